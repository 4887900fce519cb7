#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

// Simple moving average backed by TA-Lib TA_MA
class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period);

    ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<double>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    int getPeriod() const { return period_; }

private:
    const int period_;
    int lookback_;
    std::string name_;                  // "SMA(<period>)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
