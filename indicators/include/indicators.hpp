#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <string>
#include <optional>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // e.g. "SMA(10)"
    virtual std::string getName() const = 0;

    // Number of leading input points consumed before the first output value
    virtual int getLookback() const = 0;

    // Calculates over a series of values (closing prices) and stores the result.
    // Throws core::IndicatorCalculationException when the calculation fails.
    virtual void calculate(const core::TimeSeries<double>& input) = 0;

    // Output is input.size() - lookback long; element i lines up with input[i + lookback]
    virtual const core::TimeSeries<double>& getResult() const = 0;

    // Value aligned with the last input point, if the input was long enough
    std::optional<double> latest() const {
        const auto& result = getResult();
        if (result.empty()) return std::nullopt;
        return result.back();
    }
};

} // namespace indicators
