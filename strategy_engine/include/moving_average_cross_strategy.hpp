#pragma once

#include "interfaces.hpp"
#include "sma_indicator.hpp"
#include <vector>
#include <optional>

namespace strategy_engine {

    // Long-only SMA crossover on closes.
    // short > long while flat -> buy alloc_pct of cash; short < long while long -> sell everything.
    class MovingAverageCrossStrategy : public IStrategy {
    public:
        MovingAverageCrossStrategy(int short_window = 10,
                                   int long_window = 50,
                                   double alloc_pct = 0.10,
                                   bool close_on_finish = true);

        std::string getName() const override { return "MovingAverageCross"; }
        void onBar(const core::Bar& bar, backtester::Portfolio& portfolio) override;
        std::optional<FinishHook> finishHook() override;

        // Latest averages, set once enough bars have been seen
        std::optional<double> lastShortAverage() const { return last_short_; }
        std::optional<double> lastLongAverage() const { return last_long_; }

    private:
        int short_window_;
        int long_window_;
        double alloc_pct_;
        bool close_on_finish_;

        indicators::SmaIndicator short_sma_;
        indicators::SmaIndicator long_sma_;
        core::TimeSeries<double> closes_;   // Rolling window of the last long_window closes
        std::optional<core::Bar> last_bar_;
        std::optional<double> last_short_;
        std::optional<double> last_long_;
    };

} // namespace strategy_engine
