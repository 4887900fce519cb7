#pragma once

#include <string>
#include <optional>
#include <functional>

#include "datatypes.hpp" // Provides Bar

namespace backtester { class Portfolio; }

namespace strategy_engine {

    // Called once after the last bar, e.g. to liquidate an open position
    using FinishHook = std::function<void(backtester::Portfolio&)>;

    // --- Strategy Interface ---
    // Decision policy driven by the Backtester. Reads portfolio state and places buy/sell requests.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string getName() const = 0;

        // Called for every bar after the portfolio was marked to the bar's close
        virtual void onBar(const core::Bar& bar, backtester::Portfolio& portfolio) = 0;

        // Absent by default. Queried once when the Backtester is constructed.
        virtual std::optional<FinishHook> finishHook() { return std::nullopt; }
    };

} // namespace strategy_engine
