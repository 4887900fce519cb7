#pragma once

#include <string>
#include <memory>
#include <optional>

#include "datatypes.hpp"
#include "config.hpp"
#include "bar_source.hpp"   // data::IBarSource
#include "interfaces.hpp"   // Strategy engine interfaces
#include "portfolio.hpp"

namespace backtester {

    // Drives one simulation: per bar mark-to-market, equity sample, strategy callback;
    // after the last bar the finish hook and a final equity sample.
    class Backtester {
    public:
        Backtester(const core::BacktestConfig& config,
                   std::unique_ptr<strategy_engine::IStrategy> strategy,
                   std::string run_id = "");

        // Consumes the source to exhaustion and returns the number of bars processed.
        // Strategy and bar source exceptions propagate. A Backtester runs once.
        std::size_t run(data::IBarSource& source);

        Portfolio& getPortfolio() { return *portfolio_; }
        const Portfolio& getPortfolio() const { return *portfolio_; }
        const strategy_engine::IStrategy& getStrategy() const { return *strategy_; }
        const std::string& getRunId() const { return run_id_; }
        bool hasFinishHook() const { return finish_hook_.has_value(); }

    private:
        core::BacktestConfig config_;
        std::string run_id_;
        std::unique_ptr<Portfolio> portfolio_;
        std::unique_ptr<strategy_engine::IStrategy> strategy_;
        std::optional<strategy_engine::FinishHook> finish_hook_;
        bool has_run_ = false;

        void logBar(std::size_t index, const core::Bar& bar) const;
    };

} // namespace backtester
