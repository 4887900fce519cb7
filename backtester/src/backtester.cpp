#include "backtester.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <stdexcept>

namespace backtester {

    Backtester::Backtester(const core::BacktestConfig& config,
                           std::unique_ptr<strategy_engine::IStrategy> strategy,
                           std::string run_id)
        : config_(config), run_id_(std::move(run_id)), strategy_(std::move(strategy))
    {
        if (!strategy_) {
            throw core::BacktestException("Backtester requires a strategy.");
        }
        portfolio_ = std::make_unique<Portfolio>(config_, run_id_);
        finish_hook_ = strategy_->finishHook();
        core::logging::getLogger()->debug("{}Backtester initialized: strategy={}, finish hook={}",
                                          portfolio_->logPrefix(), strategy_->getName(),
                                          finish_hook_ ? "yes" : "no");
    }

    void Backtester::logBar(std::size_t index, const core::Bar& bar) const {
        auto logger = core::logging::getLogger();
        const bool at_info = index == 1 || (config_.log_every > 0 && index % static_cast<std::size_t>(config_.log_every) == 0);
        logger->log(at_info ? spdlog::level::info : spdlog::level::debug,
                    "{}[{}] {} i={} close={:.8f} cash={:.2f} qty={:.8f} equity={:.2f}",
                    portfolio_->logPrefix(), core::utils::timestampToString(bar.timestamp), bar.symbol, index,
                    bar.close, portfolio_->getCash(), portfolio_->getPositionQuantity(), portfolio_->equity());
    }

    std::size_t Backtester::run(data::IBarSource& source) {
        auto logger = core::logging::getLogger();
        if (has_run_) {
            throw core::BacktestException("Backtester::run called twice; create a new Backtester per run.");
        }
        has_run_ = true;

        const std::string prefix = portfolio_->logPrefix();
        logger->info("{}========================================================", prefix);
        logger->info("{}Starting Backtest Run: strategy={}, symbol={}, cash={:.2f}",
                     prefix, strategy_->getName(), config_.symbol, portfolio_->getStartingCash());
        logger->info("{}========================================================", prefix);

        std::size_t processed = 0;
        std::optional<core::Timestamp> last_timestamp;

        try {
            while (auto bar = source.next()) {
                ++processed;
                last_timestamp = bar->timestamp;

                portfolio_->markToMarket(bar->close);
                portfolio_->recordEquitySample(bar->timestamp);
                logBar(processed, *bar);

                strategy_->onBar(*bar, *portfolio_);
            }

            if (finish_hook_) {
                (*finish_hook_)(*portfolio_);
            }
        } catch (const std::exception& e) {
            logger->error("{}Backtest aborted after {} bar(s): {}", prefix, processed, e.what());
            throw;
        }

        // Last point always carries the true terminal equity
        if (last_timestamp) {
            portfolio_->recordEquitySample(*last_timestamp);
        }

        const PortfolioSummary s = portfolio_->summary();
        logger->info("{}Backtest finished: bars={}, trades={}, equity={:.2f}, total_pnl={:.2f}, realized_pnl={:.2f}",
                     prefix, processed, portfolio_->getTradeLedger().size(), s.equity, s.total_pnl, s.realized_pnl);
        return processed;
    }

} // namespace backtester
