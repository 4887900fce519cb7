#include "buy_second_bar_strategy.hpp"
#include "portfolio.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

    BuySecondBarStrategy::BuySecondBarStrategy(double alloc_pct)
        : alloc_pct_(alloc_pct)
    {
        if (alloc_pct_ < 0.0 || alloc_pct_ > 1.0) {
            throw core::StrategyException(fmt::format("alloc_pct must be in [0, 1], got {}", alloc_pct_));
        }
    }

    void BuySecondBarStrategy::onBar(const core::Bar& bar, backtester::Portfolio& portfolio) {
        ++counter_;
        last_bar_ = bar;

        if (counter_ == 2) {
            double qty = portfolio.affordableQuantity(bar.close, alloc_pct_);
            if (qty > 0 && !portfolio.buy(bar.timestamp, qty, bar.close, "Second bar buy (alloc %)")) {
                core::logging::getLogger()->debug("{}{}: second-bar buy was rejected", portfolio.logPrefix(), getName());
            }
        }
    }

    std::optional<FinishHook> BuySecondBarStrategy::finishHook() {
        return FinishHook([this](backtester::Portfolio& portfolio) {
            if (!last_bar_ || portfolio.getPositionQuantity() <= 0) {
                return;
            }
            if (!portfolio.sell(last_bar_->timestamp, portfolio.getPositionQuantity(), last_bar_->close, "Close on finish")) {
                core::logging::getLogger()->warn("{}{}: closing sell was rejected, position of {:.8f} stays open",
                                                 portfolio.logPrefix(), getName(), portfolio.getPositionQuantity());
            }
        });
    }

} // namespace strategy_engine
