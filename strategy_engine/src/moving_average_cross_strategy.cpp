#include "moving_average_cross_strategy.hpp"
#include "portfolio.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

namespace strategy_engine {

    namespace {

        int checkedWindow(int window, const char* name) {
            if (window <= 0) {
                throw core::StrategyException(fmt::format("{} must be positive, got {}", name, window));
            }
            return window;
        }

    } // namespace

    MovingAverageCrossStrategy::MovingAverageCrossStrategy(int short_window,
                                                           int long_window,
                                                           double alloc_pct,
                                                           bool close_on_finish)
        : short_window_(checkedWindow(short_window, "short_window")),
          long_window_(checkedWindow(long_window, "long_window")),
          alloc_pct_(alloc_pct),
          close_on_finish_(close_on_finish),
          short_sma_(short_window_),
          long_sma_(long_window_)
    {
        if (short_window_ >= long_window_) {
            throw core::StrategyException(fmt::format("short_window ({}) must be smaller than long_window ({})",
                                                      short_window_, long_window_));
        }
        if (alloc_pct_ < 0.0 || alloc_pct_ > 1.0) {
            throw core::StrategyException(fmt::format("alloc_pct must be in [0, 1], got {}", alloc_pct_));
        }
        closes_.reserve(static_cast<size_t>(long_window_) + 1);
    }

    void MovingAverageCrossStrategy::onBar(const core::Bar& bar, backtester::Portfolio& portfolio) {
        auto logger = core::logging::getLogger();
        last_bar_ = bar;

        closes_.push_back(bar.close);
        if (closes_.size() > static_cast<size_t>(long_window_)) {
            closes_.erase(closes_.begin());
        }

        short_sma_.calculate(closes_);
        long_sma_.calculate(closes_);
        last_short_ = short_sma_.latest();
        last_long_ = long_sma_.latest();
        if (!last_short_ || !last_long_) {
            return; // Warm-up
        }

        const double held = portfolio.getPositionQuantity();
        if (*last_short_ > *last_long_ && held <= 0) {
            double qty = portfolio.affordableQuantity(bar.close, alloc_pct_);
            logger->debug("{}{}: bullish cross (short={:.4f} > long={:.4f})", portfolio.logPrefix(), getName(),
                          *last_short_, *last_long_);
            if (qty > 0 && !portfolio.buy(bar.timestamp, qty, bar.close, "MA cross: short above long")) {
                logger->debug("{}{}: entry buy was rejected", portfolio.logPrefix(), getName());
            }
        } else if (*last_short_ < *last_long_ && held > 0) {
            logger->debug("{}{}: bearish cross (short={:.4f} < long={:.4f})", portfolio.logPrefix(), getName(),
                          *last_short_, *last_long_);
            if (!portfolio.sell(bar.timestamp, held, bar.close, "MA cross: short below long")) {
                logger->debug("{}{}: exit sell was rejected", portfolio.logPrefix(), getName());
            }
        }
    }

    std::optional<FinishHook> MovingAverageCrossStrategy::finishHook() {
        if (!close_on_finish_) {
            return std::nullopt;
        }
        return FinishHook([this](backtester::Portfolio& portfolio) {
            if (!last_bar_ || portfolio.getPositionQuantity() <= 0) {
                return;
            }
            if (!portfolio.sell(last_bar_->timestamp, portfolio.getPositionQuantity(), last_bar_->close, "Close on finish")) {
                core::logging::getLogger()->warn("{}{}: closing sell was rejected, position stays open",
                                                 portfolio.logPrefix(), getName());
            }
        });
    }

} // namespace strategy_engine
