#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>

#include "buy_second_bar_strategy.hpp"
#include "moving_average_cross_strategy.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "bar_source.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

using nlohmann::json;

namespace {

    core::TimeSeries<core::Bar> barsWithCloses(const std::vector<double>& closes) {
        core::TimeSeries<core::Bar> bars;
        for (size_t i = 0; i < closes.size(); ++i) {
            core::Bar bar;
            bar.timestamp = core::utils::millisToTimestamp(1735689600000LL + static_cast<std::int64_t>(i) * 60000LL);
            bar.open = bar.high = bar.low = bar.close = closes[i];
            bar.volume = 1.0;
            bar.symbol = "BTCUSDT";
            bars.push_back(bar);
        }
        return bars;
    }

} // namespace

class StrategyTest : public ::testing::Test {
protected:
    core::BacktestConfig config_;

    void SetUp() override {
        config_.starting_cash = 1000.0;
        config_.fee_bps = 0.0;
        config_.slippage_bps = 0.0;
    }
};

TEST_F(StrategyTest, BuySecondBarBuysOnlyOnSecondBar) {
    strategy_engine::BuySecondBarStrategy strategy(0.5);
    backtester::Portfolio portfolio(config_);

    for (const auto& bar : barsWithCloses({10.0, 20.0, 30.0})) {
        portfolio.markToMarket(bar.close);
        strategy.onBar(bar, portfolio);
    }
    EXPECT_EQ(strategy.getBarCount(), 3);
    ASSERT_EQ(portfolio.getTradeLedger().size(), 1u);
    EXPECT_DOUBLE_EQ(portfolio.getTradeLedger()[0].trade.price, 20.0);
    EXPECT_DOUBLE_EQ(portfolio.getPositionQuantity(), 25.0);

    auto hook = strategy.finishHook();
    ASSERT_TRUE(hook.has_value());
    (*hook)(portfolio);
    EXPECT_DOUBLE_EQ(portfolio.getPositionQuantity(), 0.0);
    EXPECT_DOUBLE_EQ(portfolio.getTradeLedger().back().trade.price, 30.0);
    EXPECT_DOUBLE_EQ(portfolio.getCash(), 1000.0 + 25.0 * 10.0);
}

TEST_F(StrategyTest, BuySecondBarFinishHookIsNoOpWhenFlat) {
    strategy_engine::BuySecondBarStrategy strategy(0.5);
    backtester::Portfolio portfolio(config_);
    auto hook = strategy.finishHook();
    ASSERT_TRUE(hook.has_value());
    (*hook)(portfolio);
    EXPECT_TRUE(portfolio.getTradeLedger().empty());
}

TEST_F(StrategyTest, BuySecondBarRejectsBadAllocation) {
    EXPECT_THROW(strategy_engine::BuySecondBarStrategy(1.5), core::StrategyException);
    EXPECT_THROW(strategy_engine::BuySecondBarStrategy(-0.1), core::StrategyException);
}

TEST_F(StrategyTest, MovingAverageCrossEntersAndExits) {
    backtester::Backtester engine(config_,
        std::make_unique<strategy_engine::MovingAverageCrossStrategy>(2, 3, 0.5, false));
    EXPECT_FALSE(engine.hasFinishHook());

    data::SeriesBarSource source(barsWithCloses({10, 10, 10, 12, 14, 10, 6, 6}));
    engine.run(source);

    const auto& ledger = engine.getPortfolio().getTradeLedger();
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[0].trade.side, core::Side::Buy);
    EXPECT_DOUBLE_EQ(ledger[0].trade.price, 12.0);
    EXPECT_NEAR(ledger[0].trade.quantity, 500.0 / 12.0, 1e-9);
    EXPECT_EQ(ledger[1].trade.side, core::Side::Sell);
    EXPECT_DOUBLE_EQ(ledger[1].trade.price, 6.0);
    EXPECT_LT(engine.getPortfolio().getRealizedPnl(), 0.0);
    EXPECT_DOUBLE_EQ(engine.getPortfolio().getPositionQuantity(), 0.0);

    const auto& strategy = static_cast<const strategy_engine::MovingAverageCrossStrategy&>(engine.getStrategy());
    ASSERT_TRUE(strategy.lastShortAverage().has_value());
    EXPECT_DOUBLE_EQ(*strategy.lastShortAverage(), 6.0);
}

TEST_F(StrategyTest, MovingAverageCrossClosesOnFinish) {
    backtester::Backtester engine(config_,
        std::make_unique<strategy_engine::MovingAverageCrossStrategy>(2, 3, 0.5, true));
    data::SeriesBarSource source(barsWithCloses({10, 10, 10, 12, 14, 16}));
    engine.run(source);

    const auto& ledger = engine.getPortfolio().getTradeLedger();
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[1].trade.note, "Close on finish");
    EXPECT_DOUBLE_EQ(ledger[1].trade.price, 16.0);
    EXPECT_GT(engine.getPortfolio().getRealizedPnl(), 0.0);
}

TEST_F(StrategyTest, MovingAverageCrossValidatesWindows) {
    EXPECT_THROW(strategy_engine::MovingAverageCrossStrategy(5, 5), core::StrategyException);
    EXPECT_THROW(strategy_engine::MovingAverageCrossStrategy(10, 3), core::StrategyException);
    EXPECT_THROW(strategy_engine::MovingAverageCrossStrategy(0, 3), core::StrategyException);
    EXPECT_THROW(strategy_engine::MovingAverageCrossStrategy(2, 3, 2.0), core::StrategyException);
}

TEST_F(StrategyTest, FactoryBuildsKnownTypes) {
    auto second = strategy_engine::StrategyFactory::createStrategy(json{{"type", "buy_second_bar"}}, 0.2);
    EXPECT_EQ(second->getName(), "BuySecondBar");

    auto cross = strategy_engine::StrategyFactory::createStrategy(
        json{{"type", "ma_cross"}, {"short_window", 3}, {"long_window", 8}, {"close_on_finish", false}});
    EXPECT_EQ(cross->getName(), "MovingAverageCross");
    EXPECT_FALSE(cross->finishHook().has_value());
}

TEST_F(StrategyTest, FactoryRejectsBadConfigs) {
    using strategy_engine::StrategyFactory;
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "martingale"}}), core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(json::object()), core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(json::array()), core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "ma_cross"}, {"short_window", "fast"}}),
                 core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "ma_cross"}, {"short_window", 9}, {"long_window", 4}}),
                 core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(json{{"type", "buy_second_bar"}, {"alloc_pct", 3}}),
                 core::StrategyException);
}
