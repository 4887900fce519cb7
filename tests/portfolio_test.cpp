#include <gtest/gtest.h>

#include "portfolio.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

using backtester::Portfolio;
using core::Decimal;

class PortfolioTest : public ::testing::Test {
protected:
    core::BacktestConfig config_;

    void SetUp() override {
        config_.symbol = "BTCUSDT";
        config_.starting_cash = 10000.0;
        config_.fee_bps = 10.0;
        config_.slippage_bps = 0.0;
    }

    static core::Timestamp at(int hour) {
        return core::utils::millisToTimestamp(1735689600000LL + hour * 3600000LL);
    }

    static rules::SymbolRules btcRules() {
        rules::SymbolRules r;
        r.symbol = "BTCUSDT";
        r.tick_size = Decimal::fromString("0.01");
        r.step_size = Decimal::fromString("0.001");
        r.min_notional = Decimal::fromString("10");
        return r;
    }
};

TEST_F(PortfolioTest, StartsFlatWithEquityEqualToCash) {
    Portfolio p(config_);
    EXPECT_DOUBLE_EQ(p.getCash(), 10000.0);
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.0);
    EXPECT_FALSE(p.getLastPrice().has_value());
    EXPECT_DOUBLE_EQ(p.equity(), 10000.0);
    EXPECT_DOUBLE_EQ(p.pnlTotal(), 0.0);
}

TEST_F(PortfolioTest, RejectsInvalidConfiguration) {
    config_.starting_cash = 0.0;
    EXPECT_THROW(Portfolio{config_}, core::ConfigException);
    config_.starting_cash = 100.0;
    config_.fee_bps = -1.0;
    EXPECT_THROW(Portfolio{config_}, core::ConfigException);
}

TEST_F(PortfolioTest, BuyDebitsNotionalPlusFee) {
    Portfolio p(config_, "run-1");
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0, "entry"));
    EXPECT_DOUBLE_EQ(p.getCash(), 10000.0 - 100.0 - 0.1);
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 1.0);
    EXPECT_DOUBLE_EQ(p.getAveragePrice(), 100.0);
    EXPECT_DOUBLE_EQ(*p.getLastPrice(), 100.0);

    ASSERT_EQ(p.getTradeLedger().size(), 1u);
    const auto& record = p.getTradeLedger().front();
    EXPECT_EQ(record.trade.side, core::Side::Buy);
    EXPECT_EQ(record.trade.note, "entry");
    EXPECT_DOUBLE_EQ(record.trade.fee, 0.1);
    EXPECT_DOUBLE_EQ(record.trade.realized_pnl, 0.0);
    EXPECT_DOUBLE_EQ(record.trade.cash_after, p.getCash());
    EXPECT_DOUBLE_EQ(record.trade.equity_after, p.getCash() + 100.0);
    EXPECT_NEAR(record.fee_bps, 10.0, 1e-9);
    EXPECT_EQ(record.schema_version, backtester::kSchemaVersion);
    EXPECT_EQ(record.run_id, "run-1");
    EXPECT_FALSE(record.tick_size_used.has_value());
}

TEST_F(PortfolioTest, AverageCostAcrossBuys) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    ASSERT_TRUE(p.buy(at(1), 3.0, 200.0));
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 4.0);
    EXPECT_DOUBLE_EQ(p.getAveragePrice(), 175.0);
}

TEST_F(PortfolioTest, SellRealizesAgainstAverageCost) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    ASSERT_TRUE(p.sell(at(1), 1.0, 110.0, "exit"));

    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.0);
    EXPECT_DOUBLE_EQ(p.getAveragePrice(), 0.0);
    EXPECT_DOUBLE_EQ(p.getRealizedPnl(), 10.0);
    EXPECT_NEAR(p.getCash(), 10000.0 - 100.1 + 110.0 - 0.11, 1e-9);

    const auto& sell = p.getTradeLedger().back();
    EXPECT_EQ(sell.trade.side, core::Side::Sell);
    EXPECT_DOUBLE_EQ(sell.trade.realized_pnl, 10.0);
    EXPECT_DOUBLE_EQ(sell.trade.cum_realized_pnl, 10.0);
    EXPECT_DOUBLE_EQ(sell.trade.quantity_after, 0.0);
}

TEST_F(PortfolioTest, RealizedPnlNetOfFeesWhenConfigured) {
    config_.realized_pnl_net_fees = true;
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    ASSERT_TRUE(p.sell(at(1), 1.0, 110.0));
    EXPECT_NEAR(p.getRealizedPnl(), 10.0 - 0.11, 1e-9);
}

TEST_F(PortfolioTest, CashIdentityHoldsAcrossTrades) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 2.0, 100.0));
    ASSERT_TRUE(p.sell(at(1), 0.5, 120.0));
    ASSERT_TRUE(p.buy(at(2), 1.0, 90.0));
    ASSERT_TRUE(p.sell(at(3), 2.5, 130.0));

    double expected_cash = config_.starting_cash;
    for (const auto& r : p.getTradeLedger()) {
        const double notional = r.trade.quantity * r.trade.price;
        expected_cash += r.trade.side == core::Side::Buy ? -(notional + r.trade.fee) : (notional - r.trade.fee);
        EXPECT_NEAR(r.trade.fee, notional * config_.fee_bps / 10000.0, 1e-9);
    }
    EXPECT_NEAR(p.getCash(), expected_cash, 1e-9);
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.0);
}

TEST_F(PortfolioTest, OverSellThrows) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    EXPECT_THROW(p.sell(at(1), 1.5, 100.0), core::InsufficientPositionException);
    EXPECT_EQ(p.getTradeLedger().size(), 1u);
    EXPECT_THROW(Portfolio(config_).sell(at(0), 0.1, 100.0), core::InsufficientPositionException);
}

TEST_F(PortfolioTest, RejectionLeavesStateUntouched) {
    Portfolio p(config_);
    EXPECT_FALSE(p.buy(at(0), 1000.0, 100.0));   // Needs 100100 cash
    EXPECT_FALSE(p.buy(at(0), 0.0, 100.0));
    EXPECT_DOUBLE_EQ(p.getCash(), 10000.0);
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.0);
    EXPECT_TRUE(p.getTradeLedger().empty());
}

TEST_F(PortfolioTest, TradesMustBeChronological) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(2), 1.0, 100.0));
    EXPECT_THROW(p.buy(at(1), 1.0, 100.0), core::BacktestException);
    EXPECT_TRUE(p.buy(at(2), 1.0, 100.0));
}

TEST_F(PortfolioTest, AffordableQuantityAccountsForFee) {
    Portfolio p(config_);
    EXPECT_NEAR(p.affordableQuantity(100.0, 0.1), 1000.0 / (100.0 * 1.001), 1e-12);
    EXPECT_DOUBLE_EQ(p.affordableQuantity(0.0, 0.1), 0.0);
    EXPECT_DOUBLE_EQ(p.affordableQuantity(100.0, 0.0), 0.0);

    // Spending the full affordable quantity stays within cash
    const double qty = p.affordableQuantity(100.0, 1.0);
    EXPECT_TRUE(p.buy(at(0), qty, 100.0));
    EXPECT_GE(p.getCash(), -1e-9);
}

TEST_F(PortfolioTest, MarkToMarketDrivesEquity) {
    Portfolio p(config_);
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    p.markToMarket(150.0);
    EXPECT_DOUBLE_EQ(p.equity(), p.getCash() + 150.0);
    EXPECT_DOUBLE_EQ(p.equity(200.0), p.getCash() + 200.0);
    EXPECT_DOUBLE_EQ(p.pnlTotal(), p.equity() - 10000.0);

    p.recordEquitySample(at(1));
    ASSERT_EQ(p.getEquityCurve().size(), 1u);
    EXPECT_DOUBLE_EQ(p.getEquityCurve()[0].equity, p.getCash() + 150.0);
}

TEST_F(PortfolioTest, RulesApplyAndAreRecorded) {
    Portfolio p(config_);
    p.setExecutionRules(btcRules(), 5.0);
    EXPECT_DOUBLE_EQ(p.getSlippageBps(), 5.0);
    ASSERT_TRUE(p.getExecutionRules().has_value());

    ASSERT_TRUE(p.buy(at(0), 0.0014, 20000.0));
    const auto& record = p.getTradeLedger().back();
    EXPECT_DOUBLE_EQ(record.trade.quantity, 0.001);
    EXPECT_DOUBLE_EQ(record.trade.price, 20010.0);
    EXPECT_DOUBLE_EQ(record.execution.intended_price, 20000.0);
    ASSERT_TRUE(record.tick_size_used.has_value());
    EXPECT_EQ(record.tick_size_used->toString(), "0.01");
    EXPECT_EQ(record.step_size_used->toString(), "0.001");
    EXPECT_EQ(record.min_notional_used->toString(), "10");

    EXPECT_FALSE(p.buy(at(1), 0.0009, 20000.0));
    EXPECT_THROW(p.setExecutionRules(btcRules(), -1.0), core::ConfigException);

    p.clearExecutionRules();
    EXPECT_FALSE(p.getExecutionRules().has_value());
}

TEST_F(PortfolioTest, AllInBuyWithFineStepIsAccepted) {
    config_.starting_cash = 20000.0;
    config_.fee_bps = 0.0;
    Portfolio p(config_);
    rules::SymbolRules r = btcRules();
    r.step_size = Decimal::fromString("0.00000001");
    p.setExecutionRules(r, 0.0);

    const double qty = p.affordableQuantity(30000.0);
    ASSERT_TRUE(p.buy(at(0), qty, 30000.0, "all in"));
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.66666666);
    EXPECT_GE(p.getCash(), 0.0);
}

TEST_F(PortfolioTest, OversizedOrderIsRejectedNotThrown) {
    config_.starting_cash = 1000000.0;
    config_.fee_bps = 0.0;
    Portfolio p(config_);
    p.setExecutionRules(btcRules(), 0.0);

    const double qty = p.affordableQuantity(0.00001);
    EXPECT_FALSE(p.buy(at(0), qty, 0.00001));
    EXPECT_DOUBLE_EQ(p.getCash(), 1000000.0);
    EXPECT_DOUBLE_EQ(p.getPositionQuantity(), 0.0);
    EXPECT_TRUE(p.getTradeLedger().empty());
}

TEST_F(PortfolioTest, SummaryReflectsState) {
    Portfolio p(config_, "abc");
    ASSERT_TRUE(p.buy(at(0), 1.0, 100.0));
    p.markToMarket(120.0);
    auto s = p.summary();
    EXPECT_DOUBLE_EQ(s.starting_cash, 10000.0);
    EXPECT_DOUBLE_EQ(s.quantity, 1.0);
    EXPECT_DOUBLE_EQ(*s.last_price, 120.0);
    EXPECT_DOUBLE_EQ(s.equity, p.getCash() + 120.0);
    EXPECT_DOUBLE_EQ(s.total_pnl, s.equity - 10000.0);
    EXPECT_EQ(p.logPrefix(), "[run:abc] ");
    EXPECT_EQ(Portfolio(config_).logPrefix(), "");
}
