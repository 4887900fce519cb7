#include <gtest/gtest.h>

#include "execution_model.hpp"

using backtester::ExecutionRequest;
using backtester::RejectionReason;
using core::Decimal;

namespace {

    rules::SymbolRules stepRules() {
        rules::SymbolRules r;
        r.symbol = "BTCUSDT";
        r.tick_size = Decimal::fromString("0.01");
        r.step_size = Decimal::fromString("0.001");
        r.min_notional = Decimal::fromString("10");
        return r;
    }

    ExecutionRequest buyRequest(double price, double qty, const rules::SymbolRules* r = nullptr) {
        ExecutionRequest req;
        req.side = core::Side::Buy;
        req.reference_price = price;
        req.requested_quantity = qty;
        req.cash = 1000000.0;
        req.fee_bps = 10.0;
        req.slippage_bps = 0.0;
        req.rules = r;
        return req;
    }

} // namespace

TEST(ExecutionModelTest, AppliesSlippageAgainstTheTaker) {
    auto buy = buyRequest(20000.0, 1.0);
    buy.slippage_bps = 5.0;
    auto preview = backtester::previewExecution(buy);
    ASSERT_TRUE(preview.accepted);
    EXPECT_DOUBLE_EQ(preview.exec_price, 20010.0);
    EXPECT_DOUBLE_EQ(preview.intended_price, 20000.0);

    auto sell = buy;
    sell.side = core::Side::Sell;
    sell.position = 1.0;
    preview = backtester::previewExecution(sell);
    ASSERT_TRUE(preview.accepted);
    EXPECT_DOUBLE_EQ(preview.exec_price, 19990.0);
}

TEST(ExecutionModelTest, StepRoundingFloorsQuantity) {
    const auto r = stepRules();
    auto preview = backtester::previewExecution(buyRequest(20000.0, 0.0014, &r));
    ASSERT_TRUE(preview.accepted);
    EXPECT_DOUBLE_EQ(preview.qty_rounded, 0.001);
    EXPECT_NEAR(preview.qty_round_diff, 0.0004, 1e-12);
    EXPECT_EQ(preview.reason, RejectionReason::None);
}

TEST(ExecutionModelTest, QuantityBelowOneStepIsRejected) {
    const auto r = stepRules();
    auto preview = backtester::previewExecution(buyRequest(20000.0, 0.0009, &r));
    EXPECT_FALSE(preview.accepted);
    EXPECT_EQ(preview.reason, RejectionReason::ZeroQuantityAfterRounding);
}

TEST(ExecutionModelTest, NotionalBelowMinimumIsRejected) {
    const auto r = stepRules();
    auto preview = backtester::previewExecution(buyRequest(9999.0, 0.001, &r));
    EXPECT_FALSE(preview.accepted);
    EXPECT_EQ(preview.reason, RejectionReason::ExchangeRuleViolation);
    EXPECT_NEAR(preview.notional_after_round, 9.999, 1e-9);

    auto enough = backtester::previewExecution(buyRequest(10000.0, 0.001, &r));
    EXPECT_TRUE(enough.accepted);
}

TEST(ExecutionModelTest, TickRoundingFloorsPrice) {
    const auto r = stepRules();
    auto req = buyRequest(20000.0, 0.5, &r);
    req.slippage_bps = 0.123;
    auto preview = backtester::previewExecution(req);
    ASSERT_TRUE(preview.accepted);
    EXPECT_DOUBLE_EQ(preview.exec_price, 20000.24);
    EXPECT_NEAR(preview.price_round_diff, 0.006, 1e-6);
}

TEST(ExecutionModelTest, InsufficientCashIncludesFee) {
    auto req = buyRequest(100.0, 1.0);
    req.cash = 100.05;   // notional 100, fee 0.1
    auto preview = backtester::previewExecution(req);
    EXPECT_FALSE(preview.accepted);
    EXPECT_EQ(preview.reason, RejectionReason::InsufficientCash);

    req.cash = 100.1;
    EXPECT_TRUE(backtester::previewExecution(req).accepted);
}

TEST(ExecutionModelTest, InvalidInputsAreRejected) {
    EXPECT_EQ(backtester::previewExecution(buyRequest(100.0, 0.0)).reason, RejectionReason::InvalidInput);
    EXPECT_EQ(backtester::previewExecution(buyRequest(100.0, -1.0)).reason, RejectionReason::InvalidInput);
    EXPECT_EQ(backtester::previewExecution(buyRequest(0.0, 1.0)).reason, RejectionReason::InvalidInput);
}

TEST(ExecutionModelTest, SellNeverExceedsPosition) {
    const auto r = stepRules();
    auto req = buyRequest(20000.0, 0.0025, &r);
    req.side = core::Side::Sell;
    req.position = 0.0015;
    auto preview = backtester::previewExecution(req);
    ASSERT_TRUE(preview.accepted);
    EXPECT_DOUBLE_EQ(preview.qty_rounded, 0.001);
}

TEST(ExecutionModelTest, SellIgnoresCash) {
    auto req = buyRequest(100.0, 1.0);
    req.side = core::Side::Sell;
    req.cash = 0.0;
    req.position = 1.0;
    EXPECT_TRUE(backtester::previewExecution(req).accepted);
}

TEST(ExecutionModelTest, AllInBuyOnFineStepIsAffordable) {
    rules::SymbolRules r = stepRules();
    r.step_size = Decimal::fromString("0.00000001");
    r.min_notional.reset();

    auto req = buyRequest(30000.0, 20000.0 / 30000.0, &r);
    req.cash = 20000.0;
    req.fee_bps = 0.0;
    auto preview = backtester::previewExecution(req);
    ASSERT_TRUE(preview.accepted) << backtester::rejectionReasonToString(preview.reason);
    EXPECT_DOUBLE_EQ(preview.qty_rounded, 0.66666666);
    EXPECT_LE(preview.qty_rounded, req.requested_quantity);
    EXPECT_LE(preview.notional_after_round, 20000.0);
}

TEST(ExecutionModelTest, UnrepresentableQuantityIsRejected) {
    const auto r = stepRules();
    auto req = buyRequest(0.00001, 1.0e11, &r);
    req.cash = 1.0e7;
    auto preview = backtester::previewExecution(req);
    EXPECT_FALSE(preview.accepted);
    EXPECT_EQ(preview.reason, RejectionReason::OutOfRange);
    EXPECT_DOUBLE_EQ(preview.qty_rounded, 0.0);

    req.side = core::Side::Sell;
    req.position = 1.0e11;
    EXPECT_EQ(backtester::previewExecution(req).reason, RejectionReason::OutOfRange);

    // Without rules nothing is rounded, so the order goes through
    auto unruled = buyRequest(0.00001, 1.0e11);
    unruled.cash = 1.0e7;
    EXPECT_TRUE(backtester::previewExecution(unruled).accepted);
}

TEST(ExecutionModelTest, ReasonStrings) {
    EXPECT_STREQ(backtester::rejectionReasonToString(RejectionReason::None), "OK");
    EXPECT_STRNE(backtester::rejectionReasonToString(RejectionReason::InsufficientCash), "OK");
    EXPECT_STRNE(backtester::rejectionReasonToString(RejectionReason::OutOfRange), "OK");
}
