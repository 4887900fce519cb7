#pragma once

#include "datatypes.hpp"     // For core::Side
#include "symbol_rules.hpp"

namespace backtester {

    enum class RejectionReason {
        None,                       // Accepted
        InvalidInput,               // requested qty <= 0 or reference price <= 0
        ZeroQuantityAfterRounding,  // qty below one step
        InsufficientCash,           // notional + fee exceeds cash
        ExchangeRuleViolation,      // minQty / minNotional
        OutOfRange                  // price or qty too large for exchange rounding
    };

    // "OK" for None
    const char* rejectionReasonToString(RejectionReason reason);

    struct ExecutionRequest {
        core::Side side = core::Side::Buy;
        double reference_price = 0.0;   // Usually the bar close
        double requested_quantity = 0.0;
        double cash = 0.0;
        double position = 0.0;
        double fee_bps = 0.0;
        double slippage_bps = 0.0;
        const rules::SymbolRules* rules = nullptr; // Optional, not owned
    };

    // Outcome of one order request before any ledger mutation
    struct ExecutionPreview {
        bool accepted = false;
        RejectionReason reason = RejectionReason::InvalidInput;
        double intended_price = 0.0;          // Reference price
        double exec_price_raw = 0.0;          // After slippage, before tick rounding
        double exec_price = 0.0;              // After tick rounding
        double qty_raw = 0.0;
        double qty_rounded = 0.0;
        double price_round_diff = 0.0;        // exec_price_raw - exec_price
        double qty_round_diff = 0.0;          // qty_raw - qty_rounded
        double slippage_bps = 0.0;
        double notional_before_round = 0.0;   // exec_price_raw * qty_raw
        double notional_after_round = 0.0;    // exec_price * qty_rounded
    };

    // Slippage -> tick/step flooring -> cash check (BUY) -> minQty/minNotional.
    // Values that cannot be rounded exactly are rejected with OutOfRange.
    // Pure: depends only on the request.
    ExecutionPreview previewExecution(const ExecutionRequest& request);

} // namespace backtester
