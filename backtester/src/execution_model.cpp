#include "execution_model.hpp"

#include <algorithm>
#include <stdexcept>

namespace backtester {

    namespace {

        // Headroom for float noise when cash is spent exactly
        constexpr double kCashTolerance = 1e-9;

    } // namespace

    const char* rejectionReasonToString(RejectionReason reason) {
        switch (reason) {
            case RejectionReason::None: return "OK";
            case RejectionReason::InvalidInput: return "invalid quantity or reference price";
            case RejectionReason::ZeroQuantityAfterRounding: return "quantity is zero after step rounding";
            case RejectionReason::InsufficientCash: return "insufficient cash for notional + fee";
            case RejectionReason::ExchangeRuleViolation: return "exchange rules: minNotional/minQty";
            case RejectionReason::OutOfRange: return "price or quantity outside the exchange rounding range";
        }
        return "unknown";
    }

    ExecutionPreview previewExecution(const ExecutionRequest& request) {
        ExecutionPreview preview;
        preview.intended_price = request.reference_price;
        preview.qty_raw = request.requested_quantity;
        preview.slippage_bps = request.slippage_bps;

        // 1. Basic validation
        if (request.requested_quantity <= 0.0 || request.reference_price <= 0.0) {
            preview.reason = RejectionReason::InvalidInput;
            preview.exec_price_raw = request.reference_price;
            preview.exec_price = request.reference_price;
            preview.qty_rounded = 0.0;
            preview.qty_round_diff = request.requested_quantity;
            return preview;
        }

        // 2. Slippage against the taker
        const double slip = request.slippage_bps / 10000.0;
        preview.exec_price_raw = request.side == core::Side::Buy
            ? request.reference_price * (1.0 + slip)
            : request.reference_price * (1.0 - slip);

        // 3. Exchange rounding
        bool rules_ok = true;
        if (request.rules) {
            try {
                rules::RuledOrder ruled = rules::applyExchangeRules(preview.exec_price_raw,
                                                                    request.requested_quantity,
                                                                    *request.rules);
                preview.exec_price = ruled.price.toDouble();
                preview.qty_rounded = ruled.quantity.toDouble();
                rules_ok = ruled.valid;

                // Never sell more than held
                if (request.side == core::Side::Sell && preview.qty_rounded > request.position) {
                    core::Decimal capped = rules::roundQuantity(std::max(0.0, request.position),
                                                                request.rules->step_size);
                    preview.qty_rounded = capped.toDouble();
                    rules_ok = rules::isOrderValid(ruled.price, capped,
                                                   request.rules->min_notional, request.rules->min_qty);
                }
            } catch (const std::out_of_range&) {
                preview.reason = RejectionReason::OutOfRange;
                preview.exec_price = preview.exec_price_raw;
                preview.qty_rounded = 0.0;
                preview.qty_round_diff = preview.qty_raw;
                preview.notional_before_round = preview.exec_price_raw * preview.qty_raw;
                return preview;
            }
        } else {
            preview.exec_price = preview.exec_price_raw;
            preview.qty_rounded = request.requested_quantity;
            if (request.side == core::Side::Sell && preview.qty_rounded > request.position) {
                preview.qty_rounded = std::max(0.0, request.position);
            }
        }

        preview.price_round_diff = preview.exec_price_raw - preview.exec_price;
        preview.qty_round_diff = preview.qty_raw - preview.qty_rounded;
        preview.notional_before_round = preview.exec_price_raw * preview.qty_raw;
        preview.notional_after_round = preview.exec_price * preview.qty_rounded;

        // 4. Quantity must survive rounding
        if (preview.qty_rounded <= 0.0) {
            preview.reason = RejectionReason::ZeroQuantityAfterRounding;
            return preview;
        }

        // 5. Affordability including the explicit fee
        if (request.side == core::Side::Buy) {
            const double fee_factor = 1.0 + request.fee_bps / 10000.0;
            if (preview.notional_after_round * fee_factor > request.cash + kCashTolerance) {
                preview.reason = RejectionReason::InsufficientCash;
                return preview;
            }
        }

        // 6. minQty / minNotional
        if (request.rules && !rules_ok) {
            preview.reason = RejectionReason::ExchangeRuleViolation;
            return preview;
        }

        preview.accepted = true;
        preview.reason = RejectionReason::None;
        return preview;
    }

} // namespace backtester
