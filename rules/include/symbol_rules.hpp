#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

#include "decimal.hpp"

namespace rules {

    using json = nlohmann::json;

    // Trading constraints the exchange publishes for one symbol. Immutable once built.
    struct SymbolRules {
        std::string symbol;
        core::Decimal tick_size;                     // PRICE_FILTER.tickSize
        core::Decimal step_size;                     // LOT_SIZE / MARKET_LOT_SIZE stepSize
        std::optional<core::Decimal> min_qty;
        std::optional<core::Decimal> max_qty;        // Carried for audit, not enforced
        std::optional<core::Decimal> min_notional;   // NOTIONAL / MIN_NOTIONAL minNotional
        json raw_filters = json::object();           // filterType -> filter object, as received

        // Decimals are written as strings to keep them exact
        json toJson() const;
        static SymbolRules fromJson(const json& j);
    };

    struct RuledOrder {
        core::Decimal price;
        core::Decimal quantity;
        bool valid = false;
    };

    // --- Rounding (floor to the allowed multiple) ---
    core::Decimal roundPrice(const core::Decimal& price, const core::Decimal& tick_size);
    core::Decimal roundQuantity(const core::Decimal& qty, const core::Decimal& step_size);
    // Double overloads drop digits past 1e-8 toward negative infinity, so the result never exceeds the input.
    // Throw std::out_of_range when the value does not fit a Decimal.
    core::Decimal roundPrice(double price, const core::Decimal& tick_size);
    core::Decimal roundQuantity(double qty, const core::Decimal& step_size);

    // qty >= min_qty and price * qty >= min_notional, each only when present
    bool isOrderValid(const core::Decimal& price,
                      const core::Decimal& qty,
                      const std::optional<core::Decimal>& min_notional,
                      const std::optional<core::Decimal>& min_qty);

    // Throws std::out_of_range when price, qty or their product does not fit a Decimal
    RuledOrder applyExchangeRules(double price, double qty, const SymbolRules& rules);

    // Extracts the rules of `symbol` from an exchangeInfo response.
    // Throws core::RulesException when the symbol or its tick/step filters are missing.
    SymbolRules parseExchangeInfo(const std::string& symbol, const json& exchange_info);

} // namespace rules
