#include "symbol_rules.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <stdexcept>

namespace rules {

    namespace {

        // Filters carry decimals as strings ("0.01000000"); tolerate plain numbers too
        core::Decimal decimalFrom(const json& value, const std::string& what) {
            try {
                if (value.is_string()) {
                    return core::Decimal::fromString(value.get<std::string>());
                }
                if (value.is_number()) {
                    return core::Decimal::fromDouble(value.get<double>());
                }
            } catch (const std::invalid_argument& e) {
                throw core::RulesException("Invalid decimal for " + what + ": " + e.what());
            } catch (const std::out_of_range& e) {
                throw core::RulesException("Decimal out of range for " + what + ": " + e.what());
            }
            throw core::RulesException("Expected a decimal string for " + what + ", got: " + value.dump());
        }

        std::optional<core::Decimal> optionalDecimal(const json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return std::nullopt;
            }
            return decimalFrom(*it, key);
        }

        json optionalToJson(const std::optional<core::Decimal>& value) {
            return value ? json(value->toString()) : json(nullptr);
        }

    } // namespace

    json SymbolRules::toJson() const {
        return json{
            {"symbol", symbol},
            {"tick_size", tick_size.toString()},
            {"step_size", step_size.toString()},
            {"min_qty", optionalToJson(min_qty)},
            {"max_qty", optionalToJson(max_qty)},
            {"min_notional", optionalToJson(min_notional)},
            {"raw_filters", raw_filters}
        };
    }

    SymbolRules SymbolRules::fromJson(const json& j) {
        if (!j.is_object() || !j.contains("symbol") || !j.contains("tick_size") || !j.contains("step_size")) {
            throw core::RulesException("Rules JSON must contain symbol, tick_size and step_size");
        }
        SymbolRules rules;
        try {
            rules.symbol = j.at("symbol").get<std::string>();
        } catch (const json::exception& e) {
            throw core::RulesException(std::string("Invalid symbol in rules JSON: ") + e.what());
        }
        rules.tick_size = decimalFrom(j.at("tick_size"), "tick_size");
        rules.step_size = decimalFrom(j.at("step_size"), "step_size");
        rules.min_qty = optionalDecimal(j, "min_qty");
        rules.max_qty = optionalDecimal(j, "max_qty");
        rules.min_notional = optionalDecimal(j, "min_notional");
        rules.raw_filters = j.value("raw_filters", json::object());
        return rules;
    }

    core::Decimal roundPrice(const core::Decimal& price, const core::Decimal& tick_size) {
        return price.floorToStep(tick_size);
    }

    core::Decimal roundQuantity(const core::Decimal& qty, const core::Decimal& step_size) {
        return qty.floorToStep(step_size);
    }

    core::Decimal roundPrice(double price, const core::Decimal& tick_size) {
        return roundPrice(core::Decimal::fromDouble(price, core::Decimal::Rounding::Floor), tick_size);
    }

    core::Decimal roundQuantity(double qty, const core::Decimal& step_size) {
        return roundQuantity(core::Decimal::fromDouble(qty, core::Decimal::Rounding::Floor), step_size);
    }

    bool isOrderValid(const core::Decimal& price,
                      const core::Decimal& qty,
                      const std::optional<core::Decimal>& min_notional,
                      const std::optional<core::Decimal>& min_qty)
    {
        if (min_qty && qty < *min_qty) {
            return false;
        }
        if (min_notional && (price * qty) < *min_notional) {
            return false;
        }
        return true;
    }

    RuledOrder applyExchangeRules(double price, double qty, const SymbolRules& rules) {
        RuledOrder order;
        order.price = roundPrice(price, rules.tick_size);
        order.quantity = roundQuantity(qty, rules.step_size);
        order.valid = isOrderValid(order.price, order.quantity, rules.min_notional, rules.min_qty);
        return order;
    }

    SymbolRules parseExchangeInfo(const std::string& symbol, const json& exchange_info) {
        auto symbols_it = exchange_info.find("symbols");
        if (symbols_it == exchange_info.end() || !symbols_it->is_array()) {
            throw core::RulesException("exchangeInfo response has no 'symbols' array");
        }

        const json* symbol_info = nullptr;
        for (const auto& s : *symbols_it) {
            if (s.is_object() && s.value("symbol", std::string()) == symbol) {
                symbol_info = &s;
                break;
            }
        }
        if (!symbol_info) {
            throw core::RulesException("Symbol " + symbol + " not found in exchangeInfo");
        }

        SymbolRules rules;
        rules.symbol = symbol;
        std::optional<core::Decimal> tick_size;
        std::optional<core::Decimal> step_size;

        const json filters = symbol_info->value("filters", json::array());
        for (const auto& f : filters) {
            if (!f.is_object()) continue;
            std::string type = f.value("filterType", std::string());
            if (!type.empty()) {
                rules.raw_filters[type] = f;
            }

            if (type == "PRICE_FILTER") {
                if (f.contains("tickSize")) tick_size = decimalFrom(f.at("tickSize"), "tickSize");
            } else if (type == "LOT_SIZE" || type == "MARKET_LOT_SIZE") {
                // MARKET_LOT_SIZE listed after LOT_SIZE overrides it
                if (f.contains("stepSize")) step_size = decimalFrom(f.at("stepSize"), "stepSize");
                if (f.contains("minQty")) rules.min_qty = decimalFrom(f.at("minQty"), "minQty");
                if (f.contains("maxQty")) rules.max_qty = decimalFrom(f.at("maxQty"), "maxQty");
            } else if (type == "NOTIONAL" || type == "MIN_NOTIONAL") {
                if (f.contains("minNotional")) rules.min_notional = decimalFrom(f.at("minNotional"), "minNotional");
            }
        }

        if (!tick_size || !step_size) {
            throw core::RulesException("Missing PRICE_FILTER/LOT_SIZE for " + symbol +
                                       ": tick_size=" + (tick_size ? tick_size->toString() : "None") +
                                       ", step_size=" + (step_size ? step_size->toString() : "None"));
        }
        rules.tick_size = *tick_size;
        rules.step_size = *step_size;

        core::logging::getLogger()->debug("Parsed rules for {}: tick={}, step={}, minQty={}, minNotional={}",
                                          symbol, rules.tick_size.toString(), rules.step_size.toString(),
                                          rules.min_qty ? rules.min_qty->toString() : "-",
                                          rules.min_notional ? rules.min_notional->toString() : "-");
        return rules;
    }

} // namespace rules
