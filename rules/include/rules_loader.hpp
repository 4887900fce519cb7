#pragma once

#include <string>
#include <functional>
#include <nlohmann/json.hpp>

#include "symbol_rules.hpp"

namespace rules {

    // Returns the raw exchangeInfo JSON for a symbol (usually BinanceApiClient::getExchangeInfo)
    using ExchangeInfoFetcher = std::function<nlohmann::json(const std::string& symbol)>;

    // <rules_dir>/<SYMBOL>_rules.json
    std::string rulesCachePath(const std::string& rules_dir, const std::string& symbol);

    // Reads the cache when use_cache && !refresh && the file exists.
    // Otherwise fetches, parses, rewrites the cache (creating rules_dir) and returns.
    // Throws core::RulesException when a fetch is needed and no fetcher is given.
    SymbolRules loadSymbolRules(const std::string& symbol,
                                const std::string& rules_dir,
                                bool use_cache,
                                bool refresh,
                                const ExchangeInfoFetcher& fetcher);

} // namespace rules
