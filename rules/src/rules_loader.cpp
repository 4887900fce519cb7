#include "rules_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <fstream>
#include <filesystem>

namespace rules {

    namespace fs = std::filesystem;

    std::string rulesCachePath(const std::string& rules_dir, const std::string& symbol) {
        return (fs::path(rules_dir) / (symbol + "_rules.json")).string();
    }

    SymbolRules loadSymbolRules(const std::string& symbol,
                                const std::string& rules_dir,
                                bool use_cache,
                                bool refresh,
                                const ExchangeInfoFetcher& fetcher)
    {
        auto logger = core::logging::getLogger();
        const std::string cache_path = rulesCachePath(rules_dir, symbol);

        if (use_cache && !refresh && fs::exists(cache_path)) {
            std::ifstream in(cache_path);
            if (!in.is_open()) {
                throw core::RulesException("Could not open rules cache: " + cache_path);
            }
            json cached;
            try {
                in >> cached;
            } catch (const json::parse_error& e) {
                throw core::RulesException("Corrupt rules cache '" + cache_path + "': " + e.what());
            }
            logger->info("Loaded exchange rules for {} from cache {}", symbol, cache_path);
            return SymbolRules::fromJson(cached);
        }

        if (!fetcher) {
            throw core::RulesException("No cached rules for " + symbol + " and no exchangeInfo fetcher available");
        }

        logger->info("Fetching exchange rules for {} (refresh={})", symbol, refresh);
        SymbolRules rules = parseExchangeInfo(symbol, fetcher(symbol));

        try {
            fs::create_directories(fs::path(cache_path).parent_path());
        } catch (const fs::filesystem_error& e) {
            throw core::RulesException("Could not create rules directory '" + rules_dir + "': " + e.what());
        }
        std::ofstream out(cache_path);
        if (!out.is_open()) {
            throw core::RulesException("Could not write rules cache: " + cache_path);
        }
        out << rules.toJson().dump(4);
        logger->info("Cached exchange rules for {} at {}", symbol, cache_path);
        return rules;
    }

} // namespace rules
