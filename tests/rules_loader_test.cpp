#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "rules_loader.hpp"
#include "exceptions.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

class RulesLoaderTest : public ::testing::Test {
protected:
    fs::path rules_dir_;
    int fetch_count_ = 0;
    rules::ExchangeInfoFetcher fetcher_;

    void SetUp() override {
        rules_dir_ = fs::temp_directory_path() / "spot_backtester_rules_test";
        fs::remove_all(rules_dir_);
        fetcher_ = [this](const std::string& symbol) {
            ++fetch_count_;
            return json{{"symbols", json::array({json{
                {"symbol", symbol},
                {"filters", json::array({
                    json{{"filterType", "PRICE_FILTER"}, {"tickSize", "0.01000000"}},
                    json{{"filterType", "LOT_SIZE"}, {"stepSize", "0.00010000"}, {"minQty", "0.00010000"}},
                    json{{"filterType", "NOTIONAL"}, {"minNotional", "5.00000000"}}
                })}
            }})}};
        };
    }

    void TearDown() override {
        fs::remove_all(rules_dir_);
    }
};

TEST_F(RulesLoaderTest, CachePathNaming) {
    EXPECT_EQ(fs::path(rules::rulesCachePath("rules", "BTCUSDT")), fs::path("rules") / "BTCUSDT_rules.json");
}

TEST_F(RulesLoaderTest, FetchesOnceThenServesFromCache) {
    auto first = rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, false, fetcher_);
    EXPECT_EQ(fetch_count_, 1);
    EXPECT_TRUE(fs::exists(rules::rulesCachePath(rules_dir_.string(), "BTCUSDT")));

    auto second = rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, false, fetcher_);
    EXPECT_EQ(fetch_count_, 1);
    EXPECT_EQ(second.tick_size, first.tick_size);
    EXPECT_EQ(second.step_size, first.step_size);
    EXPECT_EQ(second.min_notional, first.min_notional);
    EXPECT_EQ(second.step_size.toString(), "0.0001");
}

TEST_F(RulesLoaderTest, RefreshAndDisabledCacheFetchAgain) {
    rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, false, fetcher_);
    rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, true, fetcher_);
    rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), false, false, fetcher_);
    EXPECT_EQ(fetch_count_, 3);
}

TEST_F(RulesLoaderTest, MissingFetcherWithoutCacheThrows) {
    EXPECT_THROW(rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, false, nullptr), core::RulesException);
}

TEST_F(RulesLoaderTest, CorruptCacheThrows) {
    fs::create_directories(rules_dir_);
    std::ofstream(rules::rulesCachePath(rules_dir_.string(), "BTCUSDT")) << "{ broken";
    EXPECT_THROW(rules::loadSymbolRules("BTCUSDT", rules_dir_.string(), true, false, fetcher_), core::RulesException);
}
