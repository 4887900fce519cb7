#include <gtest/gtest.h>
#include <algorithm>

#include "database_manager.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

namespace {

    core::TimeSeries<core::Bar> hourlyBars(std::int64_t start_ms, int count, double first_close) {
        core::TimeSeries<core::Bar> bars;
        for (int i = 0; i < count; ++i) {
            core::Bar bar;
            bar.timestamp = core::utils::millisToTimestamp(start_ms + i * 3600000LL);
            bar.open = first_close + i;
            bar.high = first_close + i + 1;
            bar.low = first_close + i - 1;
            bar.close = first_close + i;
            bar.volume = 10.0 + i;
            bar.symbol = "BTCUSDT";
            bars.push_back(bar);
        }
        return bars;
    }

} // namespace

class DatabaseManagerTest : public ::testing::Test {
protected:
    data::DatabaseManager db_{":memory:"};

    void SetUp() override {
        ASSERT_TRUE(db_.connect());
        ASSERT_TRUE(db_.initializeSchema());
    }
};

TEST_F(DatabaseManagerTest, SavesAndQueriesInAscendingOrder) {
    auto bars = hourlyBars(1735689600000, 5, 100.0);
    std::reverse(bars.begin(), bars.end());
    ASSERT_TRUE(db_.saveBars(bars, "BTCUSDT", "1h"));

    auto loaded = db_.queryBars("BTCUSDT", "1h");
    ASSERT_EQ(loaded.size(), 5u);
    EXPECT_EQ(core::utils::timestampToMillis(loaded.front().timestamp), 1735689600000);
    EXPECT_DOUBLE_EQ(loaded.front().close, 100.0);
    EXPECT_DOUBLE_EQ(loaded.back().close, 104.0);
    EXPECT_DOUBLE_EQ(loaded.back().volume, 14.0);
    EXPECT_EQ(loaded.back().symbol, "BTCUSDT");
}

TEST_F(DatabaseManagerTest, DuplicatesAreIgnored) {
    auto bars = hourlyBars(1735689600000, 3, 100.0);
    ASSERT_TRUE(db_.saveBars(bars, "BTCUSDT", "1h"));
    ASSERT_TRUE(db_.saveBars(bars, "BTCUSDT", "1h"));
    EXPECT_EQ(db_.queryBars("BTCUSDT", "1h").size(), 3u);
}

TEST_F(DatabaseManagerTest, QueryFiltersBySymbolIntervalAndRange) {
    ASSERT_TRUE(db_.saveBars(hourlyBars(1735689600000, 10, 100.0), "BTCUSDT", "1h"));
    ASSERT_TRUE(db_.saveBars(hourlyBars(1735689600000, 4, 50.0), "ETHUSDT", "1h"));

    EXPECT_EQ(db_.queryBars("ETHUSDT", "1h").size(), 4u);
    EXPECT_TRUE(db_.queryBars("BTCUSDT", "4h").empty());

    auto ranged = db_.queryBars("BTCUSDT", "1h",
                                core::utils::millisToTimestamp(1735689600000 + 2 * 3600000LL),
                                core::utils::millisToTimestamp(1735689600000 + 5 * 3600000LL));
    ASSERT_EQ(ranged.size(), 4u);
    EXPECT_DOUBLE_EQ(ranged.front().close, 102.0);
    EXPECT_DOUBLE_EQ(ranged.back().close, 105.0);
}

TEST_F(DatabaseManagerTest, QueryWhenDisconnectedThrows) {
    db_.disconnect();
    EXPECT_FALSE(db_.isConnected());
    EXPECT_THROW(db_.queryBars("BTCUSDT", "1h"), core::DataLoadException);
    EXPECT_FALSE(db_.saveBars(hourlyBars(0, 1, 1.0), "BTCUSDT", "1h"));
}
