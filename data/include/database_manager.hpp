#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// Local SQLite store for downloaded klines.
// Rows are keyed by (symbol, interval, open_time_ms); timestamps are stored as INTEGER epoch milliseconds.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns a raw sqlite3 handle: neither copyable nor movable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = delete;
    DatabaseManager& operator=(DatabaseManager&&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; rolls back on the first failed row
    bool saveBars(const core::TimeSeries<core::Bar>& bars,
                  const std::string& symbol,
                  const std::string& interval);

    // Ascending by timestamp; bounds are inclusive and optional.
    // Throws core::DataLoadException when not connected or the query fails.
    core::TimeSeries<core::Bar> queryBars(
        const std::string& symbol,
        const std::string& interval,
        std::optional<core::Timestamp> start_time = std::nullopt,
        std::optional<core::Timestamp> end_time = std::nullopt);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
