#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToMillis/millisToTimestamp
#include <limits>
#include <cstdint>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Unfinalized statements keep the handle busy
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->debug("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS bars (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            open_time_ms INTEGER NOT NULL, -- UTC epoch milliseconds
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL NOT NULL,
            PRIMARY KEY (symbol, interval, open_time_ms)
        );
    )";

        bool success = executeSQL(create_bars_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::Bar> DatabaseManager::queryBars(
        const std::string& symbol,
        const std::string& interval,
        std::optional<core::Timestamp> start_time,
        std::optional<core::Timestamp> end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query bars: not connected to database " + database_path_);
        }

        const std::int64_t start_ms = start_time ? core::utils::timestampToMillis(*start_time)
                                                 : std::numeric_limits<std::int64_t>::min();
        const std::int64_t end_ms = end_time ? core::utils::timestampToMillis(*end_time)
                                             : std::numeric_limits<std::int64_t>::max();

        logger->debug("Querying bars for {} ({}) between {} and {} ms", symbol, interval, start_ms, end_ms);

        const char* sql = R"(
            SELECT open_time_ms, open, high, low, close, volume
            FROM bars
            WHERE symbol = ?
              AND interval = ?
              AND open_time_ms >= ?
              AND open_time_ms <= ?
            ORDER BY open_time_ms ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Failed to prepare bar query: " + message);
        }

        // Index is 1-based
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, start_ms);
        sqlite3_bind_int64(stmt, 4, end_ms);

        core::TimeSeries<core::Bar> bars;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            core::Bar bar;
            bar.timestamp = core::utils::millisToTimestamp(sqlite3_column_int64(stmt, 0));
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            bar.volume = sqlite3_column_double(stmt, 5);
            bar.symbol = symbol;
            bars.push_back(bar);
        }

        if (rc != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Error stepping through bar query results: " + message);
        }
        sqlite3_finalize(stmt);

        logger->debug("Loaded {} bars for {} ({}) from SQLite.", bars.size(), symbol, interval);
        return bars;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars,
                                   const std::string &symbol,
                                   const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save for {} ({}).", symbol, interval);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO bars
(symbol, interval, open_time_ms, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, core::utils::timestampToMillis(bar.timestamp));
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);
            sqlite3_bind_double(stmt, 8, bar.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;")) {
                    logger->error("ROLLBACK after failed COMMIT also failed for {} ({}).", symbol, interval);
                }
                return false;
            }
            logger->info("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving bars.");
        }
        logger->warn("Transaction rolled back due to error during bar save for {} ({}).", symbol, interval);
        return false;
    }

} // namespace data
