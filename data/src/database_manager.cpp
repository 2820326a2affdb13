#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace data
{

    namespace
    {

        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            if (!text)
            {
                throw std::runtime_error("NULL in column " + std::to_string(column));
            }
            return reinterpret_cast<const char *>(text);
        }

    } // end anonymous namespace

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
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Handle is allocated even on failure
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
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
            // Unfinalized statements keep the handle open
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
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
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
        CREATE TABLE IF NOT EXISTS price_bars (
            symbol TEXT NOT NULL,
            timeframe TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- UTC, YYYY-MM-DDTHH:MM:SSZ
            open TEXT NOT NULL,      -- Exact decimal strings, never REAL
            high TEXT NOT NULL,
            low TEXT NOT NULL,
            close TEXT NOT NULL,
            volume INTEGER NOT NULL,
            PRIMARY KEY (symbol, timeframe, timestamp)
        );
    )";

        const std::string create_bars_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_price_bars_timestamp
        ON price_bars (symbol, timeframe, timestamp);
     )";

        bool success = executeSQL(create_bars_sql);
        success = success && executeSQL(create_bars_index_sql);

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
        const std::string &symbol,
        const std::string &timeframe,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query bars: not connected to " + database_path_);
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);
        logger->debug("Querying bars for {} ({}) between '{}' and '{}'", symbol, timeframe, start_str, end_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM price_bars
            WHERE symbol = ?
              AND timeframe = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Failed to prepare bar query [" + std::to_string(rc) + "]: " + message);
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Bar> bars;
        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ++row_count;
            try
            {
                bars.push_back(core::makeBar(
                    symbol, timeframe,
                    core::utils::stringToTimestamp(columnText(stmt, 0)),
                    core::Decimal::fromString(columnText(stmt, 1)),
                    core::Decimal::fromString(columnText(stmt, 2)),
                    core::Decimal::fromString(columnText(stmt, 3)),
                    core::Decimal::fromString(columnText(stmt, 4)),
                    sqlite3_column_int64(stmt, 5)));
            }
            catch (const std::exception &e)
            {
                // One unreadable row does not invalidate the series
                logger->warn("Skipping unreadable bar row {} for {} ({}): {}", row_count, symbol, timeframe, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Error stepping through bar query [" + std::to_string(rc) + "]: " + message);
        }
        sqlite3_finalize(stmt);

        logger->debug("Loaded {} bars for {} ({}).", bars.size(), symbol, timeframe);
        return bars;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save.");
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO price_bars
(symbol, timeframe, timestamp, open, high, low, close, volume)
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
            const std::string timestamp_str = core::utils::timestampToString(bar.timestamp);
            const std::string open = bar.open.toString();
            const std::string high = bar.high.toString();
            const std::string low = bar.low.toString();
            const std::string close = bar.close.toString();

            sqlite3_bind_text(stmt, 1, bar.symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, bar.timeframe.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, open.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, high.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 6, low.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 7, close.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 8, bar.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to insert bar {} {} [{}]: {}", bar.symbol, timestamp_str, rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                ++saved_count;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("Failed to ROLLBACK after COMMIT failure.");
                }
                return false;
            }
            logger->info("Saved {} new bars ({} duplicates ignored).", saved_count, bars.size() - static_cast<size_t>(saved_count));
        }
        else
        {
            if (!executeSQL("ROLLBACK;"))
            {
                logger->error("Failed to ROLLBACK transaction for saving bars.");
            }
            logger->warn("Transaction rolled back due to error during bar save.");
        }
        return success;
    }

} // namespace data
