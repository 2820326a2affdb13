#pragma once

#include <string>
#include <vector>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

// Historical bar store. Prices are kept as exact decimal TEXT, timestamps as
// UTC ISO-8601 TEXT so that lexical order equals time order.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();
    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; rolled back on the first failed row
    bool saveBars(const core::TimeSeries<core::Bar>& bars);

    // Bars with start_time <= timestamp <= end_time, ascending.
    // Throws core::DataLoadException when not connected or the query fails.
    core::TimeSeries<core::Bar> queryBars(
        const std::string& symbol,
        const std::string& timeframe,
        core::Timestamp start_time,
        core::Timestamp end_time);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
