#pragma once

#include <memory>
#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp" // Keep core types

namespace data {

// --- DatabaseManager ---
// Local SQLite store of historical candles, keyed by (instrument, interval,
// timestamp). Timestamps are stored as ISO-8601 UTC text so range queries can
// compare them as strings.
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

    // Creates the candle table and its index if missing.
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; duplicates are skipped.
    bool saveCandles(const core::PriceTable& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Candles in [start_time, end_time], ascending. Throws
    // core::DataLoadException if not connected or the query fails.
    core::PriceTable queryCandles(const std::string& instrument_key,
                                  const std::string& interval,
                                  core::Timestamp start_time,
                                  core::Timestamp end_time);

    // Every candle stored for the instrument/interval.
    core::PriceTable queryAllCandles(const std::string& instrument_key,
                                     const std::string& interval);

private:
    // Finalized on destruction, so early returns and throws cannot leak a statement
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    // Null statement on failure; the SQLite error is in lastError().
    Statement prepare(const char* sql);
    std::string lastError() const;

    core::PriceTable runCandleQuery(const std::string& instrument_key,
                                    const std::string& interval,
                                    const std::string& start_text,
                                    const std::string& end_text);

    bool insertCandles(sqlite3_stmt* stmt,
                       const core::PriceTable& candles,
                       const std::string& instrument_key,
                       const std::string& interval,
                       int& inserted);

    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
