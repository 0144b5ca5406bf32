#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <spdlog/fmt/fmt.h>
#include <exception>

namespace data
{

    namespace
    {
        const char* const kCreateCandlesSql = R"(
            CREATE TABLE IF NOT EXISTS historical_candles (
                instrument_key TEXT NOT NULL,
                interval TEXT NOT NULL,
                timestamp TEXT NOT NULL, -- ISO-8601 UTC, e.g. 2023-01-03T00:00:00Z
                open REAL,
                high REAL,
                low REAL,
                close REAL,
                volume INTEGER,
                PRIMARY KEY (instrument_key, interval, timestamp)
            );
        )";

        const char* const kCreateCandlesIndexSql = R"(
            CREATE INDEX IF NOT EXISTS idx_candles_timestamp
            ON historical_candles (instrument_key, interval, timestamp);
        )";

        // Timestamps share one fixed-width UTC layout, so TEXT comparison orders them
        const char* const kSelectCandlesSql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?1 AND interval = ?2 AND timestamp >= ?3 AND timestamp <= ?4
            ORDER BY timestamp ASC;
        )";

        // Duplicates on (instrument_key, interval, timestamp) are ignored
        const char* const kInsertCandleSql = R"(
            INSERT OR IGNORE INTO historical_candles
            (instrument_key, interval, timestamp, open, high, low, close, volume)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);
        )";

        const char* const kMinTimestamp = "0000-01-01T00:00:00Z";
        const char* const kMaxTimestamp = "9999-12-31T23:59:59Z";

        core::Candle readCandleRow(sqlite3_stmt* stmt, const char* timestamp_text)
        {
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(timestamp_text);
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_int64(stmt, 5);
            return candle;
        }
    } // namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (isConnected())
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Opening candle database: {}", database_path_);
        const int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_,
                          db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // The handle is allocated even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // Only happens with statements left unfinalized
            core::logging::getLogger()->error("Error closing SQLite database {}: {}", database_path_, lastError());
        }
        db_ = nullptr;
        connected_ = false;
        core::logging::getLogger()->debug("Closed SQLite database: {}", database_path_);
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && db_ != nullptr;
    }

    std::string DatabaseManager::lastError() const
    {
        return db_ ? sqlite3_errmsg(db_) : "no database handle";
    }

    DatabaseManager::Statement DatabaseManager::prepare(const char* sql)
    {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return Statement();
        }
        return Statement(raw);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: not connected to {}.", database_path_);
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);
        char *error_msg = nullptr;
        const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
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
        if (!executeSQL(kCreateCandlesSql) || !executeSQL(kCreateCandlesIndexSql))
        {
            core::logging::getLogger()->error("Candle schema initialization failed for {}.", database_path_);
            return false;
        }
        core::logging::getLogger()->debug("Candle schema ready in {}", database_path_);
        return true;
    }

    core::PriceTable DatabaseManager::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        return runCandleQuery(instrument_key, interval,
                              core::utils::timestampToString(start_time),
                              core::utils::timestampToString(end_time));
    }

    core::PriceTable DatabaseManager::queryAllCandles(const std::string& instrument_key,
                                                      const std::string& interval)
    {
        return runCandleQuery(instrument_key, interval, kMinTimestamp, kMaxTimestamp);
    }

    core::PriceTable DatabaseManager::runCandleQuery(const std::string& instrument_key,
                                                     const std::string& interval,
                                                     const std::string& start_text,
                                                     const std::string& end_text)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException(fmt::format("Cannot query candles: not connected to {}.", database_path_));
        }

        Statement stmt = prepare(kSelectCandlesSql);
        if (!stmt)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare candle query: {}", lastError()));
        }
        sqlite3_bind_text(stmt.get(), 1, instrument_key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 2, interval.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 3, start_text.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 4, end_text.c_str(), -1, SQLITE_STATIC);

        core::PriceTable candles;
        int row = 0;
        int rc = SQLITE_OK;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            ++row;
            const auto* ts_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
            if (ts_text == nullptr)
            {
                logger->warn("Row {} of {} ({}) has no timestamp. Row skipped.", row, instrument_key, interval);
                continue;
            }
            try
            {
                candles.push_back(readCandleRow(stmt.get(), ts_text));
            }
            catch (const std::exception& e)
            {
                logger->warn("Row {} of {} ({}): {}. Row skipped.", row, instrument_key, interval, e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format(
                "Candle query for {} ({}) failed [{}]: {}", instrument_key, interval, rc, lastError()));
        }

        logger->debug("Candle query [{} .. {}] returned {} rows for {} ({}).",
                      start_text, end_text, candles.size(), instrument_key, interval);
        return candles;
    }

    bool DatabaseManager::insertCandles(sqlite3_stmt* stmt,
                                        const core::PriceTable& candles,
                                        const std::string& instrument_key,
                                        const std::string& interval,
                                        int& inserted)
    {
        for (const auto& candle : candles)
        {
            const std::string timestamp = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 3, timestamp.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);

            const int rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Insert of {} {} failed [{}]: {}", instrument_key, timestamp, rc, lastError());
                return false;
            }
            inserted += sqlite3_changes(db_);
            if (sqlite3_reset(stmt) != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to reset insert statement: {}", lastError());
                return false;
            }
        }
        return true;
    }

    bool DatabaseManager::saveCandles(const core::PriceTable &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: not connected to {}.", database_path_);
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles to save for {} ({}).", instrument_key, interval);
            return true;
        }

        int inserted = 0;
        bool success = false;
        {
            Statement stmt = prepare(kInsertCandleSql);
            if (!stmt)
            {
                logger->error("Failed to prepare candle insert: {}", lastError());
                return false;
            }
            if (!executeSQL("BEGIN TRANSACTION;"))
            {
                return false;
            }
            success = insertCandles(stmt.get(), candles, instrument_key, interval, inserted);
        } // Statement finalized before COMMIT/ROLLBACK

        if (success && executeSQL("COMMIT;"))
        {
            logger->info("Saved {} new candles ({} duplicates ignored) for {} ({}).",
                         inserted, candles.size() - static_cast<std::size_t>(inserted), instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("ROLLBACK failed for {} ({}); database {} may hold a partial write.",
                          instrument_key, interval, database_path_);
        }
        logger->warn("Candle save for {} ({}) rolled back.", instrument_key, interval);
        return false;
    }

} // namespace data
