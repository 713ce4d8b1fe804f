#include "candle_store.hpp"
#include "logging.hpp"

#include <filesystem>
#include <string>

namespace data
{

    namespace
    {
        // sqlite3_column_text returns unsigned char*, and NULL for SQL NULL
        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? reinterpret_cast<const char *>(text) : std::string();
        }
    } // namespace

    CandleStore::CandleStore(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("CandleStore (SQLite) created for path: {}", db_path);
    }

    CandleStore::~CandleStore()
    {
        disconnect();
    }

    bool CandleStore::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        // Create the parent directory of on-disk caches; ":memory:" has none
        const std::filesystem::path parent = std::filesystem::path(database_path_).parent_path();
        if (database_path_ != ":memory:" && !parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                logger->error("Cannot create cache directory '{}': {}", parent.string(), ec.message());
                return false;
            }
        }

        logger->info("Connecting to SQLite database: {}", database_path_);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        return true;
    }

    void CandleStore::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->debug("Disconnecting from SQLite database: {}", database_path_);
        if (sqlite3_close(db_) != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool CandleStore::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool CandleStore::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool CandleStore::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }

        // Prices stay TEXT so the exchange's decimal strings round-trip untouched
        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS candles (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            open_time_ms INTEGER NOT NULL,
            open TEXT NOT NULL,
            high TEXT NOT NULL,
            low TEXT NOT NULL,
            close TEXT NOT NULL,
            PRIMARY KEY (symbol, interval, open_time_ms)
        );
    )";

        const std::string create_ranges_sql = R"(
        CREATE TABLE IF NOT EXISTS fetched_ranges (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            start_ms INTEGER NOT NULL,
            end_ms INTEGER NOT NULL,
            fetched_at_ms INTEGER NOT NULL DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000),
            PRIMARY KEY (symbol, interval, start_ms, end_ms)
        );
    )";

        bool success = executeSQL(create_candles_sql) && executeSQL(create_ranges_sql);
        if (!success)
        {
            core::logging::getLogger()->error("SQLite candle cache schema initialization failed.");
        }
        return success;
    }

    bool CandleStore::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                  const std::string &symbol,
                                  const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO candles
(symbol, interval, open_time_ms, open, high, low, close)
VALUES (?, ?, ?, ?, ?, ?, ?);
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
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, candle.open_time_ms);
            sqlite3_bind_text(stmt, 4, candle.open.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, candle.high.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 6, candle.low.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 7, candle.close.c_str(), -1, SQLITE_TRANSIENT);

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

        const std::string final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success && !executeSQL("ROLLBACK;"))
            {
                logger->error("ROLLBACK after failed COMMIT also failed; connection may hold an open transaction.");
            }
            return false;
        }

        if (success)
        {
            logger->info("Cached {} new candles (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", symbol, interval);
        }
        return success;
    }

    core::TimeSeries<core::Candle> CandleStore::queryCandles(const std::string &symbol,
                                                             const std::string &interval,
                                                             const core::TimeWindow &window)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        const char *sql = R"(
            SELECT open_time_ms, open, high, low, close
            FROM candles
            WHERE symbol = ? AND interval = ?
              AND open_time_ms >= ? AND open_time_ms < ?
            ORDER BY open_time_ms ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return candles;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, window.start_ms);
        sqlite3_bind_int64(stmt, 4, window.end_ms);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::Candle candle;
            candle.open_time_ms = sqlite3_column_int64(stmt, 0);
            candle.open = columnText(stmt, 1);
            candle.high = columnText(stmt, 2);
            candle.low = columnText(stmt, 3);
            candle.close = columnText(stmt, 4);
            candles.push_back(std::move(candle));
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        else
        {
            logger->debug("Loaded {} cached candles for {} ({}).", candles.size(), symbol, interval);
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    bool CandleStore::recordRange(const std::string &symbol,
                                  const std::string &interval,
                                  const core::TimeWindow &window)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot record range: Not connected to database.");
            return false;
        }

        const char *sql = "INSERT OR REPLACE INTO fetched_ranges (symbol, interval, start_ms, end_ms) VALUES (?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare range insert [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, window.start_ms);
        sqlite3_bind_int64(stmt, 4, window.end_ms);

        rc = sqlite3_step(stmt);
        const bool success = (rc == SQLITE_DONE);
        if (!success)
        {
            core::logging::getLogger()->error("Failed to record fetched range [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return success;
    }

    bool CandleStore::hasRange(const std::string &symbol,
                               const std::string &interval,
                               const core::TimeWindow &window)
    {
        if (!isConnected())
        {
            return false;
        }

        const char *sql = R"(
            SELECT 1 FROM fetched_ranges
            WHERE symbol = ? AND interval = ? AND start_ms <= ? AND end_ms >= ?
            LIMIT 1;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare range lookup [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, window.start_ms);
        sqlite3_bind_int64(stmt, 4, window.end_ms);

        rc = sqlite3_step(stmt);
        const bool found = (rc == SQLITE_ROW);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            core::logging::getLogger()->error("Error looking up fetched range [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return found;
    }

} // namespace data
