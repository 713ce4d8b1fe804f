#pragma once

#include <string>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// Local SQLite cache of fetched candles plus a record of which exact ranges
// were fetched to completion, so a repeated request can skip the network.
class CandleStore {
public:
    explicit CandleStore(const std::string& db_path);
    ~CandleStore();

    CandleStore(const CandleStore&) = delete;
    CandleStore& operator=(const CandleStore&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();
    bool executeSQL(const std::string& sql);

    // Duplicate (symbol, interval, open_time_ms) rows are ignored. One transaction.
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     const std::string& interval);

    // Ascending by open time, restricted to the half-open window
    core::TimeSeries<core::Candle> queryCandles(const std::string& symbol,
                                                const std::string& interval,
                                                const core::TimeWindow& window);

    bool recordRange(const std::string& symbol,
                     const std::string& interval,
                     const core::TimeWindow& window);

    // True when a previously recorded range covers `window` entirely
    bool hasRange(const std::string& symbol,
                  const std::string& interval,
                  const core::TimeWindow& window);

    const std::string& path() const { return database_path_; }

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
