#pragma once

#include <cstddef>
#include <string>

#include "datatypes.hpp"

namespace data {

    // Writes open_time_ms,open,high,low,close with a header row.
    // Returns the number of candle rows written. Throws core::DataLoadException.
    std::size_t writeCandlesCsv(const std::string& path, const core::TimeSeries<core::Candle>& candles);

    // Loads a candle CSV with loosely named headers (timestamp/time/datetime/date,
    // open, high, low, close; extra columns ignored). Timestamps may be epoch ms,
    // epoch seconds or ISO 8601. Rows with unusable values are dropped; the result
    // is sorted by open time. Throws core::DataLoadException.
    core::TimeSeries<core::Candle> readCandlesCsv(const std::string& path);

} // namespace data
