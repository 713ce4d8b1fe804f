#pragma once

#include <string>
#include "datatypes.hpp"

namespace data {

    // Parses one klines page: a JSON array of arrays whose first five elements are
    // [open_time_ms, open, high, low, close]. Trailing elements are ignored.
    // Prices may arrive as numbers or numeric strings and are kept as decimal text.
    // Open times must be strictly increasing. Throws core::DataLoadException.
    core::TimeSeries<core::Candle> parseKlinePage(const std::string& body);

} // namespace data
