#pragma once

#include "datatypes.hpp"
#include <string>

namespace core {
namespace utils {

    // Binance interval string ("1m", "30m", "4h", "1d", "1w", "1M") to its length in ms.
    // "M" counts as 30 days. Throws std::invalid_argument on anything else.
    Millis intervalToMillis(const std::string& interval);

    // UTC ISO 8601 with milliseconds, e.g. 2026-01-01T00:30:00.000Z
    std::string millisToIsoString(Millis ms);

    // Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM].
    // A missing offset is read as UTC. Throws std::runtime_error on failure.
    Millis isoStringToMillis(const std::string& iso_string);

    Millis nowMillis();

    // Plain decimal text: optional sign, digits with at most one '.', optional exponent
    bool isDecimalString(const std::string& text);

} // namespace utils
} // namespace core
