#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace core {

    // Unix milliseconds, UTC
    using Millis = std::int64_t;

    // Upstream hard cap on rows per page
    constexpr int kMaxPageLimit = 1000;
    constexpr const char* kDefaultInterval = "30m";

    // One fixed-interval OHLC bar. Prices are passed through as the decimal
    // text the exchange sent, never re-rounded.
    struct Candle {
        Millis open_time_ms = 0;
        std::string open;
        std::string high;
        std::string low;
        std::string close;

        bool operator<(const Candle& other) const {
            return open_time_ms < other.open_time_ms;
        }

        bool operator==(const Candle& other) const {
            return open_time_ms == other.open_time_ms && open == other.open &&
                   high == other.high && low == other.low && close == other.close;
        }
    };

    // Half-open [start_ms, end_ms)
    struct TimeWindow {
        Millis start_ms = 0;
        Millis end_ms = 0;

        bool empty() const { return start_ms >= end_ms; }
        bool contains(Millis t) const { return t >= start_ms && t < end_ms; }
    };

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    struct PageRequest {
        std::string symbol;
        std::string interval = kDefaultInterval;
        Millis start_ms = 0;
        Millis end_ms = 0;
        int limit = kMaxPageLimit;

        TimeWindow window() const { return TimeWindow{start_ms, end_ms}; }

        // Parameter names as the klines endpoint expects them. The endpoint's
        // endTime is inclusive, so the half-open window ends at end_ms - 1.
        QueryParams toQueryParams() const {
            return {
                {"symbol", symbol},
                {"interval", interval},
                {"startTime", std::to_string(start_ms)},
                {"endTime", std::to_string(end_ms - 1)},
                {"limit", std::to_string(limit)},
            };
        }
    };

    template<typename T>
    using TimeSeries = std::vector<T>; // Simple alias for now

} // namespace core
