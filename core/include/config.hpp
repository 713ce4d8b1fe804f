#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace core {

    using json = nlohmann::json;

    // Everything the fetcher needs from the outside world. Built once in main()
    // and handed down by value or reference; nothing reads globals.
    struct FetcherConfig {
        std::string base_url = "https://api.binance.com";
        std::string klines_path = "/api/v3/klines";
        std::string symbol = "BTCUSDT";
        std::string interval = kDefaultInterval;
        int limit = kMaxPageLimit;
        int timeout_ms = 15000;
        int max_attempts = 8;
        int inter_page_delay_ms = 200;
        int backoff_cap_s = 30;
        std::string cache_db_path = "cache/klines.db";
        bool use_cache = true;
        std::string log_level = "info";

        // Reads any subset of the fields above; unknown keys are ignored.
        // Throws ConfigException when a present key has the wrong type.
        static FetcherConfig fromJson(const json& config);
        static FetcherConfig fromFile(const std::string& path);

        // KLINE_BASE_URL, KLINE_SYMBOL, KLINE_INTERVAL, KLINE_CACHE_DB,
        // KLINE_MAX_ATTEMPTS, KLINE_LOG_LEVEL
        void applyEnvironment();

        // Throws ConfigException describing the first invalid field
        void validate() const;
    };

} // namespace core
