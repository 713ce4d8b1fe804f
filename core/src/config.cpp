#include "config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace core {

    namespace {

        template<typename T>
        void readField(const json& config, const char* key, T& target) {
            if (!config.contains(key)) {
                return;
            }
            try {
                target = config.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Config key '{}' has the wrong type: {}", key, e.what()));
            }
        }

        void readEnv(const char* name, std::string& target) {
            if (const char* value = std::getenv(name)) {
                target = value;
            }
        }

    } // namespace

    FetcherConfig FetcherConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Fetcher config must be a JSON object");
        }
        FetcherConfig result;
        readField(config, "base_url", result.base_url);
        readField(config, "klines_path", result.klines_path);
        readField(config, "symbol", result.symbol);
        readField(config, "interval", result.interval);
        readField(config, "limit", result.limit);
        readField(config, "timeout_ms", result.timeout_ms);
        readField(config, "max_attempts", result.max_attempts);
        readField(config, "inter_page_delay_ms", result.inter_page_delay_ms);
        readField(config, "backoff_cap_s", result.backoff_cap_s);
        readField(config, "cache_db_path", result.cache_db_path);
        readField(config, "use_cache", result.use_cache);
        readField(config, "log_level", result.log_level);
        return result;
    }

    FetcherConfig FetcherConfig::fromFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json parsed;
        try {
            parsed = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        return fromJson(parsed);
    }

    void FetcherConfig::applyEnvironment() {
        readEnv("KLINE_BASE_URL", base_url);
        readEnv("KLINE_SYMBOL", symbol);
        readEnv("KLINE_INTERVAL", interval);
        readEnv("KLINE_CACHE_DB", cache_db_path);
        readEnv("KLINE_LOG_LEVEL", log_level);

        if (const char* attempts = std::getenv("KLINE_MAX_ATTEMPTS")) {
            try {
                max_attempts = std::stoi(attempts);
            } catch (const std::exception&) {
                throw ConfigException(fmt::format("KLINE_MAX_ATTEMPTS is not an integer: '{}'", attempts));
            }
        }
    }

    void FetcherConfig::validate() const {
        if (symbol.empty()) {
            throw ConfigException("symbol must not be empty");
        }
        if (base_url.empty()) {
            throw ConfigException("base_url must not be empty");
        }
        if (limit < 1 || limit > kMaxPageLimit) {
            throw ConfigException(fmt::format("limit must be within [1, {}], got {}", kMaxPageLimit, limit));
        }
        if (timeout_ms <= 0) {
            throw ConfigException(fmt::format("timeout_ms must be positive, got {}", timeout_ms));
        }
        if (max_attempts < 1) {
            throw ConfigException(fmt::format("max_attempts must be at least 1, got {}", max_attempts));
        }
        if (inter_page_delay_ms < 0) {
            throw ConfigException(fmt::format("inter_page_delay_ms must not be negative, got {}", inter_page_delay_ms));
        }
        if (backoff_cap_s < 1) {
            throw ConfigException(fmt::format("backoff_cap_s must be at least 1, got {}", backoff_cap_s));
        }
        try {
            utils::intervalToMillis(interval);
        } catch (const std::logic_error& e) {
            throw ConfigException(e.what());
        }
    }

} // namespace core
