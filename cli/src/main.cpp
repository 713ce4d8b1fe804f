// cli/src/main.cpp

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include "cancellation.hpp"
#include "candle_store.hpp"
#include "config.hpp"
#include "cpr_http_transport.hpp"
#include "csv_io.hpp"
#include "exceptions.hpp"
#include "fetch_engine.hpp"
#include "history_service.hpp"
#include "logging.hpp"
#include "sleeper.hpp"
#include "utils.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFetchFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

// Static storage so the signal handler can reach it
core::CancellationToken g_cancel_token;

extern "C" void onInterrupt(int) {
    g_cancel_token.cancel();
}

struct CliOptions {
    std::string config_path;
    std::string symbol;
    std::string interval;
    std::string start = "2026-01-01";
    std::string end = "now";
    std::string csv_path;
    std::string log_level;
    int limit = 0;
    int timeout_s = 0;
    bool no_cache = false;
    bool show_help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config FILE     JSON fetcher config\n"
              << "  --symbol S        trading pair, e.g. BTCUSDT\n"
              << "  --interval I      bar size, e.g. 30m\n"
              << "  --start T         UTC start, YYYY-MM-DD[THH:MM:SS] (default 2026-01-01)\n"
              << "  --end T           UTC end (exclusive) or 'now' (default now)\n"
              << "  --limit N         rows per page, 1..1000\n"
              << "  --timeout-s N     stop the whole fetch after N seconds\n"
              << "  --csv OUT         also write the candles to a CSV file\n"
              << "  --no-cache        bypass the SQLite cache\n"
              << "  --log-level L     trace|debug|info|warn|error\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw core::ConfigException("Missing value for " + flag);
        }
        return argv[++i];
    };
    auto integer = [](const std::string& flag, const std::string& text) {
        try {
            return std::stoi(text);
        } catch (const std::exception&) {
            throw core::ConfigException(flag + " expects an integer, got '" + text + "'");
        }
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") options.config_path = value(i, arg);
        else if (arg == "--symbol") options.symbol = value(i, arg);
        else if (arg == "--interval") options.interval = value(i, arg);
        else if (arg == "--start") options.start = value(i, arg);
        else if (arg == "--end") options.end = value(i, arg);
        else if (arg == "--csv") options.csv_path = value(i, arg);
        else if (arg == "--log-level") options.log_level = value(i, arg);
        else if (arg == "--limit") options.limit = integer(arg, value(i, arg));
        else if (arg == "--timeout-s") options.timeout_s = integer(arg, value(i, arg));
        else if (arg == "--no-cache") options.no_cache = true;
        else if (arg == "--help" || arg == "-h") options.show_help = true;
        else throw core::ConfigException("Unknown argument: " + arg);
    }
    return options;
}

core::Millis parseTime(const std::string& text) {
    if (text == "now") {
        return core::utils::nowMillis();
    }
    try {
        return core::utils::isoStringToMillis(text);
    } catch (const std::runtime_error& e) {
        throw core::ConfigException(e.what());
    }
}

core::FetcherConfig buildConfig(const CliOptions& options) {
    core::FetcherConfig config = options.config_path.empty()
        ? core::FetcherConfig{}
        : core::FetcherConfig::fromFile(options.config_path);
    config.applyEnvironment();

    // Command line wins over file and environment
    if (!options.symbol.empty()) config.symbol = options.symbol;
    if (!options.interval.empty()) config.interval = options.interval;
    if (!options.log_level.empty()) config.log_level = options.log_level;
    if (options.limit != 0) config.limit = options.limit;
    if (options.no_cache) config.use_cache = false;

    config.validate();
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    CliOptions options;
    core::FetcherConfig config;
    core::Millis start_ms = 0;
    core::Millis end_ms = 0;
    try {
        options = parseArgs(argc, argv);
        if (options.show_help) {
            printUsage(argv[0]);
            return kExitOk;
        }
        config = buildConfig(options);
        start_ms = parseTime(options.start);
        end_ms = parseTime(options.end);
    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    }

    try {
        core::logging::initialize("kline_fetcher", core::logging::level_from_string(config.log_level),
                                  spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("kline_fetcher starting: {} {} [{}, {})", config.symbol, config.interval,
                     core::utils::millisToIsoString(start_ms), core::utils::millisToIsoString(end_ms));

        std::signal(SIGINT, onInterrupt);
        if (options.timeout_s > 0) {
            g_cancel_token.setTimeout(std::chrono::seconds(options.timeout_s));
        }

        data::CprHttpTransport transport;
        data::ThreadSleeper sleeper;
        data::FetchEngine engine(transport, sleeper, config.base_url, config.klines_path);

        std::unique_ptr<data::CandleStore> store;
        if (config.use_cache) {
            store = std::make_unique<data::CandleStore>(config.cache_db_path);
            if (!store->connect() || !store->initializeSchema()) {
                logger->warn("Candle cache unavailable at {}, continuing without it", config.cache_db_path);
                store.reset();
            }
        }

        data::FetchRequest request = data::FetchRequest::fromConfig(config, start_ms, end_ms);
        request.on_progress = [&logger](std::size_t fetched, std::size_t total, const std::string& message) {
            const std::size_t percent = std::min<std::size_t>(100, fetched * 100 / std::max<std::size_t>(1, total));
            logger->info("[{:>3}%] {}", percent, message);
        };

        data::HistoryService history(engine, store.get());
        data::FetchResult result = history.load(request, config.use_cache, g_cancel_token);

        if (!result.ok()) {
            const data::FetchError& error = result.error();
            if (error.kind == data::FetchErrorKind::Cancelled) {
                logger->warn("Fetch cancelled: {}", error.describe());
                return kExitCancelled;
            }
            throw core::ApiRequestException(error.describe());
        }

        const auto& candles = result.candles();
        logger->info("Collected {} candles", candles.size());
        if (!candles.empty()) {
            logger->info("First {} close {}, last {} close {}",
                         core::utils::millisToIsoString(candles.front().open_time_ms), candles.front().close,
                         core::utils::millisToIsoString(candles.back().open_time_ms), candles.back().close);
        }

        if (!options.csv_path.empty()) {
            data::writeCandlesCsv(options.csv_path, candles);
        }

        logger->info("kline_fetcher finished.");

    } catch (const core::ApiRequestException& ex) {
        std::cerr << "Fetch failed: " << ex.what() << std::endl;
        if (logger) logger->critical("Fetch failed: {}", ex.what());
        return kExitFetchFailed;
    } catch (const core::KlineFetcherException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Error: {}", ex.what());
        return kExitFetchFailed;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return kExitFetchFailed;
    }

    return kExitOk;
}
