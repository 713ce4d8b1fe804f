#include "fetch_engine.hpp"
#include "exceptions.hpp"
#include "kline_parser.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace data {

namespace {

bool isValidLimit(int limit) {
    return limit >= 1 && limit <= core::kMaxPageLimit;
}

FetchError invalidLimit(int limit) {
    FetchError error;
    error.kind = FetchErrorKind::InvalidLimit;
    error.message = fmt::format("limit must be within [1, {}], got {}", core::kMaxPageLimit, limit);
    return error;
}

FetchError cancelled(const std::string& where) {
    FetchError error;
    error.kind = FetchErrorKind::Cancelled;
    error.message = "cancelled " + where;
    return error;
}

std::size_t estimateTotal(const FetchRequest& request) {
    core::Millis interval_ms = 0;
    try {
        interval_ms = core::utils::intervalToMillis(request.interval);
    } catch (const std::logic_error& e) {
        core::logging::getLogger()->debug("No progress estimate for interval '{}': {}", request.interval, e.what());
        return 1;
    }
    return static_cast<std::size_t>(std::max<core::Millis>(1, (request.end_ms - request.start_ms) / interval_ms));
}

} // namespace

FetchRequest FetchRequest::fromConfig(const core::FetcherConfig& config,
                                      core::Millis start_ms,
                                      core::Millis end_ms)
{
    FetchRequest request;
    request.symbol = config.symbol;
    request.interval = config.interval;
    request.start_ms = start_ms;
    request.end_ms = end_ms;
    request.limit = config.limit;
    request.timeout = std::chrono::milliseconds(config.timeout_ms);
    request.max_attempts = config.max_attempts;
    request.inter_page_delay = std::chrono::milliseconds(config.inter_page_delay_ms);
    request.backoff_cap = std::chrono::seconds(config.backoff_cap_s);
    return request;
}

FetchEngine::FetchEngine(IHttpTransport& transport,
                         ISleeper& sleeper,
                         std::string base_url,
                         std::string klines_path)
    : transport_(transport),
      sleeper_(sleeper),
      url_(std::move(base_url) + klines_path)
{
    core::logging::getLogger()->debug("FetchEngine created for {}", url_);
}

std::chrono::seconds FetchEngine::backoffDelay(int attempt, std::chrono::seconds cap)
{
    // 2^31 overflows int; anything that large is past any sane cap anyway
    if (attempt >= 30) {
        return cap;
    }
    const std::chrono::seconds exponential(1LL << std::max(0, attempt));
    return std::min(exponential, cap);
}

FetchResult FetchEngine::fetch(const FetchRequest& request) const
{
    core::CancellationToken never_cancelled;
    return fetch(request, never_cancelled);
}

FetchResult FetchEngine::fetch(const FetchRequest& request, const core::CancellationToken& token) const
{
    auto logger = core::logging::getLogger();

    if (!isValidLimit(request.limit)) {
        logger->error("Rejecting fetch for {}: limit {} out of range", request.symbol, request.limit);
        return FetchResult::failure(invalidLimit(request.limit));
    }
    if (request.start_ms >= request.end_ms) {
        logger->debug("Empty window [{}, {}) for {}, nothing to fetch", request.start_ms, request.end_ms, request.symbol);
        return FetchResult::success({});
    }

    logger->info("Fetching {} {} candles from {} to {}", request.symbol, request.interval,
                 core::utils::millisToIsoString(request.start_ms),
                 core::utils::millisToIsoString(request.end_ms));

    const RetryPolicy policy = request.retryPolicy();
    const std::size_t estimated_total = estimateTotal(request);
    core::TimeSeries<core::Candle> results;
    core::Millis cursor = request.start_ms;
    int page_number = 0;

    while (cursor < request.end_ms) {
        if (token.isCancelled()) {
            logger->warn("Fetch for {} cancelled before page {}", request.symbol, page_number + 1);
            return FetchResult::failure(cancelled(fmt::format("before page {}", page_number + 1)));
        }

        const core::PageRequest page{request.symbol, request.interval, cursor, request.end_ms, request.limit};
        ++page_number;

        FetchResult outcome = runWithRetry(page, policy, token);
        if (!outcome.ok()) {
            logger->error("Fetch for {} aborted on page {}: {}", request.symbol, page_number, outcome.error().describe());
            return outcome;
        }

        core::TimeSeries<core::Candle> rows = outcome.takeCandles();
        if (rows.empty()) {
            logger->info("Page {} is empty, no more data before {}", page_number,
                         core::utils::millisToIsoString(request.end_ms));
            break;
        }

        cursor = rows.back().open_time_ms + 1;
        logger->debug("Page {}: {} candles, cursor -> {}", page_number, rows.size(), cursor);
        results.insert(results.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));

        if (request.on_progress) {
            request.on_progress(results.size(), estimated_total,
                                fmt::format("{} {} candles collected...", request.symbol, results.size()));
        }

        if (cursor >= request.end_ms) {
            break;
        }
        if (request.inter_page_delay.count() > 0 && !sleeper_.sleepFor(request.inter_page_delay, token)) {
            logger->warn("Fetch for {} cancelled during page pacing", request.symbol);
            return FetchResult::failure(cancelled("during page pacing"));
        }
    }

    logger->info("Fetched {} candles for {} in {} page(s)", results.size(), request.symbol, page_number);
    return FetchResult::success(std::move(results));
}

FetchResult FetchEngine::fetchPage(const core::PageRequest& page,
                                   const RetryPolicy& policy,
                                   const core::CancellationToken& token) const
{
    if (!isValidLimit(page.limit)) {
        return FetchResult::failure(invalidLimit(page.limit));
    }
    if (page.window().empty()) {
        FetchError error;
        error.kind = FetchErrorKind::InvalidRange;
        error.message = fmt::format("page window [{}, {}) is empty", page.start_ms, page.end_ms);
        return FetchResult::failure(error);
    }
    return runWithRetry(page, policy, token);
}

FetchResult FetchEngine::runWithRetry(const core::PageRequest& page,
                                      const RetryPolicy& policy,
                                      const core::CancellationToken& token) const
{
    auto logger = core::logging::getLogger();
    const int max_attempts = std::max(1, policy.max_attempts);
    AttemptFailure last_failure;

    for (int attempt_no = 1; attempt_no <= max_attempts; ++attempt_no) {
        if (token.isCancelled()) {
            return FetchResult::failure(cancelled(fmt::format("before attempt {}", attempt_no)));
        }

        core::TimeSeries<core::Candle> rows;
        if (attempt(page, policy.timeout, rows, last_failure)) {
            if (attempt_no > 1) {
                logger->info("Page starting {} succeeded on attempt {}", page.start_ms, attempt_no);
            }
            return FetchResult::success(std::move(rows));
        }

        if (attempt_no == max_attempts) {
            logger->error("Attempt {}/{} for {} [{}, {}) failed: {} {}", attempt_no, max_attempts,
                          page.symbol, page.start_ms, page.end_ms, toString(last_failure.kind), last_failure.message);
            break;
        }

        const std::chrono::seconds delay = backoffDelay(attempt_no, policy.backoff_cap);
        logger->warn("Attempt {}/{} for {} [{}, {}) failed: {} {}; retrying in {}s", attempt_no, max_attempts,
                     page.symbol, page.start_ms, page.end_ms, toString(last_failure.kind), last_failure.message,
                     delay.count());
        if (!sleeper_.sleepFor(delay, token)) {
            return FetchResult::failure(cancelled(fmt::format("during backoff after attempt {}", attempt_no)));
        }
    }

    FetchError error;
    error.kind = FetchErrorKind::FetchFailed;
    error.message = fmt::format("page starting {} for {} could not be fetched", page.start_ms, page.symbol);
    error.attempts = max_attempts;
    error.last_cause = last_failure;
    return FetchResult::failure(error);
}

bool FetchEngine::attempt(const core::PageRequest& page,
                          std::chrono::milliseconds timeout,
                          core::TimeSeries<core::Candle>& rows,
                          AttemptFailure& failure) const
{
    core::logging::getLogger()->debug("GET {} symbol={} startTime={} endTime={} limit={}",
                                      url_, page.symbol, page.start_ms, page.end_ms, page.limit);

    HttpResponse response = transport_.get(url_, page.toQueryParams(), timeout);

    if (response.failedInTransport()) {
        failure = AttemptFailure{FetchErrorKind::TransportError, 0, response.transport_error->message};
        return false;
    }
    if (response.status_code != 200) {
        failure = AttemptFailure{FetchErrorKind::UpstreamError, static_cast<int>(response.status_code),
                                 fmt::format("HTTP {}: {}", response.status_code, response.body.substr(0, 200))};
        return false;
    }

    try {
        rows = parseKlinePage(response.body);
    } catch (const core::DataLoadException& e) {
        failure = AttemptFailure{FetchErrorKind::MalformedResponse, 200, e.what()};
        return false;
    }

    // A bar opening exactly at end_ms belongs to the next window
    const auto past_end = std::find_if(rows.begin(), rows.end(), [&page](const core::Candle& candle) {
        return candle.open_time_ms >= page.end_ms;
    });
    if (past_end != rows.end()) {
        core::logging::getLogger()->debug("Dropping {} row(s) at or after {}", std::distance(past_end, rows.end()),
                                          page.end_ms);
        rows.erase(past_end, rows.end());
    }

    // Anything left must sit inside the window, otherwise the cursor could stall
    if (!rows.empty() && !page.window().contains(rows.front().open_time_ms)) {
        failure = AttemptFailure{FetchErrorKind::MalformedResponse, 200,
                                 fmt::format("rows [{}, {}] fall outside [{}, {})", rows.front().open_time_ms,
                                             rows.back().open_time_ms, page.start_ms, page.end_ms)};
        rows.clear();
        return false;
    }
    return true;
}

} // namespace data
