#include "history_service.hpp"
#include "logging.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace data {

HistoryService::HistoryService(const FetchEngine& engine, CandleStore* store, Clock now)
    : engine_(engine), store_(store), now_(std::move(now))
{
}

FetchResult HistoryService::load(const FetchRequest& request,
                                 bool use_cache,
                                 const core::CancellationToken& token)
{
    auto logger = core::logging::getLogger();
    const core::TimeWindow window{request.start_ms, request.end_ms};
    const bool caching = use_cache && store_ != nullptr && store_->isConnected();

    if (caching && !window.empty() && store_->hasRange(request.symbol, request.interval, window)) {
        core::TimeSeries<core::Candle> cached = store_->queryCandles(request.symbol, request.interval, window);
        if (!cached.empty()) {
            logger->info("Loaded {} candles for {} ({}) from cache {}", cached.size(), request.symbol,
                         request.interval, store_->path());
            if (request.on_progress) {
                request.on_progress(cached.size(), cached.size(), "Loaded from cache: " + store_->path());
            }
            return FetchResult::success(std::move(cached));
        }
        logger->warn("Cache lists range for {} ({}) but holds no candles; refetching", request.symbol, request.interval);
    }

    FetchResult result = engine_.fetch(request, token);
    if (!result.ok()) {
        return result;
    }

    if (result.candles().empty()) {
        if (window.empty()) {
            return result;
        }
        FetchError error;
        error.kind = FetchErrorKind::NoData;
        error.message = "upstream returned no candles for " + request.symbol + " " + request.interval;
        return FetchResult::failure(error);
    }

    if (caching) {
        storeClosedBars(request, result.candles());
    }
    return result;
}

void HistoryService::storeClosedBars(const FetchRequest& request, const core::TimeSeries<core::Candle>& candles)
{
    auto logger = core::logging::getLogger();
    core::Millis interval_ms = 0;
    try {
        interval_ms = core::utils::intervalToMillis(request.interval);
    } catch (const std::logic_error& e) {
        logger->warn("Not caching {} ({}): {}", request.symbol, request.interval, e.what());
        return;
    }

    // Bars open in ascending order, so only a trailing run can still be forming
    const core::Millis now = now_();
    auto closed_end = candles.end();
    while (closed_end != candles.begin() && std::prev(closed_end)->open_time_ms + interval_ms > now) {
        --closed_end;
    }
    const core::TimeSeries<core::Candle> closed(candles.begin(), closed_end);
    core::TimeWindow recorded{request.start_ms, request.end_ms};
    if (closed_end != candles.end()) {
        recorded.end_ms = closed_end->open_time_ms;
        logger->debug("Leaving {} unfinished bar(s) of {} out of the cache", std::distance(closed_end, candles.end()),
                      request.symbol);
    }

    // The candles are already in hand; a cache write failure only costs a refetch later
    if (!store_->saveCandles(closed, request.symbol, request.interval)) {
        logger->warn("Could not cache candles for {} ({})", request.symbol, request.interval);
        return;
    }
    if (!recorded.empty() && !store_->recordRange(request.symbol, request.interval, recorded)) {
        logger->warn("Could not record cached range for {} ({})", request.symbol, request.interval);
    }
}

} // namespace data
