#pragma once

#include <functional>

#include "cancellation.hpp"
#include "candle_store.hpp"
#include "fetch_engine.hpp"
#include "fetch_result.hpp"
#include "utils.hpp"

namespace data {

// Cache-aware front of FetchEngine: serves a range from the CandleStore when it
// was fetched before, otherwise fetches it and stores the result.
// A bar that has not closed yet is returned to the caller but never cached,
// and the recorded range stops at its open time.
class HistoryService {
public:
    using Clock = std::function<core::Millis()>;

    // `store` may be null, which disables caching regardless of `use_cache`
    HistoryService(const FetchEngine& engine, CandleStore* store, Clock now = core::utils::nowMillis);

    // Fails with NoData when the upstream has nothing for a non-empty range
    FetchResult load(const FetchRequest& request,
                     bool use_cache,
                     const core::CancellationToken& token);

private:
    const FetchEngine& engine_;
    CandleStore* store_;
    Clock now_;

    void storeClosedBars(const FetchRequest& request, const core::TimeSeries<core::Candle>& candles);
};

} // namespace data
