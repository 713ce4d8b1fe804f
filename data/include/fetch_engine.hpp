#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "cancellation.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "fetch_result.hpp"
#include "http_transport.hpp"
#include "sleeper.hpp"

namespace data {

    // (candles fetched so far, estimated total for the range, human readable message)
    using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string&)>;

    struct RetryPolicy {
        int max_attempts = 8;
        std::chrono::milliseconds timeout{15000};      // per request, not per fetch
        std::chrono::seconds backoff_cap{30};
    };

    struct FetchRequest {
        std::string symbol;
        std::string interval = core::kDefaultInterval;
        core::Millis start_ms = 0;
        core::Millis end_ms = 0;
        int limit = core::kMaxPageLimit;
        std::chrono::milliseconds timeout{15000};
        int max_attempts = 8;
        std::chrono::milliseconds inter_page_delay{200};
        std::chrono::seconds backoff_cap{30};
        ProgressCallback on_progress;

        RetryPolicy retryPolicy() const { return RetryPolicy{max_attempts, timeout, backoff_cap}; }

        static FetchRequest fromConfig(const core::FetcherConfig& config,
                                       core::Millis start_ms,
                                       core::Millis end_ms);
    };

    // Walks [start_ms, end_ms) page by page, advancing the cursor to one past the
    // last open time seen, retrying each page with capped exponential backoff.
    // Holds no state between calls; the transport and sleeper are borrowed.
    class FetchEngine {
    public:
        FetchEngine(IHttpTransport& transport,
                    ISleeper& sleeper,
                    std::string base_url = "https://api.binance.com",
                    std::string klines_path = "/api/v3/klines");

        // Whole range, all-or-nothing. start_ms >= end_ms succeeds with no candles
        // and no network traffic.
        FetchResult fetch(const FetchRequest& request) const;
        FetchResult fetch(const FetchRequest& request, const core::CancellationToken& token) const;

        // One page with the retry policy applied. Unlike fetch(), an empty window
        // is rejected with InvalidRange.
        FetchResult fetchPage(const core::PageRequest& page,
                              const RetryPolicy& policy,
                              const core::CancellationToken& token) const;

        // min(2^attempt, cap) seconds
        static std::chrono::seconds backoffDelay(int attempt, std::chrono::seconds cap);

        const std::string& url() const { return url_; }

    private:
        IHttpTransport& transport_;
        ISleeper& sleeper_;
        std::string url_;

        FetchResult runWithRetry(const core::PageRequest& page,
                                 const RetryPolicy& policy,
                                 const core::CancellationToken& token) const;

        // One request; fills `failure` and returns false when the attempt is unusable
        bool attempt(const core::PageRequest& page,
                     std::chrono::milliseconds timeout,
                     core::TimeSeries<core::Candle>& rows,
                     AttemptFailure& failure) const;
    };

} // namespace data
