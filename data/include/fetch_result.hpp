#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "datatypes.hpp"

namespace data {

    enum class FetchErrorKind {
        InvalidRange,      // start_ms >= end_ms where forward progress is required
        InvalidLimit,      // page size outside [1, 1000]
        TransportError,    // one attempt failed below HTTP (refused, timeout, DNS)
        UpstreamError,     // one attempt got a non-200 status
        MalformedResponse, // one attempt got 200 with an unusable body
        FetchFailed,       // retry budget for a page exhausted
        Cancelled,
        NoData             // a cached load found nothing upstream
    };

    const char* toString(FetchErrorKind kind);

    // Why a single attempt did not produce a page
    struct AttemptFailure {
        FetchErrorKind kind = FetchErrorKind::TransportError;
        int http_status = 0;
        std::string message;
    };

    struct FetchError {
        FetchErrorKind kind = FetchErrorKind::FetchFailed;
        std::string message;
        int attempts = 0;
        std::optional<AttemptFailure> last_cause;

        std::string describe() const;
    };

    // All-or-nothing outcome of a fetch: the full candle sequence or a typed error.
    class FetchResult {
    public:
        static FetchResult success(core::TimeSeries<core::Candle> candles) {
            return FetchResult(std::move(candles));
        }
        static FetchResult failure(FetchError error) {
            return FetchResult(std::move(error));
        }

        bool ok() const { return std::holds_alternative<core::TimeSeries<core::Candle>>(value_); }

        // Throw std::bad_variant_access when called on the wrong alternative
        const core::TimeSeries<core::Candle>& candles() const {
            return std::get<core::TimeSeries<core::Candle>>(value_);
        }
        core::TimeSeries<core::Candle> takeCandles() {
            return std::move(std::get<core::TimeSeries<core::Candle>>(value_));
        }
        const FetchError& error() const { return std::get<FetchError>(value_); }

    private:
        explicit FetchResult(core::TimeSeries<core::Candle> candles) : value_(std::move(candles)) {}
        explicit FetchResult(FetchError error) : value_(std::move(error)) {}

        std::variant<core::TimeSeries<core::Candle>, FetchError> value_;
    };

} // namespace data
