#include "fetch_result.hpp"
#include <spdlog/fmt/fmt.h>

namespace data {

    const char* toString(FetchErrorKind kind) {
        switch (kind) {
            case FetchErrorKind::InvalidRange: return "InvalidRange";
            case FetchErrorKind::InvalidLimit: return "InvalidLimit";
            case FetchErrorKind::TransportError: return "TransportError";
            case FetchErrorKind::UpstreamError: return "UpstreamError";
            case FetchErrorKind::MalformedResponse: return "MalformedResponse";
            case FetchErrorKind::FetchFailed: return "FetchFailed";
            case FetchErrorKind::Cancelled: return "Cancelled";
            case FetchErrorKind::NoData: return "NoData";
        }
        return "Unknown";
    }

    std::string FetchError::describe() const {
        std::string text = fmt::format("{}: {}", toString(kind), message);
        if (attempts > 0) {
            text += fmt::format(" (after {} attempt{})", attempts, attempts == 1 ? "" : "s");
        }
        if (last_cause) {
            text += fmt::format("; last cause {}", toString(last_cause->kind));
            if (last_cause->http_status != 0) {
                text += fmt::format(" HTTP {}", last_cause->http_status);
            }
            if (!last_cause->message.empty()) {
                text += fmt::format(": {}", last_cause->message);
            }
        }
        return text;
    }

} // namespace data
