#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "datatypes.hpp" // For QueryParams

namespace data {

    // Failure below the HTTP layer: connection refused, timeout, DNS...
    struct TransportFailure {
        int code = 0;
        std::string message;
    };

    struct HttpResponse {
        long status_code = 0;
        std::string body;
        std::optional<TransportFailure> transport_error;

        bool failedInTransport() const { return transport_error.has_value(); }
    };

    // --- HTTP GET capability ---
    // Implementations report transport failures in the response, never by throwing.
    class IHttpTransport {
    public:
        virtual ~IHttpTransport() = default;

        virtual HttpResponse get(const std::string& url,
                                 const core::QueryParams& params,
                                 std::chrono::milliseconds timeout) = 0;
    };

} // namespace data
