#pragma once

#include <string>

#include "http_transport.hpp"

namespace data {

class CprHttpTransport : public IHttpTransport {
public:
    CprHttpTransport() = default;

    HttpResponse get(const std::string& url,
                     const core::QueryParams& params,
                     std::chrono::milliseconds timeout) override;
};

} // namespace data
