#include "cpr_http_transport.hpp"
#include "logging.hpp"

#include <cpr/cpr.h>

#include <utility>

namespace data {

HttpResponse CprHttpTransport::get(const std::string& url,
                                   const core::QueryParams& params,
                                   std::chrono::milliseconds timeout)
{
    cpr::Parameters parameters;
    for (const auto& param : params) {
        parameters.Add({param.first, param.second});
    }

    cpr::Header headers = {
        {"Accept", "application/json"}
    };

    cpr::Response response = cpr::Get(cpr::Url{url}, headers, parameters, cpr::Timeout{timeout});

    core::logging::getLogger()->trace("GET {} -> status {}, body size {}",
                                      url, response.status_code, response.text.length());

    HttpResponse result;
    result.status_code = response.status_code;
    result.body = std::move(response.text);
    if (response.error) {
        result.transport_error = TransportFailure{static_cast<int>(response.error.code), response.error.message};
    }
    return result;
}

} // namespace data
