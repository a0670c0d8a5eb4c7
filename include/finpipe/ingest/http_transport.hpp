// include/finpipe/ingest/http_transport.hpp

#pragma once

#include <chrono>
#include <string>
#include "finpipe/core/error.hpp"

namespace finpipe {

struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Outbound HTTP GET, injected into the source adapters
 *
 * Any response that arrives is returned as a value whatever its status code.
 * Errors are reserved for requests that got no response: TIMEOUT_ERROR when the
 * deadline passed, CONNECTION_ERROR otherwise.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> get(const std::string& url,
                                     std::chrono::milliseconds timeout) = 0;
};

}  // namespace finpipe
