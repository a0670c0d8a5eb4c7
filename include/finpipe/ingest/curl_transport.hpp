// include/finpipe/ingest/curl_transport.hpp

#pragma once

#include <string>
#include <vector>
#include "finpipe/ingest/http_transport.hpp"

namespace finpipe {

/**
 * @brief libcurl implementation of HttpTransport. One easy handle per request.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "Mozilla/5.0 (finpipe)");

    Result<HttpResponse> get(const std::string& url, std::chrono::milliseconds timeout) override;

    void add_header(const std::string& header) {
        headers_.push_back(header);
    }

    void clear_headers() {
        headers_.clear();
    }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* body);

    std::string user_agent_;
    std::vector<std::string> headers_;
};

}  // namespace finpipe
