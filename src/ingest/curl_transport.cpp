// src/ingest/curl_transport.cpp

#include "finpipe/ingest/curl_transport.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include "finpipe/core/logger.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "CurlTransport";

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ensure_curl_initialized();
}

size_t CurlTransport::write_callback(void* contents, size_t size, size_t nmemb,
                                     std::string* body) {
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> CurlTransport::get(const std::string& url,
                                        std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        kComponent);
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& header : headers_) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended) {
            return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                            "Failed to build request headers", kComponent);
        }
        headers.release();
        headers.reset(appended);
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlTransport::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(
            ErrorCode::TIMEOUT_ERROR,
            "Request timed out after " + std::to_string(timeout.count()) + "ms: " + url,
            kComponent);
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        kComponent);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    TRACE("GET " << url << " -> " << response.status << " (" << response.body.size()
                 << " bytes)");
    return response;
}

}  // namespace finpipe
