// test_utils.hpp
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/state_manager.hpp"
#include "finpipe/core/time_utils.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/event_bus.hpp"
#include "finpipe/ingest/http_transport.hpp"

namespace finpipe {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
        PipelineEventBus::instance().clear();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        PipelineEventBus::instance().clear();
        StateManager::reset_instance();
    }
};

// ================= Dates and bars =================

inline Timestamp day(const std::string& text) {
    return *core::parse_date(text);
}

/**
 * @brief Consecutive daily bars starting at `start`, one per close; high/low are close +/- 1
 */
inline std::vector<PriceBar> make_bars(const std::string& symbol, const std::string& start,
                                       const std::vector<double>& closes,
                                       double volume = 1000.0) {
    std::vector<PriceBar> bars;
    Timestamp date = day(start);
    for (double close : closes) {
        bars.emplace_back(symbol, date, close, close + 1.0, close - 1.0, close, volume, "test");
        date += std::chrono::hours(24);
    }
    return bars;
}

inline std::vector<double> linear_closes(size_t count, double first, double step) {
    std::vector<double> closes;
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(first + step * static_cast<double>(i));
    }
    return closes;
}

/**
 * @brief A chart endpoint body with one point per (unix seconds, close)
 */
inline std::string yahoo_chart_body(const std::vector<int64_t>& timestamps,
                                    const std::vector<double>& closes) {
    nlohmann::json quote;
    quote["open"] = closes;
    quote["close"] = closes;
    std::vector<double> highs, lows, volumes;
    for (double c : closes) {
        highs.push_back(c + 1.0);
        lows.push_back(c - 1.0);
        volumes.push_back(1000.0);
    }
    quote["high"] = highs;
    quote["low"] = lows;
    quote["volume"] = volumes;

    nlohmann::json result;
    result["timestamp"] = timestamps;
    result["indicators"]["quote"] = nlohmann::json::array({quote});

    nlohmann::json doc;
    doc["chart"]["result"] = nlohmann::json::array({result});
    doc["chart"]["error"] = nullptr;
    return doc.dump();
}

inline std::string yahoo_not_found_body() {
    return R"({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})";
}

// ================= Fake transport =================

/**
 * @brief Answers GETs from canned responses matched by URL substring
 *
 * Unmatched URLs get a 404. Every requested URL is recorded.
 */
class FakeTransport : public HttpTransport {
public:
    void respond(const std::string& url_part, long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url_part] = Route{status, std::move(body), ErrorCode::NONE};
    }

    void fail(const std::string& url_part, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url_part] = Route{0, "", code};
    }

    // While held, get() records the request and then blocks until release()
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        gate_.notify_all();
    }

    bool wait_for_requests(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return gate_.wait_for(lock, timeout, [&] { return requests_.size() >= count; });
    }

    Result<HttpResponse> get(const std::string& url, std::chrono::milliseconds) override {
        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back(url);
        gate_.notify_all();
        gate_.wait(lock, [this] { return !held_; });
        for (const auto& [part, route] : routes_) {
            if (url.find(part) == std::string::npos) {
                continue;
            }
            if (route.error != ErrorCode::NONE) {
                return make_error<HttpResponse>(route.error, "simulated failure", "FakeTransport");
            }
            return HttpResponse{route.status, route.body};
        }
        return HttpResponse{404, "not found"};
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count(const std::string& url_part) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& url : requests_) {
            if (url.find(url_part) != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    struct Route {
        long status;
        std::string body;
        ErrorCode error;
    };

    mutable std::mutex mutex_;
    std::condition_variable gate_;
    bool held_{false};
    std::map<std::string, Route> routes_;
    std::vector<std::string> requests_;
};

}  // namespace testing
}  // namespace finpipe
