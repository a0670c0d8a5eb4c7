// include/finpipe/ingest/rate_limiter.hpp

#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "finpipe/config/pipeline_config.hpp"
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief Outcome of a permit request. `retry_after` is zero when allowed.
 */
struct AcquireDecision {
    bool allowed{false};
    std::chrono::milliseconds retry_after{0};

    static AcquireDecision Allowed() {
        return AcquireDecision{true, std::chrono::milliseconds(0)};
    }
    static AcquireDecision Denied(std::chrono::milliseconds retry_after) {
        return AcquireDecision{false, retry_after};
    }
};

/**
 * @brief Permits granted out of a larger request. `retry_after` is set when short.
 */
struct PermitGrant {
    int granted{0};
    std::chrono::milliseconds retry_after{0};
};

/**
 * @brief Quota usage of one source in its current window
 */
struct QuotaUsage {
    std::string source;
    int used{0};
    int quota{0};  // 0 = unlimited
    std::chrono::seconds window{0};
    std::chrono::milliseconds resets_in{0};
};

/**
 * @brief Per-source call budget shared by every adapter
 *
 * A permit is taken at try_acquire time, before the request goes out, so concurrent batches
 * can never jointly overshoot a quota. Sources with quota 0, and sources without a
 * configured quota, are never denied.
 */
class RateLimiter {
public:
    /**
     * @param store Receives the api-call audit log; may be null in tests
     */
    RateLimiter(std::shared_ptr<const Clock> clock, std::shared_ptr<TimeSeriesStore> store);

    void configure(const SourceConfig& source);
    void configure(const std::map<std::string, SourceConfig>& sources);

    /**
     * @brief Take `permits` permits atomically, all or none
     */
    AcquireDecision try_acquire(const std::string& source, int permits = 1);

    /**
     * @brief Take as many of `wanted` permits as the window still holds, atomically
     */
    PermitGrant try_acquire_up_to(const std::string& source, int wanted);

    /**
     * @brief Append a sent request to the audit log
     * A failed call gives its permit back when the source does not count failures.
     */
    Result<void> record_call(const ApiCallRecord& record);

    /**
     * @brief Rebuild in-window usage from the stored audit log (process restart)
     */
    Result<void> prime_from_store();

    QuotaUsage usage(const std::string& source) const;

private:
    struct SourceState {
        SourceConfig config;
        std::deque<Timestamp> permits;  // oldest first
    };

    bool limited(const SourceState& state) const {
        return state.config.quota > 0;
    }
    Timestamp window_start(const SourceState& state, Timestamp now) const;
    void expire(SourceState& state, Timestamp now) const;
    std::chrono::milliseconds time_until_free(const SourceState& state, Timestamp now,
                                              int permits) const;

    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<TimeSeriesStore> store_;
    std::map<std::string, SourceState> sources_;
    mutable std::mutex mutex_;
};

}  // namespace finpipe
