// src/ingest/rate_limiter.cpp

#include "finpipe/ingest/rate_limiter.hpp"
#include <algorithm>
#include <optional>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/time_utils.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "RateLimiter";

std::chrono::milliseconds to_millis(Timestamp::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d);
    return ms.count() < 0 ? std::chrono::milliseconds(0) : ms;
}

}  // namespace

RateLimiter::RateLimiter(std::shared_ptr<const Clock> clock,
                         std::shared_ptr<TimeSeriesStore> store)
    : clock_(std::move(clock)), store_(std::move(store)) {}

void RateLimiter::configure(const SourceConfig& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = sources_[source.name];
    state.config = source;
    DEBUG("Quota for " << source.name << ": "
                       << (source.quota > 0 ? std::to_string(source.quota) : "unlimited")
                       << " per " << source.window_seconds << "s");
}

void RateLimiter::configure(const std::map<std::string, SourceConfig>& sources) {
    for (const auto& [_, source] : sources) {
        configure(source);
    }
}

Timestamp RateLimiter::window_start(const SourceState& state, Timestamp now) const {
    const int64_t window = state.config.window_seconds;
    if (state.config.window_kind == WindowKind::FIXED) {
        int64_t seconds = core::to_unix_seconds(now);
        return core::from_unix_seconds(seconds - (seconds % window));
    }
    return now - std::chrono::seconds(window);
}

void RateLimiter::expire(SourceState& state, Timestamp now) const {
    Timestamp start = window_start(state, now);
    bool fixed = state.config.window_kind == WindowKind::FIXED;
    while (!state.permits.empty() &&
           (fixed ? state.permits.front() < start : state.permits.front() <= start)) {
        state.permits.pop_front();
    }
}

std::chrono::milliseconds RateLimiter::time_until_free(const SourceState& state, Timestamp now,
                                                       int permits) const {
    const std::chrono::seconds window(state.config.window_seconds);
    if (state.config.window_kind == WindowKind::FIXED) {
        return to_millis(window_start(state, now) + window - now);
    }
    // Rolling: wait until enough of the oldest permits have aged out
    int must_expire = static_cast<int>(state.permits.size()) + permits - state.config.quota;
    if (must_expire <= 0) {
        return std::chrono::milliseconds(0);
    }
    if (must_expire > static_cast<int>(state.permits.size())) {
        return to_millis(window);
    }
    return to_millis(state.permits[must_expire - 1] + window - now);
}

AcquireDecision RateLimiter::try_acquire(const std::string& source, int permits) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sources_.find(source);
    if (it == sources_.end() || !limited(it->second)) {
        return AcquireDecision::Allowed();
    }

    SourceState& state = it->second;
    Timestamp now = clock_->now();
    expire(state, now);

    if (permits > state.config.quota) {
        WARN("Request for " << permits << " permits exceeds the whole " << source << " quota of "
                            << state.config.quota);
        return AcquireDecision::Denied(std::chrono::seconds(state.config.window_seconds));
    }

    if (static_cast<int>(state.permits.size()) + permits > state.config.quota) {
        auto wait = time_until_free(state, now, permits);
        WARN("Quota exhausted for " << source << " (" << state.permits.size() << "/"
                                    << state.config.quota << "), retry in " << wait.count()
                                    << "ms");
        return AcquireDecision::Denied(wait);
    }

    for (int i = 0; i < permits; ++i) {
        state.permits.push_back(now);
    }
    TRACE("Granted " << permits << " permits for " << source << " ("
                     << state.permits.size() << "/" << state.config.quota << ")");
    return AcquireDecision::Allowed();
}

PermitGrant RateLimiter::try_acquire_up_to(const std::string& source, int wanted) {
    std::lock_guard<std::mutex> lock(mutex_);
    PermitGrant grant;
    auto it = sources_.find(source);
    if (it == sources_.end() || !limited(it->second)) {
        grant.granted = std::max(0, wanted);
        return grant;
    }

    SourceState& state = it->second;
    Timestamp now = clock_->now();
    expire(state, now);

    int available = state.config.quota - static_cast<int>(state.permits.size());
    grant.granted = std::max(0, std::min(wanted, available));
    for (int i = 0; i < grant.granted; ++i) {
        state.permits.push_back(now);
    }
    if (grant.granted < wanted) {
        grant.retry_after = time_until_free(state, now, 1);
        WARN("Quota for " << source << " covers " << grant.granted << " of " << wanted
                          << " permits, retry in " << grant.retry_after.count() << "ms");
    }
    return grant;
}

Result<void> RateLimiter::record_call(const ApiCallRecord& record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sources_.find(record.source);
        if (it != sources_.end() && limited(it->second) && !record.success &&
            !it->second.config.count_failures && !it->second.permits.empty()) {
            it->second.permits.pop_back();
        }
    }

    if (!store_) {
        return Result<void>();
    }
    auto stored = store_->record_api_call(record);
    if (stored.is_error()) {
        return forward_error<void>(stored, kComponent);
    }
    return Result<void>();
}

Result<void> RateLimiter::prime_from_store() {
    if (!store_) {
        return Result<void>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_->now();
    for (auto& [name, state] : sources_) {
        if (!limited(state)) {
            continue;
        }
        Timestamp since = window_start(state, now);
        auto calls = store_->api_calls_since(name, since);
        if (calls.is_error()) {
            return forward_error<void>(calls, kComponent);
        }

        std::deque<Timestamp> permits;
        for (const auto& call : calls.value()) {
            if (call.success || state.config.count_failures) {
                permits.push_back(call.timestamp);
            }
        }
        std::sort(permits.begin(), permits.end());
        state.permits = std::move(permits);
        expire(state, now);
        INFO("Primed " << name << " with " << state.permits.size() << " calls in window");
    }
    return Result<void>();
}

QuotaUsage RateLimiter::usage(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    QuotaUsage result;
    result.source = source;
    auto it = sources_.find(source);
    if (it == sources_.end()) {
        return result;
    }

    const SourceState& state = it->second;
    result.quota = state.config.quota;
    result.window = std::chrono::seconds(state.config.window_seconds);
    if (!limited(state)) {
        return result;
    }

    Timestamp now = clock_->now();
    Timestamp start = window_start(state, now);
    bool fixed = state.config.window_kind == WindowKind::FIXED;
    std::optional<Timestamp> oldest;
    for (const auto& ts : state.permits) {
        if (fixed ? ts >= start : ts > start) {
            if (!oldest) {
                oldest = ts;
            }
            ++result.used;
        }
    }
    if (oldest) {
        // Fixed windows reset all at once; rolling ones free the oldest permit first
        result.resets_in = fixed ? to_millis(start + result.window - now)
                                 : to_millis(*oldest + result.window - now);
    }
    return result;
}

}  // namespace finpipe
