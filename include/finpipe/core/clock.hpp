// include/finpipe/core/clock.hpp

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include "finpipe/core/types.hpp"

namespace finpipe {

/**
 * @brief Source of wall-clock time, injected into time-dependent components
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;

    /**
     * @brief Block on `cv` until this clock reaches `deadline` or `stop()` holds
     * @return true when `stop()` ended the wait
     */
    virtual bool wait_until(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                            Timestamp deadline, const std::function<bool()>& stop) const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }

    bool wait_until(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                    Timestamp deadline, const std::function<bool()>& stop) const override {
        return cv.wait_until(lock, deadline, stop);
    }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{}) : now_(start) {}

    Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    // Polls so that advance() from another thread releases the waiter
    bool wait_until(std::unique_lock<std::mutex>& lock, std::condition_variable& cv,
                    Timestamp deadline, const std::function<bool()>& stop) const override {
        while (!stop()) {
            if (now() >= deadline) {
                return false;
            }
            cv.wait_for(lock, std::chrono::milliseconds(2));
        }
        return true;
    }

    void set(Timestamp ts) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = ts;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<Timestamp::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace finpipe
