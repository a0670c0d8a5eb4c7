// include/finpipe/scheduler/refresh_scheduler.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "finpipe/config/pipeline_config.hpp"
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/core/state_manager.hpp"
#include "finpipe/pipeline/pipeline_service.hpp"

namespace finpipe {

/**
 * @brief Periodically refreshes the favorited symbols
 *
 * The first tick runs as soon as the scheduler starts, then one every interval. Ticks
 * never overlap: tick() called by hand waits for a background tick in flight and vice versa.
 * stop() lets a running tick finish and guarantees no tick starts afterwards.
 */
class RefreshScheduler {
public:
    RefreshScheduler(std::shared_ptr<PipelineService> service, SchedulerConfig config,
                     std::shared_ptr<const Clock> clock);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    /**
     * @return INVALID_ARGUMENT if already running
     */
    Result<void> start();

    void stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Run one refresh on the calling thread
     */
    RefreshReport tick();

    /**
     * @brief Time of the last completed tick, including ticks with nothing to refresh
     */
    std::optional<Timestamp> last_checked() const;

    std::optional<RefreshReport> last_report() const;

    size_t tick_count() const {
        return tick_count_.load();
    }

    const SchedulerConfig& config() const {
        return config_;
    }

private:
    void run_loop();
    void register_component();
    void set_state(ComponentState state, const std::string& error = "");

    std::shared_ptr<PipelineService> service_;
    SchedulerConfig config_;
    std::shared_ptr<const Clock> clock_;
    std::string component_id_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> tick_count_{0};
    bool stop_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread worker_;

    // Held for the whole duration of a tick
    std::mutex tick_mutex_;

    mutable std::mutex report_mutex_;
    std::optional<Timestamp> last_checked_;
    std::optional<RefreshReport> last_report_;
};

}  // namespace finpipe
