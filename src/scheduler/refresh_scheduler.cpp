// src/scheduler/refresh_scheduler.cpp

#include "finpipe/scheduler/refresh_scheduler.hpp"
#include "finpipe/core/logger.hpp"
#include "finpipe/core/state_manager.hpp"

namespace finpipe {

namespace {
constexpr const char* kComponent = "RefreshScheduler";
}

RefreshScheduler::RefreshScheduler(std::shared_ptr<PipelineService> service,
                                   SchedulerConfig config, std::shared_ptr<const Clock> clock)
    : service_(std::move(service)), config_(std::move(config)), clock_(std::move(clock)) {
    register_component();
}

RefreshScheduler::~RefreshScheduler() {
    stop();
    if (!component_id_.empty()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            WARN("Error unregistering scheduler: " << result.error()->what());
        }
    }
}

void RefreshScheduler::register_component() {
    static std::atomic<int> counter{0};
    std::string unique_id = "REFRESH_SCHEDULER_" + std::to_string(++counter);
    ComponentInfo info{ComponentType::SCHEDULER, ComponentState::INITIALIZED, unique_id, "",
                       std::chrono::system_clock::now(), {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register scheduler with StateManager: " << registered.error()->what());
        return;
    }
    component_id_ = unique_id;
}

void RefreshScheduler::set_state(ComponentState state, const std::string& error) {
    if (component_id_.empty()) {
        return;
    }
    auto updated = StateManager::instance().update_state(component_id_, state, error);
    if (updated.is_error()) {
        DEBUG(updated.error()->what());
    }
}

Result<void> RefreshScheduler::start() {
    if (config_.interval_seconds <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Scheduler interval must be positive", kComponent);
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Scheduler already running",
                                kComponent);
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread(&RefreshScheduler::run_loop, this);
    set_state(ComponentState::RUNNING);
    INFO("Refresh scheduler started, interval " << config_.interval_seconds << "s, range "
                                                << fetch_range_to_string(config_.range));
    return Result<void>();
}

void RefreshScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (running_.exchange(false)) {
        set_state(ComponentState::STOPPED);
        INFO("Refresh scheduler stopped after " << tick_count_.load() << " ticks");
    }
}

void RefreshScheduler::run_loop() {
    Logger::register_component(kComponent);
    const auto interval = std::chrono::seconds(config_.interval_seconds);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (stop_requested_) {
                break;
            }
        }
        // Cadence is measured from the start of each tick on the injected clock
        const Timestamp due = clock_->now() + interval;
        tick();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (clock_->wait_until(lock, wake_, due, [this] { return stop_requested_; })) {
            break;
        }
    }
}

RefreshReport RefreshScheduler::tick() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    ScopedLogComponent log_component(kComponent);

    RefreshReport report = service_->refresh_favorites(config_);
    const size_t ticks = ++tick_count_;
    if (report.symbols.empty()) {
        DEBUG("Tick " << ticks << ": " << report.message);
    } else {
        INFO("Tick " << ticks << " over " << report.symbols.size()
                     << " favorites: " << report.message);
    }

    if (!component_id_.empty()) {
        auto metrics = StateManager::instance().update_metrics(
            component_id_, {{"ticks", static_cast<double>(ticks)},
                            {"last_symbols", static_cast<double>(report.symbols.size())},
                            {"last_alerts_triggered", static_cast<double>(report.alerts_triggered)}});
        if (metrics.is_error()) {
            DEBUG(metrics.error()->what());
        }
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_checked_ = clock_->now();
    last_report_ = report;
    return report;
}

std::optional<Timestamp> RefreshScheduler::last_checked() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_checked_;
}

std::optional<RefreshReport> RefreshScheduler::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

}  // namespace finpipe
