// src/data/event_bus.cpp
#include "finpipe/data/event_bus.hpp"
#include <algorithm>
#include "finpipe/core/logger.hpp"

namespace finpipe {

std::string pipeline_event_type_to_string(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::PRICES_UPSERTED:
            return "PRICES_UPSERTED";
        case PipelineEventType::MACRO_UPSERTED:
            return "MACRO_UPSERTED";
        case PipelineEventType::INDICATORS_RECOMPUTED:
            return "INDICATORS_RECOMPUTED";
        case PipelineEventType::ALERT_TRIGGERED:
            return "ALERT_TRIGGERED";
        case PipelineEventType::INDICATOR_ALERT_TRIGGERED:
            return "INDICATOR_ALERT_TRIGGERED";
        case PipelineEventType::QUOTA_EXCEEDED:
            return "QUOTA_EXCEEDED";
        case PipelineEventType::REFRESH_COMPLETED:
            return "REFRESH_COMPLETED";
        default:
            return "UNKNOWN";
    }
}

Result<void> PipelineEventBus::subscribe(const SubscriberInfo& subscriber_info) {
    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "PipelineEventBus");
    }
    if (subscriber_info.event_types.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Must subscribe to at least one event type", "PipelineEventBus");
    }
    if (!subscriber_info.callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "PipelineEventBus");
    }

    Subscription sub{subscriber_info.event_types, subscriber_info.symbols,
                     std::make_shared<PipelineEventCallback>(subscriber_info.callback)};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_[subscriber_info.id] = std::move(sub);
    }

    DEBUG("Added subscription for " << subscriber_info.id << " with "
                                    << subscriber_info.event_types.size() << " event types and "
                                    << subscriber_info.symbols.size() << " symbols");
    return Result<void>();
}

Result<void> PipelineEventBus::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscriptions_.erase(subscriber_id) == 0) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND,
                                "Subscriber ID not found: " + subscriber_id, "PipelineEventBus");
    }
    return Result<void>();
}

void PipelineEventBus::publish(const PipelineEvent& event) {
    std::vector<std::pair<std::string, std::shared_ptr<PipelineEventCallback>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (should_notify(sub, event)) {
                targets.emplace_back(id, sub.callback);
            }
        }
    }

    for (const auto& [id, callback] : targets) {
        try {
            (*callback)(event);
        } catch (const std::exception& e) {
            ERROR("Error in subscriber callback for " << id << " on "
                                                      << pipeline_event_type_to_string(event.type)
                                                      << ": " << e.what());
        }
    }
}

size_t PipelineEventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void PipelineEventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

bool PipelineEventBus::should_notify(const Subscription& sub, const PipelineEvent& event) const {
    if (std::find(sub.event_types.begin(), sub.event_types.end(), event.type) ==
        sub.event_types.end()) {
        return false;
    }
    if (sub.symbols.empty()) {
        return true;
    }
    return std::find(sub.symbols.begin(), sub.symbols.end(), event.symbol) != sub.symbols.end();
}

}  // namespace finpipe
