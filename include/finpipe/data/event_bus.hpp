// include/finpipe/data/event_bus.hpp
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"

namespace finpipe {

/**
 * @brief Type of pipeline event
 */
enum class PipelineEventType {
    PRICES_UPSERTED,
    MACRO_UPSERTED,
    INDICATORS_RECOMPUTED,
    ALERT_TRIGGERED,
    INDICATOR_ALERT_TRIGGERED,
    QUOTA_EXCEEDED,
    REFRESH_COMPLETED
};

std::string pipeline_event_type_to_string(PipelineEventType type);

/**
 * @brief Pipeline event. `symbol` is empty for events not tied to one ticker
 * (macro series carry their code there).
 */
struct PipelineEvent {
    PipelineEventType type;
    std::string symbol;
    Timestamp timestamp;
    std::unordered_map<std::string, double> numeric_fields;
    std::unordered_map<std::string, std::string> string_fields;
};

using PipelineEventCallback = std::function<void(const PipelineEvent&)>;

struct SubscriberInfo {
    std::string id;
    std::vector<PipelineEventType> event_types;
    std::vector<std::string> symbols;  // Empty means every symbol
    PipelineEventCallback callback;
};

/**
 * @brief Process-wide fan-out of pipeline events to UI-side observers
 *
 * Callbacks run synchronously on the publishing thread, outside the bus lock, so a
 * callback may subscribe or unsubscribe. A throwing callback is logged and skipped.
 */
class PipelineEventBus {
public:
    static PipelineEventBus& instance() {
        static PipelineEventBus instance;
        return instance;
    }

    /**
     * @brief Add or replace a subscription
     * @return INVALID_ARGUMENT for an empty id, no event types or a null callback
     */
    Result<void> subscribe(const SubscriberInfo& subscriber_info);

    /**
     * @return DATA_NOT_FOUND if the id is not subscribed
     */
    Result<void> unsubscribe(const std::string& subscriber_id);

    void publish(const PipelineEvent& event);

    size_t subscriber_count() const;

    /**
     * @brief Drop every subscription (tests only)
     */
    void clear();

private:
    PipelineEventBus() = default;

    struct Subscription {
        std::vector<PipelineEventType> event_types;
        std::vector<std::string> symbols;
        std::shared_ptr<PipelineEventCallback> callback;
    };

    bool should_notify(const Subscription& sub, const PipelineEvent& event) const;

    std::unordered_map<std::string, Subscription> subscriptions_;
    mutable std::mutex mutex_;
};

}  // namespace finpipe
