// include/finpipe/core/state_manager.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"

namespace finpipe {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType { STORE, SOURCE_ADAPTER, RATE_LIMITER, SCHEDULER, PIPELINE };

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of long-lived pipeline components and their lifecycle
 *
 * Allowed transitions:
 *   INITIALIZED -> RUNNING | ERR_STATE
 *   RUNNING     -> PAUSED | STOPPED | ERR_STATE
 *   PAUSED      -> RUNNING | STOPPED | ERR_STATE
 *   ERR_STATE   -> INITIALIZED | STOPPED
 *   STOPPED     -> INITIALIZED | RUNNING
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    /**
     * @brief True when at least one component is registered and none is stopped or failed
     */
    bool is_healthy() const;

    std::vector<std::string> get_all_components() const;
    std::vector<std::string> get_components_by_type(ComponentType type) const;

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    static bool is_valid_transition(ComponentState current_state, ComponentState new_state);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace finpipe
