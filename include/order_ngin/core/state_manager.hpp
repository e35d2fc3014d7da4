// include/order_ngin/core/state_manager.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "order_ngin/core/error.hpp"
#include "order_ngin/core/types.hpp"

namespace order_ngin {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType { EXECUTION_SUPERVISOR, EXCHANGE_CLIENT, CLI };

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
 * @brief Process-wide registry of long-lived components and their health
 *
 * The supervisor registers itself here on construction and publishes its
 * engine metrics after every plan retirement.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);

    /**
     * @brief Move a component to a new state
     * @return INVALID_STATE_TRANSITION if the move is not allowed from the current state
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    /**
     * @brief True when at least one component is registered and none is paused,
     * stopped or in error
     */
    bool is_healthy() const;

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

}  // namespace order_ngin
