#include "order_ngin/core/state_manager.hpp"

namespace order_ngin {

std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::PAUSED:
            return "PAUSED";
        case ComponentState::ERR_STATE:
            return "ERROR";
        case ComponentState::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component ID cannot be empty",
                                "StateManager");
    }

    if (components_.count(info.id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component already registered: " + info.id, "StateManager");
    }

    components_[info.id] = info;
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (components_.erase(component_id) == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo>(ErrorCode::INVALID_ARGUMENT,
                                         "Component not found: " + component_id,
                                         "StateManager");
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }

    if (!is_valid_transition(it->second.state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Invalid state transition for " + component_id + ": " +
                                    component_state_to_string(it->second.state) + " -> " +
                                    component_state_to_string(new_state),
                                "StateManager");
    }

    it->second.state = new_state;
    it->second.last_update = std::chrono::system_clock::now();
    if (new_state == ComponentState::ERR_STATE) {
        it->second.error_message = error_message;
    } else {
        it->second.error_message.clear();
    }
    return Result<void>();
}

bool StateManager::is_valid_transition(ComponentState current_state, ComponentState new_state) {
    switch (current_state) {
        case ComponentState::INITIALIZED:
            return new_state == ComponentState::RUNNING ||
                   new_state == ComponentState::STOPPED ||
                   new_state == ComponentState::ERR_STATE;
        case ComponentState::RUNNING:
            return new_state == ComponentState::PAUSED ||
                   new_state == ComponentState::STOPPED ||
                   new_state == ComponentState::ERR_STATE;
        case ComponentState::PAUSED:
            return new_state == ComponentState::RUNNING ||
                   new_state == ComponentState::STOPPED ||
                   new_state == ComponentState::ERR_STATE;
        case ComponentState::ERR_STATE:
            return new_state == ComponentState::INITIALIZED ||
                   new_state == ComponentState::STOPPED;
        case ComponentState::STOPPED:
            return new_state == ComponentState::INITIALIZED;
    }
    return false;
}

Result<void> StateManager::update_metrics(
    const std::string& component_id,
    const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component not found: " + component_id, "StateManager");
    }

    it->second.metrics = metrics;
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.empty())
        return false;

    for (const auto& [_, info] : components_) {
        if (info.state != ComponentState::INITIALIZED &&
            info.state != ComponentState::RUNNING) {
            return false;
        }
    }
    return true;
}

}  // namespace order_ngin
