// src/core/state_manager.cpp
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "StateManager";

template <typename T>
Result<T> unknown_component(const std::string& component_id) {
    return make_error<T>(ErrorCode::INVALID_ARGUMENT, "Unknown component: " + component_id,
                         kComponent);
}

}  // namespace

std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::ERR_STATE:
            return "ERR_STATE";
    }
    return "UNKNOWN";
}

ComponentInfo* StateManager::find_locked(const std::string& component_id) {
    auto it = components_.find(component_id);
    return it == components_.end() ? nullptr : &it->second;
}

bool StateManager::can_transition(ComponentState from, ComponentState to) {
    switch (from) {
        case ComponentState::INITIALIZED:
            return to == ComponentState::RUNNING || to == ComponentState::ERR_STATE;
        case ComponentState::RUNNING:
            return to == ComponentState::ERR_STATE;
        case ComponentState::ERR_STATE:
            return to == ComponentState::INITIALIZED;
    }
    return false;
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component ID cannot be empty",
                                kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!components_.emplace(info.id, info).second) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component already registered: " + info.id, kComponent);
    }
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return unknown_component<void>(component_id);
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return unknown_component<ComponentInfo>(component_id);
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    ComponentInfo* info = find_locked(component_id);
    if (!info) {
        return unknown_component<void>(component_id);
    }

    if (!can_transition(info->state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                component_id + ": cannot move from " +
                                    component_state_to_string(info->state) + " to " +
                                    component_state_to_string(new_state),
                                kComponent);
    }

    info->state = new_state;
    info->error_message = new_state == ComponentState::ERR_STATE ? error_message : "";
    info->last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::update_metrics(
    const std::string& component_id, const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    ComponentInfo* info = find_locked(component_id);
    if (!info) {
        return unknown_component<void>(component_id);
    }

    info->metrics = metrics;
    info->last_update = std::chrono::system_clock::now();
    return Result<void>();
}

}  // namespace paper_ngin
