// include/paper_ngin/core/state_manager.hpp
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief Lifecycle of a registered book
 *
 * INITIALIZED -> RUNNING on a successful start, any state -> ERR_STATE on an
 * invariant halt, and ERR_STATE -> INITIALIZED on reset.
 */
enum class ComponentState { INITIALIZED, RUNNING, ERR_STATE };

enum class ComponentType { PORTFOLIO, DUAL_PORTFOLIO };

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;  // halt reason, set only in ERR_STATE
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component health
 *
 * Portfolios register here, push capital metrics after each committed
 * mutation and move to ERR_STATE when halted on an invariant violation,
 * so an operator layer can see which book stopped and why.
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

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    // Caller holds mutex_
    ComponentInfo* find_locked(const std::string& component_id);
    static bool can_transition(ComponentState from, ComponentState to);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace paper_ngin
