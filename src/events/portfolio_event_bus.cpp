// src/events/portfolio_event_bus.cpp
#include "paper_ngin/events/portfolio_event_bus.hpp"
#include <algorithm>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

std::string portfolio_event_type_to_string(PortfolioEventType type) {
    switch (type) {
        case PortfolioEventType::POSITION_ENTERED:
            return "POSITION_ENTERED";
        case PortfolioEventType::POSITION_EXITED:
            return "POSITION_EXITED";
        case PortfolioEventType::POSITION_REPLACED:
            return "POSITION_REPLACED";
        case PortfolioEventType::STOP_RAISED:
            return "STOP_RAISED";
        case PortfolioEventType::PORTFOLIO_HALTED:
            return "PORTFOLIO_HALTED";
    }
    return "UNKNOWN";
}

Result<void> PortfolioEventBus::subscribe(const PortfolioSubscriberInfo& subscriber_info) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (subscriber_info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Subscriber ID cannot be empty",
                                "PortfolioEventBus");
    }

    if (subscriber_info.event_types.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Must subscribe to at least one event type", "PortfolioEventBus");
    }

    if (!subscriber_info.callback) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Callback function cannot be null",
                                "PortfolioEventBus");
    }

    subscriptions_[subscriber_info.id] = Subscription{
        subscriber_info.event_types, subscriber_info.symbols, subscriber_info.callback, true};

    DEBUG("Added subscription for " << subscriber_info.id << " with "
                                    << subscriber_info.event_types.size() << " event types and "
                                    << subscriber_info.symbols.size() << " symbols");
    return Result<void>();
}

Result<void> PortfolioEventBus::unsubscribe(const std::string& subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subscriptions_.find(subscriber_id);
    if (it == subscriptions_.end()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Subscriber ID not found: " + subscriber_id, "PortfolioEventBus");
    }

    it->second.active = false;
    DEBUG("Deactivated subscription for " << subscriber_id);
    return Result<void>();
}

size_t PortfolioEventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(subscriptions_.begin(), subscriptions_.end(),
                      [](const auto& entry) { return entry.second.active; }));
}

void PortfolioEventBus::publish(const PortfolioEvent& event) {
    // Callbacks run outside the lock so a subscriber may (un)subscribe
    std::vector<std::pair<std::string, PortfolioEventCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscriptions_) {
            if (sub.active && should_notify(sub, event)) {
                targets.emplace_back(id, sub.callback);
            }
        }
    }

    for (const auto& [id, callback] : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            ERROR("Error in subscriber callback for " << id << " on "
                                                      << portfolio_event_type_to_string(event.type)
                                                      << ": " << e.what());
        }
    }
}

bool PortfolioEventBus::should_notify(const Subscription& sub, const PortfolioEvent& event) const {
    if (std::find(sub.event_types.begin(), sub.event_types.end(), event.type) ==
        sub.event_types.end()) {
        return false;
    }

    if (sub.symbols.empty()) {
        return true;
    }

    return std::find(sub.symbols.begin(), sub.symbols.end(), event.symbol) != sub.symbols.end();
}

}  // namespace paper_ngin
