// include/paper_ngin/events/portfolio_event_bus.hpp
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief Lifecycle events emitted by a portfolio after each committed change
 */
enum class PortfolioEventType {
    POSITION_ENTERED,
    POSITION_EXITED,
    POSITION_REPLACED,
    STOP_RAISED,
    PORTFOLIO_HALTED
};

std::string portfolio_event_type_to_string(PortfolioEventType type);

struct PortfolioEvent {
    PortfolioEventType type;
    std::string portfolio_id;
    std::string symbol;
    Timestamp timestamp;
    std::unordered_map<std::string, double> numeric_fields;
    std::unordered_map<std::string, std::string> string_fields;
};

using PortfolioEventCallback = std::function<void(const PortfolioEvent&)>;

struct PortfolioSubscriberInfo {
    std::string id;
    std::vector<PortfolioEventType> event_types;
    std::vector<std::string> symbols;  // empty means every symbol
    PortfolioEventCallback callback;
};

/**
 * @brief Publish/subscribe fan-out for portfolio events
 *
 * One bus is shared by the portfolios that should report to the same
 * listeners. A throwing subscriber is logged and skipped; it never affects
 * the publisher or the other subscribers.
 */
class PortfolioEventBus {
public:
    Result<void> subscribe(const PortfolioSubscriberInfo& subscriber_info);
    Result<void> unsubscribe(const std::string& subscriber_id);
    void publish(const PortfolioEvent& event);

    size_t subscriber_count() const;

private:
    struct Subscription {
        std::vector<PortfolioEventType> event_types;
        std::vector<std::string> symbols;
        PortfolioEventCallback callback;
        bool active{true};
    };

    bool should_notify(const Subscription& sub, const PortfolioEvent& event) const;

    std::unordered_map<std::string, Subscription> subscriptions_;
    mutable std::mutex mutex_;
};

}  // namespace paper_ngin
