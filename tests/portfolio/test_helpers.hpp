// tests/portfolio/test_helpers.hpp
#pragma once

#include <gmock/gmock.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/core/time_utils.hpp"
#include "paper_ngin/events/portfolio_event_bus.hpp"
#include "paper_ngin/position/position.hpp"
#include "paper_ngin/signal/signal.hpp"
#include "paper_ngin/storage/state_store.hpp"

namespace paper_ngin {
namespace testing {

// 2024-11-04 is a Monday; 04:00Z is 09:30 IST
inline Timestamp monday_open() {
    return *core::parse_timestamp("2024-11-04T04:00:00Z");
}

inline Timestamp trading_days_later(int days) {
    // Calendar days that land on the requested weekday count from a Monday
    int calendar_days = (days / 5) * 7 + days % 5;
    return monday_open() + std::chrono::hours(24 * calendar_days);
}

inline Signal make_signal(const std::string& symbol, double quality = 8.0, Price entry = 100.0,
                          Price stop = 98.0, Price t1 = 103.0, Price t2 = 108.0, Price t3 = 112.0,
                          StrategyClass cls = StrategyClass::SWING,
                          SignalType type = SignalType::MOMENTUM) {
    Signal s;
    s.symbol = symbol;
    s.strategy_class = cls;
    s.signal_type = type;
    s.entry_price = entry;
    s.stop_loss = stop;
    s.targets = {{t1, t2, t3}};
    s.quality_score = quality;
    s.timestamp = monday_open();
    return s;
}

inline Position make_position(const std::string& symbol, ShareCount shares = 100,
                              Price entry = 100.0, Price stop = 98.0, Price t1 = 103.0,
                              Price t2 = 108.0, Price t3 = 112.0,
                              StrategyClass cls = StrategyClass::SWING) {
    Position p;
    p.symbol = symbol;
    p.strategy_class = cls;
    p.signal_type = SignalType::MOMENTUM;
    p.entry_price = entry;
    p.shares_original = shares;
    p.shares_remaining = shares;
    p.stop_loss = stop;
    p.initial_stop = stop;
    p.targets = {{TargetLevel{t1, 0.4}, TargetLevel{t2, 0.4}, TargetLevel{t3, 0.2}}};
    p.entry_time = monday_open();
    p.quality_score = 8.0;
    p.max_hold_periods = 15;
    return p;
}

// Keeps the last saved snapshot in memory; saves can be made to fail
class InMemoryStateStore : public StateStore {
public:
    Result<void> save(const PortfolioState& state) override {
        ++save_attempts;
        if (fail_saves) {
            return make_error<void>(ErrorCode::DATABASE_ERROR, "simulated outage",
                                    "InMemoryStateStore");
        }
        stored = state;
        return Result<void>();
    }

    Result<std::optional<PortfolioState>> load() override {
        return Result<std::optional<PortfolioState>>(stored);
    }

    Result<void> clear() override {
        stored.reset();
        return Result<void>();
    }

    std::optional<PortfolioState> stored;
    bool fail_saves{false};
    int save_attempts{0};
};

class EventCapture {
public:
    PortfolioSubscriberInfo subscriber(const std::string& id) {
        return {id,
                {PortfolioEventType::POSITION_ENTERED, PortfolioEventType::POSITION_EXITED,
                 PortfolioEventType::POSITION_REPLACED, PortfolioEventType::STOP_RAISED,
                 PortfolioEventType::PORTFOLIO_HALTED},
                {},
                [this](const PortfolioEvent& event) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    events_.push_back(event);
                }};
    }

    std::vector<PortfolioEventType> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PortfolioEventType> out;
        for (const auto& event : events_) {
            out.push_back(event.type);
        }
        return out;
    }

    std::vector<PortfolioEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<PortfolioEvent> events_;
};

MATCHER_P(HasExitReason, reason, "Trade closed for the given reason") {
    return arg.reason == reason;
}

MATCHER_P2(HasShares, symbol, shares, "Trade fills the given share count") {
    return arg.symbol == symbol && arg.shares == shares;
}

}  // namespace testing
}  // namespace paper_ngin
