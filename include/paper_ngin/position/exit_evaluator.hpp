// include/paper_ngin/position/exit_evaluator.hpp
#pragma once

#include <array>
#include <optional>
#include <string>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/core/trading_calendar.hpp"
#include "paper_ngin/position/exit_decision.hpp"
#include "paper_ngin/position/position.hpp"

namespace paper_ngin {

/**
 * @brief How stop exits are priced
 */
enum class StopFill {
    STOP_PRICE,  // fill at the stop level
    MARKET       // fill at the tick that breached the stop
};

std::string stop_fill_to_string(StopFill fill);
std::optional<StopFill> stop_fill_from_string(const std::string& value);

/**
 * @brief Target and hold policy for one strategy class
 */
struct ExitPolicy : public ConfigBase {
    std::array<double, 3> target_exit_fractions{{0.4, 0.4, 0.2}};
    double t1_lock_pct{0.03};  // stop moves to entry * (1 + t1_lock_pct) at T1
    double t2_lock_pct{0.06};
    int max_hold_periods{15};

    ExitPolicy() = default;
    explicit ExitPolicy(int hold_periods) : max_hold_periods(hold_periods) {}

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

struct ExitConfig : public ConfigBase {
    ExitPolicy swing{15};
    ExitPolicy positional{90};
    double trailing_activation_pct{0.05};
    double trailing_distance_pct{0.03};
    double time_exit_min_profit_pct{0.03};  // past the horizon, exit only below this gain
    StopFill stop_fill{StopFill::STOP_PRICE};

    std::string version{"1.0.0"};

    const ExitPolicy& policy_for(StrategyClass cls) const {
        return cls == StrategyClass::SWING ? swing : positional;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Decides what happens to an open position on each price tick
 *
 * Rules run in fixed priority and at most one exit fires per tick:
 *   1. T3 reached: full exit
 *   2. T2 reached: partial exit, stop locked to entry + t2_lock_pct
 *   3. T1 reached: partial exit, stop locked to entry + t1_lock_pct
 *   4. trailing ratchet (never an exit by itself)
 *   5. stop breached: full exit
 *   6. past the hold limit without enough profit: full exit
 *
 * The evaluator does not mutate the position; the returned decision is
 * applied by the PositionStore.
 */
class ExitEvaluator {
public:
    explicit ExitEvaluator(ExitConfig config, TradingCalendar calendar = TradingCalendar());

    ExitDecision evaluate(const Position& position, Price price, const Timestamp& now) const;

    /**
     * @brief Close the whole position at price for the given reason
     */
    ExitDecision forced_exit(const Position& position, Price price, const Timestamp& now,
                             ExitReason reason) const;

    int holding_periods(const Position& position, const Timestamp& now) const;

    const ExitConfig& config() const {
        return config_;
    }

    const TradingCalendar& calendar() const {
        return calendar_;
    }

private:
    void fill_target(ExitDecision& decision, const Position& position, size_t target_index,
                     const ExitPolicy& policy) const;

    ExitConfig config_;
    TradingCalendar calendar_;
};

}  // namespace paper_ngin
