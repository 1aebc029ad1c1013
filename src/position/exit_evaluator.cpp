// src/position/exit_evaluator.cpp
#include "paper_ngin/position/exit_evaluator.hpp"
#include <algorithm>
#include <cmath>

namespace paper_ngin {

namespace {

constexpr double kShareEpsilon = 1e-9;

Result<void> invalid(const std::string& component, const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, component);
}

bool valid_pct(double v) {
    return std::isfinite(v) && v >= 0.0 && v < 1.0;
}

}  // namespace

std::string stop_fill_to_string(StopFill fill) {
    switch (fill) {
        case StopFill::STOP_PRICE:
            return "STOP_PRICE";
        case StopFill::MARKET:
            return "MARKET";
    }
    return "UNKNOWN";
}

std::optional<StopFill> stop_fill_from_string(const std::string& value) {
    if (value == "STOP_PRICE")
        return StopFill::STOP_PRICE;
    if (value == "MARKET")
        return StopFill::MARKET;
    return std::nullopt;
}

nlohmann::json ExitPolicy::to_json() const {
    nlohmann::json j;
    j["target_exit_fractions"] = target_exit_fractions;
    j["t1_lock_pct"] = t1_lock_pct;
    j["t2_lock_pct"] = t2_lock_pct;
    j["max_hold_periods"] = max_hold_periods;
    return j;
}

void ExitPolicy::from_json(const nlohmann::json& j) {
    if (j.contains("target_exit_fractions")) {
        const auto& fractions = j.at("target_exit_fractions");
        for (size_t i = 0; i < target_exit_fractions.size() && i < fractions.size(); ++i) {
            target_exit_fractions[i] = fractions.at(i).get<double>();
        }
    }
    if (j.contains("t1_lock_pct"))
        t1_lock_pct = j.at("t1_lock_pct").get<double>();
    if (j.contains("t2_lock_pct"))
        t2_lock_pct = j.at("t2_lock_pct").get<double>();
    if (j.contains("max_hold_periods"))
        max_hold_periods = j.at("max_hold_periods").get<int>();
}

Result<void> ExitPolicy::validate() const {
    for (double f : target_exit_fractions) {
        if (!std::isfinite(f) || f <= 0.0 || f > 1.0) {
            return invalid("ExitPolicy", "target exit fractions must be in (0, 1]");
        }
    }
    if (target_exit_fractions[0] + target_exit_fractions[1] > 1.0 + kShareEpsilon) {
        return invalid("ExitPolicy", "T1 and T2 exit fractions exceed the original position");
    }
    if (!valid_pct(t1_lock_pct) || !valid_pct(t2_lock_pct) || t2_lock_pct < t1_lock_pct) {
        return invalid("ExitPolicy", "stop locks must satisfy 0 <= t1_lock_pct <= t2_lock_pct < 1");
    }
    if (max_hold_periods <= 0) {
        return invalid("ExitPolicy", "max_hold_periods must be positive");
    }
    return Result<void>();
}

nlohmann::json ExitConfig::to_json() const {
    nlohmann::json j;
    j["swing"] = swing.to_json();
    j["positional"] = positional.to_json();
    j["trailing_activation_pct"] = trailing_activation_pct;
    j["trailing_distance_pct"] = trailing_distance_pct;
    j["time_exit_min_profit_pct"] = time_exit_min_profit_pct;
    j["stop_fill"] = stop_fill_to_string(stop_fill);
    j["version"] = version;
    return j;
}

void ExitConfig::from_json(const nlohmann::json& j) {
    if (j.contains("swing"))
        swing.from_json(j.at("swing"));
    if (j.contains("positional"))
        positional.from_json(j.at("positional"));
    if (j.contains("trailing_activation_pct"))
        trailing_activation_pct = j.at("trailing_activation_pct").get<double>();
    if (j.contains("trailing_distance_pct"))
        trailing_distance_pct = j.at("trailing_distance_pct").get<double>();
    if (j.contains("time_exit_min_profit_pct"))
        time_exit_min_profit_pct = j.at("time_exit_min_profit_pct").get<double>();
    if (j.contains("stop_fill")) {
        const auto name = j.at("stop_fill").get<std::string>();
        auto fill = stop_fill_from_string(name);
        if (!fill) {
            throw TradeError(ErrorCode::INVALID_ARGUMENT, "Unknown stop_fill: " + name,
                             "ExitConfig");
        }
        stop_fill = *fill;
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> ExitConfig::validate() const {
    auto swing_result = swing.validate();
    if (swing_result.is_error()) {
        return swing_result;
    }
    auto positional_result = positional.validate();
    if (positional_result.is_error()) {
        return positional_result;
    }
    if (!valid_pct(trailing_activation_pct) || trailing_activation_pct == 0.0) {
        return invalid("ExitConfig", "trailing_activation_pct must be in (0, 1)");
    }
    if (!valid_pct(trailing_distance_pct) || trailing_distance_pct == 0.0) {
        return invalid("ExitConfig", "trailing_distance_pct must be in (0, 1)");
    }
    if (!std::isfinite(time_exit_min_profit_pct)) {
        return invalid("ExitConfig", "time_exit_min_profit_pct must be finite");
    }
    return Result<void>();
}

ExitEvaluator::ExitEvaluator(ExitConfig config, TradingCalendar calendar)
    : config_(std::move(config)), calendar_(std::move(calendar)) {}

int ExitEvaluator::holding_periods(const Position& position, const Timestamp& now) const {
    return calendar_.trading_days_between(position.entry_time, now);
}

void ExitEvaluator::fill_target(ExitDecision& decision, const Position& position,
                                size_t target_index, const ExitPolicy& policy) const {
    const ShareCount partial = static_cast<ShareCount>(
        std::floor(policy.target_exit_fractions[target_index] *
                       static_cast<double>(position.shares_original) +
                   kShareEpsilon));

    decision.reason = target_index == 0 ? ExitReason::TARGET_1 : ExitReason::TARGET_2;
    if (partial < 1 || partial >= position.shares_remaining) {
        decision.action = ExitAction::FULL_EXIT;
        decision.shares = position.shares_remaining;
    } else {
        decision.action = ExitAction::PARTIAL_EXIT;
        decision.shares = partial;
    }
}

ExitDecision ExitEvaluator::evaluate(const Position& position, Price price,
                                     const Timestamp& now) const {
    ExitDecision decision;
    decision.fill_price = price;
    decision.holding_periods = holding_periods(position, now);

    const ExitPolicy& policy = config_.policy_for(position.strategy_class);
    const auto& targets = position.targets;
    const auto& hit = position.targets_hit;

    if (!hit[2] && price >= targets[2].price) {
        decision.action = ExitAction::FULL_EXIT;
        decision.reason = ExitReason::TARGET_3;
        decision.shares = position.shares_remaining;
        for (size_t i = 0; i < hit.size(); ++i) {
            decision.targets_to_mark[i] = !hit[i];
        }
        return decision;
    }

    Price stop = position.stop_loss;
    bool target_fired = false;

    if (!hit[1] && price >= targets[1].price) {
        fill_target(decision, position, 1, policy);
        decision.targets_to_mark[1] = true;
        decision.targets_to_mark[0] = !hit[0];
        stop = std::max(stop, position.entry_price * (1.0 + policy.t2_lock_pct));
        target_fired = true;
    } else if (!hit[0] && price >= targets[0].price) {
        fill_target(decision, position, 0, policy);
        decision.targets_to_mark[0] = true;
        stop = std::max(stop, position.entry_price * (1.0 + policy.t1_lock_pct));
        target_fired = true;
    }

    if (position.unrealized_return(price) >= config_.trailing_activation_pct) {
        stop = std::max(stop, price * (1.0 - config_.trailing_distance_pct));
    }

    if (stop > position.stop_loss) {
        decision.new_stop = stop;
    }

    if (target_fired) {
        return decision;
    }

    if (price <= position.stop_loss) {
        decision.action = ExitAction::FULL_EXIT;
        decision.reason =
            position.stop_raised() ? ExitReason::TRAILING_STOP : ExitReason::STOP_LOSS;
        decision.shares = position.shares_remaining;
        decision.fill_price =
            config_.stop_fill == StopFill::STOP_PRICE ? position.stop_loss : price;
        decision.new_stop.reset();
        return decision;
    }

    if (decision.holding_periods >= position.max_hold_periods &&
        position.unrealized_return(price) < config_.time_exit_min_profit_pct) {
        decision.action = ExitAction::FULL_EXIT;
        decision.reason = ExitReason::TIME_EXIT;
        decision.shares = position.shares_remaining;
        decision.new_stop.reset();
    }

    return decision;
}

ExitDecision ExitEvaluator::forced_exit(const Position& position, Price price,
                                        const Timestamp& now, ExitReason reason) const {
    ExitDecision decision;
    decision.action = ExitAction::FULL_EXIT;
    decision.reason = reason;
    decision.shares = position.shares_remaining;
    decision.fill_price = price;
    decision.holding_periods = holding_periods(position, now);
    return decision;
}

}  // namespace paper_ngin
