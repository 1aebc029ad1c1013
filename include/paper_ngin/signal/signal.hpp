// include/paper_ngin/signal/signal.hpp
#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief Trade proposal produced by the scanning layer
 *
 * The engine treats the scoring behind a signal as opaque. It only checks
 * that the record is complete and that its prices are coherent.
 */
struct Signal {
    std::string symbol;
    StrategyClass strategy_class{StrategyClass::SWING};
    SignalType signal_type{SignalType::MOMENTUM};
    Price entry_price{0.0};
    Price stop_loss{0.0};
    std::array<Price, 3> targets{{0.0, 0.0, 0.0}};  // T1 < T2 < T3
    double quality_score{0.0};                      // 0-10
    Timestamp timestamp{};

    // Overrides the strategy-class hold limit when present
    std::optional<int> max_hold_periods;

    nlohmann::json to_json() const;

    /**
     * @brief Build a signal from a loosely-shaped scanner record
     * @return INVALID_SIGNAL naming the first missing or mistyped field
     */
    static Result<Signal> from_json(const nlohmann::json& j);
};

/**
 * @brief Check a signal before it reaches sizing
 *
 * Rejects non-finite or non-positive prices, entry at or below the stop,
 * targets that are not strictly ascending above the entry, and quality scores
 * outside [0, 10].
 */
Result<void> validate_signal(const Signal& signal);

}  // namespace paper_ngin
