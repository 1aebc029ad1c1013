// include/paper_ngin/position/exit_decision.hpp
#pragma once

#include <array>
#include <optional>
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

enum class ExitAction {
    HOLD,          // no fill; a stop raise may still apply
    PARTIAL_EXIT,  // some shares closed, position stays open
    FULL_EXIT      // all remaining shares closed
};

/**
 * @brief Outcome of evaluating one position against one price
 *
 * Produced by the ExitEvaluator, applied by the PositionStore.
 */
struct ExitDecision {
    ExitAction action{ExitAction::HOLD};
    std::optional<ExitReason> reason;
    ShareCount shares{0};
    Price fill_price{0.0};
    std::optional<Price> new_stop;
    std::array<bool, 3> targets_to_mark{{false, false, false}};
    int holding_periods{0};

    bool is_exit() const {
        return action != ExitAction::HOLD;
    }

    bool changes_state() const {
        return is_exit() || new_stop.has_value() || targets_to_mark[0] || targets_to_mark[1] ||
               targets_to_mark[2];
    }
};

}  // namespace paper_ngin
