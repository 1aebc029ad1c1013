// include/paper_ngin/portfolio/replacement_arbitrator.hpp
#pragma once

#include <optional>
#include <string>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/portfolio/portfolio_state.hpp"
#include "paper_ngin/position/exit_evaluator.hpp"
#include "paper_ngin/signal/signal.hpp"
#include "paper_ngin/sizing/position_sizer.hpp"

namespace paper_ngin {

struct ReplacementConfig : public ConfigBase {
    bool enabled{true};
    double high_quality_threshold{8.5};  // only signals this good may evict
    double min_score_margin{0.5};        // over the evicted position's score

    // weakness = pnl_weight * unrealized P&L % + score_weight * quality score
    double pnl_weight{1.0};
    double score_weight{10.0};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

enum class ArbitrationVerdict {
    EVICTED,
    DISABLED,
    SIGNAL_NOT_HIGH_QUALITY,
    NO_CANDIDATE,
    MARGIN_TOO_SMALL
};

std::string arbitration_verdict_to_string(ArbitrationVerdict verdict);

struct EvictionCandidate {
    std::string symbol;
    double weakness{0.0};
    double quality_score{0.0};
    double unrealized_pnl_pct{0.0};
    Price mark_price{0.0};
    Timestamp entry_time{};
};

struct ReplacementOutcome {
    ArbitrationVerdict verdict{ArbitrationVerdict::NO_CANDIDATE};
    std::optional<EvictionCandidate> candidate;
    std::optional<TradeRecord> evicted_trade;
    SizingResult resized;  // sizing of the new signal after the eviction

    bool evicted() const {
        return verdict == ArbitrationVerdict::EVICTED;
    }
};

/**
 * @brief Frees room for a high-quality signal by closing the weakest position
 *
 * Runs only when the portfolio is full or cash-constrained. At most one
 * position is evicted per call. The eviction is applied to the state passed
 * in; the orchestrator decides whether that state is committed.
 */
class ReplacementArbitrator {
public:
    ReplacementArbitrator(ReplacementConfig config, const PositionSizer& sizer,
                          const ExitEvaluator& evaluator);

    double weakness(const Position& position, Price mark_price) const;

    /**
     * @brief Lowest-weakness open position
     * Ties go to the lower P&L, then the older entry, then the symbol.
     */
    std::optional<EvictionCandidate> weakest(const PortfolioState& state) const;

    ReplacementOutcome try_replace(const Signal& signal, PortfolioState& state,
                                   const Timestamp& now) const;

    const ReplacementConfig& config() const {
        return config_;
    }

private:
    ReplacementConfig config_;
    const PositionSizer& sizer_;
    const ExitEvaluator& evaluator_;
};

}  // namespace paper_ngin
