// src/portfolio/replacement_arbitrator.cpp
#include "paper_ngin/portfolio/replacement_arbitrator.hpp"
#include <cmath>
#include <tuple>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

std::string arbitration_verdict_to_string(ArbitrationVerdict verdict) {
    switch (verdict) {
        case ArbitrationVerdict::EVICTED:
            return "EVICTED";
        case ArbitrationVerdict::DISABLED:
            return "DISABLED";
        case ArbitrationVerdict::SIGNAL_NOT_HIGH_QUALITY:
            return "SIGNAL_NOT_HIGH_QUALITY";
        case ArbitrationVerdict::NO_CANDIDATE:
            return "NO_CANDIDATE";
        case ArbitrationVerdict::MARGIN_TOO_SMALL:
            return "MARGIN_TOO_SMALL";
    }
    return "UNKNOWN";
}

nlohmann::json ReplacementConfig::to_json() const {
    nlohmann::json j;
    j["enabled"] = enabled;
    j["high_quality_threshold"] = high_quality_threshold;
    j["min_score_margin"] = min_score_margin;
    j["pnl_weight"] = pnl_weight;
    j["score_weight"] = score_weight;
    j["version"] = version;
    return j;
}

void ReplacementConfig::from_json(const nlohmann::json& j) {
    if (j.contains("enabled"))
        enabled = j.at("enabled").get<bool>();
    if (j.contains("high_quality_threshold"))
        high_quality_threshold = j.at("high_quality_threshold").get<double>();
    if (j.contains("min_score_margin"))
        min_score_margin = j.at("min_score_margin").get<double>();
    if (j.contains("pnl_weight"))
        pnl_weight = j.at("pnl_weight").get<double>();
    if (j.contains("score_weight"))
        score_weight = j.at("score_weight").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> ReplacementConfig::validate() const {
    if (high_quality_threshold < 0.0 || high_quality_threshold > 10.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "high_quality_threshold must be in [0, 10]", "ReplacementConfig");
    }
    if (!std::isfinite(min_score_margin) || min_score_margin < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "min_score_margin must be non-negative", "ReplacementConfig");
    }
    if (!std::isfinite(pnl_weight) || !std::isfinite(score_weight)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "weakness weights must be finite",
                                "ReplacementConfig");
    }
    return Result<void>();
}

ReplacementArbitrator::ReplacementArbitrator(ReplacementConfig config, const PositionSizer& sizer,
                                             const ExitEvaluator& evaluator)
    : config_(std::move(config)), sizer_(sizer), evaluator_(evaluator) {}

double ReplacementArbitrator::weakness(const Position& position, Price mark_price) const {
    return config_.pnl_weight * position.unrealized_return(mark_price) * 100.0 +
           config_.score_weight * position.quality_score;
}

std::optional<EvictionCandidate> ReplacementArbitrator::weakest(const PortfolioState& state) const {
    std::optional<EvictionCandidate> best;

    for (const auto& [symbol, position] : state.positions.positions()) {
        EvictionCandidate candidate;
        candidate.symbol = symbol;
        candidate.mark_price = state.mark_price(symbol);
        candidate.weakness = weakness(position, candidate.mark_price);
        candidate.quality_score = position.quality_score;
        candidate.unrealized_pnl_pct = position.unrealized_return(candidate.mark_price) * 100.0;
        candidate.entry_time = position.entry_time;

        if (!best || std::tie(candidate.weakness, candidate.unrealized_pnl_pct,
                              candidate.entry_time, candidate.symbol) <
                         std::tie(best->weakness, best->unrealized_pnl_pct, best->entry_time,
                                  best->symbol)) {
            best = candidate;
        }
    }
    return best;
}

ReplacementOutcome ReplacementArbitrator::try_replace(const Signal& signal, PortfolioState& state,
                                                      const Timestamp& now) const {
    ReplacementOutcome outcome;

    if (!config_.enabled) {
        outcome.verdict = ArbitrationVerdict::DISABLED;
        return outcome;
    }
    if (signal.quality_score < config_.high_quality_threshold) {
        outcome.verdict = ArbitrationVerdict::SIGNAL_NOT_HIGH_QUALITY;
        return outcome;
    }

    outcome.candidate = weakest(state);
    if (!outcome.candidate) {
        outcome.verdict = ArbitrationVerdict::NO_CANDIDATE;
        return outcome;
    }
    if (signal.quality_score < outcome.candidate->quality_score + config_.min_score_margin) {
        outcome.verdict = ArbitrationVerdict::MARGIN_TOO_SMALL;
        DEBUG(signal.symbol << " (" << signal.quality_score << ") does not clear weakest "
                            << outcome.candidate->symbol << " (" << outcome.candidate->quality_score
                            << ") by " << config_.min_score_margin);
        return outcome;
    }

    const Position* victim = state.positions.find(outcome.candidate->symbol);
    if (victim == nullptr) {
        throw_invariant_violation("Eviction candidate vanished: " + outcome.candidate->symbol,
                                  "ReplacementArbitrator");
    }

    ExitDecision decision =
        evaluator_.forced_exit(*victim, outcome.candidate->mark_price, now, ExitReason::REPLACED);
    outcome.evicted_trade = state.positions.apply(outcome.candidate->symbol, decision, now);
    if (!outcome.evicted_trade) {
        throw_invariant_violation("Forced exit produced no fill: " + outcome.candidate->symbol,
                                  "ReplacementArbitrator");
    }

    const TradeRecord& trade = *outcome.evicted_trade;
    state.ledger.release(trade.exit_price * static_cast<double>(trade.shares),
                         trade.entry_price * static_cast<double>(trade.shares));
    state.last_prices.erase(outcome.candidate->symbol);

    outcome.resized = sizer_.size(signal, state.ledger, state.positions);
    outcome.verdict = ArbitrationVerdict::EVICTED;
    return outcome;
}

}  // namespace paper_ngin
