// src/sizing/position_sizer.cpp
#include "paper_ngin/sizing/position_sizer.hpp"
#include <algorithm>
#include <cmath>

namespace paper_ngin {

namespace {

// Guards floor() against 299.99999999 style results
constexpr double kShareEpsilon = 1e-9;

Result<void> invalid(const std::string& message) {
    return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "SizingConfig");
}

bool in_unit_interval(double v) {
    return std::isfinite(v) && v > 0.0 && v <= 1.0;
}

}  // namespace

std::string sizing_outcome_to_string(SizingOutcome outcome) {
    switch (outcome) {
        case SizingOutcome::SIZED:
            return "SIZED";
        case SizingOutcome::BELOW_MIN_QUALITY:
            return "BELOW_MIN_QUALITY";
        case SizingOutcome::DEGENERATE_STOP:
            return "DEGENERATE_STOP";
        case SizingOutcome::TOO_SMALL:
            return "TOO_SMALL";
        case SizingOutcome::INSUFFICIENT_CAPITAL:
            return "INSUFFICIENT_CAPITAL";
    }
    return "UNKNOWN";
}

nlohmann::json SizingConfig::to_json() const {
    nlohmann::json j;
    j["risk_per_trade_pct"] = risk_per_trade_pct;
    j["max_position_pct"] = max_position_pct;
    j["min_quality_score"] = min_quality_score;
    j["quality_pivot"] = quality_pivot;
    j["quality_base_multiplier"] = quality_base_multiplier;
    j["quality_slope"] = quality_slope;
    j["max_quality_multiplier"] = max_quality_multiplier;

    nlohmann::json weights;
    for (const auto& [type, weight] : signal_type_weights) {
        weights[signal_type_to_string(type)] = weight;
    }
    j["signal_type_weights"] = weights;

    j["drawdown_adjustment"] = drawdown_adjustment;
    j["drawdown_minor"] = drawdown_minor;
    j["drawdown_minor_multiplier"] = drawdown_minor_multiplier;
    j["drawdown_major"] = drawdown_major;
    j["drawdown_major_multiplier"] = drawdown_major_multiplier;
    j["version"] = version;
    return j;
}

void SizingConfig::from_json(const nlohmann::json& j) {
    if (j.contains("risk_per_trade_pct"))
        risk_per_trade_pct = j.at("risk_per_trade_pct").get<double>();
    if (j.contains("max_position_pct"))
        max_position_pct = j.at("max_position_pct").get<double>();
    if (j.contains("min_quality_score"))
        min_quality_score = j.at("min_quality_score").get<double>();
    if (j.contains("quality_pivot"))
        quality_pivot = j.at("quality_pivot").get<double>();
    if (j.contains("quality_base_multiplier"))
        quality_base_multiplier = j.at("quality_base_multiplier").get<double>();
    if (j.contains("quality_slope"))
        quality_slope = j.at("quality_slope").get<double>();
    if (j.contains("max_quality_multiplier"))
        max_quality_multiplier = j.at("max_quality_multiplier").get<double>();

    if (j.contains("signal_type_weights")) {
        for (const auto& [name, weight] : j.at("signal_type_weights").items()) {
            auto type = signal_type_from_string(name);
            if (!type) {
                throw TradeError(ErrorCode::INVALID_ARGUMENT,
                                 "Unknown signal type in signal_type_weights: " + name,
                                 "SizingConfig");
            }
            signal_type_weights[*type] = weight.get<double>();
        }
    }

    if (j.contains("drawdown_adjustment"))
        drawdown_adjustment = j.at("drawdown_adjustment").get<bool>();
    if (j.contains("drawdown_minor"))
        drawdown_minor = j.at("drawdown_minor").get<double>();
    if (j.contains("drawdown_minor_multiplier"))
        drawdown_minor_multiplier = j.at("drawdown_minor_multiplier").get<double>();
    if (j.contains("drawdown_major"))
        drawdown_major = j.at("drawdown_major").get<double>();
    if (j.contains("drawdown_major_multiplier"))
        drawdown_major_multiplier = j.at("drawdown_major_multiplier").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> SizingConfig::validate() const {
    if (!in_unit_interval(risk_per_trade_pct)) {
        return invalid("risk_per_trade_pct must be in (0, 1]");
    }
    if (!in_unit_interval(max_position_pct)) {
        return invalid("max_position_pct must be in (0, 1]");
    }
    if (min_quality_score < 0.0 || min_quality_score > 10.0) {
        return invalid("min_quality_score must be in [0, 10]");
    }
    if (max_quality_multiplier <= 0.0) {
        return invalid("max_quality_multiplier must be positive");
    }
    for (const auto& [type, weight] : signal_type_weights) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return invalid("signal_type_weights[" + signal_type_to_string(type) +
                           "] must be non-negative");
        }
    }
    if (drawdown_adjustment) {
        if (!(drawdown_minor > 0.0 && drawdown_minor < drawdown_major && drawdown_major < 1.0)) {
            return invalid("drawdown thresholds must satisfy 0 < minor < major < 1");
        }
        if (!in_unit_interval(drawdown_minor_multiplier) ||
            !in_unit_interval(drawdown_major_multiplier)) {
            return invalid("drawdown multipliers must be in (0, 1]");
        }
    }
    return Result<void>();
}

PositionSizer::PositionSizer(SizingConfig config) : config_(std::move(config)) {}

double PositionSizer::portfolio_value(const CapitalLedger& ledger, const PositionStore& store) {
    return ledger.available() + store.committed_cost();
}

double PositionSizer::quality_multiplier(double quality_score) const {
    double m = config_.quality_base_multiplier +
               (quality_score - config_.quality_pivot) * config_.quality_slope;
    return std::clamp(m, 0.0, config_.max_quality_multiplier);
}

double PositionSizer::drawdown_multiplier(double drawdown) const {
    if (!config_.drawdown_adjustment) {
        return 1.0;
    }
    if (drawdown >= config_.drawdown_major) {
        return config_.drawdown_major_multiplier;
    }
    if (drawdown >= config_.drawdown_minor) {
        return config_.drawdown_minor_multiplier;
    }
    return 1.0;
}

SizingResult PositionSizer::size(const Signal& signal, const CapitalLedger& ledger,
                                 const PositionStore& store) const {
    SizingResult result;

    if (signal.quality_score < config_.min_quality_score) {
        result.outcome = SizingOutcome::BELOW_MIN_QUALITY;
        return result;
    }

    const double risk_per_share = signal.entry_price - signal.stop_loss;
    if (!(risk_per_share > 0.0)) {
        result.outcome = SizingOutcome::DEGENERATE_STOP;
        return result;
    }

    result.portfolio_value = portfolio_value(ledger, store);

    const double max_risk = result.portfolio_value * config_.risk_per_trade_pct;
    result.risk_cap = (max_risk / risk_per_share) * signal.entry_price;
    result.position_cap = result.portfolio_value * config_.max_position_pct;
    result.quality_multiplier = quality_multiplier(signal.quality_score);

    double weight = 1.0;
    auto it = config_.signal_type_weights.find(signal.signal_type);
    if (it != config_.signal_type_weights.end()) {
        weight = it->second;
    }

    result.requested = std::min(result.risk_cap, result.position_cap) *
                       result.quality_multiplier * weight *
                       drawdown_multiplier(ledger.drawdown());

    const double final_allocation = std::min(result.requested, ledger.available());
    result.shares =
        static_cast<ShareCount>(std::floor(final_allocation / signal.entry_price + kShareEpsilon));

    if (result.shares <= 0) {
        result.shares = 0;
        const bool request_buys_share = result.requested / signal.entry_price + kShareEpsilon >= 1.0;
        result.outcome =
            request_buys_share ? SizingOutcome::INSUFFICIENT_CAPITAL : SizingOutcome::TOO_SMALL;
        return result;
    }

    result.allocation = static_cast<double>(result.shares) * signal.entry_price;
    if (result.allocation > ledger.available()) {
        // epsilon pushed floor over the cash line
        result.shares -= 1;
        result.allocation = static_cast<double>(result.shares) * signal.entry_price;
        if (result.shares <= 0) {
            result.shares = 0;
            result.allocation = 0.0;
            result.outcome = SizingOutcome::INSUFFICIENT_CAPITAL;
            return result;
        }
    }

    result.outcome = SizingOutcome::SIZED;
    return result;
}

}  // namespace paper_ngin
