// src/portfolio/portfolio_config.cpp
#include "paper_ngin/portfolio/portfolio_config.hpp"
#include <cmath>

namespace paper_ngin {

nlohmann::json PortfolioConfig::to_json() const {
    nlohmann::json j;
    j["portfolio_id"] = portfolio_id;
    j["initial_capital"] = initial_capital;
    j["max_positions"] = max_positions;
    j["sizing"] = sizing.to_json();
    j["exits"] = exits.to_json();
    j["replacement"] = replacement.to_json();
    j["version"] = version;
    return j;
}

void PortfolioConfig::from_json(const nlohmann::json& j) {
    if (j.contains("portfolio_id"))
        portfolio_id = j.at("portfolio_id").get<std::string>();
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("max_positions"))
        max_positions = j.at("max_positions").get<int>();
    if (j.contains("sizing"))
        sizing.from_json(j.at("sizing"));
    if (j.contains("exits"))
        exits.from_json(j.at("exits"));
    if (j.contains("replacement"))
        replacement.from_json(j.at("replacement"));
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> PortfolioConfig::validate() const {
    if (portfolio_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "portfolio_id cannot be empty",
                                "PortfolioConfig");
    }
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "initial_capital must be positive",
                                "PortfolioConfig");
    }
    if (max_positions <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_positions must be positive",
                                "PortfolioConfig");
    }

    auto sizing_result = sizing.validate();
    if (sizing_result.is_error())
        return sizing_result;

    auto exits_result = exits.validate();
    if (exits_result.is_error())
        return exits_result;

    auto replacement_result = replacement.validate();
    if (replacement_result.is_error())
        return replacement_result;

    if (replacement.enabled && replacement.high_quality_threshold < sizing.min_quality_score) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "high_quality_threshold is below min_quality_score",
                                "PortfolioConfig");
    }
    return Result<void>();
}

}  // namespace paper_ngin
