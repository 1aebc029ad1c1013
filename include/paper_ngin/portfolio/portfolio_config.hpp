// include/paper_ngin/portfolio/portfolio_config.hpp
#pragma once

#include <string>
#include <vector>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/portfolio/replacement_arbitrator.hpp"
#include "paper_ngin/position/exit_evaluator.hpp"
#include "paper_ngin/sizing/position_sizer.hpp"

namespace paper_ngin {

/**
 * @brief Complete policy for one portfolio
 *
 * Passed by value at construction and never modified afterwards, so two
 * portfolios with different thresholds can run side by side.
 */
struct PortfolioConfig : public ConfigBase {
    std::string portfolio_id{"paper"};
    double initial_capital{100000.0};
    int max_positions{10};

    SizingConfig sizing;
    ExitConfig exits;
    ReplacementConfig replacement;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

}  // namespace paper_ngin
