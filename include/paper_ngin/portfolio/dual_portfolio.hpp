// include/paper_ngin/portfolio/dual_portfolio.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/portfolio/portfolio_orchestrator.hpp"

namespace paper_ngin {

/**
 * @brief Capital split between a swing book and a positional book
 *
 * initial_capital in the two sub-configs is derived from total_capital and
 * swing_fraction; values set there are overwritten.
 */
struct DualPortfolioConfig : public ConfigBase {
    std::string id{"dual"};
    double total_capital{100000.0};
    double swing_fraction{0.30};

    PortfolioConfig swing;
    PortfolioConfig positional;

    std::string version{"1.0.0"};

    /**
     * @brief Sub-configs with ids and capital filled in from the split
     */
    PortfolioConfig resolved_swing() const;
    PortfolioConfig resolved_positional() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Runs a swing and a positional portfolio as siblings
 *
 * Signals are routed by strategy class, and a symbol open in either book is
 * rejected by the other.
 */
class DualPortfolio {
public:
    DualPortfolio(DualPortfolioConfig config, std::shared_ptr<StateStore> swing_store = nullptr,
                  std::shared_ptr<StateStore> positional_store = nullptr,
                  std::shared_ptr<PortfolioEventBus> bus = nullptr,
                  TradingCalendar calendar = TradingCalendar());
    ~DualPortfolio();

    DualPortfolio(const DualPortfolio&) = delete;
    DualPortfolio& operator=(const DualPortfolio&) = delete;

    Result<void> initialize();

    Result<SignalOutcome> on_signal(const Signal& signal);

    /**
     * @brief Route a batch in descending quality order across both books
     */
    Result<std::vector<SignalOutcome>> on_signals(std::vector<Signal> signals);

    /**
     * @brief Feed ticks to the swing book, then the positional book
     */
    Result<std::vector<ExitEvent>> on_price_ticks(const std::vector<PriceTick>& ticks);

    PortfolioSummary combined_summary(const std::map<std::string, Price>& prices = {}) const;

    Result<void> reset();

    PortfolioOrchestrator& swing() {
        return *swing_;
    }
    const PortfolioOrchestrator& swing() const {
        return *swing_;
    }
    PortfolioOrchestrator& positional() {
        return *positional_;
    }
    const PortfolioOrchestrator& positional() const {
        return *positional_;
    }

    const DualPortfolioConfig& config() const {
        return config_;
    }

private:
    PortfolioOrchestrator& route(StrategyClass cls) {
        return cls == StrategyClass::SWING ? *swing_ : *positional_;
    }

    DualPortfolioConfig config_;
    std::unique_ptr<PortfolioOrchestrator> swing_;
    std::unique_ptr<PortfolioOrchestrator> positional_;
    bool registered_{false};
};

}  // namespace paper_ngin
