// src/portfolio/dual_portfolio.cpp
#include "paper_ngin/portfolio/dual_portfolio.hpp"
#include <algorithm>
#include <cmath>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

PortfolioConfig DualPortfolioConfig::resolved_swing() const {
    PortfolioConfig resolved = swing;
    resolved.portfolio_id = id + "_swing";
    resolved.initial_capital = total_capital * swing_fraction;
    return resolved;
}

PortfolioConfig DualPortfolioConfig::resolved_positional() const {
    PortfolioConfig resolved = positional;
    resolved.portfolio_id = id + "_positional";
    resolved.initial_capital = total_capital * (1.0 - swing_fraction);
    return resolved;
}

nlohmann::json DualPortfolioConfig::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["total_capital"] = total_capital;
    j["swing_fraction"] = swing_fraction;
    j["swing"] = swing.to_json();
    j["positional"] = positional.to_json();
    j["version"] = version;
    return j;
}

void DualPortfolioConfig::from_json(const nlohmann::json& j) {
    if (j.contains("id"))
        id = j.at("id").get<std::string>();
    if (j.contains("total_capital"))
        total_capital = j.at("total_capital").get<double>();
    if (j.contains("swing_fraction"))
        swing_fraction = j.at("swing_fraction").get<double>();
    if (j.contains("swing"))
        swing.from_json(j.at("swing"));
    if (j.contains("positional"))
        positional.from_json(j.at("positional"));
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<void> DualPortfolioConfig::validate() const {
    if (id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "id cannot be empty",
                                "DualPortfolioConfig");
    }
    if (!std::isfinite(total_capital) || total_capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "total_capital must be positive",
                                "DualPortfolioConfig");
    }
    if (!(swing_fraction > 0.0 && swing_fraction < 1.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "swing_fraction must be in (0, 1)",
                                "DualPortfolioConfig");
    }

    auto swing_result = resolved_swing().validate();
    if (swing_result.is_error())
        return swing_result;

    return resolved_positional().validate();
}

DualPortfolio::DualPortfolio(DualPortfolioConfig config, std::shared_ptr<StateStore> swing_store,
                             std::shared_ptr<StateStore> positional_store,
                             std::shared_ptr<PortfolioEventBus> bus, TradingCalendar calendar)
    : config_(std::move(config)) {
    swing_ = std::make_unique<PortfolioOrchestrator>(config_.resolved_swing(),
                                                     std::move(swing_store), bus, calendar);
    positional_ = std::make_unique<PortfolioOrchestrator>(
        config_.resolved_positional(), std::move(positional_store), bus, std::move(calendar));

    swing_->add_sibling(positional_.get());
    positional_->add_sibling(swing_.get());
    Logger::register_component("DualPortfolio");
}

DualPortfolio::~DualPortfolio() {
    if (registered_) {
        auto result = StateManager::instance().unregister_component(config_.id);
        if (result.is_error()) {
            WARN("Failed to unregister " << config_.id << ": " << result.error()->what());
        }
    }
}

Result<void> DualPortfolio::initialize() {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return valid;
    }

    auto swing_init = swing_->initialize();
    if (swing_init.is_error())
        return swing_init;

    auto positional_init = positional_->initialize();
    if (positional_init.is_error())
        return positional_init;

    if (!registered_) {
        ComponentInfo info{ComponentType::DUAL_PORTFOLIO,
                           ComponentState::INITIALIZED,
                           config_.id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};
        auto register_result = StateManager::instance().register_component(info);
        if (register_result.is_error()) {
            WARN("Failed to register " << config_.id << ": " << register_result.error()->what());
        } else {
            registered_ = true;
            auto running =
                StateManager::instance().update_state(config_.id, ComponentState::RUNNING);
            if (running.is_error()) {
                WARN("Failed to mark " << config_.id << " running: " << running.error()->what());
            }
        }
    }

    INFO("Dual portfolio " << config_.id << " ready: swing "
                           << swing_->snapshot().ledger.available() << ", positional "
                           << positional_->snapshot().ledger.available());
    return Result<void>();
}

Result<SignalOutcome> DualPortfolio::on_signal(const Signal& signal) {
    return route(signal.strategy_class).on_signal(signal);
}

Result<std::vector<SignalOutcome>> DualPortfolio::on_signals(std::vector<Signal> signals) {
    std::stable_sort(signals.begin(), signals.end(), [](const Signal& a, const Signal& b) {
        return a.quality_score > b.quality_score;
    });

    std::vector<SignalOutcome> outcomes;
    outcomes.reserve(signals.size());
    for (const auto& signal : signals) {
        auto outcome = on_signal(signal);
        if (outcome.is_error()) {
            return forward_error<std::vector<SignalOutcome>>(outcome);
        }
        outcomes.push_back(outcome.take_value());
    }
    return Result<std::vector<SignalOutcome>>(std::move(outcomes));
}

Result<std::vector<ExitEvent>> DualPortfolio::on_price_ticks(const std::vector<PriceTick>& ticks) {
    std::vector<ExitEvent> all_exits;
    for (PortfolioOrchestrator* book : {swing_.get(), positional_.get()}) {
        auto exits = book->on_price_ticks(ticks);
        if (exits.is_error()) {
            return exits;
        }
        for (auto& exit : exits.take_value()) {
            all_exits.push_back(std::move(exit));
        }
    }
    return Result<std::vector<ExitEvent>>(std::move(all_exits));
}

PortfolioSummary DualPortfolio::combined_summary(const std::map<std::string, Price>& prices) const {
    return combine(swing_->summary(prices), positional_->summary(prices), config_.id);
}

Result<void> DualPortfolio::reset() {
    auto swing_reset = swing_->reset();
    if (swing_reset.is_error())
        return swing_reset;
    return positional_->reset();
}

}  // namespace paper_ngin
