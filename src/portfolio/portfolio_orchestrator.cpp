// src/portfolio/portfolio_orchestrator.cpp
#include "paper_ngin/portfolio/portfolio_orchestrator.hpp"
#include <algorithm>
#include <cmath>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "PortfolioOrchestrator";

RejectionReason rejection_for(SizingOutcome outcome) {
    switch (outcome) {
        case SizingOutcome::BELOW_MIN_QUALITY:
            return RejectionReason::BELOW_MIN_QUALITY;
        case SizingOutcome::DEGENERATE_STOP:
            return RejectionReason::DEGENERATE_STOP;
        case SizingOutcome::INSUFFICIENT_CAPITAL:
            return RejectionReason::INSUFFICIENT_CAPITAL;
        case SizingOutcome::TOO_SMALL:
        case SizingOutcome::SIZED:
            break;
    }
    return RejectionReason::TOO_SMALL;
}

}  // namespace

std::string signal_status_to_string(SignalStatus status) {
    switch (status) {
        case SignalStatus::ENTERED:
            return "ENTERED";
        case SignalStatus::REJECTED:
            return "REJECTED";
        case SignalStatus::REPLACED_AND_ENTERED:
            return "REPLACED_AND_ENTERED";
    }
    return "UNKNOWN";
}

std::string rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NONE:
            return "NONE";
        case RejectionReason::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case RejectionReason::DUPLICATE:
            return "DUPLICATE";
        case RejectionReason::HELD_BY_SIBLING:
            return "HELD_BY_SIBLING";
        case RejectionReason::BELOW_MIN_QUALITY:
            return "BELOW_MIN_QUALITY";
        case RejectionReason::DEGENERATE_STOP:
            return "DEGENERATE_STOP";
        case RejectionReason::TOO_SMALL:
            return "TOO_SMALL";
        case RejectionReason::INSUFFICIENT_CAPITAL:
            return "INSUFFICIENT_CAPITAL";
        case RejectionReason::MAX_POSITIONS:
            return "MAX_POSITIONS";
    }
    return "UNKNOWN";
}

PortfolioOrchestrator::PortfolioOrchestrator(PortfolioConfig config,
                                             std::shared_ptr<StateStore> store,
                                             std::shared_ptr<PortfolioEventBus> bus,
                                             TradingCalendar calendar)
    : config_(std::move(config)),
      store_(std::move(store)),
      bus_(std::move(bus)),
      sizer_(config_.sizing),
      evaluator_(config_.exits, std::move(calendar)),
      arbitrator_(config_.replacement, sizer_, evaluator_) {
    Logger::register_component(kComponent);
}

PortfolioOrchestrator::~PortfolioOrchestrator() {
    if (registered_) {
        auto result = StateManager::instance().unregister_component(config_.portfolio_id);
        if (result.is_error()) {
            WARN("Failed to unregister portfolio " << config_.portfolio_id << ": "
                                                   << result.error()->what());
        }
    }
}

PortfolioState PortfolioOrchestrator::fresh_state() const {
    PortfolioState state;
    state.portfolio_id = config_.portfolio_id;
    state.initial_capital = config_.initial_capital;
    state.ledger = CapitalLedger(config_.initial_capital);
    return state;
}

Result<void> PortfolioOrchestrator::initialize() {
    if (initialized_) {
        return Result<void>();
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR("Invalid configuration for portfolio " << config_.portfolio_id << ": "
                                                     << valid.error()->what());
        return valid;
    }

    if (!registered_) {
        ComponentInfo info{ComponentType::PORTFOLIO,
                           ComponentState::INITIALIZED,
                           config_.portfolio_id,
                           "",
                           std::chrono::system_clock::now(),
                           {}};
        auto register_result = StateManager::instance().register_component(info);
        if (register_result.is_error()) {
            WARN("Failed to register portfolio with StateManager: "
                 << register_result.error()->what());
        } else {
            registered_ = true;
        }
    }

    if (store_) {
        auto loaded = store_->load();
        if (loaded.is_error()) {
            ERROR("Failed to load state for portfolio " << config_.portfolio_id << ": "
                                                        << loaded.error()->what());
            return forward_error<void>(loaded);
        }

        std::optional<PortfolioState> stored = loaded.take_value();
        if (stored) {
            if (stored->portfolio_id != config_.portfolio_id) {
                return make_error<void>(ErrorCode::INVALID_DATA,
                                        "Stored state belongs to portfolio " +
                                            stored->portfolio_id + ", expected " +
                                            config_.portfolio_id,
                                        kComponent);
            }
            state_ = std::move(*stored);
            INFO("Restored portfolio " << config_.portfolio_id << " with "
                                       << state_.positions.open_count() << " open positions and "
                                       << state_.ledger.available() << " available");
        } else {
            PortfolioState initial = fresh_state();
            auto saved = store_->save(initial);
            if (saved.is_error()) {
                return saved;
            }
            state_ = std::move(initial);
            INFO("Created portfolio " << config_.portfolio_id << " with capital "
                                      << config_.initial_capital);
        }
    } else {
        state_ = fresh_state();
    }

    initialized_ = true;
    if (registered_) {
        auto running = StateManager::instance().update_state(config_.portfolio_id,
                                                             ComponentState::RUNNING);
        if (running.is_error()) {
            WARN("Failed to mark portfolio running: " << running.error()->what());
        }
    }
    publish_metrics();
    return Result<void>();
}

void PortfolioOrchestrator::add_sibling(const PortfolioOrchestrator* sibling) {
    if (sibling != nullptr && sibling != this &&
        std::find(siblings_.begin(), siblings_.end(), sibling) == siblings_.end()) {
        siblings_.push_back(sibling);
    }
}

bool PortfolioOrchestrator::holds(const std::string& symbol) const {
    return state_.positions.contains(symbol);
}

Result<void> PortfolioOrchestrator::check_ready() const {
    if (!initialized_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Portfolio " + config_.portfolio_id + " is not initialized",
                                kComponent);
    }
    if (halted_) {
        return make_error<void>(ErrorCode::PORTFOLIO_HALTED,
                                "Portfolio " + config_.portfolio_id +
                                    " is halted after an invariant violation",
                                kComponent);
    }
    return Result<void>();
}

Result<SignalOutcome> PortfolioOrchestrator::on_signal(const Signal& signal) {
    auto ready = check_ready();
    if (ready.is_error()) {
        return forward_error<SignalOutcome>(ready);
    }

    PortfolioState working = state_;
    std::vector<PortfolioEvent> events;
    SignalOutcome outcome;

    try {
        outcome = admit(signal, working, events, signal.timestamp);
    } catch (const TradeError& e) {
        if (e.code() != ErrorCode::INVARIANT_VIOLATION) {
            throw;
        }
        halt(e, "on_signal(" + signal.symbol + ")");
        return make_error<SignalOutcome>(ErrorCode::PORTFOLIO_HALTED, e.what(), kComponent);
    }

    if (!outcome.is_entered()) {
        INFO("[" << config_.portfolio_id << "] Rejected " << signal.symbol << ": "
                 << rejection_reason_to_string(outcome.reason)
                 << (outcome.detail.empty() ? "" : " (" + outcome.detail + ")"));
        return Result<SignalOutcome>(std::move(outcome));
    }

    auto committed = commit(std::move(working), events);
    if (committed.is_error()) {
        return forward_error<SignalOutcome>(committed);
    }

    INFO("[" << config_.portfolio_id << "] " << signal_status_to_string(outcome.status) << " "
             << signal.symbol << " x" << outcome.shares << " @ " << signal.entry_price
             << " (quality " << signal.quality_score << ")");
    return Result<SignalOutcome>(std::move(outcome));
}

Result<SignalOutcome> PortfolioOrchestrator::on_signal_json(const nlohmann::json& record) {
    auto ready = check_ready();
    if (ready.is_error()) {
        return forward_error<SignalOutcome>(ready);
    }

    auto parsed = Signal::from_json(record);
    if (parsed.is_error()) {
        SignalOutcome outcome;
        if (record.is_object() && record.contains("symbol") && record.at("symbol").is_string()) {
            outcome.symbol = record.at("symbol").get<std::string>();
        }
        outcome.reason = RejectionReason::INVALID_SIGNAL;
        outcome.detail = parsed.error()->what();
        INFO("[" << config_.portfolio_id << "] Rejected malformed signal: " << outcome.detail);
        return Result<SignalOutcome>(std::move(outcome));
    }
    return on_signal(parsed.value());
}

Result<std::vector<SignalOutcome>> PortfolioOrchestrator::on_signals(std::vector<Signal> signals) {
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

SignalOutcome PortfolioOrchestrator::admit(const Signal& signal, PortfolioState& working,
                                           std::vector<PortfolioEvent>& events,
                                           const Timestamp& now) const {
    SignalOutcome outcome;
    outcome.symbol = signal.symbol;

    auto reject = [&outcome](RejectionReason reason, std::string detail) {
        outcome.status = SignalStatus::REJECTED;
        outcome.reason = reason;
        outcome.detail = std::move(detail);
        return outcome;
    };

    auto valid = validate_signal(signal);
    if (valid.is_error()) {
        return reject(RejectionReason::INVALID_SIGNAL, valid.error()->what());
    }

    if (working.positions.contains(signal.symbol)) {
        return reject(RejectionReason::DUPLICATE, "already open in this portfolio");
    }

    for (const auto* sibling : siblings_) {
        if (sibling->holds(signal.symbol)) {
            return reject(RejectionReason::HELD_BY_SIBLING, "open in " + sibling->id());
        }
    }

    if (signal.quality_score < config_.sizing.min_quality_score) {
        return reject(RejectionReason::BELOW_MIN_QUALITY,
                      "score " + std::to_string(signal.quality_score) + " below " +
                          std::to_string(config_.sizing.min_quality_score));
    }

    const bool at_capacity =
        working.positions.open_count() >= static_cast<size_t>(config_.max_positions);

    if (!at_capacity) {
        SizingResult sizing = sizer_.size(signal, working.ledger, working.positions);
        if (sizing.is_sized()) {
            outcome.status = SignalStatus::ENTERED;
            enter(signal, sizing, working, events, outcome);
            return outcome;
        }
        if (sizing.outcome != SizingOutcome::INSUFFICIENT_CAPITAL) {
            return reject(rejection_for(sizing.outcome),
                          "requested " + std::to_string(sizing.requested));
        }
    }

    ReplacementOutcome replacement = arbitrator_.try_replace(signal, working, now);
    if (!replacement.evicted()) {
        return reject(at_capacity ? RejectionReason::MAX_POSITIONS
                                  : RejectionReason::INSUFFICIENT_CAPITAL,
                      "replacement " + arbitration_verdict_to_string(replacement.verdict));
    }

    const TradeRecord& evicted = *replacement.evicted_trade;
    if (!replacement.resized.is_sized()) {
        // Caller discards the working copy, which undoes the eviction
        return reject(rejection_for(replacement.resized.outcome),
                      "still unsized after evicting " + evicted.symbol);
    }

    PortfolioEvent exited = make_event(PortfolioEventType::POSITION_EXITED, evicted.symbol, now);
    exited.numeric_fields["shares"] = static_cast<double>(evicted.shares);
    exited.numeric_fields["exit_price"] = evicted.exit_price;
    exited.numeric_fields["pnl"] = evicted.pnl;
    exited.numeric_fields["pnl_pct"] = evicted.pnl_pct;
    exited.string_fields["reason"] = exit_reason_to_string(evicted.reason);
    events.push_back(std::move(exited));

    PortfolioEvent replaced = make_event(PortfolioEventType::POSITION_REPLACED, evicted.symbol, now);
    replaced.numeric_fields["pnl"] = evicted.pnl;
    replaced.numeric_fields["evicted_quality"] = evicted.quality_score;
    replaced.numeric_fields["new_quality"] = signal.quality_score;
    replaced.string_fields["replaced_by"] = signal.symbol;
    events.push_back(std::move(replaced));

    outcome.status = SignalStatus::REPLACED_AND_ENTERED;
    outcome.replaced_trade = evicted;
    enter(signal, replacement.resized, working, events, outcome);
    return outcome;
}

void PortfolioOrchestrator::enter(const Signal& signal, const SizingResult& sizing,
                                  PortfolioState& working, std::vector<PortfolioEvent>& events,
                                  SignalOutcome& outcome) const {
    auto reserved = working.ledger.reserve(sizing.allocation);
    if (reserved.is_error()) {
        throw_invariant_violation("Sized allocation not reservable for " + signal.symbol + ": " +
                                      reserved.error()->what(),
                                  kComponent);
    }

    const ExitPolicy& policy = config_.exits.policy_for(signal.strategy_class);

    Position position;
    position.symbol = signal.symbol;
    position.strategy_class = signal.strategy_class;
    position.signal_type = signal.signal_type;
    position.entry_price = signal.entry_price;
    position.shares_original = sizing.shares;
    position.shares_remaining = sizing.shares;
    position.stop_loss = signal.stop_loss;
    position.initial_stop = signal.stop_loss;
    for (size_t i = 0; i < position.targets.size(); ++i) {
        position.targets[i] = TargetLevel{signal.targets[i], policy.target_exit_fractions[i]};
    }
    position.entry_time = signal.timestamp;
    position.quality_score = signal.quality_score;
    position.max_hold_periods = signal.max_hold_periods.value_or(policy.max_hold_periods);

    working.positions.open(position);
    working.last_prices[signal.symbol] = signal.entry_price;

    outcome.shares = sizing.shares;
    outcome.allocation = sizing.allocation;

    PortfolioEvent entered =
        make_event(PortfolioEventType::POSITION_ENTERED, signal.symbol, signal.timestamp);
    entered.numeric_fields["shares"] = static_cast<double>(sizing.shares);
    entered.numeric_fields["entry_price"] = signal.entry_price;
    entered.numeric_fields["stop_loss"] = signal.stop_loss;
    entered.numeric_fields["allocation"] = sizing.allocation;
    entered.numeric_fields["quality_score"] = signal.quality_score;
    entered.string_fields["strategy_class"] = strategy_class_to_string(signal.strategy_class);
    entered.string_fields["signal_type"] = signal_type_to_string(signal.signal_type);
    events.push_back(std::move(entered));
}

Result<std::vector<ExitEvent>> PortfolioOrchestrator::on_price_tick(const std::string& symbol,
                                                                    Price price,
                                                                    const Timestamp& timestamp) {
    auto ready = check_ready();
    if (ready.is_error()) {
        return forward_error<std::vector<ExitEvent>>(ready);
    }

    if (!std::isfinite(price) || price <= 0.0) {
        return make_error<std::vector<ExitEvent>>(
            ErrorCode::INVALID_ARGUMENT,
            "Invalid price " + std::to_string(price) + " for " + symbol, kComponent);
    }

    if (!state_.positions.contains(symbol)) {
        return Result<std::vector<ExitEvent>>(std::vector<ExitEvent>());
    }

    PortfolioState working = state_;
    std::vector<PortfolioEvent> events;
    std::vector<ExitEvent> exits;

    try {
        exits = evaluate_tick(symbol, price, timestamp, working, events);
    } catch (const TradeError& e) {
        if (e.code() != ErrorCode::INVARIANT_VIOLATION) {
            throw;
        }
        halt(e, "on_price_tick(" + symbol + ")");
        return make_error<std::vector<ExitEvent>>(ErrorCode::PORTFOLIO_HALTED, e.what(),
                                                  kComponent);
    }

    auto committed = commit(std::move(working), events);
    if (committed.is_error()) {
        return forward_error<std::vector<ExitEvent>>(committed);
    }

    for (const auto& exit : exits) {
        INFO("[" << config_.portfolio_id << "] " << exit_reason_to_string(exit.trade.reason) << " "
                 << symbol << " x" << exit.trade.shares << " @ " << exit.trade.exit_price
                 << " pnl " << exit.trade.pnl << " (" << exit.shares_remaining << " left)");
    }
    return Result<std::vector<ExitEvent>>(std::move(exits));
}

std::vector<ExitEvent> PortfolioOrchestrator::evaluate_tick(const std::string& symbol, Price price,
                                                            const Timestamp& timestamp,
                                                            PortfolioState& working,
                                                            std::vector<PortfolioEvent>& events) const {
    std::vector<ExitEvent> exits;
    working.last_prices[symbol] = price;

    const Position* position = working.positions.find(symbol);
    const Price old_stop = position->stop_loss;

    ExitDecision decision = evaluator_.evaluate(*position, price, timestamp);
    std::optional<TradeRecord> trade = working.positions.apply(symbol, decision, timestamp);

    const Position* after = working.positions.find(symbol);
    if (after == nullptr) {
        working.last_prices.erase(symbol);
    }
    if (after != nullptr && after->stop_loss > old_stop) {
        PortfolioEvent raised = make_event(PortfolioEventType::STOP_RAISED, symbol, timestamp);
        raised.numeric_fields["old_stop"] = old_stop;
        raised.numeric_fields["new_stop"] = after->stop_loss;
        raised.numeric_fields["price"] = price;
        events.push_back(std::move(raised));
        DEBUG("[" << config_.portfolio_id << "] " << symbol << " stop " << old_stop << " -> "
                  << after->stop_loss);
    }

    if (trade) {
        working.ledger.release(trade->exit_price * static_cast<double>(trade->shares),
                               trade->entry_price * static_cast<double>(trade->shares));

        ExitEvent exit;
        exit.portfolio_id = config_.portfolio_id;
        exit.trade = *trade;
        exit.shares_remaining = after != nullptr ? after->shares_remaining : 0;
        exits.push_back(exit);

        PortfolioEvent exited = make_event(PortfolioEventType::POSITION_EXITED, symbol, timestamp);
        exited.numeric_fields["shares"] = static_cast<double>(trade->shares);
        exited.numeric_fields["exit_price"] = trade->exit_price;
        exited.numeric_fields["pnl"] = trade->pnl;
        exited.numeric_fields["pnl_pct"] = trade->pnl_pct;
        exited.numeric_fields["shares_remaining"] = static_cast<double>(exit.shares_remaining);
        exited.string_fields["reason"] = exit_reason_to_string(trade->reason);
        events.push_back(std::move(exited));
    }

    return exits;
}

Result<std::vector<ExitEvent>> PortfolioOrchestrator::on_price_ticks(std::vector<PriceTick> ticks) {
    std::stable_sort(ticks.begin(), ticks.end(),
                     [](const PriceTick& a, const PriceTick& b) { return a.symbol < b.symbol; });

    std::vector<ExitEvent> all_exits;
    for (const auto& tick : ticks) {
        auto exits = on_price_tick(tick.symbol, tick.price, tick.timestamp);
        if (exits.is_error()) {
            return exits;
        }
        for (auto& exit : exits.take_value()) {
            all_exits.push_back(std::move(exit));
        }
    }
    return Result<std::vector<ExitEvent>>(std::move(all_exits));
}

PortfolioSummary PortfolioOrchestrator::summary(const std::map<std::string, Price>& prices) const {
    return summarize(state_, prices);
}

Result<void> PortfolioOrchestrator::reset() {
    if (!initialized_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Portfolio " + config_.portfolio_id + " is not initialized",
                                kComponent);
    }

    PortfolioState initial = fresh_state();
    if (store_) {
        auto saved = store_->save(initial);
        if (saved.is_error()) {
            ERROR("Failed to persist reset of portfolio " << config_.portfolio_id << ": "
                                                          << saved.error()->what());
            return saved;
        }
    }
    state_ = std::move(initial);

    if (halted_) {
        halted_ = false;
        if (registered_) {
            auto& manager = StateManager::instance();
            auto reinit = manager.update_state(config_.portfolio_id, ComponentState::INITIALIZED);
            if (reinit.is_ok()) {
                reinit = manager.update_state(config_.portfolio_id, ComponentState::RUNNING);
            }
            if (reinit.is_error()) {
                WARN("Failed to restore component state: " << reinit.error()->what());
            }
        }
    }

    publish_metrics();
    INFO("Reset portfolio " << config_.portfolio_id << " to capital " << config_.initial_capital);
    return Result<void>();
}

Result<void> PortfolioOrchestrator::commit(PortfolioState working,
                                           const std::vector<PortfolioEvent>& events) {
    if (store_) {
        auto saved = store_->save(working);
        if (saved.is_error()) {
            ERROR("Failed to persist portfolio " << config_.portfolio_id
                                                 << ", change discarded: " << saved.error()->what());
            return saved;
        }
    }

    state_ = std::move(working);
    publish_metrics();

    if (bus_) {
        for (const auto& event : events) {
            bus_->publish(event);
        }
    }
    return Result<void>();
}

void PortfolioOrchestrator::halt(const TradeError& error, const std::string& operation) {
    halted_ = true;
    FATAL("[" << config_.portfolio_id << "] Halted during " << operation << ": "
              << error.to_string());

    if (registered_) {
        auto result = StateManager::instance().update_state(
            config_.portfolio_id, ComponentState::ERR_STATE, error.what());
        if (result.is_error()) {
            WARN("Failed to mark portfolio as errored: " << result.error()->what());
        }
    }

    if (bus_) {
        PortfolioEvent event =
            make_event(PortfolioEventType::PORTFOLIO_HALTED, "", std::chrono::system_clock::now());
        event.string_fields["operation"] = operation;
        event.string_fields["error"] = error.what();
        bus_->publish(event);
    }
}

void PortfolioOrchestrator::publish_metrics() const {
    if (!registered_) {
        return;
    }
    std::unordered_map<std::string, double> metrics{
        {"available_capital", state_.ledger.available()},
        {"committed_capital", state_.ledger.committed()},
        {"realized_pnl", state_.ledger.realized_pnl()},
        {"open_positions", static_cast<double>(state_.positions.open_count())},
        {"trades", static_cast<double>(state_.positions.trade_history().size())}};

    auto result = StateManager::instance().update_metrics(config_.portfolio_id, metrics);
    if (result.is_error()) {
        WARN("Failed to publish metrics for " << config_.portfolio_id << ": "
                                              << result.error()->what());
    }
}

PortfolioEvent PortfolioOrchestrator::make_event(PortfolioEventType type,
                                                 const std::string& symbol,
                                                 const Timestamp& timestamp) const {
    PortfolioEvent event;
    event.type = type;
    event.portfolio_id = config_.portfolio_id;
    event.symbol = symbol;
    event.timestamp = timestamp;
    return event;
}

}  // namespace paper_ngin
