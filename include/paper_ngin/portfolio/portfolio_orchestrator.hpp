// include/paper_ngin/portfolio/portfolio_orchestrator.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/trading_calendar.hpp"
#include "paper_ngin/events/portfolio_event_bus.hpp"
#include "paper_ngin/portfolio/portfolio_config.hpp"
#include "paper_ngin/portfolio/portfolio_state.hpp"
#include "paper_ngin/portfolio/portfolio_statistics.hpp"
#include "paper_ngin/portfolio/replacement_arbitrator.hpp"
#include "paper_ngin/position/exit_evaluator.hpp"
#include "paper_ngin/signal/signal.hpp"
#include "paper_ngin/sizing/position_sizer.hpp"
#include "paper_ngin/storage/state_store.hpp"

namespace paper_ngin {

enum class SignalStatus { ENTERED, REJECTED, REPLACED_AND_ENTERED };

enum class RejectionReason {
    NONE,
    INVALID_SIGNAL,
    DUPLICATE,
    HELD_BY_SIBLING,
    BELOW_MIN_QUALITY,
    DEGENERATE_STOP,
    TOO_SMALL,
    INSUFFICIENT_CAPITAL,
    MAX_POSITIONS
};

std::string signal_status_to_string(SignalStatus status);
std::string rejection_reason_to_string(RejectionReason reason);

struct SignalOutcome {
    std::string symbol;
    SignalStatus status{SignalStatus::REJECTED};
    RejectionReason reason{RejectionReason::NONE};
    std::string detail;
    ShareCount shares{0};
    double allocation{0.0};
    std::optional<TradeRecord> replaced_trade;

    bool is_entered() const {
        return status != SignalStatus::REJECTED;
    }
};

struct PriceTick {
    std::string symbol;
    Price price{0.0};
    Timestamp timestamp{};
};

struct ExitEvent {
    std::string portfolio_id;
    TradeRecord trade;
    ShareCount shares_remaining{0};
};

/**
 * @brief Owns one portfolio and drives its position lifecycle
 *
 * Every mutating call works on a copy of the portfolio state, persists it
 * through the state store and only then swaps it in and publishes events.
 * A rejected signal or failed save leaves the portfolio untouched.
 *
 * An invariant violation discards the copy and halts the portfolio: the
 * component moves to ERR_STATE, a PORTFOLIO_HALTED event is published and
 * every later call fails with PORTFOLIO_HALTED until reset().
 */
class PortfolioOrchestrator {
public:
    /**
     * @param config Portfolio policy
     * @param store Persistence; may be null for a purely in-memory portfolio
     * @param bus Event sink; may be null
     * @param calendar Trading calendar used to count holding periods
     */
    explicit PortfolioOrchestrator(PortfolioConfig config,
                                   std::shared_ptr<StateStore> store = nullptr,
                                   std::shared_ptr<PortfolioEventBus> bus = nullptr,
                                   TradingCalendar calendar = TradingCalendar());
    ~PortfolioOrchestrator();

    PortfolioOrchestrator(const PortfolioOrchestrator&) = delete;
    PortfolioOrchestrator& operator=(const PortfolioOrchestrator&) = delete;

    /**
     * @brief Validate config, load persisted state or start fresh, register
     * with the StateManager
     */
    Result<void> initialize();

    /**
     * @brief Portfolio whose open symbols this one must not duplicate
     * The sibling must outlive this orchestrator.
     */
    void add_sibling(const PortfolioOrchestrator* sibling);

    bool holds(const std::string& symbol) const;

    Result<SignalOutcome> on_signal(const Signal& signal);

    /**
     * @brief Admit a raw scanner record; malformed input is an INVALID_SIGNAL rejection
     */
    Result<SignalOutcome> on_signal_json(const nlohmann::json& record);

    /**
     * @brief Evaluate signals in descending quality order, each against the
     * state left by the previous one
     */
    Result<std::vector<SignalOutcome>> on_signals(std::vector<Signal> signals);

    Result<std::vector<ExitEvent>> on_price_tick(const std::string& symbol, Price price,
                                                 const Timestamp& timestamp);

    /**
     * @brief Apply ticks in symbol order; ties keep their input order
     */
    Result<std::vector<ExitEvent>> on_price_ticks(std::vector<PriceTick> ticks);

    const PortfolioState& snapshot() const {
        return state_;
    }

    PortfolioSummary summary(const std::map<std::string, Price>& prices = {}) const;

    /**
     * @brief Discard positions and history, restore initial capital and
     * clear a halt
     */
    Result<void> reset();

    bool is_halted() const {
        return halted_;
    }

    bool is_initialized() const {
        return initialized_;
    }

    const std::string& id() const {
        return config_.portfolio_id;
    }

    const PortfolioConfig& config() const {
        return config_;
    }

private:
    Result<void> check_ready() const;
    PortfolioState fresh_state() const;

    SignalOutcome admit(const Signal& signal, PortfolioState& working,
                        std::vector<PortfolioEvent>& events, const Timestamp& now) const;
    void enter(const Signal& signal, const SizingResult& sizing, PortfolioState& working,
               std::vector<PortfolioEvent>& events, SignalOutcome& outcome) const;
    std::vector<ExitEvent> evaluate_tick(const std::string& symbol, Price price,
                                         const Timestamp& timestamp, PortfolioState& working,
                                         std::vector<PortfolioEvent>& events) const;

    Result<void> commit(PortfolioState working, const std::vector<PortfolioEvent>& events);
    void halt(const TradeError& error, const std::string& operation);
    void publish_metrics() const;

    PortfolioEvent make_event(PortfolioEventType type, const std::string& symbol,
                              const Timestamp& timestamp) const;

    PortfolioConfig config_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<PortfolioEventBus> bus_;

    PositionSizer sizer_;
    ExitEvaluator evaluator_;
    ReplacementArbitrator arbitrator_;

    PortfolioState state_;
    std::vector<const PortfolioOrchestrator*> siblings_;
    bool initialized_{false};
    bool halted_{false};
    bool registered_{false};
};

}  // namespace paper_ngin
