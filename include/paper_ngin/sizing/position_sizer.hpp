// include/paper_ngin/sizing/position_sizer.hpp
#pragma once

#include <map>
#include <string>
#include "paper_ngin/core/config_base.hpp"
#include "paper_ngin/ledger/capital_ledger.hpp"
#include "paper_ngin/position/position_store.hpp"
#include "paper_ngin/signal/signal.hpp"

namespace paper_ngin {

/**
 * @brief Risk and concentration limits used to size new entries
 */
struct SizingConfig : public ConfigBase {
    double risk_per_trade_pct{0.02};   // fraction of portfolio value at risk per trade
    double max_position_pct{0.25};     // fraction of portfolio value in one position
    double min_quality_score{7.0};

    // multiplier = base + (score - pivot) * slope, clamped to [0, max]
    double quality_pivot{7.0};
    double quality_base_multiplier{0.5};
    double quality_slope{0.5};
    double max_quality_multiplier{2.0};

    std::map<SignalType, double> signal_type_weights{{SignalType::MOMENTUM, 1.0},
                                                     {SignalType::MEAN_REVERSION, 1.0},
                                                     {SignalType::BREAKOUT, 1.0}};

    // Size cut while equity is below its peak
    bool drawdown_adjustment{false};
    double drawdown_minor{0.05};
    double drawdown_minor_multiplier{0.75};
    double drawdown_major{0.10};
    double drawdown_major_multiplier{0.5};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

enum class SizingOutcome {
    SIZED,
    BELOW_MIN_QUALITY,
    DEGENERATE_STOP,
    TOO_SMALL,             // the requested allocation buys no share
    INSUFFICIENT_CAPITAL   // the request buys shares, available cash does not
};

std::string sizing_outcome_to_string(SizingOutcome outcome);

struct SizingResult {
    SizingOutcome outcome{SizingOutcome::TOO_SMALL};
    ShareCount shares{0};
    double allocation{0.0};  // shares * entry
    double portfolio_value{0.0};
    double risk_cap{0.0};
    double position_cap{0.0};
    double quality_multiplier{0.0};
    double requested{0.0};

    bool is_sized() const {
        return outcome == SizingOutcome::SIZED;
    }
};

/**
 * @brief Turns a signal into a whole-share quantity
 *
 * Pure function of the signal, the ledger and the open positions. The
 * allocation is the smaller of the risk cap and the concentration cap, scaled
 * by signal quality and signal-type weight, then limited by available cash.
 */
class PositionSizer {
public:
    explicit PositionSizer(SizingConfig config);

    SizingResult size(const Signal& signal, const CapitalLedger& ledger,
                      const PositionStore& store) const;

    /**
     * @brief Available cash plus the entry cost of shares still held
     */
    static double portfolio_value(const CapitalLedger& ledger, const PositionStore& store);

    double quality_multiplier(double quality_score) const;
    double drawdown_multiplier(double drawdown) const;

    const SizingConfig& config() const {
        return config_;
    }

private:
    SizingConfig config_;
};

}  // namespace paper_ngin
