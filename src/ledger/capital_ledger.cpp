// src/ledger/capital_ledger.cpp
#include "paper_ngin/ledger/capital_ledger.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "CapitalLedger";

// Absorbs floating point dust from summing per-fill cost bases
constexpr double kCapitalEpsilon = 1e-6;

}  // namespace

CapitalLedger::CapitalLedger(double initial_capital)
    : available_(initial_capital), peak_equity_(initial_capital) {
    if (!std::isfinite(initial_capital) || initial_capital < 0.0) {
        throw_invariant_violation(
            "Initial capital must be non-negative: " + std::to_string(initial_capital),
            kComponent);
    }
}

Result<void> CapitalLedger::reserve(double amount) {
    if (!std::isfinite(amount) || amount < 0.0) {
        throw_invariant_violation("Negative reservation: " + std::to_string(amount), kComponent);
    }

    if (amount > available_ + kCapitalEpsilon) {
        return make_error<void>(ErrorCode::INSUFFICIENT_FUNDS,
                                "Reservation of " + std::to_string(amount) +
                                    " exceeds available capital " + std::to_string(available_),
                                kComponent);
    }

    available_ -= amount;
    if (available_ < 0.0) {
        DEBUG("Reservation of " << amount << " overdrew available capital by " << -available_
                                << "; rounding to 0");
        available_ = 0.0;
    }
    committed_ += amount;
    check_invariants("reserve");
    return Result<void>();
}

void CapitalLedger::release(double proceeds, double cost_basis) {
    if (!std::isfinite(proceeds) || proceeds < 0.0) {
        throw_invariant_violation("Negative proceeds: " + std::to_string(proceeds), kComponent);
    }
    if (!std::isfinite(cost_basis) || cost_basis < 0.0) {
        throw_invariant_violation("Negative cost basis: " + std::to_string(cost_basis),
                                  kComponent);
    }
    if (cost_basis > committed_ + kCapitalEpsilon) {
        throw_invariant_violation("Releasing cost basis " + std::to_string(cost_basis) +
                                      " above committed capital " + std::to_string(committed_),
                                  kComponent);
    }

    available_ += proceeds;
    committed_ -= cost_basis;
    if (committed_ < 0.0) {
        DEBUG("Release of cost basis " << cost_basis << " overdrew committed capital by "
                                       << -committed_ << "; rounding to 0");
        committed_ = 0.0;
    }
    realized_pnl_ += proceeds - cost_basis;
    peak_equity_ = std::max(peak_equity_, equity());
    check_invariants("release");
}

double CapitalLedger::drawdown() const {
    if (peak_equity_ <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, (peak_equity_ - equity()) / peak_equity_);
}

void CapitalLedger::check_invariants(const char* operation) const {
    if (!(available_ >= 0.0) || !(committed_ >= 0.0)) {
        throw_invariant_violation(std::string("Negative balance after ") + operation +
                                      ": available=" + std::to_string(available_) +
                                      " committed=" + std::to_string(committed_),
                                  kComponent);
    }
}

nlohmann::json CapitalLedger::to_json() const {
    return {{"available", available_},
            {"committed", committed_},
            {"realized_pnl", realized_pnl_},
            {"peak_equity", peak_equity_}};
}

Result<CapitalLedger> CapitalLedger::from_json(const nlohmann::json& j) {
    CapitalLedger ledger;
    try {
        ledger.available_ = j.at("available").get<double>();
        ledger.committed_ = j.at("committed").get<double>();
        ledger.realized_pnl_ = j.value("realized_pnl", 0.0);
        ledger.peak_equity_ = j.value("peak_equity", ledger.available_ + ledger.committed_);
    } catch (const nlohmann::json::exception& e) {
        return make_error<CapitalLedger>(ErrorCode::INVALID_DATA,
                                         std::string("Malformed ledger: ") + e.what(),
                                         kComponent);
    }

    for (double v : {ledger.available_, ledger.committed_, ledger.peak_equity_}) {
        if (!std::isfinite(v) || v < 0.0) {
            return make_error<CapitalLedger>(ErrorCode::INVALID_DATA,
                                             "Stored ledger balances must be non-negative",
                                             kComponent);
        }
    }
    if (!std::isfinite(ledger.realized_pnl_)) {
        return make_error<CapitalLedger>(ErrorCode::INVALID_DATA,
                                         "Stored realized P&L is not finite", kComponent);
    }
    return Result<CapitalLedger>(std::move(ledger));
}

}  // namespace paper_ngin
