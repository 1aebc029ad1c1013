// src/portfolio/portfolio_state.cpp
#include "paper_ngin/portfolio/portfolio_state.hpp"
#include <cmath>

namespace paper_ngin {

namespace {
const std::string kComponent = "PortfolioState";
constexpr double kConsistencyTolerance = 1e-4;
}  // namespace

Price PortfolioState::mark_price(const std::string& symbol) const {
    auto it = last_prices.find(symbol);
    if (it != last_prices.end()) {
        return it->second;
    }
    const Position* position = positions.find(symbol);
    return position ? position->entry_price : 0.0;
}

Result<void> PortfolioState::check_consistency() const {
    const double open_cost = positions.committed_cost();
    if (std::fabs(open_cost - ledger.committed()) > kConsistencyTolerance) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                portfolio_id + ": committed capital " +
                                    std::to_string(ledger.committed()) +
                                    " does not match open cost basis " +
                                    std::to_string(open_cost),
                                kComponent);
    }
    return Result<void>();
}

nlohmann::json PortfolioState::to_json() const {
    nlohmann::json j;
    j["version"] = kSchemaVersion;
    j["portfolio_id"] = portfolio_id;
    j["initial_capital"] = initial_capital;
    j["ledger"] = ledger.to_json();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& [symbol, position] : positions.positions()) {
        positions_json.push_back(position.to_json());
    }
    j["positions"] = positions_json;

    nlohmann::json history_json = nlohmann::json::array();
    for (const auto& trade : positions.trade_history()) {
        history_json.push_back(trade.to_json());
    }
    j["trade_history"] = history_json;
    j["last_prices"] = last_prices;
    return j;
}

Result<PortfolioState> PortfolioState::from_json(const nlohmann::json& j) {
    PortfolioState state;
    try {
        const std::string version = j.value("version", std::string(kSchemaVersion));
        if (version != kSchemaVersion) {
            return make_error<PortfolioState>(ErrorCode::INVALID_DATA,
                                              "Unsupported state schema version " + version,
                                              kComponent);
        }

        state.portfolio_id = j.at("portfolio_id").get<std::string>();
        state.initial_capital = j.at("initial_capital").get<double>();

        auto ledger = CapitalLedger::from_json(j.at("ledger"));
        if (ledger.is_error()) {
            return forward_error<PortfolioState>(ledger);
        }
        state.ledger = ledger.take_value();

        for (const auto& position_json : j.at("positions")) {
            auto position = Position::from_json(position_json);
            if (position.is_error()) {
                return forward_error<PortfolioState>(position);
            }
            state.positions.restore(position.take_value());
        }

        std::vector<TradeRecord> history;
        for (const auto& trade_json : j.value("trade_history", nlohmann::json::array())) {
            auto trade = TradeRecord::from_json(trade_json);
            if (trade.is_error()) {
                return forward_error<PortfolioState>(trade);
            }
            history.push_back(trade.take_value());
        }
        state.positions.restore_history(std::move(history));

        if (j.contains("last_prices")) {
            state.last_prices = j.at("last_prices").get<std::map<std::string, Price>>();
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<PortfolioState>(ErrorCode::INVALID_DATA,
                                          std::string("Malformed portfolio state: ") + e.what(),
                                          kComponent);
    } catch (const TradeError& e) {
        // duplicate symbols in the stored position list
        return make_error<PortfolioState>(ErrorCode::INVALID_DATA, e.what(), kComponent);
    }

    auto consistent = state.check_consistency();
    if (consistent.is_error()) {
        return forward_error<PortfolioState>(consistent);
    }
    return Result<PortfolioState>(std::move(state));
}

}  // namespace paper_ngin
