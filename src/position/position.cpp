// src/position/position.cpp
#include "paper_ngin/position/position.hpp"
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

namespace {

Timestamp read_timestamp(const nlohmann::json& j, const char* field) {
    auto ts = core::parse_timestamp(j.at(field).get<std::string>());
    if (!ts) {
        throw TradeError(ErrorCode::CONVERSION_ERROR,
                         std::string("Malformed timestamp in field ") + field, "Position");
    }
    return *ts;
}

template <typename E>
E read_enum(const nlohmann::json& j, const char* field,
            std::optional<E> (*parse)(const std::string&)) {
    auto value = parse(j.at(field).get<std::string>());
    if (!value) {
        throw TradeError(ErrorCode::CONVERSION_ERROR,
                         std::string("Unknown value in field ") + field + ": " + j.at(field).dump(),
                         "Position");
    }
    return *value;
}

}  // namespace

nlohmann::json Position::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["strategy_class"] = strategy_class_to_string(strategy_class);
    j["signal_type"] = signal_type_to_string(signal_type);
    j["entry_price"] = entry_price;
    j["shares_original"] = shares_original;
    j["shares_remaining"] = shares_remaining;
    j["stop_loss"] = stop_loss;
    j["initial_stop"] = initial_stop;

    nlohmann::json targets_json = nlohmann::json::array();
    for (size_t i = 0; i < targets.size(); ++i) {
        targets_json.push_back({{"price", targets[i].price},
                                {"exit_fraction", targets[i].exit_fraction},
                                {"hit", targets_hit[i]}});
    }
    j["targets"] = targets_json;
    j["entry_time"] = core::format_timestamp(entry_time);
    j["quality_score"] = quality_score;
    j["max_hold_periods"] = max_hold_periods;
    return j;
}

Result<Position> Position::from_json(const nlohmann::json& j) {
    Position p;
    try {
        p.symbol = j.at("symbol").get<std::string>();
        p.strategy_class = read_enum<StrategyClass>(j, "strategy_class", strategy_class_from_string);
        p.signal_type = read_enum<SignalType>(j, "signal_type", signal_type_from_string);
        p.entry_price = j.at("entry_price").get<double>();
        p.shares_original = j.at("shares_original").get<ShareCount>();
        p.shares_remaining = j.at("shares_remaining").get<ShareCount>();
        p.stop_loss = j.at("stop_loss").get<double>();
        p.initial_stop = j.value("initial_stop", p.stop_loss);

        const auto& targets_json = j.at("targets");
        if (!targets_json.is_array() || targets_json.size() != 3) {
            return make_error<Position>(ErrorCode::INVALID_DATA,
                                        p.symbol + ": expected exactly 3 targets", "Position");
        }
        for (size_t i = 0; i < 3; ++i) {
            p.targets[i].price = targets_json[i].at("price").get<double>();
            p.targets[i].exit_fraction = targets_json[i].at("exit_fraction").get<double>();
            p.targets_hit[i] = targets_json[i].value("hit", false);
        }
        p.entry_time = read_timestamp(j, "entry_time");
        p.quality_score = j.at("quality_score").get<double>();
        p.max_hold_periods = j.at("max_hold_periods").get<int>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<Position>(ErrorCode::INVALID_DATA,
                                    std::string("Malformed position: ") + e.what(), "Position");
    } catch (const TradeError& e) {
        return make_error<Position>(e.code(), e.what(), "Position");
    }

    if (p.symbol.empty() || p.shares_remaining <= 0 || p.shares_remaining > p.shares_original ||
        p.entry_price <= 0.0 || p.stop_loss < p.initial_stop) {
        return make_error<Position>(ErrorCode::INVALID_DATA,
                                    "Stored position violates share or stop invariants: " +
                                        p.symbol,
                                    "Position");
    }
    return Result<Position>(std::move(p));
}

nlohmann::json TradeRecord::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["strategy_class"] = strategy_class_to_string(strategy_class);
    j["signal_type"] = signal_type_to_string(signal_type);
    j["entry_price"] = entry_price;
    j["exit_price"] = exit_price;
    j["shares"] = shares;
    j["pnl"] = pnl;
    j["pnl_pct"] = pnl_pct;
    j["reason"] = exit_reason_to_string(reason);
    j["entry_time"] = core::format_timestamp(entry_time);
    j["exit_time"] = core::format_timestamp(exit_time);
    j["holding_periods"] = holding_periods;
    j["quality_score"] = quality_score;
    j["closed_position"] = closed_position;
    return j;
}

Result<TradeRecord> TradeRecord::from_json(const nlohmann::json& j) {
    TradeRecord t;
    try {
        t.symbol = j.at("symbol").get<std::string>();
        t.strategy_class = read_enum<StrategyClass>(j, "strategy_class", strategy_class_from_string);
        t.signal_type = read_enum<SignalType>(j, "signal_type", signal_type_from_string);
        t.entry_price = j.at("entry_price").get<double>();
        t.exit_price = j.at("exit_price").get<double>();
        t.shares = j.at("shares").get<ShareCount>();
        t.pnl = j.at("pnl").get<double>();
        t.pnl_pct = j.at("pnl_pct").get<double>();
        t.reason = read_enum<ExitReason>(j, "reason", exit_reason_from_string);
        t.entry_time = read_timestamp(j, "entry_time");
        t.exit_time = read_timestamp(j, "exit_time");
        t.holding_periods = j.value("holding_periods", 0);
        t.quality_score = j.value("quality_score", 0.0);
        t.closed_position = j.value("closed_position", false);
    } catch (const nlohmann::json::exception& e) {
        return make_error<TradeRecord>(ErrorCode::INVALID_DATA,
                                       std::string("Malformed trade record: ") + e.what(),
                                       "TradeRecord");
    } catch (const TradeError& e) {
        return make_error<TradeRecord>(e.code(), e.what(), "TradeRecord");
    }
    return Result<TradeRecord>(std::move(t));
}

}  // namespace paper_ngin
