// src/signal/signal.cpp
#include "paper_ngin/signal/signal.hpp"
#include <cmath>
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

namespace {

const std::string kComponent = "Signal";

bool finite_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

// Symbols end up in JSON snapshots, and nlohmann::json refuses to serialize
// malformed UTF-8.
bool is_valid_utf8(const std::string& text) {
    try {
        nlohmann::json(text).dump();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}

template <typename T>
Result<T> invalid(const std::string& message) {
    return make_error<T>(ErrorCode::INVALID_SIGNAL, message, kComponent);
}

}  // namespace

nlohmann::json Signal::to_json() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["strategy_class"] = strategy_class_to_string(strategy_class);
    j["signal_type"] = signal_type_to_string(signal_type);
    j["entry_price"] = entry_price;
    j["stop_loss"] = stop_loss;
    j["targets"] = targets;
    j["quality_score"] = quality_score;
    j["timestamp"] = core::format_timestamp(timestamp);
    if (max_hold_periods) {
        j["max_hold_periods"] = *max_hold_periods;
    }
    return j;
}

Result<Signal> Signal::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return invalid<Signal>("Signal record must be a JSON object");
    }

    for (const char* field : {"symbol", "strategy_class", "signal_type", "entry_price",
                              "stop_loss", "targets", "quality_score", "timestamp"}) {
        if (!j.contains(field) || j.at(field).is_null()) {
            return invalid<Signal>(std::string("Missing field: ") + field);
        }
    }

    Signal signal;
    try {
        signal.symbol = j.at("symbol").get<std::string>();

        auto cls = strategy_class_from_string(j.at("strategy_class").get<std::string>());
        if (!cls) {
            return invalid<Signal>("Unknown strategy_class: " + j.at("strategy_class").dump());
        }
        signal.strategy_class = *cls;

        auto type = signal_type_from_string(j.at("signal_type").get<std::string>());
        if (!type) {
            return invalid<Signal>("Unknown signal_type: " + j.at("signal_type").dump());
        }
        signal.signal_type = *type;

        signal.entry_price = j.at("entry_price").get<double>();
        signal.stop_loss = j.at("stop_loss").get<double>();
        signal.quality_score = j.at("quality_score").get<double>();

        const auto& targets = j.at("targets");
        if (!targets.is_array() || targets.size() != 3) {
            return invalid<Signal>("targets must be an array of exactly 3 prices");
        }
        for (size_t i = 0; i < 3; ++i) {
            signal.targets[i] = targets.at(i).get<double>();
        }

        auto ts = core::parse_timestamp(j.at("timestamp").get<std::string>());
        if (!ts) {
            return invalid<Signal>("Malformed timestamp: " + j.at("timestamp").dump());
        }
        signal.timestamp = *ts;

        if (j.contains("max_hold_periods") && !j.at("max_hold_periods").is_null()) {
            signal.max_hold_periods = j.at("max_hold_periods").get<int>();
        }
    } catch (const nlohmann::json::exception& e) {
        return invalid<Signal>(std::string("Mistyped signal field: ") + e.what());
    }

    return Result<Signal>(std::move(signal));
}

Result<void> validate_signal(const Signal& signal) {
    if (signal.symbol.empty()) {
        return invalid<void>("Signal symbol is empty");
    }
    if (!is_valid_utf8(signal.symbol)) {
        return invalid<void>("Signal symbol is not valid UTF-8");
    }
    if (!finite_positive(signal.entry_price)) {
        return invalid<void>(signal.symbol + ": entry price must be positive");
    }
    if (!std::isfinite(signal.stop_loss) || signal.stop_loss < 0.0) {
        return invalid<void>(signal.symbol + ": stop loss must be a non-negative price");
    }
    if (signal.entry_price <= signal.stop_loss) {
        return invalid<void>(signal.symbol + ": entry " + std::to_string(signal.entry_price) +
                             " is not above stop " + std::to_string(signal.stop_loss));
    }
    for (size_t i = 0; i < signal.targets.size(); ++i) {
        if (!finite_positive(signal.targets[i])) {
            return invalid<void>(signal.symbol + ": target " + std::to_string(i + 1) +
                                 " must be positive");
        }
    }
    if (!(signal.targets[0] > signal.entry_price && signal.targets[0] < signal.targets[1] &&
          signal.targets[1] < signal.targets[2])) {
        return invalid<void>(signal.symbol + ": targets must ascend strictly above the entry");
    }
    if (!std::isfinite(signal.quality_score) || signal.quality_score < 0.0 ||
        signal.quality_score > 10.0) {
        return invalid<void>(signal.symbol + ": quality score outside [0, 10]");
    }
    if (signal.max_hold_periods && *signal.max_hold_periods <= 0) {
        return invalid<void>(signal.symbol + ": max_hold_periods override must be positive");
    }
    return Result<void>();
}

}  // namespace paper_ngin
