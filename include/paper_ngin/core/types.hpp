// include/paper_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace paper_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type, rupees with double precision
 */
using Price = double;

/**
 * @brief Whole-share quantity. NSE cash equities trade in lots of one share.
 */
using ShareCount = std::int64_t;

/**
 * @brief Hold-duration class of a trade
 * Determines target, stop and time-limit policy
 */
enum class StrategyClass {
    SWING,       // short hold, days to a few weeks
    POSITIONAL   // long hold, weeks to months
};

/**
 * @brief Setup that produced a signal
 * Informational; feeds allocation policy only
 */
enum class SignalType {
    MOMENTUM,
    MEAN_REVERSION,
    BREAKOUT
};

/**
 * @brief Why a fill closed shares of a position
 */
enum class ExitReason {
    TARGET_1,
    TARGET_2,
    TARGET_3,
    STOP_LOSS,
    TRAILING_STOP,
    TIME_EXIT,
    REPLACED
};

inline std::string strategy_class_to_string(StrategyClass cls) {
    switch (cls) {
        case StrategyClass::SWING:
            return "SWING";
        case StrategyClass::POSITIONAL:
            return "POSITIONAL";
    }
    return "UNKNOWN";
}

inline std::optional<StrategyClass> strategy_class_from_string(const std::string& value) {
    if (value == "SWING")
        return StrategyClass::SWING;
    if (value == "POSITIONAL")
        return StrategyClass::POSITIONAL;
    return std::nullopt;
}

inline std::string signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::MOMENTUM:
            return "MOMENTUM";
        case SignalType::MEAN_REVERSION:
            return "MEAN_REVERSION";
        case SignalType::BREAKOUT:
            return "BREAKOUT";
    }
    return "UNKNOWN";
}

inline std::optional<SignalType> signal_type_from_string(const std::string& value) {
    if (value == "MOMENTUM")
        return SignalType::MOMENTUM;
    if (value == "MEAN_REVERSION")
        return SignalType::MEAN_REVERSION;
    if (value == "BREAKOUT")
        return SignalType::BREAKOUT;
    return std::nullopt;
}

inline std::string exit_reason_to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::TARGET_1:
            return "TARGET_1";
        case ExitReason::TARGET_2:
            return "TARGET_2";
        case ExitReason::TARGET_3:
            return "TARGET_3";
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::TRAILING_STOP:
            return "TRAILING_STOP";
        case ExitReason::TIME_EXIT:
            return "TIME_EXIT";
        case ExitReason::REPLACED:
            return "REPLACED";
    }
    return "UNKNOWN";
}

inline std::optional<ExitReason> exit_reason_from_string(const std::string& value) {
    if (value == "TARGET_1")
        return ExitReason::TARGET_1;
    if (value == "TARGET_2")
        return ExitReason::TARGET_2;
    if (value == "TARGET_3")
        return ExitReason::TARGET_3;
    if (value == "STOP_LOSS")
        return ExitReason::STOP_LOSS;
    if (value == "TRAILING_STOP")
        return ExitReason::TRAILING_STOP;
    if (value == "TIME_EXIT")
        return ExitReason::TIME_EXIT;
    if (value == "REPLACED")
        return ExitReason::REPLACED;
    return std::nullopt;
}

}  // namespace paper_ngin
