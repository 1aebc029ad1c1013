// src/core/trading_calendar.cpp
#include "paper_ngin/core/trading_calendar.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

namespace {

constexpr long kSecondsPerDay = 86400;
constexpr long kIstOffsetSeconds = 5 * 3600 + 30 * 60;

long floor_div(long a, long b) {
    long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::optional<long> parse_day(const std::string& date) {
    std::tm tm{};
    std::istringstream ss(date);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        return std::nullopt;
    }
    std::time_t tt = core::safe_timegm(&tm);
    return floor_div(static_cast<long>(tt), kSecondsPerDay);
}

std::string format_day(long day) {
    std::time_t tt = static_cast<std::time_t>(day * kSecondsPerDay);
    std::tm tm{};
    core::safe_gmtime(&tt, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return std::string(buffer);
}

}  // namespace

TradingCalendar::TradingCalendar(const std::vector<std::string>& holidays) {
    for (const auto& date : holidays) {
        auto result = add_holiday(date);
        if (result.is_error()) {
            WARN("Skipping holiday entry: " << result.error()->what());
        }
    }
}

Result<void> TradingCalendar::add_holiday(const std::string& date) {
    auto day = parse_day(date);
    if (!day) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Malformed holiday date: " + date,
                                "TradingCalendar");
    }
    holiday_days_.insert(*day);
    return Result<void>();
}

Result<void> TradingCalendar::load_holidays(const std::string& json_path) {
    std::ifstream file(json_path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Could not open holidays file: " + json_path, "TradingCalendar");
    }

    try {
        nlohmann::json j;
        file >> j;

        std::vector<std::string> dates;
        if (j.is_array()) {
            for (const auto& entry : j) {
                dates.push_back(entry.get<std::string>());
            }
        } else {
            for (const auto& [year, entries] : j.items()) {
                for (const auto& entry : entries) {
                    dates.push_back(entry.at("date").get<std::string>());
                }
            }
        }

        for (const auto& date : dates) {
            auto result = add_holiday(date);
            if (result.is_error()) {
                return result;
            }
        }

        INFO("Loaded " << dates.size() << " exchange holidays from " << json_path);
        return Result<void>();
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid holidays file " + json_path + ": " + e.what(),
                                "TradingCalendar");
    }
}

long TradingCalendar::exchange_day(const Timestamp& ts) {
    auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    return floor_div(static_cast<long>(seconds) + kIstOffsetSeconds, kSecondsPerDay);
}

bool TradingCalendar::is_trading_day_index(long day) const {
    // 1970-01-01 was a Thursday; 0 = Sunday
    long weekday = ((day + 4) % 7 + 7) % 7;
    if (weekday == 0 || weekday == 6) {
        return false;
    }
    return holiday_days_.count(day) == 0;
}

bool TradingCalendar::is_trading_day(const Timestamp& ts) const {
    return is_trading_day_index(exchange_day(ts));
}

int TradingCalendar::trading_days_between(const Timestamp& entry, const Timestamp& now) const {
    long first = exchange_day(entry);
    long last = exchange_day(now);

    int count = 0;
    for (long day = first + 1; day <= last; ++day) {
        if (is_trading_day_index(day)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> TradingCalendar::holidays() const {
    std::vector<std::string> dates;
    dates.reserve(holiday_days_.size());
    for (long day : holiday_days_) {
        dates.push_back(format_day(day));
    }
    return dates;
}

}  // namespace paper_ngin
