// include/paper_ngin/core/trading_calendar.hpp
#pragma once

#include <set>
#include <string>
#include <vector>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/core/types.hpp"

namespace paper_ngin {

/**
 * @brief NSE trading-day arithmetic
 *
 * Dates are taken in exchange time (IST, UTC+05:30). A trading day is a
 * weekday that is not listed as an exchange holiday.
 */
class TradingCalendar {
public:
    TradingCalendar() = default;

    /**
     * @brief Construct with a holiday list
     * @param holidays Dates in "YYYY-MM-DD" form; malformed entries are skipped
     */
    explicit TradingCalendar(const std::vector<std::string>& holidays);

    /**
     * @brief Load holidays from a JSON file
     * Accepts either a flat array of date strings or an object keyed by year
     * whose values are arrays of {"date": "...", "name": "..."} records.
     */
    Result<void> load_holidays(const std::string& json_path);

    Result<void> add_holiday(const std::string& date);

    bool is_trading_day(const Timestamp& ts) const;

    /**
     * @brief Trading days elapsed after the entry date, up to and including
     * the date of `now`. Zero on the entry day itself or if now < entry.
     */
    int trading_days_between(const Timestamp& entry, const Timestamp& now) const;

    std::vector<std::string> holidays() const;

private:
    static long exchange_day(const Timestamp& ts);
    bool is_trading_day_index(long day) const;

    std::set<long> holiday_days_;
};

}  // namespace paper_ngin
