#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "../portfolio/test_helpers.hpp"
#include "paper_ngin/core/trading_calendar.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class TradingCalendarTest : public TestBase {
protected:
    Timestamp at(const std::string& iso) {
        return *core::parse_timestamp(iso);
    }
};

TEST_F(TradingCalendarTest, WeekendsAreNotTradingDays) {
    TradingCalendar calendar;
    EXPECT_TRUE(calendar.is_trading_day(at("2024-11-08T04:00:00Z")));   // Friday
    EXPECT_FALSE(calendar.is_trading_day(at("2024-11-09T04:00:00Z")));  // Saturday
    EXPECT_FALSE(calendar.is_trading_day(at("2024-11-10T04:00:00Z")));  // Sunday
}

TEST_F(TradingCalendarTest, UsesExchangeDate) {
    TradingCalendar calendar;
    // 20:00Z Friday is 01:30 IST Saturday
    EXPECT_FALSE(calendar.is_trading_day(at("2024-11-08T20:00:00Z")));
}

TEST_F(TradingCalendarTest, CountsDaysAfterEntry) {
    TradingCalendar calendar;
    EXPECT_EQ(calendar.trading_days_between(monday_open(), monday_open()), 0);
    EXPECT_EQ(calendar.trading_days_between(monday_open(), monday_open() + std::chrono::hours(5)),
              0);
    EXPECT_EQ(calendar.trading_days_between(monday_open(), trading_days_later(4)), 4);
    EXPECT_EQ(calendar.trading_days_between(monday_open(), trading_days_later(5)), 5);
    EXPECT_EQ(calendar.trading_days_between(monday_open(), trading_days_later(15)), 15);
}

TEST_F(TradingCalendarTest, HolidaysAreSkipped) {
    TradingCalendar calendar({"2024-11-05", "not-a-date"});
    ASSERT_EQ(calendar.holidays().size(), 1u);
    EXPECT_EQ(calendar.holidays().front(), "2024-11-05");
    EXPECT_FALSE(calendar.is_trading_day(at("2024-11-05T04:00:00Z")));
    EXPECT_EQ(calendar.trading_days_between(monday_open(), trading_days_later(4)), 3);
}

TEST_F(TradingCalendarTest, NowBeforeEntryIsZero) {
    TradingCalendar calendar;
    EXPECT_EQ(calendar.trading_days_between(trading_days_later(3), monday_open()), 0);
}

TEST_F(TradingCalendarTest, LoadsYearKeyedFile) {
    auto path = std::filesystem::temp_directory_path() / "paper_ngin_holidays.json";
    std::ofstream(path) << R"({"2024": [{"date": "2024-11-01", "name": "Diwali"},
                                        {"date": "2024-11-15", "name": "Guru Nanak Jayanti"}]})";

    TradingCalendar calendar;
    ASSERT_TRUE(calendar.load_holidays(path.string()).is_ok());
    EXPECT_EQ(calendar.holidays().size(), 2u);
    std::filesystem::remove(path);
}

TEST_F(TradingCalendarTest, LoadsFlatArray) {
    auto path = std::filesystem::temp_directory_path() / "paper_ngin_holidays_flat.json";
    std::ofstream(path) << R"(["2025-01-26", "2025-03-14"])";

    TradingCalendar calendar;
    ASSERT_TRUE(calendar.load_holidays(path.string()).is_ok());
    EXPECT_EQ(calendar.holidays().size(), 2u);
    std::filesystem::remove(path);
}

TEST_F(TradingCalendarTest, MissingHolidayFile) {
    TradingCalendar calendar;
    auto result = calendar.load_holidays("/nonexistent/holidays.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}
