#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "../core/test_base.hpp"
#include "paper_ngin/ledger/capital_ledger.hpp"

using namespace paper_ngin;
using namespace paper_ngin::testing;

class CapitalLedgerTest : public TestBase {};

TEST_F(CapitalLedgerTest, ReserveMovesCashToCommitted) {
    CapitalLedger ledger(100000.0);
    ASSERT_TRUE(ledger.reserve(25000.0).is_ok());

    EXPECT_DOUBLE_EQ(ledger.available(), 75000.0);
    EXPECT_DOUBLE_EQ(ledger.committed(), 25000.0);
    EXPECT_DOUBLE_EQ(ledger.equity(), 100000.0);
}

TEST_F(CapitalLedgerTest, ReserveBeyondAvailableFailsCleanly) {
    CapitalLedger ledger(10000.0);
    auto result = ledger.reserve(10000.01 + 1.0);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(ledger.available(), 10000.0);
    EXPECT_DOUBLE_EQ(ledger.committed(), 0.0);
}

TEST_F(CapitalLedgerTest, ReserveExactBalance) {
    CapitalLedger ledger(5000.0);
    ASSERT_TRUE(ledger.reserve(5000.0).is_ok());
    EXPECT_DOUBLE_EQ(ledger.available(), 0.0);
}

TEST_F(CapitalLedgerTest, RoundingDustIsZeroedAndLogged) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::CONSOLE;
    Logger::instance().initialize(config);

    std::stringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());

    CapitalLedger ledger(1000.0);
    auto reserved = ledger.reserve(1000.0 + 5e-7);
    ledger.release(1000.0, 1000.0 + 1e-6);
    std::cout.rdbuf(original);

    ASSERT_TRUE(reserved.is_ok());
    EXPECT_EQ(ledger.available(), 1000.0);
    EXPECT_EQ(ledger.committed(), 0.0);
    EXPECT_NE(captured.str().find("overdrew available capital"), std::string::npos);
    EXPECT_NE(captured.str().find("overdrew committed capital"), std::string::npos);
}

TEST_F(CapitalLedgerTest, ReleaseRealizesProfit) {
    CapitalLedger ledger(100000.0);
    ASSERT_TRUE(ledger.reserve(10000.0).is_ok());

    ledger.release(11000.0, 10000.0);

    EXPECT_DOUBLE_EQ(ledger.available(), 101000.0);
    EXPECT_DOUBLE_EQ(ledger.committed(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 1000.0);
    EXPECT_DOUBLE_EQ(ledger.peak_equity(), 101000.0);
}

TEST_F(CapitalLedgerTest, ConservationAcrossPartialReleases) {
    CapitalLedger ledger(50000.0);
    ASSERT_TRUE(ledger.reserve(10000.0).is_ok());

    ledger.release(4120.0, 4000.0);  // 40 shares at 103 vs 100
    ledger.release(4320.0, 4000.0);  // 40 shares at 108
    ledger.release(2240.0, 2000.0);  // 20 shares at 112

    EXPECT_DOUBLE_EQ(ledger.committed(), 0.0);
    EXPECT_NEAR(ledger.equity(), 50000.0 + ledger.realized_pnl(), 1e-9);
    EXPECT_NEAR(ledger.realized_pnl(), 680.0, 1e-9);
}

TEST_F(CapitalLedgerTest, DrawdownFromPeak) {
    CapitalLedger ledger(100000.0);
    ASSERT_TRUE(ledger.reserve(20000.0).is_ok());
    ledger.release(12000.0, 20000.0);

    EXPECT_NEAR(ledger.drawdown(), 0.08, 1e-12);
    EXPECT_DOUBLE_EQ(ledger.peak_equity(), 100000.0);
}

TEST_F(CapitalLedgerTest, NegativeAmountsAreInvariantViolations) {
    CapitalLedger ledger(1000.0);
    try {
        (void)ledger.reserve(-1.0);
        FAIL() << "negative reservation accepted";
    } catch (const TradeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVARIANT_VIOLATION);
    }
    EXPECT_THROW(ledger.release(-5.0, 0.0), TradeError);
}

TEST_F(CapitalLedgerTest, OverReleaseIsInvariantViolation) {
    CapitalLedger ledger(1000.0);
    ASSERT_TRUE(ledger.reserve(100.0).is_ok());
    EXPECT_THROW(ledger.release(150.0, 150.0), TradeError);
}

TEST_F(CapitalLedgerTest, JsonRestoreValidatesBalances) {
    CapitalLedger ledger(1000.0);
    ASSERT_TRUE(ledger.reserve(400.0).is_ok());

    auto restored = CapitalLedger::from_json(ledger.to_json());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_DOUBLE_EQ(restored.value().available(), 600.0);
    EXPECT_DOUBLE_EQ(restored.value().committed(), 400.0);

    auto negative = CapitalLedger::from_json({{"available", -1.0}, {"committed", 0.0}});
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error()->code(), ErrorCode::INVALID_DATA);
}
