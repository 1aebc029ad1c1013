// src/storage/postgres_state_store.cpp
#include "paper_ngin/storage/postgres_state_store.hpp"
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/time_utils.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "PostgresStateStore";
}

PostgresStateStore::PostgresStateStore(std::string connection_string, std::string portfolio_id)
    : connection_string_(std::move(connection_string)),
      portfolio_id_(std::move(portfolio_id)),
      connection_(nullptr) {}

PostgresStateStore::~PostgresStateStore() {
    disconnect();
}

Result<void> PostgresStateStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", kComponent);
        }
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()), kComponent);
    }

    auto schema = ensure_schema();
    if (schema.is_error()) {
        return schema;
    }

    INFO("Connected state store for portfolio " << portfolio_id_);
    return Result<void>();
}

void PostgresStateStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected state store for portfolio " << portfolio_id_);
    }
}

bool PostgresStateStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresStateStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                kComponent);
    }
    return Result<void>();
}

Result<void> PostgresStateStore::ensure_schema() {
    try {
        pqxx::work txn(*connection_);
        txn.exec("CREATE SCHEMA IF NOT EXISTS paper_trading");
        txn.exec(
            "CREATE TABLE IF NOT EXISTS paper_trading.portfolio_state ("
            "portfolio_id TEXT PRIMARY KEY, "
            "state JSONB NOT NULL, "
            "updated_at TIMESTAMPTZ NOT NULL DEFAULT now())");
        txn.exec(
            "CREATE TABLE IF NOT EXISTS paper_trading.trade_records ("
            "id BIGSERIAL PRIMARY KEY, "
            "portfolio_id TEXT NOT NULL, "
            "symbol TEXT NOT NULL, "
            "strategy_class TEXT NOT NULL, "
            "signal_type TEXT NOT NULL, "
            "entry_price DOUBLE PRECISION NOT NULL, "
            "exit_price DOUBLE PRECISION NOT NULL, "
            "shares BIGINT NOT NULL, "
            "pnl DOUBLE PRECISION NOT NULL, "
            "pnl_pct DOUBLE PRECISION NOT NULL, "
            "exit_reason TEXT NOT NULL, "
            "entry_time TIMESTAMPTZ NOT NULL, "
            "exit_time TIMESTAMPTZ NOT NULL, "
            "holding_periods INTEGER NOT NULL, "
            "quality_score DOUBLE PRECISION NOT NULL)");
        txn.commit();
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to create paper_trading schema: " + std::string(e.what()),
                                kComponent);
    }
}

Result<void> PostgresStateStore::save(const PortfolioState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    const auto& history = state.positions.trade_history();
    if (history.size() < persisted_trades_) {
        // history shrank: the portfolio was reset
        persisted_trades_ = 0;
    }

    try {
        pqxx::work txn(*connection_);

        txn.exec_params(
            "INSERT INTO paper_trading.portfolio_state (portfolio_id, state, updated_at) "
            "VALUES ($1, $2::jsonb, now()) "
            "ON CONFLICT (portfolio_id) DO UPDATE SET state = EXCLUDED.state, "
            "updated_at = EXCLUDED.updated_at",
            portfolio_id_, state.to_json().dump());

        for (size_t i = persisted_trades_; i < history.size(); ++i) {
            const TradeRecord& t = history[i];
            txn.exec_params(
                "INSERT INTO paper_trading.trade_records (portfolio_id, symbol, strategy_class, "
                "signal_type, entry_price, exit_price, shares, pnl, pnl_pct, exit_reason, "
                "entry_time, exit_time, holding_periods, quality_score) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14)",
                portfolio_id_, t.symbol, strategy_class_to_string(t.strategy_class),
                signal_type_to_string(t.signal_type), t.entry_price, t.exit_price, t.shares, t.pnl,
                t.pnl_pct, exit_reason_to_string(t.reason), core::format_timestamp(t.entry_time),
                core::format_timestamp(t.exit_time), t.holding_periods, t.quality_score);
        }

        txn.commit();
        persisted_trades_ = history.size();
        return Result<void>();

    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to save portfolio " + portfolio_id_ + ": " + e.what(),
                                kComponent);
    }
}

Result<std::optional<PortfolioState>> PostgresStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return forward_error<std::optional<PortfolioState>>(validation);

    std::string document;
    try {
        pqxx::work txn(*connection_);
        pqxx::result rows = txn.exec_params(
            "SELECT state::text FROM paper_trading.portfolio_state WHERE portfolio_id = $1",
            portfolio_id_);
        txn.commit();

        if (rows.empty()) {
            return Result<std::optional<PortfolioState>>(std::optional<PortfolioState>());
        }
        document = rows[0][0].as<std::string>();
    } catch (const std::exception& e) {
        return make_error<std::optional<PortfolioState>>(
            ErrorCode::DATABASE_ERROR,
            "Failed to load portfolio " + portfolio_id_ + ": " + e.what(), kComponent);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(document);
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::optional<PortfolioState>>(
            ErrorCode::JSON_PARSE_ERROR, "Stored state is not valid JSON: " + std::string(e.what()),
            kComponent);
    }

    auto state = PortfolioState::from_json(j);
    if (state.is_error()) {
        return forward_error<std::optional<PortfolioState>>(state);
    }
    persisted_trades_ = state.value().positions.trade_history().size();
    return Result<std::optional<PortfolioState>>(
        std::optional<PortfolioState>(state.take_value()));
}

Result<void> PostgresStateStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error())
        return validation;

    try {
        pqxx::work txn(*connection_);
        txn.exec_params("DELETE FROM paper_trading.portfolio_state WHERE portfolio_id = $1",
                        portfolio_id_);
        txn.commit();
        persisted_trades_ = 0;
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to clear portfolio " + portfolio_id_ + ": " + e.what(),
                                kComponent);
    }
}

}  // namespace paper_ngin
