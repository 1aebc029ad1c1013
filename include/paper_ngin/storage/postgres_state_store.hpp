// include/paper_ngin/storage/postgres_state_store.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "paper_ngin/storage/state_store.hpp"

namespace paper_ngin {

/**
 * @brief PostgreSQL-backed state store
 *
 * Tables (created on connect if missing):
 *   paper_trading.portfolio_state(portfolio_id PK, state jsonb, updated_at)
 *   paper_trading.trade_records(id, portfolio_id, symbol, ..., exit_time)
 *
 * Each save upserts the snapshot and appends the trade records produced since
 * the previous save in a single transaction.
 */
class PostgresStateStore : public StateStore {
public:
    PostgresStateStore(std::string connection_string, std::string portfolio_id);
    ~PostgresStateStore() override;

    PostgresStateStore(const PostgresStateStore&) = delete;
    PostgresStateStore& operator=(const PostgresStateStore&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<void> save(const PortfolioState& state) override;
    Result<std::optional<PortfolioState>> load() override;
    Result<void> clear() override;

private:
    Result<void> validate_connection() const;
    Result<void> ensure_schema();

    std::string connection_string_;
    std::string portfolio_id_;
    std::unique_ptr<pqxx::connection> connection_;
    size_t persisted_trades_{0};
    mutable std::mutex mutex_;
};

}  // namespace paper_ngin
