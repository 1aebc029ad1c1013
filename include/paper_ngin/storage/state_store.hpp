// include/paper_ngin/storage/state_store.hpp
#pragma once

#include <optional>
#include "paper_ngin/core/error.hpp"
#include "paper_ngin/portfolio/portfolio_state.hpp"

namespace paper_ngin {

/**
 * @brief Persistence collaborator for one portfolio
 *
 * save() is called after every committed mutation; a failed save keeps the
 * orchestrator on its previous state. load() returns nullopt when nothing
 * has been stored yet.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual Result<void> save(const PortfolioState& state) = 0;
    virtual Result<std::optional<PortfolioState>> load() = 0;

    /**
     * @brief Remove any stored state so the next load() starts fresh
     */
    virtual Result<void> clear() = 0;
};

}  // namespace paper_ngin
