// include/paper_ngin/storage/json_state_store.hpp
#pragma once

#include <string>
#include "paper_ngin/storage/state_store.hpp"

namespace paper_ngin {

/**
 * @brief Stores a portfolio as one pretty-printed JSON document
 *
 * Writes go to "<path>.tmp" and are renamed over the target, so a crash
 * mid-write leaves the previous snapshot intact.
 */
class JsonFileStateStore : public StateStore {
public:
    explicit JsonFileStateStore(std::string path);

    Result<void> save(const PortfolioState& state) override;
    Result<std::optional<PortfolioState>> load() override;
    Result<void> clear() override;

    const std::string& path() const {
        return path_;
    }

private:
    std::string path_;
};

}  // namespace paper_ngin
