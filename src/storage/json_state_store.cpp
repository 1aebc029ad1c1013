// src/storage/json_state_store.cpp
#include "paper_ngin/storage/json_state_store.hpp"
#include <filesystem>
#include <fstream>
#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

namespace {
const std::string kComponent = "JsonFileStateStore";
}

JsonFileStateStore::JsonFileStateStore(std::string path) : path_(std::move(path)) {}

Result<void> JsonFileStateStore::save(const PortfolioState& state) {
    const std::filesystem::path target(path_);
    const std::filesystem::path temp(path_ + ".tmp");

    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create state directory " +
                                        target.parent_path().string() + ": " + ec.message(),
                                    kComponent);
        }
    }

    // Serialize before touching the temp file so a failure leaves nothing behind.
    std::string document;
    try {
        document = state.to_json().dump(4);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                "Failed to serialize portfolio " + state.portfolio_id + ": " +
                                    e.what(),
                                kComponent);
    }

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + temp.string() + " for writing", kComponent);
        }
        file << document << std::endl;
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp, ec);
            return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + temp.string(),
                                    kComponent);
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to replace " + path_ + ": " + ec.message(), kComponent);
    }

    TRACE("Saved portfolio " << state.portfolio_id << " to " << path_);
    return Result<void>();
}

Result<std::optional<PortfolioState>> JsonFileStateStore::load() {
    if (!std::filesystem::exists(path_)) {
        return Result<std::optional<PortfolioState>>(std::optional<PortfolioState>());
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        return make_error<std::optional<PortfolioState>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open " + path_ + " for reading", kComponent);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return make_error<std::optional<PortfolioState>>(
            ErrorCode::JSON_PARSE_ERROR, "Corrupt state file " + path_ + ": " + e.what(),
            kComponent);
    }

    auto state = PortfolioState::from_json(j);
    if (state.is_error()) {
        return forward_error<std::optional<PortfolioState>>(state);
    }
    return Result<std::optional<PortfolioState>>(
        std::optional<PortfolioState>(state.take_value()));
}

Result<void> JsonFileStateStore::clear() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to remove " + path_ + ": " + ec.message(), kComponent);
    }
    return Result<void>();
}

}  // namespace paper_ngin
