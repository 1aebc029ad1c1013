// include/paper_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "paper_ngin/core/error.hpp"

namespace paper_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common serialization, deserialization and validation hooks
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Save configuration to JSON file
     * @param filepath Path to save the file
     * @return Result indicating success or failure
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Load configuration from JSON file, then validate it
     * @param filepath Path to the file
     * @return Result indicating success or failure
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * Keys that are absent keep their current value.
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check ranges and cross-field consistency
     * @return INVALID_ARGUMENT error naming the first offending field
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace paper_ngin
