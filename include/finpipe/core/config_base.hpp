// include/finpipe/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "finpipe/core/error.hpp"

namespace finpipe {

/**
 * @brief Base class for all configuration types
 * Provides common serialization and deserialization methods
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
     * @brief Load configuration from JSON file
     * @param filepath Path to the file
     * @return FILE_NOT_FOUND when the file is missing, JSON_PARSE_ERROR when malformed
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @throws nlohmann::json::exception on type mismatches
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace finpipe
