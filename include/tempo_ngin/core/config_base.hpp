// include/tempo_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "tempo_ngin/core/error.hpp"

namespace tempo_ngin {

/**
 * @brief Base class for all configuration types
 * Provides common JSON serialization so a run's configuration can be
 * stored next to its result
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param j JSON object to load from
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Validate field ranges and cross-field combinations
     * @return Result indicating if the configuration is usable
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }

    /**
     * @brief Round-trip a configuration through JSON
     * @return Result indicating success or failure
     */
    Result<void> load_json(const nlohmann::json& j);
};

}  // namespace tempo_ngin
