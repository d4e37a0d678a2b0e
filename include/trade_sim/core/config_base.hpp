// include/trade_sim/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "trade_sim/core/error.hpp"

namespace trade_sim {

/**
 * @brief Base class for all configuration types
 *
 * Provides JSON file persistence and whole-configuration validation.
 * Derived configurations append their violated constraints in validate();
 * nested configurations forward to their members' validate().
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
     *
     * The loaded values are validated; a file describing an invalid
     * configuration yields a ValidationError listing every violation.
     * @param filepath Path to the file
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Load configuration from JSON
     * @param json JSON object to load from
     */
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Append one message per violated constraint
     */
    virtual void validate(std::vector<std::string>& violations) const;

    /**
     * @brief Every violated constraint, empty when the configuration is valid
     */
    std::vector<std::string> collect_violations() const;

    /**
     * @brief ValidationError listing all violations, if any
     * @param component Reported as the error's origin
     */
    Result<void> check(const std::string& component = "ConfigBase") const;
};

}  // namespace trade_sim
