// include/fund_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "fund_ngin/core/error.hpp"

namespace fund_ngin {

/**
 * @brief Base class for all configuration sections
 *
 * Sections read only the keys present in the JSON they are given, so a
 * partial document overrides defaults key by key.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the section as indented JSON, replacing the file atomically
     * @return FILE_IO_ERROR if the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read the section from a JSON file
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR or INVALID_DATA
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief from_json with type mismatches reported as INVALID_DATA
     */
    Result<void> apply_json(const nlohmann::json& j);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace fund_ngin
