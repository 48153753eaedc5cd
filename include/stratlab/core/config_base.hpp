// include/stratlab/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "stratlab/core/error.hpp"

namespace stratlab {

/**
 * @brief JSON-backed settings shared by the logger, cost model, simulator,
 * Monte Carlo and optimizer configs
 *
 * Keys missing from a loaded document keep their defaults, so a partial file
 * only overrides what it names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to a file, indented
     * @return FILE_IO_ERROR when the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Parse a file and apply it through from_json()
     * @return FILE_NOT_FOUND, or JSON_PARSE_ERROR for malformed content
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Overwrite the fields present in j; may throw nlohmann::json::type_error
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace stratlab
