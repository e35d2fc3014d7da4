// include/order_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "order_ngin/core/error.hpp"

namespace order_ngin {

/**
 * @brief JSON-backed settings object
 *
 * EngineConfig, RetryPolicy, LoggerConfig and SimulatedExchangeConfig derive
 * from it. from_json() reads only the keys present, so a partial file keeps
 * the defaults of every field it leaves out.
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
     * @return FILE_IO_ERROR if the file cannot be opened, JSON_PARSE_ERROR if it is not JSON
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    /**
     * @brief Convert configuration to JSON
     * @return JSON representation of the configuration
     */
    virtual nlohmann::json to_json() const = 0;

    /**
     * @brief Overwrite the fields whose keys appear in `j`
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace order_ngin
