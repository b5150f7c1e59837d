// include/signal_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/error.hpp"

namespace signal_ngin {

/**
 * @brief JSON-backed configuration
 *
 * Every engine config (overlays, weights, classifiers, models, monitor,
 * backtest, logger) derives from this. Keys missing from the input keep the
 * field's current value, so a partial file overrides only what it names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @return FILE_IO_ERROR if the file cannot be written
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @return FILE_NOT_FOUND if the file cannot be opened, JSON_PARSE_ERROR
     *         for malformed JSON
     */
    virtual Result<void> load_from_file(const std::string& filepath);
};

}  // namespace signal_ngin
