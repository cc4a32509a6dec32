// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_converter.h"

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace forgepost {

using json = nlohmann::json;

/**
 * @brief Converter settings loaded from a JSON file
 *
 * Values are addressed with JSON pointers (RFC 6901). Every accessor has a
 * default, so an empty or missing file behaves like:
 *
 * ```json
 * {
 *   "subroutines": {
 *     "enabled": true,
 *     "start_trigger": "; filament start gcode",
 *     "end_trigger": "; filament end gcode",
 *     "start_call": "M981 S1 P20000 ; Enable spaghetti detector",
 *     "end_call": "M981 S0 P20000 ; Disable spaghetti detector"
 *   },
 *   "backup": { "enabled": true, "suffix": ".backup" },
 *   "log": { "level": "info", "dest": "console", "file": "" },
 *   "verify_output": true
 * }
 * ```
 */
class ConverterConfig {
  public:
    ConverterConfig() = default;

    /**
     * @brief Load configuration from a file
     *
     * A missing file leaves the defaults in place. A file that is not valid
     * JSON is reported and ignored.
     *
     * @return true if the file was read and parsed
     */
    bool load(const std::string& config_path);

    /**
     * @brief Load configuration from JSON text
     *
     * @return true if the text parsed as a JSON object
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Get a value with default fallback
     *
     * Returns default_value if the path is missing or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        try {
            json::json_pointer ptr(json_ptr);
            if (data.contains(ptr)) {
                return data.at(ptr).template get<T>();
            }
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Ignoring {}: {}", json_ptr, e.what());
        }
        return default_value;
    }

    /**
     * @brief Set a value (in memory only)
     */
    template <typename T> void set(const std::string& json_ptr, const T& v) {
        data[json::json_pointer(json_ptr)] = v;
    }

    /**
     * @brief Conversion options derived from the subroutines and verify_output keys
     */
    [[nodiscard]] gcode::ConversionOptions conversion_options() const;

    [[nodiscard]] bool backup_enabled() const;
    [[nodiscard]] std::string backup_suffix() const;
    [[nodiscard]] std::string log_level() const;
    [[nodiscard]] std::string log_dest() const;
    [[nodiscard]] std::string log_file() const;

    /**
     * @brief Path of the loaded file (empty when running on defaults)
     */
    [[nodiscard]] const std::string& get_path() const {
        return path;
    }

    /**
     * @brief Locate the configuration file
     *
     * Order: explicit path, $XDG_CONFIG_HOME/forgepost/config.json,
     * ~/.config/forgepost/config.json. An explicit path is returned even if it
     * does not exist; the default locations only when present.
     */
    [[nodiscard]] static std::optional<std::string> find_config_file(const std::string& cli_path);

  private:
    std::string path;
    json data = json::object();
};

} // namespace forgepost
