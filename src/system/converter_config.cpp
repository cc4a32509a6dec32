// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "converter_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace forgepost {

bool ConverterConfig::load(const std::string& config_path) {
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        spdlog::debug("[Config] No config at {}, using defaults", config_path);
        return false;
    }

    std::ifstream in(config_path);
    if (!in.is_open()) {
        spdlog::error("[Config] Cannot open {}, using defaults", config_path);
        return false;
    }

    spdlog::debug("[Config] Loading config from {}", config_path);
    try {
        json parsed = json::parse(in);
        if (!parsed.is_object()) {
            spdlog::error("[Config] {} is not a JSON object, using defaults", config_path);
            return false;
        }
        data = std::move(parsed);
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        spdlog::warn("[Config] Config file is corrupt, using defaults");
        return false;
    }

    path = config_path;
    return true;
}

bool ConverterConfig::load_from_string(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            spdlog::error("[Config] Configuration is not a JSON object");
            return false;
        }
        data = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse configuration: {}", e.what());
        return false;
    }
}

gcode::ConversionOptions ConverterConfig::conversion_options() const {
    gcode::ConversionOptions options;
    const gcode::InjectionRules defaults;

    options.inject_subroutines = get<bool>("/subroutines/enabled", true);
    options.injection.start_trigger =
        get<std::string>("/subroutines/start_trigger", defaults.start_trigger);
    options.injection.end_trigger =
        get<std::string>("/subroutines/end_trigger", defaults.end_trigger);
    options.injection.start_call = get<std::string>("/subroutines/start_call", defaults.start_call);
    options.injection.end_call = get<std::string>("/subroutines/end_call", defaults.end_call);
    options.verify_output = get<bool>("/verify_output", true);
    return options;
}

bool ConverterConfig::backup_enabled() const {
    return get<bool>("/backup/enabled", true);
}

std::string ConverterConfig::backup_suffix() const {
    std::string suffix = get<std::string>("/backup/suffix", ".backup");
    if (suffix.empty()) {
        spdlog::warn("[Config] Empty backup suffix would overwrite the input, using .backup");
        return ".backup";
    }
    return suffix;
}

std::string ConverterConfig::log_level() const {
    return get<std::string>("/log/level", "info");
}

std::string ConverterConfig::log_dest() const {
    return get<std::string>("/log/dest", "console");
}

std::string ConverterConfig::log_file() const {
    return get<std::string>("/log/file", "");
}

std::optional<std::string> ConverterConfig::find_config_file(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }

    std::error_code ec;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        std::string candidate = std::string(xdg) + "/forgepost/config.json";
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        std::string candidate = std::string(home) + "/.config/forgepost/config.json";
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }

    return std::nullopt;
}

} // namespace forgepost
