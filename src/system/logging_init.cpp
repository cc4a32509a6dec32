// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <vector>

#ifdef __linux__
#ifdef FORGEPOST_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace forgepost {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "forgepost";

bool env_set(const char* value) {
    return value && value[0] != '\0';
}

/**
 * @brief Sink for the configured target, nullptr for Console or on failure
 *
 * @param[out] problem Set when the target could not be honored as requested
 */
spdlog::sink_ptr make_target_sink(const LogConfig& config, std::string& problem) {
    switch (config.target) {
    case LogTarget::Console:
        return nullptr;

    case LogTarget::File: {
        std::string path = config.file_path.empty() ? default_log_file_path() : config.file_path;
        try {
            // spdlog creates missing parent directories
            return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, config.max_file_size, config.max_files);
        } catch (const spdlog::spdlog_ex& e) {
            problem = "Cannot open log file " + path + ": " + e.what();
            return nullptr;
        }
    }

    case LogTarget::Journal:
#ifdef FORGEPOST_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME);
#else
        problem = "Built without systemd support, journal output goes to syslog";
        [[fallthrough]];
#endif

    case LogTarget::Syslog:
#ifdef __linux__
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID, LOG_USER,
                                                               false);
#else
        problem = "syslog is not available on this platform";
        return nullptr;
#endif
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    std::string problem;
    if (auto sink = make_target_sink(config, problem)) {
        sinks.push_back(std::move(sink));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!problem.empty()) {
        spdlog::warn("[Logging] {}", problem);
    }
    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(config.target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

std::string default_log_file_path() {
    std::filesystem::path state_dir;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); env_set(xdg)) {
        state_dir = xdg;
    } else if (const char* home = std::getenv("HOME"); env_set(home)) {
        state_dir = std::filesystem::path(home) / ".local" / "state";
    } else {
        state_dir = std::filesystem::temp_directory_path();
    }
    return (state_dir / "forgepost" / "forgepost.log").string();
}

std::optional<LogTarget> parse_log_target(const std::string& name) {
    for (LogTarget target :
         {LogTarget::Console, LogTarget::File, LogTarget::Syslog, LogTarget::Journal}) {
        if (name == log_target_name(target)) {
            return target;
        }
    }
    return std::nullopt;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Console:
        return "console";
    case LogTarget::File:
        return "file";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::Journal:
        return "journal";
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& name,
                                      spdlog::level::level_enum fallback) {
    // Accepts "warn"/"warning" and "err"/"error"; unknown names come back as off
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return fallback;
    }
    return level;
}

spdlog::level::level_enum apply_verbosity(spdlog::level::level_enum base, int verbosity) {
    if (verbosity <= 0) {
        return base;
    }
    spdlog::level::level_enum wanted = verbosity == 1 ? spdlog::level::debug : spdlog::level::trace;
    return wanted < base ? wanted : base;
}

} // namespace logging
} // namespace forgepost
