// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace forgepost {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Console, ///< stderr only
    File,    ///< Rotating log file
    Syslog,  ///< syslog(3), Linux only
    Journal, ///< systemd journal; syslog when built without FORGEPOST_HAS_SYSTEMD
};

/**
 * @brief Logger setup
 *
 * The console sink writes to stderr so that stdout stays free for the
 * conversion report.
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool enable_console = true;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< LogTarget::File destination (empty = default_log_file_path())
    size_t max_file_size = 1024 * 1024;
    size_t max_files = 3;
};

/**
 * @brief Install the default spdlog logger
 *
 * A target sink that cannot be opened is reported as a warning through the
 * new logger, which then logs to the console only. Safe to call more than
 * once; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief $XDG_STATE_HOME/forgepost/forgepost.log, or ~/.local/state/forgepost/forgepost.log
 */
[[nodiscard]] std::string default_log_file_path();

/**
 * @brief Parse "console", "file", "syslog" or "journal"
 */
[[nodiscard]] std::optional<LogTarget> parse_log_target(const std::string& name);

[[nodiscard]] const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 *
 * @param fallback Returned for unrecognized names
 */
[[nodiscard]] spdlog::level::level_enum parse_level(const std::string& name,
                                                    spdlog::level::level_enum fallback);

/**
 * @brief Level after applying -v flags (-v=debug, -vv and more=trace)
 *
 * Verbosity only ever lowers the threshold.
 */
[[nodiscard]] spdlog::level::level_enum apply_verbosity(spdlog::level::level_enum base,
                                                        int verbosity);

} // namespace logging
} // namespace forgepost
