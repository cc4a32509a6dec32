// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for forgepost
 */

#include <optional>
#include <string>

namespace forgepost {

/// Process exit codes
namespace exit_code {
constexpr int SUCCESS = 0;
constexpr int CONVERSION_FAILED = 1; ///< Input left untouched
constexpr int USAGE = 2;
constexpr int IO_ERROR = 3;
} // namespace exit_code

/**
 * @brief Parsed command-line arguments
 *
 * Options left unset here fall back to the configuration file.
 */
struct CliArgs {
    std::string input_path;  ///< G-code file to convert (required)
    std::string output_path; ///< -o: write here instead of replacing the input
    std::string config_path; ///< -c: explicit configuration file

    std::optional<bool> subroutines; ///< --subroutines / --no-subroutines
    bool no_backup = false;
    bool dry_run = false; ///< Convert and report, write nothing
    bool report = false;  ///< Print the JSON report to stdout

    int verbosity = 0; ///< Number of -v flags

    std::string log_dest; ///< --log-dest override (empty = config)
    std::string log_file; ///< --log-file override (empty = config)
};

/**
 * @brief Outcome of argument parsing
 */
enum class CliParseResult {
    OK,         ///< Arguments valid, proceed with conversion
    EXIT,       ///< Help or version printed, exit successfully
    USAGE_ERROR ///< Invalid arguments, message printed to stderr
};

/**
 * @brief Parse command-line arguments
 *
 * Accepts `--opt value` and `--opt=value` forms. The single positional
 * argument is the G-code file, matching how slicers invoke post-processing
 * scripts.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 */
[[nodiscard]] CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Print usage text to stdout
 */
void print_help(const char* program_name);

} // namespace forgepost
