// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "forgepost_version.h"
#include "logging_init.h"

#include <cstdio>
#include <cstring>
#include <string>

namespace forgepost {

namespace {

enum class ValueMatch { NO_MATCH, MATCHED, MISSING };

// Match "-s VALUE", "--long VALUE" or "--long=VALUE"
ValueMatch match_value_option(int argc, char** argv, int& i, const char* short_name,
                              const char* long_name, std::string& out) {
    const char* arg = argv[i];
    size_t long_len = std::strlen(long_name);

    if (std::strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        out = arg + long_len + 1;
        return ValueMatch::MATCHED;
    }

    bool is_short = short_name && std::strcmp(arg, short_name) == 0;
    if (!is_short && std::strcmp(arg, long_name) != 0) {
        return ValueMatch::NO_MATCH;
    }
    if (i + 1 >= argc) {
        return ValueMatch::MISSING;
    }
    out = argv[++i];
    return ValueMatch::MATCHED;
}

} // namespace

void print_help(const char* program_name) {
    printf("Usage: %s [options] <file.gcode>\n", program_name);
    printf("\nRewrites an OrcaSlicer G-code file into the block order FlashForge firmware\n");
    printf("expects, so print time and filament usage show up on the printer.\n");
    printf("\nOptions:\n");
    printf("  -o, --output <path>  Write result to <path> instead of replacing the input\n");
    printf("  -n, --dry-run        Convert in memory only, write nothing\n");
    printf("  --report             Print a JSON conversion report to stdout\n");
    printf("  --subroutines        Insert spaghetti detector calls (M981)\n");
    printf("  --no-subroutines     Do not insert spaghetti detector calls\n");
    printf("  --no-backup          Do not write <file>.backup before replacing\n");
    printf("  -c, --config <path>  Configuration file (default: "
           "$XDG_CONFIG_HOME/forgepost/config.json)\n");
    printf("  -v, --verbose        Increase verbosity (-v=debug, -vv=trace)\n");
    printf("  --log-dest <dest>    Log destination: console, file, syslog, journal\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nExit codes:\n");
    printf("  %d  success\n", exit_code::SUCCESS);
    printf("  %d  conversion failed (file left untouched)\n", exit_code::CONVERSION_FAILED);
    printf("  %d  usage error\n", exit_code::USAGE);
    printf("  %d  file read/write error\n", exit_code::IO_ERROR);
    printf("\nAs an OrcaSlicer post-processing script:\n");
    printf("  /path/to/%s;\n", program_name);
}

CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        std::string value;
        ValueMatch m;

        // Options with values
        if ((m = match_value_option(argc, argv, i, "-o", "--output", value)) !=
            ValueMatch::NO_MATCH) {
            if (m == ValueMatch::MISSING || value.empty()) {
                fprintf(stderr, "Error: -o/--output requires a path argument\n");
                return CliParseResult::USAGE_ERROR;
            }
            args.output_path = value;
        } else if ((m = match_value_option(argc, argv, i, "-c", "--config", value)) !=
                   ValueMatch::NO_MATCH) {
            if (m == ValueMatch::MISSING || value.empty()) {
                fprintf(stderr, "Error: -c/--config requires a path argument\n");
                return CliParseResult::USAGE_ERROR;
            }
            args.config_path = value;
        } else if ((m = match_value_option(argc, argv, i, nullptr, "--log-dest", value)) !=
                   ValueMatch::NO_MATCH) {
            if (m == ValueMatch::MISSING) {
                fprintf(stderr, "Error: --log-dest requires an argument\n");
                return CliParseResult::USAGE_ERROR;
            }
            if (!logging::parse_log_target(value)) {
                fprintf(stderr, "Error: invalid --log-dest value: %s\n", value.c_str());
                fprintf(stderr, "Valid values: console, file, syslog, journal\n");
                return CliParseResult::USAGE_ERROR;
            }
            args.log_dest = value;
        } else if ((m = match_value_option(argc, argv, i, nullptr, "--log-file", value)) !=
                   ValueMatch::NO_MATCH) {
            if (m == ValueMatch::MISSING || value.empty()) {
                fprintf(stderr, "Error: --log-file requires a path argument\n");
                return CliParseResult::USAGE_ERROR;
            }
            args.log_file = value;
        }
        // Simple boolean flags
        else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--dry-run") == 0) {
            args.dry_run = true;
        } else if (strcmp(arg, "--report") == 0) {
            args.report = true;
        } else if (strcmp(arg, "--subroutines") == 0) {
            args.subroutines = true;
        } else if (strcmp(arg, "--no-subroutines") == 0) {
            args.subroutines = false;
        } else if (strcmp(arg, "--no-backup") == 0) {
            args.no_backup = true;
        }
        // Verbosity
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "-vv") == 0 || strcmp(arg, "-vvv") == 0) {
            const char* p = arg;
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        }
        // Help
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return CliParseResult::EXIT;
        }
        // Version
        else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            printf("forgepost %s\n", forgepost_version());
            return CliParseResult::EXIT;
        }
        // "--" ends options
        else if (strcmp(arg, "--") == 0) {
            for (i++; i < argc; i++) {
                if (!args.input_path.empty()) {
                    fprintf(stderr, "Error: only one G-code file may be given\n");
                    return CliParseResult::USAGE_ERROR;
                }
                args.input_path = argv[i];
            }
        }
        // Positional: the G-code file
        else if (arg[0] != '-') {
            if (!args.input_path.empty()) {
                fprintf(stderr, "Error: only one G-code file may be given (got %s and %s)\n",
                        args.input_path.c_str(), arg);
                return CliParseResult::USAGE_ERROR;
            }
            args.input_path = arg;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", arg);
            fprintf(stderr, "Use --help for usage information\n");
            return CliParseResult::USAGE_ERROR;
        }
    }

    if (args.input_path.empty()) {
        fprintf(stderr, "Usage: %s [options] <file.gcode>\n", argc > 0 ? argv[0] : "forgepost");
        fprintf(stderr, "Use --help for usage information\n");
        return CliParseResult::USAGE_ERROR;
    }

    if (args.dry_run && !args.output_path.empty()) {
        fprintf(stderr, "Error: --dry-run and --output cannot be combined\n");
        return CliParseResult::USAGE_ERROR;
    }

    return CliParseResult::OK;
}

} // namespace forgepost
