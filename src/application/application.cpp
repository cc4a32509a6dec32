// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "forgepost_version.h"
#include "gcode_file_io.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

namespace forgepost {

Application::Application(std::ostream& report_out) : report_out_(report_out) {}

int Application::run(int argc, char** argv) {
    CliArgs args;
    switch (parse_cli_args(argc, argv, args)) {
    case CliParseResult::EXIT:
        return exit_code::SUCCESS;
    case CliParseResult::USAGE_ERROR:
        return exit_code::USAGE;
    case CliParseResult::OK:
        break;
    }
    return run(args);
}

int Application::run(const CliArgs& args) {
    args_ = args;
    written_path_.clear();
    backup_path_.clear();
    io_error_.clear();

    // Console logging at CLI verbosity until the config says otherwise
    logging::LogConfig bootstrap;
    bootstrap.level = logging::apply_verbosity(spdlog::level::info, args_.verbosity);
    logging::init(bootstrap);

    init_config();
    init_logging();

    spdlog::info("[Main] forgepost {} converting G-code: {}", forgepost_version(),
                 args_.input_path);

    gcode::Document input;
    FileIoResult read = read_document(args_.input_path, input);
    if (!read) {
        spdlog::error("[Main] {}", read.user_msg);
        io_error_ = read.technical_msg;
        if (args_.report) {
            print_report(gcode::ConversionResult{});
        }
        return exit_code::IO_ERROR;
    }

    gcode::GCodeConverter converter;
    gcode::ConversionResult result = converter.convert(input, options_);
    for (const auto& warning : result.warnings) {
        spdlog::warn("[Main] {}", warning);
    }

    if (!result.success()) {
        spdlog::error("[Main] {}", result.error.user_msg);
        spdlog::error("[Main] {}: {}", conversion_error_code_name(result.error.code),
                      result.error.technical_msg);
        if (args_.report) {
            print_report(result);
        }
        return exit_code::CONVERSION_FAILED;
    }

    int code = write_output(input, result);
    if (args_.report) {
        print_report(result);
    }
    return code;
}

void Application::init_config() {
    auto config_path = ConverterConfig::find_config_file(args_.config_path);
    if (config_path) {
        bool loaded = config_.load(*config_path);
        if (!loaded && !args_.config_path.empty()) {
            spdlog::warn("[Config] Could not load {}, using defaults", *config_path);
        }
    } else {
        spdlog::debug("[Config] No configuration file found, using defaults");
    }

    options_ = config_.conversion_options();
    if (args_.subroutines) {
        options_.inject_subroutines = *args_.subroutines;
    }
}

void Application::init_logging() {
    logging::LogConfig log_config;
    log_config.level = logging::apply_verbosity(
        logging::parse_level(config_.log_level(), spdlog::level::info), args_.verbosity);

    std::string dest = args_.log_dest.empty() ? config_.log_dest() : args_.log_dest;
    auto target = logging::parse_log_target(dest);
    log_config.target = target.value_or(logging::LogTarget::Console);
    log_config.file_path = args_.log_file.empty() ? config_.log_file() : args_.log_file;

    logging::init(log_config);
    if (!target) {
        spdlog::warn("[Config] Unknown log destination '{}', logging to console", dest);
    }
}

int Application::write_output(const gcode::Document& input,
                              const gcode::ConversionResult& result) {
    if (args_.dry_run) {
        spdlog::info("[Main] Dry run: {} lines would be written ({} injected, {} synthesized)",
                     result.output_lines, result.injected, result.synthesized_lines.size());
        return exit_code::SUCCESS;
    }

    // Separate output file: the input stays as it is, no backup needed
    if (!args_.output_path.empty()) {
        FileIoResult write = write_document_atomic(args_.output_path, *result.output);
        if (!write) {
            spdlog::error("[Main] {}", write.user_msg);
            io_error_ = write.technical_msg;
            return exit_code::IO_ERROR;
        }
        written_path_ = args_.output_path;
        spdlog::info("[Main] Converted {} -> {}", args_.input_path, args_.output_path);
        return exit_code::SUCCESS;
    }

    if (!result.changed(input)) {
        spdlog::info("[Main] {} is already in FlashForge layout, nothing to do", args_.input_path);
        return exit_code::SUCCESS;
    }

    if (config_.backup_enabled() && !args_.no_backup) {
        FileIoResult backup = create_backup(args_.input_path, config_.backup_suffix());
        if (!backup) {
            spdlog::error("[Main] {}", backup.user_msg);
            io_error_ = backup.technical_msg;
            return exit_code::IO_ERROR;
        }
        backup_path_ = backup.path;
    }

    FileIoResult write = write_document_atomic(args_.input_path, *result.output);
    if (!write) {
        spdlog::error("[Main] {}", write.user_msg);
        io_error_ = write.technical_msg;
        return exit_code::IO_ERROR;
    }
    written_path_ = args_.input_path;

    spdlog::info("[Main] Successfully converted {} to Orca-FlashForge format", args_.input_path);
    if (result.injected > 0) {
        spdlog::info("[Main] Spaghetti detector commands added ({})", result.injected);
    }
    return exit_code::SUCCESS;
}

void Application::print_report(const gcode::ConversionResult& result) {
    json report = result.to_json();
    report["input"] = args_.input_path;
    report["written"] = written_path_.empty() ? json(nullptr) : json(written_path_);
    report["backup"] = backup_path_.empty() ? json(nullptr) : json(backup_path_);
    report["dry_run"] = args_.dry_run;
    report["subroutines_enabled"] = options_.inject_subroutines;
    if (!io_error_.empty()) {
        report["success"] = false;
        report["io_error"] = io_error_;
    }
    report_out_ << report.dump(2) << std::endl;
}

} // namespace forgepost
