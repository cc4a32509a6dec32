// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "converter_config.h"
#include "gcode_converter.h"
#include "gcode_document.h"

#include <iostream>
#include <string>

namespace forgepost {

/**
 * @brief Command-line entry point
 *
 * Phases, in order:
 * 1. Parse arguments
 * 2. Load configuration and set up logging
 * 3. Read the G-code file
 * 4. Convert in memory
 * 5. Back up and replace the file (or write --output)
 * 6. Print the report if requested
 *
 * The input file is only touched after a conversion has fully succeeded.
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    explicit Application(std::ostream& report_out = std::cout);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Run the application
     * @return Process exit code (see exit_code)
     */
    int run(int argc, char** argv);

    /**
     * @brief Run with already parsed arguments
     */
    int run(const CliArgs& args);

  private:
    void init_config();
    void init_logging();
    int write_output(const gcode::Document& input, const gcode::ConversionResult& result);
    void print_report(const gcode::ConversionResult& result);

    std::ostream& report_out_;
    CliArgs args_;
    ConverterConfig config_;
    gcode::ConversionOptions options_;

    // Filled in while running, reported by --report
    std::string written_path_;
    std::string backup_path_;
    std::string io_error_;
};

} // namespace forgepost
