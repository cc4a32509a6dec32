// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"
#include "logging_init.h"
#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>

#include <nlohmann/json.hpp>

using namespace forgepost;
using json = nlohmann::json;

// ============================================================================
// Fixture: scratch dir, no user configuration leaking in
// ============================================================================

class ApplicationTestFixture : public TempDirFixture {
  public:
    ApplicationTestFixture()
        : xdg_("XDG_CONFIG_HOME", temp_dir_.string().c_str()),
          home_("HOME", temp_dir_.string().c_str()) {}

    CliArgs args_for(const std::string& input) const {
        CliArgs args;
        args.input_path = input;
        args.report = true;
        return args;
    }

    int run(const CliArgs& args) {
        report_.str("");
        Application app(report_);
        return app.run(args);
    }

    json report() const {
        return json::parse(report_.str());
    }

    std::ostringstream report_;

  private:
    EnvGuard xdg_;
    EnvGuard home_;
};

// ============================================================================
// In-place conversion
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Converts in place with a backup",
                 "[application]") {
    auto file = write_file("part.gcode", test::orca_layout_gcode());

    REQUIRE(run(args_for(file)) == exit_code::SUCCESS);
    REQUIRE(read_file("part.gcode") == test::flashforge_layout_gcode());
    REQUIRE(read_file("part.gcode.backup") == test::orca_layout_gcode());
    REQUIRE_FALSE(exists("part.gcode.forgepost.tmp"));

    auto j = report();
    REQUIRE(j["success"] == true);
    REQUIRE(j["input"] == file);
    REQUIRE(j["written"] == file);
    REQUIRE(j["backup"] == file + ".backup");
    REQUIRE(j["injected"] == 2);
    REQUIRE(j["subroutines_enabled"] == true);
    REQUIRE(j["dry_run"] == false);
}

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Backup can be skipped", "[application]") {
    auto file = write_file("part.gcode", test::orca_layout_gcode());
    auto args = args_for(file);
    args.no_backup = true;

    REQUIRE(run(args) == exit_code::SUCCESS);
    REQUIRE(read_file("part.gcode") == test::flashforge_layout_gcode());
    REQUIRE_FALSE(exists("part.gcode.backup"));
    REQUIRE(report()["backup"].is_null());
}

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Already converted file is left alone",
                 "[application]") {
    auto file = write_file("part.gcode", test::flashforge_layout_gcode());

    REQUIRE(run(args_for(file)) == exit_code::SUCCESS);
    REQUIRE(read_file("part.gcode") == test::flashforge_layout_gcode());
    REQUIRE_FALSE(exists("part.gcode.backup"));

    auto j = report();
    REQUIRE(j["already_canonical"] == true);
    REQUIRE(j["already_present"] == 2);
    REQUIRE(j["written"].is_null());
}

// ============================================================================
// Output modes
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Output file and dry run",
                 "[application]") {
    auto file = write_file("part.gcode", test::orca_layout_gcode());

    SECTION("--output leaves the input untouched") {
        auto args = args_for(file);
        args.output_path = path("converted.gcode");
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(read_file("converted.gcode") == test::flashforge_layout_gcode());
        REQUIRE(read_file("part.gcode") == test::orca_layout_gcode());
        REQUIRE_FALSE(exists("part.gcode.backup"));
        REQUIRE(report()["written"] == path("converted.gcode"));
    }

    SECTION("--dry-run writes nothing") {
        auto args = args_for(file);
        args.dry_run = true;
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(read_file("part.gcode") == test::orca_layout_gcode());
        REQUIRE_FALSE(exists("part.gcode.backup"));

        auto j = report();
        REQUIRE(j["dry_run"] == true);
        REQUIRE(j["output_lines"] == 42);
        REQUIRE(j["written"].is_null());
    }

    SECTION("No report unless asked") {
        auto args = args_for(file);
        args.report = false;
        args.dry_run = true;
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(report_.str().empty());
    }
}

// ============================================================================
// Subroutine switch precedence
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Subroutine switch", "[application]") {
    auto file = write_file("part.gcode", test::orca_layout_gcode());
    auto config = write_file("config.json", R"({"subroutines": {"enabled": false}})");

    SECTION("CLI disables injection") {
        auto args = args_for(file);
        args.subroutines = false;
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(read_file("part.gcode").find("M981") == std::string::npos);
        REQUIRE(report()["subroutines_enabled"] == false);
    }

    SECTION("Config disables injection") {
        auto args = args_for(file);
        args.config_path = config;
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(read_file("part.gcode").find("M981") == std::string::npos);
        REQUIRE(report()["injected"] == 0);
    }

    SECTION("CLI overrides config") {
        auto args = args_for(file);
        args.config_path = config;
        args.subroutines = true;
        REQUIRE(run(args) == exit_code::SUCCESS);
        REQUIRE(read_file("part.gcode") == test::flashforge_layout_gcode());
    }

    SECTION("Config found in XDG_CONFIG_HOME") {
        std::filesystem::create_directories(temp_dir_ / "forgepost");
        write_file("forgepost/config.json", R"({"subroutines": {"enabled": false}})");
        REQUIRE(run(args_for(file)) == exit_code::SUCCESS);
        REQUIRE(report()["subroutines_enabled"] == false);
    }
}

// ============================================================================
// Logging destination
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Log file from config", "[application]") {
    auto file = write_file("part.gcode", test::orca_layout_gcode());
    auto config = write_file("config.json", R"({"log": {"dest": "file", "file": ")" +
                                                path("forgepost.log") + R"("}})");
    auto args = args_for(file);
    args.config_path = config;
    args.dry_run = true;

    REQUIRE(run(args) == exit_code::SUCCESS);
    spdlog::default_logger()->flush();
    REQUIRE(read_file("forgepost.log").find("[Main] forgepost") != std::string::npos);

    logging::init(logging::LogConfig{});
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - Conversion failure touches nothing",
                 "[application][errors]") {
    std::string truncated = test::orca_layout_gcode();
    truncated.erase(truncated.find("; CONFIG_BLOCK_END"));
    auto file = write_file("part.gcode", truncated);
    write_file("part.gcode.backup", "previous backup");

    REQUIRE(run(args_for(file)) == exit_code::CONVERSION_FAILED);
    REQUIRE(read_file("part.gcode") == truncated);
    REQUIRE(read_file("part.gcode.backup") == "previous backup");

    auto j = report();
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"]["code"] == "unterminated_block");
}

TEST_CASE_METHOD(ApplicationTestFixture, "Application - I/O failures", "[application][errors]") {
    SECTION("Missing input") {
        REQUIRE(run(args_for(path("missing.gcode"))) == exit_code::IO_ERROR);
        auto j = report();
        REQUIRE(j["success"] == false);
        REQUIRE(j.contains("io_error"));
    }

    SECTION("Backup failure leaves the input untouched") {
        auto file = write_file("part.gcode", test::orca_layout_gcode());
        auto config = write_file("config.json", R"({"backup": {"suffix": "/sub/dir.bak"}})");
        auto args = args_for(file);
        args.config_path = config;

        REQUIRE(run(args) == exit_code::IO_ERROR);
        REQUIRE(read_file("part.gcode") == test::orca_layout_gcode());
        REQUIRE(report()["success"] == false);
    }

    SECTION("Unwritable output path") {
        auto file = write_file("part.gcode", test::orca_layout_gcode());
        auto args = args_for(file);
        args.output_path = path("no/such/dir/out.gcode");
        REQUIRE(run(args) == exit_code::IO_ERROR);
        REQUIRE(read_file("part.gcode") == test::orca_layout_gcode());
    }
}

// ============================================================================
// argv entry point
// ============================================================================

TEST_CASE_METHOD(ApplicationTestFixture, "Application - argv entry point", "[application]") {
    std::ostringstream out;
    Application app(out);

    SECTION("Help exits successfully") {
        char prog[] = "forgepost";
        char help[] = "--help";
        char* argv[] = {prog, help, nullptr};
        REQUIRE(app.run(2, argv) == exit_code::SUCCESS);
    }

    SECTION("Missing file is a usage error") {
        char prog[] = "forgepost";
        char* argv[] = {prog, nullptr};
        REQUIRE(app.run(1, argv) == exit_code::USAGE);
    }

    SECTION("Converts the file given as sole argument") {
        auto file = write_file("part.gcode", test::orca_layout_gcode());
        std::string file_arg = file;
        char prog[] = "forgepost";
        char* argv[] = {prog, file_arg.data(), nullptr};
        REQUIRE(app.run(2, argv) == exit_code::SUCCESS);
        REQUIRE(read_file("part.gcode") == test::flashforge_layout_gcode());
        REQUIRE(out.str().empty());
    }
}
