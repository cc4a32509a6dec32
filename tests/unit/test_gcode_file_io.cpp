// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_file_io.h"
#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace forgepost;

// ============================================================================
// Reading
// ============================================================================

TEST_CASE_METHOD(TempDirFixture, "GCodeFileIo - read_document", "[file_io]") {
    SECTION("Reads lines and trailing newline") {
        auto file = write_file("part.gcode", "G28\r\nG1 X0\n");
        gcode::Document doc;
        auto result = read_document(file, doc);
        REQUIRE(result.success());
        REQUIRE(result.path == file);
        REQUIRE(doc.lines == std::vector<std::string>{"G28\r", "G1 X0"});
        REQUIRE(doc.trailing_newline);
    }

    SECTION("Missing file") {
        gcode::Document doc;
        auto result = read_document(path("missing.gcode"), doc);
        REQUIRE(result.code == FileIoErrorCode::NOT_FOUND);
        REQUIRE_FALSE(result.user_msg.empty());
        REQUIRE(std::string(file_io_error_code_name(result.code)) == "not_found");
    }

    SECTION("Directory is not a G-code file") {
        gcode::Document doc;
        auto result = read_document(temp_dir_.string(), doc);
        REQUIRE(result.code == FileIoErrorCode::NOT_FOUND);
    }
}

// ============================================================================
// Backups
// ============================================================================

TEST_CASE_METHOD(TempDirFixture, "GCodeFileIo - create_backup", "[file_io]") {
    SECTION("Copies the original bytes next to the file") {
        auto file = write_file("part.gcode", "G28\nM400");
        auto result = create_backup(file, ".backup");
        REQUIRE(result.success());
        REQUIRE(result.path == file + ".backup");
        REQUIRE(read_file("part.gcode.backup") == "G28\nM400");
    }

    SECTION("Existing backup is replaced") {
        auto file = write_file("part.gcode", "new");
        write_file("part.gcode.orig", "old");
        REQUIRE(create_backup(file, ".orig").success());
        REQUIRE(read_file("part.gcode.orig") == "new");
    }

    SECTION("Missing source fails") {
        auto result = create_backup(path("missing.gcode"), ".backup");
        REQUIRE(result.code == FileIoErrorCode::BACKUP_FAILED);
        REQUIRE_FALSE(exists("missing.gcode.backup"));
    }
}

// ============================================================================
// Atomic writes
// ============================================================================

TEST_CASE_METHOD(TempDirFixture, "GCodeFileIo - write_document_atomic", "[file_io]") {
    gcode::Document doc = gcode::Document::split("; HEADER_BLOCK_START\n; HEADER_BLOCK_END\nG28\n");

    SECTION("Replaces the target and leaves no temp file") {
        auto file = write_file("part.gcode", "old content");
        auto result = write_document_atomic(file, doc);
        REQUIRE(result.success());
        REQUIRE(read_file("part.gcode") == doc.join());
        REQUIRE_FALSE(exists("part.gcode.forgepost.tmp"));
    }

    SECTION("Creates a new file") {
        auto result = write_document_atomic(path("out.gcode"), doc);
        REQUIRE(result.success());
        REQUIRE(read_file("out.gcode") == doc.join());
    }

    SECTION("Missing trailing newline is preserved") {
        auto unterminated = gcode::Document::split("G28\nM400");
        REQUIRE(write_document_atomic(path("out.gcode"), unterminated).success());
        REQUIRE(read_file("out.gcode") == "G28\nM400");
    }

    SECTION("Unwritable directory fails without touching anything") {
        auto result = write_document_atomic(path("no/such/dir/out.gcode"), doc);
        REQUIRE(result.code == FileIoErrorCode::WRITE_FAILED);
        REQUIRE_FALSE(exists("no"));
    }

    SECTION("Rename onto a directory fails and cleans up") {
        std::filesystem::create_directories(temp_dir_ / "target.gcode");
        std::filesystem::create_directories(temp_dir_ / "target.gcode" / "child");
        auto result = write_document_atomic(path("target.gcode"), doc);
        REQUIRE(result.code == FileIoErrorCode::RENAME_FAILED);
        REQUIRE_FALSE(exists("target.gcode.forgepost.tmp"));
    }

    SECTION("Temp path is a sibling") {
        REQUIRE(temp_path_for("/data/part.gcode") == "/data/part.gcode.forgepost.tmp");
    }
}
