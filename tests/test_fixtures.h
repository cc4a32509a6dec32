// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Shared sample G-code documents and temp file fixture for forgepost unit tests
 *
 * Sample documents:
 * - orca_layout_gcode(): OrcaSlicer order (Header, Thumbnail, Executable, Metadata, Config)
 * - flashforge_layout_gcode(): the same file as forgepost writes it, M981 calls included
 * - scenario_gcode(): Executable, Header, Config with one filament start trigger
 *
 * Helpers: TempDirFixture (scratch directory), EnvGuard (scoped environment variable)
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(TempDirFixture, "Writes a file", "[file_io]") {
 *     auto path = write_file("part.gcode", test::orca_layout_gcode());
 *     ...
 * }
 * @endcode
 */

#include "gcode_document.h"

#include <filesystem>
#include <string>
#include <vector>

namespace forgepost {
namespace test {

/// 16x16 PNG preview, 176 base64 characters split over three comment lines
extern const std::vector<std::string> THUMBNAIL_PAYLOAD;

/// "; thumbnail begin 16x16 176" + payload + "; thumbnail end"
std::vector<std::string> thumbnail_image_lines();

std::string orca_layout_gcode();

std::string flashforge_layout_gcode();

std::string scenario_gcode();

/// Join lines with '\n' and a trailing newline
std::string join_lines(const std::vector<std::string>& lines);

} // namespace test
} // namespace forgepost

// ============================================================================
// TempDirFixture - isolated scratch directory per test case
// ============================================================================

/**
 * @brief Creates a unique directory under the system temp dir, removed on teardown
 */
class TempDirFixture {
  public:
    TempDirFixture();
    ~TempDirFixture();

    TempDirFixture(const TempDirFixture&) = delete;
    TempDirFixture& operator=(const TempDirFixture&) = delete;

    /// Absolute path of a file inside the temp dir
    std::string path(const std::string& name) const;

    /// Write raw bytes to a file inside the temp dir, returns its path
    std::string write_file(const std::string& name, const std::string& content) const;

    /// Read a file back as raw bytes ("" if missing)
    std::string read_file(const std::string& name) const;

    bool exists(const std::string& name) const;

    std::filesystem::path temp_dir_;
};

// ============================================================================
// EnvGuard - set or unset an environment variable for one scope
// ============================================================================

class EnvGuard {
  public:
    explicit EnvGuard(const char* name, const char* value = nullptr);
    ~EnvGuard();

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

  private:
    std::string m_name;
    std::string m_original;
    bool m_had_original{false};
};
