// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace forgepost {
namespace test {

const std::vector<std::string> THUMBNAIL_PAYLOAD = {
    "; iVBORw0KGgoAAAANSUhEUgAAABAAAAAQCAYAAAAf8/9hAAAAAXNSR0IArs4c6QAA",
    "; AEJJREFUOE9jZKAQMFKon2HUAIbRMGAYDQOG0TBgGA0DhtEwYBgNA4bRMGAYDQOG",
    "; 0TBgGM0Ag2gYMIyGAQMAYbgBEQp6zCkAAAAASUVORK5CYII=",
};

std::vector<std::string> thumbnail_image_lines() {
    std::vector<std::string> lines = {"; thumbnail begin 16x16 176"};
    lines.insert(lines.end(), THUMBNAIL_PAYLOAD.begin(), THUMBNAIL_PAYLOAD.end());
    lines.push_back("; thumbnail end");
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

namespace {

std::vector<std::string> header_section() {
    return {
        "; HEADER_BLOCK_START",
        "; generated by OrcaSlicer 2.2.0 on 2025-01-15 at 10:30:00",
        "; total layer number: 120",
        "; HEADER_BLOCK_END",
        "",
    };
}

std::vector<std::string> thumbnail_section() {
    std::vector<std::string> lines = {"; THUMBNAIL_BLOCK_START", ""};
    auto image = thumbnail_image_lines();
    lines.insert(lines.end(), image.begin(), image.end());
    lines.push_back("; THUMBNAIL_BLOCK_END");
    lines.push_back("");
    return lines;
}

std::vector<std::string> executable_section(bool with_calls) {
    std::vector<std::string> lines = {
        "; EXECUTABLE_BLOCK_START",
        "M73 P0 R62",
        "G28",
        "; filament start gcode",
    };
    if (with_calls) {
        lines.push_back("M981 S1 P20000 ; Enable spaghetti detector");
    }
    lines.push_back("M104 S220");
    lines.push_back("G1 X10 Y10 E1.5");
    lines.push_back("; filament end gcode");
    if (with_calls) {
        lines.push_back("M981 S0 P20000 ; Disable spaghetti detector");
    }
    lines.push_back("M400");
    lines.push_back("; EXECUTABLE_BLOCK_END");
    return lines;
}

std::vector<std::string> metadata_section() {
    return {
        "; filament used [mm] = 1234.56",
        "; filament used [cm3] = 2.97",
        "; filament used [g] = 3.68",
        "; filament cost = 0.09",
        "; total filament used [g] = 3.68",
        "; total filament cost = 0.09",
        "; total layers count = 120",
        "; estimated printing time (normal mode) = 1h 2m 3s",
        "",
    };
}

std::vector<std::string> config_section() {
    return {
        "; CONFIG_BLOCK_START",
        "; layer_height = 0.2",
        "; nozzle_diameter = 0.4",
        "; nozzle_temperature = 220",
        "; hot_plate_temp = 60",
        "; sparse_infill_density = 15%",
        "; filament_type = PLA",
        "; printer_model = Flashforge Adventurer 5M Pro",
        "; CONFIG_BLOCK_END",
    };
}

void append(std::vector<std::string>& out, const std::vector<std::string>& lines) {
    out.insert(out.end(), lines.begin(), lines.end());
}

} // namespace

std::string orca_layout_gcode() {
    std::vector<std::string> lines;
    append(lines, header_section());
    append(lines, thumbnail_section());
    append(lines, executable_section(false));
    append(lines, metadata_section());
    append(lines, config_section());
    return join_lines(lines);
}

std::string flashforge_layout_gcode() {
    std::vector<std::string> lines;
    append(lines, header_section());
    append(lines, metadata_section());
    append(lines, config_section());
    append(lines, thumbnail_section());
    append(lines, executable_section(true));
    return join_lines(lines);
}

std::string scenario_gcode() {
    return join_lines({
        "G28",
        "; filament start gcode",
        "G1 X0 Y0 F3000",
        "; HEADER_BLOCK_START",
        "; generated by OrcaSlicer 2.2.0",
        "; HEADER_BLOCK_END",
        "; CONFIG_BLOCK_START",
        "; layer_height = 0.2",
        "; CONFIG_BLOCK_END",
    });
}

} // namespace test
} // namespace forgepost

// ============================================================================
// TempDirFixture implementation
// ============================================================================

TempDirFixture::TempDirFixture() {
    static std::atomic<int> counter{0};
    temp_dir_ = fs::temp_directory_path() /
                ("forgepost_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "_" + std::to_string(counter++));
    fs::create_directories(temp_dir_);
}

TempDirFixture::~TempDirFixture() {
    std::error_code ec;
    fs::remove_all(temp_dir_, ec);
}

std::string TempDirFixture::path(const std::string& name) const {
    return (temp_dir_ / name).string();
}

std::string TempDirFixture::write_file(const std::string& name, const std::string& content) const {
    std::string file = path(name);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
}

std::string TempDirFixture::read_file(const std::string& name) const {
    std::ifstream in(path(name), std::ios::binary);
    if (!in.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool TempDirFixture::exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(temp_dir_ / name, ec);
}

// ============================================================================
// EnvGuard implementation
// ============================================================================

EnvGuard::EnvGuard(const char* name, const char* value) : m_name(name) {
    const char* original = std::getenv(name);
    if (original) {
        m_had_original = true;
        m_original = original;
    }

    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
}

EnvGuard::~EnvGuard() {
    if (m_had_original) {
        setenv(m_name.c_str(), m_original.c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}
