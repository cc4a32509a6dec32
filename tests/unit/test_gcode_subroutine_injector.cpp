// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_block_classifier.h"
#include "gcode_subroutine_injector.h"

#include <catch2/catch_test_macros.hpp>

using namespace forgepost;
using namespace forgepost::gcode;

namespace {

const char* START_CALL = "M981 S1 P20000 ; Enable spaghetti detector";
const char* END_CALL = "M981 S0 P20000 ; Disable spaghetti detector";

std::vector<Block> blocks_of(const std::string& content) {
    GCodeBlockClassifier classifier;
    auto result = classifier.classify(Document::split(content));
    REQUIRE(result.success());
    return result.blocks;
}

const std::vector<std::string>& executable_lines(const std::vector<Block>& blocks) {
    for (const auto& block : blocks) {
        if (block.type == BlockType::EXECUTABLE) {
            return block.lines;
        }
    }
    FAIL("no executable block");
    return blocks.front().lines;
}

} // namespace

// ============================================================================
// Command comparison
// ============================================================================

TEST_CASE("GCodeSubroutineInjector - same_command", "[gcode][injector]") {
    SECTION("Trailing comments, whitespace and case are ignored") {
        REQUIRE(GCodeSubroutineInjector::same_command(START_CALL, "M981 S1 P20000"));
        REQUIRE(GCodeSubroutineInjector::same_command(START_CALL, "  m981 s1 p20000 ; other"));
    }

    SECTION("Different parameters differ") {
        REQUIRE_FALSE(GCodeSubroutineInjector::same_command(START_CALL, END_CALL));
        REQUIRE_FALSE(GCodeSubroutineInjector::same_command(START_CALL, "M981 S1 P10000"));
    }

    SECTION("Comment-only lines never match") {
        REQUIRE_FALSE(GCodeSubroutineInjector::same_command("; note", "; note"));
    }
}

// ============================================================================
// Injection
// ============================================================================

TEST_CASE("GCodeSubroutineInjector - Inserts after each trigger", "[gcode][injector]") {
    auto blocks = blocks_of("; EXECUTABLE_BLOCK_START\n"
                            "G28\n"
                            "; filament start gcode\n"
                            "G1 X0\n"
                            "; filament end gcode\n"
                            "T1\n"
                            "; filament start gcode\n"
                            "G1 X5\n"
                            "; filament end gcode\n"
                            "; EXECUTABLE_BLOCK_END\n");
    const size_t before = executable_lines(blocks).size();

    GCodeSubroutineInjector injector;
    auto result = injector.inject(blocks);

    SECTION("N start and M end triggers give N+M calls") {
        REQUIRE(result.markers.size() == 4);
        REQUIRE(result.injected == 4);
        REQUIRE(result.already_present == 0);
        REQUIRE(result.inserted_lines.size() == 4);
        REQUIRE(executable_lines(blocks).size() == before + 4);
    }

    SECTION("Each call immediately follows its trigger") {
        const auto& lines = executable_lines(blocks);
        size_t starts = 0;
        size_t ends = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (lines[i] == "; filament start gcode") {
                REQUIRE(lines[i + 1] == START_CALL);
                starts++;
            } else if (lines[i] == "; filament end gcode") {
                REQUIRE(lines[i + 1] == END_CALL);
                ends++;
            }
        }
        REQUIRE(starts == 2);
        REQUIRE(ends == 2);
    }

    SECTION("Nothing else moves") {
        const auto& lines = executable_lines(blocks);
        REQUIRE(lines.front() == "; EXECUTABLE_BLOCK_START");
        REQUIRE(lines[1] == "G28");
        REQUIRE(lines.back() == "; EXECUTABLE_BLOCK_END");
    }

    SECTION("A second pass finds every call already present") {
        auto again = injector.inject(blocks);
        REQUIRE(again.injected == 0);
        REQUIRE(again.already_present == 4);
        REQUIRE(executable_lines(blocks).size() == before + 4);
    }
}

TEST_CASE("GCodeSubroutineInjector - Trigger matching", "[gcode][injector]") {
    GCodeSubroutineInjector injector;

    SECTION("Case-insensitive substring of the trimmed line") {
        auto blocks = blocks_of("G28\n  ; FILAMENT START GCODE for PLA\nG1 X0\n");
        auto result = injector.inject(blocks);
        REQUIRE(result.injected == 1);
        REQUIRE(blocks[0].lines[2] == START_CALL);
    }

    SECTION("Triggers outside executable blocks are ignored") {
        auto blocks = blocks_of("; HEADER_BLOCK_START\n; filament start gcode\n; HEADER_BLOCK_END\n"
                                "G28\n");
        auto result = injector.inject(blocks);
        REQUIRE(result.markers.empty());
        REQUIRE(result.injected == 0);
    }

    SECTION("Trigger on the last line of a block") {
        auto blocks = blocks_of("G28\n; filament end gcode\n");
        auto result = injector.inject(blocks);
        REQUIRE(result.injected == 1);
        REQUIRE(blocks[0].lines.back() == END_CALL);
    }

    SECTION("Existing call with a different comment counts as present") {
        auto blocks = blocks_of("G28\n; filament start gcode\nM981 S1 P20000\nG1 X0\n");
        auto markers = injector.find_markers(blocks);
        REQUIRE(markers.size() == 1);
        REQUIRE(markers[0].kind == SubroutineKind::START);
        REQUIRE(markers[0].line_index == 1);
        REQUIRE(markers[0].already_present);

        auto result = injector.inject(blocks);
        REQUIRE(result.injected == 0);
        REQUIRE(result.already_present == 1);
        REQUIRE(blocks[0].lines.size() == 4);
    }

    SECTION("No triggers, no changes") {
        auto blocks = blocks_of("G28\nG1 X0\n");
        auto result = injector.inject(blocks);
        REQUIRE(result.markers.empty());
        REQUIRE(blocks[0].lines.size() == 2);
    }
}

TEST_CASE("GCodeSubroutineInjector - Custom rules", "[gcode][injector]") {
    InjectionRules rules;
    rules.start_trigger = "; TOOLCHANGE START";
    rules.start_call = "M900 K0.04";
    rules.end_trigger = "";

    GCodeSubroutineInjector injector(rules);
    auto blocks = blocks_of("G28\n; toolchange start\n; filament end gcode\nG1 X0\n");
    auto result = injector.inject(blocks);

    REQUIRE(result.injected == 1);
    REQUIRE(blocks[0].lines[2] == "M900 K0.04");
    REQUIRE(injector.rules().start_call == "M900 K0.04");
}
