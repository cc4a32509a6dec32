// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_document.h"

#include <string>
#include <vector>

namespace forgepost {
namespace gcode {

/**
 * @brief Trigger comments and the subroutine calls placed after them
 *
 * Defaults enable the FlashForge spaghetti detector (M981) for the duration
 * of each filament's G-code.
 */
struct InjectionRules {
    std::string start_trigger = "; filament start gcode";
    std::string end_trigger = "; filament end gcode";
    std::string start_call = "M981 S1 P20000 ; Enable spaghetti detector";
    std::string end_call = "M981 S0 P20000 ; Disable spaghetti detector";
};

/**
 * @brief Which trigger a subroutine marker matched
 */
enum class SubroutineKind {
    START,
    END,
};

/**
 * @brief Trigger comment found inside an EXECUTABLE block
 */
struct SubroutineMarker {
    SubroutineKind kind;
    size_t block_index; ///< Index into the block list
    size_t line_index;  ///< Index of the trigger line within the block
    bool already_present = false;
};

/**
 * @brief Outcome of injecting into a block list
 */
struct InjectionResult {
    std::vector<SubroutineMarker> markers;
    size_t injected = 0;        ///< Call lines inserted
    size_t already_present = 0; ///< Triggers already followed by their call
    std::vector<std::string> inserted_lines;
};

/**
 * @brief Inserts vendor subroutine calls after filament-change comments
 *
 * Only EXECUTABLE blocks are scanned. A trigger matches as a case-insensitive
 * substring of the trimmed line. The call goes on the line right after the
 * trigger unless that line already issues the same command, which keeps
 * repeated runs from stacking calls.
 *
 * Lines are only ever inserted; nothing is removed or reordered.
 */
class GCodeSubroutineInjector {
  public:
    explicit GCodeSubroutineInjector(InjectionRules rules = {});

    /**
     * @brief Locate trigger comments without modifying anything
     */
    [[nodiscard]] std::vector<SubroutineMarker>
    find_markers(const std::vector<Block>& blocks) const;

    /**
     * @brief Insert calls into the EXECUTABLE blocks in place
     */
    InjectionResult inject(std::vector<Block>& blocks) const;

    /**
     * @brief Check if two lines issue the same command
     *
     * Trailing comments, surrounding whitespace and case are ignored:
     * "M981 S1 P20000" matches "m981 s1 p20000 ; Enable spaghetti detector".
     */
    [[nodiscard]] static bool same_command(const std::string& a, const std::string& b);

    [[nodiscard]] const InjectionRules& rules() const {
        return rules_;
    }

  private:
    InjectionRules rules_;
    std::string start_trigger_lower_;
    std::string end_trigger_lower_;
};

} // namespace gcode
} // namespace forgepost
