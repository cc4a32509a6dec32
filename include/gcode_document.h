// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace forgepost {
namespace gcode {

/**
 * @brief Semantic type of a run of G-code lines
 *
 * The declaration order of the first five values is the canonical output order
 * expected by FlashForge firmware. UNCLASSIFIED lines are emitted with HEADER.
 */
enum class BlockType {
    HEADER,      ///< Slicer preamble (HEADER_BLOCK_START..END)
    METADATA,    ///< Filament usage, layer count, print time comments
    CONFIG,      ///< Full slicer settings dump (CONFIG_BLOCK_START..END)
    THUMBNAIL,   ///< Base64 encoded preview images (THUMBNAIL_BLOCK_START..END)
    EXECUTABLE,  ///< Instructions that drive the machine
    UNCLASSIFIED ///< Lines seen before any recognized content
};

/// Canonical FlashForge order (UNCLASSIFIED is folded into HEADER)
inline constexpr std::array<BlockType, 5> CANONICAL_ORDER = {
    BlockType::HEADER, BlockType::METADATA, BlockType::CONFIG, BlockType::THUMBNAIL,
    BlockType::EXECUTABLE};

/**
 * @brief Position of a block type in the canonical output order
 *
 * UNCLASSIFIED ranks with HEADER.
 */
[[nodiscard]] int canonical_rank(BlockType type);

/**
 * @brief Lowercase name used in logs and reports ("header", "thumbnail", ...)
 */
[[nodiscard]] const char* block_type_name(BlockType type);

/**
 * @brief A contiguous run of lines of one semantic type
 */
struct Block {
    BlockType type = BlockType::UNCLASSIFIED;
    std::vector<std::string> lines;
    size_t first_line = 0;        ///< 1-indexed source line of lines[0] (0 if synthesized)
    bool has_start_marker = false; ///< Opened by an explicit *_BLOCK_START marker
    bool terminated = false;       ///< Explicit marker block closed by its *_BLOCK_END

    [[nodiscard]] bool empty() const {
        return lines.empty();
    }
};

/**
 * @brief Whole G-code file as an ordered list of lines
 *
 * split() and join() are exact inverses: lines keep every byte except the '\n'
 * separator (a trailing '\r' stays part of the line), and the presence of a
 * final newline is remembered separately.
 */
struct Document {
    std::vector<std::string> lines;
    bool trailing_newline = false;

    /**
     * @brief Split raw file content into a Document
     */
    [[nodiscard]] static Document split(const std::string& content);

    /**
     * @brief Serialize back to raw file content
     */
    [[nodiscard]] std::string join() const;

    [[nodiscard]] size_t line_count() const {
        return lines.size();
    }

    bool operator==(const Document& other) const {
        return trailing_newline == other.trailing_newline && lines == other.lines;
    }
    bool operator!=(const Document& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Line helpers shared by the pipeline stages
// ============================================================================

/**
 * @brief Strip leading/trailing spaces, tabs and carriage returns
 */
[[nodiscard]] std::string trim_copy(const std::string& s);

/**
 * @brief ASCII lowercase copy
 */
[[nodiscard]] std::string to_lower_copy(const std::string& s);

/**
 * @brief Comment text with the leading ';' and surrounding whitespace removed
 *
 * Returns an empty string for lines that are not comments.
 */
[[nodiscard]] std::string comment_body(const std::string& line);

/**
 * @brief Check if a line is a G-code instruction (G/M/T word first)
 *
 * Matches "G1 X10", "M104 S200", "T0", with optional leading whitespace and an
 * optional "N123" line number word. Comments, blank lines and macro calls are
 * not instructions.
 */
[[nodiscard]] bool is_instruction_line(const std::string& line);

/**
 * @brief Check if a line is something the firmware executes
 *
 * True for any line that is neither blank nor a ';' comment: instructions as
 * well as macro calls such as "START_PRINT" or "END_PRINT".
 */
[[nodiscard]] bool is_command_line(const std::string& line);

/**
 * @brief Count instruction lines in a range of lines
 */
[[nodiscard]] size_t count_instruction_lines(const std::vector<std::string>& lines);

} // namespace gcode
} // namespace forgepost
