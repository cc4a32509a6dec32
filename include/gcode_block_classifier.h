// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "conversion_error.h"
#include "gcode_document.h"

#include <optional>
#include <string>
#include <vector>

namespace forgepost {
namespace gcode {

/**
 * @brief Marker vocabulary of the source layout
 *
 * Block markers are compared against the comment body (leading ';' and
 * surrounding whitespace removed), so "; HEADER_BLOCK_START" and
 * ";HEADER_BLOCK_START  " both match. Metadata labels are compared
 * case-insensitively as a prefix of the comment body.
 *
 * Defaults describe OrcaSlicer output.
 */
struct MarkerSet {
    std::string header_start = "HEADER_BLOCK_START";
    std::string header_end = "HEADER_BLOCK_END";
    std::string config_start = "CONFIG_BLOCK_START";
    std::string config_end = "CONFIG_BLOCK_END";
    std::string thumbnail_start = "THUMBNAIL_BLOCK_START";
    std::string thumbnail_end = "THUMBNAIL_BLOCK_END";
    std::string executable_start = "EXECUTABLE_BLOCK_START";
    std::string executable_end = "EXECUTABLE_BLOCK_END";

    /// Comment labels that place a line outside marker blocks into METADATA
    std::vector<std::string> metadata_labels = {
        "filament used [mm]",
        "filament used [cm3]",
        "filament used [g]",
        "filament cost",
        "total filament used [g]",
        "total filament cost",
        "total filament change",
        "total layers count",
        "estimated printing time (normal mode)",
    };
};

/**
 * @brief State of the classifier state machine
 *
 * After an end marker the state keeps the closed block's type, so trailing
 * blank and comment lines stay with that block. Unmarked METADATA and
 * EXECUTABLE lines continue the current block only while the state matches.
 */
enum class ClassifierState {
    SCANNING,
    IN_HEADER,
    IN_METADATA,
    IN_CONFIG,
    IN_THUMBNAIL,
    IN_EXECUTABLE,
};

/**
 * @brief Output of GCodeBlockClassifier::classify()
 */
struct ClassificationResult {
    std::vector<Block> blocks; ///< Document order; empty on error
    ConversionError error;

    [[nodiscard]] bool success() const {
        return error.success();
    }

    /**
     * @brief Check if any non-empty block of the given type was found
     */
    [[nodiscard]] bool has_block(BlockType type) const;

    /**
     * @brief Total number of lines classified as the given type
     */
    [[nodiscard]] size_t line_count(BlockType type) const;
};

/**
 * @brief Partitions a G-code document into typed blocks
 *
 * Single pass over the lines. Every line lands in exactly one block and the
 * concatenation of all blocks reproduces the document.
 *
 * - A start marker opens a block; everything up to and including the matching
 *   end marker belongs to it.
 * - Outside marker blocks, metadata labels open/continue a METADATA block and
 *   any other non-comment line (instructions and macro calls) opens/continues
 *   an EXECUTABLE block.
 * - Blank and comment lines are appended to the block of the current state,
 *   or to a leading UNCLASSIFIED block when nothing has been seen yet.
 *
 * Thumbnail blocks are validated while scanning, since a damaged payload must
 * not be carried into the rewritten file.
 *
 * @code
 * GCodeBlockClassifier classifier;
 * auto result = classifier.classify(Document::split(content));
 * if (!result.success()) {
 *     spdlog::error("{}", result.error.technical_msg);
 * }
 * @endcode
 *
 * @note Thread-safe for concurrent classification of different documents.
 */
class GCodeBlockClassifier {
  public:
    explicit GCodeBlockClassifier(MarkerSet markers = {});

    /**
     * @brief Classify every line of a document
     *
     * @param doc Document to partition
     * @return Blocks in document order, or a fatal error for unterminated
     *         marker blocks and damaged thumbnails
     */
    [[nodiscard]] ClassificationResult classify(const Document& doc) const;

    /**
     * @brief Block type whose start marker this line is, if any
     */
    [[nodiscard]] std::optional<BlockType> match_start_marker(const std::string& line) const;

    /**
     * @brief Check if the line is the end marker for the given block type
     */
    [[nodiscard]] bool is_end_marker(const std::string& line, BlockType type) const;

    /**
     * @brief Check if the line carries one of the metadata labels
     */
    [[nodiscard]] bool is_metadata_line(const std::string& line) const;

    [[nodiscard]] static const char* state_name(ClassifierState state);

  private:
    MarkerSet markers_;
    std::vector<std::string> metadata_labels_lower_;
};

} // namespace gcode
} // namespace forgepost
