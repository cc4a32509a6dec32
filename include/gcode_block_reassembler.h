// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_document.h"
#include "gcode_metadata_extractor.h"

#include <map>
#include <string>
#include <vector>

namespace forgepost {
namespace gcode {

/**
 * @brief Output of GCodeBlockReassembler::reassemble()
 */
struct ReassemblyResult {
    Document document;
    std::vector<std::string> synthesized_lines; ///< Vendor metadata lines added
    std::map<BlockType, size_t> section_lines;  ///< Emitted line count per canonical section
};

/**
 * @brief Emits classified blocks in FlashForge order
 *
 * Sections are written as Header (UNCLASSIFIED lines, then HEADER blocks),
 * Metadata, Config, Thumbnail, Executable. Blocks of one type keep their
 * document order and their lines are copied verbatim.
 *
 * The firmware reads print time, filament usage and layer count only from the
 * vendor-syntax comments of the Metadata section. For each of those fields
 * known from elsewhere in the file but missing there, one vendor line is
 * synthesized.
 */
class GCodeBlockReassembler {
  public:
    /**
     * @brief Fields the firmware reads, in the order they are synthesized
     */
    static const std::vector<MetadataField>& vendor_fields();

    /**
     * @brief Vendor comment label for a field ("total layers count"), or nullptr
     */
    [[nodiscard]] static const char* vendor_label(MetadataField field);

    /**
     * @brief Format a value as a vendor metadata comment
     *
     * "; filament used [mm] = 1234.50", "; total layers count = 120",
     * "; estimated printing time (normal mode) = 1h 2m 3s"
     */
    [[nodiscard]] static std::string vendor_line(const MetadataValue& value);

    /**
     * @brief Check if a line already carries the vendor label of a field
     */
    [[nodiscard]] static bool has_vendor_label(const std::string& line, MetadataField field);

    /**
     * @brief Build the output document
     *
     * @param blocks Classified blocks (after injection)
     * @param metadata Extracted fields used for synthesis
     * @param trailing_newline Whether the output ends with a newline
     */
    [[nodiscard]] ReassemblyResult reassemble(const std::vector<Block>& blocks,
                                              const MetadataMap& metadata,
                                              bool trailing_newline) const;

    /**
     * @brief Vendor lines missing from the given Metadata section lines
     */
    [[nodiscard]] std::vector<std::string>
    synthesize(const std::vector<std::string>& metadata_lines, const MetadataMap& metadata) const;
};

} // namespace gcode
} // namespace forgepost
