// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "conversion_error.h"
#include "gcode_block_classifier.h"
#include "gcode_block_reassembler.h"
#include "gcode_document.h"
#include "gcode_metadata_extractor.h"
#include "gcode_subroutine_injector.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace forgepost {
namespace gcode {

/**
 * @brief Per-conversion settings
 *
 * Passed explicitly to every conversion; nothing is read from global state.
 */
struct ConversionOptions {
    bool inject_subroutines = true; ///< Insert M981 calls after filament-change comments
    InjectionRules injection;
    MarkerSet markers;
    bool verify_output = true; ///< Check line conservation before returning output
};

/**
 * @brief Everything a conversion produced
 *
 * On failure `output` is empty and `error` describes the problem; the other
 * fields hold whatever was gathered before the failure.
 */
struct ConversionResult {
    ConversionError error;
    std::optional<Document> output;

    std::map<BlockType, size_t> blocks_found; ///< Input line count per block type
    MetadataMap metadata;
    std::vector<std::string> warnings;
    std::vector<std::string> synthesized_lines;
    size_t injected = 0;
    size_t already_present = 0;
    bool already_canonical = false; ///< Input blocks were already in FlashForge order
    size_t input_lines = 0;
    size_t output_lines = 0;

    [[nodiscard]] bool success() const {
        return error.success() && output.has_value();
    }

    /**
     * @brief Whether the output differs from the input
     */
    [[nodiscard]] bool changed(const Document& input) const {
        return output.has_value() && *output != input;
    }

    /**
     * @brief Machine-readable summary (used by --report)
     */
    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Rewrites an OrcaSlicer G-code document into FlashForge block order
 *
 * Pipeline: classify -> extract metadata -> inject subroutine calls (optional)
 * -> reassemble -> verify. All work happens in memory and the input is never
 * modified; the result either carries a complete output document or an error.
 *
 * Converting an already converted document returns identical bytes.
 *
 * @code
 * GCodeConverter converter;
 * auto result = converter.convert(Document::split(content), options);
 * if (result.success()) {
 *     write(result.output->join());
 * }
 * @endcode
 */
class GCodeConverter {
  public:
    /**
     * @brief Convert a document
     */
    [[nodiscard]] ConversionResult convert(const Document& input,
                                           const ConversionOptions& options = {}) const;

    /**
     * @brief Convert raw file content
     */
    [[nodiscard]] ConversionResult convert_content(const std::string& content,
                                                   const ConversionOptions& options = {}) const;

    /**
     * @brief Check that output lines are exactly the input lines plus insertions
     *
     * Compares line multisets, then Executable instruction counts.
     *
     * @param input Original document
     * @param output Reassembled document
     * @param inserted Lines added by injection and synthesis
     * @param executable_in Instruction lines in input EXECUTABLE blocks
     * @param executable_out Instruction lines in output EXECUTABLE section
     * @param injected_instructions Instruction lines among the injected calls
     */
    [[nodiscard]] static ConversionError
    verify_conservation(const Document& input, const Document& output,
                        const std::vector<std::string>& inserted, size_t executable_in,
                        size_t executable_out, size_t injected_instructions);

    /**
     * @brief Whether non-empty blocks already appear in canonical order
     */
    [[nodiscard]] static bool is_canonical_order(const std::vector<Block>& blocks);
};

} // namespace gcode
} // namespace forgepost
