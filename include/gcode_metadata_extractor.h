// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_document.h"

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace forgepost {
namespace gcode {

/**
 * @brief Print properties recognized in slicer comments
 */
enum class MetadataField {
    ESTIMATED_TIME,
    FILAMENT_LENGTH_MM,
    FILAMENT_VOLUME_CM3,
    FILAMENT_MASS_G,
    FILAMENT_COST,
    TOTAL_FILAMENT_MASS_G,
    TOTAL_FILAMENT_COST,
    FILAMENT_CHANGE_COUNT,
    LAYER_COUNT,
    INFILL_PERCENT,
    LAYER_HEIGHT,
    NOZZLE_TEMP,
    BED_TEMP,
    PRINT_SPEED,
    NOZZLE_DIAMETER,
    FILAMENT_TYPE,
    PRINTER_MODEL,
    SLICER,
};

/**
 * @brief How a field's value text is parsed
 */
enum class MetadataKind {
    DURATION, ///< "1d 2h 3m 4s", "HH:MM:SS" or seconds -> seconds
    QUANTITY, ///< Number with optional unit, normalized to the canonical unit
    COUNT,    ///< Non-negative integer
    STRING,   ///< Trimmed text
};

/**
 * @brief One extracted field value
 */
struct MetadataValue {
    MetadataField field = MetadataField::SLICER;
    double number = 0.0;  ///< Normalized value (seconds, mm, cm3, g, ...); 0 for STRING
    std::string unit;     ///< Canonical unit ("s", "mm", "cm3", "g", "%", "C", "mm/s", "")
    std::string text;     ///< Value text for STRING fields
    std::string raw;      ///< Value text as written in the file
    size_t line = 0;      ///< 1-indexed source line

    [[nodiscard]] long long as_integer() const {
        return static_cast<long long>(number + 0.5);
    }
};

using MetadataMap = std::map<MetadataField, MetadataValue>;

/**
 * @brief Result of a metadata scan
 */
struct ExtractionResult {
    MetadataMap fields;
    std::vector<std::string> warnings; ///< Recognized labels whose value could not be parsed

    [[nodiscard]] bool has(MetadataField field) const {
        return fields.count(field) > 0;
    }

    [[nodiscard]] std::optional<MetadataValue> get(MetadataField field) const;
};

/**
 * @brief Recognition pattern for one field
 *
 * The regex is matched against the whole comment body (';' stripped) and must
 * capture the value text in group 1.
 */
struct MetadataPattern {
    MetadataField field;
    std::regex regex;
    std::string description;
};

/**
 * @brief Extracts print properties from slicer comment lines
 *
 * Scans HEADER, UNCLASSIFIED, METADATA and CONFIG blocks in document order.
 * Patterns are tried in priority order and the first match decides a line's
 * field. A field seen several times keeps its last valid value.
 *
 * Recognizes OrcaSlicer/PrusaSlicer "key = value" comments, the BambuStudio
 * header forms ("total layer number: N", "model printing time: ...; total
 * estimated time: ...") and the Cura ";TIME:" / ";LAYER_COUNT:" forms.
 *
 * Lines are never modified.
 */
class GCodeMetadataExtractor {
  public:
    GCodeMetadataExtractor();

    /**
     * @brief Extract fields from classified blocks
     *
     * EXECUTABLE and THUMBNAIL blocks are skipped.
     */
    [[nodiscard]] ExtractionResult extract(const std::vector<Block>& blocks) const;

    /**
     * @brief Extract fields from bare lines (numbered from first_line)
     */
    void extract_lines(const std::vector<std::string>& lines, size_t first_line,
                       ExtractionResult& result) const;

    [[nodiscard]] const std::vector<MetadataPattern>& patterns() const {
        return patterns_;
    }

    /**
     * @brief Snake-case key ("estimated_time", "layer_count", ...)
     */
    [[nodiscard]] static const char* field_name(MetadataField field);

    [[nodiscard]] static MetadataKind field_kind(MetadataField field);

    /**
     * @brief Whether a list value ("12.5,3.1") is summed or its first element used
     *
     * Per-extruder consumption is summed; settings take the first extruder's value.
     */
    [[nodiscard]] static bool sums_lists(MetadataField field);

    /**
     * @brief Parse a duration into seconds
     *
     * Accepts "1d 2h 3m 4s" (any subset, in order), "HH:MM:SS" and plain
     * (possibly fractional) seconds.
     */
    [[nodiscard]] static std::optional<double> parse_duration(const std::string& text);

    /**
     * @brief Format seconds the way slicers write print time ("1h 2m 3s")
     *
     * Leading zero units are omitted: 45 -> "45s", 3600 -> "1h 0m 0s".
     */
    [[nodiscard]] static std::string format_duration(double seconds);

    /**
     * @brief Parse a single value of the given field
     *
     * @return Normalized value, or nullopt when the text cannot be interpreted
     */
    [[nodiscard]] static std::optional<MetadataValue> parse_value(MetadataField field,
                                                                  const std::string& text);

  private:
    void init_default_patterns();

    std::vector<MetadataPattern> patterns_;
};

} // namespace gcode
} // namespace forgepost
