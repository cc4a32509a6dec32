// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_document.h"

#include <cstddef>
#include <string>

namespace forgepost {

/**
 * @brief Conversion outcome codes
 *
 * Everything except SUCCESS is fatal: the conversion produces no output and the
 * caller must leave the original file untouched.
 */
enum class ConversionErrorCode {
    SUCCESS = 0,         ///< Conversion completed
    UNTERMINATED_BLOCK,  ///< A *_BLOCK_START marker has no matching *_BLOCK_END
    CORRUPT_THUMBNAIL,   ///< Thumbnail payload damaged or truncated
    INVARIANT_VIOLATION, ///< Output would lose or duplicate input lines
};

/**
 * @brief Detailed error information for a failed conversion
 */
struct ConversionError {
    ConversionErrorCode code;  ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< Message suitable for the slicer's script console
    size_t line_number = 0;    ///< 1-indexed source line involved (0 if N/A)

    ConversionError(ConversionErrorCode c = ConversionErrorCode::SUCCESS,
                    const std::string& tech = "", const std::string& user = "", size_t line = 0)
        : code(c), technical_msg(tech), user_msg(user), line_number(line) {}

    [[nodiscard]] bool success() const {
        return code == ConversionErrorCode::SUCCESS;
    }

    operator bool() const {
        return success();
    }
};

/**
 * @brief Lowercase identifier for an error code ("unterminated_block", ...)
 */
[[nodiscard]] const char* conversion_error_code_name(ConversionErrorCode code);

/**
 * @brief Factory methods for the fatal conditions detected during conversion
 */
class ConversionErrorHelper {
  public:
    static ConversionError success() {
        return ConversionError(ConversionErrorCode::SUCCESS);
    }

    /**
     * @brief Marker block still open at end of input
     * @param type Block type whose end marker is missing
     * @param start_line Line of the start marker
     */
    static ConversionError unterminated_block(gcode::BlockType type, size_t start_line) {
        return ConversionError(ConversionErrorCode::UNTERMINATED_BLOCK,
                               std::string(gcode::block_type_name(type)) +
                                   " block starting at line " + std::to_string(start_line) +
                                   " has no end marker",
                               "G-code file appears truncated; it was not modified", start_line);
    }

    /**
     * @brief Thumbnail data that cannot be carried over safely
     * @param detail What was wrong with the payload
     * @param line Offending line
     */
    static ConversionError corrupt_thumbnail(const std::string& detail, size_t line) {
        return ConversionError(ConversionErrorCode::CORRUPT_THUMBNAIL,
                               detail + " (line " + std::to_string(line) + ")",
                               "Thumbnail data in the G-code file is damaged; it was not modified",
                               line);
    }

    /**
     * @brief Reassembled output does not account for every input line
     */
    static ConversionError invariant_violation(const std::string& detail) {
        return ConversionError(ConversionErrorCode::INVARIANT_VIOLATION, detail,
                               "Internal conversion check failed; the file was not modified");
    }
};

} // namespace forgepost
