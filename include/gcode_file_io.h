// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_document.h"

#include <string>

namespace forgepost {

/**
 * @brief File operation outcome codes
 */
enum class FileIoErrorCode {
    SUCCESS = 0,
    NOT_FOUND,     ///< Input file does not exist
    READ_FAILED,   ///< Could not open or read the input
    BACKUP_FAILED, ///< Could not write the backup copy
    WRITE_FAILED,  ///< Could not write the temporary output
    RENAME_FAILED, ///< Could not move the temporary output into place
};

/**
 * @brief Result of a file operation
 */
struct FileIoResult {
    FileIoErrorCode code = FileIoErrorCode::SUCCESS;
    std::string technical_msg;
    std::string user_msg;
    std::string path; ///< File the operation was about

    [[nodiscard]] bool success() const {
        return code == FileIoErrorCode::SUCCESS;
    }

    operator bool() const {
        return success();
    }
};

[[nodiscard]] const char* file_io_error_code_name(FileIoErrorCode code);

/**
 * @brief Read a whole G-code file
 *
 * @param path File to read
 * @param out Receives the document on success
 */
[[nodiscard]] FileIoResult read_document(const std::string& path, gcode::Document& out);

/**
 * @brief Copy a file byte for byte to `path + suffix`
 *
 * An existing backup is overwritten. On success the result's path is the
 * backup file.
 */
[[nodiscard]] FileIoResult create_backup(const std::string& path, const std::string& suffix);

/**
 * @brief Replace a file's content atomically
 *
 * Writes `<path>.forgepost.tmp` next to the target and renames it over the
 * target. On any failure the temporary file is removed and the target is left
 * as it was.
 */
[[nodiscard]] FileIoResult write_document_atomic(const std::string& path,
                                                 const gcode::Document& doc);

/**
 * @brief Temporary sibling used by write_document_atomic()
 */
[[nodiscard]] std::string temp_path_for(const std::string& path);

} // namespace forgepost
