// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_file_io.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace forgepost {

namespace {

FileIoResult make_error(FileIoErrorCode code, const std::string& path, const std::string& tech,
                        const std::string& user) {
    FileIoResult result;
    result.code = code;
    result.path = path;
    result.technical_msg = tech;
    result.user_msg = user;
    spdlog::error("[FileIo] {}", tech);
    return result;
}

std::string errno_text() {
    return std::strerror(errno);
}

} // namespace

const char* file_io_error_code_name(FileIoErrorCode code) {
    switch (code) {
    case FileIoErrorCode::SUCCESS:
        return "success";
    case FileIoErrorCode::NOT_FOUND:
        return "not_found";
    case FileIoErrorCode::READ_FAILED:
        return "read_failed";
    case FileIoErrorCode::BACKUP_FAILED:
        return "backup_failed";
    case FileIoErrorCode::WRITE_FAILED:
        return "write_failed";
    case FileIoErrorCode::RENAME_FAILED:
        return "rename_failed";
    }
    return "unknown";
}

std::string temp_path_for(const std::string& path) {
    return path + ".forgepost.tmp";
}

FileIoResult read_document(const std::string& path, gcode::Document& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error(FileIoErrorCode::NOT_FOUND, path, "File does not exist: " + path,
                          "File " + path + " does not exist");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return make_error(FileIoErrorCode::READ_FAILED, path,
                          "Cannot open " + path + ": " + errno_text(),
                          "Could not read " + path);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return make_error(FileIoErrorCode::READ_FAILED, path, "Error reading " + path,
                          "Could not read " + path);
    }

    out = gcode::Document::split(buffer.str());
    spdlog::debug("[FileIo] Read {} lines from {}", out.line_count(), path);

    FileIoResult result;
    result.path = path;
    return result;
}

FileIoResult create_backup(const std::string& path, const std::string& suffix) {
    const std::string backup_path = path + suffix;

    std::error_code ec;
    fs::copy_file(path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return make_error(FileIoErrorCode::BACKUP_FAILED, backup_path,
                          "Cannot create backup " + backup_path + ": " + ec.message(),
                          "Could not create backup " + backup_path + "; file was not modified");
    }

    spdlog::info("[FileIo] Backup created: {}", backup_path);
    FileIoResult result;
    result.path = backup_path;
    return result;
}

FileIoResult write_document_atomic(const std::string& path, const gcode::Document& doc) {
    const std::string temp_path = temp_path_for(path);
    std::error_code ec;

    {
        std::ofstream outfile(temp_path, std::ios::binary | std::ios::trunc);
        if (!outfile.is_open()) {
            return make_error(FileIoErrorCode::WRITE_FAILED, path,
                              "Failed to create temp file " + temp_path + ": " + errno_text(),
                              "Could not write " + path);
        }

        outfile << doc.join();
        outfile.flush();
        if (!outfile.good()) {
            outfile.close();
            fs::remove(temp_path, ec);
            return make_error(FileIoErrorCode::WRITE_FAILED, path,
                              "Error writing temp file " + temp_path,
                              "Could not write " + path + " (disk full?)");
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        return make_error(FileIoErrorCode::RENAME_FAILED, path,
                          "Cannot rename " + temp_path + " to " + path + ": " + reason,
                          "Could not replace " + path);
    }

    spdlog::debug("[FileIo] Wrote {} lines to {}", doc.line_count(), path);
    FileIoResult result;
    result.path = path;
    return result;
}

} // namespace forgepost
