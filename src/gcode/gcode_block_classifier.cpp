// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_block_classifier.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace forgepost {
namespace gcode {

namespace {

ClassifierState state_for(BlockType type) {
    switch (type) {
    case BlockType::HEADER:
        return ClassifierState::IN_HEADER;
    case BlockType::METADATA:
        return ClassifierState::IN_METADATA;
    case BlockType::CONFIG:
        return ClassifierState::IN_CONFIG;
    case BlockType::THUMBNAIL:
        return ClassifierState::IN_THUMBNAIL;
    case BlockType::EXECUTABLE:
        return ClassifierState::IN_EXECUTABLE;
    case BlockType::UNCLASSIFIED:
        return ClassifierState::SCANNING;
    }
    return ClassifierState::SCANNING;
}

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
}

/**
 * @brief Checks image payloads inside a THUMBNAIL block
 *
 * Slicers write each image as
 *   ; thumbnail[_PNG|_JPG|_QOI] begin WxH SIZE
 *   ; <base64 payload, wrapped>
 *   ; thumbnail[_FMT] end
 * where SIZE is the length of the base64 text. Comment and blank lines between
 * images are allowed.
 */
class ThumbnailValidator {
  public:
    void reset() {
        in_image_ = false;
        declared_size_ = 0;
        has_declared_size_ = false;
        payload_size_ = 0;
        begin_line_ = 0;
    }

    ConversionError feed(const std::string& line, size_t line_no) {
        std::string trimmed = trim_copy(line);
        if (trimmed.empty()) {
            return ConversionErrorHelper::success();
        }
        if (trimmed[0] != ';') {
            return ConversionErrorHelper::corrupt_thumbnail(
                "Non-comment line inside thumbnail block", line_no);
        }

        std::string body = comment_body(line);
        std::smatch match;

        if (std::regex_match(body, match, begin_re_)) {
            if (in_image_) {
                return ConversionErrorHelper::corrupt_thumbnail(
                    "Thumbnail starting at line " + std::to_string(begin_line_) +
                        " has no 'thumbnail end'",
                    line_no);
            }
            in_image_ = true;
            begin_line_ = line_no;
            payload_size_ = 0;
            has_declared_size_ = match[2].matched;
            declared_size_ = has_declared_size_ ? std::stoull(match[2].str()) : 0;
            return ConversionErrorHelper::success();
        }

        if (std::regex_match(body, end_re_)) {
            if (!in_image_) {
                return ConversionErrorHelper::corrupt_thumbnail(
                    "'thumbnail end' without matching 'thumbnail begin'", line_no);
            }
            in_image_ = false;
            if (has_declared_size_ && payload_size_ != declared_size_) {
                return ConversionErrorHelper::corrupt_thumbnail(
                    "Thumbnail payload is " + std::to_string(payload_size_) +
                        " characters, header declared " + std::to_string(declared_size_),
                    line_no);
            }
            return ConversionErrorHelper::success();
        }

        if (!in_image_) {
            return ConversionErrorHelper::success();
        }

        auto bad = std::find_if_not(body.begin(), body.end(), is_base64_char);
        if (bad != body.end()) {
            return ConversionErrorHelper::corrupt_thumbnail(
                "Invalid character in thumbnail payload", line_no);
        }
        payload_size_ += body.size();
        return ConversionErrorHelper::success();
    }

    ConversionError finish(size_t line_no) const {
        if (in_image_) {
            return ConversionErrorHelper::corrupt_thumbnail(
                "Thumbnail starting at line " + std::to_string(begin_line_) +
                    " has no 'thumbnail end'",
                line_no);
        }
        return ConversionErrorHelper::success();
    }

  private:
    std::regex begin_re_{R"(thumbnail(?:_[a-z0-9]+)?\s+begin\s+(\d+x\d+)(?:\s+(\d{1,12}))?.*)",
                         std::regex::icase};
    std::regex end_re_{R"(thumbnail(?:_[a-z0-9]+)?\s+end\s*)", std::regex::icase};

    bool in_image_ = false;
    bool has_declared_size_ = false;
    size_t declared_size_ = 0;
    size_t payload_size_ = 0;
    size_t begin_line_ = 0;
};

} // namespace

// ============================================================================
// ClassificationResult implementation
// ============================================================================

bool ClassificationResult::has_block(BlockType type) const {
    return std::any_of(blocks.begin(), blocks.end(),
                       [type](const Block& b) { return b.type == type && !b.empty(); });
}

size_t ClassificationResult::line_count(BlockType type) const {
    size_t count = 0;
    for (const auto& block : blocks) {
        if (block.type == type) {
            count += block.lines.size();
        }
    }
    return count;
}

// ============================================================================
// GCodeBlockClassifier implementation
// ============================================================================

GCodeBlockClassifier::GCodeBlockClassifier(MarkerSet markers) : markers_(std::move(markers)) {
    for (const auto& label : markers_.metadata_labels) {
        metadata_labels_lower_.push_back(to_lower_copy(label));
    }
}

const char* GCodeBlockClassifier::state_name(ClassifierState state) {
    switch (state) {
    case ClassifierState::SCANNING:
        return "Scanning";
    case ClassifierState::IN_HEADER:
        return "InHeader";
    case ClassifierState::IN_METADATA:
        return "InMetadata";
    case ClassifierState::IN_CONFIG:
        return "InConfig";
    case ClassifierState::IN_THUMBNAIL:
        return "InThumbnail";
    case ClassifierState::IN_EXECUTABLE:
        return "InExecutable";
    }
    return "Unknown";
}

std::optional<BlockType> GCodeBlockClassifier::match_start_marker(const std::string& line) const {
    std::string body = comment_body(line);
    if (body.empty()) {
        return std::nullopt;
    }
    if (body == markers_.header_start) {
        return BlockType::HEADER;
    }
    if (body == markers_.config_start) {
        return BlockType::CONFIG;
    }
    if (body == markers_.thumbnail_start) {
        return BlockType::THUMBNAIL;
    }
    if (body == markers_.executable_start) {
        return BlockType::EXECUTABLE;
    }
    return std::nullopt;
}

bool GCodeBlockClassifier::is_end_marker(const std::string& line, BlockType type) const {
    std::string body = comment_body(line);
    if (body.empty()) {
        return false;
    }
    switch (type) {
    case BlockType::HEADER:
        return body == markers_.header_end;
    case BlockType::CONFIG:
        return body == markers_.config_end;
    case BlockType::THUMBNAIL:
        return body == markers_.thumbnail_end;
    case BlockType::EXECUTABLE:
        return body == markers_.executable_end;
    case BlockType::METADATA:
    case BlockType::UNCLASSIFIED:
        return false;
    }
    return false;
}

bool GCodeBlockClassifier::is_metadata_line(const std::string& line) const {
    std::string body = to_lower_copy(comment_body(line));
    if (body.empty()) {
        return false;
    }
    for (const auto& label : metadata_labels_lower_) {
        if (body.compare(0, label.size(), label) != 0) {
            continue;
        }
        // "filament cost" must not match "filament costs_per_kg"
        if (body.size() == label.size()) {
            return true;
        }
        char next = body[label.size()];
        if (next == ' ' || next == '=' || next == ':' || next == '\t') {
            return true;
        }
    }
    return false;
}

ClassificationResult GCodeBlockClassifier::classify(const Document& doc) const {
    ClassificationResult result;
    auto& blocks = result.blocks;

    ClassifierState state = ClassifierState::SCANNING;
    ThumbnailValidator thumbnail;

    auto open_block = [&blocks](BlockType type, size_t line_no, bool has_marker) {
        Block block;
        block.type = type;
        block.first_line = line_no;
        block.has_start_marker = has_marker;
        blocks.push_back(std::move(block));
    };

    // Unmarked content continues the current block when the state already matches
    auto enter = [&](ClassifierState target, BlockType type, size_t line_no) {
        if (state != target) {
            open_block(type, line_no, false);
            state = target;
        }
    };

    auto in_marker_block = [&blocks]() {
        return !blocks.empty() && blocks.back().has_start_marker && !blocks.back().terminated;
    };

    auto fail = [&result](ConversionError error) {
        spdlog::error("[BlockClassifier] {}", error.technical_msg);
        result.blocks.clear();
        result.error = std::move(error);
        return result;
    };

    for (size_t i = 0; i < doc.lines.size(); ++i) {
        const std::string& line = doc.lines[i];
        const size_t line_no = i + 1;

        // Inside an explicit marker block everything is content until its end marker
        if (in_marker_block()) {
            Block& current = blocks.back();
            current.lines.push_back(line);

            if (is_end_marker(line, current.type)) {
                if (state == ClassifierState::IN_THUMBNAIL) {
                    ConversionError err = thumbnail.finish(line_no);
                    if (!err) {
                        return fail(std::move(err));
                    }
                }
                current.terminated = true;
                spdlog::trace("[BlockClassifier] Closed {} block at line {}",
                              block_type_name(current.type), line_no);
                continue;
            }

            if (state == ClassifierState::IN_THUMBNAIL) {
                ConversionError err = thumbnail.feed(line, line_no);
                if (!err) {
                    return fail(std::move(err));
                }
            }
            continue;
        }

        if (auto start = match_start_marker(line)) {
            open_block(*start, line_no, true);
            blocks.back().lines.push_back(line);
            state = state_for(*start);
            if (state == ClassifierState::IN_THUMBNAIL) {
                thumbnail.reset();
            }
            spdlog::trace("[BlockClassifier] {} block starts at line {}", block_type_name(*start),
                          line_no);
            continue;
        }

        if (is_metadata_line(line)) {
            enter(ClassifierState::IN_METADATA, BlockType::METADATA, line_no);
            blocks.back().lines.push_back(line);
            continue;
        }

        // The firmware runs every non-comment line, macros included
        if (is_command_line(line)) {
            enter(ClassifierState::IN_EXECUTABLE, BlockType::EXECUTABLE, line_no);
            blocks.back().lines.push_back(line);
            continue;
        }

        // Blank lines and comments stay in the current context
        if (state == ClassifierState::SCANNING && blocks.empty()) {
            open_block(BlockType::UNCLASSIFIED, line_no, false);
        }
        blocks.back().lines.push_back(line);
    }

    if (in_marker_block()) {
        const Block& open = blocks.back();
        return fail(ConversionErrorHelper::unterminated_block(open.type, open.first_line));
    }

    spdlog::debug("[BlockClassifier] {} lines -> {} blocks (final state {})", doc.lines.size(),
                  blocks.size(), state_name(state));
    return result;
}

} // namespace gcode
} // namespace forgepost
