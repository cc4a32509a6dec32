// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_document.h"

#include <algorithm>
#include <cctype>

namespace forgepost {
namespace gcode {

int canonical_rank(BlockType type) {
    switch (type) {
    case BlockType::HEADER:
    case BlockType::UNCLASSIFIED:
        return 0;
    case BlockType::METADATA:
        return 1;
    case BlockType::CONFIG:
        return 2;
    case BlockType::THUMBNAIL:
        return 3;
    case BlockType::EXECUTABLE:
        return 4;
    }
    return 0;
}

const char* block_type_name(BlockType type) {
    switch (type) {
    case BlockType::HEADER:
        return "header";
    case BlockType::METADATA:
        return "metadata";
    case BlockType::CONFIG:
        return "config";
    case BlockType::THUMBNAIL:
        return "thumbnail";
    case BlockType::EXECUTABLE:
        return "executable";
    case BlockType::UNCLASSIFIED:
        return "unclassified";
    }
    return "unknown";
}

// ============================================================================
// Document implementation
// ============================================================================

Document Document::split(const std::string& content) {
    Document doc;
    if (content.empty()) {
        return doc;
    }

    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            doc.lines.emplace_back(content, start, std::string::npos);
            return doc;
        }
        doc.lines.emplace_back(content, start, nl - start);
        start = nl + 1;
    }

    // Content ended exactly on a newline
    doc.trailing_newline = true;
    return doc;
}

std::string Document::join() const {
    size_t total = 0;
    for (const auto& line : lines) {
        total += line.size() + 1;
    }

    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i) {
        out += lines[i];
        if (i + 1 < lines.size() || trailing_newline) {
            out += '\n';
        }
    }
    return out;
}

// ============================================================================
// Line helpers
// ============================================================================

std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string comment_body(const std::string& line) {
    std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed[0] != ';') {
        return {};
    }
    return trim_copy(trimmed.substr(1));
}

bool is_instruction_line(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) {
        return false;
    }

    auto is_digit = [&line](size_t i) {
        return i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]));
    };

    // Optional "N<digits>" line number word
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(line[pos])));
    if (c == 'N' && is_digit(pos + 1)) {
        pos++;
        while (is_digit(pos)) {
            pos++;
        }
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            return false;
        }
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(line[pos])));
    }

    return (c == 'G' || c == 'M' || c == 'T') && is_digit(pos + 1);
}

bool is_command_line(const std::string& line) {
    std::string trimmed = trim_copy(line);
    return !trimmed.empty() && trimmed[0] != ';';
}

size_t count_instruction_lines(const std::vector<std::string>& lines) {
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(), is_instruction_line));
}

} // namespace gcode
} // namespace forgepost
