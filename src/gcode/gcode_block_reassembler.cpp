// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_block_reassembler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace forgepost {
namespace gcode {

const std::vector<MetadataField>& GCodeBlockReassembler::vendor_fields() {
    // Order OrcaSlicer itself writes them
    static const std::vector<MetadataField> fields = {
        MetadataField::FILAMENT_LENGTH_MM,    MetadataField::FILAMENT_VOLUME_CM3,
        MetadataField::FILAMENT_MASS_G,       MetadataField::FILAMENT_COST,
        MetadataField::TOTAL_FILAMENT_MASS_G, MetadataField::TOTAL_FILAMENT_COST,
        MetadataField::LAYER_COUNT,           MetadataField::ESTIMATED_TIME,
    };
    return fields;
}

const char* GCodeBlockReassembler::vendor_label(MetadataField field) {
    switch (field) {
    case MetadataField::FILAMENT_LENGTH_MM:
        return "filament used [mm]";
    case MetadataField::FILAMENT_VOLUME_CM3:
        return "filament used [cm3]";
    case MetadataField::FILAMENT_MASS_G:
        return "filament used [g]";
    case MetadataField::FILAMENT_COST:
        return "filament cost";
    case MetadataField::TOTAL_FILAMENT_MASS_G:
        return "total filament used [g]";
    case MetadataField::TOTAL_FILAMENT_COST:
        return "total filament cost";
    case MetadataField::LAYER_COUNT:
        return "total layers count";
    case MetadataField::ESTIMATED_TIME:
        return "estimated printing time (normal mode)";
    default:
        return nullptr;
    }
}

std::string GCodeBlockReassembler::vendor_line(const MetadataValue& value) {
    const char* label = vendor_label(value.field);
    if (!label) {
        return {};
    }

    std::string line = std::string("; ") + label + " = ";
    switch (GCodeMetadataExtractor::field_kind(value.field)) {
    case MetadataKind::DURATION:
        line += GCodeMetadataExtractor::format_duration(value.number);
        break;
    case MetadataKind::COUNT:
        line += std::to_string(value.as_integer());
        break;
    default: {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", value.number);
        line += buf;
        break;
    }
    }
    return line;
}

bool GCodeBlockReassembler::has_vendor_label(const std::string& line, MetadataField field) {
    const char* label = vendor_label(field);
    if (!label) {
        return false;
    }
    std::string body = to_lower_copy(comment_body(line));
    std::string prefix(label);
    if (body.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (body.size() == prefix.size()) {
        return true;
    }
    char next = body[prefix.size()];
    return next == ' ' || next == '\t' || next == '=' || next == ':';
}

std::vector<std::string>
GCodeBlockReassembler::synthesize(const std::vector<std::string>& metadata_lines,
                                  const MetadataMap& metadata) const {
    std::vector<std::string> out;

    for (MetadataField field : vendor_fields()) {
        auto it = metadata.find(field);
        if (it == metadata.end()) {
            continue;
        }
        bool present =
            std::any_of(metadata_lines.begin(), metadata_lines.end(),
                        [field](const std::string& line) { return has_vendor_label(line, field); });
        if (present) {
            continue;
        }
        out.push_back(vendor_line(it->second));
        spdlog::debug("[BlockReassembler] Synthesized {} from line {}",
                      GCodeMetadataExtractor::field_name(field), it->second.line);
    }
    return out;
}

ReassemblyResult GCodeBlockReassembler::reassemble(const std::vector<Block>& blocks,
                                                   const MetadataMap& metadata,
                                                   bool trailing_newline) const {
    ReassemblyResult result;

    auto gather = [&blocks](BlockType type) {
        std::vector<std::string> lines;
        for (const auto& block : blocks) {
            if (block.type == type) {
                lines.insert(lines.end(), block.lines.begin(), block.lines.end());
            }
        }
        return lines;
    };

    std::vector<std::string> header = gather(BlockType::UNCLASSIFIED);
    std::vector<std::string> header_blocks = gather(BlockType::HEADER);
    header.insert(header.end(), header_blocks.begin(), header_blocks.end());

    std::vector<std::string> meta = gather(BlockType::METADATA);
    result.synthesized_lines = synthesize(meta, metadata);
    if (!result.synthesized_lines.empty()) {
        // Keep trailing blank separators after the synthesized lines
        auto last_text = std::find_if(meta.rbegin(), meta.rend(), [](const std::string& line) {
            return !trim_copy(line).empty();
        });
        auto pos = last_text.base();

        // CRLF files keep CRLF on synthesized lines
        const std::string* neighbour = nullptr;
        if (pos != meta.begin()) {
            neighbour = &*(pos - 1);
        } else {
            auto first = std::find_if(blocks.begin(), blocks.end(),
                                      [](const Block& block) { return !block.lines.empty(); });
            if (first != blocks.end()) {
                neighbour = &first->lines.front();
            }
        }
        if (neighbour && !neighbour->empty() && neighbour->back() == '\r') {
            for (auto& line : result.synthesized_lines) {
                line += '\r';
            }
        }
        meta.insert(pos, result.synthesized_lines.begin(), result.synthesized_lines.end());
    }

    auto& out = result.document.lines;
    auto emit = [&out, &result](BlockType section, const std::vector<std::string>& lines) {
        out.insert(out.end(), lines.begin(), lines.end());
        result.section_lines[section] = lines.size();
    };

    emit(BlockType::HEADER, header);
    emit(BlockType::METADATA, meta);
    emit(BlockType::CONFIG, gather(BlockType::CONFIG));
    emit(BlockType::THUMBNAIL, gather(BlockType::THUMBNAIL));
    emit(BlockType::EXECUTABLE, gather(BlockType::EXECUTABLE));

    result.document.trailing_newline = trailing_newline && !out.empty();

    spdlog::debug("[BlockReassembler] Emitted {} lines (header={}, metadata={}, config={}, "
                  "thumbnail={}, executable={})",
                  out.size(), result.section_lines[BlockType::HEADER],
                  result.section_lines[BlockType::METADATA],
                  result.section_lines[BlockType::CONFIG],
                  result.section_lines[BlockType::THUMBNAIL],
                  result.section_lines[BlockType::EXECUTABLE]);
    return result;
}

} // namespace gcode
} // namespace forgepost
