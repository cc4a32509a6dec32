// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_converter.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <unordered_map>
#include <utility>

namespace forgepost {
namespace gcode {

// ============================================================================
// ConversionResult implementation
// ============================================================================

nlohmann::json ConversionResult::to_json() const {
    nlohmann::json j;
    j["success"] = success();
    if (!error.success()) {
        j["error"] = {{"code", conversion_error_code_name(error.code)},
                      {"message", error.technical_msg},
                      {"user_message", error.user_msg},
                      {"line", error.line_number}};
    }

    j["input_lines"] = input_lines;
    j["output_lines"] = output_lines;
    j["already_canonical"] = already_canonical;

    nlohmann::json blocks = nlohmann::json::object();
    for (const auto& [type, count] : blocks_found) {
        blocks[block_type_name(type)] = count;
    }
    j["blocks"] = blocks;

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [field, value] : metadata) {
        nlohmann::json entry;
        if (GCodeMetadataExtractor::field_kind(field) == MetadataKind::STRING) {
            entry["value"] = value.text;
        } else if (GCodeMetadataExtractor::field_kind(field) == MetadataKind::COUNT) {
            entry["value"] = value.as_integer();
        } else {
            entry["value"] = value.number;
        }
        if (!value.unit.empty()) {
            entry["unit"] = value.unit;
        }
        entry["raw"] = value.raw;
        entry["line"] = value.line;
        fields[GCodeMetadataExtractor::field_name(field)] = entry;
    }
    j["metadata"] = fields;

    j["synthesized"] = synthesized_lines;
    j["injected"] = injected;
    j["already_present"] = already_present;
    j["warnings"] = warnings;
    return j;
}

// ============================================================================
// GCodeConverter implementation
// ============================================================================

bool GCodeConverter::is_canonical_order(const std::vector<Block>& blocks) {
    int last_rank = -1;
    for (const auto& block : blocks) {
        if (block.empty()) {
            continue;
        }
        int rank = canonical_rank(block.type);
        if (rank < last_rank) {
            return false;
        }
        last_rank = rank;
    }
    return true;
}

ConversionError GCodeConverter::verify_conservation(const Document& input, const Document& output,
                                                    const std::vector<std::string>& inserted,
                                                    size_t executable_in, size_t executable_out,
                                                    size_t injected_instructions) {
    if (output.line_count() != input.line_count() + inserted.size()) {
        return ConversionErrorHelper::invariant_violation(
            "Output has " + std::to_string(output.line_count()) + " lines, expected " +
            std::to_string(input.line_count()) + " + " + std::to_string(inserted.size()) +
            " inserted");
    }

    std::unordered_map<std::string, long> balance;
    for (const auto& line : input.lines) {
        balance[line]++;
    }
    for (const auto& line : inserted) {
        balance[line]++;
    }
    for (const auto& line : output.lines) {
        balance[line]--;
    }

    auto mismatch = std::find_if(balance.begin(), balance.end(),
                                 [](const auto& entry) { return entry.second != 0; });
    if (mismatch != balance.end()) {
        std::string sample = mismatch->first.substr(0, 60);
        return ConversionErrorHelper::invariant_violation(
            std::string(mismatch->second > 0 ? "Lost" : "Duplicated") + " line '" + sample + "'");
    }

    if (executable_out != executable_in + injected_instructions) {
        return ConversionErrorHelper::invariant_violation(
            "Executable instruction count " + std::to_string(executable_out) + ", expected " +
            std::to_string(executable_in) + " + " + std::to_string(injected_instructions) +
            " injected");
    }
    return ConversionErrorHelper::success();
}

ConversionResult GCodeConverter::convert(const Document& input,
                                         const ConversionOptions& options) const {
    ConversionResult result;
    result.input_lines = input.line_count();

    // 1. Partition into blocks
    GCodeBlockClassifier classifier(options.markers);
    ClassificationResult classification = classifier.classify(input);
    if (!classification.success()) {
        result.error = classification.error;
        return result;
    }
    std::vector<Block> blocks = std::move(classification.blocks);

    size_t executable_in = 0;
    for (const auto& block : blocks) {
        result.blocks_found[block.type] += block.lines.size();
        if (block.type == BlockType::EXECUTABLE) {
            executable_in += count_instruction_lines(block.lines);
        }
    }
    result.already_canonical = is_canonical_order(blocks);

    // 2. Metadata
    GCodeMetadataExtractor extractor;
    ExtractionResult extraction = extractor.extract(blocks);
    result.metadata = std::move(extraction.fields);
    result.warnings = std::move(extraction.warnings);

    // 3. Subroutine calls
    std::vector<std::string> inserted;
    size_t injected_instructions = 0;
    if (options.inject_subroutines) {
        GCodeSubroutineInjector injector(options.injection);
        InjectionResult injection = injector.inject(blocks);
        result.injected = injection.injected;
        result.already_present = injection.already_present;
        injected_instructions = count_instruction_lines(injection.inserted_lines);
        inserted = std::move(injection.inserted_lines);
    }

    // 4. Canonical order
    GCodeBlockReassembler reassembler;
    ReassemblyResult reassembly =
        reassembler.reassemble(blocks, result.metadata, input.trailing_newline);
    result.synthesized_lines = reassembly.synthesized_lines;
    inserted.insert(inserted.end(), reassembly.synthesized_lines.begin(),
                    reassembly.synthesized_lines.end());

    // 5. Nothing lost, nothing duplicated
    if (options.verify_output) {
        const auto& out_lines = reassembly.document.lines;
        size_t executable_lines = reassembly.section_lines[BlockType::EXECUTABLE];
        std::vector<std::string> executable_section(
            out_lines.end() - static_cast<std::ptrdiff_t>(executable_lines), out_lines.end());

        ConversionError check = verify_conservation(input, reassembly.document, inserted,
                                                    executable_in,
                                                    count_instruction_lines(executable_section),
                                                    injected_instructions);
        if (!check) {
            spdlog::error("[Converter] {}", check.technical_msg);
            result.error = check;
            return result;
        }
    }

    result.output_lines = reassembly.document.line_count();
    result.output = std::move(reassembly.document);

    spdlog::debug("[Converter] {} -> {} lines ({} injected, {} already present, {} synthesized, "
                  "{})",
                  result.input_lines, result.output_lines, result.injected,
                  result.already_present, result.synthesized_lines.size(),
                  result.already_canonical ? "already canonical" : "reordered");
    return result;
}

ConversionResult GCodeConverter::convert_content(const std::string& content,
                                                 const ConversionOptions& options) const {
    return convert(Document::split(content), options);
}

} // namespace gcode
} // namespace forgepost
