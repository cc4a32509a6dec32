// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_metadata_extractor.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace forgepost {
namespace gcode {

namespace {

/// Split "a, b;c" into trimmed non-empty elements
std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t sep = text.find_first_of(",;", start);
        size_t len = sep == std::string::npos ? std::string::npos : sep - start;
        std::string item = trim_copy(text.substr(start, len));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 1;
    }
    return out;
}

struct UnitRule {
    const char* unit; ///< Lowercase spelling as found in files
    double factor;    ///< Multiplier to the canonical unit
};

struct QuantityRules {
    const char* canonical;
    std::vector<UnitRule> units;
    bool currency = false; ///< Any prefix/suffix text is a currency marker
};

const QuantityRules& quantity_rules(MetadataField field) {
    static const QuantityRules LENGTH{"mm", {{"", 1.0}, {"mm", 1.0}, {"cm", 10.0}, {"m", 1000.0}}};
    static const QuantityRules VOLUME{
        "cm3",
        {{"", 1.0},
         {"cm3", 1.0},
         {"cm\xc2\xb3", 1.0},
         {"ml", 1.0},
         {"mm3", 0.001},
         {"mm\xc2\xb3", 0.001}}};
    static const QuantityRules MASS{"g", {{"", 1.0}, {"g", 1.0}, {"kg", 1000.0}}};
    static const QuantityRules COST{"", {}, true};
    static const QuantityRules PERCENT{"%", {{"", 1.0}, {"%", 1.0}}};
    static const QuantityRules MILLIMETER{"mm", {{"", 1.0}, {"mm", 1.0}}};
    static const QuantityRules TEMPERATURE{"C", {{"", 1.0}, {"c", 1.0}, {"\xc2\xb0" "c", 1.0}}};
    static const QuantityRules SPEED{"mm/s", {{"", 1.0}, {"mm/s", 1.0}}};
    static const QuantityRules PLAIN{"", {{"", 1.0}}};

    switch (field) {
    case MetadataField::FILAMENT_LENGTH_MM:
        return LENGTH;
    case MetadataField::FILAMENT_VOLUME_CM3:
        return VOLUME;
    case MetadataField::FILAMENT_MASS_G:
    case MetadataField::TOTAL_FILAMENT_MASS_G:
        return MASS;
    case MetadataField::FILAMENT_COST:
    case MetadataField::TOTAL_FILAMENT_COST:
        return COST;
    case MetadataField::INFILL_PERCENT:
        return PERCENT;
    case MetadataField::LAYER_HEIGHT:
    case MetadataField::NOZZLE_DIAMETER:
        return MILLIMETER;
    case MetadataField::NOZZLE_TEMP:
    case MetadataField::BED_TEMP:
        return TEMPERATURE;
    case MetadataField::PRINT_SPEED:
        return SPEED;
    default:
        return PLAIN;
    }
}

/// Parse one list element ("1.5m", "$0.42", "15%") into the canonical unit
std::optional<double> parse_quantity_item(MetadataField field, const std::string& item) {
    static const std::regex number_re(
        R"(([^0-9.+\-]*?)\s*([-+]?(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][-+]?\d+)?)\s*(.*))");

    std::smatch match;
    if (!std::regex_match(item, match, number_re)) {
        return std::nullopt;
    }

    const QuantityRules& rules = quantity_rules(field);
    std::string prefix = trim_copy(match[1].str());
    std::string unit = to_lower_copy(trim_copy(match[3].str()));

    double value = 0.0;
    try {
        value = std::stod(match[2].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (rules.currency) {
        // "$0.42", "0.42 EUR": the currency marker carries no scale
        return value;
    }
    if (!prefix.empty()) {
        return std::nullopt;
    }

    auto rule = std::find_if(rules.units.begin(), rules.units.end(),
                             [&unit](const UnitRule& r) { return unit == r.unit; });
    if (rule == rules.units.end()) {
        return std::nullopt;
    }
    return value * rule->factor;
}

} // namespace

// ============================================================================
// ExtractionResult implementation
// ============================================================================

std::optional<MetadataValue> ExtractionResult::get(MetadataField field) const {
    auto it = fields.find(field);
    if (it != fields.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// GCodeMetadataExtractor implementation
// ============================================================================

GCodeMetadataExtractor::GCodeMetadataExtractor() {
    init_default_patterns();
}

const char* GCodeMetadataExtractor::field_name(MetadataField field) {
    switch (field) {
    case MetadataField::ESTIMATED_TIME:
        return "estimated_time";
    case MetadataField::FILAMENT_LENGTH_MM:
        return "filament_length_mm";
    case MetadataField::FILAMENT_VOLUME_CM3:
        return "filament_volume_cm3";
    case MetadataField::FILAMENT_MASS_G:
        return "filament_mass_g";
    case MetadataField::FILAMENT_COST:
        return "filament_cost";
    case MetadataField::TOTAL_FILAMENT_MASS_G:
        return "total_filament_mass_g";
    case MetadataField::TOTAL_FILAMENT_COST:
        return "total_filament_cost";
    case MetadataField::FILAMENT_CHANGE_COUNT:
        return "filament_change_count";
    case MetadataField::LAYER_COUNT:
        return "layer_count";
    case MetadataField::INFILL_PERCENT:
        return "infill_percent";
    case MetadataField::LAYER_HEIGHT:
        return "layer_height";
    case MetadataField::NOZZLE_TEMP:
        return "nozzle_temp";
    case MetadataField::BED_TEMP:
        return "bed_temp";
    case MetadataField::PRINT_SPEED:
        return "print_speed";
    case MetadataField::NOZZLE_DIAMETER:
        return "nozzle_diameter";
    case MetadataField::FILAMENT_TYPE:
        return "filament_type";
    case MetadataField::PRINTER_MODEL:
        return "printer_model";
    case MetadataField::SLICER:
        return "slicer";
    }
    return "unknown";
}

MetadataKind GCodeMetadataExtractor::field_kind(MetadataField field) {
    switch (field) {
    case MetadataField::ESTIMATED_TIME:
        return MetadataKind::DURATION;
    case MetadataField::FILAMENT_CHANGE_COUNT:
    case MetadataField::LAYER_COUNT:
        return MetadataKind::COUNT;
    case MetadataField::FILAMENT_TYPE:
    case MetadataField::PRINTER_MODEL:
    case MetadataField::SLICER:
        return MetadataKind::STRING;
    default:
        return MetadataKind::QUANTITY;
    }
}

bool GCodeMetadataExtractor::sums_lists(MetadataField field) {
    switch (field) {
    case MetadataField::FILAMENT_LENGTH_MM:
    case MetadataField::FILAMENT_VOLUME_CM3:
    case MetadataField::FILAMENT_MASS_G:
    case MetadataField::FILAMENT_COST:
    case MetadataField::TOTAL_FILAMENT_MASS_G:
    case MetadataField::TOTAL_FILAMENT_COST:
        return true;
    default:
        return false;
    }
}

void GCodeMetadataExtractor::init_default_patterns() {
    auto add = [this](MetadataField field, const char* re, const char* description) {
        patterns_.push_back(
            {field, std::regex(re, std::regex::ECMAScript | std::regex::icase), description});
    };

    // Most specific first: the first match decides a line's field

    // Print time
    add(MetadataField::ESTIMATED_TIME, R"(estimated printing time \(normal mode\)\s*[=:]\s*(.*))",
        "PrusaSlicer/OrcaSlicer normal mode time");
    add(MetadataField::ESTIMATED_TIME,
        R"(model printing time\s*:.*;\s*total estimated time\s*:\s*(.*))",
        "BambuStudio header time");
    add(MetadataField::ESTIMATED_TIME, R"(total estimated time\s*[=:]\s*(.*))",
        "Total estimated time");
    add(MetadataField::ESTIMATED_TIME, R"(estimated printing time\s*[=:]\s*(.*))",
        "Estimated printing time");
    add(MetadataField::ESTIMATED_TIME, R"(time\s*:\s*(\d+(?:\.\d+)?))", "Cura ;TIME:");

    // Filament consumption (totals before per-filament forms)
    add(MetadataField::TOTAL_FILAMENT_MASS_G, R"(total filament used \[g\]\s*[=:]\s*(.*))",
        "Total filament mass");
    add(MetadataField::TOTAL_FILAMENT_COST, R"(total filament cost\s*[=:]\s*(.*))",
        "Total filament cost");
    add(MetadataField::FILAMENT_CHANGE_COUNT, R"(total filament changes?\s*[=:]\s*(.*))",
        "Filament change count");
    add(MetadataField::FILAMENT_LENGTH_MM, R"(filament used \[mm\]\s*[=:]\s*(.*))",
        "Filament length");
    add(MetadataField::FILAMENT_VOLUME_CM3, R"(filament used \[cm3\]\s*[=:]\s*(.*))",
        "Filament volume");
    add(MetadataField::FILAMENT_MASS_G, R"(filament used \[g\]\s*[=:]\s*(.*))", "Filament mass");
    add(MetadataField::FILAMENT_COST, R"(filament cost\s*[=:]\s*(.*))", "Filament cost");
    add(MetadataField::FILAMENT_LENGTH_MM, R"(filament used\s*:\s*(.*))", "Cura ;Filament used:");

    // Layers
    add(MetadataField::LAYER_COUNT, R"(total layers count\s*[=:]\s*(.*))", "Total layers count");
    add(MetadataField::LAYER_COUNT, R"(total layer number\s*[=:]\s*(.*))", "Total layer number");
    add(MetadataField::LAYER_COUNT, R"(layer_count\s*:\s*(.*))", "Cura ;LAYER_COUNT:");

    // Settings dump
    add(MetadataField::INFILL_PERCENT,
        R"((?:sparse_infill_density|fill_density|infill_sparse_density)\s*[=:]\s*(.*))",
        "Infill density");
    add(MetadataField::LAYER_HEIGHT, R"(layer_height\s*[=:]\s*(.*))", "Layer height");
    add(MetadataField::NOZZLE_TEMP, R"((?:nozzle_temperature|temperature)\s*[=:]\s*(.*))",
        "Nozzle temperature");
    add(MetadataField::BED_TEMP, R"((?:hot_plate_temp|bed_temperature)\s*[=:]\s*(.*))",
        "Bed temperature");
    add(MetadataField::PRINT_SPEED,
        R"((?:outer_wall_speed|perimeter_speed|speed_print)\s*[=:]\s*(.*))", "Print speed");
    add(MetadataField::NOZZLE_DIAMETER, R"(nozzle_diameter\s*[=:]\s*(.*))", "Nozzle diameter");
    add(MetadataField::FILAMENT_TYPE, R"(filament_type\s*[=:]\s*(.*))", "Filament type");
    add(MetadataField::PRINTER_MODEL, R"(printer_model\s*[=:]\s*(.*))", "Printer model");
    add(MetadataField::SLICER, R"(generated by\s+(.*?)(?:\s+on\s+\d{4}-\d{2}-\d{2}.*)?)",
        "Generator line");

    spdlog::trace("[MetadataExtractor] Initialized with {} patterns", patterns_.size());
}

ExtractionResult GCodeMetadataExtractor::extract(const std::vector<Block>& blocks) const {
    ExtractionResult result;

    for (const auto& block : blocks) {
        if (block.type == BlockType::EXECUTABLE || block.type == BlockType::THUMBNAIL) {
            continue;
        }
        extract_lines(block.lines, block.first_line, result);
    }

    spdlog::debug("[MetadataExtractor] Extracted {} fields ({} warnings)", result.fields.size(),
                  result.warnings.size());
    return result;
}

void GCodeMetadataExtractor::extract_lines(const std::vector<std::string>& lines,
                                           size_t first_line, ExtractionResult& result) const {
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string body = comment_body(lines[i]);
        if (body.empty()) {
            continue;
        }
        const size_t line_no = first_line + i;

        for (const auto& pattern : patterns_) {
            std::smatch match;
            if (!std::regex_match(body, match, pattern.regex)) {
                continue;
            }

            std::string value_text = trim_copy(match[1].str());
            auto value = parse_value(pattern.field, value_text);
            if (value) {
                value->line = line_no;
                result.fields[pattern.field] = *value;
                spdlog::trace("[MetadataExtractor] Line {}: {} = {} ({})", line_no,
                              field_name(pattern.field), value_text, pattern.description);
            } else {
                std::string warning = "Line " + std::to_string(line_no) + ": cannot parse " +
                                      field_name(pattern.field) + " value '" + value_text + "'";
                spdlog::warn("[MetadataExtractor] {}", warning);
                result.warnings.push_back(std::move(warning));
            }
            break;
        }
    }
}

std::optional<MetadataValue> GCodeMetadataExtractor::parse_value(MetadataField field,
                                                                 const std::string& text) {
    MetadataValue value;
    value.field = field;
    value.raw = text;

    std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    switch (field_kind(field)) {
    case MetadataKind::STRING:
        value.text = trimmed;
        return value;

    case MetadataKind::DURATION: {
        auto seconds = parse_duration(trimmed);
        if (!seconds) {
            return std::nullopt;
        }
        value.number = *seconds;
        value.unit = "s";
        return value;
    }

    case MetadataKind::COUNT: {
        auto items = split_list(trimmed);
        static const std::regex count_re(R"(\d{1,15})");
        if (items.empty() || !std::regex_match(items.front(), count_re)) {
            return std::nullopt;
        }
        value.number = static_cast<double>(std::stoll(items.front()));
        return value;
    }

    case MetadataKind::QUANTITY: {
        auto items = split_list(trimmed);
        if (items.empty()) {
            return std::nullopt;
        }
        const bool sum = sums_lists(field);
        double total = 0.0;
        for (const auto& item : items) {
            auto parsed = parse_quantity_item(field, item);
            if (!parsed) {
                return std::nullopt;
            }
            total += *parsed;
            if (!sum) {
                break;
            }
        }
        value.number = total;
        value.unit = quantity_rules(field).canonical;
        return value;
    }
    }
    return std::nullopt;
}

std::optional<double> GCodeMetadataExtractor::parse_duration(const std::string& text) {
    static const std::regex dhms_re(
        R"((?:(\d+)\s*d)?\s*(?:(\d+)\s*h)?\s*(?:(\d+)\s*m)?\s*(?:(\d+(?:\.\d+)?)\s*s)?)",
        std::regex::icase);
    static const std::regex clock_re(R"((\d+):(\d{1,2}):(\d{1,2}(?:\.\d+)?))");
    static const std::regex seconds_re(R"(\d+(?:\.\d+)?)");

    std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::smatch match;
    try {
        if (std::regex_match(trimmed, match, seconds_re)) {
            return std::stod(trimmed);
        }
        if (std::regex_match(trimmed, match, clock_re)) {
            return std::stod(match[1].str()) * 3600.0 + std::stod(match[2].str()) * 60.0 +
                   std::stod(match[3].str());
        }
        if (std::regex_match(trimmed, match, dhms_re)) {
            double total = 0.0;
            bool any = false;
            const double scale[] = {86400.0, 3600.0, 60.0, 1.0};
            for (size_t i = 0; i < 4; ++i) {
                if (match[i + 1].matched) {
                    total += std::stod(match[i + 1].str()) * scale[i];
                    any = true;
                }
            }
            if (any) {
                return total;
            }
        }
    } catch (const std::exception& e) {
        spdlog::debug("[MetadataExtractor] Duration '{}' out of range: {}", trimmed, e.what());
    }
    return std::nullopt;
}

std::string GCodeMetadataExtractor::format_duration(double seconds) {
    long long total = seconds > 0 ? std::llround(seconds) : 0;
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;

    char buf[64];
    if (days > 0) {
        std::snprintf(buf, sizeof(buf), "%lldd %lldh %lldm %llds", days, hours, minutes, secs);
    } else if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %lldm %llds", hours, minutes, secs);
    } else if (minutes > 0) {
        std::snprintf(buf, sizeof(buf), "%lldm %llds", minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%llds", secs);
    }
    return buf;
}

} // namespace gcode
} // namespace forgepost
