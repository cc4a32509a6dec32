// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_subroutine_injector.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <utility>

namespace forgepost {
namespace gcode {

namespace {

std::string command_part(const std::string& line) {
    size_t semi = line.find(';');
    return to_lower_copy(trim_copy(semi == std::string::npos ? line : line.substr(0, semi)));
}

} // namespace

GCodeSubroutineInjector::GCodeSubroutineInjector(InjectionRules rules)
    : rules_(std::move(rules)),
      start_trigger_lower_(to_lower_copy(trim_copy(rules_.start_trigger))),
      end_trigger_lower_(to_lower_copy(trim_copy(rules_.end_trigger))) {}

bool GCodeSubroutineInjector::same_command(const std::string& a, const std::string& b) {
    std::string cmd_a = command_part(a);
    return !cmd_a.empty() && cmd_a == command_part(b);
}

std::vector<SubroutineMarker>
GCodeSubroutineInjector::find_markers(const std::vector<Block>& blocks) const {
    std::vector<SubroutineMarker> markers;

    for (size_t b = 0; b < blocks.size(); ++b) {
        const Block& block = blocks[b];
        if (block.type != BlockType::EXECUTABLE) {
            continue;
        }

        for (size_t i = 0; i < block.lines.size(); ++i) {
            std::string lower = to_lower_copy(trim_copy(block.lines[i]));

            SubroutineKind kind;
            if (!start_trigger_lower_.empty() &&
                lower.find(start_trigger_lower_) != std::string::npos) {
                kind = SubroutineKind::START;
            } else if (!end_trigger_lower_.empty() &&
                       lower.find(end_trigger_lower_) != std::string::npos) {
                kind = SubroutineKind::END;
            } else {
                continue;
            }

            const std::string& call =
                kind == SubroutineKind::START ? rules_.start_call : rules_.end_call;
            bool present = i + 1 < block.lines.size() && same_command(call, block.lines[i + 1]);
            markers.push_back({kind, b, i, present});
        }
    }
    return markers;
}

InjectionResult GCodeSubroutineInjector::inject(std::vector<Block>& blocks) const {
    InjectionResult result;
    result.markers = find_markers(blocks);

    // Insert back to front so earlier line indices stay valid
    for (auto it = result.markers.rbegin(); it != result.markers.rend(); ++it) {
        if (it->already_present) {
            result.already_present++;
            continue;
        }
        std::string call = it->kind == SubroutineKind::START ? rules_.start_call : rules_.end_call;
        auto& lines = blocks[it->block_index].lines;

        // CRLF files keep CRLF on the inserted line
        const std::string& trigger = lines[it->line_index];
        if (!trigger.empty() && trigger.back() == '\r') {
            call += '\r';
        }
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(it->line_index + 1), call);
        result.injected++;
        result.inserted_lines.push_back(call);

        spdlog::trace("[SubroutineInjector] Inserted '{}' after block {} line {}", call,
                      it->block_index, it->line_index);
    }

    if (result.injected > 0 || result.already_present > 0) {
        spdlog::debug("[SubroutineInjector] {} calls injected, {} already present", result.injected,
                      result.already_present);
    }
    return result;
}

} // namespace gcode
} // namespace forgepost
