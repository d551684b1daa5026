/// \file
/// \brief Parser for the BDF font header.
///
/// This source file implements one part of the bdfconv pipeline architecture. Header keywords are dispatched through a table of transitions that fill a parse state; required fields are checked once the header ends.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/metadata.h"

#include <array>
#include <optional>
#include <string_view>

namespace {

enum class step {
    next,  // keep reading header lines
    stop,  // header complete
    fail
};

struct metadata_state {
    std::optional<std::string> name;
    std::optional<bdf_bounding_box> bounding_box;
    std::optional<std::int32_t> point_size;
    bdf_coord resolution{};
    bdf_metrics_set metrics_set{bdf_metrics_set::horizontal};
    bdf_properties properties;
};

struct metadata_context {
    bdf_lines& lines;
    const bdf_parse_options& opt;
    metadata_state& state;
    bdf_parser_error& err;
};

using transition_fn = step (*)(metadata_context&, const bdf_line&);

step on_font(metadata_context& ctx, const bdf_line& line) {
    ctx.state.name = std::string(line.parameters);
    return step::next;
}

step on_font_bounding_box(metadata_context& ctx, const bdf_line& line) {
    const auto box = bdf_bounding_box::parse(line);
    if (!box) {
        ctx.err = bdf_parser_error::at("invalid \"FONTBOUNDINGBOX\"", line);
        return step::fail;
    }
    ctx.state.bounding_box = *box;
    return step::next;
}

step on_size(metadata_context& ctx, const bdf_line& line) {
    const auto values = line.parse_integer_parameters<3>();
    if (!values) {
        ctx.err = bdf_parser_error::at("invalid \"SIZE\"", line);
        return step::fail;
    }
    ctx.state.point_size = (*values)[0];
    ctx.state.resolution = bdf_coord{(*values)[1], (*values)[2]};
    return step::next;
}

step on_metrics_set(metadata_context& ctx, const bdf_line& line) {
    const auto values = line.parse_integer_parameters<1>();
    if (!values || (*values)[0] < 0 || (*values)[0] > 2) {
        ctx.err = bdf_parser_error::at("invalid \"METRICSSET\"", line);
        return step::fail;
    }
    switch ((*values)[0]) {
        case 0: ctx.state.metrics_set = bdf_metrics_set::horizontal; break;
        case 1: ctx.state.metrics_set = bdf_metrics_set::vertical; break;
        default: ctx.state.metrics_set = bdf_metrics_set::both; break;
    }
    return step::next;
}

step on_start_properties(metadata_context& ctx, const bdf_line& line) {
    ctx.lines.backtrack(line);
    if (!bdf_properties::parse(ctx.lines, ctx.opt, ctx.state.properties, ctx.err)) return step::fail;
    return step::next;
}

step on_glyph_section(metadata_context& ctx, const bdf_line& line) {
    ctx.lines.backtrack(line);
    return step::stop;
}

constexpr std::array<std::pair<std::string_view, transition_fn>, 7> k_transitions = {{
    {"FONT", &on_font},
    {"FONTBOUNDINGBOX", &on_font_bounding_box},
    {"SIZE", &on_size},
    {"METRICSSET", &on_metrics_set},
    {"STARTPROPERTIES", &on_start_properties},
    {"CHARS", &on_glyph_section},
    {"STARTCHAR", &on_glyph_section},
}};

/// \brief find_transition.
transition_fn find_transition(std::string_view keyword) {
    for (const auto& [name, fn] : k_transitions) {
        if (name == keyword) return fn;
    }
    return nullptr;
}

} // namespace

/// \brief bdf_metadata::parse.
bool bdf_metadata::parse(bdf_lines& lines, const bdf_parse_options& opt, bdf_metadata& out, bdf_parser_error& err) {
    metadata_state state;
    metadata_context ctx{lines, opt, state, err};

    while (const auto line = lines.next()) {
        const transition_fn fn = find_transition(line->keyword);
        if (!fn) {
            err = bdf_parser_error::at("unknown keyword in metadata: \"" + std::string(line->keyword) + "\"", *line);
            return false;
        }
        const step s = fn(ctx, *line);
        if (s == step::fail) return false;
        if (s == step::stop) break;
    }

    if (!state.name) {
        err = bdf_parser_error::make("missing \"FONT\"");
        return false;
    }
    if (!state.bounding_box) {
        err = bdf_parser_error::make("missing \"FONTBOUNDINGBOX\"");
        return false;
    }
    if (!state.point_size) {
        err = bdf_parser_error::make("missing \"SIZE\"");
        return false;
    }

    out = {};
    out.name = std::move(*state.name);
    out.point_size = *state.point_size;
    out.resolution = state.resolution;
    out.bounding_box = *state.bounding_box;
    out.metrics_set = state.metrics_set;
    out.properties = std::move(state.properties);
    return true;
}
