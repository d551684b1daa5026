/// \file
/// \brief Parser for STARTPROPERTIES ... ENDPROPERTIES blocks.
///
/// This source file implements one part of the bdfconv pipeline architecture. The property block is read by a small state machine: the opening line, the entries, and the closing line each have their own transition.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/properties.h"

#include <array>
#include <optional>
#include <utility>

namespace {

constexpr std::array<std::pair<bdf_property, std::string_view>, 58> k_property_names = {{
    {bdf_property::foundry, "FOUNDRY"},
    {bdf_property::family_name, "FAMILY_NAME"},
    {bdf_property::weight_name, "WEIGHT_NAME"},
    {bdf_property::slant, "SLANT"},
    {bdf_property::setwidth_name, "SETWIDTH_NAME"},
    {bdf_property::add_style_name, "ADD_STYLE_NAME"},
    {bdf_property::pixel_size, "PIXEL_SIZE"},
    {bdf_property::point_size, "POINT_SIZE"},
    {bdf_property::resolution_x, "RESOLUTION_X"},
    {bdf_property::resolution_y, "RESOLUTION_Y"},
    {bdf_property::spacing, "SPACING"},
    {bdf_property::average_width, "AVERAGE_WIDTH"},
    {bdf_property::charset_registry, "CHARSET_REGISTRY"},
    {bdf_property::charset_encoding, "CHARSET_ENCODING"},
    {bdf_property::min_space, "MIN_SPACE"},
    {bdf_property::norm_space, "NORM_SPACE"},
    {bdf_property::max_space, "MAX_SPACE"},
    {bdf_property::end_space, "END_SPACE"},
    {bdf_property::avg_capital_width, "AVG_CAPITAL_WIDTH"},
    {bdf_property::avg_lowercase_width, "AVG_LOWERCASE_WIDTH"},
    {bdf_property::quad_width, "QUAD_WIDTH"},
    {bdf_property::figure_width, "FIGURE_WIDTH"},
    {bdf_property::superscript_x, "SUPERSCRIPT_X"},
    {bdf_property::superscript_y, "SUPERSCRIPT_Y"},
    {bdf_property::subscript_x, "SUBSCRIPT_X"},
    {bdf_property::subscript_y, "SUBSCRIPT_Y"},
    {bdf_property::superscript_size, "SUPERSCRIPT_SIZE"},
    {bdf_property::subscript_size, "SUBSCRIPT_SIZE"},
    {bdf_property::small_cap_size, "SMALL_CAP_SIZE"},
    {bdf_property::underline_position, "UNDERLINE_POSITION"},
    {bdf_property::underline_thickness, "UNDERLINE_THICKNESS"},
    {bdf_property::strikeout_ascent, "STRIKEOUT_ASCENT"},
    {bdf_property::strikeout_descent, "STRIKEOUT_DESCENT"},
    {bdf_property::italic_angle, "ITALIC_ANGLE"},
    {bdf_property::cap_height, "CAP_HEIGHT"},
    {bdf_property::x_height, "X_HEIGHT"},
    {bdf_property::relative_setwidth, "RELATIVE_SETWIDTH"},
    {bdf_property::relative_weight, "RELATIVE_WEIGHT"},
    {bdf_property::weight, "WEIGHT"},
    {bdf_property::resolution, "RESOLUTION"},
    {bdf_property::font, "FONT"},
    {bdf_property::face_name, "FACE_NAME"},
    {bdf_property::full_name, "FULL_NAME"},
    {bdf_property::copyright, "COPYRIGHT"},
    {bdf_property::notice, "NOTICE"},
    {bdf_property::destination, "DESTINATION"},
    {bdf_property::font_type, "FONT_TYPE"},
    {bdf_property::font_version, "FONT_VERSION"},
    {bdf_property::rasterizer_name, "RASTERIZER_NAME"},
    {bdf_property::rasterizer_version, "RASTERIZER_VERSION"},
    {bdf_property::raw_ascent, "RAW_ASCENT"},
    {bdf_property::raw_descent, "RAW_DESCENT"},
    {bdf_property::axis_names, "AXIS_NAMES"},
    {bdf_property::axis_limits, "AXIS_LIMITS"},
    {bdf_property::axis_types, "AXIS_TYPES"},
    {bdf_property::font_ascent, "FONT_ASCENT"},
    {bdf_property::font_descent, "FONT_DESCENT"},
    {bdf_property::default_char, "DEFAULT_CHAR"},
}};

/// \brief unquote_text.
std::optional<std::string> unquote_text(std::string_view raw) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') return std::nullopt;
    raw.remove_prefix(1);
    raw.remove_suffix(1);

    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        out.push_back(raw[i]);
        if (raw[i] == '"' && i + 1 < raw.size() && raw[i + 1] == '"') ++i;
    }
    return out;
}

class property_block_parser {
public:
    property_block_parser(const bdf_parse_options& opt, bdf_properties& out, bdf_parser_error& err)
        : opt_(opt), out_(out), err_(err) {}

    bool run(bdf_lines& lines) {
        while (state_ != state::done) {
            const auto line = lines.next();
            if (!line) {
                err_ = bdf_parser_error::make(state_ == state::start
                    ? "missing \"STARTPROPERTIES\""
                    : "missing \"ENDPROPERTIES\"");
                return false;
            }
            const bool ok = (state_ == state::start) ? on_start(*line) : on_entry(*line);
            if (!ok) return false;
        }
        return true;
    }

private:
    enum class state { start, entries, done };

    bool on_start(const bdf_line& line) {
        if (line.keyword != "STARTPROPERTIES") {
            err_ = bdf_parser_error::at("expected \"STARTPROPERTIES\"", line);
            return false;
        }
        const auto count = line.parse_integer_parameters<1>();
        if (!count || (*count)[0] < 0) {
            err_ = bdf_parser_error::at("invalid \"STARTPROPERTIES\"", line);
            return false;
        }
        declared_ = static_cast<std::size_t>((*count)[0]);
        state_ = state::entries;
        return true;
    }

    bool on_entry(const bdf_line& line) {
        if (line.keyword == "ENDPROPERTIES") return on_end(line);

        if (const auto number = bdf_parse_i32(line.parameters)) {
            out_.set(std::string(line.keyword), bdf_property_value{*number});
        } else if (auto text = unquote_text(line.parameters)) {
            out_.set(std::string(line.keyword), bdf_property_value{std::move(*text)});
        } else {
            err_ = bdf_parser_error::at("invalid property: \"" + std::string(line.keyword) + "\"", line);
            return false;
        }
        ++found_;
        return true;
    }

    bool on_end(const bdf_line& line) {
        if (opt_.enforce_declared_counts && found_ != declared_) {
            err_ = bdf_parser_error::at(
                "property count mismatch: declared " + std::to_string(declared_) +
                ", found " + std::to_string(found_), line);
            return false;
        }
        state_ = state::done;
        return true;
    }

    const bdf_parse_options& opt_;
    bdf_properties& out_;
    bdf_parser_error& err_;
    state state_{state::start};
    std::size_t declared_{0};
    std::size_t found_{0};
};

} // namespace

/// \brief bdf_property_name.
std::string_view bdf_property_name(bdf_property property) {
    for (const auto& [key, name] : k_property_names) {
        if (key == property) return name;
    }
    return {};
}

/// \brief bdf_property_value::get.
bdf_property_status bdf_property_value::get(std::string& out) const {
    const auto* text = std::get_if<std::string>(&value_);
    if (!text) return bdf_property_status::wrong_type;
    out = *text;
    return bdf_property_status::ok;
}

/// \brief bdf_property_value::get.
bdf_property_status bdf_property_value::get(std::int32_t& out) const {
    const auto* number = std::get_if<std::int32_t>(&value_);
    if (!number) return bdf_property_status::wrong_type;
    out = *number;
    return bdf_property_status::ok;
}

/// \brief bdf_properties::parse.
bool bdf_properties::parse(bdf_lines& lines, const bdf_parse_options& opt, bdf_properties& out, bdf_parser_error& err) {
    out = {};
    property_block_parser parser(opt, out, err);
    return parser.run(lines);
}

/// \brief bdf_properties::find.
const bdf_property_value* bdf_properties::find(std::string_view name) const {
    const auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
}

void bdf_properties::set(std::string name, bdf_property_value value) {
    values_.insert_or_assign(std::move(name), std::move(value));
}
