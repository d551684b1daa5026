/// \file
/// \brief BDF property block model and parser.
///
/// This header declares the typed key/value store built from a STARTPROPERTIES block. Values are either text or 32 bit integers; typed accessors report missing keys and type mismatches separately.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "bdfconv/parser.h"

// Well-known XLFD properties.
enum class bdf_property {
    foundry,
    family_name,
    weight_name,
    slant,
    setwidth_name,
    add_style_name,
    pixel_size,
    point_size,
    resolution_x,
    resolution_y,
    spacing,
    average_width,
    charset_registry,
    charset_encoding,
    min_space,
    norm_space,
    max_space,
    end_space,
    avg_capital_width,
    avg_lowercase_width,
    quad_width,
    figure_width,
    superscript_x,
    superscript_y,
    subscript_x,
    subscript_y,
    superscript_size,
    subscript_size,
    small_cap_size,
    underline_position,
    underline_thickness,
    strikeout_ascent,
    strikeout_descent,
    italic_angle,
    cap_height,
    x_height,
    relative_setwidth,
    relative_weight,
    weight,
    resolution,
    font,
    face_name,
    full_name,
    copyright,
    notice,
    destination,
    font_type,
    font_version,
    rasterizer_name,
    rasterizer_version,
    raw_ascent,
    raw_descent,
    axis_names,
    axis_limits,
    axis_types,
    font_ascent,
    font_descent,
    default_char
};

/// Returns the property name as written in BDF files, e.g. "FONT_ASCENT".
std::string_view bdf_property_name(bdf_property property);

enum class bdf_property_status {
    ok,
    undefined,
    wrong_type
};

class bdf_property_value {
public:
    bdf_property_value() = default;
    explicit bdf_property_value(std::string text) : value_(std::move(text)) {}
    explicit bdf_property_value(std::int32_t number) : value_(number) {}

    bool is_text() const { return std::holds_alternative<std::string>(value_); }
    bool is_int() const { return std::holds_alternative<std::int32_t>(value_); }

    bdf_property_status get(std::string& out) const;
    bdf_property_status get(std::int32_t& out) const;

    bool operator==(const bdf_property_value&) const = default;

private:
    std::variant<std::string, std::int32_t> value_{std::string{}};
};

class bdf_properties {
public:
    using map_type = std::map<std::string, bdf_property_value, std::less<>>;

    static bool parse(bdf_lines& lines, const bdf_parse_options& opt, bdf_properties& out, bdf_parser_error& err);

    const bdf_property_value* find(std::string_view name) const;

    template <typename T>
    bdf_property_status try_get(std::string_view name, T& out) const {
        const bdf_property_value* value = find(name);
        if (!value) return bdf_property_status::undefined;
        return value->get(out);
    }

    template <typename T>
    bdf_property_status try_get(bdf_property property, T& out) const {
        return try_get(bdf_property_name(property), out);
    }

    // last write wins
    void set(std::string name, bdf_property_value value);

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    map_type::const_iterator begin() const { return values_.begin(); }
    map_type::const_iterator end() const { return values_.end(); }

    bool operator==(const bdf_properties&) const = default;

private:
    map_type values_;
};
