/// \file
/// \brief Glyph selection and metric derivation for converted fonts.
///
/// This header declares the first conversion stage. A font_converter collects the requested characters, resolves them against a parsed BDF font and produces a converted_font that the packed and mono outputs are built from.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bdfconv/font.h"
#include "bdfconv/mapping.h"

struct converted_font {
    bdf_font bdf;
    std::string name;
    std::vector<std::string> comments;

    // ascending code point order, every glyph has a standard encoding
    std::vector<bdf_glyph> glyphs;
    std::size_t replacement_character{0};

    std::uint32_t ascent{0};
    std::uint32_t descent{0};
    std::uint32_t underline_position{0};
    std::uint32_t underline_thickness{0};
    std::uint32_t strikethrough_position{0};
    std::uint32_t strikethrough_thickness{0};

    std::optional<std::size_t> glyph_index(char32_t c) const;
    std::u32string characters() const;
};

class font_converter {
public:
    explicit font_converter(std::string name) : name_(std::move(name)) {}

    // Requests accumulate. Without any request every glyph of the font with
    // a standard encoding is converted.
    font_converter& glyphs(char32_t c);
    font_converter& glyphs(std::u32string_view chars);
    font_converter& glyphs(mapping_preset preset);
    font_converter& glyph_range(char32_t first, char32_t last);

    // Used in place of requested glyphs the font does not contain.
    font_converter& missing_glyph_substitute(char32_t c);
    font_converter& replacement_character(char32_t c);
    font_converter& comment(std::string text);

    const std::set<char32_t>& requested_glyphs() const { return glyphs_; }

    bool convert(const bdf_font& font, converted_font& out, std::string& err) const;

private:
    bool select_glyphs(const bdf_font& font, std::vector<bdf_glyph>& out, std::string& err) const;

    std::string name_;
    std::vector<std::string> comments_;
    std::set<char32_t> glyphs_;
    std::optional<char32_t> missing_glyph_substitute_;
    std::optional<char32_t> replacement_character_;
};

// ASCII letter followed by ASCII letters, digits or '_'.
bool is_valid_identifier(std::string_view name);
