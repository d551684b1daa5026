/// \file
/// \brief Glyph selection and metric derivation.
///
/// This source file implements one part of the bdfconv pipeline architecture. It turns a parsed BDF font and a glyph request into the converted font shared by all outputs.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/font_converter.h"

#include <algorithm>

#include "bdfconv/unicode.h"

namespace {

constexpr char32_t k_unicode_replacement = 0xFFFD;

/// \brief read_vertical_metric.
std::uint32_t read_vertical_metric(const bdf_properties& props, bdf_property property) {
    std::int32_t value = 0;
    if (props.try_get(property, value) != bdf_property_status::ok || value < 0) return 0;
    return static_cast<std::uint32_t>(value);
}

/// \brief is_ascii_alpha.
bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

/// \brief is_valid_identifier.
bool is_valid_identifier(std::string_view name) {
    if (name.empty() || !is_ascii_alpha(name.front())) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return is_ascii_alpha(c) || (c >= '0' && c <= '9') || c == '_';
    });
}

/// \brief converted_font::glyph_index.
std::optional<std::size_t> converted_font::glyph_index(char32_t c) const {
    const auto encoding = bdf_encoding::standard(static_cast<std::uint32_t>(c));
    for (std::size_t i = 0; i < glyphs.size(); ++i) {
        if (glyphs[i].encoding == encoding) return i;
    }
    return std::nullopt;
}

/// \brief converted_font::characters.
std::u32string converted_font::characters() const {
    std::u32string out;
    out.reserve(glyphs.size());
    for (const auto& g : glyphs) out.push_back(static_cast<char32_t>(g.encoding.value()));
    return out;
}

/// \brief font_converter::glyphs.
font_converter& font_converter::glyphs(char32_t c) {
    glyphs_.insert(c);
    return *this;
}

/// \brief font_converter::glyphs.
font_converter& font_converter::glyphs(std::u32string_view chars) {
    glyphs_.insert(chars.begin(), chars.end());
    return *this;
}

/// \brief font_converter::glyphs.
font_converter& font_converter::glyphs(mapping_preset preset) {
    return glyphs(mapping_preset_characters(preset));
}

/// \brief font_converter::glyph_range.
font_converter& font_converter::glyph_range(char32_t first, char32_t last) {
    for (char32_t c = first; c <= last; ++c) {
        glyphs_.insert(c);
        if (c == last) break;
    }
    return *this;
}

/// \brief font_converter::missing_glyph_substitute.
font_converter& font_converter::missing_glyph_substitute(char32_t c) {
    missing_glyph_substitute_ = c;
    return *this;
}

/// \brief font_converter::replacement_character.
font_converter& font_converter::replacement_character(char32_t c) {
    replacement_character_ = c;
    return *this;
}

/// \brief font_converter::comment.
font_converter& font_converter::comment(std::string text) {
    comments_.push_back(std::move(text));
    return *this;
}

/// \brief font_converter::select_glyphs.
bool font_converter::select_glyphs(const bdf_font& font, std::vector<bdf_glyph>& out, std::string& err) const {
    out.clear();

    if (glyphs_.empty()) {
        for (const auto& g : font.glyphs) {
            if (!g.encoding.is_standard()) continue;
            out.push_back(g);
        }
        // stable sort keeps the first of several glyphs with one encoding in front
        std::stable_sort(out.begin(), out.end(), [](const bdf_glyph& a, const bdf_glyph& b) {
            return a.encoding.value() < b.encoding.value();
        });
        out.erase(std::unique(out.begin(), out.end(), [](const bdf_glyph& a, const bdf_glyph& b) {
            return a.encoding == b.encoding;
        }), out.end());
        return true;
    }

    out.reserve(glyphs_.size());
    for (const char32_t c : glyphs_) {
        char32_t source = c;
        if (!font.glyphs.get(c) && missing_glyph_substitute_) source = *missing_glyph_substitute_;

        const bdf_glyph* glyph = font.glyphs.get(source);
        if (!glyph) {
            err = "glyph " + format_codepoint(source) + " is not contained in the BDF font";
            return false;
        }

        bdf_glyph copy = *glyph;
        copy.encoding = bdf_encoding::standard(static_cast<std::uint32_t>(c));
        out.push_back(std::move(copy));
    }
    return true;
}

/// \brief font_converter::convert.
bool font_converter::convert(const bdf_font& font, converted_font& out, std::string& err) const {
    if (!is_valid_identifier(name_)) {
        err = "name is not a valid identifier: " + name_;
        return false;
    }

    converted_font result;
    if (!select_glyphs(font, result.glyphs, err)) return false;

    result.bdf = font;
    result.name = name_;
    result.comments = comments_;

    const auto& props = font.metadata.properties;
    result.ascent = read_vertical_metric(props, bdf_property::font_ascent);
    result.descent = read_vertical_metric(props, bdf_property::font_descent);

    // derived from ascent and descent, UNDERLINE_POSITION is not read
    result.underline_position = result.ascent + 1;
    result.underline_thickness = 1;
    result.strikethrough_position = (result.ascent + result.descent) / 2;
    result.strikethrough_thickness = 1;

    if (replacement_character_) {
        const auto index = result.glyph_index(*replacement_character_);
        if (!index) {
            err = "replacement character " + format_codepoint(*replacement_character_) +
                  " is not included in the glyphs";
            return false;
        }
        result.replacement_character = *index;
    } else if (const auto index = result.glyph_index(k_unicode_replacement)) {
        result.replacement_character = *index;
    } else if (const auto question = result.glyph_index(U'?')) {
        result.replacement_character = *question;
    } else {
        result.replacement_character = 0;
    }

    out = std::move(result);
    return true;
}
