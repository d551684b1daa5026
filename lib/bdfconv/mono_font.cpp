/// \file
/// \brief Fixed-grid glyph atlas builder.
///
/// This source file implements one part of the bdfconv pipeline architecture. It draws the selected glyphs into uniform cells and derives the character mapping used to find them again.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/mono_font.h"

#include <cstdint>
#include <limits>

#include "bdfconv/unicode.h"

namespace {

// upper bound for the packed atlas image
constexpr std::uint64_t k_max_atlas_bytes = std::uint64_t{1} << 28;

/// \brief union_bounding_box.
bool union_bounding_box(const std::vector<bdf_glyph>& glyphs, bdf_bounding_box& out, std::string& err) {
    bdf_bounding_box cell;
    for (const auto& g : glyphs) {
        if (g.bounding_box.size.x < 0 || g.bounding_box.size.y < 0) {
            err = "glyph " + format_codepoint(static_cast<char32_t>(g.encoding.value())) +
                  " has a negative bounding box size";
            return false;
        }
        cell = cell.union_with(g.bounding_box);
    }
    out = cell;
    return true;
}

} // namespace

/// \brief mono_font_output::build.
bool mono_font_output::build(const converted_font& font, mono_font_output& out, std::string& err) {
    bdf_bounding_box cell;
    if (!union_bounding_box(font.glyphs, cell, err)) return false;

    mono_font_output result;
    result.font_ = font;
    result.character_width_ = static_cast<std::uint32_t>(cell.size.x);
    result.character_height_ = static_cast<std::uint32_t>(cell.size.y);
    result.baseline_ = font.ascent > 0 ? font.ascent - 1 : 0;
    result.underline_ = {font.underline_position, font.underline_thickness};
    result.strikethrough_ = {font.strikethrough_position, font.strikethrough_thickness};

    const std::u32string characters = font.characters();
    result.mapping_ = detect_mapping_preset(characters);

    // preset fonts are laid out in preset order, everything else by code point
    std::vector<const bdf_glyph*> cells;
    if (result.mapping_) {
        result.cell_characters_ = mapping_preset_characters(*result.mapping_);
        for (const char32_t c : result.cell_characters_) {
            const auto index = font.glyph_index(c);
            if (!index) {
                err = "glyph " + format_codepoint(c) + " is missing from the converted font";
                return false;
            }
            cells.push_back(&font.glyphs[*index]);
        }
    } else {
        result.cell_characters_ = characters;
        for (const auto& g : font.glyphs) cells.push_back(&g);
    }

    std::size_t replacement = 0;
    if (font.replacement_character < font.glyphs.size()) {
        const auto c = static_cast<char32_t>(font.glyphs[font.replacement_character].encoding.value());
        const auto pos = result.cell_characters_.find(c);
        if (pos != std::u32string::npos) replacement = pos;
    }
    result.str_mapping_ = str_glyph_mapping(
        result.mapping_ ? result.cell_characters_ : compress_glyph_mapping(characters), replacement);

    const std::uint64_t rows = (cells.size() + k_atlas_columns - 1) / k_atlas_columns;
    const std::uint64_t width = std::uint64_t{result.character_width_} * k_atlas_columns;
    const std::uint64_t height = std::uint64_t{result.character_height_} * rows;
    constexpr std::uint64_t k_max_side = std::numeric_limits<std::uint32_t>::max();
    if (width > k_max_side || height > k_max_side || (width + 7) / 8 * height > k_max_atlas_bytes) {
        err = "atlas image of " + std::to_string(width) + "x" + std::to_string(height) + " pixels is too large";
        return false;
    }
    result.image_width_ = static_cast<std::uint32_t>(width);
    result.image_height_ = static_cast<std::uint32_t>(height);
    result.data_.assign(result.bytes_per_row() * result.image_height_, 0);

    const std::int32_t cell_top = cell.offset.y + cell.size.y - 1;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        const bdf_glyph& glyph = *cells[i];
        const auto& box = glyph.bounding_box;
        if (box.is_empty()) continue;

        const auto col = static_cast<std::uint32_t>(i % k_atlas_columns);
        const auto row = static_cast<std::uint32_t>(i / k_atlas_columns);
        const std::int32_t left = box.offset.x - cell.offset.x;
        const std::int32_t top = cell_top - (box.offset.y + box.size.y - 1);

        for (std::int32_t y = 0; y < box.size.y; ++y) {
            for (std::int32_t x = 0; x < box.size.x; ++x) {
                if (!glyph.pixel(x, y).value_or(false)) continue;
                result.set_pixel(col * result.character_width_ + static_cast<std::uint32_t>(left + x),
                                 row * result.character_height_ + static_cast<std::uint32_t>(top + y));
            }
        }
    }

    out = std::move(result);
    return true;
}

/// \brief mono_font_output::set_pixel.
void mono_font_output::set_pixel(std::uint32_t x, std::uint32_t y) {
    if (x >= image_width_ || y >= image_height_) return;
    data_[bytes_per_row() * y + x / 8] |= static_cast<std::uint8_t>(0x80u >> (x % 8));
}

/// \brief mono_font_output::pixel.
std::optional<bool> mono_font_output::pixel(std::uint32_t x, std::uint32_t y) const {
    if (x >= image_width_ || y >= image_height_) return std::nullopt;
    return (data_[bytes_per_row() * y + x / 8] & (0x80u >> (x % 8))) != 0;
}

/// \brief mono_font_output::glyph_index.
std::size_t mono_font_output::glyph_index(char32_t c) const {
    return str_mapping_.index(c);
}
