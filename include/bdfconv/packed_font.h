/// \file
/// \brief Bit-packed glyph stream output for proportional fonts.
///
/// This header declares the packed encoding: the bitmaps of all selected glyphs concatenated into one MSB-first bit stream without per-glyph padding, plus a glyph table with each glyph's rectangle, advance and bit offset into the stream.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bdfconv/font_converter.h"

// Y-down rectangle, top_left relative to the baseline origin.
struct packed_rectangle {
    std::int32_t x{0};
    std::int32_t y{0};
    std::uint32_t width{0};
    std::uint32_t height{0};

    bool operator==(const packed_rectangle&) const = default;
};

packed_rectangle to_packed_rectangle(const bdf_bounding_box& box);

struct packed_glyph {
    char32_t character{0};
    packed_rectangle bounding_box{};
    std::uint32_t device_width{0};
    std::size_t start_index{0};  // bit offset into the stream

    bool operator==(const packed_glyph&) const = default;
};

class packed_font_output {
public:
    // Fails if a glyph has a negative bounding box size.
    static bool build(const converted_font& font, packed_font_output& out, std::string& err);

    const converted_font& font() const { return font_; }
    const std::vector<std::uint8_t>& data() const { return data_; }
    std::size_t bit_count() const { return bit_count_; }
    const std::vector<packed_glyph>& glyphs() const { return glyphs_; }

    // union of all glyph boxes
    const bdf_bounding_box& bounding_box() const { return bounding_box_; }

    // glyph answering for c, or the replacement glyph; null if the font is empty
    const packed_glyph* glyph_for(char32_t c) const;

    // pixel (x, y) inside the glyph rectangle, read back from the stream
    std::optional<bool> glyph_pixel(const packed_glyph& glyph, std::uint32_t x, std::uint32_t y) const;

private:
    converted_font font_;
    std::vector<std::uint8_t> data_;
    std::size_t bit_count_{0};
    std::vector<packed_glyph> glyphs_;
    bdf_bounding_box bounding_box_{};
};
