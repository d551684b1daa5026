/// \file
/// \brief Bit-packed glyph stream builder.
///
/// This source file implements one part of the bdfconv pipeline architecture. It appends every glyph's pixels to a single bit stream and records where each glyph starts.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/packed_font.h"

#include <algorithm>

#include "bdfconv/unicode.h"

namespace {

class bit_writer {
public:
    explicit bit_writer(std::vector<std::uint8_t>& out) : out_(out) {}

    void push(bool bit) {
        if (count_ % 8 == 0) out_.push_back(0);
        if (bit) out_.back() |= static_cast<std::uint8_t>(0x80u >> (count_ % 8));
        ++count_;
    }

    std::size_t count() const { return count_; }

private:
    std::vector<std::uint8_t>& out_;
    std::size_t count_{0};
};

} // namespace

/// \brief to_packed_rectangle.
packed_rectangle to_packed_rectangle(const bdf_bounding_box& box) {
    packed_rectangle r;
    r.x = box.offset.x;
    r.y = -box.offset.y - (box.size.y - 1);
    r.width = static_cast<std::uint32_t>(box.size.x);
    r.height = static_cast<std::uint32_t>(box.size.y);
    return r;
}

/// \brief packed_font_output::build.
bool packed_font_output::build(const converted_font& font, packed_font_output& out, std::string& err) {
    packed_font_output result;
    result.font_ = font;

    bit_writer writer(result.data_);
    for (const auto& glyph : font.glyphs) {
        const auto& box = glyph.bounding_box;
        const char32_t c = static_cast<char32_t>(glyph.encoding.value());
        if (box.size.x < 0 || box.size.y < 0) {
            err = "glyph " + format_codepoint(c) + " has a negative bounding box size";
            return false;
        }

        packed_glyph pg;
        pg.character = c;
        pg.bounding_box = to_packed_rectangle(box);
        pg.device_width = static_cast<std::uint32_t>(std::max(glyph.device_width(), 0));
        pg.start_index = writer.count();
        result.glyphs_.push_back(pg);

        for (const bool bit : glyph.pixels()) writer.push(bit);

        result.bounding_box_ = result.bounding_box_.union_with(box);
    }
    result.bit_count_ = writer.count();

    out = std::move(result);
    return true;
}

/// \brief packed_font_output::glyph_for.
const packed_glyph* packed_font_output::glyph_for(char32_t c) const {
    for (const auto& g : glyphs_) {
        if (g.character == c) return &g;
    }
    if (font_.replacement_character < glyphs_.size()) return &glyphs_[font_.replacement_character];
    return nullptr;
}

/// \brief packed_font_output::glyph_pixel.
std::optional<bool> packed_font_output::glyph_pixel(const packed_glyph& glyph, std::uint32_t x, std::uint32_t y) const {
    if (x >= glyph.bounding_box.width || y >= glyph.bounding_box.height) return std::nullopt;

    const std::size_t bit = glyph.start_index + static_cast<std::size_t>(y) * glyph.bounding_box.width + x;
    if (bit >= bit_count_) return std::nullopt;
    return (data_[bit / 8] & (0x80u >> (bit % 8))) != 0;
}
