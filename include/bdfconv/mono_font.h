/// \file
/// \brief Fixed-grid glyph atlas output for monospace fonts.
///
/// This header declares the mono encoding: every selected glyph is drawn into a cell of uniform size, the cells form a grid of k_atlas_columns columns and the whole grid is stored as one 1 bit per pixel image with byte padded, MSB-first rows. Characters map to cells either through a preset mapping or through a compressed range string.
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
#include "bdfconv/mapping.h"

inline constexpr std::uint32_t k_atlas_columns = 16;

struct decoration_dimensions {
    std::uint32_t offset{0};
    std::uint32_t height{0};

    bool operator==(const decoration_dimensions&) const = default;
};

class mono_font_output {
public:
    static bool build(const converted_font& font, mono_font_output& out, std::string& err);

    const converted_font& font() const { return font_; }

    const std::vector<std::uint8_t>& data() const { return data_; }
    std::uint32_t image_width() const { return image_width_; }
    std::uint32_t image_height() const { return image_height_; }
    std::size_t bytes_per_row() const { return (static_cast<std::size_t>(image_width_) + 7) / 8; }

    std::uint32_t character_width() const { return character_width_; }
    std::uint32_t character_height() const { return character_height_; }
    std::uint32_t character_spacing() const { return 0; }
    std::uint32_t baseline() const { return baseline_; }
    const decoration_dimensions& underline() const { return underline_; }
    const decoration_dimensions& strikethrough() const { return strikethrough_; }

    // set when the glyph set equals a preset exactly
    const std::optional<mapping_preset>& mapping() const { return mapping_; }
    // always valid, also for preset fonts
    const str_glyph_mapping& str_mapping() const { return str_mapping_; }

    // characters in cell order
    const std::u32string& cell_characters() const { return cell_characters_; }
    std::size_t replacement_index() const { return str_mapping_.replacement(); }

    // cell index for c; the replacement cell for unknown characters
    std::size_t glyph_index(char32_t c) const;

    std::optional<bool> pixel(std::uint32_t x, std::uint32_t y) const;

private:
    void set_pixel(std::uint32_t x, std::uint32_t y);

    converted_font font_;
    std::vector<std::uint8_t> data_;
    std::uint32_t image_width_{0};
    std::uint32_t image_height_{0};
    std::uint32_t character_width_{0};
    std::uint32_t character_height_{0};
    std::uint32_t baseline_{0};
    decoration_dimensions underline_{};
    decoration_dimensions strikethrough_{};
    std::optional<mapping_preset> mapping_;
    std::u32string cell_characters_;
    str_glyph_mapping str_mapping_{std::u32string{}, 0};
};
