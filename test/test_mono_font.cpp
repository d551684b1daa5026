/// \file
/// \brief Unit tests for the fixed-grid glyph atlas.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "bdfconv/mono_font.h"

using namespace std::string_literals;

namespace {

/// \brief load_sample.
bdf_font load_sample() {
    std::ifstream in(std::filesystem::path(TEST_DATA_DIR) / "sample.bdf", std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();

    bdf_font font;
    bdf_parser_error err;
    EXPECT_TRUE(bdf_font::parse(ss.str(), font, err)) << err.to_string();
    return font;
}

/// \brief build_atlas.
mono_font_output build_atlas(const font_converter& conv) {
    converted_font converted;
    std::string err;
    EXPECT_TRUE(conv.convert(load_sample(), converted, err)) << err;

    mono_font_output out;
    EXPECT_TRUE(mono_font_output::build(converted, out, err)) << err;
    return out;
}

} // namespace

TEST(mono_font, cell_size_is_union_of_glyph_boxes) {
    const mono_font_output atlas = build_atlas(font_converter("sample"));

    EXPECT_EQ(atlas.character_width(), 5u);
    EXPECT_EQ(atlas.character_height(), 9u);
    EXPECT_EQ(atlas.character_spacing(), 0u);
    EXPECT_EQ(atlas.image_width(), 5u * k_atlas_columns);
    EXPECT_EQ(atlas.image_height(), 9u);
    EXPECT_EQ(atlas.bytes_per_row(), 10u);
    EXPECT_EQ(atlas.data().size(), 90u);
}

TEST(mono_font, metrics) {
    const mono_font_output atlas = build_atlas(font_converter("sample"));

    EXPECT_EQ(atlas.baseline(), 7u);
    EXPECT_EQ(atlas.underline(), (decoration_dimensions{9, 1}));
    EXPECT_EQ(atlas.strikethrough(), (decoration_dimensions{5, 1}));
}

TEST(mono_font, compressed_mapping_without_preset) {
    const mono_font_output atlas = build_atlas(font_converter("sample"));

    EXPECT_FALSE(atlas.mapping().has_value());
    EXPECT_EQ(atlas.cell_characters(), U" ?ABCabcg");
    EXPECT_EQ(atlas.str_mapping().mapping(), U" ?\0AC\0acg"s);
    EXPECT_EQ(atlas.replacement_index(), 1u);
    EXPECT_EQ(atlas.glyph_index(U'B'), 3u);
    EXPECT_EQ(atlas.glyph_index(U'g'), 8u);
    EXPECT_EQ(atlas.glyph_index(U'z'), 1u);
}

TEST(mono_font, glyphs_are_placed_on_the_common_baseline) {
    const mono_font_output atlas = build_atlas(font_converter("sample"));

    // 'A' in cell 2, bar row 4 spans the cell
    for (std::uint32_t x = 10; x < 15; ++x) EXPECT_EQ(atlas.pixel(x, 4), true) << x;
    EXPECT_EQ(atlas.pixel(12, 0), true);
    EXPECT_EQ(atlas.pixel(10, 0), false);

    // '?' in cell 1 is shifted right by its x offset
    EXPECT_EQ(atlas.pixel(6, 0), false);
    EXPECT_EQ(atlas.pixel(7, 0), true);
    EXPECT_EQ(atlas.pixel(8, 0), true);

    // 'a' in cell 5 starts two rows lower than the capitals
    EXPECT_EQ(atlas.pixel(27, 0), false);
    EXPECT_EQ(atlas.pixel(27, 1), false);
    EXPECT_EQ(atlas.pixel(27, 2), true);

    // 'g' in cell 8 descends to the bottom of the cell
    EXPECT_EQ(atlas.pixel(40, 2), false);
    for (std::uint32_t x = 41; x < 45; ++x) EXPECT_EQ(atlas.pixel(x, 2), true) << x;
    EXPECT_EQ(atlas.pixel(41, 8), true);

    // the space cell and unused cells stay blank
    for (std::uint32_t y = 0; y < 9; ++y) {
        for (std::uint32_t x = 0; x < 5; ++x) EXPECT_EQ(atlas.pixel(x, y), false);
        for (std::uint32_t x = 45; x < 80; ++x) EXPECT_EQ(atlas.pixel(x, y), false);
    }

    EXPECT_FALSE(atlas.pixel(80, 0).has_value());
    EXPECT_FALSE(atlas.pixel(0, 9).has_value());
}

TEST(mono_font, ascii_preset_is_detected) {
    const mono_font_output atlas = build_atlas(
        font_converter("sample").glyphs(mapping_preset::ascii).missing_glyph_substitute(U'?'));

    ASSERT_TRUE(atlas.mapping().has_value());
    EXPECT_EQ(*atlas.mapping(), mapping_preset::ascii);
    EXPECT_EQ(atlas.cell_characters(), mapping_preset_characters(mapping_preset::ascii));
    EXPECT_EQ(atlas.image_height(), 6u * 9u);
    EXPECT_EQ(atlas.replacement_index(), 31u);
    EXPECT_EQ(atlas.glyph_index(U'A'), 33u);
    EXPECT_EQ(atlas.glyph_index(U'é'), 31u);
}

TEST(mono_font, preset_cells_follow_preset_order) {
    const mono_font_output atlas = build_atlas(
        font_converter("sample").glyphs(mapping_preset::iso_8859_5).missing_glyph_substitute(U'?'));

    ASSERT_TRUE(atlas.mapping().has_value());
    EXPECT_EQ(*atlas.mapping(), mapping_preset::iso_8859_5);
    EXPECT_EQ(atlas.cell_characters()[96], U'\u00A0');
    EXPECT_EQ(atlas.cell_characters()[97], U'Ё');
    EXPECT_EQ(atlas.glyph_index(U'Ё'), 97u);
    EXPECT_EQ(atlas.glyph_index(U'§'), 96u + 0x5d);
    EXPECT_EQ(atlas.replacement_index(), 31u);

    // 'A' keeps its ASCII cell: column 1 of row 2
    EXPECT_EQ(atlas.pixel(5 * 1 + 4, 9 * 2 + 4), true);
}

TEST(mono_font, empty_font_gives_empty_image) {
    converted_font font;
    font.name = "empty";

    mono_font_output atlas;
    std::string err;
    ASSERT_TRUE(mono_font_output::build(font, atlas, err)) << err;
    EXPECT_EQ(atlas.image_width(), 0u);
    EXPECT_EQ(atlas.image_height(), 0u);
    EXPECT_TRUE(atlas.data().empty());
    EXPECT_EQ(atlas.baseline(), 0u);
}

TEST(mono_font, oversized_atlas_is_rejected) {
    bdf_glyph glyph;
    glyph.name = "wide";
    glyph.encoding = bdf_encoding::standard(U'w');
    glyph.bounding_box.size = {200000000, 1};

    converted_font font;
    font.name = "wide";
    font.glyphs.push_back(glyph);

    mono_font_output atlas;
    std::string err;
    EXPECT_FALSE(mono_font_output::build(font, atlas, err));
    EXPECT_EQ(err, "atlas image of 3200000000x1 pixels is too large");

    // 16 cells of this width no longer fit a 32 bit image width
    font.glyphs[0].bounding_box.size = {300000000, 1};
    EXPECT_FALSE(mono_font_output::build(font, atlas, err));
    EXPECT_EQ(err, "atlas image of 4800000000x1 pixels is too large");
}
