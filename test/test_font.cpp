/// \file
/// \brief End-to-end tests for the BDF font parser.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "bdfconv/font.h"

namespace {

const char* const k_minimal_font =
    "STARTFONT 2.1\n"
    "FONT -gbdfed-Fixed-Medium-R-Normal--16-120-96-96-M-80-ISO10646-1\n"
    "SIZE 16 75 75\n"
    "FONTBOUNDINGBOX 16 24 0 0\n"
    "STARTPROPERTIES 3\n"
    "COPYRIGHT \"Copyright \"\"quoted\"\"\"\n"
    "FONT_ASCENT 14\n"
    "FONT_DESCENT 2\n"
    "ENDPROPERTIES\n"
    "CHARS 1\n"
    "STARTCHAR A\n"
    "ENCODING 65\n"
    "SWIDTH 500 0\n"
    "DWIDTH 8 0\n"
    "BBX 8 8 0 0\n"
    "BITMAP\n"
    "1f\n"
    "01\n"
    "ENDCHAR\n"
    "ENDFONT\n";

/// \brief read_file.
std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// \brief replace_all.
std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    for (std::size_t pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
    }
    return text;
}

} // namespace

TEST(bdf_font, parses_minimal_font) {
    bdf_font font;
    bdf_parser_error err;
    ASSERT_TRUE(bdf_font::parse(k_minimal_font, font, err)) << err.to_string();

    EXPECT_EQ(font.metadata.name, "-gbdfed-Fixed-Medium-R-Normal--16-120-96-96-M-80-ISO10646-1");
    EXPECT_EQ(font.metadata.point_size, 16);
    EXPECT_EQ(font.metadata.properties.size(), 3u);

    std::string copyright;
    EXPECT_EQ(font.metadata.properties.try_get(bdf_property::copyright, copyright), bdf_property_status::ok);
    EXPECT_EQ(copyright, "Copyright \"quoted\"");

    ASSERT_EQ(font.glyphs.size(), 1u);
    const bdf_glyph* a = font.glyphs.get(U'A');
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->bitmap, (std::vector<std::uint8_t>{0x1f, 0x01}));
}

TEST(bdf_font, endfont_and_line_endings_do_not_matter) {
    bdf_font reference;
    bdf_parser_error err;
    ASSERT_TRUE(bdf_font::parse(k_minimal_font, reference, err));

    const std::string without_end = replace_all(k_minimal_font, "ENDFONT\n", "");
    const std::string crlf = replace_all(k_minimal_font, "\n", "\r\n");
    const std::string leading_blank = std::string("\n\n") + k_minimal_font;

    for (const std::string& text : {without_end, crlf, leading_blank, replace_all(without_end, "\n", "\r\n")}) {
        bdf_font font;
        ASSERT_TRUE(bdf_font::parse(text, font, err)) << err.to_string();
        EXPECT_EQ(font, reference);
    }
}

TEST(bdf_font, banner_is_required) {
    bdf_font font;
    bdf_parser_error err;

    EXPECT_FALSE(bdf_font::parse("", font, err));
    EXPECT_EQ(err.to_string(), "empty input");

    EXPECT_FALSE(bdf_font::parse("\n  \nCOMMENT only\n", font, err));
    EXPECT_EQ(err.to_string(), "empty input");

    EXPECT_FALSE(bdf_font::parse("STARTFONT 2.2\nFONT f\n", font, err));
    EXPECT_EQ(err.to_string(), "line 1: expected \"STARTFONT 2.1\"");

    EXPECT_FALSE(bdf_font::parse("\nFONT f\n", font, err));
    EXPECT_EQ(err.to_string(), "line 2: expected \"STARTFONT 2.1\"");
}

TEST(bdf_font, first_error_aborts_with_line_number) {
    const std::string broken = replace_all(k_minimal_font, "01\n", "0x\n");
    bdf_font font;
    bdf_parser_error err;
    EXPECT_FALSE(bdf_font::parse(broken, font, err));
    EXPECT_EQ(err.to_string(), "line 18: invalid hex data in BITMAP");
}

TEST(bdf_font, trailing_data_is_rejected_unless_lenient) {
    const std::string text = read_file(std::filesystem::path(TEST_DATA_DIR) / "trailing.bdf");
    ASSERT_FALSE(text.empty());

    bdf_font font;
    bdf_parser_error err;
    EXPECT_FALSE(bdf_font::parse(text, font, err));
    EXPECT_EQ(err.to_string(), "line 13: unexpected data after \"ENDFONT\"");

    bdf_parse_options opt;
    opt.end_check = bdf_end_check::lenient;
    ASSERT_TRUE(bdf_font::parse(text, opt, font, err)) << err.to_string();
    ASSERT_NE(font.glyphs.get(U'A'), nullptr);
    EXPECT_EQ(font.glyphs.get(U'A')->bitmap, (std::vector<std::uint8_t>{0xff}));
}

TEST(bdf_font, declared_counts_are_advisory_unless_enforced) {
    const std::string lying = replace_all(replace_all(k_minimal_font, "CHARS 1", "CHARS 4"),
                                          "STARTPROPERTIES 3", "STARTPROPERTIES 2");
    bdf_font font;
    bdf_parser_error err;
    EXPECT_TRUE(bdf_font::parse(lying, font, err)) << err.to_string();

    bdf_parse_options opt;
    opt.enforce_declared_counts = true;
    EXPECT_TRUE(bdf_font::parse(k_minimal_font, opt, font, err)) << err.to_string();

    EXPECT_FALSE(bdf_font::parse(lying, opt, font, err));
    EXPECT_EQ(err.to_string(), "line 9: property count mismatch: declared 2, found 3");

    const std::string wrong_chars = replace_all(k_minimal_font, "CHARS 1", "CHARS 4");
    EXPECT_FALSE(bdf_font::parse(wrong_chars, opt, font, err));
    EXPECT_EQ(err.to_string(), "line 10: glyph count mismatch: declared 4, found 1");
}

TEST(bdf_font, sample_font_from_disk) {
    const std::string text = read_file(std::filesystem::path(TEST_DATA_DIR) / "sample.bdf");
    ASSERT_FALSE(text.empty());

    bdf_font font;
    bdf_parser_error err;
    ASSERT_TRUE(bdf_font::parse(text, font, err)) << err.to_string();

    EXPECT_EQ(font.glyphs.size(), 10u);
    EXPECT_EQ(font.metadata.bounding_box, (bdf_bounding_box{bdf_coord{0, -2}, bdf_coord{6, 10}}));

    std::int32_t ascent = 0;
    EXPECT_EQ(font.metadata.properties.try_get(bdf_property::font_ascent, ascent), bdf_property_status::ok);
    EXPECT_EQ(ascent, 8);

    const bdf_glyph* question = font.glyphs.get(U'?');
    ASSERT_NE(question, nullptr);
    ASSERT_TRUE(question->width_horizontal.has_value());
    EXPECT_EQ(question->width_horizontal->scalable.x, 576);

    EXPECT_NE(font.glyphs.find(bdf_encoding::non_standard(200)), nullptr);
    EXPECT_EQ(font.glyphs.get(U'Z'), nullptr);
}
