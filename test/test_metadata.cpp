/// \file
/// \brief Unit tests for the BDF header parser.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "bdfconv/metadata.h"

namespace {

/// \brief parse_header.
bool parse_header(bdf_lines& lines, bdf_metadata& out, bdf_parser_error& err) {
    const bdf_parse_options opt;
    return bdf_metadata::parse(lines, opt, out, err);
}

} // namespace

TEST(bdf_metadata, reads_required_fields_and_stops_at_chars) {
    bdf_lines lines(
        "FONT -Misc-Fixed\n"
        "SIZE 16 75 100\n"
        "FONTBOUNDINGBOX 8 16 0 -4\n"
        "STARTPROPERTIES 1\n"
        "FONT_ASCENT 12\n"
        "ENDPROPERTIES\n"
        "CHARS 0\n");

    bdf_metadata meta;
    bdf_parser_error err;
    ASSERT_TRUE(parse_header(lines, meta, err)) << err.to_string();

    EXPECT_EQ(meta.name, "-Misc-Fixed");
    EXPECT_EQ(meta.point_size, 16);
    EXPECT_EQ(meta.resolution, (bdf_coord{75, 100}));
    EXPECT_EQ(meta.bounding_box, (bdf_bounding_box{bdf_coord{0, -4}, bdf_coord{8, 16}}));
    EXPECT_EQ(meta.metrics_set, bdf_metrics_set::horizontal);
    EXPECT_EQ(meta.properties.size(), 1u);

    // CHARS is left for the glyph section
    const auto next = lines.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->keyword, "CHARS");
}

TEST(bdf_metadata, stops_at_startchar_without_chars) {
    bdf_lines lines("FONT f\nSIZE 8 72 72\nFONTBOUNDINGBOX 1 1 0 0\nSTARTCHAR A\n");

    bdf_metadata meta;
    bdf_parser_error err;
    ASSERT_TRUE(parse_header(lines, meta, err));
    const auto next = lines.next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->keyword, "STARTCHAR");
}

TEST(bdf_metadata, metrics_set_values) {
    for (const auto& [value, expected] : {
             std::pair{"0", bdf_metrics_set::horizontal},
             std::pair{"1", bdf_metrics_set::vertical},
             std::pair{"2", bdf_metrics_set::both}}) {
        bdf_lines lines(std::string("FONT f\nSIZE 8 72 72\nFONTBOUNDINGBOX 1 1 0 0\nMETRICSSET ") + value + "\n");
        bdf_metadata meta;
        bdf_parser_error err;
        ASSERT_TRUE(parse_header(lines, meta, err)) << value;
        EXPECT_EQ(meta.metrics_set, expected);
    }

    bdf_lines bad("FONT f\nMETRICSSET 3\n");
    bdf_metadata meta;
    bdf_parser_error err;
    EXPECT_FALSE(parse_header(bad, meta, err));
    EXPECT_EQ(err.to_string(), "line 2: invalid \"METRICSSET\"");
}

TEST(bdf_metadata, missing_required_fields) {
    bdf_metadata meta;
    bdf_parser_error err;

    bdf_lines no_font("SIZE 8 72 72\nFONTBOUNDINGBOX 1 1 0 0\nCHARS 0\n");
    EXPECT_FALSE(parse_header(no_font, meta, err));
    EXPECT_EQ(err.message, "missing \"FONT\"");

    bdf_lines no_box("FONT f\nSIZE 8 72 72\nCHARS 0\n");
    EXPECT_FALSE(parse_header(no_box, meta, err));
    EXPECT_EQ(err.message, "missing \"FONTBOUNDINGBOX\"");

    bdf_lines no_size("FONT f\nFONTBOUNDINGBOX 1 1 0 0\nCHARS 0\n");
    EXPECT_FALSE(parse_header(no_size, meta, err));
    EXPECT_EQ(err.message, "missing \"SIZE\"");
    EXPECT_FALSE(err.line_number.has_value());
}

TEST(bdf_metadata, invalid_values_report_their_line) {
    bdf_metadata meta;
    bdf_parser_error err;

    bdf_lines size("FONT f\nSIZE 8 72\n");
    EXPECT_FALSE(parse_header(size, meta, err));
    EXPECT_EQ(err.to_string(), "line 2: invalid \"SIZE\"");

    bdf_lines box("FONT f\n\nFONTBOUNDINGBOX 1 1 0\n");
    EXPECT_FALSE(parse_header(box, meta, err));
    EXPECT_EQ(err.to_string(), "line 3: invalid \"FONTBOUNDINGBOX\"");
}

TEST(bdf_metadata, unknown_keyword_is_an_error) {
    bdf_lines lines("FONT f\nFOO bar\n");
    bdf_metadata meta;
    bdf_parser_error err;
    EXPECT_FALSE(parse_header(lines, meta, err));
    EXPECT_EQ(err.message, "unknown keyword in metadata: \"FOO\"");
    EXPECT_EQ(err.line_number, 2u);
}
