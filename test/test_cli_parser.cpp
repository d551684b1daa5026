#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <bdfconv/cli_parser.h>
#include <bdfconv/options.h>

// helper to build argc/argv arrays
struct argv_builder {
    std::vector<std::string> storage;
    std::vector<const char*> ptrs;

    argv_builder& arg(std::string s) { storage.push_back(std::move(s)); return *this; }
    std::pair<int,const char**> finalize() {
        ptrs.clear();
        for (auto& s : storage) ptrs.push_back(s.c_str());
        ptrs.push_back(nullptr);
        return { static_cast<int>(ptrs.size() - 1), ptrs.data() };
    }
};

TEST(cli_parser, full_export_command) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("--glyph-range").arg("A-Z,0-9,_")
     .arg("--missing-glyph-substitute").arg("?")
     .arg("--replacement-character").arg("U+FFFD")
     .arg("--comment").arg("generated font")
     .arg("--plugin-dir").arg("build/plugins")
     .arg("-o").arg("out/font.c")
     .arg("--exporter").arg("raw_c")
     .arg("--exporter-parameters").arg("format=mono,static=1")
     .arg("fonts/6x10.bdf")
     .arg("FONT_6X10");

    auto [argc, argv] = b.finalize();
    int rc = p.parse(argc, argv, opt);
    ASSERT_EQ(rc, 0);

    EXPECT_EQ(opt.input_file.string(), "fonts/6x10.bdf");
    EXPECT_EQ(opt.name, "FONT_6X10");
    EXPECT_FALSE(opt.mapping.has_value());

    ASSERT_EQ(opt.glyph_ranges.size(), 3u);
    EXPECT_EQ(opt.glyph_ranges[0].first, U'A');
    EXPECT_EQ(opt.glyph_ranges[0].last, U'Z');
    EXPECT_EQ(opt.glyph_ranges[1].first, U'0');
    EXPECT_EQ(opt.glyph_ranges[1].last, U'9');
    EXPECT_EQ(opt.glyph_ranges[2].first, U'_');
    EXPECT_EQ(opt.glyph_ranges[2].last, U'_');

    EXPECT_EQ(opt.missing_glyph_substitute, U'?');
    EXPECT_EQ(opt.replacement_character, char32_t{0xFFFD});
    ASSERT_EQ(opt.comments.size(), 1u);
    EXPECT_EQ(opt.comments[0], "generated font");

    EXPECT_EQ(opt.plugin_dir.string(), "build/plugins");
    EXPECT_EQ(opt.output_file.string(), "out/font.c");
    EXPECT_EQ(opt.exporter, "raw_c");
    EXPECT_EQ(opt.exporter_parameters, "format=mono,static=1");
    EXPECT_FALSE(opt.lenient_end);
    EXPECT_FALSE(opt.strict_counts);
}

TEST(cli_parser, repeated_comments_accumulate) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("--comment").arg("first line")
     .arg("--comment=second line")
     .arg("--comment").arg("third line")
     .arg("font.bdf")
     .arg("FONT");

    auto [argc, argv] = b.finalize();
    ASSERT_EQ(p.parse(argc, argv, opt), 0);

    ASSERT_EQ(opt.comments.size(), 3u);
    EXPECT_EQ(opt.comments[0], "first line");
    EXPECT_EQ(opt.comments[1], "second line");
    EXPECT_EQ(opt.comments[2], "third line");
}

TEST(cli_parser, mapping_flags_and_aliases) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("font.bdf")
     .arg("--mapping").arg("iso_8859_15")
     .arg("--lenient-end")
     .arg("--strict-counts")
     .arg("-e").arg("png")
     .arg("-p").arg("scale=2")                // alias for --exporter-parameters
     .arg("latin9");

    auto [argc, argv] = b.finalize();
    int rc = p.parse(argc, argv, opt);
    ASSERT_EQ(rc, 0);

    EXPECT_EQ(opt.input_file.string(), "font.bdf");
    EXPECT_EQ(opt.name, "latin9");
    EXPECT_EQ(opt.mapping, mapping_preset::iso_8859_15);
    EXPECT_TRUE(opt.lenient_end);
    EXPECT_TRUE(opt.strict_counts);
    EXPECT_EQ(opt.exporter, "png");
    EXPECT_EQ(opt.exporter_parameters, "scale=2");
    EXPECT_EQ(opt.plugin_dir.string(), "plugins");
}

TEST(cli_parser, list_mappings_needs_no_positionals) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv").arg("--list-mappings");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 0);
    EXPECT_TRUE(opt.list_mappings);
}

TEST(cli_parser, missing_positionals_is_error) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv").arg("font.bdf");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 1);
}

TEST(cli_parser, mapping_and_range_are_exclusive) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("--mapping").arg("ascii")
     .arg("--glyph-range").arg("a-z")
     .arg("font.bdf").arg("f");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 1);
}

TEST(cli_parser, unknown_mapping_returns_error) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("--mapping").arg("ebcdic")
     .arg("font.bdf").arg("f");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 2);
}

TEST(cli_parser, invalid_glyph_range_returns_error) {
    for (const char* bad : {"z-a", "a-", "A-Z,,0", "", "ab", "U+110000"}) {
        cli_parser p;
        bdfconv_options opt;

        argv_builder b;
        b.arg("bdfconv")
         .arg("--glyph-range").arg(bad)
         .arg("font.bdf").arg("f");

        auto [argc, argv] = b.finalize();
        EXPECT_EQ(p.parse(argc, argv, opt), 2) << bad;
    }
}

TEST(cli_parser, invalid_substitute_returns_error) {
    cli_parser p;
    bdfconv_options opt;

    argv_builder b;
    b.arg("bdfconv")
     .arg("--missing-glyph-substitute").arg("??")
     .arg("font.bdf").arg("f");

    auto [argc, argv] = b.finalize();
    EXPECT_EQ(p.parse(argc, argv, opt), 2);
}

TEST(cli_parser, parse_char_forms) {
    EXPECT_EQ(cli_parser::parse_char("A"), U'A');
    EXPECT_EQ(cli_parser::parse_char("\xC3\xA4"), U'ä');
    EXPECT_EQ(cli_parser::parse_char("U+00E4"), U'ä');
    EXPECT_EQ(cli_parser::parse_char("u+20ac"), U'€');
    EXPECT_EQ(cli_parser::parse_char("U"), U'U');
    EXPECT_FALSE(cli_parser::parse_char("").has_value());
    EXPECT_FALSE(cli_parser::parse_char("U+D800").has_value());
    EXPECT_FALSE(cli_parser::parse_char("U+12G").has_value());
}

TEST(cli_parser, glyph_ranges_with_dashes) {
    std::vector<glyph_range_item> ranges;
    ASSERT_TRUE(cli_parser::parse_glyph_ranges("!--,-,U+00C0-U+00FF", ranges));
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].first, U'!');
    EXPECT_EQ(ranges[0].last, U'-');
    EXPECT_EQ(ranges[1].first, U'-');
    EXPECT_EQ(ranges[1].last, U'-');
    EXPECT_EQ(ranges[2].first, char32_t{0xC0});
    EXPECT_EQ(ranges[2].last, char32_t{0xFF});
}
