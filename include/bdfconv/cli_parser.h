#pragma once
#include <optional>
#include <string_view>
#include <vector>

#include "options.h"

class cli_parser {
public:
    // returns 0 on success, 1 on usage errors, 2 on invalid option values.
    // Note: -h/--help is handled by argparse and will print usage & exit(0).
    int parse(int argc, const char** argv, bdfconv_options& out) const;

    // "A", "ä" or "U+00E4"
    static std::optional<char32_t> parse_char(std::string_view s);
    // "A-Z,0-9,_,U+00C0-U+00FF"
    static bool parse_glyph_ranges(std::string_view s, std::vector<glyph_range_item>& out);
};
