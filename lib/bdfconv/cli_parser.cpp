#include "bdfconv/cli_parser.h"
#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "bdfconv/unicode.h"

extern "C" {
#include <argparse.h>
}

// ---- helpers -------------------------------------------------------------

namespace {

// argparse callback, option->data points at the std::vector<std::string> to fill
int append_comment(struct argparse*, const struct argparse_option* option) {
    const char* text = *static_cast<const char**>(option->value);
    if (text) reinterpret_cast<std::vector<std::string>*>(option->data)->emplace_back(text);
    return 0;
}

} // namespace

std::optional<char32_t> cli_parser::parse_char(std::string_view s) {
    if (s.size() > 2 && (s[0] == 'U' || s[0] == 'u') && s[1] == '+') {
        const std::string_view hex = s.substr(2);
        if (hex.size() > 6) return std::nullopt;
        std::uint32_t value = 0;
        const auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
        if (ec != std::errc{} || ptr != hex.data() + hex.size()) return std::nullopt;
        if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) return std::nullopt;
        return static_cast<char32_t>(value);
    }

    const auto decoded = decode_utf8(s);
    if (!decoded || decoded->size() != 1) return std::nullopt;
    return decoded->front();
}

bool cli_parser::parse_glyph_ranges(std::string_view s, std::vector<glyph_range_item>& out) {
    std::vector<glyph_range_item> items;
    while (true) {
        const std::size_t comma = s.find(',');
        const std::string_view item = s.substr(0, comma);
        if (item.empty()) return false;

        if (const auto c = parse_char(item)) {
            items.push_back({*c, *c});
        } else {
            // "a-z", also "!--" where the range ends at '-'
            bool found = false;
            for (std::size_t dash = item.find('-'); dash != std::string_view::npos; dash = item.find('-', dash + 1)) {
                const auto first = parse_char(item.substr(0, dash));
                const auto last = parse_char(item.substr(dash + 1));
                if (!first || !last) continue;
                if (*first > *last) return false;
                items.push_back({*first, *last});
                found = true;
                break;
            }
            if (!found) return false;
        }

        if (comma == std::string_view::npos) break;
        s.remove_prefix(comma + 1);
    }
    out = std::move(items);
    return true;
}

// ---- parse ---------------------------------------------------------------

int cli_parser::parse(int argc, const char** argv, bdfconv_options& out) const {
    // argparse target variables
    const char* mapping_str = nullptr;
    const char* glyph_range_str = nullptr;
    const char* substitute_str = nullptr;
    const char* replacement_str = nullptr;
    const char* comment_str = nullptr;
    const char* plugin_dir_str = nullptr;
    const char* exporter_str = nullptr;
    const char* exporter_params_str = nullptr;
    const char* out_file_str = nullptr;

    int list_mappings_flag = 0;
    int lenient_end_flag = 0;
    int strict_counts_flag = 0;

    const char* const usage[] = {
        "bdfconv [options] <bdf_file> <name>",
        "bdfconv --list-mappings",
        nullptr
    };

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"

    // Use macros to avoid missing-field warnings in C++
    struct argparse_option options[] = {
        // glyph selection
        OPT_STRING(  0, "mapping",     &mapping_str,     "convert all glyphs of a preset mapping"),
        OPT_STRING(  0, "glyph-range", &glyph_range_str, "glyphs to convert, e.g. A-Z,0-9,U+00C0-U+00FF"),
        OPT_STRING(  0, "missing-glyph-substitute", &substitute_str,  "glyph used for requested glyphs missing in the font"),
        OPT_STRING(  0, "replacement-character",    &replacement_str, "glyph drawn for characters without a glyph"),
        OPT_STRING(  0, "comment",     &comment_str,     "comment added to generated code, may be repeated",
                   &append_comment, reinterpret_cast<intptr_t>(&out.comments)),
        OPT_BOOLEAN( 0, "list-mappings", &list_mappings_flag, "list preset mappings and exit"),

        // parser strictness
        OPT_BOOLEAN( 0, "lenient-end",   &lenient_end_flag,   "ignore data after ENDFONT"),
        OPT_BOOLEAN( 0, "strict-counts", &strict_counts_flag, "check STARTPROPERTIES and CHARS counts"),

        // plugins
        OPT_STRING(  0, "plugin-dir", &plugin_dir_str, "directory with exporter plugins"),

        // output file
        OPT_STRING('o', "output",  &out_file_str, "output filename"),

        // exporter and parameters
        OPT_STRING('e', "exporter",            &exporter_str,         "exporter name (plugin)"),
        OPT_STRING(  0, "exporter-parameters", &exporter_params_str,  "parameters for exporter (quoted ok)"),
        OPT_STRING('p', "ep",                  &exporter_params_str,  "alias for --exporter-parameters"),

        OPT_HELP(),
        OPT_END()
    };

#pragma GCC diagnostic pop

    struct argparse ap{};
    argparse_init(&ap, options, usage, 0);
    argparse_describe(&ap, "bdfconv BDF font converter",
                           "example: bdfconv --mapping ascii -e raw_c -o font.c 6x10.bdf FONT_6X10");
    int nargs = argparse_parse(&ap, argc, argv);

    out.list_mappings = (list_mappings_flag != 0);
    out.lenient_end = (lenient_end_flag != 0);
    out.strict_counts = (strict_counts_flag != 0);
    if (plugin_dir_str) out.plugin_dir = plugin_dir_str;
    if (out_file_str) out.output_file = out_file_str;
    if (exporter_str) out.exporter = exporter_str;
    if (exporter_params_str) out.exporter_parameters = exporter_params_str;

    if (out.list_mappings) return 0;

    // positional arguments are moved to the front of argv
    if (nargs < 2) {
        std::cerr << "error: BDF file and font name are required\n";
        return 1;
    }
    if (nargs > 2) {
        std::cerr << "error: unexpected argument: " << argv[2] << "\n";
        return 1;
    }
    out.input_file = std::filesystem::path(argv[0]);
    out.name = argv[1];

    if (mapping_str && glyph_range_str) {
        std::cerr << "error: --mapping and --glyph-range cannot be combined\n";
        return 1;
    }
    if (mapping_str) {
        out.mapping = parse_mapping_preset(mapping_str);
        if (!out.mapping) {
            std::cerr << "error: invalid --mapping; see --list-mappings\n";
            return 2;
        }
    }
    if (glyph_range_str && !parse_glyph_ranges(glyph_range_str, out.glyph_ranges)) {
        std::cerr << "error: invalid --glyph-range; expected comma separated characters or first-last ranges\n";
        return 2;
    }
    if (substitute_str) {
        out.missing_glyph_substitute = parse_char(substitute_str);
        if (!out.missing_glyph_substitute) {
            std::cerr << "error: invalid --missing-glyph-substitute; expected one character or U+XXXX\n";
            return 2;
        }
    }
    if (replacement_str) {
        out.replacement_character = parse_char(replacement_str);
        if (!out.replacement_character) {
            std::cerr << "error: invalid --replacement-character; expected one character or U+XXXX\n";
            return 2;
        }
    }

    if (out.exporter.empty()) {
        std::cerr << "warning: no --exporter specified; the font is only checked\n";
    }
    return 0;
}
