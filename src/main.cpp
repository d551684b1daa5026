#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "bdfconv/cli_parser.h"
#include "bdfconv/exported_font.h"
#include "bdfconv/font.h"
#include "bdfconv/font_converter.h"
#include "bdfconv/options.h"
#include "bdfconv/plugin.h"
#include "bdfconv/plugin_manager.h"
#include "bdfconv/plugin_options.h"

static void print_mappings() {
    for (const auto preset : all_mapping_presets()) {
        std::cout << mapping_preset_name(preset) << " (" << mapping_preset_characters(preset).size() << " glyphs)\n";
    }
}

static bool read_text_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

static font_converter make_converter(const bdfconv_options& opt) {
    font_converter converter(opt.name);
    if (opt.mapping) converter.glyphs(*opt.mapping);
    for (const auto& r : opt.glyph_ranges) converter.glyph_range(r.first, r.last);
    if (opt.missing_glyph_substitute) converter.missing_glyph_substitute(*opt.missing_glyph_substitute);
    if (opt.replacement_character) converter.replacement_character(*opt.replacement_character);
    for (const auto& c : opt.comments) converter.comment(c);
    return converter;
}

static void print_summary(const exported_font& font) {
    const auto& packed = font.packed();
    const auto& mono = font.mono();
    std::cout << "  glyphs: " << packed.glyphs().size() << "\n";
    std::cout << "  packed: " << packed.bit_count() << " bits\n";
    std::cout << "  atlas: " << mono.image_width() << "x" << mono.image_height()
              << " px, cell " << mono.character_width() << "x" << mono.character_height() << "\n";
    std::cout << "  mapping: "
              << (mono.mapping() ? std::string(mapping_preset_name(*mono.mapping())) : std::string("(range string)")) << "\n";
}

int main(int argc, const char** argv) {
    bdfconv_options opt;
    cli_parser parser;
    int rc = parser.parse(argc, argv, opt);
    if (rc) return rc;

    if (opt.list_mappings) {
        print_mappings();
        return 0;
    }

    std::string text;
    if (!read_text_file(opt.input_file, text)) {
        std::cerr << "error: couldn't read BDF file " << opt.input_file << "\n";
        return 1;
    }

    bdf_parse_options parse_opt;
    parse_opt.end_check = opt.lenient_end ? bdf_end_check::lenient : bdf_end_check::strict;
    parse_opt.enforce_declared_counts = opt.strict_counts;

    bdf_font bdf;
    bdf_parser_error parse_err;
    if (!bdf_font::parse(text, parse_opt, bdf, parse_err)) {
        std::cerr << "error: couldn't parse BDF file: " << parse_err.to_string() << "\n";
        return 1;
    }
    std::cout << "parsed " << bdf.glyphs.size() << " glyphs from " << opt.input_file.string() << "\n";

    std::string err;
    converted_font converted;
    if (!make_converter(opt).convert(bdf, converted, err)) {
        std::cerr << "error: " << err << "\n";
        return 1;
    }

    exported_font exported;
    if (!exported_font::build(converted, exported, err)) {
        std::cerr << "error: " << err << "\n";
        return 1;
    }

    if (opt.exporter.empty()) {
        print_summary(exported);
        return 0;
    }

    plugin_options params;
    if (!plugin_options::parse(opt.exporter_parameters, params, err)) {
        std::cerr << "error: " << err << "\n";
        return 1;
    }
    std::string output = opt.output_file.string();
    if (output.empty()) {
        if (const auto* v = params.get("output")) output = *v;
    }
    if (output.empty()) {
        std::cerr << "error: exporter output path is required (-o or output=...)\n";
        return 1;
    }

    plugin_manager plugins;
    plugins.load_from_dir(opt.plugin_dir);
    const loaded_plugin* exporter = plugins.find(opt.exporter);
    if (!exporter) {
        std::cerr << "error: exporter plugin not found: " << opt.exporter
                  << " (searched " << opt.plugin_dir.string() << ")\n";
        return 1;
    }

    const bdfconv_font view = exported.as_plugin_font();
    char errbuf[512] = {0};
    const int export_rc = exporter->info->export_font(
        &view, output.c_str(), params.data(), params.size(), errbuf, sizeof(errbuf));
    if (export_rc != 0) {
        std::cerr << "error: exporter " << exporter->info->name << " failed (" << export_rc << ")";
        if (errbuf[0] != '\0') std::cerr << ": " << errbuf;
        std::cerr << "\n";
        return 1;
    }

    std::cout << "exported with plugin: " << exporter->info->name << "\n";
    return 0;
}
