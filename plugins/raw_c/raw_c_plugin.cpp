/// \file
/// \brief C source exporter plugin implementation.
///
/// This source file implements one part of the bdfconv pipeline architecture. It renders a converted font as C constants: either the packed bit stream with its glyph table, or the atlas image with its mapping and metrics.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/plugin.h"
#include "bdfconv/plugin_util.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace {

struct c_style {
    int bytes_per_line{12};
    bool uppercase_hex{false};
    std::string qualifier;   // "" or "static "
};

/// \brief sanitize_c_ident.
std::string sanitize_c_ident(std::string value) {
    if (value.empty()) return "font";
    for (char& c : value) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '_')) c = '_';
    }
    const unsigned char first = static_cast<unsigned char>(value.front());
    if (!(std::isalpha(first) || value.front() == '_')) value.insert(value.begin(), '_');
    return value;
}

/// \brief hex.
std::string hex(std::uint32_t value, int digits, bool uppercase) {
    std::ostringstream h;
    if (uppercase) h.setf(std::ios::uppercase);
    h << "0x" << std::hex;
    h.width(digits);
    h.fill('0');
    h << value;
    return h.str();
}

/// \brief write_byte_array.
void write_byte_array(std::ostringstream& text, const c_style& style, const std::string& symbol, std::span<const std::uint8_t> bytes) {
    const auto per_line = static_cast<std::size_t>(style.bytes_per_line);
    text << style.qualifier << "const uint8_t " << symbol << "[" << (bytes.empty() ? 1 : bytes.size()) << "] = {\n";
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i % per_line == 0) text << "    ";
        text << hex(bytes[i], 2, style.uppercase_hex);
        if (i + 1 < bytes.size()) text << ",";
        text << (((i + 1) % per_line == 0 || i + 1 == bytes.size()) ? "\n" : " ");
    }
    if (bytes.empty()) text << "    0x00\n";
    text << "};\n";
}

/// \brief write_u32.
void write_u32(std::ostringstream& text, const c_style& style, const std::string& symbol, std::uint32_t value) {
    text << style.qualifier << "const uint32_t " << symbol << " = " << value << "u;\n";
}

/// \brief write_packed.
void write_packed(std::ostringstream& text, const bdfconv_font& font, const c_style& style, const std::string& symbol) {
    text << "#ifndef BDFCONV_PACKED_GLYPH_DEFINED\n";
    text << "#define BDFCONV_PACKED_GLYPH_DEFINED\n";
    text << "typedef struct bdfconv_packed_glyph {\n";
    text << "    uint32_t character;\n";
    text << "    int32_t x;\n";
    text << "    int32_t y;\n";
    text << "    uint32_t width;\n";
    text << "    uint32_t height;\n";
    text << "    uint32_t device_width;\n";
    text << "    uint32_t start_index;\n";
    text << "} bdfconv_packed_glyph;\n";
    text << "#endif\n\n";

    write_byte_array(text, style, symbol + "_data", plugin_bytes(font.packed_data, font.packed_size));
    text << "\n";

    text << style.qualifier << "const bdfconv_packed_glyph " << symbol << "_glyphs["
         << (font.packed_glyph_count == 0 ? 1u : font.packed_glyph_count) << "] = {\n";
    for (unsigned i = 0; i < font.packed_glyph_count; ++i) {
        const bdfconv_packed_glyph& g = font.packed_glyphs[i];
        text << "    { " << hex(g.character, 4, style.uppercase_hex) << ", " << g.x << ", " << g.y << ", "
             << g.width << ", " << g.height << ", " << g.device_width << ", " << g.start_index << " },\n";
    }
    if (font.packed_glyph_count == 0) text << "    { 0, 0, 0, 0, 0, 0, 0 },\n";
    text << "};\n\n";

    write_u32(text, style, symbol + "_glyph_count", font.packed_glyph_count);
    write_u32(text, style, symbol + "_replacement", font.replacement_index);
    write_u32(text, style, symbol + "_ascent", font.ascent);
    write_u32(text, style, symbol + "_descent", font.descent);
}

/// \brief write_mono.
void write_mono(std::ostringstream& text, const bdfconv_font& font, const c_style& style, const std::string& symbol) {
    write_byte_array(text, style, symbol + "_image", plugin_bytes(font.atlas_data, font.atlas_size));
    text << "\n";

    if (font.mapping_preset) {
        text << style.qualifier << "const char " << symbol << "_mapping_preset[] = \"" << font.mapping_preset << "\";\n";
    }
    // range string: 0 followed by two characters is an inclusive range
    text << style.qualifier << "const uint32_t " << symbol << "_mapping["
         << (font.mapping_length == 0 ? 1u : font.mapping_length) << "] = {";
    for (unsigned i = 0; i < font.mapping_length; ++i) {
        if (i % 8 == 0) text << "\n    ";
        text << hex(font.mapping[i], 4, style.uppercase_hex);
        if (i + 1 < font.mapping_length) text << ", ";
    }
    if (font.mapping_length == 0) text << "\n    0";
    text << "\n};\n";
    write_u32(text, style, symbol + "_mapping_length", font.mapping_length);
    text << "\n";

    write_u32(text, style, symbol + "_image_width", font.atlas_width);
    write_u32(text, style, symbol + "_image_height", font.atlas_height);
    write_u32(text, style, symbol + "_character_width", font.character_width);
    write_u32(text, style, symbol + "_character_height", font.character_height);
    write_u32(text, style, symbol + "_character_spacing", font.character_spacing);
    write_u32(text, style, symbol + "_baseline", font.baseline);
    write_u32(text, style, symbol + "_underline_offset", font.underline_offset);
    write_u32(text, style, symbol + "_underline_height", font.underline_height);
    write_u32(text, style, symbol + "_strikethrough_offset", font.strikethrough_offset);
    write_u32(text, style, symbol + "_strikethrough_height", font.strikethrough_height);
    write_u32(text, style, symbol + "_replacement", font.atlas_replacement_index);
}

/// \brief export_raw_c.
int export_raw_c(
    const bdfconv_font* font,
    const char* output_path,
    const bdfconv_kv* options,
    unsigned options_count,
    char* errbuf,
    unsigned errbuf_len
) {
    if (!font || !font->name) {
        plugin_set_err(errbuf, errbuf_len, "raw_c: font data missing");
        return 10;
    }
    if (!output_path || output_path[0] == '\0') {
        plugin_set_err(errbuf, errbuf_len, "raw_c: output path is empty");
        return 11;
    }

    const plugin_kv_view kv{options, options_count};

    c_style style;
    const auto bytes_per_line = plugin_parse_int_in_range(kv.get("bytes_per_line"), 12, 1, 1024);
    if (!bytes_per_line) {
        plugin_set_err(errbuf, errbuf_len, "raw_c: bytes_per_line must be in range 1..1024");
        return 12;
    }
    style.bytes_per_line = *bytes_per_line;
    style.uppercase_hex = plugin_parse_bool(kv.get("uppercase_hex"), false);
    style.qualifier = plugin_parse_bool(kv.get("static"), false) ? "static " : "";
    const bool include_stdint = plugin_parse_bool(kv.get("include_stdint"), true);

    const std::string_view format = kv.get("format").value_or("packed");
    if (format != "packed" && format != "mono") {
        plugin_set_err(errbuf, errbuf_len, "raw_c: format must be packed or mono");
        return 13;
    }

    std::string symbol = sanitize_c_ident(font->name);
    if (const auto v = kv.get("symbol"); v && !v->empty()) {
        symbol = sanitize_c_ident(std::string(*v));
    }

    const std::filesystem::path out_path{output_path};
    std::ostringstream text;
    text << "// " << out_path.filename().string() << "\n";
    for (unsigned i = 0; i < font->comment_count; ++i) {
        if (font->comments[i]) text << "// " << font->comments[i] << "\n";
    }
    text << "//\n";
    text << "// Format is " << format << ", generated by bdfconv.\n";
    if (include_stdint) text << "#include <stdint.h>\n";
    text << "\n";

    if (format == "packed") {
        write_packed(text, *font, style, symbol);
    } else {
        write_mono(text, *font, style, symbol);
    }

    std::ofstream out{output_path, std::ios::out | std::ios::trunc};
    if (!out.is_open()) {
        plugin_set_err(errbuf, errbuf_len, "raw_c: cannot open output file");
        return 14;
    }
    out << text.str();
    if (!out.good()) {
        plugin_set_err(errbuf, errbuf_len, "raw_c: failed while writing output");
        return 15;
    }
    return 0;
}

const bdfconv_plugin_info k_info = {
    "raw_c",
    "Exports the converted font as C constants (packed glyph stream or mono atlas)",
    "bdfconv project",
    "c",
    BDFCONV_PLUGIN_ABI_VERSION,
    &export_raw_c
};

} // namespace

extern "C" BDFCONV_PLUGIN_API int bdfconv_plugin_get(const bdfconv_plugin_info** out) {
    if (!out) return 1;
    *out = &k_info;
    return 0;
}
