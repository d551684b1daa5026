/// \file
/// \brief Raw binary exporter plugin implementation.
///
/// This source file implements one part of the bdfconv pipeline architecture. It writes either the packed glyph bit stream or the atlas image bytes unchanged to a file.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/plugin.h"
#include "bdfconv/plugin_util.h"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string_view>

namespace {

/// \brief export_raw_bin.
int export_raw_bin(
    const bdfconv_font* font,
    const char* output_path,
    const bdfconv_kv* options,
    unsigned options_count,
    char* errbuf,
    unsigned errbuf_len
) {
    if (!font) {
        plugin_set_err(errbuf, errbuf_len, "raw_bin: font data missing");
        return 10;
    }
    if (!output_path || output_path[0] == '\0') {
        plugin_set_err(errbuf, errbuf_len, "raw_bin: output path is empty");
        return 11;
    }

    const plugin_kv_view kv{options, options_count};

    std::span<const std::uint8_t> bytes;
    const std::string_view source = kv.get("source").value_or("packed");
    if (source == "packed") {
        bytes = plugin_bytes(font->packed_data, font->packed_size);
    } else if (source == "atlas") {
        bytes = plugin_bytes(font->atlas_data, font->atlas_size);
    } else {
        plugin_set_err(errbuf, errbuf_len, "raw_bin: source must be packed or atlas");
        return 12;
    }

    std::ofstream out{output_path, std::ios::binary | std::ios::trunc};
    if (!out.is_open()) {
        plugin_set_err(errbuf, errbuf_len, "raw_bin: cannot open output file");
        return 13;
    }

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        plugin_set_err(errbuf, errbuf_len, "raw_bin: failed while writing output");
        return 14;
    }
    return 0;
}

const bdfconv_plugin_info k_info = {
    "raw_bin",
    "Exports the packed glyph stream or the atlas image as raw bytes (.bin)",
    "bdfconv project",
    "bin",
    BDFCONV_PLUGIN_ABI_VERSION,
    &export_raw_bin
};

} // namespace

extern "C" BDFCONV_PLUGIN_API int bdfconv_plugin_get(const bdfconv_plugin_info** out) {
    if (!out) return 1;
    *out = &k_info;
    return 0;
}
