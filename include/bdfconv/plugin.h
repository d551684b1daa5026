#pragma once

#include <stddef.h>
#include <stdint.h>

// Stable C ABI for exporter plugins
#ifdef __cplusplus
extern "C" {
#endif

// ABI versioning
#define BDFCONV_PLUGIN_ABI_VERSION 1

// symbol visibility (gcc/clang)
#if defined(__GNUC__) || defined(__clang__)
#define BDFCONV_PLUGIN_API __attribute__((visibility("default")))
#else
#define BDFCONV_PLUGIN_API
#endif

// one entry of the packed glyph table; y axis points down
typedef struct bdfconv_packed_glyph {
    uint32_t character;        // Unicode scalar value
    int32_t x;                 // top left, relative to the baseline origin
    int32_t y;
    uint32_t width;
    uint32_t height;
    uint32_t device_width;     // advance in px
    size_t start_index;        // bit offset into packed_data
} bdfconv_packed_glyph;

// view of one converted font; everything is owned by the host and only
// valid during the export call
typedef struct bdfconv_font {
    const char* name;                   // valid C identifier
    const char* const* comments;        // array of comment_count strings
    unsigned comment_count;

    uint32_t ascent;
    uint32_t descent;
    uint32_t replacement_index;         // index into packed_glyphs

    // proportional encoding
    const uint8_t* packed_data;         // MSB-first bit stream
    size_t packed_size;                 // bytes
    size_t packed_bit_count;
    const bdfconv_packed_glyph* packed_glyphs;
    unsigned packed_glyph_count;

    // fixed grid encoding, 1bpp, rows padded to whole bytes, MSB first
    const uint8_t* atlas_data;
    size_t atlas_size;
    uint32_t atlas_width;               // px
    uint32_t atlas_height;              // px
    uint32_t character_width;
    uint32_t character_height;
    uint32_t character_spacing;
    uint32_t baseline;
    uint32_t underline_offset;
    uint32_t underline_height;
    uint32_t strikethrough_offset;
    uint32_t strikethrough_height;
    uint32_t atlas_replacement_index;   // cell index

    const char* mapping_preset;         // e.g. "iso_8859_1", or NULL
    const uint32_t* mapping;            // compressed range string, NUL starts a range
    unsigned mapping_length;
} bdfconv_font;

// simple key=value option (plugins can accept arbitrary params)
typedef struct bdfconv_kv {
    const char* key;
    const char* value;
} bdfconv_kv;

// exporter returns 0 on success; nonzero on error (fill errbuf if provided)
typedef int (*bdfconv_export_fn)(
    const bdfconv_font* font,
    const char* output_path,
    const bdfconv_kv* options,     // array
    unsigned options_count,
    char* errbuf,                  // optional; plugin writes a human message
    unsigned errbuf_len
);

// constant plugin metadata (owned by the plugin; do not free)
typedef struct bdfconv_plugin_info {
    const char* name;              // short id, e.g., "raw_c"
    const char* description;       // human friendly
    const char* author;            // optional
    const char* extension;         // default output file extension, no dot
    unsigned    abi_version;       // must be BDFCONV_PLUGIN_ABI_VERSION
    bdfconv_export_fn export_font; // required
} bdfconv_plugin_info;

// REQUIRED entry point symbol that bdfconv looks up with dlsym():
//   int bdfconv_plugin_get(const bdfconv_plugin_info** out);
// Returns 0 on success, nonzero on failure. *out must point to a static object.
BDFCONV_PLUGIN_API int bdfconv_plugin_get(const bdfconv_plugin_info** out);

#ifdef __cplusplus
} // extern "C"
#endif
