#include "bdfconv/plugin.h"
#include "bdfconv/plugin_util.h"

#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" {
#include <stb_image_write.h>
}

namespace {

constexpr unsigned char k_ink = 0;
constexpr unsigned char k_paper = 255;

void draw_atlas(
    std::vector<unsigned char>& img,
    int image_w,
    const bdfconv_font& font,
    int scale,
    bool invert
) {
    const auto bytes = plugin_bytes(font.atlas_data, font.atlas_size);
    const std::size_t stride = (static_cast<std::size_t>(font.atlas_width) + 7) / 8;
    const unsigned char on = invert ? k_paper : k_ink;

    for (std::uint32_t y = 0; y < font.atlas_height; ++y) {
        for (std::uint32_t x = 0; x < font.atlas_width; ++x) {
            if (!plugin_bit_is_set(bytes, y * stride * 8 + x)) continue;
            for (int sy = 0; sy < scale; ++sy) {
                const std::size_t row = static_cast<std::size_t>(y) * scale + sy;
                for (int sx = 0; sx < scale; ++sx) {
                    const std::size_t col = static_cast<std::size_t>(x) * scale + sx;
                    img[row * static_cast<std::size_t>(image_w) + col] = on;
                }
            }
        }
    }
}

} // namespace

extern "C" int bdfconv_plugin_get(const bdfconv_plugin_info** out);

static int export_png_atlas(
    const bdfconv_font* font,
    const char* output_path,
    const bdfconv_kv* options,
    unsigned options_count,
    char* errbuf,
    unsigned errbuf_len
) {
    const plugin_kv_view kv{options, options_count};

    if (!font || !font->atlas_data) {
        plugin_set_err(errbuf, errbuf_len, "png: atlas data missing");
        return 10;
    }
    if (!output_path || output_path[0] == '\0') {
        plugin_set_err(errbuf, errbuf_len, "png: output path is empty");
        return 11;
    }

    const auto scale = plugin_parse_int_in_range(kv.get("scale"), 1, 1, 64);
    if (!scale) {
        plugin_set_err(errbuf, errbuf_len, "png: scale must be in range 1..64");
        return 12;
    }
    const bool invert = plugin_parse_bool(kv.get("invert"), false);

    const long long image_w = static_cast<long long>(font->atlas_width) * *scale;
    const long long image_h = static_cast<long long>(font->atlas_height) * *scale;
    if (image_w <= 0 || image_h <= 0 || image_w > 65535 || image_h > 65535) {
        plugin_set_err(errbuf, errbuf_len, "png: invalid image dimensions");
        return 13;
    }

    // white background, black glyphs unless inverted
    std::vector<unsigned char> image(static_cast<std::size_t>(image_w * image_h), invert ? k_ink : k_paper);
    draw_atlas(image, static_cast<int>(image_w), *font, *scale, invert);

    if (stbi_write_png(output_path, static_cast<int>(image_w), static_cast<int>(image_h), 1, image.data(), static_cast<int>(image_w)) == 0) {
        plugin_set_err(errbuf, errbuf_len, "png: failed to write png");
        return 14;
    }
    return 0;
}

static const bdfconv_plugin_info k_info = {
    "png",
    "Exports the mono font atlas as a grayscale PNG",
    "bdfconv project",
    "png",
    BDFCONV_PLUGIN_ABI_VERSION,
    &export_png_atlas
};

extern "C" BDFCONV_PLUGIN_API int bdfconv_plugin_get(const bdfconv_plugin_info** out) {
    if (!out) return 1;
    *out = &k_info;
    return 0;
}
