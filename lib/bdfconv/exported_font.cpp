/// \file
/// \brief Conversions from converted font types to plugin-facing structs.
///
/// This source file implements one part of the bdfconv pipeline architecture. It flattens both font encodings into the C structs exporter plugins receive.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/exported_font.h"

/// \brief exported_font::build.
bool exported_font::build(const converted_font& font, exported_font& out, std::string& err) {
    exported_font result;
    if (!packed_font_output::build(font, result.packed_, err)) return false;
    if (!mono_font_output::build(font, result.mono_, err)) return false;

    out = std::move(result);
    // the pointers must refer to the moved-to object
    out.refresh_views();
    return true;
}

/// \brief exported_font::refresh_views.
void exported_font::refresh_views() {
    glyph_views_.clear();
    for (const auto& g : packed_.glyphs()) {
        bdfconv_packed_glyph view{};
        view.character = static_cast<std::uint32_t>(g.character);
        view.x = g.bounding_box.x;
        view.y = g.bounding_box.y;
        view.width = g.bounding_box.width;
        view.height = g.bounding_box.height;
        view.device_width = g.device_width;
        view.start_index = g.start_index;
        glyph_views_.push_back(view);
    }

    comment_views_.clear();
    for (const auto& c : packed_.font().comments) comment_views_.push_back(c.c_str());

    mapping_view_.clear();
    for (const char32_t c : mono_.str_mapping().mapping()) mapping_view_.push_back(static_cast<std::uint32_t>(c));
}

/// \brief exported_font::as_plugin_font.
bdfconv_font exported_font::as_plugin_font() const {
    const converted_font& font = packed_.font();

    bdfconv_font out{};
    out.name = font.name.c_str();
    out.comments = comment_views_.empty() ? nullptr : comment_views_.data();
    out.comment_count = static_cast<unsigned>(comment_views_.size());
    out.ascent = font.ascent;
    out.descent = font.descent;
    out.replacement_index = static_cast<std::uint32_t>(font.replacement_character);

    out.packed_data = packed_.data().data();
    out.packed_size = packed_.data().size();
    out.packed_bit_count = packed_.bit_count();
    out.packed_glyphs = glyph_views_.data();
    out.packed_glyph_count = static_cast<unsigned>(glyph_views_.size());

    out.atlas_data = mono_.data().data();
    out.atlas_size = mono_.data().size();
    out.atlas_width = mono_.image_width();
    out.atlas_height = mono_.image_height();
    out.character_width = mono_.character_width();
    out.character_height = mono_.character_height();
    out.character_spacing = mono_.character_spacing();
    out.baseline = mono_.baseline();
    out.underline_offset = mono_.underline().offset;
    out.underline_height = mono_.underline().height;
    out.strikethrough_offset = mono_.strikethrough().offset;
    out.strikethrough_height = mono_.strikethrough().height;
    out.atlas_replacement_index = static_cast<std::uint32_t>(mono_.replacement_index());

    out.mapping_preset = mono_.mapping() ? mapping_preset_name(*mono_.mapping()).data() : nullptr;
    out.mapping = mapping_view_.data();
    out.mapping_length = static_cast<unsigned>(mapping_view_.size());
    return out;
}
