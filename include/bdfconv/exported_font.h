/// \file
/// \brief Plugin-facing view of a converted font.
///
/// This header declares the bridge between the conversion stage and the exporter plugins. An exported_font owns both encodings and the flat arrays the C ABI points into, so it must outlive every export call made with its view.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bdfconv/mono_font.h"
#include "bdfconv/packed_font.h"
#include "bdfconv/plugin.h"

class exported_font {
public:
    // Builds both outputs from one converted font.
    static bool build(const converted_font& font, exported_font& out, std::string& err);

    const packed_font_output& packed() const { return packed_; }
    const mono_font_output& mono() const { return mono_; }

    bdfconv_font as_plugin_font() const;

private:
    void refresh_views();

    packed_font_output packed_;
    mono_font_output mono_;

    std::vector<bdfconv_packed_glyph> glyph_views_;
    std::vector<const char*> comment_views_;
    std::vector<std::uint32_t> mapping_view_;
};
