/// \file
/// \brief Top-level BDF font model and parse entry point.
///
/// This header declares the value produced by parsing one BDF file. Parsing is a pure function of the input text: no I/O happens here and the first error aborts the parse.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <string_view>

#include "bdfconv/glyph.h"
#include "bdfconv/metadata.h"
#include "bdfconv/parser.h"

struct bdf_font {
    bdf_metadata metadata;
    bdf_glyphs glyphs;

    // Accepts "\n" and "\r\n" line endings. ENDFONT is optional.
    static bool parse(std::string_view text, bdf_font& out, bdf_parser_error& err);
    static bool parse(std::string_view text, const bdf_parse_options& opt, bdf_font& out, bdf_parser_error& err);

    bool operator==(const bdf_font&) const = default;
};
