/// \file
/// \brief BDF parse entry point.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/font.h"

/// \brief bdf_font::parse.
bool bdf_font::parse(std::string_view text, bdf_font& out, bdf_parser_error& err) {
    return parse(text, bdf_parse_options{}, out, err);
}

/// \brief bdf_font::parse.
bool bdf_font::parse(std::string_view text, const bdf_parse_options& opt, bdf_font& out, bdf_parser_error& err) {
    bdf_lines lines(text);

    const auto banner = lines.next();
    if (!banner) {
        err = bdf_parser_error::make("empty input");
        return false;
    }
    if (banner->keyword != "STARTFONT" || banner->parameters != "2.1") {
        err = bdf_parser_error::at("expected \"STARTFONT 2.1\"", *banner);
        return false;
    }

    bdf_font font;
    if (!bdf_metadata::parse(lines, opt, font.metadata, err)) return false;
    if (!bdf_glyphs::parse(lines, font.metadata, opt, font.glyphs, err)) return false;

    if (opt.end_check == bdf_end_check::strict) {
        if (const auto trailing = lines.next()) {
            err = bdf_parser_error::at("unexpected data after \"ENDFONT\"", *trailing);
            return false;
        }
    }

    out = std::move(font);
    return true;
}
