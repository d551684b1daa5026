/// \file
/// \brief Character to glyph index mappings for fixed-grid fonts.
///
/// This header declares the known preset mappings and the compressed range string used when a font's character set matches no preset. In the range string a single character stands for itself, a pair of characters is a literal two character set, and a NUL followed by two characters is an inclusive range.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class mapping_preset {
    ascii,
    iso_8859_1,
    iso_8859_2,
    iso_8859_3,
    iso_8859_4,
    iso_8859_5,
    iso_8859_7,
    iso_8859_9,
    iso_8859_10,
    iso_8859_13,
    iso_8859_14,
    iso_8859_15,
    iso_8859_16,
    jis_x0201
};

const std::vector<mapping_preset>& all_mapping_presets();

// identifier used on the command line and in generated code, e.g. "iso_8859_15"
std::string_view mapping_preset_name(mapping_preset preset);
std::optional<mapping_preset> parse_mapping_preset(std::string_view name);

// characters in glyph index order
const std::u32string& mapping_preset_characters(mapping_preset preset);

// Returns the preset whose character set equals `sorted_chars` exactly.
std::optional<mapping_preset> detect_mapping_preset(const std::u32string& sorted_chars);

// Compresses ascending characters into a range string.
std::u32string compress_glyph_mapping(const std::u32string& sorted_chars);

class str_glyph_mapping {
public:
    str_glyph_mapping(std::u32string mapping, std::size_t replacement)
        : mapping_(std::move(mapping)), replacement_(replacement) {}

    // glyph index for `c`, or the replacement index
    std::size_t index(char32_t c) const;

    const std::u32string& mapping() const { return mapping_; }
    std::size_t replacement() const { return replacement_; }

private:
    std::u32string mapping_;
    std::size_t replacement_{0};
};
