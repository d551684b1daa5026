/// \file
/// \brief Preset mapping tables and range string compression.
///
/// This source file implements one part of the bdfconv pipeline architecture. It decides how a fixed-grid font maps characters to glyph cells.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/mapping.h"

#include <algorithm>
#include <array>
#include <utility>

namespace {

/// \brief append_range.
void append_range(std::u32string& out, char32_t first, char32_t last) {
    for (char32_t c = first; c <= last; ++c) out.push_back(c);
}

/// \brief build_ascii.
std::u32string build_ascii() {
    std::u32string out;
    append_range(out, 0x20, 0x7F);
    return out;
}

/// \brief build_iso_8859_1.
std::u32string build_iso_8859_1() {
    std::u32string out = build_ascii();
    append_range(out, 0xA0, 0xFF);
    return out;
}

using upper_half_table = std::array<char32_t, 96>;

/// \brief ASCII followed by the code points of bytes 0xA0..0xFF, 0 marks an unassigned byte.
std::u32string build_from_upper_half(const upper_half_table& upper) {
    std::u32string out = build_ascii();
    for (const char32_t c : upper) {
        if (c != 0) out.push_back(c);
    }
    return out;
}

/// \brief ISO 8859-1 with the given {byte, code point} positions replaced.
template <std::size_t N>
std::u32string build_from_latin_1(const std::array<std::pair<char32_t, char32_t>, N>& changes) {
    std::u32string out = build_iso_8859_1();
    const std::size_t upper_half = 0x7F - 0x20 + 1;
    for (const auto& [byte, code_point] : changes) {
        out[upper_half + (byte - 0xA0)] = code_point;
    }
    return out;
}

/// \brief build_iso_8859_2.
std::u32string build_iso_8859_2() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x0104, 0x02D8, 0x0141, 0x00A4, 0x013D, 0x015A, 0x00A7,
        0x00A8, 0x0160, 0x015E, 0x0164, 0x0179, 0x00AD, 0x017D, 0x017B,
        0x00B0, 0x0105, 0x02DB, 0x0142, 0x00B4, 0x013E, 0x015B, 0x02C7,
        0x00B8, 0x0161, 0x015F, 0x0165, 0x017A, 0x02DD, 0x017E, 0x017C,
        0x0154, 0x00C1, 0x00C2, 0x0102, 0x00C4, 0x0139, 0x0106, 0x00C7,
        0x010C, 0x00C9, 0x0118, 0x00CB, 0x011A, 0x00CD, 0x00CE, 0x010E,
        0x0110, 0x0143, 0x0147, 0x00D3, 0x00D4, 0x0150, 0x00D6, 0x00D7,
        0x0158, 0x016E, 0x00DA, 0x0170, 0x00DC, 0x00DD, 0x0162, 0x00DF,
        0x0155, 0x00E1, 0x00E2, 0x0103, 0x00E4, 0x013A, 0x0107, 0x00E7,
        0x010D, 0x00E9, 0x0119, 0x00EB, 0x011B, 0x00ED, 0x00EE, 0x010F,
        0x0111, 0x0144, 0x0148, 0x00F3, 0x00F4, 0x0151, 0x00F6, 0x00F7,
        0x0159, 0x016F, 0x00FA, 0x0171, 0x00FC, 0x00FD, 0x0163, 0x02D9,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_3.
std::u32string build_iso_8859_3() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x0126, 0x02D8, 0x00A3, 0x00A4, 0,      0x0124, 0x00A7,
        0x00A8, 0x0130, 0x015E, 0x011E, 0x0134, 0x00AD, 0,      0x017B,
        0x00B0, 0x0127, 0x00B2, 0x00B3, 0x00B4, 0x00B5, 0x0125, 0x00B7,
        0x00B8, 0x0131, 0x015F, 0x011F, 0x0135, 0x00BD, 0,      0x017C,
        0x00C0, 0x00C1, 0x00C2, 0,      0x00C4, 0x010A, 0x0108, 0x00C7,
        0x00C8, 0x00C9, 0x00CA, 0x00CB, 0x00CC, 0x00CD, 0x00CE, 0x00CF,
        0,      0x00D1, 0x00D2, 0x00D3, 0x00D4, 0x0120, 0x00D6, 0x00D7,
        0x011C, 0x00D9, 0x00DA, 0x00DB, 0x00DC, 0x016C, 0x015C, 0x00DF,
        0x00E0, 0x00E1, 0x00E2, 0,      0x00E4, 0x010B, 0x0109, 0x00E7,
        0x00E8, 0x00E9, 0x00EA, 0x00EB, 0x00EC, 0x00ED, 0x00EE, 0x00EF,
        0,      0x00F1, 0x00F2, 0x00F3, 0x00F4, 0x0121, 0x00F6, 0x00F7,
        0x011D, 0x00F9, 0x00FA, 0x00FB, 0x00FC, 0x016D, 0x015D, 0x02D9,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_4.
std::u32string build_iso_8859_4() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x0104, 0x0138, 0x0156, 0x00A4, 0x0128, 0x013B, 0x00A7,
        0x00A8, 0x0160, 0x0112, 0x0122, 0x0166, 0x00AD, 0x017D, 0x00AF,
        0x00B0, 0x0105, 0x02DB, 0x0157, 0x00B4, 0x0129, 0x013C, 0x02C7,
        0x00B8, 0x0161, 0x0113, 0x0123, 0x0167, 0x014A, 0x017E, 0x014B,
        0x0100, 0x00C1, 0x00C2, 0x00C3, 0x00C4, 0x00C5, 0x00C6, 0x012E,
        0x010C, 0x00C9, 0x0118, 0x00CB, 0x0116, 0x00CD, 0x00CE, 0x012A,
        0x0110, 0x0145, 0x014C, 0x0136, 0x00D4, 0x00D5, 0x00D6, 0x00D7,
        0x00D8, 0x0172, 0x00DA, 0x00DB, 0x00DC, 0x0168, 0x016A, 0x00DF,
        0x0101, 0x00E1, 0x00E2, 0x00E3, 0x00E4, 0x00E5, 0x00E6, 0x012F,
        0x010D, 0x00E9, 0x0119, 0x00EB, 0x0117, 0x00ED, 0x00EE, 0x012B,
        0x0111, 0x0146, 0x014D, 0x0137, 0x00F4, 0x00F5, 0x00F6, 0x00F7,
        0x00F8, 0x0173, 0x00FA, 0x00FB, 0x00FC, 0x0169, 0x016B, 0x02D9,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_5.
std::u32string build_iso_8859_5() {
    std::u32string out = build_ascii();
    out.push_back(0x00A0);
    append_range(out, 0x0401, 0x040C);
    out.push_back(0x00AD);
    append_range(out, 0x040E, 0x044F);
    out.push_back(0x2116);
    append_range(out, 0x0451, 0x045C);
    out.push_back(0x00A7);
    append_range(out, 0x045E, 0x045F);
    return out;
}

/// \brief build_iso_8859_7.
std::u32string build_iso_8859_7() {
    upper_half_table upper = {
        0x00A0, 0x2018, 0x2019, 0x00A3, 0x20AC, 0x20AF, 0x00A6, 0x00A7,
        0x00A8, 0x00A9, 0x037A, 0x00AB, 0x00AC, 0x00AD, 0,      0x2015,
        0x00B0, 0x00B1, 0x00B2, 0x00B3, 0x0384, 0x0385, 0x0386, 0x00B7,
        0x0388, 0x0389, 0x038A, 0x00BB, 0x038C, 0x00BD, 0x038E, 0x038F,
    };
    // 0xC0..0xFE is the Greek block in code point order, 0xD2 and 0xFF are unassigned
    for (std::size_t i = 32; i < upper.size() - 1; ++i) {
        upper[i] = static_cast<char32_t>(0x0390 + (i - 32));
    }
    upper[0xD2 - 0xA0] = 0;
    return build_from_upper_half(upper);
}

/// \brief build_iso_8859_9.
std::u32string build_iso_8859_9() {
    // byte value and code point of the positions that differ from ISO 8859-1
    constexpr std::array<std::pair<char32_t, char32_t>, 6> k_changes = {{
        {0xD0, 0x011E},
        {0xDD, 0x0130},
        {0xDE, 0x015E},
        {0xF0, 0x011F},
        {0xFD, 0x0131},
        {0xFE, 0x015F},
    }};

    return build_from_latin_1(k_changes);
}

/// \brief build_iso_8859_10.
std::u32string build_iso_8859_10() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x0104, 0x0112, 0x0122, 0x012A, 0x0128, 0x0136, 0x00A7,
        0x013B, 0x0110, 0x0160, 0x0166, 0x017D, 0x00AD, 0x016A, 0x014A,
        0x00B0, 0x0105, 0x0113, 0x0123, 0x012B, 0x0129, 0x0137, 0x00B7,
        0x013C, 0x0111, 0x0161, 0x0167, 0x017E, 0x2015, 0x016B, 0x014B,
        0x0100, 0x00C1, 0x00C2, 0x00C3, 0x00C4, 0x00C5, 0x00C6, 0x012E,
        0x010C, 0x00C9, 0x0118, 0x00CB, 0x0116, 0x00CD, 0x00CE, 0x00CF,
        0x00D0, 0x0145, 0x014C, 0x00D3, 0x00D4, 0x00D5, 0x00D6, 0x0168,
        0x00D8, 0x0172, 0x00DA, 0x00DB, 0x00DC, 0x00DD, 0x00DE, 0x00DF,
        0x0101, 0x00E1, 0x00E2, 0x00E3, 0x00E4, 0x00E5, 0x00E6, 0x012F,
        0x010D, 0x00E9, 0x0119, 0x00EB, 0x0117, 0x00ED, 0x00EE, 0x00EF,
        0x00F0, 0x0146, 0x014D, 0x00F3, 0x00F4, 0x00F5, 0x00F6, 0x0169,
        0x00F8, 0x0173, 0x00FA, 0x00FB, 0x00FC, 0x00FD, 0x00FE, 0x0138,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_13.
std::u32string build_iso_8859_13() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x201D, 0x00A2, 0x00A3, 0x00A4, 0x201E, 0x00A6, 0x00A7,
        0x00D8, 0x00A9, 0x0156, 0x00AB, 0x00AC, 0x00AD, 0x00AE, 0x00C6,
        0x00B0, 0x00B1, 0x00B2, 0x00B3, 0x201C, 0x00B5, 0x00B6, 0x00B7,
        0x00F8, 0x00B9, 0x0157, 0x00BB, 0x00BC, 0x00BD, 0x00BE, 0x00E6,
        0x0104, 0x012E, 0x0100, 0x0106, 0x00C4, 0x00C5, 0x0118, 0x0112,
        0x010C, 0x00C9, 0x0179, 0x0116, 0x0122, 0x0136, 0x012A, 0x013B,
        0x0160, 0x0143, 0x0145, 0x00D3, 0x014C, 0x00D5, 0x00D6, 0x00D7,
        0x0172, 0x0141, 0x015A, 0x016A, 0x00DC, 0x017B, 0x017D, 0x00DF,
        0x0105, 0x012F, 0x0101, 0x0107, 0x00E4, 0x00E5, 0x0119, 0x0113,
        0x010D, 0x00E9, 0x017A, 0x0117, 0x0123, 0x0137, 0x012B, 0x013C,
        0x0161, 0x0144, 0x0146, 0x00F3, 0x014D, 0x00F5, 0x00F6, 0x00F7,
        0x0173, 0x0142, 0x015B, 0x016B, 0x00FC, 0x017C, 0x017E, 0x2019,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_14.
std::u32string build_iso_8859_14() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x1E02, 0x1E03, 0x00A3, 0x010A, 0x010B, 0x1E0A, 0x00A7,
        0x1E80, 0x00A9, 0x1E82, 0x1E0B, 0x1EF2, 0x00AD, 0x00AE, 0x0178,
        0x1E1E, 0x1E1F, 0x0120, 0x0121, 0x1E40, 0x1E41, 0x00B6, 0x1E56,
        0x1E81, 0x1E57, 0x1E83, 0x1E60, 0x1EF3, 0x1E84, 0x1E85, 0x1E61,
        0x00C0, 0x00C1, 0x00C2, 0x00C3, 0x00C4, 0x00C5, 0x00C6, 0x00C7,
        0x00C8, 0x00C9, 0x00CA, 0x00CB, 0x00CC, 0x00CD, 0x00CE, 0x00CF,
        0x0174, 0x00D1, 0x00D2, 0x00D3, 0x00D4, 0x00D5, 0x00D6, 0x1E6A,
        0x00D8, 0x00D9, 0x00DA, 0x00DB, 0x00DC, 0x00DD, 0x0176, 0x00DF,
        0x00E0, 0x00E1, 0x00E2, 0x00E3, 0x00E4, 0x00E5, 0x00E6, 0x00E7,
        0x00E8, 0x00E9, 0x00EA, 0x00EB, 0x00EC, 0x00ED, 0x00EE, 0x00EF,
        0x0175, 0x00F1, 0x00F2, 0x00F3, 0x00F4, 0x00F5, 0x00F6, 0x1E6B,
        0x00F8, 0x00F9, 0x00FA, 0x00FB, 0x00FC, 0x00FD, 0x0177, 0x00FF,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_iso_8859_15.
std::u32string build_iso_8859_15() {
    // byte value and code point of the positions that differ from ISO 8859-1
    constexpr std::array<std::pair<char32_t, char32_t>, 8> k_changes = {{
        {0xA4, 0x20AC},
        {0xA6, 0x0160},
        {0xA8, 0x0161},
        {0xB4, 0x017D},
        {0xB8, 0x017E},
        {0xBC, 0x0152},
        {0xBD, 0x0153},
        {0xBE, 0x0178},
    }};

    return build_from_latin_1(k_changes);
}

/// \brief build_iso_8859_16.
std::u32string build_iso_8859_16() {
    constexpr upper_half_table k_upper = {
        0x00A0, 0x0104, 0x0105, 0x0141, 0x20AC, 0x201E, 0x0160, 0x00A7,
        0x0161, 0x00A9, 0x0218, 0x00AB, 0x0179, 0x00AD, 0x017A, 0x017B,
        0x00B0, 0x00B1, 0x010C, 0x0142, 0x017D, 0x201D, 0x00B6, 0x00B7,
        0x017E, 0x010D, 0x0219, 0x00BB, 0x0152, 0x0153, 0x0178, 0x017C,
        0x00C0, 0x00C1, 0x00C2, 0x0102, 0x00C4, 0x0106, 0x00C6, 0x00C7,
        0x00C8, 0x00C9, 0x00CA, 0x00CB, 0x00CC, 0x00CD, 0x00CE, 0x00CF,
        0x0110, 0x0143, 0x00D2, 0x00D3, 0x00D4, 0x0150, 0x00D6, 0x015A,
        0x0170, 0x00D9, 0x00DA, 0x00DB, 0x00DC, 0x0118, 0x021A, 0x00DF,
        0x00E0, 0x00E1, 0x00E2, 0x0103, 0x00E4, 0x0107, 0x00E6, 0x00E7,
        0x00E8, 0x00E9, 0x00EA, 0x00EB, 0x00EC, 0x00ED, 0x00EE, 0x00EF,
        0x0111, 0x0144, 0x00F2, 0x00F3, 0x00F4, 0x0151, 0x00F6, 0x015B,
        0x0171, 0x00F9, 0x00FA, 0x00FB, 0x00FC, 0x0119, 0x021B, 0x00FF,
    };
    return build_from_upper_half(k_upper);
}

/// \brief build_jis_x0201.
std::u32string build_jis_x0201() {
    std::u32string out = build_ascii();
    out[0x5C - 0x20] = 0x00A5; // yen sign
    out[0x7E - 0x20] = 0x203E; // overline
    append_range(out, 0xFF61, 0xFF9F);
    return out;
}

struct preset_entry {
    mapping_preset preset;
    std::string_view name;
    std::u32string characters;
};

/// \brief preset_table.
const std::vector<preset_entry>& preset_table() {
    static const std::vector<preset_entry> table = {
        {mapping_preset::ascii, "ascii", build_ascii()},
        {mapping_preset::iso_8859_1, "iso_8859_1", build_iso_8859_1()},
        {mapping_preset::iso_8859_2, "iso_8859_2", build_iso_8859_2()},
        {mapping_preset::iso_8859_3, "iso_8859_3", build_iso_8859_3()},
        {mapping_preset::iso_8859_4, "iso_8859_4", build_iso_8859_4()},
        {mapping_preset::iso_8859_5, "iso_8859_5", build_iso_8859_5()},
        {mapping_preset::iso_8859_7, "iso_8859_7", build_iso_8859_7()},
        {mapping_preset::iso_8859_9, "iso_8859_9", build_iso_8859_9()},
        {mapping_preset::iso_8859_10, "iso_8859_10", build_iso_8859_10()},
        {mapping_preset::iso_8859_13, "iso_8859_13", build_iso_8859_13()},
        {mapping_preset::iso_8859_14, "iso_8859_14", build_iso_8859_14()},
        {mapping_preset::iso_8859_15, "iso_8859_15", build_iso_8859_15()},
        {mapping_preset::iso_8859_16, "iso_8859_16", build_iso_8859_16()},
        {mapping_preset::jis_x0201, "jis_x0201", build_jis_x0201()},
    };
    return table;
}

/// \brief entry_for.
const preset_entry& entry_for(mapping_preset preset) {
    const auto& table = preset_table();
    const auto it = std::find_if(table.begin(), table.end(),
        [preset](const preset_entry& e) { return e.preset == preset; });
    return it != table.end() ? *it : table.front();
}

} // namespace

/// \brief all_mapping_presets.
const std::vector<mapping_preset>& all_mapping_presets() {
    static const std::vector<mapping_preset> presets = [] {
        std::vector<mapping_preset> out;
        for (const auto& e : preset_table()) out.push_back(e.preset);
        return out;
    }();
    return presets;
}

/// \brief mapping_preset_name.
std::string_view mapping_preset_name(mapping_preset preset) {
    return entry_for(preset).name;
}

/// \brief parse_mapping_preset.
std::optional<mapping_preset> parse_mapping_preset(std::string_view name) {
    for (const auto& e : preset_table()) {
        if (e.name == name) return e.preset;
    }
    return std::nullopt;
}

/// \brief mapping_preset_characters.
const std::u32string& mapping_preset_characters(mapping_preset preset) {
    return entry_for(preset).characters;
}

/// \brief detect_mapping_preset.
std::optional<mapping_preset> detect_mapping_preset(const std::u32string& sorted_chars) {
    for (const auto& e : preset_table()) {
        std::u32string chars = e.characters;
        std::sort(chars.begin(), chars.end());
        if (chars == sorted_chars) return e.preset;
    }
    return std::nullopt;
}

/// \brief compress_glyph_mapping.
std::u32string compress_glyph_mapping(const std::u32string& sorted_chars) {
    std::vector<std::pair<char32_t, char32_t>> ranges;
    for (const char32_t c : sorted_chars) {
        if (!ranges.empty() && c == ranges.back().second + 1) {
            ranges.back().second = c;
        } else {
            ranges.emplace_back(c, c);
        }
    }

    std::u32string mapping;
    for (const auto& [first, last] : ranges) {
        const char32_t count = last - first + 1;
        if (count == 1) {
            mapping.push_back(first);
            continue;
        }
        if (count > 2) mapping.push_back(U'\0');
        mapping.push_back(first);
        mapping.push_back(last);
    }
    return mapping;
}

/// \brief str_glyph_mapping::index.
std::size_t str_glyph_mapping::index(char32_t c) const {
    std::size_t index = 0;
    for (std::size_t i = 0; i < mapping_.size(); ++i) {
        if (mapping_[i] == U'\0' && i + 2 < mapping_.size()) {
            const char32_t first = mapping_[i + 1];
            const char32_t last = mapping_[i + 2];
            if (c >= first && c <= last) return index + (c - first);
            index += last - first + 1;
            i += 2;
        } else {
            if (mapping_[i] == c) return index;
            ++index;
        }
    }
    return replacement_;
}
