/// \file
/// \brief Small UTF-8 and code point helpers.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <optional>
#include <string>
#include <string_view>

std::string to_utf8(char32_t c);
std::string to_utf8(std::u32string_view s);

// Decodes the whole input. Fails on malformed sequences, surrogates and
// values above U+10FFFF.
std::optional<std::u32string> decode_utf8(std::string_view s);

// "'A' (U+0041)"
std::string format_codepoint(char32_t c);
