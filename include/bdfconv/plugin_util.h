/// \file
/// \brief Shared helper utilities for plugin option parsing and errors.
///
/// This header declares the helpers every exporter plugin uses to read its key=value options, report errors into the host buffer and read bits from the font views.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "bdfconv/plugin.h"

class plugin_kv_view {
public:
    plugin_kv_view(const bdfconv_kv* items, unsigned count) : items_(items), count_(count) {}

    // last value wins
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const {
        if (!items_) return std::nullopt;
        for (unsigned i = count_; i > 0; --i) {
            const bdfconv_kv& kv = items_[i - 1];
            if (!kv.key || !kv.value) continue;
            if (key == kv.key) return std::string_view{kv.value};
        }
        return std::nullopt;
    }

private:
    const bdfconv_kv* items_{nullptr};
    unsigned count_{0};
};

inline void plugin_set_err(char* errbuf, unsigned errbuf_len, std::string_view message) {
    if (!errbuf || errbuf_len == 0) return;
    const std::size_t n = std::min<std::size_t>(message.size(), errbuf_len - 1);
    std::copy_n(message.data(), n, errbuf);
    errbuf[n] = '\0';
}

inline std::optional<int> plugin_parse_int(std::string_view s) {
    if (s.empty()) return std::nullopt;
    int out = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return out;
}

inline bool plugin_parse_bool(std::optional<std::string_view> raw, bool default_value) {
    if (!raw || raw->empty()) return default_value;
    if (*raw == "1" || *raw == "true" || *raw == "yes") return true;
    if (*raw == "0" || *raw == "false" || *raw == "no") return false;
    return default_value;
}

// Bounded integer option: nullopt when present but malformed or out of range.
inline std::optional<int> plugin_parse_int_in_range(std::optional<std::string_view> raw, int fallback, int min_value, int max_value) {
    if (!raw || raw->empty()) return fallback;
    const auto parsed = plugin_parse_int(*raw);
    if (!parsed || *parsed < min_value || *parsed > max_value) return std::nullopt;
    return *parsed;
}

inline std::span<const std::uint8_t> plugin_bytes(const std::uint8_t* data, std::size_t size) {
    if (!data) return {};
    return {data, size};
}

inline bool plugin_bit_is_set(std::span<const std::uint8_t> bytes, std::size_t bit) {
    const std::size_t byte_index = bit / 8;
    if (byte_index >= bytes.size()) return false;
    return (bytes[byte_index] & (0x80u >> (bit % 8))) != 0;
}
