/// \file
/// \brief Implementation of the BDF line tokenizer.
///
/// This source file implements one part of the bdfconv pipeline architecture. It splits raw BDF text into keyword/parameter records for the metadata, property and glyph parsers.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/parser.h"

#include <charconv>
#include <stdexcept>

namespace {

/// \brief trim.
std::string_view trim(std::string_view s) {
    std::size_t first = 0;
    while (first < s.size() && bdf_line::is_space(s[first])) ++first;
    std::size_t last = s.size();
    while (last > first && bdf_line::is_space(s[last - 1])) --last;
    return s.substr(first, last - first);
}

} // namespace

/// \brief bdf_parser_error::to_string.
std::string bdf_parser_error::to_string() const {
    if (!line_number) return message;
    return "line " + std::to_string(*line_number) + ": " + message;
}

bdf_parser_error bdf_parser_error::make(std::string message) {
    return bdf_parser_error{std::move(message), std::nullopt};
}

bdf_parser_error bdf_parser_error::at(std::string message, const bdf_line& line) {
    return bdf_parser_error{std::move(message), line.line_number};
}

/// \brief bdf_parse_i32.
std::optional<std::int32_t> bdf_parse_i32(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-') return std::nullopt;
    }
    std::int32_t out = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return out;
}

/// \brief bdf_lines::next_physical_line.
std::optional<std::string_view> bdf_lines::next_physical_line() {
    if (pos_ >= input_.size()) return std::nullopt;

    std::size_t end = input_.find('\n', pos_);
    if (end == std::string_view::npos) end = input_.size();

    std::string_view raw = input_.substr(pos_, end - pos_);
    pos_ = end + 1;
    ++line_number_;

    if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
    return raw;
}

/// \brief bdf_lines::next.
std::optional<bdf_line> bdf_lines::next() {
    if (backtrack_next_) {
        const bdf_line line = *backtrack_next_;
        backtrack_next_.reset();
        return line;
    }

    while (const auto raw = next_physical_line()) {
        const std::string_view text = trim(*raw);
        if (text.empty()) continue;

        std::size_t split = 0;
        while (split < text.size() && !bdf_line::is_space(text[split])) ++split;

        bdf_line line;
        line.keyword = text.substr(0, split);
        line.parameters = trim(text.substr(split));
        line.line_number = line_number_;

        if (line.keyword == "COMMENT") continue;
        return line;
    }
    return std::nullopt;
}

/// \brief bdf_lines::backtrack.
void bdf_lines::backtrack(const bdf_line& line) {
    if (backtrack_next_) {
        throw std::logic_error("bdf_lines::backtrack called twice without next()");
    }
    backtrack_next_ = line;
}
