/// \file
/// \brief BDF line tokenizer and parser error type.
///
/// This header declares the lowest layer of the BDF reader: a line iterator that keeps original line numbers, skips blank and comment lines and supports a single line of lookahead.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct bdf_line;

enum class bdf_end_check {
    strict,   // lines after ENDFONT are an error
    lenient   // lines after ENDFONT are ignored
};

struct bdf_parse_options {
    bdf_end_check end_check{bdf_end_check::strict};
    // compare STARTPROPERTIES / CHARS counts with the entries actually found
    bool enforce_declared_counts{false};
};

struct bdf_parser_error {
    std::string message;
    std::optional<std::size_t> line_number;

    /// Formats the error as "line N: message" or just "message".
    std::string to_string() const;

    static bdf_parser_error make(std::string message);
    static bdf_parser_error at(std::string message, const bdf_line& line);
};

/// Parses a signed 32 bit integer with an optional '+' or '-' sign.
std::optional<std::int32_t> bdf_parse_i32(std::string_view text);

struct bdf_line {
    std::string_view keyword;
    std::string_view parameters;
    std::size_t line_number{0};

    /// Parses exactly N whitespace separated integers from the parameters.
    template <std::size_t N>
    std::optional<std::array<std::int32_t, N>> parse_integer_parameters() const {
        std::array<std::int32_t, N> out{};
        std::size_t count = 0;
        std::size_t pos = 0;
        while (pos < parameters.size()) {
            while (pos < parameters.size() && is_space(parameters[pos])) ++pos;
            if (pos >= parameters.size()) break;
            std::size_t end = pos;
            while (end < parameters.size() && !is_space(parameters[end])) ++end;

            if (count == N) return std::nullopt;
            const auto value = bdf_parse_i32(parameters.substr(pos, end - pos));
            if (!value) return std::nullopt;
            out[count++] = *value;
            pos = end;
        }
        if (count != N) return std::nullopt;
        return out;
    }

    static bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    bool operator==(const bdf_line&) const = default;
};

class bdf_lines {
public:
    explicit bdf_lines(std::string_view input) : input_(input) {}

    // returns the next non-empty, non-comment line; a backtracked line first
    std::optional<bdf_line> next();

    // replays `line` on the next call to next(); throws std::logic_error if a
    // line is already waiting
    void backtrack(const bdf_line& line);

private:
    std::optional<std::string_view> next_physical_line();

    std::string_view input_;
    std::size_t pos_{0};
    std::size_t line_number_{0};
    std::optional<bdf_line> backtrack_next_;
};
