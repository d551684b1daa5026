/// \file
/// \brief BDF glyph model, glyph collection and their parsers.
///
/// This header declares the per-character data read from STARTCHAR ... ENDCHAR blocks. Bitmaps are kept exactly as stored in the file: row-major, MSB-first, one bit per pixel and ceil(width / 8) bytes per row.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "bdfconv/geometry.h"
#include "bdfconv/metadata.h"
#include "bdfconv/parser.h"

class bdf_encoding {
public:
    enum class kind {
        standard,      // ENCODING n, n >= 0
        non_standard,  // ENCODING -1 n
        unspecified    // ENCODING -1
    };

    bdf_encoding() = default;

    static bdf_encoding standard(std::uint32_t code) { return bdf_encoding{kind::standard, code}; }
    static bdf_encoding non_standard(std::uint32_t index) { return bdf_encoding{kind::non_standard, index}; }
    static bdf_encoding unspecified() { return bdf_encoding{kind::unspecified, 0}; }

    kind type() const { return kind_; }
    std::uint32_t value() const { return value_; }
    bool is_standard() const { return kind_ == kind::standard; }

    auto operator<=>(const bdf_encoding&) const = default;

private:
    bdf_encoding(kind k, std::uint32_t value) : kind_(k), value_(value) {}

    kind kind_{kind::unspecified};
    std::uint32_t value_{0};
};

struct bdf_glyph_width {
    bdf_coord scalable{};  // 1/1000 em
    bdf_coord device{};    // pixels

    bool operator==(const bdf_glyph_width&) const = default;
};

struct bdf_glyph;

// Lazy row-major sequence of all pixels inside a glyph's bounding box.
class bdf_glyph_pixels {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = bool;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = bool;

        iterator() = default;
        iterator(const bdf_glyph* glyph, std::size_t index) : glyph_(glyph), index_(index) {}

        bool operator*() const;
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++index_; return tmp; }
        bool operator==(const iterator& other) const { return index_ == other.index_; }

    private:
        const bdf_glyph* glyph_{nullptr};
        std::size_t index_{0};
    };

    explicit bdf_glyph_pixels(const bdf_glyph& glyph) : glyph_(&glyph) {}

    iterator begin() const { return iterator{glyph_, 0}; }
    iterator end() const { return iterator{glyph_, size()}; }
    std::size_t size() const;

private:
    const bdf_glyph* glyph_;
};

struct bdf_glyph {
    std::string name;
    bdf_encoding encoding{};
    std::optional<bdf_glyph_width> width_horizontal;
    std::optional<bdf_glyph_width> width_vertical;
    bdf_bounding_box bounding_box{};
    std::optional<bdf_coord> origin_offset;  // VVECTOR
    std::vector<std::uint8_t> bitmap;

    // Parses one STARTCHAR ... ENDCHAR block. The font header supplies the
    // point size and resolution used to approximate a missing SWIDTH.
    static bool parse(bdf_lines& lines, const bdf_metadata& metadata, bdf_glyph& out, bdf_parser_error& err);

    std::optional<bool> pixel(std::int32_t x, std::int32_t y) const;
    bdf_glyph_pixels pixels() const { return bdf_glyph_pixels{*this}; }

    // DWIDTH x, or the bounding box width when the glyph has no DWIDTH
    std::int32_t device_width() const;

    bool operator==(const bdf_glyph&) const = default;
};

class bdf_glyphs {
public:
    using container = std::vector<bdf_glyph>;

    // Reads CHARS, all glyph blocks and ENDFONT. Returns with the line after
    // ENDFONT unread, or at the end of input.
    static bool parse(bdf_lines& lines, const bdf_metadata& metadata, const bdf_parse_options& opt,
                      bdf_glyphs& out, bdf_parser_error& err);

    void push_back(bdf_glyph glyph);

    // Looks up ENCODING c. Assumes standard encodings are Unicode code points,
    // which does not hold for every BDF charset (JIS X 0208, ...).
    const bdf_glyph* get(char32_t c) const;
    const bdf_glyph* find(const bdf_encoding& encoding) const;

    std::size_t size() const { return glyphs_.size(); }
    bool empty() const { return glyphs_.empty(); }
    const bdf_glyph& operator[](std::size_t i) const { return glyphs_[i]; }
    container::const_iterator begin() const { return glyphs_.begin(); }
    container::const_iterator end() const { return glyphs_.end(); }

    bool operator==(const bdf_glyphs& other) const { return glyphs_ == other.glyphs_; }

private:
    void rebuild_index();

    container glyphs_;
    std::vector<std::size_t> index_;  // glyph indices sorted by encoding, stable
};
