/// \file
/// \brief Parsers for glyph blocks and the glyph section of a BDF file.
///
/// This source file implements one part of the bdfconv pipeline architecture. A glyph block is read in two states: header keywords until BITMAP, then hex rows until ENDCHAR. Widths are resolved once the block is complete.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/glyph.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace {

/// \brief hex_value.
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// \brief append_hex_row.
bool append_hex_row(const bdf_line& line, std::vector<std::uint8_t>& bitmap) {
    if (!line.parameters.empty()) return false;
    const std::string_view hex = line.keyword;
    if (hex.empty() || hex.size() % 2 != 0) return false;

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        bitmap.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return true;
}

/// \brief approximate_scalable.
/// Approximates SWIDTH from DWIDTH: device * 1000 * 72 / (point_size * resolution).
std::int32_t approximate_scalable(std::int32_t device, std::int32_t point_size, std::int32_t resolution) {
    const std::int64_t denominator = static_cast<std::int64_t>(point_size) * resolution;
    if (denominator == 0) return 0;
    return static_cast<std::int32_t>(static_cast<std::int64_t>(device) * 1000 * 72 / denominator);
}

struct width_pair {
    std::optional<bdf_coord> scalable;
    std::optional<bdf_coord> device;
    std::size_t line_number{0};
};

class glyph_block_parser {
public:
    glyph_block_parser(const bdf_metadata& metadata, bdf_glyph& out, bdf_parser_error& err)
        : metadata_(metadata), out_(out), err_(err) {}

    bool run(bdf_lines& lines) {
        while (state_ != state::done) {
            const auto line = lines.next();
            if (!line) {
                err_ = bdf_parser_error::make(state_ == state::start
                    ? "missing \"STARTCHAR\""
                    : "missing \"ENDCHAR\"");
                return false;
            }

            bool ok = false;
            switch (state_) {
                case state::start: ok = on_start(*line); break;
                case state::header: ok = on_header(*line); break;
                case state::bitmap: ok = on_bitmap(*line); break;
                case state::done: break;
            }
            if (!ok) return false;
        }
        return true;
    }

private:
    enum class state { start, header, bitmap, done };

    using header_fn = bool (glyph_block_parser::*)(const bdf_line&);

    bool on_start(const bdf_line& line) {
        if (line.keyword != "STARTCHAR") {
            err_ = bdf_parser_error::at("expected \"STARTCHAR\"", line);
            return false;
        }
        out_ = {};
        out_.name = std::string(line.parameters);
        state_ = state::header;
        return true;
    }

    bool on_header(const bdf_line& line) {
        static constexpr std::array<std::pair<std::string_view, header_fn>, 8> k_header = {{
            {"ENCODING", &glyph_block_parser::on_encoding},
            {"SWIDTH", &glyph_block_parser::on_swidth},
            {"DWIDTH", &glyph_block_parser::on_dwidth},
            {"SWIDTH1", &glyph_block_parser::on_swidth1},
            {"DWIDTH1", &glyph_block_parser::on_dwidth1},
            {"BBX", &glyph_block_parser::on_bbx},
            {"VVECTOR", &glyph_block_parser::on_vvector},
            {"BITMAP", &glyph_block_parser::on_bitmap_start},
        }};

        for (const auto& [keyword, fn] : k_header) {
            if (keyword == line.keyword) return (this->*fn)(line);
        }
        err_ = bdf_parser_error::at("unknown keyword in glyphs: \"" + std::string(line.keyword) + "\"", line);
        return false;
    }

    bool on_encoding(const bdf_line& line) {
        if (const auto one = line.parse_integer_parameters<1>()) {
            const std::int32_t code = (*one)[0];
            out_.encoding = code >= 0
                ? bdf_encoding::standard(static_cast<std::uint32_t>(code))
                : bdf_encoding::unspecified();
            return true;
        }
        if (const auto two = line.parse_integer_parameters<2>()) {
            const std::int32_t first = (*two)[0];
            const std::int32_t second = (*two)[1];
            if (first < 0 && second >= 0) {
                out_.encoding = bdf_encoding::non_standard(static_cast<std::uint32_t>(second));
                return true;
            }
        }
        err_ = bdf_parser_error::at("invalid \"ENCODING\"", line);
        return false;
    }

    bool read_coord(const bdf_line& line, std::optional<bdf_coord>& target, width_pair* pair) {
        const auto value = bdf_coord::parse(line);
        if (!value) {
            err_ = bdf_parser_error::at("invalid \"" + std::string(line.keyword) + "\"", line);
            return false;
        }
        target = *value;
        if (pair && pair->line_number == 0) pair->line_number = line.line_number;
        return true;
    }

    bool on_swidth(const bdf_line& line) { return read_coord(line, horizontal_.scalable, &horizontal_); }
    bool on_dwidth(const bdf_line& line) { return read_coord(line, horizontal_.device, &horizontal_); }
    bool on_swidth1(const bdf_line& line) { return read_coord(line, vertical_.scalable, &vertical_); }
    bool on_dwidth1(const bdf_line& line) { return read_coord(line, vertical_.device, &vertical_); }
    bool on_vvector(const bdf_line& line) { return read_coord(line, out_.origin_offset, nullptr); }

    bool on_bbx(const bdf_line& line) {
        const auto box = bdf_bounding_box::parse(line);
        if (!box) {
            err_ = bdf_parser_error::at("invalid \"BBX\"", line);
            return false;
        }
        out_.bounding_box = *box;
        return true;
    }

    bool on_bitmap_start(const bdf_line&) {
        state_ = state::bitmap;
        return true;
    }

    bool on_bitmap(const bdf_line& line) {
        if (line.keyword == "ENDCHAR") return on_end();
        if (!append_hex_row(line, out_.bitmap)) {
            err_ = bdf_parser_error::at("invalid hex data in BITMAP", line);
            return false;
        }
        return true;
    }

    bool resolve_width(const width_pair& pair, const char* dwidth_name, std::optional<bdf_glyph_width>& target) {
        if (!pair.scalable && !pair.device) return true;
        if (!pair.device) {
            err_ = bdf_parser_error{std::string("missing \"") + dwidth_name + "\"", pair.line_number};
            return false;
        }

        bdf_glyph_width width;
        width.device = *pair.device;
        if (pair.scalable) {
            width.scalable = *pair.scalable;
        } else {
            width.scalable.x = approximate_scalable(width.device.x, metadata_.point_size, metadata_.resolution.x);
            width.scalable.y = approximate_scalable(width.device.y, metadata_.point_size, metadata_.resolution.y);
        }
        target = width;
        return true;
    }

    bool on_end() {
        if (!resolve_width(horizontal_, "DWIDTH", out_.width_horizontal)) return false;
        if (!resolve_width(vertical_, "DWIDTH1", out_.width_vertical)) return false;
        state_ = state::done;
        return true;
    }

    const bdf_metadata& metadata_;
    bdf_glyph& out_;
    bdf_parser_error& err_;
    state state_{state::start};
    width_pair horizontal_;
    width_pair vertical_;
};

} // namespace

/// \brief bdf_glyph_pixels::size.
std::size_t bdf_glyph_pixels::size() const {
    const bdf_bounding_box& box = glyph_->bounding_box;
    if (box.size.x <= 0 || box.size.y <= 0) return 0;
    return static_cast<std::size_t>(box.size.x) * static_cast<std::size_t>(box.size.y);
}

/// \brief bdf_glyph_pixels::iterator::operator*.
bool bdf_glyph_pixels::iterator::operator*() const {
    const std::int32_t width = glyph_->bounding_box.size.x;
    const auto x = static_cast<std::int32_t>(index_ % static_cast<std::size_t>(width));
    const auto y = static_cast<std::int32_t>(index_ / static_cast<std::size_t>(width));
    return glyph_->pixel(x, y).value_or(false);
}

/// \brief bdf_glyph::parse.
bool bdf_glyph::parse(bdf_lines& lines, const bdf_metadata& metadata, bdf_glyph& out, bdf_parser_error& err) {
    glyph_block_parser parser(metadata, out, err);
    return parser.run(lines);
}

/// \brief bdf_glyph::pixel.
std::optional<bool> bdf_glyph::pixel(std::int32_t x, std::int32_t y) const {
    const std::int32_t width = bounding_box.size.x;
    if (x < 0 || y < 0 || x >= width) return std::nullopt;

    const std::size_t bytes_per_row = (static_cast<std::size_t>(width) + 7) / 8;
    const std::size_t byte_index = static_cast<std::size_t>(x / 8) + bytes_per_row * static_cast<std::size_t>(y);
    if (byte_index >= bitmap.size()) return std::nullopt;

    const unsigned mask = 0x80u >> (x % 8);
    return (bitmap[byte_index] & mask) != 0;
}

/// \brief bdf_glyph::device_width.
std::int32_t bdf_glyph::device_width() const {
    if (width_horizontal) return width_horizontal->device.x;
    return bounding_box.size.x;
}

/// \brief bdf_glyphs::parse.
bool bdf_glyphs::parse(bdf_lines& lines, const bdf_metadata& metadata, const bdf_parse_options& opt,
                       bdf_glyphs& out, bdf_parser_error& err) {
    out = {};
    std::optional<std::size_t> declared;
    std::size_t declared_line = 0;

    while (const auto line = lines.next()) {
        if (line->keyword == "CHARS") {
            if (!opt.enforce_declared_counts) continue;
            const auto count = line->parse_integer_parameters<1>();
            if (!count || (*count)[0] < 0) {
                err = bdf_parser_error::at("invalid \"CHARS\"", *line);
                return false;
            }
            declared = static_cast<std::size_t>((*count)[0]);
            declared_line = line->line_number;
        } else if (line->keyword == "STARTCHAR") {
            lines.backtrack(*line);
            bdf_glyph glyph;
            if (!bdf_glyph::parse(lines, metadata, glyph, err)) return false;
            out.glyphs_.push_back(std::move(glyph));
        } else if (line->keyword == "ENDFONT") {
            break;
        } else {
            err = bdf_parser_error::at("unknown keyword in glyphs: \"" + std::string(line->keyword) + "\"", *line);
            return false;
        }
    }

    if (declared && *declared != out.glyphs_.size()) {
        err = bdf_parser_error{
            "glyph count mismatch: declared " + std::to_string(*declared) +
            ", found " + std::to_string(out.glyphs_.size()),
            declared_line
        };
        return false;
    }

    out.rebuild_index();
    return true;
}

/// \brief bdf_glyphs::push_back.
void bdf_glyphs::push_back(bdf_glyph glyph) {
    const std::size_t index = glyphs_.size();
    const bdf_encoding encoding = glyph.encoding;
    glyphs_.push_back(std::move(glyph));

    const auto pos = std::upper_bound(index_.begin(), index_.end(), encoding,
        [this](const bdf_encoding& e, std::size_t i) { return e < glyphs_[i].encoding; });
    index_.insert(pos, index);
}

/// \brief bdf_glyphs::rebuild_index.
void bdf_glyphs::rebuild_index() {
    index_.resize(glyphs_.size());
    for (std::size_t i = 0; i < index_.size(); ++i) index_[i] = i;
    std::stable_sort(index_.begin(), index_.end(),
        [this](std::size_t a, std::size_t b) { return glyphs_[a].encoding < glyphs_[b].encoding; });
}

/// \brief bdf_glyphs::find.
const bdf_glyph* bdf_glyphs::find(const bdf_encoding& encoding) const {
    const auto pos = std::lower_bound(index_.begin(), index_.end(), encoding,
        [this](std::size_t i, const bdf_encoding& e) { return glyphs_[i].encoding < e; });
    if (pos == index_.end() || glyphs_[*pos].encoding != encoding) return nullptr;
    return &glyphs_[*pos];
}

/// \brief bdf_glyphs::get.
const bdf_glyph* bdf_glyphs::get(char32_t c) const {
    return find(bdf_encoding::standard(static_cast<std::uint32_t>(c)));
}
