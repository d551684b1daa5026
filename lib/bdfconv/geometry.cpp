/// \file
/// \brief Coordinate parsing and bounding box union.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include "bdfconv/geometry.h"

#include <algorithm>
#include <stdexcept>

/// \brief bdf_coord::parse.
std::optional<bdf_coord> bdf_coord::parse(const bdf_line& line) {
    const auto values = line.parse_integer_parameters<2>();
    if (!values) return std::nullopt;
    return bdf_coord{(*values)[0], (*values)[1]};
}

/// \brief bdf_bounding_box::parse.
std::optional<bdf_bounding_box> bdf_bounding_box::parse(const bdf_line& line) {
    const auto values = line.parse_integer_parameters<4>();
    if (!values) return std::nullopt;
    const auto& v = *values;
    return bdf_bounding_box{bdf_coord{v[2], v[3]}, bdf_coord{v[0], v[1]}};
}

/// \brief bdf_bounding_box::union_with.
bdf_bounding_box bdf_bounding_box::union_with(const bdf_bounding_box& other) const {
    if (size.x < 0 || size.y < 0 || other.size.x < 0 || other.size.y < 0) {
        throw std::logic_error("bounding box union requires non-negative sizes");
    }
    if (other.is_empty()) return *this;
    if (is_empty()) return other;

    const std::int32_t x_min = std::min(offset.x, other.offset.x);
    const std::int32_t y_min = std::min(offset.y, other.offset.y);
    const std::int32_t x_max = std::max(offset.x + size.x - 1, other.offset.x + other.size.x - 1);
    const std::int32_t y_max = std::max(offset.y + size.y - 1, other.offset.y + other.size.y - 1);

    return bdf_bounding_box{
        bdf_coord{x_min, y_min},
        bdf_coord{x_max - x_min + 1, y_max - y_min + 1}
    };
}
