/// \file
/// \brief Integer coordinate and bounding box types used by the BDF model.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstdint>
#include <optional>

#include "bdfconv/parser.h"

// Y axis points up, as in BDF files.
struct bdf_coord {
    std::int32_t x{0};
    std::int32_t y{0};

    static std::optional<bdf_coord> parse(const bdf_line& line);

    bool operator==(const bdf_coord&) const = default;
};

struct bdf_bounding_box {
    bdf_coord offset{};
    bdf_coord size{};

    // BBX / FONTBOUNDINGBOX order: size.x size.y offset.x offset.y
    static std::optional<bdf_bounding_box> parse(const bdf_line& line);

    bool is_empty() const { return size.x == 0 || size.y == 0; }

    /// Smallest box enclosing both boxes. An empty box is the identity
    /// element. Throws std::logic_error if either size is negative.
    bdf_bounding_box union_with(const bdf_bounding_box& other) const;

    bool operator==(const bdf_bounding_box&) const = default;
};
