/// \file
/// \brief Unit tests for coordinates and bounding boxes.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#include <gtest/gtest.h>

#include <stdexcept>

#include "bdfconv/geometry.h"

namespace {

/// \brief box.
bdf_bounding_box box(std::int32_t w, std::int32_t h, std::int32_t x, std::int32_t y) {
    return bdf_bounding_box{bdf_coord{x, y}, bdf_coord{w, h}};
}

} // namespace

TEST(geometry, coord_parses_two_integers) {
    const auto c = bdf_coord::parse(bdf_line{"DWIDTH", "8 -1", 1});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->x, 8);
    EXPECT_EQ(c->y, -1);

    EXPECT_FALSE(bdf_coord::parse(bdf_line{"DWIDTH", "8", 1}).has_value());
    EXPECT_FALSE(bdf_coord::parse(bdf_line{"DWIDTH", "8 0 0", 1}).has_value());
}

TEST(geometry, bounding_box_parses_size_before_offset) {
    const auto b = bdf_bounding_box::parse(bdf_line{"BBX", "5 7 1 -2", 1});
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, box(5, 7, 1, -2));
}

TEST(geometry, union_of_overlapping_boxes) {
    const auto a = box(5, 7, 0, 0);
    const auto g = box(5, 7, 0, -2);
    const auto q = box(4, 7, 1, 0);

    EXPECT_EQ(a.union_with(g), box(5, 9, 0, -2));
    EXPECT_EQ(a.union_with(q), box(5, 7, 0, 0));
    EXPECT_EQ(box(2, 2, -3, 4).union_with(box(1, 1, 5, -1)), box(9, 7, -3, -1));
}

TEST(geometry, union_is_commutative) {
    const bdf_bounding_box boxes[] = {
        box(5, 7, 0, 0), box(1, 1, -4, 9), box(8, 3, 2, -5), box(0, 0, 0, 0)
    };
    for (const auto& a : boxes) {
        for (const auto& b : boxes) {
            EXPECT_EQ(a.union_with(b), b.union_with(a));
        }
    }
}

TEST(geometry, empty_box_is_identity) {
    const auto a = box(5, 7, 2, -1);
    const auto empty_w = box(0, 9, 100, 100);
    const auto empty_h = box(4, 0, -100, 3);

    EXPECT_TRUE(empty_w.is_empty());
    EXPECT_TRUE(empty_h.is_empty());
    EXPECT_EQ(a.union_with(empty_w), a);
    EXPECT_EQ(empty_h.union_with(a), a);
    EXPECT_TRUE(empty_w.union_with(empty_h).is_empty());
}

TEST(geometry, negative_size_is_a_precondition_failure) {
    EXPECT_THROW(box(-1, 2, 0, 0).union_with(box(1, 1, 0, 0)), std::logic_error);
    EXPECT_THROW(box(1, 1, 0, 0).union_with(box(1, -2, 0, 0)), std::logic_error);
}
