/// \file
/// \brief BDF font header model and parser.
///
/// Copyright (c) 2026 Tomaz Stih
/// SPDX-License-Identifier: GPL-2.0-only

#pragma once

#include <cstdint>
#include <string>

#include "bdfconv/geometry.h"
#include "bdfconv/parser.h"
#include "bdfconv/properties.h"

// METRICSSET 0, 1 and 2
enum class bdf_metrics_set {
    horizontal,
    vertical,
    both
};

struct bdf_metadata {
    std::string name;
    std::int32_t point_size{0};
    bdf_coord resolution{};
    bdf_bounding_box bounding_box{};
    bdf_metrics_set metrics_set{bdf_metrics_set::horizontal};
    bdf_properties properties;

    // Reads header lines up to (not including) CHARS or the first STARTCHAR.
    static bool parse(bdf_lines& lines, const bdf_parse_options& opt, bdf_metadata& out, bdf_parser_error& err);

    bool operator==(const bdf_metadata&) const = default;
};
