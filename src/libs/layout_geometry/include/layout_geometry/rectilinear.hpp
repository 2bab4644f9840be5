#pragma once

#include <layout_model/types.hpp>
#include <vector>

namespace layout_geometry {

constexpr double default_rectify_threshold_px = 20.0;

// Snaps near-aligned vertex coordinates onto shared axis lines.
//
// X and Y are handled independently: values are sorted and grouped into
// chains where each value lies within `threshold` of the previous member of
// the chain, then every member is replaced by the chain mean. A chain may
// span more than `threshold` overall (0, 15, 30 chain together at 20).
// Inputs with fewer than 3 points are returned unchanged.
layout_model::Polygon snap_to_rectilinear(const layout_model::Polygon& points,
    double threshold = default_rectify_threshold_px);

// One axis of snap_to_rectilinear; output keeps the input order.
std::vector<double> snap_values(const std::vector<double>& values, double threshold);

} // namespace layout_geometry
