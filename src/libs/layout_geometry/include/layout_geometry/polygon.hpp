#pragma once

#include <layout_model/types.hpp>
#include <optional>
#include <vector>

namespace layout_geometry {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct Box {
    double min_x = 0;
    double min_y = 0;
    double max_x = 0;
    double max_y = 0;
};

std::optional<Box> bounding_box(const layout_model::Polygon& polygon);

// Shoelace area in squared pixels; 0 for fewer than 3 points.
double polygon_area_px(const layout_model::Polygon& polygon);

double segment_length(const layout_model::Point& a, const layout_model::Point& b);

// Outline acquisition reports corners on a 0..1000 grid with a top-left origin.
constexpr double normalized_grid_extent = 1000.0;

// Maps normalized-grid points onto an image of the given pixel size.
// Throws std::invalid_argument for non-positive image dimensions.
layout_model::Polygon from_normalized_grid(const std::vector<layout_model::Point>& points,
    double image_width, double image_height);

} // namespace layout_geometry
