#pragma once

#include <layout_geometry/scale.hpp>
#include <layout_model/catalog.hpp>
#include <layout_model/types.hpp>
#include <layout_placement/estimate.hpp>
#include <optional>
#include <string>
#include <vector>

namespace layout_loaders {

// Everything the editor hands to the placement engine for one room.
struct FloorPlan {
    std::string name;
    layout_model::Polygon polygon;                 // pixels
    std::vector<layout_model::Polygon> holes;      // pixels
    layout_geometry::Scale scale{ 1.0 };
    std::vector<layout_model::FurnitureSpec> catalog = layout_model::default_catalog();
    std::optional<double> rectify_threshold;       // snap the outline before placing
    double tax_rate = layout_placement::default_tax_rate;
};

// L-shaped 12 m x 9 m room with a pillar, at 0.1 px/mm.
FloorPlan sample_floor_plan();

} // namespace layout_loaders
