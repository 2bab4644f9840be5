#pragma once

#include <layout_geometry/containment.hpp>
#include <layout_geometry/scale.hpp>
#include <layout_model/catalog.hpp>
#include <layout_model/types.hpp>
#include <layout_placement/placement_constants.hpp>
#include <layout_placement/types.hpp>
#include <cstddef>
#include <vector>

namespace layout_placement {

struct PlacementOptions {
    double chair_depth_mm = layout_model::default_chair.depth;
    double item_gap_mm = sweep::item_gap_mm;
    double search_step_mm = sweep::search_step_mm;
    double empty_row_step_mm = sweep::empty_row_step_mm;
    // Column steps allowed before PlacementLimitError; 0 disables the ceiling.
    std::size_t max_sweep_steps = 0;
};

// Fills the room row by row, left to right. At every cursor position the
// first enabled catalog entry whose footprint (table plus chair row) is
// admissible wins. Items are returned in placement order.
//
// Returns an empty list for polygons with fewer than 3 points. Throws
// std::invalid_argument for a negative or non-finite aisle gap or
// non-positive sweep steps, PlacementLimitError when the step ceiling is hit
// or when a cursor step is too small to move the cursor at the room's
// coordinates.
std::vector<PlacedItem> place_furniture(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    double aisle_gap_mm,
    const IdGenerator& next_id,
    const PlacementOptions& options = {},
    const layout_geometry::ContainmentStrategy& containment = layout_geometry::SampledContainment());

// Same as above for an unchecked pixels-per-mm value; throws
// layout_geometry::InvalidScaleError before sweeping when it is not usable.
std::vector<PlacedItem> place_furniture(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    double pixels_per_mm,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    double aisle_gap_mm,
    const IdGenerator& next_id,
    const PlacementOptions& options = {});

std::vector<PlacedItem> place_for_pattern(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    layout_model::LayoutPattern pattern,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    const IdGenerator& next_id,
    const PlacementOptions& options = {});

// Footprint of a spec in pixels: table width by table depth plus chair depth.
layout_geometry::Rect footprint_at(double x, double y, const layout_model::FurnitureSpec& spec,
    const layout_geometry::Scale& scale, double chair_depth_mm = layout_model::default_chair.depth);

} // namespace layout_placement
