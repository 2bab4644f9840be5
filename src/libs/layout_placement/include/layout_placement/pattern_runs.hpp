#pragma once

#include <layout_geometry/scale.hpp>
#include <layout_model/types.hpp>
#include <layout_placement/placer.hpp>
#include <layout_placement/types.hpp>
#include <functional>
#include <vector>

namespace layout_placement {

// Supplies a fresh id generator for each pattern run.
using IdGeneratorFactory = std::function<IdGenerator(layout_model::LayoutPattern)>;

// Per-spec counts in catalog order (specs with no placed items are omitted)
// and the summed unit prices. Items whose spec id is not in the catalog are
// counted after the catalog entries, in order of first appearance.
PatternResult summarize(layout_model::LayoutPattern pattern, double aisle_gap_mm,
    std::vector<PlacedItem> items,
    const std::vector<layout_model::FurnitureSpec>& catalog);

// Runs the engine once per density pattern (tight, standard, generous).
std::vector<PatternResult> run_all_patterns(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    const IdGeneratorFactory& make_ids,
    const PlacementOptions& options = {});

} // namespace layout_placement
