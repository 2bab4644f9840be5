#pragma once

#include <layout_model/types.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace layout_placement {

struct PlacedItem {
    std::string id;
    double x = 0;         // top-left of the footprint, pixels
    double y = 0;
    double rotation = 0;  // always 0; furniture is never rotated
    layout_model::FurnitureSpec spec;
};

// Produces one identifier per placed item.
using IdGenerator = std::function<std::string()>;

// Thrown when a sweep exceeds PlacementOptions::max_sweep_steps.
class PlacementLimitError : public std::runtime_error {
public:
    explicit PlacementLimitError(const std::string& what) : std::runtime_error(what) {}
};

struct SpecCount {
    layout_model::FurnitureSpec spec;
    int count = 0;
};

struct PatternResult {
    layout_model::LayoutPattern pattern = layout_model::LayoutPattern::Standard;
    double aisle_gap_mm = 0;
    std::vector<PlacedItem> items;
    std::vector<SpecCount> counts;  // catalog order, only specs that were placed
    long long total_cost = 0;
};

} // namespace layout_placement
