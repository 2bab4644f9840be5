#pragma once

#include <layout_loaders/floor_plan.hpp>
#include <layout_placement/types.hpp>
#include <nlohmann/json.hpp>
#include <ostream>
#include <vector>

namespace layout_loaders {

nlohmann::json report_to_json(const FloorPlan& plan,
    const std::vector<layout_placement::PatternResult>& results);

void write_report_json(std::ostream& out, const FloorPlan& plan,
    const std::vector<layout_placement::PatternResult>& results, int indent = 2);

} // namespace layout_loaders
