#pragma once

#include <layout_loaders/floor_plan.hpp>
#include <optional>
#include <istream>
#include <string>

namespace layout_loaders {

std::optional<FloorPlan> load_floor_plan_from_json(std::istream& in);
std::optional<FloorPlan> load_floor_plan_from_json_file(const std::string& path);

} // namespace layout_loaders
