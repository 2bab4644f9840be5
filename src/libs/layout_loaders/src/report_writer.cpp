#include <layout_loaders/report_writer.hpp>
#include <layout_geometry/polygon.hpp>
#include <layout_model/catalog.hpp>
#include <layout_placement/estimate.hpp>

namespace layout_loaders {

namespace {

nlohmann::json polygon_to_json(const layout_model::Polygon& polygon) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : polygon) arr.push_back({ { "x", p.x }, { "y", p.y } });
    return arr;
}

nlohmann::json estimate_to_json(const layout_placement::Estimate& estimate) {
    nlohmann::json lines = nlohmann::json::array();
    for (const auto& line : estimate.lines) {
        lines.push_back({
            { "spec_id", line.spec_id },
            { "name", line.name },
            { "count", line.count },
            { "unit_price", line.unit_price },
            { "subtotal", line.subtotal },
        });
    }
    return {
        { "lines", lines },
        { "subtotal", estimate.subtotal },
        { "tax", estimate.tax },
        { "total", estimate.total },
    };
}

nlohmann::json result_to_json(const layout_placement::PatternResult& result, double tax_rate) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : result.items) {
        items.push_back({
            { "id", item.id },
            { "x", item.x },
            { "y", item.y },
            { "rotation", item.rotation },
            { "spec_id", item.spec.id },
        });
    }
    return {
        { "pattern", layout_model::pattern_name(result.pattern) },
        { "aisle_gap_mm", result.aisle_gap_mm },
        { "item_count", result.items.size() },
        { "items", items },
        { "estimate", estimate_to_json(layout_placement::make_estimate(result, tax_rate)) },
    };
}

} // namespace

nlohmann::json report_to_json(const FloorPlan& plan,
    const std::vector<layout_placement::PatternResult>& results)
{
    nlohmann::json holes = nlohmann::json::array();
    for (const auto& hole : plan.holes) holes.push_back(polygon_to_json(hole));

    nlohmann::json patterns = nlohmann::json::array();
    for (const auto& r : results) patterns.push_back(result_to_json(r, plan.tax_rate));

    return {
        { "name", plan.name },
        { "scale", plan.scale.pixels_per_mm() },
        { "area_m2", plan.scale.area_to_square_meters(layout_geometry::polygon_area_px(plan.polygon)) },
        { "polygon", polygon_to_json(plan.polygon) },
        { "holes", holes },
        { "tax_rate", plan.tax_rate },
        { "patterns", patterns },
    };
}

void write_report_json(std::ostream& out, const FloorPlan& plan,
    const std::vector<layout_placement::PatternResult>& results, int indent)
{
    out << report_to_json(plan, results).dump(indent) << '\n';
}

} // namespace layout_loaders
