#include <layout_placement/pattern_runs.hpp>
#include <layout_placement/log.hpp>
#include <layout_model/catalog.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

namespace layout_placement {

PatternResult summarize(layout_model::LayoutPattern pattern, double aisle_gap_mm,
    std::vector<PlacedItem> items,
    const std::vector<layout_model::FurnitureSpec>& catalog)
{
    PatternResult out;
    out.pattern = pattern;
    out.aisle_gap_mm = aisle_gap_mm;

    for (const auto& spec : catalog) {
        if (std::none_of(out.counts.begin(), out.counts.end(),
                [&](const SpecCount& c) { return c.spec.id == spec.id; })) {
            out.counts.push_back(SpecCount{ spec, 0 });
        }
    }

    for (const auto& item : items) {
        auto it = std::find_if(out.counts.begin(), out.counts.end(),
            [&](const SpecCount& c) { return c.spec.id == item.spec.id; });
        if (it == out.counts.end()) {
            out.counts.push_back(SpecCount{ item.spec, 0 });
            it = std::prev(out.counts.end());
        }
        ++it->count;
        out.total_cost += item.spec.unit_price;
    }

    out.counts.erase(std::remove_if(out.counts.begin(), out.counts.end(),
        [](const SpecCount& c) { return c.count == 0; }), out.counts.end());
    out.items = std::move(items);
    return out;
}

std::vector<PatternResult> run_all_patterns(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    const IdGeneratorFactory& make_ids,
    const PlacementOptions& options)
{
    std::vector<PatternResult> results;
    results.reserve(layout_model::all_patterns.size());
    for (const auto pattern : layout_model::all_patterns) {
        const double gap = layout_model::pattern_aisle_gap_mm(pattern);
        auto items = place_furniture(main_polygon, holes, scale, catalog, gap, make_ids(pattern), options);
        results.push_back(summarize(pattern, gap, std::move(items), catalog));
        logger()->info("pattern={} items={} cost={}",
            layout_model::pattern_name(pattern), results.back().items.size(), results.back().total_cost);
    }
    return results;
}

} // namespace layout_placement
