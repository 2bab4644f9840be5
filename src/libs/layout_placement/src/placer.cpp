#include <layout_placement/placer.hpp>
#include <layout_placement/log.hpp>
#include <layout_geometry/polygon.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace layout_placement {

namespace {

bool usable_spec(const layout_model::FurnitureSpec& spec) {
    return spec.enabled
        && std::isfinite(spec.table_width) && spec.table_width > 0.0
        && std::isfinite(spec.table_depth) && spec.table_depth > 0.0;
}

void validate_options(double aisle_gap_mm, const PlacementOptions& options) {
    if (!std::isfinite(aisle_gap_mm) || aisle_gap_mm < 0.0) {
        throw std::invalid_argument("aisle gap must be finite and non-negative");
    }
    if (!std::isfinite(options.chair_depth_mm) || options.chair_depth_mm < 0.0) {
        throw std::invalid_argument("chair depth must be finite and non-negative");
    }
    if (!std::isfinite(options.item_gap_mm) || options.item_gap_mm < 0.0) {
        throw std::invalid_argument("item gap must be finite and non-negative");
    }
    if (!std::isfinite(options.search_step_mm) || options.search_step_mm <= 0.0
        || !std::isfinite(options.empty_row_step_mm) || options.empty_row_step_mm <= 0.0) {
        throw std::invalid_argument("sweep steps must be positive");
    }
}

// False when adding step to a cursor at `from` rounds back to `from`.
bool advances(double from, double step) {
    return from + step != from;
}

// Every cursor update must move the cursor at the far ends of the box,
// otherwise the sweep never reaches max_x/max_y.
void check_sweep_progress(const layout_geometry::Box& box, double gap_px,
    double min_advance_x, double min_advance_y)
{
    const double xs[] = { box.min_x, box.min_x + gap_px, box.max_x };
    const double ys[] = { box.min_y, box.min_y + gap_px, box.max_y };
    for (double x : xs) {
        if (!advances(x, min_advance_x)) {
            throw PlacementLimitError("sweep step " + std::to_string(min_advance_x)
                + " px is below coordinate precision at x=" + std::to_string(x));
        }
    }
    for (double y : ys) {
        if (!advances(y, min_advance_y)) {
            throw PlacementLimitError("sweep step " + std::to_string(min_advance_y)
                + " px is below coordinate precision at y=" + std::to_string(y));
        }
    }
}

} // namespace

layout_geometry::Rect footprint_at(double x, double y, const layout_model::FurnitureSpec& spec,
    const layout_geometry::Scale& scale, double chair_depth_mm)
{
    return layout_geometry::Rect{ x, y,
        scale.to_pixels(spec.table_width),
        scale.to_pixels(spec.table_depth + chair_depth_mm) };
}

std::vector<PlacedItem> place_furniture(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    double aisle_gap_mm,
    const IdGenerator& next_id,
    const PlacementOptions& options,
    const layout_geometry::ContainmentStrategy& containment)
{
    validate_options(aisle_gap_mm, options);

    std::vector<PlacedItem> items;
    if (main_polygon.size() < 3) return items;

    std::vector<const layout_model::FurnitureSpec*> candidates;
    for (const auto& spec : catalog) {
        if (usable_spec(spec)) {
            candidates.push_back(&spec);
        } else if (spec.enabled) {
            logger()->warn("skipping catalog entry '{}' with unusable dimensions {}x{}",
                spec.id, spec.table_width, spec.table_depth);
        }
    }
    if (candidates.empty()) return items;

    const auto box = layout_geometry::bounding_box(main_polygon);
    const double gap_px = scale.to_pixels(aisle_gap_mm);
    const double item_gap_px = scale.to_pixels(options.item_gap_mm);
    const double search_step_px = scale.to_pixels(options.search_step_mm);
    const double empty_row_step_px = scale.to_pixels(options.empty_row_step_mm);

    double min_advance_x = search_step_px;
    double min_advance_y = empty_row_step_px;
    for (const auto* spec : candidates) {
        const auto rect = footprint_at(0.0, 0.0, *spec, scale, options.chair_depth_mm);
        min_advance_x = std::min(min_advance_x, rect.width + item_gap_px);
        min_advance_y = std::min(min_advance_y, rect.height + gap_px);
    }
    check_sweep_progress(*box, gap_px, min_advance_x, min_advance_y);

    std::size_t steps = 0;
    double cursor_y = box->min_y + gap_px;
    while (cursor_y < box->max_y) {
        double cursor_x = box->min_x + gap_px;
        double row_height = 0.0;

        while (cursor_x < box->max_x) {
            if (options.max_sweep_steps != 0 && ++steps > options.max_sweep_steps) {
                throw PlacementLimitError("placement sweep exceeded "
                    + std::to_string(options.max_sweep_steps) + " steps");
            }

            bool placed = false;
            for (const auto* spec : candidates) {
                const auto rect = footprint_at(cursor_x, cursor_y, *spec, scale, options.chair_depth_mm);
                if (!containment.admissible(rect, main_polygon, holes)) continue;

                items.push_back(PlacedItem{ next_id(), cursor_x, cursor_y, 0.0, *spec });
                cursor_x += rect.width + item_gap_px;
                row_height = std::max(row_height, rect.height);
                placed = true;
                break;
            }
            if (!placed) cursor_x += search_step_px;
        }

        if (row_height > 0.0) {
            cursor_y += row_height + gap_px;
        } else {
            cursor_y += empty_row_step_px;
        }
    }

    logger()->debug("placed {} items (aisle {} mm, scale {} px/mm, {} holes)",
        items.size(), aisle_gap_mm, scale.pixels_per_mm(), holes.size());
    return items;
}

std::vector<PlacedItem> place_furniture(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    double pixels_per_mm,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    double aisle_gap_mm,
    const IdGenerator& next_id,
    const PlacementOptions& options)
{
    const layout_geometry::Scale scale(pixels_per_mm);
    return place_furniture(main_polygon, holes, scale, catalog, aisle_gap_mm, next_id, options);
}

std::vector<PlacedItem> place_for_pattern(const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes,
    const layout_geometry::Scale& scale,
    layout_model::LayoutPattern pattern,
    const std::vector<layout_model::FurnitureSpec>& catalog,
    const IdGenerator& next_id,
    const PlacementOptions& options)
{
    return place_furniture(main_polygon, holes, scale, catalog,
        layout_model::pattern_aisle_gap_mm(pattern), next_id, options);
}

} // namespace layout_placement
