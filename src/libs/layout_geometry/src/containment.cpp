#include <layout_geometry/containment.hpp>
#include <algorithm>
#include <array>

namespace layout_geometry {

bool point_in_polygon(const layout_model::Point& point, const layout_model::Polygon& polygon) {
    bool inside = false;
    const std::size_t n = polygon.size();
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& vi = polygon[i];
        const auto& vj = polygon[j];
        if ((vi.y > point.y) != (vj.y > point.y)) {
            const double cross_x = (vj.x - vi.x) * (point.y - vi.y) / (vj.y - vi.y) + vi.x;
            if (point.x < cross_x) inside = !inside;
        }
    }
    return inside;
}

bool rect_admissible(double x, double y, double w, double h,
    const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes)
{
    const std::array<layout_model::Point, 5> samples = {{
        { x, y },
        { x + w, y },
        { x + w, y + h },
        { x, y + h },
        { x + w / 2, y + h / 2 },
    }};

    const bool inside_main = std::all_of(samples.begin(), samples.end(),
        [&](const layout_model::Point& p) { return point_in_polygon(p, main_polygon); });
    if (!inside_main) return false;

    for (const auto& hole : holes) {
        const bool hit = std::any_of(samples.begin(), samples.end(),
            [&](const layout_model::Point& p) { return point_in_polygon(p, hole); });
        if (hit) return false;
    }
    return true;
}

bool SampledContainment::admissible(const Rect& rect,
    const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes) const
{
    return rect_admissible(rect.x, rect.y, rect.width, rect.height, main_polygon, holes);
}

} // namespace layout_geometry
