#include <layout_geometry/polygon.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace layout_geometry {

std::optional<Box> bounding_box(const layout_model::Polygon& polygon) {
    if (polygon.empty()) return std::nullopt;
    Box box{ polygon.front().x, polygon.front().y, polygon.front().x, polygon.front().y };
    for (const auto& p : polygon) {
        box.min_x = std::min(box.min_x, p.x);
        box.min_y = std::min(box.min_y, p.y);
        box.max_x = std::max(box.max_x, p.x);
        box.max_y = std::max(box.max_y, p.y);
    }
    return box;
}

double polygon_area_px(const layout_model::Polygon& polygon) {
    if (polygon.size() < 3) return 0.0;
    double twice_area = 0.0;
    for (std::size_t i = 0; i < polygon.size(); ++i) {
        const auto& a = polygon[i];
        const auto& b = polygon[(i + 1) % polygon.size()];
        twice_area += a.x * b.y - b.x * a.y;
    }
    return std::abs(twice_area) * 0.5;
}

double segment_length(const layout_model::Point& a, const layout_model::Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

layout_model::Polygon from_normalized_grid(const std::vector<layout_model::Point>& points,
    double image_width, double image_height)
{
    if (!(image_width > 0.0) || !(image_height > 0.0)) {
        throw std::invalid_argument("image dimensions must be positive");
    }
    layout_model::Polygon out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back({ p.x / normalized_grid_extent * image_width,
                        p.y / normalized_grid_extent * image_height });
    }
    return out;
}

} // namespace layout_geometry
