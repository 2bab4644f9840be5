#pragma once

#include <layout_geometry/polygon.hpp>
#include <layout_model/types.hpp>
#include <vector>

namespace layout_geometry {

// Horizontal ray-casting parity test. Points exactly on an edge resolve
// arbitrarily (inside or outside) depending on the edge orientation.
bool point_in_polygon(const layout_model::Point& point, const layout_model::Polygon& polygon);

// Four corners plus center of the rectangle must lie inside main and outside
// every hole. A hole or a reflex boundary vertex that cuts through an edge of
// the rectangle without covering a sample point is not detected.
bool rect_admissible(double x, double y, double w, double h,
    const layout_model::Polygon& main_polygon,
    const std::vector<layout_model::Polygon>& holes);

// Decides whether a furniture footprint may occupy a rectangle of the room.
class ContainmentStrategy {
public:
    virtual ~ContainmentStrategy() = default;

    virtual bool admissible(const Rect& rect,
        const layout_model::Polygon& main_polygon,
        const std::vector<layout_model::Polygon>& holes) const = 0;
};

// Five-point sampling (see rect_admissible).
class SampledContainment : public ContainmentStrategy {
public:
    bool admissible(const Rect& rect,
        const layout_model::Polygon& main_polygon,
        const std::vector<layout_model::Polygon>& holes) const override;
};

} // namespace layout_geometry
