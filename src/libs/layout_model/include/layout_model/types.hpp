#pragma once

#include <string>
#include <vector>

namespace layout_model {

// A position in the editing coordinate space (pixels unless stated otherwise).
struct Point {
    double x = 0;
    double y = 0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

// Implicitly closed ring: the last point connects back to the first.
// Winding order is not constrained.
using Polygon = std::vector<Point>;

struct FurnitureSpec {
    std::string id;
    std::string name;
    double table_width = 0;  // mm
    double table_depth = 0;  // mm
    int chair_count = 0;
    long long unit_price = 0;
    std::string color;
    bool enabled = true;
};

struct ChairDimensions {
    double width = 500;  // mm
    double depth = 600;  // mm
};

enum class LayoutPattern { Tight, Standard, Generous };

} // namespace layout_model
