#include <layout_loaders/floor_plan.hpp>

namespace layout_loaders {

FloorPlan sample_floor_plan() {
    FloorPlan plan;
    plan.name = "Sample L-shaped room";
    plan.scale = layout_geometry::Scale(0.1);

    // 12 m x 9 m with a 4 m x 3 m notch cut from the top-right corner.
    plan.polygon = {
        { 0, 0 }, { 800, 0 }, { 800, 300 }, { 1200, 300 }, { 1200, 900 }, { 0, 900 },
    };
    // 600 mm square pillar.
    plan.holes = {
        { { 570, 570 }, { 630, 570 }, { 630, 630 }, { 570, 630 } },
    };
    return plan;
}

} // namespace layout_loaders
