#include <layout_placement/placer.hpp>
#include <layout_placement/id_generator.hpp>
#include <layout_model/catalog.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace layout_placement {
namespace {

using layout_geometry::Scale;
using layout_model::FurnitureSpec;
using layout_model::Polygon;

Polygon square(double x, double y, double size) {
    return { { x, y }, { x + size, y }, { x + size, y + size }, { x, y + size } };
}

Polygon rect(double x0, double y0, double x1, double y1) {
    return { { x0, y0 }, { x1, y0 }, { x1, y1 }, { x0, y1 } };
}

FurnitureSpec table(const char* id, double width, double depth = 450, long long price = 40000) {
    return FurnitureSpec{ id, id, width, depth, 2, price, "#f59e0b", true };
}

const std::vector<FurnitureSpec> single_table = { table("t1200", 1200) };

TEST(PlaceFurniture, RoomTooSmallForAisleYieldsNothing) {
    const auto items = place_furniture(square(0, 0, 2000), {}, Scale(1.0), single_table,
        layout_model::aisle::standard_mm, sequential_ids());
    EXPECT_TRUE(items.empty());
}

TEST(PlaceFurniture, TwoRowsOfThreeInSixMeterSquare) {
    const auto items = place_furniture(square(0, 0, 6000), {}, Scale(1.0), single_table,
        layout_model::aisle::standard_mm, sequential_ids());
    ASSERT_EQ(items.size(), 6u);

    const double xs[] = { 1300, 2550, 3800 };
    const double ys[] = { 1300, 3650 };
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_DOUBLE_EQ(items[i].x, xs[i % 3]) << "item " << i;
        EXPECT_DOUBLE_EQ(items[i].y, ys[i / 3]) << "item " << i;
        EXPECT_DOUBLE_EQ(items[i].rotation, 0.0);
        EXPECT_EQ(items[i].spec.id, "t1200");
    }
    EXPECT_EQ(items.front().id, "item-1");
    EXPECT_EQ(items.back().id, "item-6");
}

TEST(PlaceFurniture, PixelPositionsFollowScale) {
    // Same room at half a pixel per millimeter.
    const auto items = place_furniture(square(0, 0, 3000), {}, Scale(0.5), single_table,
        layout_model::aisle::standard_mm, sequential_ids());
    ASSERT_EQ(items.size(), 6u);
    EXPECT_DOUBLE_EQ(items[1].x, 1275);
    EXPECT_DOUBLE_EQ(items[2].x, 1900);
    EXPECT_DOUBLE_EQ(items[3].y, 1825);
}

TEST(PlaceFurniture, HoleForcesSearchForward) {
    const Polygon room = square(0, 0, 6000);
    // Covers the center of the second cell of the first row.
    const std::vector<Polygon> holes = { rect(2600, 1400, 4230, 2200) };

    const auto with_hole = place_furniture(room, holes, Scale(1.0), single_table,
        layout_model::aisle::standard_mm, sequential_ids());
    const auto without_hole = place_furniture(room, {}, Scale(1.0), single_table,
        layout_model::aisle::standard_mm, sequential_ids());

    EXPECT_LT(with_hole.size(), without_hole.size());
    ASSERT_EQ(with_hole.size(), 5u);
    EXPECT_DOUBLE_EQ(with_hole[0].x, 1300);
    EXPECT_DOUBLE_EQ(with_hole[1].x, 3650);
    EXPECT_DOUBLE_EQ(with_hole[1].y, 1300);
    EXPECT_DOUBLE_EQ(with_hole[2].y, 3650);
}

TEST(PlaceFurniture, CatalogOrderIsPriority) {
    const Polygon room = rect(0, 0, 4500, 3100);
    const std::vector<FurnitureSpec> wide_first = { table("wide", 1800), table("narrow", 1200) };
    const std::vector<FurnitureSpec> narrow_first = { table("narrow", 1200), table("wide", 1800) };

    const auto a = place_furniture(room, {}, Scale(1.0), wide_first, 1000, sequential_ids());
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a[0].spec.id, "wide");
    EXPECT_EQ(a[1].spec.id, "narrow");
    EXPECT_DOUBLE_EQ(a[1].x, 2850);

    const auto b = place_furniture(room, {}, Scale(1.0), narrow_first, 1000, sequential_ids());
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].spec.id, "narrow");
    EXPECT_EQ(b[1].spec.id, "narrow");
}

TEST(PlaceFurniture, DisabledEntriesAreSkipped) {
    std::vector<FurnitureSpec> catalog = { table("wide", 1800), table("narrow", 1200) };
    catalog[0].enabled = false;
    const auto items = place_furniture(rect(0, 0, 4500, 3100), {}, Scale(1.0), catalog, 1000, sequential_ids());
    ASSERT_EQ(items.size(), 2u);
    for (const auto& item : items) EXPECT_EQ(item.spec.id, "narrow");
}

TEST(PlaceFurniture, EmptyOrFullyDisabledCatalogYieldsNothing) {
    EXPECT_TRUE(place_furniture(square(0, 0, 6000), {}, Scale(1.0), {}, 1300, sequential_ids()).empty());
    auto disabled = single_table;
    disabled[0].enabled = false;
    EXPECT_TRUE(place_furniture(square(0, 0, 6000), {}, Scale(1.0), disabled, 1300, sequential_ids()).empty());
}

TEST(PlaceFurniture, DegeneratePolygonYieldsNothing) {
    const Polygon line = { { 0, 0 }, { 6000, 6000 } };
    EXPECT_TRUE(place_furniture(line, {}, Scale(1.0), single_table, 1300, sequential_ids()).empty());
    EXPECT_TRUE(place_furniture({}, {}, Scale(1.0), single_table, 1300, sequential_ids()).empty());
}

TEST(PlaceFurniture, RejectsUnusableScaleBeforeSweeping) {
    const Polygon room = square(0, 0, 6000);
    for (double bad : { 0.0, -1.0, std::numeric_limits<double>::quiet_NaN(),
                        std::numeric_limits<double>::infinity() }) {
        int ids_drawn = 0;
        const IdGenerator counting = [&ids_drawn]() { return std::to_string(++ids_drawn); };
        EXPECT_THROW(place_furniture(room, {}, bad, single_table, 1300, counting),
            layout_geometry::InvalidScaleError);
        EXPECT_EQ(ids_drawn, 0);
    }
}

TEST(PlaceFurniture, RawScaleOverloadMatchesTypedScale) {
    const auto raw = place_furniture(square(0, 0, 6000), {}, 1.0, single_table, 1300, sequential_ids());
    EXPECT_EQ(raw.size(), 6u);
}

TEST(PlaceFurniture, RejectsNegativeAisleGap) {
    EXPECT_THROW(place_furniture(square(0, 0, 6000), {}, Scale(1.0), single_table, -10, sequential_ids()),
        std::invalid_argument);
}

TEST(PlaceFurniture, StepCeilingReportsComputationTooLarge) {
    PlacementOptions options;
    options.max_sweep_steps = 3;
    EXPECT_THROW(place_furniture(square(0, 0, 6000), {}, Scale(1.0), single_table, 1300, sequential_ids(), options),
        PlacementLimitError);

    options.max_sweep_steps = 1'000'000;
    EXPECT_EQ(place_furniture(square(0, 0, 6000), {}, Scale(1.0), single_table, 1300, sequential_ids(), options).size(), 6u);
}

TEST(PlaceFurniture, RejectsRoomWhereStepsVanishInRounding) {
    // At 1e18 adjacent doubles are 128 apart, so a 50 px step cannot move the cursor.
    const auto far_room = square(1e18, 1e18, 1e6);
    EXPECT_THROW(place_furniture(far_room, {}, Scale(1.0), layout_model::default_catalog(), 1300, sequential_ids()),
        PlacementLimitError);
}

TEST(PlaceFurniture, StepCeilingStopsTinyScaleSweep) {
    PlacementOptions options;
    options.max_sweep_steps = 1'000'000;
    EXPECT_THROW(place_furniture(square(0, 0, 1000), {}, Scale(1e-7), single_table, 1300, sequential_ids(), options),
        PlacementLimitError);
}

TEST(PlaceFurniture, IdenticalInputsGiveIdenticalOutput) {
    const auto plan_room = Polygon{ { 0, 0 }, { 800, 0 }, { 800, 300 }, { 1200, 300 }, { 1200, 900 }, { 0, 900 } };
    const std::vector<Polygon> holes = { square(570, 570, 60) };
    const auto catalog = layout_model::default_catalog();

    const auto a = place_furniture(plan_room, holes, Scale(0.1), catalog, 1000, random_ids(42));
    const auto b = place_furniture(plan_room, holes, Scale(0.1), catalog, 1000, random_ids(42));
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, b[i].id);
        EXPECT_EQ(a[i].x, b[i].x);
        EXPECT_EQ(a[i].y, b[i].y);
        EXPECT_EQ(a[i].spec.id, b[i].spec.id);
    }
}

TEST(PlaceFurniture, EveryItemIsAdmissibleWhereItWasPlaced) {
    const auto room = Polygon{ { 0, 0 }, { 800, 0 }, { 800, 300 }, { 1200, 300 }, { 1200, 900 }, { 0, 900 } };
    const std::vector<Polygon> holes = { square(570, 570, 60), rect(100, 700, 220, 760) };
    const Scale scale(0.1);

    for (const auto pattern : layout_model::all_patterns) {
        const auto items = place_for_pattern(room, holes, scale, pattern, layout_model::default_catalog(), sequential_ids());
        for (const auto& item : items) {
            const auto r = footprint_at(item.x, item.y, item.spec, scale);
            EXPECT_TRUE(layout_geometry::rect_admissible(r.x, r.y, r.width, r.height, room, holes))
                << item.id << " at " << item.x << "," << item.y;
        }
    }
}

TEST(PlaceFurniture, WiderAisleNeverPlacesMore) {
    for (double side : { 4000.0, 6000.0, 7300.0, 9100.0 }) {
        std::size_t previous = std::numeric_limits<std::size_t>::max();
        for (const auto pattern : layout_model::all_patterns) {
            const auto items = place_for_pattern(square(0, 0, side), {}, Scale(1.0), pattern, single_table, sequential_ids());
            EXPECT_LE(items.size(), previous) << "room " << side << " pattern " << layout_model::pattern_name(pattern);
            previous = items.size();
        }
    }
}

class RejectEverything : public layout_geometry::ContainmentStrategy {
public:
    bool admissible(const layout_geometry::Rect&, const Polygon&, const std::vector<Polygon>&) const override {
        ++calls;
        return false;
    }
    mutable int calls = 0;
};

TEST(PlaceFurniture, UsesInjectedContainmentStrategy) {
    const RejectEverything strategy;
    const auto items = place_furniture(square(0, 0, 6000), {}, Scale(1.0), single_table, 1300,
        sequential_ids(), PlacementOptions{}, strategy);
    EXPECT_TRUE(items.empty());
    EXPECT_GT(strategy.calls, 0);
}

} // namespace
} // namespace layout_placement
