#include <layout_geometry/polygon.hpp>
#include <gtest/gtest.h>

#include <stdexcept>

namespace layout_geometry {
namespace {

TEST(BoundingBox, EmptyPolygonHasNone) {
    EXPECT_FALSE(bounding_box({}).has_value());
}

TEST(BoundingBox, CoversAllVertices) {
    const auto box = bounding_box({ { 5, -2 }, { 20, 7 }, { -3, 4 } });
    ASSERT_TRUE(box.has_value());
    EXPECT_DOUBLE_EQ(box->min_x, -3);
    EXPECT_DOUBLE_EQ(box->min_y, -2);
    EXPECT_DOUBLE_EQ(box->max_x, 20);
    EXPECT_DOUBLE_EQ(box->max_y, 7);
}

TEST(PolygonArea, RectangleEitherWinding) {
    EXPECT_DOUBLE_EQ(polygon_area_px({ { 0, 0 }, { 40, 0 }, { 40, 10 }, { 0, 10 } }), 400.0);
    EXPECT_DOUBLE_EQ(polygon_area_px({ { 0, 10 }, { 40, 10 }, { 40, 0 }, { 0, 0 } }), 400.0);
}

TEST(PolygonArea, LShape) {
    const layout_model::Polygon l_shape = { { 0, 0 }, { 50, 0 }, { 50, 50 }, { 100, 50 }, { 100, 100 }, { 0, 100 } };
    EXPECT_DOUBLE_EQ(polygon_area_px(l_shape), 7500.0);
}

TEST(PolygonArea, FewerThanThreePointsIsZero) {
    EXPECT_DOUBLE_EQ(polygon_area_px({ { 0, 0 }, { 10, 10 } }), 0.0);
}

TEST(SegmentLength, Pythagorean) {
    EXPECT_DOUBLE_EQ(segment_length({ 1, 1 }, { 4, 5 }), 5.0);
}

TEST(NormalizedGrid, MapsOntoImagePixels) {
    const auto px = from_normalized_grid({ { 0, 0 }, { 1000, 1000 }, { 250, 500 } }, 2000, 1500);
    ASSERT_EQ(px.size(), 3u);
    EXPECT_DOUBLE_EQ(px[1].x, 2000);
    EXPECT_DOUBLE_EQ(px[1].y, 1500);
    EXPECT_DOUBLE_EQ(px[2].x, 500);
    EXPECT_DOUBLE_EQ(px[2].y, 750);
}

TEST(NormalizedGrid, RejectsEmptyImage) {
    EXPECT_THROW(from_normalized_grid({ { 1, 1 } }, 0, 100), std::invalid_argument);
    EXPECT_THROW(from_normalized_grid({ { 1, 1 } }, 100, -1), std::invalid_argument);
}

} // namespace
} // namespace layout_geometry
