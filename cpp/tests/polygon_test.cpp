#include <gtest/gtest.h>

#include "floorplan/geometry/polygon.h"
#include "floorplan/measurement/measurement.h"

using namespace floorplan;

namespace {

Polygon square(double x, double y, double size) {
    return {Point2{x, y}, Point2{x + size, y}, Point2{x + size, y + size}, Point2{x, y + size}};
}

} // namespace

TEST(PolygonTest, AreaIsOrientationIndependent) {
    const std::vector<Polygon> shapes{
        square(0, 0, 10),
        {Point2{0, 0}, Point2{4, 0}, Point2{4, 3}},
        {Point2{0, 0}, Point2{6, 0}, Point2{6, 6}, Point2{3, 2}, Point2{0, 6}}, // concave
        {Point2{-5.5, 2.25}, Point2{7.125, -3.0}, Point2{1.0, 9.75}},
    };
    for (const Polygon& p : shapes) {
        EXPECT_GE(polygonArea(p), 0.0);
        EXPECT_DOUBLE_EQ(polygonArea(p), polygonArea(reversePolygon(p)));
        EXPECT_DOUBLE_EQ(signedPolygonArea(p), -signedPolygonArea(reversePolygon(p)));
    }
    EXPECT_DOUBLE_EQ(polygonArea(shapes[1]), 6.0);
}

TEST(PolygonTest, DegenerateInputsAreZero) {
    EXPECT_EQ(polygonArea({}), 0.0);
    EXPECT_EQ(polygonArea({Point2{0, 0}, Point2{5, 5}}), 0.0);
    EXPECT_EQ(polygonPerimeter({Point2{1, 1}}), 0.0);
    // Two points close back on themselves.
    EXPECT_DOUBLE_EQ(polygonPerimeter({Point2{0, 0}, Point2{3, 4}}), 10.0);
}

TEST(PolygonTest, PerimeterIgnoresRepeatedClosingPoint) {
    Polygon p = square(0, 0, 500);
    EXPECT_DOUBLE_EQ(polygonPerimeter(p), 2000.0);
    p.push_back(p.front());
    EXPECT_DOUBLE_EQ(polygonPerimeter(p), 2000.0);
    EXPECT_DOUBLE_EQ(polygonArea(p), 250000.0);
}

TEST(PolygonTest, AreaWithHolesSubtractsAndClamps) {
    const double ppf = 50.0;
    const Polygon outer = square(0, 0, 20 * ppf);
    const std::vector<Polygon> holes{square(7.5 * ppf, 7.5 * ppf, 5 * ppf)};

    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(outer), ppf), 400.0, 1e-9);
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(holes[0]), ppf), 25.0, 1e-9);
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonAreaWithHoles(outer, holes), ppf), 375.0, 1e-9);

    // Holes larger than the outline never drive the area negative.
    EXPECT_EQ(polygonAreaWithHoles(square(0, 0, 1), {square(0, 0, 2)}), 0.0);
}

TEST(PolygonTest, CentroidFallsBackToVertexMean) {
    const Point2 c = polygonCentroid(square(0, 0, 10));
    EXPECT_NEAR(c.x, 5.0, 1e-12);
    EXPECT_NEAR(c.y, 5.0, 1e-12);

    const Point2 line = polygonCentroid({Point2{0, 0}, Point2{2, 0}, Point2{4, 0}});
    EXPECT_NEAR(line.x, 2.0, 1e-12);
    EXPECT_NEAR(line.y, 0.0, 1e-12);

    const Point2 none = polygonCentroid({});
    EXPECT_EQ(none.x, 0.0);
}

TEST(PolygonTest, PointInPolygonConcave) {
    const Polygon notch{Point2{0, 0}, Point2{6, 0}, Point2{6, 6}, Point2{3, 2}, Point2{0, 6}};
    EXPECT_TRUE(pointInPolygon(Point2{1, 1}, notch));
    EXPECT_FALSE(pointInPolygon(Point2{3, 4}, notch));
    EXPECT_FALSE(pointInPolygon(Point2{10, 1}, notch));
    EXPECT_FALSE(pointInPolygon(Point2{1, 1}, {Point2{0, 0}, Point2{5, 5}}));
}

TEST(PolygonTest, PolygonInsidePolygonChecksEdges) {
    EXPECT_TRUE(polygonInsidePolygon(square(2, 2, 2), square(0, 0, 10)));
    EXPECT_FALSE(polygonInsidePolygon(square(8, 8, 4), square(0, 0, 10)));

    // All vertices inside the U-shape but the top edge crosses the notch.
    const Polygon u{Point2{0, 0}, Point2{9, 0}, Point2{9, 9}, Point2{6, 9}, Point2{6, 3},
                    Point2{3, 3}, Point2{3, 9}, Point2{0, 9}};
    const Polygon bar{Point2{1, 7}, Point2{8, 7}, Point2{8, 8}, Point2{1, 8}};
    EXPECT_FALSE(polygonInsidePolygon(bar, u));
}

TEST(PolygonTest, OrientationAndSimplify) {
    const Polygon ccw = square(0, 0, 4);
    EXPECT_FALSE(isClockwise(ccw));
    EXPECT_TRUE(isClockwise(reversePolygon(ccw)));

    const Polygon withMidpoints{Point2{0, 0}, Point2{2, 0}, Point2{4, 0}, Point2{4, 4}, Point2{0, 4}, Point2{0, 2}};
    const Polygon simplified = simplifyPolygon(withMidpoints);
    EXPECT_EQ(simplified.size(), 4u);
    EXPECT_DOUBLE_EQ(polygonArea(simplified), 16.0);
}

TEST(PolygonTest, SimplifyIgnoresRepeatedClosingPoint) {
    Polygon ring = square(0, 0, 4);
    ring.push_back(ring.front());
    const Polygon simplified = simplifyPolygon(ring);
    ASSERT_EQ(simplified.size(), 4u);
    EXPECT_DOUBLE_EQ(simplified.front().x, 0.0);
    EXPECT_DOUBLE_EQ(simplified.front().y, 0.0);
    EXPECT_DOUBLE_EQ(polygonArea(simplified), 16.0);

    const Polygon withDuplicate{Point2{0, 0}, Point2{4, 0}, Point2{4, 0}, Point2{4, 4}, Point2{0, 4}};
    EXPECT_EQ(simplifyPolygon(withDuplicate).size(), 4u);
}
