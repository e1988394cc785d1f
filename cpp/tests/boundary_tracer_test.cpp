#include <gtest/gtest.h>

#include "floorplan/geometry/polygon.h"
#include "floorplan/measurement/measurement.h"
#include "floorplan/topology/boundary_tracer.h"
#include "floorplan/topology/wall_graph.h"
#include "sketch_test_common.h"

#include <algorithm>

using namespace floorplan;
using floorplan::test::makeSquareWalls;
using floorplan::test::makeWall;

namespace {

constexpr double kPpf = 50.0;

std::vector<Wall> outerWithHole() {
    std::vector<Wall> walls = makeSquareWalls(1, 0.0, 0.0, 20 * kPpf);
    const std::vector<Wall> inner = makeSquareWalls(5, 7.5 * kPpf, 7.5 * kPpf, 5 * kPpf);
    walls.insert(walls.end(), inner.begin(), inner.end());
    return walls;
}

// Picks the smallest loop, to exercise the selector seam.
class SmallestAreaLoopSelector final : public OuterLoopSelector {
public:
    std::optional<std::size_t> selectOuter(const std::vector<ClosedLoop>& loops) const override {
        std::optional<std::size_t> best;
        for (std::size_t i = 0; i < loops.size(); ++i) {
            if (!best || polygonArea(loops[i].points) < polygonArea(loops[*best].points)) best = i;
        }
        return best;
    }
};

} // namespace

TEST(WallGraphTest, ConnectionsWithinTolerance) {
    std::vector<Wall> walls{
        makeWall(1, 0, 0, 100, 0),
        makeWall(2, 104, 0, 104, 100), // 4 px gap
        makeWall(3, 300, 300, 400, 300),
        makeWall(4, 104, 105, 0, 105), // 5 px gap is not a connection
    };
    const WallGraph graph(walls);
    EXPECT_EQ(graph.size(), 4u);
    EXPECT_EQ(graph.degree(0), 1u);
    EXPECT_EQ(graph.degree(1), 1u);
    EXPECT_EQ(graph.degree(2), 0u);
    EXPECT_EQ(graph.degree(3), 0u);

    const auto connections = findWallConnections(walls);
    ASSERT_EQ(connections.size(), 4u);
    EXPECT_EQ(connections.at(1), std::vector<std::uint32_t>{2});
    EXPECT_EQ(connections.at(2), std::vector<std::uint32_t>{1});
    EXPECT_TRUE(connections.at(3).empty());
}

TEST(WallGraphTest, NeighboursAreSortedAndSymmetric) {
    const std::vector<Wall> walls = makeSquareWalls(10, 0, 0, 100);
    const WallGraph graph(walls);
    for (std::size_t i = 0; i < graph.size(); ++i) {
        const auto& nb = graph.neighbors(i);
        EXPECT_TRUE(std::is_sorted(nb.begin(), nb.end()));
        for (const std::uint32_t j : nb) {
            const auto& back = graph.neighbors(j);
            EXPECT_NE(std::find(back.begin(), back.end(), static_cast<std::uint32_t>(i)), back.end());
        }
    }
}

TEST(BoundaryTracerTest, ClosedSquare) {
    const std::vector<Wall> walls = makeSquareWalls(1, 0, 0, 500);
    const TraceResult r = traceBoundary(walls);
    EXPECT_EQ(r.status, TraceStatus::Closed);
    EXPECT_TRUE(r.closed());
    ASSERT_EQ(r.points.size(), 5u);
    EXPECT_DOUBLE_EQ(r.points.front().x, r.points.back().x);
    EXPECT_EQ(r.wallIndices.size(), 4u);

    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(r.points), kPpf), 100.0, 1e-9);
    EXPECT_NEAR(pixelsToFeet(polygonPerimeter(r.points), kPpf), 40.0, 1e-9);
}

TEST(BoundaryTracerTest, HandlesReversedWallsAndOrder) {
    std::vector<Wall> walls{
        makeWall(1, 0, 0, 500, 0),
        makeWall(3, 0, 500, 500, 500),  // drawn the other way
        makeWall(2, 500, 500, 500, 0),  // drawn the other way
        makeWall(4, 0, 500, 0, 0),
    };
    const TraceResult r = traceBoundary(walls);
    EXPECT_EQ(r.status, TraceStatus::Closed);
    EXPECT_NEAR(polygonArea(r.points), 250000.0, 1e-6);
}

TEST(BoundaryTracerTest, SmallGapsWithinToleranceClose) {
    std::vector<Wall> walls{
        makeWall(1, 0, 0, 498, 0),
        makeWall(2, 500, 2, 500, 500),
        makeWall(3, 500, 500, 0, 500),
        makeWall(4, 0, 500, 0, 3),
    };
    EXPECT_TRUE(traceBoundary(walls).closed());

    TraceOptions tight;
    tight.tolerance = 1.0;
    EXPECT_FALSE(traceBoundary(walls, tight).closed());
}

TEST(BoundaryTracerTest, OpenChainIsReported) {
    std::vector<Wall> walls = makeSquareWalls(1, 0, 0, 500);
    walls.pop_back();

    const TraceResult r = traceBoundary(walls);
    EXPECT_EQ(r.status, TraceStatus::OpenChain);
    EXPECT_EQ(r.wallIndices.size(), 3u);

    // Legacy boundary keeps the truncated points.
    const Polygon legacy = calculateRoomBoundary(walls);
    EXPECT_EQ(legacy.size(), 3u);
}

TEST(BoundaryTracerTest, DegenerateInputs) {
    EXPECT_TRUE(calculateRoomBoundary({}).empty());
    EXPECT_EQ(traceBoundary({}).status, TraceStatus::NoConnectableWalls);

    const Polygon one = calculateRoomBoundary({makeWall(1, 0, 0, 10, 0)});
    ASSERT_EQ(one.size(), 2u);
    EXPECT_DOUBLE_EQ(one[1].x, 10.0);

    const std::vector<Wall> apart{makeWall(1, 0, 0, 10, 0), makeWall(2, 100, 100, 200, 100)};
    const TraceResult r = traceBoundary(apart);
    EXPECT_EQ(r.status, TraceStatus::NoConnectableWalls);
    const Polygon legacy = calculateRoomBoundary(apart);
    ASSERT_EQ(legacy.size(), 1u);
    EXPECT_DOUBLE_EQ(legacy[0].x, 0.0);
}

TEST(BoundaryTracerTest, FindClosedLoopsConsumesWalls) {
    const std::vector<Wall> walls = outerWithHole();
    const WallGraph graph(walls);
    const std::vector<ClosedLoop> loops = findClosedLoops(graph);
    ASSERT_EQ(loops.size(), 2u);

    std::vector<std::size_t> all;
    for (const ClosedLoop& l : loops) all.insert(all.end(), l.wallIndices.begin(), l.wallIndices.end());
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::unique(all.begin(), all.end()), all.end());
    EXPECT_EQ(all.size(), 8u);
}

TEST(BoundaryTracerTest, SeparatesOuterFromInterior) {
    const std::vector<Wall> walls = outerWithHole();
    const WallSeparation sep = separateOuterAndInteriorWalls(walls);
    ASSERT_TRUE(sep.outerLoop.has_value());
    EXPECT_EQ(sep.outerWalls.size(), 4u);
    ASSERT_EQ(sep.interiorWalls.size(), 4u);
    for (const Wall& w : sep.outerWalls) EXPECT_LE(w.id, 4u);
    EXPECT_EQ(sep.interiorWalls.front().id, 5u);
}

TEST(BoundaryTracerTest, BoundaryWithHoles) {
    const BoundaryWithHoles b = calculateRoomBoundaryWithHoles(outerWithHole());
    EXPECT_EQ(b.outerStatus, TraceStatus::Closed);
    ASSERT_EQ(b.holes.size(), 1u);

    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(b.outer), kPpf), 400.0, 1e-9);
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(b.holes[0]), kPpf), 25.0, 1e-9);
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonAreaWithHoles(b.outer, b.holes), kPpf), 375.0, 1e-9);
}

TEST(BoundaryTracerTest, InteriorWallsThatDoNotCloseAreDropped) {
    std::vector<Wall> walls = makeSquareWalls(1, 0, 0, 1000);
    walls.push_back(makeWall(20, 300, 300, 600, 300));
    walls.push_back(makeWall(21, 600, 300, 600, 600));

    const BoundaryWithHoles b = calculateRoomBoundaryWithHoles(walls);
    EXPECT_TRUE(b.holes.empty());
    EXPECT_NEAR(polygonArea(b.outer), 1000000.0, 1e-6);
}

TEST(BoundaryTracerTest, NoClosedLoopFallsBackToAllWalls) {
    std::vector<Wall> walls = makeSquareWalls(1, 0, 0, 500);
    walls.pop_back();
    const BoundaryWithHoles b = calculateRoomBoundaryWithHoles(walls);
    EXPECT_EQ(b.outerStatus, TraceStatus::OpenChain);
    EXPECT_EQ(b.outer.size(), 3u);
    EXPECT_TRUE(b.holes.empty());
}

TEST(BoundaryTracerTest, CustomOuterLoopSelector) {
    const BoundaryWithHoles b = calculateRoomBoundaryWithHoles(outerWithHole(), SmallestAreaLoopSelector{});
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonArea(b.outer), kPpf), 25.0, 1e-9);
    // The larger loop surrounds the chosen outer ring, so it is not a hole.
    EXPECT_TRUE(b.holes.empty());
}

TEST(BoundaryTracerTest, LoopOutsideOuterRingIsNotAHole) {
    std::vector<Wall> walls = makeSquareWalls(1, 0, 0, 10 * kPpf);
    const std::vector<Wall> beside = makeSquareWalls(5, 12 * kPpf, 0, 8 * kPpf);
    walls.insert(walls.end(), beside.begin(), beside.end());

    const BoundaryWithHoles b = calculateRoomBoundaryWithHoles(walls);
    EXPECT_EQ(b.outerStatus, TraceStatus::Closed);
    EXPECT_TRUE(b.holes.empty());
    EXPECT_NEAR(pixelAreaToSquareFeet(polygonAreaWithHoles(b.outer, b.holes), kPpf), 100.0, 1e-9);
}

TEST(BoundaryTracerTest, SimplifiedTraceKeepsEveryCorner) {
    const Polygon ring = calculateRoomBoundary(makeSquareWalls(1, 0, 0, 500));
    ASSERT_EQ(ring.size(), 5u);
    const Polygon simplified = simplifyPolygon(ring);
    EXPECT_EQ(simplified.size(), 4u);
    EXPECT_NEAR(polygonArea(simplified), 250000.0, 1e-6);
}
