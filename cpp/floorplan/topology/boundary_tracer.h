#ifndef FLOORPLAN_TOPOLOGY_BOUNDARY_TRACER_H
#define FLOORPLAN_TOPOLOGY_BOUNDARY_TRACER_H

#include "floorplan/core/types.h"
#include "floorplan/topology/wall_graph.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace floorplan {

enum class TraceStatus : std::uint8_t {
    Closed = 0,             // walk returned to its first point
    OpenChain = 1,          // walked at least one more wall but never closed
    NoConnectableWalls = 2, // empty input, or nothing continues from the start wall
};

struct TraceOptions {
    double tolerance{kDefaultBoundaryTolerance};
    std::size_t startIndex{0};
};

// Greedy walk result. A closed trace repeats its first point at the end.
struct TraceResult {
    TraceStatus status{TraceStatus::NoConnectableWalls};
    Polygon points;
    std::vector<std::size_t> wallIndices; // walls consumed, in walk order

    bool closed() const noexcept { return status == TraceStatus::Closed; }
};

struct ClosedLoop {
    Polygon points;
    std::vector<std::size_t> wallIndices;
};

// Walks from graph wall `start` through walls not flagged in `excluded`,
// always taking the lowest-index unused neighbour whose endpoint matches the
// current point within the graph tolerance.
TraceResult traceFrom(const WallGraph& graph, std::size_t start, const std::vector<bool>& excluded);

TraceResult traceBoundary(const std::vector<Wall>& walls, const TraceOptions& options = {});

// Repeats the walk from every wall not yet in a loop. Each closed loop
// consumes its walls, so no wall belongs to two loops.
std::vector<ClosedLoop> findClosedLoops(const WallGraph& graph);

// Legacy boundary: the traced points with silent truncation when the walk
// cannot close. One wall yields its two endpoints, none yields nothing.
Polygon calculateRoomBoundary(const std::vector<Wall>& walls, double tolerance = kDefaultBoundaryTolerance);

// Chooses which discovered loop is the outer boundary.
class OuterLoopSelector {
public:
    virtual ~OuterLoopSelector() = default;
    virtual std::optional<std::size_t> selectOuter(const std::vector<ClosedLoop>& loops) const = 0;
};

// Heuristic: the loop enclosing the largest area is the outside. Loops of
// near-equal area may be misclassified; the first such loop wins.
class LargestAreaLoopSelector final : public OuterLoopSelector {
public:
    std::optional<std::size_t> selectOuter(const std::vector<ClosedLoop>& loops) const override;
};

struct WallSeparation {
    std::vector<Wall> outerWalls;    // in walk order
    std::vector<Wall> interiorWalls; // in input order
    std::vector<ClosedLoop> loops;   // wall indices refer to the input list
    std::optional<std::size_t> outerLoop;
};

WallSeparation separateOuterAndInteriorWalls(
    const std::vector<Wall>& walls,
    double tolerance = kDefaultBoundaryTolerance);

WallSeparation separateOuterAndInteriorWalls(
    const std::vector<Wall>& walls,
    const OuterLoopSelector& selector,
    double tolerance = kDefaultBoundaryTolerance);

struct BoundaryWithHoles {
    Polygon outer;
    std::vector<Polygon> holes;
    TraceStatus outerStatus{TraceStatus::NoConnectableWalls};
};

// Outer ring from the outer walls (or from every wall when no loop closes);
// each closed loop among the interior walls that lies inside the outer ring
// becomes a hole. Other interior walls are dropped.
BoundaryWithHoles calculateRoomBoundaryWithHoles(
    const std::vector<Wall>& walls,
    double tolerance = kDefaultBoundaryTolerance);

BoundaryWithHoles calculateRoomBoundaryWithHoles(
    const std::vector<Wall>& walls,
    const OuterLoopSelector& selector,
    double tolerance = kDefaultBoundaryTolerance);

} // namespace floorplan

#endif // FLOORPLAN_TOPOLOGY_BOUNDARY_TRACER_H
