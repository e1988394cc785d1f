#include "floorplan/topology/boundary_tracer.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/polygon.h"
#include "floorplan/geometry/primitives.h"

namespace floorplan {

namespace {

// Legacy entry shared by calculateRoomBoundary and the hole-aware tracer.
TraceResult traceWallList(const std::vector<Wall>& walls, double tolerance) {
    if (walls.empty()) return TraceResult{};

    if (walls.size() == 1) {
        TraceResult r;
        r.points = {walls[0].start, walls[0].end};
        r.wallIndices = {0};
        return r;
    }

    TraceOptions opt;
    opt.tolerance = tolerance;
    return traceBoundary(walls, opt);
}

} // namespace

TraceResult traceFrom(const WallGraph& graph, std::size_t start, const std::vector<bool>& excluded) {
    TraceResult result;
    if (start >= graph.size()) return result;

    std::vector<bool> used = excluded;
    used.resize(graph.size(), false);

    const double tol = graph.tolerance();
    const WallGraph::Node& first = graph.node(start);
    used[start] = true;
    result.points.push_back(first.start);
    result.wallIndices.push_back(start);

    Point2 current = first.end;
    std::size_t currentWall = start;

    for (;;) {
        bool found = false;
        // Any wall touching `current` shares a corner with currentWall, so its
        // neighbour list covers every candidate.
        for (const std::uint32_t nb : graph.neighbors(currentWall)) {
            if (used[nb]) continue;
            const WallGraph::Node& n = graph.node(nb);
            if (distance(current, n.start) < tol) {
                result.points.push_back(n.start);
                current = n.end;
            } else if (distance(current, n.end) < tol) {
                result.points.push_back(n.end);
                current = n.start;
            } else {
                continue;
            }
            used[nb] = true;
            result.wallIndices.push_back(nb);
            currentWall = nb;
            found = true;
            break;
        }
        if (!found) break;

        if (result.points.size() > 2 && distance(current, result.points.front()) < tol) {
            result.points.push_back(result.points.front());
            result.status = TraceStatus::Closed;
            return result;
        }
    }

    result.status = result.wallIndices.size() > 1 ? TraceStatus::OpenChain : TraceStatus::NoConnectableWalls;
    return result;
}

TraceResult traceBoundary(const std::vector<Wall>& walls, const TraceOptions& options) {
    if (walls.empty()) return TraceResult{};
    const WallGraph graph(walls, options.tolerance);
    return traceFrom(graph, options.startIndex, std::vector<bool>(graph.size(), false));
}

std::vector<ClosedLoop> findClosedLoops(const WallGraph& graph) {
    std::vector<ClosedLoop> loops;
    std::vector<bool> consumed(graph.size(), false);

    for (std::size_t i = 0; i < graph.size(); ++i) {
        if (consumed[i]) continue;
        TraceResult r = traceFrom(graph, i, consumed);
        if (!r.closed()) continue;
        for (const std::size_t w : r.wallIndices) consumed[w] = true;
        loops.push_back(ClosedLoop{std::move(r.points), std::move(r.wallIndices)});
    }
    return loops;
}

Polygon calculateRoomBoundary(const std::vector<Wall>& walls, double tolerance) {
    TraceResult r = traceWallList(walls, tolerance);
    if (walls.size() > 1 && !r.closed()) {
        FLOORPLAN_LOG_DEBUG("boundary trace stopped open after %zu of %zu walls", r.wallIndices.size(), walls.size());
    }
    return std::move(r.points);
}

std::optional<std::size_t> LargestAreaLoopSelector::selectOuter(const std::vector<ClosedLoop>& loops) const {
    std::optional<std::size_t> best;
    double bestArea = -1.0;
    for (std::size_t i = 0; i < loops.size(); ++i) {
        const double a = polygonArea(loops[i].points);
        if (a > bestArea) {
            bestArea = a;
            best = i;
        }
    }
    return best;
}

WallSeparation separateOuterAndInteriorWalls(const std::vector<Wall>& walls, double tolerance) {
    return separateOuterAndInteriorWalls(walls, LargestAreaLoopSelector{}, tolerance);
}

WallSeparation separateOuterAndInteriorWalls(
    const std::vector<Wall>& walls,
    const OuterLoopSelector& selector,
    double tolerance) {
    WallSeparation sep;
    if (walls.empty()) return sep;

    const WallGraph graph(walls, tolerance);
    sep.loops = findClosedLoops(graph);
    sep.outerLoop = selector.selectOuter(sep.loops);

    std::vector<bool> isOuter(walls.size(), false);
    if (sep.outerLoop && *sep.outerLoop < sep.loops.size()) {
        for (const std::size_t w : sep.loops[*sep.outerLoop].wallIndices) {
            isOuter[w] = true;
            sep.outerWalls.push_back(walls[w]);
        }
    } else {
        sep.outerLoop.reset();
    }

    for (std::size_t i = 0; i < walls.size(); ++i) {
        if (!isOuter[i]) sep.interiorWalls.push_back(walls[i]);
    }
    return sep;
}

BoundaryWithHoles calculateRoomBoundaryWithHoles(const std::vector<Wall>& walls, double tolerance) {
    return calculateRoomBoundaryWithHoles(walls, LargestAreaLoopSelector{}, tolerance);
}

BoundaryWithHoles calculateRoomBoundaryWithHoles(
    const std::vector<Wall>& walls,
    const OuterLoopSelector& selector,
    double tolerance) {
    BoundaryWithHoles out;
    if (walls.empty()) return out;

    const WallSeparation sep = separateOuterAndInteriorWalls(walls, selector, tolerance);

    // No closed loop at all: the whole wall list is the (open) outline.
    if (sep.outerWalls.empty()) {
        TraceResult outer = traceWallList(walls, tolerance);
        out.outer = std::move(outer.points);
        out.outerStatus = outer.status;
        return out;
    }

    TraceResult outer = traceWallList(sep.outerWalls, tolerance);
    out.outer = std::move(outer.points);
    out.outerStatus = outer.status;

    if (sep.interiorWalls.empty()) return out;

    const WallGraph interior(sep.interiorWalls, tolerance);
    std::vector<ClosedLoop> holeLoops = findClosedLoops(interior);

    std::size_t holeWalls = 0;
    for (ClosedLoop& loop : holeLoops) {
        if (!polygonInsidePolygon(loop.points, out.outer)) continue;
        holeWalls += loop.wallIndices.size();
        out.holes.push_back(std::move(loop.points));
    }
    if (holeWalls < sep.interiorWalls.size()) {
        FLOORPLAN_LOG_DEBUG("dropped %zu interior walls that do not close a loop inside the outer ring",
                            sep.interiorWalls.size() - holeWalls);
    }
    return out;
}

} // namespace floorplan
