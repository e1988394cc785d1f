#ifndef FLOORPLAN_TOPOLOGY_WALL_GRAPH_H
#define FLOORPLAN_TOPOLOGY_WALL_GRAPH_H

#include "floorplan/core/types.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace floorplan {

// Max distance (drawing units) at which two wall endpoints are the same corner.
constexpr double kDefaultBoundaryTolerance = 5.0;

struct TopologyConfig {
    double boundaryTolerance{kDefaultBoundaryTolerance};
};

// Endpoint-proximity adjacency over a flat wall list, built once per pass.
// Walls are copied into an arena and addressed by index; neighbour lists are
// symmetric and sorted ascending so every walk over them is deterministic.
class WallGraph {
public:
    struct Node {
        std::uint32_t id;
        Point2 start;
        Point2 end;
    };

    explicit WallGraph(const std::vector<Wall>& walls, double tolerance = kDefaultBoundaryTolerance);

    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }
    double tolerance() const noexcept { return tolerance_; }

    const Node& node(std::size_t index) const { return nodes_[index]; }
    const std::vector<std::uint32_t>& neighbors(std::size_t index) const { return adjacency_[index]; }
    std::size_t degree(std::size_t index) const { return adjacency_[index].size(); }

    // Two walls connect when any endpoint pair lies strictly within tolerance.
    static bool endpointsTouch(const Point2& a0, const Point2& a1, const Point2& b0, const Point2& b1, double tolerance) noexcept;

    // wallId -> neighbour wall ids, for writing back into Wall::connectedWalls.
    std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> connectionMap() const;

private:
    double tolerance_;
    std::vector<Node> nodes_;
    std::vector<std::vector<std::uint32_t>> adjacency_;
};

std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> findWallConnections(
    const std::vector<Wall>& walls,
    double tolerance = kDefaultBoundaryTolerance);

} // namespace floorplan

#endif // FLOORPLAN_TOPOLOGY_WALL_GRAPH_H
