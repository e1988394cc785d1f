#include "floorplan/topology/wall_graph.h"
#include "floorplan/geometry/primitives.h"

namespace floorplan {

WallGraph::WallGraph(const std::vector<Wall>& walls, double tolerance)
    : tolerance_(tolerance) {
    nodes_.reserve(walls.size());
    for (const Wall& w : walls) {
        nodes_.push_back(Node{w.id, w.start, w.end});
    }

    adjacency_.assign(nodes_.size(), std::vector<std::uint32_t>{});
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        const Node& a = nodes_[i];
        for (std::size_t j = i + 1; j < nodes_.size(); ++j) {
            const Node& b = nodes_[j];
            if (!endpointsTouch(a.start, a.end, b.start, b.end, tolerance_)) continue;
            adjacency_[i].push_back(static_cast<std::uint32_t>(j));
            adjacency_[j].push_back(static_cast<std::uint32_t>(i));
        }
    }
}

bool WallGraph::endpointsTouch(const Point2& a0, const Point2& a1, const Point2& b0, const Point2& b1, double tolerance) noexcept {
    return distance(a0, b0) < tolerance ||
           distance(a0, b1) < tolerance ||
           distance(a1, b0) < tolerance ||
           distance(a1, b1) < tolerance;
}

std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> WallGraph::connectionMap() const {
    std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> out;
    out.reserve(nodes_.size());
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        auto& ids = out[nodes_[i].id];
        for (const std::uint32_t n : adjacency_[i]) {
            ids.push_back(nodes_[n].id);
        }
    }
    return out;
}

std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> findWallConnections(
    const std::vector<Wall>& walls,
    double tolerance) {
    return WallGraph(walls, tolerance).connectionMap();
}

} // namespace floorplan
