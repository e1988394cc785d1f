#include "floorplan/calc/area_calculator.h"
#include "floorplan/core/defaults.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/polygon.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/measurement/measurement.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace floorplan {

namespace {

std::unordered_map<std::uint32_t, const WallFixture*> indexFixtures(const std::vector<WallFixture>& fixtures) {
    std::unordered_map<std::uint32_t, const WallFixture*> byId;
    byId.reserve(fixtures.size());
    for (const WallFixture& f : fixtures) byId.emplace(f.id, &f);
    return byId;
}

void accumulate(AreaCalculation& total, const AreaCalculation& a) noexcept {
    total.floorArea += a.floorArea;
    total.ceilingArea += a.ceilingArea;
    total.wallArea += a.wallArea;
    total.netWallArea += a.netWallArea;
    total.volume += a.volume;
    total.perimeter += a.perimeter;
}

} // namespace

std::vector<Wall> collectRoomWalls(const SketchRoom& room, const std::vector<Wall>& walls) {
    const std::unordered_set<std::uint32_t> ids(room.wallIds.begin(), room.wallIds.end());
    std::vector<Wall> out;
    for (const Wall& w : walls) {
        if (ids.count(w.id) != 0) out.push_back(w);
    }
    return out;
}

bool hasValidArea(const SketchRoom& room, const std::vector<Wall>& roomWalls) noexcept {
    return roomWalls.size() >= 3 && room.boundary.size() >= 3;
}

double roomHeightFeet(const SketchRoom& room) noexcept {
    if (room.properties.ceilingHeight) {
        return room.properties.ceilingHeight->totalInches / kInchesPerFoot;
    }
    return defaults::kCeilingHeightFeet;
}

double calculateOpeningAreas(const std::vector<WallFixture>& fixtures) noexcept {
    double total = 0.0;
    for (const WallFixture& f : fixtures) {
        if (!f.isOpening) continue;
        const FixtureDimensions& d = f.openingDimensions ? *f.openingDimensions : f.dimensions;
        total += (d.width / kInchesPerFoot) * (d.height / kInchesPerFoot);
    }
    return total;
}

WallAreaTotals calculateWallAreas(
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    double pixelsPerFoot) {
    WallAreaTotals totals;
    totals.walls.reserve(walls.size());
    const auto byId = indexFixtures(fixtures);

    std::vector<WallFixture> wallFixtures;
    for (const Wall& wall : walls) {
        const double length = pixelsToFeet(distance(wall.start, wall.end), pixelsPerFoot);
        const double height = wall.height.totalInches / kInchesPerFoot;
        const double area = length * height;

        wallFixtures.clear();
        for (const std::uint32_t fid : wall.fixtures) {
            const auto it = byId.find(fid);
            if (it != byId.end()) wallFixtures.push_back(*it->second);
        }
        const double openingArea = calculateOpeningAreas(wallFixtures);
        const double netArea = std::max(0.0, area - openingArea);

        totals.totalArea += area;
        totals.netArea += netArea;
        totals.walls.push_back(WallAreaDetail{wall.id, area, netArea, length, height, openingArea});
    }
    return totals;
}

AreaCalculation calculateRoomAreas(
    const SketchRoom& room,
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    double pixelsPerFoot,
    const std::vector<Polygon>& holes) {
    const std::vector<Wall> roomWalls = collectRoomWalls(room, walls);
    const bool valid = hasValidArea(room, roomWalls);

    AreaCalculation out;
    if (valid) {
        out.floorArea = pixelAreaToSquareFeet(polygonAreaWithHoles(room.boundary, holes), pixelsPerFoot);
    }
    out.ceilingArea = out.floorArea;
    out.perimeter = pixelsToFeet(polygonPerimeter(room.boundary), pixelsPerFoot);

    const WallAreaTotals wallAreas = calculateWallAreas(roomWalls, fixtures, pixelsPerFoot);
    out.wallArea = wallAreas.totalArea;
    out.netWallArea = wallAreas.netArea;

    out.volume = valid ? out.floorArea * roomHeightFeet(room) : 0.0;
    return out;
}

AreaCalculation calculateRoomAreas(const SketchRoom& room, const std::vector<Wall>& walls, double pixelsPerFoot) {
    return calculateRoomAreas(room, walls, {}, pixelsPerFoot);
}

RoomDimensions calculateRoomDimensions(const SketchRoom& room, const Polygon& boundary, double pixelsPerFoot) {
    RoomDimensions dims = room.dimensions;
    if (!boundary.empty()) {
        const BoundingBox box = boundingBox(boundary);
        dims.width = pixelsToFeet(box.maxX - box.minX, pixelsPerFoot);
        dims.height = pixelsToFeet(box.maxY - box.minY, pixelsPerFoot);
    }
    if (!dims.depth) dims.depth = defaults::kCeilingHeightFeet;
    return dims;
}

RoomAreaResult calculateRoomResult(
    const SketchRoom& room,
    const SketchDocument& document,
    const TopologyConfig& topology) {
    const double ppf = document.metadata.scale.pixelsPerFoot;

    RoomAreaResult result;
    result.roomId = room.id;

    const std::vector<Wall> roomWalls = collectRoomWalls(room, document.walls);
    BoundaryWithHoles traced = calculateRoomBoundaryWithHoles(roomWalls, topology.boundaryTolerance);
    if (!roomWalls.empty() && traced.outerStatus != TraceStatus::Closed) {
        FLOORPLAN_LOG_DEBUG("room %u: boundary not closed, measuring partial outline", room.id);
    }

    SketchRoom derived = room;
    derived.boundary = traced.outer;

    result.areas = calculateRoomAreas(derived, document.walls, document.wallFixtures, ppf, traced.holes);
    result.dimensions = calculateRoomDimensions(room, traced.outer, ppf);
    result.boundary = std::move(traced.outer);
    result.holes = std::move(traced.holes);
    result.boundaryStatus = traced.outerStatus;
    return result;
}

SketchAreaResult calculateSketchAreas(const SketchDocument& document, const TopologyConfig& topology) {
    SketchAreaResult out;
    out.rooms.reserve(document.rooms.size());

    for (const SketchRoom& room : document.rooms) {
        out.rooms.push_back(calculateRoomResult(room, document, topology));
        accumulate(out.totals, out.rooms.back().areas);
    }

    if (!document.walls.empty()) {
        std::vector<Point2> endpoints;
        endpoints.reserve(document.walls.size() * 2);
        for (const Wall& w : document.walls) {
            endpoints.push_back(w.start);
            endpoints.push_back(w.end);
        }
        out.bounds = boundingBox(endpoints);
        out.boundsValid = true;
    }
    return out;
}

} // namespace floorplan
