#ifndef FLOORPLAN_CALC_AREA_CALCULATOR_H
#define FLOORPLAN_CALC_AREA_CALCULATOR_H

#include "floorplan/core/types.h"
#include "floorplan/topology/boundary_tracer.h"

#include <cstdint>
#include <vector>

namespace floorplan {

struct WallAreaDetail {
    std::uint32_t wallId;
    double area;        // sq ft
    double netArea;     // sq ft, never negative
    double length;      // ft
    double height;      // ft
    double openingArea; // sq ft
};

struct WallAreaTotals {
    double totalArea{0.0};
    double netArea{0.0};
    std::vector<WallAreaDetail> walls;
};

// Derived geometry and quantities for one room, for the host to merge back.
struct RoomAreaResult {
    std::uint32_t roomId{0};
    Polygon boundary;
    std::vector<Polygon> holes;
    TraceStatus boundaryStatus{TraceStatus::NoConnectableWalls};
    RoomDimensions dimensions;
    AreaCalculation areas;
};

struct SketchAreaResult {
    std::vector<RoomAreaResult> rooms;
    AreaCalculation totals;
    BoundingBox bounds{0.0, 0.0, 0.0, 0.0};
    bool boundsValid{false}; // false when the document has no walls
};

// Walls listed in room.wallIds, in document order. Unknown ids are skipped.
std::vector<Wall> collectRoomWalls(const SketchRoom& room, const std::vector<Wall>& walls);

// >= 3 bounding walls and >= 3 boundary points.
bool hasValidArea(const SketchRoom& room, const std::vector<Wall>& roomWalls) noexcept;

// Ceiling height in feet, 8 when the room does not set one.
double roomHeightFeet(const SketchRoom& room) noexcept;

// Sum of width x height (ft) over opening fixtures, using openingDimensions when present.
double calculateOpeningAreas(const std::vector<WallFixture>& fixtures) noexcept;

// Per-wall length x height with openings removed. Fixture ids that no longer
// resolve are ignored.
WallAreaTotals calculateWallAreas(
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    double pixelsPerFoot);

// Invalid rooms get zero floor/ceiling area and volume but keep perimeter and
// wall areas. Holes are subtracted from the floor area.
AreaCalculation calculateRoomAreas(
    const SketchRoom& room,
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    double pixelsPerFoot,
    const std::vector<Polygon>& holes = {});

AreaCalculation calculateRoomAreas(const SketchRoom& room, const std::vector<Wall>& walls, double pixelsPerFoot);

// Boundary bounding box in feet; depth kept from the room or defaulted to 8 ft.
RoomDimensions calculateRoomDimensions(const SketchRoom& room, const Polygon& boundary, double pixelsPerFoot);

// Full per-room pipeline: trace boundary + holes from the room's walls, then measure.
RoomAreaResult calculateRoomResult(
    const SketchRoom& room,
    const SketchDocument& document,
    const TopologyConfig& topology = {});

SketchAreaResult calculateSketchAreas(const SketchDocument& document, const TopologyConfig& topology = {});

} // namespace floorplan

#endif // FLOORPLAN_CALC_AREA_CALCULATOR_H
