#include "floorplan/calc/area_summary.h"
#include "floorplan/core/defaults.h"

#include <utility>

namespace floorplan {

AreaSummary generateAreaSummary(
    const SketchDocument& document,
    bool includeEstimates,
    const std::optional<UnitPrices>& prices,
    const MaterialOptions& materialOptions) {
    AreaSummary out;
    out.sketchName = document.name;
    out.totalFloorArea = document.metadata.totalAreas.floorArea;
    out.totalRooms = document.rooms.size();
    out.totalWalls = document.walls.size();
    out.totals = document.metadata.totalAreas;

    const bool withCosts = includeEstimates && prices.has_value();
    double estimated = 0.0;

    out.rooms.reserve(document.rooms.size());
    for (const SketchRoom& room : document.rooms) {
        RoomSummary rs;
        rs.roomId = room.id;
        rs.name = room.name;
        rs.type = defaults::roomTypeName(room.type);
        rs.floorArea = room.areas.floorArea;
        rs.wallArea = room.areas.wallArea;
        rs.volume = room.areas.volume;
        rs.perimeter = room.areas.perimeter;

        if (includeEstimates) {
            rs.materials = calculateMaterials(room, document.walls, document.wallFixtures, materialOptions);
            if (withCosts) {
                rs.costs = calculateCostEstimation(*rs.materials, *prices);
                estimated += rs.costs->grandTotal;
            }
        }
        out.rooms.push_back(std::move(rs));
    }

    if (withCosts) out.estimatedCost = estimated;
    return out;
}

} // namespace floorplan
