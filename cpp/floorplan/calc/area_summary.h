#ifndef FLOORPLAN_CALC_AREA_SUMMARY_H
#define FLOORPLAN_CALC_AREA_SUMMARY_H

#include "floorplan/calc/materials.h"
#include "floorplan/core/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace floorplan {

struct RoomSummary {
    std::uint32_t roomId{0};
    std::string name;
    std::string type;
    double floorArea{0.0};
    double wallArea{0.0};
    double volume{0.0};
    double perimeter{0.0};
    std::optional<MaterialCalculation> materials;
    std::optional<CostEstimation> costs;
};

// Export hand-off record. Figures are read from the document's stored
// derived fields, so recalculate and merge before summarizing.
struct AreaSummary {
    std::string sketchName;
    double totalFloorArea{0.0};
    std::size_t totalRooms{0};
    std::size_t totalWalls{0};
    std::vector<RoomSummary> rooms;
    AreaCalculation totals;
    std::optional<double> estimatedCost; // set only when prices were supplied
};

AreaSummary generateAreaSummary(
    const SketchDocument& document,
    bool includeEstimates = false,
    const std::optional<UnitPrices>& prices = std::nullopt,
    const MaterialOptions& materialOptions = {});

} // namespace floorplan

#endif // FLOORPLAN_CALC_AREA_SUMMARY_H
