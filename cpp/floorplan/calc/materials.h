#ifndef FLOORPLAN_CALC_MATERIALS_H
#define FLOORPLAN_CALC_MATERIALS_H

#include "floorplan/core/types.h"

#include <cstdint>
#include <vector>

namespace floorplan {

struct MaterialOptions {
    double flooringWastePercent{10.0};
    double paintCoverage{350.0};  // sq ft per gallon
    double ceilingTileSize{24.0}; // inches, square tiles
    bool includeTrim{true};
};

struct MaterialCalculation {
    double flooringSquareFeet{0.0};
    double flooringWaste{0.0};
    double flooringTotal{0.0};
    double paintableArea{0.0};
    std::int32_t paintGallons{0};
    std::int32_t primerGallons{0};
    double baseboardLinearFeet{0.0};
    double crownMoldingLinearFeet{0.0};
    double caseLinearFeet{0.0};
    double ceilingSquareFeet{0.0};
    std::int32_t ceilingTiles{0};
};

struct UnitPrices {
    double flooringPerSqFt{5.0};
    double paintPerSqFt{2.0};
    double trimPerLinearFt{3.0};
    double laborPerSqFt{8.0};
};

struct CostLine {
    double quantity{0.0}; // sq ft or linear ft
    double unitPrice{0.0};
    double total{0.0};
};

struct LaborCost {
    std::int32_t hours{0};
    double hourlyRate{0.0};
    double total{0.0};
};

struct CostEstimation {
    CostLine flooring;
    CostLine paint;
    CostLine trim;
    LaborCost labor;
    double grandTotal{0.0};
};

// Quantities come from room.areas, so the room must already carry derived
// areas. Casing covers every opening fixture on the room's walls.
MaterialCalculation calculateMaterials(
    const SketchRoom& room,
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    const MaterialOptions& options = {});

CostEstimation calculateCostEstimation(const MaterialCalculation& materials, const UnitPrices& prices = {});

} // namespace floorplan

#endif // FLOORPLAN_CALC_MATERIALS_H
