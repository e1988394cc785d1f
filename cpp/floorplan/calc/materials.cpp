#include "floorplan/calc/materials.h"
#include "floorplan/calc/area_calculator.h"
#include "floorplan/measurement/measurement.h"

#include <cmath>
#include <limits>
#include <unordered_map>

namespace floorplan {

namespace {

// ceil() that tolerates a zero or negative divisor and saturates at the
// int32 range.
std::int32_t ceilQuotient(double numerator, double denominator) noexcept {
    if (!(denominator > 0.0) || !std::isfinite(numerator)) return 0;
    const double q = std::ceil(numerator / denominator);
    constexpr std::int32_t kMax = std::numeric_limits<std::int32_t>::max();
    constexpr std::int32_t kMin = std::numeric_limits<std::int32_t>::min();
    if (!(q < static_cast<double>(kMax))) return kMax;
    if (q < static_cast<double>(kMin)) return kMin;
    return static_cast<std::int32_t>(q);
}

double casingLinearFeet(
    const std::vector<Wall>& roomWalls,
    const std::vector<WallFixture>& fixtures) {
    std::unordered_map<std::uint32_t, const WallFixture*> byId;
    for (const WallFixture& f : fixtures) byId.emplace(f.id, &f);

    double total = 0.0;
    for (const Wall& wall : roomWalls) {
        for (const std::uint32_t fid : wall.fixtures) {
            const auto it = byId.find(fid);
            if (it == byId.end() || !it->second->isOpening) continue;
            const FixtureDimensions& d = it->second->dimensions;
            // Two sides and the head.
            total += 2.0 * (d.height / kInchesPerFoot) + d.width / kInchesPerFoot;
        }
    }
    return total;
}

} // namespace

MaterialCalculation calculateMaterials(
    const SketchRoom& room,
    const std::vector<Wall>& walls,
    const std::vector<WallFixture>& fixtures,
    const MaterialOptions& options) {
    const AreaCalculation& areas = room.areas;
    MaterialCalculation out;

    out.flooringSquareFeet = areas.floorArea;
    out.flooringWaste = areas.floorArea * (options.flooringWastePercent / 100.0);
    out.flooringTotal = out.flooringSquareFeet + out.flooringWaste;

    out.paintableArea = areas.netWallArea;
    out.paintGallons = ceilQuotient(out.paintableArea, options.paintCoverage);
    out.primerGallons = static_cast<std::int32_t>(std::ceil(out.paintGallons * 0.8));

    if (options.includeTrim) {
        out.baseboardLinearFeet = areas.perimeter;
        out.crownMoldingLinearFeet = areas.perimeter;
        out.caseLinearFeet = casingLinearFeet(collectRoomWalls(room, walls), fixtures);
    }

    out.ceilingSquareFeet = areas.ceilingArea;
    const double tileSquareFeet = (options.ceilingTileSize * options.ceilingTileSize) / 144.0;
    out.ceilingTiles = ceilQuotient(out.ceilingSquareFeet, tileSquareFeet);
    return out;
}

CostEstimation calculateCostEstimation(const MaterialCalculation& materials, const UnitPrices& prices) {
    CostEstimation out;

    out.flooring = CostLine{materials.flooringTotal, prices.flooringPerSqFt,
                            materials.flooringTotal * prices.flooringPerSqFt};
    out.paint = CostLine{materials.paintableArea, prices.paintPerSqFt,
                         materials.paintableArea * prices.paintPerSqFt};

    const double trimFeet =
        materials.baseboardLinearFeet + materials.crownMoldingLinearFeet + materials.caseLinearFeet;
    out.trim = CostLine{trimFeet, prices.trimPerLinearFt, trimFeet * prices.trimPerLinearFt};

    // One hour per 10 sq ft of floor.
    out.labor.hours = ceilQuotient(materials.flooringSquareFeet, 10.0);
    out.labor.hourlyRate = prices.laborPerSqFt * 10.0;
    out.labor.total = out.labor.hours * out.labor.hourlyRate;

    out.grandTotal = out.flooring.total + out.paint.total + out.trim.total + out.labor.total;
    return out;
}

} // namespace floorplan
