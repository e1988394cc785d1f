#include "floorplan/engine.h"
#include "floorplan/core/logging.h"

#include <utility>

namespace floorplan {

namespace {

const SketchRoom* findRoom(const SketchDocument& document, std::uint32_t roomId) noexcept {
    for (const SketchRoom& r : document.rooms) {
        if (r.id == roomId) return &r;
    }
    return nullptr;
}

} // namespace

EngineError SketchEngine::recalculate(const SketchDocument& document, DocumentUpdate& out) const {
    out = DocumentUpdate{};
    if (!(document.metadata.scale.pixelsPerFoot > 0.0)) {
        FLOORPLAN_LOG_WARN("recalculate: non-positive scale %g px/ft", document.metadata.scale.pixelsPerFoot);
        return setError(EngineError::InvalidScale);
    }

    SketchAreaResult areas = calculateSketchAreas(document, config_.topology);
    out.rooms = std::move(areas.rooms);
    out.totals = areas.totals;
    out.bounds = areas.bounds;
    out.boundsValid = areas.boundsValid;
    out.connections = findWallConnections(document.walls, config_.topology.boundaryTolerance);
    return setError(EngineError::Ok);
}

EngineError SketchEngine::measureRoom(const SketchDocument& document, std::uint32_t roomId, SketchRoom& out) const {
    if (!(document.metadata.scale.pixelsPerFoot > 0.0)) return EngineError::InvalidScale;

    const SketchRoom* room = findRoom(document, roomId);
    if (room == nullptr) {
        FLOORPLAN_LOG_WARN("room %u not found", roomId);
        return EngineError::UnknownRoom;
    }

    const RoomAreaResult result = calculateRoomResult(*room, document, config_.topology);
    out = *room;
    out.boundary = result.boundary;
    out.dimensions = result.dimensions;
    out.areas = result.areas;

    if (!hasValidArea(out, collectRoomWalls(out, document.walls))) return EngineError::NoValidArea;
    return EngineError::Ok;
}

EngineError SketchEngine::calculateRoomMaterials(const SketchDocument& document, std::uint32_t roomId,
                                                 MaterialCalculation& out) const {
    SketchRoom measured;
    const EngineError err = measureRoom(document, roomId, measured);
    if (err == EngineError::Ok || err == EngineError::NoValidArea) {
        out = calculateMaterials(measured, document.walls, document.wallFixtures, config_.materials);
    }
    return setError(err);
}

EngineError SketchEngine::calculateRoomCosts(const SketchDocument& document, std::uint32_t roomId,
                                             CostEstimation& out) const {
    MaterialCalculation materials;
    const EngineError err = calculateRoomMaterials(document, roomId, materials);
    if (err == EngineError::Ok || err == EngineError::NoValidArea) {
        out = calculateCostEstimation(materials, config_.prices);
    }
    return err;
}

ValidationResult SketchEngine::validate(const SketchDocument& document) const {
    return validateSketch(document, config_.validation);
}

EngineError SketchEngine::summarize(const SketchDocument& document, bool includeEstimates, AreaSummary& out) const {
    DocumentUpdate update;
    const EngineError err = recalculate(document, update);
    if (err != EngineError::Ok) return err;

    SketchDocument merged = document;
    applyDocumentUpdate(merged, update);
    out = generateAreaSummary(merged, includeEstimates,
                              includeEstimates ? std::optional<UnitPrices>(config_.prices) : std::nullopt,
                              config_.materials);
    return EngineError::Ok;
}

Measurement SketchEngine::measure(const Point2& a, const Point2& b, double pixelsPerFoot) const {
    return measureDistance(a, b, pixelsPerFoot, config_.measurement.precision);
}

Measurement SketchEngine::makeMeasurement(double totalInches) const {
    return createMeasurement(totalInches, config_.measurement.precision);
}

std::optional<Measurement> SketchEngine::parseMeasurement(std::string_view text) const {
    return parseMeasurementString(text);
}

bool SketchEngine::measurementsEqual(const Measurement& a, const Measurement& b) const noexcept {
    return floorplan::measurementsEqual(a, b, config_.measurement.equalityTolerance);
}

void applyDocumentUpdate(SketchDocument& document, const DocumentUpdate& update) {
    std::unordered_map<std::uint32_t, const RoomAreaResult*> byRoom;
    for (const RoomAreaResult& r : update.rooms) byRoom.emplace(r.roomId, &r);

    for (SketchRoom& room : document.rooms) {
        const auto it = byRoom.find(room.id);
        if (it == byRoom.end()) continue;
        room.boundary = it->second->boundary;
        room.dimensions = it->second->dimensions;
        room.areas = it->second->areas;
    }

    for (Wall& wall : document.walls) {
        const auto it = update.connections.find(wall.id);
        wall.connectedWalls = it != update.connections.end() ? it->second : std::vector<std::uint32_t>{};
    }

    document.metadata.totalAreas = update.totals;
    if (update.boundsValid) document.metadata.bounds = update.bounds;
}

} // namespace floorplan
