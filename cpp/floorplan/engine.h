#pragma once

#include "floorplan/core/types.h"
#include "floorplan/calc/area_calculator.h"
#include "floorplan/calc/area_summary.h"
#include "floorplan/calc/materials.h"
#include "floorplan/measurement/measurement.h"
#include "floorplan/topology/wall_graph.h"
#include "floorplan/validation/validator.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace floorplan {

struct EngineConfig {
    MeasurementConfig measurement;
    TopologyConfig topology;
    MaterialOptions materials;
    UnitPrices prices;
    ValidatorOptions validation;
};

// Everything recalculate() derives, for the host to merge back into its
// document. Rooms are in document order.
struct DocumentUpdate {
    std::vector<RoomAreaResult> rooms;
    AreaCalculation totals;
    BoundingBox bounds{0.0, 0.0, 0.0, 0.0};
    bool boundsValid{false};
    std::unordered_map<std::uint32_t, std::vector<std::uint32_t>> connections;
};

// Stateless apart from its configuration and the last error code; every
// call reads a document snapshot and never writes to it.
class SketchEngine {
public:
    SketchEngine() = default;
    explicit SketchEngine(const EngineConfig& config) : config_(config) {}

    const EngineConfig& config() const noexcept { return config_; }
    void setConfig(const EngineConfig& config) { config_ = config; }

    EngineError getLastError() const noexcept { return lastError_; }

    // InvalidScale when the document's pixelsPerFoot is not positive; out is
    // left empty in that case.
    EngineError recalculate(const SketchDocument& document, DocumentUpdate& out) const;

    // Materials/costs for one room, measured from the room's walls rather
    // than its stored areas. UnknownRoom when the id is missing; NoValidArea
    // when the room does not enclose an area (out is still filled).
    EngineError calculateRoomMaterials(const SketchDocument& document, std::uint32_t roomId,
                                       MaterialCalculation& out) const;
    EngineError calculateRoomCosts(const SketchDocument& document, std::uint32_t roomId,
                                   CostEstimation& out) const;

    ValidationResult validate(const SketchDocument& document) const;

    // Summary of a freshly recalculated copy of the document. Costs are
    // included with the configured prices when includeEstimates is set.
    EngineError summarize(const SketchDocument& document, bool includeEstimates, AreaSummary& out) const;

    Measurement measure(const Point2& a, const Point2& b, double pixelsPerFoot) const;
    Measurement makeMeasurement(double totalInches) const;
    std::optional<Measurement> parseMeasurement(std::string_view text) const;
    bool measurementsEqual(const Measurement& a, const Measurement& b) const noexcept;

private:
    EngineConfig config_{};
    mutable EngineError lastError_{EngineError::Ok};

    EngineError setError(EngineError err) const noexcept { lastError_ = err; return err; }
    EngineError measureRoom(const SketchDocument& document, std::uint32_t roomId, SketchRoom& out) const;
};

// Host-side merge: writes derived boundaries, areas, dimensions, totals,
// bounds and wall connections. Rooms missing from the update are untouched.
void applyDocumentUpdate(SketchDocument& document, const DocumentUpdate& update);

} // namespace floorplan
