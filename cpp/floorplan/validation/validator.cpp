#include "floorplan/validation/validator.h"
#include "floorplan/geometry/polygon.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/measurement/measurement.h"

#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <unordered_set>

namespace floorplan {

namespace {

// Below this the wall is degenerate whatever the scale.
constexpr double kFallbackMinWallLengthPx = 0.1;

std::string formatMessage(const char* fmt, ...) {
    char buf[160];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    return std::string(buf);
}

class IssueSink {
public:
    explicit IssueSink(ValidationResult& result) : result_(result) {}

    void error(ValidationCode code, std::string message, std::uint32_t id = 0, ElementType type = ElementType::None) {
        result_.errors.push_back({ValidationSeverity::Error, code, std::move(message), id, type});
        result_.isValid = false;
    }

    void warning(ValidationCode code, std::string message, std::uint32_t id = 0, ElementType type = ElementType::None) {
        result_.warnings.push_back({ValidationSeverity::Warning, code, std::move(message), id, type});
    }

private:
    ValidationResult& result_;
};

bool isBlank(const std::string& s) noexcept {
    for (const char c : s) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
    }
    return true;
}

bool isFinitePoint(const Point2& p) noexcept {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

bool outsideHeightRange(double feet, double maxFeet) noexcept {
    return feet <= 0.0 || feet > maxFeet;
}

void merge(ValidationResult& into, ValidationResult&& from) {
    for (ValidationIssue& e : from.errors) into.errors.push_back(std::move(e));
    for (ValidationIssue& w : from.warnings) into.warnings.push_back(std::move(w));
    if (!from.isValid) into.isValid = false;
}

} // namespace

const char* validationCodeName(ValidationCode code) noexcept {
    switch (code) {
        case ValidationCode::SketchNoName: return "SKETCH_NO_NAME";
        case ValidationCode::WallInvalidStartPoint: return "WALL_INVALID_START_POINT";
        case ValidationCode::WallInvalidEndPoint: return "WALL_INVALID_END_POINT";
        case ValidationCode::WallZeroLength: return "WALL_ZERO_LENGTH";
        case ValidationCode::WallUnusualThickness: return "WALL_UNUSUAL_THICKNESS";
        case ValidationCode::WallUnusualHeight: return "WALL_UNUSUAL_HEIGHT";
        case ValidationCode::WallDisconnected: return "WALL_DISCONNECTED";
        case ValidationCode::RoomNoName: return "ROOM_NO_NAME";
        case ValidationCode::RoomNoWalls: return "ROOM_NO_WALLS";
        case ValidationCode::RoomInsufficientWalls: return "ROOM_INSUFFICIENT_WALLS";
        case ValidationCode::RoomInvalidWallReference: return "ROOM_INVALID_WALL_REFERENCE";
        case ValidationCode::RoomUnusualCeilingHeight: return "ROOM_UNUSUAL_CEILING_HEIGHT";
        case ValidationCode::RoomZeroArea: return "ROOM_ZERO_AREA";
        case ValidationCode::FixtureInvalidPosition: return "FIXTURE_INVALID_POSITION";
        case ValidationCode::FixtureInvalidDimensions: return "FIXTURE_INVALID_DIMENSIONS";
    }
    return "UNKNOWN";
}

ValidationResult validateWall(const Wall& wall, double pixelsPerFoot, const ValidatorOptions& options) {
    ValidationResult result;
    IssueSink sink(result);

    const bool startOk = isFinitePoint(wall.start);
    const bool endOk = isFinitePoint(wall.end);
    if (!startOk) {
        sink.error(ValidationCode::WallInvalidStartPoint, "Wall start point has invalid coordinates",
                   wall.id, ElementType::Wall);
    }
    if (!endOk) {
        sink.error(ValidationCode::WallInvalidEndPoint, "Wall end point has invalid coordinates",
                   wall.id, ElementType::Wall);
    }

    if (startOk && endOk) {
        const double minLength = pixelsPerFoot > 0.0
            ? feetToPixels(options.minWallLengthInches / kInchesPerFoot, pixelsPerFoot)
            : kFallbackMinWallLengthPx;
        if (distance(wall.start, wall.end) < minLength) {
            sink.error(ValidationCode::WallZeroLength, "Wall length is too small (minimum 1 inch)",
                       wall.id, ElementType::Wall);
        }
    }

    if (wall.thickness <= 0.0 || wall.thickness > options.maxWallThicknessInches) {
        sink.warning(ValidationCode::WallUnusualThickness,
                     formatMessage("Wall thickness %g\" is unusual (typical: 4\"-6\")", wall.thickness),
                     wall.id, ElementType::Wall);
    }

    const double heightFeet = wall.height.totalInches / kInchesPerFoot;
    if (outsideHeightRange(heightFeet, options.maxHeightFeet)) {
        sink.warning(ValidationCode::WallUnusualHeight,
                     formatMessage("Wall height %g' is unusual (typical: 8'-10')", heightFeet),
                     wall.id, ElementType::Wall);
    }
    return result;
}

ValidationResult validateRoom(const SketchRoom& room, const std::vector<Wall>& walls,
                              const ValidatorOptions& options) {
    ValidationResult result;
    IssueSink sink(result);

    if (isBlank(room.name)) {
        sink.error(ValidationCode::RoomNoName, "Room must have a name", room.id, ElementType::Room);
    }

    if (room.wallIds.empty()) {
        sink.error(ValidationCode::RoomNoWalls, "Room must have at least 3 walls", room.id, ElementType::Room);
    } else if (room.wallIds.size() < 3) {
        sink.error(ValidationCode::RoomInsufficientWalls,
                   "Room must have at least 3 walls to form an enclosed area", room.id, ElementType::Room);
    }

    std::unordered_set<std::uint32_t> known;
    known.reserve(walls.size());
    for (const Wall& w : walls) known.insert(w.id);
    for (const std::uint32_t wallId : room.wallIds) {
        if (known.count(wallId) == 0) {
            sink.error(ValidationCode::RoomInvalidWallReference,
                       formatMessage("Room references non-existent wall: %u", wallId),
                       room.id, ElementType::Room);
        }
    }

    if (room.properties.ceilingHeight) {
        const double feet = room.properties.ceilingHeight->totalInches / kInchesPerFoot;
        if (outsideHeightRange(feet, options.maxHeightFeet)) {
            sink.warning(ValidationCode::RoomUnusualCeilingHeight,
                         formatMessage("Ceiling height %g' is unusual (typical: 8'-10')", feet),
                         room.id, ElementType::Room);
        }
    }

    if (polygonArea(room.boundary) <= 0.0) {
        sink.warning(ValidationCode::RoomZeroArea, "Room area is zero or negative", room.id, ElementType::Room);
    }
    return result;
}

ValidationResult validateWallFixture(const WallFixture& fixture) {
    ValidationResult result;
    IssueSink sink(result);

    if (!std::isfinite(fixture.position) || fixture.position < 0.0 || fixture.position > 1.0) {
        sink.error(ValidationCode::FixtureInvalidPosition,
                   "Fixture position must be between 0 and 1 along the wall", fixture.id, ElementType::Fixture);
    }
    if (!(fixture.dimensions.width > 0.0) || !(fixture.dimensions.height > 0.0)) {
        sink.error(ValidationCode::FixtureInvalidDimensions, "Fixture dimensions must be positive",
                   fixture.id, ElementType::Fixture);
    }
    return result;
}

ValidationResult validateRoomFixture(const RoomFixture& fixture) {
    ValidationResult result;
    IssueSink sink(result);

    if (!isFinitePoint(fixture.position)) {
        sink.error(ValidationCode::FixtureInvalidPosition, "Fixture position has invalid coordinates",
                   fixture.id, ElementType::Fixture);
    }
    if (!(fixture.dimensions.width > 0.0) || !(fixture.dimensions.height > 0.0)) {
        sink.error(ValidationCode::FixtureInvalidDimensions, "Fixture dimensions must be positive",
                   fixture.id, ElementType::Fixture);
    }
    return result;
}

ValidationResult validateSketch(const SketchDocument& document, const ValidatorOptions& options) {
    ValidationResult result;
    IssueSink sink(result);

    if (isBlank(document.name)) {
        sink.error(ValidationCode::SketchNoName, "Sketch must have a name");
    }

    const double ppf = document.metadata.scale.pixelsPerFoot;
    for (const Wall& wall : document.walls) merge(result, validateWall(wall, ppf, options));
    for (const SketchRoom& room : document.rooms) merge(result, validateRoom(room, document.walls, options));
    for (const WallFixture& f : document.wallFixtures) merge(result, validateWallFixture(f));
    for (const RoomFixture& f : document.roomFixtures) merge(result, validateRoomFixture(f));

    // Connectivity comes from geometry, not the stored connectedWalls lists.
    const WallGraph graph(document.walls, options.connectionTolerance);
    for (std::size_t i = 0; i < graph.size(); ++i) {
        if (graph.degree(i) == 0) {
            sink.warning(ValidationCode::WallDisconnected, "Wall is not connected to other walls",
                         graph.node(i).id, ElementType::Wall);
        }
    }
    return result;
}

} // namespace floorplan
