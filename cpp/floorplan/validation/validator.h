#ifndef FLOORPLAN_VALIDATION_VALIDATOR_H
#define FLOORPLAN_VALIDATION_VALIDATOR_H

#include "floorplan/core/types.h"
#include "floorplan/topology/wall_graph.h"

#include <cstdint>
#include <string>
#include <vector>

namespace floorplan {

enum class ValidationSeverity : std::uint8_t { Error = 0, Warning = 1 };

enum class ValidationCode : std::uint8_t {
    SketchNoName = 0,
    WallInvalidStartPoint,
    WallInvalidEndPoint,
    WallZeroLength,
    WallUnusualThickness,
    WallUnusualHeight,
    WallDisconnected,
    RoomNoName,
    RoomNoWalls,
    RoomInsufficientWalls,
    RoomInvalidWallReference,
    RoomUnusualCeilingHeight,
    RoomZeroArea,
    FixtureInvalidPosition,
    FixtureInvalidDimensions,
};

enum class ElementType : std::uint8_t { None = 0, Wall, Room, Fixture };

// Stable upper-snake code string, e.g. "ROOM_INSUFFICIENT_WALLS".
const char* validationCodeName(ValidationCode code) noexcept;

struct ValidationIssue {
    ValidationSeverity severity{ValidationSeverity::Error};
    ValidationCode code{ValidationCode::SketchNoName};
    std::string message;
    std::uint32_t elementId{0}; // 0 for document-level issues
    ElementType elementType{ElementType::None};
};

struct ValidationResult {
    bool isValid{true};
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
};

struct ValidatorOptions {
    double connectionTolerance{kDefaultBoundaryTolerance}; // drawing units
    double minWallLengthInches{1.0};
    double maxWallThicknessInches{24.0};
    double maxHeightFeet{20.0};
};

// Issues are ordered: document, walls, rooms, wall fixtures, room fixtures,
// then disconnected walls. The document is never modified.
ValidationResult validateSketch(const SketchDocument& document, const ValidatorOptions& options = {});

ValidationResult validateWall(const Wall& wall, double pixelsPerFoot, const ValidatorOptions& options = {});
ValidationResult validateRoom(const SketchRoom& room, const std::vector<Wall>& walls,
                              const ValidatorOptions& options = {});
ValidationResult validateWallFixture(const WallFixture& fixture);
ValidationResult validateRoomFixture(const RoomFixture& fixture);

} // namespace floorplan

#endif // FLOORPLAN_VALIDATION_VALIDATOR_H
