#ifndef FLOORPLAN_CORE_TYPES_H
#define FLOORPLAN_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Document records shared by every stage of the measurement pipeline.
// Coordinates are drawing-space units (pixels); physical sizes are inches
// unless a field says otherwise.

namespace floorplan {

struct Point2 { double x; double y; };

using Polygon = std::vector<Point2>;

struct BoundingBox {
    double minX, minY, maxX, maxY;
};

struct Rectangle {
    double x, y, width, height;
};

// Imperial length. totalInches is the source of truth; feet/inches/display
// are always regenerable from it.
struct Measurement {
    std::int32_t feet{0};
    double inches{0.0};     // [0, 12)
    double totalInches{0.0};
    std::string display;
};

struct AreaCalculation {
    double floorArea{0.0};    // sq ft
    double ceilingArea{0.0};  // sq ft
    double wallArea{0.0};     // sq ft
    double netWallArea{0.0};  // sq ft, openings removed
    double volume{0.0};       // cu ft
    double perimeter{0.0};    // ft
};

// Fixture size in inches.
struct FixtureDimensions {
    double width{0.0};
    double height{0.0};
    double depth{0.0}; // 0 when the fixture has no depth
};

// Room bounding size in feet.
struct RoomDimensions {
    double width{0.0};
    double height{0.0};
    std::optional<double> depth; // room height, feet
};

enum class WallType : std::uint8_t { Exterior = 0, Interior = 1, LoadBearing = 2 };

enum class FixtureCategory : std::uint8_t {
    Door = 0,
    Window = 1,
    Cabinet = 2,
    Vanity = 3,
    Appliance = 4,
    Electrical = 5,
    Plumbing = 6,
};

enum class RoomType : std::uint8_t {
    LivingRoom = 0,
    Bedroom,
    Kitchen,
    Bathroom,
    DiningRoom,
    Office,
    Hallway,
    Closet,
    Utility,
    Garage,
    Basement,
    Attic,
    Other,
};

// Ids are host-assigned and non-zero; 0 means "none".
struct Wall {
    std::uint32_t id{0};
    Point2 start{0.0, 0.0};
    Point2 end{0.0, 0.0};
    double thickness{4.0}; // inches
    Measurement height;
    WallType type{WallType::Interior};
    std::vector<std::uint32_t> fixtures;       // WallFixture ids
    std::uint32_t roomId{0};
    std::vector<std::uint32_t> connectedWalls;
};

struct WallFixture {
    std::uint32_t id{0};
    FixtureCategory category{FixtureCategory::Door};
    std::uint32_t wallId{0};
    double position{0.5}; // along the owning wall, [0, 1]
    FixtureDimensions dimensions;
    bool isOpening{false};
    std::optional<FixtureDimensions> openingDimensions; // overrides dimensions for the cut-out
};

struct RoomFixture {
    std::uint32_t id{0};
    FixtureCategory category{FixtureCategory::Cabinet};
    std::uint32_t roomId{0};
    Point2 position{0.0, 0.0}; // absolute, drawing space
    double rotation{0.0};      // radians
    FixtureDimensions dimensions;
};

struct RoomProperties {
    std::optional<Measurement> ceilingHeight;
    std::string floorMaterial;
    std::string notes;
};

struct SketchRoom {
    std::uint32_t id{0};
    std::string name;
    RoomType type{RoomType::Other};
    std::vector<std::uint32_t> wallIds;
    Polygon boundary; // derived from wallIds
    RoomDimensions dimensions;
    AreaCalculation areas; // derived
    RoomProperties properties;
};

struct Scale {
    double pixelsPerFoot{50.0};
    double gridSize{1.0}; // feet
};

struct SketchMetadata {
    Scale scale;
    BoundingBox bounds{0.0, 0.0, 0.0, 0.0};
    AreaCalculation totalAreas;
};

struct SketchDocument {
    std::uint32_t id{0};
    std::string name;
    std::vector<SketchRoom> rooms;
    std::vector<Wall> walls;
    std::vector<WallFixture> wallFixtures;
    std::vector<RoomFixture> roomFixtures;
    SketchMetadata metadata;
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidScale = 1,
    UnknownRoom = 2,
    NoValidArea = 3,
};

} // namespace floorplan

#endif // FLOORPLAN_CORE_TYPES_H
