#include "floorplan/core/defaults.h"
#include "floorplan/measurement/measurement.h"

#include <cctype>

namespace floorplan::defaults {

namespace {

bool equalsIgnoreCase(const std::string& a, const char* b) noexcept {
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return i == a.size() && b[i] == '\0';
}

} // namespace

const FixtureDefaults& fixtureDefaults(FixtureCategory category) noexcept {
    for (const FixtureDefaults& d : kFixtureDefaults) {
        if (d.category == category) return d;
    }
    return kFixtureDefaults[0];
}

FixtureDimensions fixtureDimensionsFor(const std::string& categoryName) {
    for (const FixtureDefaults& d : kFixtureDefaults) {
        if (equalsIgnoreCase(categoryName, d.name)) return d.dimensions;
    }
    return kFallbackFixtureDimensions;
}

const char* fixtureCategoryName(FixtureCategory category) noexcept {
    return fixtureDefaults(category).name;
}

const char* roomTypeName(RoomType type) noexcept {
    switch (type) {
        case RoomType::LivingRoom: return "living_room";
        case RoomType::Bedroom: return "bedroom";
        case RoomType::Kitchen: return "kitchen";
        case RoomType::Bathroom: return "bathroom";
        case RoomType::DiningRoom: return "dining_room";
        case RoomType::Office: return "office";
        case RoomType::Hallway: return "hallway";
        case RoomType::Closet: return "closet";
        case RoomType::Utility: return "utility";
        case RoomType::Garage: return "garage";
        case RoomType::Basement: return "basement";
        case RoomType::Attic: return "attic";
        case RoomType::Other: return "other";
    }
    return "other";
}

Wall createDefaultWall(std::uint32_t id, Point2 start, Point2 end) {
    Wall w;
    w.id = id;
    w.start = start;
    w.end = end;
    w.thickness = kWallThicknessInches;
    w.height = createMeasurement(kWallHeightInches);
    w.type = WallType::Interior;
    return w;
}

SketchRoom createDefaultRoom(std::uint32_t id, const std::string& name) {
    SketchRoom r;
    r.id = id;
    r.name = name;
    r.type = RoomType::Other;
    r.dimensions.depth = kCeilingHeightFeet;
    return r;
}

WallFixture createDefaultWallFixture(std::uint32_t id, FixtureCategory category, double positionOnWall) {
    const FixtureDefaults& d = fixtureDefaults(category);
    WallFixture f;
    f.id = id;
    f.category = category;
    f.position = positionOnWall;
    f.dimensions = d.dimensions;
    f.isOpening = d.isOpening;
    return f;
}

RoomFixture createDefaultRoomFixture(std::uint32_t id, FixtureCategory category) {
    RoomFixture f;
    f.id = id;
    f.category = category;
    f.dimensions = fixtureDefaults(category).dimensions;
    return f;
}

SketchDocument createDefaultSketch(std::uint32_t id, const std::string& name) {
    SketchDocument doc;
    doc.id = id;
    doc.name = name;
    doc.metadata.scale = Scale{kPixelsPerFoot, kGridSizeFeet};
    return doc;
}

} // namespace floorplan::defaults
