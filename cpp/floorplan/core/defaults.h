#pragma once

/**
 * @file defaults.h
 * @brief Static default tables for new sketch elements.
 *
 * Pure data: colours, fixture sizes and the fixture catalogue shown by the
 * host's fixture picker. Nothing here is mutable at runtime.
 */

#include "floorplan/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace floorplan::defaults {

// =============================================================================
// Scale & Geometry
// =============================================================================

constexpr double kPixelsPerFoot = 50.0;
constexpr double kGridSizeFeet = 1.0;
constexpr double kWallThicknessInches = 4.0;
constexpr double kWallHeightInches = 96.0;
constexpr double kCeilingHeightFeet = 8.0;
constexpr double kSnapTolerancePx = 5.0;

// =============================================================================
// Styles
// =============================================================================

struct StrokeStyle {
    const char* fillColor;
    const char* strokeColor;
    double strokeWidth;
    double opacity;
};

constexpr StrokeStyle kWallStyle{"#ffffff", "#000000", 2.0, 1.0};
constexpr StrokeStyle kRoomStyle{"#e6f3ff", "#1890ff", 1.0, 0.3};

struct FixtureDefaults {
    FixtureCategory category;
    const char* name;
    FixtureDimensions dimensions; // inches
    StrokeStyle style;
    bool isOpening;
};

constexpr FixtureDefaults kFixtureDefaults[] = {
    {FixtureCategory::Door,       "door",       {36.0, 84.0, 0.0},  {"#8B4513", "#654321", 1.0, 1.0}, true},
    {FixtureCategory::Window,     "window",     {48.0, 48.0, 0.0},  {"#87CEEB", "#4682B4", 1.0, 0.7}, true},
    {FixtureCategory::Cabinet,    "cabinet",    {24.0, 36.0, 18.0}, {"#DEB887", "#8B7355", 1.0, 1.0}, false},
    {FixtureCategory::Vanity,     "vanity",     {48.0, 36.0, 24.0}, {"#D2691E", "#8B4513", 1.0, 1.0}, false},
    {FixtureCategory::Appliance,  "appliance",  {36.0, 72.0, 30.0}, {"#C0C0C0", "#808080", 1.0, 1.0}, false},
    {FixtureCategory::Electrical, "electrical", {4.0, 4.0, 0.0},    {"#FFD700", "#B8860B", 1.0, 1.0}, false},
    {FixtureCategory::Plumbing,   "plumbing",   {6.0, 6.0, 0.0},    {"#4682B4", "#191970", 1.0, 1.0}, false},
};

// Unknown category names get a 2' x 2' footprint.
constexpr FixtureDimensions kFallbackFixtureDimensions{24.0, 24.0, 0.0};

// =============================================================================
// Fixture Catalogue
// =============================================================================

struct FixtureTypeInfo {
    const char* key;
    const char* label;
    const char* group;
};

constexpr FixtureTypeInfo kFixtureTypes[] = {
    {"refrigerator", "Refrigerator", "kitchen"},
    {"stove", "Stove/Range", "kitchen"},
    {"dishwasher", "Dishwasher", "kitchen"},
    {"cabinet", "Cabinet", "kitchen"},
    {"sink", "Kitchen Sink", "kitchen"},
    {"toilet", "Toilet", "bathroom"},
    {"vanity", "Vanity", "bathroom"},
    {"bathtub", "Bathtub", "bathroom"},
    {"shower", "Shower", "bathroom"},
    {"door", "Door", "openings"},
    {"window", "Window", "openings"},
    {"archway", "Archway", "openings"},
};

constexpr std::size_t kFixtureTypeCount = sizeof(kFixtureTypes) / sizeof(kFixtureTypes[0]);

const FixtureDefaults& fixtureDefaults(FixtureCategory category) noexcept;

// Case-insensitive lookup by category name ("door", "Window", ...).
FixtureDimensions fixtureDimensionsFor(const std::string& categoryName);

const char* fixtureCategoryName(FixtureCategory category) noexcept;
const char* roomTypeName(RoomType type) noexcept;

// =============================================================================
// Factories
// =============================================================================

Wall createDefaultWall(std::uint32_t id, Point2 start, Point2 end);
SketchRoom createDefaultRoom(std::uint32_t id, const std::string& name = "Room");
WallFixture createDefaultWallFixture(std::uint32_t id, FixtureCategory category, double positionOnWall = 0.5);
RoomFixture createDefaultRoomFixture(std::uint32_t id, FixtureCategory category);
SketchDocument createDefaultSketch(std::uint32_t id, const std::string& name = "Untitled Sketch");

} // namespace floorplan::defaults
