#include <gtest/gtest.h>

#include "floorplan/engine.h"
#include "floorplan/core/defaults.h"
#include "sketch_test_common.h"

using namespace floorplan;
using floorplan::test::makeSquareRoomDocument;
using floorplan::test::makeSquareWalls;

TEST(SketchEngineTest, RecalculateAndApply) {
    SketchDocument doc = makeSquareRoomDocument();
    SketchEngine engine;

    DocumentUpdate update;
    ASSERT_EQ(engine.recalculate(doc, update), EngineError::Ok);
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    ASSERT_EQ(update.rooms.size(), 1u);
    EXPECT_NEAR(update.rooms[0].areas.floorArea, 100.0, 1e-9);
    EXPECT_NEAR(update.totals.floorArea, 100.0, 1e-9);
    ASSERT_TRUE(update.boundsValid);
    EXPECT_DOUBLE_EQ(update.bounds.maxX, 500.0);
    ASSERT_EQ(update.connections.size(), 4u);
    EXPECT_EQ(update.connections.at(1), (std::vector<std::uint32_t>{2, 4}));

    // recalculate never touches the input.
    EXPECT_TRUE(doc.rooms[0].boundary.empty());
    EXPECT_EQ(doc.rooms[0].areas.floorArea, 0.0);

    applyDocumentUpdate(doc, update);
    EXPECT_EQ(doc.rooms[0].boundary.size(), 5u);
    EXPECT_NEAR(doc.rooms[0].areas.perimeter, 40.0, 1e-9);
    EXPECT_NEAR(doc.rooms[0].dimensions.width, 10.0, 1e-9);
    EXPECT_NEAR(doc.metadata.totalAreas.volume, 800.0, 1e-9);
    EXPECT_DOUBLE_EQ(doc.metadata.bounds.maxY, 500.0);
    EXPECT_EQ(doc.walls[2].connectedWalls, (std::vector<std::uint32_t>{2, 4}));
}

TEST(SketchEngineTest, InvalidScale) {
    SketchDocument doc = makeSquareRoomDocument();
    doc.metadata.scale.pixelsPerFoot = 0.0;

    SketchEngine engine;
    DocumentUpdate update;
    EXPECT_EQ(engine.recalculate(doc, update), EngineError::InvalidScale);
    EXPECT_EQ(engine.getLastError(), EngineError::InvalidScale);
    EXPECT_TRUE(update.rooms.empty());

    MaterialCalculation m;
    EXPECT_EQ(engine.calculateRoomMaterials(doc, 100, m), EngineError::InvalidScale);
}

TEST(SketchEngineTest, RoomMaterialsAndCosts) {
    const SketchDocument doc = makeSquareRoomDocument();
    SketchEngine engine;

    MaterialCalculation m;
    ASSERT_EQ(engine.calculateRoomMaterials(doc, 100, m), EngineError::Ok);
    EXPECT_NEAR(m.flooringTotal, 110.0, 1e-9);
    EXPECT_EQ(m.paintGallons, 1);
    EXPECT_EQ(m.ceilingTiles, 25);

    CostEstimation c;
    ASSERT_EQ(engine.calculateRoomCosts(doc, 100, c), EngineError::Ok);
    EXPECT_EQ(c.labor.hours, 10);
    EXPECT_NEAR(c.flooring.total, 550.0, 1e-9);
}

TEST(SketchEngineTest, RoomLookupErrors) {
    SketchDocument doc = makeSquareRoomDocument();
    SketchEngine engine;

    MaterialCalculation m;
    EXPECT_EQ(engine.calculateRoomMaterials(doc, 555, m), EngineError::UnknownRoom);
    EXPECT_EQ(engine.getLastError(), EngineError::UnknownRoom);

    doc.rooms[0].wallIds = {1, 2};
    CostEstimation c;
    EXPECT_EQ(engine.calculateRoomCosts(doc, 100, c), EngineError::NoValidArea);
    EXPECT_EQ(c.flooring.total, 0.0);
    EXPECT_EQ(c.labor.hours, 0);
}

TEST(SketchEngineTest, ConfigFlowsThrough) {
    EngineConfig config;
    config.materials.flooringWastePercent = 0.0;
    config.prices.flooringPerSqFt = 1.0;
    config.measurement.precision = kPrecisionQuarter;
    config.measurement.equalityTolerance = 0.5;
    SketchEngine engine(config);

    const SketchDocument doc = makeSquareRoomDocument();
    CostEstimation c;
    ASSERT_EQ(engine.calculateRoomCosts(doc, 100, c), EngineError::Ok);
    EXPECT_NEAR(c.flooring.total, 100.0, 1e-9);

    const Measurement m = engine.makeMeasurement(10.1);
    EXPECT_DOUBLE_EQ(m.inches, 10.0);
    EXPECT_TRUE(engine.measurementsEqual(engine.makeMeasurement(10.0), engine.makeMeasurement(10.4)));

    const Measurement d = engine.measure(Point2{0, 0}, Point2{0, 625}, 50.0);
    EXPECT_EQ(d.display, "12' 6\"");

    const auto parsed = engine.parseMeasurement("12.5'");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->totalInches, 150.0);
}

TEST(SketchEngineTest, ValidateUsesConfiguredTolerance) {
    SketchDocument doc = makeSquareRoomDocument();
    // Starts 8 px past the square's corner.
    doc.walls.push_back(defaults::createDefaultWall(9, Point2{508, 0}, Point2{700, 0}));

    auto disconnected = [](const ValidationResult& r) {
        for (const ValidationIssue& w : r.warnings) {
            if (w.code == ValidationCode::WallDisconnected) return true;
        }
        return false;
    };

    SketchEngine engine;
    EXPECT_TRUE(disconnected(engine.validate(doc)));

    EngineConfig config;
    config.validation.connectionTolerance = 10.0;
    SketchEngine loose(config);
    EXPECT_FALSE(disconnected(loose.validate(doc)));
}

TEST(SketchEngineTest, SummarizeRecalculatesFirst) {
    SketchDocument doc = makeSquareRoomDocument();
    const std::vector<Wall> closetWalls = makeSquareWalls(11, 600, 0, 250);
    doc.walls.insert(doc.walls.end(), closetWalls.begin(), closetWalls.end());
    SketchRoom closet = defaults::createDefaultRoom(200, "Closet");
    closet.type = RoomType::Closet;
    closet.wallIds = test::wallIdsOf(closetWalls);
    doc.rooms.push_back(closet);

    SketchEngine engine;
    AreaSummary plain;
    ASSERT_EQ(engine.summarize(doc, false, plain), EngineError::Ok);
    EXPECT_EQ(plain.totalRooms, 2u);
    EXPECT_EQ(plain.totalWalls, 8u);
    EXPECT_NEAR(plain.totalFloorArea, 125.0, 1e-9);
    EXPECT_EQ(plain.rooms[1].type, "closet");
    EXPECT_FALSE(plain.estimatedCost.has_value());

    AreaSummary withCosts;
    ASSERT_EQ(engine.summarize(doc, true, withCosts), EngineError::Ok);
    ASSERT_TRUE(withCosts.estimatedCost.has_value());
    ASSERT_TRUE(withCosts.rooms[0].costs.has_value());
    ASSERT_TRUE(withCosts.rooms[1].costs.has_value());
    EXPECT_NEAR(*withCosts.estimatedCost,
                withCosts.rooms[0].costs->grandTotal + withCosts.rooms[1].costs->grandTotal, 1e-9);
}

TEST(DefaultsTest, FactoriesUseDefaultTables) {
    const Wall w = defaults::createDefaultWall(1, Point2{0, 0}, Point2{10, 0});
    EXPECT_DOUBLE_EQ(w.thickness, 4.0);
    EXPECT_DOUBLE_EQ(w.height.totalInches, 96.0);
    EXPECT_EQ(w.height.display, "8'");

    const WallFixture door = defaults::createDefaultWallFixture(2, FixtureCategory::Door);
    EXPECT_TRUE(door.isOpening);
    EXPECT_DOUBLE_EQ(door.dimensions.height, 84.0);
    EXPECT_DOUBLE_EQ(door.position, 0.5);

    const RoomFixture vanity = defaults::createDefaultRoomFixture(3, FixtureCategory::Vanity);
    EXPECT_DOUBLE_EQ(vanity.dimensions.depth, 24.0);

    const SketchDocument doc = defaults::createDefaultSketch(4);
    EXPECT_EQ(doc.name, "Untitled Sketch");
    EXPECT_DOUBLE_EQ(doc.metadata.scale.pixelsPerFoot, 50.0);

    EXPECT_DOUBLE_EQ(defaults::fixtureDimensionsFor("WINDOW").width, 48.0);
    EXPECT_DOUBLE_EQ(defaults::fixtureDimensionsFor("hammock").width, 24.0);
    EXPECT_STREQ(defaults::fixtureCategoryName(FixtureCategory::Plumbing), "plumbing");
    EXPECT_EQ(defaults::kFixtureTypeCount, 12u);
}
