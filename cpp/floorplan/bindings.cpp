#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "floorplan/engine.h"
#include "floorplan/core/defaults.h"

#ifdef EMSCRIPTEN
using namespace floorplan;

namespace {

// embind cannot return through out-parameters; these wrap the engine calls
// into value results that carry the status code alongside. Wall connections
// reach the host through recalculateAndApply (Wall::connectedWalls).
struct RecalculateResult {
    EngineError error;
    DocumentUpdate update;
};

struct MaterialsResult {
    EngineError error;
    MaterialCalculation materials;
};

struct CostsResult {
    EngineError error;
    CostEstimation costs;
};

struct SummaryResult {
    EngineError error;
    AreaSummary summary;
};

RecalculateResult recalculateDocument(const SketchEngine& engine, const SketchDocument& doc) {
    RecalculateResult r{};
    r.error = engine.recalculate(doc, r.update);
    return r;
}

SketchDocument recalculateAndApply(const SketchEngine& engine, const SketchDocument& doc) {
    DocumentUpdate update;
    SketchDocument out = doc;
    if (engine.recalculate(doc, update) == EngineError::Ok) applyDocumentUpdate(out, update);
    return out;
}

MaterialsResult roomMaterials(const SketchEngine& engine, const SketchDocument& doc, std::uint32_t roomId) {
    MaterialsResult r{};
    r.error = engine.calculateRoomMaterials(doc, roomId, r.materials);
    return r;
}

CostsResult roomCosts(const SketchEngine& engine, const SketchDocument& doc, std::uint32_t roomId) {
    CostsResult r{};
    r.error = engine.calculateRoomCosts(doc, roomId, r.costs);
    return r;
}

SummaryResult summarizeDocument(const SketchEngine& engine, const SketchDocument& doc, bool includeEstimates) {
    SummaryResult r{};
    r.error = engine.summarize(doc, includeEstimates, r.summary);
    return r;
}

std::optional<Measurement> parseMeasurementText(const std::string& text) {
    return parseMeasurementString(text);
}

std::string formatMeasurementText(const Measurement& m, bool showZeroInches) {
    return formatMeasurement(m, showZeroInches);
}

std::string validationCodeString(ValidationCode code) {
    return validationCodeName(code);
}

} // namespace

EMSCRIPTEN_BINDINGS(floorplan_module) {
    using namespace emscripten;

    enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidScale", EngineError::InvalidScale)
        .value("UnknownRoom", EngineError::UnknownRoom)
        .value("NoValidArea", EngineError::NoValidArea);

    enum_<WallType>("WallType")
        .value("Exterior", WallType::Exterior)
        .value("Interior", WallType::Interior)
        .value("LoadBearing", WallType::LoadBearing);

    enum_<FixtureCategory>("FixtureCategory")
        .value("Door", FixtureCategory::Door)
        .value("Window", FixtureCategory::Window)
        .value("Cabinet", FixtureCategory::Cabinet)
        .value("Vanity", FixtureCategory::Vanity)
        .value("Appliance", FixtureCategory::Appliance)
        .value("Electrical", FixtureCategory::Electrical)
        .value("Plumbing", FixtureCategory::Plumbing);

    enum_<RoomType>("RoomType")
        .value("LivingRoom", RoomType::LivingRoom)
        .value("Bedroom", RoomType::Bedroom)
        .value("Kitchen", RoomType::Kitchen)
        .value("Bathroom", RoomType::Bathroom)
        .value("DiningRoom", RoomType::DiningRoom)
        .value("Office", RoomType::Office)
        .value("Hallway", RoomType::Hallway)
        .value("Closet", RoomType::Closet)
        .value("Utility", RoomType::Utility)
        .value("Garage", RoomType::Garage)
        .value("Basement", RoomType::Basement)
        .value("Attic", RoomType::Attic)
        .value("Other", RoomType::Other);

    enum_<TraceStatus>("TraceStatus")
        .value("Closed", TraceStatus::Closed)
        .value("OpenChain", TraceStatus::OpenChain)
        .value("NoConnectableWalls", TraceStatus::NoConnectableWalls);

    enum_<ValidationSeverity>("ValidationSeverity")
        .value("Error", ValidationSeverity::Error)
        .value("Warning", ValidationSeverity::Warning);

    enum_<ValidationCode>("ValidationCode")
        .value("SketchNoName", ValidationCode::SketchNoName)
        .value("WallInvalidStartPoint", ValidationCode::WallInvalidStartPoint)
        .value("WallInvalidEndPoint", ValidationCode::WallInvalidEndPoint)
        .value("WallZeroLength", ValidationCode::WallZeroLength)
        .value("WallUnusualThickness", ValidationCode::WallUnusualThickness)
        .value("WallUnusualHeight", ValidationCode::WallUnusualHeight)
        .value("WallDisconnected", ValidationCode::WallDisconnected)
        .value("RoomNoName", ValidationCode::RoomNoName)
        .value("RoomNoWalls", ValidationCode::RoomNoWalls)
        .value("RoomInsufficientWalls", ValidationCode::RoomInsufficientWalls)
        .value("RoomInvalidWallReference", ValidationCode::RoomInvalidWallReference)
        .value("RoomUnusualCeilingHeight", ValidationCode::RoomUnusualCeilingHeight)
        .value("RoomZeroArea", ValidationCode::RoomZeroArea)
        .value("FixtureInvalidPosition", ValidationCode::FixtureInvalidPosition)
        .value("FixtureInvalidDimensions", ValidationCode::FixtureInvalidDimensions);

    enum_<ElementType>("ElementType")
        .value("None", ElementType::None)
        .value("Wall", ElementType::Wall)
        .value("Room", ElementType::Room)
        .value("Fixture", ElementType::Fixture);

    register_vector<std::uint32_t>("VectorU32");
    register_vector<Point2>("PointVector");
    register_vector<Polygon>("PolygonVector");
    register_vector<Wall>("WallVector");
    register_vector<SketchRoom>("RoomVector");
    register_vector<WallFixture>("WallFixtureVector");
    register_vector<RoomFixture>("RoomFixtureVector");
    register_vector<RoomAreaResult>("RoomAreaResultVector");
    register_vector<RoomSummary>("RoomSummaryVector");
    register_vector<ValidationIssue>("ValidationIssueVector");
    register_optional<double>();
    register_optional<Measurement>();
    register_optional<FixtureDimensions>();
    register_optional<MaterialCalculation>();
    register_optional<CostEstimation>();

    value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    value_object<BoundingBox>("BoundingBox")
        .field("minX", &BoundingBox::minX)
        .field("minY", &BoundingBox::minY)
        .field("maxX", &BoundingBox::maxX)
        .field("maxY", &BoundingBox::maxY);

    value_object<Measurement>("Measurement")
        .field("feet", &Measurement::feet)
        .field("inches", &Measurement::inches)
        .field("totalInches", &Measurement::totalInches)
        .field("display", &Measurement::display);

    value_object<AreaCalculation>("AreaCalculation")
        .field("floorArea", &AreaCalculation::floorArea)
        .field("ceilingArea", &AreaCalculation::ceilingArea)
        .field("wallArea", &AreaCalculation::wallArea)
        .field("netWallArea", &AreaCalculation::netWallArea)
        .field("volume", &AreaCalculation::volume)
        .field("perimeter", &AreaCalculation::perimeter);

    value_object<FixtureDimensions>("FixtureDimensions")
        .field("width", &FixtureDimensions::width)
        .field("height", &FixtureDimensions::height)
        .field("depth", &FixtureDimensions::depth);

    value_object<RoomDimensions>("RoomDimensions")
        .field("width", &RoomDimensions::width)
        .field("height", &RoomDimensions::height)
        .field("depth", &RoomDimensions::depth);

    value_object<Wall>("Wall")
        .field("id", &Wall::id)
        .field("start", &Wall::start)
        .field("end", &Wall::end)
        .field("thickness", &Wall::thickness)
        .field("height", &Wall::height)
        .field("type", &Wall::type)
        .field("fixtures", &Wall::fixtures)
        .field("roomId", &Wall::roomId)
        .field("connectedWalls", &Wall::connectedWalls);

    value_object<WallFixture>("WallFixture")
        .field("id", &WallFixture::id)
        .field("category", &WallFixture::category)
        .field("wallId", &WallFixture::wallId)
        .field("position", &WallFixture::position)
        .field("dimensions", &WallFixture::dimensions)
        .field("isOpening", &WallFixture::isOpening)
        .field("openingDimensions", &WallFixture::openingDimensions);

    value_object<RoomFixture>("RoomFixture")
        .field("id", &RoomFixture::id)
        .field("category", &RoomFixture::category)
        .field("roomId", &RoomFixture::roomId)
        .field("position", &RoomFixture::position)
        .field("rotation", &RoomFixture::rotation)
        .field("dimensions", &RoomFixture::dimensions);

    value_object<RoomProperties>("RoomProperties")
        .field("ceilingHeight", &RoomProperties::ceilingHeight)
        .field("floorMaterial", &RoomProperties::floorMaterial)
        .field("notes", &RoomProperties::notes);

    value_object<SketchRoom>("SketchRoom")
        .field("id", &SketchRoom::id)
        .field("name", &SketchRoom::name)
        .field("type", &SketchRoom::type)
        .field("wallIds", &SketchRoom::wallIds)
        .field("boundary", &SketchRoom::boundary)
        .field("dimensions", &SketchRoom::dimensions)
        .field("areas", &SketchRoom::areas)
        .field("properties", &SketchRoom::properties);

    value_object<Scale>("Scale")
        .field("pixelsPerFoot", &Scale::pixelsPerFoot)
        .field("gridSize", &Scale::gridSize);

    value_object<SketchMetadata>("SketchMetadata")
        .field("scale", &SketchMetadata::scale)
        .field("bounds", &SketchMetadata::bounds)
        .field("totalAreas", &SketchMetadata::totalAreas);

    value_object<SketchDocument>("SketchDocument")
        .field("id", &SketchDocument::id)
        .field("name", &SketchDocument::name)
        .field("rooms", &SketchDocument::rooms)
        .field("walls", &SketchDocument::walls)
        .field("wallFixtures", &SketchDocument::wallFixtures)
        .field("roomFixtures", &SketchDocument::roomFixtures)
        .field("metadata", &SketchDocument::metadata);

    value_object<RoomAreaResult>("RoomAreaResult")
        .field("roomId", &RoomAreaResult::roomId)
        .field("boundary", &RoomAreaResult::boundary)
        .field("holes", &RoomAreaResult::holes)
        .field("boundaryStatus", &RoomAreaResult::boundaryStatus)
        .field("dimensions", &RoomAreaResult::dimensions)
        .field("areas", &RoomAreaResult::areas);

    value_object<DocumentUpdate>("DocumentUpdate")
        .field("rooms", &DocumentUpdate::rooms)
        .field("totals", &DocumentUpdate::totals)
        .field("bounds", &DocumentUpdate::bounds)
        .field("boundsValid", &DocumentUpdate::boundsValid);

    value_object<MaterialCalculation>("MaterialCalculation")
        .field("flooringSquareFeet", &MaterialCalculation::flooringSquareFeet)
        .field("flooringWaste", &MaterialCalculation::flooringWaste)
        .field("flooringTotal", &MaterialCalculation::flooringTotal)
        .field("paintableArea", &MaterialCalculation::paintableArea)
        .field("paintGallons", &MaterialCalculation::paintGallons)
        .field("primerGallons", &MaterialCalculation::primerGallons)
        .field("baseboardLinearFeet", &MaterialCalculation::baseboardLinearFeet)
        .field("crownMoldingLinearFeet", &MaterialCalculation::crownMoldingLinearFeet)
        .field("caseLinearFeet", &MaterialCalculation::caseLinearFeet)
        .field("ceilingSquareFeet", &MaterialCalculation::ceilingSquareFeet)
        .field("ceilingTiles", &MaterialCalculation::ceilingTiles);

    value_object<CostLine>("CostLine")
        .field("quantity", &CostLine::quantity)
        .field("unitPrice", &CostLine::unitPrice)
        .field("total", &CostLine::total);

    value_object<LaborCost>("LaborCost")
        .field("hours", &LaborCost::hours)
        .field("hourlyRate", &LaborCost::hourlyRate)
        .field("total", &LaborCost::total);

    value_object<CostEstimation>("CostEstimation")
        .field("flooring", &CostEstimation::flooring)
        .field("paint", &CostEstimation::paint)
        .field("trim", &CostEstimation::trim)
        .field("labor", &CostEstimation::labor)
        .field("grandTotal", &CostEstimation::grandTotal);

    value_object<RoomSummary>("RoomSummary")
        .field("roomId", &RoomSummary::roomId)
        .field("name", &RoomSummary::name)
        .field("type", &RoomSummary::type)
        .field("floorArea", &RoomSummary::floorArea)
        .field("wallArea", &RoomSummary::wallArea)
        .field("volume", &RoomSummary::volume)
        .field("perimeter", &RoomSummary::perimeter)
        .field("materials", &RoomSummary::materials)
        .field("costs", &RoomSummary::costs);

    value_object<AreaSummary>("AreaSummary")
        .field("sketchName", &AreaSummary::sketchName)
        .field("totalFloorArea", &AreaSummary::totalFloorArea)
        .field("totalRooms", &AreaSummary::totalRooms)
        .field("totalWalls", &AreaSummary::totalWalls)
        .field("rooms", &AreaSummary::rooms)
        .field("totals", &AreaSummary::totals)
        .field("estimatedCost", &AreaSummary::estimatedCost);

    value_object<ValidationIssue>("ValidationIssue")
        .field("severity", &ValidationIssue::severity)
        .field("code", &ValidationIssue::code)
        .field("message", &ValidationIssue::message)
        .field("elementId", &ValidationIssue::elementId)
        .field("elementType", &ValidationIssue::elementType);

    value_object<ValidationResult>("ValidationResult")
        .field("isValid", &ValidationResult::isValid)
        .field("errors", &ValidationResult::errors)
        .field("warnings", &ValidationResult::warnings);

    value_object<RecalculateResult>("RecalculateResult")
        .field("error", &RecalculateResult::error)
        .field("update", &RecalculateResult::update);
    value_object<MaterialsResult>("MaterialsResult")
        .field("error", &MaterialsResult::error)
        .field("materials", &MaterialsResult::materials);
    value_object<CostsResult>("CostsResult")
        .field("error", &CostsResult::error)
        .field("costs", &CostsResult::costs);
    value_object<SummaryResult>("SummaryResult")
        .field("error", &SummaryResult::error)
        .field("summary", &SummaryResult::summary);

    class_<SketchEngine>("SketchEngine")
        .constructor<>()
        .function("getLastError", &SketchEngine::getLastError)
        .function("recalculate", &recalculateDocument)
        .function("recalculateAndApply", &recalculateAndApply)
        .function("calculateRoomMaterials", &roomMaterials)
        .function("calculateRoomCosts", &roomCosts)
        .function("validate", &SketchEngine::validate)
        .function("summarize", &summarizeDocument)
        .function("measure", &SketchEngine::measure)
        .function("makeMeasurement", &SketchEngine::makeMeasurement)
        .function("measurementsEqual", &SketchEngine::measurementsEqual);

    // Free measurement helpers for text fields in the host UI.
    function("createMeasurement", &createMeasurement);
    function("isRepresentableInches", &isRepresentableInches);
    function("parseMeasurementString", &parseMeasurementText);
    function("formatMeasurement", &formatMeasurementText);
    function("decimalToFraction", &decimalToFraction);
    function("pixelsToFeet", &pixelsToFeet);
    function("feetToPixels", &feetToPixels);
    function("validationCodeName", &validationCodeString);

    function("createDefaultWall", &defaults::createDefaultWall);
    function("createDefaultRoom", &defaults::createDefaultRoom);
    function("createDefaultWallFixture", &defaults::createDefaultWallFixture);
    function("createDefaultRoomFixture", &defaults::createDefaultRoomFixture);
    function("createDefaultSketch", &defaults::createDefaultSketch);
}
#endif
