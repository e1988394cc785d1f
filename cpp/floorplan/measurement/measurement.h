#ifndef FLOORPLAN_MEASUREMENT_MEASUREMENT_H
#define FLOORPLAN_MEASUREMENT_MEASUREMENT_H

#include "floorplan/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace floorplan {

constexpr double kInchesPerFoot = 12.0;
constexpr double kInchesPerYard = 36.0;
constexpr double kCentimetersPerInch = 2.54;
constexpr double kMillimetersPerInch = 25.4;

// Fraction denominators for rounding/display.
constexpr std::int32_t kPrecisionSixteenth = 16;
constexpr std::int32_t kPrecisionEighth = 8;
constexpr std::int32_t kPrecisionQuarter = 4;
constexpr std::int32_t kPrecisionHalf = 2;
constexpr std::int32_t kPrecisionWhole = 1;

constexpr double kDefaultEqualityTolerance = 0.0625; // 1/16"

struct MeasurementConfig {
    std::int32_t precision{kPrecisionSixteenth};
    double equalityTolerance{kDefaultEqualityTolerance};
};

enum class LengthUnit : std::uint8_t { Inches = 0, Feet, Yards, Centimeters, Millimeters };
enum class AreaUnit : std::uint8_t { SquareFeet = 0, SquareInches, SquareYards };
enum class VolumeUnit : std::uint8_t { CubicFeet = 0, CubicInches, CubicYards };

// =============================================================================
// Construction
// =============================================================================

// Finite and small enough that its whole feet fit Measurement::feet.
bool isRepresentableInches(double totalInches) noexcept;

// Splits totalInches into whole feet and inches rounded to 1/precision.
// totalInches itself is kept unrounded. Input that is not representable
// (non-finite, or too many feet) yields a zero measurement.
Measurement createMeasurement(double totalInches, std::int32_t precision = kPrecisionSixteenth);
Measurement createMeasurementFromFeetInches(double feet, double inches);

// Accepts, in order: 12'6", 12.5' / 12.5ft, 150" / 150in, 12'6-1/2", 6-1/2",
// and bare fractions 12'1/2", 1/2". Whitespace is ignored. Values that are
// not representable are rejected.
std::optional<Measurement> parseMeasurementString(std::string_view input);

// =============================================================================
// Formatting
// =============================================================================

std::string formatMeasurement(
    const Measurement& m,
    bool showZeroInches = false,
    std::int32_t precision = kPrecisionSixteenth);
std::string formatInches(double inches, std::int32_t precision = kPrecisionSixteenth);

// Closest n/d with d dividing precision, reduced. "0" for zero.
std::string decimalToFraction(double decimal, std::int32_t precision = kPrecisionSixteenth);

std::string formatArea(double squareFeet, AreaUnit unit = AreaUnit::SquareFeet);
std::string formatVolume(double cubicFeet, VolumeUnit unit = VolumeUnit::CubicFeet);

// =============================================================================
// Scale conversion
// =============================================================================

// Non-positive scales convert to 0.
double pixelsToFeet(double pixels, double pixelsPerFoot) noexcept;
double feetToPixels(double feet, double pixelsPerFoot) noexcept;
double pixelAreaToSquareFeet(double pixelArea, double pixelsPerFoot) noexcept;
double calculateCubicFeet(double areaSquareFeet, const Measurement& height) noexcept;

Measurement measureDistance(const Point2& a, const Point2& b, double pixelsPerFoot,
                            std::int32_t precision = kPrecisionSixteenth);

// =============================================================================
// Units, comparison, validation
// =============================================================================

double convertMeasurement(const Measurement& m, LengthUnit target) noexcept;

// Unrecognized names fall back to inches.
LengthUnit parseLengthUnit(std::string_view name) noexcept;

Measurement roundMeasurement(const Measurement& m, std::int32_t precision = kPrecisionSixteenth);

double compareMeasurements(const Measurement& a, const Measurement& b) noexcept;
bool measurementsEqual(const Measurement& a, const Measurement& b,
                       double tolerance = kDefaultEqualityTolerance) noexcept;
std::optional<Measurement> minMeasurement(const std::vector<Measurement>& values);
std::optional<Measurement> maxMeasurement(const std::vector<Measurement>& values);

bool isValidMeasurement(const Measurement& m) noexcept;
bool isValidMeasurementString(std::string_view input);

} // namespace floorplan

#endif // FLOORPLAN_MEASUREMENT_MEASUREMENT_H
