#include "floorplan/measurement/measurement.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/primitives.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace floorplan {

namespace {

std::int32_t sanitizePrecision(std::int32_t precision) noexcept {
    return precision > 0 ? precision : kPrecisionSixteenth;
}

std::int32_t gcd(std::int32_t a, std::int32_t b) noexcept {
    while (b != 0) {
        const std::int32_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

std::string formatWhole(double v) {
    return std::to_string(static_cast<long long>(v));
}

std::string formatFixed2(double v, const char* unitLabel) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %s", v, unitLabel);
    return std::string(buf);
}

} // namespace

bool isRepresentableInches(double totalInches) noexcept {
    if (!std::isfinite(totalInches)) return false;
    const double wholeFeet = std::floor(totalInches / kInchesPerFoot);
    // One foot of headroom for the rounding carry.
    return wholeFeet >= static_cast<double>(std::numeric_limits<std::int32_t>::min()) &&
           wholeFeet < static_cast<double>(std::numeric_limits<std::int32_t>::max());
}

Measurement createMeasurement(double totalInches, std::int32_t precision) {
    precision = sanitizePrecision(precision);
    if (!isRepresentableInches(totalInches)) {
        if (std::isfinite(totalInches)) FLOORPLAN_LOG_WARN("length %g in is out of range, using 0", totalInches);
        totalInches = 0.0;
    }

    const double wholeFeet = std::floor(totalInches / kInchesPerFoot);
    const double remaining = totalInches - wholeFeet * kInchesPerFoot;
    double inches = std::round(remaining * precision) / precision;

    Measurement m;
    m.feet = static_cast<std::int32_t>(wholeFeet);
    if (inches >= kInchesPerFoot) {
        // 11-63/64" at 1/16 rounds up to the next foot.
        m.feet += 1;
        inches -= kInchesPerFoot;
    }
    m.inches = inches;
    m.totalInches = totalInches;
    m.display = formatMeasurement(m, false, precision);
    return m;
}

Measurement createMeasurementFromFeetInches(double feet, double inches) {
    return createMeasurement(feet * kInchesPerFoot + inches);
}

std::string formatMeasurement(const Measurement& m, bool showZeroInches, std::int32_t precision) {
    if (m.feet == 0 && m.inches == 0.0) return "0\"";
    if (m.feet == 0) return formatInches(m.inches, precision);

    const std::string feetPart = std::to_string(m.feet) + "'";
    if (m.inches == 0.0) {
        return showZeroInches ? feetPart + " 0\"" : feetPart;
    }
    return feetPart + " " + formatInches(m.inches, precision);
}

std::string formatInches(double inches, std::int32_t precision) {
    const double whole = std::floor(inches);
    const double fraction = inches - whole;

    if (fraction == 0.0) return formatWhole(whole) + "\"";

    const std::string frac = decimalToFraction(fraction, precision);
    if (whole == 0.0) return frac + "\"";
    return formatWhole(whole) + "-" + frac + "\"";
}

std::string decimalToFraction(double decimal, std::int32_t precision) {
    if (decimal == 0.0) return "0";
    precision = std::max<std::int32_t>(2, sanitizePrecision(precision));

    std::int32_t bestNum = 1;
    std::int32_t bestDen = precision;
    double bestDiff = std::abs(decimal - 1.0 / precision);

    // Only denominators the precision can represent (halves..sixteenths for 16).
    for (std::int32_t den = 2; den <= precision; ++den) {
        if (precision % den != 0) continue;
        for (std::int32_t num = 1; num < den; ++num) {
            const double diff = std::abs(decimal - static_cast<double>(num) / den);
            if (diff < bestDiff) {
                bestDiff = diff;
                bestNum = num;
                bestDen = den;
            }
        }
    }

    const std::int32_t g = gcd(bestNum, bestDen);
    return std::to_string(bestNum / g) + "/" + std::to_string(bestDen / g);
}

std::string formatArea(double squareFeet, AreaUnit unit) {
    switch (unit) {
        case AreaUnit::SquareInches: return formatFixed2(squareFeet * 144.0, "sq in");
        case AreaUnit::SquareYards: return formatFixed2(squareFeet / 9.0, "sq yd");
        case AreaUnit::SquareFeet:
        default: return formatFixed2(squareFeet, "sq ft");
    }
}

std::string formatVolume(double cubicFeet, VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::CubicInches: return formatFixed2(cubicFeet * 1728.0, "cu in");
        case VolumeUnit::CubicYards: return formatFixed2(cubicFeet / 27.0, "cu yd");
        case VolumeUnit::CubicFeet:
        default: return formatFixed2(cubicFeet, "cu ft");
    }
}

double pixelsToFeet(double pixels, double pixelsPerFoot) noexcept {
    if (!(pixelsPerFoot > 0.0)) return 0.0;
    return pixels / pixelsPerFoot;
}

double feetToPixels(double feet, double pixelsPerFoot) noexcept {
    if (!(pixelsPerFoot > 0.0)) return 0.0;
    return feet * pixelsPerFoot;
}

double pixelAreaToSquareFeet(double pixelArea, double pixelsPerFoot) noexcept {
    if (!(pixelsPerFoot > 0.0)) return 0.0;
    return pixelArea / (pixelsPerFoot * pixelsPerFoot);
}

double calculateCubicFeet(double areaSquareFeet, const Measurement& height) noexcept {
    return areaSquareFeet * (height.totalInches / kInchesPerFoot);
}

Measurement measureDistance(const Point2& a, const Point2& b, double pixelsPerFoot, std::int32_t precision) {
    const double feet = pixelsToFeet(distance(a, b), pixelsPerFoot);
    return createMeasurement(feet * kInchesPerFoot, precision);
}

double convertMeasurement(const Measurement& m, LengthUnit target) noexcept {
    switch (target) {
        case LengthUnit::Feet: return m.totalInches / kInchesPerFoot;
        case LengthUnit::Yards: return m.totalInches / kInchesPerYard;
        case LengthUnit::Centimeters: return m.totalInches * kCentimetersPerInch;
        case LengthUnit::Millimeters: return m.totalInches * kMillimetersPerInch;
        case LengthUnit::Inches:
        default: return m.totalInches;
    }
}

LengthUnit parseLengthUnit(std::string_view name) noexcept {
    char buf[16];
    if (name.size() >= sizeof(buf)) {
        FLOORPLAN_LOG_WARN("unit name too long, using inches");
        return LengthUnit::Inches;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        buf[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
    }
    const std::string_view lower(buf, name.size());

    if (lower == "inches" || lower == "inch" || lower == "in") return LengthUnit::Inches;
    if (lower == "feet" || lower == "foot" || lower == "ft") return LengthUnit::Feet;
    if (lower == "yards" || lower == "yard" || lower == "yd") return LengthUnit::Yards;
    if (lower == "cm" || lower == "centimeters") return LengthUnit::Centimeters;
    if (lower == "mm" || lower == "millimeters") return LengthUnit::Millimeters;

    FLOORPLAN_LOG_WARN("unknown length unit '%.*s', using inches", static_cast<int>(name.size()), name.data());
    return LengthUnit::Inches;
}

Measurement roundMeasurement(const Measurement& m, std::int32_t precision) {
    precision = sanitizePrecision(precision);
    const double rounded = std::round(m.totalInches * precision) / precision;
    return createMeasurement(rounded, precision);
}

double compareMeasurements(const Measurement& a, const Measurement& b) noexcept {
    return a.totalInches - b.totalInches;
}

bool measurementsEqual(const Measurement& a, const Measurement& b, double tolerance) noexcept {
    return std::abs(a.totalInches - b.totalInches) <= tolerance;
}

std::optional<Measurement> minMeasurement(const std::vector<Measurement>& values) {
    if (values.empty()) return std::nullopt;
    return *std::min_element(values.begin(), values.end(), [](const Measurement& a, const Measurement& b) {
        return compareMeasurements(a, b) < 0.0;
    });
}

std::optional<Measurement> maxMeasurement(const std::vector<Measurement>& values) {
    if (values.empty()) return std::nullopt;
    return *std::max_element(values.begin(), values.end(), [](const Measurement& a, const Measurement& b) {
        return compareMeasurements(a, b) < 0.0;
    });
}

bool isValidMeasurement(const Measurement& m) noexcept {
    return m.totalInches >= 0.0 &&
           m.feet >= 0 &&
           m.inches >= 0.0 &&
           m.inches < kInchesPerFoot;
}

bool isValidMeasurementString(std::string_view input) {
    return parseMeasurementString(input).has_value();
}

} // namespace floorplan
