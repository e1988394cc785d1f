#include "floorplan/measurement/measurement.h"

#include <cctype>
#include <cstdint>
#include <string>

namespace floorplan {

namespace {

// Cursor over whitespace-free input. Each read* consumes only on success.
class MeasurementScanner {
public:
    explicit MeasurementScanner(std::string_view text) : text_(text) {}

    bool atEnd() const noexcept { return pos_ >= text_.size(); }

    bool readInteger(std::int64_t& out) noexcept {
        std::size_t p = pos_;
        std::int64_t v = 0;
        while (p < text_.size() && isDigit(text_[p])) {
            if (v > 100000000000LL) return false;
            v = v * 10 + (text_[p] - '0');
            ++p;
        }
        if (p == pos_) return false;
        out = v;
        pos_ = p;
        return true;
    }

    // digits ( '.' digits )?
    bool readDecimal(double& out) noexcept {
        std::int64_t whole = 0;
        if (!readInteger(whole)) return false;
        double value = static_cast<double>(whole);
        if (pos_ + 1 < text_.size() && text_[pos_] == '.' && isDigit(text_[pos_ + 1])) {
            ++pos_;
            double scale = 0.1;
            while (pos_ < text_.size() && isDigit(text_[pos_])) {
                value += (text_[pos_] - '0') * scale;
                scale *= 0.1;
                ++pos_;
            }
        }
        out = value;
        return true;
    }

    bool consume(char c) noexcept {
        if (atEnd() || text_[pos_] != c) return false;
        ++pos_;
        return true;
    }

    bool consumeLiteral(std::string_view lit) noexcept {
        if (text_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    // ' or U+2032 PRIME
    bool consumeFeetMark() noexcept {
        return consume('\'') || consumeLiteral("\xE2\x80\xB2");
    }

    // " or U+2033 DOUBLE PRIME or curly double quotes
    bool consumeInchMark() noexcept {
        return consume('"') || consumeLiteral("\xE2\x80\xB3") ||
               consumeLiteral("\xE2\x80\x9C") || consumeLiteral("\xE2\x80\x9D");
    }

    bool consumeFeetWord() noexcept {
        return consumeLiteral("feet") || consumeLiteral("ft");
    }

    bool consumeInchWord() noexcept {
        return consumeLiteral("inches") || consumeLiteral("inch") || consumeLiteral("in");
    }

private:
    static bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

    std::string_view text_;
    std::size_t pos_{0};
};

struct Fraction {
    std::int64_t numerator{0};
    std::int64_t denominator{1};
};

// N/D with a non-zero denominator.
bool readFraction(MeasurementScanner& s, Fraction& out) noexcept {
    std::int64_t n = 0;
    std::int64_t d = 0;
    if (!s.readInteger(n) || !s.consume('/') || !s.readInteger(d)) return false;
    if (d == 0) return false;
    out = Fraction{n, d};
    return true;
}

double fractionValue(const Fraction& f) noexcept {
    return static_cast<double>(f.numerator) / static_cast<double>(f.denominator);
}

bool finishWithOptionalInchMark(MeasurementScanner& s) noexcept {
    s.consumeInchMark();
    return s.atEnd();
}

std::optional<Measurement> representable(double totalInches) {
    if (!isRepresentableInches(totalInches)) return std::nullopt;
    return createMeasurement(totalInches);
}

// 12'6"
std::optional<Measurement> matchFeetInches(std::string_view text) {
    MeasurementScanner s(text);
    std::int64_t feet = 0;
    double inches = 0.0;
    if (!s.readInteger(feet) || !s.consumeFeetMark() || !s.readDecimal(inches)) return std::nullopt;
    if (!finishWithOptionalInchMark(s)) return std::nullopt;
    return representable(static_cast<double>(feet) * kInchesPerFoot + inches);
}

// 12.5' / 12.5ft / 12
std::optional<Measurement> matchDecimalFeet(std::string_view text) {
    MeasurementScanner s(text);
    double feet = 0.0;
    if (!s.readDecimal(feet)) return std::nullopt;
    s.consumeFeetMark();
    s.consumeFeetWord();
    if (!s.atEnd()) return std::nullopt;
    return representable(feet * kInchesPerFoot);
}

// 150" / 150in
std::optional<Measurement> matchInches(std::string_view text) {
    MeasurementScanner s(text);
    double inches = 0.0;
    if (!s.readDecimal(inches)) return std::nullopt;
    s.consumeInchMark();
    s.consumeInchWord();
    if (!s.atEnd()) return std::nullopt;
    return representable(inches);
}

// 12'6-1/2"
std::optional<Measurement> matchFeetMixedFraction(std::string_view text) {
    MeasurementScanner s(text);
    std::int64_t feet = 0;
    std::int64_t whole = 0;
    Fraction f;
    if (!s.readInteger(feet) || !s.consumeFeetMark() || !s.readInteger(whole) || !s.consume('-')) return std::nullopt;
    if (!readFraction(s, f) || !finishWithOptionalInchMark(s)) return std::nullopt;
    const double inches = static_cast<double>(whole) + fractionValue(f);
    return representable(static_cast<double>(feet) * kInchesPerFoot + inches);
}

// 6-1/2"
std::optional<Measurement> matchMixedFraction(std::string_view text) {
    MeasurementScanner s(text);
    std::int64_t whole = 0;
    Fraction f;
    if (!s.readInteger(whole) || !s.consume('-')) return std::nullopt;
    if (!readFraction(s, f) || !finishWithOptionalInchMark(s)) return std::nullopt;
    return representable(static_cast<double>(whole) + fractionValue(f));
}

// 12'1/2"
std::optional<Measurement> matchFeetFraction(std::string_view text) {
    MeasurementScanner s(text);
    std::int64_t feet = 0;
    Fraction f;
    if (!s.readInteger(feet) || !s.consumeFeetMark()) return std::nullopt;
    if (!readFraction(s, f) || !finishWithOptionalInchMark(s)) return std::nullopt;
    return representable(static_cast<double>(feet) * kInchesPerFoot + fractionValue(f));
}

// 1/2"
std::optional<Measurement> matchFraction(std::string_view text) {
    MeasurementScanner s(text);
    Fraction f;
    if (!readFraction(s, f) || !finishWithOptionalInchMark(s)) return std::nullopt;
    return representable(fractionValue(f));
}

} // namespace

std::optional<Measurement> parseMeasurementString(std::string_view input) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (const char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) cleaned.push_back(c);
    }
    if (cleaned.empty()) return std::nullopt;

    using Matcher = std::optional<Measurement> (*)(std::string_view);
    static constexpr Matcher kMatchers[] = {
        matchFeetInches,
        matchDecimalFeet,
        matchInches,
        matchFeetMixedFraction,
        matchMixedFraction,
        matchFeetFraction,
        matchFraction,
    };

    for (const Matcher match : kMatchers) {
        if (auto m = match(cleaned)) return m;
    }
    return std::nullopt;
}

} // namespace floorplan
