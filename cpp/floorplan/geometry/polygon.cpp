#include "floorplan/geometry/polygon.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace floorplan {

double signedPolygonArea(const Polygon& points) noexcept {
    const std::size_t n = points.size();
    if (n < 3) return 0.0;

    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = points[i];
        const Point2& b = points[(i + 1) % n];
        sum += a.x * b.y - b.x * a.y;
    }
    return sum * 0.5;
}

double polygonArea(const Polygon& points) noexcept {
    return std::abs(signedPolygonArea(points));
}

double polygonAreaWithHoles(const Polygon& outer, const std::vector<Polygon>& holes) noexcept {
    double area = polygonArea(outer);
    for (const Polygon& hole : holes) {
        area -= polygonArea(hole);
    }
    return std::max(0.0, area);
}

double polygonPerimeter(const Polygon& points) noexcept {
    const std::size_t n = points.size();
    if (n < 2) return 0.0;

    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        total += distance(points[i], points[(i + 1) % n]);
    }
    return total;
}

Point2 polygonCentroid(const Polygon& points) noexcept {
    const std::size_t n = points.size();
    if (n == 0) return Point2{0.0, 0.0};

    double cx = 0.0;
    double cy = 0.0;
    double area = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = points[i];
        const Point2& b = points[(i + 1) % n];
        const double cross = a.x * b.y - b.x * a.y;
        area += cross;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }
    area *= 0.5;

    if (std::abs(area) < kGeometryEpsilon) {
        double sx = 0.0;
        double sy = 0.0;
        for (const Point2& p : points) {
            sx += p.x;
            sy += p.y;
        }
        return Point2{sx / static_cast<double>(n), sy / static_cast<double>(n)};
    }

    return Point2{cx / (6.0 * area), cy / (6.0 * area)};
}

bool pointInPolygon(const Point2& p, const Polygon& polygon) noexcept {
    const std::size_t n = polygon.size();
    if (n < 3) return false;

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& a = polygon[i];
        const Point2& b = polygon[j];
        if ((a.y > p.y) != (b.y > p.y) &&
            p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x) {
            inside = !inside;
        }
    }
    return inside;
}

bool polygonInsidePolygon(const Polygon& inner, const Polygon& outer) noexcept {
    if (inner.size() < 3 || outer.size() < 3) return false;

    for (const Point2& p : inner) {
        if (!pointInPolygon(p, outer)) return false;
    }

    // A vertex-inside test alone misses an edge poking out through a concave notch.
    const std::size_t ni = inner.size();
    const std::size_t no = outer.size();
    for (std::size_t i = 0; i < ni; ++i) {
        const Point2& a0 = inner[i];
        const Point2& a1 = inner[(i + 1) % ni];
        for (std::size_t j = 0; j < no; ++j) {
            if (segmentsIntersect(a0, a1, outer[j], outer[(j + 1) % no])) return false;
        }
    }
    return true;
}

bool isClockwise(const Polygon& points) noexcept {
    return signedPolygonArea(points) < 0.0;
}

Polygon reversePolygon(const Polygon& points) {
    return Polygon(points.rbegin(), points.rend());
}

Polygon simplifyPolygon(const Polygon& points, double tolerance) {
    std::size_t n = points.size();
    // A closed ring repeats its first point at the end.
    while (n > 1 && distance(points[n - 1], points[0]) < kGeometryEpsilon) --n;
    if (n < 3) return Polygon(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(n));

    Polygon out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& cur = points[i];

        // Nearest distinct neighbours on either side.
        std::size_t p = (i + n - 1) % n;
        while (p != i && distance(points[p], cur) < kGeometryEpsilon) p = (p + n - 1) % n;
        std::size_t q = (i + 1) % n;
        while (q != i && distance(points[q], cur) < kGeometryEpsilon) q = (q + 1) % n;
        if (p == i || q == i) continue;

        // Skip duplicates of a vertex already kept.
        if (!out.empty() && distance(out.back(), cur) < kGeometryEpsilon) continue;

        const double turn = crossProduct(subtractPoints(cur, points[p]), subtractPoints(points[q], cur));
        if (std::abs(turn) > tolerance) out.push_back(cur);
    }
    return out;
}

} // namespace floorplan
