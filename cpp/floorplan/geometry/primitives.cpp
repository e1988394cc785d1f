#include "floorplan/geometry/primitives.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

// 0 = collinear, 1 = clockwise, 2 = counter-clockwise
int orientation(const Point2& p, const Point2& q, const Point2& r) noexcept {
    const double val = (q.y - p.y) * (r.x - q.x) - (q.x - p.x) * (r.y - q.y);
    if (std::abs(val) < kGeometryEpsilon) return 0;
    return val > 0.0 ? 1 : 2;
}

// q lies within the box spanned by p and r.
bool onSegment(const Point2& p, const Point2& q, const Point2& r) noexcept {
    return q.x <= std::max(p.x, r.x) && q.x >= std::min(p.x, r.x) &&
           q.y <= std::max(p.y, r.y) && q.y >= std::min(p.y, r.y);
}

} // namespace

double distance(const Point2& a, const Point2& b) noexcept {
    return std::sqrt(distanceSquared(a, b));
}

double distanceSquared(const Point2& a, const Point2& b) noexcept {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return dx * dx + dy * dy;
}

Point2 midpoint(const Point2& a, const Point2& b) noexcept {
    return Point2{(a.x + b.x) * 0.5, (a.y + b.y) * 0.5};
}

Point2 rotatePoint(const Point2& p, const Point2& center, double angle) noexcept {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    const double dx = p.x - center.x;
    const double dy = p.y - center.y;
    return Point2{center.x + dx * c - dy * s, center.y + dx * s + dy * c};
}

Point2 normalize(const Point2& v) noexcept {
    const double len = std::sqrt(v.x * v.x + v.y * v.y);
    if (len == 0.0) return Point2{0.0, 0.0};
    return Point2{v.x / len, v.y / len};
}

double lineAngle(const Point2& a, const Point2& b) noexcept {
    return std::atan2(b.y - a.y, b.x - a.x);
}

Point2 perpendicular(const Point2& a, const Point2& b) noexcept {
    const Point2 dir = normalize(subtractPoints(b, a));
    return Point2{-dir.y, dir.x};
}

Point2 pointOnLine(const Point2& a, const Point2& b, double dist) noexcept {
    const Point2 dir = normalize(subtractPoints(b, a));
    return addPoints(a, scalePoint(dir, dist));
}

Point2 closestPointOnSegment(const Point2& p, const Point2& segStart, const Point2& segEnd) noexcept {
    const Point2 seg = subtractPoints(segEnd, segStart);
    const double len2 = dotProduct(seg, seg);
    if (len2 == 0.0) return segStart;
    double t = dotProduct(subtractPoints(p, segStart), seg) / len2;
    t = std::max(0.0, std::min(1.0, t));
    return addPoints(segStart, scalePoint(seg, t));
}

double distanceToSegment(const Point2& p, const Point2& segStart, const Point2& segEnd) noexcept {
    return distance(p, closestPointOnSegment(p, segStart, segEnd));
}

bool segmentsIntersect(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept {
    const int o1 = orientation(p1, q1, p2);
    const int o2 = orientation(p1, q1, q2);
    const int o3 = orientation(p2, q2, p1);
    const int o4 = orientation(p2, q2, q1);

    if (o1 != o2 && o3 != o4) return true;

    // Collinear special cases
    if (o1 == 0 && onSegment(p1, p2, q1)) return true;
    if (o2 == 0 && onSegment(p1, q2, q1)) return true;
    if (o3 == 0 && onSegment(p2, p1, q2)) return true;
    if (o4 == 0 && onSegment(p2, q1, q2)) return true;
    return false;
}

std::optional<Point2> lineIntersection(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4) noexcept {
    const double denom = (p1.x - p2.x) * (p3.y - p4.y) - (p1.y - p2.y) * (p3.x - p4.x);
    if (std::abs(denom) < kGeometryEpsilon) return std::nullopt;

    const double t = ((p1.x - p3.x) * (p3.y - p4.y) - (p1.y - p3.y) * (p3.x - p4.x)) / denom;
    return Point2{p1.x + t * (p2.x - p1.x), p1.y + t * (p2.y - p1.y)};
}

BoundingBox boundingBox(const std::vector<Point2>& points) noexcept {
    if (points.empty()) return BoundingBox{0.0, 0.0, 0.0, 0.0};

    BoundingBox box{points[0].x, points[0].y, points[0].x, points[0].y};
    for (std::size_t i = 1; i < points.size(); ++i) {
        const Point2& p = points[i];
        if (p.x < box.minX) box.minX = p.x;
        if (p.x > box.maxX) box.maxX = p.x;
        if (p.y < box.minY) box.minY = p.y;
        if (p.y > box.maxY) box.maxY = p.y;
    }
    return box;
}

bool pointInRectangle(const Point2& p, const Rectangle& r) noexcept {
    return p.x >= r.x && p.x <= r.x + r.width &&
           p.y >= r.y && p.y <= r.y + r.height;
}

bool rectanglesOverlap(const Rectangle& a, const Rectangle& b) noexcept {
    return !(a.x + a.width < b.x || b.x + b.width < a.x ||
             a.y + a.height < b.y || b.y + b.height < a.y);
}

Rectangle expandRectangle(const Rectangle& r, double margin) noexcept {
    return Rectangle{r.x - margin, r.y - margin, r.width + 2.0 * margin, r.height + 2.0 * margin};
}

Point2 snapToGrid(const Point2& p, double gridSize) noexcept {
    if (!(gridSize > 0.0)) return p;
    return Point2{std::round(p.x / gridSize) * gridSize, std::round(p.y / gridSize) * gridSize};
}

Point2 snapToPoints(const Point2& p, const std::vector<Point2>& candidates, double tolerance) noexcept {
    Point2 best = p;
    double bestDist = tolerance;
    for (const Point2& c : candidates) {
        const double d = distance(p, c);
        if (d < bestDist) {
            bestDist = d;
            best = c;
        }
    }
    return best;
}

Point2 snapToLines(const Point2& p, const std::vector<Segment2>& lines, double tolerance) noexcept {
    Point2 best = p;
    double bestDist = tolerance;
    for (const Segment2& l : lines) {
        const Point2 c = closestPointOnSegment(p, l.start, l.end);
        const double d = distance(p, c);
        if (d < bestDist) {
            bestDist = d;
            best = c;
        }
    }
    return best;
}

WallOutline wallOutline(const Wall& wall) noexcept {
    const double half = wall.thickness * 0.5;
    const Point2 dir = normalize(subtractPoints(wall.end, wall.start));
    const Point2 offset = scalePoint(Point2{-dir.y, dir.x}, half);

    return WallOutline{
        wall.start, wall.end,
        addPoints(wall.start, offset), addPoints(wall.end, offset),
        subtractPoints(wall.start, offset), subtractPoints(wall.end, offset),
    };
}

} // namespace floorplan
