#ifndef FLOORPLAN_GEOMETRY_PRIMITIVES_H
#define FLOORPLAN_GEOMETRY_PRIMITIVES_H

#include "floorplan/core/types.h"

#include <optional>
#include <vector>

namespace floorplan {

// Near-zero threshold for cross products and determinants.
constexpr double kGeometryEpsilon = 1e-10;

// =============================================================================
// Point / vector arithmetic
// =============================================================================

double distance(const Point2& a, const Point2& b) noexcept;
double distanceSquared(const Point2& a, const Point2& b) noexcept;
Point2 midpoint(const Point2& a, const Point2& b) noexcept;

inline Point2 addPoints(const Point2& a, const Point2& b) noexcept { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 subtractPoints(const Point2& a, const Point2& b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 scalePoint(const Point2& p, double s) noexcept { return Point2{p.x * s, p.y * s}; }
inline double dotProduct(const Point2& a, const Point2& b) noexcept { return a.x * b.x + a.y * b.y; }
inline double crossProduct(const Point2& a, const Point2& b) noexcept { return a.x * b.y - a.y * b.x; }

// Rotates p about center by angle radians (counter-clockwise for positive angles).
Point2 rotatePoint(const Point2& p, const Point2& center, double angle) noexcept;

// Unit vector, or {0,0} for a zero-length input.
Point2 normalize(const Point2& v) noexcept;

// =============================================================================
// Lines & segments
// =============================================================================

double lineAngle(const Point2& a, const Point2& b) noexcept;
Point2 perpendicular(const Point2& a, const Point2& b) noexcept;
Point2 pointOnLine(const Point2& a, const Point2& b, double dist) noexcept;

Point2 closestPointOnSegment(const Point2& p, const Point2& segStart, const Point2& segEnd) noexcept;
double distanceToSegment(const Point2& p, const Point2& segStart, const Point2& segEnd) noexcept;

// Closed-segment intersection test; touching and collinear overlap count.
bool segmentsIntersect(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept;

// Intersection of the infinite lines through (p1,p2) and (p3,p4).
// Empty when the lines are parallel or coincident.
std::optional<Point2> lineIntersection(const Point2& p1, const Point2& p2, const Point2& p3, const Point2& p4) noexcept;

// =============================================================================
// Boxes
// =============================================================================

// All-zero box for an empty input.
BoundingBox boundingBox(const std::vector<Point2>& points) noexcept;
bool pointInRectangle(const Point2& p, const Rectangle& r) noexcept;
bool rectanglesOverlap(const Rectangle& a, const Rectangle& b) noexcept;
Rectangle expandRectangle(const Rectangle& r, double margin) noexcept;

// =============================================================================
// Snapping
// =============================================================================

struct Segment2 {
    Point2 start;
    Point2 end;
};

Point2 snapToGrid(const Point2& p, double gridSize) noexcept;
Point2 snapToPoints(const Point2& p, const std::vector<Point2>& candidates, double tolerance) noexcept;
Point2 snapToLines(const Point2& p, const std::vector<Segment2>& lines, double tolerance) noexcept;

// =============================================================================
// Wall outline
// =============================================================================

struct WallOutline {
    Point2 centerStart, centerEnd;
    Point2 leftStart, leftEnd;
    Point2 rightStart, rightEnd;
};

// Offsets the centre line by half the thickness on each side. Thickness is
// taken in drawing units as stored on the wall.
WallOutline wallOutline(const Wall& wall) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_GEOMETRY_PRIMITIVES_H
