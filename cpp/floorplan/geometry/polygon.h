#ifndef FLOORPLAN_GEOMETRY_POLYGON_H
#define FLOORPLAN_GEOMETRY_POLYGON_H

#include "floorplan/core/types.h"
#include "floorplan/geometry/primitives.h"

#include <vector>

namespace floorplan {

// Shoelace sum / 2. Positive for counter-clockwise rings in a y-up frame.
double signedPolygonArea(const Polygon& points) noexcept;

// Unsigned area; 0 for fewer than 3 points.
double polygonArea(const Polygon& points) noexcept;

// Outer area minus hole areas, never negative.
double polygonAreaWithHoles(const Polygon& outer, const std::vector<Polygon>& holes) noexcept;

// Closes the ring back to the first point; 0 for fewer than 2 points.
double polygonPerimeter(const Polygon& points) noexcept;

// Area-weighted centroid. Degenerate rings (|area| < 1e-10) fall back to the
// vertex mean; an empty ring yields {0,0}.
Point2 polygonCentroid(const Polygon& points) noexcept;

// Ray-casting parity test. Self-intersecting rings are not supported.
bool pointInPolygon(const Point2& p, const Polygon& polygon) noexcept;

// Every inner vertex inside outer and no pair of boundary edges intersecting.
bool polygonInsidePolygon(const Polygon& inner, const Polygon& outer) noexcept;

bool isClockwise(const Polygon& points) noexcept;
Polygon reversePolygon(const Polygon& points);

// Drops vertices whose turn cross product is within tolerance. A repeated
// closing point is ignored and the result is returned as an open ring.
Polygon simplifyPolygon(const Polygon& points, double tolerance = kGeometryEpsilon);

} // namespace floorplan

#endif // FLOORPLAN_GEOMETRY_POLYGON_H
