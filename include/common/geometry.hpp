#pragma once
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace agro {

inline Vec2 operator+(const Vec2& a, const Vec2& b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(const Vec2& a, double s) { return {a.x * s, a.y * s}; }

namespace geo {

// Planar helpers on the local metric frame. Predicates treat the polygon
// boundary as outside: touching an NFZ edge or vertex is not an incursion.

static constexpr double kEps = 1e-9;

double Dot(const Vec2& a, const Vec2& b);
double Cross(const Vec2& a, const Vec2& b);
double Length(const Vec2& v);
double Dist(const Vec2& a, const Vec2& b);
Vec2 Normalize(const Vec2& v);
bool IsFinite(const Vec2& p);

// Rotate p about the origin by angle_rad (counter-clockwise).
Vec2 Rotate(const Vec2& p, double angle_rad);

double PolylineLength(const LineString& line);

// Shoelace area; positive for counter-clockwise rings.
double SignedArea(const std::vector<Vec2>& ring);
double Area(const Polygon& poly);

struct Box {
  double xmin{0.0}, ymin{0.0}, xmax{0.0}, ymax{0.0};
};
Box Bounds(const std::vector<Vec2>& pts);

// True if closed segments [a,b] and [c,d] share at least one point.
bool SegmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d);

// True if no two non-adjacent edges of the (open, implicitly closed) ring meet
// and no adjacent edges fold back onto each other.
bool RingIsSimple(const std::vector<Vec2>& ring);

// Distance from p to segment [a,b].
double DistToSegment(const Vec2& p, const Vec2& a, const Vec2& b);

bool PointOnBoundary(const Vec2& p, const Polygon& poly, double tol = 1e-7);

// Strict interior test (boundary points are outside).
bool PointInPolygon(const Vec2& p, const Polygon& poly);

// True if the open segment (a,b) passes through the interior of poly.
bool SegmentCrossesInterior(const Vec2& a, const Vec2& b, const Polygon& poly);
bool SegmentCrossesAny(const Vec2& a, const Vec2& b, const std::vector<Polygon>& polys);

// Nearest point on a polyline to p.
Vec2 NearestPointOnPolyline(const Vec2& p, const LineString& line);

// x-intervals where the horizontal line y = y0 lies inside the ring, sorted.
std::vector<std::pair<double, double>> ScanlineIntervals(const std::vector<Vec2>& ring, double y0);

} // namespace geo
} // namespace agro
