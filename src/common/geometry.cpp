#include "common/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace agro::geo {

namespace {

inline int Orient(const Vec2& a, const Vec2& b, const Vec2& c) {
  const double v = Cross(b - a, c - a);
  if (v > kEps) return 1;
  if (v < -kEps) return -1;
  return 0;
}

inline bool WithinBox(const Vec2& a, const Vec2& b, const Vec2& p) {
  return p.x <= std::max(a.x, b.x) + kEps && p.x >= std::min(a.x, b.x) - kEps &&
         p.y <= std::max(a.y, b.y) + kEps && p.y >= std::min(a.y, b.y) - kEps;
}

// Parameter of the projection of p onto a->b, clamped to [0,1].
inline double ProjectParam(const Vec2& p, const Vec2& a, const Vec2& b) {
  const Vec2 ab = b - a;
  const double L2 = Dot(ab, ab);
  if (L2 < kEps * kEps) return 0.0;
  const double t = Dot(p - a, ab) / L2;
  return std::max(0.0, std::min(1.0, t));
}

} // namespace

double Dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
double Cross(const Vec2& a, const Vec2& b) { return a.x * b.y - a.y * b.x; }
double Length(const Vec2& v) { return std::sqrt(v.x * v.x + v.y * v.y); }
double Dist(const Vec2& a, const Vec2& b) { return Length(b - a); }

Vec2 Normalize(const Vec2& v) {
  const double L = Length(v);
  if (L < 1e-12) return {0.0, 0.0};
  return {v.x / L, v.y / L};
}

bool IsFinite(const Vec2& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

Vec2 Rotate(const Vec2& p, double angle_rad) {
  const double c = std::cos(angle_rad);
  const double s = std::sin(angle_rad);
  return {c * p.x - s * p.y, s * p.x + c * p.y};
}

double PolylineLength(const LineString& line) {
  double L = 0.0;
  for (std::size_t i = 1; i < line.size(); ++i) L += Dist(line[i - 1], line[i]);
  return L;
}

double SignedArea(const std::vector<Vec2>& ring) {
  const std::size_t n = ring.size();
  if (n < 3) return 0.0;
  double a2 = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = ring[i];
    const Vec2& q = ring[(i + 1) % n];
    a2 += p.x * q.y - q.x * p.y;
  }
  return 0.5 * a2;
}

double Area(const Polygon& poly) { return std::fabs(SignedArea(poly.ring)); }

Box Bounds(const std::vector<Vec2>& pts) {
  Box b;
  if (pts.empty()) return b;
  b.xmin = b.xmax = pts.front().x;
  b.ymin = b.ymax = pts.front().y;
  for (const auto& p : pts) {
    b.xmin = std::min(b.xmin, p.x);
    b.xmax = std::max(b.xmax, p.x);
    b.ymin = std::min(b.ymin, p.y);
    b.ymax = std::max(b.ymax, p.y);
  }
  return b;
}

bool SegmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d) {
  const int o1 = Orient(a, b, c);
  const int o2 = Orient(a, b, d);
  const int o3 = Orient(c, d, a);
  const int o4 = Orient(c, d, b);

  if (o1 != o2 && o3 != o4) return true;

  if (o1 == 0 && WithinBox(a, b, c)) return true;
  if (o2 == 0 && WithinBox(a, b, d)) return true;
  if (o3 == 0 && WithinBox(c, d, a)) return true;
  if (o4 == 0 && WithinBox(c, d, b)) return true;
  return false;
}

bool RingIsSimple(const std::vector<Vec2>& ring) {
  const std::size_t n = ring.size();
  if (n < 3) return false;

  // Spikes: an edge folding straight back onto the previous one.
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& prev = ring[(i + n - 1) % n];
    const Vec2& cur = ring[i];
    const Vec2& next = ring[(i + 1) % n];
    const Vec2 e1 = cur - prev;
    const Vec2 e2 = next - cur;
    if (std::fabs(Cross(e1, e2)) <= kEps && Dot(e1, e2) < 0.0) return false;
  }

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = ring[i];
    const Vec2& b = ring[(i + 1) % n];
    for (std::size_t j = i + 1; j < n; ++j) {
      const bool adjacent = (j == i + 1) || (i == 0 && j == n - 1);
      if (adjacent) continue;
      const Vec2& c = ring[j];
      const Vec2& d = ring[(j + 1) % n];
      if (SegmentsIntersect(a, b, c, d)) return false;
    }
  }
  return true;
}

double DistToSegment(const Vec2& p, const Vec2& a, const Vec2& b) {
  const double t = ProjectParam(p, a, b);
  return Dist(p, a + (b - a) * t);
}

bool PointOnBoundary(const Vec2& p, const Polygon& poly, double tol) {
  const std::size_t n = poly.ring.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (DistToSegment(p, poly.ring[i], poly.ring[(i + 1) % n]) <= tol) return true;
  }
  return false;
}

bool PointInPolygon(const Vec2& p, const Polygon& poly) {
  const std::size_t n = poly.ring.size();
  if (n < 3) return false;
  if (PointOnBoundary(p, poly)) return false;

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2& pi = poly.ring[i];
    const Vec2& pj = poly.ring[j];
    if ((pi.y > p.y) != (pj.y > p.y)) {
      const double x = pj.x + (p.y - pj.y) * (pi.x - pj.x) / (pi.y - pj.y);
      if (p.x < x) inside = !inside;
    }
  }
  return inside;
}

bool SegmentCrossesInterior(const Vec2& a, const Vec2& b, const Polygon& poly) {
  const std::size_t n = poly.ring.size();
  if (n < 3) return false;
  if (Dist(a, b) < kEps) return PointInPolygon(a, poly);

  // Cheap reject on bounding boxes.
  const Box pb = Bounds(poly.ring);
  if (std::max(a.x, b.x) < pb.xmin || std::min(a.x, b.x) > pb.xmax ||
      std::max(a.y, b.y) < pb.ymin || std::min(a.y, b.y) > pb.ymax) {
    return false;
  }

  std::vector<double> ts{0.0, 1.0};
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = poly.ring[i];
    const Vec2& q = poly.ring[(i + 1) % n];

    const int o1 = Orient(a, b, p);
    const int o2 = Orient(a, b, q);
    const int o3 = Orient(p, q, a);
    const int o4 = Orient(p, q, b);
    if (o1 * o2 < 0 && o3 * o4 < 0) return true;

    // Touch points split (a,b) into pieces that are each fully in or out.
    if (DistToSegment(p, a, b) <= 1e-7) ts.push_back(ProjectParam(p, a, b));
    if (DistToSegment(q, a, b) <= 1e-7) ts.push_back(ProjectParam(q, a, b));
  }

  std::sort(ts.begin(), ts.end());
  for (std::size_t k = 1; k < ts.size(); ++k) {
    if (ts[k] - ts[k - 1] < 1e-12) continue;
    const double tm = 0.5 * (ts[k] + ts[k - 1]);
    if (PointInPolygon(a + (b - a) * tm, poly)) return true;
  }
  return false;
}

bool SegmentCrossesAny(const Vec2& a, const Vec2& b, const std::vector<Polygon>& polys) {
  for (const auto& poly : polys) {
    if (SegmentCrossesInterior(a, b, poly)) return true;
  }
  return false;
}

Vec2 NearestPointOnPolyline(const Vec2& p, const LineString& line) {
  if (line.empty()) return p;
  if (line.size() == 1) return line.front();

  Vec2 best = line.front();
  double best_d = std::numeric_limits<double>::infinity();
  for (std::size_t i = 1; i < line.size(); ++i) {
    const Vec2& a = line[i - 1];
    const Vec2& b = line[i];
    const Vec2 c = a + (b - a) * ProjectParam(p, a, b);
    const double d = Dist(p, c);
    if (d < best_d) {
      best_d = d;
      best = c;
    }
  }
  return best;
}

std::vector<std::pair<double, double>> ScanlineIntervals(const std::vector<Vec2>& ring, double y0) {
  std::vector<double> xs;
  const std::size_t n = ring.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = ring[i];
    const Vec2& q = ring[(i + 1) % n];
    // Half-open rule so a vertex on the line is counted once.
    if ((p.y <= y0 && q.y > y0) || (q.y <= y0 && p.y > y0)) {
      xs.push_back(p.x + (y0 - p.y) * (q.x - p.x) / (q.y - p.y));
    }
  }
  std::sort(xs.begin(), xs.end());

  std::vector<std::pair<double, double>> out;
  for (std::size_t i = 0; i + 1 < xs.size(); i += 2) {
    if (xs[i + 1] - xs[i] > kEps) out.emplace_back(xs[i], xs[i + 1]);
  }
  return out;
}

} // namespace agro::geo
