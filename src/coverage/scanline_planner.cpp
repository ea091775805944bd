#include "coverage/scanline_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "common/geometry.hpp"
#include "coverage/turn_generator.hpp"

namespace agro::coverage {

namespace {

static constexpr double kPi = 3.14159265358979323846;
// Upper bound on scan lines per sweep angle (field diagonal / spray width).
static constexpr double kMaxScanLines = 100000.0;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

// One swath candidate in the rotated frame (runs along +x at height y).
struct RotPiece {
  int line{0};
  double y{0.0};
  double x0{0.0};
  double x1{0.0};
};

struct Layout {
  std::vector<RotPiece> pieces;
  int n_lines{0};
  double extent{0.0};     // across-track height of the headland band
  bool field_only{false}; // some line had field left before NFZ cut-outs
};

using Range = std::pair<double, double>;

std::vector<Vec2> RotateAll(const std::vector<Vec2>& pts, double angle_rad) {
  std::vector<Vec2> out;
  out.reserve(pts.size());
  for (const auto& p : pts) out.push_back(geo::Rotate(p, angle_rad));
  return out;
}

// x-extent of (ring ∩ strip ylo <= y <= yhi). Exact for convex rings,
// conservative for concave ones.
bool BlockedRange(const std::vector<Vec2>& ring, double ylo, double yhi, Range* out) {
  double xmin = std::numeric_limits<double>::infinity();
  double xmax = -std::numeric_limits<double>::infinity();
  bool any = false;
  auto add = [&](double x) {
    xmin = std::min(xmin, x);
    xmax = std::max(xmax, x);
    any = true;
  };

  const std::size_t n = ring.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = ring[i];
    const Vec2& q = ring[(i + 1) % n];
    if (p.y >= ylo && p.y <= yhi) add(p.x);
    for (double yb : {ylo, yhi}) {
      if ((p.y < yb && q.y > yb) || (q.y < yb && p.y > yb)) {
        add(p.x + (yb - p.y) * (q.x - p.x) / (q.y - p.y));
      }
    }
  }
  if (any) *out = {xmin, xmax};
  return any;
}

// [a,b] minus the union of `blocked`.
std::vector<Range> Subtract(const Range& iv, std::vector<Range> blocked) {
  std::sort(blocked.begin(), blocked.end());
  std::vector<Range> out;
  double cur = iv.first;
  for (const auto& b : blocked) {
    if (b.second <= cur) continue;
    if (b.first >= iv.second) break;
    if (b.first > cur) out.emplace_back(cur, b.first);
    cur = std::max(cur, b.second);
    if (cur >= iv.second) break;
  }
  if (cur < iv.second) out.emplace_back(cur, iv.second);
  return out;
}

Layout LayoutSwaths(const std::vector<Vec2>& field_r,
                    const std::vector<std::vector<Vec2>>& nfz_r,
                    double w, double headland, double min_len) {
  Layout L;
  const geo::Box box = geo::Bounds(field_r);
  const double band_lo = box.ymin + headland;
  const double band_hi = box.ymax - headland;
  L.extent = band_hi - band_lo;
  if (L.extent <= 0.0) return L;

  L.n_lines = static_cast<int>(std::min(std::floor(L.extent / w + 1e-9), kMaxScanLines));
  if (L.n_lines < 1) return L;

  const double offset = 0.5 * (L.extent - L.n_lines * w);
  for (int k = 0; k < L.n_lines; ++k) {
    const double y = band_lo + offset + w * (k + 0.5);

    std::vector<Range> blocked;
    for (const auto& z : nfz_r) {
      Range r;
      if (BlockedRange(z, y - 0.5 * w, y + 0.5 * w, &r)) blocked.push_back(r);
    }

    for (const auto& iv : geo::ScanlineIntervals(field_r, y)) {
      const Range trimmed{iv.first + headland, iv.second - headland};
      if (trimmed.second - trimmed.first < min_len) continue;
      L.field_only = true;

      for (const auto& piece : Subtract(trimmed, blocked)) {
        if (piece.second - piece.first < min_len) continue;
        L.pieces.push_back({k, y, piece.first, piece.second});
      }
    }
  }
  return L;
}

double ObjectiveCost(const Layout& L, CoverageObjective objective, double w) {
  double total_len = 0.0;
  for (const auto& p : L.pieces) total_len += p.x1 - p.x0;

  switch (objective) {
    case CoverageObjective::kNSwath:        return static_cast<double>(L.pieces.size());
    case CoverageObjective::kSwathLength:   return total_len;
    case CoverageObjective::kFieldCoverage: return -total_len;
    case CoverageObjective::kOverlap:       return L.extent - L.n_lines * w;
  }
  return static_cast<double>(L.pieces.size());
}

} // namespace

std::vector<int> ScanlinePlanner::OrderIndices(int n, RouteOrder order, int hop, int spiral_group) {
  std::vector<int> idx;
  if (n <= 0) return idx;
  idx.reserve(static_cast<std::size_t>(n));

  auto loops = [&](int h) {
    h = std::max(1, h);
    for (int off = 0; off < h && off < n; ++off) {
      std::vector<int> pass;
      for (int i = off; i < n; i += h) pass.push_back(i);
      if (off % 2 == 1) std::reverse(pass.begin(), pass.end());
      idx.insert(idx.end(), pass.begin(), pass.end());
    }
  };

  switch (order) {
    case RouteOrder::kBoustro:
      for (int i = 0; i < n; ++i) idx.push_back(i);
      break;
    case RouteOrder::kSnake:
      loops(2);
      break;
    case RouteOrder::kStraightLoops:
      loops(std::max(2, hop));
      break;
    case RouteOrder::kSpiral: {
      const int g = std::max(2, spiral_group);
      for (int s = 0; s < n; s += g) {
        int lo = s;
        int hi = std::min(s + g, n) - 1;
        bool take_lo = true;
        while (lo <= hi) {
          idx.push_back(take_lo ? lo++ : hi--);
          take_lo = !take_lo;
        }
      }
      break;
    }
  }
  return idx;
}

CoverageResult ScanlinePlanner::Plan(const CoverageRequest& req) const {
  CoverageResult res;

  const double w = req.spray_width_m;
  if (!(w > 0.0) || req.field.ring.size() < 3) {
    res.failure_reason = "invalid coverage request (spray width or field)";
    return res;
  }
  const double headland = std::max(0.0, req.headland_factor) * w;
  const double min_len = std::max(1e-6, opt_.min_swath_factor * w);
  const double step = std::max(1e-3, opt_.angle_step_deg);

  const geo::Box fb = geo::Bounds(req.field.ring);
  const double diagonal = std::hypot(fb.xmax - fb.xmin, fb.ymax - fb.ymin);
  if (!(diagonal / w <= kMaxScanLines)) {
    res.failure_reason = "spray width too small for the field: more than " +
                         std::to_string(static_cast<long>(kMaxScanLines)) + " scan lines";
    return res;
  }

  bool any_field_piece = false;
  bool have_best = false;
  double best_cost = std::numeric_limits<double>::infinity();
  double best_deg = 0.0;
  Layout best;

  for (double deg = 0.0; deg < 180.0 - 1e-9; deg += step) {
    const double rot = -Deg2Rad(deg);
    const std::vector<Vec2> field_r = RotateAll(req.field.ring, rot);
    std::vector<std::vector<Vec2>> nfz_r;
    nfz_r.reserve(req.nfz.size());
    for (const auto& z : req.nfz) nfz_r.push_back(RotateAll(z.ring, rot));

    Layout L = LayoutSwaths(field_r, nfz_r, w, headland, min_len);
    any_field_piece = any_field_piece || L.field_only;
    if (L.pieces.empty()) continue;

    const double cost = ObjectiveCost(L, req.objective, w);
    if (!have_best || cost < best_cost - 1e-9) {
      have_best = true;
      best_cost = cost;
      best_deg = deg;
      best = std::move(L);
    }
  }

  if (!have_best) {
    res.failure_reason = any_field_piece
        ? "no-fly zones leave no sprayable swath in the field"
        : "no swath fits: spray width and headland exceed the field extent";
    return res;
  }

  const int n = static_cast<int>(best.pieces.size());
  const double hop_d = std::ceil(2.0 * req.turn_radius_m / w - 1e-9);
  const int hop = std::isfinite(hop_d)
      ? static_cast<int>(std::max(2.0, std::min(hop_d, static_cast<double>(std::max(n, 2)))))
      : std::max(n, 2);
  const std::vector<int> order = OrderIndices(n, req.route_order, hop, opt_.spiral_group);

  const double back = Deg2Rad(best_deg);
  res.swaths.reserve(order.size());
  for (std::size_t k = 0; k < order.size(); ++k) {
    const RotPiece& p = best.pieces[static_cast<std::size_t>(order[k])];
    Vec2 a{p.x0, p.y};
    Vec2 b{p.x1, p.y};
    if (k % 2 == 1) std::swap(a, b);
    res.swaths.push_back({geo::Rotate(a, back), geo::Rotate(b, back)});
  }

  TurnOptions turn;
  turn.radius_m = std::max(0.0, req.turn_radius_m);
  turn.continuous_curvature = req.use_continuous_curvature;
  turn.step_m = opt_.turn_step_m;
  if (!res.swaths.empty()) res.turns.reserve(res.swaths.size() - 1);
  for (std::size_t k = 0; k + 1 < res.swaths.size(); ++k) {
    const LineString& cur = res.swaths[k];
    const LineString& nxt = res.swaths[k + 1];
    res.turns.push_back(MakeTurn(cur.back(), cur.back() - cur.front(),
                                 nxt.front(), nxt.back() - nxt.front(), turn));
  }

  for (std::size_t k = 0; k < res.swaths.size(); ++k) {
    res.cover_path.insert(res.cover_path.end(), res.swaths[k].begin(), res.swaths[k].end());
    if (k < res.turns.size() && res.turns[k].size() > 2) {
      const LineString& t = res.turns[k];
      res.cover_path.insert(res.cover_path.end(), t.begin() + 1, t.end() - 1);
    }
  }

  res.feasible = true;
  res.angle_used_deg = best_deg;
  return res;
}

} // namespace agro::coverage
