#include "coverage/turn_generator.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "common/geometry.hpp"

namespace agro::coverage {

namespace {

static constexpr double kPi = 3.14159265358979323846;
static constexpr double kAntiparallelCos = -0.999;
static constexpr double kBulbSwingRad = kPi / 4.0;
static constexpr int kCornerSteps = 512;
static constexpr double kSamePointM = 1e-6;

// One rounded corner in its own frame: starts at the origin heading +x and
// turns left by `deflection`. The origin itself is not in `pts`.
struct CornerShape {
  std::vector<Vec2> pts;
  double tangent_in{0.0};
  double tangent_out{0.0};
};

double ClothoidLength(double deflection, const TurnOptions& opt) {
  if (!opt.continuous_curvature) return 0.0;
  return opt.radius_m * std::min(1.0, deflection);
}

// Heading at arc length s: clothoid ramp (lc), constant arc (la), clothoid ramp.
double Heading(double s, double k, double lc, double la, double deflection) {
  if (lc > 0.0 && s < lc) return 0.5 * k * s * s / lc;
  if (s <= lc + la) return 0.5 * k * lc + k * (s - lc);
  const double u = 2.0 * lc + la - s;
  return deflection - 0.5 * k * u * u / lc;
}

CornerShape BuildCorner(double deflection, const TurnOptions& opt) {
  CornerShape c;
  const double R = opt.radius_m;
  const double k = 1.0 / R;
  const double lc = ClothoidLength(deflection, opt);
  const double la = std::max(0.0, deflection * R - lc);
  const double total = 2.0 * lc + la;
  const double ds = total / kCornerSteps;
  const double step = std::max(0.1, opt.step_m);

  Vec2 p{0.0, 0.0};
  double since = 0.0;
  for (int i = 0; i < kCornerSteps; ++i) {
    const double th = Heading((i + 0.5) * ds, k, lc, la, deflection);
    p = p + Vec2{std::cos(th), std::sin(th)} * ds;
    since += ds;
    if (since >= step || i == kCornerSteps - 1) {
      c.pts.push_back(p);
      since = 0.0;
    }
  }

  // Tangent lines: the x axis, and the line through p at `deflection`.
  const double sn = std::sin(deflection);
  c.tangent_in = p.x - p.y * std::cos(deflection) / sn;
  c.tangent_out = p.y / sn;
  return c;
}

void PushDistinct(LineString& out, const Vec2& p) {
  if (out.empty() || geo::Dist(out.back(), p) > kSamePointM) out.push_back(p);
}

// Replaces the corner at `b` (legs a->b, b->c) by its rounded curve.
void AppendCorner(const Vec2& a, const Vec2& b, const Vec2& c, const TurnOptions& opt, LineString& out) {
  const Vec2 v1 = geo::Normalize(b - a);
  const Vec2 v2 = geo::Normalize(c - b);
  const double cos_d = std::max(-1.0, std::min(1.0, geo::Dot(v1, v2)));
  const double deflection = std::acos(cos_d);
  if (deflection < 1e-6) {
    PushDistinct(out, b);
    return;
  }

  const double side = (geo::Cross(v1, v2) > 0.0) ? 1.0 : -1.0;
  const Vec2 n{-v1.y * side, v1.x * side};

  const CornerShape shape = BuildCorner(deflection, opt);
  const Vec2 t1 = b - v1 * shape.tangent_in;
  PushDistinct(out, t1);
  for (const auto& q : shape.pts) PushDistinct(out, t1 + v1 * q.x + n * q.y);
}

} // namespace

double CornerTangent(double deflection_rad, const TurnOptions& opt) {
  if (!(opt.radius_m > 0.0) || deflection_rad <= 0.0) return 0.0;
  const CornerShape c = BuildCorner(deflection_rad, opt);
  return std::max(c.tangent_in, c.tangent_out);
}

LineString MakeTurn(const Vec2& exit, const Vec2& exit_dir,
                    const Vec2& entry, const Vec2& entry_dir,
                    const TurnOptions& opt) {
  const Vec2 u = geo::Normalize(exit_dir);
  const Vec2 w = geo::Normalize(entry_dir);
  if (!(opt.radius_m > 0.0) || !std::isfinite(opt.radius_m) || geo::Length(u) == 0.0 ||
      geo::Length(w) == 0.0 || geo::Dot(u, w) > kAntiparallelCos) {
    return {exit, entry};
  }

  // Local frame: x along the exit heading, y towards the next swath.
  const Vec2 rel = entry - exit;
  const Vec2 left{-u.y, u.x};
  const double sx = geo::Dot(rel, u);
  const double sy = geo::Dot(rel, left);
  const double side = (sy >= 0.0) ? 1.0 : -1.0;
  const double gap = std::fabs(sy);
  const double xt = std::max(0.0, sx);

  std::vector<Vec2> skel;  // local, next swath at +y
  skel.push_back({0.0, 0.0});
  const double t90 = CornerTangent(0.5 * kPi, opt);
  if (gap >= 2.0 * t90 - 1e-9) {
    skel.push_back({xt + t90, 0.0});
    skel.push_back({xt + t90, gap});
  } else {
    const double beta = kBulbSwingRad;
    const double ta = CornerTangent(beta, opt);
    const double tb = CornerTangent(0.5 * kPi + beta, opt);
    const double swing = std::max(0.5 * (2.0 * tb - gap), (ta + tb) * std::sin(beta));
    const double run = swing * std::cos(beta) / std::sin(beta);
    const double xa = xt + ta;
    skel.push_back({xa, 0.0});
    skel.push_back({xa + run, -swing});
    skel.push_back({xa + run, gap + swing});
    skel.push_back({xa, gap});
  }
  skel.push_back({sx, gap});

  std::vector<Vec2> world;
  world.reserve(skel.size());
  for (const auto& p : skel) world.push_back(exit + u * p.x + left * (p.y * side));
  world.back() = entry;

  LineString out{exit};
  for (std::size_t i = 1; i + 1 < world.size(); ++i) {
    AppendCorner(world[i - 1], world[i], world[i + 1], opt, out);
  }
  if (geo::Dist(out.back(), entry) <= kSamePointM) {
    out.back() = entry;
  } else {
    out.push_back(entry);
  }
  return out;
}

} // namespace agro::coverage
