#include "stages/preprocess_stage.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "common/errors.hpp"
#include "common/geometry.hpp"

namespace agro {

namespace {

// Points closer than this are merged.
static constexpr double kDuplicateTolM = 1e-6;
static constexpr double kMinAreaM2 = 1e-6;
static constexpr double kMinRunwayLengthM = 1e-3;
// Aircraft profile limits.
static constexpr double kMinSprayWidthM = 0.1;
static constexpr double kMaxSprayWidthM = 1000.0;
static constexpr double kMaxTurnRadiusM = 10000.0;

inline bool SamePoint(const Vec2& a, const Vec2& b) {
  return geo::Dist(a, b) <= kDuplicateTolM;
}

std::vector<Vec2> DropDuplicates(const std::vector<Vec2>& pts) {
  std::vector<Vec2> out;
  out.reserve(pts.size());
  for (const auto& p : pts) {
    if (out.empty() || !SamePoint(out.back(), p)) out.push_back(p);
  }
  return out;
}

void RequireFinite(const std::vector<Vec2>& pts, const std::string& what) {
  for (const auto& p : pts) {
    if (!geo::IsFinite(p)) {
      throw InputValidationError(what + " has a non-finite coordinate");
    }
  }
}

void RequirePositive(double v, const char* name) {
  if (!std::isfinite(v) || v <= 0.0) {
    std::ostringstream oss;
    oss << "aircraft." << name << " must be > 0 (got " << v << ")";
    throw InputValidationError(oss.str());
  }
}

void RequireAtMost(double v, double hi, const char* name) {
  if (v > hi) {
    std::ostringstream oss;
    oss << "aircraft." << name << " must be <= " << hi << " (got " << v << ")";
    throw InputValidationError(oss.str());
  }
}

void RequireNonNegative(double v, const char* name) {
  if (!std::isfinite(v) || v < 0.0) {
    std::ostringstream oss;
    oss << "aircraft." << name << " must be >= 0 (got " << v << ")";
    throw InputValidationError(oss.str());
  }
}

} // namespace

std::vector<Vec2> PreprocessStage::NormalizeRing(const std::vector<Vec2>& ring, const std::string& what) {
  RequireFinite(ring, what);

  std::vector<Vec2> r = DropDuplicates(ring);
  while (r.size() > 1 && SamePoint(r.front(), r.back())) r.pop_back();

  if (r.size() < 3) {
    throw InputValidationError(what + " needs at least 3 distinct vertices");
  }
  const double a = geo::SignedArea(r);
  if (std::fabs(a) < kMinAreaM2) {
    throw InputValidationError(what + " has zero area");
  }
  if (!geo::RingIsSimple(r)) {
    throw InputValidationError(what + " is self-intersecting");
  }
  if (a < 0.0) std::reverse(r.begin(), r.end());
  return r;
}

LineString PreprocessStage::NormalizeLine(const LineString& line, const std::string& what) {
  RequireFinite(line, what);
  LineString l = DropDuplicates(line);
  if (l.size() < 2) {
    throw InputValidationError(what + " needs at least 2 distinct points");
  }
  if (geo::PolylineLength(l) < kMinRunwayLengthM) {
    throw InputValidationError(what + " has zero length");
  }
  return l;
}

void PreprocessStage::ValidateProfile(const AircraftProfile& ac) {
  RequirePositive(ac.spray_width_m, "spray_width_m");
  RequirePositive(ac.total_capacity_l, "total_capacity_l");
  RequireNonNegative(ac.turn_radius_m, "turn_radius_m");
  RequireNonNegative(ac.fuel_reserve_l, "fuel_reserve_l");
  RequireNonNegative(ac.mix_rate_l_per_ha, "mix_rate_l_per_ha");
  RequireNonNegative(ac.fuel_burn_l_per_km, "fuel_burn_l_per_km");
  RequireNonNegative(ac.headland_factor, "headland_factor");
  RequireNonNegative(ac.fuel_capacity_l, "fuel_capacity_l");

  if (ac.spray_width_m < kMinSprayWidthM) {
    std::ostringstream oss;
    oss << "aircraft.spray_width_m must be >= " << kMinSprayWidthM << " (got " << ac.spray_width_m << ")";
    throw InputValidationError(oss.str());
  }
  RequireAtMost(ac.spray_width_m, kMaxSprayWidthM, "spray_width_m");
  RequireAtMost(ac.turn_radius_m, kMaxTurnRadiusM, "turn_radius_m");
}

void PreprocessStage::Run(PlanningContext& ctx) const {
  ValidateProfile(ctx.request.aircraft);

  MissionGeometry g;
  g.field.ring = NormalizeRing(ctx.geometry.field.ring, "field polygon");
  g.runway_centerline = NormalizeLine(ctx.geometry.runway_centerline, "runway centerline");

  g.nfz.reserve(ctx.geometry.nfz.size());
  for (std::size_t i = 0; i < ctx.geometry.nfz.size(); ++i) {
    const std::string what = "nfz[" + std::to_string(i) + "]";
    g.nfz.push_back(Polygon{NormalizeRing(ctx.geometry.nfz[i].ring, what)});
  }

  ctx.geometry = std::move(g);

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(1);
  oss << "geometry ok: field " << ctx.geometry.field.ring.size() << " vertices, area "
      << geo::Area(ctx.geometry.field) << " m2; runway "
      << geo::PolylineLength(ctx.geometry.runway_centerline) << " m; nfz "
      << ctx.geometry.nfz.size();
  LogLine(ctx, oss.str());
}

} // namespace agro
