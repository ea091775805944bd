#include "stages/transit_stage.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "common/errors.hpp"
#include "common/geometry.hpp"

namespace agro {

namespace {

static constexpr double kPi = 3.14159265358979323846;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

// Point at `dist` meters along the runway axis (first -> last centerline point).
Vec2 AlongRunway(const LineString& runway, double dist) {
  const Vec2 u = geo::Normalize(runway.back() - runway.front());
  return runway.front() + u * dist;
}

} // namespace

std::optional<LineString> VisibilityGraphAvoider::FindPath(const Vec2& from, const Vec2& to,
                                                           const std::vector<Polygon>& nfz,
                                                           double clearance_m) const {
  detour::PlannerConfig cfg;
  cfg.clearance = clearance_m;
  detour::PlanResult r = detour::PlanDetour(from, to, nfz, cfg);
  if (r.status == detour::PlanStatus::Straight || r.status == detour::PlanStatus::Detour) {
    return r.path;
  }
  return std::nullopt;
}

TransitStage::TransitStage(std::shared_ptr<const IObstacleAvoider> avoider)
    : avoider_(std::move(avoider)) {}

RunwayAnchors TransitStage::TakeoffLandingAnchors(const LineString& runway, const TransitOptions& opt) {
  const TakeoffConfig& to = opt.takeoff;
  const LandingConfig& ld = opt.landing;

  double climb_dist = 0.0;
  const double climb = std::max(0.0, to.cruise_alt_agl_m - to.takeoff_alt_agl_m);
  const double tan_climb = std::tan(Deg2Rad(to.climb_angle_deg));
  if (climb > 0.0 && tan_climb > 1e-9) climb_dist = climb / tan_climb;

  double faf_dist = ld.min_faf_distance_m;
  const double tan_glide = std::tan(Deg2Rad(ld.glide_angle_deg));
  if (tan_glide > 1e-9) faf_dist = std::max(ld.faf_alt_agl_m / tan_glide, ld.min_faf_distance_m);

  RunwayAnchors a;
  a.departure = AlongRunway(runway, to.roll_distance_m + climb_dist);
  a.arrival = AlongRunway(runway, faf_dist);
  return a;
}

LineString TransitStage::Route(const Vec2& from, const Vec2& to, const PlanningContext& ctx,
                               const char* leg, int trip) const {
  const auto& nfz = ctx.geometry.nfz;
  if (!geo::SegmentCrossesAny(from, to, nfz)) return {from, to};

  const std::string where = std::string(leg) + " of trip " + std::to_string(trip);
  if (!ctx.request.transit.avoid_nfz) {
    throw TransitUnreachable(where + " crosses a no-fly zone and NFZ avoidance is disabled");
  }
  if (!avoider_) {
    throw TransitUnreachable(where + " crosses a no-fly zone and no obstacle avoider is configured");
  }

  std::optional<LineString> path = avoider_->FindPath(from, to, nfz, ctx.request.transit.nfz_clearance_m);
  if (!path || path->size() < 2) {
    throw TransitUnreachable(where + ": no path around the no-fly zones");
  }
  return *path;
}

void TransitStage::Run(PlanningContext& ctx) const {
  const LineString& runway = ctx.geometry.runway_centerline;
  const auto& swaths = ctx.coverage.swaths;
  const TransitOptions& opt = ctx.request.transit;

  RunwayAnchors fixed;
  if (opt.anchor == RunwayAnchorMode::kTakeoffLanding) {
    fixed = TakeoffLandingAnchors(runway, opt);
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << "transit anchors: departure (" << fixed.departure.x << ", " << fixed.departure.y
        << "), arrival (" << fixed.arrival.x << ", " << fixed.arrival.y << ")";
    LogLine(ctx, oss.str());
  }

  std::vector<Trip> trips = ctx.trips;
  for (std::size_t t = 0; t < trips.size(); ++t) {
    Trip& trip = trips[t];
    const Vec2 entry = swaths.at(static_cast<std::size_t>(trip.start_idx)).start;
    const Vec2 exit = swaths.at(static_cast<std::size_t>(trip.end_idx)).end;

    Vec2 dep = fixed.departure;
    Vec2 arr = fixed.arrival;
    if (opt.anchor == RunwayAnchorMode::kNearestPoint) {
      dep = geo::NearestPointOnPolyline(entry, runway);
      arr = geo::NearestPointOnPolyline(exit, runway);
    }

    const int id = static_cast<int>(t);
    trip.to_field = Route(dep, entry, ctx, "to_field", id);
    trip.back_home = Route(exit, arr, ctx, "back_home", id);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << "transit trip " << t << ": to_field " << geo::PolylineLength(trip.to_field) << " m ("
        << trip.to_field.size() - 1 << " legs), back_home " << geo::PolylineLength(trip.back_home)
        << " m (" << trip.back_home.size() - 1 << " legs)";
    LogLine(ctx, oss.str());
  }
  ctx.trips = std::move(trips);
}

} // namespace agro
