#include "stages/coordinate_transform_stage.hpp"

#include <cmath>
#include <sstream>

#include "common/errors.hpp"
#include "common/geometry.hpp"

namespace agro {

namespace {

static constexpr double kEarthRadiusM = 6378137.0;
static constexpr double kPi = 3.14159265358979323846;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }
inline double Rad2Deg(double rad) { return rad * 180.0 / kPi; }

template <class Fn>
std::vector<Vec2> MapPoints(const std::vector<Vec2>& pts, Fn&& fn) {
  std::vector<Vec2> out;
  out.reserve(pts.size());
  for (const auto& p : pts) out.push_back(fn(p));
  return out;
}

} // namespace

Vec2 CoordinateTransformStage::LonLatToLocal(const Vec2& lonlat, const GeoOrigin& origin) {
  const double cos_lat0 = std::cos(Deg2Rad(origin.lat0_deg));
  return {kEarthRadiusM * Deg2Rad(lonlat.x - origin.lon0_deg) * cos_lat0,
          kEarthRadiusM * Deg2Rad(lonlat.y - origin.lat0_deg)};
}

Vec2 CoordinateTransformStage::LocalToLonLat(const Vec2& xy, const GeoOrigin& origin) {
  const double cos_lat0 = std::cos(Deg2Rad(origin.lat0_deg));
  return {origin.lon0_deg + Rad2Deg(xy.x / (kEarthRadiusM * cos_lat0)),
          origin.lat0_deg + Rad2Deg(xy.y / kEarthRadiusM)};
}

void CoordinateTransformStage::Run(PlanningContext& ctx) const {
  const MissionRequest& req = ctx.request;

  ctx.origin = {};
  ctx.geometry = {};

  if (req.frame == CoordinateFrame::kLocalMeters) {
    ctx.geometry.field = req.field;
    ctx.geometry.runway_centerline = req.runway_centerline;
    ctx.geometry.nfz = req.nfz;
    LogLine(ctx, "frame: local meters, no projection");
    return;
  }

  if (req.field.ring.empty()) {
    throw InputValidationError("field polygon is empty");
  }
  for (const auto& p : req.field.ring) {
    if (!geo::IsFinite(p) || std::fabs(p.y) > 89.0 || std::fabs(p.x) > 180.0) {
      throw InputValidationError("field has a coordinate outside the WGS84 range");
    }
  }

  const geo::Box b = geo::Bounds(req.field.ring);
  ctx.origin.defined = true;
  ctx.origin.lon0_deg = 0.5 * (b.xmin + b.xmax);
  ctx.origin.lat0_deg = 0.5 * (b.ymin + b.ymax);

  const GeoOrigin origin = ctx.origin;
  auto to_local = [&origin](const Vec2& p) { return LonLatToLocal(p, origin); };

  ctx.geometry.field.ring = MapPoints(req.field.ring, to_local);
  ctx.geometry.runway_centerline = MapPoints(req.runway_centerline, to_local);
  ctx.geometry.nfz.reserve(req.nfz.size());
  for (const auto& z : req.nfz) {
    ctx.geometry.nfz.push_back(Polygon{MapPoints(z.ring, to_local)});
  }

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(6);
  oss << "frame: wgs84 projected to local plane at lon0=" << origin.lon0_deg
      << " lat0=" << origin.lat0_deg;
  LogLine(ctx, oss.str());
}

} // namespace agro
