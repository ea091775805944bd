#include "io/project_io.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace agro::io {

static std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// --------- GeoJSON helpers ---------

// Unwraps a Feature to its geometry; plain geometries pass through.
static const json& GeometryOf(const json& j, const std::string& what) {
  if (!j.is_object()) throw InputValidationError(what + ": expected a GeoJSON object");
  if (j.value("type", std::string()) == "Feature") {
    if (!j.contains("geometry") || !j.at("geometry").is_object()) {
      throw InputValidationError(what + ": Feature without geometry");
    }
    return j.at("geometry");
  }
  return j;
}

static Vec2 ReadPosition(const json& p, const std::string& what) {
  if (!p.is_array() || p.size() < 2 || !p[0].is_number() || !p[1].is_number()) {
    throw InputValidationError(what + ": position must be [x, y]");
  }
  return {p[0].get<double>(), p[1].get<double>()};
}

static std::vector<Vec2> ReadPositions(const json& arr, const std::string& what) {
  if (!arr.is_array()) throw InputValidationError(what + ": coordinates must be an array");
  std::vector<Vec2> pts;
  pts.reserve(arr.size());
  for (const auto& p : arr) pts.push_back(ReadPosition(p, what));
  return pts;
}

static const json& CoordinatesOf(const json& g, const char* type, const std::string& what) {
  const std::string t = g.value("type", std::string());
  if (t != type) {
    throw InputValidationError(what + ": expected GeoJSON " + type + ", got '" + t + "'");
  }
  if (!g.contains("coordinates")) throw InputValidationError(what + ": missing coordinates");
  return g.at("coordinates");
}

// Outer ring only; holes are ignored.
static Polygon ReadPolygonRings(const json& rings, const std::string& what) {
  if (!rings.is_array() || rings.empty()) {
    throw InputValidationError(what + ": polygon needs an outer ring");
  }
  return Polygon{ReadPositions(rings.at(0), what)};
}

static Polygon ReadPolygon(const json& j, const std::string& what) {
  return ReadPolygonRings(CoordinatesOf(GeometryOf(j, what), "Polygon", what), what);
}

static LineString ReadLineString(const json& j, const std::string& what) {
  return ReadPositions(CoordinatesOf(GeometryOf(j, what), "LineString", what), what);
}

static void AppendNfz(const json& j, std::vector<Polygon>& out) {
  const std::string what = "nfz[" + std::to_string(out.size()) + "]";
  if (j.is_object() && j.value("type", std::string()) == "FeatureCollection") {
    for (const auto& f : j.value("features", json::array())) AppendNfz(f, out);
    return;
  }
  const json& g = GeometryOf(j, what);
  if (g.value("type", std::string()) == "MultiPolygon") {
    for (const auto& rings : CoordinatesOf(g, "MultiPolygon", what)) {
      out.push_back(ReadPolygonRings(rings, "nfz[" + std::to_string(out.size()) + "]"));
    }
    return;
  }
  out.push_back(ReadPolygon(g, what));
}

static const json& Section(const json& root, const char* key) {
  static const json kEmpty = json::object();
  if (!root.contains(key) || root.at(key).is_null()) return kEmpty;
  const json& s = root.at(key);
  if (!s.is_object()) throw std::runtime_error(std::string("'") + key + "' must be an object");
  return s;
}

// --------- Enum names ---------

RouteOrder ProjectIO::ParseRouteOrder(const std::string& s) {
  if (s == "snake") return RouteOrder::kSnake;
  if (s == "boustro") return RouteOrder::kBoustro;
  if (s == "spiral") return RouteOrder::kSpiral;
  if (s == "straight_loops") return RouteOrder::kStraightLoops;
  throw InputValidationError("unknown route_order '" + s + "'");
}

CoverageObjective ProjectIO::ParseObjective(const std::string& s) {
  if (s == "n_swath") return CoverageObjective::kNSwath;
  if (s == "swath_length") return CoverageObjective::kSwathLength;
  if (s == "field_coverage") return CoverageObjective::kFieldCoverage;
  if (s == "overlap") return CoverageObjective::kOverlap;
  throw InputValidationError("unknown objective '" + s + "'");
}

CoordinateFrame ProjectIO::ParseFrame(const std::string& s) {
  if (s == "wgs84") return CoordinateFrame::kWgs84;
  if (s == "local") return CoordinateFrame::kLocalMeters;
  throw InputValidationError("unknown crs '" + s + "'");
}

RunwayAnchorMode ProjectIO::ParseAnchorMode(const std::string& s) {
  if (s == "nearest") return RunwayAnchorMode::kNearestPoint;
  if (s == "takeoff_landing") return RunwayAnchorMode::kTakeoffLanding;
  throw InputValidationError("unknown transit anchor '" + s + "'");
}

// --------- Request ---------

MissionRequest ProjectIO::LoadRequest(const std::string& path) {
  const fs::path p(path);
  MissionRequest req = ParseRequest(ReadAllText(p), p.string());
  if (req.mission_id.empty()) req.mission_id = p.stem().string();
  return req;
}

MissionRequest ProjectIO::ParseRequest(const std::string& text, const std::string& hint) {
  const json root = ParseJson(text, hint);
  if (!root.is_object()) throw std::runtime_error(hint + ": project root must be an object");

  MissionRequest req;
  try {
    req.mission_id = root.value("mission_id", std::string());
    req.frame = ParseFrame(root.value("crs", std::string("wgs84")));

    const json& geoms = Section(root, "geoms");
    if (!geoms.contains("field")) throw InputValidationError("geoms.field is missing");
    if (!geoms.contains("runway_centerline")) {
      throw InputValidationError("geoms.runway_centerline is missing");
    }
    req.field = ReadPolygon(geoms.at("field"), "field");
    req.runway_centerline = ReadLineString(geoms.at("runway_centerline"), "runway_centerline");
    if (geoms.contains("nfz") && !geoms.at("nfz").is_null()) {
      const json& nfz = geoms.at("nfz");
      if (nfz.is_array()) {
        for (const auto& z : nfz) AppendNfz(z, req.nfz);
      } else {
        AppendNfz(nfz, req.nfz);
      }
    }

    const json& a = Section(root, "aircraft");
    AircraftProfile& ac = req.aircraft;
    ac.spray_width_m = a.value("spray_width_m", ac.spray_width_m);
    ac.turn_radius_m = a.value("turn_radius_m", ac.turn_radius_m);
    ac.total_capacity_l = a.value("total_capacity_l", ac.total_capacity_l);
    ac.fuel_reserve_l = a.value("fuel_reserve_l", ac.fuel_reserve_l);
    ac.mix_rate_l_per_ha = a.value("mix_rate_l_per_ha", ac.mix_rate_l_per_ha);
    ac.fuel_burn_l_per_km = a.value("fuel_burn_l_per_km", ac.fuel_burn_l_per_km);
    ac.headland_factor = a.value("headland_factor", ac.headland_factor);
    ac.route_order = ParseRouteOrder(a.value("route_order", std::string(ToString(ac.route_order))));
    ac.objective = ParseObjective(a.value("objective", std::string(ToString(ac.objective))));
    ac.use_continuous_curvature = a.value("use_cc", ac.use_continuous_curvature);
    ac.fuel_capacity_l = a.value("fuel_capacity_l", ac.fuel_capacity_l);

    const json& t = Section(root, "transit");
    TransitOptions& tr = req.transit;
    tr.anchor = ParseAnchorMode(t.value("anchor", std::string(ToString(tr.anchor))));
    tr.avoid_nfz = t.value("avoid_nfz", tr.avoid_nfz);
    tr.nfz_clearance_m = t.value("nfz_clearance_m", tr.nfz_clearance_m);

    const json& to = Section(t, "takeoff");
    tr.takeoff.takeoff_alt_agl_m = to.value("takeoff_alt_agl_m", tr.takeoff.takeoff_alt_agl_m);
    tr.takeoff.cruise_alt_agl_m = to.value("cruise_alt_agl_m", tr.takeoff.cruise_alt_agl_m);
    tr.takeoff.roll_distance_m = to.value("roll_distance_m", tr.takeoff.roll_distance_m);
    tr.takeoff.climb_angle_deg = to.value("climb_angle_deg", tr.takeoff.climb_angle_deg);

    const json& ld = Section(t, "landing");
    tr.landing.faf_alt_agl_m = ld.value("faf_alt_agl_m", tr.landing.faf_alt_agl_m);
    tr.landing.glide_angle_deg = ld.value("glide_angle_deg", tr.landing.glide_angle_deg);
    tr.landing.min_faf_distance_m = ld.value("min_faf_distance_m", tr.landing.min_faf_distance_m);

    const json& m = Section(root, "metrics");
    req.metrics.transit_speed_ms = m.value("transit_speed_ms", req.metrics.transit_speed_ms);
    req.metrics.spray_speed_ms = m.value("spray_speed_ms", req.metrics.spray_speed_ms);

    const json& pl = Section(root, "planner");
    req.planner_timeout_s = pl.value("timeout_s", req.planner_timeout_s);

    const json& ex = Section(root, "export");
    req.export_options.step_m = ex.value("step_m", req.export_options.step_m);
    req.export_options.name = ex.value("name", req.export_options.name);
    if (!std::isfinite(req.export_options.step_m) || req.export_options.step_m < 0.0) {
      throw InputValidationError("export.step_m must be >= 0");
    }
  } catch (const json::exception& e) {
    // value() on a key of the wrong JSON type.
    throw std::runtime_error("invalid project " + hint + ": " + std::string(e.what()));
  }
  return req;
}

} // namespace agro::io
