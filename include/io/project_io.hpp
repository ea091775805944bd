#pragma once
#include <string>

#include "common/types.hpp"

namespace agro::io {

// ProjectIO turns a project file into a MissionRequest.
//
// Project layout (JSON):
//   {
//     "mission_id": "...",
//     "crs": "wgs84" | "local",
//     "geoms": { "field": Polygon, "runway_centerline": LineString, "nfz": [Polygon, ...] },
//     "aircraft": { ... AircraftProfile keys ... },
//     "transit":  { "anchor", "avoid_nfz", "nfz_clearance_m", "takeoff": {...}, "landing": {...} },
//     "metrics":  { "transit_speed_ms", "spray_speed_ms" },
//     "planner":  { "timeout_s" }
//   }
// Geometries are GeoJSON geometry objects or Features ("nfz" may also be a
// FeatureCollection or MultiPolygon). Missing keys keep their defaults.
//
// Unreadable files and malformed JSON -> std::runtime_error.
// Wrong geometry types and unknown enum names -> InputValidationError.
class ProjectIO {
public:
  static MissionRequest LoadRequest(const std::string& path);
  static MissionRequest ParseRequest(const std::string& text, const std::string& hint);

  static RouteOrder ParseRouteOrder(const std::string& s);
  static CoverageObjective ParseObjective(const std::string& s);
  static CoordinateFrame ParseFrame(const std::string& s);
  static RunwayAnchorMode ParseAnchorMode(const std::string& s);
};

} // namespace agro::io
