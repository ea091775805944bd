#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace agro {

// ========================
// 1) Basic geometry
// ========================

// Planar coordinate. After CoordinateTransformStage every geometry in the
// context is in a local metric frame (meters); input may be lon/lat degrees.
struct Vec2 {
  double x{0.0};
  double y{0.0};
};

// Ordered polyline (runway centerline, swath, transit path, cover path).
using LineString = std::vector<Vec2>;

// Simple polygon, outer ring only. The ring is stored open (no repeated closing
// vertex) and counter-clockwise once PreprocessStage has normalized it.
struct Polygon {
  std::vector<Vec2> ring;
};

// ========================
// 2) Closed option sets
// ========================

enum class RouteOrder {
  kSnake,
  kBoustro,
  kSpiral,
  kStraightLoops,
};

enum class CoverageObjective {
  kNSwath,
  kSwathLength,
  kFieldCoverage,
  kOverlap,
};

// Frame of the raw request geometry.
enum class CoordinateFrame {
  kLocalMeters,
  kWgs84,  // [lon, lat] degrees
};

// Where transits attach to the runway.
enum class RunwayAnchorMode {
  kNearestPoint,
  kTakeoffLanding,
};

const char* ToString(RouteOrder v);
const char* ToString(CoverageObjective v);
const char* ToString(CoordinateFrame v);
const char* ToString(RunwayAnchorMode v);

// ========================
// 3) Aircraft / options (input)
// ========================

struct AircraftProfile {
  double spray_width_m{20.0};
  double turn_radius_m{40.0};
  double total_capacity_l{0.0};    // spray-mix tank
  double fuel_reserve_l{0.0};
  double mix_rate_l_per_ha{10.0};
  double fuel_burn_l_per_km{0.35};
  double headland_factor{3.0};     // multiples of spray_width_m kept for turning
  RouteOrder route_order{RouteOrder::kSnake};
  CoverageObjective objective{CoverageObjective::kNSwath};
  bool use_continuous_curvature{true};
  // 0 = unknown. Only used for the fuel-margin warning, never for segmentation.
  double fuel_capacity_l{0.0};
};

struct TakeoffConfig {
  double takeoff_alt_agl_m{10.0};
  double cruise_alt_agl_m{30.0};
  double roll_distance_m{150.0};
  double climb_angle_deg{12.0};
};

struct LandingConfig {
  double faf_alt_agl_m{30.0};
  double glide_angle_deg{4.0};
  double min_faf_distance_m{400.0};
};

struct TransitOptions {
  RunwayAnchorMode anchor{RunwayAnchorMode::kNearestPoint};
  // false: a straight transit crossing an NFZ fails instead of detouring.
  bool avoid_nfz{true};
  double nfz_clearance_m{10.0};
  TakeoffConfig takeoff;
  LandingConfig landing;
};

struct MetricsOptions {
  double transit_speed_ms{20.0};
  double spray_speed_ms{15.0};
};

// Resampled route export next to the regular outputs.
struct ExportOptions {
  double step_m{0.0};  // 0 = no export
  std::string name;    // file base name; empty = mission id
};

// One mission-build request: raw geometry in `frame` plus the parameters.
struct MissionRequest {
  std::string mission_id;
  CoordinateFrame frame{CoordinateFrame::kLocalMeters};
  Polygon field;
  LineString runway_centerline;
  std::vector<Polygon> nfz;
  AircraftProfile aircraft;
  TransitOptions transit;
  MetricsOptions metrics;
  double planner_timeout_s{0.0};  // 0 = wait for the planner indefinitely
  ExportOptions export_options;
};

// ========================
// 4) Intermediate / output records
// ========================

// Origin of the local tangent plane when the request came in as WGS84.
struct GeoOrigin {
  bool defined{false};
  double lon0_deg{0.0};
  double lat0_deg{0.0};
};

// Geometry in the local metric frame, validated and normalized.
struct MissionGeometry {
  Polygon field;
  LineString runway_centerline;
  std::vector<Polygon> nfz;
};

struct Swath {
  int index{0};        // position in the coverage sequence
  Vec2 start;          // entry point (flight direction)
  Vec2 end;            // exit point
  double length_m{0.0};
};

struct CoveragePath {
  std::vector<Swath> swaths;
  std::vector<LineString> turns;  // turns[i] joins swaths[i] to swaths[i + 1]; may be empty
  LineString cover_path;
  double angle_used_deg{0.0};
};

struct Trip {
  int start_idx{0};
  int end_idx{0};  // inclusive, end_idx >= start_idx
  LineString to_field;
  LineString back_home;

  double mix_used_l{0.0};
  double fuel_used_l{0.0};
  double transit_length_m{0.0};
  double spray_length_m{0.0};
  double length_m{0.0};
  double time_min{0.0};

  int SwathCount() const { return end_idx - start_idx + 1; }
};

struct MissionMetrics {
  double length_total_m{0.0};
  double length_transit_m{0.0};
  double length_spray_m{0.0};
  double time_total_min{0.0};
  double time_transit_min{0.0};
  double time_spray_min{0.0};
  double fuel_l{0.0};
  double fert_l{0.0};
  double field_area_ha{0.0};
  double sprayed_area_ha{0.0};
  int trip_count{0};
};

// Final product of a successful build. Never produced partially.
struct Mission {
  std::string mission_id;
  CoordinateFrame frame{CoordinateFrame::kLocalMeters};
  GeoOrigin origin;
  MissionGeometry geometry;
  AircraftProfile aircraft;
  CoveragePath coverage;
  std::vector<Trip> trips;
  MissionMetrics metrics;
  ExportOptions export_options;
  std::vector<std::string> logs;
};

// ========================
// 5) Context passed between stages
// ========================

struct PlanningContext {
  // === input ===
  MissionRequest request;

  // === intermediate results, filled stage by stage ===
  GeoOrigin origin;
  MissionGeometry geometry;
  CoveragePath coverage;
  std::vector<Trip> trips;
  MissionMetrics metrics;

  // === diagnostics ===
  std::vector<std::string> logs;
  std::ostream* log_echo{nullptr};  // optional live copy of every log line

  // === output (MissionAssembleStage) ===
  Mission mission;
};

// Appends one diagnostic line to ctx.logs (and to ctx.log_echo when set).
void LogLine(PlanningContext& ctx, std::string line);

} // namespace agro
