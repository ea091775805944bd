#pragma once
#include <string>
#include <vector>

#include "common/types.hpp"

namespace agro::coverage {

// Input contract of a Coverage-Path Planner. Geometry is in the local metric
// frame, already validated.
struct CoverageRequest {
  Polygon field;
  std::vector<Polygon> nfz;
  double spray_width_m{0.0};
  double turn_radius_m{0.0};
  double headland_factor{0.0};
  RouteOrder route_order{RouteOrder::kSnake};
  CoverageObjective objective{CoverageObjective::kNSwath};
  bool use_continuous_curvature{true};
};

// Output contract: swaths in flight order, each oriented in flight direction,
// or a feasibility failure with a human-readable reason.
// turns[k] flies from the end of swaths[k] to the start of swaths[k + 1]. A
// planner that leaves `turns` empty gets straight connectors.
struct CoverageResult {
  bool feasible{false};
  std::string failure_reason;
  std::vector<LineString> swaths;
  std::vector<LineString> turns;
  LineString cover_path;
  double angle_used_deg{0.0};
};

// Boundary to whatever computes the coverage path. The mission core only
// relies on the request/result contract above. Implementations must be safe
// to call concurrently from independent builds.
class ICoveragePlanner {
public:
  virtual ~ICoveragePlanner() = default;
  virtual const char* Name() const = 0;
  virtual CoverageResult Plan(const CoverageRequest& request) const = 0;
};

} // namespace agro::coverage
