#include "common/types.hpp"

#include <ostream>

namespace agro {

const char* ToString(RouteOrder v) {
  switch (v) {
    case RouteOrder::kSnake:         return "snake";
    case RouteOrder::kBoustro:       return "boustro";
    case RouteOrder::kSpiral:        return "spiral";
    case RouteOrder::kStraightLoops: return "straight_loops";
  }
  return "?";
}

const char* ToString(CoverageObjective v) {
  switch (v) {
    case CoverageObjective::kNSwath:        return "n_swath";
    case CoverageObjective::kSwathLength:   return "swath_length";
    case CoverageObjective::kFieldCoverage: return "field_coverage";
    case CoverageObjective::kOverlap:       return "overlap";
  }
  return "?";
}

const char* ToString(CoordinateFrame v) {
  switch (v) {
    case CoordinateFrame::kLocalMeters: return "local";
    case CoordinateFrame::kWgs84:       return "wgs84";
  }
  return "?";
}

const char* ToString(RunwayAnchorMode v) {
  switch (v) {
    case RunwayAnchorMode::kNearestPoint:   return "nearest";
    case RunwayAnchorMode::kTakeoffLanding: return "takeoff_landing";
  }
  return "?";
}

void LogLine(PlanningContext& ctx, std::string line) {
  if (ctx.log_echo) {
    (*ctx.log_echo) << "[mission] " << line << "\n";
  }
  ctx.logs.push_back(std::move(line));
}

} // namespace agro
