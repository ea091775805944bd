#pragma once
#include <memory>
#include <optional>
#include <vector>

#include "stages/detour_planner.h"
#include "stages/stage_base.hpp"

namespace agro {

// Obstacle-avoidance capability used when a straight transit crosses an NFZ.
// Returns a polyline from -> to that stays out of every NFZ interior, or
// nullopt when none exists.
class IObstacleAvoider {
public:
  virtual ~IObstacleAvoider() = default;
  virtual const char* Name() const = 0;
  virtual std::optional<LineString> FindPath(const Vec2& from, const Vec2& to,
                                             const std::vector<Polygon>& nfz,
                                             double clearance_m) const = 0;
};

// Visibility graph over offset NFZ vertices (see detour_planner.h).
class VisibilityGraphAvoider final : public IObstacleAvoider {
public:
  const char* Name() const override { return "visibility_graph"; }
  std::optional<LineString> FindPath(const Vec2& from, const Vec2& to,
                                     const std::vector<Polygon>& nfz,
                                     double clearance_m) const override;
};

// Runway points the transits attach to.
struct RunwayAnchors {
  Vec2 departure;  // start of every to_field leg
  Vec2 arrival;    // end of every back_home leg
};

// ======================
// Stage: transit routing
// Position: trip segmentation -> transit routing -> metrics
//
// Input:  ctx.trips (swath ranges), ctx.coverage.swaths, ctx.geometry
// Output: ctx.trips[i].to_field / back_home
//
// nearest         : anchor = runway point nearest to the swath endpoint
// takeoff_landing : fixed take-off point and final approach fix on the runway
//                   axis, measured from the first centerline point
//
// Straight leg when clear, detour through the avoider otherwise. No avoider,
// avoid_nfz == false or no path -> TransitUnreachable.
// ======================
class TransitStage final : public IStage {
public:
  explicit TransitStage(std::shared_ptr<const IObstacleAvoider> avoider);

  const char* Name() const override { return "transit"; }
  void Run(PlanningContext& ctx) const override;

  static RunwayAnchors TakeoffLandingAnchors(const LineString& runway, const TransitOptions& opt);

private:
  LineString Route(const Vec2& from, const Vec2& to, const PlanningContext& ctx,
                   const char* leg, int trip) const;

  std::shared_ptr<const IObstacleAvoider> avoider_;
};

} // namespace agro
