#pragma once
#include <memory>

#include "coverage/coverage_planner.hpp"
#include "stages/stage_base.hpp"

namespace agro {

// ======================
// Stage: coverage request adapter
// Position: preprocessing -> coverage request -> trip segmentation
//
// Input:
//   ctx.geometry (field + NFZ, local frame), ctx.request.aircraft
//
// Output:
//   ctx.coverage (indexed swaths in flight order, cover path, sweep angle)
//
// Only translates between the mission model and the planner contract; no
// geometry is computed here. Infeasibility, an empty result, non-finite
// coordinates, a planner exception or an expired timeout all become
// CoveragePlanningFailure.
//
// With planner_timeout_s > 0 the planner runs on a detached thread. A call
// that times out leaves that thread running until Plan() returns, and nothing
// caps how many such threads exist at once. Callers that retry after timeouts
// should bound their retries or use a planner that returns promptly.
// ======================
class CoverageRequestStage final : public IStage {
public:
  explicit CoverageRequestStage(std::shared_ptr<const coverage::ICoveragePlanner> planner);

  const char* Name() const override { return "coverage_request"; }
  void Run(PlanningContext& ctx) const override;

  static coverage::CoverageRequest MakeRequest(const MissionGeometry& g, const AircraftProfile& ac);

private:
  coverage::CoverageResult CallPlanner(const coverage::CoverageRequest& req, double timeout_s) const;

  std::shared_ptr<const coverage::ICoveragePlanner> planner_;
};

} // namespace agro
