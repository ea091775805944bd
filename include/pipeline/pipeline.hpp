#pragma once
#include <iosfwd>
#include <memory>
#include <vector>

#include "common/types.hpp"
#include "coverage/coverage_planner.hpp"
#include "stages/stage_base.hpp"
#include "stages/transit_stage.hpp"

namespace agro {

// Pipeline chains the stages in fixed order:
//   coordinate transform -> preprocess -> coverage request -> trip segmentation
//   -> transit routing -> metrics -> mission assembly
// The planner and the obstacle avoider are injected; swapping either one
// leaves the flow untouched. A Pipeline holds no per-build state and can be
// shared by concurrent builds.
class Pipeline {
public:
  explicit Pipeline(std::shared_ptr<const coverage::ICoveragePlanner> planner,
                    std::shared_ptr<const IObstacleAvoider> avoider = std::make_shared<VisibilityGraphAvoider>());

  void Run(PlanningContext& ctx) const;

  // One full build. Throws a MissionBuildError carrying the log trail.
  Mission Build(const MissionRequest& request, std::ostream* log_echo = nullptr) const;

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace agro
