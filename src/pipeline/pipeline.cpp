#include "pipeline/pipeline.hpp"

#include <string>
#include <utility>

#include "common/errors.hpp"

// concrete stages
#include "stages/coordinate_transform_stage.hpp"
#include "stages/preprocess_stage.hpp"
#include "stages/coverage_request_stage.hpp"
#include "stages/trip_segment_stage.hpp"
#include "stages/transit_stage.hpp"
#include "stages/metrics_stage.hpp"
#include "stages/mission_assemble_stage.hpp"

namespace agro {

Pipeline::Pipeline(std::shared_ptr<const coverage::ICoveragePlanner> planner,
                   std::shared_ptr<const IObstacleAvoider> avoider) {
  stages_.emplace_back(std::make_unique<CoordinateTransformStage>());
  stages_.emplace_back(std::make_unique<PreprocessStage>());
  stages_.emplace_back(std::make_unique<CoverageRequestStage>(std::move(planner)));
  stages_.emplace_back(std::make_unique<TripSegmentStage>());
  stages_.emplace_back(std::make_unique<TransitStage>(std::move(avoider)));
  stages_.emplace_back(std::make_unique<MetricsStage>());
  stages_.emplace_back(std::make_unique<MissionAssembleStage>());
}

void Pipeline::Run(PlanningContext& ctx) const {
  for (const auto& stage : stages_) {
    stage->Run(ctx);
  }
}

Mission Pipeline::Build(const MissionRequest& request, std::ostream* log_echo) const {
  PlanningContext ctx;
  ctx.request = request;
  ctx.log_echo = log_echo;
  LogLine(ctx, "build mission '" + request.mission_id + "' (" + ToString(request.frame) + " input)");

  try {
    Run(ctx);
  } catch (MissionBuildError& e) {
    LogLine(ctx, std::string("FAILED ") + ToString(e.kind()) + ": " + e.what());
    e.set_logs(std::move(ctx.logs));
    throw;
  }
  return std::move(ctx.mission);
}

} // namespace agro
