#include "stages/mission_assemble_stage.hpp"

#include <string>
#include <utility>

namespace agro {

void MissionAssembleStage::Run(PlanningContext& ctx) const {
  LogLine(ctx, "mission '" + ctx.request.mission_id + "' assembled: " +
                   std::to_string(ctx.trips.size()) + " trip(s)");

  Mission m;
  m.mission_id = ctx.request.mission_id;
  m.frame = ctx.request.frame;
  m.origin = ctx.origin;
  m.geometry = ctx.geometry;
  m.aircraft = ctx.request.aircraft;
  m.coverage = ctx.coverage;
  m.trips = ctx.trips;
  m.metrics = ctx.metrics;
  m.export_options = ctx.request.export_options;
  m.logs = ctx.logs;
  ctx.mission = std::move(m);
}

} // namespace agro
