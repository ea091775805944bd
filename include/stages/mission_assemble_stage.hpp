#pragma once
#include "stages/stage_base.hpp"

namespace agro {

// ======================
// Stage: mission assembly (last)
// Output: ctx.mission, built from the finished context in one step.
// ======================
class MissionAssembleStage final : public IStage {
public:
  const char* Name() const override { return "mission_assemble"; }
  void Run(PlanningContext& ctx) const override;
};

} // namespace agro
