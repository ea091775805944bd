#pragma once
#include "common/types.hpp"

namespace agro {

// Each component of the mission build is one Stage. Inputs and outputs travel
// through PlanningContext; Pipeline calls the stages strictly in order.
// A stage either completes its part of the context or throws a
// MissionBuildError; it never leaves a half-written result behind for the
// next stage.
class IStage {
public:
  virtual ~IStage() = default;
  virtual const char* Name() const = 0;
  virtual void Run(PlanningContext& ctx) const = 0;
};

} // namespace agro
