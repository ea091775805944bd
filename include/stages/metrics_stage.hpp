#pragma once
#include <cstddef>

#include "stages/stage_base.hpp"

namespace agro {

// ======================
// Stage: metrics
// Position: transit routing -> metrics -> mission assembly
//
// Per trip : transit / spray / total length, fuel, time
// Mission  : sums over trips, field area, sprayed area, trip count
//
// Spray length of a trip counts its swaths plus the headland turns between
// consecutive swaths (the straight chord when the planner gave no turn). Fuel never constrains the plan; a trip whose
// fuel plus reserve exceeds fuel_capacity_l only produces a warning line.
// ======================
class MetricsStage final : public IStage {
public:
  const char* Name() const override { return "metrics"; }
  void Run(PlanningContext& ctx) const override;

  // Fills the length / fuel / time fields of one trip.
  static void MeasureTrip(Trip& trip, const CoveragePath& coverage, const AircraftProfile& ac,
                          const MetricsOptions& speeds);

  // Flown length from the end of swath i to the start of swath i + 1.
  static double ConnectorLength(const CoveragePath& coverage, std::size_t i);
};

} // namespace agro
