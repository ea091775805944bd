#pragma once
#include <functional>
#include <string>
#include <vector>

#include "stages/stage_base.hpp"

namespace agro {

// Greedy forward splitter of the swath sequence into tank-limited trips.
//
// State machine:
//   Empty --Feed--> Accumulating --Feed(fits)--> Accumulating
//                   Accumulating --Feed(over)--> [close trip] Accumulating
//   Empty / Accumulating --Finish--> Done
//
// Swaths must be fed in index order 0, 1, 2, ... A swath whose own demand
// exceeds the tank throws CapacityExceeded; it is never split.
class TripSegmenter {
public:
  enum class State { kEmpty, kAccumulating, kDone };
  using LogFn = std::function<void(const std::string&)>;

  TripSegmenter(double capacity_l, double spray_width_m, double mix_rate_l_per_ha, LogFn log = {});

  void Feed(const Swath& swath);
  std::vector<Trip> Finish();

  State state() const { return state_; }

  // Mix (l) needed to spray one swath: area_ha * rate.
  static double SwathMix(double length_m, double spray_width_m, double mix_rate_l_per_ha);

private:
  void Open(const Swath& swath, double inc);
  void Close();
  void Log(const std::string& line) const;

  double capacity_l_;
  double width_m_;
  double rate_;
  LogFn log_;

  State state_{State::kEmpty};
  int next_index_{0};
  Trip current_;
  std::vector<Trip> trips_;
};

// Runs the segmenter over the whole sequence.
std::vector<Trip> SegmentTrips(const std::vector<Swath>& swaths, const AircraftProfile& ac,
                               const TripSegmenter::LogFn& log = {});

// ======================
// Stage: trip segmentation
// Position: coverage request -> trip segmentation -> transit routing
//
// Input:  ctx.coverage.swaths, ctx.request.aircraft
// Output: ctx.trips (start_idx / end_idx / mix_used_l; transit filled later)
// ======================
class TripSegmentStage final : public IStage {
public:
  const char* Name() const override { return "trip_segment"; }
  void Run(PlanningContext& ctx) const override;
};

} // namespace agro
