#include "stages/trip_segment_stage.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "common/errors.hpp"

namespace agro {

namespace {

std::string Fmt(double v) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(3);
  oss << v;
  return oss.str();
}

} // namespace

TripSegmenter::TripSegmenter(double capacity_l, double spray_width_m, double mix_rate_l_per_ha, LogFn log)
    : capacity_l_(capacity_l), width_m_(spray_width_m), rate_(mix_rate_l_per_ha), log_(std::move(log)) {}

double TripSegmenter::SwathMix(double length_m, double spray_width_m, double mix_rate_l_per_ha) {
  return (length_m * spray_width_m / 10000.0) * mix_rate_l_per_ha;
}

void TripSegmenter::Log(const std::string& line) const {
  if (log_) log_(line);
}

void TripSegmenter::Open(const Swath& swath, double inc) {
  current_ = Trip{};
  current_.start_idx = swath.index;
  current_.end_idx = swath.index;
  current_.mix_used_l = inc;
  state_ = State::kAccumulating;
  Log("segment: open trip " + std::to_string(trips_.size()) + " at swath " +
      std::to_string(swath.index) + " (mix " + Fmt(inc) + " l)");
}

void TripSegmenter::Close() {
  Log("segment: close trip " + std::to_string(trips_.size()) + " swaths [" +
      std::to_string(current_.start_idx) + ", " + std::to_string(current_.end_idx) + "] mix " +
      Fmt(current_.mix_used_l) + " l");
  trips_.push_back(current_);
  current_ = Trip{};
}

void TripSegmenter::Feed(const Swath& swath) {
  if (state_ == State::kDone) {
    throw std::logic_error("TripSegmenter::Feed after Finish");
  }
  if (swath.index != next_index_) {
    throw std::logic_error("TripSegmenter: swath " + std::to_string(swath.index) +
                           " fed out of order (expected " + std::to_string(next_index_) + ")");
  }
  ++next_index_;

  const double inc = SwathMix(swath.length_m, width_m_, rate_);
  if (inc > capacity_l_) {
    throw CapacityExceeded("swath " + std::to_string(swath.index) + " needs " + Fmt(inc) +
                           " l of mix, tank holds " + Fmt(capacity_l_) + " l");
  }

  if (state_ == State::kEmpty) {
    Open(swath, inc);
    return;
  }

  const double next = current_.mix_used_l + inc;
  if (next <= capacity_l_) {
    current_.end_idx = swath.index;
    current_.mix_used_l = next;
    Log("segment: append swath " + std::to_string(swath.index) + " (mix " + Fmt(next) + " / " +
        Fmt(capacity_l_) + " l)");
    return;
  }

  Log("segment: swath " + std::to_string(swath.index) + " would need " + Fmt(next) + " / " +
      Fmt(capacity_l_) + " l");
  Close();
  Open(swath, inc);
}

std::vector<Trip> TripSegmenter::Finish() {
  if (state_ == State::kAccumulating) Close();
  state_ = State::kDone;
  return std::move(trips_);
}

std::vector<Trip> SegmentTrips(const std::vector<Swath>& swaths, const AircraftProfile& ac,
                               const TripSegmenter::LogFn& log) {
  TripSegmenter seg(ac.total_capacity_l, ac.spray_width_m, ac.mix_rate_l_per_ha, log);
  for (const auto& s : swaths) seg.Feed(s);
  return seg.Finish();
}

void TripSegmentStage::Run(PlanningContext& ctx) const {
  auto log = [&ctx](const std::string& line) { LogLine(ctx, line); };
  ctx.trips = SegmentTrips(ctx.coverage.swaths, ctx.request.aircraft, log);
  LogLine(ctx, "segment: " + std::to_string(ctx.trips.size()) + " trip(s) from " +
                   std::to_string(ctx.coverage.swaths.size()) + " swaths");
}

} // namespace agro
