#include "stages/metrics_stage.hpp"

#include <algorithm>
#include <sstream>

#include "common/geometry.hpp"

namespace agro {

namespace {

static constexpr double kMinSpeedMs = 0.1;

inline double Minutes(double length_m, double speed_ms) {
  return length_m / std::max(kMinSpeedMs, speed_ms) / 60.0;
}

} // namespace

double MetricsStage::ConnectorLength(const CoveragePath& coverage, std::size_t i) {
  if (i < coverage.turns.size()) return geo::PolylineLength(coverage.turns[i]);
  return geo::Dist(coverage.swaths.at(i).end, coverage.swaths.at(i + 1).start);
}

void MetricsStage::MeasureTrip(Trip& trip, const CoveragePath& coverage, const AircraftProfile& ac,
                               const MetricsOptions& speeds) {
  double spray = 0.0;
  for (int i = trip.start_idx; i <= trip.end_idx; ++i) {
    spray += coverage.swaths.at(static_cast<std::size_t>(i)).length_m;
    if (i > trip.start_idx) spray += ConnectorLength(coverage, static_cast<std::size_t>(i - 1));
  }

  trip.transit_length_m = geo::PolylineLength(trip.to_field) + geo::PolylineLength(trip.back_home);
  trip.spray_length_m = spray;
  trip.length_m = trip.transit_length_m + trip.spray_length_m;
  trip.fuel_used_l = trip.length_m / 1000.0 * ac.fuel_burn_l_per_km;
  trip.time_min = Minutes(trip.transit_length_m, speeds.transit_speed_ms) +
                  Minutes(trip.spray_length_m, speeds.spray_speed_ms);
}

void MetricsStage::Run(PlanningContext& ctx) const {
  const AircraftProfile& ac = ctx.request.aircraft;
  const MetricsOptions& speeds = ctx.request.metrics;

  MissionMetrics m;
  std::vector<Trip> trips = ctx.trips;
  for (std::size_t t = 0; t < trips.size(); ++t) {
    Trip& trip = trips[t];
    MeasureTrip(trip, ctx.coverage, ac, speeds);

    m.length_transit_m += trip.transit_length_m;
    m.length_spray_m += trip.spray_length_m;
    m.fuel_l += trip.fuel_used_l;
    m.fert_l += trip.mix_used_l;

    if (ac.fuel_capacity_l > 0.0 && trip.fuel_used_l + ac.fuel_reserve_l > ac.fuel_capacity_l) {
      std::ostringstream oss;
      oss.setf(std::ios::fixed);
      oss.precision(2);
      oss << "warning: trip " << t << " needs " << trip.fuel_used_l << " l fuel + "
          << ac.fuel_reserve_l << " l reserve, fuel tank holds " << ac.fuel_capacity_l << " l";
      LogLine(ctx, oss.str());
    }
  }

  m.length_total_m = m.length_transit_m + m.length_spray_m;
  m.time_transit_min = Minutes(m.length_transit_m, speeds.transit_speed_ms);
  m.time_spray_min = Minutes(m.length_spray_m, speeds.spray_speed_ms);
  m.time_total_min = m.time_transit_min + m.time_spray_min;
  m.field_area_ha = geo::Area(ctx.geometry.field) / 10000.0;

  double swath_len = 0.0;
  for (const auto& s : ctx.coverage.swaths) swath_len += s.length_m;
  m.sprayed_area_ha = swath_len * ac.spray_width_m / 10000.0;
  m.trip_count = static_cast<int>(trips.size());

  ctx.trips = std::move(trips);
  ctx.metrics = m;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(2);
  oss << "metrics: " << m.trip_count << " trip(s), " << m.length_total_m << " m total ("
      << m.length_transit_m << " transit, " << m.length_spray_m << " spray), "
      << m.time_total_min << " min, fuel " << m.fuel_l << " l, mix " << m.fert_l << " l, sprayed "
      << m.sprayed_area_ha << " / " << m.field_area_ha << " ha";
  LogLine(ctx, oss.str());
}

} // namespace agro
