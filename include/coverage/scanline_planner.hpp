#pragma once
#include <vector>

#include "coverage/coverage_planner.hpp"

namespace agro::coverage {

// Built-in planner: parallel swaths from a brute-force sweep-angle search.
//
//   1) for every candidate angle, rotate the field so swaths run along +x
//   2) lay scan lines spray_width apart inside the headland band, trim each
//      field interval by the headland width, cut out NFZ-blocked ranges
//   3) keep the angle with the lowest objective cost
//   4) order the swaths (route_order) and alternate the flight direction
//   5) join consecutive swaths with headland turns of turn_radius_m
//      (see turn_generator.hpp; use_continuous_curvature picks the shape)
//
// turn_radius_m also sets the hop of the straight_loops order.
class ScanlinePlanner final : public ICoveragePlanner {
public:
  struct Options {
    double angle_step_deg{1.0};
    int spiral_group{6};
    double min_swath_factor{0.5};  // pieces shorter than factor * width are dropped
    double turn_step_m{2.0};
  };

  ScanlinePlanner() = default;
  explicit ScanlinePlanner(const Options& opt) : opt_(opt) {}

  const char* Name() const override { return "scanline"; }
  CoverageResult Plan(const CoverageRequest& request) const override;

  // Visiting order of n consecutive swaths (exposed for tests).
  static std::vector<int> OrderIndices(int n, RouteOrder order, int hop, int spiral_group);

private:
  Options opt_;
};

} // namespace agro::coverage
