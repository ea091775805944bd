#pragma once
#include "common/types.hpp"

namespace agro::coverage {

// Headland turn between two swaths: leaves `exit` heading along `exit_dir` and
// arrives at `entry` heading along `entry_dir`, never tighter than radius_m.
//
// The turn is a polyline skeleton whose corners are rounded one at a time:
//   - Dubins (continuous_curvature = false): a circular arc of radius_m
//   - continuous curvature: clothoid, arc of radius_m, clothoid
// A lateral gap of at least two corner tangents gets a rectangular U with two
// 90 deg corners. A narrower gap gets a bulb that first swings away from the
// next swath. The turn starts beyond the farther of the two swath ends.
//
// Headings that are not opposite, or radius_m == 0, give the straight chord.
struct TurnOptions {
  double radius_m{0.0};
  bool continuous_curvature{true};
  double step_m{2.0};  // spacing of sampled curve points
};

LineString MakeTurn(const Vec2& exit, const Vec2& exit_dir,
                    const Vec2& entry, const Vec2& entry_dir,
                    const TurnOptions& opt);

// Distance from a skeleton corner with the given deflection (radians, 0..pi)
// back to where its rounded part begins.
double CornerTangent(double deflection_rad, const TurnOptions& opt);

} // namespace agro::coverage
