#pragma once
#include "stages/stage_base.hpp"

namespace agro {

// ======================
// Stage: coordinate transform
// Position: read request -> coordinate transform -> geometry preprocessing
//
// Input:
//   ctx.request.frame / field / runway_centerline / nfz (raw coordinates)
//
// Output:
//   ctx.origin    (defined only for WGS84 input)
//   ctx.geometry  (all geometry in the local metric frame, not yet validated)
//
// WGS84 input ([lon, lat] degrees) is projected onto an equirectangular
// tangent plane centred on the field bounding box. Distortion stays well
// below a metre over field-sized areas.
// ======================
class CoordinateTransformStage final : public IStage {
public:
  const char* Name() const override { return "coordinate_transform"; }
  void Run(PlanningContext& ctx) const override;

  // Forward / inverse projection around origin (degrees <-> meters).
  static Vec2 LonLatToLocal(const Vec2& lonlat, const GeoOrigin& origin);
  static Vec2 LocalToLonLat(const Vec2& xy, const GeoOrigin& origin);
};

} // namespace agro
