#pragma once
#include <string>
#include <vector>

#include "stages/stage_base.hpp"

namespace agro {

// ======================
// Stage: geometry preprocessing
// Position: coordinate transform -> preprocessing -> coverage request
//
// Validates (throws InputValidationError):
//   - field: >= 3 distinct finite vertices, positive area, no self-intersection
//   - runway centerline: >= 2 finite points, non-zero length
//   - every NFZ: same rules as the field
//   - aircraft profile: positive spray width / capacity, non-negative rates
//
// Normalizes ctx.geometry in place:
//   - drops a repeated closing vertex and consecutive duplicate points
//   - orients rings counter-clockwise
// ======================
class PreprocessStage final : public IStage {
public:
  const char* Name() const override { return "preprocess"; }
  void Run(PlanningContext& ctx) const override;

  // Returns the normalized ring; throws InputValidationError naming `what`.
  static std::vector<Vec2> NormalizeRing(const std::vector<Vec2>& ring, const std::string& what);
  static LineString NormalizeLine(const LineString& line, const std::string& what);
  static void ValidateProfile(const AircraftProfile& ac);
};

} // namespace agro
