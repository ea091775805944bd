#pragma once
#include <vector>

#include "common/types.hpp"

namespace agro {
namespace detour {

struct PlannerConfig {
    // Offset of graph nodes from the NFZ boundary (meters).
    double clearance = 10.0;
    // If no path exists with the full clearance, retry with these fractions of it.
    std::vector<double> clearanceScales{1.0, 0.5, 0.25, 0.1};
    // Drop intermediate nodes whose neighbours see each other directly.
    bool shortcut = true;
};

enum class PlanStatus {
    Straight,         // direct segment is clear
    Detour,           // visibility-graph path found
    EndpointBlocked,  // start or goal lies inside an NFZ
    NoPath            // graph has no connection at any clearance
};

struct PlanResult {
    PlanStatus status = PlanStatus::NoPath;
    std::vector<Vec2> path;        // start ... goal (empty unless Straight/Detour)
    double clearanceUsed = 0.0;
};

const char* statusName(PlanStatus s);

// Shortest polyline from start to goal that never enters the interior of any
// NFZ polygon. Touching an NFZ boundary is allowed.
PlanResult PlanDetour(
    const Vec2& start,
    const Vec2& goal,
    const std::vector<Polygon>& nfz,
    const PlannerConfig& cfg);

} // namespace detour
} // namespace agro
