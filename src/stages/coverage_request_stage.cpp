#include "stages/coverage_request_stage.hpp"

#include <chrono>
#include <cmath>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "common/errors.hpp"
#include "common/geometry.hpp"

namespace agro {

namespace {

void RequireFinite(const LineString& line, const std::string& what) {
  for (const auto& p : line) {
    if (!geo::IsFinite(p)) {
      throw CoveragePlanningFailure("coverage planning failed: " + what + " has a non-finite coordinate");
    }
  }
}

} // namespace

CoverageRequestStage::CoverageRequestStage(std::shared_ptr<const coverage::ICoveragePlanner> planner)
    : planner_(std::move(planner)) {}

coverage::CoverageRequest CoverageRequestStage::MakeRequest(const MissionGeometry& g,
                                                            const AircraftProfile& ac) {
  coverage::CoverageRequest req;
  req.field = g.field;
  req.nfz = g.nfz;
  req.spray_width_m = ac.spray_width_m;
  req.turn_radius_m = ac.turn_radius_m;
  req.headland_factor = ac.headland_factor;
  req.route_order = ac.route_order;
  req.objective = ac.objective;
  req.use_continuous_curvature = ac.use_continuous_curvature;
  return req;
}

coverage::CoverageResult CoverageRequestStage::CallPlanner(const coverage::CoverageRequest& req,
                                                           double timeout_s) const {
  if (timeout_s <= 0.0) return planner_->Plan(req);

  // The worker owns copies of the planner handle and request, so a late result
  // can finish after this build has already failed.
  auto planner = planner_;
  std::packaged_task<coverage::CoverageResult()> task(
      [planner, req]() { return planner->Plan(req); });
  std::future<coverage::CoverageResult> fut = task.get_future();
  std::thread(std::move(task)).detach();

  const auto limit = std::chrono::duration<double>(timeout_s);
  if (fut.wait_for(limit) != std::future_status::ready) {
    std::ostringstream oss;
    oss << "coverage planner '" << planner_->Name() << "' timed out after " << timeout_s << " s";
    throw CoveragePlanningFailure(oss.str());
  }
  return fut.get();
}

void CoverageRequestStage::Run(PlanningContext& ctx) const {
  if (!planner_) {
    throw CoveragePlanningFailure("no coverage planner configured");
  }

  const coverage::CoverageRequest req = MakeRequest(ctx.geometry, ctx.request.aircraft);
  {
    std::ostringstream oss;
    oss << "coverage request -> " << planner_->Name() << ": width " << req.spray_width_m
        << " m, turn radius " << req.turn_radius_m << " m, headland x" << req.headland_factor
        << ", order " << ToString(req.route_order) << ", objective " << ToString(req.objective)
        << ", nfz " << req.nfz.size();
    LogLine(ctx, oss.str());
  }

  coverage::CoverageResult res;
  try {
    res = CallPlanner(req, ctx.request.planner_timeout_s);
  } catch (const MissionBuildError&) {
    throw;
  } catch (const std::exception& e) {
    throw CoveragePlanningFailure(std::string("coverage planner error: ") + e.what());
  }

  if (!res.feasible) {
    throw CoveragePlanningFailure("coverage planning failed: " + res.failure_reason);
  }
  if (res.swaths.empty()) {
    throw CoveragePlanningFailure("coverage planning failed: planner returned no swaths");
  }

  CoveragePath path;
  path.swaths.reserve(res.swaths.size());
  for (std::size_t i = 0; i < res.swaths.size(); ++i) {
    const LineString& s = res.swaths[i];
    const std::string what = "swath " + std::to_string(i);
    if (s.size() < 2) {
      throw CoveragePlanningFailure("coverage planning failed: " + what + " has fewer than 2 points");
    }
    RequireFinite(s, what);
    Swath sw;
    sw.index = static_cast<int>(i);
    sw.start = s.front();
    sw.end = s.back();
    sw.length_m = geo::PolylineLength(s);
    if (!std::isfinite(sw.length_m)) {
      throw CoveragePlanningFailure("coverage planning failed: " + what + " has a non-finite length");
    }
    path.swaths.push_back(sw);
  }

  if (!res.turns.empty()) {
    if (res.turns.size() + 1 != res.swaths.size()) {
      std::ostringstream oss;
      oss << "coverage planning failed: planner returned " << res.turns.size() << " turns for "
          << res.swaths.size() << " swaths";
      throw CoveragePlanningFailure(oss.str());
    }
    for (std::size_t i = 0; i < res.turns.size(); ++i) {
      const std::string what = "turn " + std::to_string(i);
      if (res.turns[i].size() < 2) {
        throw CoveragePlanningFailure("coverage planning failed: " + what + " has fewer than 2 points");
      }
      RequireFinite(res.turns[i], what);
    }
  }
  RequireFinite(res.cover_path, "cover path");

  path.turns = std::move(res.turns);
  path.cover_path = std::move(res.cover_path);
  path.angle_used_deg = res.angle_used_deg;
  ctx.coverage = std::move(path);

  double total = 0.0;
  for (const auto& s : ctx.coverage.swaths) total += s.length_m;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(1);
  oss << "coverage ok: " << ctx.coverage.swaths.size() << " swaths, " << total
      << " m, angle " << ctx.coverage.angle_used_deg << " deg";
  LogLine(ctx, oss.str());
}

} // namespace agro
