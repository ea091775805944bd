#include "tests/test_framework.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// =========================
// Stage-by-stage tests
// =========================
//
// Each stage reads its inputs from PlanningContext and writes its own fields.
// The checks focus on:
//     1) the right ctx fields are written
//     2) the output satisfies what the next stage expects
//     3) failures surface as the right MissionBuildError subclass

#include "common/errors.hpp"
#include "common/geometry.hpp"
#include "coverage/scanline_planner.hpp"
#include "coverage/turn_generator.hpp"
#include "stages/coordinate_transform_stage.hpp"
#include "stages/coverage_request_stage.hpp"
#include "stages/detour_planner.h"
#include "stages/metrics_stage.hpp"
#include "stages/preprocess_stage.hpp"
#include "stages/transit_stage.hpp"

namespace {

static constexpr double kPi = 3.14159265358979323846;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

agro::Polygon MakeRect(double x0, double y0, double x1, double y1) {
  agro::Polygon p;
  p.ring = {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
  return p;
}

// =========================
// Pretty printers
// =========================

void PrintBanner(const std::string& title) {
  std::cout << "\n";
  std::cout << "============================================================\n";
  std::cout << title << "\n";
  std::cout << "============================================================\n";
  std::cout << std::fixed << std::setprecision(3);
}

void DumpLine(const std::string& name, const agro::LineString& line, std::size_t max_v = 8) {
  std::cout << name << " { points=" << line.size() << ", length_m=" << agro::geo::PolylineLength(line) << " }\n";
  const std::size_t n = std::min<std::size_t>(line.size(), max_v);
  for (std::size_t i = 0; i < n; ++i) {
    std::cout << "  [" << i << "] x=" << line[i].x << ", y=" << line[i].y << "\n";
  }
  if (line.size() > max_v) std::cout << "  ... (" << (line.size() - max_v) << " more)\n";
}

void DumpCoverage(const agro::coverage::CoverageResult& r, std::size_t max_s = 6) {
  std::cout << "CoverageResult { feasible=" << r.feasible << ", swaths=" << r.swaths.size()
            << ", angle_deg=" << r.angle_used_deg << ", reason='" << r.failure_reason << "' }\n";
  const std::size_t n = std::min<std::size_t>(r.swaths.size(), max_s);
  for (std::size_t i = 0; i < n; ++i) {
    const auto& s = r.swaths[i];
    std::cout << "  swath[" << i << "] (" << s.front().x << ", " << s.front().y << ") -> ("
              << s.back().x << ", " << s.back().y << ")\n";
  }
}

bool NoLegEntersNfz(const agro::LineString& path, const std::vector<agro::Polygon>& nfz) {
  for (std::size_t i = 1; i < path.size(); ++i) {
    if (agro::geo::SegmentCrossesAny(path[i - 1], path[i], nfz)) return false;
  }
  return true;
}

// =========================
// Coordinate transform
// =========================

bool Test_CoordinateTransform_LocalPassThrough() {
  PrintBanner("CoordinateTransformStage: local frame");
  agro::PlanningContext ctx;
  ctx.request.frame = agro::CoordinateFrame::kLocalMeters;
  ctx.request.field = MakeRect(0, 0, 100, 50);
  ctx.request.runway_centerline = {{-10, -10}, {-10, 200}};

  agro::CoordinateTransformStage().Run(ctx);
  AGRO_EXPECT_TRUE(!ctx.origin.defined);
  AGRO_EXPECT_EQ(ctx.geometry.field.ring.size(), 4u);
  AGRO_EXPECT_NEAR(ctx.geometry.field.ring[2].x, 100.0, 1e-12);
  AGRO_EXPECT_EQ(ctx.geometry.runway_centerline.size(), 2u);
  return true;
}

bool Test_CoordinateTransform_Wgs84Projection() {
  PrintBanner("CoordinateTransformStage: wgs84 -> local");
  agro::PlanningContext ctx;
  ctx.request.frame = agro::CoordinateFrame::kWgs84;
  // ~ 0.01 deg x 0.01 deg around (10.0, 45.0)
  ctx.request.field = MakeRect(9.995, 44.995, 10.005, 45.005);
  ctx.request.runway_centerline = {{9.990, 44.990}, {9.990, 45.000}};

  agro::CoordinateTransformStage().Run(ctx);
  AGRO_EXPECT_TRUE(ctx.origin.defined);
  AGRO_EXPECT_NEAR(ctx.origin.lon0_deg, 10.0, 1e-12);
  AGRO_EXPECT_NEAR(ctx.origin.lat0_deg, 45.0, 1e-12);

  // Field is centred on the origin; 0.01 deg of latitude ~ 1113 m.
  const agro::geo::Box b = agro::geo::Bounds(ctx.geometry.field.ring);
  std::cout << "field bbox x[" << b.xmin << ", " << b.xmax << "] y[" << b.ymin << ", " << b.ymax << "]\n";
  AGRO_EXPECT_NEAR(b.xmin + b.xmax, 0.0, 1e-6);
  AGRO_EXPECT_NEAR(b.ymax - b.ymin, 6378137.0 * Deg2Rad(0.01), 1e-6);
  AGRO_EXPECT_NEAR(b.xmax - b.xmin, 6378137.0 * Deg2Rad(0.01) * std::cos(Deg2Rad(45.0)), 1e-6);

  const agro::Vec2 back = agro::CoordinateTransformStage::LocalToLonLat(ctx.geometry.runway_centerline[0], ctx.origin);
  AGRO_EXPECT_NEAR(back.x, 9.990, 1e-10);
  AGRO_EXPECT_NEAR(back.y, 44.990, 1e-10);
  return true;
}

bool Test_CoordinateTransform_RejectsOutOfRange() {
  agro::PlanningContext ctx;
  ctx.request.frame = agro::CoordinateFrame::kWgs84;
  ctx.request.field = MakeRect(10.0, 89.5, 10.1, 89.9);
  AGRO_EXPECT_THROW(agro::CoordinateTransformStage().Run(ctx), agro::InputValidationError);
  return true;
}

// =========================
// Preprocess
// =========================

bool Test_Preprocess_NormalizesRings() {
  PrintBanner("PreprocessStage: normalization");
  agro::PlanningContext ctx;
  ctx.request.aircraft.total_capacity_l = 100.0;
  // Clockwise, explicitly closed, with a duplicated vertex.
  ctx.geometry.field.ring = {{0, 0}, {0, 50}, {0, 50}, {100, 50}, {100, 0}, {0, 0}};
  ctx.geometry.runway_centerline = {{-10, 0}, {-10, 0}, {-10, 300}};
  ctx.geometry.nfz = {MakeRect(40, 10, 60, 20)};

  agro::PreprocessStage().Run(ctx);
  DumpLine("field", ctx.geometry.field.ring);
  AGRO_EXPECT_EQ(ctx.geometry.field.ring.size(), 4u);
  AGRO_EXPECT_TRUE(agro::geo::SignedArea(ctx.geometry.field.ring) > 0.0);
  AGRO_EXPECT_NEAR(agro::geo::Area(ctx.geometry.field), 5000.0, 1e-9);
  AGRO_EXPECT_EQ(ctx.geometry.runway_centerline.size(), 2u);
  AGRO_EXPECT_EQ(ctx.geometry.nfz.size(), 1u);
  AGRO_EXPECT_TRUE(!ctx.logs.empty());
  return true;
}

bool Test_Preprocess_RejectsDegenerateInput() {
  using agro::PreprocessStage;
  // bow-tie
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeRing({{0, 0}, {10, 10}, {10, 0}, {0, 10}}, "field"),
                    agro::InputValidationError);
  // collinear
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeRing({{0, 0}, {5, 0}, {10, 0}}, "field"),
                    agro::InputValidationError);
  // too few vertices after dropping duplicates
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeRing({{0, 0}, {0, 0}, {1, 1}}, "field"),
                    agro::InputValidationError);
  // non-finite
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeRing({{0, 0}, {NAN, 0}, {1, 1}}, "field"),
                    agro::InputValidationError);
  // runway
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeLine({{3, 3}}, "runway"), agro::InputValidationError);
  AGRO_EXPECT_THROW(PreprocessStage::NormalizeLine({{3, 3}, {3, 3}}, "runway"), agro::InputValidationError);

  agro::AircraftProfile ac;
  ac.total_capacity_l = 0.0;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);
  ac.total_capacity_l = 50.0;
  ac.spray_width_m = -1.0;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);
  ac.spray_width_m = 20.0;
  ac.mix_rate_l_per_ha = -0.5;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);
  return true;
}

bool Test_Preprocess_ProfileLimits() {
  using agro::PreprocessStage;
  agro::AircraftProfile ac;
  ac.total_capacity_l = 50.0;
  PreprocessStage::ValidateProfile(ac);

  ac.turn_radius_m = 1e12;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);
  ac.turn_radius_m = 10000.0;
  PreprocessStage::ValidateProfile(ac);

  ac.spray_width_m = 0.01;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);
  ac.spray_width_m = 5000.0;
  AGRO_EXPECT_THROW(PreprocessStage::ValidateProfile(ac), agro::InputValidationError);

  ac.spray_width_m = 20.0;
  ac.turn_radius_m = 1e12;
  try {
    PreprocessStage::ValidateProfile(ac);
  } catch (const agro::InputValidationError& e) {
    std::cout << "error: " << e.what() << "\n";
    AGRO_EXPECT_TRUE(std::string(e.what()).find("turn_radius_m") != std::string::npos);
    return true;
  }
  return false;
}

bool Test_Preprocess_BadNfzNamed() {
  agro::PlanningContext ctx;
  ctx.request.aircraft.total_capacity_l = 100.0;
  ctx.geometry.field = MakeRect(0, 0, 100, 100);
  ctx.geometry.runway_centerline = {{-10, 0}, {-10, 300}};
  ctx.geometry.nfz = {MakeRect(10, 10, 20, 20), agro::Polygon{{{0, 0}, {1, 1}}}};
  try {
    agro::PreprocessStage().Run(ctx);
  } catch (const agro::InputValidationError& e) {
    std::cout << "error: " << e.what() << "\n";
    AGRO_EXPECT_TRUE(std::string(e.what()).find("nfz[1]") != std::string::npos);
    return true;
  }
  return false;
}

// =========================
// Scanline planner
// =========================

agro::coverage::CoverageRequest MakeCoverageRequest(const agro::Polygon& field) {
  agro::coverage::CoverageRequest req;
  req.field = field;
  req.spray_width_m = 20.0;
  req.turn_radius_m = 40.0;
  req.headland_factor = 0.0;
  req.route_order = agro::RouteOrder::kBoustro;
  req.objective = agro::CoverageObjective::kNSwath;
  return req;
}

bool Test_ScanlinePlanner_RectangleFewestSwaths() {
  PrintBanner("ScanlinePlanner: 400 x 300 rectangle, n_swath");
  const agro::coverage::ScanlinePlanner planner;
  const auto res = planner.Plan(MakeCoverageRequest(MakeRect(0, 0, 400, 300)));
  DumpCoverage(res);

  AGRO_EXPECT_TRUE(res.feasible);
  // Swaths along the long side: 300 / 20 lines.
  AGRO_EXPECT_NEAR(res.angle_used_deg, 0.0, 1e-9);
  AGRO_EXPECT_EQ(res.swaths.size(), 15u);
  for (std::size_t i = 0; i < res.swaths.size(); ++i) {
    const auto& s = res.swaths[i];
    AGRO_EXPECT_NEAR(agro::geo::PolylineLength(s), 400.0, 1e-6);
    AGRO_EXPECT_NEAR(s.front().y, 10.0 + 20.0 * static_cast<double>(i), 1e-6);
    // flight direction alternates
    if (i % 2 == 0) AGRO_EXPECT_TRUE(s.front().x < s.back().x);
    else AGRO_EXPECT_TRUE(s.front().x > s.back().x);
  }
  // 14 headland turns, each outside the swath ends
  AGRO_EXPECT_EQ(res.turns.size(), 14u);
  double expected_len = 0.0;
  for (std::size_t i = 0; i < res.turns.size(); ++i) {
    const auto& t = res.turns[i];
    AGRO_EXPECT_NEAR(agro::geo::Dist(t.front(), res.swaths[i].back()), 0.0, 1e-9);
    AGRO_EXPECT_NEAR(agro::geo::Dist(t.back(), res.swaths[i + 1].front()), 0.0, 1e-9);
    const double end_x = res.swaths[i].back().x;
    for (const auto& p : t) {
      AGRO_EXPECT_TRUE(end_x > 200.0 ? p.x >= end_x - 1e-6 : p.x <= end_x + 1e-6);
    }
    expected_len += agro::geo::PolylineLength(t);
  }
  for (const auto& sw : res.swaths) expected_len += agro::geo::PolylineLength(sw);
  AGRO_EXPECT_NEAR(agro::geo::PolylineLength(res.cover_path), expected_len, 1e-6);
  AGRO_EXPECT_NEAR(agro::geo::Dist(res.cover_path.front(), res.swaths.front().front()), 0.0, 1e-9);
  AGRO_EXPECT_NEAR(agro::geo::Dist(res.cover_path.back(), res.swaths.back().back()), 0.0, 1e-9);
  return true;
}

bool Test_ScanlinePlanner_HeadlandTrims() {
  agro::coverage::CoverageRequest req = MakeCoverageRequest(MakeRect(0, 0, 400, 300));
  req.headland_factor = 3.0;  // 60 m on every side
  const auto res = agro::coverage::ScanlinePlanner().Plan(req);
  DumpCoverage(res, 3);
  AGRO_EXPECT_TRUE(res.feasible);
  for (const auto& s : res.swaths) {
    for (const auto& p : s) {
      AGRO_EXPECT_TRUE(p.x >= 60.0 - 1e-6 && p.x <= 340.0 + 1e-6);
      AGRO_EXPECT_TRUE(p.y >= 60.0 - 1e-6 && p.y <= 240.0 + 1e-6);
    }
  }
  return true;
}

bool Test_ScanlinePlanner_SwathsAvoidNfz() {
  PrintBanner("ScanlinePlanner: NFZ strip through the field");
  agro::coverage::CoverageRequest req = MakeCoverageRequest(MakeRect(0, 0, 400, 300));
  req.nfz = {MakeRect(150, -10, 250, 310)};
  const auto res = agro::coverage::ScanlinePlanner().Plan(req);
  DumpCoverage(res);

  AGRO_EXPECT_TRUE(res.feasible);
  AGRO_EXPECT_TRUE(!res.swaths.empty());
  for (const auto& s : res.swaths) {
    AGRO_EXPECT_TRUE(!agro::geo::SegmentCrossesAny(s.front(), s.back(), req.nfz));
    // a whole spray width stays clear, not only the centre line
    const agro::Vec2 d = agro::geo::Normalize(s.back() - s.front());
    const agro::Vec2 n{-d.y, d.x};
    for (double off : {-9.9, 9.9}) {
      AGRO_EXPECT_TRUE(!agro::geo::SegmentCrossesAny(s.front() + n * off, s.back() + n * off, req.nfz));
    }
  }
  return true;
}

bool Test_ScanlinePlanner_Infeasible() {
  // Headland band wider than the field at every angle.
  agro::coverage::CoverageRequest small = MakeCoverageRequest(MakeRect(0, 0, 50, 50));
  small.headland_factor = 3.0;
  const auto r1 = agro::coverage::ScanlinePlanner().Plan(small);
  DumpCoverage(r1);
  AGRO_EXPECT_TRUE(!r1.feasible);
  AGRO_EXPECT_TRUE(r1.swaths.empty());
  AGRO_EXPECT_TRUE(r1.failure_reason.find("no swath fits") != std::string::npos);

  // NFZ over the whole field.
  agro::coverage::CoverageRequest covered = MakeCoverageRequest(MakeRect(0, 0, 400, 300));
  covered.nfz = {MakeRect(-10, -10, 410, 310)};
  const auto r2 = agro::coverage::ScanlinePlanner().Plan(covered);
  DumpCoverage(r2);
  AGRO_EXPECT_TRUE(!r2.feasible);
  AGRO_EXPECT_TRUE(r2.failure_reason.find("no-fly") != std::string::npos);
  return true;
}

bool Test_ScanlinePlanner_RouteOrders() {
  using agro::coverage::ScanlinePlanner;
  using agro::RouteOrder;
  AGRO_EXPECT_TRUE((ScanlinePlanner::OrderIndices(5, RouteOrder::kBoustro, 2, 6) == std::vector<int>{0, 1, 2, 3, 4}));
  AGRO_EXPECT_TRUE((ScanlinePlanner::OrderIndices(5, RouteOrder::kSnake, 2, 6) == std::vector<int>{0, 2, 4, 3, 1}));
  AGRO_EXPECT_TRUE((ScanlinePlanner::OrderIndices(6, RouteOrder::kStraightLoops, 3, 6) ==
                    std::vector<int>{0, 3, 4, 1, 2, 5}));
  AGRO_EXPECT_TRUE((ScanlinePlanner::OrderIndices(8, RouteOrder::kSpiral, 2, 6) ==
                    std::vector<int>{0, 5, 1, 4, 2, 3, 6, 7}));
  AGRO_EXPECT_TRUE(ScanlinePlanner::OrderIndices(0, RouteOrder::kSnake, 2, 6).empty());

  // Every order visits every line exactly once.
  for (RouteOrder o : {RouteOrder::kBoustro, RouteOrder::kSnake, RouteOrder::kStraightLoops, RouteOrder::kSpiral}) {
    std::vector<int> idx = ScanlinePlanner::OrderIndices(13, o, 4, 6);
    std::sort(idx.begin(), idx.end());
    for (int i = 0; i < 13; ++i) AGRO_EXPECT_EQ(idx[static_cast<std::size_t>(i)], i);
  }
  return true;
}

bool Test_ScanlinePlanner_ExtremeRadiusAndWidth() {
  // Radius far beyond any field: the straight_loops hop is capped at the swath count.
  agro::coverage::CoverageRequest req = MakeCoverageRequest(MakeRect(0, 0, 400, 300));
  req.route_order = agro::RouteOrder::kStraightLoops;
  req.turn_radius_m = 1e12;
  const auto res = agro::coverage::ScanlinePlanner().Plan(req);
  DumpCoverage(res, 3);
  AGRO_EXPECT_TRUE(res.feasible);
  AGRO_EXPECT_EQ(res.swaths.size(), 15u);
  for (std::size_t i = 0; i < res.swaths.size(); ++i) {
    AGRO_EXPECT_NEAR(res.swaths[i].front().y, 10.0 + 20.0 * static_cast<double>(i), 1e-6);
  }
  for (const auto& p : res.cover_path) AGRO_EXPECT_TRUE(agro::geo::IsFinite(p));

  // Too many scan lines for the field is reported, not attempted.
  agro::coverage::CoverageRequest thin = MakeCoverageRequest(MakeRect(0, 0, 400, 300));
  thin.spray_width_m = 1e-4;
  const auto r2 = agro::coverage::ScanlinePlanner().Plan(thin);
  AGRO_EXPECT_TRUE(!r2.feasible);
  AGRO_EXPECT_TRUE(r2.failure_reason.find("scan lines") != std::string::npos);
  return true;
}

// =========================
// Headland turns
// =========================

bool Test_Turn_DubinsUTurn() {
  PrintBanner("MakeTurn: Dubins U-turn, gap 80 m, radius 20 m");
  agro::coverage::TurnOptions opt;
  opt.radius_m = 20.0;
  opt.continuous_curvature = false;
  AGRO_EXPECT_NEAR(agro::coverage::CornerTangent(kPi / 2.0, opt), 20.0, 1e-3);

  const agro::LineString t = agro::coverage::MakeTurn({100, 0}, {1, 0}, {100, 80}, {-1, 0}, opt);
  DumpLine("turn", t);
  AGRO_EXPECT_NEAR(t.front().x, 100.0, 1e-12);
  AGRO_EXPECT_NEAR(t.front().y, 0.0, 1e-12);
  AGRO_EXPECT_NEAR(t.back().x, 100.0, 1e-12);
  AGRO_EXPECT_NEAR(t.back().y, 80.0, 1e-12);
  // two quarter circles + 40 m straight
  AGRO_EXPECT_NEAR(agro::geo::PolylineLength(t), kPi * 20.0 + 40.0, 0.1);
  for (const auto& p : t) {
    AGRO_EXPECT_TRUE(p.x >= 100.0 - 1e-6 && p.x <= 120.0 + 1e-3);
  }
  // quarter circles stay on radius 20 around (100, 20) and (100, 60)
  for (const auto& p : t) {
    if (p.y < 20.0) AGRO_EXPECT_NEAR(agro::geo::Dist(p, {100, 20}), 20.0, 1e-2);
    if (p.y > 60.0) AGRO_EXPECT_NEAR(agro::geo::Dist(p, {100, 60}), 20.0, 1e-2);
  }
  return true;
}

bool Test_Turn_ContinuousCurvatureIsLonger() {
  agro::coverage::TurnOptions dubins;
  dubins.radius_m = 20.0;
  dubins.continuous_curvature = false;
  agro::coverage::TurnOptions cc = dubins;
  cc.continuous_curvature = true;

  AGRO_EXPECT_TRUE(agro::coverage::CornerTangent(kPi / 2.0, cc) > agro::coverage::CornerTangent(kPi / 2.0, dubins));

  const agro::LineString a = agro::coverage::MakeTurn({100, 0}, {1, 0}, {100, 80}, {-1, 0}, dubins);
  const agro::LineString b = agro::coverage::MakeTurn({100, 0}, {1, 0}, {100, 80}, {-1, 0}, cc);
  std::cout << "dubins=" << agro::geo::PolylineLength(a) << " cc=" << agro::geo::PolylineLength(b) << "\n";
  AGRO_EXPECT_TRUE(agro::geo::PolylineLength(b) > agro::geo::PolylineLength(a) + 1.0);
  AGRO_EXPECT_NEAR(agro::geo::Dist(b.back(), {100, 80}), 0.0, 1e-12);

  // The clothoid entry leaves the swath line tangentially.
  AGRO_EXPECT_TRUE(b.size() >= 3);
  const agro::Vec2 d0 = agro::geo::Normalize(b[1] - b[0]);
  AGRO_EXPECT_TRUE(d0.x > 0.99);
  return true;
}

bool Test_Turn_NarrowGapBulb() {
  PrintBanner("MakeTurn: bulb for a 20 m gap, radius 40 m");
  for (bool use_cc : {false, true}) {
    agro::coverage::TurnOptions opt;
    opt.radius_m = 40.0;
    opt.continuous_curvature = use_cc;
    const agro::LineString t = agro::coverage::MakeTurn({0, 0}, {1, 0}, {0, 20}, {-1, 0}, opt);
    DumpLine(use_cc ? "cc bulb" : "dubins bulb", t, 4);

    AGRO_EXPECT_NEAR(agro::geo::Dist(t.front(), {0, 0}), 0.0, 1e-12);
    AGRO_EXPECT_NEAR(agro::geo::Dist(t.back(), {0, 20}), 0.0, 1e-12);
    for (const auto& p : t) AGRO_EXPECT_TRUE(p.x >= -1e-6);
    // 360 deg of heading change at radius >= 40 m
    AGRO_EXPECT_TRUE(agro::geo::PolylineLength(t) >= 2.0 * kPi * 40.0 - 1.0);

    const agro::Vec2 first = agro::geo::Normalize(t[1] - t[0]);
    const agro::Vec2 last = agro::geo::Normalize(t[t.size() - 1] - t[t.size() - 2]);
    AGRO_EXPECT_TRUE(first.x > 0.9);
    AGRO_EXPECT_TRUE(last.x < -0.9);
  }

  // Headings that are not opposite, or no radius: straight chord.
  agro::coverage::TurnOptions opt;
  opt.radius_m = 40.0;
  AGRO_EXPECT_EQ(agro::coverage::MakeTurn({0, 0}, {1, 0}, {50, 50}, {0, 1}, opt).size(), 2u);
  opt.radius_m = 0.0;
  AGRO_EXPECT_EQ(agro::coverage::MakeTurn({0, 0}, {1, 0}, {0, 20}, {-1, 0}, opt).size(), 2u);
  return true;
}

// =========================
// Coverage request adapter
// =========================

class StubPlanner final : public agro::coverage::ICoveragePlanner {
public:
  enum class Mode { kEcho, kEmpty, kInfeasible, kThrow, kSlow, kWithTurn, kNanPoint, kNanTurn, kTurnCount };
  explicit StubPlanner(Mode mode) : mode_(mode) {}

  const char* Name() const override { return "stub"; }
  agro::coverage::CoverageResult Plan(const agro::coverage::CoverageRequest& req) const override {
    agro::coverage::CoverageResult r;
    switch (mode_) {
      case Mode::kThrow:
        throw std::runtime_error("solver crashed");
      case Mode::kInfeasible:
        r.failure_reason = "field too narrow";
        return r;
      case Mode::kEmpty:
        r.feasible = true;
        return r;
      case Mode::kSlow:
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        break;
      default:
        break;
    }
    r.feasible = true;
    r.swaths = {{{0, 10}, {req.spray_width_m * 5.0, 10}}, {{100, 30}, {50, 30}, {0, 30}}};
    r.cover_path = {{0, 10}, {100, 10}, {100, 30}, {0, 30}};
    r.angle_used_deg = 0.0;
    switch (mode_) {
      case Mode::kWithTurn:
        r.turns = {{{100, 10}, {110, 10}, {110, 30}, {100, 30}}};
        break;
      case Mode::kNanPoint:
        r.swaths[1].back() = {NAN, 30};
        break;
      case Mode::kNanTurn:
        r.turns = {{{100, 10}, {INFINITY, 20}, {100, 30}}};
        break;
      case Mode::kTurnCount:
        r.turns = {{{100, 10}, {100, 30}}, {{0, 30}, {0, 50}}};
        break;
      default:
        break;
    }
    return r;
  }

private:
  Mode mode_;
};

agro::PlanningContext MakeCoverageContext() {
  agro::PlanningContext ctx;
  ctx.geometry.field = MakeRect(0, 0, 100, 40);
  ctx.geometry.runway_centerline = {{-50, 0}, {-50, 100}};
  ctx.request.aircraft.total_capacity_l = 100.0;
  return ctx;
}

bool Test_CoverageRequest_IndexesSwaths() {
  PrintBanner("CoverageRequestStage: result -> indexed swaths");
  agro::PlanningContext ctx = MakeCoverageContext();
  agro::CoverageRequestStage stage(std::make_shared<StubPlanner>(StubPlanner::Mode::kEcho));
  stage.Run(ctx);

  AGRO_EXPECT_EQ(ctx.coverage.swaths.size(), 2u);
  AGRO_EXPECT_EQ(ctx.coverage.swaths[1].index, 1);
  AGRO_EXPECT_NEAR(ctx.coverage.swaths[0].length_m, 100.0, 1e-9);
  AGRO_EXPECT_NEAR(ctx.coverage.swaths[1].length_m, 100.0, 1e-9);
  AGRO_EXPECT_NEAR(ctx.coverage.swaths[1].start.x, 100.0, 1e-12);
  AGRO_EXPECT_NEAR(ctx.coverage.swaths[1].end.x, 0.0, 1e-12);
  AGRO_EXPECT_EQ(ctx.coverage.cover_path.size(), 4u);
  AGRO_EXPECT_TRUE(ctx.coverage.turns.empty());
  for (const auto& l : ctx.logs) std::cout << "  " << l << "\n";

  agro::PlanningContext with_turn = MakeCoverageContext();
  agro::CoverageRequestStage(std::make_shared<StubPlanner>(StubPlanner::Mode::kWithTurn)).Run(with_turn);
  AGRO_EXPECT_EQ(with_turn.coverage.turns.size(), 1u);
  AGRO_EXPECT_EQ(with_turn.coverage.turns[0].size(), 4u);
  return true;
}

bool Test_CoverageRequest_RejectsNonFiniteOutput() {
  for (auto mode : {StubPlanner::Mode::kNanPoint, StubPlanner::Mode::kNanTurn, StubPlanner::Mode::kTurnCount}) {
    agro::PlanningContext ctx = MakeCoverageContext();
    agro::CoverageRequestStage stage(std::make_shared<StubPlanner>(mode));
    try {
      stage.Run(ctx);
      return false;
    } catch (const agro::CoveragePlanningFailure& e) {
      std::cout << "error: " << e.what() << "\n";
    }
    AGRO_EXPECT_TRUE(ctx.coverage.swaths.empty());
  }

  agro::PlanningContext ctx = MakeCoverageContext();
  try {
    agro::CoverageRequestStage(std::make_shared<StubPlanner>(StubPlanner::Mode::kNanPoint)).Run(ctx);
  } catch (const agro::CoveragePlanningFailure& e) {
    AGRO_EXPECT_TRUE(std::string(e.what()).find("swath 1 has a non-finite coordinate") != std::string::npos);
    return true;
  }
  return false;
}

bool Test_CoverageRequest_FailuresBecomePlanningFailure() {
  for (auto mode : {StubPlanner::Mode::kEmpty, StubPlanner::Mode::kInfeasible, StubPlanner::Mode::kThrow}) {
    agro::PlanningContext ctx = MakeCoverageContext();
    agro::CoverageRequestStage stage(std::make_shared<StubPlanner>(mode));
    AGRO_EXPECT_THROW(stage.Run(ctx), agro::CoveragePlanningFailure);
    AGRO_EXPECT_TRUE(ctx.coverage.swaths.empty());
  }

  agro::PlanningContext ctx = MakeCoverageContext();
  try {
    agro::CoverageRequestStage(std::make_shared<StubPlanner>(StubPlanner::Mode::kInfeasible)).Run(ctx);
  } catch (const agro::CoveragePlanningFailure& e) {
    AGRO_EXPECT_TRUE(std::string(e.what()).find("field too narrow") != std::string::npos);
    return true;
  }
  return false;
}

bool Test_CoverageRequest_Timeout() {
  agro::PlanningContext ctx = MakeCoverageContext();
  ctx.request.planner_timeout_s = 0.02;
  agro::CoverageRequestStage stage(std::make_shared<StubPlanner>(StubPlanner::Mode::kSlow));
  AGRO_EXPECT_THROW(stage.Run(ctx), agro::CoveragePlanningFailure);

  // Generous limit: the same planner finishes in time.
  agro::PlanningContext ok = MakeCoverageContext();
  ok.request.planner_timeout_s = 30.0;
  stage.Run(ok);
  AGRO_EXPECT_EQ(ok.coverage.swaths.size(), 2u);
  return true;
}

// =========================
// Detour planner / transit
// =========================

bool Test_DetourPlanner_AroundBox() {
  PrintBanner("PlanDetour: around a box");
  const std::vector<agro::Polygon> nfz = {MakeRect(100, -250, 300, -100)};
  agro::detour::PlannerConfig cfg;

  const auto straight = agro::detour::PlanDetour({0, -400}, {0, 0}, nfz, cfg);
  AGRO_EXPECT_TRUE(straight.status == agro::detour::PlanStatus::Straight);
  AGRO_EXPECT_EQ(straight.path.size(), 2u);

  const auto r = agro::detour::PlanDetour({200, -400}, {200, 0}, nfz, cfg);
  std::cout << "status=" << agro::detour::statusName(r.status) << " clearance=" << r.clearanceUsed << "\n";
  DumpLine("detour", r.path);
  AGRO_EXPECT_TRUE(r.status == agro::detour::PlanStatus::Detour);
  AGRO_EXPECT_TRUE(r.path.size() >= 3);
  AGRO_EXPECT_NEAR(r.path.front().x, 200.0, 1e-12);
  AGRO_EXPECT_NEAR(r.path.back().y, 0.0, 1e-12);
  AGRO_EXPECT_TRUE(NoLegEntersNfz(r.path, nfz));
  AGRO_EXPECT_TRUE(agro::geo::PolylineLength(r.path) > 400.0);

  const auto blocked = agro::detour::PlanDetour({200, -200}, {200, 0}, nfz, cfg);
  AGRO_EXPECT_TRUE(blocked.status == agro::detour::PlanStatus::EndpointBlocked);
  AGRO_EXPECT_TRUE(blocked.path.empty());
  return true;
}

agro::PlanningContext MakeTransitContext() {
  agro::PlanningContext ctx;
  ctx.geometry.field = MakeRect(0, 0, 400, 300);
  ctx.geometry.runway_centerline = {{0, -400}, {400, -400}};
  ctx.geometry.nfz = {MakeRect(100, -250, 300, -100)};

  agro::Swath s0;
  s0.index = 0;
  s0.start = {200, 10};
  s0.end = {380, 10};
  s0.length_m = 180;
  agro::Swath s1;
  s1.index = 1;
  s1.start = {380, 30};
  s1.end = {20, 30};
  s1.length_m = 360;
  ctx.coverage.swaths = {s0, s1};

  agro::Trip t;
  t.start_idx = 0;
  t.end_idx = 1;
  ctx.trips = {t};
  return ctx;
}

bool Test_Transit_StraightAndDetour() {
  PrintBanner("TransitStage: nearest anchors");
  agro::PlanningContext ctx = MakeTransitContext();
  agro::TransitStage(std::make_shared<agro::VisibilityGraphAvoider>()).Run(ctx);

  const agro::Trip& t = ctx.trips[0];
  DumpLine("to_field", t.to_field);
  DumpLine("back_home", t.back_home);

  // to_field: (200,-400) -> (200,10) is blocked by the NFZ
  AGRO_EXPECT_NEAR(t.to_field.front().x, 200.0, 1e-9);
  AGRO_EXPECT_NEAR(t.to_field.front().y, -400.0, 1e-9);
  AGRO_EXPECT_NEAR(t.to_field.back().x, 200.0, 1e-9);
  AGRO_EXPECT_NEAR(t.to_field.back().y, 10.0, 1e-9);
  AGRO_EXPECT_TRUE(t.to_field.size() >= 3);
  AGRO_EXPECT_TRUE(NoLegEntersNfz(t.to_field, ctx.geometry.nfz));

  // back_home: (20,30) -> (20,-400) passes west of the NFZ
  AGRO_EXPECT_EQ(t.back_home.size(), 2u);
  AGRO_EXPECT_NEAR(t.back_home.back().x, 20.0, 1e-9);
  AGRO_EXPECT_NEAR(t.back_home.back().y, -400.0, 1e-9);
  return true;
}

bool Test_Transit_Unreachable() {
  {
    agro::PlanningContext ctx = MakeTransitContext();
    ctx.request.transit.avoid_nfz = false;
    AGRO_EXPECT_THROW(agro::TransitStage(std::make_shared<agro::VisibilityGraphAvoider>()).Run(ctx),
                      agro::TransitUnreachable);
  }
  {
    agro::PlanningContext ctx = MakeTransitContext();
    AGRO_EXPECT_THROW(agro::TransitStage(nullptr).Run(ctx), agro::TransitUnreachable);
  }
  {
    // Runway inside a no-fly zone.
    agro::PlanningContext ctx = MakeTransitContext();
    ctx.geometry.nfz.push_back(MakeRect(-50, -450, 450, -350));
    AGRO_EXPECT_THROW(agro::TransitStage(std::make_shared<agro::VisibilityGraphAvoider>()).Run(ctx),
                      agro::TransitUnreachable);
  }
  return true;
}

bool Test_Transit_TakeoffLandingAnchors() {
  const agro::LineString runway = {{0, 0}, {1000, 0}};
  agro::TransitOptions opt;
  opt.anchor = agro::RunwayAnchorMode::kTakeoffLanding;

  const agro::RunwayAnchors a = agro::TransitStage::TakeoffLandingAnchors(runway, opt);
  const double dep = 150.0 + 20.0 / std::tan(Deg2Rad(12.0));
  const double arr = std::max(30.0 / std::tan(Deg2Rad(4.0)), 400.0);
  std::cout << "departure x=" << a.departure.x << " (expected " << dep << "), arrival x=" << a.arrival.x
            << " (expected " << arr << ")\n";
  AGRO_EXPECT_NEAR(a.departure.x, dep, 1e-9);
  AGRO_EXPECT_NEAR(a.departure.y, 0.0, 1e-12);
  AGRO_EXPECT_NEAR(a.arrival.x, arr, 1e-9);

  // Short approach: min FAF distance wins.
  opt.landing.glide_angle_deg = 30.0;
  const agro::RunwayAnchors b = agro::TransitStage::TakeoffLandingAnchors(runway, opt);
  AGRO_EXPECT_NEAR(b.arrival.x, 400.0, 1e-9);

  agro::PlanningContext ctx = MakeTransitContext();
  ctx.geometry.nfz.clear();
  ctx.request.transit.anchor = agro::RunwayAnchorMode::kTakeoffLanding;
  agro::TransitStage(std::make_shared<agro::VisibilityGraphAvoider>()).Run(ctx);
  AGRO_EXPECT_NEAR(ctx.trips[0].to_field.front().x, 0.0 + dep, 1e-9);
  AGRO_EXPECT_NEAR(ctx.trips[0].back_home.back().x, 0.0 + arr, 1e-9);
  return true;
}

// =========================
// Metrics
// =========================

bool Test_Metrics_TripAndMissionTotals() {
  PrintBanner("MetricsStage: totals");
  agro::PlanningContext ctx = MakeTransitContext();
  ctx.geometry.nfz.clear();
  ctx.request.aircraft.spray_width_m = 20.0;
  ctx.request.aircraft.fuel_burn_l_per_km = 0.5;
  ctx.request.metrics.transit_speed_ms = 20.0;
  ctx.request.metrics.spray_speed_ms = 10.0;
  ctx.trips[0].mix_used_l = 10.8;
  ctx.trips[0].to_field = {{200, -400}, {200, 10}};   // 410 m
  ctx.trips[0].back_home = {{20, 30}, {20, -400}};    // 430 m

  agro::MetricsStage().Run(ctx);
  const agro::Trip& t = ctx.trips[0];
  const agro::MissionMetrics& m = ctx.metrics;
  std::cout << "trip: transit=" << t.transit_length_m << " spray=" << t.spray_length_m
            << " fuel=" << t.fuel_used_l << " time=" << t.time_min << "\n";

  // spray = 180 + connector 20 + 360
  AGRO_EXPECT_NEAR(t.transit_length_m, 840.0, 1e-9);
  AGRO_EXPECT_NEAR(t.spray_length_m, 560.0, 1e-9);
  AGRO_EXPECT_NEAR(t.length_m, 1400.0, 1e-9);
  AGRO_EXPECT_NEAR(t.fuel_used_l, 0.7, 1e-12);
  AGRO_EXPECT_NEAR(t.time_min, 840.0 / 20.0 / 60.0 + 560.0 / 10.0 / 60.0, 1e-12);

  AGRO_EXPECT_NEAR(m.length_total_m, 1400.0, 1e-9);
  AGRO_EXPECT_NEAR(m.time_total_min, m.time_transit_min + m.time_spray_min, 1e-12);
  AGRO_EXPECT_NEAR(m.fert_l, 10.8, 1e-12);
  AGRO_EXPECT_NEAR(m.field_area_ha, 12.0, 1e-9);
  AGRO_EXPECT_NEAR(m.sprayed_area_ha, 540.0 * 20.0 / 10000.0, 1e-12);
  AGRO_EXPECT_EQ(m.trip_count, 1);
  return true;
}

bool Test_Metrics_TurnsCountAsSpray() {
  agro::PlanningContext ctx = MakeTransitContext();
  ctx.geometry.nfz.clear();
  ctx.request.metrics.spray_speed_ms = 10.0;
  ctx.trips[0].to_field = {{200, -400}, {200, 10}};
  ctx.trips[0].back_home = {{20, 30}, {20, -400}};
  // 20 m out, 20 m across, 20 m back
  ctx.coverage.turns = {{{380, 10}, {400, 10}, {400, 30}, {380, 30}}};

  AGRO_EXPECT_NEAR(agro::MetricsStage::ConnectorLength(ctx.coverage, 0), 60.0, 1e-9);
  agro::MetricsStage().Run(ctx);
  const agro::Trip& t = ctx.trips[0];
  AGRO_EXPECT_NEAR(t.spray_length_m, 180.0 + 60.0 + 360.0, 1e-9);
  AGRO_EXPECT_NEAR(t.time_min, 840.0 / 20.0 / 60.0 + 600.0 / 10.0 / 60.0, 1e-12);
  // sprayed area still counts swaths only
  AGRO_EXPECT_NEAR(ctx.metrics.sprayed_area_ha, 540.0 * 20.0 / 10000.0, 1e-12);
  return true;
}

bool Test_Metrics_FuelMarginWarning() {
  agro::PlanningContext ctx = MakeTransitContext();
  ctx.trips[0].to_field = {{200, -400}, {200, 10}};
  ctx.trips[0].back_home = {{20, 30}, {20, -400}};
  ctx.request.aircraft.fuel_burn_l_per_km = 1.0;  // 1.4 l for the trip
  ctx.request.aircraft.fuel_reserve_l = 0.5;

  ctx.request.aircraft.fuel_capacity_l = 10.0;
  agro::MetricsStage().Run(ctx);
  for (const auto& l : ctx.logs) AGRO_EXPECT_TRUE(l.find("warning") == std::string::npos);

  ctx.logs.clear();
  ctx.request.aircraft.fuel_capacity_l = 1.5;
  agro::MetricsStage().Run(ctx);
  bool warned = false;
  for (const auto& l : ctx.logs) warned = warned || l.find("warning: trip 0") != std::string::npos;
  AGRO_EXPECT_TRUE(warned);
  AGRO_EXPECT_EQ(ctx.trips.size(), 1u);
  return true;
}

} // namespace

int main() {
  using agro::test::TestCase;

  std::vector<TestCase> cases = {
      {"CoordinateTransformStage: local pass-through", Test_CoordinateTransform_LocalPassThrough},
      {"CoordinateTransformStage: wgs84 projection", Test_CoordinateTransform_Wgs84Projection},
      {"CoordinateTransformStage: out-of-range latitude", Test_CoordinateTransform_RejectsOutOfRange},
      {"PreprocessStage: ring normalization", Test_Preprocess_NormalizesRings},
      {"PreprocessStage: degenerate input rejected", Test_Preprocess_RejectsDegenerateInput},
      {"PreprocessStage: bad NFZ reported by index", Test_Preprocess_BadNfzNamed},
      {"PreprocessStage: spray width / turn radius limits", Test_Preprocess_ProfileLimits},
      {"ScanlinePlanner: rectangle, fewest swaths", Test_ScanlinePlanner_RectangleFewestSwaths},
      {"ScanlinePlanner: headland trimming", Test_ScanlinePlanner_HeadlandTrims},
      {"ScanlinePlanner: swaths avoid NFZ", Test_ScanlinePlanner_SwathsAvoidNfz},
      {"ScanlinePlanner: infeasible fields", Test_ScanlinePlanner_Infeasible},
      {"ScanlinePlanner: route orders", Test_ScanlinePlanner_RouteOrders},
      {"ScanlinePlanner: extreme radius and width", Test_ScanlinePlanner_ExtremeRadiusAndWidth},
      {"MakeTurn: Dubins U-turn", Test_Turn_DubinsUTurn},
      {"MakeTurn: continuous curvature vs Dubins", Test_Turn_ContinuousCurvatureIsLonger},
      {"MakeTurn: bulb for narrow gaps", Test_Turn_NarrowGapBulb},
      {"CoverageRequestStage: indexed swaths", Test_CoverageRequest_IndexesSwaths},
      {"CoverageRequestStage: planner failures", Test_CoverageRequest_FailuresBecomePlanningFailure},
      {"CoverageRequestStage: non-finite planner output", Test_CoverageRequest_RejectsNonFiniteOutput},
      {"CoverageRequestStage: timeout", Test_CoverageRequest_Timeout},
      {"PlanDetour: around a box", Test_DetourPlanner_AroundBox},
      {"TransitStage: straight + detour legs", Test_Transit_StraightAndDetour},
      {"TransitStage: unreachable cases", Test_Transit_Unreachable},
      {"TransitStage: take-off / landing anchors", Test_Transit_TakeoffLandingAnchors},
      {"MetricsStage: trip + mission totals", Test_Metrics_TripAndMissionTotals},
      {"MetricsStage: turns count as spray length", Test_Metrics_TurnsCountAsSpray},
      {"MetricsStage: fuel margin warning", Test_Metrics_FuelMarginWarning},
  };

  return agro::test::RunAll(cases);
}
