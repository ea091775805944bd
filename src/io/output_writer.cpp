#include "io/output_writer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

#include "common/geometry.hpp"
#include "stages/coordinate_transform_stage.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace agro::io {

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

// Local frame -> output frame.
static Vec2 Out(const Mission& m, const Vec2& p) {
  if (m.frame == CoordinateFrame::kWgs84 && m.origin.defined) {
    return CoordinateTransformStage::LocalToLonLat(p, m.origin);
  }
  return p;
}

static json Positions(const Mission& m, const std::vector<Vec2>& pts) {
  json arr = json::array();
  for (const auto& p : pts) {
    const Vec2 q = Out(m, p);
    arr.push_back({q.x, q.y});
  }
  return arr;
}

static json LineStringJson(const Mission& m, const LineString& line) {
  return {{"type", "LineString"}, {"coordinates", Positions(m, line)}};
}

static json PolygonJson(const Mission& m, const Polygon& poly) {
  std::vector<Vec2> closed = poly.ring;
  if (!closed.empty()) closed.push_back(closed.front());
  return {{"type", "Polygon"}, {"coordinates", json::array({Positions(m, closed)})}};
}

LineString OutputWriter::CoverSegment(const Mission& mission, const Trip& trip) {
  const CoveragePath& cov = mission.coverage;
  LineString path;
  auto add = [&path](const Vec2& p) {
    if (path.empty() || geo::Dist(path.back(), p) > 1e-9) path.push_back(p);
  };
  for (int i = trip.start_idx; i <= trip.end_idx; ++i) {
    const std::size_t k = static_cast<std::size_t>(i);
    const Swath& s = cov.swaths.at(k);
    add(s.start);
    add(s.end);
    if (i < trip.end_idx && k < cov.turns.size()) {
      for (const auto& p : cov.turns[k]) add(p);
    }
  }
  return path;
}

LineString OutputWriter::TripPath(const Mission& mission, const Trip& trip) {
  LineString path;
  auto add = [&path](const Vec2& p) {
    if (path.empty() || geo::Dist(path.back(), p) > 1e-9) path.push_back(p);
  };
  for (const auto& p : trip.to_field) add(p);
  for (const auto& p : CoverSegment(mission, trip)) add(p);
  for (const auto& p : trip.back_home) add(p);
  return path;
}

LineString OutputWriter::Resample(const LineString& line, double step_m) {
  LineString out;
  if (line.empty()) return out;
  const double total = geo::PolylineLength(line);
  if (!(total > 0.0)) {
    out.push_back(line.front());
    return out;
  }
  const double step = std::max(0.1, step_m);
  std::vector<double> stations;
  for (long i = 0; static_cast<double>(i) * step < total - 1e-9; ++i) {
    stations.push_back(static_cast<double>(i) * step);
  }
  stations.push_back(total);

  // One walk along the polyline; stations are increasing.
  std::size_t seg = 1;
  double seg_start = 0.0;
  for (const double d : stations) {
    while (seg + 1 < line.size() && seg_start + geo::Dist(line[seg - 1], line[seg]) < d) {
      seg_start += geo::Dist(line[seg - 1], line[seg]);
      ++seg;
    }
    const Vec2& a = line[seg - 1];
    const Vec2& b = line[seg];
    const double len = geo::Dist(a, b);
    const double t = (len > 0.0) ? std::min(1.0, std::max(0.0, (d - seg_start) / len)) : 0.0;
    out.push_back(a + (b - a) * t);
  }
  return out;
}

json OutputWriter::ToJson(const Mission& m) {
  json j;
  j["mission_id"] = m.mission_id;
  j["crs"] = ToString(m.frame);
  if (m.origin.defined) {
    j["origin"] = {{"lon0_deg", m.origin.lon0_deg}, {"lat0_deg", m.origin.lat0_deg}};
  }

  json trips = json::array();
  for (std::size_t i = 0; i < m.trips.size(); ++i) {
    const Trip& t = m.trips[i];
    trips.push_back({
        {"index", i},
        {"start_idx", t.start_idx},
        {"end_idx", t.end_idx},
        {"swath_count", t.SwathCount()},
        {"to_field_geometry", LineStringJson(m, t.to_field)},
        {"back_home_geometry", LineStringJson(m, t.back_home)},
        {"mix_used_l", t.mix_used_l},
        {"fuel_used_l", t.fuel_used_l},
        {"transit_length_m", t.transit_length_m},
        {"spray_length_m", t.spray_length_m},
        {"length_m", t.length_m},
        {"time_min", t.time_min},
    });
  }
  j["trips"] = std::move(trips);

  const MissionMetrics& mm = m.metrics;
  j["metrics"] = {
      {"length_total_m", mm.length_total_m},
      {"length_transit_m", mm.length_transit_m},
      {"length_spray_m", mm.length_spray_m},
      {"time_total_min", mm.time_total_min},
      {"time_transit_min", mm.time_transit_min},
      {"time_spray_min", mm.time_spray_min},
      {"fuel_l", mm.fuel_l},
      {"fert_l", mm.fert_l},
      {"field_area_ha", mm.field_area_ha},
      {"sprayed_area_ha", mm.sprayed_area_ha},
      {"trip_count", mm.trip_count},
  };

  json nfz = json::array();
  for (const auto& z : m.geometry.nfz) nfz.push_back(PolygonJson(m, z));

  json swaths = json::array();
  for (const auto& s : m.coverage.swaths) swaths.push_back(Positions(m, {s.start, s.end}));

  json trip_paths = json::array();
  for (const auto& t : m.trips) trip_paths.push_back(LineStringJson(m, TripPath(m, t)));

  j["geo"] = {
      {"field", PolygonJson(m, m.geometry.field)},
      {"nfz", std::move(nfz)},
      {"runway_centerline", LineStringJson(m, m.geometry.runway_centerline)},
      {"swaths", {{"type", "MultiLineString"}, {"coordinates", std::move(swaths)}}},
      {"trips", std::move(trip_paths)},
      {"cover_path", LineStringJson(m, m.coverage.cover_path)},
      {"angle_used_deg", m.coverage.angle_used_deg},
  };
  j["logs"] = m.logs;
  return j;
}

void OutputWriter::WriteAll(const Mission& mission, const std::string& output_dir) {
  EnsureDir(output_dir);
  WriteMissionJson(mission, (fs::path(output_dir) / "mission.json").string());
  WriteTripsCsv(mission, output_dir);
  if (mission.export_options.step_m > 0.0) WriteExport(mission, output_dir);
}

void OutputWriter::WriteMissionJson(const Mission& mission, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << ToJson(mission).dump(2) << "\n";
}

static bool IsGeographic(const Mission& m) {
  return m.frame == CoordinateFrame::kWgs84 && m.origin.defined;
}

static void WriteCsv(const fs::path& p, const Mission& m, const LineString& pts) {
  std::ofstream ofs(p);
  if (!ofs) throw std::runtime_error("Failed to write: " + p.string());
  ofs << (IsGeographic(m) ? "lon,lat\n" : "x,y\n");
  ofs << std::fixed << std::setprecision(IsGeographic(m) ? 8 : 2);
  for (const auto& w : pts) {
    const Vec2 q = Out(m, w);
    ofs << q.x << "," << q.y << "\n";
  }
}

void OutputWriter::WriteTripsCsv(const Mission& mission, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);

  for (std::size_t i = 0; i < mission.trips.size(); ++i) {
    char name[32];
    std::snprintf(name, sizeof(name), "trip%02zu.csv", i + 1);
    WriteCsv(outdir / name, mission, TripPath(mission, mission.trips[i]));
  }
}

std::vector<OutputWriter::ExportSegment> OutputWriter::ExportSegments(const Mission& mission) {
  std::vector<ExportSegment> out;
  const double step = mission.export_options.step_m;
  for (std::size_t i = 0; i < mission.trips.size(); ++i) {
    const Trip& t = mission.trips[i];
    const int trip_no = static_cast<int>(i) + 1;
    out.push_back({trip_no, "to_field", Resample(t.to_field, step)});
    out.push_back({trip_no, "cover", Resample(CoverSegment(mission, t), step)});
    out.push_back({trip_no, "back_home", Resample(t.back_home, step)});
  }
  return out;
}

std::string OutputWriter::ExportBaseName(const Mission& mission) {
  std::string base = mission.export_options.name;
  if (base.empty()) base = mission.mission_id;
  if (base.empty()) base = "route";
  return base + "_" + std::to_string(static_cast<long>(mission.export_options.step_m)) + "m";
}

void OutputWriter::WriteExport(const Mission& mission, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);
  const std::string base = ExportBaseName(mission);
  const std::vector<ExportSegment> segments = ExportSegments(mission);

  json features = json::array();
  for (const auto& seg : segments) {
    features.push_back({
        {"type", "Feature"},
        {"properties", {{"trip", seg.trip}, {"segment", seg.segment},
                        {"step_m", mission.export_options.step_m}}},
        {"geometry", LineStringJson(mission, seg.points)},
    });
  }
  const json fc = {{"type", "FeatureCollection"}, {"features", std::move(features)}};

  const fs::path gj = outdir / (base + ".geojson");
  std::ofstream gofs(gj);
  if (!gofs) throw std::runtime_error("Failed to write: " + gj.string());
  gofs << fc.dump(2) << "\n";

  // One CSV per trip: segment,idx,lat,lon (segment,idx,x,y in a local frame).
  const bool geographic = IsGeographic(mission);
  for (std::size_t i = 0; i < mission.trips.size(); ++i) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_trip%02zu.csv", i + 1);
    const fs::path p = outdir / (base + suffix);
    std::ofstream ofs(p);
    if (!ofs) throw std::runtime_error("Failed to write: " + p.string());
    ofs << (geographic ? "segment,idx,lat,lon\n" : "segment,idx,x,y\n");
    ofs << std::fixed << std::setprecision(geographic ? 8 : 2);
    for (const auto& seg : segments) {
      if (seg.trip != static_cast<int>(i) + 1) continue;
      for (std::size_t k = 0; k < seg.points.size(); ++k) {
        const Vec2 q = Out(mission, seg.points[k]);
        ofs << seg.segment << "," << k << ",";
        if (geographic) {
          ofs << q.y << "," << q.x << "\n";
        } else {
          ofs << q.x << "," << q.y << "\n";
        }
      }
    }
  }
}

} // namespace agro::io
