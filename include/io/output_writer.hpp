#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace agro::io {

// OutputWriter writes a finished Mission to an output directory:
// 1) mission.json : trips, metrics, geo (GeoJSON geometries), logs
// 2) tripNN.csv   : full flight path of each trip, x,y (lon,lat) per line
// 3) with export_options.step_m > 0, a resampled export <base>_<step>m:
//      .geojson           FeatureCollection, one LineString per trip segment
//      _tripNN.csv        segment,idx,lat,lon (segment,idx,x,y when local)
//    Segments are to_field, cover and back_home, resampled every step_m
//    metres in the local frame, each ending on its last vertex.
// Geometry goes out in the frame the request came in (lon/lat for wgs84).
class OutputWriter {
public:
  static void WriteAll(const Mission& mission, const std::string& output_dir);

  static void WriteMissionJson(const Mission& mission, const std::string& output_path);
  static void WriteTripsCsv(const Mission& mission, const std::string& output_dir);
  static void WriteExport(const Mission& mission, const std::string& output_dir);

  static nlohmann::json ToJson(const Mission& mission);

  // to_field + cover segment + back_home, in the local frame.
  static LineString TripPath(const Mission& mission, const Trip& trip);
  // The trip's swaths joined by their turns (straight chords when none).
  static LineString CoverSegment(const Mission& mission, const Trip& trip);

  // Points every step_m along the line, from its first vertex; the last point
  // is always the line's end.
  static LineString Resample(const LineString& line, double step_m);

  struct ExportSegment {
    int trip{0};  // 1-based
    std::string segment;
    LineString points;
  };
  static std::vector<ExportSegment> ExportSegments(const Mission& mission);
  static std::string ExportBaseName(const Mission& mission);
};

} // namespace agro::io
