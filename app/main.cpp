#include <iostream>
#include <memory>
#include <string>

#include "common/errors.hpp"
#include "coverage/scanline_planner.hpp"
#include "io/output_writer.hpp"
#include "io/project_io.hpp"
#include "pipeline/pipeline.hpp"

int main(int argc, char** argv) {
  // Defaults: demo/project.json -> demo/output
  //   ./agro_mission_demo
  //   ./agro_mission_demo /path/to/project.json /path/to/output [--quiet]
  std::string project_path = "demo/project.json";
  std::string output_dir   = "demo/output";
  bool quiet = false;

  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--quiet") {
      quiet = true;
    } else if (positional == 0) {
      project_path = arg;
      ++positional;
    } else if (positional == 1) {
      output_dir = arg;
      ++positional;
    } else {
      std::cerr << "usage: agro_mission_demo [project.json] [output_dir] [--quiet]\n";
      return 1;
    }
  }

  try {
    // 1) read the project
    agro::MissionRequest request = agro::io::ProjectIO::LoadRequest(project_path);

    // 2) build the mission
    agro::Pipeline pipe(std::make_shared<agro::coverage::ScanlinePlanner>());
    agro::Mission mission = pipe.Build(request, quiet ? nullptr : &std::cout);

    // 3) write mission.json + tripNN.csv
    agro::io::OutputWriter::WriteAll(mission, output_dir);

    std::cout << "Done. " << mission.trips.size() << " trip(s), output written to: " << output_dir << "\n";
    return 0;
  } catch (const agro::MissionBuildError& e) {
    std::cerr << "MISSION FAILED [" << agro::ToString(e.kind()) << "]: " << e.what() << "\n";
    for (const auto& line : e.logs()) std::cerr << "  " << line << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
