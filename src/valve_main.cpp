#include "frame_io.hpp"
#include "frame_sequencer.hpp"
#include "geometry_io.hpp"
#include "valve_config.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

//---------------------------------------------
// 2D tricuspid valve: prescribed kinematics + analytic flow
// Units:
//   x, y:   cm
//   U, V:   cm/s
//   P:      mmHg
//   t:      s
//---------------------------------------------

namespace {

std::string frame_stem(const std::string &dir, int index,
                       const std::string &severity) {
  std::ostringstream ss;
  ss << dir << "/frame_" << std::setw(4) << std::setfill('0') << index << "_"
     << severity;
  return ss.str();
}

bool write_frame(const std::string &dir, const FrameRecord &record) {
  for (const auto &sf : record.severities) {
    const std::string stem = frame_stem(dir, record.index, sf.severity);
    if (!write_vertex_file(stem + ".vertex", sf.deformed_vertices) ||
        !write_flow_field_csv(stem + "_field.csv", sf.flow) ||
        !write_streamlines_csv(stem + "_streamlines.csv", sf.streamlines))
      return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " path/to/valve.inp\n";
    return 1;
  }

  const SeverityCatalog &catalog = default_severity_catalog();
  RunConfig cfg;
  std::string input_file = argv[1];

  // 1. Read valve.inp and validate everything before any frame
  try {
    if (!load_input_file(input_file, cfg))
      return 1;
    validate_config(cfg, catalog);
  } catch (const ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  auto grid = make_flow_grid(cfg);
  FrameSequencer sequencer(catalog, grid, make_sequencer_settings(cfg, *grid));

  // 2. Base geometries (the files the external FSI solver reads)
  std::cout << "Geometry (" << cfg.resolution << " points per leaflet):\n";
  for (const auto &geom : sequencer.geometries()) {
    GeometryProperties props = compute_geometry_properties(geom);
    std::cout << "  " << std::left << std::setw(10) << geom.severity.name
              << std::right << " vertices " << props.n_vertices << ", springs "
              << props.n_springs << ", beams " << props.n_beams
              << ", orifice area " << std::fixed << std::setprecision(2)
              << props.orifice_area << " cm^2, stiffness "
              << std::scientific << props.avg_stiffness << " (mean)\n"
              << std::defaultfloat << std::setprecision(6);
    if (cfg.write_geometry && !write_geometry_files(cfg.output_prefix, geom))
      return 1;
  }

  std::string frames_dir = cfg.output_prefix + "_frames";
  if (cfg.write_frames) {
    std::error_code ec;
    std::filesystem::create_directories(frames_dir, ec);
    if (ec) {
      std::cerr << "Error: cannot create " << frames_dir << ": "
                << ec.message() << "\n";
      return 1;
    }
  }

  // 3. Frames: kinematics -> flow -> streamlines + metrics
  std::cout << "Running " << sequencer.size() << " frames over "
            << cfg.cycles << " cycle(s) of " << cfg.timing.cycle_duration
            << " s (systole " << cfg.timing.systole_duration() << " s), "
            << "deformation: " << sequencer.deformation().name() << "\n";

  std::vector<MetricsAccumulator> accumulators;
  for (const auto &name : cfg.severities)
    accumulators.emplace_back(name);
  std::vector<MetricSample> samples;
  samples.reserve(static_cast<std::size_t>(sequencer.size()) *
                  cfg.severities.size());

  bool frames_ok = true;
  const int report_every = std::max(1, sequencer.size() / 10);
  sequencer.run([&](const FrameRecord &record) {
    for (std::size_t s = 0; s < record.severities.size(); ++s) {
      accumulators[s].add(record.severities[s].metrics);
      samples.push_back(record.severities[s].metrics);
    }
    if (cfg.write_frames && frames_ok && record.index % cfg.frame_stride == 0)
      frames_ok = write_frame(frames_dir, record);
    if (record.index % report_every == 0) {
      std::cout << "  Frame " << record.index << "/" << sequencer.size()
                << " (t = " << record.t << " s)\n";
    }
  });
  if (!frames_ok)
    return 1;

  // 4. Metrics and report
  const std::string metrics_file = cfg.output_prefix + "_metrics.csv";
  if (!write_metrics_csv(metrics_file, samples))
    return 1;

  std::vector<CycleSummary> summaries;
  for (const auto &acc : accumulators)
    summaries.push_back(acc.summary(cfg.thresholds));

  std::cout << "\n"
            << std::left << std::setw(12) << "Severity" << std::right
            << std::setw(14) << "Vpeak [cm/s]" << std::setw(14)
            << "dPmean [mmHg]" << std::setw(14) << "EOA [cm^2]"
            << std::setw(14) << "CO [L/min]" << "  Grade\n";
  std::cout << std::fixed << std::setprecision(2);
  for (const auto &s : summaries) {
    std::cout << std::left << std::setw(12) << s.severity << std::right
              << std::setw(14) << s.peak_velocity << std::setw(14)
              << s.mean_gradient << std::setw(14) << s.max_orifice_area
              << std::setw(14) << s.cardiac_output << "  " << s.classification
              << "\n";
  }

  if (cfg.write_report) {
    const std::string report_file = cfg.output_prefix + "_report.txt";
    if (!write_clinical_report(report_file, summaries, catalog))
      return 1;
    std::cout << "Report written to " << report_file << "\n";
  }

  std::cout << "Simulation completed. Results written to " << metrics_file
            << "\n";
  return 0;
}
