#pragma once

#include "flow_field.hpp"
#include "frame_sequencer.hpp"
#include "kinematics.hpp"
#include "metrics.hpp"
#include "severity_profile.hpp"
#include "streamlines.hpp"

#include <memory>
#include <string>
#include <vector>

// Run configuration read from an .inp file (name = value, # comments)
struct RunConfig {
  int resolution = 64; // points per leaflet
  std::vector<std::string> severities{"healthy", "severe"};
  CycleTiming timing;
  int total_frames = 240;
  int cycles = 1;

  // flow grid [cm]
  double grid_x_min = -4.0;
  double grid_x_max = 4.0;
  double grid_y_min = -4.0;
  double grid_y_max = 4.0;
  int grid_nx = 81;
  int grid_ny = 81;

  // streamlines
  TraceSettings trace;
  int n_seeds = 15;
  double seed_x = -3.5; // [cm]

  MetricsParams metrics;
  ClassificationThresholds thresholds;

  // output
  std::string output_prefix = "valve2d";
  bool write_geometry = true;
  bool write_frames = false;
  int frame_stride = 1;
  bool write_report = true;
};

// Applies defaults, then the file's values. Returns false if the file cannot
// be opened; throws ConfigurationError for a malformed value.
bool load_input_file(const std::string &filename, RunConfig &cfg);

// Comma-separated list -> trimmed, non-empty names
std::vector<std::string> split_names(const std::string &value);

// Checks every field (and every severity name against the catalog).
// Throws ConfigurationError naming the first bad field.
void validate_config(const RunConfig &cfg, const SeverityCatalog &catalog);

std::shared_ptr<const FlowGrid> make_flow_grid(const RunConfig &cfg);
SequencerSettings make_sequencer_settings(const RunConfig &cfg,
                                          const FlowGrid &grid);
