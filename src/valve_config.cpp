#include "valve_config.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// trim white spaces
void trim(std::string &s) {
  auto is_not_space = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), is_not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), is_not_space).base(), s.end());
}

double parse_double(const std::string &name, const std::string &value) {
  try {
    std::size_t used = 0;
    double d = std::stod(value, &used);
    if (used == value.size())
      return d;
  } catch (const std::logic_error &) {
    // reported below
  }
  throw ConfigurationError(name, "a real number, got '" + value + "'");
}

int parse_int(const std::string &name, const std::string &value) {
  try {
    std::size_t used = 0;
    int i = std::stoi(value, &used);
    if (used == value.size())
      return i;
  } catch (const std::logic_error &) {
    // reported below
  }
  throw ConfigurationError(name, "an integer, got '" + value + "'");
}

bool parse_flag(const std::string &name, const std::string &value) {
  return parse_int(name, value) != 0;
}

} // namespace

std::vector<std::string> split_names(const std::string &value) {
  std::vector<std::string> names;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (!item.empty())
      names.push_back(item);
  }
  return names;
}

// 1. Helper function to load input/valve.inp
bool load_input_file(const std::string &filename, RunConfig &cfg) {
  std::ifstream fin(filename);
  if (!fin) {
    std::cerr << "Error: cannot open input file: " << filename << "\n";
    return false;
  }

  // Default parameters
  cfg = RunConfig{};

  // parse file
  std::string line;
  while (std::getline(fin, line)) {
    // remove comments
    auto pos = line.find('#');
    if (pos != std::string::npos)
      line = line.substr(0, pos);

    trim(line);
    if (line.empty())
      continue;

    // expect name = value
    std::string name, value;
    std::stringstream ss(line);
    if (!std::getline(ss, name, '='))
      continue;
    if (!std::getline(ss, value)) {
      std::cerr << "Warning: no value for '" << name << "', line ignored\n";
      continue;
    }
    trim(name);
    trim(value);

    // ------------------ structure / cycle ------------------
    if (name == "resolution")
      cfg.resolution = parse_int(name, value);
    else if (name == "severities" || name == "severity")
      cfg.severities = split_names(value);
    else if (name == "cycle_duration")
      cfg.timing.cycle_duration = parse_double(name, value);
    else if (name == "systole_fraction")
      cfg.timing.systole_fraction = parse_double(name, value);
    else if (name == "total_frames")
      cfg.total_frames = parse_int(name, value);
    else if (name == "cycles")
      cfg.cycles = parse_int(name, value);
    // ------------------ grid ------------------
    else if (name == "grid_x_min")
      cfg.grid_x_min = parse_double(name, value);
    else if (name == "grid_x_max")
      cfg.grid_x_max = parse_double(name, value);
    else if (name == "grid_y_min")
      cfg.grid_y_min = parse_double(name, value);
    else if (name == "grid_y_max")
      cfg.grid_y_max = parse_double(name, value);
    else if (name == "grid_nx")
      cfg.grid_nx = parse_int(name, value);
    else if (name == "grid_ny")
      cfg.grid_ny = parse_int(name, value);
    // ------------------ streamlines ------------------
    else if (name == "step_budget")
      cfg.trace.step_budget = parse_int(name, value);
    else if (name == "step_size")
      cfg.trace.step_size = parse_double(name, value);
    else if (name == "n_seeds")
      cfg.n_seeds = parse_int(name, value);
    else if (name == "seed_x")
      cfg.seed_x = parse_double(name, value);
    // ------------------ metrics ------------------
    else if (name == "assumed_cross_section")
      cfg.metrics.assumed_cross_section = parse_double(name, value);
    else if (name == "severe_gradient")
      cfg.thresholds.severe_gradient = parse_double(name, value);
    else if (name == "moderate_gradient")
      cfg.thresholds.moderate_gradient = parse_double(name, value);
    else if (name == "mild_gradient")
      cfg.thresholds.mild_gradient = parse_double(name, value);
    else if (name == "severe_area")
      cfg.thresholds.severe_area = parse_double(name, value);
    else if (name == "moderate_area")
      cfg.thresholds.moderate_area = parse_double(name, value);
    else if (name == "mild_area")
      cfg.thresholds.mild_area = parse_double(name, value);
    else if (name == "severe_velocity")
      cfg.thresholds.severe_velocity = parse_double(name, value);
    else if (name == "moderate_velocity")
      cfg.thresholds.moderate_velocity = parse_double(name, value);
    else if (name == "mild_velocity")
      cfg.thresholds.mild_velocity = parse_double(name, value);
    // ------------------ output ------------------
    else if (name == "output_prefix")
      cfg.output_prefix = value;
    else if (name == "write_geometry")
      cfg.write_geometry = parse_flag(name, value);
    else if (name == "write_frames")
      cfg.write_frames = parse_flag(name, value);
    else if (name == "frame_stride")
      cfg.frame_stride = parse_int(name, value);
    else if (name == "write_report")
      cfg.write_report = parse_flag(name, value);
    else
      std::cerr << "Warning: unknown key '" << name << "' ignored\n";
  }

  return true;
}

// 2. Validation: all fields, before any computation
void validate_config(const RunConfig &cfg, const SeverityCatalog &catalog) {
  if (cfg.resolution < MIN_RESOLUTION) {
    throw ConfigurationError("resolution",
                             "an integer >= " + std::to_string(MIN_RESOLUTION) +
                                 ", got " + std::to_string(cfg.resolution));
  }
  if (cfg.severities.empty())
    throw ConfigurationError("severities", "at least one severity name");
  for (const auto &name : cfg.severities)
    catalog.at(name); // throws for an unknown name

  validate_timing(cfg.timing);
  if (cfg.total_frames <= 0)
    throw ConfigurationError("total_frames", "a positive frame count");
  if (cfg.cycles <= 0)
    throw ConfigurationError("cycles", "a positive cycle count");

  // grid checks live with the grid
  auto grid = make_flow_grid(cfg);

  if (cfg.trace.step_budget <= 0)
    throw ConfigurationError("step_budget", "a positive step count");
  if (!(cfg.trace.step_size > 0.0))
    throw ConfigurationError("step_size", "a positive step [s]");
  if (cfg.n_seeds <= 0)
    throw ConfigurationError("n_seeds", "at least one seed point");
  if (cfg.seed_x < grid->x_min || cfg.seed_x > grid->x_max)
    throw ConfigurationError("seed_x", "a position inside the grid");

  if (!(cfg.metrics.assumed_cross_section > 0.0))
    throw ConfigurationError("assumed_cross_section", "a positive area [cm^2]");
  validate_thresholds(cfg.thresholds);

  if (cfg.output_prefix.empty())
    throw ConfigurationError("output_prefix", "a non-empty file prefix");
  if (cfg.frame_stride <= 0)
    throw ConfigurationError("frame_stride", "a positive stride");
}

std::shared_ptr<const FlowGrid> make_flow_grid(const RunConfig &cfg) {
  return make_flow_grid(cfg.grid_x_min, cfg.grid_x_max, cfg.grid_nx,
                        cfg.grid_y_min, cfg.grid_y_max, cfg.grid_ny);
}

SequencerSettings make_sequencer_settings(const RunConfig &cfg,
                                          const FlowGrid &grid) {
  SequencerSettings settings;
  settings.resolution = cfg.resolution;
  settings.severities = cfg.severities;
  settings.total_frames = cfg.total_frames;
  settings.cycles = cfg.cycles;
  settings.timing = cfg.timing;
  settings.trace = cfg.trace;
  settings.metrics = cfg.metrics;
  settings.seeds = make_seed_line(grid, cfg.seed_x, cfg.n_seeds);
  return settings;
}
