#include "frame_sequencer.hpp"
#include "valve_errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

FrameSequencer::FrameSequencer(const SeverityCatalog &catalog,
                               std::shared_ptr<const FlowGrid> grid,
                               SequencerSettings settings,
                               std::unique_ptr<DeformationModel> deformation)
    : settings_(std::move(settings)), grid_(std::move(grid)),
      deformation_(std::move(deformation)) {
  if (!grid_)
    throw ConfigurationError("grid", "a flow grid");
  if (settings_.total_frames <= 0)
    throw ConfigurationError("total_frames", "a positive frame count");
  if (settings_.cycles <= 0)
    throw ConfigurationError("cycles", "a positive cycle count");
  if (settings_.severities.empty())
    throw ConfigurationError("severities", "at least one severity name");
  if (settings_.seeds.empty())
    throw ConfigurationError("seed points", "at least one seed point");
  if (settings_.trace.step_budget <= 0)
    throw ConfigurationError("step_budget", "a positive step count");
  if (!(settings_.trace.step_size > 0.0))
    throw ConfigurationError("step_size", "a positive step [s]");
  validate_timing(settings_.timing);

  if (!deformation_)
    deformation_ = std::make_unique<RadialRetractionModel>();

  // base geometry per severity, generated once
  for (const auto &name : settings_.severities) {
    const SeverityProfile &profile = catalog.at(name);
    profiles_.push_back(profile);
    geometries_.push_back(generate_valve_geometry(settings_.resolution, profile));
    base_areas_.push_back(convex_hull_area(base_positions(geometries_.back())));
  }
}

double FrameSequencer::time_at(int index) const {
  const CycleTiming &timing = settings_.timing;
  return (static_cast<double>(index) / settings_.total_frames) *
         timing.cycle_duration * settings_.cycles;
}

std::size_t FrameSequencer::slot(const std::string &severity) const {
  for (std::size_t s = 0; s < profiles_.size(); ++s) {
    if (profiles_[s].name == severity)
      return s;
  }
  throw std::out_of_range("severity '" + severity +
                          "' is not part of this sequence");
}

const ValveGeometry &
FrameSequencer::geometry(const std::string &severity) const {
  return geometries_[slot(severity)];
}

double FrameSequencer::base_area(const std::string &severity) const {
  return base_areas_[slot(severity)];
}

FrameRecord FrameSequencer::frame(int index) const {
  if (index < 0 || index >= size()) {
    throw std::out_of_range("frame " + std::to_string(index) +
                            " outside [0, " + std::to_string(size()) + ")");
  }

  FrameRecord record;
  record.index = index;
  record.t = time_at(index);
  record.severities.reserve(profiles_.size());

  const CycleTiming &timing = settings_.timing;
  for (std::size_t s = 0; s < profiles_.size(); ++s) {
    const SeverityProfile &profile = profiles_[s];

    SeverityFrame sf;
    sf.severity = profile.name;
    // 1) kinematics
    sf.state = cycle_state(record.t, profile, timing);
    sf.deformed_vertices =
        deformation_->deform(geometries_[s], sf.state.opening_fraction);
    // 2) flow field
    sf.flow =
        evaluate_flow_field(grid_, record.t, profile, timing, settings_.flow);
    // 3) streamlines + metrics, both from the same field
    sf.streamlines = trace_streamlines(sf.flow, settings_.seeds, settings_.trace);
    sf.metrics =
        compute_metrics(sf.flow, sf.state.opening_fraction, base_areas_[s],
                        profile, timing, settings_.flow, settings_.metrics);

    record.severities.push_back(std::move(sf));
  }
  return record;
}
