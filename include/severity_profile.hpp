#pragma once

#include <cstddef>
#include <string>
#include <vector>

// 1. Disease-severity preset (healthy -> severe stenosis)
struct SeverityProfile {
  std::string name;
  double stiffness_mult;      // spring stiffness multiplier [-]
  double rigidity_mult;       // beam rigidity multiplier [-]
  double leaflet_length_frac; // fraction of nominal leaflet length [-]
  double mobility_frac;       // leaflet curvature (mobility) factor [-]
  double max_opening;         // peak systolic opening fraction, in [0,1]
  double peak_velocity_cm_s;  // reference peak jet velocity [cm/s]
  double pressure_gradient_scale_mmHg; // reference mean gradient [mmHg]
  double resistance_coeff; // downstream (turbulent) dissipation [-]
};

// 2. Immutable table of named presets.
// Built once at startup and passed (by const reference) to whoever needs it.
class SeverityCatalog {
public:
  explicit SeverityCatalog(std::vector<SeverityProfile> profiles);

  // Throws ConfigurationError for an unknown name (no fallback preset).
  const SeverityProfile &at(const std::string &name) const;
  bool contains(const std::string &name) const;

  std::vector<std::string> names() const;
  std::size_t size() const { return profiles_.size(); }
  const std::vector<SeverityProfile> &profiles() const { return profiles_; }

private:
  std::vector<SeverityProfile> profiles_;
};

// healthy, mild, moderate, severe
const SeverityCatalog &default_severity_catalog();
