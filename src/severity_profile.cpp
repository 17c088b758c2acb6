#include "severity_profile.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <utility>

//---------------------------------------------
// Severity presets
//   stiffness / rigidity multipliers are relative to the healthy leaflet
//   (spring 5.0e2, beam 1.0e-2), velocities in cm/s, gradients in mmHg
//---------------------------------------------

SeverityCatalog::SeverityCatalog(std::vector<SeverityProfile> profiles)
    : profiles_(std::move(profiles)) {
  if (profiles_.empty())
    throw ConfigurationError("severity catalog", "at least one profile");

  for (std::size_t i = 0; i < profiles_.size(); ++i) {
    const SeverityProfile &p = profiles_[i];
    if (p.name.empty())
      throw ConfigurationError("severity name", "a non-empty name");
    for (std::size_t j = 0; j < i; ++j) {
      if (profiles_[j].name == p.name)
        throw ConfigurationError("severity " + p.name, "a unique name");
    }
    if (p.max_opening < 0.0 || p.max_opening > 1.0)
      throw ConfigurationError(p.name + ".max_opening", "a value in [0, 1]");
    if (p.stiffness_mult <= 0.0 || p.rigidity_mult <= 0.0)
      throw ConfigurationError(p.name + ".stiffness_mult/rigidity_mult",
                               "positive multipliers");
    if (p.leaflet_length_frac <= 0.0)
      throw ConfigurationError(p.name + ".leaflet_length_frac",
                               "a positive fraction");
    if (p.resistance_coeff < 0.0)
      throw ConfigurationError(p.name + ".resistance_coeff",
                               "a non-negative coefficient");
  }
}

const SeverityProfile &SeverityCatalog::at(const std::string &name) const {
  auto it = std::find_if(
      profiles_.begin(), profiles_.end(),
      [&name](const SeverityProfile &p) { return p.name == name; });
  if (it == profiles_.end()) {
    std::string known;
    for (const auto &p : profiles_) {
      if (!known.empty())
        known += ", ";
      known += p.name;
    }
    throw ConfigurationError("severity", "one of {" + known + "}, got '" +
                                             name + "'");
  }
  return *it;
}

bool SeverityCatalog::contains(const std::string &name) const {
  return std::any_of(
      profiles_.begin(), profiles_.end(),
      [&name](const SeverityProfile &p) { return p.name == name; });
}

std::vector<std::string> SeverityCatalog::names() const {
  std::vector<std::string> out;
  out.reserve(profiles_.size());
  for (const auto &p : profiles_)
    out.push_back(p.name);
  return out;
}

const SeverityCatalog &default_severity_catalog() {
  // name, stiffness, rigidity, length, mobility, max_opening,
  // peak velocity [cm/s], gradient [mmHg], resistance
  static const SeverityCatalog catalog({
      {"healthy", 1.0, 1.0, 1.00, 1.0, 0.90, 120.0, 5.0, 1.0},
      {"mild", 1.6, 2.0, 0.95, 0.9, 0.80, 250.0, 15.0, 1.5},
      {"moderate", 3.0, 5.0, 0.85, 0.7, 0.65, 350.0, 30.0, 2.5},
      {"severe", 6.0, 10.0, 0.70, 0.4, 0.40, 500.0, 50.0, 5.0},
  });
  return catalog;
}
