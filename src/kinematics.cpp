#include "kinematics.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

const char *phase_name(CardiacPhase phase) {
  return phase == CardiacPhase::SYSTOLE ? "systole" : "diastole";
}

void validate_timing(const CycleTiming &timing) {
  if (!(timing.cycle_duration > 0.0))
    throw ConfigurationError("cycle_duration", "a positive duration [s]");
  if (!(timing.systole_fraction > 0.0 && timing.systole_fraction < 1.0)) {
    throw ConfigurationError("systole_fraction",
                             "a value in (0, 1) so that systole_duration < "
                             "cycle_duration, got " +
                                 std::to_string(timing.systole_fraction));
  }
}

// Wrap time into [0, cycle_duration) assuming periodicity
double time_in_cycle(double t, const CycleTiming &timing) {
  double t_mod = std::fmod(t, timing.cycle_duration);
  if (t_mod < 0.0)
    t_mod += timing.cycle_duration;
  // fmod of a tiny negative can round up to exactly one period
  if (t_mod >= timing.cycle_duration)
    t_mod = 0.0;
  return t_mod;
}

CardiacPhase cardiac_phase(double t, const CycleTiming &timing) {
  return time_in_cycle(t, timing) < timing.systole_duration()
             ? CardiacPhase::SYSTOLE
             : CardiacPhase::DIASTOLE;
}

double opening_fraction(double t, const SeverityProfile &severity,
                        const CycleTiming &timing) {
  double t_mod = time_in_cycle(t, timing);
  double ts = timing.systole_duration();
  if (t_mod < ts) {
    double f = severity.max_opening * std::sin(M_PI * (t_mod / ts));
    return std::clamp(f, 0.0, severity.max_opening);
  }
  return std::min(RESIDUAL_CLOSED_FRACTION, severity.max_opening);
}

CycleState cycle_state(double t, const SeverityProfile &severity,
                       const CycleTiming &timing) {
  CycleState state;
  state.t = time_in_cycle(t, timing);
  state.phase = cardiac_phase(t, timing);
  state.opening_fraction = opening_fraction(t, severity, timing);
  return state;
}

std::vector<Vec2> RadialRetractionModel::deform(const ValveGeometry &base,
                                                double opening_fraction) const {
  std::vector<Vec2> deformed;
  deformed.reserve(base.vertices.size());

  double r_max = 0.0;
  for (const auto &v : base.vertices)
    r_max = std::max(r_max, std::hypot(v.base_position.x, v.base_position.y));

  for (const auto &v : base.vertices) {
    const Vec2 &p = v.base_position;
    double dr = 0.0;
    if (r_max > 0.0) {
      double r = std::hypot(p.x, p.y);
      dr = opening_fraction * (1.0 - r / r_max) * displacement_scale_;
    }
    deformed.push_back({p.x * (1.0 - dr), p.y * (1.0 - dr)});
  }
  return deformed;
}
