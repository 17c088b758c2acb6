#include "metrics.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

const char *grade_name(StenosisGrade grade) {
  switch (grade) {
  case StenosisGrade::SEVERE:
    return "severe";
  case StenosisGrade::MODERATE:
    return "moderate";
  case StenosisGrade::MILD:
    return "mild";
  case StenosisGrade::NORMAL:
    break;
  }
  return "normal";
}

void validate_thresholds(const ClassificationThresholds &th) {
  if (!(th.mild_gradient >= 0.0 && th.mild_gradient < th.moderate_gradient &&
        th.moderate_gradient < th.severe_gradient)) {
    throw ConfigurationError("mild/moderate/severe_gradient",
                             "0 <= mild < moderate < severe [mmHg]");
  }
  if (!(th.severe_area > 0.0 && th.severe_area < th.moderate_area &&
        th.moderate_area < th.mild_area)) {
    throw ConfigurationError("severe/moderate/mild_area",
                             "0 < severe < moderate < mild [cm^2]");
  }
  if (!(th.mild_velocity >= 0.0 && th.mild_velocity < th.moderate_velocity &&
        th.moderate_velocity < th.severe_velocity)) {
    throw ConfigurationError("mild/moderate/severe_velocity",
                             "0 <= mild < moderate < severe [cm/s]");
  }
}

StenosisGrade classify_stenosis(double gradient, double area,
                                double peak_velocity,
                                const ClassificationThresholds &th) {
  if (gradient > th.severe_gradient || area < th.severe_area ||
      peak_velocity > th.severe_velocity)
    return StenosisGrade::SEVERE;
  if (gradient > th.moderate_gradient || area < th.moderate_area ||
      peak_velocity > th.moderate_velocity)
    return StenosisGrade::MODERATE;
  if (gradient > th.mild_gradient || area < th.mild_area ||
      peak_velocity > th.mild_velocity)
    return StenosisGrade::MILD;
  return StenosisGrade::NORMAL;
}

double peak_velocity(const FlowField &field) {
  double peak = 0.0;
  for (std::size_t k = 0; k < field.U.size(); ++k)
    peak = std::max(peak, field.speed(k));
  return peak;
}

double pressure_gradient(const FlowField &field, const MetricsParams &params) {
  const FlowGrid &g = *field.grid;
  double p_up = interpolate_bilinear(g, field.pressure, params.upstream_probe.x,
                                     params.upstream_probe.y);
  double p_down =
      interpolate_bilinear(g, field.pressure, params.downstream_probe.x,
                           params.downstream_probe.y);
  return p_up - p_down;
}

double effective_orifice_area(double base_area, double opening,
                              const SeverityProfile &severity) {
  if (severity.max_opening <= 0.0)
    return 0.0;
  return base_area * opening / severity.max_opening;
}

double reference_velocity(double t, const SeverityProfile &severity,
                          const CycleTiming &timing) {
  return severity.peak_velocity_cm_s * flow_strength(t, timing);
}

double reference_gradient(double t, const SeverityProfile &severity,
                          const CycleTiming &timing) {
  double s = flow_strength(t, timing);
  return severity.pressure_gradient_scale_mmHg * s * s;
}

double representative_velocity(double t, const SeverityProfile &severity,
                               const CycleTiming &timing,
                               const FlowModelParams &flow) {
  double opening = opening_fraction(t, severity, timing);
  return throat_velocity(flow_strength(t, timing), opening, flow) * opening;
}

double stroke_volume(const SeverityProfile &severity, const CycleTiming &timing,
                     const FlowModelParams &flow, const MetricsParams &params) {
  if (params.integration_intervals < 1)
    throw ConfigurationError("integration_intervals", "at least one interval");

  // trapezoid rule over [0, ts); the last sample sits just inside systole
  const double ts = timing.systole_duration();
  const int n_int = params.integration_intervals;
  const double h = ts / n_int;
  double sum = 0.0;
  for (int n = 0; n <= n_int; ++n) {
    double tn = std::min(n * h, std::nextafter(ts, 0.0));
    double v = representative_velocity(tn, severity, timing, flow);
    sum += (n == 0 || n == n_int) ? 0.5 * v : v;
  }
  return sum * h * params.assumed_cross_section; // [cm^3] = [mL]
}

double cardiac_output(const SeverityProfile &severity,
                      const CycleTiming &timing, const FlowModelParams &flow,
                      const MetricsParams &params) {
  double heart_rate = 60.0 / timing.cycle_duration; // [1/min]
  return stroke_volume(severity, timing, flow, params) * heart_rate / 1000.0;
}

MetricSample compute_metrics(const FlowField &field, double opening,
                             double base_area, const SeverityProfile &severity,
                             const CycleTiming &timing,
                             const FlowModelParams &flow,
                             const MetricsParams &params) {
  MetricSample m;
  m.severity = severity.name;
  m.t = field.t;
  m.phase = field.phase;
  m.opening_fraction = opening;
  m.peak_velocity = peak_velocity(field);
  m.pressure_gradient = pressure_gradient(field, params);
  m.effective_orifice_area =
      effective_orifice_area(base_area, opening, severity);
  m.cardiac_output = cardiac_output(severity, timing, flow, params);
  m.reference_velocity = reference_velocity(field.t, severity, timing);
  m.reference_gradient = reference_gradient(field.t, severity, timing);
  return m;
}

MetricsAccumulator::MetricsAccumulator(std::string severity)
    : severity_(std::move(severity)) {}

void MetricsAccumulator::add(const MetricSample &sample) {
  if (sample.severity != severity_) {
    throw std::invalid_argument("metric sample for '" + sample.severity +
                                "' added to the '" + severity_ +
                                "' accumulator");
  }
  samples_.push_back(sample);
}

CycleSummary
MetricsAccumulator::summary(const ClassificationThresholds &thresholds) const {
  if (samples_.empty())
    throw std::runtime_error("No metric samples for " + severity_ + ".");

  CycleSummary s{};
  s.severity = severity_;
  s.n_samples = samples_.size();

  double gradient_sum = 0.0;
  std::size_t n_systole = 0;
  for (const auto &m : samples_) {
    s.peak_velocity = std::max(s.peak_velocity, m.peak_velocity);
    s.peak_gradient = std::max(s.peak_gradient, m.pressure_gradient);
    s.max_orifice_area = std::max(s.max_orifice_area, m.effective_orifice_area);
    s.cardiac_output = m.cardiac_output;
    if (m.phase == CardiacPhase::SYSTOLE) {
      gradient_sum += m.pressure_gradient;
      ++n_systole;
    }
  }
  s.mean_gradient = n_systole > 0 ? gradient_sum / n_systole : 0.0;

  s.grade = classify_stenosis(s.mean_gradient, s.max_orifice_area,
                              s.peak_velocity, thresholds);
  s.classification = grade_name(s.grade);
  return s;
}
