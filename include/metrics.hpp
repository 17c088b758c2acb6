#pragma once

#include "flow_field.hpp"
#include "kinematics.hpp"
#include "severity_profile.hpp"
#include "valve_geometry.hpp"

#include <cstddef>
#include <string>
#include <vector>

//---------------------------------------------
// Clinical metrics derived from geometry + flow field
// Units:
//   velocity: cm/s
//   gradient: mmHg
//   area:     cm^2
//   cardiac output: L/min
//---------------------------------------------

struct MetricsParams {
  Vec2 upstream_probe{-2.0, 0.0};  // left ventricular outflow side [cm]
  Vec2 downstream_probe{0.0, 0.0}; // valve plane / vena contracta [cm]
  double assumed_cross_section = 3.5; // annulus cross section [cm^2]
  int integration_intervals = 200;    // trapezoid panels over systole
};

// ACC/AHA style grading; a grade applies if ANY criterion is met
struct ClassificationThresholds {
  double severe_gradient = 40.0; // mean gradient above [mmHg]
  double moderate_gradient = 25.0;
  double mild_gradient = 10.0;
  double severe_area = 1.0; // orifice area below [cm^2]
  double moderate_area = 1.5;
  double mild_area = 2.0;
  double severe_velocity = 400.0; // peak velocity above [cm/s]
  double moderate_velocity = 300.0;
  double mild_velocity = 200.0;
};

enum class StenosisGrade { NORMAL, MILD, MODERATE, SEVERE };

const char *grade_name(StenosisGrade grade);

// Throws ConfigurationError unless the three tiers are ordered
void validate_thresholds(const ClassificationThresholds &thresholds);

StenosisGrade classify_stenosis(double gradient, double area,
                                double peak_velocity,
                                const ClassificationThresholds &thresholds);

// Append-only per-frame record
struct MetricSample {
  std::string severity;
  double t; // [s]
  CardiacPhase phase;
  double opening_fraction;
  double peak_velocity;          // max |v| over the grid
  double pressure_gradient;      // P(upstream) - P(downstream)
  double effective_orifice_area; // [cm^2]
  double cardiac_output;         // [L/min]
  double reference_velocity;     // profile waveform [cm/s]
  double reference_gradient;     // profile waveform [mmHg]
};

double peak_velocity(const FlowField &field);
double pressure_gradient(const FlowField &field, const MetricsParams &params);

// base_area * opening / max_opening: the geometric orifice at full opening
double effective_orifice_area(double base_area, double opening,
                              const SeverityProfile &severity);

// Reference waveforms of the severity profile
double reference_velocity(double t, const SeverityProfile &severity,
                          const CycleTiming &timing);
double reference_gradient(double t, const SeverityProfile &severity,
                          const CycleTiming &timing);

// Mean velocity over the annulus cross section: the throat jet spread over
// the whole annulus (throat velocity * opening) [cm/s]
double representative_velocity(double t, const SeverityProfile &severity,
                               const CycleTiming &timing,
                               const FlowModelParams &flow);

// Time integral of representative_velocity over one systole, times
// assumed_cross_section [mL]
double stroke_volume(const SeverityProfile &severity, const CycleTiming &timing,
                     const FlowModelParams &flow, const MetricsParams &params);
// stroke volume * heart rate [L/min]
double cardiac_output(const SeverityProfile &severity,
                      const CycleTiming &timing, const FlowModelParams &flow,
                      const MetricsParams &params);

// base_area: convex-hull area of the undeformed geometry
MetricSample compute_metrics(const FlowField &field, double opening,
                             double base_area, const SeverityProfile &severity,
                             const CycleTiming &timing,
                             const FlowModelParams &flow,
                             const MetricsParams &params);

// Fold of the samples of one severity
struct CycleSummary {
  std::string severity;
  std::size_t n_samples;
  double peak_velocity;
  double peak_gradient;
  double mean_gradient; // mean over systolic samples
  double max_orifice_area;
  double cardiac_output;
  StenosisGrade grade;
  std::string classification;
};

class MetricsAccumulator {
public:
  explicit MetricsAccumulator(std::string severity);

  // Samples of another severity are rejected (std::invalid_argument)
  void add(const MetricSample &sample);

  CycleSummary summary(const ClassificationThresholds &thresholds) const;
  const std::vector<MetricSample> &samples() const { return samples_; }

private:
  std::string severity_;
  std::vector<MetricSample> samples_;
};
