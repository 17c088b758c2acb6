#pragma once

#include "severity_profile.hpp"
#include "valve_geometry.hpp"

#include <vector>

//---------------------------------------------
// Prescribed valve kinematics over the cardiac cycle
//   t: s (absolute time, wrapped into one cycle)
//---------------------------------------------

constexpr double RESIDUAL_CLOSED_FRACTION = 0.05; // diastolic leak opening
constexpr double DISPLACEMENT_SCALE = 0.3;        // radial retraction gain

enum class CardiacPhase { SYSTOLE, DIASTOLE };

const char *phase_name(CardiacPhase phase);

// 1. Cycle timing (75 bpm, 0.3 s systole by default)
struct CycleTiming {
  double cycle_duration = 0.8;     // [s]
  double systole_fraction = 0.375; // systole / cycle [-]

  double systole_duration() const { return cycle_duration * systole_fraction; }
};

// Throws ConfigurationError unless 0 < systole_duration < cycle_duration
void validate_timing(const CycleTiming &timing);

// 2. Derived per-frame state, never persisted
struct CycleState {
  double t; // time within the cycle, [0, cycle_duration)
  CardiacPhase phase;
  double opening_fraction; // [0, max_opening]
};

double time_in_cycle(double t, const CycleTiming &timing);
CardiacPhase cardiac_phase(double t, const CycleTiming &timing);

// Systole: max_opening * sin(pi t / systole_duration)
// Diastole: residual closed fraction (never above max_opening)
double opening_fraction(double t, const SeverityProfile &severity,
                        const CycleTiming &timing);

CycleState cycle_state(double t, const SeverityProfile &severity,
                       const CycleTiming &timing);

// 3. Deformation of the base geometry for a given opening fraction.
// Implementations return a new vertex set (same order as base.vertices);
// the base geometry is never modified.
class DeformationModel {
public:
  virtual ~DeformationModel() = default;

  virtual std::vector<Vec2> deform(const ValveGeometry &base,
                                   double opening_fraction) const = 0;
  virtual const char *name() const = 0;
};

// Prescribed radial retraction. NOT derived from fluid forces: it stands in
// for the structural response an FSI solve would compute.
//   dr = f (1 - r / r_max) * displacement_scale,  p' = p (1 - dr)
class RadialRetractionModel : public DeformationModel {
public:
  explicit RadialRetractionModel(double displacement_scale = DISPLACEMENT_SCALE)
      : displacement_scale_(displacement_scale) {}

  std::vector<Vec2> deform(const ValveGeometry &base,
                           double opening_fraction) const override;
  const char *name() const override { return "prescribed-radial-retraction"; }

  double displacement_scale() const { return displacement_scale_; }

private:
  double displacement_scale_;
};
