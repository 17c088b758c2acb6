#pragma once

#include "kinematics.hpp"
#include "severity_profile.hpp"

#include <cstddef>
#include <memory>
#include <vector>

//---------------------------------------------
// Analytic, region-wise flow field around the valve plane (x = 0)
// Units:
//   x, y:   cm
//   U, V:   cm/s
//   P:      mmHg
//   rho:    g/cm^3
//---------------------------------------------

// 1. Fixed sample grid, shared read-only by every frame
struct FlowGrid {
  double x_min;
  double x_max;
  double y_min;
  double y_max;
  int nx;
  int ny;
  std::vector<double> x; // nx node coordinates
  std::vector<double> y; // ny node coordinates

  double dx() const { return (x_max - x_min) / (nx - 1); }
  double dy() const { return (y_max - y_min) / (ny - 1); }
  std::size_t size() const { return static_cast<std::size_t>(nx) * ny; }
  // row-major, j (y) outer
  std::size_t index(int i, int j) const {
    return static_cast<std::size_t>(j) * nx + i;
  }
  bool contains(double px, double py) const {
    return px >= x_min && px <= x_max && py >= y_min && py <= y_max;
  }
};

// Throws ConfigurationError unless min < max and nx, ny >= 2
std::shared_ptr<const FlowGrid> make_flow_grid(double x_min, double x_max,
                                               int nx, double y_min,
                                               double y_max, int ny);

// 2. Model constants
struct FlowModelParams {
  double k_up = 50.0;            // upstream ramp amplitude [cm/s]
  double upstream_length = 4.0;  // ramp length L [cm]
  double k_throat = 100.0;       // throat velocity at unit opening [cm/s]
  double throat_half_width = 0.1; // |x| band carrying the throat jet [cm]
  double decay_length = 3.0;     // downstream jet decay [cm]
  double k_transverse = 10.0;    // focusing gain [1/s]
  double transverse_width = 4.0; // focusing spread [cm^2]
  double jet_radius_scale = 1.2; // jet radius per unit opening [cm]
  double full_strength_x = -1.0; // no attenuation upstream of this [cm]
  double outside_attenuation = 0.3;
  double backflow_velocity = 5.0; // diastolic backflow amplitude [cm/s]
  double backflow_width = 2.0;    // [cm^2]
  double min_opening_floor = 0.05; // guards the 1/opening throat term
  double rho = 1.06;               // blood density [g/cm^3]
  double p_base = 80.0;            // baseline pressure [mmHg]
  double dyn_per_mmHg = 1333.22;   // dyne/cm^2 -> mmHg
};

// 3. One frame of the field; arrays are row-major over the grid
struct FlowField {
  std::shared_ptr<const FlowGrid> grid;
  double t; // absolute time [s]
  CardiacPhase phase;
  double opening_fraction; // opening used in the throat term (floored)
  std::vector<double> U;
  std::vector<double> V;
  std::vector<double> pressure;

  double speed(std::size_t k) const;
};

// sin(pi t / systole_duration) in systole, 0 in diastole
double flow_strength(double t, const CycleTiming &timing);

// Opening clamped to the minimum-opening floor
double effective_opening(double opening, const FlowModelParams &params);

// Mass conservation: narrower opening -> faster jet
double throat_velocity(double strength, double opening,
                       const FlowModelParams &params);

// Bernoulli: P = P_base - 1/2 rho |v|^2
double bernoulli_pressure(double speed, const FlowModelParams &params);

// Throat band half-width on this grid: never narrower than half a cell, so
// at least one node column carries the jet wherever x = 0 falls
double throat_half_width(const FlowGrid &grid, const FlowModelParams &params);

FlowField evaluate_flow_field(std::shared_ptr<const FlowGrid> grid, double t,
                              const SeverityProfile &severity,
                              const CycleTiming &timing,
                              const FlowModelParams &params = FlowModelParams{});

// Bilinear interpolation of a grid array; points outside are clamped to the
// boundary cell.
double interpolate_bilinear(const FlowGrid &grid,
                            const std::vector<double> &values, double px,
                            double py);
