#pragma once

#include "flow_field.hpp"
#include "valve_geometry.hpp"

#include <vector>

// Why a polyline stopped
enum class StreamlineEnd { DOMAIN_EXIT, STEP_BUDGET };

struct StreamlinePoint {
  double x;     // [cm]
  double y;     // [cm]
  double speed; // interpolated |v| at the point [cm/s]
};

struct Streamline {
  Vec2 seed;
  std::vector<StreamlinePoint> points; // at most step_budget + 1 samples
  StreamlineEnd end;
};

struct TraceSettings {
  int step_budget = 400;   // hard bound on integration steps
  double step_size = 0.002; // pseudo-time step [s]
};

// Velocity at an arbitrary point (bilinear over the enclosing cell)
Vec2 sample_velocity(const FlowField &field, double px, double py);

// n seeds evenly spread over the grid height at x = seed_x
std::vector<Vec2> make_seed_line(const FlowGrid &grid, double seed_x,
                                 int n_seeds);

// RK4 integration of dx/dt = U, dy/dt = V from one seed.
// A seed outside the grid gives an empty DOMAIN_EXIT polyline.
Streamline trace_streamline(const FlowField &field, const Vec2 &seed,
                            const TraceSettings &settings);

// Throws ConfigurationError for an empty seed set or a non-positive budget
std::vector<Streamline> trace_streamlines(const FlowField &field,
                                          const std::vector<Vec2> &seeds,
                                          const TraceSettings &settings);
