#include "flow_field.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

std::shared_ptr<const FlowGrid> make_flow_grid(double x_min, double x_max,
                                               int nx, double y_min,
                                               double y_max, int ny) {
  if (!(x_min < x_max))
    throw ConfigurationError("grid_x_min/grid_x_max", "x_min < x_max");
  if (!(y_min < y_max))
    throw ConfigurationError("grid_y_min/grid_y_max", "y_min < y_max");
  if (nx < 2)
    throw ConfigurationError("grid_nx", "at least 2 nodes");
  if (ny < 2)
    throw ConfigurationError("grid_ny", "at least 2 nodes");

  auto grid = std::make_shared<FlowGrid>();
  grid->x_min = x_min;
  grid->x_max = x_max;
  grid->y_min = y_min;
  grid->y_max = y_max;
  grid->nx = nx;
  grid->ny = ny;

  // evenly spaced, end points exact
  grid->x.resize(static_cast<std::size_t>(nx));
  for (int i = 0; i < nx; ++i)
    grid->x[i] = (i == nx - 1) ? x_max : x_min + i * grid->dx();
  grid->y.resize(static_cast<std::size_t>(ny));
  for (int j = 0; j < ny; ++j)
    grid->y[j] = (j == ny - 1) ? y_max : y_min + j * grid->dy();

  return grid;
}

double FlowField::speed(std::size_t k) const {
  return std::hypot(U[k], V[k]);
}

double flow_strength(double t, const CycleTiming &timing) {
  double t_mod = time_in_cycle(t, timing);
  double ts = timing.systole_duration();
  if (t_mod < ts)
    return std::sin(M_PI * (t_mod / ts));
  return 0.0;
}

double effective_opening(double opening, const FlowModelParams &params) {
  return std::max(opening, params.min_opening_floor);
}

double throat_velocity(double strength, double opening,
                       const FlowModelParams &params) {
  return strength * params.k_throat / effective_opening(opening, params);
}

double bernoulli_pressure(double speed, const FlowModelParams &params) {
  double dynamic = 0.5 * params.rho * speed * speed; // [dyne/cm^2]
  return params.p_base - dynamic / params.dyn_per_mmHg;
}

double throat_half_width(const FlowGrid &grid, const FlowModelParams &params) {
  return std::max(params.throat_half_width, 0.5 * grid.dx());
}

FlowField evaluate_flow_field(std::shared_ptr<const FlowGrid> grid, double t,
                              const SeverityProfile &severity,
                              const CycleTiming &timing,
                              const FlowModelParams &params) {
  FlowField field;
  field.grid = std::move(grid);
  field.t = t;
  field.phase = cardiac_phase(t, timing);

  const FlowGrid &g = *field.grid;
  const std::size_t n = g.size();
  field.U.assign(n, 0.0);
  field.V.assign(n, 0.0);
  field.pressure.assign(n, params.p_base);

  const double opening = opening_fraction(t, severity, timing);
  field.opening_fraction = effective_opening(opening, params);

  if (field.phase == CardiacPhase::SYSTOLE) {
    const double strength = flow_strength(t, timing);
    const double u_throat = throat_velocity(strength, opening, params);
    const double dissipation = 1.0 / (1.0 + severity.resistance_coeff);
    const double jet_radius = params.jet_radius_scale * opening;
    const double half_width = throat_half_width(g, params);

    for (int j = 0; j < g.ny; ++j) {
      const double y = g.y[j];
      for (int i = 0; i < g.nx; ++i) {
        const double x = g.x[i];
        double u;
        if (x < -half_width) {
          // upstream: accelerate towards the valve
          u = strength * params.k_up * (1.0 + x / params.upstream_length);
        } else if (x <= half_width) {
          u = u_throat;
        } else {
          // downstream: jet decays and loses energy to turbulence
          u = u_throat * std::exp(-(x - half_width) / params.decay_length) *
              dissipation;
        }
        double v = -y * strength * params.k_transverse *
                   std::exp(-x * x / params.transverse_width);

        // jet footprint
        const double r = std::hypot(x, y);
        if (!(r < jet_radius || x < params.full_strength_x)) {
          u *= params.outside_attenuation;
          v *= params.outside_attenuation;
        }

        const std::size_t k = g.index(i, j);
        field.U[k] = u;
        field.V[k] = v;
      }
    }
  } else {
    // near-closed valve: weak backflow concentrated at the center
    for (int j = 0; j < g.ny; ++j) {
      for (int i = 0; i < g.nx; ++i) {
        const double r2 = g.x[i] * g.x[i] + g.y[j] * g.y[j];
        field.U[g.index(i, j)] =
            -params.backflow_velocity * std::exp(-r2 / params.backflow_width);
      }
    }
  }

  for (std::size_t k = 0; k < n; ++k)
    field.pressure[k] = bernoulli_pressure(field.speed(k), params);

  return field;
}

double interpolate_bilinear(const FlowGrid &grid,
                            const std::vector<double> &values, double px,
                            double py) {
  const double fx =
      std::clamp((px - grid.x_min) / grid.dx(), 0.0, double(grid.nx - 1));
  const double fy =
      std::clamp((py - grid.y_min) / grid.dy(), 0.0, double(grid.ny - 1));

  int i0 = std::min(static_cast<int>(fx), grid.nx - 2);
  int j0 = std::min(static_cast<int>(fy), grid.ny - 2);
  const double ax = fx - i0;
  const double ay = fy - j0;

  const double v00 = values[grid.index(i0, j0)];
  const double v10 = values[grid.index(i0 + 1, j0)];
  const double v01 = values[grid.index(i0, j0 + 1)];
  const double v11 = values[grid.index(i0 + 1, j0 + 1)];

  return (1.0 - ax) * (1.0 - ay) * v00 + ax * (1.0 - ay) * v10 +
         (1.0 - ax) * ay * v01 + ax * ay * v11;
}
