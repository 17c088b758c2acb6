#include "streamlines.hpp"
#include "valve_errors.hpp"

#include <cmath>

Vec2 sample_velocity(const FlowField &field, double px, double py) {
  const FlowGrid &g = *field.grid;
  return {interpolate_bilinear(g, field.U, px, py),
          interpolate_bilinear(g, field.V, px, py)};
}

std::vector<Vec2> make_seed_line(const FlowGrid &grid, double seed_x,
                                 int n_seeds) {
  std::vector<Vec2> seeds;
  if (n_seeds <= 0)
    return seeds;
  seeds.reserve(static_cast<std::size_t>(n_seeds));
  const double h = (grid.y_max - grid.y_min) / n_seeds;
  for (int k = 0; k < n_seeds; ++k)
    seeds.push_back({seed_x, grid.y_min + (k + 0.5) * h});
  return seeds;
}

Streamline trace_streamline(const FlowField &field, const Vec2 &seed,
                            const TraceSettings &settings) {
  const FlowGrid &g = *field.grid;

  Streamline line;
  line.seed = seed;
  line.end = StreamlineEnd::DOMAIN_EXIT;
  if (!g.contains(seed.x, seed.y))
    return line;

  line.points.reserve(static_cast<std::size_t>(settings.step_budget) + 1);
  Vec2 p = seed;
  Vec2 k1 = sample_velocity(field, p.x, p.y);
  line.points.push_back({p.x, p.y, std::hypot(k1.x, k1.y)});

  const double h = settings.step_size;
  // ------------------------------------------------------------
  // Classical RK4, one step per sample.
  // Stages may probe outside the grid; interpolation clamps there.
  // ------------------------------------------------------------
  for (int n = 0; n < settings.step_budget; ++n) {
    Vec2 k2 = sample_velocity(field, p.x + 0.5 * h * k1.x, p.y + 0.5 * h * k1.y);
    Vec2 k3 = sample_velocity(field, p.x + 0.5 * h * k2.x, p.y + 0.5 * h * k2.y);
    Vec2 k4 = sample_velocity(field, p.x + h * k3.x, p.y + h * k3.y);

    Vec2 next;
    next.x = p.x + h / 6.0 * (k1.x + 2.0 * k2.x + 2.0 * k3.x + k4.x);
    next.y = p.y + h / 6.0 * (k1.y + 2.0 * k2.y + 2.0 * k3.y + k4.y);

    // crossing the boundary ends the line (the outside point is dropped)
    if (!g.contains(next.x, next.y))
      return line;

    p = next;
    k1 = sample_velocity(field, p.x, p.y);
    line.points.push_back({p.x, p.y, std::hypot(k1.x, k1.y)});
  }

  line.end = StreamlineEnd::STEP_BUDGET;
  return line;
}

std::vector<Streamline> trace_streamlines(const FlowField &field,
                                          const std::vector<Vec2> &seeds,
                                          const TraceSettings &settings) {
  if (seeds.empty())
    throw ConfigurationError("seed points", "at least one seed point");
  if (settings.step_budget <= 0)
    throw ConfigurationError("step_budget", "a positive step count");
  if (!(settings.step_size > 0.0))
    throw ConfigurationError("step_size", "a positive step [s]");

  std::vector<Streamline> lines;
  lines.reserve(seeds.size());
  for (const auto &seed : seeds)
    lines.push_back(trace_streamline(field, seed, settings));
  return lines;
}
