#include "valve_geometry.hpp"
#include "valve_errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

double distance(const Vec2 &a, const Vec2 &b) {
  return std::hypot(b.x - a.x, b.y - a.y);
}

double cross(const Vec2 &o, const Vec2 &a, const Vec2 &b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

int cross_springs_per_leaflet(int resolution) {
  int skip = cross_spring_skip(resolution);
  int count = 0;
  for (int i = 0; i < resolution - skip - 1; i += skip)
    ++count;
  return count;
}

} // namespace

int cross_spring_skip(int resolution) { return std::max(1, resolution / 8); }

std::size_t expected_spring_count(int resolution) {
  return static_cast<std::size_t>(N_LEAFLETS) *
         static_cast<std::size_t>((resolution - 1) +
                                  cross_springs_per_leaflet(resolution));
}

std::size_t expected_beam_count(int resolution) {
  return static_cast<std::size_t>(N_LEAFLETS) *
         static_cast<std::size_t>(resolution - 2);
}

ValveGeometry generate_valve_geometry(int resolution,
                                      const SeverityProfile &severity) {
  if (resolution < MIN_RESOLUTION) {
    throw ConfigurationError("resolution",
                             "an integer >= " + std::to_string(MIN_RESOLUTION) +
                                 " points per leaflet, got " +
                                 std::to_string(resolution));
  }

  ValveGeometry geom;
  geom.resolution = resolution;
  geom.severity = severity;
  geom.vertices.reserve(static_cast<std::size_t>(N_LEAFLETS * resolution));
  geom.springs.reserve(expected_spring_count(resolution));
  geom.beams.reserve(expected_beam_count(resolution));

  const double leaflet_length = LEAFLET_LENGTH * severity.leaflet_length_frac;

  // 1) Vertices: three leaflets 120 degrees apart, annulus (s=0) to free
  //    edge (s=1). Stiffer leaflets bow less (curvature ~ mobility).
  for (int k = 0; k < N_LEAFLETS; ++k) {
    double theta_center = k * (2.0 * M_PI / N_LEAFLETS);
    for (int i = 0; i < resolution; ++i) {
      double s = static_cast<double>(i) / (resolution - 1);
      double r = ANNULUS_RADIUS + leaflet_length * s;
      double bow = LEAFLET_CURVATURE * (1.0 - s * s) * severity.mobility_frac;
      double theta = theta_center + bow * std::sin(M_PI * s);

      Vertex v;
      v.id = k * resolution + i;
      v.base_position = {r * std::cos(theta), r * std::sin(theta)};
      geom.vertices.push_back(v);
    }
  }

  auto add_spring = [&geom](int a, int b, double stiffness) {
    double rest = distance(geom.vertices[a].base_position,
                           geom.vertices[b].base_position);
    geom.springs.push_back({a, b, rest, stiffness});
  };

  const double stiffness = BASE_STIFFNESS * severity.stiffness_mult;
  const double rigidity = BASE_RIGIDITY * severity.rigidity_mult;

  // 2) Longitudinal springs between consecutive points of a leaflet
  for (int k = 0; k < N_LEAFLETS; ++k) {
    int base = k * resolution;
    for (int i = 0; i < resolution - 1; ++i)
      add_spring(base + i, base + i + 1, stiffness);
  }

  // 3) Beams over every three consecutive points
  for (int k = 0; k < N_LEAFLETS; ++k) {
    int base = k * resolution;
    for (int i = 0; i < resolution - 2; ++i)
      geom.beams.push_back({base + i, base + i + 1, base + i + 2, rigidity});
  }

  // 4) Cross springs every `skip` points, starting at the annulus
  const int skip = cross_spring_skip(resolution);
  for (int k = 0; k < N_LEAFLETS; ++k) {
    int base = k * resolution;
    for (int i = 0; i < resolution - skip - 1; i += skip)
      add_spring(base + i, base + i + skip, stiffness * CROSS_SPRING_FACTOR);
  }

  return geom;
}

ValveGeometry generate_valve_geometry(int resolution,
                                      const std::string &severity_name,
                                      const SeverityCatalog &catalog) {
  return generate_valve_geometry(resolution, catalog.at(severity_name));
}

std::vector<Vec2> base_positions(const ValveGeometry &geom) {
  std::vector<Vec2> out;
  out.reserve(geom.vertices.size());
  for (const auto &v : geom.vertices)
    out.push_back(v.base_position);
  return out;
}

double convex_hull_area(std::vector<Vec2> points) {
  if (points.size() < 3)
    return 0.0;

  std::sort(points.begin(), points.end(), [](const Vec2 &a, const Vec2 &b) {
    return a.x < b.x || (a.x == b.x && a.y < b.y);
  });

  // lower + upper chains, collinear points dropped
  std::vector<Vec2> hull(2 * points.size());
  std::size_t n = 0;
  for (std::size_t i = 0; i < points.size(); ++i) {
    while (n >= 2 && cross(hull[n - 2], hull[n - 1], points[i]) <= 0.0)
      --n;
    hull[n++] = points[i];
  }
  for (std::size_t i = points.size() - 1, lower = n + 1; i-- > 0;) {
    while (n >= lower && cross(hull[n - 2], hull[n - 1], points[i]) <= 0.0)
      --n;
    hull[n++] = points[i];
  }
  // last point repeats the first
  if (n < 4)
    return 0.0;
  n -= 1;

  double twice_area = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 &a = hull[i];
    const Vec2 &b = hull[(i + 1) % n];
    twice_area += a.x * b.y - b.x * a.y;
  }
  return 0.5 * std::abs(twice_area);
}

GeometryProperties compute_geometry_properties(const ValveGeometry &geom) {
  GeometryProperties props{};
  props.n_vertices = geom.vertices.size();
  props.n_springs = geom.springs.size();
  props.n_beams = geom.beams.size();
  if (geom.vertices.empty())
    return props;

  for (const auto &v : geom.vertices) {
    props.center.x += v.base_position.x;
    props.center.y += v.base_position.y;
  }
  props.center.x /= static_cast<double>(props.n_vertices);
  props.center.y /= static_cast<double>(props.n_vertices);

  props.min_radius = distance(props.center, geom.vertices.front().base_position);
  props.max_radius = props.min_radius;
  for (const auto &v : geom.vertices) {
    double r = distance(props.center, v.base_position);
    props.min_radius = std::min(props.min_radius, r);
    props.max_radius = std::max(props.max_radius, r);
  }
  props.radial_extent = props.max_radius - props.min_radius;
  props.orifice_area = convex_hull_area(base_positions(geom));

  if (!geom.springs.empty()) {
    double sum = 0.0;
    for (const auto &s : geom.springs) {
      sum += s.stiffness;
      props.max_stiffness = std::max(props.max_stiffness, s.stiffness);
    }
    props.avg_stiffness = sum / static_cast<double>(geom.springs.size());
  }
  return props;
}
