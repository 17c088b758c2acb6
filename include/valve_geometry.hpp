#pragma once

#include "severity_profile.hpp"

#include <cstddef>
#include <string>
#include <vector>

//---------------------------------------------
// 2D tricuspid valve structure (immersed-boundary style)
// Units:
//   positions: cm
//   spring stiffness: dyne/cm
//   beam rigidity: dyne·cm
//---------------------------------------------

constexpr int N_LEAFLETS = 3;
constexpr double ANNULUS_RADIUS = 1.0;     // attachment ring radius [cm]
constexpr double LEAFLET_LENGTH = 1.2;     // nominal annulus -> free edge [cm]
constexpr double LEAFLET_CURVATURE = 0.3;  // max angular bow of a leaflet [rad]
constexpr double BASE_STIFFNESS = 5.0e2;   // healthy spring stiffness
constexpr double BASE_RIGIDITY = 1.0e-2;   // healthy beam rigidity
constexpr double CROSS_SPRING_FACTOR = 0.5; // cross spring / longitudinal
constexpr int MIN_RESOLUTION = 3;          // smallest leaflet carrying a beam

struct Vec2 {
  double x;
  double y;
};

// 1-1. Lagrangian point, owned by the ValveGeometry that created it
struct Vertex {
  int id;
  Vec2 base_position; // [cm]
};

// 1-2. Distance-preserving link
struct Spring {
  int vertex_a;
  int vertex_b;
  double rest_length; // [cm]
  double stiffness;
};

// 1-3. Curvature-preserving link over three consecutive points
struct Beam {
  int vertex_a;
  int vertex_b;
  int vertex_c;
  double rigidity;
};

// 1-4. Immutable base geometry for one (resolution, severity) pair.
// Vertex i of leaflet k has id k * resolution + i (0 = annulus).
struct ValveGeometry {
  int resolution; // points per leaflet
  SeverityProfile severity;
  std::vector<Vertex> vertices;
  std::vector<Spring> springs;
  std::vector<Beam> beams;
};

// 2. Generator: pure function of (resolution, severity), no hidden state.
// Throws ConfigurationError if resolution < MIN_RESOLUTION.
ValveGeometry generate_valve_geometry(int resolution,
                                      const SeverityProfile &severity);
// Same, looking the severity up by name (unknown name -> ConfigurationError)
ValveGeometry generate_valve_geometry(int resolution,
                                      const std::string &severity_name,
                                      const SeverityCatalog &catalog);

// Spacing (in points) of the cross springs of one leaflet
int cross_spring_skip(int resolution);
std::size_t expected_spring_count(int resolution);
std::size_t expected_beam_count(int resolution);

std::vector<Vec2> base_positions(const ValveGeometry &geom);

// 3. Geometric properties
struct GeometryProperties {
  Vec2 center;          // vertex centroid [cm]
  double min_radius;    // about the centroid [cm]
  double max_radius;    // [cm]
  double radial_extent; // max - min [cm]
  double orifice_area;  // convex hull area [cm^2]
  double avg_stiffness;
  double max_stiffness;
  std::size_t n_vertices;
  std::size_t n_springs;
  std::size_t n_beams;
};

// Area of the convex hull (Andrew's monotone chain); 0 for < 3 points
double convex_hull_area(std::vector<Vec2> points);
GeometryProperties compute_geometry_properties(const ValveGeometry &geom);
