#pragma once

#include "valve_geometry.hpp"

#include <string>
#include <vector>

//---------------------------------------------
// Geometry files for the external immersed-boundary FSI solver
//   .vertex : n, then "x<TAB>y"                       [cm]
//   .spring : n, then "a b stiffness rest_length"
//   .beam   : n, then "a b c rigidity"
// Reals are written in %e notation, indices right-aligned in 6 columns.
//---------------------------------------------

// <prefix>_<severity>_<resolution>
std::string geometry_file_stem(const std::string &prefix,
                               const ValveGeometry &geom);

bool write_vertex_file(const std::string &filename,
                       const std::vector<Vec2> &positions);
bool write_spring_file(const std::string &filename,
                       const std::vector<Spring> &springs);
bool write_beam_file(const std::string &filename,
                     const std::vector<Beam> &beams);

// Writes <stem>.vertex, <stem>.spring and <stem>.beam
bool write_geometry_files(const std::string &prefix, const ValveGeometry &geom);

bool load_vertex_file(const std::string &filename,
                      std::vector<Vec2> &positions);
bool load_spring_file(const std::string &filename,
                      std::vector<Spring> &springs);
bool load_beam_file(const std::string &filename, std::vector<Beam> &beams);
