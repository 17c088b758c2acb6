#include "geometry_io.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

// Reads the leading record count. Reports and returns false on failure.
bool read_count(std::istream &fin, const std::string &filename,
                std::size_t &count) {
  std::string line;
  while (std::getline(fin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos)
      continue;
    std::stringstream ss(line);
    long n = -1;
    if (!(ss >> n) || n < 0) {
      std::cerr << "Error: bad record count in " << filename << "\n";
      return false;
    }
    count = static_cast<std::size_t>(n);
    return true;
  }
  std::cerr << "Error: empty geometry file: " << filename << "\n";
  return false;
}

bool open_for_write(std::ofstream &fout, const std::string &filename) {
  fout.open(filename);
  if (!fout) {
    std::cerr << "Error: cannot open output file: " << filename << "\n";
    return false;
  }
  fout << std::scientific << std::setprecision(6);
  return true;
}

} // namespace

std::string geometry_file_stem(const std::string &prefix,
                               const ValveGeometry &geom) {
  return prefix + "_" + geom.severity.name + "_" +
         std::to_string(geom.resolution);
}

bool write_vertex_file(const std::string &filename,
                       const std::vector<Vec2> &positions) {
  std::ofstream fout;
  if (!open_for_write(fout, filename))
    return false;

  fout << positions.size() << "\n";
  for (const auto &p : positions)
    fout << p.x << "\t" << p.y << "\n";
  return static_cast<bool>(fout);
}

bool write_spring_file(const std::string &filename,
                       const std::vector<Spring> &springs) {
  std::ofstream fout;
  if (!open_for_write(fout, filename))
    return false;

  fout << springs.size() << "\n";
  for (const auto &s : springs) {
    fout << std::setw(6) << s.vertex_a << " " << std::setw(6) << s.vertex_b
         << " " << s.stiffness << " " << s.rest_length << "\n";
  }
  return static_cast<bool>(fout);
}

bool write_beam_file(const std::string &filename,
                     const std::vector<Beam> &beams) {
  std::ofstream fout;
  if (!open_for_write(fout, filename))
    return false;

  fout << beams.size() << "\n";
  for (const auto &b : beams) {
    fout << std::setw(6) << b.vertex_a << " " << std::setw(6) << b.vertex_b
         << " " << std::setw(6) << b.vertex_c << " " << b.rigidity << "\n";
  }
  return static_cast<bool>(fout);
}

bool write_geometry_files(const std::string &prefix,
                          const ValveGeometry &geom) {
  const std::string stem = geometry_file_stem(prefix, geom);
  if (!write_vertex_file(stem + ".vertex", base_positions(geom)))
    return false;
  if (!write_spring_file(stem + ".spring", geom.springs))
    return false;
  if (!write_beam_file(stem + ".beam", geom.beams))
    return false;

  std::cout << "Written " << geom.vertices.size() << " vertices, "
            << geom.springs.size() << " springs, " << geom.beams.size()
            << " beams to " << stem << ".{vertex,spring,beam}\n";
  return true;
}

bool load_vertex_file(const std::string &filename,
                      std::vector<Vec2> &positions) {
  std::ifstream fin(filename);
  if (!fin) {
    std::cerr << "Error: cannot open vertex file: " << filename << "\n";
    return false;
  }

  std::size_t n = 0;
  if (!read_count(fin, filename, n))
    return false;

  positions.clear();
  positions.reserve(n);
  std::string line;
  while (positions.size() < n && std::getline(fin, line)) {
    std::stringstream ss(line);
    Vec2 p;
    if (!(ss >> p.x >> p.y)) {
      std::cerr << "Error: could not parse vertex line: " << line << "\n";
      return false;
    }
    positions.push_back(p);
  }

  if (positions.size() != n) {
    std::cerr << "Error: expected " << n << " vertices in " << filename
              << ", found " << positions.size() << "\n";
    return false;
  }
  return true;
}

bool load_spring_file(const std::string &filename,
                      std::vector<Spring> &springs) {
  std::ifstream fin(filename);
  if (!fin) {
    std::cerr << "Error: cannot open spring file: " << filename << "\n";
    return false;
  }

  std::size_t n = 0;
  if (!read_count(fin, filename, n))
    return false;

  springs.clear();
  springs.reserve(n);
  std::string line;
  while (springs.size() < n && std::getline(fin, line)) {
    std::stringstream ss(line);
    Spring s;
    if (!(ss >> s.vertex_a >> s.vertex_b >> s.stiffness >> s.rest_length)) {
      std::cerr << "Error: could not parse spring line: " << line << "\n";
      return false;
    }
    springs.push_back(s);
  }

  if (springs.size() != n) {
    std::cerr << "Error: expected " << n << " springs in " << filename
              << ", found " << springs.size() << "\n";
    return false;
  }
  return true;
}

bool load_beam_file(const std::string &filename, std::vector<Beam> &beams) {
  std::ifstream fin(filename);
  if (!fin) {
    std::cerr << "Error: cannot open beam file: " << filename << "\n";
    return false;
  }

  std::size_t n = 0;
  if (!read_count(fin, filename, n))
    return false;

  beams.clear();
  beams.reserve(n);
  std::string line;
  while (beams.size() < n && std::getline(fin, line)) {
    std::stringstream ss(line);
    Beam b;
    if (!(ss >> b.vertex_a >> b.vertex_b >> b.vertex_c >> b.rigidity)) {
      std::cerr << "Error: could not parse beam line: " << line << "\n";
      return false;
    }
    beams.push_back(b);
  }

  if (beams.size() != n) {
    std::cerr << "Error: expected " << n << " beams in " << filename
              << ", found " << beams.size() << "\n";
    return false;
  }
  return true;
}
