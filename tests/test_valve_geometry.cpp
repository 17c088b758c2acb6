#include "geometry_io.hpp"
#include "severity_profile.hpp"
#include "valve_errors.hpp"
#include "valve_geometry.hpp"
#include <catch2/catch.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

TEST_CASE("SEVERITY CATALOG", "[severity]") {
  const SeverityCatalog &catalog = default_severity_catalog();

  SECTION("Default presets") {
    REQUIRE(catalog.size() == 4);
    REQUIRE(catalog.contains("healthy"));
    REQUIRE(catalog.contains("severe"));
    REQUIRE_FALSE(catalog.contains("critical"));

    const SeverityProfile &severe = catalog.at("severe");
    REQUIRE_THAT(severe.max_opening, Catch::Matchers::WithinAbs(0.4, 1e-12));
    REQUIRE_THAT(severe.stiffness_mult, Catch::Matchers::WithinAbs(6.0, 1e-12));
    REQUIRE_THAT(severe.resistance_coeff,
                 Catch::Matchers::WithinAbs(5.0, 1e-12));
  }
  SECTION("Unknown name is rejected, no fallback") {
    REQUIRE_THROWS_AS(catalog.at("critical"), ConfigurationError);
  }
  SECTION("Invalid presets") {
    SeverityProfile p{"bad", 1.0, 1.0, 1.0, 1.0, 1.5, 100.0, 5.0, 1.0};
    std::vector<SeverityProfile> one{p};
    REQUIRE_THROWS_AS(SeverityCatalog(one), ConfigurationError);
    std::vector<SeverityProfile> none;
    REQUIRE_THROWS_AS(SeverityCatalog(none), ConfigurationError);

    SeverityProfile ok{"ok", 1.0, 1.0, 1.0, 1.0, 0.5, 100.0, 5.0, 1.0};
    std::vector<SeverityProfile> twice{ok, ok};
    REQUIRE_THROWS_AS(SeverityCatalog(twice), ConfigurationError);
  }
}

TEST_CASE("GEOMETRY TOPOLOGY", "[geometry]") {
  const SeverityCatalog &catalog = default_severity_catalog();

  SECTION("Counts at resolution 64") {
    ValveGeometry g = generate_valve_geometry(64, "healthy", catalog);
    REQUIRE(g.vertices.size() == 192);
    // 3 * 63 longitudinal + 3 * 7 cross
    REQUIRE(g.springs.size() == 210);
    REQUIRE(g.beams.size() == 186);
    REQUIRE(g.springs.size() == expected_spring_count(64));
    REQUIRE(g.beams.size() == expected_beam_count(64));
    REQUIRE(cross_spring_skip(64) == 8);
  }
  SECTION("Smallest resolution") {
    ValveGeometry g = generate_valve_geometry(MIN_RESOLUTION, "healthy", catalog);
    REQUIRE(g.vertices.size() == 9);
    REQUIRE(g.beams.size() == 3);
    REQUIRE(g.springs.size() == expected_spring_count(MIN_RESOLUTION));
  }
  SECTION("Every index refers to an existing vertex") {
    ValveGeometry g = generate_valve_geometry(32, "moderate", catalog);
    const int n = static_cast<int>(g.vertices.size());
    for (std::size_t k = 0; k < g.vertices.size(); ++k)
      REQUIRE(g.vertices[k].id == static_cast<int>(k));
    for (const auto &s : g.springs) {
      REQUIRE(s.vertex_a >= 0);
      REQUIRE(s.vertex_b < n);
      REQUIRE(s.vertex_a != s.vertex_b);
      REQUIRE(s.rest_length > 0.0);
    }
    for (const auto &b : g.beams) {
      REQUIRE(b.vertex_b == b.vertex_a + 1);
      REQUIRE(b.vertex_c == b.vertex_a + 2);
      REQUIRE(b.vertex_c < n);
    }
  }
  SECTION("Same topology for every severity") {
    ValveGeometry healthy = generate_valve_geometry(48, "healthy", catalog);
    ValveGeometry severe = generate_valve_geometry(48, "severe", catalog);
    REQUIRE(healthy.springs.size() == severe.springs.size());
    REQUIRE(healthy.beams.size() == severe.beams.size());
    for (std::size_t k = 0; k < healthy.springs.size(); ++k) {
      REQUIRE(healthy.springs[k].vertex_a == severe.springs[k].vertex_a);
      REQUIRE(healthy.springs[k].vertex_b == severe.springs[k].vertex_b);
    }
    for (std::size_t k = 0; k < healthy.beams.size(); ++k) {
      REQUIRE(healthy.beams[k].vertex_a == severe.beams[k].vertex_a);
      REQUIRE(healthy.beams[k].vertex_b == severe.beams[k].vertex_b);
      REQUIRE(healthy.beams[k].vertex_c == severe.beams[k].vertex_c);
    }
    // stiffer, shorter leaflets
    REQUIRE_THAT(severe.springs[0].stiffness,
                 Catch::Matchers::WithinAbs(6.0 * BASE_STIFFNESS, 1e-9));
    REQUIRE_THAT(severe.beams[0].rigidity,
                 Catch::Matchers::WithinAbs(10.0 * BASE_RIGIDITY, 1e-12));
  }
  SECTION("Deterministic") {
    ValveGeometry a = generate_valve_geometry(40, "mild", catalog);
    ValveGeometry b = generate_valve_geometry(40, "mild", catalog);
    for (std::size_t k = 0; k < a.vertices.size(); ++k) {
      REQUIRE(a.vertices[k].base_position.x == b.vertices[k].base_position.x);
      REQUIRE(a.vertices[k].base_position.y == b.vertices[k].base_position.y);
    }
  }
  SECTION("Invalid input") {
    REQUIRE_THROWS_AS(generate_valve_geometry(2, "healthy", catalog),
                      ConfigurationError);
    REQUIRE_THROWS_AS(generate_valve_geometry(0, "healthy", catalog),
                      ConfigurationError);
    REQUIRE_THROWS_AS(generate_valve_geometry(64, "critical", catalog),
                      ConfigurationError);
  }
}

TEST_CASE("GEOMETRIC PROPERTIES", "[geometry]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  GeometryProperties healthy =
      compute_geometry_properties(generate_valve_geometry(64, "healthy", catalog));
  GeometryProperties severe =
      compute_geometry_properties(generate_valve_geometry(64, "severe", catalog));

  SECTION("Annulus and free edge") {
    // three-fold symmetry puts the centroid at the origin
    REQUIRE_THAT(healthy.center.x, Catch::Matchers::WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(healthy.center.y, Catch::Matchers::WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(healthy.min_radius, Catch::Matchers::WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(healthy.max_radius, Catch::Matchers::WithinAbs(2.2, 1e-9));
    REQUIRE_THAT(severe.max_radius, Catch::Matchers::WithinAbs(1.84, 1e-9));
  }
  SECTION("Orifice area shrinks with severity") {
    REQUIRE_THAT(healthy.orifice_area, Catch::Matchers::WithinAbs(6.39, 0.01));
    REQUIRE_THAT(severe.orifice_area, Catch::Matchers::WithinAbs(4.40, 0.01));
    REQUIRE(severe.orifice_area < healthy.orifice_area);
  }
  SECTION("Stiffness") {
    REQUIRE_THAT(healthy.max_stiffness,
                 Catch::Matchers::WithinAbs(BASE_STIFFNESS, 1e-9));
    REQUIRE(healthy.avg_stiffness < healthy.max_stiffness);
    REQUIRE(severe.avg_stiffness > healthy.avg_stiffness);
  }
  SECTION("Convex hull") {
    std::vector<Vec2> square{{0, 0}, {2, 0}, {2, 2}, {0, 2}, {1, 1}, {1, 0}};
    REQUIRE_THAT(convex_hull_area(square), Catch::Matchers::WithinAbs(4.0, 1e-12));
    std::vector<Vec2> line{{0, 0}, {1, 1}, {2, 2}};
    REQUIRE_THAT(convex_hull_area(line), Catch::Matchers::WithinAbs(0.0, 1e-12));
  }
}

TEST_CASE("GEOMETRY FILES", "[geometry, io]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  ValveGeometry g = generate_valve_geometry(16, "moderate", catalog);
  const std::string prefix =
      (std::filesystem::temp_directory_path() / "valve2d_test").string();
  const std::string stem = geometry_file_stem(prefix, g);
  REQUIRE(stem == prefix + "_moderate_16");

  SECTION("Non-existent file") {
    std::vector<Vec2> positions;
    REQUIRE(load_vertex_file("non_existent_file.vertex", positions) == false);
  }
  SECTION("Written files read back") {
    REQUIRE(write_geometry_files(prefix, g));

    std::vector<Vec2> positions;
    std::vector<Spring> springs;
    std::vector<Beam> beams;
    REQUIRE(load_vertex_file(stem + ".vertex", positions));
    REQUIRE(load_spring_file(stem + ".spring", springs));
    REQUIRE(load_beam_file(stem + ".beam", beams));

    REQUIRE(positions.size() == g.vertices.size());
    REQUIRE(springs.size() == g.springs.size());
    REQUIRE(beams.size() == g.beams.size());

    // six significant digits on disk
    REQUIRE_THAT(positions[5].x, Catch::Matchers::WithinRel(
                                     g.vertices[5].base_position.x, 1e-5));
    REQUIRE(springs.back().vertex_a == g.springs.back().vertex_a);
    REQUIRE(springs.back().vertex_b == g.springs.back().vertex_b);
    REQUIRE_THAT(springs.back().stiffness,
                 Catch::Matchers::WithinRel(g.springs.back().stiffness, 1e-5));
    REQUIRE(beams[7].vertex_c == g.beams[7].vertex_c);

    std::filesystem::remove(stem + ".vertex");
    std::filesystem::remove(stem + ".spring");
    std::filesystem::remove(stem + ".beam");
  }
  SECTION("Text layout") {
    ValveGeometry h = generate_valve_geometry(64, "healthy", catalog);
    const std::string h_stem = geometry_file_stem(prefix, h);
    REQUIRE(write_geometry_files(prefix, h));

    auto first_lines = [](const std::string &path, std::size_t n) {
      std::vector<std::string> lines;
      std::ifstream fin(path);
      std::string line;
      while (lines.size() < n && std::getline(fin, line))
        lines.push_back(line);
      return lines;
    };

    // count line, then tab-separated x y
    std::vector<std::string> vertex = first_lines(h_stem + ".vertex", 3);
    REQUIRE(vertex.size() == 3);
    REQUIRE(vertex[0] == "192");
    REQUIRE(vertex[1] == "1.000000e+00\t0.000000e+00");
    REQUIRE(vertex[2] == "1.018934e+00\t1.523419e-02");

    // a b stiffness rest_length; cross springs follow the 189 longitudinal ones
    std::vector<std::string> spring = first_lines(h_stem + ".spring", 191);
    REQUIRE(spring.size() == 191);
    REQUIRE(spring[0] == "210");
    REQUIRE(spring[1] == "     0      1 5.000000e+02 2.430159e-02");
    REQUIRE(spring[190] == "     0      8 2.500000e+02 1.958350e-01");

    // a b c rigidity
    std::vector<std::string> beam = first_lines(h_stem + ".beam", 2);
    REQUIRE(beam.size() == 2);
    REQUIRE(beam[0] == "186");
    REQUIRE(beam[1] == "     0      1      2 1.000000e-02");

    std::filesystem::remove(h_stem + ".vertex");
    std::filesystem::remove(h_stem + ".spring");
    std::filesystem::remove(h_stem + ".beam");
  }
}
