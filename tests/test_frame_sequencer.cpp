#include "frame_io.hpp"
#include "frame_sequencer.hpp"
#include "valve_config.hpp"
#include "valve_errors.hpp"
#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

SequencerSettings small_run(const FlowGrid &grid) {
  SequencerSettings settings;
  settings.resolution = 8;
  settings.severities = {"healthy", "severe"};
  settings.total_frames = 8;
  settings.cycles = 1;
  settings.trace.step_budget = 20;
  settings.seeds = make_seed_line(grid, -1.5, 3);
  return settings;
}

std::vector<std::string> read_lines(const std::string &path) {
  std::vector<std::string> lines;
  std::ifstream fin(path);
  std::string line;
  while (std::getline(fin, line))
    lines.push_back(line);
  return lines;
}

MetricSample summary_sample(const std::string &severity, double velocity,
                            double gradient, double area) {
  MetricSample m{};
  m.severity = severity;
  m.phase = CardiacPhase::SYSTOLE;
  m.peak_velocity = velocity;
  m.pressure_gradient = gradient;
  m.effective_orifice_area = area;
  m.cardiac_output = 5.0;
  return m;
}

} // namespace

TEST_CASE("HANDLE INPUT FILE CORRECTLY", "[input]") {
  RunConfig cfg;

  SECTION("Non-existent file") {
    bool result = load_input_file("non_existent_file.inp", cfg);
    REQUIRE(result == false);
  }
  // NOTE: reads the input file copied next to the test binary at build time
  SECTION("Existing file") {
    bool result = load_input_file("input/valve.inp", cfg);
    REQUIRE(result == true);
    REQUIRE(cfg.resolution == 64);
    REQUIRE(cfg.severities.size() == 4);
    REQUIRE(cfg.severities[0] == "healthy");
    REQUIRE(cfg.severities[3] == "severe");
    REQUIRE_THAT(cfg.timing.cycle_duration,
                 Catch::Matchers::WithinAbs(0.8, 1e-12));
    REQUIRE_THAT(cfg.timing.systole_fraction,
                 Catch::Matchers::WithinAbs(0.375, 1e-12));
    REQUIRE(cfg.grid_nx == 81);
    REQUIRE_THAT(cfg.trace.step_size, Catch::Matchers::WithinAbs(0.002, 1e-12));
    REQUIRE_THAT(cfg.metrics.assumed_cross_section,
                 Catch::Matchers::WithinAbs(3.5, 1e-12));
    REQUIRE(cfg.output_prefix == "valve2d");
    REQUIRE(cfg.write_frames == false);
    REQUIRE(cfg.frame_stride == 10);

    REQUIRE_NOTHROW(validate_config(cfg, default_severity_catalog()));
  }
  SECTION("Malformed value") {
    const std::string path =
        (std::filesystem::temp_directory_path() / "valve_bad.inp").string();
    {
      std::ofstream fout(path);
      fout << "# broken\nresolution = sixty-four\n";
    }
    try {
      load_input_file(path, cfg);
      FAIL("expected ConfigurationError");
    } catch (const ConfigurationError &e) {
      REQUIRE(e.field() == "resolution");
    }
    std::filesystem::remove(path);
  }
  SECTION("Severity list") {
    std::vector<std::string> names = split_names(" healthy ,severe,, mild ");
    REQUIRE(names.size() == 3);
    REQUIRE(names[0] == "healthy");
    REQUIRE(names[2] == "mild");
  }
}

TEST_CASE("CONFIGURATION CHECKS", "[input]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  RunConfig cfg;
  REQUIRE_NOTHROW(validate_config(cfg, catalog));

  SECTION("Resolution") {
    cfg.resolution = 2;
    REQUIRE_THROWS_AS(validate_config(cfg, catalog), ConfigurationError);
  }
  SECTION("Unknown severity") {
    cfg.severities = {"healthy", "critical"};
    REQUIRE_THROWS_AS(validate_config(cfg, catalog), ConfigurationError);
  }
  SECTION("Systole longer than the cycle") {
    cfg.timing.systole_fraction = 1.2;
    REQUIRE_THROWS_AS(validate_config(cfg, catalog), ConfigurationError);
  }
  SECTION("Seed line outside the grid") {
    cfg.seed_x = 10.0;
    REQUIRE_THROWS_AS(validate_config(cfg, catalog), ConfigurationError);
  }
  SECTION("Grid") {
    cfg.grid_nx = 1;
    REQUIRE_THROWS_AS(validate_config(cfg, catalog), ConfigurationError);
  }
}

TEST_CASE("FRAME SEQUENCER", "[sequencer]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  auto grid = make_flow_grid(-2.0, 2.0, 5, -2.0, 2.0, 5);
  FrameSequencer seq(catalog, grid, small_run(*grid));

  SECTION("Sample times") {
    REQUIRE(seq.size() == 8);
    REQUIRE_THAT(seq.time_at(0), Catch::Matchers::WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(seq.time_at(4), Catch::Matchers::WithinAbs(0.4, 1e-12));
    REQUIRE_THAT(seq.time_at(7), Catch::Matchers::WithinAbs(0.7, 1e-12));
  }
  SECTION("Base geometry per severity") {
    REQUIRE(seq.geometries().size() == 2);
    REQUIRE(seq.geometry("severe").severity.name == "severe");
    REQUIRE(seq.base_area("severe") < seq.base_area("healthy"));
    REQUIRE_THROWS_AS(seq.geometry("mild"), std::out_of_range);
  }
  SECTION("One frame") {
    FrameRecord r = seq.frame(1); // t = 0.1, systole
    REQUIRE(r.index == 1);
    REQUIRE(r.severities.size() == 2);
    REQUIRE(r.severities[0].severity == "healthy");
    REQUIRE(r.severities[1].severity == "severe");

    const SeverityFrame &sf = r.severities[1];
    REQUIRE(sf.state.phase == CardiacPhase::SYSTOLE);
    REQUIRE(sf.deformed_vertices.size() == 24);
    REQUIRE(sf.streamlines.size() == 3);
    for (const auto &l : sf.streamlines)
      REQUIRE(l.points.size() <= 21);
    REQUIRE(sf.metrics.severity == "severe");
    REQUIRE(sf.metrics.opening_fraction == sf.state.opening_fraction);
    REQUIRE(sf.flow.grid == grid);
  }
  SECTION("Frames are independent of evaluation order") {
    FrameRecord first = seq.frame(5);
    seq.frame(2);
    seq.frame(7);
    FrameRecord again = seq.frame(5);
    for (std::size_t s = 0; s < first.severities.size(); ++s) {
      const MetricSample &a = first.severities[s].metrics;
      const MetricSample &b = again.severities[s].metrics;
      REQUIRE(a.t == b.t);
      REQUIRE(a.peak_velocity == b.peak_velocity);
      REQUIRE(a.pressure_gradient == b.pressure_gradient);
      REQUIRE(first.severities[s].flow.U == again.severities[s].flow.U);
    }
  }
  SECTION("Iteration is lazy and restartable") {
    int count = 0;
    double last_t = -1.0;
    for (const FrameRecord &r : seq) {
      REQUIRE(r.t > last_t);
      last_t = r.t;
      ++count;
    }
    REQUIRE(count == 8);

    int again = 0;
    seq.run([&again](const FrameRecord &r) {
      REQUIRE(r.index == again);
      ++again;
    });
    REQUIRE(again == 8);
  }
  SECTION("Out of range") {
    REQUIRE_THROWS_AS(seq.frame(-1), std::out_of_range);
    REQUIRE_THROWS_AS(seq.frame(8), std::out_of_range);
  }
  SECTION("Accumulated cycle") {
    MetricsAccumulator healthy("healthy");
    MetricsAccumulator severe("severe");
    for (const FrameRecord &r : seq) {
      healthy.add(r.severities[0].metrics);
      severe.add(r.severities[1].metrics);
    }
    CycleSummary h = healthy.summary(ClassificationThresholds{});
    CycleSummary s = severe.summary(ClassificationThresholds{});
    REQUIRE(h.n_samples == 8);
    REQUIRE(s.peak_velocity > h.peak_velocity);
    REQUIRE(s.mean_gradient > h.mean_gradient);

    std::string report = format_clinical_report(s, catalog.at("severe"));
    REQUIRE(report.find("Valve condition: severe") != std::string::npos);
  }
}

TEST_CASE("SEQUENCER CONFIGURATION", "[sequencer]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  auto grid = make_flow_grid(-2.0, 2.0, 5, -2.0, 2.0, 5);

  SECTION("Rejected before any frame") {
    SequencerSettings settings = small_run(*grid);
    settings.total_frames = 0;
    REQUIRE_THROWS_AS(FrameSequencer(catalog, grid, settings),
                      ConfigurationError);

    settings = small_run(*grid);
    settings.severities = {"critical"};
    REQUIRE_THROWS_AS(FrameSequencer(catalog, grid, settings),
                      ConfigurationError);

    settings = small_run(*grid);
    settings.seeds.clear();
    REQUIRE_THROWS_AS(FrameSequencer(catalog, grid, settings),
                      ConfigurationError);

    settings = small_run(*grid);
    settings.resolution = 1;
    REQUIRE_THROWS_AS(FrameSequencer(catalog, grid, settings),
                      ConfigurationError);
  }
  SECTION("Several cycles") {
    SequencerSettings settings = small_run(*grid);
    settings.cycles = 2;
    FrameSequencer seq(catalog, grid, settings);
    REQUIRE_THAT(seq.time_at(4), Catch::Matchers::WithinAbs(0.8, 1e-12));
    // same point of the cycle, same opening
    FrameRecord a = seq.frame(1);
    FrameRecord b = seq.frame(5);
    REQUIRE_THAT(a.severities[0].state.opening_fraction,
                 Catch::Matchers::WithinAbs(
                     b.severities[0].state.opening_fraction, 1e-9));
  }
  SECTION("Built from a run configuration") {
    RunConfig cfg;
    cfg.resolution = 8;
    cfg.total_frames = 4;
    cfg.n_seeds = 2;
    auto cfg_grid = make_flow_grid(cfg);
    FrameSequencer seq(catalog, cfg_grid, make_sequencer_settings(cfg, *cfg_grid));
    REQUIRE(seq.size() == 4);
    REQUIRE(seq.settings().seeds.size() == 2);
    REQUIRE(std::string(seq.deformation().name()) ==
            "prescribed-radial-retraction");
  }
}

TEST_CASE("FRAME OUTPUT FILES", "[sequencer, io]") {
  const SeverityCatalog &catalog = default_severity_catalog();
  auto grid = make_flow_grid(-2.0, 2.0, 5, -2.0, 2.0, 5);
  FrameSequencer seq(catalog, grid, small_run(*grid));
  FrameRecord r = seq.frame(1);
  const SeverityFrame &sf = r.severities[1];
  const std::filesystem::path dir = std::filesystem::temp_directory_path();

  SECTION("Flow field") {
    const std::string path = (dir / "valve2d_field.csv").string();
    REQUIRE(write_flow_field_csv(path, sf.flow));
    std::vector<std::string> lines = read_lines(path);
    REQUIRE(lines.size() == 1 + grid->size());
    REQUIRE(lines[0] == "x,y,U,V,speed,pressure");

    // rows run over x first, starting at the lower-left node
    std::stringstream row(lines[1]);
    std::string x, y, u;
    std::getline(row, x, ',');
    std::getline(row, y, ',');
    std::getline(row, u, ',');
    REQUIRE_THAT(std::stod(x), Catch::Matchers::WithinAbs(-2.0, 1e-12));
    REQUIRE_THAT(std::stod(y), Catch::Matchers::WithinAbs(-2.0, 1e-12));
    REQUIRE_THAT(std::stod(u),
                 Catch::Matchers::WithinRel(sf.flow.U[grid->index(0, 0)], 1e-9));
    std::stringstream second(lines[2]);
    std::getline(second, x, ',');
    REQUIRE_THAT(std::stod(x), Catch::Matchers::WithinAbs(-1.0, 1e-12));
    std::filesystem::remove(path);
  }
  SECTION("Streamlines") {
    const std::string path = (dir / "valve2d_lines.csv").string();
    REQUIRE(write_streamlines_csv(path, sf.streamlines));
    std::vector<std::string> lines = read_lines(path);
    std::size_t n_points = 0;
    for (const auto &l : sf.streamlines)
      n_points += l.points.size();
    REQUIRE(n_points > 0);
    REQUIRE(lines.size() == 1 + n_points);
    REQUIRE(lines[0] == "line,x,y,speed");
    REQUIRE(lines[1].rfind("0,", 0) == 0);
    std::filesystem::remove(path);
  }
  SECTION("Metrics") {
    std::vector<MetricSample> samples;
    for (const FrameRecord &rec : seq)
      for (const auto &s : rec.severities)
        samples.push_back(s.metrics);
    const std::string path = (dir / "valve2d_metrics.csv").string();
    REQUIRE(write_metrics_csv(path, samples));
    std::vector<std::string> lines = read_lines(path);
    REQUIRE(lines.size() == 1 + 16);
    REQUIRE(lines[0] ==
            "severity,t,phase,opening_fraction,peak_velocity,pressure_gradient,"
            "effective_orifice_area,cardiac_output,reference_velocity,"
            "reference_gradient");
    REQUIRE(lines[1].rfind("healthy,0,", 0) == 0);
    REQUIRE(lines[2].rfind("severe,0,", 0) == 0);
    std::filesystem::remove(path);
  }
  SECTION("Clinical report") {
    MetricsAccumulator severe("severe");
    severe.add(summary_sample("severe", 450.0, 45.0, 0.8));
    MetricsAccumulator healthy("healthy");
    healthy.add(summary_sample("healthy", 100.0, 5.0, 3.0));
    std::vector<CycleSummary> summaries{
        severe.summary(ClassificationThresholds{}),
        healthy.summary(ClassificationThresholds{})};

    std::string text = format_clinical_report(summaries[0], catalog.at("severe"));
    REQUIRE(text.find("Classification: severe") != std::string::npos);
    REQUIRE(text.find("Recommendation: AORTIC VALVE REPLACEMENT INDICATED") !=
            std::string::npos);

    const std::string path = (dir / "valve2d_report.txt").string();
    REQUIRE(write_clinical_report(path, summaries, catalog));
    std::ifstream fin(path);
    std::stringstream content;
    content << fin.rdbuf();
    fin.close();
    const std::string report = content.str();
    REQUIRE(report.find("Valve condition: severe") != std::string::npos);
    REQUIRE(report.find("Valve condition: healthy") != std::string::npos);
    REQUIRE(report.find("Classification: normal") != std::string::npos);
    REQUIRE(report.find("Recommendation: NO INTERVENTION NEEDED") !=
            std::string::npos);
    std::filesystem::remove(path);
  }
  SECTION("Output directory does not exist") {
    const std::string path = "/nonexistent_valve2d_dir/out.csv";
    REQUIRE(write_flow_field_csv(path, sf.flow) == false);
    REQUIRE(write_streamlines_csv(path, sf.streamlines) == false);
    REQUIRE(write_metrics_csv(path, {sf.metrics}) == false);
    REQUIRE(write_clinical_report(path, {}, catalog) == false);
  }
}
