#include "flow_field.hpp"
#include "kinematics.hpp"
#include "metrics.hpp"
#include "severity_profile.hpp"
#include "valve_errors.hpp"
#include "valve_geometry.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

//---------------------------------------------
/* Example: healthy vs. diseased valve */

// Four instants of one 0.8 s cycle (75 bpm):
//   early systole, peak systole, end systole, diastole
// For each severity the opening, peak jet velocity, transvalvular gradient
// and effective orifice area are printed side by side.
//---------------------------------------------

int main(int argc, char *argv[]) {
  const SeverityCatalog &catalog = default_severity_catalog();
  std::string diseased = argc > 1 ? argv[1] : "severe";
  int resolution = argc > 2 ? std::atoi(argv[2]) : 96;

  CycleTiming timing;
  FlowModelParams flow;
  MetricsParams metrics;

  try {
    const SeverityProfile &healthy = catalog.at("healthy");
    const SeverityProfile &other = catalog.at(diseased);
    ValveGeometry g_healthy = generate_valve_geometry(resolution, healthy);
    ValveGeometry g_other = generate_valve_geometry(resolution, other);
    double a_healthy = compute_geometry_properties(g_healthy).orifice_area;
    double a_other = compute_geometry_properties(g_other).orifice_area;

    auto grid = make_flow_grid(-4.0, 4.0, 81, -4.0, 4.0, 81);

    std::cout << "Cardiac cycle: " << timing.cycle_duration << " s, systole 0 - "
              << timing.systole_duration() << " s\n";
    std::cout << "Geometric orifice area: healthy " << std::fixed
              << std::setprecision(2) << a_healthy << " cm^2, " << diseased
              << " " << a_other << " cm^2 ("
              << (a_other / a_healthy - 1.0) * 100.0 << "%)\n\n";

    const double times[] = {0.0, 0.15, 0.3, 0.5};
    const char *labels[] = {"early systole", "peak systole", "end systole",
                            "diastole"};

    std::cout << std::left << std::setw(16) << "phase" << std::setw(10)
              << "severity" << std::right << std::setw(10) << "opening"
              << std::setw(14) << "Vpeak [cm/s]" << std::setw(14)
              << "dP [mmHg]" << std::setw(14) << "EOA [cm^2]" << "\n";

    for (int k = 0; k < 4; ++k) {
      double t = times[k];
      const SeverityProfile *profiles[] = {&healthy, &other};
      const double areas[] = {a_healthy, a_other};
      for (int s = 0; s < 2; ++s) {
        const SeverityProfile &p = *profiles[s];
        double opening = opening_fraction(t, p, timing);
        FlowField field = evaluate_flow_field(grid, t, p, timing, flow);
        MetricSample m =
            compute_metrics(field, opening, areas[s], p, timing, flow, metrics);

        std::cout << std::left << std::setw(16) << (s == 0 ? labels[k] : "")
                  << std::setw(10) << p.name << std::right << std::setw(10)
                  << m.opening_fraction << std::setw(14) << m.peak_velocity
                  << std::setw(14) << m.pressure_gradient << std::setw(14)
                  << m.effective_orifice_area << "\n";
      }
    }
  } catch (const ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
