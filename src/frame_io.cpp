#include "frame_io.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

bool open_output(std::ofstream &fout, const std::string &filename) {
  fout.open(filename);
  if (!fout) {
    std::cerr << "Error: cannot open output file: " << filename << "\n";
    return false;
  }
  fout << std::setprecision(10);
  return true;
}

const char *recommendation(StenosisGrade grade) {
  switch (grade) {
  case StenosisGrade::SEVERE:
    return "Severity: SEVERE AORTIC STENOSIS\n"
           "Recommendation: AORTIC VALVE REPLACEMENT INDICATED\n"
           "  - High transvalvular pressure gradient\n"
           "  - Significantly reduced orifice area\n";
  case StenosisGrade::MODERATE:
    return "Severity: MODERATE AORTIC STENOSIS\n"
           "Recommendation: CLOSE MONITORING, CONSIDER INTERVENTION IF "
           "SYMPTOMATIC\n"
           "  - Serial echocardiography every 6-12 months\n";
  case StenosisGrade::MILD:
    return "Severity: MILD AORTIC STENOSIS\n"
           "Recommendation: PERIODIC MONITORING\n"
           "  - Echocardiography every 12-24 months\n";
  case StenosisGrade::NORMAL:
    break;
  }
  return "Severity: NORMAL VALVE FUNCTION\n"
         "Recommendation: NO INTERVENTION NEEDED\n";
}

} // namespace

bool write_flow_field_csv(const std::string &filename, const FlowField &field) {
  std::ofstream fout;
  if (!open_output(fout, filename))
    return false;

  const FlowGrid &g = *field.grid;
  fout << "x,y,U,V,speed,pressure\n";
  for (int j = 0; j < g.ny; ++j) {
    for (int i = 0; i < g.nx; ++i) {
      std::size_t k = g.index(i, j);
      fout << g.x[i] << "," << g.y[j] << "," << field.U[k] << ","
           << field.V[k] << "," << field.speed(k) << "," << field.pressure[k]
           << "\n";
    }
  }
  return static_cast<bool>(fout);
}

bool write_streamlines_csv(const std::string &filename,
                           const std::vector<Streamline> &lines) {
  std::ofstream fout;
  if (!open_output(fout, filename))
    return false;

  fout << "line,x,y,speed\n";
  for (std::size_t l = 0; l < lines.size(); ++l) {
    for (const auto &p : lines[l].points)
      fout << l << "," << p.x << "," << p.y << "," << p.speed << "\n";
  }
  return static_cast<bool>(fout);
}

bool write_metrics_csv(const std::string &filename,
                       const std::vector<MetricSample> &samples) {
  std::ofstream fout;
  if (!open_output(fout, filename))
    return false;

  // output header
  fout << "severity,t,phase,opening_fraction,peak_velocity,pressure_gradient,"
          "effective_orifice_area,cardiac_output,reference_velocity,"
          "reference_gradient\n";
  for (const auto &m : samples) {
    fout << m.severity << "," << m.t << "," << phase_name(m.phase) << ","
         << m.opening_fraction << "," << m.peak_velocity << ","
         << m.pressure_gradient << "," << m.effective_orifice_area << ","
         << m.cardiac_output << "," << m.reference_velocity << ","
         << m.reference_gradient << "\n";
  }
  return static_cast<bool>(fout);
}

std::string format_clinical_report(const CycleSummary &summary,
                                   const SeverityProfile &severity) {
  const std::string rule(70, '=');
  const std::string thin(70, '-');

  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << rule << "\n"
      << "                    AORTIC VALVE SIMULATION REPORT\n"
      << rule << "\n\n"
      << "Valve condition: " << summary.severity << "\n\n"
      << "HEMODYNAMIC MEASUREMENTS:\n"
      << thin << "\n"
      << std::left << std::setw(35) << "Peak Jet Velocity:" << std::right
      << std::setw(10) << summary.peak_velocity << " cm/s\n"
      << std::left << std::setw(35) << "Mean Pressure Gradient:" << std::right
      << std::setw(10) << summary.mean_gradient << " mmHg\n"
      << std::left << std::setw(35) << "Peak Pressure Gradient:" << std::right
      << std::setw(10) << summary.peak_gradient << " mmHg\n"
      << std::left << std::setw(35) << "Effective Orifice Area:" << std::right
      << std::setw(10) << summary.max_orifice_area << " cm^2\n"
      << std::left << std::setw(35) << "Cardiac Output:" << std::right
      << std::setw(10) << summary.cardiac_output << " L/min\n\n"
      << "STRUCTURAL PARAMETERS:\n"
      << thin << "\n"
      << std::left << std::setw(35) << "Leaflet Mobility:" << std::right
      << std::setw(10) << severity.mobility_frac << "\n"
      << std::left << std::setw(35) << "Maximum Opening:" << std::right
      << std::setw(10) << severity.max_opening << "\n"
      << std::left << std::setw(35) << "Stiffness Multiplier:" << std::right
      << std::setw(10) << severity.stiffness_mult << "\n\n"
      << "CLINICAL INTERPRETATION (" << summary.n_samples << " frames):\n"
      << thin << "\n"
      << "Classification: " << summary.classification << "\n"
      << recommendation(summary.grade) << "\n"
      << "Valve motion is prescribed (radial retraction), not computed from\n"
      << "fluid forces; the flow field is analytic. Illustrative only.\n"
      << rule << "\n";
  return out.str();
}

bool write_clinical_report(const std::string &filename,
                           const std::vector<CycleSummary> &summaries,
                           const SeverityCatalog &catalog) {
  std::ofstream fout(filename);
  if (!fout) {
    std::cerr << "Error: cannot open report file: " << filename << "\n";
    return false;
  }
  for (const auto &s : summaries)
    fout << format_clinical_report(s, catalog.at(s.severity)) << "\n";
  return static_cast<bool>(fout);
}
