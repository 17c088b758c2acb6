#pragma once

#include "flow_field.hpp"
#include "metrics.hpp"
#include "streamlines.hpp"

#include <string>
#include <vector>

// CSV / text output for external renderers and reporting tools.
// All writers return false (and report on std::cerr) if the file cannot be
// written.

// x,y,U,V,speed,pressure per grid node
bool write_flow_field_csv(const std::string &filename, const FlowField &field);

// line,x,y,speed per polyline sample
bool write_streamlines_csv(const std::string &filename,
                           const std::vector<Streamline> &lines);

// one row per sample, header first
bool write_metrics_csv(const std::string &filename,
                       const std::vector<MetricSample> &samples);

std::string format_clinical_report(const CycleSummary &summary,
                                   const SeverityProfile &severity);
bool write_clinical_report(const std::string &filename,
                           const std::vector<CycleSummary> &summaries,
                           const SeverityCatalog &catalog);
