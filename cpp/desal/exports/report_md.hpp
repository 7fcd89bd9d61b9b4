#pragma once
/*
================================================================================
Exports: Executive Markdown Report
FILE: cpp/desal/exports/report_md.hpp

Sections:
  - Results summary (annual production, daily mean, irradiance, GOR,
    thermal efficiency, water temperature)
  - Seasonal distribution table ranked by production, with a trend label
  - Best / worst month
  - Correlations of production with irradiance, temperature, humidity
  - Daily energy balance (solar / useful / lost)
  - Calibration note

Output is deterministic: no wall-clock timestamp unless the caller passes one.
================================================================================
*/

#include <string>

#include "desal/pipeline/simulate.hpp"

namespace desal {

struct ReportOptions {
  std::string title = "Executive Report: Solar Desalination Box Annual Simulation";
  std::string generated_on;  // printed verbatim when non-empty
};

std::string render_markdown_report(const SimulationRun& run, const ReportOptions& opt = ReportOptions());

// Returns true on success, false on I/O failure.
bool write_markdown_report_file(const SimulationRun& run,
                                const std::string& file_path,
                                const ReportOptions& opt = ReportOptions());

}  // namespace desal
