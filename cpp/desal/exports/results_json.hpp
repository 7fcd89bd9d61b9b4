#pragma once
/*
================================================================================
Exports: Run Summary JSON
FILE: cpp/desal/exports/results_json.hpp

Purpose:
  - One JSON document per simulation run for dashboards and archiving:
      seed, configuration, derived parameters, annual summary,
      monthly (12) and seasonal (4) arrays.
  - Daily rows are not included (use the daily CSV).

Hardening:
  - Stable key order; results use fixed precision (6 decimals).
  - NaN/Inf serialize as null.
================================================================================
*/

#include <string>

#include "desal/pipeline/simulate.hpp"

namespace desal {

std::string run_to_json(const SimulationRun& run, int indent_spaces = 2);

// Returns true on success, false on I/O failure.
bool write_run_json_file(const SimulationRun& run, const std::string& file_path, int indent_spaces = 2);

}  // namespace desal
