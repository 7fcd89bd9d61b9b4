#pragma once
/*
================================================================================
Exports: CSV Results (Daily / Monthly / Seasonal)
FILE: cpp/desal/exports/results_csv.hpp

Purpose:
  - Spreadsheet-friendly tables of a simulation run:
      * daily    : one row per simulated day (climate, temperatures, losses,
                   energy, production, GOR, thermal efficiency)
      * monthly  : 12 rows, January..December
      * seasonal : 4 rows, Winter..Autumn

Hardening:
  - Stable column order; units in column names.
  - Fixed precision (6 decimals).
  - NaN/Inf export as empty cells (never "nan").
  - Strings quoted when they contain the delimiter, quotes or newlines.
================================================================================
*/

#include <array>
#include <string>
#include <vector>

#include "desal/analysis/aggregate.hpp"
#include "desal/physics/thermal_model.hpp"

namespace desal {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

// ---- Daily ----
std::string daily_csv_header(const CsvExportOptions& opt = CsvExportOptions());
std::string daily_csv_row(const DailyResult& r, const CsvExportOptions& opt = CsvExportOptions());
std::string daily_to_csv(const std::vector<DailyResult>& records, const CsvExportOptions& opt = CsvExportOptions());

// ---- Monthly ----
std::string monthly_csv_header(const CsvExportOptions& opt = CsvExportOptions());
std::string monthly_csv_row(const MonthlySummary& m, const CsvExportOptions& opt = CsvExportOptions());
std::string monthly_to_csv(const std::array<MonthlySummary, kMonthsPerYear>& months,
                           const CsvExportOptions& opt = CsvExportOptions());

// ---- Seasonal ----
std::string seasonal_csv_header(const CsvExportOptions& opt = CsvExportOptions());
std::string seasonal_csv_row(const SeasonalSummary& s, const CsvExportOptions& opt = CsvExportOptions());
std::string seasonal_to_csv(const std::array<SeasonalSummary, kSeasonsPerYear>& seasons,
                            const CsvExportOptions& opt = CsvExportOptions());

// File writers. Return true on success, false on I/O error.
bool write_daily_csv_file(const std::vector<DailyResult>& records,
                          const std::string& file_path,
                          const CsvExportOptions& opt = CsvExportOptions());

bool write_monthly_csv_file(const std::array<MonthlySummary, kMonthsPerYear>& months,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

bool write_seasonal_csv_file(const std::array<SeasonalSummary, kSeasonsPerYear>& seasons,
                             const std::string& file_path,
                             const CsvExportOptions& opt = CsvExportOptions());

}  // namespace desal
