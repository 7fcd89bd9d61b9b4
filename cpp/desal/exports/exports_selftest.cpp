/*
  Exports Selftest: CSV, JSON Summary and Markdown Report

  Objective
  ---------
    1) Daily / monthly / seasonal CSV have a header plus one row per record.
    2) Delimiter option is honored and text cells are escaped.
    3) The run summary JSON contains every section and no NaN/Inf tokens.
    4) The markdown report names every season and section.
    5) File writers create the files and report failure on a bad path.

  Expected use
  ------------
      ./desal_exports_selftest
  Non-zero return code indicates failure.
*/

#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "desal/core/logging.hpp"
#include "desal/exports/report_md.hpp"
#include "desal/exports/results_csv.hpp"
#include "desal/exports/results_json.hpp"
#include "desal/pipeline/simulate.hpp"

namespace desal {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

size_t count_lines(const std::string& s) {
  size_t n = 0;
  for (char c : s) {
    if (c == '\n') ++n;
  }
  return n;
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

bool file_exists(const std::string& path) {
  std::ifstream ifs(path);
  return ifs.is_open();
}

void test_csv(const SimulationRun& run) {
  const std::string daily = daily_to_csv(run.daily);
  expect_true(count_lines(daily) == 366, "daily CSV: header + 365 rows");
  expect_true(daily.rfind("date,day_of_year,month,irradiance_Wm2,", 0) == 0, "daily CSV header prefix");
  expect_true(contains(daily, "\n2024-01-01,0,1,"), "first daily row is Jan 1");
  expect_true(!contains(daily, "nan") && !contains(daily, "inf"), "daily CSV has no non-finite cells");

  const std::string monthly = monthly_to_csv(run.monthly);
  expect_true(count_lines(monthly) == 13, "monthly CSV: header + 12 rows");
  expect_true(monthly.rfind("month,month_name,day_count,", 0) == 0, "monthly CSV header prefix");
  expect_true(contains(monthly, "December"), "monthly CSV names the months");

  const std::string seasonal = seasonal_to_csv(run.seasonal);
  expect_true(count_lines(seasonal) == 5, "seasonal CSV: header + 4 rows");
  std::istringstream first(seasonal);
  std::string header;
  std::getline(first, header);
  expect_true(header.size() > 20 && header.compare(header.size() - 19, 19, "share_of_annual_pct") == 0,
              "seasonal CSV ends with the production share");

  CsvExportOptions semi;
  semi.delimiter = ';';
  semi.include_header = false;
  const std::string rows = monthly_to_csv(run.monthly, semi);
  expect_true(count_lines(rows) == 12, "header can be omitted");
  expect_true(rows.rfind("1;January;", 0) == 0, "delimiter option is honored");

  MonthlySummary odd = run.monthly[0];
  odd.name = "Jan, \"cold\"";
  const std::string row = monthly_csv_row(odd);
  expect_true(contains(row, "\"Jan, \"\"cold\"\"\""), "text cells with delimiter or quotes are escaped");
}

void test_json(const SimulationRun& run) {
  const std::string json = run_to_json(run);
  expect_true(!json.empty() && json.front() == '{', "summary is a JSON object");
  for (const char* section : {"\"seed\"", "\"configuration\"", "\"derived\"", "\"annual\"", "\"monthly\"",
                              "\"seasonal\"", "\"correlations\"", "\"energy_J\""}) {
    expect_true(contains(json, section), std::string("summary contains ") + section);
  }
  expect_true(!contains(json, "nan") && !contains(json, "inf"), "summary has no NaN/Inf tokens");
  expect_true(contains(json, "\"seed\": 42"), "seed recorded");
  expect_true(run_to_json(run) == json, "summary is deterministic");
}

void test_report(const SimulationRun& run) {
  const std::string md = render_markdown_report(run);
  expect_true(md.rfind("# Executive Report", 0) == 0, "report title");
  for (const char* heading : {"## Results Summary", "## Seasonal Distribution", "### Monthly Highlights",
                              "## Correlations with Daily Production", "## Daily Energy Balance",
                              "## Model Notes"}) {
    expect_true(contains(md, heading), std::string("report section ") + heading);
  }
  for (const char* season : {"Winter", "Spring", "Summer", "Autumn"}) {
    expect_true(contains(md, season), std::string("report names ") + season);
  }
  expect_true(contains(md, "Peak") && contains(md, "Minimum"), "seasonal trend labels");
  expect_true(!contains(md, "*Generated:"), "no timestamp unless requested");

  ReportOptions opt;
  opt.generated_on = "2024-06-01";
  expect_true(contains(render_markdown_report(run, opt), "2024-06-01"), "timestamp printed when given");
}

void test_files(const SimulationRun& run) {
  const std::string daily_path = "desal_exports_selftest_daily.csv";
  const std::string json_path = "desal_exports_selftest_summary.json";
  const std::string md_path = "desal_exports_selftest_report.md";

  expect_true(write_daily_csv_file(run.daily, daily_path), "daily CSV written");
  expect_true(write_run_json_file(run, json_path), "summary JSON written");
  expect_true(write_markdown_report_file(run, md_path), "report written");
  expect_true(file_exists(daily_path) && file_exists(json_path) && file_exists(md_path), "files exist");

  std::remove(daily_path.c_str());
  std::remove(json_path.c_str());
  std::remove(md_path.c_str());

  expect_true(!write_seasonal_csv_file(run.seasonal, "no_such_dir_desal/seasonal.csv"),
              "writer reports failure for a missing directory");
}

}  // namespace
}  // namespace desal

int main() {
  using namespace desal;

  set_log_level(LogLevel::ERROR);

  const SimulationRun run = run_simulation(Configuration::defaults(), 42);

  test_csv(run);
  test_json(run);
  test_report(run);
  test_files(run);

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
