/*
  Aggregate Selftest: Monthly, Seasonal and Annual Summaries

  Objective
  ---------
    1) Month and season tables are complete and add up to the annual totals.
    2) Pearson correlation handles perfect, constant and mismatched input.
    3) Empty seasons are zero rows, not errors.
    4) simulate() is deterministic and stays within the physical clamps.
    5) Over 100 seeds per hemisphere, daily ratios and climate stay in range
       and the seasonal table conserves the daily production.

  Expected use
  ------------
      ./desal_aggregate_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "desal/analysis/aggregate.hpp"
#include "desal/core/errors.hpp"
#include "desal/core/logging.hpp"
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

bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

DailyResult synthetic_day(int month, double production_L, double irradiance_Wm2) {
  DailyResult r;
  r.climate.month = month;
  r.climate.irradiance_Wm2 = irradiance_Wm2;
  r.climate.ambient_temp_C = 20.0;
  r.production_L = production_L;
  r.evaporated_mass_kg = production_L;
  r.solar_energy_J = 1.0e6;
  r.useful_energy_J = 5.0e5;
  r.lost_energy_J = 5.0e5;
  return r;
}

void test_season_mapping() {
  expect_true(season_of_month(12) == Season::Winter && season_of_month(1) == Season::Winter &&
                  season_of_month(2) == Season::Winter,
              "Dec/Jan/Feb are winter");
  expect_true(season_of_month(3) == Season::Spring && season_of_month(5) == Season::Spring, "Mar..May are spring");
  expect_true(season_of_month(6) == Season::Summer && season_of_month(8) == Season::Summer, "Jun..Aug are summer");
  expect_true(season_of_month(9) == Season::Autumn && season_of_month(11) == Season::Autumn, "Sep..Nov are autumn");

  bool threw = false;
  try {
    (void)season_of_month(13);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "month 13 is rejected");

  std::vector<DailyResult> bad(1);
  bad[0].climate.month = 0;
  threw = false;
  try {
    (void)aggregate_monthly(bad);
  } catch (const DesalError&) {
    threw = true;
  }
  expect_true(threw, "record with month 0 is rejected as a DesalError");
  expect_true(std::string(to_string(Season::Autumn)) == "Autumn", "season names");
}

void test_pearson() {
  const std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0};
  const std::vector<double> up = {2.0, 4.0, 6.0, 8.0, 10.0};
  const std::vector<double> down = {5.0, 4.0, 3.0, 2.0, 1.0};
  const std::vector<double> flat = {3.0, 3.0, 3.0, 3.0, 3.0};

  expect_true(near(pearson_correlation(x, up), 1.0, 1e-12), "perfect positive correlation");
  expect_true(near(pearson_correlation(x, down), -1.0, 1e-12), "perfect negative correlation");
  expect_true(pearson_correlation(x, flat) == 0.0, "constant series gives 0");
  expect_true(pearson_correlation({}, {}) == 0.0, "empty input gives 0");
  expect_true(pearson_correlation(x, {1.0, 2.0}) == 0.0, "mismatched lengths give 0");
}

void test_empty_seasons() {
  std::vector<DailyResult> days;
  for (int i = 0; i < 10; ++i) days.push_back(synthetic_day(7, 0.05, 800.0));
  for (int i = 0; i < 10; ++i) days.push_back(synthetic_day(4, 0.02, 500.0));

  const auto seasons = aggregate_seasonal(days);
  const SeasonalSummary& winter = seasons[static_cast<int>(Season::Winter)];
  const SeasonalSummary& summer = seasons[static_cast<int>(Season::Summer)];
  const SeasonalSummary& spring = seasons[static_cast<int>(Season::Spring)];

  expect_true(winter.stats.day_count == 0 && winter.stats.production_L == 0.0 && winter.share_of_annual_pct == 0.0,
              "season without days is a zero row");
  expect_true(winter.name == "Winter", "zero row keeps its name");
  expect_true(near(summer.stats.production_L, 0.5, 1e-12), "summer total");
  expect_true(near(summer.share_of_annual_pct, 0.5 / 0.7 * 100.0, 1e-9), "summer share of annual production");
  expect_true(near(spring.stats.mean_irradiance_Wm2, 500.0, 1e-12), "spring mean irradiance");

  const auto months = aggregate_monthly(days);
  expect_true(months[0].stats.day_count == 0 && months[0].name == "January", "empty January is a zero row");
  expect_true(months[6].stats.day_count == 10, "July holds its ten days");

  const AnnualSummary a = summarize_annual(days);
  expect_true(a.best_month == 7 && a.worst_month == 4, "best/worst month skip empty months");
  expect_true(a.best_season == Season::Summer && a.worst_season == Season::Spring,
              "best/worst season skip empty seasons");
  expect_true(near(a.annual_thermal_efficiency, 0.5, 1e-12), "annual efficiency from energy sums");
  expect_true(near(a.lost_energy_share_pct, 50.0, 1e-9), "lost energy share");

  const AnnualSummary none = summarize_annual({});
  expect_true(none.day_count == 0 && none.total_production_L == 0.0, "empty year summarizes to zeros");
}

void test_year_totals() {
  const SimulationRun run = run_simulation(Configuration::defaults(), 42);

  expect_true(run.daily.size() == 365, "365 daily results");

  int days = 0;
  double monthly_L = 0.0;
  for (const auto& m : run.monthly) {
    days += m.stats.day_count;
    monthly_L += m.stats.production_L;
  }
  expect_true(days == 365, "monthly day counts sum to 365");
  expect_true(near(monthly_L, run.annual.total_production_L, 1e-9), "monthly production sums to the annual total");

  int season_days = 0;
  double share = 0.0;
  double seasonal_L = 0.0;
  for (const auto& s : run.seasonal) {
    season_days += s.stats.day_count;
    share += s.share_of_annual_pct;
    seasonal_L += s.stats.production_L;
  }
  expect_true(season_days == 365, "seasonal day counts sum to 365");
  expect_true(near(share, 100.0, 1e-6), "seasonal shares sum to 100%");
  expect_true(near(seasonal_L, run.annual.total_production_L, 1e-9), "seasonal production sums to the annual total");

  expect_true(run.annual.total_production_L > 0.5 && run.annual.total_production_L < 20.0,
              "annual production is a few litres");
  expect_true(run.annual.corr_production_irradiance > 0.5, "production follows irradiance in the north");
  expect_true(run.annual.min_irradiance_Wm2 >= 100.0 && run.annual.max_irradiance_Wm2 <= 950.0,
              "annual irradiance extremes inside the clamp");
  expect_true(run.annual.high_production_days > 0, "some days above the mean");
  expect_true(run.annual.mean_gor >= 0.0 && run.annual.annual_gor <= run.annual.annual_thermal_efficiency,
              "GOR never exceeds thermal efficiency");
}

void test_simulate_invariants() {
  const Configuration cfg = Configuration::defaults();
  const auto a = simulate(cfg, 7);
  const auto b = simulate(cfg, 7);

  bool identical = a.size() == b.size();
  for (size_t i = 0; identical && i < a.size(); ++i) {
    if (a[i].production_L != b[i].production_L || a[i].climate.irradiance_Wm2 != b[i].climate.irradiance_Wm2) {
      identical = false;
    }
  }
  expect_true(identical, "same configuration and seed give identical results");

  bool clamped = true;
  bool ordered = true;
  const double cap = 0.25 * cfg.operation.water_mass_kg;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].evaporated_mass_kg < 0.0 || a[i].evaporated_mass_kg > cap) clamped = false;
    if (a[i].evaporated_mass_kg > 0.0 && a[i].evaporated_mass_kg < 0.001) clamped = false;
    if (a[i].climate.day_of_year != static_cast<int>(i)) ordered = false;
  }
  expect_true(clamped, "daily mass in {0} or [1 g, 25% of water]");
  expect_true(ordered, "results are date ordered");

  Configuration south = cfg;
  south.operation.hemisphere = Hemisphere::South;
  const SimulationRun s = run_simulation(south, 42);
  expect_true(s.annual.corr_production_irradiance >= -1.0 && s.annual.corr_production_irradiance <= 1.0,
              "southern correlation is a valid coefficient");
  expect_true(s.monthly[11].stats.mean_irradiance_Wm2 > s.monthly[5].stats.mean_irradiance_Wm2,
              "south: December brighter than June");
}

// Per-day ratios, climate ranges and seasonal conservation over many seeds.
void test_invariants_across_seeds() {
  for (Hemisphere h : {Hemisphere::North, Hemisphere::South}) {
    Configuration cfg = Configuration::defaults();
    cfg.operation.hemisphere = h;

    int violations = 0;
    int conservation_errors = 0;
    for (std::uint64_t seed = 0; seed < 100; ++seed) {
      const SimulationRun run = run_simulation(cfg, seed);

      double daily_L = 0.0;
      for (const auto& r : run.daily) {
        if (!(r.gor >= 0.0 && r.gor <= 1.0)) ++violations;
        if (!(r.thermal_efficiency >= 0.0 && r.thermal_efficiency <= 1.0)) ++violations;
        if (r.gor > r.thermal_efficiency) ++violations;
        if (r.climate.irradiance_Wm2 < 100.0 || r.climate.irradiance_Wm2 > 950.0) ++violations;
        if (r.climate.relative_humidity_pct < 30.0 || r.climate.relative_humidity_pct > 95.0) ++violations;
        if (r.climate.wind_speed_ms < 0.5) ++violations;
        daily_L += r.production_L;
      }

      double seasonal_L = 0.0;
      int seasonal_days = 0;
      for (const auto& s : run.seasonal) {
        seasonal_L += s.stats.production_L;
        seasonal_days += s.stats.day_count;
      }
      if (!near(seasonal_L, daily_L, 1e-9) || seasonal_days != 365) ++conservation_errors;
    }

    const std::string tag = std::string(" (") + to_string(h) + ", 100 seeds)";
    expect_true(violations == 0, "GOR and efficiency in [0,1], climate in range" + tag);
    expect_true(conservation_errors == 0, "seasonal production sums to daily production" + tag);
  }
}

void test_invalid_configuration() {
  Configuration cfg = Configuration::defaults();
  cfg.operation.water_mass_kg = -1.0;
  bool threw = false;
  try {
    (void)simulate(cfg, 42);
  } catch (const ConfigurationError& e) {
    threw = (e.parameter() == "operation.water_mass_kg");
  }
  expect_true(threw, "invalid configuration rejected before simulation");
}

}  // namespace
}  // namespace desal

int main() {
  using namespace desal;

  set_log_level(LogLevel::ERROR);

  test_season_mapping();
  test_pearson();
  test_empty_seasons();
  test_year_totals();
  test_simulate_invariants();
  test_invariants_across_seeds();
  test_invalid_configuration();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
