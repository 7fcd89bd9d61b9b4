/*
  Climate Selftest: Synthetic Annual Series

  Objective
  ---------
    1) Exactly 365 consecutive days from Jan 1 of the epoch year.
    2) Every field inside its documented range.
    3) Same seed -> bit-identical series; reseed() reproduces it.
    4) Seasonal phase: June is the irradiance peak in the north and the
       trough in the south.

  Expected use
  ------------
      ./desal_climate_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "desal/climate/climate_generator.hpp"
#include "desal/core/logging.hpp"

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

bool same_series(const std::vector<DailyClimateRecord>& a, const std::vector<DailyClimateRecord>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].date != b[i].date) return false;
    if (a[i].irradiance_Wm2 != b[i].irradiance_Wm2) return false;
    if (a[i].ambient_temp_C != b[i].ambient_temp_C) return false;
    if (a[i].relative_humidity_pct != b[i].relative_humidity_pct) return false;
    if (a[i].wind_speed_ms != b[i].wind_speed_ms) return false;
  }
  return true;
}

double month_mean_irradiance(const std::vector<DailyClimateRecord>& s, int month) {
  double sum = 0.0;
  int n = 0;
  for (const auto& r : s) {
    if (r.month != month) continue;
    sum += r.irradiance_Wm2;
    ++n;
  }
  return n > 0 ? sum / n : 0.0;
}

void test_calendar_coverage() {
  Configuration cfg = Configuration::defaults();
  ClimateGenerator gen(cfg, 42);
  const auto s = gen.generate();

  expect_true(s.size() == 365, "exactly 365 records");
  expect_true(s.front().date == (CalendarDate{2024, 1, 1}), "starts Jan 1 of epoch year");
  expect_true(s.back().date == (CalendarDate{2024, 12, 30}), "leap epoch ends Dec 30");

  bool consecutive = true;
  for (size_t i = 1; i < s.size(); ++i) {
    if (s[i].date != next_day(s[i - 1].date)) consecutive = false;
    if (s[i].day_of_year != static_cast<int>(i)) consecutive = false;
  }
  expect_true(consecutive, "dates are consecutive and day_of_year is the index");

  cfg.simulation.epoch_year = 2023;
  ClimateGenerator common(cfg, 42);
  expect_true(common.generate().back().date == (CalendarDate{2023, 12, 31}), "common epoch ends Dec 31");
}

void test_ranges() {
  for (Hemisphere h : {Hemisphere::North, Hemisphere::South}) {
    Configuration cfg = Configuration::defaults();
    cfg.operation.hemisphere = h;
    ClimateGenerator gen(cfg, 0);

    bool ok = true;
    for (std::uint64_t seed = 0; seed < 100; ++seed) {
      gen.reseed(seed);
      for (const auto& r : gen.generate()) {
        if (r.irradiance_Wm2 < 100.0 || r.irradiance_Wm2 > 950.0) ok = false;
        if (r.relative_humidity_pct < 30.0 || r.relative_humidity_pct > 95.0) ok = false;
        if (r.wind_speed_ms < 0.5) ok = false;
        if (!std::isfinite(r.ambient_temp_C) || !std::isfinite(r.vapor_pressure_Pa)) ok = false;
        if (std::fabs(r.ambient_temp_K - (r.ambient_temp_C + 273.15)) > 1e-9) ok = false;
        if (r.vapor_pressure_Pa <= 0.0) ok = false;
      }
    }
    expect_true(ok, std::string("fields within documented ranges for 100 seeds (") + to_string(h) + ")");
  }
}

void test_determinism() {
  const Configuration cfg = Configuration::defaults();
  ClimateGenerator a(cfg, 1234);
  ClimateGenerator b(cfg, 1234);
  const auto sa = a.generate();
  const auto sb = b.generate();
  expect_true(same_series(sa, sb), "same seed yields identical series");

  ClimateGenerator c(cfg, 1235);
  expect_true(!same_series(sa, c.generate()), "different seed yields a different series");

  const auto continued = a.generate();
  expect_true(!same_series(sa, continued), "second generate() continues the stream");
  a.reseed(1234);
  expect_true(same_series(sa, a.generate()), "reseed() reproduces the series");
  expect_true(a.seed() == 1234, "seed() reports the seed");
}

void test_hemisphere_phase() {
  Configuration cfg = Configuration::defaults();
  ClimateGenerator north(cfg, 42);
  const auto n = north.generate();
  expect_true(month_mean_irradiance(n, 6) > month_mean_irradiance(n, 12) + 300.0, "north peaks in June");

  cfg.operation.hemisphere = Hemisphere::South;
  ClimateGenerator south(cfg, 42);
  const auto s = south.generate();
  expect_true(month_mean_irradiance(s, 12) > month_mean_irradiance(s, 6) + 300.0, "south peaks in December");

  // Amplitude 0 and no noise: flat irradiance at the base value.
  cfg.simulation.seasonal_amplitude_Wm2 = 0.0;
  cfg.simulation.daily_stddev_Wm2 = 0.0;
  ClimateGenerator flat(cfg, 42);
  bool all_base = true;
  for (const auto& r : flat.generate()) {
    if (r.irradiance_Wm2 != 500.0) all_base = false;
  }
  expect_true(all_base, "zero amplitude and stddev give constant irradiance");
}

void test_vapor_pressure() {
  // Magnus-Tetens at 0 degC equals its leading coefficient.
  expect_true(std::fabs(saturation_vapor_pressure_Pa(0.0) - 610.78) < 1e-9, "Psat(0 degC) = 610.78 Pa");
  expect_true(std::fabs(saturation_vapor_pressure_Pa(20.0) - 2337.0) < 5.0, "Psat(20 degC) ~ 2337 Pa");
  expect_true(std::fabs(seasonal_phase_rad(6, Hemisphere::North)) < 1e-12, "north phase zero in June");
  expect_true(std::fabs(seasonal_phase_rad(12, Hemisphere::South)) < 1e-12, "south phase zero in December");
}

}  // namespace
}  // namespace desal

int main() {
  using namespace desal;

  set_log_level(LogLevel::ERROR);

  test_calendar_coverage();
  test_ranges();
  test_determinism();
  test_hemisphere_phase();
  test_vapor_pressure();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
