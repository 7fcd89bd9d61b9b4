/*
  Thermal Selftest: Derived Parameters and Daily Energy Balance

  Objective
  ---------
    1) Geometry, resistance network and energy budget of the default box.
    2) A fixed reference day reproduces the calibrated balance.
    3) Clamps: loss cap, heating floor, 25% evaporation cap, 1 g noise floor.
    4) Zero solar energy yields zero ratios; NaN input raises NumericalError.
    5) Band table selection and the ambient scale clamp.

  Expected use
  ------------
      ./desal_thermal_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "desal/core/errors.hpp"
#include "desal/core/logging.hpp"
#include "desal/physics/derived_params.hpp"
#include "desal/physics/thermal_model.hpp"

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

void expect_near(double got, double want, double rel_tol, std::string_view msg) {
  const double scale = std::fabs(want) > 1.0 ? std::fabs(want) : 1.0;
  if (std::fabs(got - want) <= rel_tol * scale) {
    pass(msg);
    return;
  }
  std::cerr << "       got " << got << ", want " << want << "\n";
  fail(msg);
}

DailyClimateRecord make_day(double irradiance_Wm2, double ambient_C, double wind_ms) {
  DailyClimateRecord d;
  d.date = CalendarDate{2024, 6, 15};
  d.month = 6;
  d.day_of_month = 15;
  d.day_of_year = 166;
  d.irradiance_Wm2 = irradiance_Wm2;
  d.ambient_temp_C = ambient_C;
  d.ambient_temp_K = ambient_C + 273.15;
  d.relative_humidity_pct = 50.0;
  d.vapor_pressure_Pa = 1500.0;
  d.wind_speed_ms = wind_ms;
  return d;
}

void test_derived_defaults() {
  const DerivedParameters p = DerivedParameters::from(Configuration::defaults());

  expect_near(p.captured_area_m2, 0.1125, 1e-12, "captured area 0.45 x 0.25");
  expect_near(p.wall_area_m2, 0.42, 1e-12, "wall area 2 (L + W) H");
  expect_near(p.total_area_m2, 0.645, 1e-12, "total area base + lid + walls");
  expect_near(p.resistances.R_total_K_W, 0.392790645, 1e-7, "R_total of the default network");
  expect_near(p.energy.per_kg_J, 2573950.0, 1e-9, "energy per kg (heat to 95 degC + evaporate)");
  expect_near(p.cos_incidence, std::sqrt(3.0) / 2.0, 1e-12, "cos(30 deg)");
  expect_near(p.useful_seconds, 21600.0, 1e-12, "6 useful sun hours");
  expect_near(p.water_depth_m, 2.0 / (1000.0 * 0.1125), 1e-9, "water depth from mass and base area");
  expect_true(!p.box_conductivity_fallback, "aluminum is in the default map");
  expect_near(p.box_conductivity_W_mK, 205.0, 1e-12, "aluminum conductivity");

  expect_near(p.natural_convection_W_m2K, 5.0, 1e-12, "exterior natural convection coefficient");
  expect_near(p.water_convection_W_m2K, 50.0, 1e-12, "water convection coefficient");
  expect_near(p.evaporation_coefficient_W_m2K, 25.0, 1e-12, "evaporation coefficient (Dunkle representative)");
  expect_near(p.condensation_W_m2K, 8000.0, 1e-12, "condensation coefficient");
}

void test_reference_day() {
  const ThermalModel model(DerivedParameters::from(Configuration::defaults()));
  const DailyResult r = model.compute_day(make_day(900.0, 30.0, 0.0));

  expect_near(r.water_temp_K, 375.15, 1e-9, "T_w = T_a + 0.08 G");
  expect_near(r.glass_temp_K, 324.75, 1e-9, "T_g = T_a + 0.3 (T_w - T_a)");
  expect_near(r.base_temp_K, 377.15, 1e-9, "T_b = T_w + 2");
  expect_near(r.losses.h_conv_W_m2K, 5.7, 1e-12, "h at zero wind");
  expect_near(r.losses.conv_glass_W, 2.07765, 1e-5, "glass convection");
  expect_near(r.losses.rad_glass_W, 3.02305289, 1e-6, "glass radiation to sky");
  expect_near(r.losses.conv_wall_W, 25.8552, 1e-5, "wall convection");
  expect_near(r.losses.conduction_W, 3.43694539, 1e-6, "conduction through the network");
  expect_near(r.losses.total_W, 34.3928483, 1e-6, "total loss");

  expect_near(r.solar_energy_J, 1704597.80, 1e-6, "solar energy");
  expect_near(r.lost_energy_J, 742885.523, 1e-6, "lost energy (below the cap)");
  expect_near(r.useful_energy_J, 961712.279, 1e-6, "useful energy");
  expect_near(r.heating_energy_J, 687759.8, 1e-6, "sensible heating of 2 kg");
  expect_near(r.evaporation_energy_J, 273952.479, 1e-6, "energy left for evaporation");

  expect_near(r.band_efficiency, 0.85, 1e-12, "calibrated band at 900 W/m2");
  expect_near(r.scaled_efficiency, 0.85, 1e-12, "ambient scale 1.0 at 30 degC");
  expect_near(r.evaporated_mass_kg, 0.103035225, 1e-7, "evaporated mass");
  expect_near(r.production_L, r.evaporated_mass_kg, 1e-12, "1 kg water = 1 L");
  expect_near(r.gor, 0.160713852, 1e-7, "GOR");
  expect_near(r.thermal_efficiency, 0.564187211, 1e-7, "thermal efficiency");
}

void test_clamps() {
  const ThermalModel model(DerivedParameters::from(Configuration::defaults()));

  // Cold, dim, windy: water never reaches its initial temperature.
  const DailyResult cold = model.compute_day(make_day(100.0, 0.0, 2.0));
  expect_true(cold.heating_energy_J == 0.0, "heating energy floored at zero");
  expect_near(cold.thermal_efficiency, 0.35, 1e-12, "loss cap leaves 35% useful");
  expect_near(cold.gor, 0.35, 1e-12, "no heating: GOR equals thermal efficiency");
  expect_near(cold.band_efficiency, 0.25, 1e-12, "lowest calibrated band");
  expect_near(cold.scaled_efficiency, 0.125, 1e-12, "ambient scale clamped at 0.5");
  expect_near(cold.evaporated_mass_kg, 0.00366647757, 1e-9, "cold-day mass");

  const DailyResult mid = model.compute_day(make_day(500.0, 10.0, 3.0));
  expect_near(mid.thermal_efficiency, 0.35, 1e-12, "loss cap active at 500 W/m2 and 3 m/s");
  expect_near(mid.band_efficiency, 0.45, 1e-12, "400..600 band");
  expect_near(mid.evaporated_mass_kg, 0.00786840657, 1e-9, "mid-day mass");

  bool monotone = true;
  for (double g = 100.0; g <= 950.0; g += 50.0) {
    const DailyResult r = model.compute_day(make_day(g, 20.0, 1.0));
    if (r.useful_energy_J < 0.0 || r.useful_energy_J > r.solar_energy_J) monotone = false;
    if (r.evaporation_energy_J < 0.0 || r.evaporation_energy_J > r.useful_energy_J) monotone = false;
    if (r.evaporated_mass_kg < 0.0 || r.evaporated_mass_kg > 0.5) monotone = false;
  }
  expect_true(monotone, "0 <= E_evap <= E_useful <= E_solar and mass <= 0.25 m");

  Configuration small = Configuration::defaults();
  small.operation.water_mass_kg = 0.1;
  const ThermalModel small_model(DerivedParameters::from(small));
  const DailyResult hot = small_model.compute_day(make_day(950.0, 40.0, 0.0));
  expect_near(hot.evaporated_mass_kg, 0.025, 1e-12, "evaporation capped at 25% of the water mass");
  expect_near(hot.scaled_efficiency, 0.85 * 1.2, 1e-12, "ambient scale clamped at 1.2");
}

void test_zero_solar() {
  const ThermalModel model(DerivedParameters::from(Configuration::defaults()));

  const DailyResult r = model.compute_day(make_day(0.0, 15.0, 2.0));
  expect_true(r.solar_energy_J == 0.0, "no irradiance, no solar energy");
  expect_true(r.gor == 0.0 && r.thermal_efficiency == 0.0, "ratios are zero, not NaN");
  expect_true(r.evaporated_mass_kg == 0.0 && r.production_L == 0.0, "no production");
}

void test_numerical_error() {
  const ThermalModel model(DerivedParameters::from(Configuration::defaults()));
  bool threw = false;
  try {
    (void)model.compute_day(make_day(std::numeric_limits<double>::quiet_NaN(), 20.0, 1.0));
  } catch (const NumericalError& e) {
    threw = (e.day_index() == 166);
  }
  expect_true(threw, "NaN irradiance raises NumericalError with the day index");
}

void test_bands_and_materials() {
  const EfficiencyBandTable cal = EfficiencyBandTable::calibrated();
  expect_near(cal.factor_for(950.0), 0.85, 1e-12, "band >= 800");
  expect_near(cal.factor_for(800.0), 0.85, 1e-12, "band threshold is inclusive");
  expect_near(cal.factor_for(799.9), 0.65, 1e-12, "band 600..800");
  expect_near(cal.factor_for(399.9), 0.25, 1e-12, "band < 400");
  expect_near(cal.factor_for(-5.0), 0.25, 1e-12, "last band covers everything below");

  expect_near(ambient_efficiency_scale(-40.0), 0.5, 1e-12, "scale lower clamp");
  expect_near(ambient_efficiency_scale(20.0), 0.75, 1e-12, "scale (20 + 10) / 40");
  expect_near(ambient_efficiency_scale(60.0), 1.2, 1e-12, "scale upper clamp");

  Configuration cfg = Configuration::defaults();
  cfg.simulation.band_source = BandSource::Configured;
  const DerivedParameters configured = DerivedParameters::from(cfg);
  expect_near(configured.bands.factor_for(900.0), 0.80, 1e-12, "configured bands used verbatim");
  expect_near(configured.bands.factor_for(100.0), 0.35, 1e-12, "configured lowest band");

  cfg = Configuration::defaults();
  cfg.thermal.box_material = "pvc";
  const DerivedParameters pvc = DerivedParameters::from(cfg);
  expect_true(pvc.resistances.R_cond_K_W > 1000.0 * DerivedParameters::from(Configuration::defaults()).resistances.R_cond_K_W,
              "pvc wall conducts far less than aluminum");

  cfg.thermal.box_material = "copper";
  const DerivedParameters fallback = DerivedParameters::from(cfg);
  expect_true(fallback.box_conductivity_fallback, "unknown material flags the fallback");
  expect_near(fallback.box_conductivity_W_mK, kDefaultConductivity_W_mK, 1e-12, "fallback conductivity");

  cfg.thermal.unknown_material = MaterialPolicy::Reject;
  bool rejected = false;
  try {
    (void)DerivedParameters::from(cfg);
  } catch (const ConfigurationError&) {
    rejected = true;
  }
  expect_true(rejected, "reject policy raises ConfigurationError");
}

}  // namespace
}  // namespace desal

int main() {
  using namespace desal;

  set_log_level(LogLevel::ERROR);

  test_derived_defaults();
  test_reference_day();
  test_clamps();
  test_zero_solar();
  test_numerical_error();
  test_bands_and_materials();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
