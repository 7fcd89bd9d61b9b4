/*
  Core Selftest: Configuration, Config JSON, Calendar, Logging

  Objective
  ---------
  Framework-free checks that:
    1) Defaults validate and every rejection names its dotted parameter.
    2) Unknown box materials follow the configured policy.
    3) Config JSON survives save -> load with every field intact; unknown
       keys are ignored, missing keys keep defaults.
    4) Malformed JSON and wrong types are rejected with a line/col location.
    5) Calendar arithmetic honors leap years.

  Expected use
  ------------
      ./desal_config_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "desal/core/calendar.hpp"
#include "desal/core/config.hpp"
#include "desal/core/config_json.hpp"
#include "desal/core/errors.hpp"
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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

// Runs validate_or_throw() and checks the reported parameter path.
template <typename Mutate>
void expect_rejected(Mutate mutate, const std::string& parameter) {
  Configuration c = Configuration::defaults();
  mutate(c);
  try {
    c.validate_or_throw();
    fail("expected ConfigurationError for " + parameter);
  } catch (const ConfigurationError& e) {
    expect_eq_str(e.parameter(), parameter, "rejection names " + parameter);
  }
}

void test_defaults_validate() {
  Configuration c = Configuration::defaults();
  bool ok = true;
  try {
    c.validate_or_throw();
  } catch (const ConfigurationError& e) {
    ok = false;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(ok, "defaults validate");
  expect_true(c.thermal.box_material == "aluminum", "default material is aluminum");
  expect_true(c.operation.hemisphere == Hemisphere::North, "default hemisphere is north");
  expect_true(c.simulation.band_source == BandSource::Calibrated, "default band source is calibrated");
}

void test_rejections_name_parameter() {
  expect_rejected([](Configuration& c) { c.dimensions.length_m = -0.1; }, "dimensions.length_m");
  expect_rejected([](Configuration& c) { c.dimensions.height_m = 0.0; }, "dimensions.height_m");
  expect_rejected([](Configuration& c) { c.thermal.absorptivity = 1.5; }, "thermal.absorptivity");
  expect_rejected([](Configuration& c) { c.thermal.incidence_angle_deg = 90.0; }, "thermal.incidence_angle_deg");
  expect_rejected([](Configuration& c) { c.water.boiling_temp_K = 290.0; }, "water.boiling_temp_K");
  expect_rejected([](Configuration& c) { c.water.latent_heat_J_kg = std::nan(""); }, "water.latent_heat_J_kg");
  expect_rejected([](Configuration& c) { c.operation.water_mass_kg = 0.0; }, "operation.water_mass_kg");
  expect_rejected([](Configuration& c) { c.operation.useful_sun_hours = 25.0; }, "operation.useful_sun_hours");
  expect_rejected([](Configuration& c) { c.simulation.daily_stddev_Wm2 = -1.0; }, "simulation.daily_stddev_Wm2");
  expect_rejected([](Configuration& c) { c.material_conductivity_W_mK["wood"] = 0.0; },
                  "material_conductivity_W_mK.wood");
  expect_rejected([](Configuration& c) { c.simulation.efficiency_bands[1].factor = 0.0; },
                  "simulation.efficiency_bands[1].factor");
  expect_rejected([](Configuration& c) { c.simulation.efficiency_bands[2].min_irradiance_Wm2 = 700.0; },
                  "simulation.efficiency_bands[2].min_irradiance_Wm2");
}

void test_unknown_material_policy() {
  Configuration c = Configuration::defaults();
  c.thermal.box_material = "unobtainium";

  bool fallback = false;
  const double k = c.box_conductivity_W_mK(&fallback);
  expect_true(fallback, "unknown material uses fallback");
  expect_true(k == kDefaultConductivity_W_mK, "fallback conductivity is 205 W/(m K)");

  c.thermal.unknown_material = MaterialPolicy::Reject;
  expect_rejected([](Configuration& x) {
    x.thermal.box_material = "unobtainium";
    x.thermal.unknown_material = MaterialPolicy::Reject;
  }, "thermal.box_material");

  c.thermal.box_material = "steel";
  expect_true(c.box_conductivity_W_mK(&fallback) == 50.0 && !fallback, "known material is looked up");
}

void test_json_round_trip() {
  Configuration c = Configuration::defaults();
  c.dimensions.length_m = 0.6;
  c.thermal.absorptivity = 0.85;
  c.thermal.box_material = "steel";
  c.thermal.unknown_material = MaterialPolicy::Reject;
  c.water.initial_temp_K = 291.3;
  c.material_conductivity_W_mK["copper \"pure\""] = 385.0;
  c.operation.hemisphere = Hemisphere::South;
  c.operation.water_mass_kg = 1.25;
  c.simulation.epoch_year = 2023;
  c.simulation.band_source = BandSource::Configured;
  c.simulation.efficiency_bands = {{700.0, 0.9}, {0.0, 0.1}};

  const std::string json = config_to_json(c);
  Configuration back;
  JsonParseError err;
  const bool ok = parse_config_json(std::string_view(json), &back, &err);
  expect_true(ok, "config JSON parses");
  if (!ok) {
    std::cerr << "  " << err.message << " @ " << err.line << ":" << err.col << "\n";
    return;
  }

  expect_true(back.dimensions.length_m == 0.6, "length_m survives");
  expect_true(back.thermal.absorptivity == 0.85, "absorptivity survives");
  expect_eq_str(back.thermal.box_material, "steel", "box_material survives");
  expect_true(back.thermal.unknown_material == MaterialPolicy::Reject, "unknown_material survives");
  expect_true(back.water.initial_temp_K == 291.3, "initial_temp_K survives exactly");
  expect_true(back.material_conductivity_W_mK.size() == 4, "material table size survives");
  expect_true(back.material_conductivity_W_mK.count("copper \"pure\"") == 1, "escaped material name survives");
  expect_true(back.operation.hemisphere == Hemisphere::South, "hemisphere survives");
  expect_true(back.operation.water_mass_kg == 1.25, "water_mass_kg survives");
  expect_true(back.simulation.epoch_year == 2023, "epoch_year survives");
  expect_true(back.simulation.band_source == BandSource::Configured, "band_source survives");
  expect_true(back.simulation.efficiency_bands.size() == 2 &&
                  back.simulation.efficiency_bands[0].factor == 0.9 &&
                  back.simulation.efficiency_bands[1].min_irradiance_Wm2 == 0.0,
              "efficiency_bands survive");

  expect_eq_str(config_to_json(back), json, "serialization is deterministic");
}

void test_json_partial_and_unknown_keys() {
  const std::string json = R"({
    "operation": {"water_mass_kg": 3.5, "future_option": true},
    "comment": "ignored",
    "dimensions": {}
  })";
  Configuration c;
  JsonParseError err;
  expect_true(parse_config_json(std::string_view(json), &c, &err), "partial JSON parses");
  expect_true(c.operation.water_mass_kg == 3.5, "present key applied");
  expect_true(c.dimensions.length_m == 0.45, "missing key keeps default");
  expect_true(c.material_conductivity_W_mK.size() == 3, "missing material table keeps defaults");

  std::istringstream is(json);
  Configuration from_stream;
  expect_true(parse_config_json(is, &from_stream, &err) && from_stream.operation.water_mass_kg == 3.5,
              "stream overload parses");
}

void test_json_errors_have_location() {
  {
    Configuration c;
    JsonParseError err;
    const bool ok = parse_config_json(std::string_view("{\n  \"dimensions\": {\"length_m\": 0.5,}\n}"), &c, &err);
    expect_true(!ok, "trailing comma rejected");
    expect_true(err.line == 2, "syntax error reports line 2");
    expect_true(err.col > 1, "syntax error reports a column");
  }
  {
    Configuration c;
    JsonParseError err;
    const bool ok = parse_config_json(std::string_view("{\n\"water\": {\n  \"latent_heat_J_kg\": \"lots\"\n}}"), &c, &err);
    expect_true(!ok, "string for numeric field rejected");
    expect_true(err.line == 3, "type error points at the value line");
    expect_true(err.message.find("water.latent_heat_J_kg") != std::string::npos, "type error names the path");
  }
  {
    Configuration c;
    JsonParseError err;
    expect_true(!parse_config_json(std::string_view("{\"operation\": {\"water_mass_kg\": null}}"), &c, &err),
                "null numeric rejected");
    expect_true(!parse_config_json(std::string_view("{\"operation\": {\"hemisphere\": \"east\"}}"), &c, &err),
                "unknown hemisphere rejected");
    expect_true(!parse_config_json(std::string_view("{\"simulation\": {\"epoch_year\": 2024.5}}"), &c, &err),
                "fractional epoch_year rejected");
    expect_true(!parse_config_json(std::string_view("{\"dimensions\": {\"length_m\": 1e999}}"), &c, &err),
                "out-of-range number rejected");
    expect_true(!parse_config_json(std::string_view("[]"), &c, &err), "non-object root rejected");
    expect_true(!parse_config_json(std::string_view("{} x"), &c, &err), "trailing characters rejected");
  }
}

void test_json_file_io() {
  const std::string path = "desal_config_selftest.json";
  Configuration c = Configuration::defaults();
  c.operation.water_mass_kg = 4.0;
  expect_true(write_config_json_file(c, path, true), "config file written with derived block");

  Configuration back;
  JsonParseError err;
  expect_true(load_config_json_file(path, &back, &err), "config file loads (derived block ignored)");
  expect_true(back.operation.water_mass_kg == 4.0, "file round trip keeps water mass");

  const std::string with_derived = config_to_json(c, true);
  expect_true(with_derived.find("\"derived\"") != std::string::npos, "derived block present");
  expect_true(with_derived.find("\"resistances_K_W\"") != std::string::npos, "derived resistances present");
  expect_true(with_derived.find("\"heat_transfer_W_m2K\"") != std::string::npos, "derived coefficients present");
  expect_true(with_derived.find("\"evaporation\": 25,") != std::string::npos, "evaporation coefficient exported");
  expect_true(with_derived.find("\"condensation\": 8000") != std::string::npos, "condensation coefficient exported");
  std::remove(path.c_str());

  bool threw = false;
  try {
    (void)load_config_json_file("does/not/exist.json", &back, &err);
  } catch (const IOError&) {
    threw = true;
  }
  expect_true(threw, "missing config file raises IOError");
}

void test_calendar() {
  expect_true(is_leap_year(2024) && !is_leap_year(2023), "leap year /4");
  expect_true(!is_leap_year(1900) && is_leap_year(2000), "leap year /100 and /400");
  expect_true(days_in_month(2024, 2) == 29 && days_in_month(2023, 2) == 28, "February length");
  expect_eq_str(to_iso_string(add_days(CalendarDate{2024, 1, 1}, 364)), "2024-12-30", "leap year day 365 is Dec 30");
  expect_eq_str(to_iso_string(add_days(CalendarDate{2023, 1, 1}, 364)), "2023-12-31", "common year day 365 is Dec 31");
  expect_eq_str(to_iso_string(next_day(CalendarDate{2023, 12, 31})), "2024-01-01", "year rollover");
  expect_eq_str(month_name(6), "June", "month name");

  bool threw = false;
  try {
    (void)days_in_month(2024, 13);
  } catch (const ValidationError& e) {
    const DesalError& base = e;
    threw = std::string(base.what()).find("month") != std::string::npos;
  }
  expect_true(threw, "month 13 raises ValidationError (a DesalError)");

  threw = false;
  try {
    (void)add_days(CalendarDate{2024, 1, 1}, -1);
  } catch (const DesalError&) {
    threw = true;
  }
  expect_true(threw, "negative day offset is rejected");
}

void test_log_level_parse() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("Debug", &lvl) && lvl == LogLevel::DEBUG, "log level parse is case-insensitive");
  expect_true(!parse_log_level("chatty", &lvl) && lvl == LogLevel::DEBUG, "unknown log level leaves value");
}

}  // namespace
}  // namespace desal

int main() {
  using namespace desal;

  set_log_level(LogLevel::ERROR);

  test_defaults_validate();
  test_rejections_name_parameter();
  test_unknown_material_policy();
  test_json_round_trip();
  test_json_partial_and_unknown_keys();
  test_json_errors_have_location();
  test_json_file_io();
  test_calendar();
  test_log_level_parse();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
