#include "desal/exports/results_json.hpp"

#include <fstream>

#include "desal/core/config_json.hpp"
#include "desal/core/json_writer.hpp"

namespace desal {

namespace {

void emit_period(JsonWriter& j, const PeriodStats& s) {
  j.key("day_count"); j.num_i(s.day_count); j.comma(); j.nl();
  j.field("production_L", s.production_L);
  j.field("evaporated_mass_kg", s.evaporated_mass_kg);
  j.field("solar_energy_J", s.solar_energy_J);
  j.field("useful_energy_J", s.useful_energy_J);
  j.field("lost_energy_J", s.lost_energy_J);
  j.field("evaporation_energy_J", s.evaporation_energy_J);
  j.field("mean_production_L", s.mean_production_L);
  j.field("mean_irradiance_Wm2", s.mean_irradiance_Wm2);
  j.field("mean_gor", s.mean_gor);
  j.field("mean_thermal_efficiency", s.mean_thermal_efficiency);

  j.key("mean_losses_W"); j.obj_begin(); j.nl();
  j.field("conv_glass", s.mean_conv_glass_W);
  j.field("rad_glass", s.mean_rad_glass_W);
  j.field("conv_wall", s.mean_conv_wall_W);
  j.field("conduction", s.mean_conduction_W);
  j.field("total", s.mean_total_loss_W, true);
  j.obj_end(); j.comma(); j.nl();

  j.field("mean_water_temp_C", s.mean_water_temp_C);
  j.field("mean_glass_temp_C", s.mean_glass_temp_C);
  j.field("mean_ambient_temp_C", s.mean_ambient_temp_C);
  j.field("mean_relative_humidity_pct", s.mean_relative_humidity_pct);
  j.field("mean_wind_speed_ms", s.mean_wind_speed_ms, true);
}

void emit_annual(JsonWriter& j, const AnnualSummary& a) {
  j.obj_begin(); j.nl();
  j.key("day_count"); j.num_i(a.day_count); j.comma(); j.nl();

  j.field("total_production_L", a.total_production_L);
  j.field("mean_daily_production_L", a.mean_daily_production_L);
  j.field("max_daily_production_L", a.max_daily_production_L);

  j.field("mean_irradiance_Wm2", a.mean_irradiance_Wm2);
  j.field("min_irradiance_Wm2", a.min_irradiance_Wm2);
  j.field("max_irradiance_Wm2", a.max_irradiance_Wm2);

  j.field("mean_gor", a.mean_gor);
  j.field("annual_gor", a.annual_gor);
  j.field("annual_thermal_efficiency", a.annual_thermal_efficiency);

  j.key("energy_J"); j.obj_begin(); j.nl();
  j.field("solar", a.total_solar_energy_J);
  j.field("useful", a.total_useful_energy_J);
  j.field("lost", a.total_lost_energy_J);
  j.field("evaporation", a.total_evaporation_energy_J, true);
  j.obj_end(); j.comma(); j.nl();
  j.field("lost_energy_share_pct", a.lost_energy_share_pct);

  j.field("mean_water_temp_C", a.mean_water_temp_C);
  j.field("mean_glass_temp_C", a.mean_glass_temp_C);
  j.field("mean_ambient_temp_C", a.mean_ambient_temp_C);
  j.field("mean_relative_humidity_pct", a.mean_relative_humidity_pct);
  j.field("mean_wind_speed_ms", a.mean_wind_speed_ms);
  j.field("mean_total_loss_W", a.mean_total_loss_W);

  j.key("correlations"); j.obj_begin(); j.nl();
  j.field("production_irradiance", a.corr_production_irradiance);
  j.field("production_temperature", a.corr_production_temperature);
  j.field("production_humidity", a.corr_production_humidity, true);
  j.obj_end(); j.comma(); j.nl();

  j.key("high_production_days"); j.num_i(a.high_production_days); j.comma(); j.nl();
  j.key("low_production_days"); j.num_i(a.low_production_days); j.comma(); j.nl();
  j.key("best_month"); j.num_i(a.best_month); j.comma(); j.nl();
  j.key("worst_month"); j.num_i(a.worst_month); j.comma(); j.nl();
  j.key("best_season"); j.str(to_string(a.best_season)); j.comma(); j.nl();
  j.key("worst_season"); j.str(to_string(a.worst_season));
  j.obj_end();
}

}  // namespace

std::string run_to_json(const SimulationRun& run, int indent_spaces) {
  JsonWriter j;
  j.indent = indent_spaces;

  j.obj_begin(); j.nl();

  j.key("seed"); j.num_u(run.seed); j.comma(); j.nl();

  // Configuration values are echoed exactly; results use fixed precision.
  j.fixed_point = false;
  j.key("configuration"); emit_config_object(j, run.config, nullptr); j.comma(); j.nl();
  j.fixed_point = true;

  j.key("derived"); emit_derived_object(j, run.derived); j.comma(); j.nl();
  j.key("annual"); emit_annual(j, run.annual); j.comma(); j.nl();

  j.key("monthly"); j.arr_begin();
  for (size_t i = 0; i < run.monthly.size(); ++i) {
    const auto& m = run.monthly[i];
    j.nl(); j.obj_begin(); j.nl();
    j.key("month"); j.num_i(m.month); j.comma(); j.nl();
    j.key("name"); j.str(m.name); j.comma(); j.nl();
    emit_period(j, m.stats);
    j.obj_end();
    if (i + 1 < run.monthly.size()) j.comma();
  }
  j.arr_end(); j.comma(); j.nl();

  j.key("seasonal"); j.arr_begin();
  for (size_t i = 0; i < run.seasonal.size(); ++i) {
    const auto& s = run.seasonal[i];
    j.nl(); j.obj_begin(); j.nl();
    j.key("season"); j.str(s.name); j.comma(); j.nl();
    j.field("share_of_annual_pct", s.share_of_annual_pct);
    emit_period(j, s.stats);
    j.obj_end();
    if (i + 1 < run.seasonal.size()) j.comma();
  }
  j.arr_end();

  j.obj_end();
  j.out << "\n";
  return j.out.str();
}

bool write_run_json_file(const SimulationRun& run, const std::string& file_path, int indent_spaces) {
  const std::string text = run_to_json(run, indent_spaces);
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << text;
  f.close();
  return !f.fail();
}

}  // namespace desal
