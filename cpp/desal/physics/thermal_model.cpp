#include "desal/physics/thermal_model.hpp"

#include <algorithm>
#include <utility>

#include "desal/core/errors.hpp"
#include "desal/core/numeric.hpp"
#include "desal/core/units.hpp"

namespace desal {

namespace {

void require_finite_field(double v, int day_index, const char* field) {
  if (!is_finite(v)) throw NumericalError(day_index, field, "non-finite value");
}

}  // namespace

ComponentTemperatures component_temperatures(double ambient_K, double irradiance_Wm2) noexcept {
  using C = ThermalCalibration;
  ComponentTemperatures t;
  t.water_K = ambient_K + C::water_temp_rise_K_per_Wm2 * irradiance_Wm2;
  t.glass_K = ambient_K + C::glass_temp_fraction * (t.water_K - ambient_K);
  t.base_K = t.water_K + C::base_temp_offset_K;
  t.sky_K = ambient_K - C::sky_temp_depression_K;
  return t;
}

double wind_convection_coefficient(double wind_speed_ms) noexcept {
  using C = ThermalCalibration;
  return C::h_wind_base_W_m2K + C::h_wind_slope_W_m2K_per_ms * wind_speed_ms;
}

ThermalModel::ThermalModel(DerivedParameters params) : p_(std::move(params)) {}

HeatLosses ThermalModel::heat_losses(const ComponentTemperatures& t,
                                     double ambient_K,
                                     double wind_speed_ms) const noexcept {
  using C = ThermalCalibration;
  const double f = C::insulation_factor;

  HeatLosses q;
  q.h_conv_W_m2K = wind_convection_coefficient(wind_speed_ms);

  q.conv_glass_W = f * q.h_conv_W_m2K * p_.lid_area_m2 * (t.glass_K - ambient_K);
  q.rad_glass_W = f * ConstructionConstants::emissivity * units::stefan_boltzmann * p_.lid_area_m2 *
                  (units::pow4(t.glass_K) - units::pow4(t.sky_K));
  q.conv_wall_W = f * q.h_conv_W_m2K * p_.wall_area_m2 * (t.water_K - ambient_K);

  const double R_eff = p_.resistances.R_total_K_W * C::resistance_inflation;
  q.conduction_W = f * (t.water_K - ambient_K) / R_eff;

  q.total_W = q.conv_glass_W + q.rad_glass_W + q.conv_wall_W + q.conduction_W;
  return q;
}

DailyResult ThermalModel::compute_day(const DailyClimateRecord& day) const {
  using C = ThermalCalibration;
  const int idx = day.day_of_year;

  DailyResult r;
  r.climate = day;

  // 1) Temperatures
  const ComponentTemperatures t = component_temperatures(day.ambient_temp_K, day.irradiance_Wm2);
  r.water_temp_K = t.water_K;
  r.glass_temp_K = t.glass_K;
  r.base_temp_K = t.base_K;
  r.sky_temp_K = t.sky_K;
  r.water_temp_C = units::kelvin_to_celsius(t.water_K);
  r.glass_temp_C = units::kelvin_to_celsius(t.glass_K);
  r.base_temp_C = units::kelvin_to_celsius(t.base_K);

  // 2) Losses
  r.losses = heat_losses(t, day.ambient_temp_K, day.wind_speed_ms);
  require_finite_field(r.losses.total_W, idx, "losses.total_W");

  // 3) Energy
  r.solar_energy_J = day.irradiance_Wm2 * p_.cos_incidence * p_.absorptivity *
                     p_.captured_area_m2 * p_.useful_seconds;
  r.lost_energy_J = r.losses.total_W * p_.useful_seconds;
  const double capped_loss_J = std::min(r.lost_energy_J, C::max_loss_fraction * r.solar_energy_J);
  r.useful_energy_J = std::max(0.0, r.solar_energy_J - capped_loss_J);
  require_finite_field(r.useful_energy_J, idx, "useful_energy_J");

  // 4) Production
  r.band_efficiency = p_.bands.factor_for(day.irradiance_Wm2);
  r.scaled_efficiency = r.band_efficiency * ambient_efficiency_scale(day.ambient_temp_C);

  // Water that stays below its initial temperature needs no sensible heat.
  r.heating_energy_J = std::max(0.0, p_.water_mass_kg * p_.specific_heat_J_kgK *
                                         (r.water_temp_K - p_.initial_temp_K));
  r.evaporation_energy_J = std::max(0.0, r.useful_energy_J - r.heating_energy_J);

  const double theoretical_kg = r.evaporation_energy_J / p_.latent_heat_J_kg;
  double mass_kg = theoretical_kg * r.scaled_efficiency;
  mass_kg = std::min(mass_kg, C::max_daily_evaporation_fraction * p_.water_mass_kg);
  if (mass_kg < C::evaporation_noise_floor_kg) mass_kg = 0.0;
  require_finite_field(mass_kg, idx, "evaporated_mass_kg");

  r.evaporated_mass_kg = mass_kg;
  r.production_L = mass_kg * units::kg_water_to_L;

  // 5) Metrics
  r.gor = (r.solar_energy_J > 0.0) ? safe_div(r.evaporation_energy_J, r.solar_energy_J) : 0.0;
  r.thermal_efficiency = (r.solar_energy_J > 0.0) ? safe_div(r.useful_energy_J, r.solar_energy_J) : 0.0;

  return r;
}

std::vector<DailyResult> ThermalModel::compute(const std::vector<DailyClimateRecord>& series) const {
  std::vector<DailyResult> out;
  out.reserve(series.size());
  for (const auto& day : series) out.push_back(compute_day(day));
  return out;
}

}  // namespace desal
