#pragma once
/*
================================================================================
Physics: Daily Energy Balance of the Solar Still
FILE: cpp/desal/physics/thermal_model.hpp

Purpose:
  - For one climate day (no inter-day state, no hysteresis):
      1) component temperatures (empirical, not PDE-solved)
      2) heat loss by mechanism: glass convection, glass radiation to sky,
         wall convection, conduction through the resistance network
      3) solar / lost / useful energy over the useful sun hours
      4) evaporated mass and production
      5) GOR and thermal efficiency

Model:
  - T_w = T_a + 0.08 G ;  T_g = T_a + 0.3 (T_w - T_a) ;  T_b = T_w + 2
  - h   = 5.7 + 3.8 v                         (McAdams forced convection)
  - q   = f * {h A_lid dT_g, eps sigma A_lid (T_g^4 - T_sky^4),
               h A_wall dT_w, dT_w / (8 R_total)},  T_sky = T_a - 6
  - E_useful = max(0, E_solar - min(E_lost, 0.65 E_solar))
  - E_heat   = max(0, m cp (T_w - T_init))
  - E_evap   = max(0, E_useful - E_heat)
  - m_evap   = min(E_evap / L * band(G) * scale(T_a), 0.25 m), < 1 g -> 0
  - GOR = E_evap / E_solar ; eta_th = E_useful / E_solar  (0 if E_solar <= 0)

Calibration:
  - The coefficients in ThermalCalibration are empirical tuning constants of
    the prototype, not physical invariants. They are kept literally.

Hardening:
  - A non-finite result throws NumericalError naming the day and field.
  - Zero solar energy yields zero ratios (never an error).
================================================================================
*/

#include <vector>

#include "desal/climate/climate_generator.hpp"
#include "desal/physics/derived_params.hpp"

namespace desal {

struct ThermalCalibration {
  static constexpr double water_temp_rise_K_per_Wm2 = 0.08;
  static constexpr double glass_temp_fraction = 0.3;
  static constexpr double base_temp_offset_K = 2.0;
  static constexpr double sky_temp_depression_K = 6.0;

  static constexpr double h_wind_base_W_m2K = 5.7;
  static constexpr double h_wind_slope_W_m2K_per_ms = 3.8;

  static constexpr double insulation_factor = 0.15;
  static constexpr double resistance_inflation = 8.0;

  static constexpr double max_loss_fraction = 0.65;
  static constexpr double max_daily_evaporation_fraction = 0.25;
  static constexpr double evaporation_noise_floor_kg = 0.001;
};

struct HeatLosses {
  double h_conv_W_m2K = 0.0;
  double conv_glass_W = 0.0;
  double rad_glass_W = 0.0;
  double conv_wall_W = 0.0;
  double conduction_W = 0.0;
  double total_W = 0.0;
};

struct DailyResult {
  DailyClimateRecord climate;

  // Temperatures
  double water_temp_K = 0.0;
  double glass_temp_K = 0.0;
  double base_temp_K = 0.0;
  double sky_temp_K = 0.0;
  double water_temp_C = 0.0;
  double glass_temp_C = 0.0;
  double base_temp_C = 0.0;

  HeatLosses losses;

  // Energy over the useful sun hours (J)
  double solar_energy_J = 0.0;
  double lost_energy_J = 0.0;
  double useful_energy_J = 0.0;
  double heating_energy_J = 0.0;
  double evaporation_energy_J = 0.0;

  // Production
  double band_efficiency = 0.0;
  double scaled_efficiency = 0.0;
  double evaporated_mass_kg = 0.0;
  double production_L = 0.0;

  // Metrics
  double gor = 0.0;
  double thermal_efficiency = 0.0;
};

// Component temperatures for one day. Exposed for reports and tests.
struct ComponentTemperatures {
  double water_K = 0.0;
  double glass_K = 0.0;
  double base_K = 0.0;
  double sky_K = 0.0;
};

ComponentTemperatures component_temperatures(double ambient_K, double irradiance_Wm2) noexcept;

// Forced-convection coefficient from wind speed (W/(m2 K)).
double wind_convection_coefficient(double wind_speed_ms) noexcept;

class ThermalModel {
 public:
  explicit ThermalModel(DerivedParameters params);

  // Loss terms for a day with the given temperatures and wind.
  HeatLosses heat_losses(const ComponentTemperatures& t,
                         double ambient_K,
                         double wind_speed_ms) const noexcept;

  // Full energy balance for one day. Throws NumericalError on NaN/Inf.
  DailyResult compute_day(const DailyClimateRecord& day) const;

  // Per-day map over the series; output order == input order.
  std::vector<DailyResult> compute(const std::vector<DailyClimateRecord>& series) const;

  const DerivedParameters& params() const noexcept { return p_; }

 private:
  DerivedParameters p_;
};

}  // namespace desal
