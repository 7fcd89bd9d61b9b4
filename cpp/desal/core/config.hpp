#pragma once
/*
================================================================================
Core: Desalinator Configuration
FILE: cpp/desal/core/config.hpp

Purpose:
  - Single validated value holding every physical, geometric and operational
    parameter of the solar box plus the climate-generator tunables.
  - Injected by value into DerivedParameters / ClimateGenerator / ThermalModel.
    Nothing in the engine looks configuration up from ambient state.

Hardening:
  - validate_or_throw() rejects non-physical values before any generation.
  - Every failure names the dotted parameter path (ConfigurationError).
  - Explicit units in every field name.

Defaults reproduce the reference prototype (0.45 x 0.25 x 0.30 m aluminum
box, 2 kg of water, 6 useful sun hours, northern hemisphere, 40 deg latitude).
================================================================================
*/

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "desal/core/errors.hpp"

namespace desal {

// ----------------------------- Enumerations ----------------------------------
enum class Hemisphere : int { North = 0, South = 1 };

// What to do when thermal.box_material is missing from the conductivity map.
enum class MaterialPolicy : int {
  FallbackToDefault = 0,  // use kDefaultConductivity_W_mK and log a warning
  Reject = 1              // ConfigurationError
};

// Which efficiency-band table the thermal model applies.
enum class BandSource : int {
  Calibrated = 0,  // fixed calibrated table (0.85 / 0.65 / 0.45 / 0.25)
  Configured = 1   // simulation.efficiency_bands verbatim
};

const char* to_string(Hemisphere h) noexcept;
const char* to_string(MaterialPolicy p) noexcept;
const char* to_string(BandSource b) noexcept;

bool parse_hemisphere(const std::string& s, Hemisphere* out) noexcept;
bool parse_material_policy(const std::string& s, MaterialPolicy* out) noexcept;
bool parse_band_source(const std::string& s, BandSource* out) noexcept;

// Aluminum; used for unknown materials under MaterialPolicy::FallbackToDefault.
inline constexpr double kDefaultConductivity_W_mK = 205.0;

// ----------------------------- Dimensions ------------------------------------
struct Dimensions {
  double length_m = 0.45;
  double width_m = 0.25;
  double height_m = 0.30;

  void validate_or_throw() const;
};

// ----------------------------- Thermal ---------------------------------------
struct ThermalProperties {
  // Solar absorptivity of the absorber (0..1]
  double absorptivity = 0.9;

  // Solar incidence angle from the aperture normal (deg), [0, 90)
  double incidence_angle_deg = 30.0;

  // Key into Configuration::material_conductivity_W_mK
  std::string box_material = "aluminum";

  MaterialPolicy unknown_material = MaterialPolicy::FallbackToDefault;

  void validate_or_throw() const;
};

// ----------------------------- Water -----------------------------------------
struct WaterProperties {
  double specific_heat_J_kgK = 4186.0;
  double latent_heat_J_kg = 2.26e6;
  double initial_temp_K = 293.0;   // 20 degC
  double boiling_temp_K = 368.0;   // 95 degC

  void validate_or_throw() const;
};

// ----------------------------- Operation -------------------------------------
struct OperationSettings {
  double useful_sun_hours = 6.0;
  double water_mass_kg = 2.0;
  Hemisphere hemisphere = Hemisphere::North;

  // Informational only: the climate generator is parametric, not latitude-driven.
  double latitude_deg = 40.0;

  void validate_or_throw() const;
};

// ----------------------------- Simulation ------------------------------------
struct EfficiencyBand {
  double min_irradiance_Wm2 = 0.0;  // band applies when G >= this
  double factor = 0.0;              // (0,1]
};

struct SimulationSettings {
  double base_irradiance_Wm2 = 500.0;
  double seasonal_amplitude_Wm2 = 350.0;
  double daily_stddev_Wm2 = 100.0;

  // Calendar year of the first simulated day (Jan 1).
  int epoch_year = 2024;

  BandSource band_source = BandSource::Calibrated;

  // Strictly descending thresholds. The last band also covers every
  // irradiance below its own threshold.
  std::vector<EfficiencyBand> efficiency_bands = {
      {800.0, 0.80},
      {600.0, 0.70},
      {400.0, 0.55},
      {0.0, 0.35},
  };

  void validate_or_throw() const;
};

// ----------------------------- Configuration ---------------------------------
struct Configuration {
  Dimensions dimensions;
  ThermalProperties thermal;
  WaterProperties water;
  std::map<std::string, double> material_conductivity_W_mK = {
      {"steel", 50.0},
      {"aluminum", 205.0},
      {"pvc", 0.19},
  };
  OperationSettings operation;
  SimulationSettings simulation;

  void validate_or_throw() const;

  // True when thermal.box_material has an entry in the conductivity map.
  bool has_box_material() const;

  // Conductivity of thermal.box_material, applying the unknown-material policy.
  // *fallback_used (optional) reports whether the default was substituted.
  double box_conductivity_W_mK(bool* fallback_used = nullptr) const;

  static Configuration defaults() {
    Configuration c;
    return c;
  }
};

}  // namespace desal
