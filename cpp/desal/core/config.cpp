#include "desal/core/config.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

#include "desal/core/numeric.hpp"

namespace desal {

namespace {

std::string lower(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

void require_positive(double v, const char* param) {
  if (!is_positive(v)) {
    std::ostringstream oss;
    oss << "must be finite and > 0, got " << v;
    throw ConfigurationError(param, oss.str());
  }
}

void require_nonnegative(double v, const char* param) {
  if (!is_nonnegative(v)) {
    std::ostringstream oss;
    oss << "must be finite and >= 0, got " << v;
    throw ConfigurationError(param, oss.str());
  }
}

}  // namespace

const char* to_string(Hemisphere h) noexcept {
  switch (h) {
    case Hemisphere::North: return "north";
    case Hemisphere::South: return "south";
    default:                return "north";
  }
}

const char* to_string(MaterialPolicy p) noexcept {
  switch (p) {
    case MaterialPolicy::FallbackToDefault: return "fallback";
    case MaterialPolicy::Reject:            return "reject";
    default:                                return "fallback";
  }
}

const char* to_string(BandSource b) noexcept {
  switch (b) {
    case BandSource::Calibrated: return "calibrated";
    case BandSource::Configured: return "configured";
    default:                     return "calibrated";
  }
}

bool parse_hemisphere(const std::string& s, Hemisphere* out) noexcept {
  if (!out) return false;
  const std::string v = lower(s);
  if (v == "north" || v == "n") { *out = Hemisphere::North; return true; }
  if (v == "south" || v == "s") { *out = Hemisphere::South; return true; }
  return false;
}

bool parse_material_policy(const std::string& s, MaterialPolicy* out) noexcept {
  if (!out) return false;
  const std::string v = lower(s);
  if (v == "fallback") { *out = MaterialPolicy::FallbackToDefault; return true; }
  if (v == "reject")   { *out = MaterialPolicy::Reject; return true; }
  return false;
}

bool parse_band_source(const std::string& s, BandSource* out) noexcept {
  if (!out) return false;
  const std::string v = lower(s);
  if (v == "calibrated") { *out = BandSource::Calibrated; return true; }
  if (v == "configured") { *out = BandSource::Configured; return true; }
  return false;
}

void Dimensions::validate_or_throw() const {
  require_positive(length_m, "dimensions.length_m");
  require_positive(width_m, "dimensions.width_m");
  require_positive(height_m, "dimensions.height_m");
}

void ThermalProperties::validate_or_throw() const {
  if (!(is_finite(absorptivity) && absorptivity > 0.0 && absorptivity <= 1.0)) {
    throw ConfigurationError("thermal.absorptivity", "must be in (0,1]");
  }
  if (!(is_finite(incidence_angle_deg) && incidence_angle_deg >= 0.0 && incidence_angle_deg < 90.0)) {
    throw ConfigurationError("thermal.incidence_angle_deg", "must be in [0,90)");
  }
  if (box_material.empty()) {
    throw ConfigurationError("thermal.box_material", "must not be empty");
  }
}

void WaterProperties::validate_or_throw() const {
  require_positive(specific_heat_J_kgK, "water.specific_heat_J_kgK");
  require_positive(latent_heat_J_kg, "water.latent_heat_J_kg");
  require_positive(initial_temp_K, "water.initial_temp_K");
  require_positive(boiling_temp_K, "water.boiling_temp_K");
  if (!(boiling_temp_K > initial_temp_K)) {
    std::ostringstream oss;
    oss << "must exceed water.initial_temp_K (" << initial_temp_K << " K), got " << boiling_temp_K << " K";
    throw ConfigurationError("water.boiling_temp_K", oss.str());
  }
}

void OperationSettings::validate_or_throw() const {
  require_positive(useful_sun_hours, "operation.useful_sun_hours");
  if (useful_sun_hours > 24.0) {
    throw ConfigurationError("operation.useful_sun_hours", "must be <= 24");
  }
  require_positive(water_mass_kg, "operation.water_mass_kg");
  if (!(is_finite(latitude_deg) && latitude_deg >= -90.0 && latitude_deg <= 90.0)) {
    throw ConfigurationError("operation.latitude_deg", "must be in [-90,90]");
  }
}

void SimulationSettings::validate_or_throw() const {
  require_positive(base_irradiance_Wm2, "simulation.base_irradiance_Wm2");
  require_nonnegative(seasonal_amplitude_Wm2, "simulation.seasonal_amplitude_Wm2");
  require_nonnegative(daily_stddev_Wm2, "simulation.daily_stddev_Wm2");
  if (epoch_year < 1583 || epoch_year > 9999) {
    throw ConfigurationError("simulation.epoch_year", "must be a Gregorian year in [1583,9999]");
  }

  if (efficiency_bands.empty()) {
    throw ConfigurationError("simulation.efficiency_bands", "must contain at least one band");
  }
  for (std::size_t i = 0; i < efficiency_bands.size(); ++i) {
    const auto& b = efficiency_bands[i];
    const std::string at = "simulation.efficiency_bands[" + std::to_string(i) + "]";
    if (!is_nonnegative(b.min_irradiance_Wm2)) {
      throw ConfigurationError(at + ".min_irradiance_Wm2", "must be finite and >= 0");
    }
    if (!(is_finite(b.factor) && b.factor > 0.0 && b.factor <= 1.0)) {
      throw ConfigurationError(at + ".factor", "must be in (0,1]");
    }
    if (i > 0 && !(b.min_irradiance_Wm2 < efficiency_bands[i - 1].min_irradiance_Wm2)) {
      throw ConfigurationError(at + ".min_irradiance_Wm2", "thresholds must be strictly descending");
    }
  }
}

void Configuration::validate_or_throw() const {
  dimensions.validate_or_throw();
  thermal.validate_or_throw();
  water.validate_or_throw();
  operation.validate_or_throw();
  simulation.validate_or_throw();

  for (const auto& kv : material_conductivity_W_mK) {
    if (!is_positive(kv.second)) {
      throw ConfigurationError("material_conductivity_W_mK." + kv.first, "must be finite and > 0");
    }
  }
  if (!has_box_material() && thermal.unknown_material == MaterialPolicy::Reject) {
    throw ConfigurationError("thermal.box_material",
                             "unknown material '" + thermal.box_material + "' and unknown_material=reject");
  }
}

bool Configuration::has_box_material() const {
  return material_conductivity_W_mK.find(thermal.box_material) != material_conductivity_W_mK.end();
}

double Configuration::box_conductivity_W_mK(bool* fallback_used) const {
  const auto it = material_conductivity_W_mK.find(thermal.box_material);
  if (it != material_conductivity_W_mK.end()) {
    if (fallback_used) *fallback_used = false;
    return it->second;
  }
  if (thermal.unknown_material == MaterialPolicy::Reject) {
    throw ConfigurationError("thermal.box_material",
                             "unknown material '" + thermal.box_material + "'");
  }
  if (fallback_used) *fallback_used = true;
  return kDefaultConductivity_W_mK;
}

}  // namespace desal
