#include "desal/physics/derived_params.hpp"

#include <cmath>
#include <sstream>
#include <utility>

#include "desal/core/logging.hpp"
#include "desal/core/numeric.hpp"
#include "desal/core/units.hpp"

namespace desal {

EfficiencyBandTable::EfficiencyBandTable(std::vector<EfficiencyBand> bands)
    : bands_(std::move(bands)) {}

EfficiencyBandTable EfficiencyBandTable::calibrated() {
  return EfficiencyBandTable({
      {800.0, 0.85},
      {600.0, 0.65},
      {400.0, 0.45},
      {0.0, 0.25},
  });
}

double EfficiencyBandTable::factor_for(double irradiance_Wm2) const noexcept {
  if (bands_.empty()) return 0.0;
  for (const auto& b : bands_) {
    if (irradiance_Wm2 >= b.min_irradiance_Wm2) return b.factor;
  }
  return bands_.back().factor;
}

double dunkle_evaporation_coefficient_W_m2K() noexcept {
  return 25.0;
}

double ambient_efficiency_scale(double ambient_temp_C) noexcept {
  return clamp((ambient_temp_C + 10.0) / 40.0, 0.5, 1.2);
}

ThermalResistances compute_resistances(double box_conductivity_W_mK,
                                       double wall_area_m2,
                                       double lid_area_m2,
                                       double total_area_m2) {
  using C = ConstructionConstants;
  ThermalResistances r;
  r.R_cond_K_W = C::box_thickness_m / (box_conductivity_W_mK * wall_area_m2);
  r.R_insulation_K_W = C::insulation_thickness_m / (C::insulation_conductivity_W_mK * wall_area_m2);
  r.R_walls_K_W = r.R_cond_K_W + r.R_insulation_K_W;
  r.R_glass_K_W = C::glass_thickness_m / (C::glass_conductivity_W_mK * lid_area_m2);
  r.R_conv_ext_K_W = 1.0 / (C::h_natural_convection_W_m2K * total_area_m2);

  // Walls and glass in parallel, exterior convection in series.
  const double parallel = 1.0 / (1.0 / r.R_walls_K_W + 1.0 / r.R_glass_K_W);
  r.R_total_K_W = parallel + r.R_conv_ext_K_W;
  return r;
}

DerivedParameters DerivedParameters::from(const Configuration& cfg) {
  cfg.validate_or_throw();

  const auto& dim = cfg.dimensions;
  DerivedParameters p;

  p.captured_area_m2 = dim.length_m * dim.width_m;
  p.base_area_m2 = p.captured_area_m2;
  p.lid_area_m2 = p.captured_area_m2;
  p.wall_area_m2 = 2.0 * (dim.length_m + dim.width_m) * dim.height_m;
  p.total_area_m2 = p.base_area_m2 + p.lid_area_m2 + p.wall_area_m2;
  p.volume_m3 = dim.length_m * dim.width_m * dim.height_m;
  p.volume_L = p.volume_m3 * units::m3_to_L;
  p.water_depth_m = cfg.operation.water_mass_kg / (units::water_density_kg_m3 * p.base_area_m2);

  p.cos_incidence = std::cos(deg2rad(cfg.thermal.incidence_angle_deg));
  p.useful_seconds = cfg.operation.useful_sun_hours * units::hour_to_s;

  p.box_material = cfg.thermal.box_material;
  p.box_conductivity_W_mK = cfg.box_conductivity_W_mK(&p.box_conductivity_fallback);
  if (p.box_conductivity_fallback) {
    std::ostringstream oss;
    oss << "box material '" << cfg.thermal.box_material
        << "' has no conductivity entry; using default " << kDefaultConductivity_W_mK << " W/(m K)";
    log_warn(oss.str());
  }

  p.natural_convection_W_m2K = ConstructionConstants::h_natural_convection_W_m2K;
  p.water_convection_W_m2K = ConstructionConstants::h_water_convection_W_m2K;
  p.evaporation_coefficient_W_m2K = dunkle_evaporation_coefficient_W_m2K();
  p.condensation_W_m2K = ConstructionConstants::h_condensation_W_m2K;

  p.resistances = compute_resistances(p.box_conductivity_W_mK, p.wall_area_m2,
                                      p.lid_area_m2, p.total_area_m2);

  const auto& w = cfg.water;
  const double m = cfg.operation.water_mass_kg;
  p.energy.heating_J = m * w.specific_heat_J_kgK * (w.boiling_temp_K - w.initial_temp_K);
  p.energy.evaporation_J = m * w.latent_heat_J_kg;
  p.energy.total_required_J = p.energy.heating_J + p.energy.evaporation_J;
  p.energy.per_kg_J = p.energy.total_required_J / m;

  p.bands = (cfg.simulation.band_source == BandSource::Configured)
                ? EfficiencyBandTable(cfg.simulation.efficiency_bands)
                : EfficiencyBandTable::calibrated();

  p.water_mass_kg = m;
  p.specific_heat_J_kgK = w.specific_heat_J_kgK;
  p.latent_heat_J_kg = w.latent_heat_J_kg;
  p.initial_temp_K = w.initial_temp_K;
  p.absorptivity = cfg.thermal.absorptivity;

  std::ostringstream dbg;
  dbg << "derived: A_captured=" << p.captured_area_m2 << " m2, A_wall=" << p.wall_area_m2
      << " m2, R_total=" << p.resistances.R_total_K_W << " K/W, E_per_kg=" << p.energy.per_kg_J << " J/kg";
  log_debug(dbg.str());

  return p;
}

}  // namespace desal
