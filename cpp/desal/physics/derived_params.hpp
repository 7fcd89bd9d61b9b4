#pragma once
/*
================================================================================
Physics: Derived Parameters (Geometry, Resistances, Energy Budget)
FILE: cpp/desal/physics/derived_params.hpp

Purpose:
  - Everything the thermal model needs that depends on the Configuration only:
      * aperture / lid / base / wall / total areas, volume, water depth
      * conductive, insulation, glass and exterior-convection resistances
      * energy to heat the configured water mass to boiling and evaporate it
      * the efficiency-by-irradiance band table

Model:
  - R_cond  = t_box / (k_box * A_wall)
  - R_ins   = t_ins / (k_ins * A_wall)
  - R_glass = t_glass / (k_glass * A_lid)
  - R_conv  = 1 / (h_nat * A_total)
  - R_total = (R_walls || R_glass) + R_conv,   R_walls = R_cond + R_ins

Hardening:
  - from() validates the Configuration first; the only failure mode is
    ConfigurationError.
  - Pure: same Configuration -> same DerivedParameters. Recompute instead of
    mutating when the Configuration changes.
================================================================================
*/

#include <string>
#include <vector>

#include "desal/core/config.hpp"

namespace desal {

// Fixed construction properties of the prototype.
struct ConstructionConstants {
  static constexpr double box_thickness_m = 0.0025;
  static constexpr double insulation_thickness_m = 0.02;
  static constexpr double insulation_conductivity_W_mK = 0.04;  // polystyrene
  static constexpr double glass_thickness_m = 0.01;
  static constexpr double glass_conductivity_W_mK = 1.0;

  static constexpr double h_natural_convection_W_m2K = 5.0;
  static constexpr double h_water_convection_W_m2K = 50.0;
  static constexpr double h_condensation_W_m2K = 8000.0;

  static constexpr double emissivity = 0.95;
};

// Piecewise-constant efficiency keyed by irradiance threshold.
class EfficiencyBandTable {
 public:
  EfficiencyBandTable() = default;
  explicit EfficiencyBandTable(std::vector<EfficiencyBand> bands);

  // Calibrated table: >=800 -> 0.85, >=600 -> 0.65, >=400 -> 0.45, else 0.25.
  static EfficiencyBandTable calibrated();

  // Factor of the first band whose threshold <= G; the last band otherwise.
  double factor_for(double irradiance_Wm2) const noexcept;

  const std::vector<EfficiencyBand>& bands() const noexcept { return bands_; }

 private:
  std::vector<EfficiencyBand> bands_;
};

// Water-to-glass evaporative coefficient (W/(m2 K)). The Dunkle relation
// h_ev = 16.273e-3 h_cw (P_w - P_g) / (T_w - T_g) is replaced by its
// representative value for the box's operating range.
double dunkle_evaporation_coefficient_W_m2K() noexcept;

// Ambient-temperature scaling of the band efficiency:
// clip((T_amb_C + 10) / 40, 0.5, 1.2).
double ambient_efficiency_scale(double ambient_temp_C) noexcept;

struct ThermalResistances {
  double R_cond_K_W = 0.0;
  double R_insulation_K_W = 0.0;
  double R_walls_K_W = 0.0;
  double R_glass_K_W = 0.0;
  double R_conv_ext_K_W = 0.0;
  double R_total_K_W = 0.0;
};

struct EnergyBudget {
  double heating_J = 0.0;        // m cp (T_boil - T_init)
  double evaporation_J = 0.0;    // m L
  double total_required_J = 0.0;
  double per_kg_J = 0.0;
};

struct DerivedParameters {
  // Geometry
  double captured_area_m2 = 0.0;
  double base_area_m2 = 0.0;
  double lid_area_m2 = 0.0;
  double wall_area_m2 = 0.0;
  double total_area_m2 = 0.0;
  double volume_m3 = 0.0;
  double volume_L = 0.0;
  double water_depth_m = 0.0;

  // Optics / timing
  double cos_incidence = 1.0;
  double useful_seconds = 0.0;

  // Materials
  std::string box_material;
  double box_conductivity_W_mK = 0.0;
  bool box_conductivity_fallback = false;

  // Heat-transfer coefficients (W/(m2 K)), reported with the network
  double natural_convection_W_m2K = 0.0;
  double water_convection_W_m2K = 0.0;
  double evaporation_coefficient_W_m2K = 0.0;
  double condensation_W_m2K = 0.0;

  ThermalResistances resistances;
  EnergyBudget energy;
  EfficiencyBandTable bands;

  // Copied from the Configuration so the thermal model needs nothing else.
  double water_mass_kg = 0.0;
  double specific_heat_J_kgK = 0.0;
  double latent_heat_J_kg = 0.0;
  double initial_temp_K = 0.0;
  double absorptivity = 0.0;

  // Validate cfg and compute. Logs a warning when the box material falls
  // back to the default conductivity.
  static DerivedParameters from(const Configuration& cfg);
};

// Resistance network only (used by from(); exposed for tests/reports).
ThermalResistances compute_resistances(double box_conductivity_W_mK,
                                       double wall_area_m2,
                                       double lid_area_m2,
                                       double total_area_m2);

}  // namespace desal
