#pragma once
/*
================================================================================
Core: Configuration JSON (Save / Load)
FILE: cpp/desal/core/config_json.hpp

Purpose:
  - Persist a Configuration as JSON and read it back.
  - Optional "derived" block (areas, heat-transfer coefficients,
    resistances, energy budget) for human inspection. It is ignored when
    loading.

Schema (all sections optional on input):
  {
    "dimensions": {"length_m", "width_m", "height_m"},
    "thermal": {"absorptivity", "incidence_angle_deg", "box_material",
                "unknown_material": "fallback"|"reject"},
    "water": {"specific_heat_J_kgK", "latent_heat_J_kg",
              "initial_temp_K", "boiling_temp_K"},
    "material_conductivity_W_mK": {"<name>": k, ...},
    "operation": {"useful_sun_hours", "water_mass_kg",
                  "hemisphere": "north"|"south", "latitude_deg"},
    "simulation": {"base_irradiance_Wm2", "seasonal_amplitude_Wm2",
                   "daily_stddev_Wm2", "epoch_year",
                   "band_source": "calibrated"|"configured",
                   "efficiency_bands": [{"min_irradiance_Wm2", "factor"}, ...]}
  }

Parsing rules:
  - Unknown keys are ignored (forward compatible).
  - Missing keys keep Configuration::defaults().
  - A present material_conductivity_W_mK object replaces the whole map.
  - Wrong types, null and NaN/Inf numbers are rejected with a location.
  - Parsing does NOT validate physics; call validate_or_throw().
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "desal/core/config.hpp"
#include "desal/core/json_writer.hpp"

namespace desal {

struct DerivedParameters;

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

// Serialize. include_derived adds a read-only "derived" section computed
// from cfg (cfg must then be valid: throws ConfigurationError otherwise).
std::string config_to_json(const Configuration& cfg, bool include_derived = false, int indent_spaces = 2);

// Building blocks for documents that embed the configuration (run summary).
// The writer's number mode is left as the caller set it.
void emit_config_object(JsonWriter& j, const Configuration& cfg, const DerivedParameters* derived);
void emit_derived_object(JsonWriter& j, const DerivedParameters& p);

// Returns true on success, false on I/O failure.
bool write_config_json_file(const Configuration& cfg,
                            const std::string& file_path,
                            bool include_derived = false);

bool parse_config_json(std::string_view json, Configuration* out, JsonParseError* err = nullptr);

// Stream convenience (reads full stream into memory).
bool parse_config_json(std::istream& is, Configuration* out, JsonParseError* err = nullptr);

// Throws IOError when the file cannot be opened; parse failures return false.
bool load_config_json_file(const std::string& file_path, Configuration* out, JsonParseError* err = nullptr);

}  // namespace desal
