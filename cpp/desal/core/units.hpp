#pragma once
/*
================================================================================
Core: Units + Physical Constants
FILE: cpp/desal/core/units.hpp

Purpose:
  - Explicit unit conversion helpers so the thermal code stays readable and
    avoids silent unit bugs (K vs degC, hours vs seconds, J vs kJ).
  - Centralize physical constants used by the loss model.

Hardening:
  - Header-only constexpr constants (no runtime overhead).
================================================================================
*/

namespace desal::units {

// Temperature
inline constexpr double kelvin_offset = 273.15;

constexpr double celsius_to_kelvin(double c) { return c + kelvin_offset; }
constexpr double kelvin_to_celsius(double k) { return k - kelvin_offset; }

// Time
inline constexpr double hour_to_s = 3600.0;

// Energy
inline constexpr double J_to_kJ = 1.0e-3;

// Water
inline constexpr double water_density_kg_m3 = 1000.0;
inline constexpr double kg_water_to_L = 1.0;   // 1 kg ~ 1 L at 1000 kg/m^3
inline constexpr double m3_to_L = 1000.0;

// Radiation
inline constexpr double stefan_boltzmann = 5.67e-8;  // W/(m^2 K^4)

// Helpers
constexpr double sqr(double x) { return x * x; }
constexpr double pow4(double x) { return sqr(x) * sqr(x); }

} // namespace desal::units
