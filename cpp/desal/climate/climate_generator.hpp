#pragma once
/*
================================================================================
Climate: Synthetic Annual Climate Generator
FILE: cpp/desal/climate/climate_generator.hpp

Purpose:
  - Produce exactly 365 consecutive daily climate records starting Jan 1 of
    SimulationSettings::epoch_year:
      * solar irradiance (seasonal cosine + daily Gaussian noise, [100,950] W/m2)
      * ambient temperature (15 +/- 12 degC seasonal, sigma 3 degC)
      * relative humidity (60 +/- 20 %, sigma 10 %, [30,95] %)
      * vapor pressure (Magnus-Tetens)
      * wind speed (2 +/- 1 m/s sine, sigma 0.8 m/s, floor 0.5 m/s)

Determinism:
  - The RNG (std::mt19937_64) is owned by the generator instance and seeded
    explicitly. No global RNG state.
  - One standard-normal stream is consumed in blocks: 365 irradiance draws,
    then 365 temperature, 365 humidity and 365 wind draws. Re-seeding
    reproduces the series bit-for-bit.

Notes:
  - The phase peaks in June (north) or December (south).
  - This is a parametric generator, not a forecast or a weather-file reader.
================================================================================
*/

#include <cstdint>
#include <random>
#include <vector>

#include "desal/core/calendar.hpp"
#include "desal/core/config.hpp"

namespace desal {

inline constexpr int kDaysPerRun = 365;
inline constexpr std::uint64_t kDefaultSeed = 42;

struct DailyClimateRecord {
  CalendarDate date;
  int month = 1;             // 1..12
  int day_of_month = 1;
  int day_of_year = 0;       // 0-based offset from the epoch (Jan 1)

  double irradiance_Wm2 = 0.0;
  double ambient_temp_C = 0.0;
  double ambient_temp_K = 0.0;
  double relative_humidity_pct = 0.0;
  double vapor_pressure_Pa = 0.0;
  double wind_speed_ms = 0.0;
};

// Seasonal shape constants of the generator.
struct ClimateConstants {
  static constexpr double irradiance_min_Wm2 = 100.0;
  static constexpr double irradiance_max_Wm2 = 950.0;

  static constexpr double temp_mean_C = 15.0;
  static constexpr double temp_amplitude_C = 12.0;
  static constexpr double temp_stddev_C = 3.0;

  static constexpr double humidity_mean_pct = 60.0;
  static constexpr double humidity_amplitude_pct = 20.0;
  static constexpr double humidity_stddev_pct = 10.0;
  static constexpr double humidity_min_pct = 30.0;
  static constexpr double humidity_max_pct = 95.0;

  static constexpr double wind_mean_ms = 2.0;
  static constexpr double wind_amplitude_ms = 1.0;
  static constexpr double wind_stddev_ms = 0.8;
  static constexpr double wind_min_ms = 0.5;
};

// Saturation vapor pressure over water (Pa), Magnus-Tetens, T in degC.
double saturation_vapor_pressure_Pa(double temp_C) noexcept;

// Month phase (rad): (month - peak) * 2pi/12, peak = 6 north / 12 south.
double seasonal_phase_rad(int month, Hemisphere h) noexcept;

class ClimateGenerator {
 public:
  ClimateGenerator(const Configuration& cfg, std::uint64_t seed = kDefaultSeed);

  // Generates the full series. Each call continues the RNG stream; call
  // reseed() first to reproduce a previous series.
  std::vector<DailyClimateRecord> generate();

  void reseed(std::uint64_t seed);

  std::uint64_t seed() const noexcept { return seed_; }

 private:
  std::vector<double> draw_block(int n, double stddev);

  SimulationSettings sim_;
  Hemisphere hemisphere_;
  std::uint64_t seed_;
  std::mt19937_64 rng_;
  std::normal_distribution<double> standard_normal_{0.0, 1.0};
};

}  // namespace desal
