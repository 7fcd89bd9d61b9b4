#pragma once
/*
================================================================================
Analysis: Monthly / Seasonal / Annual Aggregation
FILE: cpp/desal/analysis/aggregate.hpp

Purpose:
  - Group the per-day results by calendar month and by meteorological season
    and reduce them to sums and means.
  - Annual summary: totals, annual ratios, correlations, best/worst periods.

Conventions:
  - Seasons are fixed month sets, labelled the same in both hemispheres:
      Winter {12,1,2}, Spring {3,4,5}, Summer {6,7,8}, Autumn {9,10,11}.
  - All 12 months and all 4 seasons are always present; an empty group is an
    explicit zero row with day_count == 0.
  - Summaries are recomputed from scratch on every call.
================================================================================
*/

#include <array>
#include <string>
#include <vector>

#include "desal/physics/thermal_model.hpp"

namespace desal {

enum class Season : int { Winter = 0, Spring = 1, Summer = 2, Autumn = 3 };

inline constexpr int kMonthsPerYear = 12;
inline constexpr int kSeasonsPerYear = 4;

const char* to_string(Season s) noexcept;

// Throws ValidationError for month outside 1..12.
Season season_of_month(int month);

// Means and sums shared by month and season rows.
struct PeriodStats {
  int day_count = 0;

  // Sums
  double production_L = 0.0;
  double evaporated_mass_kg = 0.0;
  double solar_energy_J = 0.0;
  double useful_energy_J = 0.0;
  double lost_energy_J = 0.0;
  double evaporation_energy_J = 0.0;

  // Means
  double mean_production_L = 0.0;
  double mean_irradiance_Wm2 = 0.0;
  double mean_gor = 0.0;
  double mean_thermal_efficiency = 0.0;
  double mean_conv_glass_W = 0.0;
  double mean_rad_glass_W = 0.0;
  double mean_conv_wall_W = 0.0;
  double mean_conduction_W = 0.0;
  double mean_total_loss_W = 0.0;
  double mean_water_temp_C = 0.0;
  double mean_glass_temp_C = 0.0;
  double mean_ambient_temp_C = 0.0;
  double mean_relative_humidity_pct = 0.0;
  double mean_wind_speed_ms = 0.0;
};

struct MonthlySummary {
  int month = 1;  // 1..12
  std::string name;
  PeriodStats stats;
};

struct SeasonalSummary {
  Season season = Season::Winter;
  std::string name;
  PeriodStats stats;
  double share_of_annual_pct = 0.0;  // production share; 0 when the year produced nothing
};

struct AnnualSummary {
  int day_count = 0;

  double total_production_L = 0.0;
  double mean_daily_production_L = 0.0;
  double max_daily_production_L = 0.0;

  double mean_irradiance_Wm2 = 0.0;
  double min_irradiance_Wm2 = 0.0;
  double max_irradiance_Wm2 = 0.0;

  double mean_gor = 0.0;
  double annual_gor = 0.0;                 // sum(E_evap) / sum(E_solar)
  double annual_thermal_efficiency = 0.0;  // sum(E_useful) / sum(E_solar)

  double total_solar_energy_J = 0.0;
  double total_useful_energy_J = 0.0;
  double total_lost_energy_J = 0.0;
  double total_evaporation_energy_J = 0.0;
  double lost_energy_share_pct = 0.0;      // sum(E_lost) / sum(E_solar) * 100

  double mean_water_temp_C = 0.0;
  double mean_glass_temp_C = 0.0;
  double mean_ambient_temp_C = 0.0;
  double mean_relative_humidity_pct = 0.0;
  double mean_wind_speed_ms = 0.0;
  double mean_total_loss_W = 0.0;

  double corr_production_irradiance = 0.0;
  double corr_production_temperature = 0.0;
  double corr_production_humidity = 0.0;

  int high_production_days = 0;  // > mean daily production
  int low_production_days = 0;    // < half the mean daily production

  int best_month = 1;
  int worst_month = 1;
  Season best_season = Season::Winter;
  Season worst_season = Season::Winter;
};

std::array<MonthlySummary, kMonthsPerYear> aggregate_monthly(const std::vector<DailyResult>& records);

std::array<SeasonalSummary, kSeasonsPerYear> aggregate_seasonal(const std::vector<DailyResult>& records);

// Pearson r of two paired series. 0 for empty, mismatched-length or
// zero-variance input; otherwise clamped to [-1, 1].
double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) noexcept;

AnnualSummary summarize_annual(const std::vector<DailyResult>& records);

}  // namespace desal
