#include "desal/analysis/aggregate.hpp"

#include <sstream>

#include "desal/core/calendar.hpp"
#include "desal/core/errors.hpp"
#include "desal/core/logging.hpp"
#include "desal/core/numeric.hpp"
#include "desal/stats/online_stats.hpp"

namespace desal {

namespace {

// One online accumulator per averaged field.
struct PeriodAccumulator {
  PeriodStats sums;
  stats::OnlineStats production, irradiance, gor, eta;
  stats::OnlineStats conv_glass, rad_glass, conv_wall, conduction, total_loss;
  stats::OnlineStats water_C, glass_C, ambient_C, humidity, wind;

  void push(const DailyResult& r) {
    ++sums.day_count;
    sums.production_L += r.production_L;
    sums.evaporated_mass_kg += r.evaporated_mass_kg;
    sums.solar_energy_J += r.solar_energy_J;
    sums.useful_energy_J += r.useful_energy_J;
    sums.lost_energy_J += r.lost_energy_J;
    sums.evaporation_energy_J += r.evaporation_energy_J;

    production.push(r.production_L);
    irradiance.push(r.climate.irradiance_Wm2);
    gor.push(r.gor);
    eta.push(r.thermal_efficiency);
    conv_glass.push(r.losses.conv_glass_W);
    rad_glass.push(r.losses.rad_glass_W);
    conv_wall.push(r.losses.conv_wall_W);
    conduction.push(r.losses.conduction_W);
    total_loss.push(r.losses.total_W);
    water_C.push(r.water_temp_C);
    glass_C.push(r.glass_temp_C);
    ambient_C.push(r.climate.ambient_temp_C);
    humidity.push(r.climate.relative_humidity_pct);
    wind.push(r.climate.wind_speed_ms);
  }

  PeriodStats finish() const {
    PeriodStats s = sums;
    s.mean_production_L = production.mean_or_zero();
    s.mean_irradiance_Wm2 = irradiance.mean_or_zero();
    s.mean_gor = gor.mean_or_zero();
    s.mean_thermal_efficiency = eta.mean_or_zero();
    s.mean_conv_glass_W = conv_glass.mean_or_zero();
    s.mean_rad_glass_W = rad_glass.mean_or_zero();
    s.mean_conv_wall_W = conv_wall.mean_or_zero();
    s.mean_conduction_W = conduction.mean_or_zero();
    s.mean_total_loss_W = total_loss.mean_or_zero();
    s.mean_water_temp_C = water_C.mean_or_zero();
    s.mean_glass_temp_C = glass_C.mean_or_zero();
    s.mean_ambient_temp_C = ambient_C.mean_or_zero();
    s.mean_relative_humidity_pct = humidity.mean_or_zero();
    s.mean_wind_speed_ms = wind.mean_or_zero();
    return s;
  }
};

}  // namespace

const char* to_string(Season s) noexcept {
  switch (s) {
    case Season::Winter: return "Winter";
    case Season::Spring: return "Spring";
    case Season::Summer: return "Summer";
    case Season::Autumn: return "Autumn";
  }
  return "Unknown";
}

Season season_of_month(int month) {
  switch (month) {
    case 12: case 1: case 2: return Season::Winter;
    case 3: case 4: case 5: return Season::Spring;
    case 6: case 7: case 8: return Season::Summer;
    case 9: case 10: case 11: return Season::Autumn;
    default: break;
  }
  throw ValidationError("season_of_month: month must be 1..12, got " + std::to_string(month));
}

std::array<MonthlySummary, kMonthsPerYear> aggregate_monthly(const std::vector<DailyResult>& records) {
  std::array<PeriodAccumulator, kMonthsPerYear> acc{};
  for (const auto& r : records) {
    const int m = r.climate.month;
    if (m < 1 || m > kMonthsPerYear) {
      throw ValidationError("aggregate_monthly: record with month " + std::to_string(m));
    }
    acc[static_cast<std::size_t>(m - 1)].push(r);
  }

  std::array<MonthlySummary, kMonthsPerYear> out{};
  for (int m = 1; m <= kMonthsPerYear; ++m) {
    auto& row = out[static_cast<std::size_t>(m - 1)];
    row.month = m;
    row.name = month_name(m);
    row.stats = acc[static_cast<std::size_t>(m - 1)].finish();
  }
  return out;
}

std::array<SeasonalSummary, kSeasonsPerYear> aggregate_seasonal(const std::vector<DailyResult>& records) {
  std::array<PeriodAccumulator, kSeasonsPerYear> acc{};
  double annual_L = 0.0;
  for (const auto& r : records) {
    const Season s = season_of_month(r.climate.month);
    acc[static_cast<std::size_t>(s)].push(r);
    annual_L += r.production_L;
  }

  std::array<SeasonalSummary, kSeasonsPerYear> out{};
  for (int i = 0; i < kSeasonsPerYear; ++i) {
    auto& row = out[static_cast<std::size_t>(i)];
    row.season = static_cast<Season>(i);
    row.name = to_string(row.season);
    row.stats = acc[static_cast<std::size_t>(i)].finish();
    row.share_of_annual_pct = (annual_L > 0.0) ? 100.0 * row.stats.production_L / annual_L : 0.0;
  }
  return out;
}

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) noexcept {
  if (x.empty() || x.size() != y.size()) return 0.0;
  stats::PearsonAccumulator acc;
  for (std::size_t i = 0; i < x.size(); ++i) acc.push(x[i], y[i]);
  return acc.correlation();
}

AnnualSummary summarize_annual(const std::vector<DailyResult>& records) {
  AnnualSummary a;
  a.day_count = static_cast<int>(records.size());
  if (records.empty()) return a;

  stats::OnlineStats production, irradiance, gor;
  stats::OnlineStats water_C, glass_C, ambient_C, humidity, wind, loss;
  stats::PearsonAccumulator c_irr, c_temp, c_hum;

  for (const auto& r : records) {
    production.push(r.production_L);
    irradiance.push(r.climate.irradiance_Wm2);
    gor.push(r.gor);
    water_C.push(r.water_temp_C);
    glass_C.push(r.glass_temp_C);
    ambient_C.push(r.climate.ambient_temp_C);
    humidity.push(r.climate.relative_humidity_pct);
    wind.push(r.climate.wind_speed_ms);
    loss.push(r.losses.total_W);

    c_irr.push(r.production_L, r.climate.irradiance_Wm2);
    c_temp.push(r.production_L, r.climate.ambient_temp_C);
    c_hum.push(r.production_L, r.climate.relative_humidity_pct);

    a.total_solar_energy_J += r.solar_energy_J;
    a.total_useful_energy_J += r.useful_energy_J;
    a.total_lost_energy_J += r.lost_energy_J;
    a.total_evaporation_energy_J += r.evaporation_energy_J;
  }

  a.total_production_L = production.sum;
  a.mean_daily_production_L = production.mean_or_zero();
  a.max_daily_production_L = production.max();

  a.mean_irradiance_Wm2 = irradiance.mean_or_zero();
  a.min_irradiance_Wm2 = irradiance.min();
  a.max_irradiance_Wm2 = irradiance.max();

  a.mean_gor = gor.mean_or_zero();
  a.annual_gor = safe_div(a.total_evaporation_energy_J, a.total_solar_energy_J);
  a.annual_thermal_efficiency = safe_div(a.total_useful_energy_J, a.total_solar_energy_J);
  a.lost_energy_share_pct = 100.0 * safe_div(a.total_lost_energy_J, a.total_solar_energy_J);

  a.mean_water_temp_C = water_C.mean_or_zero();
  a.mean_glass_temp_C = glass_C.mean_or_zero();
  a.mean_ambient_temp_C = ambient_C.mean_or_zero();
  a.mean_relative_humidity_pct = humidity.mean_or_zero();
  a.mean_wind_speed_ms = wind.mean_or_zero();
  a.mean_total_loss_W = loss.mean_or_zero();

  a.corr_production_irradiance = c_irr.correlation();
  a.corr_production_temperature = c_temp.correlation();
  a.corr_production_humidity = c_hum.correlation();

  const double mean_L = a.mean_daily_production_L;
  for (const auto& r : records) {
    if (r.production_L > mean_L) ++a.high_production_days;
    if (r.production_L < 0.5 * mean_L) ++a.low_production_days;
  }

  // Best/worst among periods that contain at least one day; first wins ties.
  const auto months = aggregate_monthly(records);
  bool have_month = false;
  double best_m = 0.0, worst_m = 0.0;
  for (const auto& m : months) {
    if (m.stats.day_count == 0) continue;
    if (!have_month || m.stats.production_L > best_m) { best_m = m.stats.production_L; a.best_month = m.month; }
    if (!have_month || m.stats.production_L < worst_m) { worst_m = m.stats.production_L; a.worst_month = m.month; }
    have_month = true;
  }

  const auto seasons = aggregate_seasonal(records);
  bool have_season = false;
  double best_s = 0.0, worst_s = 0.0;
  for (const auto& s : seasons) {
    if (s.stats.day_count == 0) continue;
    if (!have_season || s.stats.production_L > best_s) { best_s = s.stats.production_L; a.best_season = s.season; }
    if (!have_season || s.stats.production_L < worst_s) { worst_s = s.stats.production_L; a.worst_season = s.season; }
    have_season = true;
  }

  std::ostringstream oss;
  oss << "annual: " << a.day_count << " days, production=" << a.total_production_L
      << " L, GOR=" << a.annual_gor << ", r(prod,G)=" << a.corr_production_irradiance;
  log_debug(oss.str());

  return a;
}

}  // namespace desal
