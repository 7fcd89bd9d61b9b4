#include "desal/climate/climate_generator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "desal/core/logging.hpp"
#include "desal/core/numeric.hpp"
#include "desal/core/units.hpp"

namespace desal {

double saturation_vapor_pressure_Pa(double temp_C) noexcept {
  return 610.78 * std::exp(17.27 * temp_C / (temp_C + 237.3));
}

double seasonal_phase_rad(int month, Hemisphere h) noexcept {
  const int peak = (h == Hemisphere::North) ? 6 : 12;
  return static_cast<double>(month - peak) * (2.0 * kPi / 12.0);
}

ClimateGenerator::ClimateGenerator(const Configuration& cfg, std::uint64_t seed)
    : sim_(cfg.simulation),
      hemisphere_(cfg.operation.hemisphere),
      seed_(seed),
      rng_(static_cast<std::mt19937_64::result_type>(seed)) {
  sim_.validate_or_throw();
}

void ClimateGenerator::reseed(std::uint64_t seed) {
  seed_ = seed;
  rng_.seed(static_cast<std::mt19937_64::result_type>(seed));
  standard_normal_.reset();
}

std::vector<double> ClimateGenerator::draw_block(int n, double stddev) {
  std::vector<double> out(static_cast<std::size_t>(n));
  for (auto& x : out) x = stddev * standard_normal_(rng_);
  return out;
}

std::vector<DailyClimateRecord> ClimateGenerator::generate() {
  using K = ClimateConstants;
  const int n = kDaysPerRun;

  std::vector<DailyClimateRecord> days(static_cast<std::size_t>(n));
  std::vector<double> phase(static_cast<std::size_t>(n));

  CalendarDate d{sim_.epoch_year, 1, 1};
  for (int i = 0; i < n; ++i) {
    auto& r = days[static_cast<std::size_t>(i)];
    r.date = d;
    r.month = d.month;
    r.day_of_month = d.day;
    r.day_of_year = i;
    phase[static_cast<std::size_t>(i)] = seasonal_phase_rad(d.month, hemisphere_);
    d = next_day(d);
  }

  // Draw order is part of the reproducibility contract.
  const std::vector<double> g_noise = draw_block(n, sim_.daily_stddev_Wm2);
  const std::vector<double> t_noise = draw_block(n, K::temp_stddev_C);
  const std::vector<double> h_noise = draw_block(n, K::humidity_stddev_pct);
  const std::vector<double> w_noise = draw_block(n, K::wind_stddev_ms);

  // North: cooler and more humid around the irradiance peak; south mirrored.
  const double temp_sign = (hemisphere_ == Hemisphere::North) ? -1.0 : 1.0;
  const double humidity_sign = (hemisphere_ == Hemisphere::North) ? 1.0 : -1.0;

  for (std::size_t i = 0; i < days.size(); ++i) {
    auto& r = days[i];
    const double c = std::cos(phase[i]);

    const double g_mean = sim_.base_irradiance_Wm2 + sim_.seasonal_amplitude_Wm2 * c;
    r.irradiance_Wm2 = clamp(g_mean + g_noise[i], K::irradiance_min_Wm2, K::irradiance_max_Wm2);

    r.ambient_temp_C = K::temp_mean_C + temp_sign * K::temp_amplitude_C * c + t_noise[i];
    r.ambient_temp_K = units::celsius_to_kelvin(r.ambient_temp_C);

    const double rh = K::humidity_mean_pct + humidity_sign * K::humidity_amplitude_pct * c + h_noise[i];
    r.relative_humidity_pct = clamp(rh, K::humidity_min_pct, K::humidity_max_pct);

    r.vapor_pressure_Pa = r.relative_humidity_pct * saturation_vapor_pressure_Pa(r.ambient_temp_C) / 100.0;

    const double wind = K::wind_mean_ms + K::wind_amplitude_ms * std::sin(phase[i]) + w_noise[i];
    r.wind_speed_ms = std::max(K::wind_min_ms, wind);
  }

  std::ostringstream oss;
  oss << "climate: generated " << days.size() << " days from " << to_iso_string(days.front().date)
      << " (seed=" << seed_ << ", hemisphere=" << to_string(hemisphere_) << ")";
  log_debug(oss.str());

  return days;
}

}  // namespace desal
