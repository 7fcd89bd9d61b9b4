#include "desal/exports/results_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <initializer_list>
#include <sstream>

#include "desal/core/calendar.hpp"
#include "desal/core/units.hpp"

namespace desal {

namespace {

// Helper: escape CSV string (quote if contains delimiter/quote/newline)
std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Helper: format double, or empty string if NaN/Inf
std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

// Delimiter-joined row builder.
struct CsvRow {
  std::ostringstream out;
  char d = ',';
  int precision = 6;
  bool first = true;

  explicit CsvRow(const CsvExportOptions& opt) : d(opt.delimiter), precision(opt.precision) {}

  void sep() {
    if (!first) out << d;
    first = false;
  }
  void text(const std::string& s) { sep(); out << csv_escape(s, d); }
  void num(double x) { sep(); out << csv_double(x, precision); }
  void integer(long long v) { sep(); out << v; }

  void names(std::initializer_list<const char*> cols) {
    for (const char* c : cols) text(c);
  }

  std::string str() const { return out.str(); }
};

void period_header(CsvRow& h) {
  h.names({"day_count",
           "production_L", "evaporated_mass_kg",
           "solar_energy_J", "useful_energy_J", "lost_energy_J", "evaporation_energy_J",
           "mean_production_L", "mean_irradiance_Wm2", "mean_gor", "mean_thermal_efficiency",
           "mean_loss_conv_glass_W", "mean_loss_rad_glass_W", "mean_loss_conv_wall_W",
           "mean_loss_conduction_W", "mean_loss_total_W",
           "mean_water_temp_C", "mean_glass_temp_C", "mean_ambient_temp_C",
           "mean_relative_humidity_pct", "mean_wind_speed_ms"});
}

void period_cells(CsvRow& row, const PeriodStats& s) {
  row.integer(s.day_count);
  row.num(s.production_L);
  row.num(s.evaporated_mass_kg);
  row.num(s.solar_energy_J);
  row.num(s.useful_energy_J);
  row.num(s.lost_energy_J);
  row.num(s.evaporation_energy_J);
  row.num(s.mean_production_L);
  row.num(s.mean_irradiance_Wm2);
  row.num(s.mean_gor);
  row.num(s.mean_thermal_efficiency);
  row.num(s.mean_conv_glass_W);
  row.num(s.mean_rad_glass_W);
  row.num(s.mean_conv_wall_W);
  row.num(s.mean_conduction_W);
  row.num(s.mean_total_loss_W);
  row.num(s.mean_water_temp_C);
  row.num(s.mean_glass_temp_C);
  row.num(s.mean_ambient_temp_C);
  row.num(s.mean_relative_humidity_pct);
  row.num(s.mean_wind_speed_ms);
}

template <typename Rows, typename RowFn>
std::string join_rows(const std::string& header, const Rows& rows, const CsvExportOptions& opt, RowFn row_fn) {
  std::ostringstream o;
  if (opt.include_header) o << header << "\n";
  for (const auto& r : rows) o << row_fn(r, opt) << "\n";
  return o.str();
}

bool write_text_file(const std::string& file_path, const std::string& text) {
  std::ofstream ofs(file_path, std::ios::out | std::ios::trunc);
  if (!ofs.is_open()) return false;
  ofs << text;
  return ofs.good();
}

}  // namespace

// ---------------------------------------------------------------- Daily

std::string daily_csv_header(const CsvExportOptions& opt) {
  CsvRow h(opt);
  h.names({"date", "day_of_year", "month",
           "irradiance_Wm2", "ambient_temp_C", "relative_humidity_pct", "vapor_pressure_Pa", "wind_speed_ms",
           "water_temp_C", "glass_temp_C", "base_temp_C", "sky_temp_C",
           "h_conv_W_m2K", "loss_conv_glass_W", "loss_rad_glass_W", "loss_conv_wall_W",
           "loss_conduction_W", "loss_total_W",
           "solar_energy_J", "lost_energy_J", "useful_energy_J", "heating_energy_J", "evaporation_energy_J",
           "band_efficiency", "scaled_efficiency", "evaporated_mass_kg", "production_L",
           "gor", "thermal_efficiency"});
  return h.str();
}

std::string daily_csv_row(const DailyResult& r, const CsvExportOptions& opt) {
  CsvRow row(opt);
  const auto& c = r.climate;
  row.text(to_iso_string(c.date));
  row.integer(c.day_of_year);
  row.integer(c.month);

  row.num(c.irradiance_Wm2);
  row.num(c.ambient_temp_C);
  row.num(c.relative_humidity_pct);
  row.num(c.vapor_pressure_Pa);
  row.num(c.wind_speed_ms);

  row.num(r.water_temp_C);
  row.num(r.glass_temp_C);
  row.num(r.base_temp_C);
  row.num(units::kelvin_to_celsius(r.sky_temp_K));

  row.num(r.losses.h_conv_W_m2K);
  row.num(r.losses.conv_glass_W);
  row.num(r.losses.rad_glass_W);
  row.num(r.losses.conv_wall_W);
  row.num(r.losses.conduction_W);
  row.num(r.losses.total_W);

  row.num(r.solar_energy_J);
  row.num(r.lost_energy_J);
  row.num(r.useful_energy_J);
  row.num(r.heating_energy_J);
  row.num(r.evaporation_energy_J);

  row.num(r.band_efficiency);
  row.num(r.scaled_efficiency);
  row.num(r.evaporated_mass_kg);
  row.num(r.production_L);

  row.num(r.gor);
  row.num(r.thermal_efficiency);
  return row.str();
}

std::string daily_to_csv(const std::vector<DailyResult>& records, const CsvExportOptions& opt) {
  return join_rows(daily_csv_header(opt), records, opt,
                   [](const DailyResult& r, const CsvExportOptions& o) { return daily_csv_row(r, o); });
}

// ---------------------------------------------------------------- Monthly

std::string monthly_csv_header(const CsvExportOptions& opt) {
  CsvRow h(opt);
  h.names({"month", "month_name"});
  period_header(h);
  return h.str();
}

std::string monthly_csv_row(const MonthlySummary& m, const CsvExportOptions& opt) {
  CsvRow row(opt);
  row.integer(m.month);
  row.text(m.name);
  period_cells(row, m.stats);
  return row.str();
}

std::string monthly_to_csv(const std::array<MonthlySummary, kMonthsPerYear>& months, const CsvExportOptions& opt) {
  return join_rows(monthly_csv_header(opt), months, opt,
                   [](const MonthlySummary& m, const CsvExportOptions& o) { return monthly_csv_row(m, o); });
}

// ---------------------------------------------------------------- Seasonal

std::string seasonal_csv_header(const CsvExportOptions& opt) {
  CsvRow h(opt);
  h.names({"season"});
  period_header(h);
  h.names({"share_of_annual_pct"});
  return h.str();
}

std::string seasonal_csv_row(const SeasonalSummary& s, const CsvExportOptions& opt) {
  CsvRow row(opt);
  row.text(s.name);
  period_cells(row, s.stats);
  row.num(s.share_of_annual_pct);
  return row.str();
}

std::string seasonal_to_csv(const std::array<SeasonalSummary, kSeasonsPerYear>& seasons, const CsvExportOptions& opt) {
  return join_rows(seasonal_csv_header(opt), seasons, opt,
                   [](const SeasonalSummary& s, const CsvExportOptions& o) { return seasonal_csv_row(s, o); });
}

// ---------------------------------------------------------------- Files

bool write_daily_csv_file(const std::vector<DailyResult>& records,
                          const std::string& file_path,
                          const CsvExportOptions& opt) {
  return write_text_file(file_path, daily_to_csv(records, opt));
}

bool write_monthly_csv_file(const std::array<MonthlySummary, kMonthsPerYear>& months,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  return write_text_file(file_path, monthly_to_csv(months, opt));
}

bool write_seasonal_csv_file(const std::array<SeasonalSummary, kSeasonsPerYear>& seasons,
                             const std::string& file_path,
                             const CsvExportOptions& opt) {
  return write_text_file(file_path, seasonal_to_csv(seasons, opt));
}

}  // namespace desal
