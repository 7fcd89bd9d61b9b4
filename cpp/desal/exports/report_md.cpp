#include "desal/exports/report_md.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "desal/core/units.hpp"
#include "desal/physics/thermal_model.hpp"

namespace desal {

namespace {

struct Fmt {
  double v;
  int decimals;
};

std::ostream& operator<<(std::ostream& os, const Fmt& f) {
  std::ostringstream tmp;
  tmp << std::fixed << std::setprecision(f.decimals) << f.v;
  return os << tmp.str();
}

Fmt f1(double v) { return {v, 1}; }
Fmt f2(double v) { return {v, 2}; }
Fmt f4(double v) { return {v, 4}; }

// Rank 0 is the highest-producing season.
const char* trend_label(int rank) {
  switch (rank) {
    case 0: return "Peak";
    case 1: return "High";
    case 2: return "Low";
    default: return "Minimum";
  }
}

}  // namespace

std::string render_markdown_report(const SimulationRun& run, const ReportOptions& opt) {
  const AnnualSummary& a = run.annual;
  const DerivedParameters& d = run.derived;
  const double days = static_cast<double>(std::max(1, a.day_count));

  std::ostringstream md;
  md << "# " << opt.title << "\n\n";
  if (!opt.generated_on.empty()) md << "*Generated: " << opt.generated_on << "*\n\n";

  md << "## Results Summary\n\n";
  md << "Box of " << run.config.dimensions.length_m << " m x " << run.config.dimensions.width_m << " m x "
     << run.config.dimensions.height_m << " m (" << d.box_material << ", captured area "
     << f4(d.captured_area_m2) << " m2), " << run.config.operation.water_mass_kg << " kg of water, "
     << to_string(run.config.operation.hemisphere) << "ern hemisphere, seed " << run.seed << ".\n\n";
  md << "* **Annual production**: " << f2(a.total_production_L) << " L\n";
  md << "* **Mean daily production**: " << f4(a.mean_daily_production_L) << " L/day\n";
  md << "* **Mean solar irradiance**: " << f2(a.mean_irradiance_Wm2) << " W/m2\n";
  md << "* **Mean daily GOR**: " << f4(a.mean_gor) << " (annual: " << f4(a.annual_gor) << ")\n";
  md << "* **Thermal efficiency**: " << f2(100.0 * a.annual_thermal_efficiency) << " %\n";
  md << "* **Mean water temperature**: " << f1(a.mean_water_temp_C) << " degC (ambient "
     << f1(a.mean_ambient_temp_C) << " degC)\n";
  md << "* **Days above mean production**: " << a.high_production_days
     << "; below half the mean: " << a.low_production_days << "\n\n";

  // Seasons ranked by production; stable so ties keep Winter..Autumn order.
  std::array<const SeasonalSummary*, kSeasonsPerYear> ranked{};
  for (size_t i = 0; i < ranked.size(); ++i) ranked[i] = &run.seasonal[i];
  std::stable_sort(ranked.begin(), ranked.end(), [](const SeasonalSummary* x, const SeasonalSummary* y) {
    return x->stats.production_L > y->stats.production_L;
  });

  md << "## Seasonal Distribution\n\n";
  md << "| Season | Production (L) | Share | Mean GOR | Trend |\n";
  md << "|--------|----------------|-------|----------|-------|\n";
  for (size_t i = 0; i < ranked.size(); ++i) {
    const SeasonalSummary& s = *ranked[i];
    md << "| " << s.name << " | " << f2(s.stats.production_L) << " | " << f1(s.share_of_annual_pct)
       << " % | " << f4(s.stats.mean_gor) << " | " << trend_label(static_cast<int>(i)) << " |\n";
  }
  md << "\n";
  md << ranked[0]->name << " and " << ranked[1]->name << " account for "
     << f1(ranked[0]->share_of_annual_pct + ranked[1]->share_of_annual_pct) << " % of annual production.\n\n";

  const auto& best = run.monthly[static_cast<size_t>(a.best_month - 1)];
  const auto& worst = run.monthly[static_cast<size_t>(a.worst_month - 1)];
  md << "### Monthly Highlights\n\n";
  md << "* Best month: **" << best.name << "** with " << f2(best.stats.production_L) << " L\n";
  md << "* Worst month: **" << worst.name << "** with " << f2(worst.stats.production_L) << " L\n";
  md << "* Best / worst ratio: " << f1(best.stats.production_L / std::max(0.001, worst.stats.production_L))
     << "x\n\n";

  md << "## Correlations with Daily Production\n\n";
  md << "* **Solar irradiance**: " << f4(a.corr_production_irradiance) << "\n";
  md << "* **Ambient temperature**: " << f4(a.corr_production_temperature) << "\n";
  md << "* **Relative humidity**: " << f4(a.corr_production_humidity) << "\n\n";

  const double solar_kJ = a.total_solar_energy_J * units::J_to_kJ / days;
  const double useful_kJ = a.total_useful_energy_J * units::J_to_kJ / days;
  const double lost_kJ = a.total_lost_energy_J * units::J_to_kJ / days;
  md << "## Daily Energy Balance\n\n";
  md << "* **Solar energy received**: " << f2(solar_kJ) << " kJ/day (100 %)\n";
  md << "* **Useful energy**: " << f2(useful_kJ) << " kJ/day ("
     << f2(100.0 * a.annual_thermal_efficiency) << " %)\n";
  md << "* **Thermal losses**: " << f2(lost_kJ) << " kJ/day (" << f2(a.lost_energy_share_pct) << " %)\n";
  md << "* **Mean loss rate**: " << f2(a.mean_total_loss_W) << " W\n\n";

  md << "## Model Notes\n\n";
  md << "Component temperatures, loss scaling (insulation factor "
     << ThermalCalibration::insulation_factor << ", resistance inflation x"
     << ThermalCalibration::resistance_inflation << "), the " << ThermalCalibration::max_loss_fraction * 100.0
     << " % loss cap and the irradiance efficiency bands are empirical calibration of the prototype, "
     << "not first-principles physics. Compare relative trends, not absolute litres.\n";

  return md.str();
}

bool write_markdown_report_file(const SimulationRun& run, const std::string& file_path, const ReportOptions& opt) {
  const std::string text = render_markdown_report(run, opt);
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << text;
  f.close();
  return !f.fail();
}

}  // namespace desal
