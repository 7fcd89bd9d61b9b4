/*
================================================================================
CLI: Main Entry Point (desal_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end of the solar desalination simulation engine:
    * run a one-year simulation and export CSV / JSON / Markdown results
    * print the configuration and its derived parameters
    * save a configuration file to edit and reload

Usage:
  desal_cli [command] [options]

Hardening:
  - Explicit exit codes for scripting
  - Configuration errors name the offending parameter
  - No silent failures: every write is checked
================================================================================
*/

#include "desal/core/config.hpp"
#include "desal/core/config_json.hpp"
#include "desal/core/errors.hpp"
#include "desal/core/logging.hpp"
#include "desal/exports/report_md.hpp"
#include "desal/exports/results_csv.hpp"
#include "desal/exports/results_json.hpp"
#include "desal/pipeline/simulate.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

using namespace desal;

// Exit codes for scripting
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  CONFIG_INVALID = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
desal_cli - Passive Solar Desalination Box: Annual Simulation

Usage:
  desal_cli [command] [options]

Commands:
  run           Simulate one year and write results
  params        Print the configuration and derived parameters
  save-config   Write the configuration to a JSON file
  help          Show this help message

Options (run):
  --config <json>           Load configuration (missing keys keep defaults)
  --seed <N>                Climate RNG seed (default 42)
  --out-dir <dir>           Existing directory for outputs (default .)
  --hemisphere north|south  Override operation.hemisphere
  --water-mass <kg>         Override operation.water_mass_kg
  --material <name>         Override thermal.box_material
  --no-report               Skip the Markdown report
  --verbose                 Debug logging

Options (params):
  --config <json>

Options (save-config):
  desal_cli save-config <path> [--config <json>] [--with-derived]

Outputs of run (in --out-dir):
  daily_results.csv, monthly_results.csv, seasonal_results.csv,
  simulation_summary.json, executive_report.md

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Configuration invalid
  3 - Computation failed
  4 - I/O error
)";
}

namespace {

struct Args {
  std::string config_path;
  std::string out_dir = ".";
  std::string save_path;
  std::uint64_t seed = kDefaultSeed;

  bool has_hemisphere = false;
  Hemisphere hemisphere = Hemisphere::North;
  bool has_water_mass = false;
  double water_mass_kg = 0.0;
  bool has_material = false;
  std::string material;

  bool write_report = true;
  bool with_derived = false;
  bool verbose = false;
};

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_u64(const char* s, std::uint64_t* out) {
  if (!s || !out || *s == '\0' || *s == '-') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (end == s || *end != '\0' || errno == ERANGE) return false;
  *out = static_cast<std::uint64_t>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

// Parses argv[first..]; a bare (non-option) argument is the save-config path.
bool parse_args(int first, int argc, char** argv, Args* a, std::string* err) {
  for (int i = first; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--config") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--config requires a value"; return false; }
      a->config_path = v;
    } else if (std::strcmp(k, "--out-dir") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--out-dir requires a value"; return false; }
      a->out_dir = v;
    } else if (std::strcmp(k, "--seed") == 0) {
      if (!get_next(i, argc, argv, &v) || !parse_u64(v, &a->seed)) {
        *err = "--seed requires a non-negative integer";
        return false;
      }
    } else if (std::strcmp(k, "--hemisphere") == 0) {
      if (!get_next(i, argc, argv, &v) || !parse_hemisphere(v, &a->hemisphere)) {
        *err = "--hemisphere requires north|south";
        return false;
      }
      a->has_hemisphere = true;
    } else if (std::strcmp(k, "--water-mass") == 0) {
      if (!get_next(i, argc, argv, &v) || !parse_double(v, &a->water_mass_kg)) {
        *err = "--water-mass requires a number (kg)";
        return false;
      }
      a->has_water_mass = true;
    } else if (std::strcmp(k, "--material") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--material requires a value"; return false; }
      a->material = v;
      a->has_material = true;
    } else if (std::strcmp(k, "--no-report") == 0) {
      a->write_report = false;
    } else if (std::strcmp(k, "--with-derived") == 0) {
      a->with_derived = true;
    } else if (std::strcmp(k, "--verbose") == 0) {
      a->verbose = true;
    } else if (k[0] != '-' && a->save_path.empty()) {
      a->save_path = k;
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

// Loads --config (or defaults) and applies command-line overrides.
// Throws IOError when the file cannot be read.
bool load_configuration(const Args& a, Configuration* cfg) {
  Configuration c = Configuration::defaults();
  if (!a.config_path.empty()) {
    JsonParseError perr;
    if (!load_config_json_file(a.config_path, &c, &perr)) {
      std::cerr << "Configuration parse error: " << perr.message << " @ " << a.config_path << ":"
                << perr.line << ":" << perr.col << "\n";
      return false;
    }
    log_info("loaded configuration from " + a.config_path);
  }
  if (a.has_hemisphere) c.operation.hemisphere = a.hemisphere;
  if (a.has_water_mass) c.operation.water_mass_kg = a.water_mass_kg;
  if (a.has_material) c.thermal.box_material = a.material;
  *cfg = c;
  return true;
}

std::string join_path(const std::string& dir, const char* name) {
  if (dir.empty()) return name;
  const char last = dir.back();
  return (last == '/' || last == '\\') ? dir + name : dir + "/" + name;
}

void print_parameters(const Configuration& cfg, const DerivedParameters& d) {
  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Configuration:\n";
  std::cout << "  Dimensions: " << cfg.dimensions.length_m << " m x " << cfg.dimensions.width_m << " m x "
            << cfg.dimensions.height_m << " m\n";
  std::cout << "  Material: " << d.box_material << " (k = " << d.box_conductivity_W_mK << " W/(m K)"
            << (d.box_conductivity_fallback ? ", default" : "") << ")\n";
  std::cout << "  Absorptivity: " << cfg.thermal.absorptivity << "\n";
  std::cout << "  Incidence angle: " << cfg.thermal.incidence_angle_deg << " deg (cos = " << d.cos_incidence
            << ")\n";
  std::cout << "  Water mass: " << cfg.operation.water_mass_kg << " kg\n";
  std::cout << "  Useful sun hours: " << cfg.operation.useful_sun_hours << " h\n";
  std::cout << "  Hemisphere: " << to_string(cfg.operation.hemisphere) << "\n";
  std::cout << "\nDerived parameters:\n";
  std::cout << "  Captured area: " << d.captured_area_m2 << " m2\n";
  std::cout << "  Wall area: " << d.wall_area_m2 << " m2\n";
  std::cout << "  Total area: " << d.total_area_m2 << " m2\n";
  std::cout << "  Volume: " << d.volume_L << " L\n";
  std::cout << "  R_total: " << d.resistances.R_total_K_W << " K/W\n";
  std::cout << "  Energy per kg: " << d.energy.per_kg_J << " J/kg\n";
}

int cmd_run(const Args& a) {
  try {
    Configuration cfg;
    if (!load_configuration(a, &cfg)) return ExitCode::CONFIG_INVALID;

    const SimulationRun run = run_simulation(cfg, a.seed);

    const std::string daily = join_path(a.out_dir, "daily_results.csv");
    const std::string monthly = join_path(a.out_dir, "monthly_results.csv");
    const std::string seasonal = join_path(a.out_dir, "seasonal_results.csv");
    const std::string summary = join_path(a.out_dir, "simulation_summary.json");
    const std::string report = join_path(a.out_dir, "executive_report.md");

    if (!write_daily_csv_file(run.daily, daily)) throw IOError("failed to write file: " + daily);
    if (!write_monthly_csv_file(run.monthly, monthly)) throw IOError("failed to write file: " + monthly);
    if (!write_seasonal_csv_file(run.seasonal, seasonal)) throw IOError("failed to write file: " + seasonal);
    if (!write_run_json_file(run, summary)) throw IOError("failed to write file: " + summary);
    if (a.write_report && !write_markdown_report_file(run, report)) {
      throw IOError("failed to write file: " + report);
    }

    const AnnualSummary& s = run.annual;
    std::cout << std::fixed;
    std::cout << "=== Annual Simulation ===\n";
    std::cout << "Seed: " << run.seed << "\n";
    std::cout << "Annual production: " << std::setprecision(2) << s.total_production_L << " L\n";
    std::cout << "Mean daily production: " << std::setprecision(4) << s.mean_daily_production_L << " L/day\n";
    std::cout << "Mean irradiance: " << std::setprecision(2) << s.mean_irradiance_Wm2 << " W/m2\n";
    std::cout << "Mean GOR: " << std::setprecision(4) << s.mean_gor << " (annual " << s.annual_gor << ")\n";
    std::cout << "Thermal efficiency: " << std::setprecision(2) << 100.0 * s.annual_thermal_efficiency << " %\n";
    std::cout << "Correlation production/irradiance: " << std::setprecision(4) << s.corr_production_irradiance
              << "\n";
    std::cout << "\nSeasons:\n";
    for (const auto& season : run.seasonal) {
      std::cout << "  " << season.name << ": " << std::setprecision(2) << season.stats.production_L << " L ("
                << std::setprecision(1) << season.share_of_annual_pct << " %)\n";
    }
    std::cout << "\nOutputs written to " << a.out_dir << "\n";
    return ExitCode::SUCCESS;

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration invalid: " << e.what() << "\n";
    return ExitCode::CONFIG_INVALID;
  } catch (const IOError& e) {
    std::cerr << "IO error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_params(const Args& a) {
  try {
    Configuration cfg;
    if (!load_configuration(a, &cfg)) return ExitCode::CONFIG_INVALID;
    const DerivedParameters d = DerivedParameters::from(cfg);
    print_parameters(cfg, d);
    return ExitCode::SUCCESS;

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration invalid: " << e.what() << "\n";
    return ExitCode::CONFIG_INVALID;
  } catch (const IOError& e) {
    std::cerr << "IO error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

int cmd_save_config(const Args& a) {
  if (a.save_path.empty()) {
    std::cerr << "Argument error: save-config requires an output path\n";
    return ExitCode::INVALID_ARGS;
  }
  try {
    Configuration cfg;
    if (!load_configuration(a, &cfg)) return ExitCode::CONFIG_INVALID;
    cfg.validate_or_throw();
    if (!write_config_json_file(cfg, a.save_path, a.with_derived)) {
      throw IOError("failed to write file: " + a.save_path);
    }
    std::cout << "Configuration saved to: " << a.save_path << "\n";
    return ExitCode::SUCCESS;

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration invalid: " << e.what() << "\n";
    return ExitCode::CONFIG_INVALID;
  } catch (const IOError& e) {
    std::cerr << "IO error: " << e.what() << "\n";
    return ExitCode::IO_ERROR;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  if (cmd != "run" && cmd != "params" && cmd != "save-config") {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'desal_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  Args a;
  std::string err;
  if (!parse_args(2, argc, argv, &a, &err)) {
    std::cerr << "Argument error: " << err << "\n";
    return ExitCode::INVALID_ARGS;
  }
  if (cmd != "save-config" && !a.save_path.empty()) {
    std::cerr << "Argument error: unexpected argument: " << a.save_path << "\n";
    return ExitCode::INVALID_ARGS;
  }

  set_log_level(a.verbose ? LogLevel::DEBUG : LogLevel::INFO);

  if (cmd == "run") return cmd_run(a);
  if (cmd == "params") return cmd_params(a);
  return cmd_save_config(a);
}
