#pragma once
/*
================================================================================
Pipeline: One-Year Simulation Entry Points
FILE: cpp/desal/pipeline/simulate.hpp

Purpose:
  - simulate(): Configuration + seed -> 365 DailyResult, date ordered.
      1) validate configuration (ConfigurationError before any generation)
      2) derive parameters
      3) generate the seeded climate series
      4) per-day energy balance
  - run_simulation(): the same, bundled with the monthly / seasonal / annual
    summaries for exporters and the CLI.

Determinism:
  - Same Configuration + same seed -> bit-identical results.
================================================================================
*/

#include <array>
#include <cstdint>
#include <vector>

#include "desal/analysis/aggregate.hpp"
#include "desal/climate/climate_generator.hpp"
#include "desal/core/config.hpp"
#include "desal/physics/derived_params.hpp"
#include "desal/physics/thermal_model.hpp"

namespace desal {

struct SimulationRun {
  Configuration config;
  std::uint64_t seed = kDefaultSeed;
  DerivedParameters derived;
  std::vector<DailyResult> daily;
  std::array<MonthlySummary, kMonthsPerYear> monthly{};
  std::array<SeasonalSummary, kSeasonsPerYear> seasonal{};
  AnnualSummary annual;
};

std::vector<DailyResult> simulate(const Configuration& cfg, std::uint64_t seed = kDefaultSeed);

SimulationRun run_simulation(const Configuration& cfg, std::uint64_t seed = kDefaultSeed);

}  // namespace desal
