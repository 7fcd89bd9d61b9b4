#include "desal/pipeline/simulate.hpp"

#include <sstream>
#include <utility>

#include "desal/core/logging.hpp"

namespace desal {

namespace {

std::vector<DailyResult> simulate_with(const DerivedParameters& derived,
                                       const Configuration& cfg,
                                       std::uint64_t seed) {
  ClimateGenerator gen(cfg, seed);
  const std::vector<DailyClimateRecord> climate = gen.generate();
  const ThermalModel model(derived);
  return model.compute(climate);
}

}  // namespace

std::vector<DailyResult> simulate(const Configuration& cfg, std::uint64_t seed) {
  const DerivedParameters derived = DerivedParameters::from(cfg);
  return simulate_with(derived, cfg, seed);
}

SimulationRun run_simulation(const Configuration& cfg, std::uint64_t seed) {
  SimulationRun run;
  run.config = cfg;
  run.seed = seed;
  run.derived = DerivedParameters::from(cfg);
  run.daily = simulate_with(run.derived, cfg, seed);
  run.monthly = aggregate_monthly(run.daily);
  run.seasonal = aggregate_seasonal(run.daily);
  run.annual = summarize_annual(run.daily);

  std::ostringstream oss;
  oss << "simulation complete: seed=" << seed << ", hemisphere=" << to_string(cfg.operation.hemisphere)
      << ", material=" << run.derived.box_material << ", annual production=" << run.annual.total_production_L
      << " L, annual GOR=" << run.annual.annual_gor;
  log_info(oss.str());

  return run;
}

}  // namespace desal
