#pragma once

#include <functional>
#include <random>
#include <string>
#include <vector>

#include "nexus_core/builder.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/progress.hpp"
#include "nexus_core/validator.hpp"

namespace nexus_core {

struct GenerationReport {
  std::vector<Lineup> lineups;
  std::vector<std::string> warnings;
  int attempts{0};
  int rejected{0};
};

// Minimum number of differing players between two portfolio lineups.
int diversity_floor(int min_player_difference, std::size_t lineup_size);

// Single-pass portfolio construction: repeated build, validate, accept with
// the ledger kept in step with the accepted set.
class PortfolioGenerator {
public:
  PortfolioGenerator(const LineupBuilder &builder,
                     const LineupValidator &validator,
                     const OptimizerConfig &cfg, const RunControl &control,
                     const Logger &log)
      : builder_(builder), validator_(validator), cfg_(cfg),
        control_(control), log_(log) {}

  // Called after each accept with (accepted, requested).
  using AcceptHook = std::function<void(int, int)>;

  // tracker must already hold the seeds. Returned lineups carry ids
  // "lineup_N" numbered after the seeds.
  GenerationReport generate(int count, const std::vector<Lineup> &seeds,
                            ExposureTracker &tracker, std::mt19937_64 &rng,
                            const AcceptHook &on_accept = {}) const;

private:
  const LineupBuilder &builder_;
  const LineupValidator &validator_;
  const OptimizerConfig &cfg_;
  const RunControl &control_;
  const Logger &log_;
};

} // namespace nexus_core
