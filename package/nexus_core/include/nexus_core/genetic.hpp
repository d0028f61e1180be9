#pragma once

#include <array>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "nexus_core/builder.hpp"
#include "nexus_core/config.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/pool.hpp"
#include "nexus_core/progress.hpp"
#include "nexus_core/validator.hpp"

namespace nexus_core {

// Seeding strategy for the initial population.
struct GeneticStrategy {
  const char *name;
  double leverage_multiplier;
  double randomness;
  std::optional<int> preferred_stack_size;
};

const std::array<GeneticStrategy, 6> &seeding_strategies();

struct Individual {
  Lineup lineup;
  double fitness{0.0};
  int age{0};
  std::string origin;
};

struct GenerationStats {
  int generation{0};
  double best{0.0};
  double average{0.0};
  double diversity{0.0};
};

struct EvolutionOutcome {
  std::vector<Lineup> selected; // fitness filled, not yet simulated
  std::vector<GenerationStats> history;
  int generations_run{0};
  int restarts{0};
  double initial_best{0.0};
  double final_best{0.0};
  double final_diversity{0.0};
  std::vector<std::string> warnings;
};

// Fast surrogate:
//   10 * projection + max(0, 30 - avg own%) * 2 + sum_{k>=3} (k-2)^1.5 * 15
//   - 100 per team over the limit + captain impact * 10 + constraint bonus
double genetic_fitness(const Lineup &l, const PlayerPool &pool,
                       const ExposureTracker &seeds,
                       const OptimizerConfig &cfg);

class EvolutionDriver {
public:
  EvolutionDriver(const PlayerPool &pool, const LineupBuilder &builder,
                  const LineupValidator &validator, const OptimizerConfig &cfg,
                  const GeneticConfig &gcfg, const RunControl &control,
                  const Logger &log)
      : pool_(pool), builder_(builder), validator_(validator), cfg_(cfg),
        gcfg_(gcfg), control_(control), log_(log) {}

  // seeds holds the seed lineups already recorded. Progress is reported in
  // [from, to] percent.
  EvolutionOutcome run(int count, const std::vector<Lineup> &seed_lineups,
                       const ExposureTracker &seeds, std::mt19937_64 &rng,
                       double from, double to) const;

  // Round-robin over the seeding strategies; an individual that cannot be
  // built within init_retries is skipped.
  std::vector<Individual> initialize_population(const ExposureTracker &seeds,
                                                const SignatureSet &seed_sigs,
                                                std::mt19937_64 &rng) const;

  std::optional<Lineup> crossover(const Lineup &a, const Lineup &b,
                                  std::mt19937_64 &rng) const;
  void mutate(Lineup &l, std::mt19937_64 &rng) const;

  // Fittest first, then greedy on 0.5 * fitness + 50 * distance to the
  // chosen set, within exposure budgets. Lineups adding a (team, k) stack
  // still below its min are taken ahead of the rest. sorted is
  // fitness-descending.
  std::vector<Lineup> select_final(const std::vector<Individual> &sorted,
                                   int count, const ExposureTracker &seeds,
                                   int planned_total) const;

private:
  void evaluate(std::vector<Individual> &population,
                const ExposureTracker &seeds) const;
  std::vector<Individual> next_generation(const std::vector<Individual> &sorted,
                                          const ExposureTracker &seeds,
                                          const SignatureSet &seed_sigs,
                                          std::mt19937_64 &rng) const;
  std::vector<Individual> restart(const std::vector<Individual> &sorted,
                                  const ExposureTracker &seeds,
                                  const SignatureSet &seed_sigs,
                                  std::mt19937_64 &rng) const;
  const Individual &tournament(const std::vector<Individual> &population,
                               std::mt19937_64 &rng) const;
  bool diverse_enough(const Lineup &l,
                      const std::vector<Individual> &population) const;
  std::optional<Lineup> random_individual(const ExposureTracker &tracker,
                                          const BuildOptions &opts,
                                          const SignatureSet &taken,
                                          int planned_total,
                                          std::mt19937_64 &rng) const;

  void swap_player(Lineup &l, std::mt19937_64 &rng) const;
  void swap_captain(Lineup &l, std::mt19937_64 &rng) const;
  void swap_team_stack(Lineup &l, std::mt19937_64 &rng) const;

  const PlayerPool &pool_;
  const LineupBuilder &builder_;
  const LineupValidator &validator_;
  const OptimizerConfig &cfg_;
  const GeneticConfig &gcfg_;
  const RunControl &control_;
  const Logger &log_;
};

} // namespace nexus_core
