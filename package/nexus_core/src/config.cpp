#include "nexus_core/config.hpp"

#include <fmt/format.h>

#include "nexus_core/errors.hpp"

namespace nexus_core {

namespace {

void require(bool cond, const char *field, double value, const char *rule) {
  if (!cond) {
    throw InvalidInputError(
        fmt::format("invalid config: {}={} (expected {})", field, value, rule));
  }
}

} // namespace

void validate(const OptimizerConfig &cfg) {
  require(cfg.salary_cap > 0, "salary_cap", cfg.salary_cap, "> 0");
  require(cfg.max_players_per_team >= 1, "max_players_per_team",
          cfg.max_players_per_team, ">= 1");
  require(cfg.min_games >= 1, "min_games", cfg.min_games, ">= 1");
  require(cfg.captain_multiplier >= 1.0, "captain_multiplier",
          cfg.captain_multiplier, ">= 1");
  require(cfg.iterations > 0, "iterations", cfg.iterations, "> 0");
  require(cfg.sample_batch_size > 0, "sample_batch_size",
          cfg.sample_batch_size, "> 0");
  require(cfg.randomness >= 0.0 && cfg.randomness < 1.0, "randomness",
          cfg.randomness, "in [0, 1)");
  require(cfg.randomness_step >= 0.0, "randomness_step", cfg.randomness_step,
          ">= 0");
  require(cfg.target_top > 0.0 && cfg.target_top < 1.0, "target_top",
          cfg.target_top, "in (0, 1)");
  require(cfg.correlation_shift >= 0.0 && cfg.correlation_shift <= 0.5,
          "correlation_shift", cfg.correlation_shift, "in [0, 0.5]");
  require(cfg.field_size > 0, "field_size", cfg.field_size, "> 0");
  require(cfg.leverage_multiplier >= 0.0, "leverage_multiplier",
          cfg.leverage_multiplier, ">= 0");
  require(cfg.min_player_difference >= 0, "min_player_difference",
          cfg.min_player_difference, ">= 0");
  require(cfg.max_consecutive_failure_factor > 0,
          "max_consecutive_failure_factor",
          cfg.max_consecutive_failure_factor, "> 0");
  require(cfg.attempt_factor > 0, "attempt_factor", cfg.attempt_factor, "> 0");
}

void validate(const GeneticConfig &cfg) {
  require(cfg.population_size >= 2, "population_size", cfg.population_size,
          ">= 2");
  require(cfg.generations >= 0, "generations", cfg.generations, ">= 0");
  require(cfg.elite_fraction >= 0.05 && cfg.elite_fraction <= 0.20,
          "elite_fraction", cfg.elite_fraction, "in [0.05, 0.20]");
  require(cfg.crossover_rate >= 0.4 && cfg.crossover_rate <= 0.7,
          "crossover_rate", cfg.crossover_rate, "in [0.4, 0.7]");
  require(cfg.mutation_rate >= 0.15 && cfg.mutation_rate <= 0.6,
          "mutation_rate", cfg.mutation_rate, "in [0.15, 0.6]");
  require(cfg.tournament_size >= 2 && cfg.tournament_size <= 5,
          "tournament_size", cfg.tournament_size, "in [2, 5]");
  require(cfg.diversity_threshold >= 0.0 && cfg.diversity_threshold <= 1.0,
          "diversity_threshold", cfg.diversity_threshold, "in [0, 1]");
  require(cfg.diversity_fill_fraction >= 0.0 &&
              cfg.diversity_fill_fraction <= 1.0,
          "diversity_fill_fraction", cfg.diversity_fill_fraction, "in [0, 1]");
  require(cfg.max_stagnation >= 1, "max_stagnation", cfg.max_stagnation,
          ">= 1");
  require(cfg.restart_keep_fraction > 0.0 && cfg.restart_keep_fraction <= 1.0,
          "restart_keep_fraction", cfg.restart_keep_fraction, "in (0, 1]");
  require(cfg.fitness_batch_size >= 1, "fitness_batch_size",
          cfg.fitness_batch_size, ">= 1");
  require(cfg.init_retries >= 1, "init_retries", cfg.init_retries, ">= 1");
}

} // namespace nexus_core
