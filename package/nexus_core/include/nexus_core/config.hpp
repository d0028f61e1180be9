#pragma once

#include <cstdint>

namespace nexus_core {

struct CorrelationWeights {
  double same_team{0.65};
  double same_team_same_position{0.20};
  double opposing_team{-0.15};
};

struct OptimizerConfig {
  // Roster rules
  int salary_cap{50000};
  int max_players_per_team{4};
  int min_games{2};
  double captain_multiplier{1.5};

  // Monte Carlo
  int iterations{10000};
  int sample_batch_size{1000};
  double randomness{0.3};      // R in the [1-R, 1+R] sample factor
  double randomness_step{0.05}; // builder randomness growth per accepted lineup
  double target_top{0.2};
  double correlation_shift{0.2};
  double cash_line{130.0};
  double win_line{180.0};
  int field_size{1000};
  bool calibrated_roi{false};

  // Construction
  double leverage_multiplier{1.0};
  CorrelationWeights correlation{};
  int min_player_difference{2};
  int max_consecutive_failure_factor{5};
  int attempt_factor{50};
  bool verify_ledger{true};

  bool debug_mode{false};
  std::uint64_t seed{0};
};

struct GeneticConfig {
  int population_size{100};
  int generations{50};
  double elite_fraction{0.05};
  double crossover_rate{0.4};
  double mutation_rate{0.6};
  int tournament_size{2};
  double diversity_threshold{0.1};
  double diversity_fill_fraction{0.7};
  int max_stagnation{3};
  double restart_keep_fraction{0.2};
  int fitness_batch_size{10};
  int init_retries{5};
};

// Throws InvalidInputError on out-of-range values.
void validate(const OptimizerConfig &cfg);
void validate(const GeneticConfig &cfg);

} // namespace nexus_core
