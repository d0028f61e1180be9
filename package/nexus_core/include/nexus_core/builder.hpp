#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "nexus_core/config.hpp"
#include "nexus_core/correlation.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/pool.hpp"

namespace nexus_core {

// Per-call overrides. Strategies in the genetic driver set these instead of
// touching the optimizer config.
struct BuildOptions {
  double randomness{0.3};
  double leverage_multiplier{1.0};
  std::optional<int> preferred_stack_size;
};

// Roulette choice over w after flattening: w_i + max(w) * randomness * U(0,1).
// Uniform when every weight is zero. Requires a non-empty w.
std::size_t weighted_index(const std::vector<double> &w, double randomness,
                           std::mt19937_64 &rng);

// MID pairs with JNG and ADC with SUP: true when role's partner position is
// already among the chosen players, whatever their team.
bool partner_chosen(Position role, const std::vector<Position> &chosen);

struct StackChoice {
  std::string team;
  std::optional<int> size;
};

// Greedy randomized constructor: stack team, captain, then one player per
// required position under salary, team-limit and exposure guidance.
class LineupBuilder {
public:
  LineupBuilder(const PlayerPool &pool, const CorrelationMatrix &corr,
                const ExposureConstraints &cons, const OptimizerConfig &cfg,
                const Logger &log)
      : pool_(pool), corr_(corr), cons_(cons), cfg_(cfg), log_(log) {}

  // Throws BuildFailure when a slot cannot be filled.
  Lineup build(const ExposureTracker &tracker, std::mt19937_64 &rng,
               const BuildOptions &opts, int planned_total) const;

  StackChoice select_stack(const ExposureTracker &tracker,
                           std::mt19937_64 &rng, const BuildOptions &opts,
                           int planned_total) const;

  // Team projection, scaled by weight_adjustment against the team's slot
  // share only when the team carries an explicit target.
  double stack_team_weight(const Team &t, const ExposureTracker &tracker) const;

  // Most underexposed (team, k) below its min, if any.
  std::optional<int> underexposed_stack_size(const std::string &team,
                                             const ExposureTracker &tracker) const;

  std::size_t select_captain(const std::string &stack_team,
                             const ExposureTracker &tracker,
                             std::mt19937_64 &rng, const BuildOptions &opts,
                             int planned_total) const;

  // Still-unused uses under an explicit maximum; a large value when none.
  int player_budget_left(std::size_t idx, const ExposureTracker &tracker,
                         int planned_total) const;
  bool team_budget_exhausted(const std::string &team,
                             const ExposureTracker &tracker,
                             int planned_total) const;

  const PlayerPool &pool() const { return pool_; }
  const ExposureConstraints &constraints() const { return cons_; }

private:
  struct Draft;

  // Cheapest unused salary for every slot from `from` on.
  int reserve_from(const Draft &d, std::size_t from) const;
  std::vector<std::size_t> slot_candidates(const Draft &d, std::size_t slot,
                                           const ExposureTracker &tracker,
                                           int planned_total) const;
  double fill_weight(std::size_t idx, const Draft &d,
                     const ExposureTracker &tracker,
                     const BuildOptions &opts) const;
  bool prefers_stack(Position role, const Draft &d,
                     std::mt19937_64 &rng) const;
  int stack_capable_slots(const Draft &d, std::size_t from,
                          const ExposureTracker &tracker,
                          int planned_total) const;
  std::size_t pick_team_slot(const Draft &d,
                             const std::vector<std::size_t> &cands) const;

  const PlayerPool &pool_;
  const CorrelationMatrix &corr_;
  const ExposureConstraints &cons_;
  const OptimizerConfig &cfg_;
  const Logger &log_;
};

} // namespace nexus_core
