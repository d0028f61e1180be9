#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "nexus_core/types.hpp"

namespace nexus_core {

class PlayerPool;

// One roster slot: a pool player and the role it fills. Salary is derived
// from the role (captain pays the multiplier), never stored.
struct LineupSlot {
  std::size_t player{0};
  Position role{Position::TOP};

  bool is_captain() const { return role == Position::CPT; }
};

struct LineupStats {
  double projected_points{0.0};
  double min{0.0};
  double p10{0.0};
  double p25{0.0};
  double median{0.0};
  double p75{0.0};
  double p90{0.0};
  double max{0.0};
  // Rates are fractions here; records report percentages.
  double cash_rate{0.0};
  double win_rate{0.0};
  double first_place{0.0};
  double top10{0.0};
  double roi{0.0};
};

struct ScoreComponents {
  double base_projection{0.0};
  double leverage_factor{1.0};
  double avg_ownership{0.0};
  double field_avg_ownership{0.0};
  double stack_bonus{0.0};
  double position_bonus{0.0};
  std::string team_stacks;   // "KT (4), T1 (2)"
  std::string stack_pattern; // "4-2-1"
};

struct Lineup {
  std::string id;
  std::string name;
  LineupSlot captain{0, Position::CPT};
  std::vector<LineupSlot> slots; // non-captain, fill order

  std::optional<LineupStats> stats;
  double nexus_score{0.0};
  ScoreComponents components;
  std::optional<double> genetic_fitness;
};

using Signature = std::vector<std::size_t>;
using SignatureSet = std::set<Signature>;
using TeamCounts = std::map<std::string, int>;

// Captain first, then slots.
std::vector<std::size_t> player_indices(const Lineup &l);

// Sorted player indices; equal signatures mean the same player set.
Signature signature(const Lineup &l);

int slot_salary(const LineupSlot &s, const PlayerPool &pool,
                double captain_multiplier);
int total_salary(const Lineup &l, const PlayerPool &pool,
                 double captain_multiplier);

// Captain counts toward its own team.
TeamCounts team_counts(const Lineup &l, const PlayerPool &pool);

// Team sizes sorted descending, e.g. "4-2-1".
std::string stack_pattern(const TeamCounts &counts);

// Teams contributing two or more players, e.g. "KT (4), T1 (2)".
std::string team_stacks_label(const TeamCounts &counts);

double projected_points(const Lineup &l, const PlayerPool &pool,
                        double captain_multiplier);

// Mean ownership percent over every slot.
double average_ownership(const Lineup &l, const PlayerPool &pool);

int shared_players(const Lineup &a, const Lineup &b);

// 1 - |A ∩ B| / |A ∪ B| over player sets.
double jaccard_distance(const Lineup &a, const Lineup &b);

// Mean pairwise Jaccard distance; 0 for fewer than two lineups.
double mean_pairwise_distance(const std::vector<const Lineup *> &lineups);

} // namespace nexus_core
