#pragma once

#include "nexus_core/lineup.hpp"
#include "nexus_core/types.hpp"

namespace nexus_core {

class PlayerPool;

// clamp(1 / max(0.1, avg_ownership_pct / 100), 0.6, 1.5)
double leverage_factor(double avg_ownership_pct);

// Sum of (k - 2) * 3 over teams with k >= 3 players.
double stack_bonus(const TeamCounts &counts);

// Captain position impact * 2.
double position_bonus(Position captain_position);

ScoreComponents score_components(const Lineup &l, const PlayerPool &pool,
                                 double captain_multiplier);

// (base * leverage + stack bonus + position bonus) / 7
double nexus_score(const ScoreComponents &c);

// Fills components and nexus_score on l.
void apply_nexus_score(Lineup &l, const PlayerPool &pool,
                       double captain_multiplier);

} // namespace nexus_core
