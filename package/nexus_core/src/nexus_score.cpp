#include "nexus_core/nexus_score.hpp"

#include <algorithm>

#include "nexus_core/pool.hpp"

namespace nexus_core {

double leverage_factor(double avg_ownership_pct) {
  const double own = std::max(0.1, avg_ownership_pct / 100.0);
  return std::clamp(1.0 / own, 0.6, 1.5);
}

double stack_bonus(const TeamCounts &counts) {
  double bonus = 0.0;
  for (const auto &kv : counts) {
    if (kv.second >= 3)
      bonus += (kv.second - 2) * 3.0;
  }
  return bonus;
}

double position_bonus(Position captain_position) {
  return position_impact(captain_position) * 2.0;
}

ScoreComponents score_components(const Lineup &l, const PlayerPool &pool,
                                 double captain_multiplier) {
  const TeamCounts counts = team_counts(l, pool);
  ScoreComponents c;
  c.base_projection = projected_points(l, pool, captain_multiplier);
  c.avg_ownership = average_ownership(l, pool);
  c.field_avg_ownership = pool.field_avg_ownership();
  c.leverage_factor = leverage_factor(c.avg_ownership);
  c.stack_bonus = stack_bonus(counts);
  c.position_bonus = position_bonus(pool[l.captain.player].position);
  c.team_stacks = team_stacks_label(counts);
  c.stack_pattern = stack_pattern(counts);
  return c;
}

double nexus_score(const ScoreComponents &c) {
  return (c.base_projection * c.leverage_factor + c.stack_bonus +
          c.position_bonus) /
         7.0;
}

void apply_nexus_score(Lineup &l, const PlayerPool &pool,
                       double captain_multiplier) {
  l.components = score_components(l, pool, captain_multiplier);
  l.nexus_score = nexus_score(l.components);
}

} // namespace nexus_core
