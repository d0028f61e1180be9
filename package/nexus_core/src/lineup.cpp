#include "nexus_core/lineup.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "nexus_core/pool.hpp"

namespace nexus_core {

std::vector<std::size_t> player_indices(const Lineup &l) {
  std::vector<std::size_t> out;
  out.reserve(l.slots.size() + 1);
  out.push_back(l.captain.player);
  for (const LineupSlot &s : l.slots)
    out.push_back(s.player);
  return out;
}

Signature signature(const Lineup &l) {
  Signature sig = player_indices(l);
  std::sort(sig.begin(), sig.end());
  return sig;
}

int slot_salary(const LineupSlot &s, const PlayerPool &pool,
                double captain_multiplier) {
  const int base = pool[s.player].salary;
  if (!s.is_captain())
    return base;
  return static_cast<int>(std::lround(base * captain_multiplier));
}

int total_salary(const Lineup &l, const PlayerPool &pool,
                 double captain_multiplier) {
  int total = slot_salary(l.captain, pool, captain_multiplier);
  for (const LineupSlot &s : l.slots)
    total += slot_salary(s, pool, captain_multiplier);
  return total;
}

TeamCounts team_counts(const Lineup &l, const PlayerPool &pool) {
  TeamCounts counts;
  for (std::size_t idx : player_indices(l))
    ++counts[pool[idx].team];
  return counts;
}

std::string stack_pattern(const TeamCounts &counts) {
  std::vector<int> sizes;
  for (const auto &kv : counts)
    sizes.push_back(kv.second);
  std::sort(sizes.begin(), sizes.end(), std::greater<int>());
  return fmt::format("{}", fmt::join(sizes, "-"));
}

std::string team_stacks_label(const TeamCounts &counts) {
  std::vector<std::pair<std::string, int>> stacks;
  for (const auto &kv : counts) {
    if (kv.second >= 2)
      stacks.emplace_back(kv.first, kv.second);
  }
  std::stable_sort(stacks.begin(), stacks.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  std::vector<std::string> parts;
  for (const auto &s : stacks)
    parts.push_back(fmt::format("{} ({})", s.first, s.second));
  return fmt::format("{}", fmt::join(parts, ", "));
}

double projected_points(const Lineup &l, const PlayerPool &pool,
                        double captain_multiplier) {
  double total = pool[l.captain.player].projected_points * captain_multiplier;
  for (const LineupSlot &s : l.slots)
    total += pool[s.player].projected_points;
  return total;
}

double average_ownership(const Lineup &l, const PlayerPool &pool) {
  const auto idx = player_indices(l);
  double sum = 0.0;
  for (std::size_t i : idx)
    sum += pool[i].ownership;
  return sum / static_cast<double>(idx.size());
}

int shared_players(const Lineup &a, const Lineup &b) {
  const Signature sa = signature(a);
  const Signature sb = signature(b);
  std::vector<std::size_t> common;
  std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(),
                        std::back_inserter(common));
  return static_cast<int>(common.size());
}

double jaccard_distance(const Lineup &a, const Lineup &b) {
  const Signature sa = signature(a);
  const Signature sb = signature(b);
  std::vector<std::size_t> common, all;
  std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(),
                        std::back_inserter(common));
  std::set_union(sa.begin(), sa.end(), sb.begin(), sb.end(),
                 std::back_inserter(all));
  if (all.empty())
    return 0.0;
  return 1.0 - static_cast<double>(common.size()) / all.size();
}

double mean_pairwise_distance(const std::vector<const Lineup *> &lineups) {
  if (lineups.size() < 2)
    return 0.0;
  double sum = 0.0;
  int pairs = 0;
  for (std::size_t i = 0; i < lineups.size(); ++i) {
    for (std::size_t j = i + 1; j < lineups.size(); ++j) {
      sum += jaccard_distance(*lineups[i], *lineups[j]);
      ++pairs;
    }
  }
  return sum / pairs;
}

} // namespace nexus_core
