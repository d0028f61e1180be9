#include "nexus_core/validator.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nexus_core {

const char *to_string(Violation v) {
  switch (v) {
  case Violation::UnknownPlayer: return "unknown player";
  case Violation::SalaryCap: return "salary cap exceeded";
  case Violation::DuplicatePlayer: return "duplicate player";
  case Violation::PositionMismatch: return "required positions not met";
  case Violation::CaptainIneligible: return "captain slot mismatch";
  case Violation::TeamLimit: return "too many players from one team";
  case Violation::GameDiversity: return "too few distinct games";
  case Violation::DuplicateLineup: return "duplicate lineup";
  }
  return "unknown violation";
}

bool ValidationResult::has(Violation v) const {
  return std::find(violations.begin(), violations.end(), v) !=
         violations.end();
}

std::string ValidationResult::describe() const {
  std::vector<std::string> parts;
  for (Violation v : violations)
    parts.emplace_back(to_string(v));
  return fmt::format("{}", fmt::join(parts, ", "));
}

int LineupValidator::distinct_games(const Lineup &l) const {
  std::set<std::string> games;
  for (std::size_t idx : player_indices(l))
    games.insert(pool_.game_of(pool_[idx].team));
  return static_cast<int>(games.size());
}

ValidationResult LineupValidator::check_structure(const Lineup &l) const {
  ValidationResult r;
  const auto idx = player_indices(l);
  for (std::size_t i : idx) {
    if (i >= pool_.size()) {
      r.violations.push_back(Violation::UnknownPlayer);
      return r;
    }
  }

  if (total_salary(l, pool_, cfg_.captain_multiplier) > cfg_.salary_cap)
    r.violations.push_back(Violation::SalaryCap);

  const Signature sig = signature(l);
  if (std::adjacent_find(sig.begin(), sig.end()) != sig.end())
    r.violations.push_back(Violation::DuplicatePlayer);

  // One slot per required position, in fill order, each holding a player of
  // that position.
  const auto &required = pool_.required_positions();
  bool positions_ok = l.slots.size() == required.size();
  for (std::size_t s = 0; positions_ok && s < l.slots.size(); ++s) {
    positions_ok = l.slots[s].role == required[s] &&
                   pool_[l.slots[s].player].position == required[s];
  }
  if (!positions_ok)
    r.violations.push_back(Violation::PositionMismatch);

  if (!l.captain.is_captain() ||
      pool_[l.captain.player].position == Position::TEAM)
    r.violations.push_back(Violation::CaptainIneligible);

  for (const auto &kv : team_counts(l, pool_)) {
    if (kv.second > cfg_.max_players_per_team) {
      r.violations.push_back(Violation::TeamLimit);
      break;
    }
  }

  if (checks_games() && distinct_games(l) < cfg_.min_games)
    r.violations.push_back(Violation::GameDiversity);
  return r;
}

ValidationResult LineupValidator::validate(const Lineup &l,
                                           const SignatureSet &existing) const {
  ValidationResult r = check_structure(l);
  if (!r.has(Violation::UnknownPlayer) && existing.count(signature(l)) != 0)
    r.violations.push_back(Violation::DuplicateLineup);
  return r;
}

bool LineupValidator::fix_duplicates(Lineup &l, std::mt19937_64 &rng) const {
  std::set<std::size_t> used{l.captain.player};
  bool fixed = true;
  for (LineupSlot &s : l.slots) {
    if (used.insert(s.player).second)
      continue;
    std::vector<std::size_t> alternatives;
    for (std::size_t cand : pool_.by_position(s.role)) {
      if (std::find_if(l.slots.begin(), l.slots.end(),
                       [&](const LineupSlot &o) { return o.player == cand; }) ==
              l.slots.end() &&
          cand != l.captain.player)
        alternatives.push_back(cand);
    }
    if (alternatives.empty()) {
      fixed = false;
      continue;
    }
    std::uniform_int_distribution<std::size_t> pick(0, alternatives.size() - 1);
    s.player = alternatives[pick(rng)];
    used.insert(s.player);
  }
  return fixed;
}

} // namespace nexus_core
