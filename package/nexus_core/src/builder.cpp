#include "nexus_core/builder.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <map>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"

namespace nexus_core {

std::size_t weighted_index(const std::vector<double> &w, double randomness,
                           std::mt19937_64 &rng) {
  if (w.empty()) {
    throw std::invalid_argument("weighted_index: empty weights");
  }
  const double maxw = *std::max_element(w.begin(), w.end());
  if (!(maxw > 0.0)) {
    std::uniform_int_distribution<std::size_t> pick(0, w.size() - 1);
    return pick(rng);
  }
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  std::vector<double> adjusted(w.size());
  double total = 0.0;
  for (std::size_t i = 0; i < w.size(); ++i) {
    adjusted[i] = std::max(0.0, w[i]) + maxw * randomness * unif(rng);
    total += adjusted[i];
  }
  double r = unif(rng) * total;
  for (std::size_t i = 0; i < adjusted.size(); ++i) {
    r -= adjusted[i];
    if (r <= 0.0)
      return i;
  }
  return adjusted.size() - 1;
}

// Partial lineup under construction.
struct LineupBuilder::Draft {
  std::vector<Position> order; // required slot roles
  std::string stack_team;
  std::optional<int> stack_size;
  std::vector<std::size_t> chosen; // captain first
  std::vector<LineupSlot> slots;
  std::map<std::string, int> teams;
  int remaining_salary{0};

  bool uses(std::size_t idx) const {
    return std::find(chosen.begin(), chosen.end(), idx) != chosen.end();
  }
  int team_count(const std::string &team) const {
    auto it = teams.find(team);
    return it == teams.end() ? 0 : it->second;
  }
  int stack_count() const { return team_count(stack_team); }
};

int LineupBuilder::player_budget_left(std::size_t idx,
                                      const ExposureTracker &tracker,
                                      int planned_total) const {
  const Player &p = pool_[idx];
  if (p.max_exposure >= 1.0)
    return INT_MAX;
  return exposure_budget(p.max_exposure, planned_total) -
         tracker.player_count(idx);
}

bool LineupBuilder::team_budget_exhausted(const std::string &team,
                                          const ExposureTracker &tracker,
                                          int planned_total) const {
  const ExposureBounds &b = cons_.team(team);
  return b.has_max() &&
         tracker.team_count(team) >= exposure_budget(b.max, planned_total);
}

std::optional<int>
LineupBuilder::underexposed_stack_size(const std::string &team,
                                       const ExposureTracker &tracker) const {
  std::optional<int> best;
  double best_gap = 0.0;
  for (int k = 2; k <= 4; ++k) {
    const ExposureBounds &b = cons_.stack(team, k);
    if (!b.has_min())
      continue;
    const double cur = tracker.stack_fraction(team, k);
    if (tracker.lineup_count() > 0 && cur >= b.min)
      continue;
    const double gap = b.min - cur;
    if (!best || gap > best_gap) {
      best = k;
      best_gap = gap;
    }
  }
  return best;
}

StackChoice LineupBuilder::select_stack(const ExposureTracker &tracker,
                                        std::mt19937_64 &rng,
                                        const BuildOptions &opts,
                                        int planned_total) const {
  std::vector<const Team *> open;
  for (const Team &t : pool_.teams()) {
    if (!team_budget_exhausted(t.code, tracker, planned_total))
      open.push_back(&t);
  }
  if (open.empty()) {
    throw BuildFailure("every team has reached its exposure budget");
  }

  // Teams below a team or (team, k) minimum go first.
  std::vector<const Team *> needy;
  for (const Team *t : open) {
    bool needs = tracker.team_needs_exposure(t->code, std::nullopt, cons_);
    for (int k = 2; k <= 4 && !needs; ++k) {
      needs = cons_.stack(t->code, k).has_min() &&
              tracker.team_needs_exposure(t->code, k, cons_);
    }
    if (needs)
      needy.push_back(t);
  }
  if (!needy.empty()) {
    std::uniform_int_distribution<std::size_t> pick(0, needy.size() - 1);
    StackChoice c;
    c.team = needy[pick(rng)]->code;
    c.size = underexposed_stack_size(c.team, tracker);
    if (!c.size)
      c.size = opts.preferred_stack_size;
    log_.debug("stack team {} below minimum exposure", c.team);
    return c;
  }

  // Stack targets act as quotas over the planned portfolio.
  const int lineups = tracker.lineup_count();
  const StackKey *due = nullptr;
  double most_overdue = 0.0;
  for (const auto &kv : cons_.stacks) {
    if (!kv.second.target || !pool_.has_team(kv.first.first) ||
        team_budget_exhausted(kv.first.first, tracker, planned_total))
      continue;
    const double target = *kv.second.target;
    const int count = tracker.stack_count(kv.first.first, kv.first.second);
    const double expected = target * (lineups + 1);
    if (count + 0.5 >= expected)
      continue;
    if (count >= static_cast<int>(std::lround(target * planned_total)))
      continue;
    if (kv.second.has_max() &&
        count >= exposure_budget(kv.second.max, planned_total))
      continue;
    if (!due || expected - count > most_overdue) {
      due = &kv.first;
      most_overdue = expected - count;
    }
  }
  if (due) {
    log_.debug("stack {} x{} is due", due->first, due->second);
    return StackChoice{due->first, due->second};
  }

  std::vector<double> weights;
  weights.reserve(open.size());
  for (const Team *t : open)
    weights.push_back(stack_team_weight(*t, tracker));
  StackChoice c;
  c.team = open[weighted_index(weights, opts.randomness, rng)]->code;
  c.size = opts.preferred_stack_size;
  return c;
}

double LineupBuilder::stack_team_weight(const Team &t,
                                        const ExposureTracker &tracker) const {
  const std::optional<double> &target = cons_.team(t.code).target;
  if (!target)
    return t.total_projection;
  return t.total_projection *
         ExposureTracker::weight_adjustment(*target,
                                            tracker.team_player_share(t.code));
}

int LineupBuilder::reserve_from(const Draft &d, std::size_t from) const {
  int reserve = 0;
  for (std::size_t s = from; s < d.order.size(); ++s) {
    int cheapest = INT_MAX;
    for (std::size_t idx : pool_.by_position(d.order[s])) {
      if (!d.uses(idx))
        cheapest = std::min(cheapest, pool_[idx].salary);
    }
    if (cheapest != INT_MAX)
      reserve += cheapest;
  }
  return reserve;
}

std::size_t LineupBuilder::select_captain(const std::string &stack_team,
                                          const ExposureTracker &tracker,
                                          std::mt19937_64 &rng,
                                          const BuildOptions &opts,
                                          int planned_total) const {
  Draft empty;
  empty.order = pool_.required_positions();
  const int room = cfg_.salary_cap - reserve_from(empty, 0);

  const auto usable = [&](std::size_t idx) {
    const Player &p = pool_[idx];
    const int salary =
        static_cast<int>(std::lround(p.salary * cfg_.captain_multiplier));
    return salary <= room && player_budget_left(idx, tracker, planned_total) > 0;
  };

  // Stack-team core roles, then any team, then supports as a last resort.
  std::vector<std::size_t> cands;
  const auto collect = [&](bool same_team, bool core_only) {
    for (std::size_t idx = 0; idx < pool_.size(); ++idx) {
      const Player &p = pool_[idx];
      if (p.position == Position::TEAM)
        continue;
      if (core_only && !captain_eligible(p.position))
        continue;
      if (same_team && p.team != stack_team)
        continue;
      if (!same_team && team_budget_exhausted(p.team, tracker, planned_total))
        continue;
      if (usable(idx))
        cands.push_back(idx);
    }
  };
  collect(true, true);
  if (cands.empty())
    collect(false, true);
  if (cands.empty())
    collect(true, false);
  if (cands.empty())
    collect(false, false);
  if (cands.empty()) {
    throw BuildFailure(fmt::format("no affordable captain for {}", stack_team));
  }

  std::vector<std::size_t> below;
  for (std::size_t idx : cands) {
    if (tracker.player_below_min(idx, pool_))
      below.push_back(idx);
  }
  if (!below.empty()) {
    std::uniform_int_distribution<std::size_t> pick(0, below.size() - 1);
    return below[pick(rng)];
  }

  std::vector<std::size_t> open;
  for (std::size_t idx : cands) {
    if (!tracker.player_at_max(idx, pool_))
      open.push_back(idx);
  }
  if (open.empty())
    open = cands;

  std::vector<double> weights;
  weights.reserve(open.size());
  for (std::size_t idx : open) {
    const Player &p = pool_[idx];
    const double value = p.projected_points / std::max(0.01, p.ownership);
    const double avail =
        std::max(0.0, p.max_exposure - tracker.player_fraction(idx));
    weights.push_back(p.projected_points * value *
                      (avail / std::max(0.1, p.max_exposure)));
  }
  return open[weighted_index(weights, opts.randomness, rng)];
}

double LineupBuilder::fill_weight(std::size_t idx, const Draft &d,
                                  const ExposureTracker &tracker,
                                  const BuildOptions &opts) const {
  const Player &p = pool_[idx];
  const double value = p.projected_points / std::max(0.01, p.ownership);
  const double leverage = std::pow(value, opts.leverage_multiplier);

  double log_synergy = 0.0;
  for (std::size_t m : d.chosen)
    log_synergy += std::log(std::max(1e-6, 1.0 + corr_(idx, m)));
  const double synergy =
      d.chosen.empty() ? 1.0 : std::exp(log_synergy / d.chosen.size());

  const double target = p.target_exposure;
  const double exposure =
      (target - tracker.player_fraction(idx)) / std::max(1e-6, target);
  return p.projected_points * leverage * synergy * std::max(0.1, exposure);
}

bool partner_chosen(Position role, const std::vector<Position> &chosen) {
  const auto has = [&](Position p) {
    return std::find(chosen.begin(), chosen.end(), p) != chosen.end();
  };
  switch (role) {
  case Position::MID: return has(Position::JNG);
  case Position::JNG: return has(Position::MID);
  case Position::ADC: return has(Position::SUP);
  case Position::SUP: return has(Position::ADC);
  default: return false;
  }
}

bool LineupBuilder::prefers_stack(Position role, const Draft &d,
                                  std::mt19937_64 &rng) const {
  switch (role) {
  case Position::TOP: {
    std::bernoulli_distribution coin(0.5);
    return coin(rng);
  }
  case Position::TEAM: return true;
  default: break;
  }
  std::vector<Position> chosen;
  chosen.reserve(d.chosen.size());
  for (std::size_t idx : d.chosen)
    chosen.push_back(pool_[idx].position);
  return partner_chosen(role, chosen);
}

int LineupBuilder::stack_capable_slots(const Draft &d, std::size_t from,
                                       const ExposureTracker &tracker,
                                       int planned_total) const {
  if (!pool_.has_team(d.stack_team))
    return 0;
  const Team &team = pool_.team(d.stack_team);
  int capable = 0;
  for (std::size_t s = from; s < d.order.size(); ++s) {
    for (std::size_t idx : team.by_position[position_index(d.order[s])]) {
      if (!d.uses(idx) && player_budget_left(idx, tracker, planned_total) > 0) {
        ++capable;
        break;
      }
    }
  }
  return capable;
}

std::vector<std::size_t>
LineupBuilder::slot_candidates(const Draft &d, std::size_t slot,
                               const ExposureTracker &tracker,
                               int planned_total) const {
  const Position role = d.order[slot];
  const int room = d.remaining_salary - reserve_from(d, slot + 1);
  std::vector<std::size_t> out;
  for (std::size_t idx : pool_.by_position(role)) {
    const Player &p = pool_[idx];
    if (d.uses(idx) || p.salary > room)
      continue;
    const int on_team = d.team_count(p.team);
    if (on_team >= cfg_.max_players_per_team)
      continue;
    if (on_team == 0 && team_budget_exhausted(p.team, tracker, planned_total))
      continue;
    if (player_budget_left(idx, tracker, planned_total) <= 0)
      continue;
    out.push_back(idx);
  }
  return out;
}

std::size_t LineupBuilder::pick_team_slot(const Draft &d,
                                          const std::vector<std::size_t> &cands) const {
  const auto best_of = [&](bool stack_only) {
    std::optional<std::size_t> best;
    for (std::size_t idx : cands) {
      if (stack_only && pool_[idx].team != d.stack_team)
        continue;
      if (!best || pool_[idx].projected_points > pool_[*best].projected_points)
        best = idx;
    }
    return best;
  };
  if (auto b = best_of(true))
    return *b;
  return *best_of(false);
}

Lineup LineupBuilder::build(const ExposureTracker &tracker,
                            std::mt19937_64 &rng, const BuildOptions &opts,
                            int planned_total) const {
  Draft d;
  d.order = pool_.required_positions();
  d.remaining_salary = cfg_.salary_cap;

  const StackChoice stack = select_stack(tracker, rng, opts, planned_total);
  d.stack_team = stack.team;
  if (stack.size)
    d.stack_size = std::min(*stack.size, cfg_.max_players_per_team);

  const std::size_t cpt =
      select_captain(d.stack_team, tracker, rng, opts, planned_total);
  const Player &captain = pool_[cpt];
  d.chosen.push_back(cpt);
  ++d.teams[captain.team];
  d.remaining_salary -=
      static_cast<int>(std::lround(captain.salary * cfg_.captain_multiplier));

  for (std::size_t s = 0; s < d.order.size(); ++s) {
    const Position role = d.order[s];
    std::vector<std::size_t> cands =
        slot_candidates(d, s, tracker, planned_total);

    if (d.stack_size) {
      const int need = *d.stack_size - d.stack_count();
      const auto on_stack = [&](std::size_t idx) {
        return pool_[idx].team == d.stack_team;
      };
      std::vector<std::size_t> stack_only, others;
      for (std::size_t idx : cands)
        (on_stack(idx) ? stack_only : others).push_back(idx);

      if (need <= 0) {
        cands = others;
      } else if (need >= stack_capable_slots(d, s, tracker, planned_total)) {
        cands = stack_only;
      } else if (!stack_only.empty() && prefers_stack(role, d, rng)) {
        cands = stack_only;
      }
    }

    if (cands.empty()) {
      throw BuildFailure(fmt::format("no candidates for {} (stack {})",
                                     to_string(role), d.stack_team));
    }

    std::size_t pick;
    if (role == Position::TEAM) {
      pick = pick_team_slot(d, cands);
    } else {
      std::vector<std::size_t> below;
      for (std::size_t idx : cands) {
        if (tracker.player_below_min(idx, pool_))
          below.push_back(idx);
      }
      if (!below.empty()) {
        std::uniform_int_distribution<std::size_t> u(0, below.size() - 1);
        pick = below[u(rng)];
      } else {
        std::vector<double> weights;
        weights.reserve(cands.size());
        for (std::size_t idx : cands)
          weights.push_back(fill_weight(idx, d, tracker, opts));
        pick = cands[weighted_index(weights, opts.randomness, rng)];
      }
    }

    d.chosen.push_back(pick);
    d.slots.push_back(LineupSlot{pick, role});
    ++d.teams[pool_[pick].team];
    d.remaining_salary -= pool_[pick].salary;
  }

  if (d.stack_size && d.stack_count() != *d.stack_size) {
    throw BuildFailure(fmt::format("{} stack of {} not reached (got {})",
                                   d.stack_team, *d.stack_size,
                                   d.stack_count()));
  }

  Lineup out;
  out.captain = LineupSlot{cpt, Position::CPT};
  out.slots = std::move(d.slots);
  return out;
}

} // namespace nexus_core
