#include "nexus_core/exposure.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"
#include "nexus_core/pool.hpp"

namespace nexus_core {

namespace {

const ExposureBounds kUnbounded{};

std::string normalize_code(const std::string &s) {
  std::string out;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

double percent_to_fraction(const std::optional<double> &v, double fallback,
                           const std::string &what) {
  if (!v)
    return fallback;
  if (!std::isfinite(*v) || *v < 0.0 || *v > 100.0) {
    throw InvalidInputError(
        fmt::format("{}: exposure {} outside [0, 100]", what, *v));
  }
  return *v / 100.0;
}

ExposureBounds make_bounds(const std::optional<double> &mn,
                           const std::optional<double> &mx,
                           const std::optional<double> &target,
                           const std::string &what) {
  ExposureBounds b;
  b.min = percent_to_fraction(mn, 0.0, what);
  b.max = percent_to_fraction(mx, 1.0, what);
  if (target)
    b.target = percent_to_fraction(target, 0.0, what);
  if (b.min > b.max) {
    throw InvalidInputError(
        fmt::format("{}: min exposure above max exposure", what));
  }
  return b;
}

double fraction(int count, int lineups) {
  return lineups > 0 ? static_cast<double>(count) / lineups : 0.0;
}

template <typename Map, typename Key>
int lookup(const Map &m, const Key &k) {
  auto it = m.find(k);
  return it == m.end() ? 0 : it->second;
}

template <typename Map, typename Key>
void bump(Map &m, const Key &k, int delta) {
  int &v = m[k];
  v += delta;
  if (v == 0)
    m.erase(k);
}

} // namespace

const ExposureBounds &ExposureConstraints::team(const std::string &code) const {
  auto it = teams.find(code);
  return it == teams.end() ? kUnbounded : it->second;
}

const ExposureBounds &ExposureConstraints::stack(const std::string &code,
                                                 int size) const {
  auto it = stacks.find(StackKey(code, size));
  return it == stacks.end() ? kUnbounded : it->second;
}

const ExposureBounds *ExposureConstraints::player(const std::string &id) const {
  auto it = players.find(id);
  return it == players.end() ? nullptr : &it->second;
}

const ExposureBounds *ExposureConstraints::position(Position p) const {
  auto it = positions.find(p);
  return it == positions.end() ? nullptr : &it->second;
}

ExposureConstraints resolve_exposure(const ExposureSettings &settings) {
  ExposureConstraints out;
  const GlobalExposureSetting &g = settings.global;
  make_bounds(g.global_min_exposure, g.global_max_exposure, std::nullopt,
              "global");
  out.global = g;

  for (const TeamExposureSetting &t : settings.teams) {
    const std::string code = normalize_code(t.team);
    if (code.empty()) {
      throw InvalidInputError("team exposure setting without a team code");
    }
    if (t.stack_size) {
      const int k = *t.stack_size;
      if (k < 2 || k > 4) {
        throw InvalidInputError(fmt::format(
            "team {}: stack size {} not in {{2, 3, 4}}", code, k));
      }
      out.stacks[StackKey(code, k)] =
          make_bounds(t.min, t.max, t.target, fmt::format("{} {}-stack", code, k));
    } else {
      out.teams[code] = make_bounds(t.min, t.max, t.target, code);
    }
  }

  for (const PlayerExposureSetting &p : settings.players) {
    if (p.id.empty()) {
      throw InvalidInputError("player exposure setting without an id");
    }
    out.players[p.id] = make_bounds(p.min, p.max, p.target, p.id);
  }

  for (const auto &kv : settings.positions) {
    const auto pos = parse_position(normalize_code(kv.first));
    if (!pos) {
      throw InvalidInputError(
          fmt::format("unknown position '{}' in exposure settings", kv.first));
    }
    out.positions[*pos] =
        make_bounds(kv.second.min, kv.second.max, kv.second.target, kv.first);
  }
  return out;
}

std::vector<std::string> scale_stack_targets(ExposureConstraints &cons,
                                             int lineup_size) {
  std::vector<std::string> notes;
  for (int k = 2; k <= 4; ++k) {
    double sum = 0.0;
    for (const auto &kv : cons.stacks) {
      if (kv.first.second == k && kv.second.target)
        sum += *kv.second.target;
    }
    const double room = static_cast<double>(lineup_size / k);
    if (sum <= room + 1e-9)
      continue;
    const double factor = room / sum;
    for (auto &kv : cons.stacks) {
      if (kv.first.second == k && kv.second.target)
        *kv.second.target *= factor;
    }
    notes.push_back(fmt::format(
        "{}-stack targets sum to {:.0f}%; scaled to {:.0f}%", k, sum * 100.0,
        room * 100.0));
  }
  return notes;
}

int exposure_budget(double max_fraction, int planned_total) {
  return static_cast<int>(std::floor(max_fraction * planned_total + 1e-9));
}

void ExposureTracker::reset(std::size_t pool_size) {
  lineups_ = 0;
  players_.assign(pool_size, 0);
  teams_.clear();
  stacks_.clear();
  positions_.fill(0);
}

void ExposureTracker::apply(const Lineup &l, const PlayerPool &pool,
                            int delta) {
  lineups_ += delta;
  for (std::size_t idx : player_indices(l))
    players_.at(idx) += delta;
  for (const auto &kv : nexus_core::team_counts(l, pool)) {
    bump(teams_, kv.first, delta);
    bump(stacks_, StackKey(kv.first, kv.second), delta);
  }
  positions_[position_index(Position::CPT)] += delta;
  for (const LineupSlot &s : l.slots)
    positions_[position_index(s.role)] += delta;
}

void ExposureTracker::record(const Lineup &l, const PlayerPool &pool) {
  apply(l, pool, +1);
}

void ExposureTracker::remove(const Lineup &l, const PlayerPool &pool) {
  if (lineups_ == 0) {
    throw InternalInvariantError("ExposureTracker: remove from empty ledger");
  }
  apply(l, pool, -1);
}

int ExposureTracker::team_count(const std::string &team) const {
  return lookup(teams_, team);
}

int ExposureTracker::stack_count(const std::string &team, int size) const {
  return lookup(stacks_, StackKey(team, size));
}

double ExposureTracker::player_fraction(std::size_t idx) const {
  return fraction(players_.at(idx), lineups_);
}

double ExposureTracker::team_fraction(const std::string &team) const {
  return fraction(team_count(team), lineups_);
}

double ExposureTracker::stack_fraction(const std::string &team,
                                       int size) const {
  return fraction(stack_count(team, size), lineups_);
}

double ExposureTracker::position_fraction(Position p) const {
  return fraction(position_count(p), lineups_);
}

double ExposureTracker::team_player_share(const std::string &team) const {
  int held = 0, slots = 0;
  for (const auto &kv : stacks_) {
    slots += kv.first.second * kv.second;
    if (kv.first.first == team)
      held += kv.first.second * kv.second;
  }
  return fraction(held, slots);
}

bool ExposureTracker::team_needs_exposure(const std::string &team,
                                          std::optional<int> size,
                                          const ExposureConstraints &cons) const {
  if (size) {
    const ExposureBounds &sb = cons.stack(team, *size);
    const double cur = stack_fraction(team, *size);
    if (sb.has_max() && lineups_ > 0 && cur >= sb.max)
      return false;
    if (sb.has_min())
      return lineups_ == 0 || cur < sb.min;
  }
  const ExposureBounds &tb = cons.team(team);
  const double cur = team_fraction(team);
  if (tb.has_max() && lineups_ > 0 && cur >= tb.max)
    return false;
  if (tb.has_min())
    return lineups_ == 0 || cur < tb.min;
  return false;
}

bool ExposureTracker::player_below_min(std::size_t idx,
                                       const PlayerPool &pool) const {
  const Player &p = pool[idx];
  return p.min_exposure > 0.0 &&
         (lineups_ == 0 || player_fraction(idx) < p.min_exposure);
}

bool ExposureTracker::player_at_max(std::size_t idx,
                                    const PlayerPool &pool) const {
  const Player &p = pool[idx];
  return p.max_exposure < 1.0 && player_fraction(idx) >= p.max_exposure;
}

double ExposureTracker::weight_adjustment(double target, double current) {
  return std::max(0.1, 1.0 + (target - current));
}

bool ExposureTracker::within_budgets(const Lineup &l, const PlayerPool &pool,
                                     const ExposureConstraints &cons,
                                     int planned_total) const {
  for (std::size_t idx : player_indices(l)) {
    const Player &p = pool[idx];
    if (p.max_exposure < 1.0 &&
        players_.at(idx) + 1 > exposure_budget(p.max_exposure, planned_total))
      return false;
  }
  for (const auto &kv : nexus_core::team_counts(l, pool)) {
    const ExposureBounds &tb = cons.team(kv.first);
    if (tb.has_max() &&
        team_count(kv.first) + 1 > exposure_budget(tb.max, planned_total))
      return false;
    auto it = cons.stacks.find(StackKey(kv.first, kv.second));
    if (it == cons.stacks.end())
      continue;
    const ExposureBounds &sb = it->second;
    const int next = stack_count(kv.first, kv.second) + 1;
    if (sb.has_max() && next > exposure_budget(sb.max, planned_total))
      return false;
    if (sb.target &&
        next > static_cast<int>(std::lround(*sb.target * planned_total)))
      return false;
  }
  return true;
}

bool ExposureTracker::matches_recount(const std::vector<const Lineup *> &lineups,
                                      const PlayerPool &pool) const {
  ExposureTracker fresh(pool.size());
  for (const Lineup *l : lineups)
    fresh.record(*l, pool);
  return fresh == *this;
}

bool ExposureTracker::operator==(const ExposureTracker &o) const {
  return lineups_ == o.lineups_ && players_ == o.players_ &&
         teams_ == o.teams_ && stacks_ == o.stacks_ &&
         positions_ == o.positions_;
}

} // namespace nexus_core
