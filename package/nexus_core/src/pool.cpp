#include "nexus_core/pool.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"

namespace nexus_core {

namespace {

std::string trim(const std::string &s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::string upper(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

// Rank of players[idx] within its position bucket, 0..1.
double percentile_within(const std::vector<Player> &players,
                         const std::vector<std::size_t> &bucket,
                         std::size_t idx) {
  if (bucket.size() <= 1)
    return 0.5;
  const double mine = players[idx].projected_points;
  std::size_t below = 0;
  for (std::size_t j : bucket) {
    if (players[j].projected_points < mine)
      ++below;
  }
  return static_cast<double>(below) / static_cast<double>(bucket.size() - 1);
}

} // namespace

double safe_parse_double(const RawNumber &v, double fallback) {
  if (const double *d = std::get_if<double>(&v)) {
    return std::isfinite(*d) ? *d : fallback;
  }
  if (const std::string *s = std::get_if<std::string>(&v)) {
    std::string t = trim(*s);
    t.erase(std::remove(t.begin(), t.end(), ','), t.end());
    if (!t.empty() && t.front() == '$')
      t.erase(t.begin());
    if (!t.empty() && t.back() == '%')
      t.pop_back();
    if (t.empty())
      return fallback;
    char *end = nullptr;
    const double parsed = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0' || !std::isfinite(parsed))
      return fallback;
    return parsed;
  }
  return fallback;
}

double derive_std_dev(Position p, double projection) {
  return std::max(3.0, projection * position_volatility(p));
}

std::string normalize_opponent(const std::string &raw) {
  std::string t = trim(raw);
  const std::string u = upper(t);
  for (const char *prefix : {"VS.", "VS", "AT", "@"}) {
    const std::string pre(prefix);
    if (u.size() > pre.size() && u.compare(0, pre.size(), pre) == 0) {
      const char next = t[pre.size()];
      // "@T1" needs no separator; word prefixes do.
      if (pre == "@" || std::isspace(static_cast<unsigned char>(next))) {
        return trim(t.substr(pre.size()));
      }
    }
  }
  return t;
}

const Team &PlayerPool::team(const std::string &code) const {
  auto it = team_index_.find(code);
  if (it == team_index_.end()) {
    throw std::out_of_range("PlayerPool: unknown team " + code);
  }
  return teams_[it->second];
}

std::string PlayerPool::opponent_of(const std::string &team) const {
  auto it = opponents_.find(team);
  return it == opponents_.end() ? std::string() : it->second;
}

std::string PlayerPool::game_of(const std::string &team) const {
  const std::string opp = opponent_of(team);
  if (opp.empty())
    return team;
  return team < opp ? fmt::format("{} vs {}", team, opp)
                    : fmt::format("{} vs {}", opp, team);
}

double PlayerPool::projection_percentile(std::size_t idx) const {
  const auto &bucket = by_position(table_[idx].position);
  return percentile_within(table_.players(), bucket, idx);
}

void PlayerPool::index_teams() {
  teams_.clear();
  team_index_.clear();
  for (auto &b : by_position_)
    b.clear();

  for (std::size_t i = 0; i < table_.size(); ++i) {
    const Player &p = table_[i];
    auto it = team_index_.find(p.team);
    if (it == team_index_.end()) {
      it = team_index_.emplace(p.team, teams_.size()).first;
      Team t;
      t.code = p.team;
      teams_.push_back(t);
    }
    Team &t = teams_[it->second];
    t.players.push_back(i);
    t.by_position[position_index(p.position)].push_back(i);
    t.total_projection += p.projected_points;
    t.total_salary += p.salary;
    t.avg_ownership += p.ownership;
    by_position_[position_index(p.position)].push_back(i);
  }
  for (auto &t : teams_) {
    if (!t.players.empty())
      t.avg_ownership /= static_cast<double>(t.players.size());
  }

  required_.clear();
  for (Position pos : kFillOrder) {
    if (!by_position_[position_index(pos)].empty())
      required_.push_back(pos);
  }
}

void PlayerPool::index_matchups(const Logger &log) {
  opponents_.clear();
  for (const Player &p : table_.players()) {
    if (p.opponent.empty() || p.opponent == p.team)
      continue;
    auto it = opponents_.find(p.team);
    if (it == opponents_.end()) {
      opponents_[p.team] = p.opponent;
    } else if (it->second != p.opponent) {
      log.warn("team {} listed against both {} and {}; keeping {}", p.team,
               it->second, p.opponent, it->second);
    }
  }
  // Fill in the reverse side of each known matchup.
  const auto known = opponents_;
  for (const auto &kv : known) {
    if (opponents_.count(kv.second) == 0)
      opponents_[kv.second] = kv.first;
  }
  if (opponents_.empty()) {
    log.warn("no opponent data in player pool; game diversity check skipped");
  }
}

PlayerPool build_player_pool(const std::vector<PlayerRecord> &records,
                             const ExposureConstraints &cons,
                             const Logger &log) {
  if (records.empty()) {
    throw InvalidInputError("player pool is empty");
  }

  std::vector<Player> players;
  players.reserve(records.size());
  std::array<std::vector<std::size_t>, kPoolPositions> buckets;
  int invalid_projections = 0;

  for (const PlayerRecord &r : records) {
    Player p;
    p.id = trim(r.id);
    if (p.id.empty()) {
      throw InvalidInputError(
          fmt::format("player '{}' has an empty id", r.name));
    }
    const auto pos = parse_position(upper(trim(r.position)));
    if (!pos) {
      throw InvalidInputError(fmt::format("player {} has unknown position '{}'",
                                          p.id, r.position));
    }
    p.name = r.name.empty() ? p.id : r.name;
    p.position = *pos;
    p.team = upper(trim(r.team));
    if (p.team.empty()) {
      throw InvalidInputError(fmt::format("player {} has no team", p.id));
    }
    p.opponent = upper(normalize_opponent(r.opponent));

    const double salary = safe_parse_double(r.salary, 0.0);
    p.salary = static_cast<int>(std::lround(std::max(0.0, salary)));
    p.projected_points = safe_parse_double(r.projected_points, 0.0);
    if (p.projected_points < 0.0) {
      p.projected_points = 0.0;
    }
    if (p.projected_points == 0.0)
      ++invalid_projections;
    p.ownership =
        std::min(100.0, std::max(0.0, safe_parse_double(r.ownership, 0.0)));
    p.std_dev = derive_std_dev(p.position, p.projected_points);

    buckets[position_index(p.position)].push_back(players.size());
    players.push_back(std::move(p));
  }

  // Exposure bounds: per-player override > position default > global.
  const GlobalExposureSetting &g = cons.global;
  for (std::size_t i = 0; i < players.size(); ++i) {
    Player &p = players[i];
    double mn = g.apply_to_new_lineups ? g.global_min_exposure / 100.0 : 0.0;
    double mx = g.apply_to_new_lineups ? g.global_max_exposure / 100.0 : 1.0;
    std::optional<double> target;
    if (const ExposureBounds *pb = cons.position(p.position)) {
      if (pb->has_min())
        mn = pb->min;
      if (pb->has_max())
        mx = pb->max;
      target = pb->target;
    }
    if (const ExposureBounds *b = cons.player(p.id)) {
      mn = b->min;
      mx = b->max;
      if (b->target)
        target = b->target;
    }
    if (mn > mx)
      mn = mx;
    p.min_exposure = mn;
    p.max_exposure = mx;
    if (target) {
      p.target_exposure = std::min(mx, std::max(mn, *target));
    } else {
      const double pct =
          percentile_within(players, buckets[position_index(p.position)], i);
      double leverage = 1.0;
      if (!g.prioritize_projections) {
        leverage =
            std::min(1.0, (p.projected_points / std::max(0.1, p.ownership)) /
                              1.5);
      }
      p.target_exposure = mn + (mx - mn) * pct * leverage;
    }
  }

  PlayerPool pool;
  for (const Player &p : players) {
    if (pool.table_.has_id(p.id)) {
      throw InvalidInputError(fmt::format("duplicate player id {}", p.id));
    }
    pool.table_.add_player(p);
  }
  for (const auto &kv : cons.players) {
    if (!pool.table_.has_id(kv.first))
      log.warn("exposure setting for unknown player {} ignored", kv.first);
  }

  pool.index_teams();
  for (Position core : {Position::TOP, Position::JNG, Position::MID,
                        Position::ADC, Position::SUP}) {
    if (!pool.has_position(core)) {
      throw InvalidInputError(
          fmt::format("player pool has no {} players", to_string(core)));
    }
  }
  pool.index_matchups(log);

  double own = 0.0;
  for (const Player &p : pool.table_.players())
    own += p.ownership;
  pool.field_avg_ownership_ = own / static_cast<double>(pool.size());

  if (invalid_projections > 0) {
    log.warn("{} players have no usable projection; treated as 0",
             invalid_projections);
  }
  log.info("player pool ready: {} players, {} teams, {} required slots",
           pool.size(), pool.teams().size(), pool.required_positions().size());
  return pool;
}

} // namespace nexus_core
