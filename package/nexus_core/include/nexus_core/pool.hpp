#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "nexus_core/exposure.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/player.hpp"
#include "nexus_core/types.hpp"

namespace nexus_core {

// NaN-safe numeric coercion. Absent, empty, unparseable and non-finite
// values fall back.
double safe_parse_double(const RawNumber &v, double fallback = 0.0);

// max(3.0, projection * position volatility)
double derive_std_dev(Position p, double projection);

// Strips "vs " / "at " / "@ " prefixes and surrounding blanks.
std::string normalize_opponent(const std::string &raw);

// Normalized player pool plus the team and matchup tables derived from it.
class PlayerPool {
public:
  PlayerPool() = default;

  const PlayerTable &table() const { return table_; }
  std::size_t size() const { return table_.size(); }
  const Player &operator[](std::size_t idx) const { return table_[idx]; }
  std::size_t index_of(const std::string &id) const {
    return table_.index_of(id);
  }

  const std::vector<Team> &teams() const { return teams_; }
  const Team &team(const std::string &code) const;
  bool has_team(const std::string &code) const {
    return team_index_.count(code) != 0;
  }

  const std::vector<std::size_t> &by_position(Position p) const {
    return by_position_.at(position_index(p));
  }
  bool has_position(Position p) const { return !by_position(p).empty(); }

  // Pool positions present, in fill order. These are the required slots.
  const std::vector<Position> &required_positions() const {
    return required_;
  }

  bool has_matchups() const { return !opponents_.empty(); }
  std::string opponent_of(const std::string &team) const;
  // "A vs B" with the codes sorted; the team alone when its opponent is
  // unknown.
  std::string game_of(const std::string &team) const;
  const std::map<std::string, std::string> &matchups() const {
    return opponents_;
  }

  double field_avg_ownership() const { return field_avg_ownership_; }

  // Rank of the player's projection inside its position, 0 (lowest) to 1
  // (highest); 0.5 when the position has a single player.
  double projection_percentile(std::size_t idx) const;

  friend PlayerPool build_player_pool(const std::vector<PlayerRecord> &,
                                      const ExposureConstraints &,
                                      const Logger &);

private:
  void index_teams();
  void index_matchups(const Logger &log);

  PlayerTable table_;
  std::vector<Team> teams_;
  std::unordered_map<std::string, std::size_t> team_index_;
  std::array<std::vector<std::size_t>, kPoolPositions> by_position_;
  std::vector<Position> required_;
  std::map<std::string, std::string> opponents_;
  double field_avg_ownership_{0.0};
};

// Coerces records, derives volatility, resolves per-player exposure bounds
// and builds the team/matchup tables. Throws InvalidInputError on an empty
// pool, unknown positions, duplicate or empty ids.
PlayerPool build_player_pool(const std::vector<PlayerRecord> &records,
                             const ExposureConstraints &cons,
                             const Logger &log);

} // namespace nexus_core
