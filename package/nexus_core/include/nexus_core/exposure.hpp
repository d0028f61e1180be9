#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "nexus_core/lineup.hpp"
#include "nexus_core/types.hpp"

namespace nexus_core {

class PlayerPool;

// ---- Input records (percent values, 0..100) ----

struct GlobalExposureSetting {
  double global_min_exposure{0.0};
  double global_max_exposure{100.0};
  bool apply_to_new_lineups{true};
  bool prioritize_projections{false};
};

struct TeamExposureSetting {
  std::string team;
  std::optional<int> stack_size;
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> target;
};

struct PlayerExposureSetting {
  std::string id;
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> target;
};

struct PositionExposureSetting {
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> target;
};

struct ExposureSettings {
  GlobalExposureSetting global;
  std::vector<TeamExposureSetting> teams;
  std::vector<PlayerExposureSetting> players;
  std::map<std::string, PositionExposureSetting> positions;
};

// ---- Resolved constraints (fractions, 0..1) ----

struct ExposureBounds {
  double min{0.0};
  double max{1.0};
  std::optional<double> target;

  bool has_min() const { return min > 0.0; }
  bool has_max() const { return max < 1.0; }
};

using StackKey = std::pair<std::string, int>; // (team, stack size)

struct ExposureConstraints {
  std::map<std::string, ExposureBounds> players; // explicit, by player id
  std::map<std::string, ExposureBounds> teams;
  std::map<StackKey, ExposureBounds> stacks;
  std::map<Position, ExposureBounds> positions;
  GlobalExposureSetting global;

  const ExposureBounds &team(const std::string &code) const;
  const ExposureBounds &stack(const std::string &code, int size) const;
  const ExposureBounds *player(const std::string &id) const;
  const ExposureBounds *position(Position p) const;
};

// Converts percent records into fractions. Throws InvalidInputError on
// stack sizes outside {2,3,4}, percents outside [0,100], min > max or
// unknown position names.
ExposureConstraints resolve_exposure(const ExposureSettings &settings);

// A lineup of lineup_size players holds at most lineup_size / k stacks of
// size k. Where the (team, k) targets of one size add up to more than that,
// they are scaled down proportionally. Returns one message per scaled size.
std::vector<std::string> scale_stack_targets(ExposureConstraints &cons,
                                             int lineup_size);

// Uses allowed under an explicit maximum over a planned portfolio size.
int exposure_budget(double max_fraction, int planned_total);

// ---- Ledger ----

// Counts over the lineups currently accepted (seeds included). Fractions
// divide by the lineup count.
class ExposureTracker {
public:
  ExposureTracker() = default;
  explicit ExposureTracker(std::size_t pool_size) { reset(pool_size); }

  void reset(std::size_t pool_size);

  void record(const Lineup &l, const PlayerPool &pool);
  void remove(const Lineup &l, const PlayerPool &pool);

  int lineup_count() const { return lineups_; }
  int player_count(std::size_t idx) const { return players_.at(idx); }
  int team_count(const std::string &team) const;
  int stack_count(const std::string &team, int size) const;
  int position_count(Position p) const {
    return positions_[position_index(p)];
  }

  double player_fraction(std::size_t idx) const;
  double team_fraction(const std::string &team) const;
  double stack_fraction(const std::string &team, int size) const;
  double position_fraction(Position p) const;
  // Share of all rostered slots held by the team's players.
  double team_player_share(const std::string &team) const;

  // True while below an explicit min (always true on an empty ledger);
  // false once an explicit max is reached. With a stack size, the
  // (team, size) bounds are consulted first.
  bool team_needs_exposure(const std::string &team, std::optional<int> size,
                           const ExposureConstraints &cons) const;
  bool player_below_min(std::size_t idx, const PlayerPool &pool) const;
  bool player_at_max(std::size_t idx, const PlayerPool &pool) const;

  // max(0.1, 1 + (target - current))
  static double weight_adjustment(double target, double current);

  // True when accepting l keeps every explicit maximum within its budget
  // and every explicit stack target within its rounded quota.
  bool within_budgets(const Lineup &l, const PlayerPool &pool,
                      const ExposureConstraints &cons,
                      int planned_total) const;

  // Compares every counter with a fresh recount of lineups.
  bool matches_recount(const std::vector<const Lineup *> &lineups,
                       const PlayerPool &pool) const;

  const std::map<std::string, int> &team_counts() const { return teams_; }
  const std::map<StackKey, int> &stack_counts() const { return stacks_; }

  bool operator==(const ExposureTracker &o) const;
  bool operator!=(const ExposureTracker &o) const { return !(*this == o); }

private:
  void apply(const Lineup &l, const PlayerPool &pool, int delta);

  int lineups_{0};
  std::vector<int> players_;
  std::map<std::string, int> teams_;
  std::map<StackKey, int> stacks_;
  std::array<int, kPoolPositions + 1> positions_{}; // indexed by Position
};

} // namespace nexus_core
