#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "nexus_core/types.hpp"

namespace nexus_core {

// Numeric input field as it arrives from an upload: absent, a number, or text.
using RawNumber = std::variant<std::monostate, double, std::string>;

// Input record before preprocessing.
struct PlayerRecord {
  std::string id;
  std::string name;
  std::string position;
  std::string team;
  RawNumber salary;
  RawNumber projected_points;
  RawNumber ownership; // percent of the field, 0..100
  std::string opponent; // optional; may carry a "vs "/"at " prefix

  PlayerRecord() = default;
  PlayerRecord(std::string id_, std::string name_, std::string position_,
               std::string team_, RawNumber salary_, RawNumber projected_,
               RawNumber ownership_, std::string opponent_ = {})
      : id(std::move(id_)), name(std::move(name_)),
        position(std::move(position_)), team(std::move(team_)),
        salary(std::move(salary_)), projected_points(std::move(projected_)),
        ownership(std::move(ownership_)), opponent(std::move(opponent_)) {}
};

// Normalized pool player. Immutable once the pool is built.
struct Player {
  std::string id;
  std::string name;
  Position position{Position::TOP};
  std::string team;
  std::string opponent;
  int salary{0};
  double projected_points{0.0};
  double ownership{0.0}; // percent
  double std_dev{3.0};
  double min_exposure{0.0};
  double max_exposure{1.0};
  double target_exposure{0.0};

  double ownership_fraction() const { return ownership / 100.0; }
};

struct Team {
  std::string code;
  std::vector<std::size_t> players; // pool indices, input order
  std::array<std::vector<std::size_t>, kPoolPositions> by_position;
  double total_projection{0.0};
  double total_salary{0.0};
  double avg_ownership{0.0};
};

// Id-keyed player table. Everything downstream refers to players by the
// index returned here.
class PlayerTable {
public:
  PlayerTable() = default;

  std::size_t add_player(const Player &p) {
    if (index_.count(p.id) != 0) {
      throw std::invalid_argument("PlayerTable: duplicate player id " + p.id);
    }
    const std::size_t idx = players_.size();
    players_.push_back(p);
    index_[p.id] = idx;
    return idx;
  }

  std::size_t size() const { return players_.size(); }
  bool empty() const { return players_.empty(); }

  bool has_id(const std::string &id) const {
    return index_.find(id) != index_.end();
  }

  std::size_t index_of(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
      throw std::out_of_range("PlayerTable: player id not found: " + id);
    }
    return it->second;
  }

  const Player &at(std::size_t idx) const { return players_.at(idx); }
  const Player &operator[](std::size_t idx) const { return players_[idx]; }

  const std::vector<Player> &players() const { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace nexus_core
