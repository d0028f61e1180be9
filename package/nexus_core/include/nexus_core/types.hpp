#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace nexus_core {

// Roster roles. CPT is a slot role only; pool players never carry it.
enum class Position { TOP = 0, JNG, MID, ADC, SUP, TEAM, CPT };

constexpr std::size_t kPoolPositions = 6; // TOP..TEAM
constexpr std::size_t kLineupSize = 7;    // CPT + one of each pool position

// Fill order used by the builder and the validator.
constexpr std::array<Position, kPoolPositions> kFillOrder = {
    Position::TOP, Position::JNG, Position::MID,
    Position::ADC, Position::SUP, Position::TEAM};

inline std::size_t position_index(Position p) {
  return static_cast<std::size_t>(p);
}

inline const char *to_string(Position p) {
  switch (p) {
  case Position::TOP: return "TOP";
  case Position::JNG: return "JNG";
  case Position::MID: return "MID";
  case Position::ADC: return "ADC";
  case Position::SUP: return "SUP";
  case Position::TEAM: return "TEAM";
  case Position::CPT: return "CPT";
  }
  return "UNKNOWN";
}

// Parses a pool position. CPT is not accepted here.
inline std::optional<Position> parse_position(const std::string &s) {
  if (s == "TOP") return Position::TOP;
  if (s == "JNG" || s == "JUNGLE") return Position::JNG;
  if (s == "MID") return Position::MID;
  if (s == "ADC" || s == "BOT") return Position::ADC;
  if (s == "SUP" || s == "SUPPORT") return Position::SUP;
  if (s == "TEAM") return Position::TEAM;
  return std::nullopt;
}

// Standard deviation as a fraction of projection.
inline double position_volatility(Position p) {
  switch (p) {
  case Position::MID:
  case Position::ADC: return 0.40;
  case Position::TOP:
  case Position::JNG: return 0.35;
  case Position::SUP: return 0.25;
  case Position::TEAM: return 0.30;
  default: return 0.35;
  }
}

// Captain impact weights shared by NexusScore and the genetic fitness.
inline double position_impact(Position p) {
  switch (p) {
  case Position::MID: return 2.0;
  case Position::ADC: return 1.8;
  case Position::JNG: return 1.5;
  case Position::TOP: return 1.2;
  case Position::SUP: return 1.0;
  case Position::TEAM: return 0.8;
  default: return 1.0;
  }
}

inline bool captain_eligible(Position p) {
  return p == Position::TOP || p == Position::JNG || p == Position::MID ||
         p == Position::ADC;
}

} // namespace nexus_core
