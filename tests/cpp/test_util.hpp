#pragma once

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "nexus_core/exposure.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/player.hpp"
#include "nexus_core/pool.hpp"

// ============================================
// Test utilities
// ============================================

inline int tests_passed = 0;
inline int tests_failed = 0;

#define TEST(name) void name()
#define RUN_TEST(name)                                                         \
  do {                                                                         \
    std::cout << "Running: " << #name << "... ";                               \
    try {                                                                      \
      name();                                                                  \
      tests_passed++;                                                          \
      std::cout << "PASSED\n";                                                 \
    } catch (const std::exception &e) {                                        \
      tests_failed++;                                                          \
      std::cout << "FAILED: " << e.what() << "\n";                             \
    }                                                                          \
  } while (0)

#define ASSERT_TRUE(cond)                                                      \
  do {                                                                         \
    if (!(cond))                                                               \
      throw std::runtime_error("Assertion failed: " #cond);                    \
  } while (0)
#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))
#define ASSERT_EQ(a, b)                                                        \
  do {                                                                         \
    if ((a) != (b))                                                            \
      throw std::runtime_error("Assertion failed: " #a " == " #b);             \
  } while (0)
#define ASSERT_NEAR(a, b, tol)                                                 \
  do {                                                                         \
    if (std::abs((a) - (b)) > (tol))                                           \
      throw std::runtime_error(fmt::format(                                    \
          "Assertion failed: " #a " ~= " #b " ({} vs {})", (a), (b)));         \
  } while (0)
#define ASSERT_THROWS(expr, type)                                              \
  do {                                                                         \
    bool caught_ = false;                                                      \
    try {                                                                      \
      expr;                                                                    \
    } catch (const type &) {                                                   \
      caught_ = true;                                                          \
    }                                                                          \
    if (!caught_)                                                              \
      throw std::runtime_error("Expected " #type " from " #expr);              \
  } while (0)

inline int report_results() {
  std::cout << "\n=== Results ===\n";
  std::cout << "Passed: " << tests_passed << "\n";
  std::cout << "Failed: " << tests_failed << "\n";
  return tests_failed > 0 ? 1 : 0;
}

// ============================================
// Fixtures
// ============================================

namespace fixture {

struct TeamRow {
  const char *code;
  const char *opponent;
  double projection_scale;
  double ownership;
  int salary_offset;
};

struct PositionRow {
  const char *position;
  double projection;
  int salary;
};

inline const std::vector<PositionRow> &positions() {
  static const std::vector<PositionRow> p = {
      {"TOP", 18.0, 5500}, {"JNG", 20.0, 6000}, {"MID", 24.0, 7000},
      {"ADC", 26.0, 6800}, {"SUP", 12.0, 4800}, {"TEAM", 14.0, 4200}};
  return p;
}

// Five teams of six, ids "<TEAM>_<POS>".
inline std::vector<nexus_core::PlayerRecord>
league_records(bool with_opponents = true) {
  static const std::vector<TeamRow> teams = {
      {"T1", "GEN", 1.15, 30.0, 400}, {"GEN", "T1", 1.10, 25.0, 200},
      {"KT", "HLE", 1.00, 15.0, 0},   {"HLE", "KT", 0.95, 12.0, -200},
      {"DK", "NS", 0.90, 8.0, -300}};
  std::vector<nexus_core::PlayerRecord> out;
  for (const TeamRow &t : teams) {
    for (const PositionRow &p : positions()) {
      out.emplace_back(fmt::format("{}_{}", t.code, p.position),
                       fmt::format("{} {}", t.code, p.position), p.position,
                       t.code, static_cast<double>(p.salary + t.salary_offset),
                       p.projection * t.projection_scale, t.ownership,
                       with_opponents ? fmt::format("vs {}", t.opponent)
                                      : std::string());
    }
  }
  return out;
}

// Uniform projections of 40 and salaries between 6,000 and 7,000.
inline std::vector<nexus_core::PlayerRecord> uniform_records() {
  static const char *teams[] = {"T1", "GEN", "KT", "HLE", "DK"};
  static const char *opponents[] = {"GEN", "T1", "HLE", "KT", "NS"};
  std::vector<nexus_core::PlayerRecord> out;
  for (int t = 0; t < 5; ++t) {
    int pos = 0;
    for (const PositionRow &p : positions()) {
      out.emplace_back(fmt::format("{}_{}", teams[t], p.position),
                       fmt::format("{} {}", teams[t], p.position), p.position,
                       teams[t], 6000.0 + 150.0 * pos + 50.0 * t, 40.0,
                       10.0 + 4.0 * t + pos,
                       fmt::format("vs {}", opponents[t]));
      ++pos;
    }
  }
  return out;
}

inline const nexus_core::Logger &quiet_log() {
  static const nexus_core::Logger log("test");
  return log;
}

inline nexus_core::PlayerPool
make_pool(const std::vector<nexus_core::PlayerRecord> &records,
          const nexus_core::ExposureConstraints &cons = {}) {
  return nexus_core::build_player_pool(records, cons, quiet_log());
}

// Slots filled in required order from the given ids.
inline nexus_core::Lineup make_lineup(const nexus_core::PlayerPool &pool,
                                      const std::string &captain,
                                      const std::vector<std::string> &ids) {
  nexus_core::Lineup l;
  l.captain = nexus_core::LineupSlot{pool.index_of(captain),
                                     nexus_core::Position::CPT};
  for (nexus_core::Position role : pool.required_positions()) {
    for (const std::string &id : ids) {
      const std::size_t idx = pool.index_of(id);
      if (pool[idx].position == role) {
        l.slots.push_back(nexus_core::LineupSlot{idx, role});
        break;
      }
    }
  }
  return l;
}

} // namespace fixture
