/**
 * Lineup construction tests
 *
 * Invariants are checked over many random builds.
 */

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cmath>
#include <map>
#include <random>
#include <set>

#include "nexus_core/builder.hpp"
#include "nexus_core/errors.hpp"
#include "nexus_core/validator.hpp"
#include "test_util.hpp"

using namespace nexus_core;

namespace {

struct Fixture {
  explicit Fixture(const ExposureSettings &settings = {},
                   std::vector<PlayerRecord> records = fixture::league_records())
      : cons(resolve_exposure(settings)),
        pool(fixture::make_pool(records, cons)),
        corr(CorrelationMatrix::build(pool.table(), cfg.correlation)),
        builder(pool, corr, cons, cfg, fixture::quiet_log()),
        validator(pool, cfg) {}

  OptimizerConfig cfg;
  ExposureConstraints cons;
  PlayerPool pool;
  CorrelationMatrix corr;
  LineupBuilder builder;
  LineupValidator validator;
};

int max_team_count(const Lineup &l, const PlayerPool &pool) {
  int best = 0;
  for (const auto &kv : team_counts(l, pool))
    best = std::max(best, kv.second);
  return best;
}

} // namespace

TEST(test_weighted_index) {
  std::mt19937_64 rng(1);
  ASSERT_THROWS(weighted_index({}, 0.3, rng), std::invalid_argument);

  for (int i = 0; i < 50; ++i)
    ASSERT_EQ(weighted_index({0.0, 5.0, 0.0}, 0.0, rng), 1u);

  std::set<std::size_t> seen;
  for (int i = 0; i < 200; ++i)
    seen.insert(weighted_index({0.0, 0.0, 0.0, 0.0}, 0.3, rng));
  ASSERT_EQ(seen.size(), 4u);

  // Randomness flattens the choice.
  std::set<std::size_t> flat;
  for (int i = 0; i < 500; ++i)
    flat.insert(weighted_index({10.0, 0.0, 0.0}, 0.9, rng));
  ASSERT_EQ(flat.size(), 3u);
}

TEST(test_build_invariants) {
  Fixture f;
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(2024);
  BuildOptions opts;

  int built = 0;
  for (int i = 0; i < 300; ++i) {
    Lineup l;
    try {
      l = f.builder.build(tracker, rng, opts, 20);
    } catch (const BuildFailure &) {
      continue;
    }
    ++built;
    const ValidationResult r = f.validator.check_structure(l);
    for (Violation v : r.violations)
      ASSERT_TRUE(v == Violation::GameDiversity);

    ASSERT_EQ(l.slots.size(), f.pool.required_positions().size());
    ASSERT_TRUE(l.captain.is_captain());
    ASSERT_TRUE(f.pool[l.captain.player].position != Position::TEAM);
    ASSERT_TRUE(total_salary(l, f.pool, f.cfg.captain_multiplier) <=
                f.cfg.salary_cap);
    ASSERT_TRUE(max_team_count(l, f.pool) <= f.cfg.max_players_per_team);
    ASSERT_EQ(slot_salary(l.captain, f.pool, f.cfg.captain_multiplier),
              static_cast<int>(std::lround(f.pool[l.captain.player].salary * 1.5)));
  }
  ASSERT_TRUE(built >= 270);
}

TEST(test_preferred_stack_size) {
  Fixture f;
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(77);
  BuildOptions opts;
  opts.preferred_stack_size = 4;

  int built = 0;
  for (int i = 0; i < 100; ++i) {
    try {
      const Lineup l = f.builder.build(tracker, rng, opts, 20);
      ++built;
      ASSERT_EQ(max_team_count(l, f.pool), 4);
    } catch (const BuildFailure &) {
    }
  }
  ASSERT_TRUE(built >= 50);
}

TEST(test_captain_prefers_stack_core) {
  Fixture f;
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(5);
  BuildOptions opts;
  for (const char *team : {"T1", "KT", "DK"}) {
    for (int i = 0; i < 20; ++i) {
      const Player &c =
          f.pool[f.builder.select_captain(team, tracker, rng, opts, 20)];
      ASSERT_EQ(c.team, std::string(team));
      ASSERT_TRUE(captain_eligible(c.position));
    }
  }
}

TEST(test_captain_below_min_first) {
  ExposureSettings s;
  s.players.push_back(PlayerExposureSetting{"KT_TOP", 30.0, std::nullopt,
                                            std::nullopt});
  Fixture f(s);
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(9);
  BuildOptions opts;
  for (int i = 0; i < 10; ++i)
    ASSERT_EQ(f.builder.select_captain("KT", tracker, rng, opts, 20),
              f.pool.index_of("KT_TOP"));
}

TEST(test_budgets) {
  ExposureSettings s;
  s.players.push_back(PlayerExposureSetting{"T1_MID", std::nullopt, 10.0,
                                            std::nullopt});
  s.teams.push_back(
      TeamExposureSetting{"DK", std::nullopt, std::nullopt, 0.0, std::nullopt});
  Fixture f(s);
  ExposureTracker tracker(f.pool.size());

  ASSERT_EQ(f.builder.player_budget_left(f.pool.index_of("T1_MID"), tracker, 20),
            2);
  ASSERT_EQ(f.builder.player_budget_left(f.pool.index_of("KT_MID"), tracker, 20),
            INT_MAX);
  ASSERT_TRUE(f.builder.team_budget_exhausted("DK", tracker, 20));
  ASSERT_FALSE(f.builder.team_budget_exhausted("T1", tracker, 20));

  // A zero team budget keeps the team out of every lineup.
  std::mt19937_64 rng(11);
  BuildOptions opts;
  for (int i = 0; i < 100; ++i) {
    try {
      const Lineup l = f.builder.build(tracker, rng, opts, 20);
      ASSERT_EQ(team_counts(l, f.pool).count("DK"), 0u);
    } catch (const BuildFailure &) {
    }
  }
}

TEST(test_select_stack_minimums) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{"KT", 3, 30.0, std::nullopt,
                                        std::nullopt});
  Fixture f(s);
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(13);
  BuildOptions opts;

  ASSERT_TRUE(f.builder.underexposed_stack_size("KT", tracker) == 3);
  ASSERT_FALSE(f.builder.underexposed_stack_size("T1", tracker).has_value());

  const StackChoice c = f.builder.select_stack(tracker, rng, opts, 20);
  ASSERT_EQ(c.team, "KT");
  ASSERT_TRUE(c.size == 3);
}

TEST(test_select_stack_due_target) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{"HLE", 4, std::nullopt, std::nullopt,
                                        60.0});
  Fixture f(s);
  ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(17);
  BuildOptions opts;

  const StackChoice c = f.builder.select_stack(tracker, rng, opts, 10);
  ASSERT_EQ(c.team, "HLE");
  ASSERT_TRUE(c.size == 4);
}

TEST(test_stack_team_weight) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{"T1", std::nullopt, std::nullopt,
                                        std::nullopt, 50.0});
  Fixture f(s);
  ExposureTracker tracker(f.pool.size());
  const Team &t1 = f.pool.team("T1");
  const Team &gen = f.pool.team("GEN");

  ASSERT_NEAR(f.builder.stack_team_weight(t1, tracker),
              t1.total_projection * 1.5, 1e-9);
  ASSERT_NEAR(f.builder.stack_team_weight(gen, tracker), gen.total_projection,
              1e-9);

  // T1 holds 4 of 7 slots, GEN stays neutral.
  tracker.record(fixture::make_lineup(f.pool, "T1_MID",
                                      {"T1_TOP", "T1_JNG", "GEN_MID", "T1_ADC",
                                       "GEN_SUP", "KT_TEAM"}),
                 f.pool);
  ASSERT_NEAR(f.builder.stack_team_weight(t1, tracker),
              t1.total_projection * (1.0 + 0.5 - 4.0 / 7.0), 1e-9);
  ASSERT_NEAR(f.builder.stack_team_weight(gen, tracker), gen.total_projection,
              1e-9);

  // Without a target every team keeps its projection.
  Fixture plain;
  ASSERT_NEAR(plain.builder.stack_team_weight(plain.pool.team("T1"), tracker),
              plain.pool.team("T1").total_projection, 1e-9);
}

TEST(test_team_target_steers_stack) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{"T1", std::nullopt, std::nullopt,
                                        std::nullopt, 50.0});
  Fixture targeted(s);
  Fixture plain;
  const ExposureTracker tracker(targeted.pool.size());
  BuildOptions opts;
  opts.randomness = 0.0;

  const auto tally = [&](const Fixture &f, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::map<std::string, int> picks;
    for (int i = 0; i < 3000; ++i)
      ++picks[f.builder.select_stack(tracker, rng, opts, 20).team];
    return picks;
  };
  const std::map<std::string, int> with = tally(targeted, 23);
  const std::map<std::string, int> without = tally(plain, 23);

  for (const auto &kv : with) {
    if (kv.first != "T1")
      ASSERT_TRUE(with.at("T1") > kv.second + 150);
  }
  ASSERT_TRUE(with.at("T1") > without.at("T1") + 100);
}

TEST(test_partner_chosen) {
  ASSERT_TRUE(partner_chosen(Position::MID, {Position::TOP, Position::JNG}));
  ASSERT_TRUE(partner_chosen(Position::JNG, {Position::MID}));
  ASSERT_TRUE(partner_chosen(Position::ADC, {Position::SUP}));
  ASSERT_TRUE(partner_chosen(Position::SUP, {Position::TOP, Position::ADC}));
  ASSERT_FALSE(partner_chosen(Position::MID, {Position::TOP, Position::ADC}));
  ASSERT_FALSE(partner_chosen(Position::ADC, {}));
  ASSERT_FALSE(partner_chosen(Position::TOP, {Position::MID, Position::JNG}));
}

TEST(test_every_team_exhausted) {
  ExposureSettings s;
  for (const char *team : {"T1", "GEN", "KT", "HLE", "DK"})
    s.teams.push_back(
        TeamExposureSetting{team, std::nullopt, std::nullopt, 0.0, std::nullopt});
  Fixture f(s);
  const ExposureTracker tracker(f.pool.size());
  std::mt19937_64 rng(19);
  ASSERT_THROWS(f.builder.build(tracker, rng, BuildOptions{}, 10), BuildFailure);
}

int main() {
  global_log_level() = LogLevel::Error;

  RUN_TEST(test_weighted_index);
  RUN_TEST(test_build_invariants);
  RUN_TEST(test_preferred_stack_size);
  RUN_TEST(test_captain_prefers_stack_core);
  RUN_TEST(test_captain_below_min_first);
  RUN_TEST(test_budgets);
  RUN_TEST(test_select_stack_minimums);
  RUN_TEST(test_select_stack_due_target);
  RUN_TEST(test_stack_team_weight);
  RUN_TEST(test_team_target_steers_stack);
  RUN_TEST(test_partner_chosen);
  RUN_TEST(test_every_team_exhausted);

  return report_results();
}
