/**
 * Player pool preprocessing tests
 *
 * Parsing, volatility, exposure resolution and matchup extraction.
 */

#include <algorithm>

#include "nexus_core/errors.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/pool.hpp"
#include "test_util.hpp"

using namespace nexus_core;

// ============================================
// Parsing
// ============================================

TEST(test_safe_parse_double) {
  ASSERT_NEAR(safe_parse_double(RawNumber{6500.0}), 6500.0, 1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{std::string("$6,500")}), 6500.0,
              1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{std::string(" 12.5% ")}), 12.5,
              1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{std::string("n/a")}, -1.0), -1.0,
              1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{std::string("")}, 7.0), 7.0, 1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{}, 3.0), 3.0, 1e-9);
  ASSERT_NEAR(safe_parse_double(RawNumber{std::nan("")}, 2.0), 2.0, 1e-9);
}

TEST(test_derive_std_dev) {
  ASSERT_NEAR(derive_std_dev(Position::MID, 24.0), 9.6, 1e-9);
  ASSERT_NEAR(derive_std_dev(Position::SUP, 20.0), 5.0, 1e-9);
  ASSERT_NEAR(derive_std_dev(Position::SUP, 5.0), 3.0, 1e-9);
  ASSERT_NEAR(derive_std_dev(Position::TEAM, 0.0), 3.0, 1e-9);
}

TEST(test_normalize_opponent) {
  ASSERT_EQ(normalize_opponent("vs GEN"), "GEN");
  ASSERT_EQ(normalize_opponent("VS. HLE"), "HLE");
  ASSERT_EQ(normalize_opponent("at KT"), "KT");
  ASSERT_EQ(normalize_opponent("@T1"), "T1");
  ASSERT_EQ(normalize_opponent("  DK "), "DK");
  ASSERT_EQ(normalize_opponent("ATHENA"), "ATHENA");
}

TEST(test_position_aliases) {
  ASSERT_TRUE(parse_position("JUNGLE") == Position::JNG);
  ASSERT_TRUE(parse_position("BOT") == Position::ADC);
  ASSERT_TRUE(parse_position("SUPPORT") == Position::SUP);
  ASSERT_FALSE(parse_position("CPT").has_value());
  ASSERT_FALSE(parse_position("FLEX").has_value());
}

// ============================================
// Pool construction
// ============================================

TEST(test_build_pool_tables) {
  const PlayerPool pool = fixture::make_pool(fixture::league_records());
  ASSERT_EQ(pool.size(), 30u);
  ASSERT_EQ(pool.teams().size(), 5u);
  ASSERT_EQ(pool.required_positions().size(), 6u);
  ASSERT_TRUE(pool.required_positions().front() == Position::TOP);
  ASSERT_TRUE(pool.required_positions().back() == Position::TEAM);
  ASSERT_EQ(pool.by_position(Position::MID).size(), 5u);

  const Team &t1 = pool.team("T1");
  ASSERT_EQ(t1.players.size(), 6u);
  ASSERT_EQ(t1.by_position[position_index(Position::ADC)].size(), 1u);
  ASSERT_NEAR(t1.avg_ownership, 30.0, 1e-9);
  ASSERT_NEAR(t1.total_salary, 34300.0 + 6 * 400.0, 1e-9);
  ASSERT_NEAR(pool.field_avg_ownership(), 18.0, 1e-9);
}

TEST(test_matchups_and_games) {
  const PlayerPool pool = fixture::make_pool(fixture::league_records());
  ASSERT_TRUE(pool.has_matchups());
  ASSERT_EQ(pool.opponent_of("T1"), "GEN");
  ASSERT_EQ(pool.opponent_of("HLE"), "KT");
  ASSERT_EQ(pool.opponent_of("NS"), "DK");
  ASSERT_EQ(pool.game_of("T1"), "GEN vs T1");
  ASSERT_EQ(pool.game_of("GEN"), "GEN vs T1");

  const PlayerPool blind = fixture::make_pool(fixture::league_records(false));
  ASSERT_FALSE(blind.has_matchups());
  ASSERT_EQ(blind.opponent_of("T1"), "");
  ASSERT_EQ(blind.game_of("T1"), "T1");
}

TEST(test_record_normalization) {
  std::vector<PlayerRecord> records = fixture::league_records();
  records[0].team = " t1 ";
  records[0].ownership = RawNumber{150.0};
  records[1].ownership = RawNumber{std::string("-5")};
  records[2].salary = RawNumber{std::string("$7,250")};
  records[3].projected_points = RawNumber{std::string("bad")};
  const PlayerPool pool = fixture::make_pool(records);

  ASSERT_EQ(pool[0].team, "T1");
  ASSERT_NEAR(pool[0].ownership, 100.0, 1e-9);
  ASSERT_NEAR(pool[1].ownership, 0.0, 1e-9);
  ASSERT_EQ(pool[2].salary, 7250);
  ASSERT_NEAR(pool[3].projected_points, 0.0, 1e-9);
  ASSERT_NEAR(pool[3].std_dev, 3.0, 1e-9);
}

TEST(test_pool_validation_errors) {
  ASSERT_THROWS(fixture::make_pool({}), InvalidInputError);

  std::vector<PlayerRecord> bad_position = fixture::league_records();
  bad_position[0].position = "FLEX";
  ASSERT_THROWS(fixture::make_pool(bad_position), InvalidInputError);

  std::vector<PlayerRecord> duplicate = fixture::league_records();
  duplicate[1].id = duplicate[0].id;
  ASSERT_THROWS(fixture::make_pool(duplicate), InvalidInputError);

  std::vector<PlayerRecord> no_support;
  for (const PlayerRecord &r : fixture::league_records()) {
    if (r.position != "SUP")
      no_support.push_back(r);
  }
  ASSERT_THROWS(fixture::make_pool(no_support), InvalidInputError);

  std::vector<PlayerRecord> no_team_slot;
  for (const PlayerRecord &r : fixture::league_records()) {
    if (r.position != "TEAM")
      no_team_slot.push_back(r);
  }
  const PlayerPool pool = fixture::make_pool(no_team_slot);
  ASSERT_EQ(pool.required_positions().size(), 5u);
}

// ============================================
// Exposure resolution
// ============================================

TEST(test_resolve_exposure_errors) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{"KT", 5, std::nullopt, 20.0,
                                        std::nullopt});
  ASSERT_THROWS(resolve_exposure(s), InvalidInputError);

  ExposureSettings range;
  range.players.push_back(PlayerExposureSetting{"T1_MID", std::nullopt, 120.0,
                                                std::nullopt});
  ASSERT_THROWS(resolve_exposure(range), InvalidInputError);

  ExposureSettings inverted;
  inverted.teams.push_back(
      TeamExposureSetting{"T1", std::nullopt, 60.0, 40.0, std::nullopt});
  ASSERT_THROWS(resolve_exposure(inverted), InvalidInputError);

  ExposureSettings unknown;
  unknown.positions["FLEX"] = PositionExposureSetting{};
  ASSERT_THROWS(resolve_exposure(unknown), InvalidInputError);
}

TEST(test_resolve_exposure_fractions) {
  ExposureSettings s;
  s.teams.push_back(TeamExposureSetting{" kt", 4, 10.0, 40.0, 27.0});
  s.teams.push_back(
      TeamExposureSetting{"T1", std::nullopt, std::nullopt, 50.0, std::nullopt});
  const ExposureConstraints c = resolve_exposure(s);

  const ExposureBounds &kt4 = c.stack("KT", 4);
  ASSERT_NEAR(kt4.min, 0.10, 1e-9);
  ASSERT_NEAR(kt4.max, 0.40, 1e-9);
  ASSERT_TRUE(kt4.target.has_value());
  ASSERT_NEAR(*kt4.target, 0.27, 1e-9);
  ASSERT_TRUE(c.team("T1").has_max());
  ASSERT_FALSE(c.team("GEN").has_max());
  ASSERT_FALSE(c.stack("KT", 3).has_min());
}

TEST(test_exposure_precedence) {
  ExposureSettings s;
  s.global.global_max_exposure = 60.0;
  s.positions["SUP"] = PositionExposureSetting{std::nullopt, 30.0, std::nullopt};
  s.players.push_back(PlayerExposureSetting{"T1_SUP", 5.0, 10.0, std::nullopt});
  const ExposureConstraints cons = resolve_exposure(s);
  const PlayerPool pool = fixture::make_pool(fixture::league_records(), cons);

  ASSERT_NEAR(pool[pool.index_of("T1_MID")].max_exposure, 0.6, 1e-9);
  ASSERT_NEAR(pool[pool.index_of("GEN_SUP")].max_exposure, 0.3, 1e-9);
  ASSERT_NEAR(pool[pool.index_of("T1_SUP")].max_exposure, 0.1, 1e-9);
  ASSERT_NEAR(pool[pool.index_of("T1_SUP")].min_exposure, 0.05, 1e-9);

  ExposureSettings off = s;
  off.global.apply_to_new_lineups = false;
  off.positions.clear();
  const PlayerPool open =
      fixture::make_pool(fixture::league_records(), resolve_exposure(off));
  ASSERT_NEAR(open[open.index_of("T1_MID")].max_exposure, 1.0, 1e-9);
  ASSERT_NEAR(open[open.index_of("T1_SUP")].max_exposure, 0.1, 1e-9);
}

TEST(test_target_derivation) {
  ExposureSettings s;
  s.players.push_back(PlayerExposureSetting{"KT_MID", 10.0, 50.0, 80.0});
  const PlayerPool pool =
      fixture::make_pool(fixture::league_records(), resolve_exposure(s));

  // Explicit target clamped into [min, max].
  ASSERT_NEAR(pool[pool.index_of("KT_MID")].target_exposure, 0.5, 1e-9);

  for (std::size_t i = 0; i < pool.size(); ++i) {
    const Player &p = pool[i];
    ASSERT_TRUE(p.target_exposure >= p.min_exposure - 1e-12);
    ASSERT_TRUE(p.target_exposure <= p.max_exposure + 1e-12);
  }
  // Lowest projection at its position derives the minimum.
  ASSERT_NEAR(pool[pool.index_of("DK_ADC")].target_exposure, 0.0, 1e-9);
  ASSERT_NEAR(pool.projection_percentile(pool.index_of("T1_ADC")), 1.0, 1e-9);

  // T1 ADC: projection 29.9 at 30% ownership.
  const double leverage = std::min(1.0, (26.0 * 1.15 / 30.0) / 1.5);
  ASSERT_NEAR(pool[pool.index_of("T1_ADC")].target_exposure, leverage, 1e-9);

  ExposureSettings prio;
  prio.global.prioritize_projections = true;
  const PlayerPool ranked =
      fixture::make_pool(fixture::league_records(), resolve_exposure(prio));
  ASSERT_NEAR(ranked[ranked.index_of("T1_ADC")].target_exposure, 1.0, 1e-9);
}

int main() {
  global_log_level() = LogLevel::Error;

  RUN_TEST(test_safe_parse_double);
  RUN_TEST(test_derive_std_dev);
  RUN_TEST(test_normalize_opponent);
  RUN_TEST(test_position_aliases);

  RUN_TEST(test_build_pool_tables);
  RUN_TEST(test_matchups_and_games);
  RUN_TEST(test_record_normalization);
  RUN_TEST(test_pool_validation_errors);

  RUN_TEST(test_resolve_exposure_errors);
  RUN_TEST(test_resolve_exposure_fractions);
  RUN_TEST(test_exposure_precedence);
  RUN_TEST(test_target_derivation);

  return report_results();
}
