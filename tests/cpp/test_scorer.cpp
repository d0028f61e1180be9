/**
 * Monte Carlo scoring tests
 */

#include <stdexcept>
#include <vector>

#include "nexus_core/correlation.hpp"
#include "nexus_core/simulator.hpp"
#include "test_util.hpp"

using namespace nexus_core;

namespace {

Eigen::VectorXd ramp(int n, double start = 1.0) {
  Eigen::VectorXd v(n);
  for (int i = 0; i < n; ++i)
    v[i] = start + i;
  return v;
}

} // namespace

TEST(test_sorted_quantile) {
  const std::vector<double> v = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
  ASSERT_NEAR(sorted_quantile(v, 0.0), 1.0, 1e-12);
  ASSERT_NEAR(sorted_quantile(v, 0.1), 2.0, 1e-12);
  ASSERT_NEAR(sorted_quantile(v, 0.55), 6.0, 1e-12);
  ASSERT_NEAR(sorted_quantile(v, 1.0), 10.0, 1e-12);
  ASSERT_THROWS(sorted_quantile({}, 0.5), std::invalid_argument);
}

TEST(test_roi_formula) {
  ASSERT_NEAR(compute_roi(0.1, 0.2, 0.5), 13.0, 1e-12);
  ASSERT_NEAR(compute_roi(0.0, 0.0, 0.0), 0.0, 1e-12);
  ASSERT_TRUE(compute_roi(0.11, 0.2, 0.5) > compute_roi(0.1, 0.2, 0.5));
  ASSERT_TRUE(compute_roi(0.1, 0.21, 0.5) > compute_roi(0.1, 0.2, 0.5));
  ASSERT_TRUE(compute_roi(0.1, 0.2, 0.51) > compute_roi(0.1, 0.2, 0.5));
}

TEST(test_summarize_statistics) {
  const PlayerPool pool;
  const CorrelationMatrix corr;
  const PerformanceGrid grid;
  OptimizerConfig cfg;
  cfg.cash_line = 50.0;
  cfg.win_line = 90.0;
  const MonteCarloScorer scorer(pool, corr, grid, cfg);

  // 100 totals 1..100, shuffled order does not matter.
  Eigen::VectorXd totals = ramp(100);
  std::swap(totals[0], totals[99]);
  const LineupStats s = scorer.summarize(totals, 123.0);

  ASSERT_NEAR(s.projected_points, 123.0, 1e-12);
  ASSERT_NEAR(s.min, 1.0, 1e-12);
  ASSERT_NEAR(s.max, 100.0, 1e-12);
  ASSERT_NEAR(s.p10, 11.0, 1e-12);
  ASSERT_NEAR(s.p25, 26.0, 1e-12);
  ASSERT_NEAR(s.median, 51.0, 1e-12);
  ASSERT_NEAR(s.p75, 76.0, 1e-12);
  ASSERT_NEAR(s.p90, 91.0, 1e-12);
  ASSERT_NEAR(s.cash_rate, 0.51, 1e-12);
  ASSERT_NEAR(s.win_rate, 0.11, 1e-12);
  // Strictly above the 80th-percentile value of 81.
  ASSERT_NEAR(s.first_place, 0.19, 1e-12);
  ASSERT_NEAR(s.top10, 0.10, 1e-12);
  ASSERT_NEAR(s.roi, compute_roi(0.19, 0.10, 0.51), 1e-9);
}

TEST(test_summarize_empty) {
  const PlayerPool pool;
  const CorrelationMatrix corr;
  const PerformanceGrid grid;
  const OptimizerConfig cfg;
  const MonteCarloScorer scorer(pool, corr, grid, cfg);
  const LineupStats s = scorer.summarize(Eigen::VectorXd(), 50.0);
  ASSERT_NEAR(s.projected_points, 50.0, 1e-12);
  ASSERT_NEAR(s.roi, 0.0, 1e-12);
}

TEST(test_totals_without_correlation) {
  const PlayerPool pool = fixture::make_pool(fixture::league_records());
  OptimizerConfig cfg;
  cfg.correlation_shift = 0.0;
  const CorrelationMatrix corr =
      CorrelationMatrix::build(pool.table(), cfg.correlation);
  PerformanceGrid grid;
  grid.sample(pool.table(), 200, 0.3, 8, 100);
  const MonteCarloScorer scorer(pool, corr, grid, cfg);

  const Lineup l = fixture::make_lineup(
      pool, "T1_MID",
      {"T1_TOP", "T1_JNG", "GEN_MID", "T1_ADC", "GEN_SUP", "KT_TEAM"});
  const Eigen::VectorXd totals = scorer.simulate_totals(l);
  ASSERT_EQ(totals.size(), 200);
  for (int it = 0; it < 200; ++it) {
    double expected = grid.at(l.captain.player, it) * 1.5;
    for (const LineupSlot &s : l.slots)
      expected += grid.at(s.player, it);
    ASSERT_NEAR(totals[it], expected, 1e-9);
  }
}

TEST(test_pair_adjustment) {
  const PlayerPool pool = fixture::make_pool(fixture::league_records());
  const OptimizerConfig cfg;
  const CorrelationMatrix corr =
      CorrelationMatrix::build(pool.table(), cfg.correlation);
  PerformanceGrid grid;
  grid.sample(pool.table(), 50, 0.3, 8, 50);
  const MonteCarloScorer scorer(pool, corr, grid, cfg);

  // Captain and one teammate: each moves 0.65 * 0.2 of the way to the mean.
  Lineup l;
  l.captain = LineupSlot{pool.index_of("T1_MID"), Position::CPT};
  l.slots.push_back(LineupSlot{pool.index_of("T1_JNG"), Position::JNG});
  const Eigen::VectorXd totals = scorer.simulate_totals(l);
  const double k = 0.65 * 0.2;
  for (int it = 0; it < 50; ++it) {
    const double a = grid.at(l.captain.player, it);
    const double b = grid.at(l.slots[0].player, it);
    const double avg = 0.5 * (a + b);
    const double a2 = a + (avg - a) * k;
    const double b2 = b + (avg - b) * k;
    ASSERT_NEAR(totals[it], 1.5 * a2 + b2, 1e-9);
  }
}

TEST(test_score_fills_projection) {
  const PlayerPool pool = fixture::make_pool(fixture::league_records());
  const OptimizerConfig cfg;
  const CorrelationMatrix corr =
      CorrelationMatrix::build(pool.table(), cfg.correlation);
  PerformanceGrid grid;
  grid.sample(pool.table(), 1000, 0.3, 21, 250);
  const MonteCarloScorer scorer(pool, corr, grid, cfg);

  const Lineup l = fixture::make_lineup(
      pool, "T1_MID",
      {"T1_TOP", "T1_JNG", "GEN_MID", "T1_ADC", "GEN_SUP", "KT_TEAM"});
  const LineupStats s = scorer.score(l);
  ASSERT_NEAR(s.projected_points, projected_points(l, pool, 1.5), 1e-9);
  ASSERT_TRUE(s.min <= s.p10 && s.p10 <= s.p25 && s.p25 <= s.median);
  ASSERT_TRUE(s.median <= s.p75 && s.p75 <= s.p90 && s.p90 <= s.max);
  ASSERT_NEAR(s.median, s.projected_points, 0.15 * s.projected_points);
  ASSERT_TRUE(s.first_place > 0.0 && s.first_place <= 0.2 + 1e-12);
  ASSERT_TRUE(s.roi >= 0.0);
}

TEST(test_calibrated_thresholds) {
  // 2000 pooled totals 1..2000 over a field of 1000: two pooled entries per
  // field place.
  const std::vector<Eigen::VectorXd> totals = {ramp(1000), ramp(1000, 1001.0)};
  const FieldThresholds t = calibrated_thresholds(totals, 1000);
  ASSERT_NEAR(t.first_place, 1999.0, 1e-12);
  ASSERT_NEAR(t.top10, 1981.0, 1e-12);
  ASSERT_NEAR(t.cash, 1601.0, 1e-12);
  ASSERT_THROWS(calibrated_thresholds({}, 1000), std::invalid_argument);
}

TEST(test_apply_thresholds) {
  LineupStats s;
  const Eigen::VectorXd totals = ramp(100);
  MonteCarloScorer::apply_thresholds(s, totals, FieldThresholds{96.0, 81.0, 51.0});
  ASSERT_NEAR(s.first_place, 0.05, 1e-12);
  ASSERT_NEAR(s.top10, 0.20, 1e-12);
  ASSERT_NEAR(s.cash_rate, 0.50, 1e-12);
  ASSERT_NEAR(s.roi, compute_roi(0.05, 0.20, 0.50), 1e-9);
}

int main() {
  global_log_level() = LogLevel::Error;

  RUN_TEST(test_sorted_quantile);
  RUN_TEST(test_roi_formula);
  RUN_TEST(test_summarize_statistics);
  RUN_TEST(test_summarize_empty);
  RUN_TEST(test_totals_without_correlation);
  RUN_TEST(test_pair_adjustment);
  RUN_TEST(test_score_fills_projection);
  RUN_TEST(test_calibrated_thresholds);
  RUN_TEST(test_apply_thresholds);

  return report_results();
}
