#pragma once

#include <vector>

#include <Eigen/Dense>

#include "nexus_core/config.hpp"
#include "nexus_core/correlation.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/pool.hpp"
#include "nexus_core/projection.hpp"

namespace nexus_core {

// Points needed to finish first / top-10 / in the money, taken from the
// pooled totals of every lineup in a run.
struct FieldThresholds {
  double first_place{0.0};
  double top10{0.0};
  double cash{0.0};
};

// 100 * first + 10 * top10 + 2 * cash, all fractions.
inline double compute_roi(double first_place, double top10, double cash) {
  return 100.0 * first_place + 10.0 * top10 + 2.0 * cash;
}

// sorted[floor(q * n)], clamped to the last element. Requires sorted input.
double sorted_quantile(const std::vector<double> &sorted, double q);

class MonteCarloScorer {
public:
  MonteCarloScorer(const PlayerPool &pool, const CorrelationMatrix &corr,
                   const PerformanceGrid &grid, const OptimizerConfig &cfg)
      : pool_(pool), corr_(corr), grid_(grid), cfg_(cfg) {}

  // One total per iteration: members pulled toward (or pushed from) each
  // pair's mean by correlation * shift, then captain * multiplier + rest.
  Eigen::VectorXd simulate_totals(const Lineup &l) const;

  LineupStats summarize(const Eigen::VectorXd &totals,
                        double projected) const;

  LineupStats score(const Lineup &l) const;

  // Recomputes the rates and ROI of s against field thresholds.
  static void apply_thresholds(LineupStats &s, const Eigen::VectorXd &totals,
                               const FieldThresholds &t);

private:
  const PlayerPool &pool_;
  const CorrelationMatrix &corr_;
  const PerformanceGrid &grid_;
  const OptimizerConfig &cfg_;
};

FieldThresholds calibrated_thresholds(const std::vector<Eigen::VectorXd> &totals,
                                      int field_size);

} // namespace nexus_core
