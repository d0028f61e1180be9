#include "nexus_core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace nexus_core {

namespace {

double rate(const Eigen::VectorXd &totals, double line, bool strict) {
  if (totals.size() == 0)
    return 0.0;
  Eigen::Index hits = 0;
  for (Eigen::Index i = 0; i < totals.size(); ++i) {
    if (strict ? totals[i] > line : totals[i] >= line)
      ++hits;
  }
  return static_cast<double>(hits) / static_cast<double>(totals.size());
}

// Value with `rank` entries at or above it in descending order.
double top_rank_value(const std::vector<double> &desc, long rank) {
  const long idx = std::max(0L, std::min<long>(rank, desc.size()) - 1);
  return desc[static_cast<std::size_t>(idx)];
}

} // namespace

double sorted_quantile(const std::vector<double> &sorted, double q) {
  if (sorted.empty()) {
    throw std::invalid_argument("sorted_quantile: empty input");
  }
  auto idx = static_cast<std::size_t>(std::floor(q * sorted.size()));
  if (idx >= sorted.size())
    idx = sorted.size() - 1;
  return sorted[idx];
}

Eigen::VectorXd MonteCarloScorer::simulate_totals(const Lineup &l) const {
  const std::vector<std::size_t> idx = player_indices(l);
  const std::size_t k = idx.size();
  const int n = grid_.iterations();
  const double shift = cfg_.correlation_shift;

  Eigen::VectorXd totals(n);
  std::vector<double> v(k);
  for (int it = 0; it < n; ++it) {
    for (std::size_t j = 0; j < k; ++j)
      v[j] = grid_.at(idx[j], it);

    for (std::size_t a = 0; a < k; ++a) {
      for (std::size_t b = a + 1; b < k; ++b) {
        const double c = corr_(idx[a], idx[b]);
        if (c == 0.0)
          continue;
        const double avg = 0.5 * (v[a] + v[b]);
        v[a] += (avg - v[a]) * c * shift;
        v[b] += (avg - v[b]) * c * shift;
      }
    }

    // Slot 0 is the captain.
    double total = v[0] * cfg_.captain_multiplier;
    for (std::size_t j = 1; j < k; ++j)
      total += v[j];
    totals[it] = total;
  }
  return totals;
}

LineupStats MonteCarloScorer::summarize(const Eigen::VectorXd &totals,
                                        double projected) const {
  LineupStats s;
  s.projected_points = projected;
  if (totals.size() == 0)
    return s;

  std::vector<double> v(totals.data(), totals.data() + totals.size());
  std::sort(v.begin(), v.end());
  s.min = v.front();
  s.max = v.back();
  s.p10 = sorted_quantile(v, 0.10);
  s.p25 = sorted_quantile(v, 0.25);
  s.median = v[v.size() / 2];
  s.p75 = sorted_quantile(v, 0.75);
  s.p90 = sorted_quantile(v, 0.90);

  s.cash_rate = rate(totals, cfg_.cash_line, false);
  s.win_rate = rate(totals, cfg_.win_line, false);
  // Measured against this lineup's own distribution.
  s.first_place = rate(totals, sorted_quantile(v, 1.0 - cfg_.target_top), true);
  s.top10 = rate(totals, s.p90, false);
  s.roi = compute_roi(s.first_place, s.top10, s.cash_rate);
  return s;
}

LineupStats MonteCarloScorer::score(const Lineup &l) const {
  return summarize(simulate_totals(l),
                   projected_points(l, pool_, cfg_.captain_multiplier));
}

void MonteCarloScorer::apply_thresholds(LineupStats &s,
                                        const Eigen::VectorXd &totals,
                                        const FieldThresholds &t) {
  s.first_place = rate(totals, t.first_place, false);
  s.top10 = rate(totals, t.top10, false);
  s.cash_rate = rate(totals, t.cash, false);
  s.roi = compute_roi(s.first_place, s.top10, s.cash_rate);
}

FieldThresholds calibrated_thresholds(const std::vector<Eigen::VectorXd> &totals,
                                      int field_size) {
  std::vector<double> pooled;
  for (const auto &t : totals)
    pooled.insert(pooled.end(), t.data(), t.data() + t.size());
  if (pooled.empty()) {
    throw std::invalid_argument("calibrated_thresholds: no simulated totals");
  }
  std::sort(pooled.begin(), pooled.end(), std::greater<double>());

  // Field ranks scaled onto the pooled sample.
  const double f = static_cast<double>(std::max(1, field_size));
  const double scale = static_cast<double>(pooled.size()) / f;
  const auto rank = [&](double places) {
    return static_cast<long>(std::ceil(places * scale));
  };
  FieldThresholds out;
  out.first_place =
      top_rank_value(pooled, rank(std::max(1.0, std::ceil(0.001 * f))));
  out.top10 = top_rank_value(pooled, rank(std::max(10.0, std::ceil(0.01 * f))));
  out.cash = top_rank_value(pooled, rank(std::max(20.0, std::ceil(0.2 * f))));
  return out;
}

} // namespace nexus_core
