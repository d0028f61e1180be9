#include "nexus_core/correlation.hpp"

#include <algorithm>

namespace nexus_core {

double pair_correlation(const Player &a, const Player &b,
                        const CorrelationWeights &w) {
  if (a.team == b.team) {
    double c = w.same_team;
    if (a.position == b.position)
      c += w.same_team_same_position;
    return c;
  }
  // Applied to every cross-team pair since matchups are not always known.
  return w.opposing_team;
}

CorrelationMatrix CorrelationMatrix::build(const PlayerTable &players,
                                           const CorrelationWeights &w) {
  const Eigen::Index n = static_cast<Eigen::Index>(players.size());
  CorrelationMatrix out;
  out.m_ = Eigen::MatrixXd::Zero(n, n);
  for (Eigen::Index i = 0; i < n; ++i) {
    for (Eigen::Index j = i + 1; j < n; ++j) {
      const double c = std::clamp(
          pair_correlation(players[static_cast<std::size_t>(i)],
                           players[static_cast<std::size_t>(j)], w),
          -1.0, 1.0);
      out.m_(i, j) = c;
      out.m_(j, i) = c;
    }
  }
  return out;
}

} // namespace nexus_core
