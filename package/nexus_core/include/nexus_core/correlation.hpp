#pragma once

#include <cstddef>

#include <Eigen/Dense>

#include "nexus_core/config.hpp"
#include "nexus_core/player.hpp"

namespace nexus_core {

// Symmetric pairwise correlation over pool indices. Diagonal is zero.
class CorrelationMatrix {
public:
  CorrelationMatrix() = default;

  static CorrelationMatrix build(const PlayerTable &players,
                                 const CorrelationWeights &w);

  double operator()(std::size_t a, std::size_t b) const {
    return m_(static_cast<Eigen::Index>(a), static_cast<Eigen::Index>(b));
  }

  std::size_t size() const { return static_cast<std::size_t>(m_.rows()); }
  const Eigen::MatrixXd &matrix() const { return m_; }

private:
  Eigen::MatrixXd m_;
};

// Single pair value before clamping is applied by build().
double pair_correlation(const Player &a, const Player &b,
                        const CorrelationWeights &w);

} // namespace nexus_core
