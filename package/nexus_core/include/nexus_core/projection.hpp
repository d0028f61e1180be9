#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <stdexcept>

#include <Eigen/Dense>

#include "nexus_core/player.hpp"

namespace nexus_core {

// splitmix64-style mixing to decorrelate seeds
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

// One player's fantasy-point outcome: normal(mean, std_dev), clamped at
// zero and scaled by a uniform factor in [1 - randomness, 1 + randomness].
struct PointsDistribution {
  double mean{0.0};
  double std_dev{3.0};
  double randomness{0.0};

  PointsDistribution() = default;
  PointsDistribution(double mean_, double std_dev_, double randomness_)
      : mean(mean_), std_dev(std_dev_), randomness(randomness_) {
    if (!(std_dev >= 0.0) || !(randomness >= 0.0 && randomness < 1.0)) {
      throw std::invalid_argument(
          "PointsDistribution: require std_dev >= 0 and 0 <= randomness < 1");
    }
  }

  double draw(std::mt19937_64 &rng) const {
    std::normal_distribution<double> norm(0.0, 1.0);
    std::uniform_real_distribution<double> unif(-1.0, 1.0);
    const double base = mean + norm(rng) * std_dev;
    const double factor = 1.0 + unif(rng) * randomness;
    return base * factor > 0.0 ? base * factor : 0.0;
  }
};

// Simulated points, one row per pool player and one column per iteration.
// Column i is one coherent world across every player.
class PerformanceGrid {
public:
  // Called between sampling batches with (iterations done, total); may throw
  // to abort.
  using Checkpoint = std::function<void(int, int)>;

  PerformanceGrid() = default;

  void sample(const PlayerTable &players, int iterations, double randomness,
              std::uint64_t seed, int batch_size,
              const Checkpoint &checkpoint = {});

  double at(std::size_t player, int iteration) const {
    return grid_(static_cast<Eigen::Index>(player), iteration);
  }

  int iterations() const { return static_cast<int>(grid_.cols()); }
  std::size_t players() const { return static_cast<std::size_t>(grid_.rows()); }
  const Eigen::MatrixXd &matrix() const { return grid_; }

private:
  Eigen::MatrixXd grid_;
};

} // namespace nexus_core
