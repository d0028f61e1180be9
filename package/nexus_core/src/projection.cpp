#include "nexus_core/projection.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace nexus_core {

void PerformanceGrid::sample(const PlayerTable &players, int iterations,
                             double randomness, std::uint64_t seed,
                             int batch_size, const Checkpoint &checkpoint) {
  if (iterations <= 0 || batch_size <= 0) {
    throw std::invalid_argument(
        "PerformanceGrid.sample: iterations and batch_size must be positive");
  }
  const std::size_t n = players.size();
  Eigen::MatrixXd out(static_cast<Eigen::Index>(n), iterations);

  // One stream per player, seeded by pool index, carried across batches so
  // the batch size never changes the drawn values.
  std::vector<std::mt19937_64> streams;
  std::vector<PointsDistribution> dists;
  streams.reserve(n);
  dists.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Player &p = players[i];
    streams.emplace_back(mix_seed(seed, static_cast<std::uint64_t>(i)));
    dists.emplace_back(p.projected_points, p.std_dev, randomness);
  }

  for (int start = 0; start < iterations; start += batch_size) {
    const int end = std::min(iterations, start + batch_size);
    for (std::size_t i = 0; i < n; ++i) {
      for (int k = start; k < end; ++k) {
        out(static_cast<Eigen::Index>(i), k) = dists[i].draw(streams[i]);
      }
    }
    if (checkpoint)
      checkpoint(end, iterations);
  }
  grid_ = std::move(out);
}

} // namespace nexus_core
