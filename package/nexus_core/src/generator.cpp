#include "nexus_core/generator.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"

namespace nexus_core {

int diversity_floor(int min_player_difference, std::size_t lineup_size) {
  return std::max(min_player_difference,
                  static_cast<int>(std::floor(0.3 * lineup_size)));
}

GenerationReport PortfolioGenerator::generate(int count,
                                              const std::vector<Lineup> &seeds,
                                              ExposureTracker &tracker,
                                              std::mt19937_64 &rng,
                                              const AcceptHook &on_accept) const {
  const PlayerPool &pool = builder_.pool();
  const ExposureConstraints &cons = builder_.constraints();
  const int planned = static_cast<int>(seeds.size()) + count;
  const int max_attempts = count * cfg_.attempt_factor;
  const int failure_limit =
      std::max(100, cfg_.max_consecutive_failure_factor * count);
  const int min_difference =
      diversity_floor(cfg_.min_player_difference,
                      pool.required_positions().size() + 1);

  GenerationReport report;
  report.lineups.reserve(static_cast<std::size_t>(count));

  SignatureSet taken;
  std::set<std::string> ids;
  for (const Lineup &s : seeds) {
    taken.insert(signature(s));
    ids.insert(s.id);
  }

  BuildOptions opts;
  opts.randomness = cfg_.randomness;
  opts.leverage_multiplier = cfg_.leverage_multiplier;

  const auto too_similar = [&](const Lineup &l) {
    const int size = static_cast<int>(l.slots.size()) + 1;
    const auto close = [&](const Lineup &o) {
      return size - shared_players(l, o) < min_difference;
    };
    return std::any_of(seeds.begin(), seeds.end(), close) ||
           std::any_of(report.lineups.begin(), report.lineups.end(), close);
  };

  int consecutive = 0;
  int next_number = static_cast<int>(seeds.size());
  while (static_cast<int>(report.lineups.size()) < count &&
         report.attempts < max_attempts && consecutive < failure_limit) {
    control_.checkpoint("lineup generation");
    ++report.attempts;

    Lineup candidate;
    try {
      candidate = builder_.build(tracker, rng, opts, planned);
    } catch (const BuildFailure &e) {
      log_.debug("build attempt {} failed: {}", report.attempts, e.what());
      ++consecutive;
      ++report.rejected;
      continue;
    }

    ValidationResult check = validator_.validate(candidate, taken);
    if (check.has(Violation::DuplicatePlayer) &&
        validator_.fix_duplicates(candidate, rng)) {
      check = validator_.validate(candidate, taken);
      if (check.has(Violation::DuplicatePlayer)) {
        throw InternalInvariantError("duplicate player survived fix-up");
      }
    }
    if (!check.ok()) {
      log_.debug("rejected candidate: {}", check.describe());
      ++consecutive;
      ++report.rejected;
      continue;
    }
    if (too_similar(candidate) ||
        !tracker.within_budgets(candidate, pool, cons, planned)) {
      ++consecutive;
      ++report.rejected;
      continue;
    }

    do {
      ++next_number;
      candidate.id = fmt::format("lineup_{}", next_number);
    } while (ids.count(candidate.id) != 0);
    candidate.name = fmt::format("Lineup {}", next_number);
    ids.insert(candidate.id);

    tracker.record(candidate, pool);
    taken.insert(signature(candidate));
    report.lineups.push_back(std::move(candidate));
    consecutive = 0;
    opts.randomness = std::min(0.9, opts.randomness + cfg_.randomness_step);

    if (cfg_.verify_ledger) {
      std::vector<const Lineup *> all;
      for (const Lineup &s : seeds)
        all.push_back(&s);
      for (const Lineup &l : report.lineups)
        all.push_back(&l);
      if (!tracker.matches_recount(all, pool)) {
        throw InternalInvariantError(
            "exposure ledger does not match a recount of accepted lineups");
      }
    }
    log_.debug("accepted {} ({}/{})", report.lineups.back().id,
               report.lineups.size(), count);
    if (on_accept)
      on_accept(static_cast<int>(report.lineups.size()), count);
  }

  const int made = static_cast<int>(report.lineups.size());
  if (made < count) {
    const std::string reason =
        consecutive >= failure_limit
            ? fmt::format("{} consecutive failed attempts", consecutive)
            : fmt::format("{} attempts", report.attempts);
    report.warnings.push_back(fmt::format(
        "Generated {} of {} requested lineups; stopped after {}", made, count,
        reason));
    log_.warn("{}", report.warnings.back());
  }
  return report;
}

} // namespace nexus_core
