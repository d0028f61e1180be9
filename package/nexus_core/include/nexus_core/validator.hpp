#pragma once

#include <random>
#include <set>
#include <string>
#include <vector>

#include "nexus_core/config.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/pool.hpp"

namespace nexus_core {

enum class Violation {
  UnknownPlayer,
  SalaryCap,
  DuplicatePlayer,
  PositionMismatch,
  CaptainIneligible,
  TeamLimit,
  GameDiversity,
  DuplicateLineup
};

const char *to_string(Violation v);

struct ValidationResult {
  std::vector<Violation> violations;

  bool ok() const { return violations.empty(); }
  bool has(Violation v) const;
  std::string describe() const;
};

// Hard roster rules. The game-diversity rule is skipped when the pool has
// no opponent data.
class LineupValidator {
public:
  LineupValidator(const PlayerPool &pool, const OptimizerConfig &cfg)
      : pool_(pool), cfg_(cfg) {}

  ValidationResult check_structure(const Lineup &l) const;

  // Structure plus the duplicate-lineup rule against existing signatures.
  ValidationResult validate(const Lineup &l,
                            const SignatureSet &existing) const;

  // Replaces repeated players with unused players of the same slot role.
  // Returns false when some repeat has no alternative.
  bool fix_duplicates(Lineup &l, std::mt19937_64 &rng) const;

  bool checks_games() const { return pool_.has_matchups(); }
  int distinct_games(const Lineup &l) const;

private:
  const PlayerPool &pool_;
  const OptimizerConfig &cfg_;
};

} // namespace nexus_core
