#include "nexus_core/genetic.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include <fmt/format.h>

#include "nexus_core/errors.hpp"

namespace nexus_core {

namespace {

bool by_fitness(const Individual &a, const Individual &b) {
  return a.fitness > b.fitness;
}

double population_diversity(const std::vector<Individual> &population) {
  std::vector<const Lineup *> ptrs;
  ptrs.reserve(population.size());
  for (const Individual &ind : population)
    ptrs.push_back(&ind.lineup);
  return mean_pairwise_distance(ptrs);
}

bool contains(const Lineup &l, std::size_t idx) {
  if (l.captain.player == idx)
    return true;
  return std::any_of(l.slots.begin(), l.slots.end(),
                     [&](const LineupSlot &s) { return s.player == idx; });
}

} // namespace

const std::array<GeneticStrategy, 6> &seeding_strategies() {
  static const std::array<GeneticStrategy, 6> strategies = {{
      {"projection_focused", 0.3, 0.1, std::nullopt},
      {"leverage_focused", 1.2, 0.2, std::nullopt},
      {"contrarian", 1.5, 0.4, std::nullopt},
      {"balanced", 0.7, 0.3, std::nullopt},
      {"stack_heavy", 0.8, 0.2, 4},
      {"stack_light", 0.6, 0.3, 2},
  }};
  return strategies;
}

double genetic_fitness(const Lineup &l, const PlayerPool &pool,
                       const ExposureTracker &seeds,
                       const OptimizerConfig &cfg) {
  double fitness = 10.0 * projected_points(l, pool, cfg.captain_multiplier);
  fitness += std::max(0.0, 30.0 - average_ownership(l, pool)) * 2.0;

  for (const auto &kv : team_counts(l, pool)) {
    if (kv.second >= 3)
      fitness += std::pow(kv.second - 2, 1.5) * 15.0;
    if (kv.second > cfg.max_players_per_team)
      fitness -= 100.0 * kv.second;
  }

  fitness += position_impact(pool[l.captain.player].position) * 10.0;

  // Reward players still short of an explicit minimum.
  for (std::size_t idx : player_indices(l)) {
    const double mn = pool[idx].min_exposure;
    const double cur = seeds.player_fraction(idx);
    if (mn > 0.0 && cur < mn)
      fitness += (mn - cur) * 50.0;
  }
  return fitness;
}

void EvolutionDriver::evaluate(std::vector<Individual> &population,
                               const ExposureTracker &seeds) const {
  const std::size_t batch = static_cast<std::size_t>(gcfg_.fitness_batch_size);
  for (std::size_t i = 0; i < population.size(); ++i) {
    if (i % batch == 0)
      control_.checkpoint("fitness evaluation");
    population[i].fitness = genetic_fitness(population[i].lineup, pool_,
                                            seeds, cfg_);
  }
  std::stable_sort(population.begin(), population.end(), by_fitness);
}

std::optional<Lineup>
EvolutionDriver::random_individual(const ExposureTracker &tracker,
                                   const BuildOptions &opts,
                                   const SignatureSet &taken,
                                   int planned_total,
                                   std::mt19937_64 &rng) const {
  Lineup l;
  try {
    l = builder_.build(tracker, rng, opts, planned_total);
  } catch (const BuildFailure &e) {
    log_.debug("individual build failed: {}", e.what());
    return std::nullopt;
  }
  if (!validator_.validate(l, taken).ok())
    return std::nullopt;
  return l;
}

std::vector<Individual>
EvolutionDriver::initialize_population(const ExposureTracker &seeds,
                                       const SignatureSet &seed_sigs,
                                       std::mt19937_64 &rng) const {
  const int target = gcfg_.population_size;
  const int planned = seeds.lineup_count() + target;
  // Population members are recorded here so exposure guidance spreads them.
  ExposureTracker tracker = seeds;
  SignatureSet taken = seed_sigs;
  const auto &strategies = seeding_strategies();

  std::vector<Individual> population;
  population.reserve(static_cast<std::size_t>(target));
  int exhausted = 0;
  for (int i = 0; i < target; ++i) {
    const GeneticStrategy &st = strategies[static_cast<std::size_t>(i) % strategies.size()];
    BuildOptions opts;
    opts.randomness = st.randomness;
    opts.leverage_multiplier = st.leverage_multiplier;
    opts.preferred_stack_size = st.preferred_stack_size;

    bool made = false;
    for (int attempt = 0; attempt < gcfg_.init_retries && !made; ++attempt) {
      control_.checkpoint("population initialization");
      std::optional<Lineup> l =
          random_individual(tracker, opts, taken, planned, rng);
      if (!l)
        continue;
      tracker.record(*l, pool_);
      taken.insert(signature(*l));
      population.push_back(Individual{std::move(*l), 0.0, 0, st.name});
      made = true;
    }
    if (!made)
      ++exhausted;
  }
  if (exhausted > 0) {
    log_.debug("{} individuals skipped after {} retries each", exhausted,
               gcfg_.init_retries);
  }
  return population;
}

const Individual &
EvolutionDriver::tournament(const std::vector<Individual> &population,
                            std::mt19937_64 &rng) const {
  const std::size_t t = std::min<std::size_t>(
      static_cast<std::size_t>(gcfg_.tournament_size), population.size());
  std::uniform_int_distribution<std::size_t> pick(0, population.size() - 1);
  const Individual *best = &population[pick(rng)];
  for (std::size_t i = 1; i < t; ++i) {
    const Individual &c = population[pick(rng)];
    if (c.fitness > best->fitness)
      best = &c;
  }
  return *best;
}

std::optional<Lineup> EvolutionDriver::crossover(const Lineup &a,
                                                 const Lineup &b,
                                                 std::mt19937_64 &rng) const {
  if (a.slots.size() != b.slots.size())
    return std::nullopt;
  std::bernoulli_distribution coin(0.5);
  Lineup child;
  child.captain = coin(rng) ? a.captain : b.captain;
  child.slots.reserve(a.slots.size());
  for (std::size_t s = 0; s < a.slots.size(); ++s)
    child.slots.push_back(coin(rng) ? a.slots[s] : b.slots[s]);

  const Signature sig = signature(child);
  if (std::adjacent_find(sig.begin(), sig.end()) != sig.end() &&
      !validator_.fix_duplicates(child, rng))
    return std::nullopt;
  return child;
}

void EvolutionDriver::swap_player(Lineup &l, std::mt19937_64 &rng) const {
  if (l.slots.empty())
    return;
  std::uniform_int_distribution<std::size_t> slot_pick(0, l.slots.size() - 1);
  LineupSlot &slot = l.slots[slot_pick(rng)];
  std::vector<std::size_t> alternatives;
  for (std::size_t idx : pool_.by_position(slot.role)) {
    if (!contains(l, idx))
      alternatives.push_back(idx);
  }
  if (alternatives.empty())
    return;
  std::uniform_int_distribution<std::size_t> pick(0, alternatives.size() - 1);
  slot.player = alternatives[pick(rng)];
}

void EvolutionDriver::swap_captain(Lineup &l, std::mt19937_64 &rng) const {
  std::vector<std::size_t> eligible;
  for (std::size_t s = 0; s < l.slots.size(); ++s) {
    if (captain_eligible(pool_[l.slots[s].player].position))
      eligible.push_back(s);
  }
  if (eligible.empty())
    return;
  std::uniform_int_distribution<std::size_t> pick(0, eligible.size() - 1);
  LineupSlot &slot = l.slots[eligible[pick(rng)]];
  const std::size_t old_captain = l.captain.player;

  if (pool_[old_captain].position == slot.role) {
    l.captain.player = slot.player;
    slot.player = old_captain;
    return;
  }
  // The old captain cannot take this role; the slot gets a fresh player.
  std::vector<std::size_t> alternatives;
  for (std::size_t idx : pool_.by_position(slot.role)) {
    if (!contains(l, idx))
      alternatives.push_back(idx);
  }
  if (alternatives.empty())
    return;
  std::uniform_int_distribution<std::size_t> alt(0, alternatives.size() - 1);
  l.captain.player = slot.player;
  slot.player = alternatives[alt(rng)];
}

void EvolutionDriver::swap_team_stack(Lineup &l, std::mt19937_64 &rng) const {
  const TeamCounts counts = team_counts(l, pool_);
  const auto top = std::max_element(
      counts.begin(), counts.end(),
      [](const auto &a, const auto &b) { return a.second < b.second; });
  if (top == counts.end())
    return;
  const std::string &stack_team = top->first;

  std::vector<std::size_t> outsiders;
  for (std::size_t s = 0; s < l.slots.size(); ++s) {
    if (pool_[l.slots[s].player].team != stack_team)
      outsiders.push_back(s);
  }
  if (outsiders.empty())
    return;
  std::uniform_int_distribution<std::size_t> pick(0, outsiders.size() - 1);
  LineupSlot &slot = l.slots[outsiders[pick(rng)]];

  std::vector<std::size_t> replacements;
  for (std::size_t idx :
       pool_.team(stack_team).by_position[position_index(slot.role)]) {
    if (!contains(l, idx))
      replacements.push_back(idx);
  }
  if (replacements.empty())
    return;
  std::uniform_int_distribution<std::size_t> alt(0, replacements.size() - 1);
  slot.player = replacements[alt(rng)];
}

void EvolutionDriver::mutate(Lineup &l, std::mt19937_64 &rng) const {
  std::uniform_int_distribution<int> how_many(1, 3);
  std::uniform_int_distribution<int> kind(0, 2);
  const int n = how_many(rng);
  for (int i = 0; i < n; ++i) {
    switch (kind(rng)) {
    case 0: swap_player(l, rng); break;
    case 1: swap_captain(l, rng); break;
    default: swap_team_stack(l, rng); break;
    }
  }
}

bool EvolutionDriver::diverse_enough(const Lineup &l,
                                     const std::vector<Individual> &population) const {
  for (const Individual &ind : population) {
    if (jaccard_distance(l, ind.lineup) < gcfg_.diversity_threshold)
      return false;
  }
  return true;
}

std::vector<Individual>
EvolutionDriver::next_generation(const std::vector<Individual> &sorted,
                                 const ExposureTracker &seeds,
                                 const SignatureSet &seed_sigs,
                                 std::mt19937_64 &rng) const {
  const int size = gcfg_.population_size;
  const int planned = seeds.lineup_count() + size;
  const std::size_t elite = std::min(
      sorted.size(),
      static_cast<std::size_t>(std::max(1, static_cast<int>(size * gcfg_.elite_fraction))));

  std::vector<Individual> next;
  next.reserve(static_cast<std::size_t>(size));
  SignatureSet taken = seed_sigs;
  for (std::size_t i = 0; i < elite; ++i) {
    next.push_back(sorted[i]);
    ++next.back().age;
    taken.insert(signature(sorted[i].lineup));
  }

  std::uniform_real_distribution<double> unif(0.0, 1.0);
  BuildOptions fresh;
  fresh.randomness = std::min(0.9, cfg_.randomness + 0.3);
  fresh.leverage_multiplier = cfg_.leverage_multiplier;

  const int max_attempts = size * 5;
  for (int attempt = 0;
       static_cast<int>(next.size()) < size && attempt < max_attempts;
       ++attempt) {
    control_.checkpoint("evolution");

    std::optional<Lineup> child;
    std::string origin = "random";
    if (!sorted.empty() && unif(rng) < gcfg_.crossover_rate) {
      const Individual &p1 = tournament(sorted, rng);
      const Individual &p2 = tournament(sorted, rng);
      child = crossover(p1.lineup, p2.lineup, rng);
      if (child) {
        origin = "crossover";
        if (unif(rng) < gcfg_.mutation_rate) {
          mutate(*child, rng);
          origin = "crossover_mutated";
        }
        if (!validator_.validate(*child, taken).ok())
          child.reset();
      }
    }
    if (!child) {
      child = random_individual(seeds, fresh, taken, planned, rng);
      origin = "random";
    }
    if (!child)
      continue;

    if (diverse_enough(*child, next) ||
        next.size() < size * gcfg_.diversity_fill_fraction) {
      taken.insert(signature(*child));
      next.push_back(Individual{std::move(*child), 0.0, 0, origin});
    }
  }
  return next;
}

std::vector<Individual>
EvolutionDriver::restart(const std::vector<Individual> &sorted,
                         const ExposureTracker &seeds,
                         const SignatureSet &seed_sigs,
                         std::mt19937_64 &rng) const {
  const int size = gcfg_.population_size;
  const int planned = seeds.lineup_count() + size;
  const std::size_t keep = std::min(
      sorted.size(), static_cast<std::size_t>(std::max(
                         1, static_cast<int>(std::ceil(size * gcfg_.restart_keep_fraction)))));

  std::vector<Individual> out(sorted.begin(), sorted.begin() + keep);
  SignatureSet taken = seed_sigs;
  for (const Individual &ind : out)
    taken.insert(signature(ind.lineup));

  const auto &strategies = seeding_strategies();
  const int max_attempts = size * 5;
  for (int attempt = 0;
       static_cast<int>(out.size()) < size && attempt < max_attempts;
       ++attempt) {
    control_.checkpoint("population restart");
    const GeneticStrategy &st =
        strategies[static_cast<std::size_t>(attempt) % strategies.size()];
    BuildOptions opts;
    opts.randomness = std::min(0.9, st.randomness + 0.3);
    opts.leverage_multiplier = st.leverage_multiplier;
    opts.preferred_stack_size = st.preferred_stack_size;
    std::optional<Lineup> l = random_individual(seeds, opts, taken, planned, rng);
    if (!l)
      continue;
    taken.insert(signature(*l));
    out.push_back(Individual{std::move(*l), 0.0, 0, "restart"});
  }
  return out;
}

std::vector<Lineup>
EvolutionDriver::select_final(const std::vector<Individual> &sorted,
                              int count, const ExposureTracker &seeds,
                              int planned_total) const {
  std::vector<Lineup> chosen;
  if (sorted.empty() || count <= 0)
    return chosen;

  ExposureTracker tracker = seeds;
  std::vector<bool> used(sorted.size(), false);
  const auto take = [&](std::size_t i) {
    used[i] = true;
    tracker.record(sorted[i].lineup, pool_);
    chosen.push_back(sorted[i].lineup);
    chosen.back().genetic_fitness = sorted[i].fitness;
  };

  // True when l adds a (team, k) stack still short of its explicit minimum.
  const ExposureConstraints &cons = builder_.constraints();
  const auto fills_minimum = [&](const Lineup &l) {
    for (const auto &kv : team_counts(l, pool_)) {
      const ExposureBounds &sb = cons.stack(kv.first, kv.second);
      if (sb.has_min() &&
          tracker.stack_count(kv.first, kv.second) <
              std::ceil(sb.min * planned_total - 1e-9))
        return true;
    }
    return false;
  };

  // The fittest always makes the cut.
  take(0);
  while (static_cast<int>(chosen.size()) < count) {
    std::optional<std::size_t> pick;
    double pick_score = 0.0;
    bool pick_fills = false;
    for (std::size_t i = 1; i < sorted.size(); ++i) {
      if (used[i])
        continue;
      const Lineup &l = sorted[i].lineup;
      if (!tracker.within_budgets(l, pool_, builder_.constraints(),
                                  planned_total))
        continue;
      double nearest = 1.0;
      for (const Lineup &c : chosen)
        nearest = std::min(nearest, jaccard_distance(l, c));
      if (nearest <= 0.0)
        continue;
      const double score = 0.5 * sorted[i].fitness + 0.5 * 100.0 * nearest;
      const bool fills = fills_minimum(l);
      if (!pick || (fills && !pick_fills) ||
          (fills == pick_fills && score > pick_score)) {
        pick = i;
        pick_score = score;
        pick_fills = fills;
      }
    }
    if (!pick)
      break;
    take(*pick);
  }
  return chosen;
}

EvolutionOutcome EvolutionDriver::run(int count,
                                      const std::vector<Lineup> &seed_lineups,
                                      const ExposureTracker &seeds,
                                      std::mt19937_64 &rng, double from,
                                      double to) const {
  EvolutionOutcome out;
  SignatureSet seed_sigs;
  for (const Lineup &l : seed_lineups)
    seed_sigs.insert(signature(l));

  std::vector<Individual> population =
      initialize_population(seeds, seed_sigs, rng);
  const int target = gcfg_.population_size;
  if (population.empty()) {
    out.warnings.push_back(
        "Genetic population could not be created under the current constraints");
    log_.warn("{}", out.warnings.back());
    return out;
  }
  if (population.size() < 0.5 * target) {
    out.warnings.push_back(fmt::format(
        "Genetic population reached only {} of {} individuals",
        population.size(), target));
    log_.warn("{}", out.warnings.back());
  }
  control_.progress(from, stage::kPopulationCreated);
  control_.status(fmt::format("Created population of {} lineups",
                              population.size()));

  evaluate(population, seeds);
  out.initial_best = population.front().fitness;
  double best = out.initial_best;
  int stagnation = 0;

  for (int g = 1; g <= gcfg_.generations; ++g) {
    control_.checkpoint("evolution");
    std::vector<Individual> next =
        next_generation(population, seeds, seed_sigs, rng);
    evaluate(next, seeds);
    population = std::move(next);

    GenerationStats stats;
    stats.generation = g;
    stats.best = population.front().fitness;
    double sum = 0.0;
    for (const Individual &ind : population)
      sum += ind.fitness;
    stats.average = sum / population.size();
    stats.diversity = population_diversity(population);
    out.history.push_back(stats);
    out.generations_run = g;

    if (stats.best > best + 1e-9) {
      best = stats.best;
      stagnation = 0;
    } else if (++stagnation >= gcfg_.max_stagnation) {
      log_.debug("generation {}: no improvement for {} generations, restarting",
                 g, stagnation);
      population = restart(population, seeds, seed_sigs, rng);
      evaluate(population, seeds);
      best = std::max(best, population.front().fitness);
      stagnation = 0;
      ++out.restarts;
    }

    const double pct =
        from + (to - from) * static_cast<double>(g) / gcfg_.generations;
    control_.progress(pct, stage::kEvolving);
    control_.status(fmt::format("Generation {}/{}: best fitness {:.1f}", g,
                                gcfg_.generations, stats.best));
  }

  out.final_best = best;
  out.final_diversity = population_diversity(population);

  control_.checkpoint("final selection");
  control_.progress(to, stage::kFinalSelection);
  const int planned = seeds.lineup_count() + count;
  out.selected = select_final(population, count, seeds, planned);
  if (static_cast<int>(out.selected.size()) < count) {
    out.warnings.push_back(fmt::format(
        "Final selection produced {} of {} requested lineups",
        out.selected.size(), count));
    log_.warn("{}", out.warnings.back());
  }
  return out;
}

} // namespace nexus_core
