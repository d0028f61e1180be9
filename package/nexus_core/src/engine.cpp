#include "nexus_core/engine.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include <fmt/format.h>

#include "nexus_core/builder.hpp"
#include "nexus_core/errors.hpp"
#include "nexus_core/generator.hpp"
#include "nexus_core/genetic.hpp"
#include "nexus_core/nexus_score.hpp"
#include "nexus_core/simulator.hpp"
#include "nexus_core/validator.hpp"

namespace nexus_core {

namespace {

double round_to(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(v * scale) / scale;
}

// Sampling occupies the first tenth of the progress bar.
constexpr double kSampledPct = 10.0;

} // namespace

Optimizer::Optimizer(OptimizerConfig cfg, GeneticConfig gcfg)
    : cfg_(cfg), gcfg_(gcfg), log_("optimizer", cfg.debug_mode) {
  validate(cfg_);
  validate(gcfg_);
}

void Optimizer::fail(const std::exception &e) {
  log_.error("{}", e.what());
  control_.progress(100.0, stage::kError);
  control_.status(fmt::format("Error: {}", e.what()));
}

void Optimizer::initialize(const std::vector<PlayerRecord> &players,
                           const ExposureSettings &settings,
                           const std::vector<SeedLineup> &seeds) {
  control_.reset();
  ready_ = false;
  control_.progress(0.0, stage::kInitializing);
  try {
    cons_ = resolve_exposure(settings);
    log_.debug("exposure: {} player, {} team, {} stack, {} position settings",
               cons_.players.size(), cons_.teams.size(), cons_.stacks.size(),
               cons_.positions.size());
    pool_ = build_player_pool(players, cons_, log_);
    corr_ = CorrelationMatrix::build(pool_.table(), cfg_.correlation);
    grid_ = PerformanceGrid();

    seeds_.clear();
    std::set<std::string> ids;
    for (std::size_t i = 0; i < seeds.size(); ++i) {
      Lineup l = seed_to_lineup(seeds[i]);
      if (l.id.empty())
        l.id = fmt::format("seed_{}", i + 1);
      if (!ids.insert(l.id).second) {
        throw InvalidInputError(fmt::format("duplicate seed lineup id {}", l.id));
      }
      seeds_.push_back(std::move(l));
    }

    init_warnings_ = scale_stack_targets(
        cons_, static_cast<int>(pool_.required_positions().size()) + 1);
    for (const std::string &w : init_warnings_)
      log_.warn("{}", w);
    if (!pool_.has_matchups()) {
      init_warnings_.push_back(
          "Opponent data unavailable; game diversity check skipped");
    }
    ready_ = true;
    control_.status(fmt::format("Initialized {} players across {} teams",
                                pool_.size(), pool_.teams().size()));
  } catch (const std::exception &e) {
    fail(e);
    throw;
  }
}

Lineup Optimizer::seed_to_lineup(const SeedLineup &s) const {
  const auto lookup = [&](const std::string &id) {
    if (!pool_.table().has_id(id)) {
      throw InvalidInputError(
          fmt::format("seed lineup {} references unknown player {}", s.id, id));
    }
    return pool_.index_of(id);
  };

  Lineup l;
  l.id = s.id;
  l.name = s.name.empty() ? s.id : s.name;
  l.captain = LineupSlot{lookup(s.captain_id), Position::CPT};

  std::vector<std::size_t> members;
  for (const std::string &id : s.player_ids)
    members.push_back(lookup(id));
  for (Position role : pool_.required_positions()) {
    auto it = std::find_if(members.begin(), members.end(), [&](std::size_t idx) {
      return pool_[idx].position == role;
    });
    if (it == members.end()) {
      throw InvalidInputError(
          fmt::format("seed lineup {} has no {} player", s.id, to_string(role)));
    }
    l.slots.push_back(LineupSlot{*it, role});
    members.erase(it);
  }
  if (!members.empty()) {
    throw InvalidInputError(
        fmt::format("seed lineup {} has {} players outside the required slots",
                    s.id, members.size()));
  }
  return l;
}

void Optimizer::require_ready(int count) const {
  if (!ready_) {
    throw InvalidInputError("optimizer is not initialized");
  }
  if (count <= 0) {
    throw InvalidInputError(
        fmt::format("lineup count must be positive, got {}", count));
  }
}

void Optimizer::ensure_grid() {
  if (grid_.iterations() == cfg_.iterations && grid_.players() == pool_.size())
    return;
  control_.status(fmt::format("Sampling {} iterations for {} players",
                              cfg_.iterations, pool_.size()));
  grid_.sample(pool_.table(), cfg_.iterations, cfg_.randomness, cfg_.seed,
               cfg_.sample_batch_size, [this](int done, int total) {
                 control_.checkpoint("sampling");
                 control_.progress(kSampledPct * done / total,
                                   stage::kInitializing);
               });
}

ExposureTracker Optimizer::seeded_tracker() const {
  ExposureTracker t(pool_.size());
  for (const Lineup &s : seeds_)
    t.record(s, pool_);
  return t;
}

std::vector<Lineup>
Optimizer::score_lineups(std::vector<Lineup> lineups, double from, double to,
                         std::vector<std::string> &warnings) {
  const MonteCarloScorer scorer(pool_, corr_, grid_, cfg_);
  std::vector<Lineup> out;
  std::vector<Eigen::VectorXd> totals;
  out.reserve(lineups.size());

  for (std::size_t i = 0; i < lineups.size(); ++i) {
    control_.checkpoint("lineup simulation");
    Lineup &l = lineups[i];
    try {
      Eigen::VectorXd t = scorer.simulate_totals(l);
      l.stats = scorer.summarize(
          t, projected_points(l, pool_, cfg_.captain_multiplier));
      apply_nexus_score(l, pool_, cfg_.captain_multiplier);
      if (cfg_.calibrated_roi)
        totals.push_back(std::move(t));
      out.push_back(std::move(l));
    } catch (const std::exception &e) {
      warnings.push_back(fmt::format("Dropped lineup {}: {}", l.id, e.what()));
      log_.warn("{}", warnings.back());
    }
    control_.progress(from + (to - from) * (i + 1) / lineups.size(),
                      stage::kFinalSimulation);
  }

  if (cfg_.calibrated_roi && !out.empty()) {
    const FieldThresholds th = calibrated_thresholds(totals, cfg_.field_size);
    log_.debug("calibrated thresholds: first {:.1f}, top10 {:.1f}, cash {:.1f}",
               th.first_place, th.top10, th.cash);
    for (std::size_t i = 0; i < out.size(); ++i)
      MonteCarloScorer::apply_thresholds(*out[i].stats, totals[i], th);
  }
  return out;
}

LineupRecord Optimizer::to_record(const Lineup &l) const {
  const auto slot_record = [&](const LineupSlot &s) {
    const Player &p = pool_[s.player];
    SlotRecord r;
    r.id = p.id;
    r.name = p.name;
    r.position = to_string(s.role);
    r.team = p.team;
    r.opponent = pool_.opponent_of(p.team);
    r.salary = slot_salary(s, pool_, cfg_.captain_multiplier);
    return r;
  };

  LineupRecord r;
  r.id = l.id;
  r.name = l.name;
  r.cpt = slot_record(l.captain);
  for (const LineupSlot &s : l.slots)
    r.players.push_back(slot_record(s));
  r.total_salary = total_salary(l, pool_, cfg_.captain_multiplier);

  const LineupStats s = l.stats.value_or(LineupStats{});
  r.projected_points = round_to(l.stats ? s.projected_points
                                        : projected_points(l, pool_, cfg_.captain_multiplier),
                                2);
  r.min = round_to(s.min, 2);
  r.max = round_to(s.max, 2);
  r.p10 = round_to(s.p10, 2);
  r.p25 = round_to(s.p25, 2);
  r.median = round_to(s.median, 2);
  r.p75 = round_to(s.p75, 2);
  r.p90 = round_to(s.p90, 2);
  r.cash_rate = round_to(s.cash_rate * 100.0, 1);
  r.win_rate = round_to(s.win_rate * 100.0, 1);
  r.first_place = round_to(s.first_place * 100.0, 1);
  r.top10 = round_to(s.top10 * 100.0, 1);
  r.roi = round_to(s.roi, 2);
  r.nexus_score = round_to(l.nexus_score, 2);
  r.score_components = l.components;
  if (l.genetic_fitness)
    r.genetic_fitness = round_to(*l.genetic_fitness, 2);
  return r;
}

Summary Optimizer::summarize(const std::vector<Lineup> &lineups, int requested,
                             std::vector<std::string> warnings) const {
  Summary sum;
  sum.requested = requested;
  sum.generated = static_cast<int>(lineups.size());
  sum.seeds = static_cast<int>(seeds_.size());
  sum.warnings = std::move(warnings);
  if (lineups.empty())
    return sum;

  ExposureTracker ledger(pool_.size());
  double roi = 0.0, nexus = 0.0;
  sum.top_roi = lineups.front().stats ? lineups.front().stats->roi : 0.0;
  sum.top_nexus_score = lineups.front().nexus_score;
  for (const Lineup &l : lineups) {
    ledger.record(l, pool_);
    const double r = l.stats ? l.stats->roi : 0.0;
    roi += r;
    nexus += l.nexus_score;
    sum.top_roi = std::max(sum.top_roi, r);
    sum.top_nexus_score = std::max(sum.top_nexus_score, l.nexus_score);
  }
  const double n = static_cast<double>(lineups.size());
  sum.average_roi = round_to(roi / n, 2);
  sum.top_roi = round_to(sum.top_roi, 2);
  sum.average_nexus_score = round_to(nexus / n, 2);
  sum.top_nexus_score = round_to(sum.top_nexus_score, 2);
  sum.distinct_teams = static_cast<int>(ledger.team_counts().size());

  const auto pct = [&](int count) { return round_to(100.0 * count / n, 1); };
  const auto by_percent = [](const ExposureEntry &a, const ExposureEntry &b) {
    return a.percent != b.percent ? a.percent > b.percent : a.key < b.key;
  };

  for (std::size_t i = 0; i < pool_.size(); ++i) {
    const int c = ledger.player_count(i);
    if (c > 0)
      sum.player_exposure.push_back(
          ExposureEntry{pool_[i].id, pool_[i].name, c, pct(c)});
  }
  for (const auto &kv : ledger.team_counts())
    sum.team_exposure.push_back(
        ExposureEntry{kv.first, kv.first, kv.second, pct(kv.second)});
  for (const auto &kv : ledger.stack_counts()) {
    if (kv.first.second < 2)
      continue;
    sum.stack_exposure.push_back(ExposureEntry{
        fmt::format("{}:{}", kv.first.first, kv.first.second),
        fmt::format("{} {}-stack", kv.first.first, kv.first.second), kv.second,
        pct(kv.second)});
  }
  std::sort(sum.player_exposure.begin(), sum.player_exposure.end(), by_percent);
  std::sort(sum.team_exposure.begin(), sum.team_exposure.end(), by_percent);
  std::sort(sum.stack_exposure.begin(), sum.stack_exposure.end(), by_percent);
  return sum;
}

SimulationResult Optimizer::run_simulation(int count) {
  require_ready(count);
  control_.reset();
  try {
    control_.progress(0.0, stage::kInitializing);
    ensure_grid();

    std::mt19937_64 rng(mix_seed(cfg_.seed, 1));
    ExposureTracker tracker = seeded_tracker();
    const LineupBuilder builder(pool_, corr_, cons_, cfg_, log_);
    const LineupValidator validator(pool_, cfg_);
    const PortfolioGenerator generator(builder, validator, cfg_, control_, log_);

    control_.progress(kSampledPct, stage::kFinalSelection);
    control_.status(fmt::format("Building {} lineups", count));
    GenerationReport report = generator.generate(
        count, seeds_, tracker, rng, [this](int done, int total) {
          control_.progress(kSampledPct + 50.0 * done / total,
                            stage::kFinalSelection);
        });

    std::vector<std::string> warnings = init_warnings_;
    warnings.insert(warnings.end(), report.warnings.begin(),
                    report.warnings.end());

    control_.status(fmt::format("Simulating {} lineups", report.lineups.size()));
    std::vector<Lineup> lineups =
        score_lineups(std::move(report.lineups), 60.0, 99.0, warnings);
    std::sort(lineups.begin(), lineups.end(),
              [](const Lineup &a, const Lineup &b) {
                const double ra = a.stats ? a.stats->roi : 0.0;
                const double rb = b.stats ? b.stats->roi : 0.0;
                if (ra != rb)
                  return ra > rb;
                if (a.nexus_score != b.nexus_score)
                  return a.nexus_score > b.nexus_score;
                return a.id < b.id;
              });

    SimulationResult result;
    for (const Lineup &l : lineups)
      result.lineups.push_back(to_record(l));
    result.summary = summarize(lineups, count, std::move(warnings));

    control_.progress(100.0, stage::kCompleted);
    control_.status(fmt::format("Generated {} of {} lineups",
                                result.summary.generated, count));
    return result;
  } catch (const std::exception &e) {
    fail(e);
    throw;
  }
}

GeneticResult Optimizer::run_genetic(int count) {
  require_ready(count);
  control_.reset();
  try {
    control_.progress(0.0, stage::kInitializing);
    ensure_grid();

    std::mt19937_64 rng(mix_seed(cfg_.seed, 2));
    const ExposureTracker seeds = seeded_tracker();
    const LineupBuilder builder(pool_, corr_, cons_, cfg_, log_);
    const LineupValidator validator(pool_, cfg_);
    const EvolutionDriver driver(pool_, builder, validator, cfg_, gcfg_,
                                 control_, log_);

    control_.status(fmt::format("Evolving population of {} for {} generations",
                                gcfg_.population_size, gcfg_.generations));
    EvolutionOutcome outcome =
        driver.run(count, seeds_, seeds, rng, kSampledPct, 70.0);

    // Number after the seeds, skipping ids a seed already uses.
    std::set<std::string> ids;
    for (const Lineup &s : seeds_)
      ids.insert(s.id);
    int number = static_cast<int>(seeds_.size());
    for (Lineup &l : outcome.selected) {
      do {
        ++number;
        l.id = fmt::format("genetic_{}", number);
      } while (ids.count(l.id) != 0);
      l.name = fmt::format("Genetic Lineup {}", number);
      ids.insert(l.id);
    }

    if (cfg_.verify_ledger) {
      ExposureTracker ledger = seeds;
      std::vector<const Lineup *> all;
      for (const Lineup &s : seeds_)
        all.push_back(&s);
      for (const Lineup &l : outcome.selected) {
        ledger.record(l, pool_);
        all.push_back(&l);
      }
      if (!ledger.matches_recount(all, pool_)) {
        throw InternalInvariantError(
            "exposure ledger does not match a recount of selected lineups");
      }
    }

    std::vector<std::string> warnings = init_warnings_;
    warnings.insert(warnings.end(), outcome.warnings.begin(),
                    outcome.warnings.end());

    control_.progress(70.0, stage::kFinalSimulation);
    control_.status(
        fmt::format("Simulating {} selected lineups", outcome.selected.size()));
    std::vector<Lineup> lineups =
        score_lineups(std::move(outcome.selected), 70.0, 99.0, warnings);
    const auto blended = [](const Lineup &l) {
      return 0.7 * l.nexus_score + 0.3 * l.genetic_fitness.value_or(0.0);
    };
    std::sort(lineups.begin(), lineups.end(),
              [&](const Lineup &a, const Lineup &b) {
                const double sa = blended(a), sb = blended(b);
                if (sa != sb)
                  return sa > sb;
                return a.id < b.id;
              });

    GeneticResult result;
    for (const Lineup &l : lineups)
      result.lineups.push_back(to_record(l));
    result.summary = summarize(lineups, count, std::move(warnings));

    EvolutionSummary &evo = result.evolution;
    evo.generations = outcome.generations_run;
    evo.restarts = outcome.restarts;
    for (const GenerationStats &g : outcome.history) {
      evo.fitness_history.push_back(FitnessRecord{
          g.generation, round_to(g.best, 2), round_to(g.average, 2),
          round_to(g.diversity, 4)});
    }
    evo.final_diversity = round_to(outcome.final_diversity, 4);
    evo.final_best_fitness = round_to(outcome.final_best, 2);
    if (!lineups.empty()) {
      double fit = 0.0;
      std::vector<const Lineup *> ptrs;
      for (const Lineup &l : lineups) {
        fit += l.genetic_fitness.value_or(0.0);
        ptrs.push_back(&l);
      }
      evo.average_genetic_fitness = round_to(fit / lineups.size(), 2);
      evo.diversity_score = round_to(mean_pairwise_distance(ptrs), 4);
    }
    if (outcome.generations_run > 0) {
      evo.evolution_efficiency = round_to(
          (outcome.final_best - outcome.initial_best) / outcome.generations_run,
          4);
    }

    control_.progress(100.0, stage::kCompleted);
    control_.status(fmt::format("Genetic optimization produced {} of {} lineups",
                                result.summary.generated, count));
    return result;
  } catch (const std::exception &e) {
    fail(e);
    throw;
  }
}

} // namespace nexus_core
