#pragma once

#include <exception>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "nexus_core/config.hpp"
#include "nexus_core/correlation.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/log.hpp"
#include "nexus_core/player.hpp"
#include "nexus_core/pool.hpp"
#include "nexus_core/progress.hpp"
#include "nexus_core/projection.hpp"

namespace nexus_core {

// Existing lineup supplied with a generation request.
struct SeedLineup {
  std::string id;
  std::string name;
  std::string captain_id;
  std::vector<std::string> player_ids;
};

struct SlotRecord {
  std::string id;
  std::string name;
  std::string position;
  std::string team;
  std::string opponent;
  int salary{0};
};

// Result row. Rates are percentages rounded to one decimal, ROI to two.
struct LineupRecord {
  std::string id;
  std::string name;
  SlotRecord cpt;
  std::vector<SlotRecord> players;
  int total_salary{0};
  double projected_points{0.0};
  double min{0.0};
  double max{0.0};
  double p10{0.0};
  double p25{0.0};
  double median{0.0};
  double p75{0.0};
  double p90{0.0};
  double cash_rate{0.0};
  double win_rate{0.0};
  double first_place{0.0};
  double top10{0.0};
  double roi{0.0};
  double nexus_score{0.0};
  ScoreComponents score_components;
  std::optional<double> genetic_fitness;
};

struct ExposureEntry {
  std::string key; // player id, team code or "TEAM:k"
  std::string label;
  int count{0};
  double percent{0.0};
};

struct Summary {
  int requested{0};
  int generated{0};
  int seeds{0};
  double average_roi{0.0};
  double top_roi{0.0};
  double average_nexus_score{0.0};
  double top_nexus_score{0.0};
  int distinct_teams{0};
  std::vector<ExposureEntry> player_exposure; // descending percent
  std::vector<ExposureEntry> team_exposure;
  std::vector<ExposureEntry> stack_exposure;
  std::vector<std::string> warnings;
};

struct FitnessRecord {
  int generation{0};
  double best{0.0};
  double average{0.0};
  double diversity{0.0};
};

struct EvolutionSummary {
  std::string algorithm{"genetic"};
  int generations{0};
  int restarts{0};
  std::vector<FitnessRecord> fitness_history;
  double final_diversity{0.0};
  double final_best_fitness{0.0};
  double average_genetic_fitness{0.0};
  double diversity_score{0.0};      // mean pairwise distance of returned set
  double evolution_efficiency{0.0}; // best-fitness gain per generation
};

struct SimulationResult {
  std::vector<LineupRecord> lineups;
  Summary summary;
};

struct GeneticResult {
  std::vector<LineupRecord> lineups;
  Summary summary;
  EvolutionSummary evolution;
};

// Engine facade. One optimization call at a time per instance; each call is
// a pure function of the initialized inputs and the configured seed.
class Optimizer {
public:
  explicit Optimizer(OptimizerConfig cfg = {}, GeneticConfig gcfg = {});

  // Throws InvalidInputError on bad pools, settings or seeds.
  void initialize(const std::vector<PlayerRecord> &players,
                  const ExposureSettings &settings,
                  const std::vector<SeedLineup> &seeds = {});

  SimulationResult run_simulation(int count);
  GeneticResult run_genetic(int count);

  void cancel() { control_.cancel(); }
  bool is_ready() const { return ready_; }

  void set_progress_callback(ProgressCallback cb) {
    control_.set_progress_callback(std::move(cb));
  }
  void set_status_callback(StatusCallback cb) {
    control_.set_status_callback(std::move(cb));
  }

  const OptimizerConfig &config() const { return cfg_; }
  const GeneticConfig &genetic_config() const { return gcfg_; }
  const PlayerPool &pool() const { return pool_; }
  const ExposureConstraints &constraints() const { return cons_; }
  const std::vector<Lineup> &seed_lineups() const { return seeds_; }

  LineupRecord to_record(const Lineup &l) const;

private:
  void require_ready(int count) const;
  void ensure_grid();
  ExposureTracker seeded_tracker() const;
  std::vector<Lineup> score_lineups(std::vector<Lineup> lineups, double from,
                                    double to, std::vector<std::string> &warnings);
  Summary summarize(const std::vector<Lineup> &lineups, int requested,
                    std::vector<std::string> warnings) const;
  Lineup seed_to_lineup(const SeedLineup &s) const;
  void fail(const std::exception &e);

  OptimizerConfig cfg_;
  GeneticConfig gcfg_;
  Logger log_;
  RunControl control_;

  bool ready_{false};
  PlayerPool pool_;
  ExposureConstraints cons_;
  CorrelationMatrix corr_;
  PerformanceGrid grid_;
  std::vector<Lineup> seeds_;
  std::vector<std::string> init_warnings_;
};

} // namespace nexus_core
