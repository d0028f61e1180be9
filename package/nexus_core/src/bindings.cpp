#include "nexus_core/config.hpp"
#include "nexus_core/engine.hpp"
#include "nexus_core/errors.hpp"
#include "nexus_core/exposure.hpp"
#include "nexus_core/lineup.hpp"
#include "nexus_core/player.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/function.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace nexus_core;

NB_MODULE(nexus_core, m) {
  m.doc() = "LoL DFS lineup optimizer core.";

  nb::exception<OptimizerError>(m, "OptimizerError");

  // Configuration
  nb::class_<CorrelationWeights>(m, "CorrelationWeights")
      .def(nb::init<>())
      .def_rw("same_team", &CorrelationWeights::same_team)
      .def_rw("same_team_same_position",
              &CorrelationWeights::same_team_same_position)
      .def_rw("opposing_team", &CorrelationWeights::opposing_team);

  nb::class_<OptimizerConfig>(m, "OptimizerConfig")
      .def(nb::init<>())
      .def_rw("salary_cap", &OptimizerConfig::salary_cap)
      .def_rw("max_players_per_team", &OptimizerConfig::max_players_per_team)
      .def_rw("min_games", &OptimizerConfig::min_games)
      .def_rw("captain_multiplier", &OptimizerConfig::captain_multiplier)
      .def_rw("iterations", &OptimizerConfig::iterations)
      .def_rw("sample_batch_size", &OptimizerConfig::sample_batch_size)
      .def_rw("randomness", &OptimizerConfig::randomness)
      .def_rw("randomness_step", &OptimizerConfig::randomness_step)
      .def_rw("target_top", &OptimizerConfig::target_top)
      .def_rw("correlation_shift", &OptimizerConfig::correlation_shift)
      .def_rw("cash_line", &OptimizerConfig::cash_line)
      .def_rw("win_line", &OptimizerConfig::win_line)
      .def_rw("field_size", &OptimizerConfig::field_size)
      .def_rw("calibrated_roi", &OptimizerConfig::calibrated_roi)
      .def_rw("leverage_multiplier", &OptimizerConfig::leverage_multiplier)
      .def_rw("correlation", &OptimizerConfig::correlation)
      .def_rw("min_player_difference", &OptimizerConfig::min_player_difference)
      .def_rw("max_consecutive_failure_factor",
              &OptimizerConfig::max_consecutive_failure_factor)
      .def_rw("attempt_factor", &OptimizerConfig::attempt_factor)
      .def_rw("verify_ledger", &OptimizerConfig::verify_ledger)
      .def_rw("debug_mode", &OptimizerConfig::debug_mode)
      .def_rw("seed", &OptimizerConfig::seed)
      .def("__repr__", [](const OptimizerConfig &c) {
        return fmt::format("OptimizerConfig(salary_cap={}, iterations={}, "
                           "randomness={}, seed={})",
                           c.salary_cap, c.iterations, c.randomness, c.seed);
      });

  nb::class_<GeneticConfig>(m, "GeneticConfig")
      .def(nb::init<>())
      .def_rw("population_size", &GeneticConfig::population_size)
      .def_rw("generations", &GeneticConfig::generations)
      .def_rw("elite_fraction", &GeneticConfig::elite_fraction)
      .def_rw("crossover_rate", &GeneticConfig::crossover_rate)
      .def_rw("mutation_rate", &GeneticConfig::mutation_rate)
      .def_rw("tournament_size", &GeneticConfig::tournament_size)
      .def_rw("diversity_threshold", &GeneticConfig::diversity_threshold)
      .def_rw("diversity_fill_fraction",
              &GeneticConfig::diversity_fill_fraction)
      .def_rw("max_stagnation", &GeneticConfig::max_stagnation)
      .def_rw("restart_keep_fraction", &GeneticConfig::restart_keep_fraction)
      .def_rw("fitness_batch_size", &GeneticConfig::fitness_batch_size)
      .def_rw("init_retries", &GeneticConfig::init_retries)
      .def("__repr__", [](const GeneticConfig &c) {
        return fmt::format(
            "GeneticConfig(population_size={}, generations={}, "
            "elite_fraction={}, crossover_rate={}, mutation_rate={})",
            c.population_size, c.generations, c.elite_fraction,
            c.crossover_rate, c.mutation_rate);
      });

  // Inputs
  nb::class_<PlayerRecord>(m, "PlayerRecord")
      .def(nb::init<>())
      .def(nb::init<std::string, std::string, std::string, std::string,
                    RawNumber, RawNumber, RawNumber, std::string>(),
           nb::arg("id"), nb::arg("name"), nb::arg("position"),
           nb::arg("team"), nb::arg("salary"), nb::arg("projected_points"),
           nb::arg("ownership"), nb::arg("opponent") = "")
      .def_rw("id", &PlayerRecord::id)
      .def_rw("name", &PlayerRecord::name)
      .def_rw("position", &PlayerRecord::position)
      .def_rw("team", &PlayerRecord::team)
      .def_rw("salary", &PlayerRecord::salary)
      .def_rw("projected_points", &PlayerRecord::projected_points)
      .def_rw("ownership", &PlayerRecord::ownership)
      .def_rw("opponent", &PlayerRecord::opponent)
      .def("__repr__", [](const PlayerRecord &p) {
        return fmt::format("PlayerRecord(id={}, name={}, position={}, team={})",
                           p.id, p.name, p.position, p.team);
      });

  nb::class_<GlobalExposureSetting>(m, "GlobalExposureSetting")
      .def(nb::init<>())
      .def_rw("global_min_exposure", &GlobalExposureSetting::global_min_exposure)
      .def_rw("global_max_exposure", &GlobalExposureSetting::global_max_exposure)
      .def_rw("apply_to_new_lineups",
              &GlobalExposureSetting::apply_to_new_lineups)
      .def_rw("prioritize_projections",
              &GlobalExposureSetting::prioritize_projections);

  nb::class_<TeamExposureSetting>(m, "TeamExposureSetting")
      .def(nb::init<>())
      .def_rw("team", &TeamExposureSetting::team)
      .def_rw("stack_size", &TeamExposureSetting::stack_size)
      .def_rw("min", &TeamExposureSetting::min)
      .def_rw("max", &TeamExposureSetting::max)
      .def_rw("target", &TeamExposureSetting::target);

  nb::class_<PlayerExposureSetting>(m, "PlayerExposureSetting")
      .def(nb::init<>())
      .def_rw("id", &PlayerExposureSetting::id)
      .def_rw("min", &PlayerExposureSetting::min)
      .def_rw("max", &PlayerExposureSetting::max)
      .def_rw("target", &PlayerExposureSetting::target);

  nb::class_<PositionExposureSetting>(m, "PositionExposureSetting")
      .def(nb::init<>())
      .def_rw("min", &PositionExposureSetting::min)
      .def_rw("max", &PositionExposureSetting::max)
      .def_rw("target", &PositionExposureSetting::target);

  nb::class_<ExposureSettings>(m, "ExposureSettings")
      .def(nb::init<>())
      .def_rw("global_", &ExposureSettings::global)
      .def_rw("teams", &ExposureSettings::teams)
      .def_rw("players", &ExposureSettings::players)
      .def_rw("positions", &ExposureSettings::positions);

  nb::class_<SeedLineup>(m, "SeedLineup")
      .def(nb::init<>())
      .def_rw("id", &SeedLineup::id)
      .def_rw("name", &SeedLineup::name)
      .def_rw("captain_id", &SeedLineup::captain_id)
      .def_rw("player_ids", &SeedLineup::player_ids);

  // Results
  nb::class_<ScoreComponents>(m, "ScoreComponents")
      .def(nb::init<>())
      .def_rw("base_projection", &ScoreComponents::base_projection)
      .def_rw("leverage_factor", &ScoreComponents::leverage_factor)
      .def_rw("avg_ownership", &ScoreComponents::avg_ownership)
      .def_rw("field_avg_ownership", &ScoreComponents::field_avg_ownership)
      .def_rw("stack_bonus", &ScoreComponents::stack_bonus)
      .def_rw("position_bonus", &ScoreComponents::position_bonus)
      .def_rw("team_stacks", &ScoreComponents::team_stacks)
      .def_rw("stack_pattern", &ScoreComponents::stack_pattern);

  nb::class_<SlotRecord>(m, "SlotRecord")
      .def(nb::init<>())
      .def_rw("id", &SlotRecord::id)
      .def_rw("name", &SlotRecord::name)
      .def_rw("position", &SlotRecord::position)
      .def_rw("team", &SlotRecord::team)
      .def_rw("opponent", &SlotRecord::opponent)
      .def_rw("salary", &SlotRecord::salary)
      .def("__repr__", [](const SlotRecord &s) {
        return fmt::format("SlotRecord(id={}, position={}, team={}, salary={})",
                           s.id, s.position, s.team, s.salary);
      });

  nb::class_<LineupRecord>(m, "LineupRecord")
      .def(nb::init<>())
      .def_rw("id", &LineupRecord::id)
      .def_rw("name", &LineupRecord::name)
      .def_rw("cpt", &LineupRecord::cpt)
      .def_rw("players", &LineupRecord::players)
      .def_rw("total_salary", &LineupRecord::total_salary)
      .def_rw("projected_points", &LineupRecord::projected_points)
      .def_rw("min", &LineupRecord::min)
      .def_rw("max", &LineupRecord::max)
      .def_rw("p10", &LineupRecord::p10)
      .def_rw("p25", &LineupRecord::p25)
      .def_rw("median", &LineupRecord::median)
      .def_rw("p75", &LineupRecord::p75)
      .def_rw("p90", &LineupRecord::p90)
      .def_rw("cash_rate", &LineupRecord::cash_rate)
      .def_rw("win_rate", &LineupRecord::win_rate)
      .def_rw("first_place", &LineupRecord::first_place)
      .def_rw("top10", &LineupRecord::top10)
      .def_rw("roi", &LineupRecord::roi)
      .def_rw("nexus_score", &LineupRecord::nexus_score)
      .def_rw("score_components", &LineupRecord::score_components)
      .def_rw("genetic_fitness", &LineupRecord::genetic_fitness)
      .def("__repr__", [](const LineupRecord &l) {
        return fmt::format("LineupRecord(id={}, cpt={}, total_salary={}, "
                           "roi={}, nexus_score={})",
                           l.id, l.cpt.id, l.total_salary, l.roi,
                           l.nexus_score);
      });

  nb::class_<ExposureEntry>(m, "ExposureEntry")
      .def(nb::init<>())
      .def_rw("key", &ExposureEntry::key)
      .def_rw("label", &ExposureEntry::label)
      .def_rw("count", &ExposureEntry::count)
      .def_rw("percent", &ExposureEntry::percent);

  nb::class_<Summary>(m, "Summary")
      .def(nb::init<>())
      .def_rw("requested", &Summary::requested)
      .def_rw("generated", &Summary::generated)
      .def_rw("seeds", &Summary::seeds)
      .def_rw("average_roi", &Summary::average_roi)
      .def_rw("top_roi", &Summary::top_roi)
      .def_rw("average_nexus_score", &Summary::average_nexus_score)
      .def_rw("top_nexus_score", &Summary::top_nexus_score)
      .def_rw("distinct_teams", &Summary::distinct_teams)
      .def_rw("player_exposure", &Summary::player_exposure)
      .def_rw("team_exposure", &Summary::team_exposure)
      .def_rw("stack_exposure", &Summary::stack_exposure)
      .def_rw("warnings", &Summary::warnings);

  nb::class_<FitnessRecord>(m, "FitnessRecord")
      .def(nb::init<>())
      .def_rw("generation", &FitnessRecord::generation)
      .def_rw("best", &FitnessRecord::best)
      .def_rw("average", &FitnessRecord::average)
      .def_rw("diversity", &FitnessRecord::diversity);

  nb::class_<EvolutionSummary>(m, "EvolutionSummary")
      .def(nb::init<>())
      .def_rw("algorithm", &EvolutionSummary::algorithm)
      .def_rw("generations", &EvolutionSummary::generations)
      .def_rw("restarts", &EvolutionSummary::restarts)
      .def_rw("fitness_history", &EvolutionSummary::fitness_history)
      .def_rw("final_diversity", &EvolutionSummary::final_diversity)
      .def_rw("final_best_fitness", &EvolutionSummary::final_best_fitness)
      .def_rw("average_genetic_fitness",
              &EvolutionSummary::average_genetic_fitness)
      .def_rw("diversity_score", &EvolutionSummary::diversity_score)
      .def_rw("evolution_efficiency", &EvolutionSummary::evolution_efficiency);

  nb::class_<SimulationResult>(m, "SimulationResult")
      .def(nb::init<>())
      .def_rw("lineups", &SimulationResult::lineups)
      .def_rw("summary", &SimulationResult::summary);

  nb::class_<GeneticResult>(m, "GeneticResult")
      .def(nb::init<>())
      .def_rw("lineups", &GeneticResult::lineups)
      .def_rw("summary", &GeneticResult::summary)
      .def_rw("evolution", &GeneticResult::evolution);

  // Engine
  nb::class_<Optimizer>(m, "Optimizer")
      .def(nb::init<OptimizerConfig, GeneticConfig>(),
           nb::arg("config") = OptimizerConfig{},
           nb::arg("genetic_config") = GeneticConfig{})
      .def("initialize", &Optimizer::initialize, nb::arg("players"),
           nb::arg("settings"), nb::arg("seeds") = std::vector<SeedLineup>{})
      .def("run_simulation", &Optimizer::run_simulation, nb::arg("count"),
           nb::call_guard<nb::gil_scoped_release>())
      .def("run_genetic", &Optimizer::run_genetic, nb::arg("count"),
           nb::call_guard<nb::gil_scoped_release>())
      .def("cancel", &Optimizer::cancel)
      .def("is_ready", &Optimizer::is_ready)
      .def("set_progress_callback", &Optimizer::set_progress_callback)
      .def("set_status_callback", &Optimizer::set_status_callback)
      .def("__repr__", [](const Optimizer &o) {
        return fmt::format("Optimizer(ready={}, players={}, seeds={})",
                           o.is_ready(), o.pool().size(),
                           o.seed_lineups().size());
      });
}
