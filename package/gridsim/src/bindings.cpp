#include "gridsim/aggregate.hpp"
#include "gridsim/backtest.hpp"
#include "gridsim/calibration.hpp"
#include "gridsim/centering.hpp"
#include "gridsim/config.hpp"
#include "gridsim/errors.hpp"
#include "gridsim/log.hpp"
#include "gridsim/market.hpp"
#include "gridsim/probability.hpp"
#include "gridsim/simulator.hpp"
#include "gridsim/team_profile.hpp"
#include "gridsim/team_stats.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <memory>

namespace {

// Profiles are immutable once built; Python holds them through the mutable
// base so nanobind can manage the shared_ptr.
std::shared_ptr<gridsim::TeamProfile> unconst(gridsim::ProfilePtr p) {
  return std::const_pointer_cast<gridsim::TeamProfile>(std::move(p));
}

} // namespace

NB_MODULE(gridsim, m) {
  m.doc() = "Monte Carlo football game simulator.";

  nanobind::exception<gridsim::DataUnavailable>(m, "DataUnavailable",
                                                PyExc_LookupError);
  nanobind::exception<gridsim::SimulationDivergence>(m, "SimulationDivergence",
                                                     PyExc_RuntimeError);
  nanobind::exception<gridsim::LookAheadViolation>(m, "LookAheadViolation",
                                                   PyExc_RuntimeError);

  nanobind::enum_<gridsim::LogLevel>(m, "LogLevel")
      .value("Debug", gridsim::LogLevel::Debug)
      .value("Info", gridsim::LogLevel::Info)
      .value("Warn", gridsim::LogLevel::Warn)
      .value("Error", gridsim::LogLevel::Error)
      .value("Off", gridsim::LogLevel::Off);
  m.def("set_log_level", &gridsim::set_log_level);
  m.def("log_level", &gridsim::log_level);

  // Inputs
  nanobind::class_<gridsim::UnitGrades>(m, "UnitGrades")
      .def(nanobind::init<>())
      .def_rw("pass_block", &gridsim::UnitGrades::pass_block)
      .def_rw("pass_rush", &gridsim::UnitGrades::pass_rush)
      .def_rw("run_block", &gridsim::UnitGrades::run_block)
      .def_rw("run_defense", &gridsim::UnitGrades::run_defense)
      .def_rw("coverage", &gridsim::UnitGrades::coverage)
      .def_rw("receiving", &gridsim::UnitGrades::receiving)
      .def("__repr__", [](const gridsim::UnitGrades &g) {
        return fmt::format("UnitGrades(pass_block={}, pass_rush={}, run_block={}, "
                           "run_defense={}, coverage={}, receiving={})",
                           g.pass_block, g.pass_rush, g.run_block, g.run_defense,
                           g.coverage, g.receiving);
      });

  nanobind::class_<gridsim::TeamWeekStats>(m, "TeamWeekStats")
      .def(nanobind::init<>())
      .def_rw("team", &gridsim::TeamWeekStats::team)
      .def_rw("season", &gridsim::TeamWeekStats::season)
      .def_rw("week", &gridsim::TeamWeekStats::week)
      .def_rw("as_of_timestamp", &gridsim::TeamWeekStats::as_of_timestamp)
      .def_rw("games_played", &gridsim::TeamWeekStats::games_played)
      .def_rw("off_epa_per_play", &gridsim::TeamWeekStats::off_epa_per_play)
      .def_rw("off_pass_epa", &gridsim::TeamWeekStats::off_pass_epa)
      .def_rw("off_rush_epa", &gridsim::TeamWeekStats::off_rush_epa)
      .def_rw("def_epa_per_play", &gridsim::TeamWeekStats::def_epa_per_play)
      .def_rw("def_pass_epa", &gridsim::TeamWeekStats::def_pass_epa)
      .def_rw("def_rush_epa", &gridsim::TeamWeekStats::def_rush_epa)
      .def_rw("off_success_rate", &gridsim::TeamWeekStats::off_success_rate)
      .def_rw("off_pass_success_rate", &gridsim::TeamWeekStats::off_pass_success_rate)
      .def_rw("off_rush_success_rate", &gridsim::TeamWeekStats::off_rush_success_rate)
      .def_rw("def_success_rate", &gridsim::TeamWeekStats::def_success_rate)
      .def_rw("def_pass_success_rate", &gridsim::TeamWeekStats::def_pass_success_rate)
      .def_rw("def_rush_success_rate", &gridsim::TeamWeekStats::def_rush_success_rate)
      .def_rw("turnover_rate", &gridsim::TeamWeekStats::turnover_rate)
      .def_rw("takeaway_rate", &gridsim::TeamWeekStats::takeaway_rate)
      .def_rw("explosive_rate", &gridsim::TeamWeekStats::explosive_rate)
      .def_rw("red_zone_td_pct", &gridsim::TeamWeekStats::red_zone_td_pct)
      .def_rw("red_zone_td_pct_allowed", &gridsim::TeamWeekStats::red_zone_td_pct_allowed)
      .def_rw("field_goal_make_pct", &gridsim::TeamWeekStats::field_goal_make_pct)
      .def_rw("punt_net_yards", &gridsim::TeamWeekStats::punt_net_yards)
      .def_rw("kick_return_start", &gridsim::TeamWeekStats::kick_return_start)
      .def_rw("seconds_per_play", &gridsim::TeamWeekStats::seconds_per_play)
      .def_rw("neutral_pass_rate", &gridsim::TeamWeekStats::neutral_pass_rate)
      .def_rw("fourth_down_aggressiveness",
              &gridsim::TeamWeekStats::fourth_down_aggressiveness)
      .def_rw("sack_rate_allowed", &gridsim::TeamWeekStats::sack_rate_allowed)
      .def_rw("def_sack_rate", &gridsim::TeamWeekStats::def_sack_rate)
      .def_rw("grades", &gridsim::TeamWeekStats::grades)
      .def("__repr__", [](const gridsim::TeamWeekStats &s) {
        return fmt::format("TeamWeekStats(team={}, season={}, week={}, games_played={}, "
                           "off_epa_per_play={}, def_epa_per_play={}, graded={})",
                           s.team, s.season, s.week, s.games_played,
                           s.off_epa_per_play, s.def_epa_per_play,
                           s.grades.has_value());
      });

  nanobind::class_<gridsim::SituationalOverrides>(m, "SituationalOverrides")
      .def(nanobind::init<>())
      .def_rw("weather_severity", &gridsim::SituationalOverrides::weather_severity)
      .def_rw("short_rest", &gridsim::SituationalOverrides::short_rest)
      .def_rw("extra_rest", &gridsim::SituationalOverrides::extra_rest)
      .def_rw("injury_severity", &gridsim::SituationalOverrides::injury_severity);

  nanobind::class_<gridsim::StatsTable>(m, "StatsTable")
      .def(nanobind::init<>())
      .def("set", &gridsim::StatsTable::set)
      .def("has", &gridsim::StatsTable::has)
      .def("get", &gridsim::StatsTable::get, nanobind::rv_policy::copy)
      .def("size", &gridsim::StatsTable::size)
      .def("teams", &gridsim::StatsTable::teams)
      .def("__repr__", [](const gridsim::StatsTable &t) {
        return fmt::format("StatsTable(size={})", t.size());
      });

  nanobind::class_<gridsim::MarketLine>(m, "MarketLine")
      .def(nanobind::init<>())
      .def_rw("spread", &gridsim::MarketLine::spread)
      .def_rw("total", &gridsim::MarketLine::total)
      .def_rw("timestamp", &gridsim::MarketLine::timestamp)
      .def("__repr__", [](const gridsim::MarketLine &l) {
        return fmt::format("MarketLine(spread={}, total={}, timestamp={})",
                           l.spread, l.total, l.timestamp);
      });

  nanobind::class_<gridsim::MarketSnapshot>(m, "MarketSnapshot")
      .def(nanobind::init<>())
      .def_rw("opening", &gridsim::MarketSnapshot::opening)
      .def_rw("closing", &gridsim::MarketSnapshot::closing);

  // Configuration
  nanobind::class_<gridsim::LeaguePriors>(m, "LeaguePriors")
      .def(nanobind::init<>())
      .def_rw("epa_per_play", &gridsim::LeaguePriors::epa_per_play)
      .def_rw("success_rate", &gridsim::LeaguePriors::success_rate)
      .def_rw("pass_success_rate", &gridsim::LeaguePriors::pass_success_rate)
      .def_rw("rush_success_rate", &gridsim::LeaguePriors::rush_success_rate)
      .def_rw("turnover_rate", &gridsim::LeaguePriors::turnover_rate)
      .def_rw("takeaway_rate", &gridsim::LeaguePriors::takeaway_rate)
      .def_rw("explosive_rate", &gridsim::LeaguePriors::explosive_rate)
      .def_rw("red_zone_td_pct", &gridsim::LeaguePriors::red_zone_td_pct)
      .def_rw("field_goal_make_pct", &gridsim::LeaguePriors::field_goal_make_pct)
      .def_rw("punt_net_yards", &gridsim::LeaguePriors::punt_net_yards)
      .def_rw("kick_return_start", &gridsim::LeaguePriors::kick_return_start)
      .def_rw("seconds_per_play", &gridsim::LeaguePriors::seconds_per_play)
      .def_rw("pass_rate", &gridsim::LeaguePriors::pass_rate)
      .def_rw("fourth_down_aggressiveness",
              &gridsim::LeaguePriors::fourth_down_aggressiveness)
      .def_rw("sack_rate", &gridsim::LeaguePriors::sack_rate);

  nanobind::class_<gridsim::ProfileConfig>(m, "ProfileConfig")
      .def(nanobind::init<>())
      .def_rw("league", &gridsim::ProfileConfig::league)
      .def_rw("prior_games", &gridsim::ProfileConfig::prior_games)
      .def_rw("weather_pass_penalty", &gridsim::ProfileConfig::weather_pass_penalty)
      .def_rw("weather_epa_penalty", &gridsim::ProfileConfig::weather_epa_penalty)
      .def_rw("weather_fg_penalty", &gridsim::ProfileConfig::weather_fg_penalty)
      .def_rw("short_rest_penalty", &gridsim::ProfileConfig::short_rest_penalty)
      .def_rw("extra_rest_bonus", &gridsim::ProfileConfig::extra_rest_bonus)
      .def_rw("injury_epa_scale", &gridsim::ProfileConfig::injury_epa_scale)
      .def_rw("offensive_plays_per_game",
              &gridsim::ProfileConfig::offensive_plays_per_game)
      .def_rw("proxy_success_sd", &gridsim::ProfileConfig::proxy_success_sd)
      .def_rw("proxy_sack_sd", &gridsim::ProfileConfig::proxy_sack_sd);

  nanobind::class_<gridsim::MatchupConfig>(m, "MatchupConfig")
      .def(nanobind::init<>())
      .def_rw("mismatch_clamp", &gridsim::MatchupConfig::mismatch_clamp);

  nanobind::class_<gridsim::SpecialTeamsConfig>(m, "SpecialTeamsConfig")
      .def(nanobind::init<>())
      .def_rw("kickoff_touchback_rate", &gridsim::SpecialTeamsConfig::kickoff_touchback_rate)
      .def_rw("touchback_yardline", &gridsim::SpecialTeamsConfig::touchback_yardline)
      .def_rw("kick_return_sd", &gridsim::SpecialTeamsConfig::kick_return_sd)
      .def_rw("punt_net_sd", &gridsim::SpecialTeamsConfig::punt_net_sd)
      .def_rw("max_field_goal_distance",
              &gridsim::SpecialTeamsConfig::max_field_goal_distance)
      .def_rw("extra_point_make_pct", &gridsim::SpecialTeamsConfig::extra_point_make_pct)
      .def_rw("two_point_rate", &gridsim::SpecialTeamsConfig::two_point_rate)
      .def_rw("interception_return_mean",
              &gridsim::SpecialTeamsConfig::interception_return_mean);

  nanobind::class_<gridsim::DriveConfig>(m, "DriveConfig")
      .def(nanobind::init<>())
      .def_rw("max_plays_per_drive", &gridsim::DriveConfig::max_plays_per_drive)
      .def_rw("two_minute_seconds", &gridsim::DriveConfig::two_minute_seconds)
      .def_rw("script_threshold", &gridsim::DriveConfig::script_threshold)
      .def_rw("script_pass_shift", &gridsim::DriveConfig::script_pass_shift)
      .def_rw("two_minute_pass_shift", &gridsim::DriveConfig::two_minute_pass_shift)
      .def_rw("clock_control_extra_seconds",
              &gridsim::DriveConfig::clock_control_extra_seconds)
      .def_rw("hurry_up_saved_seconds", &gridsim::DriveConfig::hurry_up_saved_seconds)
      .def_rw("base_pressure_rate", &gridsim::DriveConfig::base_pressure_rate)
      .def_rw("pressure_beta", &gridsim::DriveConfig::pressure_beta)
      .def_rw("pressure_min", &gridsim::DriveConfig::pressure_min)
      .def_rw("pressure_max", &gridsim::DriveConfig::pressure_max)
      .def_rw("sack_share", &gridsim::DriveConfig::sack_share)
      .def_rw("scramble_share", &gridsim::DriveConfig::scramble_share)
      .def_rw("throwaway_share", &gridsim::DriveConfig::throwaway_share)
      .def_rw("base_completion", &gridsim::DriveConfig::base_completion)
      .def_rw("pressure_completion_penalty",
              &gridsim::DriveConfig::pressure_completion_penalty)
      .def_rw("coverage_beta", &gridsim::DriveConfig::coverage_beta)
      .def_rw("base_int_clean", &gridsim::DriveConfig::base_int_clean)
      .def_rw("base_int_pressure", &gridsim::DriveConfig::base_int_pressure)
      .def_rw("explosive_pass_rate", &gridsim::DriveConfig::explosive_pass_rate)
      .def_rw("base_completion_yards", &gridsim::DriveConfig::base_completion_yards)
      .def_rw("base_run_yards", &gridsim::DriveConfig::base_run_yards)
      .def_rw("run_yards_sd", &gridsim::DriveConfig::run_yards_sd)
      .def_rw("run_block_beta", &gridsim::DriveConfig::run_block_beta)
      .def_rw("explosive_run_rate", &gridsim::DriveConfig::explosive_run_rate)
      .def_rw("base_fumble_lost_rate", &gridsim::DriveConfig::base_fumble_lost_rate)
      .def_rw("red_zone_td_rate", &gridsim::DriveConfig::red_zone_td_rate)
      .def_rw("goal_line_td_rate", &gridsim::DriveConfig::goal_line_td_rate)
      .def_rw("aggressiveness_weight", &gridsim::DriveConfig::aggressiveness_weight)
      .def_rw("aggressiveness_band", &gridsim::DriveConfig::aggressiveness_band)
      .def_rw("special_teams", &gridsim::DriveConfig::special_teams);

  nanobind::class_<gridsim::GameConfig>(m, "GameConfig")
      .def(nanobind::init<>())
      .def_rw("home_field_points", &gridsim::GameConfig::home_field_points)
      .def_rw("overtime_tie_probability", &gridsim::GameConfig::overtime_tie_probability)
      .def_rw("max_drives_per_game", &gridsim::GameConfig::max_drives_per_game)
      .def_rw("drive", &gridsim::GameConfig::drive);

  nanobind::class_<gridsim::ConvictionConfig>(m, "ConvictionConfig")
      .def(nanobind::init<>())
      .def_rw("spread_high_edge", &gridsim::ConvictionConfig::spread_high_edge)
      .def_rw("spread_medium_edge", &gridsim::ConvictionConfig::spread_medium_edge)
      .def_rw("total_high_edge", &gridsim::ConvictionConfig::total_high_edge)
      .def_rw("total_medium_edge", &gridsim::ConvictionConfig::total_medium_edge)
      .def_rw("high_side_probability", &gridsim::ConvictionConfig::high_side_probability)
      .def_rw("medium_side_probability",
              &gridsim::ConvictionConfig::medium_side_probability);

  nanobind::class_<gridsim::CenteringConfig>(m, "CenteringConfig")
      .def(nanobind::init<>())
      .def_rw("enabled", &gridsim::CenteringConfig::enabled)
      .def_rw("alpha", &gridsim::CenteringConfig::alpha)
      .def_rw("min_scale", &gridsim::CenteringConfig::min_scale)
      .def_rw("max_scale", &gridsim::CenteringConfig::max_scale)
      .def_rw("tolerance", &gridsim::CenteringConfig::tolerance)
      .def_rw("blowout_margin", &gridsim::CenteringConfig::blowout_margin)
      .def_rw("close_margin", &gridsim::CenteringConfig::close_margin)
      .def_rw("low_total", &gridsim::CenteringConfig::low_total)
      .def_rw("high_total", &gridsim::CenteringConfig::high_total);

  nanobind::class_<gridsim::SimConfig>(m, "SimConfig")
      .def(nanobind::init<>())
      .def_rw("n_trials", &gridsim::SimConfig::n_trials)
      .def_rw("seed", &gridsim::SimConfig::seed)
      .def_rw("min_trials", &gridsim::SimConfig::min_trials)
      .def_rw("time_budget_ms", &gridsim::SimConfig::time_budget_ms)
      .def_rw("n_threads", &gridsim::SimConfig::n_threads)
      .def_rw("chunk_size", &gridsim::SimConfig::chunk_size)
      .def_rw("max_discard_rate", &gridsim::SimConfig::max_discard_rate)
      .def_rw("game", &gridsim::SimConfig::game)
      .def_rw("matchup", &gridsim::SimConfig::matchup)
      .def_rw("conviction", &gridsim::SimConfig::conviction)
      .def_rw("centering", &gridsim::SimConfig::centering);

  nanobind::class_<gridsim::CalibrationConfig>(m, "CalibrationConfig")
      .def(nanobind::init<>())
      .def_rw("window_weeks", &gridsim::CalibrationConfig::window_weeks)
      .def_rw("min_history_weeks", &gridsim::CalibrationConfig::min_history_weeks)
      .def_rw("damping", &gridsim::CalibrationConfig::damping)
      .def_rw("materiality_z", &gridsim::CalibrationConfig::materiality_z)
      .def_rw("clamp_points", &gridsim::CalibrationConfig::clamp_points)
      .def_rw("clamp_epa", &gridsim::CalibrationConfig::clamp_epa)
      .def_rw("clamp_pressure", &gridsim::CalibrationConfig::clamp_pressure);

  nanobind::enum_<gridsim::ProbabilityMethod>(m, "ProbabilityMethod")
      .value("Isotonic", gridsim::ProbabilityMethod::Isotonic)
      .value("Platt", gridsim::ProbabilityMethod::Platt);

  nanobind::class_<gridsim::ProbabilityConfig>(m, "ProbabilityConfig")
      .def(nanobind::init<>())
      .def_rw("enabled", &gridsim::ProbabilityConfig::enabled)
      .def_rw("method", &gridsim::ProbabilityConfig::method)
      .def_rw("z_cap", &gridsim::ProbabilityConfig::z_cap)
      .def_rw("min_samples", &gridsim::ProbabilityConfig::min_samples)
      .def_rw("fallback_slope", &gridsim::ProbabilityConfig::fallback_slope)
      .def_rw("blend", &gridsim::ProbabilityConfig::blend)
      .def_rw("blend_min_weight", &gridsim::ProbabilityConfig::blend_min_weight)
      .def_rw("blend_max_weight", &gridsim::ProbabilityConfig::blend_max_weight)
      .def_rw("blend_full_z", &gridsim::ProbabilityConfig::blend_full_z)
      .def_rw("platt_max_iterations", &gridsim::ProbabilityConfig::platt_max_iterations)
      .def_rw("platt_l2", &gridsim::ProbabilityConfig::platt_l2);

  nanobind::class_<gridsim::BacktestConfig>(m, "BacktestConfig")
      .def(nanobind::init<>())
      .def_rw("seed", &gridsim::BacktestConfig::seed)
      .def_rw("spread_min_edge", &gridsim::BacktestConfig::spread_min_edge)
      .def_rw("total_min_edge", &gridsim::BacktestConfig::total_min_edge)
      .def_rw("price", &gridsim::BacktestConfig::price)
      .def_rw("calibrate", &gridsim::BacktestConfig::calibrate)
      .def_rw("probability", &gridsim::BacktestConfig::probability);

  nanobind::class_<gridsim::EngineConfig>(m, "EngineConfig")
      .def(nanobind::init<>())
      .def_rw("profile", &gridsim::EngineConfig::profile)
      .def_rw("sim", &gridsim::EngineConfig::sim)
      .def_rw("calibration", &gridsim::EngineConfig::calibration)
      .def_rw("backtest", &gridsim::EngineConfig::backtest)
      .def("validate", &gridsim::EngineConfig::validate);

  // Profiles
  nanobind::enum_<gridsim::Unit>(m, "Unit")
      .value("PassBlock", gridsim::Unit::PassBlock)
      .value("PassRush", gridsim::Unit::PassRush)
      .value("RunBlock", gridsim::Unit::RunBlock)
      .value("RunDefense", gridsim::Unit::RunDefense)
      .value("Coverage", gridsim::Unit::Coverage)
      .value("Receiving", gridsim::Unit::Receiving);

  nanobind::class_<gridsim::Ratings>(m, "Ratings")
      .def_ro("off_epa", &gridsim::Ratings::off_epa)
      .def_ro("off_pass_epa", &gridsim::Ratings::off_pass_epa)
      .def_ro("off_rush_epa", &gridsim::Ratings::off_rush_epa)
      .def_ro("def_epa", &gridsim::Ratings::def_epa)
      .def_ro("def_pass_epa", &gridsim::Ratings::def_pass_epa)
      .def_ro("def_rush_epa", &gridsim::Ratings::def_rush_epa)
      .def_ro("off_success", &gridsim::Ratings::off_success)
      .def_ro("def_success", &gridsim::Ratings::def_success)
      .def_ro("turnover_rate", &gridsim::Ratings::turnover_rate)
      .def_ro("takeaway_rate", &gridsim::Ratings::takeaway_rate)
      .def_ro("red_zone_td_pct", &gridsim::Ratings::red_zone_td_pct)
      .def_ro("field_goal_make_pct", &gridsim::Ratings::field_goal_make_pct)
      .def_ro("seconds_per_play", &gridsim::Ratings::seconds_per_play)
      .def_ro("pass_rate", &gridsim::Ratings::pass_rate)
      .def_ro("aggressiveness", &gridsim::Ratings::aggressiveness)
      .def_ro("pressure_adjust", &gridsim::Ratings::pressure_adjust);

  nanobind::class_<gridsim::TeamProfile>(m, "TeamProfile")
      .def_prop_ro("team", &gridsim::TeamProfile::team)
      .def_prop_ro("season", &gridsim::TeamProfile::season)
      .def_prop_ro("week", &gridsim::TeamProfile::week)
      .def_prop_ro("ratings", &gridsim::TeamProfile::ratings)
      .def("has_advanced_grades", &gridsim::TeamProfile::has_advanced_grades)
      .def("unit_grade", &gridsim::TeamProfile::unit_grade)
      .def("__repr__", [](const gridsim::TeamProfile &p) {
        return fmt::format("TeamProfile(team={}, season={}, week={}, graded={}, "
                           "off_epa={:.4f}, def_epa={:.4f})",
                           p.team(), p.season(), p.week(), p.has_advanced_grades(),
                           p.ratings().off_epa, p.ratings().def_epa);
      });
  nanobind::class_<gridsim::GradedProfile, gridsim::TeamProfile>(m, "GradedProfile");
  nanobind::class_<gridsim::ProxyProfile, gridsim::TeamProfile>(m, "ProxyProfile");

  nanobind::class_<gridsim::ProfileBuilder>(m, "ProfileBuilder")
      .def(nanobind::init<const gridsim::StatsTable &, const gridsim::ProfileConfig &,
                          const gridsim::CalibrationStore *>(),
           nanobind::arg("stats"), nanobind::arg("cfg"),
           nanobind::arg("calibration") = nullptr, nanobind::keep_alive<1, 2>(),
           nanobind::keep_alive<1, 4>())
      .def("build_profile",
           [](const gridsim::ProfileBuilder &b, const std::string &team, int season,
              int week, const gridsim::SituationalOverrides &overrides) {
             return unconst(b.build_profile(team, season, week, overrides));
           },
           nanobind::arg("team"), nanobind::arg("season"), nanobind::arg("week"),
           nanobind::arg("overrides") = gridsim::SituationalOverrides{});

  // Simulation
  nanobind::class_<gridsim::DistributionSummary>(m, "DistributionSummary")
      .def(nanobind::init<>())
      .def_rw("mean", &gridsim::DistributionSummary::mean)
      .def_rw("median", &gridsim::DistributionSummary::median)
      .def_rw("variance", &gridsim::DistributionSummary::variance)
      .def_rw("p10", &gridsim::DistributionSummary::p10)
      .def_rw("p90", &gridsim::DistributionSummary::p90)
      .def("__repr__", [](const gridsim::DistributionSummary &d) {
        return fmt::format("DistributionSummary(mean={:.2f}, median={}, "
                           "variance={:.2f}, p10={}, p90={})",
                           d.mean, d.median, d.variance, d.p10, d.p90);
      });

  nanobind::class_<gridsim::CenteredSummary>(m, "CenteredSummary")
      .def(nanobind::init<>())
      .def_rw("scale", &gridsim::CenteredSummary::scale)
      .def_rw("raw_margin_mean", &gridsim::CenteredSummary::raw_margin_mean)
      .def_rw("raw_total_mean", &gridsim::CenteredSummary::raw_total_mean)
      .def_rw("target_margin", &gridsim::CenteredSummary::target_margin)
      .def_rw("target_total", &gridsim::CenteredSummary::target_total)
      .def_rw("margin", &gridsim::CenteredSummary::margin)
      .def_rw("total", &gridsim::CenteredSummary::total)
      .def_rw("home_cover_prob", &gridsim::CenteredSummary::home_cover_prob)
      .def_rw("over_prob", &gridsim::CenteredSummary::over_prob)
      .def_rw("blowout_prob", &gridsim::CenteredSummary::blowout_prob)
      .def_rw("close_game_prob", &gridsim::CenteredSummary::close_game_prob)
      .def_rw("low_scoring_prob", &gridsim::CenteredSummary::low_scoring_prob)
      .def_rw("high_scoring_prob", &gridsim::CenteredSummary::high_scoring_prob)
      .def_rw("within_tolerance", &gridsim::CenteredSummary::within_tolerance);

  nanobind::class_<gridsim::TeamBatchStats>(m, "TeamBatchStats")
      .def(nanobind::init<>())
      .def_rw("pressure_rate", &gridsim::TeamBatchStats::pressure_rate)
      .def_rw("epa_per_play", &gridsim::TeamBatchStats::epa_per_play)
      .def_rw("sacks_per_game", &gridsim::TeamBatchStats::sacks_per_game)
      .def_rw("turnovers_per_game", &gridsim::TeamBatchStats::turnovers_per_game)
      .def_rw("drives_per_game", &gridsim::TeamBatchStats::drives_per_game);

  nanobind::enum_<gridsim::ConvictionTier>(m, "ConvictionTier")
      .value("Low", gridsim::ConvictionTier::Low)
      .value("Medium", gridsim::ConvictionTier::Medium)
      .value("High", gridsim::ConvictionTier::High);

  nanobind::enum_<gridsim::Confidence>(m, "Confidence")
      .value("Full", gridsim::Confidence::Full)
      .value("Low", gridsim::Confidence::Low);

  nanobind::class_<gridsim::SimulationBatch>(m, "SimulationBatch")
      .def(nanobind::init<>())
      .def_rw("trials_target", &gridsim::SimulationBatch::trials_target)
      .def_rw("trials_completed", &gridsim::SimulationBatch::trials_completed)
      .def_rw("trials_discarded", &gridsim::SimulationBatch::trials_discarded)
      .def_rw("capped_drives", &gridsim::SimulationBatch::capped_drives)
      .def_rw("overtime_games", &gridsim::SimulationBatch::overtime_games)
      .def_rw("seed", &gridsim::SimulationBatch::seed)
      .def_rw("home_score", &gridsim::SimulationBatch::home_score)
      .def_rw("away_score", &gridsim::SimulationBatch::away_score)
      .def_rw("margin", &gridsim::SimulationBatch::margin)
      .def_rw("total", &gridsim::SimulationBatch::total)
      .def_rw("margins", &gridsim::SimulationBatch::margins)
      .def_rw("totals", &gridsim::SimulationBatch::totals)
      .def_rw("home_win_prob", &gridsim::SimulationBatch::home_win_prob)
      .def_rw("away_win_prob", &gridsim::SimulationBatch::away_win_prob)
      .def_rw("tie_prob", &gridsim::SimulationBatch::tie_prob)
      .def_rw("market", &gridsim::SimulationBatch::market)
      .def_rw("home_cover_prob", &gridsim::SimulationBatch::home_cover_prob)
      .def_rw("away_cover_prob", &gridsim::SimulationBatch::away_cover_prob)
      .def_rw("spread_push_prob", &gridsim::SimulationBatch::spread_push_prob)
      .def_rw("over_prob", &gridsim::SimulationBatch::over_prob)
      .def_rw("under_prob", &gridsim::SimulationBatch::under_prob)
      .def_rw("total_push_prob", &gridsim::SimulationBatch::total_push_prob)
      .def_rw("spread_edge", &gridsim::SimulationBatch::spread_edge)
      .def_rw("total_edge", &gridsim::SimulationBatch::total_edge)
      .def_rw("spread_tier", &gridsim::SimulationBatch::spread_tier)
      .def_rw("total_tier", &gridsim::SimulationBatch::total_tier)
      .def_rw("home", &gridsim::SimulationBatch::home)
      .def_rw("away", &gridsim::SimulationBatch::away)
      .def_rw("centered", &gridsim::SimulationBatch::centered)
      .def_rw("truncated", &gridsim::SimulationBatch::truncated)
      .def_rw("insufficient_sample", &gridsim::SimulationBatch::insufficient_sample)
      .def_rw("unreliable", &gridsim::SimulationBatch::unreliable)
      .def_rw("proxy_mode", &gridsim::SimulationBatch::proxy_mode)
      .def_rw("confidence", &gridsim::SimulationBatch::confidence)
      .def("stakeable", &gridsim::SimulationBatch::stakeable)
      .def("__repr__", [](const gridsim::SimulationBatch &b) {
        return fmt::format("SimulationBatch(trials={}/{}, margin_median={}, "
                           "total_median={}, home_win={:.3f}, spread_tier={}, "
                           "total_tier={})",
                           b.trials_completed, b.trials_target, b.margin.median,
                           b.total.median, b.home_win_prob,
                           gridsim::tier_name(b.spread_tier),
                           gridsim::tier_name(b.total_tier));
      });

  nanobind::class_<gridsim::Simulator>(m, "Simulator")
      .def(nanobind::init<>())
      .def("run",
           [](const gridsim::Simulator &s, const gridsim::TeamProfile &home,
              const gridsim::TeamProfile &away, const gridsim::MarketLine &market,
              const gridsim::SimConfig &cfg) {
             nanobind::gil_scoped_release release;
             return s.run(home, away, market, cfg);
           },
           nanobind::arg("home"), nanobind::arg("away"), nanobind::arg("market"),
           nanobind::arg("cfg"));

  // Calibration
  nanobind::enum_<gridsim::CalibrationMetric>(m, "CalibrationMetric")
      .value("PointsFor", gridsim::CalibrationMetric::PointsFor)
      .value("PointsAgainst", gridsim::CalibrationMetric::PointsAgainst)
      .value("OffEpaPerPlay", gridsim::CalibrationMetric::OffEpaPerPlay)
      .value("PressureRateAllowed", gridsim::CalibrationMetric::PressureRateAllowed);

  nanobind::enum_<gridsim::CalibrationStatus>(m, "CalibrationStatus")
      .value("Applied", gridsim::CalibrationStatus::Applied)
      .value("NotMaterial", gridsim::CalibrationStatus::NotMaterial)
      .value("Skipped", gridsim::CalibrationStatus::Skipped);

  nanobind::class_<gridsim::CalibrationRecord>(m, "CalibrationRecord")
      .def(nanobind::init<>())
      .def_rw("version", &gridsim::CalibrationRecord::version)
      .def_rw("team", &gridsim::CalibrationRecord::team)
      .def_rw("metric", &gridsim::CalibrationRecord::metric)
      .def_rw("season", &gridsim::CalibrationRecord::season)
      .def_rw("as_of_week", &gridsim::CalibrationRecord::as_of_week)
      .def_rw("sample_size", &gridsim::CalibrationRecord::sample_size)
      .def_rw("bias", &gridsim::CalibrationRecord::bias)
      .def_rw("bias_z", &gridsim::CalibrationRecord::bias_z)
      .def_rw("delta", &gridsim::CalibrationRecord::delta)
      .def_rw("correction", &gridsim::CalibrationRecord::correction)
      .def_rw("status", &gridsim::CalibrationRecord::status)
      .def("__repr__", [](const gridsim::CalibrationRecord &r) {
        return fmt::format("CalibrationRecord(v{}, team={}, metric={}, season={}, "
                           "as_of_week={}, n={}, bias={:+.4f}, correction={:+.4f})",
                           r.version, r.team, gridsim::metric_name(r.metric),
                           r.season, r.as_of_week, r.sample_size, r.bias,
                           r.correction);
      });

  nanobind::class_<gridsim::TeamGameObservation>(m, "TeamGameObservation")
      .def(nanobind::init<>())
      .def_rw("team", &gridsim::TeamGameObservation::team)
      .def_rw("season", &gridsim::TeamGameObservation::season)
      .def_rw("week", &gridsim::TeamGameObservation::week)
      .def_rw("simulated", &gridsim::TeamGameObservation::simulated)
      .def_rw("actual", &gridsim::TeamGameObservation::actual);

  nanobind::class_<gridsim::CalibrationStore>(m, "CalibrationStore")
      .def(nanobind::init<>())
      .def("commit_week", &gridsim::CalibrationStore::commit_week)
      .def("is_committed", &gridsim::CalibrationStore::is_committed)
      .def("active_record", &gridsim::CalibrationStore::active_record,
           nanobind::rv_policy::reference_internal)
      .def("correction", &gridsim::CalibrationStore::correction)
      .def("snapshot", &gridsim::CalibrationStore::snapshot)
      .def("history", &gridsim::CalibrationStore::history)
      .def("latest_version", &gridsim::CalibrationStore::latest_version);

  nanobind::class_<gridsim::Calibrator>(m, "Calibrator")
      .def(nanobind::init<const gridsim::CalibrationConfig &>())
      .def("compute_week", &gridsim::Calibrator::compute_week)
      .def("run_week", &gridsim::Calibrator::run_week);

  // Backtest
  nanobind::class_<gridsim::HistoricalGame>(m, "HistoricalGame")
      .def(nanobind::init<>())
      .def_rw("game_id", &gridsim::HistoricalGame::game_id)
      .def_rw("season", &gridsim::HistoricalGame::season)
      .def_rw("week", &gridsim::HistoricalGame::week)
      .def_rw("home", &gridsim::HistoricalGame::home)
      .def_rw("away", &gridsim::HistoricalGame::away)
      .def_rw("kickoff", &gridsim::HistoricalGame::kickoff)
      .def_rw("market", &gridsim::HistoricalGame::market)
      .def_rw("home_score", &gridsim::HistoricalGame::home_score)
      .def_rw("away_score", &gridsim::HistoricalGame::away_score)
      .def_rw("home_overrides", &gridsim::HistoricalGame::home_overrides)
      .def_rw("away_overrides", &gridsim::HistoricalGame::away_overrides)
      .def_rw("home_off_epa", &gridsim::HistoricalGame::home_off_epa)
      .def_rw("away_off_epa", &gridsim::HistoricalGame::away_off_epa)
      .def_rw("home_pressure_rate", &gridsim::HistoricalGame::home_pressure_rate)
      .def_rw("away_pressure_rate", &gridsim::HistoricalGame::away_pressure_rate);

  nanobind::enum_<gridsim::BetSide>(m, "BetSide")
      .value("Home", gridsim::BetSide::Home)
      .value("Away", gridsim::BetSide::Away)
      .value("Over", gridsim::BetSide::Over)
      .value("Under", gridsim::BetSide::Under);

  nanobind::enum_<gridsim::BetGrade>(m, "BetGrade")
      .value("Win", gridsim::BetGrade::Win)
      .value("Loss", gridsim::BetGrade::Loss)
      .value("Push", gridsim::BetGrade::Push);

  nanobind::class_<gridsim::BetResult>(m, "BetResult")
      .def(nanobind::init<>())
      .def_rw("grade", &gridsim::BetResult::grade)
      .def_rw("profit", &gridsim::BetResult::profit);

  m.def("grade_bet", &gridsim::grade_bet, nanobind::arg("side"),
        nanobind::arg("line"), nanobind::arg("home_score"),
        nanobind::arg("away_score"), nanobind::arg("price") = -110);

  nanobind::class_<gridsim::GradedBet>(m, "GradedBet")
      .def(nanobind::init<>())
      .def_rw("side", &gridsim::GradedBet::side)
      .def_rw("line", &gridsim::GradedBet::line)
      .def_rw("closing_line", &gridsim::GradedBet::closing_line)
      .def_rw("edge", &gridsim::GradedBet::edge)
      .def_rw("tier", &gridsim::GradedBet::tier)
      .def_rw("grade", &gridsim::GradedBet::grade)
      .def_rw("profit", &gridsim::GradedBet::profit)
      .def_rw("clv_points", &gridsim::GradedBet::clv_points)
      .def("__repr__", [](const gridsim::GradedBet &b) {
        return fmt::format("GradedBet(side={}, line={}, closing_line={}, edge={:+.2f}, "
                           "tier={}, grade={}, profit={:+.3f})",
                           gridsim::side_name(b.side), b.line, b.closing_line,
                           b.edge, gridsim::tier_name(b.tier),
                           gridsim::grade_name(b.grade), b.profit);
      });

  nanobind::enum_<gridsim::PredictionStatus>(m, "PredictionStatus")
      .value("Predicted", gridsim::PredictionStatus::Predicted)
      .value("NoPrediction", gridsim::PredictionStatus::NoPrediction);

  nanobind::class_<gridsim::BacktestRecord>(m, "BacktestRecord")
      .def(nanobind::init<>())
      .def_rw("game_id", &gridsim::BacktestRecord::game_id)
      .def_rw("season", &gridsim::BacktestRecord::season)
      .def_rw("week", &gridsim::BacktestRecord::week)
      .def_rw("home", &gridsim::BacktestRecord::home)
      .def_rw("away", &gridsim::BacktestRecord::away)
      .def_rw("status", &gridsim::BacktestRecord::status)
      .def_rw("reason", &gridsim::BacktestRecord::reason)
      .def_rw("predicted_margin", &gridsim::BacktestRecord::predicted_margin)
      .def_rw("predicted_total", &gridsim::BacktestRecord::predicted_total)
      .def_rw("home_win_prob", &gridsim::BacktestRecord::home_win_prob)
      .def_rw("actual_margin", &gridsim::BacktestRecord::actual_margin)
      .def_rw("actual_total", &gridsim::BacktestRecord::actual_total)
      .def_rw("margin_error", &gridsim::BacktestRecord::margin_error)
      .def_rw("total_error", &gridsim::BacktestRecord::total_error)
      .def_rw("spread_tier", &gridsim::BacktestRecord::spread_tier)
      .def_rw("total_tier", &gridsim::BacktestRecord::total_tier)
      .def_rw("confidence", &gridsim::BacktestRecord::confidence)
      .def_rw("home_points_mean", &gridsim::BacktestRecord::home_points_mean)
      .def_rw("away_points_mean", &gridsim::BacktestRecord::away_points_mean)
      .def_rw("home_epa_per_play", &gridsim::BacktestRecord::home_epa_per_play)
      .def_rw("away_epa_per_play", &gridsim::BacktestRecord::away_epa_per_play)
      .def_rw("home_pressure_rate", &gridsim::BacktestRecord::home_pressure_rate)
      .def_rw("away_pressure_rate", &gridsim::BacktestRecord::away_pressure_rate)
      .def_rw("z_spread", &gridsim::BacktestRecord::z_spread)
      .def_rw("z_total", &gridsim::BacktestRecord::z_total)
      .def_rw("raw_home_cover_prob", &gridsim::BacktestRecord::raw_home_cover_prob)
      .def_rw("raw_over_prob", &gridsim::BacktestRecord::raw_over_prob)
      .def_rw("home_cover_prob", &gridsim::BacktestRecord::home_cover_prob)
      .def_rw("over_prob", &gridsim::BacktestRecord::over_prob)
      .def_rw("probabilities_fitted", &gridsim::BacktestRecord::probabilities_fitted)
      .def_rw("spread_outcome", &gridsim::BacktestRecord::spread_outcome)
      .def_rw("total_outcome", &gridsim::BacktestRecord::total_outcome)
      .def_rw("spread_bet", &gridsim::BacktestRecord::spread_bet)
      .def_rw("total_bet", &gridsim::BacktestRecord::total_bet)
      .def_rw("latest_input_timestamp", &gridsim::BacktestRecord::latest_input_timestamp)
      .def_rw("seed", &gridsim::BacktestRecord::seed);

  nanobind::class_<gridsim::TierAccuracy>(m, "TierAccuracy")
      .def(nanobind::init<>())
      .def_rw("bets", &gridsim::TierAccuracy::bets)
      .def_rw("wins", &gridsim::TierAccuracy::wins)
      .def_rw("losses", &gridsim::TierAccuracy::losses)
      .def_rw("pushes", &gridsim::TierAccuracy::pushes)
      .def_rw("profit", &gridsim::TierAccuracy::profit)
      .def("win_rate", &gridsim::TierAccuracy::win_rate);

  nanobind::class_<gridsim::BacktestSummary>(m, "BacktestSummary")
      .def(nanobind::init<>())
      .def_rw("games", &gridsim::BacktestSummary::games)
      .def_rw("predicted", &gridsim::BacktestSummary::predicted)
      .def_rw("no_prediction", &gridsim::BacktestSummary::no_prediction)
      .def_rw("margin_mae", &gridsim::BacktestSummary::margin_mae)
      .def_rw("total_mae", &gridsim::BacktestSummary::total_mae)
      .def_rw("straight_up_accuracy", &gridsim::BacktestSummary::straight_up_accuracy)
      .def_rw("spread", &gridsim::BacktestSummary::spread)
      .def_rw("totals", &gridsim::BacktestSummary::totals)
      .def_rw("by_tier", &gridsim::BacktestSummary::by_tier)
      .def_rw("bets", &gridsim::BacktestSummary::bets)
      .def_rw("pushes", &gridsim::BacktestSummary::pushes)
      .def_rw("profit_units", &gridsim::BacktestSummary::profit_units)
      .def_rw("clv_bets", &gridsim::BacktestSummary::clv_bets)
      .def_rw("clv_beats", &gridsim::BacktestSummary::clv_beats)
      .def_rw("clv_rate", &gridsim::BacktestSummary::clv_rate)
      .def_rw("avg_clv", &gridsim::BacktestSummary::avg_clv)
      .def_rw("spread_brier_games", &gridsim::BacktestSummary::spread_brier_games)
      .def_rw("total_brier_games", &gridsim::BacktestSummary::total_brier_games)
      .def_rw("spread_brier_raw", &gridsim::BacktestSummary::spread_brier_raw)
      .def_rw("spread_brier_calibrated",
              &gridsim::BacktestSummary::spread_brier_calibrated)
      .def_rw("total_brier_raw", &gridsim::BacktestSummary::total_brier_raw)
      .def_rw("total_brier_calibrated", &gridsim::BacktestSummary::total_brier_calibrated)
      .def("__repr__", [](const gridsim::BacktestSummary &s) {
        return fmt::format("BacktestSummary(games={}, predicted={}, margin_mae={:.2f}, "
                           "total_mae={:.2f}, bets={}, pushes={}, profit_units={:+.2f}, "
                           "clv_rate={:.3f})",
                           s.games, s.predicted, s.margin_mae, s.total_mae, s.bets,
                           s.pushes, s.profit_units, s.clv_rate);
      });

  m.def("summarize_backtest", &gridsim::summarize_backtest);

  // Market centering and probability calibration
  m.def("center_scores_to_market", &gridsim::center_scores_to_market,
        nanobind::arg("home"), nanobind::arg("away"), nanobind::arg("market"),
        nanobind::arg("cfg") = gridsim::CenteringConfig{});
  nanobind::class_<gridsim::CenteredScores>(m, "CenteredScores")
      .def_ro("home", &gridsim::CenteredScores::home)
      .def_ro("away", &gridsim::CenteredScores::away)
      .def_ro("scale", &gridsim::CenteredScores::scale)
      .def_ro("target_margin", &gridsim::CenteredScores::target_margin)
      .def_ro("target_total", &gridsim::CenteredScores::target_total);
  m.def("summarize_centered", &gridsim::summarize_centered, nanobind::arg("margins"),
        nanobind::arg("totals"), nanobind::arg("market"),
        nanobind::arg("cfg") = gridsim::CenteringConfig{});
  m.def("brier_score", &gridsim::brier_score, nanobind::arg("probabilities"),
        nanobind::arg("outcomes"));
  m.def("z_score", &gridsim::z_score, nanobind::arg("mean"), nanobind::arg("sd"),
        nanobind::arg("line"), nanobind::arg("cap") = 3.0);
  m.def("blend_toward_neutral", &gridsim::blend_toward_neutral, nanobind::arg("p"),
        nanobind::arg("z"), nanobind::arg("cfg"));

  nanobind::class_<gridsim::ProbabilityCalibrator>(m, "ProbabilityCalibrator")
      .def(nanobind::init<const gridsim::ProbabilityConfig &>(),
           nanobind::arg("cfg") = gridsim::ProbabilityConfig{})
      .def("fit", &gridsim::ProbabilityCalibrator::fit, nanobind::arg("z"),
           nanobind::arg("outcomes"))
      .def("predict_z", &gridsim::ProbabilityCalibrator::predict_z)
      .def("predict", &gridsim::ProbabilityCalibrator::predict, nanobind::arg("mean"),
           nanobind::arg("sd"), nanobind::arg("line"))
      .def_prop_ro("fitted", &gridsim::ProbabilityCalibrator::fitted)
      .def_prop_ro("samples", &gridsim::ProbabilityCalibrator::samples)
      .def_prop_ro("intercept", &gridsim::ProbabilityCalibrator::intercept)
      .def_prop_ro("slope", &gridsim::ProbabilityCalibrator::slope);

  nanobind::class_<gridsim::Backtester>(m, "Backtester")
      .def(nanobind::init<const gridsim::StatsTable &, const gridsim::ProfileConfig &,
                          const gridsim::SimConfig &, const gridsim::BacktestConfig &,
                          const gridsim::CalibrationConfig &,
                          gridsim::CalibrationStore *>(),
           nanobind::arg("stats"), nanobind::arg("profile_cfg"), nanobind::arg("sim_cfg"),
           nanobind::arg("cfg"), nanobind::arg("calibration_cfg"),
           nanobind::arg("store") = nullptr, nanobind::keep_alive<1, 2>(),
           nanobind::keep_alive<1, 7>())
      .def("run",
           [](const gridsim::Backtester &b, std::vector<gridsim::HistoricalGame> games) {
             nanobind::gil_scoped_release release;
             return b.run(std::move(games));
           },
           nanobind::arg("games"))
      .def("evaluate", &gridsim::Backtester::evaluate);
}
