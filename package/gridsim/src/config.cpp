#include "gridsim/config.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace gridsim {

namespace {

void require(bool ok, const char *field, const char *rule) {
  if (!ok)
    throw std::invalid_argument(fmt::format("{} {}", field, rule));
}

void require_probability(double v, const char *field) {
  require(v >= 0.0 && v <= 1.0, field, "must be in [0, 1]");
}

void validate_drive(const DriveConfig &d) {
  require(d.max_plays_per_drive > 0, "drive.max_plays_per_drive", "must be positive");
  require(d.two_minute_seconds >= 0 && d.two_minute_seconds <= kQuarterSeconds,
          "drive.two_minute_seconds", "must be within a quarter");
  require(d.script_threshold > 0, "drive.script_threshold", "must be positive");
  require(d.aggressiveness_weight >= 0.0 && d.aggressiveness_band >= 0.0,
          "drive.aggressiveness_band", "aggressiveness weight and band must be >= 0");
  require_probability(d.base_pressure_rate, "drive.base_pressure_rate");
  require(d.pressure_min <= d.pressure_max, "drive.pressure_min",
          "must not exceed drive.pressure_max");
  require_probability(d.pressure_min, "drive.pressure_min");
  require_probability(d.pressure_max, "drive.pressure_max");
  require(d.sack_share >= 0.0 && d.scramble_share >= 0.0 && d.throwaway_share >= 0.0 &&
              d.sack_share + d.scramble_share + d.throwaway_share <= 1.0,
          "drive.sack_share", "pressure outlet shares must sum to at most 1");
  require_probability(d.base_completion, "drive.base_completion");
  require_probability(d.base_int_clean, "drive.base_int_clean");
  require_probability(d.base_int_pressure, "drive.base_int_pressure");
  require_probability(d.base_fumble_lost_rate, "drive.base_fumble_lost_rate");
  require(d.run_yards_sd > 0.0, "drive.run_yards_sd", "must be positive");
  require(d.base_completion_yards > 0.0, "drive.base_completion_yards",
          "must be positive");

  const SpecialTeamsConfig &st = d.special_teams;
  require_probability(st.kickoff_touchback_rate, "special_teams.kickoff_touchback_rate");
  require(st.touchback_yardline > 0 && st.touchback_yardline < 100,
          "special_teams.touchback_yardline", "must be in (0, 100)");
  require(st.kick_return_sd > 0.0 && st.punt_net_sd > 0.0,
          "special_teams.kick_return_sd", "return and punt spreads must be positive");
  require_probability(st.extra_point_make_pct, "special_teams.extra_point_make_pct");
  require_probability(st.two_point_rate, "special_teams.two_point_rate");
  require(st.interception_return_mean > 0.0, "special_teams.interception_return_mean",
          "must be positive");
}

} // namespace

void validate(const ProfileConfig &cfg) {
  require(cfg.prior_games >= 0.0, "profile.prior_games", "must be >= 0");
  require(cfg.offensive_plays_per_game > 0.0, "profile.offensive_plays_per_game",
          "must be positive");
  require(cfg.proxy_success_sd > 0.0, "profile.proxy_success_sd", "must be positive");
  require(cfg.proxy_sack_sd > 0.0, "profile.proxy_sack_sd", "must be positive");
  require(cfg.league.seconds_per_play > 0.0, "profile.league.seconds_per_play",
          "must be positive");
}

void validate(const SimConfig &cfg) {
  require(cfg.n_trials > 0, "sim.n_trials", "must be positive");
  require(cfg.min_trials >= 0, "sim.min_trials", "must be >= 0");
  require(cfg.time_budget_ms >= 0, "sim.time_budget_ms", "must be >= 0");
  require(cfg.n_threads >= 0, "sim.n_threads", "must be >= 0");
  require(cfg.chunk_size > 0, "sim.chunk_size", "must be positive");
  require_probability(cfg.max_discard_rate, "sim.max_discard_rate");
  require(cfg.game.max_drives_per_game > 0, "game.max_drives_per_game",
          "must be positive");
  require(cfg.game.home_field_points >= 0, "game.home_field_points", "must be >= 0");
  require_probability(cfg.game.overtime_tie_probability, "game.overtime_tie_probability");
  require(cfg.matchup.mismatch_clamp >= 0.0, "matchup.mismatch_clamp", "must be >= 0");
  require(cfg.conviction.spread_medium_edge <= cfg.conviction.spread_high_edge,
          "conviction.spread_medium_edge", "must not exceed spread_high_edge");
  require(cfg.conviction.total_medium_edge <= cfg.conviction.total_high_edge,
          "conviction.total_medium_edge", "must not exceed total_high_edge");
  require(cfg.centering.alpha >= 0.0 && cfg.centering.alpha <= 1.0, "centering.alpha",
          "must be in [0, 1]");
  require(cfg.centering.min_scale > 0.0 && cfg.centering.min_scale <= cfg.centering.max_scale,
          "centering.min_scale", "must be positive and not exceed centering.max_scale");
  require(cfg.centering.tolerance >= 0.0, "centering.tolerance", "must be >= 0");
  validate_drive(cfg.game.drive);
}

void validate(const CalibrationConfig &cfg) {
  require(cfg.window_weeks > 0, "calibration.window_weeks", "must be positive");
  require(cfg.min_history_weeks > 0, "calibration.min_history_weeks", "must be positive");
  require(cfg.min_history_weeks <= cfg.window_weeks, "calibration.min_history_weeks",
          "must not exceed window_weeks");
  require(cfg.damping > 0.0 && cfg.damping <= 1.0, "calibration.damping",
          "must be in (0, 1]");
  require(cfg.materiality_z >= 0.0, "calibration.materiality_z", "must be >= 0");
  require(cfg.clamp_points >= 0.0 && cfg.clamp_epa >= 0.0 && cfg.clamp_pressure >= 0.0,
          "calibration.clamp_points", "clamp ranges must be >= 0");
}

void validate(const BacktestConfig &cfg) {
  require(cfg.spread_min_edge >= 0.0, "backtest.spread_min_edge", "must be >= 0");
  require(cfg.total_min_edge >= 0.0, "backtest.total_min_edge", "must be >= 0");
  require(cfg.price <= -100 || cfg.price >= 100, "backtest.price",
          "must be American odds (<= -100 or >= 100)");
  const ProbabilityConfig &p = cfg.probability;
  require(p.z_cap > 0.0, "probability.z_cap", "must be positive");
  require(p.min_samples > 0, "probability.min_samples", "must be positive");
  require_probability(p.blend_min_weight, "probability.blend_min_weight");
  require_probability(p.blend_max_weight, "probability.blend_max_weight");
  require(p.blend_full_z >= 0.0, "probability.blend_full_z", "must be >= 0");
  require(p.platt_max_iterations > 0, "probability.platt_max_iterations",
          "must be positive");
  require(p.platt_l2 >= 0.0, "probability.platt_l2", "must be >= 0");
}

void EngineConfig::validate() const {
  gridsim::validate(profile);
  gridsim::validate(sim);
  gridsim::validate(calibration);
  gridsim::validate(backtest);
}

} // namespace gridsim
