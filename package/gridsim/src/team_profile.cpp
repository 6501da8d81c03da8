#include "gridsim/team_profile.hpp"
#include "gridsim/calibration.hpp"
#include "gridsim/log.hpp"
#include "gridsim/rng.hpp"

#include <cmath>
#include <stdexcept>

namespace gridsim {

namespace {

void require_rate(double v, const char *field, const TeamWeekStats &s) {
  if (!(v >= 0.0 && v <= 1.0)) {
    throw std::invalid_argument(fmt::format(
        "{} season {} week {}: {} must be in [0, 1], got {}", s.team,
        s.season, s.week, field, v));
  }
}

double toward(double value, double prior, double w) {
  return w * value + (1.0 - w) * prior;
}

double to_grade(double z) { return clamp(50.0 + 10.0 * z, 0.0, 100.0); }

} // namespace

void validate_stats(const TeamWeekStats &s) {
  if (s.team.empty())
    throw std::invalid_argument("TeamWeekStats: empty team id");
  if (s.games_played < 0)
    throw std::invalid_argument(
        fmt::format("{}: games_played must be >= 0", s.team));
  require_rate(s.off_success_rate, "off_success_rate", s);
  require_rate(s.off_pass_success_rate, "off_pass_success_rate", s);
  require_rate(s.off_rush_success_rate, "off_rush_success_rate", s);
  require_rate(s.def_success_rate, "def_success_rate", s);
  require_rate(s.def_pass_success_rate, "def_pass_success_rate", s);
  require_rate(s.def_rush_success_rate, "def_rush_success_rate", s);
  require_rate(s.turnover_rate, "turnover_rate", s);
  require_rate(s.takeaway_rate, "takeaway_rate", s);
  require_rate(s.explosive_rate, "explosive_rate", s);
  require_rate(s.red_zone_td_pct, "red_zone_td_pct", s);
  require_rate(s.red_zone_td_pct_allowed, "red_zone_td_pct_allowed", s);
  require_rate(s.field_goal_make_pct, "field_goal_make_pct", s);
  require_rate(s.neutral_pass_rate, "neutral_pass_rate", s);
  require_rate(s.fourth_down_aggressiveness, "fourth_down_aggressiveness", s);
  if (s.sack_rate_allowed)
    require_rate(*s.sack_rate_allowed, "sack_rate_allowed", s);
  if (s.def_sack_rate)
    require_rate(*s.def_sack_rate, "def_sack_rate", s);
  if (!(s.seconds_per_play > 0.0))
    throw std::invalid_argument(
        fmt::format("{}: seconds_per_play must be positive", s.team));
}

std::optional<double> GradedProfile::unit_grade(Unit unit) const {
  switch (unit) {
  case Unit::PassBlock: return grades_.pass_block;
  case Unit::PassRush: return grades_.pass_rush;
  case Unit::RunBlock: return grades_.run_block;
  case Unit::RunDefense: return grades_.run_defense;
  case Unit::Coverage: return grades_.coverage;
  case Unit::Receiving: return grades_.receiving;
  }
  return std::nullopt;
}

ProfilePtr ProfileBuilder::build_profile(const std::string &team, int season,
                                         int week,
                                         const SituationalOverrides &overrides) const {
  const TeamWeekStats &s = stats_->get(team, season, week);
  validate_stats(s);

  Ratings r = shrink(s);
  apply_overrides(r, overrides);
  apply_calibration(r, team, season, week);

  if (s.grades) {
    return std::make_shared<GradedProfile>(team, season, week, r, cfg_.league,
                                           *s.grades);
  }
  log_warn("GradeMissing: {} season {} week {} has no unit grades, using "
           "efficiency proxies",
           team, season, week);
  return std::make_shared<ProxyProfile>(team, season, week, r, cfg_.league,
                                        proxy_grades(s));
}

Ratings ProfileBuilder::shrink(const TeamWeekStats &s) const {
  const LeaguePriors &L = cfg_.league;
  const double g = static_cast<double>(s.games_played);
  const double w = (g + cfg_.prior_games > 0.0) ? g / (g + cfg_.prior_games) : 0.0;

  Ratings r;
  r.off_epa = toward(s.off_epa_per_play, L.epa_per_play, w);
  r.off_pass_epa = toward(s.off_pass_epa, L.epa_per_play, w);
  r.off_rush_epa = toward(s.off_rush_epa, L.epa_per_play, w);
  r.def_epa = toward(s.def_epa_per_play, L.epa_per_play, w);
  r.def_pass_epa = toward(s.def_pass_epa, L.epa_per_play, w);
  r.def_rush_epa = toward(s.def_rush_epa, L.epa_per_play, w);
  r.off_success = toward(s.off_success_rate, L.success_rate, w);
  r.off_pass_success = toward(s.off_pass_success_rate, L.pass_success_rate, w);
  r.off_rush_success = toward(s.off_rush_success_rate, L.rush_success_rate, w);
  r.def_success = toward(s.def_success_rate, L.success_rate, w);
  r.def_pass_success = toward(s.def_pass_success_rate, L.pass_success_rate, w);
  r.def_rush_success = toward(s.def_rush_success_rate, L.rush_success_rate, w);
  r.turnover_rate = toward(s.turnover_rate, L.turnover_rate, w);
  r.takeaway_rate = toward(s.takeaway_rate, L.takeaway_rate, w);
  r.explosive_rate = toward(s.explosive_rate, L.explosive_rate, w);
  r.red_zone_td_pct = toward(s.red_zone_td_pct, L.red_zone_td_pct, w);
  r.red_zone_td_pct_allowed =
      toward(s.red_zone_td_pct_allowed, L.red_zone_td_pct, w);
  r.field_goal_make_pct = toward(s.field_goal_make_pct, L.field_goal_make_pct, w);
  r.punt_net_yards = toward(s.punt_net_yards, L.punt_net_yards, w);
  r.kick_return_start = toward(s.kick_return_start, L.kick_return_start, w);
  r.seconds_per_play = toward(s.seconds_per_play, L.seconds_per_play, w);
  r.pass_rate = toward(s.neutral_pass_rate, L.pass_rate, w);
  r.aggressiveness =
      toward(s.fourth_down_aggressiveness, L.fourth_down_aggressiveness, w);
  return r;
}

void ProfileBuilder::apply_overrides(Ratings &r,
                                     const SituationalOverrides &o) const {
  const int weather = clamp(o.weather_severity, 0, 3);
  if (weather > 0) {
    r.off_pass_success =
        clamp(r.off_pass_success - cfg_.weather_pass_penalty * weather, 0.0, 1.0);
    r.off_pass_epa -= cfg_.weather_epa_penalty * weather;
    r.field_goal_make_pct = clamp(
        r.field_goal_make_pct - cfg_.weather_fg_penalty * weather, 0.05, 1.0);
  }

  double epa_shift = 0.0;
  if (o.short_rest)
    epa_shift -= cfg_.short_rest_penalty;
  if (o.extra_rest)
    epa_shift += cfg_.extra_rest_bonus;
  epa_shift -= cfg_.injury_epa_scale * clamp(o.injury_severity, 0.0, 1.0);

  r.off_epa += epa_shift;
  r.off_pass_epa += epa_shift;
  r.off_rush_epa += epa_shift;
}

void ProfileBuilder::apply_calibration(Ratings &r, const std::string &team,
                                       int season, int week) const {
  if (calibration_ == nullptr)
    return;
  const double plays = cfg_.offensive_plays_per_game;
  const double pf =
      calibration_->correction(team, CalibrationMetric::PointsFor, season, week);
  const double pa = calibration_->correction(
      team, CalibrationMetric::PointsAgainst, season, week);
  const double epa = calibration_->correction(
      team, CalibrationMetric::OffEpaPerPlay, season, week);
  const double pressure = calibration_->correction(
      team, CalibrationMetric::PressureRateAllowed, season, week);

  const double off_shift = pf / plays + epa;
  r.off_epa += off_shift;
  r.off_pass_epa += off_shift;
  r.off_rush_epa += off_shift;

  const double def_shift = pa / plays;
  r.def_epa += def_shift;
  r.def_pass_epa += def_shift;
  r.def_rush_epa += def_shift;

  r.pressure_adjust += pressure;

  if (pf != 0.0 || pa != 0.0 || epa != 0.0 || pressure != 0.0) {
    log_debug("{} week {}: calibration pf={:+.3f} pa={:+.3f} epa={:+.4f} "
              "pressure={:+.4f}",
              team, week, pf, pa, epa, pressure);
  }
}

std::array<std::optional<double>, kUnitCount>
ProfileBuilder::proxy_grades(const TeamWeekStats &s) const {
  const LeaguePriors &L = cfg_.league;
  const double ssd = cfg_.proxy_success_sd;
  const double ksd = cfg_.proxy_sack_sd;
  std::array<std::optional<double>, kUnitCount> g{};

  if (s.sack_rate_allowed)
    g[static_cast<std::size_t>(Unit::PassBlock)] =
        to_grade(-(*s.sack_rate_allowed - L.sack_rate) / ksd);
  if (s.def_sack_rate)
    g[static_cast<std::size_t>(Unit::PassRush)] =
        to_grade((*s.def_sack_rate - L.sack_rate) / ksd);
  g[static_cast<std::size_t>(Unit::RunBlock)] =
      to_grade((s.off_rush_success_rate - L.rush_success_rate) / ssd);
  g[static_cast<std::size_t>(Unit::RunDefense)] =
      to_grade(-(s.def_rush_success_rate - L.rush_success_rate) / ssd);
  g[static_cast<std::size_t>(Unit::Receiving)] =
      to_grade((s.off_pass_success_rate - L.pass_success_rate) / ssd);
  g[static_cast<std::size_t>(Unit::Coverage)] =
      to_grade(-(s.def_pass_success_rate - L.pass_success_rate) / ssd);
  return g;
}

} // namespace gridsim
