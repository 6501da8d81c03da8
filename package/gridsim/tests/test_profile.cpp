#undef NDEBUG
#include "gridsim/calibration.hpp"
#include "gridsim/errors.hpp"
#include "gridsim/log.hpp"
#include "gridsim/matchup.hpp"
#include "gridsim/team_profile.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace gridsim;
using gridsim_test::near;

void test_missing_stats_throws_data_unavailable() {
  StatsTable stats;
  stats.set(gridsim_test::league_row("KC", 2023, 4));
  ProfileBuilder builder(stats, ProfileConfig{});

  bool thrown = false;
  try {
    builder.build_profile("KC", 2023, 5);
  } catch (const DataUnavailable &e) {
    thrown = true;
    assert(e.team() == "KC");
    assert(e.season() == 2023);
    assert(e.week() == 5);
  }
  assert(thrown);
  std::cout << "[PASS] test_missing_stats_throws_data_unavailable" << std::endl;
}

void test_malformed_row_rejected() {
  StatsTable stats;
  TeamWeekStats row = gridsim_test::league_row("BUF", 2023, 3);
  row.off_success_rate = 1.4;
  stats.set(row);
  ProfileBuilder builder(stats, ProfileConfig{});

  bool thrown = false;
  try {
    builder.build_profile("BUF", 2023, 3);
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);
  std::cout << "[PASS] test_malformed_row_rejected" << std::endl;
}

void test_graded_and_proxy_profiles() {
  StatsTable stats;
  TeamWeekStats graded = gridsim_test::league_row("PHI", 2023, 6);
  graded.grades = gridsim_test::flat_grades(72.0);
  stats.set(graded);

  TeamWeekStats proxy = gridsim_test::league_row("NYG", 2023, 6);
  proxy.off_rush_success_rate = 0.46; // one proxy sd above league
  proxy.sack_rate_allowed = 0.05;
  stats.set(proxy);

  TeamWeekStats bare = gridsim_test::league_row("NYJ", 2023, 6);
  stats.set(bare);

  ProfileBuilder builder(stats, ProfileConfig{});
  ProfilePtr p = builder.build_profile("PHI", 2023, 6);
  assert(p->has_advanced_grades());
  assert(near(*p->unit_grade(Unit::Coverage), 72.0));

  ProfilePtr q = builder.build_profile("NYG", 2023, 6);
  assert(!q->has_advanced_grades());
  assert(near(*q->unit_grade(Unit::RunBlock), 60.0, 1e-6));
  // lower sack rate allowed grades the line above average
  assert(*q->unit_grade(Unit::PassBlock) > 50.0);
  assert(!q->unit_grade(Unit::PassRush).has_value());

  ProfilePtr r = builder.build_profile("NYJ", 2023, 6);
  assert(!r->unit_grade(Unit::PassBlock).has_value());
  assert(near(*r->unit_grade(Unit::Coverage), 50.0, 1e-6));
  std::cout << "[PASS] test_graded_and_proxy_profiles" << std::endl;
}

void test_shrinkage_toward_league() {
  StatsTable stats;
  TeamWeekStats four = gridsim_test::league_row("SF", 2023, 5, 4);
  four.off_epa_per_play = 0.20;
  four.red_zone_td_pct = 0.70;
  stats.set(four);
  TeamWeekStats none = gridsim_test::league_row("SF", 2023, 1, 0);
  none.off_epa_per_play = 0.30;
  stats.set(none);

  ProfileConfig cfg;
  cfg.prior_games = 4.0;
  ProfileBuilder builder(stats, cfg);

  ProfilePtr half = builder.build_profile("SF", 2023, 5);
  assert(near(half->ratings().off_epa, 0.10));
  assert(near(half->ratings().red_zone_td_pct, 0.5 * 0.70 + 0.5 * 0.56));

  ProfilePtr prior = builder.build_profile("SF", 2023, 1);
  assert(near(prior->ratings().off_epa, cfg.league.epa_per_play));
  std::cout << "[PASS] test_shrinkage_toward_league" << std::endl;
}

void test_situational_overrides() {
  StatsTable stats;
  stats.set(gridsim_test::league_row("GB", 2023, 12));
  ProfileConfig cfg;
  ProfileBuilder builder(stats, cfg);

  SituationalOverrides snow;
  snow.weather_severity = 2;
  ProfilePtr base = builder.build_profile("GB", 2023, 12);
  ProfilePtr wet = builder.build_profile("GB", 2023, 12, snow);
  assert(near(wet->ratings().off_pass_success,
              base->ratings().off_pass_success - 2 * cfg.weather_pass_penalty));
  assert(near(wet->ratings().field_goal_make_pct,
              base->ratings().field_goal_make_pct - 2 * cfg.weather_fg_penalty));

  SituationalOverrides hurt;
  hurt.injury_severity = 1.0;
  hurt.short_rest = true;
  ProfilePtr thin = builder.build_profile("GB", 2023, 12, hurt);
  assert(near(thin->ratings().off_epa,
              base->ratings().off_epa - cfg.injury_epa_scale - cfg.short_rest_penalty));
  std::cout << "[PASS] test_situational_overrides" << std::endl;
}

void test_corrections_apply_to_later_weeks_only() {
  StatsTable stats;
  stats.set(gridsim_test::league_row("DAL", 2023, 5));
  stats.set(gridsim_test::league_row("DAL", 2023, 6));

  CalibrationStore store;
  CalibrationRecord rec;
  rec.team = "DAL";
  rec.metric = CalibrationMetric::OffEpaPerPlay;
  rec.correction = -0.03;
  rec.status = CalibrationStatus::Applied;
  CalibrationRecord pressure = rec;
  pressure.metric = CalibrationMetric::PressureRateAllowed;
  pressure.correction = 0.02;
  store.commit_week(2023, 5, {rec, pressure});

  ProfileBuilder plain(stats, ProfileConfig{});
  ProfileBuilder calibrated(stats, ProfileConfig{}, &store);

  ProfilePtr same_week = calibrated.build_profile("DAL", 2023, 5);
  assert(near(same_week->ratings().off_epa,
              plain.build_profile("DAL", 2023, 5)->ratings().off_epa));

  ProfilePtr next_week = calibrated.build_profile("DAL", 2023, 6);
  ProfilePtr uncorrected = plain.build_profile("DAL", 2023, 6);
  assert(near(next_week->ratings().off_epa, uncorrected->ratings().off_epa - 0.03));
  assert(near(next_week->ratings().pressure_adjust, 0.02));
  std::cout << "[PASS] test_corrections_apply_to_later_weeks_only" << std::endl;
}

void test_matchup_clamped_and_missing_units() {
  auto strong_line = gridsim_test::graded_profile("A", gridsim_test::flat_grades(95.0));
  auto weak_front = gridsim_test::graded_profile("B", gridsim_test::flat_grades(20.0));
  MatchupConfig cfg;

  MatchupContext m = resolve_matchup(*strong_line, *weak_front, cfg);
  assert(near(m.pass_protection, cfg.mismatch_clamp));
  assert(near(m.coverage, cfg.mismatch_clamp));
  assert(near(m.run_block, cfg.mismatch_clamp));

  MatchupContext r = resolve_matchup(*weak_front, *strong_line, cfg);
  assert(near(r.pass_protection, -cfg.mismatch_clamp));

  UnitGrades close = gridsim_test::flat_grades(50.0);
  close.pass_block = 58.0;
  auto c = gridsim_test::graded_profile("C", close);
  auto d = gridsim_test::graded_profile("D", gridsim_test::flat_grades(50.0));
  assert(near(resolve_matchup(*c, *d, cfg).pass_protection, 8.0));

  std::array<std::optional<double>, kUnitCount> stand_ins{};
  auto proxy = std::make_shared<ProxyProfile>("E", 2023, 5, Ratings{},
                                              LeaguePriors{}, stand_ins);
  MatchupContext none = resolve_matchup(*proxy, *strong_line, cfg);
  assert(none.pass_protection == 0.0);
  assert(none.coverage == 0.0);
  assert(none.run_block == 0.0);
  std::cout << "[PASS] test_matchup_clamped_and_missing_units" << std::endl;
}

int main() {
  std::cout << "=== Profile Tests ===" << std::endl;
  set_log_level(LogLevel::Error);

  test_missing_stats_throws_data_unavailable();
  test_malformed_row_rejected();
  test_graded_and_proxy_profiles();
  test_shrinkage_toward_league();
  test_situational_overrides();
  test_corrections_apply_to_later_weeks_only();
  test_matchup_clamped_and_missing_units();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
