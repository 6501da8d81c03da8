#undef NDEBUG
#include "gridsim/drive.hpp"
#include "gridsim/errors.hpp"
#include "gridsim/game.hpp"
#include "gridsim/log.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace gridsim;
using gridsim_test::near;

void test_expected_points_shape() {
  for (int yl = 2; yl < 99; ++yl)
    assert(expected_points(1, 10, yl) > expected_points(1, 10, yl - 1));
  assert(expected_points(1, 10, 50) > expected_points(3, 10, 50));
  assert(expected_points(3, 15, 50) < expected_points(3, 10, 50));
  std::cout << "[PASS] test_expected_points_shape" << std::endl;
}

void test_phase_classification() {
  DriveConfig cfg;
  GameState s;
  s.quarter = 1;
  s.clock = 600;
  s.yardline = 96;
  assert(classify_phase(s, cfg) == DrivePhase::GoalLine);
  s.yardline = 85;
  assert(classify_phase(s, cfg) == DrivePhase::RedZone);
  s.yardline = 40;
  assert(classify_phase(s, cfg) == DrivePhase::Normal);
  s.quarter = 2;
  s.clock = 90;
  assert(classify_phase(s, cfg) == DrivePhase::TwoMinute);

  s.quarter = 3;
  s.home_score = 21;
  s.away_score = 3;
  s.possession = Side::Home;
  assert(classify_script(s, cfg) == GameScript::ClockControl);
  s.possession = Side::Away;
  assert(classify_script(s, cfg) == GameScript::HurryUp);
  std::cout << "[PASS] test_phase_classification" << std::endl;
}

void test_pressure_tracks_protection() {
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  auto b = gridsim_test::graded_profile("B", gridsim_test::flat_grades());
  DriveConfig cfg;
  DriveContext ctx{a.get(), b.get(), MatchupContext{}, &cfg};

  assert(near(pressure_probability(ctx), cfg.base_pressure_rate));
  ctx.matchup.pass_protection = -25.0;
  const double overmatched = pressure_probability(ctx);
  ctx.matchup.pass_protection = 25.0;
  const double protected_qb = pressure_probability(ctx);
  assert(near(overmatched, cfg.base_pressure_rate + 25.0 * cfg.pressure_beta));
  assert(protected_qb < cfg.base_pressure_rate && overmatched > cfg.base_pressure_rate);
  std::cout << "[PASS] test_pressure_tracks_protection" << std::endl;
}

void test_fourth_down_choices() {
  auto off = gridsim_test::graded_profile("OFF", gridsim_test::flat_grades());
  auto def = gridsim_test::graded_profile("DEF", gridsim_test::flat_grades());
  DriveConfig cfg;
  DriveContext ctx{off.get(), def.get(), MatchupContext{}, &cfg};

  GameState s;
  s.quarter = 2;
  s.clock = 600;
  s.possession = Side::Home;
  s.down = 4;

  // 4th and 1 near midfield
  s.distance = 1;
  s.yardline = 60;
  assert(evaluate_fourth_down(s, ctx).choice == FourthDownChoice::GoForIt);

  // 4th and 10 from our own 25
  s.distance = 10;
  s.yardline = 25;
  FourthDownEval deep = evaluate_fourth_down(s, ctx);
  assert(deep.choice == FourthDownChoice::Punt);
  assert(!deep.field_goal_available);

  // 4th and 8 at their 15
  s.distance = 8;
  s.yardline = 85;
  assert(evaluate_fourth_down(s, ctx).choice == FourthDownChoice::FieldGoal);

  // Down 7 with a minute left: always go
  s.quarter = 4;
  s.clock = 60;
  s.distance = 10;
  s.yardline = 25;
  s.home_score = 10;
  s.away_score = 17;
  assert(evaluate_fourth_down(s, ctx).choice == FourthDownChoice::GoForIt);
  std::cout << "[PASS] test_fourth_down_choices" << std::endl;
}

// Aggressiveness decides only close calls and never moves the go-for-it EPA.
void test_aggressiveness_breaks_close_calls() {
  Ratings bold_r;
  bold_r.aggressiveness = 1.0;
  Ratings timid_r;
  timid_r.aggressiveness = 0.0;
  auto bold = gridsim_test::graded_profile("BOLD", gridsim_test::flat_grades(), bold_r);
  auto timid = gridsim_test::graded_profile("TIMID", gridsim_test::flat_grades(), timid_r);
  auto def = gridsim_test::graded_profile("DEF", gridsim_test::flat_grades());
  DriveConfig cfg;
  DriveContext bold_ctx{bold.get(), def.get(), MatchupContext{}, &cfg};
  DriveContext timid_ctx{timid.get(), def.get(), MatchupContext{}, &cfg};

  GameState s;
  s.quarter = 2;
  s.clock = 600;
  s.possession = Side::Home;
  s.down = 4;

  int differing = 0;
  for (int yl = 20; yl <= 95; ++yl) {
    for (int dist = 1; dist <= 10 && yl + dist <= 100; ++dist) {
      s.yardline = yl;
      s.distance = dist;
      const FourthDownEval b = evaluate_fourth_down(s, bold_ctx);
      const FourthDownEval t = evaluate_fourth_down(s, timid_ctx);
      assert(b.go_epa == t.go_epa);
      assert(b.punt_epa == t.punt_epa);

      const double best_kick = b.field_goal_available
                                   ? std::max(b.punt_epa, b.field_goal_epa)
                                   : b.punt_epa;
      const double gap = std::abs(b.go_epa - best_kick);
      if (gap > cfg.aggressiveness_band) {
        assert(b.choice == t.choice);
        assert((b.choice == FourthDownChoice::GoForIt) == (b.go_epa > best_kick));
      } else if (b.choice != t.choice) {
        ++differing;
        assert(b.choice == FourthDownChoice::GoForIt);
      }
    }
  }
  assert(differing > 0);

  DriveConfig no_band = cfg;
  no_band.aggressiveness_band = 0.0;
  DriveContext strict{bold.get(), def.get(), MatchupContext{}, &no_band};
  s.yardline = 25;
  s.distance = 10;
  assert(evaluate_fourth_down(s, strict).choice == FourthDownChoice::Punt);
  std::cout << "[PASS] test_aggressiveness_breaks_close_calls (" << differing
            << " close calls flipped)" << std::endl;
}

void test_play_cap_resolves_turnover_on_downs() {
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  auto b = gridsim_test::graded_profile("B", gridsim_test::flat_grades());
  DriveConfig cfg;
  cfg.max_plays_per_drive = 2;
  DriveSimulator sim(*a, *b, MatchupContext{}, cfg);

  int capped = 0;
  for (std::uint64_t seed = 0; seed < 300; ++seed) {
    Rng rng(mix_seed(11, seed));
    GameState s;
    s.start_half(1);
    s.start_drive(Side::Home, 25);
    DriveResult r = sim.simulate(s, rng);
    assert(static_cast<int>(r.plays.size()) <= cfg.max_plays_per_drive);
    if (r.hit_play_cap) {
      ++capped;
      assert(r.outcome == DriveOutcome::TurnoverOnDowns);
    }
  }
  assert(capped > 150);
  std::cout << "[PASS] test_play_cap_resolves_turnover_on_downs (capped " << capped
            << "/300)" << std::endl;
}

void test_game_invariants() {
  auto home = gridsim_test::graded_profile("H", gridsim_test::flat_grades(55.0));
  auto away = gridsim_test::graded_profile("V", gridsim_test::flat_grades(48.0));
  GameConfig cfg;
  GameOrchestrator game(*home, *away, cfg, MatchupConfig{});

  int overtime = 0;
  for (std::uint64_t seed = 0; seed < 1000; ++seed) {
    Rng rng(mix_seed(2024, seed));
    std::vector<DriveResult> log;
    SimulationTrial t = game.play(rng, &log);
    assert(t.drives == static_cast<int>(log.size()));
    assert(t.drives > 8);

    int changes = 0;
    int last_home = 0, last_away = 0;
    for (std::size_t i = 0; i < log.size(); ++i) {
      assert(log[i].home_score_after >= last_home);
      assert(log[i].away_score_after >= last_away);
      last_home = log[i].home_score_after;
      last_away = log[i].away_score_after;
      if (i == 0)
        continue;
      // every drive ends in a terminal event, including across halftime
      // and into overtime
      assert(log[i].offense != log[i - 1].offense);
      ++changes;
    }
    assert(changes == t.possession_changes);
    assert(t.possession_changes == t.drives - 1);
    assert(t.home_score >= last_home && t.away_score >= last_away);
    assert(t.home_score >= 0 && t.away_score >= 0);
    if (t.overtime)
      ++overtime;
    else
      assert(t.home_score != t.away_score || cfg.home_field_points == 0);
  }
  assert(overtime < 300);
  std::cout << "[PASS] test_game_invariants (overtime " << overtime << "/1000)"
            << std::endl;
}

void test_drive_bound_raises_divergence() {
  auto home = gridsim_test::graded_profile("H", gridsim_test::flat_grades());
  auto away = gridsim_test::graded_profile("V", gridsim_test::flat_grades());
  GameConfig cfg;
  cfg.max_drives_per_game = 3;
  GameOrchestrator game(*home, *away, cfg, MatchupConfig{});

  Rng rng(5);
  bool thrown = false;
  try {
    game.play(rng);
  } catch (const SimulationDivergence &) {
    thrown = true;
  }
  assert(thrown);
  std::cout << "[PASS] test_drive_bound_raises_divergence" << std::endl;
}

int main() {
  std::cout << "=== Drive Tests ===" << std::endl;
  set_log_level(LogLevel::Error);

  test_expected_points_shape();
  test_phase_classification();
  test_pressure_tracks_protection();
  test_fourth_down_choices();
  test_aggressiveness_breaks_close_calls();
  test_play_cap_resolves_turnover_on_downs();
  test_game_invariants();
  test_drive_bound_raises_divergence();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
