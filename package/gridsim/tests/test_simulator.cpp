#undef NDEBUG
#include "gridsim/config.hpp"
#include "gridsim/log.hpp"
#include "gridsim/simulator.hpp"
#include "gridsim/thread_pool.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace gridsim;
using gridsim_test::near;

namespace {

SimConfig small_config(int n_trials, std::uint64_t seed) {
  SimConfig cfg;
  cfg.n_trials = n_trials;
  cfg.seed = seed;
  cfg.min_trials = n_trials / 2;
  cfg.n_threads = 2;
  cfg.chunk_size = 64;
  return cfg;
}

MarketLine line(double spread, double total) {
  MarketLine m;
  m.spread = spread;
  m.total = total;
  return m;
}

} // namespace

void test_thread_pool_runs_tasks() {
  ThreadPool pool(3);
  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; ++i)
    futures.push_back(pool.submit([i] { return i * i; }));
  int sum = 0;
  for (auto &f : futures)
    sum += f.get();
  assert(sum == 2470);

  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  bool thrown = false;
  try {
    failing.get();
  } catch (const std::runtime_error &) {
    thrown = true;
  }
  assert(thrown);
  std::cout << "[PASS] test_thread_pool_runs_tasks" << std::endl;
}

void test_probabilities_sum_to_one() {
  auto home = gridsim_test::graded_profile("H", gridsim_test::flat_grades(55.0));
  auto away = gridsim_test::graded_profile("V", gridsim_test::flat_grades(50.0));
  SimulationBatch b =
      Simulator().run(*home, *away, line(-3.0, 44.0), small_config(2000, 7));

  assert(b.trials_completed + b.trials_discarded == 2000);
  assert(near(b.home_win_prob + b.away_win_prob + b.tie_prob, 1.0));
  assert(near(b.home_cover_prob + b.away_cover_prob + b.spread_push_prob, 1.0));
  assert(near(b.over_prob + b.under_prob + b.total_push_prob, 1.0));
  assert(b.margin.p10 <= b.margin.median && b.margin.median <= b.margin.p90);
  assert(b.total.p10 <= b.total.p90);
  assert(b.margins.size() == b.trials_completed);
  std::cout << "[PASS] test_probabilities_sum_to_one" << std::endl;
}

void test_push_buckets() {
  auto home = gridsim_test::graded_profile("H", gridsim_test::flat_grades());
  auto away = gridsim_test::graded_profile("V", gridsim_test::flat_grades());

  SimulationBatch whole =
      Simulator().run(*home, *away, line(-3.0, 44.0), small_config(2000, 99));
  int margin_three = 0, total_44 = 0;
  for (Eigen::Index k = 0; k < whole.margins.size(); ++k) {
    if (whole.margins[k] == 3)
      ++margin_three;
    if (whole.totals[k] == 44)
      ++total_44;
  }
  const double n = static_cast<double>(whole.trials_completed);
  assert(margin_three > 0);
  assert(near(whole.spread_push_prob, margin_three / n));
  assert(near(whole.total_push_prob, total_44 / n));

  SimulationBatch hook =
      Simulator().run(*home, *away, line(-3.5, 44.5), small_config(2000, 99));
  assert(hook.spread_push_prob == 0.0);
  assert(hook.total_push_prob == 0.0);
  std::cout << "[PASS] test_push_buckets" << std::endl;
}

void test_fixed_seed_replays_bit_exact() {
  auto home = gridsim_test::graded_profile("H", gridsim_test::flat_grades(60.0));
  auto away = gridsim_test::graded_profile("V", gridsim_test::flat_grades(45.0));
  SimConfig one = small_config(1500, 123456);
  one.n_threads = 1;
  SimConfig four = one;
  four.n_threads = 4;
  four.chunk_size = 17;

  SimulationBatch a = Simulator().run(*home, *away, line(-2.5, 45.5), one);
  SimulationBatch b = Simulator().run(*home, *away, line(-2.5, 45.5), four);
  assert(a.seed == b.seed);
  assert((a.margins == b.margins).all());
  assert((a.totals == b.totals).all());
  assert(a.margin.mean == b.margin.mean);
  assert(a.home.pressure_rate == b.home.pressure_rate);
  assert(a.home.epa_per_play == b.home.epa_per_play);

  SimConfig other = one;
  other.seed = 654321;
  SimulationBatch c = Simulator().run(*home, *away, line(-2.5, 45.5), other);
  assert(!(a.margins == c.margins).all());
  std::cout << "[PASS] test_fixed_seed_replays_bit_exact" << std::endl;
}

// Elite pass rush against a weak line raises the pressure rate allowed.
void test_pass_rush_mismatch_raises_pressure() {
  UnitGrades weak_line = gridsim_test::flat_grades();
  weak_line.pass_block = 30.0;
  UnitGrades elite_rush = gridsim_test::flat_grades();
  elite_rush.pass_rush = 90.0;
  auto home = gridsim_test::graded_profile("H", weak_line);
  auto away = gridsim_test::graded_profile("V", elite_rush);
  auto neutral = gridsim_test::graded_profile("N", gridsim_test::flat_grades());

  SimulationBatch mismatch =
      Simulator().run(*home, *away, line(0.0, 44.0), small_config(2000, 31));
  SimulationBatch baseline =
      Simulator().run(*neutral, *neutral, line(0.0, 44.0), small_config(2000, 31));
  assert(mismatch.home.pressure_rate > baseline.home.pressure_rate + 0.06);
  assert(mismatch.home.pressure_rate > mismatch.away.pressure_rate + 0.06);
  assert(baseline.home.pressure_rate > 0.15 && baseline.home.pressure_rate < 0.28);
  std::cout << "[PASS] test_pass_rush_mismatch_raises_pressure (home "
            << mismatch.home.pressure_rate << " vs " << baseline.home.pressure_rate
            << ")" << std::endl;
}

// Identical teams: the home team's edge comes from home_field_points only.
void test_home_field_shifts_margin() {
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  auto b = gridsim_test::graded_profile("B", gridsim_test::flat_grades());
  SimConfig neutral = small_config(20000, 77);
  neutral.n_threads = 4;
  neutral.game.home_field_points = 0;
  SimulationBatch n = Simulator().run(*a, *b, line(0.0, 44.0), neutral);
  assert(std::abs(n.margin.mean) < 1.0);

  // Same seed, so regulation play is identical and only the credited points
  // (plus the few games they push into or out of overtime) differ.
  for (int points : {2, 3, 7}) {
    SimConfig with_hfa = neutral;
    with_hfa.game.home_field_points = points;
    SimulationBatch h = Simulator().run(*a, *b, line(0.0, 44.0), with_hfa);
    const double shift = h.margin.mean - n.margin.mean;
    assert(std::abs(shift - points) < 0.5);
    assert(h.home_win_prob > n.home_win_prob);
    std::cout << "  home_field_points " << points << ": margin shift " << shift
              << std::endl;
  }
  std::cout << "[PASS] test_home_field_shifts_margin" << std::endl;
}

void test_divergent_trials_discarded() {
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  SimConfig cfg = small_config(300, 3);
  cfg.game.max_drives_per_game = 4;
  SimulationBatch b = Simulator().run(*a, *a, line(0.0, 44.0), cfg);
  assert(b.trials_completed == 0);
  assert(b.trials_discarded == 300);
  assert(b.unreliable && b.insufficient_sample);
  assert(!b.stakeable());
  assert(b.confidence == Confidence::Low);
  std::cout << "[PASS] test_divergent_trials_discarded" << std::endl;
}

void test_time_budget_truncates() {
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  SimConfig cfg = small_config(500000, 9);
  cfg.time_budget_ms = 1;
  cfg.chunk_size = 32;
  SimulationBatch b = Simulator().run(*a, *a, line(0.0, 44.0), cfg);
  assert(b.truncated);
  assert(b.trials_completed < 500000);
  assert(b.confidence == Confidence::Low);
  assert(b.spread_tier == ConvictionTier::Low && b.total_tier == ConvictionTier::Low);
  std::cout << "[PASS] test_time_budget_truncates (" << b.trials_completed
            << " trials)" << std::endl;
}

void test_proxy_profiles_are_low_confidence() {
  std::array<std::optional<double>, kUnitCount> stand_ins{};
  auto proxy = std::make_shared<ProxyProfile>("P", 2023, 5, Ratings{},
                                              LeaguePriors{}, stand_ins);
  auto graded = gridsim_test::graded_profile("G", gridsim_test::flat_grades());
  SimulationBatch b =
      Simulator().run(*proxy, *graded, line(-14.0, 30.0), small_config(1000, 5));
  assert(b.proxy_mode);
  assert(b.stakeable());
  assert(b.confidence == Confidence::Low);
  assert(b.spread_tier == ConvictionTier::Low);
  std::cout << "[PASS] test_proxy_profiles_are_low_confidence" << std::endl;
}

void test_conviction_tiers() {
  ConvictionConfig cfg;
  assert(conviction_tier(4.0, 0.62, cfg.spread_high_edge, cfg.spread_medium_edge,
                         cfg) == ConvictionTier::High);
  assert(conviction_tier(-2.0, 0.56, cfg.spread_high_edge, cfg.spread_medium_edge,
                         cfg) == ConvictionTier::Medium);
  assert(conviction_tier(4.0, 0.52, cfg.spread_high_edge, cfg.spread_medium_edge,
                         cfg) == ConvictionTier::Low);
  assert(conviction_tier(0.5, 0.70, cfg.spread_high_edge, cfg.spread_medium_edge,
                         cfg) == ConvictionTier::Low);

  // The side probability follows the edge, not whichever side is more likely.
  assert(near(side_share(2.0, 0.40, 0.55), 0.40 / 0.95));
  assert(near(side_share(-2.0, 0.40, 0.55), 0.55 / 0.95));
  assert(near(side_share(1.0, 0.0, 0.0), 0.5));
  const double against_edge = side_share(4.0, 0.40, 0.55);
  assert(conviction_tier(4.0, against_edge, cfg.spread_high_edge,
                         cfg.spread_medium_edge, cfg) == ConvictionTier::Low);
  std::cout << "[PASS] test_conviction_tiers" << std::endl;
}

void test_config_validation() {
  EngineConfig cfg;
  cfg.validate();

  EngineConfig bad = cfg;
  bad.calibration.damping = 0.0;
  bool thrown = false;
  try {
    bad.validate();
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);

  bad = cfg;
  bad.sim.game.drive.sack_share = 0.9;
  thrown = false;
  try {
    bad.validate();
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);

  SimConfig zero;
  zero.n_trials = 0;
  auto a = gridsim_test::graded_profile("A", gridsim_test::flat_grades());
  thrown = false;
  try {
    Simulator().run(*a, *a, MarketLine{}, zero);
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);
  std::cout << "[PASS] test_config_validation" << std::endl;
}

int main() {
  std::cout << "=== Simulator Tests ===" << std::endl;
  set_log_level(LogLevel::Error);

  test_thread_pool_runs_tasks();
  test_probabilities_sum_to_one();
  test_push_buckets();
  test_fixed_seed_replays_bit_exact();
  test_pass_rush_mismatch_raises_pressure();
  test_home_field_shifts_margin();
  test_divergent_trials_discarded();
  test_time_budget_truncates();
  test_proxy_profiles_are_low_confidence();
  test_conviction_tiers();
  test_config_validation();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
