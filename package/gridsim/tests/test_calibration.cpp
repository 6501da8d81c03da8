#undef NDEBUG
#include "gridsim/calibration.hpp"
#include "gridsim/log.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace gridsim;
using gridsim_test::near;

namespace {

constexpr auto kPF = CalibrationMetric::PointsFor;

// Points-for residual of `points_residual`; other metrics match exactly.
TeamGameObservation observation(const std::string &team, int week,
                                double points_residual) {
  TeamGameObservation o;
  o.team = team;
  o.season = 2023;
  o.week = week;
  o.simulated = {24.0 + points_residual, 20.0, 0.02, 0.30};
  o.actual = {24.0, 20.0, 0.02, 0.30};
  return o;
}

const CalibrationRecord &find(const std::vector<CalibrationRecord> &records,
                              const std::string &team, CalibrationMetric m) {
  for (const auto &r : records)
    if (r.team == team && r.metric == m)
      return r;
  throw std::runtime_error("record not found");
}

} // namespace

void test_short_history_skipped() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs{observation("KC", 1, 10.0),
                                       observation("KC", 2, 12.0)};
  auto records = cal.compute_week(obs, store, 2023, 2);
  const CalibrationRecord &r = find(records, "KC", kPF);
  assert(r.status == CalibrationStatus::Skipped);
  assert(r.sample_size == 2);
  assert(r.correction == 0.0);
  std::cout << "[PASS] test_short_history_skipped" << std::endl;
}

void test_material_bias_applied_and_clamped() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs{
      observation("BUF", 1, 10.0), observation("BUF", 2, 11.0),
      observation("BUF", 3, 9.0), observation("BUF", 4, 10.0)};
  auto records = cal.compute_week(obs, store, 2023, 4);
  const CalibrationRecord &r = find(records, "BUF", kPF);
  assert(r.status == CalibrationStatus::Applied);
  assert(r.sample_size == 4);
  assert(near(r.bias, 10.0));
  assert(r.bias_z > 20.0);
  assert(near(r.delta, -5.0));
  assert(near(r.correction, -cal.config().clamp_points));

  // zero residuals on the other metrics
  const CalibrationRecord &epa = find(records, "BUF", CalibrationMetric::OffEpaPerPlay);
  assert(epa.status == CalibrationStatus::NotMaterial);
  assert(epa.correction == 0.0);
  std::cout << "[PASS] test_material_bias_applied_and_clamped" << std::endl;
}

void test_noisy_bias_not_material() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs{
      observation("MIA", 1, 3.0), observation("MIA", 2, -3.0),
      observation("MIA", 3, 2.0), observation("MIA", 4, -2.0)};
  auto records = cal.compute_week(obs, store, 2023, 4);
  const CalibrationRecord &r = find(records, "MIA", kPF);
  assert(r.status == CalibrationStatus::NotMaterial);
  assert(r.correction == 0.0);
  std::cout << "[PASS] test_noisy_bias_not_material" << std::endl;
}

void test_non_finite_residuals_ignored() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs;
  for (int w = 1; w <= 4; ++w) {
    TeamGameObservation o = observation("DET", w, 1.0);
    o.actual[static_cast<std::size_t>(CalibrationMetric::OffEpaPerPlay)] =
        std::numeric_limits<double>::quiet_NaN();
    obs.push_back(o);
  }
  auto records = cal.compute_week(obs, store, 2023, 4);
  const CalibrationRecord &epa = find(records, "DET", CalibrationMetric::OffEpaPerPlay);
  assert(epa.sample_size == 0);
  assert(epa.status == CalibrationStatus::Skipped);
  std::cout << "[PASS] test_non_finite_residuals_ignored" << std::endl;
}

void test_corrections_visible_from_next_week() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs{
      observation("BUF", 1, 10.0), observation("BUF", 2, 11.0),
      observation("BUF", 3, 9.0), observation("BUF", 4, 10.0)};
  const std::int64_t v = cal.run_week(obs, store, 2023, 4);
  assert(v == 1);
  assert(store.latest_version() == 1);
  assert(store.is_committed(2023, 4));
  assert(!store.is_committed(2023, 5));

  assert(store.correction("BUF", kPF, 2023, 4) == 0.0);
  assert(near(store.correction("BUF", kPF, 2023, 5), -1.0));
  assert(near(store.correction("BUF", kPF, 2023, 9), -1.0));
  assert(store.correction("BUF", kPF, 2024, 5) == 0.0);

  auto before = store.snapshot(2023, 4);
  assert(before.empty());
  auto after = store.snapshot(2023, 5);
  const auto key = std::make_pair(std::string("BUF"), static_cast<int>(kPF));
  assert(after.count(key) == 1);
  assert(after.at(key).version == 1);
  assert(after.at(key).as_of_week == 4);
  std::cout << "[PASS] test_corrections_visible_from_next_week" << std::endl;
}

void test_week_commits_once() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  cal.run_week({observation("NE", 1, 0.0)}, store, 2023, 1);
  bool thrown = false;
  try {
    cal.run_week({observation("NE", 1, 0.0)}, store, 2023, 1);
  } catch (const std::logic_error &) {
    thrown = true;
  }
  assert(thrown);
  assert(store.latest_version() == 1);
  std::cout << "[PASS] test_week_commits_once" << std::endl;
}

void test_cumulative_correction_stays_clamped() {
  Calibrator cal{CalibrationConfig{}};
  CalibrationStore store;
  std::vector<TeamGameObservation> obs{
      observation("SEA", 1, 1.0), observation("SEA", 2, 1.1),
      observation("SEA", 3, 0.9), observation("SEA", 4, 1.0)};
  cal.run_week(obs, store, 2023, 4);
  assert(near(store.correction("SEA", kPF, 2023, 5), -0.5, 1e-9));

  obs.push_back(observation("SEA", 5, 1.0));
  cal.run_week(obs, store, 2023, 5);
  assert(near(store.correction("SEA", kPF, 2023, 6), -1.0, 1e-9));

  obs.push_back(observation("SEA", 6, 1.0));
  cal.run_week(obs, store, 2023, 6);
  assert(near(store.correction("SEA", kPF, 2023, 7), -1.0, 1e-9));
  // week 5 stays as committed
  assert(near(store.correction("SEA", kPF, 2023, 6), -1.0, 1e-9));
  assert(near(store.correction("SEA", kPF, 2023, 5), -0.5, 1e-9));
  std::cout << "[PASS] test_cumulative_correction_stays_clamped" << std::endl;
}

int main() {
  std::cout << "=== Calibration Tests ===" << std::endl;
  set_log_level(LogLevel::Error);

  test_short_history_skipped();
  test_material_bias_applied_and_clamped();
  test_noisy_bias_not_material();
  test_non_finite_residuals_ignored();
  test_corrections_visible_from_next_week();
  test_week_commits_once();
  test_cumulative_correction_stays_clamped();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
