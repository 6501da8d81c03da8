#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gridsim {

enum class CalibrationMetric {
  PointsFor = 0,
  PointsAgainst,
  OffEpaPerPlay,
  PressureRateAllowed
};
constexpr int kMetricCount = 4;

const char *metric_name(CalibrationMetric m);

enum class CalibrationStatus { Applied, NotMaterial, Skipped };

struct CalibrationConfig {
  int window_weeks{4};
  int min_history_weeks{3};
  double damping{0.5};
  double materiality_z{1.5}; // |bias| / standard error needed to act
  double clamp_points{1.0};
  double clamp_epa{0.05};
  double clamp_pressure{0.03};

  double clamp_for(CalibrationMetric m) const;
};

struct CalibrationRecord {
  std::int64_t version{0};
  std::string team;
  CalibrationMetric metric{CalibrationMetric::PointsFor};
  int season{0};
  int as_of_week{0};
  int sample_size{0};
  double bias{0.0};       // simulated - actual, window mean
  double bias_z{0.0};
  double delta{0.0};      // -damping * bias, before clamping
  double correction{0.0}; // cumulative, clamped; what profiles apply
  CalibrationStatus status{CalibrationStatus::Skipped};
};

// One team-game comparison of simulated means against the actual result.
struct TeamGameObservation {
  std::string team;
  int season{0};
  int week{0};
  std::array<double, kMetricCount> simulated{};
  std::array<double, kMetricCount> actual{};
};

// Versioned corrections keyed by (team, metric, as-of-week). Written once per
// week by a single calibration pass, read-only afterwards.
class CalibrationStore {
public:
  CalibrationStore() = default;

  // Throws std::logic_error if the week was already committed.
  std::int64_t commit_week(int season, int week,
                           std::vector<CalibrationRecord> records);

  bool is_committed(int season, int week) const;

  // Latest record for (team, metric) with as_of_week < week in the season.
  const CalibrationRecord *active_record(const std::string &team,
                                         CalibrationMetric metric, int season,
                                         int week) const;

  double correction(const std::string &team, CalibrationMetric metric,
                    int season, int week) const;

  // All active records for a week, keyed by (team, metric).
  std::map<std::pair<std::string, int>, CalibrationRecord>
  snapshot(int season, int week) const;

  const std::vector<CalibrationRecord> &history() const { return history_; }
  std::int64_t latest_version() const { return version_; }

private:
  std::vector<CalibrationRecord> history_;
  std::set<std::pair<int, int>> committed_;
  std::int64_t version_{0};
};

class Calibrator {
public:
  explicit Calibrator(const CalibrationConfig &cfg) : cfg_(cfg) {}

  // Builds the records for (season, week) from observations of completed
  // weeks up to and including `week`; does not touch the store.
  std::vector<CalibrationRecord>
  compute_week(const std::vector<TeamGameObservation> &observations,
               const CalibrationStore &store, int season, int week) const;

  // compute_week + commit. Returns the committed version.
  std::int64_t run_week(const std::vector<TeamGameObservation> &observations,
                        CalibrationStore &store, int season, int week) const;

  const CalibrationConfig &config() const { return cfg_; }

private:
  CalibrationConfig cfg_{};
};

} // namespace gridsim
