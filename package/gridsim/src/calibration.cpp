#include "gridsim/calibration.hpp"
#include "gridsim/log.hpp"
#include "gridsim/rng.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace gridsim {

const char *metric_name(CalibrationMetric m) {
  switch (m) {
  case CalibrationMetric::PointsFor: return "points_for";
  case CalibrationMetric::PointsAgainst: return "points_against";
  case CalibrationMetric::OffEpaPerPlay: return "off_epa_per_play";
  case CalibrationMetric::PressureRateAllowed: return "pressure_rate_allowed";
  }
  return "unknown";
}

double CalibrationConfig::clamp_for(CalibrationMetric m) const {
  switch (m) {
  case CalibrationMetric::PointsFor:
  case CalibrationMetric::PointsAgainst: return clamp_points;
  case CalibrationMetric::OffEpaPerPlay: return clamp_epa;
  case CalibrationMetric::PressureRateAllowed: return clamp_pressure;
  }
  return 0.0;
}

std::int64_t CalibrationStore::commit_week(int season, int week,
                                           std::vector<CalibrationRecord> records) {
  const auto key = std::make_pair(season, week);
  if (committed_.count(key) > 0) {
    throw std::logic_error(fmt::format(
        "calibration for season {} week {} already committed", season, week));
  }
  ++version_;
  for (auto &rec : records) {
    rec.version = version_;
    rec.season = season;
    rec.as_of_week = week;
    history_.push_back(std::move(rec));
  }
  committed_.insert(key);
  return version_;
}

bool CalibrationStore::is_committed(int season, int week) const {
  return committed_.count(std::make_pair(season, week)) > 0;
}

const CalibrationRecord *
CalibrationStore::active_record(const std::string &team,
                                CalibrationMetric metric, int season,
                                int week) const {
  const CalibrationRecord *best = nullptr;
  for (const auto &rec : history_) {
    if (rec.team != team || rec.metric != metric || rec.season != season)
      continue;
    if (rec.as_of_week >= week)
      continue;
    if (best == nullptr || rec.as_of_week > best->as_of_week ||
        (rec.as_of_week == best->as_of_week && rec.version > best->version)) {
      best = &rec;
    }
  }
  return best;
}

double CalibrationStore::correction(const std::string &team,
                                    CalibrationMetric metric, int season,
                                    int week) const {
  const CalibrationRecord *rec = active_record(team, metric, season, week);
  return rec ? rec->correction : 0.0;
}

std::map<std::pair<std::string, int>, CalibrationRecord>
CalibrationStore::snapshot(int season, int week) const {
  std::map<std::pair<std::string, int>, CalibrationRecord> out;
  for (const auto &rec : history_) {
    if (rec.season != season || rec.as_of_week >= week)
      continue;
    const auto key = std::make_pair(rec.team, static_cast<int>(rec.metric));
    auto it = out.find(key);
    if (it == out.end() || rec.as_of_week > it->second.as_of_week ||
        (rec.as_of_week == it->second.as_of_week &&
         rec.version > it->second.version)) {
      out[key] = rec;
    }
  }
  return out;
}

std::vector<CalibrationRecord>
Calibrator::compute_week(const std::vector<TeamGameObservation> &observations,
                         const CalibrationStore &store, int season,
                         int week) const {
  const int first_week = week - cfg_.window_weeks + 1;

  // team -> residuals per metric, in observation order
  std::map<std::string, std::array<std::vector<double>, kMetricCount>> residuals;
  for (const auto &obs : observations) {
    if (obs.season != season || obs.week > week)
      continue;
    auto &per_metric = residuals[obs.team];
    if (obs.week < first_week)
      continue;
    for (int m = 0; m < kMetricCount; ++m) {
      const double r = obs.simulated[static_cast<std::size_t>(m)] -
                       obs.actual[static_cast<std::size_t>(m)];
      if (std::isfinite(r))
        per_metric[static_cast<std::size_t>(m)].push_back(r);
    }
  }

  std::vector<CalibrationRecord> out;
  for (const auto &kv : residuals) {
    const std::string &team = kv.first;
    for (int m = 0; m < kMetricCount; ++m) {
      const auto metric = static_cast<CalibrationMetric>(m);
      const std::vector<double> &res = kv.second[static_cast<std::size_t>(m)];
      CalibrationRecord rec;
      rec.team = team;
      rec.metric = metric;
      rec.season = season;
      rec.as_of_week = week;
      rec.sample_size = static_cast<int>(res.size());

      if (rec.sample_size < cfg_.min_history_weeks) {
        rec.status = CalibrationStatus::Skipped;
        log_info("CalibrationSkipped: {} {} has {} of {} weeks of history",
                 team, metric_name(metric), rec.sample_size,
                 cfg_.min_history_weeks);
        out.push_back(rec);
        continue;
      }

      double sum = 0.0;
      for (double r : res)
        sum += r;
      const double n = static_cast<double>(res.size());
      rec.bias = sum / n;
      double ss = 0.0;
      for (double r : res)
        ss += (r - rec.bias) * (r - rec.bias);
      const double sd = (res.size() > 1) ? std::sqrt(ss / (n - 1.0)) : 0.0;
      const double se = sd / std::sqrt(n);
      if (se > 1e-12) {
        rec.bias_z = rec.bias / se;
      } else {
        rec.bias_z = (std::abs(rec.bias) > 1e-12)
                         ? std::copysign(std::numeric_limits<double>::infinity(), rec.bias)
                         : 0.0;
      }

      const double previous = store.correction(team, metric, season, week + 1);
      const double limit = cfg_.clamp_for(metric);
      if (std::abs(rec.bias_z) > cfg_.materiality_z) {
        rec.delta = -cfg_.damping * rec.bias;
        rec.correction = clamp(previous + rec.delta, -limit, limit);
        rec.status = CalibrationStatus::Applied;
        log_debug("calibration {} {} week {}: bias={:+.4f} z={:+.2f} "
                  "correction={:+.4f}",
                  team, metric_name(metric), week, rec.bias, rec.bias_z,
                  rec.correction);
      } else {
        rec.correction = clamp(previous, -limit, limit);
        rec.status = CalibrationStatus::NotMaterial;
      }
      out.push_back(rec);
    }
  }
  return out;
}

std::int64_t Calibrator::run_week(const std::vector<TeamGameObservation> &observations,
                                  CalibrationStore &store, int season,
                                  int week) const {
  std::vector<CalibrationRecord> records =
      compute_week(observations, store, season, week);
  int applied = 0;
  for (const auto &rec : records)
    if (rec.status == CalibrationStatus::Applied)
      ++applied;
  const std::int64_t version = store.commit_week(season, week, std::move(records));
  log_info("calibration season {} week {} committed as version {} ({} "
           "corrections applied)",
           season, week, version, applied);
  return version;
}

} // namespace gridsim
