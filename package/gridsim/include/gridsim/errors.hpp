#pragma once

#include <stdexcept>
#include <string>

namespace gridsim {

// No statistics for a team/week. Callers must surface this as "no prediction".
class DataUnavailable : public std::runtime_error {
public:
  DataUnavailable(const std::string &team, int season, int week)
      : std::runtime_error("no statistics for " + team + " season " +
                           std::to_string(season) + " week " +
                           std::to_string(week)),
        team_(team), season_(season), week_(week) {}

  const std::string &team() const { return team_; }
  int season() const { return season_; }
  int week() const { return week_; }

private:
  std::string team_;
  int season_{0};
  int week_{0};
};

// A trial ran past the game safety bound. Thrown per trial, caught by the
// runner and counted as a discard.
class SimulationDivergence : public std::runtime_error {
public:
  explicit SimulationDivergence(const std::string &what)
      : std::runtime_error(what) {}
};

// Backtest input timestamped after the kickoff it is used for.
class LookAheadViolation : public std::logic_error {
public:
  explicit LookAheadViolation(const std::string &what)
      : std::logic_error(what) {}
};

} // namespace gridsim
