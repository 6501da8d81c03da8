#pragma once

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>

#include "gridsim/team_profile.hpp"
#include "gridsim/team_stats.hpp"

namespace gridsim_test {

inline bool near(double a, double b, double tol = 1e-9) {
  return std::abs(a - b) <= tol;
}

// League-average stats row with `games` games of history.
inline gridsim::TeamWeekStats league_row(const std::string &team, int season,
                                         int week, int games = 8,
                                         std::int64_t as_of = 0) {
  gridsim::TeamWeekStats s;
  s.team = team;
  s.season = season;
  s.week = week;
  s.games_played = games;
  s.as_of_timestamp = as_of;
  return s;
}

inline gridsim::UnitGrades flat_grades(double g = 50.0) {
  gridsim::UnitGrades u;
  u.pass_block = g;
  u.pass_rush = g;
  u.run_block = g;
  u.run_defense = g;
  u.coverage = g;
  u.receiving = g;
  return u;
}

inline std::shared_ptr<gridsim::GradedProfile>
graded_profile(const std::string &team, const gridsim::UnitGrades &grades,
               const gridsim::Ratings &ratings = {}) {
  return std::make_shared<gridsim::GradedProfile>(team, 2023, 5, ratings,
                                                  gridsim::LeaguePriors{}, grades);
}

} // namespace gridsim_test
