#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gridsim/team_stats.hpp"

namespace gridsim {

class CalibrationStore;

// League-average priors. Profiles are shrunk toward these and the drive
// model measures efficiency relative to them.
struct LeaguePriors {
  double epa_per_play{0.0};
  double success_rate{0.45};
  double pass_success_rate{0.46};
  double rush_success_rate{0.42};
  double turnover_rate{0.02};
  double takeaway_rate{0.02};
  double explosive_rate{0.08};
  double red_zone_td_pct{0.56};
  double field_goal_make_pct{0.85};
  double punt_net_yards{41.0};
  double kick_return_start{25.0};
  double seconds_per_play{28.0};
  double pass_rate{0.58};
  double fourth_down_aggressiveness{0.5};
  double sack_rate{0.065};
};

struct ProfileConfig {
  LeaguePriors league{};
  double prior_games{4.0};          // shrinkage weight = games / (games + prior_games)
  double weather_pass_penalty{0.015}; // pass success per severity bucket
  double weather_epa_penalty{0.02};   // pass EPA/play per severity bucket
  double weather_fg_penalty{0.03};    // FG make rate per severity bucket
  double short_rest_penalty{0.015};   // EPA/play
  double extra_rest_bonus{0.01};      // EPA/play
  double injury_epa_scale{0.10};      // offensive EPA/play lost at severity 1.0
  double offensive_plays_per_game{62.0}; // converts point corrections to EPA/play
  double proxy_success_sd{0.04};
  double proxy_sack_sd{0.015};
};

enum class Unit { PassBlock = 0, PassRush, RunBlock, RunDefense, Coverage, Receiving };
constexpr int kUnitCount = 6;

// Efficiency after shrinkage, situational multipliers and calibration.
struct Ratings {
  double off_epa{0.0};
  double off_pass_epa{0.0};
  double off_rush_epa{0.0};
  double def_epa{0.0};
  double def_pass_epa{0.0};
  double def_rush_epa{0.0};
  double off_success{0.45};
  double off_pass_success{0.46};
  double off_rush_success{0.42};
  double def_success{0.45};
  double def_pass_success{0.46};
  double def_rush_success{0.42};
  double turnover_rate{0.02};
  double takeaway_rate{0.02};
  double explosive_rate{0.08};
  double red_zone_td_pct{0.56};
  double red_zone_td_pct_allowed{0.56};
  double field_goal_make_pct{0.85};
  double punt_net_yards{41.0};
  double kick_return_start{25.0};
  double seconds_per_play{28.0};
  double pass_rate{0.58};
  double aggressiveness{0.5};
  double pressure_adjust{0.0}; // additive shift to the pressure rate allowed
};

class TeamProfile {
public:
  TeamProfile(std::string team, int season, int week, Ratings ratings,
              LeaguePriors league)
      : team_(std::move(team)), season_(season), week_(week),
        ratings_(ratings), league_(league) {}
  virtual ~TeamProfile() = default;

  TeamProfile(const TeamProfile &) = delete;
  TeamProfile &operator=(const TeamProfile &) = delete;

  virtual bool has_advanced_grades() const = 0;

  // Grade for a unit, or nullopt when neither a grade nor a stand-in exists.
  virtual std::optional<double> unit_grade(Unit unit) const = 0;

  const std::string &team() const { return team_; }
  int season() const { return season_; }
  int week() const { return week_; }
  const Ratings &ratings() const { return ratings_; }
  const LeaguePriors &league() const { return league_; }

private:
  std::string team_;
  int season_{0};
  int week_{0};
  Ratings ratings_{};
  LeaguePriors league_{};
};

class GradedProfile final : public TeamProfile {
public:
  GradedProfile(std::string team, int season, int week, Ratings ratings,
                LeaguePriors league, UnitGrades grades)
      : TeamProfile(std::move(team), season, week, ratings, league),
        grades_(grades) {}

  bool has_advanced_grades() const override { return true; }
  std::optional<double> unit_grade(Unit unit) const override;

  const UnitGrades &grades() const { return grades_; }

private:
  UnitGrades grades_{};
};

// Built when advanced grades are absent. Stand-ins come from efficiency
// stats on the same 0..100 scale; a unit without a source stat stays empty.
class ProxyProfile final : public TeamProfile {
public:
  ProxyProfile(std::string team, int season, int week, Ratings ratings,
               LeaguePriors league,
               std::array<std::optional<double>, kUnitCount> stand_ins)
      : TeamProfile(std::move(team), season, week, ratings, league),
        stand_ins_(stand_ins) {}

  bool has_advanced_grades() const override { return false; }
  std::optional<double> unit_grade(Unit unit) const override {
    return stand_ins_[static_cast<std::size_t>(unit)];
  }

private:
  std::array<std::optional<double>, kUnitCount> stand_ins_{};
};

using ProfilePtr = std::shared_ptr<const TeamProfile>;

class ProfileBuilder {
public:
  ProfileBuilder(const StatsTable &stats, const ProfileConfig &cfg,
                 const CalibrationStore *calibration = nullptr)
      : stats_(&stats), cfg_(cfg), calibration_(calibration) {}

  // Throws DataUnavailable when no statistics exist for the team/week.
  ProfilePtr build_profile(const std::string &team, int season, int week,
                           const SituationalOverrides &overrides = {}) const;

  const ProfileConfig &config() const { return cfg_; }

private:
  Ratings shrink(const TeamWeekStats &s) const;
  void apply_overrides(Ratings &r, const SituationalOverrides &o) const;
  void apply_calibration(Ratings &r, const std::string &team, int season,
                         int week) const;
  std::array<std::optional<double>, kUnitCount>
  proxy_grades(const TeamWeekStats &s) const;

  const StatsTable *stats_{nullptr};
  ProfileConfig cfg_{};
  const CalibrationStore *calibration_{nullptr};
};

// Validates a raw stats row; throws std::invalid_argument.
void validate_stats(const TeamWeekStats &s);

} // namespace gridsim
