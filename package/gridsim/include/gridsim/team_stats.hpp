#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace gridsim {

// Per-unit grades on a 0..100 scale (50 = league average).
struct UnitGrades {
  double pass_block{50.0};
  double pass_rush{50.0};
  double run_block{50.0};
  double run_defense{50.0};
  double coverage{50.0};
  double receiving{50.0};
};

// Raw per-team statistics summarising games strictly before `week`.
// Defensive fields are "allowed" values unless noted.
struct TeamWeekStats {
  std::string team;
  int season{0};
  int week{0};
  std::int64_t as_of_timestamp{0}; // epoch seconds the row became available
  int games_played{0};

  double off_epa_per_play{0.0};
  double off_pass_epa{0.0};
  double off_rush_epa{0.0};
  double def_epa_per_play{0.0};
  double def_pass_epa{0.0};
  double def_rush_epa{0.0};

  double off_success_rate{0.45};
  double off_pass_success_rate{0.46};
  double off_rush_success_rate{0.42};
  double def_success_rate{0.45};
  double def_pass_success_rate{0.46};
  double def_rush_success_rate{0.42};

  double turnover_rate{0.02};  // giveaways per play
  double takeaway_rate{0.02};  // defensive takeaways per play
  double explosive_rate{0.08}; // offensive plays of 20+ yards

  double red_zone_td_pct{0.56};
  double red_zone_td_pct_allowed{0.56};

  double field_goal_make_pct{0.85};
  double punt_net_yards{41.0};
  double kick_return_start{25.0}; // average yardline after kickoffs received

  double seconds_per_play{28.0};
  double neutral_pass_rate{0.58};
  double fourth_down_aggressiveness{0.5};

  std::optional<double> sack_rate_allowed; // per dropback
  std::optional<double> def_sack_rate;     // per opponent dropback
  std::optional<UnitGrades> grades;        // nullopt = no advanced grades
};

// Game-day adjustments supplied by collaborators.
struct SituationalOverrides {
  int weather_severity{0}; // 0 none .. 3 severe
  bool short_rest{false};
  bool extra_rest{false};
  double injury_severity{0.0}; // 0..1
};

class StatsTable {
public:
  StatsTable() = default;

  void set(const TeamWeekStats &stats);
  bool has(const std::string &team, int season, int week) const;

  // Throws DataUnavailable when the row is missing.
  const TeamWeekStats &get(const std::string &team, int season, int week) const;

  std::size_t size() const { return rows_.size(); }
  std::vector<std::string> teams() const;

private:
  using Key = std::tuple<std::string, int, int>;
  std::map<Key, TeamWeekStats> rows_;
};

} // namespace gridsim
