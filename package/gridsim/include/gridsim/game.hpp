#pragma once

#include <vector>

#include "gridsim/drive.hpp"
#include "gridsim/game_state.hpp"
#include "gridsim/matchup.hpp"
#include "gridsim/rng.hpp"
#include "gridsim/team_profile.hpp"

namespace gridsim {

struct GameConfig {
  int home_field_points{2};
  double overtime_tie_probability{0.10};
  int max_drives_per_game{64};
  DriveConfig drive{};
};

struct SideStats {
  int plays{0};
  int dropbacks{0};
  int pressures{0};
  int sacks{0};
  int turnovers{0};
  int drives{0};
  int touchdowns{0};
  int field_goals{0};
  double epa_total{0.0};

  double pressure_rate() const {
    return dropbacks > 0 ? static_cast<double>(pressures) / dropbacks : 0.0;
  }
  double epa_per_play() const { return plays > 0 ? epa_total / plays : 0.0; }
};

// Result of one simulated game.
struct SimulationTrial {
  int home_score{0};
  int away_score{0};
  SideStats home{};
  SideStats away{};
  int drives{0};
  int possession_changes{0};
  int capped_drives{0};
  bool overtime{false};

  int margin() const { return home_score - away_score; }
  int total() const { return home_score + away_score; }
};

class GameOrchestrator {
public:
  GameOrchestrator(const TeamProfile &home, const TeamProfile &away,
                   const GameConfig &cfg, const MatchupConfig &matchup_cfg);

  // Plays a full game. Throws SimulationDivergence when the drive count
  // exceeds max_drives_per_game. Drives are appended to `drive_log` if given.
  SimulationTrial play(Rng &rng, std::vector<DriveResult> *drive_log = nullptr) const;

  const MatchupContext &matchup(Side offense) const {
    return offense == Side::Home ? home_offense_ : away_offense_;
  }

private:
  const TeamProfile &team(Side s) const { return s == Side::Home ? *home_ : *away_; }

  const TeamProfile *home_{nullptr};
  const TeamProfile *away_{nullptr};
  GameConfig cfg_{};
  MatchupContext home_offense_{};
  MatchupContext away_offense_{};
};

} // namespace gridsim
