#pragma once

#include <cstdint>
#include <vector>

#include "gridsim/game_state.hpp"
#include "gridsim/matchup.hpp"
#include "gridsim/rng.hpp"
#include "gridsim/special_teams.hpp"
#include "gridsim/team_profile.hpp"

namespace gridsim {

enum class PlayType : std::uint8_t { Run, Pass, FieldGoal, Punt, Kneel };

enum class DrivePhase : std::uint8_t { Normal, RedZone, GoalLine, TwoMinute };

enum class DriveOutcome : std::uint8_t {
  Touchdown,
  FieldGoalMade,
  FieldGoalMissed,
  Punt,
  Turnover,
  TurnoverOnDowns,
  Safety,
  EndOfHalf
};

enum class GameScript : std::uint8_t { Neutral, ClockControl, HurryUp };

enum class FourthDownChoice : std::uint8_t { GoForIt, FieldGoal, Punt };

const char *outcome_name(DriveOutcome o);

struct DriveConfig {
  int max_plays_per_drive{40};
  int two_minute_seconds{120};

  // Play calling
  int script_threshold{14}; // lead/deficit that switches the game script
  double script_pass_shift{0.15};
  double two_minute_pass_shift{0.20};
  int clock_control_extra_seconds{8};
  int hurry_up_saved_seconds{8};

  // Pass game
  double base_pressure_rate{0.212};
  double pressure_beta{0.004}; // pressure per grade point of protection deficit
  double pressure_min{0.05};
  double pressure_max{0.55};
  double sack_share{0.28};      // of pressured dropbacks
  double scramble_share{0.18};
  double throwaway_share{0.10};
  double base_completion{0.64};
  double pressure_completion_penalty{0.18};
  double coverage_beta{0.002}; // completion per grade point
  double base_int_clean{0.015};
  double base_int_pressure{0.035};
  double explosive_pass_rate{0.10};
  double base_completion_yards{6.8};

  // Run game
  double base_run_yards{4.3};
  double run_yards_sd{3.5};
  double run_block_beta{0.05}; // yards per grade point
  double explosive_run_rate{0.035};

  double base_fumble_lost_rate{0.006};

  // Red zone / goal line: touchdown chance per snap at league-average rates
  double red_zone_td_rate{0.14};
  double goal_line_td_rate{0.38};

  // Fourth down
  // Aggressiveness only breaks near-ties: within aggressiveness_band EPA of the
  // best kick, go_epa is compared after a shift of up to +/- weight / 2.
  double aggressiveness_weight{0.6};
  double aggressiveness_band{0.3};

  SpecialTeamsConfig special_teams{};
};

struct PlayEvent {
  PlayType type{PlayType::Run};
  DrivePhase phase{DrivePhase::Normal};
  int down{1};
  int distance{10};
  int yardline{25}; // before the snap
  int yards{0};
  int clock_used{0};
  bool dropback{false};
  bool pressure{false};
  bool sack{false};
  bool explosive{false};
  bool incomplete{false};
  bool turnover{false};
  bool touchdown{false};
  bool field_goal_good{false};
  bool stops_clock{false};
  bool timeout_used{false};
  double epa{0.0};
};

struct DriveResult {
  Side offense{Side::Home};
  int start_yardline{25};
  int quarter_started{1};
  std::vector<PlayEvent> plays;
  DriveOutcome outcome{DriveOutcome::EndOfHalf};
  int offense_points{0};
  int defense_points{0};
  double epa_total{0.0};
  bool hit_play_cap{false};
  int next_start_yardline{25}; // for the next offense when no kick follows
  int home_score_after{0};
  int away_score_after{0};
};

struct FourthDownEval {
  double go_epa{0.0}; // unshifted by aggressiveness
  double field_goal_epa{0.0};
  double punt_epa{0.0};
  bool field_goal_available{false};
  FourthDownChoice choice{FourthDownChoice::Punt};
};

// Read-only inputs shared by every play of a drive.
struct DriveContext {
  const TeamProfile *offense{nullptr};
  const TeamProfile *defense{nullptr};
  MatchupContext matchup{};
  const DriveConfig *cfg{nullptr};
};

DrivePhase classify_phase(const GameState &s, const DriveConfig &cfg);
GameScript classify_script(const GameState &s, const DriveConfig &cfg);

double pass_probability(const GameState &s, const DriveContext &ctx);
double pressure_probability(const DriveContext &ctx);
double conversion_probability(int distance, const TeamProfile &offense);

FourthDownEval evaluate_fourth_down(const GameState &s, const DriveContext &ctx);

PlayType choose_play_type(const GameState &s, const DriveContext &ctx, Rng &rng);

// Draws a scrimmage play outcome; does not touch the state.
PlayEvent sample_play(const GameState &s, PlayType type, const DriveContext &ctx,
                      Rng &rng);

// Applies yardage, down/distance and clock from a non-terminal play.
GameState advance(const GameState &s, const PlayEvent &play);

class DriveSimulator {
public:
  DriveSimulator(const TeamProfile &offense, const TeamProfile &defense,
                 const MatchupContext &matchup, const DriveConfig &cfg)
      : ctx_{&offense, &defense, matchup, &cfg} {}

  // Plays one possession from `state`, which must already hold the starting
  // field position. Updates score and clock; possession is left to the caller.
  DriveResult simulate(GameState &state, Rng &rng) const;

  const DriveContext &context() const { return ctx_; }

private:
  DriveContext ctx_;
};

} // namespace gridsim
