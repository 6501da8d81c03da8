#pragma once

#include "gridsim/rng.hpp"
#include "gridsim/team_profile.hpp"

namespace gridsim {

struct SpecialTeamsConfig {
  double kickoff_touchback_rate{0.60};
  int touchback_yardline{25};
  double kick_return_sd{6.0};
  double punt_net_sd{6.0};
  int max_field_goal_distance{64};
  double extra_point_make_pct{0.94};
  double two_point_rate{0.48};
  double interception_return_mean{8.0};
};

// Field goal distance for a snap at `yardline` (end zone + hold).
inline int field_goal_distance(int yardline) { return (100 - yardline) + 17; }

double field_goal_make_probability(int kick_distance, const TeamProfile &kicker,
                                   const SpecialTeamsConfig &cfg);

// Start yardline for the receiving team.
int sample_kickoff_start(const TeamProfile &receiving,
                         const SpecialTeamsConfig &cfg, Rng &rng);

// Free kick after a safety, taken from the kicking team's 20.
int sample_free_kick_start(const TeamProfile &receiving,
                           const SpecialTeamsConfig &cfg, Rng &rng);

// Start yardline for the receiving team after a punt from `yardline`.
int sample_punt_start(const TeamProfile &kicking, int yardline,
                      const SpecialTeamsConfig &cfg, Rng &rng);

// Expected start yardline for the receiving team; used by the 4th-down model.
int expected_punt_start(const TeamProfile &kicking, int yardline);

// Whether to try for two after a touchdown that leaves the scoring team
// `diff_after_td` points ahead (negative when behind).
bool go_for_two(int diff_after_td);

// Points added by the try after a touchdown.
int sample_try_points(bool two_point, const SpecialTeamsConfig &cfg, Rng &rng);

} // namespace gridsim
