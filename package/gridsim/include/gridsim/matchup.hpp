#pragma once

#include "gridsim/team_profile.hpp"

namespace gridsim {

struct MatchupConfig {
  double mismatch_clamp{25.0}; // grade points
};

// Offense-minus-defense grade deltas; positive favors the offense.
struct MatchupContext {
  double pass_protection{0.0}; // offense pass block - defense pass rush
  double coverage{0.0};        // offense receiving - defense coverage
  double run_block{0.0};       // offense run block - defense run defense
};

MatchupContext resolve_matchup(const TeamProfile &offense,
                               const TeamProfile &defense,
                               const MatchupConfig &cfg);

} // namespace gridsim
