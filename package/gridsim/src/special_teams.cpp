#include "gridsim/special_teams.hpp"

#include <cmath>
#include <random>

namespace gridsim {

double field_goal_make_probability(int kick_distance, const TeamProfile &kicker,
                                   const SpecialTeamsConfig &cfg) {
  if (kick_distance > cfg.max_field_goal_distance)
    return 0.0;
  double base;
  if (kick_distance < 30)
    base = 0.97;
  else if (kick_distance < 40)
    base = 0.91;
  else if (kick_distance < 50)
    base = 0.80;
  else if (kick_distance < 55)
    base = 0.66;
  else
    base = 0.50;
  const double adj =
      kicker.ratings().field_goal_make_pct - kicker.league().field_goal_make_pct;
  return clamp(base + 0.5 * adj, 0.05, 0.99);
}

int sample_kickoff_start(const TeamProfile &receiving,
                         const SpecialTeamsConfig &cfg, Rng &rng) {
  if (bernoulli(rng, cfg.kickoff_touchback_rate))
    return cfg.touchback_yardline;
  std::normal_distribution<double> ret(receiving.ratings().kick_return_start,
                                       cfg.kick_return_sd);
  return clamp(static_cast<int>(std::lround(ret(rng))), 5, 60);
}

int sample_free_kick_start(const TeamProfile &receiving,
                           const SpecialTeamsConfig &cfg, Rng &rng) {
  std::normal_distribution<double> ret(receiving.ratings().kick_return_start + 10.0,
                                       cfg.kick_return_sd);
  return clamp(static_cast<int>(std::lround(ret(rng))), 15, 70);
}

int sample_punt_start(const TeamProfile &kicking, int yardline,
                      const SpecialTeamsConfig &cfg, Rng &rng) {
  std::normal_distribution<double> net(kicking.ratings().punt_net_yards,
                                       cfg.punt_net_sd);
  const int n = clamp(static_cast<int>(std::lround(net(rng))), 15, 65);
  const int landing = yardline + n;
  if (landing >= 100)
    return 20;
  return clamp(100 - landing, 1, 99);
}

int expected_punt_start(const TeamProfile &kicking, int yardline) {
  const int landing =
      yardline + static_cast<int>(std::lround(kicking.ratings().punt_net_yards));
  if (landing >= 100)
    return 20;
  return clamp(100 - landing, 1, 99);
}

bool go_for_two(int diff_after_td) {
  switch (diff_after_td) {
  case -2:
  case -5:
  case -10:
  case 1:
  case 5:
    return true;
  default:
    return false;
  }
}

int sample_try_points(bool two_point, const SpecialTeamsConfig &cfg, Rng &rng) {
  if (two_point)
    return bernoulli(rng, cfg.two_point_rate) ? 2 : 0;
  return bernoulli(rng, cfg.extra_point_make_pct) ? 1 : 0;
}

} // namespace gridsim
