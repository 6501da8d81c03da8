#include "gridsim/game.hpp"
#include "gridsim/errors.hpp"

#include <fmt/format.h>

namespace gridsim {

namespace {

bool is_scrimmage(PlayType t) {
  return t == PlayType::Run || t == PlayType::Pass || t == PlayType::Kneel;
}

void tally(SideStats &s, const DriveResult &d) {
  ++s.drives;
  for (const auto &ev : d.plays) {
    if (!is_scrimmage(ev.type))
      continue;
    ++s.plays;
    s.epa_total += ev.epa;
    if (ev.dropback)
      ++s.dropbacks;
    if (ev.pressure)
      ++s.pressures;
    if (ev.sack)
      ++s.sacks;
    if (ev.turnover)
      ++s.turnovers;
  }
  if (d.outcome == DriveOutcome::Touchdown)
    ++s.touchdowns;
  else if (d.outcome == DriveOutcome::FieldGoalMade)
    ++s.field_goals;
}

// Net EPA/play edge of one team over the other; weights the overtime draw.
double overtime_home_share(const TeamProfile &home, const TeamProfile &away) {
  const double h = home.ratings().off_epa - home.ratings().def_epa;
  const double a = away.ratings().off_epa - away.ratings().def_epa;
  return clamp(0.5 + 2.0 * (h - a), 0.2, 0.8);
}

} // namespace

GameOrchestrator::GameOrchestrator(const TeamProfile &home,
                                   const TeamProfile &away,
                                   const GameConfig &cfg,
                                   const MatchupConfig &matchup_cfg)
    : home_(&home), away_(&away), cfg_(cfg),
      home_offense_(resolve_matchup(home, away, matchup_cfg)),
      away_offense_(resolve_matchup(away, home, matchup_cfg)) {}

SimulationTrial GameOrchestrator::play(Rng &rng,
                                       std::vector<DriveResult> *drive_log) const {
  const SpecialTeamsConfig &st_cfg = cfg_.drive.special_teams;
  const DriveSimulator home_drives(*home_, *away_, home_offense_, cfg_.drive);
  const DriveSimulator away_drives(*away_, *home_, away_offense_, cfg_.drive);

  SimulationTrial trial;
  GameState st;
  bool have_last = false;
  Side last_offense = Side::Home;

  auto run_drive = [&](Side offense, int start) {
    if (trial.drives >= cfg_.max_drives_per_game) {
      throw SimulationDivergence(fmt::format(
          "game exceeded {} drives (quarter {}, clock {}, score {}-{})",
          cfg_.max_drives_per_game, st.quarter, st.clock, st.home_score,
          st.away_score));
    }
    st.start_drive(offense, start);
    DriveResult res = (offense == Side::Home ? home_drives : away_drives)
                          .simulate(st, rng);
    ++trial.drives;
    if (have_last && last_offense != offense)
      ++trial.possession_changes;
    have_last = true;
    last_offense = offense;
    if (res.hit_play_cap)
      ++trial.capped_drives;
    tally(offense == Side::Home ? trial.home : trial.away, res);
    if (drive_log)
      drive_log->push_back(res);
    return res;
  };

  // Start yardline for the team receiving possession after `res`.
  auto next_start = [&](const DriveResult &res) {
    const Side receiving = other(res.offense);
    switch (res.outcome) {
    case DriveOutcome::Touchdown:
    case DriveOutcome::FieldGoalMade:
      return sample_kickoff_start(team(receiving), st_cfg, rng);
    case DriveOutcome::Safety:
      return sample_free_kick_start(team(receiving), st_cfg, rng);
    default:
      return res.next_start_yardline;
    }
  };

  // Possession flips after every drive, across halftime and into overtime.
  Side offense = bernoulli(rng, 0.5) ? Side::Home : Side::Away;

  for (int half = 0; half < 2; ++half) {
    st.start_half(half == 0 ? 1 : 3);
    if (have_last)
      offense = other(last_offense);
    int start = sample_kickoff_start(team(offense), st_cfg, rng);
    while (true) {
      if (st.clock <= 0 && st.end_of_half_quarter())
        break;
      const DriveResult res = run_drive(offense, start);
      if (res.outcome == DriveOutcome::EndOfHalf)
        break;
      start = next_start(res);
      offense = other(offense);
    }
  }

  st.add_points(Side::Home, cfg_.home_field_points);

  if (st.home_score == st.away_score) {
    trial.overtime = true;
    st.overtime = true;
    st.quarter = 5;
    st.clock = kOvertimeSeconds;
    st.home_timeouts = 2;
    st.away_timeouts = 2;

    offense = other(last_offense);
    int start = sample_kickoff_start(team(offense), st_cfg, rng);
    for (int i = 0; i < 2; ++i) {
      const DriveResult res = run_drive(offense, start);
      start = next_start(res);
      offense = other(offense);
    }

    if (st.home_score == st.away_score &&
        !bernoulli(rng, cfg_.overtime_tie_probability)) {
      const Side winner = bernoulli(rng, overtime_home_share(*home_, *away_))
                              ? Side::Home
                              : Side::Away;
      st.add_points(winner, 3);
    }
  }

  trial.home_score = st.home_score;
  trial.away_score = st.away_score;
  return trial;
}

} // namespace gridsim
