#include "gridsim/drive.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace gridsim {

namespace {

constexpr int kIncompleteSeconds = 6;
constexpr int kOutOfBoundsSeconds = 6;
constexpr int kTimeoutSeconds = 6;
constexpr int kTwoMinuteInboundsSeconds = 18;
constexpr int kKneelSeconds = 40;
constexpr int kFieldGoalSeconds = 5;
constexpr int kPuntSeconds = 8;

double safe_ratio(double v, double prior) {
  return prior > 0.0 ? v / prior : 1.0;
}

int round_yards(double y) { return static_cast<int>(std::lround(y)); }

// Turnover propensity of this offense against this defense relative to league.
double turnover_factor(const DriveContext &ctx) {
  const Ratings &o = ctx.offense->ratings();
  const Ratings &d = ctx.defense->ratings();
  const LeaguePriors &L = ctx.offense->league();
  return clamp(0.5 * (safe_ratio(o.turnover_rate, L.turnover_rate) +
                      safe_ratio(d.takeaway_rate, L.takeaway_rate)),
               0.4, 2.5);
}

double red_zone_td_probability(DrivePhase phase, bool pass,
                               const DriveContext &ctx) {
  const Ratings &o = ctx.offense->ratings();
  const Ratings &d = ctx.defense->ratings();
  const LeaguePriors &L = ctx.offense->league();
  const DriveConfig &cfg = *ctx.cfg;
  const double base = phase == DrivePhase::GoalLine ? cfg.goal_line_td_rate
                                                    : cfg.red_zone_td_rate;
  const double scale = safe_ratio(o.red_zone_td_pct, L.red_zone_td_pct) *
                       safe_ratio(d.red_zone_td_pct_allowed, L.red_zone_td_pct);
  const double shift =
      0.002 * (pass ? ctx.matchup.coverage : ctx.matchup.run_block);
  return clamp(base * scale + shift, 0.03, 0.80);
}

int compressed_yards(int to_goal, Rng &rng) {
  std::normal_distribution<double> gain(2.5, 2.5);
  return clamp(round_yards(gain(rng)), -3, std::max(0, to_goal - 1));
}

int play_clock(const GameState &s, PlayEvent &ev, const DriveContext &ctx,
               Rng &rng) {
  const DriveConfig &cfg = *ctx.cfg;
  if (ev.type == PlayType::Kneel)
    return kKneelSeconds;
  if (ev.incomplete) {
    ev.stops_clock = true;
    return kIncompleteSeconds;
  }

  int secs = static_cast<int>(std::lround(ctx.offense->ratings().seconds_per_play));
  switch (classify_script(s, cfg)) {
  case GameScript::ClockControl:
    secs += cfg.clock_control_extra_seconds;
    break;
  case GameScript::HurryUp:
    secs = std::max(12, secs - cfg.hurry_up_saved_seconds);
    break;
  default:
    break;
  }

  if (s.in_two_minute(cfg.two_minute_seconds) &&
      (s.quarter == 2 || s.score_diff() <= 0)) {
    if (bernoulli(rng, 0.35)) {
      ev.stops_clock = true;
      return kOutOfBoundsSeconds;
    }
    if (s.timeouts_left(s.possession) > 0) {
      ev.stops_clock = true;
      ev.timeout_used = true;
      return kTimeoutSeconds;
    }
    return kTwoMinuteInboundsSeconds;
  }
  return secs;
}

bool lost_fumble(double rate, Rng &rng) { return bernoulli(rng, rate); }

} // namespace

const char *outcome_name(DriveOutcome o) {
  switch (o) {
  case DriveOutcome::Touchdown: return "touchdown";
  case DriveOutcome::FieldGoalMade: return "field_goal_made";
  case DriveOutcome::FieldGoalMissed: return "field_goal_missed";
  case DriveOutcome::Punt: return "punt";
  case DriveOutcome::Turnover: return "turnover";
  case DriveOutcome::TurnoverOnDowns: return "turnover_on_downs";
  case DriveOutcome::Safety: return "safety";
  case DriveOutcome::EndOfHalf: return "end_of_half";
  }
  return "unknown";
}

DrivePhase classify_phase(const GameState &s, const DriveConfig &cfg) {
  if (s.yardline >= 95)
    return DrivePhase::GoalLine;
  if (s.yardline >= 80)
    return DrivePhase::RedZone;
  if (s.in_two_minute(cfg.two_minute_seconds))
    return DrivePhase::TwoMinute;
  return DrivePhase::Normal;
}

GameScript classify_script(const GameState &s, const DriveConfig &cfg) {
  const int diff = s.score_diff();
  if (diff >= cfg.script_threshold)
    return GameScript::ClockControl;
  if (diff <= -cfg.script_threshold)
    return GameScript::HurryUp;
  if (!s.overtime && s.quarter == 4 && s.clock <= 300) {
    if (diff < 0)
      return GameScript::HurryUp;
    if (diff > 0)
      return GameScript::ClockControl;
  }
  return GameScript::Neutral;
}

double pass_probability(const GameState &s, const DriveContext &ctx) {
  const DriveConfig &cfg = *ctx.cfg;
  double p = ctx.offense->ratings().pass_rate;

  switch (s.down) {
  case 1:
    p -= 0.06;
    break;
  case 2:
    if (s.distance >= 8)
      p += 0.08;
    else if (s.distance <= 2)
      p -= 0.12;
    break;
  case 3:
    if (s.distance >= 7)
      p += 0.25;
    else if (s.distance <= 2)
      p -= 0.20;
    else
      p += 0.10;
    break;
  default:
    p += s.distance <= 2 ? -0.10 : 0.20;
    break;
  }

  if (classify_phase(s, cfg) == DrivePhase::GoalLine)
    p -= 0.10;

  switch (classify_script(s, cfg)) {
  case GameScript::HurryUp:
    p += cfg.script_pass_shift;
    break;
  case GameScript::ClockControl:
    p -= cfg.script_pass_shift;
    break;
  default:
    break;
  }

  if (s.in_two_minute(cfg.two_minute_seconds)) {
    if (s.quarter == 2 || s.score_diff() <= 0)
      p += cfg.two_minute_pass_shift;
    else
      p -= cfg.two_minute_pass_shift;
  }
  return clamp(p, 0.10, 0.95);
}

double pressure_probability(const DriveContext &ctx) {
  const DriveConfig &cfg = *ctx.cfg;
  const double p = cfg.base_pressure_rate + ctx.offense->ratings().pressure_adjust -
                   cfg.pressure_beta * ctx.matchup.pass_protection;
  return clamp(p, cfg.pressure_min, cfg.pressure_max);
}

double conversion_probability(int distance, const TeamProfile &offense) {
  double base;
  if (distance <= 1)
    base = 0.68;
  else if (distance == 2)
    base = 0.60;
  else if (distance == 3)
    base = 0.54;
  else if (distance <= 5)
    base = 0.46;
  else if (distance <= 7)
    base = 0.38;
  else if (distance <= 10)
    base = 0.30;
  else
    base = 0.18;
  const double adj =
      offense.ratings().off_success - offense.league().success_rate;
  return clamp(base + 0.5 * adj, 0.05, 0.90);
}

FourthDownEval evaluate_fourth_down(const GameState &s, const DriveContext &ctx) {
  const DriveConfig &cfg = *ctx.cfg;
  const TeamProfile &off = *ctx.offense;
  const int yl = s.yardline;
  const int dist = s.distance;
  const double ep_now = expected_points(4, dist, yl);
  const double ep_kickoff = expected_points(1, 10, cfg.special_teams.touchback_yardline);

  FourthDownEval e;

  const double p_conv = conversion_probability(dist, off);
  const int gained = yl + dist;
  const double success = gained >= 100
                             ? 7.0 - ep_kickoff
                             : expected_points(1, std::min(10, 100 - gained), gained);
  const double failure = -expected_points(1, 10, 100 - yl);
  e.go_epa = p_conv * success + (1.0 - p_conv) * failure - ep_now;

  const double p_make = field_goal_make_probability(field_goal_distance(yl), off,
                                                    cfg.special_teams);
  e.field_goal_available = p_make > 0.0;
  const int miss_start = std::max(20, 107 - yl);
  e.field_goal_epa = p_make * (3.0 - ep_kickoff) +
                     (1.0 - p_make) * -expected_points(1, 10, miss_start) -
                     ep_now;

  e.punt_epa = -expected_points(1, 10, expected_punt_start(off, yl)) - ep_now;

  e.choice = FourthDownChoice::Punt;
  double best = e.punt_epa;
  if (e.field_goal_available && e.field_goal_epa > best) {
    best = e.field_goal_epa;
    e.choice = FourthDownChoice::FieldGoal;
  }
  const double shift =
      (off.ratings().aggressiveness - 0.5) * cfg.aggressiveness_weight;
  const bool close_call = std::abs(e.go_epa - best) <= cfg.aggressiveness_band;
  if ((close_call ? e.go_epa + shift : e.go_epa) > best) {
    e.choice = FourthDownChoice::GoForIt;
  }

  if (!s.overtime && s.quarter == 4 &&
      s.game_seconds_remaining() <= cfg.two_minute_seconds) {
    const int diff = s.score_diff();
    if (diff < -3) {
      e.choice = FourthDownChoice::GoForIt;
    } else if (diff <= 0 && e.field_goal_available && p_make >= 0.3) {
      e.choice = FourthDownChoice::FieldGoal;
    }
  }
  return e;
}

PlayType choose_play_type(const GameState &s, const DriveContext &ctx, Rng &rng) {
  if (!s.overtime && s.quarter == 4 && s.score_diff() > 0 && s.down < 4 &&
      s.clock <= kKneelSeconds * (4 - s.down) + 2) {
    return PlayType::Kneel;
  }
  return bernoulli(rng, pass_probability(s, ctx)) ? PlayType::Pass
                                                  : PlayType::Run;
}

PlayEvent sample_play(const GameState &s, PlayType type, const DriveContext &ctx,
                      Rng &rng) {
  const DriveConfig &cfg = *ctx.cfg;
  const Ratings &o = ctx.offense->ratings();
  const Ratings &d = ctx.defense->ratings();
  const LeaguePriors &L = ctx.offense->league();

  PlayEvent ev;
  ev.type = type;
  ev.phase = classify_phase(s, cfg);
  ev.down = s.down;
  ev.distance = s.distance;
  ev.yardline = s.yardline;

  const int to_goal = 100 - s.yardline;
  const bool red_zone =
      ev.phase == DrivePhase::RedZone || ev.phase == DrivePhase::GoalLine;
  const double to_factor = turnover_factor(ctx);

  if (type == PlayType::Kneel) {
    ev.yards = s.yardline > 1 ? -1 : 0;
  } else if (type == PlayType::Pass) {
    ev.dropback = true;
    ev.pressure = bernoulli(rng, pressure_probability(ctx));
    bool attempt = true;
    if (ev.pressure) {
      const double u = uniform01(rng);
      if (u < cfg.sack_share) {
        std::uniform_int_distribution<int> loss(2, 9);
        ev.sack = true;
        ev.yards = -loss(rng);
        ev.turnover = lost_fumble(2.0 * cfg.base_fumble_lost_rate * to_factor, rng);
        attempt = false;
      } else if (u < cfg.sack_share + cfg.scramble_share) {
        std::normal_distribution<double> scramble(5.0, 4.0);
        ev.yards = clamp(round_yards(scramble(rng)), -2, 15);
        ev.turnover = lost_fumble(cfg.base_fumble_lost_rate * to_factor, rng);
        attempt = false;
      } else if (u < cfg.sack_share + cfg.scramble_share + cfg.throwaway_share) {
        ev.incomplete = true;
        attempt = false;
      }
    }

    if (attempt) {
      const double p_int =
          clamp((ev.pressure ? cfg.base_int_pressure : cfg.base_int_clean) * to_factor,
                0.002, 0.12);
      double completion = cfg.base_completion +
                          0.8 * (o.off_pass_success - L.pass_success_rate) +
                          0.8 * (d.def_pass_success - L.pass_success_rate) +
                          cfg.coverage_beta * ctx.matchup.coverage;
      if (ev.pressure)
        completion -= cfg.pressure_completion_penalty;
      completion = clamp(completion, 0.30, 0.90);

      if (bernoulli(rng, p_int)) {
        ev.turnover = true;
      } else if (red_zone) {
        if (bernoulli(rng, red_zone_td_probability(ev.phase, true, ctx))) {
          ev.touchdown = true;
          ev.yards = to_goal;
        } else if (bernoulli(rng, completion)) {
          ev.yards = compressed_yards(to_goal, rng);
        } else {
          ev.incomplete = true;
        }
      } else if (!bernoulli(rng, completion)) {
        ev.incomplete = true;
      } else {
        const double p_explosive =
            clamp((ev.pressure ? 0.5 : 1.0) * cfg.explosive_pass_rate *
                          safe_ratio(o.explosive_rate, L.explosive_rate) +
                      0.002 * ctx.matchup.coverage,
                  0.01, 0.35);
        if (bernoulli(rng, p_explosive)) {
          std::lognormal_distribution<double> big(2.3, 0.6);
          ev.explosive = true;
          ev.yards = std::min(80, 20 + round_yards(big(rng)));
        } else {
          const double avg = clamp(
              cfg.base_completion_yards +
                  12.0 * (o.off_pass_epa + d.def_pass_epa - 2.0 * L.epa_per_play),
              3.0, 12.0);
          std::gamma_distribution<double> gain(2.0, avg / 2.0);
          ev.yards = std::min(80, round_yards(gain(rng)));
        }
        ev.turnover = lost_fumble(0.5 * cfg.base_fumble_lost_rate * to_factor, rng);
      }
    }
  } else {
    if (red_zone) {
      if (bernoulli(rng, red_zone_td_probability(ev.phase, false, ctx))) {
        ev.touchdown = true;
        ev.yards = to_goal;
      } else {
        ev.yards = compressed_yards(to_goal, rng);
      }
    } else {
      const double p_explosive = clamp(
          cfg.explosive_run_rate * safe_ratio(o.explosive_rate, L.explosive_rate),
          0.005, 0.15);
      if (bernoulli(rng, p_explosive)) {
        std::lognormal_distribution<double> big(2.2, 0.6);
        ev.explosive = true;
        ev.yards = std::min(80, 12 + round_yards(big(rng)));
      } else {
        const double mean =
            cfg.base_run_yards +
            12.0 * (o.off_rush_epa + d.def_rush_epa - 2.0 * L.epa_per_play) +
            cfg.run_block_beta * ctx.matchup.run_block;
        std::normal_distribution<double> gain(mean, cfg.run_yards_sd);
        ev.yards = clamp(round_yards(gain(rng)), -5, 99);
      }
    }
    ev.turnover = lost_fumble(cfg.base_fumble_lost_rate * to_factor, rng);
  }

  if (ev.turnover) {
    ev.touchdown = false;
    if (!ev.sack)
      ev.yards = std::max(0, std::min(ev.yards, to_goal - 1));
  } else {
    ev.yards = std::min(ev.yards, to_goal);
    if (s.yardline + ev.yards >= 100) {
      ev.touchdown = true;
      ev.yards = to_goal;
    }
  }

  ev.clock_used = std::min(s.clock, play_clock(s, ev, ctx, rng));
  if (s.overtime)
    ev.clock_used = 0;
  return ev;
}

GameState advance(const GameState &s, const PlayEvent &play) {
  GameState n = s;
  ++n.plays_this_drive;
  n.clock = std::max(0, s.clock - play.clock_used);
  if (play.timeout_used) {
    int &t = n.timeouts(s.possession);
    t = std::max(0, t - 1);
  }
  if (play.type == PlayType::FieldGoal || play.type == PlayType::Punt)
    return n;

  n.yardline = clamp(s.yardline + play.yards, 0, 100);
  if (play.turnover || play.touchdown || n.yardline <= 0)
    return n;

  if (play.yards >= s.distance) {
    n.down = 1;
    n.distance = std::min(10, 100 - n.yardline);
  } else {
    n.down = s.down + 1;
    n.distance = s.distance - play.yards;
  }
  return n;
}

DriveResult DriveSimulator::simulate(GameState &state, Rng &rng) const {
  const DriveConfig &cfg = *ctx_.cfg;
  const SpecialTeamsConfig &st = cfg.special_teams;
  const Side offense = state.possession;
  const Side defense = other(offense);

  DriveResult r;
  r.offense = offense;
  r.start_yardline = state.yardline;
  r.quarter_started = state.quarter;
  bool done = false;

  while (!done) {
    if (!state.overtime && state.clock <= 0) {
      if (state.end_of_half_quarter()) {
        r.outcome = DriveOutcome::EndOfHalf;
        break;
      }
      state.quarter += 1;
      state.clock = kQuarterSeconds;
    }

    if (static_cast<int>(r.plays.size()) >= cfg.max_plays_per_drive) {
      r.hit_play_cap = true;
      r.outcome = DriveOutcome::TurnoverOnDowns;
      r.next_start_yardline = clamp(100 - state.yardline, 1, 99);
      break;
    }

    const double ep_before =
        expected_points(state.down, state.distance, state.yardline);
    const int kick_distance = field_goal_distance(state.yardline);

    PlayType type;
    const bool last_second_kick =
        !state.overtime && state.end_of_half_quarter() && state.clock <= 8 &&
        (state.quarter == 2 || state.score_diff() >= -3) &&
        field_goal_make_probability(kick_distance, *ctx_.offense, st) >= 0.3;
    if (last_second_kick) {
      type = PlayType::FieldGoal;
    } else if (state.down == 4) {
      const FourthDownEval eval = evaluate_fourth_down(state, ctx_);
      if (eval.choice == FourthDownChoice::FieldGoal)
        type = PlayType::FieldGoal;
      else if (eval.choice == FourthDownChoice::Punt)
        type = PlayType::Punt;
      else
        type = choose_play_type(state, ctx_, rng);
    } else {
      type = choose_play_type(state, ctx_, rng);
    }

    if (type == PlayType::FieldGoal || type == PlayType::Punt) {
      PlayEvent ev;
      ev.type = type;
      ev.phase = classify_phase(state, cfg);
      ev.down = state.down;
      ev.distance = state.distance;
      ev.yardline = state.yardline;
      ev.stops_clock = true;
      ev.clock_used = state.overtime
                          ? 0
                          : std::min(state.clock, type == PlayType::FieldGoal
                                                      ? kFieldGoalSeconds
                                                      : kPuntSeconds);
      const int yl = state.yardline;
      state = advance(state, ev);
      if (type == PlayType::FieldGoal) {
        ev.field_goal_good = bernoulli(
            rng, field_goal_make_probability(kick_distance, *ctx_.offense, st));
        if (ev.field_goal_good) {
          state.add_points(offense, 3);
          r.offense_points += 3;
          r.outcome = DriveOutcome::FieldGoalMade;
          ev.epa = 3.0 - ep_before;
        } else {
          r.outcome = DriveOutcome::FieldGoalMissed;
          r.next_start_yardline = std::max(20, 107 - yl);
          ev.epa = -expected_points(1, 10, r.next_start_yardline) - ep_before;
        }
      } else {
        r.outcome = DriveOutcome::Punt;
        r.next_start_yardline = sample_punt_start(*ctx_.offense, yl, st, rng);
        ev.epa = -expected_points(1, 10, r.next_start_yardline) - ep_before;
      }
      r.plays.push_back(ev);
      r.epa_total += ev.epa;
      break;
    }

    PlayEvent ev = sample_play(state, type, ctx_, rng);
    const GameState next = advance(state, ev);

    if (ev.turnover && next.yardline <= 0) {
      state = next;
      state.add_points(defense, 2);
      r.defense_points += 2;
      r.outcome = DriveOutcome::Safety;
      ev.epa = -2.0 - ep_before;
      done = true;
    } else if (ev.turnover) {
      state = next;
      int ret = 0;
      if (ev.type == PlayType::Pass && !ev.sack) {
        std::exponential_distribution<double> back(1.0 / st.interception_return_mean);
        ret = round_yards(back(rng));
      }
      r.outcome = DriveOutcome::Turnover;
      r.next_start_yardline = clamp(100 - next.yardline + ret, 1, 99);
      ev.epa = -expected_points(1, 10, r.next_start_yardline) - ep_before;
      done = true;
    } else if (ev.touchdown) {
      state = next;
      const int diff_after =
          state.score(offense) + 6 - state.score(defense);
      const int pts = 6 + sample_try_points(go_for_two(diff_after), st, rng);
      state.add_points(offense, pts);
      r.offense_points += pts;
      r.outcome = DriveOutcome::Touchdown;
      ev.epa = 7.0 - ep_before;
      done = true;
    } else if (next.yardline <= 0) {
      state = next;
      state.add_points(defense, 2);
      r.defense_points += 2;
      r.outcome = DriveOutcome::Safety;
      ev.epa = -2.0 - ep_before;
      done = true;
    } else if (next.down > 4) {
      state = next;
      r.outcome = DriveOutcome::TurnoverOnDowns;
      r.next_start_yardline = clamp(100 - next.yardline, 1, 99);
      ev.epa = -expected_points(1, 10, r.next_start_yardline) - ep_before;
      done = true;
    } else {
      ev.epa = expected_points(next.down, next.distance, next.yardline) - ep_before;
      state = next;
    }
    r.plays.push_back(ev);
    r.epa_total += ev.epa;
  }

  r.home_score_after = state.home_score;
  r.away_score_after = state.away_score;
  return r;
}

} // namespace gridsim
