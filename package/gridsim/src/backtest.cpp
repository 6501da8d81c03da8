#include "gridsim/backtest.hpp"
#include "gridsim/centering.hpp"
#include "gridsim/errors.hpp"
#include "gridsim/log.hpp"
#include "gridsim/rng.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <tuple>

namespace gridsim {

namespace {

std::uint64_t fnv1a(const std::string &s) {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : s) {
    h ^= c;
    h *= 0x100000001b3ULL;
  }
  return h;
}

// Points the close moved in the bettor's favour.
double clv_points(BetSide side, double placed, double closing) {
  switch (side) {
  case BetSide::Home: return placed - closing;
  case BetSide::Away: return closing - placed;
  case BetSide::Over: return closing - placed;
  case BetSide::Under: return placed - closing;
  }
  return 0.0;
}

double actual_or_nan(const std::optional<double> &v) {
  return v ? *v : std::numeric_limits<double>::quiet_NaN();
}

void require_before(std::int64_t ts, std::int64_t kickoff, const char *what,
                    const HistoricalGame &g) {
  if (ts > kickoff) {
    throw LookAheadViolation(fmt::format(
        "{}: {} timestamp {} is after kickoff {}", g.game_id, what, ts, kickoff));
  }
}

double outcome_value(BetGrade g) {
  switch (g) {
  case BetGrade::Win: return 1.0;
  case BetGrade::Loss: return 0.0;
  case BetGrade::Push: return 0.5;
  }
  return 0.5;
}

Eigen::ArrayXd as_array(const std::vector<double> &v) {
  return Eigen::Map<const Eigen::ArrayXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

// Refits from scratch once enough decided games have accumulated.
void refit(ProbabilityCalibrator &cal, const ProbabilityConfig &cfg,
           const std::vector<double> &z, const std::vector<double> &outcomes) {
  const auto decided = std::count_if(outcomes.begin(), outcomes.end(),
                                     [](double o) { return o != 0.5; });
  if (!cfg.enabled || decided < cfg.min_samples)
    return;
  ProbabilityCalibrator next(cfg);
  if (next.fit(as_array(z), as_array(outcomes)) > 0)
    cal = next;
}

void tally(TierAccuracy &t, const GradedBet &b) {
  ++t.bets;
  t.profit += b.profit;
  switch (b.grade) {
  case BetGrade::Win: ++t.wins; break;
  case BetGrade::Loss: ++t.losses; break;
  case BetGrade::Push: ++t.pushes; break;
  }
}

} // namespace

const char *side_name(BetSide s) {
  switch (s) {
  case BetSide::Home: return "home";
  case BetSide::Away: return "away";
  case BetSide::Over: return "over";
  case BetSide::Under: return "under";
  }
  return "unknown";
}

const char *grade_name(BetGrade g) {
  switch (g) {
  case BetGrade::Win: return "win";
  case BetGrade::Loss: return "loss";
  case BetGrade::Push: return "push";
  }
  return "unknown";
}

BetResult grade_bet(BetSide side, double line, int home_score, int away_score,
                    int price) {
  const double margin = static_cast<double>(home_score - away_score);
  const double total = static_cast<double>(home_score + away_score);
  double value = 0.0;
  switch (side) {
  case BetSide::Home: value = margin + line; break;
  case BetSide::Away: value = -(margin + line); break;
  case BetSide::Over: value = total - line; break;
  case BetSide::Under: value = line - total; break;
  }

  BetResult r;
  if (value > 0.0) {
    r.grade = BetGrade::Win;
    r.profit = american_to_payout(price);
  } else if (value < 0.0) {
    r.grade = BetGrade::Loss;
    r.profit = -1.0;
  } else {
    r.grade = BetGrade::Push;
    r.profit = 0.0;
  }
  return r;
}

void Backtester::check_inputs(const HistoricalGame &game,
                              std::int64_t &latest) const {
  require_before(game.market.opening.timestamp, game.kickoff, "opening line", game);
  require_before(game.market.closing.timestamp, game.kickoff, "closing line", game);
  latest = std::max(game.market.opening.timestamp, game.market.closing.timestamp);
  for (const std::string *team : {&game.home, &game.away}) {
    if (!stats_->has(*team, game.season, game.week))
      continue;
    const TeamWeekStats &s = stats_->get(*team, game.season, game.week);
    require_before(s.as_of_timestamp, game.kickoff, "team stats", game);
    latest = std::max(latest, s.as_of_timestamp);
  }
}

BacktestRecord Backtester::evaluate(const HistoricalGame &game) const {
  return predict(game, ProbabilityCalibrator(cfg_.probability),
                 ProbabilityCalibrator(cfg_.probability));
}

BacktestRecord Backtester::predict(const HistoricalGame &game,
                                   const ProbabilityCalibrator &spread_prob,
                                   const ProbabilityCalibrator &total_prob) const {
  BacktestRecord rec;
  rec.game_id = game.game_id;
  rec.season = game.season;
  rec.week = game.week;
  rec.home = game.home;
  rec.away = game.away;
  rec.actual_margin = game.home_score - game.away_score;
  rec.actual_total = game.home_score + game.away_score;
  check_inputs(game, rec.latest_input_timestamp);
  const MarketLine &placed = game.market.opening;
  const MarketLine &closing = game.market.closing;
  rec.spread_outcome = outcome_value(
      grade_bet(BetSide::Home, placed.spread, game.home_score, game.away_score).grade);
  rec.total_outcome = outcome_value(
      grade_bet(BetSide::Over, placed.total, game.home_score, game.away_score).grade);

  const ProfileBuilder builder(*stats_, profile_cfg_, store_);
  ProfilePtr home, away;
  try {
    home = builder.build_profile(game.home, game.season, game.week,
                                 game.home_overrides);
    away = builder.build_profile(game.away, game.season, game.week,
                                 game.away_overrides);
  } catch (const DataUnavailable &e) {
    rec.status = PredictionStatus::NoPrediction;
    rec.reason = e.what();
    log_info("{}: no prediction ({})", game.game_id, e.what());
    return rec;
  }

  SimConfig sim = sim_cfg_;
  rec.seed = mix_seed(cfg_.seed, fnv1a(game.game_id));
  sim.seed = rec.seed;
  const SimulationBatch batch = Simulator().run(*home, *away, placed, sim);

  rec.status = PredictionStatus::Predicted;
  rec.predicted_margin = batch.margin.median;
  rec.predicted_total = batch.total.median;
  rec.home_win_prob = batch.home_win_prob;
  rec.margin_error = std::abs(rec.predicted_margin - rec.actual_margin);
  rec.total_error = std::abs(rec.predicted_total - rec.actual_total);
  rec.spread_tier = batch.spread_tier;
  rec.total_tier = batch.total_tier;
  rec.confidence = batch.confidence;
  rec.home_points_mean = batch.home_score.mean;
  rec.away_points_mean = batch.away_score.mean;
  rec.home_epa_per_play = batch.home.epa_per_play;
  rec.away_epa_per_play = batch.away.epa_per_play;
  rec.home_pressure_rate = batch.home.pressure_rate;
  rec.away_pressure_rate = batch.away.pressure_rate;

  const double cap = cfg_.probability.z_cap;
  rec.z_spread = z_score(batch.margin.mean, std::sqrt(batch.margin.variance),
                         implied_home_margin(placed), cap);
  rec.z_total =
      z_score(batch.total.mean, std::sqrt(batch.total.variance), placed.total, cap);
  rec.raw_home_cover_prob = side_share(1.0, batch.home_cover_prob, batch.away_cover_prob);
  rec.raw_over_prob = side_share(1.0, batch.over_prob, batch.under_prob);
  if (cfg_.probability.enabled) {
    rec.home_cover_prob = spread_prob.predict_z(rec.z_spread);
    rec.over_prob = total_prob.predict_z(rec.z_total);
    rec.probabilities_fitted = spread_prob.fitted() && total_prob.fitted();
  } else {
    rec.home_cover_prob = rec.raw_home_cover_prob;
    rec.over_prob = rec.raw_over_prob;
  }

  if (batch.confidence != Confidence::Full || !batch.stakeable())
    return rec;

  if (std::abs(batch.spread_edge) >= cfg_.spread_min_edge) {
    GradedBet bet;
    bet.side = batch.spread_edge > 0.0 ? BetSide::Home : BetSide::Away;
    bet.line = placed.spread;
    bet.closing_line = closing.spread;
    bet.edge = batch.spread_edge;
    bet.tier = batch.spread_tier;
    const BetResult r = grade_bet(bet.side, bet.line, game.home_score,
                                  game.away_score, cfg_.price);
    bet.grade = r.grade;
    bet.profit = r.profit;
    bet.clv_points = clv_points(bet.side, bet.line, bet.closing_line);
    rec.spread_bet = bet;
  }

  if (std::abs(batch.total_edge) >= cfg_.total_min_edge) {
    GradedBet bet;
    bet.side = batch.total_edge > 0.0 ? BetSide::Over : BetSide::Under;
    bet.line = placed.total;
    bet.closing_line = closing.total;
    bet.edge = batch.total_edge;
    bet.tier = batch.total_tier;
    const BetResult r = grade_bet(bet.side, bet.line, game.home_score,
                                  game.away_score, cfg_.price);
    bet.grade = r.grade;
    bet.profit = r.profit;
    bet.clv_points = clv_points(bet.side, bet.line, bet.closing_line);
    rec.total_bet = bet;
  }
  return rec;
}

std::vector<BacktestRecord> Backtester::run(std::vector<HistoricalGame> games) const {
  std::stable_sort(games.begin(), games.end(),
                   [](const HistoricalGame &a, const HistoricalGame &b) {
                     return std::tie(a.season, a.week, a.kickoff, a.game_id) <
                            std::tie(b.season, b.week, b.kickoff, b.game_id);
                   });

  std::vector<BacktestRecord> records;
  records.reserve(games.size());
  std::vector<TeamGameObservation> observations;
  ProbabilityCalibrator spread_prob(cfg_.probability), total_prob(cfg_.probability);
  std::vector<double> z_spread, spread_outcomes, z_total, total_outcomes;

  auto close_week = [&](int season, int week) {
    refit(spread_prob, cfg_.probability, z_spread, spread_outcomes);
    refit(total_prob, cfg_.probability, z_total, total_outcomes);
    if (!cfg_.calibrate || store_ == nullptr || store_->is_committed(season, week))
      return;
    calibrator_.run_week(observations, *store_, season, week);
  };

  for (std::size_t i = 0; i < games.size(); ++i) {
    const HistoricalGame &g = games[i];
    BacktestRecord rec = predict(g, spread_prob, total_prob);

    if (rec.status == PredictionStatus::Predicted) {
      z_spread.push_back(rec.z_spread);
      spread_outcomes.push_back(rec.spread_outcome);
      z_total.push_back(rec.z_total);
      total_outcomes.push_back(rec.total_outcome);

      TeamGameObservation h;
      h.team = g.home;
      h.season = g.season;
      h.week = g.week;
      h.simulated = {rec.home_points_mean, rec.away_points_mean,
                     rec.home_epa_per_play, rec.home_pressure_rate};
      h.actual = {static_cast<double>(g.home_score),
                  static_cast<double>(g.away_score), actual_or_nan(g.home_off_epa),
                  actual_or_nan(g.home_pressure_rate)};
      TeamGameObservation a = h;
      a.team = g.away;
      a.simulated = {rec.away_points_mean, rec.home_points_mean,
                     rec.away_epa_per_play, rec.away_pressure_rate};
      a.actual = {h.actual[1], h.actual[0], actual_or_nan(g.away_off_epa),
                  actual_or_nan(g.away_pressure_rate)};
      observations.push_back(h);
      observations.push_back(a);
    }
    records.push_back(std::move(rec));

    const bool week_ends = i + 1 == games.size() || games[i + 1].season != g.season ||
                           games[i + 1].week != g.week;
    if (week_ends)
      close_week(g.season, g.week);
  }

  const BacktestSummary s = summarize_backtest(records);
  log_info("backtest: {} games, {} predicted, margin MAE {:.2f}, total MAE "
           "{:.2f}, {} bets, {:+.2f} units",
           s.games, s.predicted, s.margin_mae, s.total_mae, s.bets, s.profit_units);
  log_info("backtest Brier: spread {:.4f} raw / {:.4f} calibrated, total {:.4f} raw "
           "/ {:.4f} calibrated",
           s.spread_brier_raw, s.spread_brier_calibrated, s.total_brier_raw,
           s.total_brier_calibrated);
  return records;
}

BacktestSummary summarize_backtest(const std::vector<BacktestRecord> &records) {
  BacktestSummary s;
  s.games = static_cast<int>(records.size());
  double margin_err = 0.0, total_err = 0.0, clv_sum = 0.0;
  int su_right = 0, su_decided = 0;
  std::vector<double> spread_raw, spread_cal, spread_out, total_raw, total_cal, total_out;

  for (const auto &r : records) {
    if (r.status != PredictionStatus::Predicted) {
      ++s.no_prediction;
      continue;
    }
    ++s.predicted;
    margin_err += r.margin_error;
    total_err += r.total_error;
    if (r.actual_margin != 0 && r.predicted_margin != 0.0) {
      ++su_decided;
      if ((r.actual_margin > 0) == (r.predicted_margin > 0.0))
        ++su_right;
    }
    if (r.spread_outcome != 0.5) {
      spread_raw.push_back(r.raw_home_cover_prob);
      spread_cal.push_back(r.home_cover_prob);
      spread_out.push_back(r.spread_outcome);
    }
    if (r.total_outcome != 0.5) {
      total_raw.push_back(r.raw_over_prob);
      total_cal.push_back(r.over_prob);
      total_out.push_back(r.total_outcome);
    }

    for (const auto *bet : {&r.spread_bet, &r.total_bet}) {
      if (!bet->has_value())
        continue;
      const GradedBet &b = **bet;
      tally(bet == &r.spread_bet ? s.spread : s.totals, b);
      tally(s.by_tier[static_cast<std::size_t>(b.tier)], b);
      ++s.bets;
      s.profit_units += b.profit;
      if (b.grade == BetGrade::Push)
        ++s.pushes;
      if (b.line != b.closing_line) {
        ++s.clv_bets;
        clv_sum += b.clv_points;
        if (b.clv_points > 0.0)
          ++s.clv_beats;
      }
    }
  }

  if (s.predicted > 0) {
    s.margin_mae = margin_err / s.predicted;
    s.total_mae = total_err / s.predicted;
  }
  if (su_decided > 0)
    s.straight_up_accuracy = static_cast<double>(su_right) / su_decided;
  if (s.clv_bets > 0) {
    s.clv_rate = static_cast<double>(s.clv_beats) / s.clv_bets;
    s.avg_clv = clv_sum / s.clv_bets;
  }
  s.spread_brier_games = static_cast<int>(spread_out.size());
  s.total_brier_games = static_cast<int>(total_out.size());
  s.spread_brier_raw = brier_score(as_array(spread_raw), as_array(spread_out));
  s.spread_brier_calibrated = brier_score(as_array(spread_cal), as_array(spread_out));
  s.total_brier_raw = brier_score(as_array(total_raw), as_array(total_out));
  s.total_brier_calibrated = brier_score(as_array(total_cal), as_array(total_out));
  return s;
}

} // namespace gridsim
