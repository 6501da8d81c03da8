#include "gridsim/aggregate.hpp"
#include "gridsim/log.hpp"

#include <algorithm>
#include <cmath>

namespace gridsim {

namespace {

struct SideTotals {
  long long dropbacks{0};
  long long pressures{0};
  long long plays{0};
  long long sacks{0};
  long long turnovers{0};
  long long drives{0};
  double epa{0.0};

  void add(const SideStats &s) {
    dropbacks += s.dropbacks;
    pressures += s.pressures;
    plays += s.plays;
    sacks += s.sacks;
    turnovers += s.turnovers;
    drives += s.drives;
    epa += s.epa_total;
  }

  TeamBatchStats finish(int games) const {
    TeamBatchStats t;
    if (dropbacks > 0)
      t.pressure_rate = static_cast<double>(pressures) / static_cast<double>(dropbacks);
    if (plays > 0)
      t.epa_per_play = epa / static_cast<double>(plays);
    if (games > 0) {
      const double g = static_cast<double>(games);
      t.sacks_per_game = static_cast<double>(sacks) / g;
      t.turnovers_per_game = static_cast<double>(turnovers) / g;
      t.drives_per_game = static_cast<double>(drives) / g;
    }
    return t;
  }
};

} // namespace

double side_share(double edge, double positive_prob, double negative_prob) {
  const double decided = positive_prob + negative_prob;
  if (decided <= 0.0)
    return 0.5;
  return (edge >= 0.0 ? positive_prob : negative_prob) / decided;
}

const char *tier_name(ConvictionTier t) {
  switch (t) {
  case ConvictionTier::Low: return "LOW";
  case ConvictionTier::Medium: return "MEDIUM";
  case ConvictionTier::High: return "HIGH";
  }
  return "LOW";
}

DistributionSummary summarize(const Eigen::ArrayXd &values) {
  DistributionSummary d;
  const Eigen::Index n = values.size();
  if (n == 0)
    return d;
  d.mean = values.mean();
  d.variance = (values - d.mean).square().sum() / static_cast<double>(n);

  std::vector<double> v(values.data(), values.data() + n);
  std::sort(v.begin(), v.end());
  const auto qidx = [&](double q) {
    int idx = static_cast<int>(std::floor(q * static_cast<double>(v.size() - 1)));
    return std::max(0, std::min(idx, static_cast<int>(v.size()) - 1));
  };
  const std::size_t mid = v.size() / 2;
  d.median = (v.size() % 2 == 1) ? v[mid] : 0.5 * (v[mid - 1] + v[mid]);
  d.p10 = v[static_cast<std::size_t>(qidx(0.10))];
  d.p90 = v[static_cast<std::size_t>(qidx(0.90))];
  return d;
}

ConvictionTier conviction_tier(double edge, double side_probability,
                               double high_edge, double medium_edge,
                               const ConvictionConfig &cfg) {
  const double e = std::abs(edge);
  if (e >= high_edge && side_probability >= cfg.high_side_probability)
    return ConvictionTier::High;
  if (e >= medium_edge && side_probability >= cfg.medium_side_probability)
    return ConvictionTier::Medium;
  return ConvictionTier::Low;
}

SimulationBatch aggregate_trials(const std::vector<SimulationTrial> &trials,
                                 const MarketLine &market,
                                 const BatchCounts &counts,
                                 const ConvictionConfig &cfg) {
  SimulationBatch b;
  const int n = static_cast<int>(trials.size());
  b.trials_target = counts.target;
  b.trials_completed = n;
  b.trials_discarded = counts.discarded;
  b.seed = counts.seed;
  b.market = market;
  b.truncated = counts.truncated;
  b.proxy_mode = counts.proxy_mode;

  const int attempted = n + counts.discarded;
  b.unreliable = attempted > 0 &&
                 static_cast<double>(counts.discarded) / attempted > counts.max_discard_rate;
  b.insufficient_sample = n < counts.min_trials;

  Eigen::ArrayXd home(n), away(n);
  b.margins.resize(n);
  b.totals.resize(n);
  SideTotals home_tot, away_tot;
  int home_wins = 0, away_wins = 0, ties = 0;
  int home_cover = 0, away_cover = 0, spread_push = 0;
  int over = 0, under = 0, total_push = 0;

  for (int k = 0; k < n; ++k) {
    const SimulationTrial &t = trials[static_cast<std::size_t>(k)];
    home[k] = t.home_score;
    away[k] = t.away_score;
    b.margins[k] = t.margin();
    b.totals[k] = t.total();
    home_tot.add(t.home);
    away_tot.add(t.away);
    b.capped_drives += t.capped_drives;
    if (t.overtime)
      ++b.overtime_games;

    if (t.margin() > 0)
      ++home_wins;
    else if (t.margin() < 0)
      ++away_wins;
    else
      ++ties;

    const double ats = static_cast<double>(t.margin()) + market.spread;
    if (ats > 0.0)
      ++home_cover;
    else if (ats < 0.0)
      ++away_cover;
    else
      ++spread_push;

    const double ou = static_cast<double>(t.total()) - market.total;
    if (ou > 0.0)
      ++over;
    else if (ou < 0.0)
      ++under;
    else
      ++total_push;
  }

  b.home_score = summarize(home);
  b.away_score = summarize(away);
  const Eigen::ArrayXd margins = b.margins.cast<double>();
  const Eigen::ArrayXd totals = b.totals.cast<double>();
  b.margin = summarize(margins);
  b.total = summarize(totals);
  b.home = home_tot.finish(n);
  b.away = away_tot.finish(n);

  if (n > 0) {
    const double dn = static_cast<double>(n);
    b.home_win_prob = home_wins / dn;
    b.away_win_prob = away_wins / dn;
    b.tie_prob = ties / dn;
    b.home_cover_prob = home_cover / dn;
    b.away_cover_prob = away_cover / dn;
    b.spread_push_prob = spread_push / dn;
    b.over_prob = over / dn;
    b.under_prob = under / dn;
    b.total_push_prob = total_push / dn;

    b.spread_edge = b.margin.median - implied_home_margin(market);
    b.total_edge = b.total.median - market.total;
    const double spread_side =
        side_share(b.spread_edge, b.home_cover_prob, b.away_cover_prob);
    const double total_side = side_share(b.total_edge, b.over_prob, b.under_prob);
    b.spread_tier = conviction_tier(b.spread_edge, spread_side, cfg.spread_high_edge,
                                    cfg.spread_medium_edge, cfg);
    b.total_tier = conviction_tier(b.total_edge, total_side, cfg.total_high_edge,
                                   cfg.total_medium_edge, cfg);
  }

  if (b.truncated || b.proxy_mode || b.insufficient_sample || b.unreliable) {
    b.confidence = Confidence::Low;
    b.spread_tier = ConvictionTier::Low;
    b.total_tier = ConvictionTier::Low;
  }
  if (b.insufficient_sample)
    log_warn("InsufficientSample: {} of {} trials completed (minimum {})", n,
             counts.target, counts.min_trials);
  if (b.unreliable)
    log_warn("batch unreliable: {} of {} trials diverged", counts.discarded,
             attempted);
  return b;
}

} // namespace gridsim
