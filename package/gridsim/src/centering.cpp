#include "gridsim/centering.hpp"
#include "gridsim/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace gridsim {

CenteredScores center_scores_to_market(const Eigen::ArrayXd &home,
                                       const Eigen::ArrayXd &away,
                                       const MarketLine &market,
                                       const CenteringConfig &cfg) {
  if (home.size() != away.size())
    throw std::invalid_argument("center_scores_to_market: home and away differ in length");

  CenteredScores c;
  if (home.size() == 0)
    return c;

  const double sim_total = home.mean() + away.mean();
  const double sim_margin = home.mean() - away.mean();
  c.target_total = cfg.alpha * market.total + (1.0 - cfg.alpha) * sim_total;
  c.target_margin =
      cfg.alpha * implied_home_margin(market) + (1.0 - cfg.alpha) * sim_margin;

  c.scale = std::clamp(c.target_total / std::max(sim_total, 1e-6), cfg.min_scale,
                       cfg.max_scale);
  c.home = home * c.scale;
  c.away = away * c.scale;

  const double shift_total = (c.target_total - (c.home.mean() + c.away.mean())) / 2.0;
  c.home += shift_total;
  c.away += shift_total;

  const double shift_margin = (c.target_margin - (c.home.mean() - c.away.mean())) / 2.0;
  c.home += shift_margin;
  c.away -= shift_margin;

  c.home = c.home.max(0.0);
  c.away = c.away.max(0.0);
  return c;
}

CenteredSummary summarize_centered(const Eigen::ArrayXi &margins,
                                   const Eigen::ArrayXi &totals,
                                   const MarketLine &market,
                                   const CenteringConfig &cfg) {
  CenteredSummary s;
  const Eigen::Index n = margins.size();
  if (n == 0 || totals.size() != n)
    return s;

  const Eigen::ArrayXd m = margins.cast<double>();
  const Eigen::ArrayXd t = totals.cast<double>();
  const CenteredScores c =
      center_scores_to_market((t + m) / 2.0, (t - m) / 2.0, market, cfg);
  const Eigen::ArrayXd cm = c.home - c.away;
  const Eigen::ArrayXd ct = c.home + c.away;

  s.scale = c.scale;
  s.raw_margin_mean = m.mean();
  s.raw_total_mean = t.mean();
  s.target_margin = c.target_margin;
  s.target_total = c.target_total;
  s.margin = summarize(cm);
  s.total = summarize(ct);

  const double dn = static_cast<double>(n);
  s.home_cover_prob = ((cm + market.spread) > 0.0).cast<double>().sum() / dn;
  s.over_prob = (ct > market.total).cast<double>().sum() / dn;
  s.blowout_prob = (cm.abs() > cfg.blowout_margin).cast<double>().sum() / dn;
  s.close_game_prob = (cm.abs() <= cfg.close_margin).cast<double>().sum() / dn;
  s.low_scoring_prob = (ct < cfg.low_total).cast<double>().sum() / dn;
  s.high_scoring_prob = (ct > cfg.high_total).cast<double>().sum() / dn;

  const double margin_err = std::abs(s.margin.mean - s.target_margin);
  const double total_err = std::abs(s.total.mean - s.target_total);
  s.within_tolerance = margin_err <= cfg.tolerance && total_err <= cfg.tolerance;
  if (!s.within_tolerance)
    log_warn("centering missed the market: margin off by {:.2f}, total off by {:.2f}",
             margin_err, total_err);
  log_debug("centering: scale {:.3f}, margin mean {:+.2f} -> {:+.2f}, total mean "
            "{:.2f} -> {:.2f}",
            s.scale, s.raw_margin_mean, s.margin.mean, s.raw_total_mean, s.total.mean);
  return s;
}

double brier_score(const Eigen::ArrayXd &probabilities, const Eigen::ArrayXd &outcomes) {
  if (probabilities.size() != outcomes.size())
    throw std::invalid_argument("brier_score: probabilities and outcomes differ in length");
  if (probabilities.size() == 0)
    return std::numeric_limits<double>::quiet_NaN();
  return (probabilities - outcomes).square().mean();
}

} // namespace gridsim
