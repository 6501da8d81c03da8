#pragma once

#include <Eigen/Dense>

#include "gridsim/aggregate.hpp"
#include "gridsim/market.hpp"

namespace gridsim {

struct CenteringConfig {
  bool enabled{false};
  double alpha{1.0};       // weight of the market in the target means
  double min_scale{0.5};   // clip on the multiplicative step
  double max_scale{2.0};
  double tolerance{0.5};   // points between centered and target means
  double blowout_margin{14.0};
  double close_margin{3.0};
  double low_total{40.0};
  double high_total{50.0};
};

struct CenteredScores {
  Eigen::ArrayXd home;
  Eigen::ArrayXd away;
  double scale{1.0};
  double target_margin{0.0};
  double target_total{0.0};
};

// Moves simulated score means onto the market while keeping their spread.
// Both sides are scaled toward the target total (clipped to
// [min_scale, max_scale]), shifted together to fix the total, then shifted
// apart to fix the margin. Scores never go below zero, so heavy clipping can
// leave the means short of the targets.
// Throws std::invalid_argument when the sides differ in length.
CenteredScores center_scores_to_market(const Eigen::ArrayXd &home,
                                       const Eigen::ArrayXd &away,
                                       const MarketLine &market,
                                       const CenteringConfig &cfg);

// Centers per-trial margins and totals (home - away, home + away) and
// summarizes the result.
CenteredSummary summarize_centered(const Eigen::ArrayXi &margins,
                                   const Eigen::ArrayXi &totals,
                                   const MarketLine &market,
                                   const CenteringConfig &cfg);

// Mean of (p - outcome)^2 over the pairs; NaN when there are none.
// Throws std::invalid_argument when the lengths differ.
double brier_score(const Eigen::ArrayXd &probabilities, const Eigen::ArrayXd &outcomes);

} // namespace gridsim
