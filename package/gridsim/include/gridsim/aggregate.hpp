#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "gridsim/game.hpp"
#include "gridsim/market.hpp"

namespace gridsim {

enum class ConvictionTier { Low = 0, Medium, High };

const char *tier_name(ConvictionTier t);

enum class Confidence { Full = 0, Low };

struct ConvictionConfig {
  double spread_high_edge{3.0};   // points between simulated median and line
  double spread_medium_edge{1.5};
  double total_high_edge{4.0};
  double total_medium_edge{2.0};
  double high_side_probability{0.58}; // share of non-push trials on our side
  double medium_side_probability{0.54};
};

struct DistributionSummary {
  double mean{0.0};
  double median{0.0};
  double variance{0.0};
  double p10{0.0};
  double p90{0.0};
};

// The batch after its score means were moved onto the market. The shape of
// the distribution is kept; only location and scale change.
struct CenteredSummary {
  double scale{1.0};          // multiplicative step actually applied
  double raw_margin_mean{0.0};
  double raw_total_mean{0.0};
  double target_margin{0.0};
  double target_total{0.0};
  DistributionSummary margin{};
  DistributionSummary total{};
  double home_cover_prob{0.0};
  double over_prob{0.0};
  double blowout_prob{0.0};   // |margin| beyond CenteringConfig::blowout_margin
  double close_game_prob{0.0};
  double low_scoring_prob{0.0};
  double high_scoring_prob{0.0};
  bool within_tolerance{false};
};

struct TeamBatchStats {
  double pressure_rate{0.0}; // pressures per dropback, offense
  double epa_per_play{0.0};
  double sacks_per_game{0.0};
  double turnovers_per_game{0.0};
  double drives_per_game{0.0};
};

struct SimulationBatch {
  int trials_target{0};
  int trials_completed{0};
  int trials_discarded{0};
  int capped_drives{0};
  int overtime_games{0};
  std::uint64_t seed{0};

  DistributionSummary home_score{};
  DistributionSummary away_score{};
  DistributionSummary margin{}; // home - away
  DistributionSummary total{};
  Eigen::ArrayXi margins;       // per completed trial, trial-index order
  Eigen::ArrayXi totals;

  double home_win_prob{0.0};
  double away_win_prob{0.0};
  double tie_prob{0.0};

  MarketLine market{};
  double home_cover_prob{0.0};
  double away_cover_prob{0.0};
  double spread_push_prob{0.0};
  double over_prob{0.0};
  double under_prob{0.0};
  double total_push_prob{0.0};
  double spread_edge{0.0}; // simulated median margin - market implied margin
  double total_edge{0.0};  // simulated median total - market total
  ConvictionTier spread_tier{ConvictionTier::Low};
  ConvictionTier total_tier{ConvictionTier::Low};

  TeamBatchStats home{};
  TeamBatchStats away{};

  // Set when SimConfig::centering is enabled and trials completed.
  std::optional<CenteredSummary> centered{};

  bool truncated{false};
  bool insufficient_sample{false};
  bool unreliable{false};
  bool proxy_mode{false};
  Confidence confidence{Confidence::Full};

  bool stakeable() const { return !insufficient_sample && !unreliable; }
};

// Bookkeeping from the runner that the trials themselves do not carry.
struct BatchCounts {
  int target{0};
  int discarded{0};
  bool truncated{false};
  bool proxy_mode{false};
  int min_trials{1000};
  double max_discard_rate{0.01};
  std::uint64_t seed{0};
};

DistributionSummary summarize(const Eigen::ArrayXd &values);

// Share of non-push outcomes on the side the edge recommends: the first side
// (home cover, over) for edge >= 0, the second otherwise.
double side_share(double edge, double positive_prob, double negative_prob);

ConvictionTier conviction_tier(double edge, double side_probability,
                               double high_edge, double medium_edge,
                               const ConvictionConfig &cfg);

// Reduces completed trials (in trial-index order) to a batch.
SimulationBatch aggregate_trials(const std::vector<SimulationTrial> &trials,
                                 const MarketLine &market,
                                 const BatchCounts &counts,
                                 const ConvictionConfig &cfg);

} // namespace gridsim
