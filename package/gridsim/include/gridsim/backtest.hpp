#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridsim/aggregate.hpp"
#include "gridsim/calibration.hpp"
#include "gridsim/market.hpp"
#include "gridsim/probability.hpp"
#include "gridsim/simulator.hpp"
#include "gridsim/team_profile.hpp"
#include "gridsim/team_stats.hpp"

namespace gridsim {

// A completed game with the lines available before it.
struct HistoricalGame {
  std::string game_id;
  int season{0};
  int week{0};
  std::string home;
  std::string away;
  std::int64_t kickoff{0}; // epoch seconds
  MarketSnapshot market{};
  int home_score{0};
  int away_score{0};
  SituationalOverrides home_overrides{};
  SituationalOverrides away_overrides{};
  // Observed offensive EPA/play and pressures per dropback allowed, when
  // known; feeds calibration.
  std::optional<double> home_off_epa{};
  std::optional<double> away_off_epa{};
  std::optional<double> home_pressure_rate{};
  std::optional<double> away_pressure_rate{};
};

enum class BetSide { Home, Away, Over, Under };
enum class BetGrade { Win, Loss, Push };

const char *side_name(BetSide s);
const char *grade_name(BetGrade g);

struct BetResult {
  BetGrade grade{BetGrade::Push};
  double profit{0.0}; // units, 1 staked
};

// Grades a bet at `line` (home spread for Home/Away, game total for
// Over/Under). An exact tie on the line is a push with zero profit.
BetResult grade_bet(BetSide side, double line, int home_score, int away_score,
                    int price = -110);

struct GradedBet {
  BetSide side{BetSide::Home};
  double line{0.0};         // placement line
  double closing_line{0.0};
  double edge{0.0};         // points between simulation and placement line
  ConvictionTier tier{ConvictionTier::Low};
  BetGrade grade{BetGrade::Push};
  double profit{0.0};
  double clv_points{0.0};   // positive when the close moved toward the bet
};

enum class PredictionStatus { Predicted, NoPrediction };

struct BacktestRecord {
  std::string game_id;
  int season{0};
  int week{0};
  std::string home;
  std::string away;
  PredictionStatus status{PredictionStatus::NoPrediction};
  std::string reason; // set for NoPrediction

  double predicted_margin{0.0};
  double predicted_total{0.0};
  double home_win_prob{0.0};
  int actual_margin{0};
  int actual_total{0};
  double margin_error{0.0}; // absolute
  double total_error{0.0};
  ConvictionTier spread_tier{ConvictionTier::Low};
  ConvictionTier total_tier{ConvictionTier::Low};
  Confidence confidence{Confidence::Low};

  // Batch means per side, compared against actuals by calibration.
  double home_points_mean{0.0};
  double away_points_mean{0.0};
  double home_epa_per_play{0.0};
  double away_epa_per_play{0.0};
  double home_pressure_rate{0.0};
  double away_pressure_rate{0.0};

  // Simulation z-scores against the placement line, the simulated share of
  // decided trials on the positive side, and the calibrated probability.
  // Outcomes are 1 (home covered, over), 0, or 0.5 for a push.
  double z_spread{0.0};
  double z_total{0.0};
  double raw_home_cover_prob{0.5};
  double raw_over_prob{0.5};
  double home_cover_prob{0.5};
  double over_prob{0.5};
  bool probabilities_fitted{false};
  double spread_outcome{0.5};
  double total_outcome{0.5};

  // At most one of each per game.
  std::optional<GradedBet> spread_bet{};
  std::optional<GradedBet> total_bet{};

  std::int64_t latest_input_timestamp{0};
  std::uint64_t seed{0};
};

struct TierAccuracy {
  int bets{0};
  int wins{0};
  int losses{0};
  int pushes{0};
  double profit{0.0};

  double win_rate() const {
    const int decided = wins + losses;
    return decided > 0 ? static_cast<double>(wins) / decided : 0.0;
  }
};

struct BacktestSummary {
  int games{0};
  int predicted{0};
  int no_prediction{0};
  double margin_mae{0.0};
  double total_mae{0.0};
  double straight_up_accuracy{0.0}; // predicted winner correct, ties excluded

  TierAccuracy spread{};
  TierAccuracy totals{};
  std::array<TierAccuracy, 3> by_tier{}; // indexed by ConvictionTier

  int bets{0};
  int pushes{0};
  double profit_units{0.0};
  int clv_bets{0};  // bets whose closing line differed from placement
  int clv_beats{0};
  double clv_rate{0.0};
  double avg_clv{0.0};

  // Over predicted games that did not push; NaN with no such games.
  int spread_brier_games{0};
  int total_brier_games{0};
  double spread_brier_raw{0.0};
  double spread_brier_calibrated{0.0};
  double total_brier_raw{0.0};
  double total_brier_calibrated{0.0};
};

BacktestSummary summarize_backtest(const std::vector<BacktestRecord> &records);

struct BacktestConfig {
  std::uint64_t seed{42};
  double spread_min_edge{1.5}; // points
  double total_min_edge{2.0};
  int price{-110};
  bool calibrate{true};
  ProbabilityConfig probability{};
};

class Backtester {
public:
  // `store` may be null to replay without calibration.
  Backtester(const StatsTable &stats, const ProfileConfig &profile_cfg,
             const SimConfig &sim_cfg, const BacktestConfig &cfg,
             const CalibrationConfig &calibration_cfg, CalibrationStore *store = nullptr)
      : stats_(&stats), profile_cfg_(profile_cfg), sim_cfg_(sim_cfg), cfg_(cfg),
        calibrator_(calibration_cfg), store_(store) {}

  // Replays games in chronological order. Throws LookAheadViolation when an
  // input is timestamped after the kickoff it is used for. Cover and over
  // probabilities for a week come from calibrators fitted on earlier weeks.
  std::vector<BacktestRecord> run(std::vector<HistoricalGame> games) const;

  // Predicts and grades one game using only inputs available before kickoff.
  // Probabilities use the unfitted fallback curve.
  BacktestRecord evaluate(const HistoricalGame &game) const;

  const BacktestConfig &config() const { return cfg_; }

private:
  void check_inputs(const HistoricalGame &game, std::int64_t &latest) const;
  BacktestRecord predict(const HistoricalGame &game,
                         const ProbabilityCalibrator &spread_prob,
                         const ProbabilityCalibrator &total_prob) const;

  const StatsTable *stats_{nullptr};
  ProfileConfig profile_cfg_{};
  SimConfig sim_cfg_{};
  BacktestConfig cfg_{};
  Calibrator calibrator_;
  CalibrationStore *store_{nullptr};
};

} // namespace gridsim
