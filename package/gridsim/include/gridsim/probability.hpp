#pragma once

#include <vector>

#include <Eigen/Dense>

namespace gridsim {

enum class ProbabilityMethod { Isotonic = 0, Platt };

const char *method_name(ProbabilityMethod m);

struct ProbabilityConfig {
  bool enabled{true};
  ProbabilityMethod method{ProbabilityMethod::Isotonic};
  double z_cap{3.0};
  int min_samples{50};        // walk-forward refits wait for this many
  double fallback_slope{0.5}; // unfitted: sigmoid(fallback_slope * z)
  // Blend toward 0.5 with a model weight rising from blend_min_weight at
  // z = 0 to blend_max_weight at |z| >= blend_full_z.
  bool blend{false};
  double blend_min_weight{0.6};
  double blend_max_weight{0.9};
  double blend_full_z{2.0};
  int platt_max_iterations{100};
  double platt_l2{1e-6}; // on the slope only
};

// (mean - line) / sd with sd floored at 1e-6, capped to +/- cap.
double z_score(double mean, double sd, double line, double cap);

double logistic(double x);

double blend_toward_neutral(double p, double z, const ProbabilityConfig &cfg);

// Maps a simulation z-score to the probability the positive side (home
// cover, over) wins. Before fit() it falls back to a fixed logistic curve.
class ProbabilityCalibrator {
public:
  explicit ProbabilityCalibrator(const ProbabilityConfig &cfg = {}) : cfg_(cfg) {}

  // Fits on z-scores against outcomes (1 positive side, 0 negative). Pushes
  // (0.5) and non-finite pairs are dropped. Returns the samples used; with
  // none the calibrator is left as it was.
  int fit(const Eigen::ArrayXd &z, const Eigen::ArrayXd &outcomes);

  double predict_z(double z) const;
  double predict(double mean, double sd, double line) const {
    return predict_z(z_score(mean, sd, line, cfg_.z_cap));
  }

  bool fitted() const { return fitted_; }
  int samples() const { return samples_; }
  double intercept() const { return intercept_; }
  double slope() const { return slope_; }
  const ProbabilityConfig &config() const { return cfg_; }

private:
  void fit_isotonic(const std::vector<double> &z, const std::vector<double> &y);
  void fit_platt(const std::vector<double> &z, const std::vector<double> &y);

  ProbabilityConfig cfg_;
  bool fitted_{false};
  int samples_{0};
  std::vector<double> knots_;  // isotonic: distinct z, ascending
  std::vector<double> levels_; // isotonic: fitted probability per knot
  double intercept_{0.0};      // platt
  double slope_{0.0};
};

} // namespace gridsim
