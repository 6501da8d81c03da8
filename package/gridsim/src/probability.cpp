#include "gridsim/probability.hpp"
#include "gridsim/log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace gridsim {

const char *method_name(ProbabilityMethod m) {
  switch (m) {
  case ProbabilityMethod::Isotonic: return "isotonic";
  case ProbabilityMethod::Platt: return "platt";
  }
  return "unknown";
}

double z_score(double mean, double sd, double line, double cap) {
  return std::clamp((mean - line) / std::max(sd, 1e-6), -cap, cap);
}

double logistic(double x) {
  if (x >= 0.0)
    return 1.0 / (1.0 + std::exp(-x));
  const double e = std::exp(x);
  return e / (1.0 + e);
}

double blend_toward_neutral(double p, double z, const ProbabilityConfig &cfg) {
  const double reach =
      cfg.blend_full_z > 0.0 ? std::min(std::abs(z) / cfg.blend_full_z, 1.0) : 1.0;
  const double w =
      cfg.blend_min_weight + (cfg.blend_max_weight - cfg.blend_min_weight) * reach;
  return std::clamp(w * p + (1.0 - w) * 0.5, 0.0, 1.0);
}

int ProbabilityCalibrator::fit(const Eigen::ArrayXd &z, const Eigen::ArrayXd &outcomes) {
  if (z.size() != outcomes.size())
    throw std::invalid_argument("ProbabilityCalibrator::fit: z and outcomes differ in length");

  std::vector<double> zs, ys;
  zs.reserve(static_cast<std::size_t>(z.size()));
  ys.reserve(static_cast<std::size_t>(z.size()));
  for (Eigen::Index i = 0; i < z.size(); ++i) {
    if (!std::isfinite(z[i]) || !std::isfinite(outcomes[i]) || outcomes[i] == 0.5)
      continue;
    zs.push_back(std::clamp(z[i], -cfg_.z_cap, cfg_.z_cap));
    ys.push_back(outcomes[i] > 0.5 ? 1.0 : 0.0);
  }
  const int n = static_cast<int>(zs.size());
  if (n == 0) {
    log_warn("probability calibration: no decided samples to fit");
    return 0;
  }
  if (n < cfg_.min_samples)
    log_warn("probability calibration on {} samples (recommended minimum {})", n,
             cfg_.min_samples);

  switch (cfg_.method) {
  case ProbabilityMethod::Isotonic: fit_isotonic(zs, ys); break;
  case ProbabilityMethod::Platt: fit_platt(zs, ys); break;
  }
  fitted_ = true;
  samples_ = n;
  log_debug("probability calibration ({}) fitted on {} samples, z in [{:.2f}, {:.2f}]",
            method_name(cfg_.method), n, *std::min_element(zs.begin(), zs.end()),
            *std::max_element(zs.begin(), zs.end()));
  return n;
}

void ProbabilityCalibrator::fit_isotonic(const std::vector<double> &z,
                                         const std::vector<double> &y) {
  std::vector<std::size_t> order(z.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) { return z[a] < z[b]; });

  // Equal z values share one point carrying their mean outcome.
  std::vector<double> xs, sums, weights;
  for (std::size_t idx : order) {
    if (!xs.empty() && z[idx] == xs.back()) {
      sums.back() += y[idx];
      weights.back() += 1.0;
    } else {
      xs.push_back(z[idx]);
      sums.push_back(y[idx]);
      weights.push_back(1.0);
    }
  }

  // Pool adjacent violators until block means are non-decreasing.
  struct Block {
    double sum;
    double weight;
    std::size_t points;
  };
  std::vector<Block> blocks;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    blocks.push_back({sums[i], weights[i], 1});
    while (blocks.size() > 1) {
      const Block &last = blocks[blocks.size() - 1];
      Block &prev = blocks[blocks.size() - 2];
      if (prev.sum / prev.weight <= last.sum / last.weight)
        break;
      prev.sum += last.sum;
      prev.weight += last.weight;
      prev.points += last.points;
      blocks.pop_back();
    }
  }

  knots_ = xs;
  levels_.clear();
  for (const Block &b : blocks)
    levels_.insert(levels_.end(), b.points, b.sum / b.weight);
}

void ProbabilityCalibrator::fit_platt(const std::vector<double> &z,
                                      const std::vector<double> &y) {
  const Eigen::Index n = static_cast<Eigen::Index>(z.size());
  Eigen::MatrixXd x(n, 2);
  x.col(0).setOnes();
  x.col(1) = Eigen::Map<const Eigen::VectorXd>(z.data(), n);
  const Eigen::Map<const Eigen::VectorXd> target(y.data(), n);

  Eigen::Matrix2d penalty = Eigen::Matrix2d::Zero();
  penalty(1, 1) = cfg_.platt_l2;
  Eigen::Vector2d w = Eigen::Vector2d::Zero();

  // Newton-Raphson on the penalized log-likelihood.
  for (int it = 0; it < cfg_.platt_max_iterations; ++it) {
    const Eigen::VectorXd eta = x * w;
    const Eigen::VectorXd p = eta.unaryExpr([](double v) { return logistic(v); });
    const Eigen::VectorXd curvature = p.array() * (1.0 - p.array());
    const Eigen::Vector2d grad = x.transpose() * (target - p) - penalty * w;
    const Eigen::Matrix2d hess = x.transpose() * curvature.asDiagonal() * x + penalty;
    const Eigen::Vector2d step = hess.ldlt().solve(grad);
    if (!step.allFinite()) {
      log_warn("platt scaling stopped after {} iterations: flat likelihood", it);
      break;
    }
    w += step;
    if (step.cwiseAbs().maxCoeff() < 1e-10)
      break;
  }
  intercept_ = w[0];
  slope_ = w[1];
}

double ProbabilityCalibrator::predict_z(double z) const {
  z = std::clamp(z, -cfg_.z_cap, cfg_.z_cap);
  double p = 0.5;
  if (!fitted_) {
    p = logistic(cfg_.fallback_slope * z);
  } else if (cfg_.method == ProbabilityMethod::Platt) {
    p = logistic(intercept_ + slope_ * z);
  } else if (z <= knots_.front()) {
    p = levels_.front();
  } else if (z >= knots_.back()) {
    p = levels_.back();
  } else {
    const auto hi = static_cast<std::size_t>(
        std::upper_bound(knots_.begin(), knots_.end(), z) - knots_.begin());
    const std::size_t lo = hi - 1;
    const double t = (z - knots_[lo]) / (knots_[hi] - knots_[lo]);
    p = levels_[lo] + t * (levels_[hi] - levels_[lo]);
  }
  if (cfg_.blend)
    p = blend_toward_neutral(p, z, cfg_);
  return std::clamp(p, 0.0, 1.0);
}

} // namespace gridsim
