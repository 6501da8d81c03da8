#pragma once

#include "gridsim/backtest.hpp"
#include "gridsim/calibration.hpp"
#include "gridsim/simulator.hpp"
#include "gridsim/team_profile.hpp"

namespace gridsim {

// Every tunable of the engine in one place. Components take the piece they
// need by const reference; `sim` drives both live runs and backtest replay.
struct EngineConfig {
  ProfileConfig profile{};
  SimConfig sim{};
  CalibrationConfig calibration{};
  BacktestConfig backtest{};

  // Throws std::invalid_argument naming the first bad field.
  void validate() const;
};

void validate(const ProfileConfig &cfg);
void validate(const SimConfig &cfg);
void validate(const CalibrationConfig &cfg);
void validate(const BacktestConfig &cfg);

} // namespace gridsim
