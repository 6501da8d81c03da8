#pragma once

#include <cstdint>
#include <optional>

#include "gridsim/aggregate.hpp"
#include "gridsim/centering.hpp"
#include "gridsim/game.hpp"
#include "gridsim/market.hpp"
#include "gridsim/matchup.hpp"
#include "gridsim/team_profile.hpp"

namespace gridsim {

struct SimConfig {
  int n_trials{10000};
  std::optional<std::uint64_t> seed{}; // unset: fresh entropy per batch
  int min_trials{1000};
  int time_budget_ms{0};               // 0 = no budget
  int n_threads{0};                    // 0 = hardware concurrency
  int chunk_size{256};                 // trials claimed per cursor step
  double max_discard_rate{0.01};
  GameConfig game{};
  MatchupConfig matchup{};
  ConvictionConfig conviction{};
  CenteringConfig centering{};
};

class Simulator {
public:
  Simulator() = default;

  // Runs cfg.n_trials games of home vs away. With a fixed seed the batch is
  // bit-identical for any thread count.
  SimulationBatch run(const TeamProfile &home, const TeamProfile &away,
                      const MarketLine &market, const SimConfig &cfg) const;

  SimulationBatch run(const ProfilePtr &home, const ProfilePtr &away,
                      const MarketLine &market, const SimConfig &cfg) const {
    return run(*home, *away, market, cfg);
  }
};

} // namespace gridsim
