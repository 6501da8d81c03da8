#include "gridsim/simulator.hpp"
#include "gridsim/errors.hpp"
#include "gridsim/log.hpp"
#include "gridsim/rng.hpp"
#include "gridsim/thread_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace gridsim {

namespace {

enum TrialState : std::uint8_t { kPending = 0, kDone = 1, kDiverged = 2 };

std::uint64_t fresh_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

} // namespace

SimulationBatch Simulator::run(const TeamProfile &home, const TeamProfile &away,
                               const MarketLine &market,
                               const SimConfig &cfg) const {
  if (cfg.n_trials <= 0)
    throw std::invalid_argument("SimConfig.n_trials must be positive");
  if (cfg.chunk_size <= 0)
    throw std::invalid_argument("SimConfig.chunk_size must be positive");

  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();
  const int n = cfg.n_trials;
  const std::uint64_t batch_seed = cfg.seed ? *cfg.seed : fresh_seed();
  const GameOrchestrator game(home, away, cfg.game, cfg.matchup);

  std::vector<SimulationTrial> slots(static_cast<std::size_t>(n));
  std::vector<std::uint8_t> state(static_cast<std::size_t>(n), kPending);
  std::atomic<int> cursor{0};
  const bool budgeted = cfg.time_budget_ms > 0;
  const auto deadline = t0 + std::chrono::milliseconds(cfg.time_budget_ms);

  auto worker = [&]() {
    while (true) {
      if (budgeted && clock::now() >= deadline)
        return;
      const int begin = cursor.fetch_add(cfg.chunk_size);
      if (begin >= n)
        return;
      const int end = std::min(n, begin + cfg.chunk_size);
      for (int k = begin; k < end; ++k) {
        const auto idx = static_cast<std::size_t>(k);
        Rng rng(mix_seed(batch_seed, static_cast<std::uint64_t>(k)));
        try {
          slots[idx] = game.play(rng);
          state[idx] = kDone;
        } catch (const SimulationDivergence &e) {
          state[idx] = kDiverged;
          log_debug("trial {} discarded: {}", k, e.what());
        }
      }
    }
  };

  const int chunks = (n + cfg.chunk_size - 1) / cfg.chunk_size;
  int n_threads = cfg.n_threads > 0
                      ? cfg.n_threads
                      : static_cast<int>(std::thread::hardware_concurrency());
  n_threads = std::max(1, std::min(n_threads, chunks));

  {
    ThreadPool pool(static_cast<std::size_t>(n_threads));
    std::vector<std::future<void>> futures;
    futures.reserve(static_cast<std::size_t>(n_threads));
    for (int i = 0; i < n_threads; ++i)
      futures.push_back(pool.submit(worker));
    for (auto &f : futures)
      f.get();
  }

  std::vector<SimulationTrial> completed;
  completed.reserve(static_cast<std::size_t>(n));
  BatchCounts counts;
  counts.target = n;
  counts.min_trials = cfg.min_trials;
  counts.max_discard_rate = cfg.max_discard_rate;
  counts.seed = batch_seed;
  counts.proxy_mode = !home.has_advanced_grades() || !away.has_advanced_grades();
  for (int k = 0; k < n; ++k) {
    const auto idx = static_cast<std::size_t>(k);
    if (state[idx] == kDone)
      completed.push_back(slots[idx]);
    else if (state[idx] == kDiverged)
      ++counts.discarded;
    else
      counts.truncated = true;
  }

  SimulationBatch batch = aggregate_trials(completed, market, counts, cfg.conviction);
  if (cfg.centering.enabled && batch.trials_completed > 0)
    batch.centered = summarize_centered(batch.margins, batch.totals, market, cfg.centering);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      clock::now() - t0).count();
  if (batch.truncated)
    log_warn("{} vs {}: time budget of {} ms reached after {} of {} trials",
             home.team(), away.team(), cfg.time_budget_ms,
             batch.trials_completed + batch.trials_discarded, n);
  log_debug("{} vs {}: {} trials in {} ms on {} threads, margin median {:+.1f} "
            "total median {:.1f}",
            home.team(), away.team(), batch.trials_completed, ms, n_threads,
            batch.margin.median, batch.total.median);
  return batch;
}

} // namespace gridsim
