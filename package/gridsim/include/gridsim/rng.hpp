#pragma once

#include <algorithm>
#include <cstdint>
#include <random>

namespace gridsim {

using Rng = std::mt19937_64;

// splitmix64-style mixing to decorrelate per-trial seeds
inline std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

inline double uniform01(Rng &rng) {
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  return unif(rng);
}

inline bool bernoulli(Rng &rng, double p) { return uniform01(rng) < p; }

inline double clamp(double v, double lo, double hi) {
  return std::min(hi, std::max(lo, v));
}

inline int clamp(int v, int lo, int hi) { return std::min(hi, std::max(lo, v)); }

} // namespace gridsim
