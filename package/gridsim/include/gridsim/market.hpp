#pragma once

#include <cstdint>

namespace gridsim {

// Published line at one point in time. Spread is the home team's line:
// negative when the home team is favored (-3.5 means home gives 3.5).
struct MarketLine {
  double spread{0.0};
  double total{44.0};
  std::int64_t timestamp{0}; // epoch seconds the line was observed
};

struct MarketSnapshot {
  MarketLine opening{};
  MarketLine closing{};
};

// Home margin the market implies.
inline double implied_home_margin(const MarketLine &m) { return -m.spread; }

// Profit per unit staked on a win at American odds (-110 -> 0.909).
inline double american_to_payout(int price) {
  if (price >= 100)
    return static_cast<double>(price) / 100.0;
  if (price <= -100)
    return 100.0 / static_cast<double>(-price);
  return 0.0;
}

} // namespace gridsim
