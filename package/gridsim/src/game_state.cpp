#include "gridsim/game_state.hpp"

#include <algorithm>

namespace gridsim {

double expected_points(int down, int distance, int yardline) {
  static const double kDownPenalty[5] = {0.0, 0.0, 0.35, 0.85, 1.6};
  const int d = std::min(4, std::max(1, down));
  const int yl = std::min(99, std::max(1, yardline));
  double ep = -0.8 + 0.066 * static_cast<double>(yl);
  ep -= kDownPenalty[d];
  ep -= 0.03 * static_cast<double>(std::max(0, distance - 10));
  return ep;
}

} // namespace gridsim
