#pragma once

#include <cstdint>

namespace gridsim {

enum class Side : std::uint8_t { Home = 0, Away = 1 };

inline Side other(Side s) { return s == Side::Home ? Side::Away : Side::Home; }

constexpr int kQuarterSeconds = 900;
constexpr int kOvertimeSeconds = 600;

// Trial-local game situation. Yardline is measured from the offense's own
// goal line (0) to the opponent's (100).
struct GameState {
  int quarter{1};
  int clock{kQuarterSeconds}; // seconds left in the quarter
  Side possession{Side::Home};
  int down{1};
  int distance{10};
  int yardline{25};
  int home_score{0};
  int away_score{0};
  int home_timeouts{3};
  int away_timeouts{3};
  int drive_number{0};
  int plays_this_drive{0};
  bool overtime{false};

  int score(Side s) const { return s == Side::Home ? home_score : away_score; }
  void add_points(Side s, int pts) {
    (s == Side::Home ? home_score : away_score) += pts;
  }
  int &timeouts(Side s) { return s == Side::Home ? home_timeouts : away_timeouts; }
  int timeouts_left(Side s) const {
    return s == Side::Home ? home_timeouts : away_timeouts;
  }

  // From the perspective of the team in possession.
  int score_diff() const {
    return score(possession) - score(other(possession));
  }

  int game_seconds_remaining() const {
    if (overtime)
      return clock;
    return (4 - quarter) * kQuarterSeconds + clock;
  }

  bool end_of_half_quarter() const { return quarter == 2 || quarter == 4; }

  bool in_two_minute(int window_seconds) const {
    return !overtime && end_of_half_quarter() && clock <= window_seconds;
  }

  void start_drive(Side offense, int start_yardline) {
    possession = offense;
    down = 1;
    yardline = start_yardline;
    distance = 100 - start_yardline < 10 ? 100 - start_yardline : 10;
    plays_this_drive = 0;
    ++drive_number;
  }

  void start_half(int q) {
    quarter = q;
    clock = kQuarterSeconds;
    home_timeouts = 3;
    away_timeouts = 3;
  }
};

// Expected points for the offense in a down/distance/yardline state.
double expected_points(int down, int distance, int yardline);

} // namespace gridsim
