#include "gridsim/team_stats.hpp"
#include "gridsim/errors.hpp"

#include <set>

namespace gridsim {

void StatsTable::set(const TeamWeekStats &stats) {
  rows_[Key{stats.team, stats.season, stats.week}] = stats;
}

bool StatsTable::has(const std::string &team, int season, int week) const {
  return rows_.find(Key{team, season, week}) != rows_.end();
}

const TeamWeekStats &StatsTable::get(const std::string &team, int season,
                                     int week) const {
  auto it = rows_.find(Key{team, season, week});
  if (it == rows_.end()) {
    throw DataUnavailable(team, season, week);
  }
  return it->second;
}

std::vector<std::string> StatsTable::teams() const {
  std::set<std::string> seen;
  for (const auto &kv : rows_)
    seen.insert(std::get<0>(kv.first));
  return std::vector<std::string>(seen.begin(), seen.end());
}

} // namespace gridsim
