#include "gridsim/matchup.hpp"
#include "gridsim/rng.hpp"

namespace gridsim {

namespace {

double unit_mismatch(const TeamProfile &offense, Unit off_unit,
                     const TeamProfile &defense, Unit def_unit,
                     double limit) {
  const std::optional<double> o = offense.unit_grade(off_unit);
  const std::optional<double> d = defense.unit_grade(def_unit);
  if (!o || !d)
    return 0.0;
  return clamp(*o - *d, -limit, limit);
}

} // namespace

MatchupContext resolve_matchup(const TeamProfile &offense,
                               const TeamProfile &defense,
                               const MatchupConfig &cfg) {
  MatchupContext m;
  m.pass_protection = unit_mismatch(offense, Unit::PassBlock, defense,
                                    Unit::PassRush, cfg.mismatch_clamp);
  m.coverage = unit_mismatch(offense, Unit::Receiving, defense, Unit::Coverage,
                             cfg.mismatch_clamp);
  m.run_block = unit_mismatch(offense, Unit::RunBlock, defense,
                              Unit::RunDefense, cfg.mismatch_clamp);
  return m;
}

} // namespace gridsim
