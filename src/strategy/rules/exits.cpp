#include "strategy/rules.h"

#include <format>
#include <stdexcept>

Signal atr_entry(const Indicators& ind,
                 int idx,
                 StrategyType strategy,
                 Direction dir,
                 int strength,
                 double confidence,
                 double stop_mult,
                 double target_mult,
                 std::string rationale) {
  auto atr = ind.atr(idx);
  if (!atr)
    throw std::invalid_argument(
        std::format("({}) atr exits without a defined atr", ind.symbol));

  auto price = ind.price(idx);
  auto sign = dir == Direction::Buy ? 1.0 : -1.0;

  auto s = Signal::entry(ind.symbol, strategy, dir, strength, confidence,
                         price, price - sign * stop_mult * *atr,
                         price + sign * target_mult * *atr,
                         std::move(rationale));
  s.atr = atr;
  return s;
}
