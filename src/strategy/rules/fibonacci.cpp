#include "strategy/rules.h"
#include "util/config.h"

#include <cmath>

inline auto& st_config = config.strategy_config;

std::optional<Signal> fibonacci_retracement(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto fib = ind.fibonacci(i);
  auto rsi = ind.rsi(i);
  if (!fib || !rsi || !ind.atr(i) || fib->high <= fib->low)
    return std::nullopt;

  double price = ind.price(i);
  auto near = [&](double ratio) {
    return std::abs(price - fib->level(ratio)) / price < st_config.fib_proximity;
  };

  Direction dir;
  double ratio;
  if (near(0.382) && *rsi < st_config.fib_rsi_support) {
    dir = Direction::Buy;
    ratio = 0.382;
  } else if (near(0.618) && *rsi < st_config.fib_rsi_support) {
    dir = Direction::Buy;
    ratio = 0.618;
  } else if (near(0.786) && *rsi > st_config.fib_rsi_resistance) {
    dir = Direction::Sell;
    ratio = 0.786;
  } else {
    return std::nullopt;
  }

  auto desc = std::format(
      "{} at the {:.3f} level {:.2f} of range {:.2f}-{:.2f}, rsi {:.1f}",
      dir == Direction::Buy ? "support" : "resistance", ratio,
      fib->level(ratio), fib->low, fib->high, *rsi);

  return atr_entry(ind, i, StrategyType::Fibonacci, dir, 2,
                   st_config.fib_confidence, st_config.tight_stop_atr,
                   st_config.tight_target_atr, desc);
}
