#include "strategy/rules.h"
#include "util/config.h"

inline auto& st_config = config.strategy_config;

std::optional<Signal> momentum(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto mom10 = ind.mom10(i), mom20 = ind.mom20(i);
  auto macd = ind.macd(i), signal = ind.macd_signal(i);
  auto rsi = ind.rsi(i);
  if (!mom10 || !mom20 || !macd || !signal || !rsi || !ind.atr(i))
    return std::nullopt;

  auto mid = st_config.momentum_mid_threshold;
  auto lng = st_config.momentum_long_threshold;

  Direction dir;
  if (*mom10 > mid && *mom20 > lng && *macd > *signal && *rsi > 50.0)
    dir = Direction::Buy;
  else if (*mom10 < -mid && *mom20 < -lng && *macd < *signal && *rsi < 50.0)
    dir = Direction::Sell;
  else
    return std::nullopt;

  auto desc = std::format("10d {:+.1f}%, 20d {:+.1f}%, macd {} signal",
                          *mom10 * 100, *mom20 * 100,
                          dir == Direction::Buy ? "above" : "below");

  return atr_entry(ind, i, StrategyType::Momentum, dir, 3,
                   st_config.momentum_confidence, st_config.tight_stop_atr,
                   st_config.breakout_target_atr, desc);
}
