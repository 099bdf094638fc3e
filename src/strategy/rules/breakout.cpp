#include "strategy/rules.h"
#include "util/config.h"

inline auto& st_config = config.strategy_config;

std::optional<Signal> breakout(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto upper = ind.bb_upper(i), lower = ind.bb_lower(i);
  auto rsi = ind.rsi(i);
  auto vol_sma = ind.volume_sma(i);
  if (!upper || !lower || !rsi || !vol_sma || !ind.atr(i))
    return std::nullopt;

  double price = ind.price(i);
  double volume = ind.volume(i);
  if (volume <= st_config.breakout_volume_ratio * *vol_sma)
    return std::nullopt;

  Direction dir;
  if (price > *upper && *rsi < st_config.breakout_rsi_cap)
    dir = Direction::Buy;
  else if (price < *lower && *rsi > 100.0 - st_config.breakout_rsi_cap)
    dir = Direction::Sell;
  else
    return std::nullopt;

  auto desc = std::format(
      "close {:.2f} {} band {:.2f}, rsi {:.1f}, volume {:.1f}x average", price,
      dir == Direction::Buy ? "above upper" : "below lower",
      dir == Direction::Buy ? *upper : *lower, *rsi, volume / *vol_sma);

  return atr_entry(ind, i, StrategyType::Breakout, dir, 3,
                   st_config.breakout_confidence, st_config.tight_stop_atr,
                   st_config.breakout_target_atr, desc);
}
