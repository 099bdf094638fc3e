#include "strategy/rules.h"
#include "util/config.h"

inline auto& st_config = config.strategy_config;

// Trend aligned band breakout with volume. RSI must show strength without
// being exhausted.
std::optional<Signal> trend_breakout(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto sma20 = ind.sma20(i), sma50 = ind.sma50(i);
  auto upper = ind.bb_upper(i), lower = ind.bb_lower(i);
  auto rsi = ind.rsi(i);
  auto vol_sma = ind.volume_sma(i);
  if (!sma20 || !sma50 || !upper || !lower || !rsi || !vol_sma || !ind.atr(i))
    return std::nullopt;

  double price = ind.price(i);
  if (ind.volume(i) <= st_config.trend_breakout_volume_ratio * *vol_sma)
    return std::nullopt;

  auto cap = st_config.breakout_rsi_cap;

  Direction dir;
  if (price > *sma20 && *sma20 > *sma50 && price > *upper && *rsi > 50.0 &&
      *rsi < cap)
    dir = Direction::Buy;
  else if (price < *sma20 && *sma20 < *sma50 && price < *lower &&
           *rsi < 50.0 && *rsi > 100.0 - cap)
    dir = Direction::Sell;
  else
    return std::nullopt;

  auto desc = std::format("{} through the {} band with the trend, rsi {:.1f}",
                          dir == Direction::Buy ? "up" : "down",
                          dir == Direction::Buy ? "upper" : "lower", *rsi);

  return atr_entry(ind, i, StrategyType::TrendBreakout, dir, 4,
                   st_config.trend_breakout_confidence, st_config.stop_atr,
                   st_config.target_atr, desc);
}
