#include "strategy/rules.h"
#include "util/config.h"

inline auto& st_config = config.strategy_config;

std::optional<Signal> ma_breakout(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto sma20 = ind.sma20(i), sma50 = ind.sma50(i);
  auto rsi = ind.rsi(i);
  if (!sma20 || !sma50 || !rsi || !ind.atr(i))
    return std::nullopt;

  double price = ind.price(i);

  Direction dir;
  if (price > *sma20 && price > *sma50 &&
      *rsi <= st_config.vote_rsi_overbought)
    dir = Direction::Buy;
  else if (price < *sma20 && price < *sma50 &&
           *rsi >= st_config.vote_rsi_oversold)
    dir = Direction::Sell;
  else
    return std::nullopt;

  auto desc = std::format("price {} sma20 {:.2f} and sma50 {:.2f}, rsi {:.1f}",
                          dir == Direction::Buy ? "above" : "below", *sma20,
                          *sma50, *rsi);

  return atr_entry(ind, i, StrategyType::MovingAverageBreakout, dir, 2,
                   st_config.ma_breakout_confidence, st_config.tight_stop_atr,
                   st_config.tight_target_atr, desc);
}
