#include "strategy/rules.h"
#include "util/config.h"

#include <algorithm>

inline auto& st_config = config.strategy_config;

// RSI stretched beyond its band AND price outside the bollinger envelope
std::optional<Signal> mean_reversion(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto rsi = ind.rsi(i);
  auto lower = ind.bb_lower(i), middle = ind.bb_middle(i),
       upper = ind.bb_upper(i);
  auto atr = ind.atr(i);
  if (!rsi || !lower || !middle || !upper || !atr)
    return std::nullopt;

  double price = ind.price(i);

  Direction dir;
  double stretch;
  if (*rsi < st_config.mr_rsi_oversold && price < *lower) {
    dir = Direction::Buy;
    stretch = st_config.mr_rsi_oversold - *rsi;
  } else if (*rsi > st_config.mr_rsi_overbought && price > *upper) {
    dir = Direction::Sell;
    stretch = *rsi - st_config.mr_rsi_overbought;
  } else {
    return std::nullopt;
  }

  auto sign = dir == Direction::Buy ? 1.0 : -1.0;
  auto stop = price - sign * st_config.tight_stop_atr * *atr;

  auto conf = std::min(st_config.mr_confidence + stretch / 100.0, 1.0);
  auto desc =
      std::format("rsi {:.1f} {} band {:.2f}, reverting to {:.2f}", *rsi,
                  dir == Direction::Buy ? "below lower" : "above upper",
                  dir == Direction::Buy ? *lower : *upper, *middle);

  auto s = Signal::entry(ind.symbol, StrategyType::MeanReversion, dir, 2, conf,
                         price, stop, *middle, desc);
  s.atr = atr;
  return s;
}
