#include "strategy/rules.h"
#include "util/config.h"
#include "util/format.h"

#include <algorithm>

inline auto& st_config = config.strategy_config;

std::optional<Signal> trend_following(const Indicators& ind, int idx) {
  int i = ind.index(idx);
  if (!ind.atr(i))
    return std::nullopt;

  int up = 0, down = 0;
  std::vector<std::string> up_reasons, down_reasons;

  auto check = [&](bool bullish, bool bearish, const char* up_desc,
                   const char* down_desc) {
    if (bullish) {
      up++;
      up_reasons.push_back(up_desc);
    } else if (bearish) {
      down++;
      down_reasons.push_back(down_desc);
    }
  };

  double price = ind.price(i);
  auto sma20 = ind.sma20(i), sma50 = ind.sma50(i);
  if (sma20 && sma50)
    check(price > *sma20 && *sma20 > *sma50, price < *sma20 && *sma20 < *sma50,
          "price>sma20>sma50", "price<sma20<sma50");

  auto ema12 = ind.ema12(i), ema26 = ind.ema26(i);
  if (ema12 && ema26)
    check(*ema12 > *ema26, *ema12 < *ema26, "ema12>ema26", "ema12<ema26");

  auto macd = ind.macd(i), signal = ind.macd_signal(i);
  if (macd && signal)
    check(*macd > *signal, *macd < *signal, "macd>signal", "macd<signal");

  auto mom10 = ind.mom10(i), mom20 = ind.mom20(i);
  if (mom10 && mom20)
    check(*mom10 > 0 && *mom20 > 0, *mom10 < 0 && *mom20 < 0,
          "momentum up", "momentum down");

  Direction dir = Direction::Watch;
  if (up >= st_config.trend_min_strength && up > down)
    dir = Direction::Buy;
  else if (down >= st_config.trend_min_strength && down > up)
    dir = Direction::Sell;
  else
    return std::nullopt;

  int strength = std::max(up, down);
  auto& reasons = dir == Direction::Buy ? up_reasons : down_reasons;

  double conf = strength / 4.0;
  auto adx = ind.adx(i);
  if (adx && *adx > st_config.trend_adx_threshold) {
    conf += st_config.trend_adx_bonus;
    reasons.push_back(std::format("adx {:.1f}", *adx));
  }

  auto desc = std::format("{}/4 trend conditions: {}", strength,
                          join(reasons.begin(), reasons.end()));
  return atr_entry(ind, i, StrategyType::TrendFollowing, dir, strength,
                   std::min(conf, 1.0), st_config.stop_atr,
                   st_config.target_atr, desc);
}
