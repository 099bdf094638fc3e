#include "strategy/rules.h"
#include "util/config.h"
#include "util/format.h"

inline auto& st_config = config.strategy_config;

std::optional<Signal> momentum_breakout(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto sma20 = ind.sma20(i), sma50 = ind.sma50(i);
  auto vol_sma = ind.volume_sma(i);
  if (!sma20 || !sma50 || !vol_sma || !ind.atr(i))
    return std::nullopt;

  double price = ind.price(i);
  bool volume_confirms =
      ind.volume(i) > st_config.momentum_volume_ratio * *vol_sma;

  std::vector<std::string> up, down;
  if (price > *sma20)
    up.push_back("above sma20");
  else if (price < *sma20)
    down.push_back("below sma20");

  if (price > *sma50)
    up.push_back("above sma50");
  else if (price < *sma50)
    down.push_back("below sma50");

  if (*sma20 > *sma50)
    up.push_back("sma20>sma50");
  else if (*sma20 < *sma50)
    down.push_back("sma20<sma50");

  if (volume_confirms) {
    up.push_back("volume");
    down.push_back("volume");
  }

  int min = st_config.momentum_min_strength;
  Direction dir;
  std::vector<std::string>* reasons;
  if (static_cast<int>(up.size()) >= min && up.size() > down.size()) {
    dir = Direction::Buy;
    reasons = &up;
  } else if (static_cast<int>(down.size()) >= min && down.size() > up.size()) {
    dir = Direction::Sell;
    reasons = &down;
  } else {
    return std::nullopt;
  }

  int strength = static_cast<int>(reasons->size());
  auto desc = std::format("{}/4 breakout conditions: {}", strength,
                          join(reasons->begin(), reasons->end()));

  return atr_entry(ind, i, StrategyType::MomentumBreakout, dir, strength,
                   strength / 4.0, st_config.stop_atr, st_config.target_atr,
                   desc);
}
