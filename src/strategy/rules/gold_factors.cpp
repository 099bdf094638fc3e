#include "strategy/rules.h"
#include "util/config.h"

#include <algorithm>
#include <cmath>
#include <numeric>

inline auto& st_config = config.strategy_config;

std::optional<GoldFactors> gold_factor_scores(const Indicators& ind, int idx) {
  auto& closes = ind.close_series();
  if (closes.empty())
    return std::nullopt;

  int i = ind.index(idx);
  size_t end = static_cast<size_t>(i) + 1;

  // safe haven: calm price action scores high, read as daily volatility
  auto vol = ind.volatility(i);
  if (!vol)
    return std::nullopt;
  double daily_vol = *vol / std::sqrt(TRADING_DAYS);

  // inflation hedge: persistent drift over the longer window
  auto hedge_n = std::min(st_config.hedge_window + 1, end);
  if (hedge_n < st_config.hedge_min_window + 1)
    return std::nullopt;

  std::vector<double> longer(closes.begin() + (end - hedge_n),
                             closes.begin() + end);
  auto returns = sample_returns(longer);
  if (returns.empty())
    return std::nullopt;
  auto mean = std::accumulate(returns.begin(), returns.end(), 0.0) /
              returns.size();

  GoldFactors f;
  f.safe_haven = 1.0 - std::min(daily_vol * 10.0, 1.0);
  f.inflation_hedge = std::clamp(mean * 100.0, 0.0, 1.0);

  auto w = std::clamp(st_config.safe_haven_weight, 0.0, 1.0);
  f.score = w * f.safe_haven + (1.0 - w) * f.inflation_hedge;
  return f;
}

std::optional<Signal> gold_factors(const Indicators& ind, int idx) {
  int i = ind.index(idx);

  auto f = gold_factor_scores(ind, i);
  if (!f || !ind.atr(i))
    return std::nullopt;

  auto trend = ind.sma200(i);
  auto trend_name = "sma200";
  if (!trend) {
    trend = ind.sma50(i);
    trend_name = "sma50";
  }
  if (!trend)
    return std::nullopt;

  double price = ind.price(i);

  Direction dir;
  double conf;
  if (f->score >= st_config.gold_factor_buy && price > *trend) {
    dir = Direction::Buy;
    conf = f->score;
  } else if (f->score <= st_config.gold_factor_sell && price < *trend) {
    dir = Direction::Sell;
    conf = 1.0 - f->score;
  } else {
    return std::nullopt;
  }

  auto desc = std::format(
      "safe haven {:.2f}, inflation hedge {:.2f}, score {:.2f}, {} {}",
      f->safe_haven, f->inflation_hedge, f->score,
      dir == Direction::Buy ? "above" : "below", trend_name);

  return atr_entry(ind, i, StrategyType::GoldFactors, dir,
                   static_cast<int>(f->score * 10), conf, st_config.stop_atr,
                   st_config.target_atr, desc);
}
