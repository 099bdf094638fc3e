#include "strategy/rules.h"
#include "util/config.h"
#include "util/format.h"

#include <cmath>

inline auto& st_config = config.strategy_config;

// price above a rising fast average is bullish, below a falling one bearish
inline Direction ordered(double price,
                         std::optional<double> fast,
                         std::optional<double> slow) {
  if (!fast || !slow)
    return Direction::Watch;
  if (price > *fast && *fast > *slow)
    return Direction::Buy;
  if (price < *fast && *fast < *slow)
    return Direction::Sell;
  return Direction::Watch;
}

VoteTally count_votes(const Indicators& ind,
                      int idx,
                      std::vector<std::string>& buys,
                      std::vector<std::string>& sells) {
  VoteTally tally;
  auto vote = [&](Direction dir, const char* name) {
    if (dir == Direction::Buy) {
      tally.buy++;
      buys.push_back(name);
    } else if (dir == Direction::Sell) {
      tally.sell++;
      sells.push_back(name);
    } else {
      tally.neutral++;
    }
  };

  int i = ind.index(idx);
  double price = ind.price(i);

  vote(ordered(price, ind.sma20(i), ind.sma50(i)), "sma");
  vote(ordered(price, ind.ema12(i), ind.ema26(i)), "ema");

  auto rsi = ind.rsi(i);
  if (rsi && *rsi < st_config.vote_rsi_oversold)
    vote(Direction::Buy, "rsi oversold");
  else if (rsi && *rsi > st_config.vote_rsi_overbought)
    vote(Direction::Sell, "rsi overbought");
  else
    vote(Direction::Watch, "rsi");

  auto macd = ind.macd(i), signal = ind.macd_signal(i);
  if (macd && signal && *macd > *signal && *macd > 0)
    vote(Direction::Buy, "macd");
  else if (macd && signal && *macd < *signal && *macd < 0)
    vote(Direction::Sell, "macd");
  else
    vote(Direction::Watch, "macd");

  auto lower = ind.bb_lower(i), upper = ind.bb_upper(i);
  if (lower && price < *lower)
    vote(Direction::Buy, "below lower band");
  else if (upper && price > *upper)
    vote(Direction::Sell, "above upper band");
  else
    vote(Direction::Watch, "bollinger");

  double change = i > 0 ? price - ind.price(i - 1) : 0.0;
  auto change_dir = change > 0   ? Direction::Buy
                    : change < 0 ? Direction::Sell
                                 : Direction::Watch;

  auto atr = ind.atr(i);
  if (atr && std::abs(change) > st_config.vote_atr_move * *atr)
    vote(change_dir, "atr move");
  else
    vote(Direction::Watch, "atr");

  auto vol_sma = ind.volume_sma(i);
  if (vol_sma && ind.volume(i) > st_config.vote_volume_spike * *vol_sma)
    vote(change_dir, "volume spike");
  else
    vote(Direction::Watch, "volume");

  return tally;
}

Signal indicator_vote(const Indicators& ind, int idx) {
  std::vector<std::string> buys, sells;
  auto tally = count_votes(ind, idx, buys, sells);

  int i = ind.index(idx);
  auto dir = tally.decide(st_config.vote_majority);

  std::string desc = tally.str();
  if (!buys.empty())
    desc += std::format(", buy: {}", join(buys.begin(), buys.end()));
  if (!sells.empty())
    desc += std::format(", sell: {}", join(sells.begin(), sells.end()));

  if (is_directional(dir) && ind.atr(i)) {
    int n = dir == Direction::Buy ? tally.buy : tally.sell;
    auto s = atr_entry(ind, i, StrategyType::Voting, dir, n,
                       static_cast<double>(n) / N_VOTES, st_config.stop_atr,
                       st_config.target_atr, desc);
    s.tally = tally;
    return s;
  }

  if (is_directional(dir))
    desc += ", no atr for exits";
  else
    desc = "no majority: " + desc;

  auto s = Signal::watch(ind.symbol, StrategyType::Voting, tally.lean(),
                         st_config.watch_confidence, ind.price(i), desc);
  s.atr = ind.atr(i);
  s.tally = tally;
  return s;
}
