#pragma once

#include "strategy.h"

#include <format>
#include <optional>
#include <string>
#include <vector>

inline constexpr int N_VOTES = 7;

// Seven votes: sma trend, ema trend, rsi extremes, macd, bollinger touch,
// atr sized move and volume spike. Undefined inputs vote neutral.
VoteTally count_votes(const Indicators& ind,
                      int idx,
                      std::vector<std::string>& buys,
                      std::vector<std::string>& sells);

// Always yields a signal, WATCH when there is no majority
Signal indicator_vote(const Indicators& ind, int idx = -1);

std::optional<Signal> trend_following(const Indicators& ind, int idx);
std::optional<Signal> mean_reversion(const Indicators& ind, int idx);
std::optional<Signal> breakout(const Indicators& ind, int idx);
std::optional<Signal> momentum_breakout(const Indicators& ind, int idx);
std::optional<Signal> ma_breakout(const Indicators& ind, int idx);
std::optional<Signal> trend_breakout(const Indicators& ind, int idx);
std::optional<Signal> momentum(const Indicators& ind, int idx);
std::optional<Signal> fibonacci_retracement(const Indicators& ind, int idx);
std::optional<Signal> gold_factors(const Indicators& ind, int idx);

struct GoldFactors {
  double safe_haven = 0.0;
  double inflation_hedge = 0.0;
  double score = 0.0;
};

std::optional<GoldFactors> gold_factor_scores(const Indicators& ind, int idx);

std::vector<Signal> yield_curve(const IndicatorMap& indicators);
std::vector<Signal> credit_spread(const IndicatorMap& indicators);

// BUY exits sit below/above the price by the given atr multiples, SELL
// mirrors them
Signal atr_entry(const Indicators& ind,
                 int idx,
                 StrategyType strategy,
                 Direction dir,
                 int strength,
                 double confidence,
                 double stop_mult,
                 double target_mult,
                 std::string rationale);
