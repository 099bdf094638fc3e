#pragma once

#include <string>

enum class Direction { Buy, Sell, Watch };

// Fusion priority, highest first
enum class StrategyFamily {
  Specialized,  // asset proxies and asset specific rules
  Voting,       // multi indicator vote
  Generic,      // single pattern rules
  Fallback,     // forced entries
};

enum class StrategyType {
  Voting,

  // Specialized
  YieldCurve,
  CreditSpread,
  Fibonacci,
  GoldFactors,

  // Generic
  TrendFollowing,
  MomentumBreakout,
  Breakout,
  TrendBreakout,
  MovingAverageBreakout,
  Momentum,
  MeanReversion,

  ForcedEntry,
};

struct Meta {
  StrategyFamily family;
  int rank;  // tie break inside a family, lower wins
  std::string str = "";
};

const Meta& meta_of(StrategyType type);

inline bool is_directional(Direction dir) {
  return dir != Direction::Watch;
}
