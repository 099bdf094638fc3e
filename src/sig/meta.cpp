#include "sig/signal_types.h"

#include <unordered_map>

inline const std::unordered_map<StrategyType, Meta> strategy_meta = {
    {
        StrategyType::Voting,                             //
        {StrategyFamily::Voting, 0, "multi_indicator_voting"}  //
    },

    // Specialized:
    {
        StrategyType::YieldCurve,                         //
        {StrategyFamily::Specialized, 0, "yield_curve"}  //
    },
    {
        StrategyType::CreditSpread,                         //
        {StrategyFamily::Specialized, 1, "credit_spread"}  //
    },
    {
        StrategyType::GoldFactors,                         //
        {StrategyFamily::Specialized, 2, "gold_factors"}  //
    },
    {
        StrategyType::Fibonacci,                                //
        {StrategyFamily::Specialized, 3, "fibonacci_retracement"}  //
    },

    // Generic:
    {
        StrategyType::TrendFollowing,                       //
        {StrategyFamily::Generic, 0, "trend_following"}  //
    },
    {
        StrategyType::TrendBreakout,                       //
        {StrategyFamily::Generic, 1, "trend_breakout"}  //
    },
    {
        StrategyType::MomentumBreakout,                       //
        {StrategyFamily::Generic, 2, "momentum_breakout"}  //
    },
    {
        StrategyType::Breakout,                       //
        {StrategyFamily::Generic, 3, "breakout"}  //
    },
    {
        StrategyType::MovingAverageBreakout,             //
        {StrategyFamily::Generic, 4, "ma_breakout"}  //
    },
    {
        StrategyType::Momentum,                       //
        {StrategyFamily::Generic, 5, "momentum"}  //
    },
    {
        StrategyType::MeanReversion,                       //
        {StrategyFamily::Generic, 6, "mean_reversion"}  //
    },

    {
        StrategyType::ForcedEntry,                         //
        {StrategyFamily::Fallback, 0, "forced_entry"}  //
    },
};

const Meta& meta_of(StrategyType type) {
  return strategy_meta.at(type);
}
