#pragma once

#include "signal_types.h"

#include <optional>
#include <string>

struct VoteTally {
  int buy = 0;
  int sell = 0;
  int neutral = 0;

  int total() const { return buy + sell + neutral; }
  int lean() const { return buy > sell ? buy : sell; }
  Direction leaning() const {
    return buy > sell ? Direction::Buy
           : sell > buy ? Direction::Sell
                        : Direction::Watch;
  }

  // BUY needs `majority` votes and more buys than sells, SELL mirrors it
  Direction decide(int majority) const;

  std::string str() const;

  bool operator==(const VoteTally&) const = default;
};

struct Signal {
  std::string symbol;
  StrategyType strategy = StrategyType::Voting;
  Direction direction = Direction::Watch;

  int strength = 0;
  double confidence = 0.0;
  double price = 0.0;

  // present exactly when the signal is directional
  std::optional<double> stop_loss;
  std::optional<double> target;

  // volatility unit at the signal bar, sizes fallback exits
  std::optional<double> atr;

  std::string rationale;
  std::optional<VoteTally> tally;

  static Signal entry(std::string symbol,
                      StrategyType strategy,
                      Direction direction,
                      int strength,
                      double confidence,
                      double price,
                      double stop_loss,
                      double target,
                      std::string rationale);

  static Signal watch(std::string symbol,
                      StrategyType strategy,
                      int strength,
                      double confidence,
                      double price,
                      std::string rationale);

  bool directional() const { return is_directional(direction); }
  bool forced() const { return strategy == StrategyType::ForcedEntry; }

  auto family() const { return meta_of(strategy).family; }
  auto rank() const { return meta_of(strategy).rank; }
  auto name() const { return meta_of(strategy).str; }

  // every invariant a consumer relies on
  bool valid() const;

  bool operator==(const Signal&) const = default;
};
