#include "sig/signal.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

Direction VoteTally::decide(int majority) const {
  if (buy >= majority && buy > sell)
    return Direction::Buy;
  if (sell >= majority && sell > buy)
    return Direction::Sell;
  return Direction::Watch;
}

std::string VoteTally::str() const {
  return std::format("{} buy / {} sell / {} neutral", buy, sell, neutral);
}

inline double clamp_confidence(double conf) {
  if (!std::isfinite(conf))
    return 0.0;
  return std::clamp(conf, 0.0, 1.0);
}

Signal Signal::entry(std::string symbol,
                     StrategyType strategy,
                     Direction direction,
                     int strength,
                     double confidence,
                     double price,
                     double stop_loss,
                     double target,
                     std::string rationale) {
  if (!is_directional(direction))
    throw std::invalid_argument("entry signal needs a BUY or SELL direction");
  if (!std::isfinite(stop_loss) || !std::isfinite(target))
    throw std::invalid_argument(
        std::format("({}) entry signal without finite exits", symbol));

  Signal s;
  s.symbol = std::move(symbol);
  s.strategy = strategy;
  s.direction = direction;
  s.strength = strength;
  s.confidence = clamp_confidence(confidence);
  s.price = price;
  s.stop_loss = stop_loss;
  s.target = target;
  s.rationale = std::move(rationale);
  return s;
}

Signal Signal::watch(std::string symbol,
                     StrategyType strategy,
                     int strength,
                     double confidence,
                     double price,
                     std::string rationale) {
  Signal s;
  s.symbol = std::move(symbol);
  s.strategy = strategy;
  s.direction = Direction::Watch;
  s.strength = strength;
  s.confidence = clamp_confidence(confidence);
  s.price = price;
  s.rationale = std::move(rationale);
  return s;
}

bool Signal::valid() const {
  if (symbol.empty())
    return false;
  if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0)
    return false;

  switch (direction) {
    case Direction::Buy:
    case Direction::Sell:
      return stop_loss.has_value() && target.has_value();
    case Direction::Watch:
      return true;
  }
  return false;
}
