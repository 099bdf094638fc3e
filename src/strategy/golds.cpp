#include "strategy/rules.h"
#include "strategy/strategy.h"

#include <array>

inline constexpr std::array<Rule, 4> gold_rules = {
    gold_factors,
    fibonacci_retracement,
    trend_breakout,
    momentum,
};

std::string_view GoldStrategy::description() const {
  return "safe haven factors, fibonacci levels, breakouts and momentum";
}

std::span<const Rule> GoldStrategy::rules() const {
  return gold_rules;
}
