#include "strategy/rules.h"
#include "strategy/strategy.h"

#include <array>

inline constexpr std::array<Rule, 2> equity_rules = {
    momentum_breakout,
    mean_reversion,
};

std::string_view EquityStrategy::description() const {
  return "momentum breakout and mean reversion over single stocks";
}

std::span<const Rule> EquityStrategy::rules() const {
  return equity_rules;
}
