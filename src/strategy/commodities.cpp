#include "strategy/rules.h"
#include "strategy/strategy.h"

#include <array>

inline constexpr std::array<Rule, 3> commodity_rules = {
    trend_following,
    breakout,
    mean_reversion,
};

std::string_view CommodityStrategy::description() const {
  return "trend following, volume confirmed breakouts and mean reversion";
}

std::span<const Rule> CommodityStrategy::rules() const {
  return commodity_rules;
}
