#include "strategy/rules.h"
#include "strategy/strategy.h"

#include <array>

inline constexpr std::array<Rule, 2> bond_rules = {
    ma_breakout,
    mean_reversion,
};

std::string_view BondStrategy::description() const {
  return "curve and credit proxies with moving average breakouts";
}

std::span<const Rule> BondStrategy::rules() const {
  return bond_rules;
}

std::vector<Signal> BondStrategy::proxy_signals(
    const IndicatorMap& indicators) const {
  auto out = yield_curve(indicators);
  for (auto& sig : credit_spread(indicators))
    out.push_back(std::move(sig));
  return out;
}
