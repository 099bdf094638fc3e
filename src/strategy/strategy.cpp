#include "strategy/strategy.h"
#include "strategy/rules.h"

#include <spdlog/spdlog.h>

Candidates Strategy::generate(const IndicatorMap& indicators) const {
  Candidates out;
  auto cls = asset_class_name(asset_class());

  for (auto& [symbol, ind] : indicators) {
    if (ind.empty())
      continue;

    auto& sigs = out[symbol];
    sigs.push_back(indicator_vote(ind, -1));

    for (auto rule : rules())
      if (auto sig = rule(ind, -1))
        sigs.push_back(std::move(*sig));

    spdlog::debug("[{}] ({}) {} candidates", cls, symbol, sigs.size());
  }

  for (auto& sig : proxy_signals(indicators)) {
    spdlog::debug("[{}] ({}) proxy {} {}", cls, sig.symbol, sig.name(),
                  sig.rationale);
    out[sig.symbol].push_back(std::move(sig));
  }

  return out;
}

std::unique_ptr<Strategy> make_strategy(AssetClass cls) {
  switch (cls) {
    case AssetClass::Equities:
      return std::make_unique<EquityStrategy>();
    case AssetClass::Bonds:
      return std::make_unique<BondStrategy>();
    case AssetClass::Commodities:
      return std::make_unique<CommodityStrategy>();
    case AssetClass::Golds:
      return std::make_unique<GoldStrategy>();
  }
  return nullptr;
}
