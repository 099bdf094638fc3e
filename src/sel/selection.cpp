#include "sel/selection.h"
#include "strategy/rules.h"
#include "util/config.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

inline auto& sel_config = config.sel_config;
inline auto& st_config = config.strategy_config;

SelectionLimits SelectionLimits::of(AssetClass cls) {
  auto [min, max] = sel_config.positions(cls);
  return {min, max, sel_config.forced_confidence_cap};
}

const Signal* SelectionResult::find(const std::string& symbol) const {
  auto it = std::find_if(signals.begin(), signals.end(),
                         [&](auto& s) { return s.symbol == symbol; });
  return it == signals.end() ? nullptr : &*it;
}

Signal forced_entry(const Signal& base,
                    const VoteTally& tally,
                    double confidence_cap,
                    std::optional<double> weakest_directional,
                    size_t min_positions) {
  auto conf = std::clamp(confidence_cap, 0.0, 1.0) * tally.lean() / N_VOTES;
  if (weakest_directional)
    conf = std::min(conf, *weakest_directional * 0.5);

  auto desc = std::format(
      "forced entry: fallback to reach {} positions, not a validated "
      "opportunity; votes {}",
      min_positions, tally.str());

  auto dir = tally.leaning();
  if (is_directional(dir) && base.atr) {
    auto sign = dir == Direction::Buy ? 1.0 : -1.0;
    auto atr = *base.atr;
    auto s = Signal::entry(base.symbol, StrategyType::ForcedEntry, dir,
                           tally.lean(), conf, base.price,
                           base.price - sign * st_config.tight_stop_atr * atr,
                           base.price + sign * st_config.tight_target_atr * atr,
                           desc);
    s.atr = base.atr;
    s.tally = tally;
    return s;
  }

  auto s = Signal::watch(base.symbol, StrategyType::ForcedEntry, tally.lean(),
                         conf, base.price, desc);
  s.atr = base.atr;
  s.tally = tally;
  return s;
}

struct ForcedCandidate {
  const Signal* base;
  VoteTally tally;
};

inline bool forced_before(const ForcedCandidate& a, const ForcedCandidate& b) {
  if (a.tally.lean() != b.tally.lean())
    return a.tally.lean() > b.tally.lean();
  auto a_votes = a.tally.buy + a.tally.sell;
  auto b_votes = b.tally.buy + b.tally.sell;
  if (a_votes != b_votes)
    return a_votes > b_votes;
  return a.base->symbol < b.base->symbol;
}

SelectionResult select(const Candidates& candidates, SelectionLimits limits) {
  auto max = limits.max_positions;
  auto min = std::min(limits.min_positions, max);

  auto fused = fuse_all(candidates);

  SelectionResult res;
  for (auto& [_, sig] : fused)
    if (sig.directional())
      res.signals.push_back(sig);

  std::sort(res.signals.begin(), res.signals.end(), ranks_before);
  if (res.signals.size() > max)
    res.signals.resize(max);

  if (res.signals.size() >= min)
    return res;

  std::optional<double> weakest;
  std::set<std::string> taken;
  for (auto& s : res.signals) {
    taken.insert(s.symbol);
    weakest = weakest ? std::min(*weakest, s.confidence) : s.confidence;
  }

  std::vector<ForcedCandidate> pending;
  for (auto& [symbol, sigs] : candidates) {
    if (sigs.empty() || taken.contains(symbol))
      continue;

    auto vote = std::find_if(sigs.begin(), sigs.end(), [](auto& s) {
      return s.strategy == StrategyType::Voting && s.tally;
    });
    if (vote != sigs.end())
      pending.push_back({&*vote, *vote->tally});
    else
      pending.push_back({&fused.at(symbol), VoteTally{}});
  }

  std::sort(pending.begin(), pending.end(), forced_before);

  for (auto& p : pending) {
    if (res.signals.size() >= min)
      break;
    res.signals.push_back(forced_entry(*p.base, p.tally,
                                       limits.forced_confidence_cap, weakest,
                                       min));
    res.n_forced++;
    spdlog::info("[select] ({}) forced entry, votes {}", p.base->symbol,
                 p.tally.str());
  }

  return res;
}
