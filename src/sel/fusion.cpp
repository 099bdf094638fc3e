#include "sel/selection.h"
#include "util/format.h"

#include <algorithm>
#include <stdexcept>

bool fusion_before(const Signal& a, const Signal& b) {
  if (a.confidence != b.confidence)
    return a.confidence > b.confidence;
  if (a.rank() != b.rank())
    return a.rank() < b.rank();
  if (a.direction != b.direction)
    return a.direction < b.direction;
  if (a.strength != b.strength)
    return a.strength > b.strength;
  if (a.strategy != b.strategy)
    return a.strategy < b.strategy;
  return a.rationale < b.rationale;
}

bool ranks_before(const Signal& a, const Signal& b) {
  if (a.confidence != b.confidence)
    return a.confidence > b.confidence;
  return a.symbol < b.symbol;
}

// Priority:
//   directional vote  -> an agreeing specialized signal, else the vote
//   no vote direction -> specialized, then generic directional
//   nothing directional -> the vote's watch, else the best watch
Signal fuse(std::vector<Signal> candidates) {
  if (candidates.empty())
    throw std::invalid_argument("fuse needs at least one candidate");

  std::sort(candidates.begin(), candidates.end(), fusion_before);

  auto first = [&candidates](auto pred) -> const Signal* {
    for (auto& s : candidates)
      if (pred(s))
        return &s;
    return nullptr;
  };

  auto directional_of = [](StrategyFamily family) {
    return [family](const Signal& s) {
      return s.family() == family && s.directional();
    };
  };

  const Signal* pick = nullptr;
  if (auto* vote = first(directional_of(StrategyFamily::Voting))) {
    pick = first([vote](const Signal& s) {
      return s.family() == StrategyFamily::Specialized &&
             s.direction == vote->direction;
    });
    if (!pick)
      pick = vote;
  } else {
    pick = first(directional_of(StrategyFamily::Specialized));
    if (!pick)
      pick = first(directional_of(StrategyFamily::Generic));
    if (!pick)
      pick = first([](const Signal& s) {
        return s.family() == StrategyFamily::Voting;
      });
    if (!pick)
      pick = &candidates.front();
  }

  Signal out = *pick;
  if (candidates.size() > 1) {
    std::vector<std::string> others;
    for (auto& s : candidates)
      if (&s != pick)
        others.push_back(s.name());
    out.rationale += std::format("; fused over {}",
                                 join(others.begin(), others.end()));
  }
  return out;
}

std::map<std::string, Signal> fuse_all(const Candidates& candidates) {
  std::map<std::string, Signal> out;
  for (auto& [symbol, sigs] : candidates)
    if (!sigs.empty())
      out.emplace(symbol, fuse(sigs));
  return out;
}
