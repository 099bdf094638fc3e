#pragma once

#include "strategy/strategy.h"
#include "util/asset_class.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct SelectionLimits {
  size_t min_positions = 0;
  size_t max_positions = 0;
  double forced_confidence_cap = 0.25;

  static SelectionLimits of(AssetClass cls);
};

struct SelectionResult {
  // ranked, at most one per instrument, forced entries last
  std::vector<Signal> signals;
  size_t n_forced = 0;

  auto size() const { return signals.size(); }
  bool empty() const { return signals.empty(); }

  auto begin() const { return signals.begin(); }
  auto end() const { return signals.end(); }

  const Signal* find(const std::string& symbol) const;
};

// Total order used inside fusion: confidence, then strategy rank, then
// direction.
bool fusion_before(const Signal& a, const Signal& b);

// Directional survivors: confidence descending, symbol ascending
bool ranks_before(const Signal& a, const Signal& b);

// One survivor out of an instrument's candidates, independent of their order.
// Throws std::invalid_argument on an empty set.
Signal fuse(std::vector<Signal> candidates);

std::map<std::string, Signal> fuse_all(const Candidates& candidates);

Signal forced_entry(const Signal& base,
                    const VoteTally& tally,
                    double confidence_cap,
                    std::optional<double> weakest_directional,
                    size_t min_positions);

SelectionResult select(const Candidates& candidates, SelectionLimits limits);
