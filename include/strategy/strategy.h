#pragma once

#include "ind/indicators.h"
#include "sig/signal.h"
#include "util/asset_class.h"

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using IndicatorMap = std::map<std::string, Indicators>;

// every candidate each rule produced, keyed by instrument
using Candidates = std::map<std::string, std::vector<Signal>>;

using Rule = std::optional<Signal> (*)(const Indicators&, int);

class Strategy {
 public:
  virtual ~Strategy() = default;

  virtual AssetClass asset_class() const = 0;
  virtual std::string_view description() const = 0;

  // The multi indicator vote runs for every instrument, followed by the
  // class rules. Nothing is filtered here.
  Candidates generate(const IndicatorMap& indicators) const;

 protected:
  virtual std::span<const Rule> rules() const = 0;

  // signals that need more than one instrument
  virtual std::vector<Signal> proxy_signals(const IndicatorMap&) const {
    return {};
  }
};

class EquityStrategy final : public Strategy {
 public:
  AssetClass asset_class() const override { return AssetClass::Equities; }
  std::string_view description() const override;

 protected:
  std::span<const Rule> rules() const override;
};

class BondStrategy final : public Strategy {
 public:
  AssetClass asset_class() const override { return AssetClass::Bonds; }
  std::string_view description() const override;

 protected:
  std::span<const Rule> rules() const override;
  std::vector<Signal> proxy_signals(const IndicatorMap&) const override;
};

class CommodityStrategy final : public Strategy {
 public:
  AssetClass asset_class() const override { return AssetClass::Commodities; }
  std::string_view description() const override;

 protected:
  std::span<const Rule> rules() const override;
};

class GoldStrategy final : public Strategy {
 public:
  AssetClass asset_class() const override { return AssetClass::Golds; }
  std::string_view description() const override;

 protected:
  std::span<const Rule> rules() const override;
};

std::unique_ptr<Strategy> make_strategy(AssetClass cls);
