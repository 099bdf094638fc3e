#pragma once

#include "util/asset_class.h"

#include <istream>
#include <string>
#include <vector>

// Instruments screened for one asset class, in file order
struct Universe {
  AssetClass cls = AssetClass::Equities;
  std::vector<std::string> symbols;
  bool from_file = false;

  // Newline separated symbols. Blank lines and '#' comments are skipped,
  // repeats keep their first position.
  static std::vector<std::string> parse(std::istream& in);

  // the configured file for the class, else the configured default list
  static Universe load(AssetClass cls) noexcept;
  static Universe load(AssetClass cls, const std::string& path) noexcept;

  auto size() const { return symbols.size(); }
  bool empty() const { return symbols.empty(); }

  auto begin() const { return symbols.begin(); }
  auto end() const { return symbols.end(); }
};
