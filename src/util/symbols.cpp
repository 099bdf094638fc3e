#include "util/symbols.h"
#include "util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

#include <spdlog/spdlog.h>

inline std::string trim(const std::string& str) {
  auto first = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return first < last ? std::string(first, last) : std::string{};
}

std::vector<std::string> Universe::parse(std::istream& in) {
  std::vector<std::string> out;
  std::set<std::string> seen;

  std::string line;
  while (std::getline(in, line)) {
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line.erase(hash);

    auto symbol = trim(line);
    if (symbol.empty() || !seen.insert(symbol).second)
      continue;

    out.push_back(std::move(symbol));
  }

  return out;
}

Universe Universe::load(AssetClass cls) noexcept {
  return load(cls, config.data_config.universe_path(cls));
}

Universe Universe::load(AssetClass cls, const std::string& path) noexcept {
  Universe u{cls};
  auto name = std::string{asset_class_name(cls)};

  std::ifstream file(path);
  if (file) {
    u.symbols = parse(file);
    u.from_file = true;
  }

  if (u.symbols.empty()) {
    auto& defaults = config.data_config.default_universe;
    auto it = defaults.find(name);
    if (it != defaults.end())
      u.symbols = it->second;
    u.from_file = false;
  }

  spdlog::info("[{}] {} symbols from {}", name, u.symbols.size(),
               u.from_file ? path : "defaults");
  return u;
}
