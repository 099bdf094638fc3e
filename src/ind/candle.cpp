#include "ind/candle.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

bool Candle::valid() const {
  for (auto v : {open, high, low, close})
    if (!std::isfinite(v) || v <= 0.0)
      return false;
  return high >= low && volume >= 0 && datetime != LocalTimePoint{};
}

Bars clean_bars(Bars bars) {
  auto n = bars.size();

  std::erase_if(bars, [](const Candle& c) { return !c.valid(); });
  std::stable_sort(bars.begin(), bars.end(),
                   [](auto& a, auto& b) { return a.datetime < b.datetime; });

  // keep the last bar seen for each date
  Bars out;
  out.reserve(bars.size());
  for (auto& c : bars) {
    if (!out.empty() && out.back().datetime == c.datetime)
      out.back() = c;
    else
      out.push_back(c);
  }

  if (out.size() != n)
    spdlog::debug("[bars] dropped {} of {} bars", n - out.size(), n);

  return out;
}
