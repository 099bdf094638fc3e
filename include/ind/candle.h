#pragma once

#include "util/times.h"

#include <cstdint>
#include <format>
#include <string>
#include <vector>

struct Candle {
  LocalTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  std::int64_t volume = 0;

  std::string day() const { return std::format("{:%F}", time()); }
  double price() const { return close; }
  LocalTimePoint time() const { return datetime; }

  bool valid() const;
};

using Bars = std::vector<Candle>;

// chronological order, one bar per date, junk bars dropped
Bars clean_bars(Bars bars);
