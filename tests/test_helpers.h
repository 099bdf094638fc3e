#pragma once

#include "core/data_source.h"
#include "ind/candle.h"
#include "ind/indicators.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ─── Bar builders ────────────────────────────────────────────────────────────

inline LocalTimePoint test_day(size_t i) {
  return date_to_local("2024-01-01") + days(static_cast<int>(i));
}

/// Bars from a close path: open at the previous close, high/low `spread`
/// around the body.
inline Bars bars_from_closes(const std::vector<double>& closes,
                             double spread = 0.0,
                             std::int64_t volume = 1000) {
  Bars bars;
  bars.reserve(closes.size());
  for (size_t i = 0; i < closes.size(); i++) {
    double open = i == 0 ? closes[i] : closes[i - 1];
    double close = closes[i];
    bars.push_back({
        .datetime = test_day(i),
        .open = open,
        .high = std::max(open, close) + spread,
        .low = std::min(open, close) - spread,
        .close = close,
        .volume = volume,
    });
  }
  return bars;
}

inline Bars flat_bars(size_t n, double price = 100.0, double spread = 0.0) {
  return bars_from_closes(std::vector<double>(n, price), spread);
}

inline std::vector<double> linear_closes(size_t n, double start, double step) {
  std::vector<double> xs(n);
  for (size_t i = 0; i < n; i++)
    xs[i] = start + step * i;
  return xs;
}

/// Compounding path: start * (1 + rate)^i.
inline std::vector<double> geometric_closes(size_t n,
                                            double start,
                                            double rate) {
  std::vector<double> xs(n);
  double px = start;
  for (size_t i = 0; i < n; i++) {
    xs[i] = px;
    px *= 1.0 + rate;
  }
  return xs;
}

/// Odd steps gain `up`, even steps lose `down`, both as fractions.
inline std::vector<double> zigzag_closes(size_t n,
                                         double start,
                                         double up,
                                         double down) {
  std::vector<double> xs(n);
  if (n == 0)
    return xs;
  xs[0] = start;
  for (size_t i = 1; i < n; i++)
    xs[i] = xs[i - 1] * (i % 2 ? 1.0 + up : 1.0 - down);
  return xs;
}

/// Even bars at `low`, odd bars at `high`.
inline std::vector<double> alternating_closes(size_t n,
                                              double low,
                                              double high) {
  std::vector<double> xs(n);
  for (size_t i = 0; i < n; i++)
    xs[i] = i % 2 ? high : low;
  return xs;
}

/// Appends `n` evenly spaced closes from the last close to `target`.
inline void append_ramp(std::vector<double>& xs, double target, size_t n) {
  double from = xs.back();
  for (size_t k = 1; k <= n; k++)
    xs.push_back(from + (target - from) * static_cast<double>(k) / n);
}

inline Bars with_last_volume(Bars bars, std::int64_t volume) {
  if (!bars.empty())
    bars.back().volume = volume;
  return bars;
}

/// Deterministic random walk, never below 1.
inline std::vector<double> random_walk(size_t n,
                                       unsigned seed,
                                       double start = 100.0,
                                       double vol = 0.015) {
  std::mt19937 gen{seed};
  std::normal_distribution<double> dist{0.0, vol};

  std::vector<double> xs(n);
  double px = start;
  for (size_t i = 0; i < n; i++) {
    xs[i] = px;
    px = std::max(1.0, px * (1.0 + dist(gen)));
  }
  return xs;
}

inline Bars random_bars(size_t n, unsigned seed, double start = 100.0) {
  std::mt19937 gen{seed + 7};
  std::uniform_int_distribution<std::int64_t> vol{500, 2500};

  auto bars = bars_from_closes(random_walk(n, seed, start), 0.3);
  for (auto& b : bars)
    b.volume = vol(gen);
  return bars;
}

inline Indicators make_indicators(const std::string& symbol, Bars bars) {
  return Indicators{symbol, std::move(bars)};
}

// ─── Fake data source ────────────────────────────────────────────────────────

/// Serves canned bars; symbols in `failing` throw, unknown ones come back
/// empty.
class FakeSource final : public DataSource {
  std::map<std::string, Bars> series;
  std::set<std::string> failing;
  mutable std::mutex mtx;
  std::atomic<size_t> calls{0};

 public:
  FakeSource() = default;

  void add(const std::string& symbol, Bars bars) {
    std::lock_guard lk{mtx};
    series[symbol] = std::move(bars);
  }

  void fail(const std::string& symbol) {
    std::lock_guard lk{mtx};
    failing.insert(symbol);
  }

  size_t n_calls() const { return calls.load(); }

  Bars time_series(const std::string& symbol, size_t n_bars) override {
    calls++;
    std::lock_guard lk{mtx};
    if (failing.contains(symbol))
      throw DataSourceError("service unavailable");

    auto it = series.find(symbol);
    if (it == series.end())
      return {};

    auto& bars = it->second;
    auto n = std::min(n_bars, bars.size());
    return Bars(bars.end() - n, bars.end());
  }
};
