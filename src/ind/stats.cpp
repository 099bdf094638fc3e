#include "ind/indicators.h"

#include <cmath>
#include <numeric>

std::vector<double> sample_returns(const std::vector<double>& closes) {
  std::vector<double> out;
  if (closes.size() < 2)
    return out;

  out.reserve(closes.size() - 1);
  for (size_t i = 1; i < closes.size(); i++)
    if (closes[i - 1] != 0.0)
      out.push_back(closes[i] / closes[i - 1] - 1.0);
  return out;
}

std::optional<double> stddev(const std::vector<double>& xs) {
  if (xs.size() < 2)
    return std::nullopt;

  auto mean = std::accumulate(xs.begin(), xs.end(), 0.0) / xs.size();
  double sq = 0.0;
  for (auto x : xs)
    sq += (x - mean) * (x - mean);
  return std::sqrt(sq / (xs.size() - 1));
}

Volatility::Volatility(const std::vector<double>& closes, int window) noexcept
    : values(closes.size()) {
  if (window < 2)
    return;

  Series returns(closes.size());
  for (size_t i = 1; i < closes.size(); i++)
    if (closes[i - 1] != 0.0)
      returns[i] = closes[i] / closes[i - 1] - 1.0;

  auto w = static_cast<size_t>(window);
  std::vector<double> buf;
  for (size_t i = w; i < closes.size(); i++) {
    buf.clear();
    for (size_t j = i + 1 - w; j <= i; j++)
      if (returns[j])
        buf.push_back(*returns[j]);

    if (buf.size() != w)
      continue;

    auto sd = stddev(buf);
    if (sd)
      values[i] = *sd * std::sqrt(TRADING_DAYS);
  }
}

Momentum::Momentum(const std::vector<double>& closes, int period) noexcept
    : values(closes.size()) {
  if (period <= 0)
    return;

  for (size_t i = period; i < closes.size(); i++) {
    auto base = closes[i - period];
    if (base != 0.0)
      values[i] = closes[i] / base - 1.0;
  }
}
