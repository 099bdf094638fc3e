#include "ind/indicators.h"

#include <algorithm>
#include <cmath>

double true_range(double prev_close, const Candle& c) {
  double high_low = c.high - c.low;
  double high_pc = std::abs(c.high - prev_close);
  double low_pc = std::abs(c.low - prev_close);
  return std::max({high_low, high_pc, low_pc});
}

// Wilder average over xs[1..]: plain mean of the first `period` values, then
// (prev * (period - 1) + x) / period.
Series wilder(const std::vector<double>& xs, int period) {
  Series out(xs.size());
  if (period <= 0 || xs.size() <= size_t(period))
    return out;

  double avg = 0.0;
  for (int i = 1; i <= period; i++)
    avg += xs[i];
  avg /= period;
  out[period] = avg;

  for (size_t i = period + 1; i < xs.size(); i++) {
    avg = (avg * (period - 1) + xs[i]) / period;
    out[i] = avg;
  }
  return out;
}

ATR::ATR(const Bars& candles, int period) noexcept {
  std::vector<double> tr(candles.size());
  for (size_t i = 1; i < candles.size(); i++)
    tr[i] = true_range(candles[i - 1].close, candles[i]);
  values = wilder(tr, period);
}

ADX::ADX(const Bars& candles, int period) noexcept
    : plus_di(candles.size()),
      minus_di(candles.size()),
      values(candles.size()) {
  auto n = candles.size();
  if (period <= 0 || n <= size_t(period))
    return;

  std::vector<double> tr(n), plus_dm(n), minus_dm(n);
  for (size_t i = 1; i < n; i++) {
    auto& prev = candles[i - 1];
    auto& c = candles[i];

    tr[i] = true_range(prev.close, c);

    double up = c.high - prev.high;
    double down = prev.low - c.low;
    plus_dm[i] = up > down && up > 0 ? up : 0.0;
    minus_dm[i] = down > up && down > 0 ? down : 0.0;
  }

  auto s_tr = wilder(tr, period);
  auto s_plus = wilder(plus_dm, period);
  auto s_minus = wilder(minus_dm, period);

  Series dx(n);
  for (size_t i = period; i < n; i++) {
    if (*s_tr[i] == 0.0)
      continue;

    auto pdi = 100.0 * *s_plus[i] / *s_tr[i];
    auto mdi = 100.0 * *s_minus[i] / *s_tr[i];
    plus_di[i] = pdi;
    minus_di[i] = mdi;

    if (pdi + mdi > 0.0)
      dx[i] = 100.0 * std::abs(pdi - mdi) / (pdi + mdi);
  }

  // smoothing state carries across bars without a defined DX
  std::optional<double> adx;
  double seed = 0.0;
  int n_seed = 0;
  for (size_t i = period; i < n; i++) {
    if (!dx[i])
      continue;

    if (!adx) {
      seed += *dx[i];
      if (++n_seed == period) {
        adx = seed / period;
        values[i] = adx;
      }
      continue;
    }

    adx = (*adx * (period - 1) + *dx[i]) / period;
    values[i] = adx;
  }
}

RollingExtreme::RollingExtreme(const Bars& candles, int window) noexcept
    : highs(candles.size()), lows(candles.size()) {
  if (window <= 0)
    return;

  auto w = static_cast<size_t>(window);
  for (size_t i = w - 1; i < candles.size(); i++) {
    double hi = candles[i].high, lo = candles[i].low;
    for (size_t j = i + 1 - w; j < i; j++) {
      hi = std::max(hi, candles[j].high);
      lo = std::min(lo, candles[j].low);
    }
    highs[i] = hi;
    lows[i] = lo;
  }
}

FibonacciLevels::FibonacciLevels(double high, double low) noexcept
    : high{high}, low{low} {
  for (size_t i = 0; i < ratios.size(); i++)
    levels[i] = level(ratios[i]);
}
