#include "ind/indicators.h"
#include "util/config.h"

#include <cmath>
#include <numeric>

inline auto& ind_config = config.ind_config;

SMA::SMA(const std::vector<double>& xs, int period) noexcept
    : values(xs.size()) {
  if (period <= 0)
    return;

  auto p = static_cast<size_t>(period);
  for (size_t i = p - 1; i < xs.size(); i++) {
    auto first = xs.begin() + (i + 1 - p);
    values[i] = std::accumulate(first, first + p, 0.0) / period;
  }
}

EMA::EMA(const std::vector<double>& xs, int period) noexcept
    : EMA{Series(xs.begin(), xs.end()), period} {}

EMA::EMA(const Series& xs, int period) noexcept : values(xs.size()) {
  if (period <= 0)
    return;

  auto alpha = 2.0 / (period + 1);

  std::optional<double> ema;
  double seed = 0.0;
  int n_seed = 0;

  for (size_t i = 0; i < xs.size(); i++) {
    if (!xs[i])
      continue;

    if (!ema) {
      seed += *xs[i];
      if (++n_seed == period) {
        ema = seed / period;
        values[i] = ema;
      }
      continue;
    }

    ema = *ema + alpha * (*xs[i] - *ema);
    values[i] = ema;
  }
}

inline std::optional<double> rsi_value(double avg_gain, double avg_loss) {
  if (avg_loss == 0.0) {
    if (avg_gain == 0.0)
      return std::nullopt;
    return 100.0;
  }
  return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
}

RSI::RSI(const std::vector<double>& closes, int period) noexcept
    : values(closes.size()) {
  if (period <= 0 || closes.size() < size_t(period + 1))
    return;

  double avg_gain = 0.0, avg_loss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = closes[i] - closes[i - 1];
    avg_gain += change > 0 ? change : 0.0;
    avg_loss += change < 0 ? -change : 0.0;
  }
  avg_gain /= period;
  avg_loss /= period;
  values[period] = rsi_value(avg_gain, avg_loss);

  for (size_t i = period + 1; i < closes.size(); i++) {
    double change = closes[i] - closes[i - 1];
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;

    avg_gain = (avg_gain * (period - 1) + gain) / period;
    avg_loss = (avg_loss * (period - 1) + loss) / period;

    values[i] = rsi_value(avg_gain, avg_loss);
  }
}

MACD::MACD(const std::vector<double>& closes,
           int fast,
           int slow,
           int signal) noexcept
    : macd_line(closes.size()), histogram(closes.size()) {
  EMA fast_ema{closes, fast};
  EMA slow_ema{closes, slow};

  for (size_t i = 0; i < closes.size(); i++)
    if (fast_ema.values[i] && slow_ema.values[i])
      macd_line[i] = *fast_ema.values[i] - *slow_ema.values[i];

  signal_ema = EMA{macd_line, signal};
  auto& signal_line = signal_ema.values;
  for (size_t i = 0; i < closes.size(); i++)
    if (macd_line[i] && signal_line[i])
      histogram[i] = *macd_line[i] - *signal_line[i];
}

Bollinger::Bollinger(const std::vector<double>& closes,
                     int period,
                     double k) noexcept
    : middle{closes, period}, upper(closes.size()), lower(closes.size()) {
  if (period <= 0)
    return;

  auto p = static_cast<size_t>(period);
  for (size_t i = p - 1; i < closes.size(); i++) {
    auto mean = *middle.values[i];

    double sq = 0.0;
    for (size_t j = i + 1 - p; j <= i; j++)
      sq += (closes[j] - mean) * (closes[j] - mean);
    auto sd = p > 1 ? std::sqrt(sq / (p - 1)) : 0.0;

    upper[i] = mean + k * sd;
    lower[i] = mean - k * sd;
  }
}

std::optional<FibonacciLevels> Indicators::fibonacci(int idx) const {
  auto hi = rolling_high(idx);
  auto lo = rolling_low(idx);
  if (!hi || !lo)
    return std::nullopt;
  return FibonacciLevels{*hi, *lo};
}

std::vector<double> field(const Bars& bars, double Candle::* member) {
  std::vector<double> xs;
  xs.reserve(bars.size());
  for (auto& c : bars)
    xs.push_back(c.*member);
  return xs;
}

std::vector<double> volume_field(const Bars& bars) {
  std::vector<double> xs;
  xs.reserve(bars.size());
  for (auto& c : bars)
    xs.push_back(static_cast<double>(c.volume));
  return xs;
}

Indicators::Indicators(std::string sym, Bars&& bars) noexcept
    : symbol{std::move(sym)},
      candles{std::move(bars)},
      closes{field(candles, &Candle::close)},
      volumes{volume_field(candles)},
      _sma_fast{closes, ind_config.sma_fast},
      _sma_slow{closes, ind_config.sma_slow},
      _sma_long{closes, ind_config.sma_long},
      _ema_fast{closes, ind_config.ema_fast},
      _ema_slow{closes, ind_config.ema_slow},
      _rsi{closes, ind_config.rsi_period},
      _macd{closes, ind_config.ema_fast, ind_config.ema_slow,
            ind_config.macd_signal},
      _bb{closes, ind_config.bb_period, ind_config.bb_k},
      _atr{candles, ind_config.atr_period},
      _adx{candles, ind_config.adx_period},
      _volatility{closes, ind_config.volatility_window},
      _mom_short{closes, ind_config.momentum_short},
      _mom_mid{closes, ind_config.momentum_mid},
      _mom_long{closes, ind_config.momentum_long},
      _volume_sma{volumes, ind_config.volume_window},
      _extreme{candles, ind_config.extreme_window}  //
{}
