#pragma once

#include "candle.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

inline constexpr double TRADING_DAYS = 252.0;

// one slot per bar, empty while the window is still warming up
using Series = std::vector<std::optional<double>>;

struct SMA {
  Series values;

  SMA() noexcept = default;
  SMA(const std::vector<double>& xs, int period) noexcept;
};

struct EMA {
  Series values;

  EMA() noexcept = default;
  EMA(const std::vector<double>& xs, int period) noexcept;
  EMA(const Series& xs, int period) noexcept;
};

// Wilder smoothing. A flat window has no defined value; a window without
// losses reads 100.
struct RSI {
  Series values;

  RSI() noexcept = default;
  RSI(const std::vector<double>& closes, int period = 14) noexcept;
};

struct MACD {
  Series macd_line;
  EMA signal_ema;
  Series histogram;

  MACD() noexcept = default;
  MACD(const std::vector<double>& closes,
       int fast = 12,
       int slow = 26,
       int signal = 9) noexcept;
};

struct Bollinger {
  SMA middle;
  Series upper;
  Series lower;

  Bollinger() noexcept = default;
  Bollinger(const std::vector<double>& closes,
            int period = 20,
            double k = 2.0) noexcept;
};

double true_range(double prev_close, const Candle& c);

struct ATR {
  Series values;

  ATR() noexcept = default;
  ATR(const Bars& candles, int period = 14) noexcept;
};

// +DI/-DI are empty where the smoothed true range is zero, ADX where the DI
// sum is zero.
struct ADX {
  Series plus_di;
  Series minus_di;
  Series values;

  ADX() noexcept = default;
  ADX(const Bars& candles, int period = 14) noexcept;
};

// annualized sample stddev of simple returns
struct Volatility {
  Series values;

  Volatility() noexcept = default;
  Volatility(const std::vector<double>& closes, int window = 20) noexcept;
};

struct Momentum {
  Series values;

  Momentum() noexcept = default;
  Momentum(const std::vector<double>& closes, int period) noexcept;
};

struct RollingExtreme {
  Series highs;
  Series lows;

  RollingExtreme() noexcept = default;
  RollingExtreme(const Bars& candles, int window = 50) noexcept;
};

struct FibonacciLevels {
  static constexpr std::array<double, 7> ratios = {0.0,   0.236, 0.382, 0.5,
                                                   0.618, 0.786, 1.0};

  double high = 0.0;
  double low = 0.0;
  std::array<double, 7> levels = {};

  FibonacciLevels(double high, double low) noexcept;

  double level(double ratio) const { return low + ratio * (high - low); }
};

std::vector<double> sample_returns(const std::vector<double>& closes);
std::optional<double> stddev(const std::vector<double>& xs);

struct Indicators {
  std::string symbol;

 private:
  Bars candles;
  std::vector<double> closes;
  std::vector<double> volumes;

  SMA _sma_fast, _sma_slow, _sma_long;
  EMA _ema_fast, _ema_slow;
  RSI _rsi;
  MACD _macd;
  Bollinger _bb;
  ATR _atr;
  ADX _adx;
  Volatility _volatility;
  Momentum _mom_short, _mom_mid, _mom_long;
  SMA _volume_sma;
  RollingExtreme _extreme;

  size_t sanitize(int idx) const {
    return idx < 0 ? candles.size() + idx : idx;
  }

  std::optional<double> at(const Series& s, int idx) const {
    if (idx < 0 && static_cast<size_t>(-idx) > s.size())
      return std::nullopt;
    auto i = idx < 0 ? s.size() + idx : static_cast<size_t>(idx);
    return i < s.size() ? s[i] : std::nullopt;
  }

 public:
  Indicators(std::string symbol, Bars&& bars) noexcept;

  Indicators(const Indicators&) = delete;
  Indicators& operator=(const Indicators&) = delete;

  Indicators(Indicators&&) = default;
  Indicators& operator=(Indicators&&) = default;

  int index(int idx) const { return static_cast<int>(sanitize(idx)); }

  auto size() const { return candles.size(); }
  bool empty() const { return candles.empty(); }
  auto& close_series() const { return closes; }

  LocalTimePoint time(int idx) const { return candles[sanitize(idx)].time(); }

  double price(int idx) const { return candles[sanitize(idx)].price(); }
  double high(int idx) const { return candles[sanitize(idx)].high; }
  double low(int idx) const { return candles[sanitize(idx)].low; }
  double close(int idx) const { return candles[sanitize(idx)].close; }
  double volume(int idx) const { return volumes[sanitize(idx)]; }

  std::optional<double> sma20(int idx) const {
    return at(_sma_fast.values, idx);
  }
  std::optional<double> sma50(int idx) const {
    return at(_sma_slow.values, idx);
  }
  std::optional<double> sma200(int idx) const {
    return at(_sma_long.values, idx);
  }

  std::optional<double> ema12(int idx) const {
    return at(_ema_fast.values, idx);
  }
  std::optional<double> ema26(int idx) const {
    return at(_ema_slow.values, idx);
  }

  std::optional<double> rsi(int idx) const { return at(_rsi.values, idx); }

  std::optional<double> macd(int idx) const {
    return at(_macd.macd_line, idx);
  }
  std::optional<double> macd_signal(int idx) const {
    return at(_macd.signal_ema.values, idx);
  }

  std::optional<double> bb_upper(int idx) const { return at(_bb.upper, idx); }
  std::optional<double> bb_middle(int idx) const {
    return at(_bb.middle.values, idx);
  }
  std::optional<double> bb_lower(int idx) const { return at(_bb.lower, idx); }

  std::optional<double> atr(int idx) const { return at(_atr.values, idx); }
  std::optional<double> adx(int idx) const { return at(_adx.values, idx); }
  std::optional<double> plus_di(int idx) const {
    return at(_adx.plus_di, idx);
  }
  std::optional<double> minus_di(int idx) const {
    return at(_adx.minus_di, idx);
  }

  std::optional<double> volatility(int idx) const {
    return at(_volatility.values, idx);
  }

  std::optional<double> mom5(int idx) const {
    return at(_mom_short.values, idx);
  }
  std::optional<double> mom10(int idx) const {
    return at(_mom_mid.values, idx);
  }
  std::optional<double> mom20(int idx) const {
    return at(_mom_long.values, idx);
  }

  std::optional<double> volume_sma(int idx) const {
    return at(_volume_sma.values, idx);
  }

  std::optional<double> rolling_high(int idx) const {
    return at(_extreme.highs, idx);
  }
  std::optional<double> rolling_low(int idx) const {
    return at(_extreme.lows, idx);
  }

  std::optional<FibonacciLevels> fibonacci(int idx) const;
};
