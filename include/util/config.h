#pragma once

#include "util/asset_class.h"
#include "util/times.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

struct APIConfig {
  static constexpr const char* name = "api_config";
  static constexpr bool debug = false;

  std::vector<std::string> td_api_keys = {};
  std::string td_url = "https://api.twelvedata.com/time_series";
};

struct DataConfig {
  static constexpr const char* name = "data_config";
  static constexpr bool debug = true;

  // bars requested per instrument
  size_t lookback_equities = 120;
  size_t lookback_bonds = 120;
  size_t lookback_commodities = 120;
  size_t lookback_golds = 300;

  // below this an instrument is excluded from the pass
  size_t min_bars_equities = 60;
  size_t min_bars_bonds = 60;
  size_t min_bars_commodities = 60;
  size_t min_bars_golds = 210;

  std::string universe_dir = "tickers";

  std::map<std::string, std::vector<std::string>> default_universe = {
      {"equities",
       {"AAPL", "MSFT", "GOOGL", "AMZN", "NVDA", "META", "JPM", "JNJ", "V",
        "PG", "XOM", "UNH"}},
      {"bonds", {"TLT", "IEF", "SHY", "LQD", "HYG", "TIP", "BND", "AGG"}},
      {"commodities",
       {"USO", "UNG", "GLD", "SLV", "DBC", "GSG", "COMT", "PDBC"}},
      {"golds", {"GLD", "IAU", "SGOL", "GLDM", "BAR", "OUNZ", "UGL", "DGL"}},
  };

  // pacing of outgoing requests
  double request_delay_s = 0.5;
  size_t batch_size = 20;
  double batch_pause_s = 2.0;

  std::string cache_path = "data/bars.bin";

  size_t lookback(AssetClass cls) const {
    switch (cls) {
      case AssetClass::Equities:
        return lookback_equities;
      case AssetClass::Bonds:
        return lookback_bonds;
      case AssetClass::Commodities:
        return lookback_commodities;
      case AssetClass::Golds:
        return lookback_golds;
    }
    return lookback_equities;
  }

  size_t min_bars(AssetClass cls) const {
    switch (cls) {
      case AssetClass::Equities:
        return min_bars_equities;
      case AssetClass::Bonds:
        return min_bars_bonds;
      case AssetClass::Commodities:
        return min_bars_commodities;
      case AssetClass::Golds:
        return min_bars_golds;
    }
    return min_bars_equities;
  }

  std::string universe_path(AssetClass cls) const {
    return universe_dir + "/" + std::string{asset_class_name(cls)} +
           "_list.txt";
  }
};

struct IndicatorsConfig {
  static constexpr const char* name = "ind_config";
  static constexpr bool debug = true;

  int sma_fast = 20;
  int sma_slow = 50;
  int sma_long = 200;

  int ema_fast = 12;
  int ema_slow = 26;
  int macd_signal = 9;

  int rsi_period = 14;

  int bb_period = 20;
  double bb_k = 2.0;

  int atr_period = 14;
  int adx_period = 14;

  // realized volatility, also the gold safe haven window
  int volatility_window = 90;
  int volume_window = 20;
  int extreme_window = 50;

  int momentum_short = 5;
  int momentum_mid = 10;
  int momentum_long = 20;
};

struct StrategyConfig {
  static constexpr const char* name = "strategy_config";
  static constexpr bool debug = true;

  // multi indicator vote
  int vote_majority = 3;
  double vote_rsi_oversold = 30.0;
  double vote_rsi_overbought = 70.0;
  double vote_atr_move = 1.5;
  double vote_volume_spike = 1.5;
  double watch_confidence = 0.3;

  // exits, in multiples of atr
  double stop_atr = 2.0;
  double target_atr = 3.0;
  double tight_stop_atr = 1.5;
  double tight_target_atr = 2.0;

  // mean reversion
  double mr_rsi_oversold = 30.0;
  double mr_rsi_overbought = 70.0;
  double mr_confidence = 0.6;

  // band breakout
  double breakout_volume_ratio = 1.5;
  double breakout_rsi_cap = 80.0;
  double breakout_target_atr = 2.5;
  double breakout_confidence = 0.7;

  // equity momentum breakout
  double momentum_volume_ratio = 1.2;
  int momentum_min_strength = 3;

  // moving average breakout
  double ma_breakout_confidence = 0.6;

  // trend following
  int trend_min_strength = 3;
  double trend_adx_threshold = 25.0;
  double trend_adx_bonus = 0.05;

  // gold trend breakout
  double trend_breakout_volume_ratio = 1.2;
  double trend_breakout_confidence = 0.8;

  // gold momentum
  double momentum_mid_threshold = 0.03;
  double momentum_long_threshold = 0.05;
  double momentum_confidence = 0.7;

  // fibonacci retracement
  double fib_proximity = 0.02;
  double fib_rsi_support = 40.0;
  double fib_rsi_resistance = 60.0;
  double fib_confidence = 0.6;

  // yield curve
  std::string curve_long = "TLT";
  std::string curve_mid = "IEF";
  std::string curve_short = "SHY";
  double curve_threshold = 0.01;
  double curve_confidence = 0.8;

  // credit spread
  std::string credit_ig = "LQD";
  std::string credit_hy = "HYG";
  double spread_threshold = 0.02;
  double spread_confidence = 0.7;

  // gold safe haven / inflation hedge factors
  size_t hedge_window = 252;
  size_t hedge_min_window = 120;
  double safe_haven_weight = 0.5;
  double gold_factor_buy = 0.6;
  double gold_factor_sell = 0.3;
};

struct SelectionConfig {
  static constexpr const char* name = "sel_config";
  static constexpr bool debug = true;

  size_t min_equities = 5;
  size_t max_equities = 8;
  size_t min_bonds = 2;
  size_t max_bonds = 3;
  size_t min_commodities = 2;
  size_t max_commodities = 3;
  size_t min_golds = 1;
  size_t max_golds = 2;

  double forced_confidence_cap = 0.25;

  std::pair<size_t, size_t> positions(AssetClass cls) const {
    switch (cls) {
      case AssetClass::Equities:
        return {min_equities, max_equities};
      case AssetClass::Bonds:
        return {min_bonds, max_bonds};
      case AssetClass::Commodities:
        return {min_commodities, max_commodities};
      case AssetClass::Golds:
        return {min_golds, max_golds};
    }
    return {0, 0};
  }
};

struct ReportConfig {
  static constexpr const char* name = "report_config";
  static constexpr bool debug = false;

  std::string dir = "reports";
  size_t n_top = 10;
  size_t n_strongest = 5;
  double min_confidence = 0.7;
};

struct Config {
  bool debug_en = false;

  bool replay_en = false;
  bool record_en = false;
  bool report_en = true;

  size_t n_concurrency = 4;

  std::string config_dir = "private";

  APIConfig api_config;
  DataConfig data_config;
  IndicatorsConfig ind_config;
  StrategyConfig strategy_config;
  SelectionConfig sel_config;
  ReportConfig report_config;

  Config();
  void read_args(int argc, char* argv[]);
  void update();
};

inline Config config;
