#include "strategy/rules.h"
#include "util/config.h"

#include <spdlog/spdlog.h>

inline auto& st_config = config.strategy_config;

inline const Indicators* find_proxy(const IndicatorMap& indicators,
                                    const std::string& symbol) {
  auto it = indicators.find(symbol);
  return it == indicators.end() || it->second.empty() ? nullptr : &it->second;
}

// Momentum of the long end against the short end of the curve
std::vector<Signal> yield_curve(const IndicatorMap& indicators) {
  auto* lng = find_proxy(indicators, st_config.curve_long);
  auto* shrt = find_proxy(indicators, st_config.curve_short);
  if (!lng || !shrt) {
    spdlog::debug("[bonds] yield curve proxies {}/{} unavailable",
                  st_config.curve_long, st_config.curve_short);
    return {};
  }

  auto lm = lng->mom5(-1), sm = shrt->mom5(-1);
  if (!lm || !sm)
    return {};

  double diff = *lm - *sm;

  std::string mid_desc;
  if (auto* mid = find_proxy(indicators, st_config.curve_mid))
    if (auto mm = mid->mom5(-1))
      mid_desc = std::format(", {} {:+.2f}%", st_config.curve_mid, *mm * 100);

  auto desc = std::format("5d {} {:+.2f}% vs {} {:+.2f}%{}",
                          st_config.curve_long, *lm * 100,
                          st_config.curve_short, *sm * 100, mid_desc);

  auto thr = st_config.curve_threshold;
  auto conf = st_config.curve_confidence;

  if (diff > thr && lng->atr(-1))
    return {atr_entry(*lng, -1, StrategyType::YieldCurve, Direction::Buy, 3,
                      conf, st_config.stop_atr, st_config.target_atr,
                      "long end leading, " + desc)};

  if (diff < -thr && shrt->atr(-1))
    return {atr_entry(*shrt, -1, StrategyType::YieldCurve, Direction::Buy, 3,
                      conf, st_config.tight_stop_atr,
                      st_config.tight_target_atr,
                      "short end leading, " + desc)};

  return {};
}

// Momentum of high yield against investment grade credit
std::vector<Signal> credit_spread(const IndicatorMap& indicators) {
  auto* ig = find_proxy(indicators, st_config.credit_ig);
  auto* hy = find_proxy(indicators, st_config.credit_hy);
  if (!ig || !hy) {
    spdlog::debug("[bonds] credit proxies {}/{} unavailable",
                  st_config.credit_hy, st_config.credit_ig);
    return {};
  }

  auto hm = hy->mom10(-1), im = ig->mom10(-1);
  if (!hm || !im)
    return {};

  double diff = *hm - *im;
  auto desc = std::format("10d {} {:+.2f}% vs {} {:+.2f}%", st_config.credit_hy,
                          *hm * 100, st_config.credit_ig, *im * 100);

  auto thr = st_config.spread_threshold;
  auto conf = st_config.spread_confidence;

  if (diff > thr && hy->atr(-1))
    return {atr_entry(*hy, -1, StrategyType::CreditSpread, Direction::Buy, 3,
                      conf, st_config.stop_atr, st_config.target_atr,
                      "spreads narrowing, " + desc)};

  if (diff < -thr && ig->atr(-1))
    return {atr_entry(*ig, -1, StrategyType::CreditSpread, Direction::Buy, 3,
                      conf, st_config.tight_stop_atr,
                      st_config.tight_target_atr, "spreads widening, " + desc)};

  return {};
}
