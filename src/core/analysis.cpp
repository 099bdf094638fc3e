#include "core/analysis.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>

inline auto& data_config = config.data_config;

AssetClassAnalysis::AssetClassAnalysis(AssetClass cls,
                                       std::vector<std::string> universe,
                                       DataSource& source,
                                       RateLimiter& limiter) noexcept
    : cls{cls},
      universe{std::move(universe)},
      source{source},
      limiter{limiter},
      strategy{make_strategy(cls)},
      limits{SelectionLimits::of(cls)}  //
{}

std::map<std::string, Bars> AssetClassAnalysis::load() {
  auto name = asset_class_name(cls);
  auto n_bars = data_config.lookback(cls);

  std::map<std::string, Bars> out;
  size_t n_failed = 0;
  std::string last_error;

  for (size_t i = 0; i < universe.size(); i++) {
    auto& symbol = universe[i];

    if (!limiter.acquire()) {
      spdlog::warn("[{}] cancelled, {} symbols not loaded", name,
                   universe.size() - i);
      for (size_t j = i; j < universe.size(); j++)
        skipped_.push_back({universe[j], "cancelled"});
      break;
    }

    Bars bars;
    try {
      bars = source.time_series(symbol, n_bars);
    } catch (const std::exception& e) {
      n_failed++;
      last_error = e.what();
      spdlog::error("[{}] ({}) {}", name, symbol, e.what());
      skipped_.push_back({symbol, e.what()});
      continue;
    }

    if (bars.empty()) {
      spdlog::warn("[{}] ({}) no data", name, symbol);
      skipped_.push_back({symbol, "no data"});
      continue;
    }

    out.emplace(symbol, std::move(bars));
  }

  if (!universe.empty() && n_failed == universe.size())
    throw DataSourceError(
        std::format("every fetch failed, last error: {}", last_error));

  return out;
}

IndicatorMap AssetClassAnalysis::compute(std::map<std::string, Bars>&& bars) {
  auto name = asset_class_name(cls);
  auto min_bars = data_config.min_bars(cls);

  IndicatorMap out;
  for (auto& [symbol, raw] : bars) {
    auto cleaned = clean_bars(std::move(raw));
    if (cleaned.size() < min_bars) {
      spdlog::warn("[{}] ({}) {} bars, {} needed", name, symbol,
                   cleaned.size(), min_bars);
      skipped_.push_back(
          {symbol, std::format("insufficient history: {} bars", cleaned.size())});
      continue;
    }

    out.emplace(symbol, Indicators{symbol, std::move(cleaned)});
  }
  return out;
}

AnalysisStatus AssetClassAnalysis::run() noexcept {
  auto name = asset_class_name(cls);

  Timer timer;
  stage_ = Stage::NotRun;
  status_ = AnalysisStatus::NotRun;
  error_.clear();
  skipped_.clear();
  result_ = {};

  try {
    auto bars = load();
    stage_ = Stage::DataLoaded;

    auto indicators = compute(std::move(bars));
    stage_ = Stage::IndicatorsComputed;

    auto candidates = strategy->generate(indicators);
    stage_ = Stage::SignalsGenerated;

    result_ = select(candidates, limits);
    stage_ = Stage::Selected;

    status_ = result_.empty() ? AnalysisStatus::NoSignals
                              : AnalysisStatus::Success;
  } catch (const std::exception& e) {
    status_ = AnalysisStatus::Error;
    error_ = e.what();
    spdlog::error("[{}] failed after stage {}: {}", name, to_str(stage_),
                  error_);
  }

  elapsed_ms_ = timer.diff_ms();
  spdlog::info("[{}] {}: {} signals ({} forced), {} skipped, took {:.2f}ms",
               name, to_str(status_), result_.size(), result_.n_forced,
               skipped_.size(), elapsed_ms_);

  return status_;
}
