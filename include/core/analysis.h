#pragma once

#include "core/data_source.h"
#include "mt/rate_limiter.h"
#include "sel/selection.h"
#include "strategy/strategy.h"
#include "util/asset_class.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

enum class Stage {
  NotRun,
  DataLoaded,
  IndicatorsComputed,
  SignalsGenerated,
  Selected,
};

enum class AnalysisStatus {
  NotRun,
  Success,
  NoSignals,
  Error,
};

struct SkippedSymbol {
  std::string symbol;
  std::string reason;
};

// One pass for one asset class:
//   universe -> bars -> indicators -> candidates -> selection
class AssetClassAnalysis {
  const AssetClass cls;
  const std::vector<std::string> universe;

  DataSource& source;
  RateLimiter& limiter;
  std::unique_ptr<Strategy> strategy;
  SelectionLimits limits;

  Stage stage_ = Stage::NotRun;
  AnalysisStatus status_ = AnalysisStatus::NotRun;
  std::string error_;
  std::vector<SkippedSymbol> skipped_;
  SelectionResult result_;
  double elapsed_ms_ = 0.0;

  std::map<std::string, Bars> load();
  IndicatorMap compute(std::map<std::string, Bars>&& bars);

 public:
  AssetClassAnalysis(AssetClass cls,
                     std::vector<std::string> universe,
                     DataSource& source,
                     RateLimiter& limiter) noexcept;

  // Never throws: failures end in AnalysisStatus::Error with the message
  // kept in error().
  AnalysisStatus run() noexcept;

  AssetClass asset_class() const { return cls; }
  auto& symbols() const { return universe; }

  Stage stage() const { return stage_; }
  AnalysisStatus status() const { return status_; }
  auto& error() const { return error_; }
  auto& skipped() const { return skipped_; }
  auto& result() const { return result_; }
  auto& signals() const { return result_.signals; }
  double elapsed_ms() const { return elapsed_ms_; }
};
