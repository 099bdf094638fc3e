#pragma once

#include "core/analysis.h"
#include "core/data_source.h"
#include "mt/rate_limiter.h"
#include "util/asset_class.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

struct RankedSignal {
  AssetClass cls;
  Signal signal;
};

struct ClassBreakdown {
  AnalysisStatus status = AnalysisStatus::NotRun;
  size_t total = 0;
  size_t buy = 0;
  size_t sell = 0;
  size_t watch = 0;
  size_t forced = 0;
  size_t skipped = 0;
};

struct TradingSummary {
  size_t total = 0;
  size_t buy = 0;
  size_t sell = 0;
  size_t watch = 0;

  std::map<AssetClass, ClassBreakdown> breakdown;
  std::vector<RankedSignal> strongest;
};

struct ClassValidation {
  AssetClass cls;
  AnalysisStatus status = AnalysisStatus::NotRun;
  size_t n_signals = 0;
  std::vector<std::string> issues;

  bool ok() const { return issues.empty(); }
};

struct ValidationReport {
  std::vector<ClassValidation> classes;

  bool ok() const;
  size_t n_signals() const;
  size_t n_issues() const;
};

using Universes = std::map<AssetClass, std::vector<std::string>>;

// Runs every asset class analysis on a bounded pool and aggregates them.
// A failing class never takes the others down.
class TechnicalManager {
  std::unique_ptr<RateLimiter> limiter;
  std::map<AssetClass, AssetClassAnalysis> analyses;
  bool cancelled_ = false;
  SysTimePoint last_run_;

 public:
  TechnicalManager(DataSource& source,
                   std::unique_ptr<RateLimiter> limiter,
                   const Universes& universes) noexcept;

  // universes from the configured files, pacing from the data config
  explicit TechnicalManager(DataSource& source) noexcept;

  static Universes configured_universes();

  TechnicalManager(const TechnicalManager&) = delete;
  TechnicalManager& operator=(const TechnicalManager&) = delete;

  // true when every class finished without error and nothing was cancelled
  bool run();

  bool cancelled() const { return cancelled_; }
  SysTimePoint last_run() const { return last_run_; }

  const AssetClassAnalysis& analysis(AssetClass cls) const {
    return analyses.at(cls);
  }
  AnalysisStatus status(AssetClass cls) const { return analysis(cls).status(); }
  const std::vector<Signal>& signals(AssetClass cls) const {
    return analysis(cls).signals();
  }

  TradingSummary trading_summary(size_t n_strongest = 5) const;
  std::vector<RankedSignal> top_signals(size_t n) const;

  // signals at or above the confidence bar, classes without one left out
  std::map<AssetClass, std::vector<Signal>> filter_signals(
      double min_confidence) const;
  ValidationReport validate() const;

  // per class csv files plus the json report, returns the written paths
  std::vector<std::string> write_reports(const std::string& dir) const;
};
