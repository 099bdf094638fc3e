#include "core/manager.h"
#include "core/report.h"
#include "mt/sleeper.h"
#include "mt/thread_pool.h"
#include "util/config.h"
#include "util/format.h"
#include "util/symbols.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <iterator>

Universes TechnicalManager::configured_universes() {
  Universes out;
  for (auto cls : asset_classes)
    out[cls] = Universe::load(cls).symbols;
  return out;
}

TechnicalManager::TechnicalManager(DataSource& source,
                                   std::unique_ptr<RateLimiter> limiter,
                                   const Universes& universes) noexcept
    : limiter{std::move(limiter)} {
  for (auto cls : asset_classes) {
    auto it = universes.find(cls);
    auto symbols = it == universes.end() ? std::vector<std::string>{}
                                         : it->second;
    analyses.try_emplace(cls, cls, std::move(symbols), source,
                         *this->limiter);
  }
}

TechnicalManager::TechnicalManager(DataSource& source) noexcept
    : TechnicalManager{source, make_rate_limiter(), configured_universes()} {}

bool TechnicalManager::run() {
  auto func = [this](AssetClass&& cls) {
    if (sleeper.should_shutdown())
      return false;
    analyses.at(cls).run();
    return true;
  };

  // the pool pops from the back
  std::vector<AssetClass> order(asset_classes.rbegin(), asset_classes.rend());

  Timer timer;
  {
    thread_pool<AssetClass> pool{config.n_concurrency, func, std::move(order)};
    pool.wait();
    cancelled_ = pool.cancelled();
  }
  cancelled_ = cancelled_ || sleeper.should_shutdown();
  last_run_ = std::chrono::floor<seconds>(SysClock::now());

  size_t n_errors = 0;
  for (auto& [cls, analysis] : analyses) {
    if (analysis.status() == AnalysisStatus::Error)
      n_errors++;
    if (analysis.status() == AnalysisStatus::NotRun)
      spdlog::warn("[manager] {} did not run", asset_class_name(cls));
  }

  spdlog::info("[manager] {} classes, {} errors{}, took {:.2f}ms",
               analyses.size(), n_errors, cancelled_ ? ", cancelled" : "",
               timer.diff_ms());

  return n_errors == 0 && !cancelled_;
}

std::vector<RankedSignal> TechnicalManager::top_signals(size_t n) const {
  std::vector<RankedSignal> all;
  for (auto& [cls, analysis] : analyses)
    for (auto& sig : analysis.signals())
      all.push_back({cls, sig});

  std::sort(all.begin(), all.end(), [](auto& a, auto& b) {
    if (a.signal.confidence != b.signal.confidence)
      return a.signal.confidence > b.signal.confidence;
    if (a.signal.symbol != b.signal.symbol)
      return a.signal.symbol < b.signal.symbol;
    return a.cls < b.cls;
  });

  if (all.size() > n)
    all.resize(n);
  return all;
}

std::map<AssetClass, std::vector<Signal>> TechnicalManager::filter_signals(
    double min_confidence) const {
  std::map<AssetClass, std::vector<Signal>> out;
  for (auto& [cls, analysis] : analyses) {
    std::vector<Signal> strong;
    std::copy_if(analysis.signals().begin(), analysis.signals().end(),
                 std::back_inserter(strong),
                 [&](auto& s) { return s.confidence >= min_confidence; });
    if (!strong.empty())
      out.emplace(cls, std::move(strong));
  }
  return out;
}

TradingSummary TechnicalManager::trading_summary(size_t n_strongest) const {
  TradingSummary summary;

  for (auto& [cls, analysis] : analyses) {
    auto& b = summary.breakdown[cls];
    b.status = analysis.status();
    b.skipped = analysis.skipped().size();

    for (auto& sig : analysis.signals()) {
      b.total++;
      if (sig.forced())
        b.forced++;

      switch (sig.direction) {
        case Direction::Buy:
          b.buy++;
          break;
        case Direction::Sell:
          b.sell++;
          break;
        case Direction::Watch:
          b.watch++;
          break;
      }
    }

    summary.total += b.total;
    summary.buy += b.buy;
    summary.sell += b.sell;
    summary.watch += b.watch;
  }

  summary.strongest = top_signals(n_strongest);
  return summary;
}

bool ValidationReport::ok() const {
  return std::all_of(classes.begin(), classes.end(),
                     [](auto& c) { return c.ok(); });
}

size_t ValidationReport::n_signals() const {
  size_t n = 0;
  for (auto& c : classes)
    n += c.n_signals;
  return n;
}

size_t ValidationReport::n_issues() const {
  size_t n = 0;
  for (auto& c : classes)
    n += c.issues.size();
  return n;
}

ValidationReport TechnicalManager::validate() const {
  ValidationReport report;

  for (auto& [cls, analysis] : analyses) {
    ClassValidation v{cls, analysis.status()};

    for (auto& sig : analysis.signals()) {
      v.n_signals++;
      if (!sig.valid())
        v.issues.push_back(std::format(
            "({}) {} {} confidence {:.3f} missing identity, range or exits",
            sig.symbol, sig.name(), to_str(sig.direction), sig.confidence));
    }

    if (!v.ok())
      spdlog::warn("[validate] {} {} issues", asset_class_name(cls),
                   v.issues.size());

    report.classes.push_back(std::move(v));
  }

  return report;
}

std::vector<std::string> TechnicalManager::write_reports(
    const std::string& dir) const {
  std::vector<std::string> paths;

  for (auto& [cls, analysis] : analyses) {
    if (analysis.signals().empty())
      continue;
    paths.push_back(
        write_signal_report(cls, analysis.result(), dir, last_run_));
  }

  paths.push_back(write_comprehensive_report(*this, dir, last_run_));

  for (auto& path : paths)
    spdlog::info("[report] {}", path);
  return paths;
}
