#include "core/report.h"
#include "core/manager.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <glaze/glaze.hpp>
#include <stdexcept>

namespace fs = std::filesystem;

inline auto& report_config = config.report_config;

struct ReportSignal {
  std::string symbol;
  std::string asset_class;
  std::string strategy;
  std::string direction;
  int strength;
  double confidence;
  double price;
  std::optional<double> stop_loss;
  std::optional<double> target;
  std::optional<std::string> votes;
  bool forced;
  std::string rationale;
};

struct ReportSkipped {
  std::string symbol;
  std::string reason;
};

struct ReportClass {
  std::string status;
  std::string stage;
  std::string error;
  size_t n_symbols;
  size_t n_signals;
  size_t n_forced;
  double elapsed_ms;
  std::vector<ReportSkipped> skipped;
  std::vector<ReportSignal> signals;
};

struct ReportSummary {
  size_t total;
  size_t buy;
  size_t sell;
  size_t watch;
  std::vector<ReportSignal> strongest;
};

struct ReportValidation {
  bool ok;
  size_t n_signals;
  size_t n_issues;
  std::vector<std::string> issues;
};

struct ComprehensiveReport {
  std::string generated_at;
  std::map<std::string, ReportClass> classes;
  ReportSummary summary;
  ReportValidation validation;
};

inline ReportSignal report_signal(AssetClass cls, const Signal& sig) {
  return {
      .symbol = sig.symbol,
      .asset_class = to_str(cls),
      .strategy = sig.name(),
      .direction = to_str(sig.direction),
      .strength = sig.strength,
      .confidence = sig.confidence,
      .price = sig.price,
      .stop_loss = sig.stop_loss,
      .target = sig.target,
      .votes = sig.tally ? std::optional{sig.tally->str()} : std::nullopt,
      .forced = sig.forced(),
      .rationale = sig.rationale,
  };
}

inline void ensure_report_dir(const std::string& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw std::runtime_error(
        std::format("cannot create report directory {}: {}", dir,
                    ec.message()));
}

std::string signal_report_path(const std::string& dir,
                               AssetClass cls,
                               SysTimePoint ts) {
  return std::format("{}/{}_technical_signals_{}.csv", dir,
                     asset_class_name(cls), timestamp_str(ts));
}

std::string comprehensive_report_path(const std::string& dir,
                                      SysTimePoint ts) {
  return std::format("{}/technical_report_{}.json", dir, timestamp_str(ts));
}

std::string write_signal_report(AssetClass cls,
                                const SelectionResult& result,
                                const std::string& dir,
                                SysTimePoint ts) {
  ensure_report_dir(dir);
  auto path = signal_report_path(dir, cls, ts);

  std::ofstream f{path};
  if (!f)
    throw std::runtime_error(std::format("cannot open {}", path));

  f << "instrument,strategy,direction,confidence,price,stop_loss,target,"
       "rationale\n";
  for (auto& sig : result)
    f << to_str<FormatTarget::Csv>(sig) << '\n';

  if (!f)
    throw std::runtime_error(std::format("error writing {}", path));
  return path;
}

std::string write_comprehensive_report(const TechnicalManager& manager,
                                       const std::string& dir,
                                       SysTimePoint ts) {
  ensure_report_dir(dir);
  auto path = comprehensive_report_path(dir, ts);

  ComprehensiveReport report;
  report.generated_at = std::format("{:%F %T}", ts);

  for (auto cls : asset_classes) {
    auto& analysis = manager.analysis(cls);

    ReportClass rc{
        .status = to_str(analysis.status()),
        .stage = to_str(analysis.stage()),
        .error = analysis.error(),
        .n_symbols = analysis.symbols().size(),
        .n_signals = analysis.result().size(),
        .n_forced = analysis.result().n_forced,
        .elapsed_ms = analysis.elapsed_ms(),
        .skipped = {},
        .signals = {},
    };
    for (auto& [symbol, reason] : analysis.skipped())
      rc.skipped.push_back({symbol, reason});
    for (auto& sig : analysis.signals())
      rc.signals.push_back(report_signal(cls, sig));

    report.classes.emplace(asset_class_name(cls), std::move(rc));
  }

  auto summary = manager.trading_summary(report_config.n_strongest);
  report.summary = {summary.total, summary.buy, summary.sell, summary.watch, {}};
  for (auto& [cls, sig] : summary.strongest)
    report.summary.strongest.push_back(report_signal(cls, sig));

  auto validation = manager.validate();
  report.validation = {validation.ok(), validation.n_signals(),
                       validation.n_issues(), {}};
  for (auto& cv : validation.classes)
    for (auto& issue : cv.issues)
      report.validation.issues.push_back(
          std::format("{}: {}", asset_class_name(cv.cls), issue));

  constexpr auto opts = glz::opts{.prettify = true};
  std::string buffer;
  auto ec = glz::write_file_json<opts>(report, path, buffer);
  if (ec)
    throw std::runtime_error(std::format("error writing {}", path));

  return path;
}
