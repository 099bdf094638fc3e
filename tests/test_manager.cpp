#include <gtest/gtest.h>
#include "core/manager.h"
#include "core/report.h"
#include "util/format.h"
#include "test_helpers.h"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Universes seed_all(FakeSource& src) {
  Universes u;
  auto add = [&](AssetClass cls, std::vector<std::string> symbols,
                 size_t n_bars) {
    unsigned seed = static_cast<unsigned>(cls) * 100;
    for (auto& sym : symbols)
      src.add(sym, random_bars(n_bars, seed++));
    u[cls] = std::move(symbols);
  };

  add(AssetClass::Equities, {"AAPL", "MSFT", "NVDA", "JPM", "XOM", "PG"}, 120);
  add(AssetClass::Bonds, {"TLT", "IEF", "SHY", "LQD", "HYG"}, 120);
  add(AssetClass::Commodities, {"USO", "UNG", "DBC"}, 120);
  add(AssetClass::Golds, {"GLD", "IAU"}, 300);
  return u;
}

// ─── run ─────────────────────────────────────────────────────────────────────

TEST(Manager, RunsEveryClass) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};

  EXPECT_TRUE(m.run());
  EXPECT_FALSE(m.cancelled());
  for (auto cls : asset_classes) {
    EXPECT_EQ(m.status(cls), AnalysisStatus::Success) << asset_class_name(cls);
    EXPECT_FALSE(m.signals(cls).empty());
  }
}

TEST(Manager, FailingClassIsIsolated) {
  FakeSource src;
  auto u = seed_all(src);
  for (auto& sym : u[AssetClass::Golds])
    src.fail(sym);

  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  EXPECT_FALSE(m.run());
  EXPECT_EQ(m.status(AssetClass::Golds), AnalysisStatus::Error);
  EXPECT_EQ(m.status(AssetClass::Equities), AnalysisStatus::Success);
  EXPECT_EQ(m.status(AssetClass::Bonds), AnalysisStatus::Success);
  EXPECT_EQ(m.status(AssetClass::Commodities), AnalysisStatus::Success);
  EXPECT_TRUE(m.signals(AssetClass::Golds).empty());
}

TEST(Manager, MissingClassUniverseHasNoSignals) {
  FakeSource src;
  Universes u;
  u[AssetClass::Commodities] = {"USO", "UNG"};
  src.add("USO", random_bars(120, 1));
  src.add("UNG", random_bars(120, 2));

  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  EXPECT_TRUE(m.run());
  EXPECT_EQ(m.status(AssetClass::Equities), AnalysisStatus::NoSignals);
  EXPECT_EQ(m.status(AssetClass::Commodities), AnalysisStatus::Success);
}

// ─── Aggregates ──────────────────────────────────────────────────────────────

TEST(Manager, SummaryCountsAddUp) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto summary = m.trading_summary(3);
  EXPECT_EQ(summary.total, summary.buy + summary.sell + summary.watch);

  size_t total = 0;
  for (auto cls : asset_classes) {
    auto& b = summary.breakdown.at(cls);
    EXPECT_EQ(b.total, m.signals(cls).size());
    EXPECT_EQ(b.total, b.buy + b.sell + b.watch);
    EXPECT_EQ(b.forced, m.analysis(cls).result().n_forced);
    EXPECT_EQ(b.status, m.status(cls));
    total += b.total;
  }
  EXPECT_EQ(summary.total, total);
  EXPECT_LE(summary.strongest.size(), 3u);
}

TEST(Manager, TopSignalsAreRanked) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto top = m.top_signals(100);
  size_t total = 0;
  for (auto cls : asset_classes)
    total += m.signals(cls).size();
  EXPECT_EQ(top.size(), total);

  for (size_t i = 1; i < top.size(); i++) {
    auto& a = top[i - 1].signal;
    auto& b = top[i].signal;
    EXPECT_GE(a.confidence, b.confidence);
    if (a.confidence == b.confidence)
      EXPECT_LE(a.symbol, b.symbol);
  }

  EXPECT_EQ(m.top_signals(2).size(), std::min<size_t>(2, total));
  EXPECT_TRUE(m.top_signals(0).empty());
}

TEST(Manager, FilterKeepsStrongSignalsPerClass) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto all = m.filter_signals(0.0);
  for (auto cls : asset_classes) {
    ASSERT_TRUE(all.contains(cls)) << asset_class_name(cls);
    EXPECT_EQ(all.at(cls), m.signals(cls));
  }

  EXPECT_TRUE(m.filter_signals(1.01).empty());

  for (double bar : {0.3, 0.5, 0.7}) {
    auto strong = m.filter_signals(bar);
    for (auto cls : asset_classes) {
      auto& sigs = m.signals(cls);
      auto n = std::count_if(sigs.begin(), sigs.end(),
                             [&](auto& s) { return s.confidence >= bar; });
      if (n == 0) {
        EXPECT_FALSE(strong.contains(cls));
        continue;
      }
      ASSERT_TRUE(strong.contains(cls));
      EXPECT_EQ(strong.at(cls).size(), static_cast<size_t>(n));
      for (auto& s : strong.at(cls))
        EXPECT_GE(s.confidence, bar);
    }
  }
}

TEST(Manager, FilterLeavesOutClassesWithoutSignals) {
  FakeSource src;
  Universes u;
  u[AssetClass::Commodities] = {"USO", "UNG"};
  src.add("USO", random_bars(120, 1));
  src.add("UNG", random_bars(120, 2));

  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto strong = m.filter_signals(0.0);
  ASSERT_EQ(strong.size(), 1u);
  EXPECT_TRUE(strong.contains(AssetClass::Commodities));
}

TEST(Manager, ValidationPassesForEngineOutput) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto report = m.validate();
  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.n_issues(), 0u);
  EXPECT_EQ(report.classes.size(), asset_classes.size());
  EXPECT_EQ(report.n_signals(), m.trading_summary().total);
}

// ─── Reports ─────────────────────────────────────────────────────────────────

TEST(Report, PathsCarryClassAndTimestamp) {
  auto ts = std::chrono::sys_days{std::chrono::year{2025} / 1 / 31} +
            hours{15} + minutes{45};
  auto t = std::chrono::floor<seconds>(ts);
  EXPECT_EQ(signal_report_path("reports", AssetClass::Bonds, t),
            "reports/bonds_technical_signals_20250131_154500.csv");
  EXPECT_EQ(comprehensive_report_path("reports", t),
            "reports/technical_report_20250131_154500.json");
}

TEST(Report, WritesCsvPerClassAndJson) {
  FakeSource src;
  auto u = seed_all(src);
  TechnicalManager m{src, std::make_unique<Unlimited>(), u};
  m.run();

  auto dir = (fs::temp_directory_path() / "screener_report_test").string();
  fs::remove_all(dir);

  auto paths = m.write_reports(dir);
  ASSERT_EQ(paths.size(), asset_classes.size() + 1);
  for (auto& p : paths)
    EXPECT_TRUE(fs::exists(p)) << p;

  std::ifstream csv{paths.front()};
  std::string header;
  std::getline(csv, header);
  EXPECT_EQ(header,
            "instrument,strategy,direction,confidence,price,stop_loss,target,"
            "rationale");

  size_t n_rows = 0;
  for (std::string line; std::getline(csv, line);)
    n_rows++;
  EXPECT_EQ(n_rows, m.signals(AssetClass::Equities).size());

  std::ifstream json{paths.back()};
  std::string body((std::istreambuf_iterator<char>(json)),
                   std::istreambuf_iterator<char>());
  EXPECT_NE(body.find("\"validation\""), std::string::npos);
  EXPECT_NE(body.find("\"equities\""), std::string::npos);

  fs::remove_all(dir);
}

TEST(Report, CsvEscapesRationale) {
  EXPECT_EQ(csv_escape("plain"), "plain");
  EXPECT_EQ(csv_escape("a, b"), "\"a, b\"");
  EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}
