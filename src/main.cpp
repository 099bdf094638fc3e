#include "core/data_source.h"
#include "core/manager.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

inline void init_logging() {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd, SysClock::now());
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

inline void print_summary(const TechnicalManager& manager) {
  auto summary = manager.trading_summary(config.report_config.n_strongest);

  std::cout << std::format("{} signals: {} buy / {} sell / {} watch\n",
                           summary.total, summary.buy, summary.sell,
                           summary.watch);

  for (auto& [cls, b] : summary.breakdown) {
    std::cout << std::format("  {:<12} {:<11} {:>3} signals ({} forced)",
                             to_str(cls), to_str(b.status), b.total, b.forced);
    if (b.status == AnalysisStatus::Error)
      std::cout << ": " << manager.analysis(cls).error();
    else if (b.skipped > 0)
      std::cout << std::format(", {} skipped", b.skipped);
    std::cout << '\n';
  }

  auto min_conf = config.report_config.min_confidence;
  auto strong = manager.filter_signals(min_conf);
  std::cout << std::format("\nconfidence >= {:.2f}:", min_conf);
  if (strong.empty())
    std::cout << " none";
  for (auto& [cls, sigs] : strong) {
    std::vector<std::string> symbols;
    for (auto& s : sigs)
      symbols.push_back(s.symbol);
    std::cout << std::format("\n  {:<12} {}", to_str(cls),
                             join(symbols.begin(), symbols.end()));
  }
  std::cout << '\n';

  auto top = manager.top_signals(config.report_config.n_top);
  if (top.empty())
    return;

  std::cout << std::format("\ntop {} signals\n", top.size());
  std::cout << std::format("{:<12} {:<8} {:<5} {:<24} {:>5} {:>10} {:>10} "
                           "{:>10}  {}\n",
                           "class", "symbol", "dir", "strategy", "conf",
                           "price", "stop", "target", "rationale");
  for (auto& [cls, sig] : top)
    std::cout << std::format("{:<12} {}\n", to_str(cls),
                             to_str<FormatTarget::Console>(sig));
}

inline bool run_screen(DataSource& source, std::unique_ptr<RateLimiter> limiter) {
  TechnicalManager manager{source, std::move(limiter),
                           TechnicalManager::configured_universes()};
  bool ok = manager.run();

  print_summary(manager);

  auto validation = manager.validate();
  if (!validation.ok())
    std::cerr << std::format("[validate] {} issues, see log\n",
                             validation.n_issues());

  if (config.report_en) {
    try {
      for (auto& path : manager.write_reports(config.report_config.dir))
        std::cout << "[report] " << path << '\n';
    } catch (const std::exception& e) {
      spdlog::error("[report] {}", e.what());
      std::cerr << "[report] " << e.what() << '\n';
      ok = false;
    }
  }

  return ok && validation.ok();
}

int main(int argc, char* argv[]) {
  ensure_directories_exist({"logs", "data"});
  config.read_args(argc, argv);
  init_logging();

  auto& cache_path = config.data_config.cache_path;
  bool ok = false;

  try {
    if (config.replay_en) {
      auto replay = Replay::from_file(cache_path);
      ok = run_screen(replay, std::make_unique<Unlimited>());
    } else if (config.record_en) {
      TD td;
      Recorder recorder{td};
      ok = run_screen(recorder, make_rate_limiter());
      recorder.save(cache_path);
    } else {
      TD td;
      ok = run_screen(td, make_rate_limiter());
    }
  } catch (const std::exception& e) {
    spdlog::critical("[main] {}", e.what());
    std::cerr << "[main] " << e.what() << '\n';
  }

  std::cout << "[exit] main" << std::endl;
  return ok ? 0 : 1;
}
