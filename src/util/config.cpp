#include "util/config.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <argparse/argparse.hpp>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

template <typename T>
T read(const std::string& path) {
  T t{};

  // a missing section file keeps the compiled-in defaults
  if (!fs::exists(path))
    return t;

  auto ec = glz::read_file_json<glz::opts{.error_on_unknown_keys = false}>(
      t, path, std::string{});
  if (ec)
    std::cerr << std::format("[config] {} error {}\n", path,
                             glz::format_error(ec));

  if (T::debug && fs::exists("logs")) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer.c_str());
  }

  return t;
}

Config::Config() {
  update();
}

void Config::update() {
  fs::remove("logs/configs.log");

  auto path = [this](const char* file) { return config_dir + "/" + file; };

  api_config = read<APIConfig>(path("api.json"));
  data_config = read<DataConfig>(path("data.json"));
  ind_config = read<IndicatorsConfig>(path("indicators.json"));
  strategy_config = read<StrategyConfig>(path("strategy.json"));
  sel_config = read<SelectionConfig>(path("selection.json"));
  report_config = read<ReportConfig>(path("report.json"));
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("screener");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  program.add_argument("-r", "--replay")
      .default_value(false)
      .implicit_value(true)
      .help("Read price history from the local bar cache");

  program.add_argument("-c", "--record")
      .default_value(false)
      .implicit_value(true)
      .help("Write fetched price history to the local bar cache");

  program.add_argument("-n", "--no-report")
      .default_value(false)
      .implicit_value(true)
      .help("Skip writing report files");

  program.add_argument("--top")
      .help("Number of top signals to print")
      .default_value(report_config.n_top)
      .scan<'d', size_t>();

  program.add_argument("--min-confidence")
      .help("Confidence bar for the strong signals listing")
      .default_value(report_config.min_confidence)
      .scan<'g', double>();

  program.add_argument("--config-dir")
      .help("Directory holding the json config sections")
      .default_value(config_dir);

  auto def_nthreads = static_cast<size_t>(std::thread::hardware_concurrency());
  program.add_argument("--nthreads")
      .help("Max number of concurrent asset class analyses")
      .default_value(def_nthreads)
      .scan<'d', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(1);
  }

  debug_en = program.get<bool>("--debug");
  replay_en = program.get<bool>("--replay");
  record_en = program.get<bool>("--record") && !replay_en;
  report_en = !program.get<bool>("--no-report");

  auto dir = program.get<std::string>("--config-dir");
  if (dir != config_dir) {
    config_dir = dir;
    update();
  }

  report_config.n_top = program.get<size_t>("--top");
  report_config.min_confidence = program.get<double>("--min-confidence");
  n_concurrency = std::clamp<size_t>(program.get<size_t>("--nthreads"), 1,
                                     asset_classes.size());
}
