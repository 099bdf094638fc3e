#include "core/data_source.h"
#include "ind/candle.h"
#include "util/times.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>

#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/unordered_map.hpp>
#include <cereal/types/vector.hpp>

namespace cereal {
template <class Archive>
void save(Archive& ar, const Candle& c) {
  LocalTimePoint tp = c.time();
  std::int64_t secs = tp.time_since_epoch().count();
  ar(secs, c.open, c.high, c.low, c.close, c.volume);
}

template <class Archive>
void load(Archive& ar, Candle& c) {
  std::int64_t secs;
  ar(secs, c.open, c.high, c.low, c.close, c.volume);
  c.datetime = LocalTimePoint{std::chrono::seconds{secs}};
}
}  // namespace cereal

void write_candles(const std::string& filename, const CandleStore& data) {
  auto parent = std::filesystem::path{filename}.parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent);

  std::ofstream ofs(filename, std::ios::binary);
  if (!ofs)
    throw std::runtime_error(std::format("unable to write {}", filename));

  cereal::BinaryOutputArchive oarchive(ofs);
  oarchive(data);
}

CandleStore read_candles(const std::string& filename) {
  std::ifstream ifs(filename, std::ios::binary);
  if (!ifs)
    throw DataSourceError(std::format("bar cache {} not found", filename));

  CandleStore data;
  cereal::BinaryInputArchive iarchive(ifs);
  iarchive(data);
  return data;
}

template <>
struct glz::meta<LocalTimePoint> {
  using T = LocalTimePoint;

  static constexpr auto write = [](const T& time_point) {
    return std::format("{:%F %T}", time_point);
  };

  static constexpr auto read = [](T& t, const std::string& str) {
    if (str.size() > 10)
      t = datetime_to_local(str);
    else
      t = date_to_local(str);
  };

  static constexpr auto value = custom<read, write>;
};

struct APIRes {
  Bars values;
  std::string status = "ok";
  std::string message;
};

Bars read_candles_json(const std::string& str) {
  constexpr auto opts = glz::opts{
      .error_on_unknown_keys = false,
      .quoted_num = true,
  };

  APIRes ts_res;
  auto ec = glz::read<opts>(ts_res, str);
  if (ec) {
    spdlog::error("[td] time_series json error: {}", glz::format_error(ec));
    return {};
  }

  if (ts_res.status != "ok") {
    spdlog::error("[td] time_series status {}: {}", ts_res.status,
                  ts_res.message);
    return {};
  }

  return ts_res.values;
}
