#pragma once

#include "ind/candle.h"
#include "util/times.h"

#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// The source itself is unusable, as opposed to one instrument lacking data
struct DataSourceError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

class DataSource {
 public:
  virtual ~DataSource() = default;

  // Latest n_bars daily bars, oldest first. Empty when the instrument has no
  // usable history; throws DataSourceError when the source is down.
  virtual Bars time_series(const std::string& symbol, size_t n_bars) = 0;
};

struct APIKey {
  const std::string key;
  int daily_calls = 0;
  std::deque<TimePoint> call_timestamps = {};  // to enforce 8/min
};

inline constexpr size_t MAX_OUTPUT_SIZE = 5000;

// twelvedata time_series client
class TD final : public DataSource {
  std::vector<APIKey> keys;
  size_t idx = 0;
  std::mutex mtx;

  int try_get_key();
  std::optional<std::string> get_key();

 public:
  TD();

  Bars time_series(const std::string& symbol, size_t n_bars) override;
};

using CandleStore = std::unordered_map<std::string, Bars>;

void write_candles(const std::string& filename, const CandleStore& data);
CandleStore read_candles(const std::string& filename);

// body of a time_series response, empty on a malformed or error payload
Bars read_candles_json(const std::string& str);

// serves bars recorded by an earlier run
class Replay final : public DataSource {
  CandleStore store;

 public:
  explicit Replay(CandleStore store) noexcept;
  static Replay from_file(const std::string& filename);

  Bars time_series(const std::string& symbol, size_t n_bars) override;

  auto size() const { return store.size(); }
};

// forwards to another source and keeps what it returned
class Recorder final : public DataSource {
  DataSource& source;
  CandleStore store;
  mutable std::mutex mtx;

 public:
  explicit Recorder(DataSource& source) noexcept : source{source} {}

  Bars time_series(const std::string& symbol, size_t n_bars) override;

  void save(const std::string& filename) const;
  size_t size() const;
};
