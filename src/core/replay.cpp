#include "core/data_source.h"

#include <spdlog/spdlog.h>
#include <algorithm>

Replay::Replay(CandleStore store) noexcept : store{std::move(store)} {
  spdlog::info("[replay] {} instruments", this->store.size());
}

Replay Replay::from_file(const std::string& filename) {
  return Replay{read_candles(filename)};
}

Bars Replay::time_series(const std::string& symbol, size_t n_bars) {
  auto it = store.find(symbol);
  if (it == store.end()) {
    spdlog::warn("[replay] ({}) not in cache", symbol);
    return {};
  }

  auto& bars = it->second;
  auto n = std::min(n_bars, bars.size());
  return Bars(bars.end() - n, bars.end());
}

Bars Recorder::time_series(const std::string& symbol, size_t n_bars) {
  auto bars = source.time_series(symbol, n_bars);
  if (!bars.empty()) {
    std::lock_guard lk{mtx};
    store[symbol] = bars;
  }
  return bars;
}

void Recorder::save(const std::string& filename) const {
  std::lock_guard lk{mtx};
  write_candles(filename, store);
  spdlog::info("[replay] recorded {} instruments to {}", store.size(),
               filename);
}

size_t Recorder::size() const {
  std::lock_guard lk{mtx};
  return store.size();
}
