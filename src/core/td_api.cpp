#include "core/data_source.h"
#include "mt/sleeper.h"
#include "util/config.h"
#include "util/format.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

inline constexpr int API_TOKENS = 800;
inline constexpr size_t MAX_CALLS_MIN = 8;

TD::TD() {
  for (auto& key : config.api_config.td_api_keys)
    keys.emplace_back(key);
  spdlog::info("[td] initiated with {} api keys", keys.size());
}

int TD::try_get_key() {
  TimePoint now = Clock::now();

  for (size_t i = 0; i < keys.size(); i++) {
    auto k = idx;
    idx = (idx + 1) % keys.size();

    auto& api_key = keys[k];
    if (api_key.daily_calls >= API_TOKENS)
      continue;

    auto& timestamps = api_key.call_timestamps;
    while (!timestamps.empty()) {
      auto duration = now - timestamps.front();
      if (duration < minutes(1))
        break;

      timestamps.pop_front();
    }

    if (timestamps.size() < MAX_CALLS_MIN)
      return static_cast<int>(k);
  }

  return -1;
}

std::optional<std::string> TD::get_key() {
  auto _ = std::lock_guard{mtx};

  if (keys.empty())
    throw DataSourceError("no twelvedata api keys configured");

  int k = -1;
  while ((k = try_get_key()) == -1) {
    bool all_spent = std::all_of(keys.begin(), keys.end(), [](auto& key) {
      return key.daily_calls >= API_TOKENS;
    });
    if (all_spent)
      throw DataSourceError("daily api budget spent on every key");

    if (!sleeper.sleep_for(seconds(10)))
      return std::nullopt;
  }

  spdlog::trace("[api_key] {}", k);
  auto& api_key = keys[k];
  api_key.daily_calls++;
  api_key.call_timestamps.push_back(Clock::now());

  return api_key.key;
}

Bars TD::time_series(const std::string& symbol, size_t n_bars) {
  auto api_key = get_key();
  if (!api_key)
    return {};

  if (n_bars > MAX_OUTPUT_SIZE) {
    spdlog::warn("[td] ({}) outputsize {} capped at {}", symbol, n_bars,
                 MAX_OUTPUT_SIZE);
    n_bars = MAX_OUTPUT_SIZE;
  }

  cpr::Parameters params{{"symbol", symbol},
                         {"interval", "1day"},
                         {"outputsize", std::to_string(n_bars)},
                         {"order", "asc"},
                         {"apikey", *api_key}};

  auto res = cpr::Get(cpr::Url{config.api_config.td_url}, params);

  // no response at all, the service is unreachable
  if (res.status_code == 0)
    throw DataSourceError(
        std::format("time_series transport error: {}", res.error.message));

  if (res.status_code != 200) {
    spdlog::error("[td] ({}) time_series http error {}", symbol,
                  res.status_code);
    return {};
  }

  auto bars = read_candles_json(res.text);
  if (bars.empty())
    spdlog::error("[td] ({}) time_series returned no bars", symbol);
  else
    spdlog::debug("[td] ({}) {} bars, last {}", symbol, bars.size(),
                  to_str(bars.back()));

  return bars;
}
