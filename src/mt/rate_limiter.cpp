#include "mt/rate_limiter.h"
#include "mt/sleeper.h"
#include "util/config.h"

#include <spdlog/spdlog.h>
#include <algorithm>

SleepFunc sleeper_sleep() {
  return [](milliseconds duration) { return sleeper.sleep_for(duration); };
}

TokenBucket::TokenBucket(double per_second, double burst, SleepFunc sleep)
    : rate{std::max(per_second, 1e-6)},
      capacity{std::max(burst, 1.0)},
      tokens{capacity},
      last{Clock::now()},
      sleep{std::move(sleep)} {}

void TokenBucket::refill() {
  auto now = Clock::now();
  auto elapsed = std::chrono::duration<double>(now - last).count();
  tokens = std::min(capacity, tokens + elapsed * rate);
  last = now;
}

bool TokenBucket::acquire() {
  std::lock_guard lk{mtx};

  refill();
  if (tokens >= 1.0) {
    tokens -= 1.0;
    return true;
  }

  auto wait = std::chrono::duration<double>((1.0 - tokens) / rate);
  if (!sleep(std::chrono::ceil<milliseconds>(wait)))
    return false;

  // the token that accrued while waiting is spent right away
  tokens = 0.0;
  last = Clock::now();
  return true;
}

BatchPacer::BatchPacer(milliseconds delay,
                       size_t batch_size,
                       milliseconds pause,
                       SleepFunc sleep)
    : delay{delay},
      pause{pause},
      batch_size{batch_size},
      sleep{std::move(sleep)} {}

bool BatchPacer::acquire() {
  std::lock_guard lk{mtx};

  if (count > 0) {
    bool batch_end = batch_size > 0 && count % batch_size == 0;
    auto wait = batch_end ? pause : delay;
    if (wait > milliseconds{0} && !sleep(wait))
      return false;
    if (batch_end)
      spdlog::debug("[pacer] batch of {} done", batch_size);
  }

  count++;
  return true;
}

std::unique_ptr<RateLimiter> make_rate_limiter() {
  auto& data = config.data_config;
  auto to_ms = [](double secs) {
    return milliseconds{static_cast<long long>(std::max(secs, 0.0) * 1000)};
  };
  return std::make_unique<BatchPacer>(to_ms(data.request_delay_s),
                                      data.batch_size,
                                      to_ms(data.batch_pause_s));
}
