#pragma once

#include "util/times.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

// returns false when the wait was cut short by shutdown
using SleepFunc = std::function<bool(milliseconds)>;

SleepFunc sleeper_sleep();

class RateLimiter {
 public:
  virtual ~RateLimiter() = default;

  // Blocks until one more request may go out. False means the run is being
  // cancelled and the request should not be made.
  virtual bool acquire() = 0;
};

class Unlimited final : public RateLimiter {
 public:
  bool acquire() override { return true; }
};

class TokenBucket final : public RateLimiter {
  const double rate;  // tokens per second
  const double capacity;
  double tokens;
  TimePoint last;

  std::mutex mtx;
  SleepFunc sleep;

  void refill();

 public:
  TokenBucket(double per_second, double burst, SleepFunc sleep = sleeper_sleep());

  bool acquire() override;
};

// fixed delay between requests and a longer pause after each batch
class BatchPacer final : public RateLimiter {
  const milliseconds delay;
  const milliseconds pause;
  const size_t batch_size;
  size_t count = 0;

  std::mutex mtx;
  SleepFunc sleep;

 public:
  BatchPacer(milliseconds delay,
             size_t batch_size,
             milliseconds pause,
             SleepFunc sleep = sleeper_sleep());

  bool acquire() override;
  size_t n_acquired() const { return count; }
};

// pacing from the data config
std::unique_ptr<RateLimiter> make_rate_limiter();
