#pragma once

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <stdexcept>
#include <thread>

// Owns SIGINT/SIGTERM for the process. Waits anywhere in the engine go
// through sleep_for so a shutdown request cuts them short.
class Sleeper {
  std::atomic<bool> shutdown_requested{false};
  std::atomic<bool> closing{false};
  std::mutex mtx;
  std::condition_variable cv;
  std::thread td;

  static sigset_t handled_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
  }

  void handler() {
    auto set = handled_signals();

    int signum;
    while (!closing.load(std::memory_order_acquire)) {
      if (sigwait(&set, &signum) != 0)
        continue;
      if (closing.load(std::memory_order_acquire))
        break;

      spdlog::warn("[sleeper] signal {} received, shutting down", signum);
      request_shutdown();
    }
  }

  static void block_signals_for_all_threads() {
    auto set = handled_signals();
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
      throw std::runtime_error("Failed to block signals");
  }

 public:
  Sleeper() {
    block_signals_for_all_threads();
    td = std::thread(&Sleeper::handler, this);
  }

  ~Sleeper() {
    closing.store(true, std::memory_order_release);
    request_shutdown();

    if (td.joinable()) {
      // wake the signal thread out of sigwait
      pthread_kill(td.native_handle(), SIGINT);
      td.join();
    }
  }

  Sleeper(const Sleeper&) = delete;
  Sleeper& operator=(const Sleeper&) = delete;
  Sleeper(Sleeper&&) = delete;
  Sleeper& operator=(Sleeper&&) = delete;

  bool should_shutdown() const {
    return shutdown_requested.load(std::memory_order_acquire);
  }

  void request_shutdown() {
    {
      std::lock_guard lk{mtx};
      shutdown_requested.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  // false when woken by a shutdown request
  template <typename Rep, typename Period>
  bool sleep_for(const std::chrono::duration<Rep, Period> duration) {
    if (should_shutdown())
      return false;
    std::unique_lock lk{mtx};
    return !cv.wait_for(lk, duration, [this] { return should_shutdown(); });
  }
};

inline Sleeper sleeper;
