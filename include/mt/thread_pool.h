#pragma once

#include "mt/sleeper.h"

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

// Runs func over every queued value on at most n_threads workers. A func
// returning false stops the pool; values not yet started are dropped. The
// destructor waits for the workers.
template <typename T>
  requires std::is_move_assignable_v<T> && std::is_move_constructible_v<T>
class thread_pool {
  const size_t n_threads = 1;
  std::vector<std::jthread> threads;
  std::latch latch;

  using Func = std::function<bool(T&&)>;
  const Func func;

  std::vector<T> vals;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool stopped = false;
  bool started = false;
  bool cancelled_ = false;

  std::optional<T> pop() {
    std::unique_lock lk{mtx};
    cv.wait(lk, [this] { return stopped || cancelled_ || started; });
    if (cancelled_ || vals.empty())
      return std::nullopt;
    auto t = std::move(vals.back());
    vals.pop_back();
    return t;
  }

  void worker_loop() {
    while (!sleeper.should_shutdown()) {
      auto t_opt = pop();
      if (!t_opt)
        break;
      if (!func(std::move(*t_opt))) {
        cancel();
        break;
      }
    }
    latch.count_down();
  }

  void cancel() {
    {
      std::lock_guard lk{mtx};
      cancelled_ = true;
    }
    cv.notify_all();
  }

  void stop() {
    {
      std::lock_guard lk{mtx};
      stopped = true;
    }
    cv.notify_all();
  }

  static size_t n_workers(size_t n_threads, size_t n_vals) {
    return std::max<size_t>(1, std::min(n_threads, n_vals));
  }

 public:
  // values are taken from the back, pass them in reverse to keep an order
  thread_pool(size_t n_threads, Func func, std::vector<T> vec) noexcept
      : n_threads{n_workers(n_threads, vec.size())},
        latch{static_cast<ptrdiff_t>(this->n_threads)},
        func{std::move(func)},
        vals{std::move(vec)}  //
  {
    threads.reserve(this->n_threads);
    for (size_t i = 0; i < this->n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this).detach();
    {
      std::lock_guard lk{mtx};
      started = true;
    }
    cv.notify_all();
  }

  ~thread_pool() {
    stop();
    latch.wait();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  // blocks until every worker is done
  void wait() { latch.wait(); }

  bool cancelled() const {
    std::lock_guard lk{mtx};
    return cancelled_;
  }
};
