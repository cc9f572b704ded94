#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of workers draining a queue of jobs. The destructor waits until
// every queued job has run; the first exception thrown by a job is rethrown
// from wait().
template <typename T>
  requires std::is_move_constructible_v<T>
class thread_pool {
  using Func = std::function<void(T&&)>;
  const Func func;

  std::vector<T> vals;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool closed = false;
  std::exception_ptr failure;

  std::latch latch;
  std::vector<std::jthread> threads;

  std::optional<T> pop() {
    std::unique_lock lk{mtx};
    cv.wait(lk, [this] { return closed || !vals.empty(); });
    if (vals.empty())
      return std::nullopt;
    auto t = std::move(vals.back());
    vals.pop_back();
    return t;
  }

  void worker_loop() {
    while (auto t_opt = pop()) {
      try {
        func(std::move(*t_opt));
      } catch (...) {
        std::lock_guard lk{mtx};
        if (!failure)
          failure = std::current_exception();
      }
    }
    latch.count_down();
  }

  void close() {
    {
      std::lock_guard lk{mtx};
      closed = true;
    }
    cv.notify_all();
  }

 public:
  thread_pool(size_t n_threads, Func func, std::vector<T> vec)
      : func{std::move(func)},
        vals{std::move(vec)},
        latch{static_cast<std::ptrdiff_t>(std::max<size_t>(n_threads, 1))}  //
  {
    n_threads = std::max<size_t>(n_threads, 1);
    threads.reserve(n_threads);
    for (size_t i = 0; i < n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this);
  }

  ~thread_pool() {
    close();
    latch.wait();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;

  template <typename... Args>
    requires std::constructible_from<T, Args...>
  void emplace(Args&&... args) {
    {
      std::lock_guard lk{mtx};
      if (closed)
        throw std::runtime_error("added work to closed thread_pool");
      vals.emplace_back(std::forward<Args>(args)...);
    }
    cv.notify_one();
  }

  // Runs the remaining jobs to completion.
  void wait() {
    close();
    latch.wait();
    std::lock_guard lk{mtx};
    if (failure)
      std::rethrow_exception(failure);
  }
};
