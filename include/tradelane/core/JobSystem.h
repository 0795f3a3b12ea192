#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tradelane::core {

// Small fixed-size worker pool.
//
//  - header-only.
//  - parallelFor() runs one work loop on the calling thread, so nested use
//    from inside a job cannot deadlock the pool.
//  - parallelCollect() is the fan-out/fan-in form used by the candidate
//    builder: each index writes into its own bucket, buckets are returned in
//    index order.
class JobSystem {
public:
  // threadCount == 0 picks hardware_concurrency() (fallback 4).
  explicit JobSystem(std::size_t threadCount = 0) {
    if (threadCount == 0) threadCount = defaultThreadCount();
    if (threadCount < 1) threadCount = 1;
    threadCount_ = threadCount;

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
      threads_.emplace_back([this]() { workerLoop(); });
    }
  }

  ~JobSystem() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;
  JobSystem(JobSystem&&) = delete;
  JobSystem& operator=(JobSystem&&) = delete;

  std::size_t threadCount() const { return threadCount_; }

  static std::size_t defaultThreadCount() {
    const unsigned hc = std::thread::hardware_concurrency();
    if (hc > 0) return static_cast<std::size_t>(hc);
    return 4;
  }

  template <class F, class... Args>
  auto submit(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<R()>>(
      [func = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
        return std::apply(std::move(func), std::move(tup));
      });

    std::future<R> fut = task->get_future();

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (stopping_) {
        lock.unlock();
        (*task)();
        return fut;
      }
      queue_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Block until the queue is empty and no worker is running a task.
  void waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [&]() { return queue_.empty() && active_ == 0; });
  }

  // Calls fn(i) once for every i in [0, count). grain == 0 picks a block size.
  //
  // An exception thrown by fn is rethrown on the calling thread after every
  // helper has finished.
  template <class Fn>
  void parallelFor(std::size_t count, Fn&& fn, std::size_t grain = 0) {
    if (count == 0) return;

    if (threadCount_ <= 1 || count <= 1) {
      for (std::size_t i = 0; i < count; ++i) fn(i);
      return;
    }

    const std::size_t workers = threadCount_;
    if (grain == 0) {
      grain = count / (workers * 4);
      if (grain < 1) grain = 1;
    }

    std::atomic<std::size_t> next{0};

    auto workLoop = [&]() {
      for (;;) {
        const std::size_t start = next.fetch_add(grain, std::memory_order_relaxed);
        if (start >= count) break;
        const std::size_t end = (start + grain < count) ? (start + grain) : count;
        for (std::size_t i = start; i < end; ++i) fn(i);
      }
    };

    const std::size_t helpers = std::min(workers - 1, (count + grain - 1) / grain);
    std::vector<std::future<void>> futs;
    futs.reserve(helpers);
    for (std::size_t i = 0; i < helpers; ++i) {
      futs.push_back(submit(workLoop));
    }

    std::exception_ptr firstError;
    try {
      workLoop();
    } catch (...) {
      firstError = std::current_exception();
      next.store(count, std::memory_order_relaxed);
    }
    for (auto& f : futs) {
      try {
        f.get();
      } catch (...) {
        if (!firstError) firstError = std::current_exception();
      }
    }
    if (firstError) std::rethrow_exception(firstError);
  }

  // Fan-out/fan-in: out[i] = fn(i). Result order never depends on scheduling.
  template <class Fn>
  auto parallelCollect(std::size_t count, Fn&& fn, std::size_t grain = 0)
    -> std::vector<std::invoke_result_t<Fn, std::size_t>> {
    using R = std::invoke_result_t<Fn, std::size_t>;
    std::vector<R> out(count);
    parallelFor(count, [&](std::size_t i) { out[i] = fn(i); }, grain);
    return out;
  }

private:
  void workerLoop() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) return;

        task = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
      }

      task();

      {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (queue_.empty() && active_ == 0) idleCv_.notify_all();
      }
    }
  }

  std::size_t threadCount_{1};
  std::vector<std::thread> threads_{};

  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::condition_variable idleCv_{};

  std::deque<std::function<void()>> queue_{};
  std::size_t active_{0};
  bool stopping_{false};
};

} // namespace tradelane::core
