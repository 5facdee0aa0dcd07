#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hyperpga::core {

/// \brief Runtime compute backend choice.
enum class ComputeBackend { Cpu, CpuParallel };

/**
 * \brief Parse compute backend from `HYPERPGA_BACKEND`.
 * \return `Cpu` for `cpu`/`serial`, `CpuParallel` otherwise.
 */
inline ComputeBackend compute_backend_from_env() {
  const char *raw = std::getenv("HYPERPGA_BACKEND");
  if (raw == nullptr) {
    return ComputeBackend::CpuParallel;
  }

  std::string value(raw);
  for (char &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (value == "cpu" || value == "serial") {
    return ComputeBackend::Cpu;
  }
  return ComputeBackend::CpuParallel;
}

/**
 * \brief Hardware concurrency with safe fallback to `1`.
 * \return Hardware thread count.
 */
inline int hardware_thread_count() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

/**
 * \brief Desired worker count from `HYPERPGA_NUM_THREADS` or hardware.
 * \return Worker count used by parallel range loops.
 */
inline int compute_thread_count() {
  const char *raw = std::getenv("HYPERPGA_NUM_THREADS");
  if (raw != nullptr) {
    const int requested = std::atoi(raw);
    if (requested > 0) {
      return requested;
    }
  }
  return hardware_thread_count();
}

/**
 * \brief Reusable worker pool handing out contiguous index ranges.
 *
 * The caller thread participates; workers claim `[begin, end)` chunks from a
 * shared atomic cursor so each index is visited by exactly one participant.
 */
class RangeWorkerPool {
public:
  using RangeFn = std::function<void(size_t, size_t)>;

  /**
   * \brief Construct pool with up to `max_workers - 1` background threads.
   * \param max_workers Total participants including caller thread.
   */
  explicit RangeWorkerPool(int max_workers)
      : max_workers_(std::max(0, max_workers - 1)) {
    workers_.reserve(static_cast<size_t>(max_workers_));
    for (int worker_idx = 0; worker_idx < max_workers_; ++worker_idx) {
      workers_.emplace_back([this, worker_idx]() { worker_loop(worker_idx); });
    }
  }

  ~RangeWorkerPool() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
      ++generation_;
    }
    cv_work_.notify_all();
    for (auto &worker : workers_) {
      worker.join();
    }
  }

  RangeWorkerPool(const RangeWorkerPool &) = delete;
  RangeWorkerPool &operator=(const RangeWorkerPool &) = delete;

  /**
   * \brief Run `fn(chunk_begin, chunk_end)` over `[0, count)`.
   * \param count Number of indices.
   * \param requested_workers Requested total participants.
   * \param fn Range body.
   */
  void run(size_t count, int requested_workers, const RangeFn &fn) {
    if (count == 0) {
      return;
    }

    const size_t participants = std::max<size_t>(
        1, std::min({static_cast<size_t>(std::max(1, requested_workers)), count,
                     static_cast<size_t>(max_workers_ + 1)}));
    if (participants <= 1) {
      fn(0, count);
      return;
    }

    // One run at a time; concurrent callers queue here.
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      count_ = count;
      grain_ = std::max<size_t>(1, count / (participants * 8));
      next_.store(0, std::memory_order_relaxed);
      active_workers_ = static_cast<int>(participants) - 1;
      remaining_.store(static_cast<int>(participants),
                       std::memory_order_relaxed);
      job_ = &fn;
      ++generation_;
    }
    cv_work_.notify_all();

    run_chunks();

    std::unique_lock<std::mutex> lock(mutex_);
    cv_done_.wait(lock, [this]() {
      return remaining_.load(std::memory_order_acquire) == 0;
    });
    job_ = nullptr;
  }

private:
  void worker_loop(int worker_idx) {
    uint64_t seen_generation = 0;
    while (true) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_work_.wait(lock, [&]() {
          return stop_ || generation_ != seen_generation;
        });
        if (stop_) {
          return;
        }
        seen_generation = generation_;
        if (worker_idx >= active_workers_) {
          continue;
        }
      }
      run_chunks();
    }
  }

  void run_chunks() {
    while (true) {
      const size_t chunk_begin =
          next_.fetch_add(grain_, std::memory_order_relaxed);
      if (chunk_begin >= count_) {
        break;
      }
      (*job_)(chunk_begin, std::min(count_, chunk_begin + grain_));
    }

    if (remaining_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::lock_guard<std::mutex> lock(mutex_);
      cv_done_.notify_one();
    }
  }

  int max_workers_ = 0;
  std::vector<std::thread> workers_;

  std::mutex run_mutex_;
  std::mutex mutex_;
  std::condition_variable cv_work_;
  std::condition_variable cv_done_;

  bool stop_ = false;
  uint64_t generation_ = 0;
  int active_workers_ = 0;

  size_t count_ = 0;
  size_t grain_ = 1;
  std::atomic<size_t> next_{0};
  std::atomic<int> remaining_{0};
  const RangeFn *job_ = nullptr;
};

/// \brief Process-wide pool used by `parallel_for_ranges`.
inline RangeWorkerPool &range_worker_pool() {
  static RangeWorkerPool pool(hardware_thread_count());
  return pool;
}

/**
 * \brief Execute `fn(begin, end)` over `[0, count)`, possibly in parallel.
 *
 * Serial when `HYPERPGA_BACKEND=cpu`, when one worker is configured, or when
 * `count < min_parallel_count`.
 * \param count Number of indices.
 * \param fn Range body.
 * \param min_parallel_count Minimum count to enable parallel execution.
 */
template <typename Fn>
void parallel_for_ranges(size_t count, Fn &&fn,
                         size_t min_parallel_count = 64) {
  if (count == 0) {
    return;
  }

  const bool allow_parallel =
      compute_backend_from_env() != ComputeBackend::Cpu;
  const int workers = allow_parallel ? compute_thread_count() : 1;
  if (workers <= 1 || count < min_parallel_count) {
    fn(size_t{0}, count);
    return;
  }

  const RangeWorkerPool::RangeFn job = [&fn](size_t begin, size_t end) {
    fn(begin, end);
  };
  range_worker_pool().run(count, workers, job);
}

} // namespace hyperpga::core
