/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file evr/task_pool.hpp
 * @brief TaskPool - shared worker pool behind Parallel, Async and RaiseAsync.
 *
 * Architecture:
 *   Submit() -- round-robin --> Worker[0..N-1] queue --> WorkerThread
 *                                     ^                       |
 *                                     +------ steal ----------+
 *
 * Features:
 * - Per-worker queues, idle workers steal from their neighbours
 * - Adaptive spin -> yield -> condition_variable wait in the worker loop
 * - FanOut(): fan-out/fan-in batch where the caller runs every unit no worker
 *   has claimed yet, so a blocked caller never starves its own batch
 * - Shutdown drains queued tasks before joining
 * - Thread priority and CPU affinity support (Linux)
 *
 * A task that throws does not kill its worker: the exception is reported
 * through the unobserved fault sink (see fault.hpp).
 *
 * Usage:
 *   evr::TaskPoolConfig cfg;
 *   cfg.name = "events";
 *   cfg.worker_num = 4;
 *
 *   evr::TaskPool pool(cfg);
 *   pool.Start();
 *   pool.Submit([] { ... });
 *   auto faults = pool.FanOut({task_a, task_b, task_c});  // blocks
 *   pool.Shutdown();
 */

#ifndef EVR_TASK_POOL_HPP_
#define EVR_TASK_POOL_HPP_

#include "evr/fault.hpp"
#include "evr/log.hpp"
#include "evr/platform.hpp"
#include "evr/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace evr {

// ============================================================================
// AdaptiveBackoff - Three-phase backoff: spin -> yield -> wait
// ============================================================================

namespace detail {

/**
 * @brief Adaptive backoff for the worker polling loop.
 *
 * Phase 1 spins with a CPU relax hint (1..32 iterations, exponential), phase
 * 2 yields. Once both are exhausted the caller falls through to a blocking
 * wait.
 */
class AdaptiveBackoff {
 public:
  void Reset() noexcept { spin_count_ = 0U; }

  void Wait() noexcept {
    if (spin_count_ < kSpinLimit) {
      const uint32_t iters = 1U << spin_count_;
      for (uint32_t i = 0U; i < iters; ++i) {
        CpuRelax();
      }
    } else {
      std::this_thread::yield();
    }
    ++spin_count_;
  }

  bool Exhausted() const noexcept { return spin_count_ >= kSpinLimit + kYieldLimit; }

 private:
  static constexpr uint32_t kSpinLimit = 6U;
  static constexpr uint32_t kYieldLimit = 4U;

  static void CpuRelax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
    __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
  }

  uint32_t spin_count_{0U};
};

}  // namespace detail

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief TaskPool configuration.
 *
 * worker_num 0 selects std::thread::hardware_concurrency() (at least 1).
 */
struct TaskPoolConfig {
  FixedString<32> name{"evr"};
  uint32_t worker_num{0U};
  int32_t priority{0};
#ifdef __linux__
  uint32_t cpu_set_size{0U};
  const cpu_set_t* cpu_set{nullptr};
#endif
};

struct TaskPoolStats {
  uint64_t submitted{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};
  uint64_t stolen{0U};
};

// ============================================================================
// TaskPool
// ============================================================================

class TaskPool {
 public:
  using Task = std::function<void()>;

  explicit TaskPool(const TaskPoolConfig& cfg = TaskPoolConfig{})
      : name_(cfg.name),
        worker_num_(ResolveWorkerNum(cfg.worker_num)),
        priority_(cfg.priority)
#ifdef __linux__
        ,
        cpu_set_size_(cfg.cpu_set_size),
        cpu_set_(cfg.cpu_set)
#endif
  {
  }

  ~TaskPool() { Shutdown(); }

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;
  TaskPool(TaskPool&&) = delete;
  TaskPool& operator=(TaskPool&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Start the worker threads. No-op when already running.
   */
  void Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(false, std::memory_order_release);

    workers_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      workers_.push_back(std::make_unique<WorkerContext>());
    }
    running_.store(true, std::memory_order_release);

    worker_threads_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      worker_threads_.emplace_back(&TaskPool::WorkerLoop, this, i);
    }
    EVR_LOG_DEBUG("Pool", "%s: started %u worker(s)", name_.c_str(), worker_num_);
  }

  /**
   * @brief Stop accepting tasks, run everything already queued, join workers.
   *
   * Must not be called from one of this pool's workers.
   */
  void Shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    EVR_ASSERT(!IsWorkerThread());
    {
      // Submit() checks both flags under this lock, so nothing is queued
      // once the workers start draining.
      std::lock_guard<std::mutex> lk(submit_mtx_);
      running_.store(false, std::memory_order_release);
      shutdown_.store(true, std::memory_order_release);
    }
    for (auto& w : workers_) {
      { std::lock_guard<std::mutex> lk(w->mtx); }
      w->cv.notify_all();
    }
    for (auto& t : worker_threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    worker_threads_.clear();
    workers_.clear();
    EVR_LOG_DEBUG("Pool", "%s: stopped", name_.c_str());
  }

  // ======================== Submit API ========================

  /**
   * @brief Queue a task for a worker.
   *
   * @return false if the pool is not running (the task is not queued).
   */
  bool Submit(Task task) {
    std::lock_guard<std::mutex> guard(submit_mtx_);
    if (!running_.load(std::memory_order_acquire) || shutdown_.load(std::memory_order_acquire)) {
      rejected_.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    const uint32_t wid = next_worker_.fetch_add(1U, std::memory_order_relaxed) % worker_num_;
    WorkerContext& w = *workers_[wid];
    {
      std::lock_guard<std::mutex> lk(w.mtx);
      w.queue.push_back(std::move(task));
    }
    submitted_.fetch_add(1U, std::memory_order_relaxed);
    w.cv.notify_one();
    return true;
  }

  /**
   * @brief Run every task concurrently and block until all have finished.
   *
   * Units are offered to the workers; the calling thread meanwhile runs, in
   * order, each unit that no worker has claimed yet. Every unit runs exactly
   * once. Exceptions are collected, never rethrown here.
   *
   * @return One exception_ptr per unit that threw, in completion order.
   */
  std::vector<std::exception_ptr> FanOut(std::vector<Task> tasks) {
    if (tasks.empty()) {
      return {};
    }
    auto batch = std::make_shared<FanOutBatch>(std::move(tasks));
    const size_t n = batch->tasks.size();
    for (size_t i = 1U; i < n; ++i) {
      if (!Submit([batch, i] { batch->Run(i); })) {
        break;
      }
    }
    for (size_t i = 0U; i < n; ++i) {
      batch->Run(i);
    }
    return batch->Wait();
  }

  // ======================== Query ========================

  TaskPoolStats GetStats() const noexcept {
    TaskPoolStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.stolen = stolen_.load(std::memory_order_relaxed);
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  const char* Name() const noexcept { return name_.c_str(); }

  /// True when called from one of this pool's worker threads.
  bool IsWorkerThread() const noexcept { return CurrentPool() == this; }

  // ======================== Process-wide pool ========================

  /**
   * @brief Set the configuration of Default() before its first use.
   *
   * @return false once the default pool exists (config unchanged).
   */
  static bool ConfigureDefault(const TaskPoolConfig& cfg) {
    auto& slot = GetDefaultSlot();
    std::lock_guard<std::mutex> lk(slot.mtx);
    if (slot.created) {
      return false;
    }
    slot.cfg = cfg;
    return true;
  }

  /**
   * @brief Lazily created, started process-wide pool.
   */
  static TaskPool& Default() {
    // Construct the log and fault singletons first so they outlive the pool.
    (void)log::detail::State();
    (void)detail::GetFaultPolicy();
    static TaskPool pool(TakeDefaultConfig());
    static const bool started = (pool.Start(), true);
    (void)started;
    return pool;
  }

 private:
  // ======================== Fan-out batch ========================

  struct FanOutBatch {
    explicit FanOutBatch(std::vector<Task> t)
        : tasks(std::move(t)), claimed(new std::atomic<bool>[tasks.size()]), remaining(tasks.size()) {
      for (size_t i = 0U; i < tasks.size(); ++i) {
        claimed[i].store(false, std::memory_order_relaxed);
      }
    }

    void Run(size_t i) {
      if (claimed[i].exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      std::exception_ptr fault;
      try {
        tasks[i]();
      } catch (...) {
        fault = std::current_exception();
      }
      std::lock_guard<std::mutex> lk(mtx);
      if (fault) {
        faults.push_back(std::move(fault));
      }
      if (--remaining == 0U) {
        cv.notify_all();
      }
    }

    std::vector<std::exception_ptr> Wait() {
      std::unique_lock<std::mutex> lk(mtx);
      cv.wait(lk, [this] { return remaining == 0U; });
      return std::move(faults);
    }

    std::vector<Task> tasks;
    std::unique_ptr<std::atomic<bool>[]> claimed;
    std::mutex mtx;
    std::condition_variable cv;
    size_t remaining;
    std::vector<std::exception_ptr> faults;
  };

  // ======================== Worker thread ========================

  struct WorkerContext {
    std::deque<Task> queue;
    std::mutex mtx;
    std::condition_variable cv;
  };

  bool TryPop(uint32_t worker_id, Task& task) {
    WorkerContext& own = *workers_[worker_id];
    {
      std::lock_guard<std::mutex> lk(own.mtx);
      if (!own.queue.empty()) {
        task = std::move(own.queue.front());
        own.queue.pop_front();
        return true;
      }
    }
    for (uint32_t i = 1U; i < worker_num_; ++i) {
      WorkerContext& victim = *workers_[(worker_id + i) % worker_num_];
      std::unique_lock<std::mutex> lk(victim.mtx, std::try_to_lock);
      if (lk.owns_lock() && !victim.queue.empty()) {
        task = std::move(victim.queue.back());
        victim.queue.pop_back();
        stolen_.fetch_add(1U, std::memory_order_relaxed);
        return true;
      }
    }
    return false;
  }

  void RunTask(Task& task) noexcept {
    try {
      task();
    } catch (...) {
      ReportUnobservedFault(std::current_exception());
    }
    task = nullptr;
    processed_.fetch_add(1U, std::memory_order_relaxed);
  }

  void WorkerLoop(uint32_t worker_id) {
    SetThreadPriority(priority_);
#ifdef __linux__
    if (cpu_set_ != nullptr && cpu_set_size_ > 0U) {
      (void)pthread_setaffinity_np(pthread_self(), cpu_set_size_, cpu_set_);
    }
#endif
    CurrentPool() = this;

    WorkerContext& ctx = *workers_[worker_id];
    Task task;
    detail::AdaptiveBackoff backoff;

    while (!shutdown_.load(std::memory_order_acquire)) {
      if (TryPop(worker_id, task)) {
        RunTask(task);
        backoff.Reset();
        continue;
      }
      if (!backoff.Exhausted()) {
        backoff.Wait();
        continue;
      }
      std::unique_lock<std::mutex> lk(ctx.mtx);
      ctx.cv.wait_for(lk, std::chrono::milliseconds(1),
                      [&] { return !ctx.queue.empty() || shutdown_.load(std::memory_order_acquire); });
      backoff.Reset();
    }

    // Drain remaining (own queue and anything left with the neighbours)
    while (TryPop(worker_id, task)) {
      RunTask(task);
    }
    CurrentPool() = nullptr;
  }

  // ======================== Platform helpers ========================

  static void SetThreadPriority(int32_t prio) noexcept {
#ifdef __linux__
    if (prio > 0) {
      struct sched_param param{};
      param.sched_priority = (prio > 99) ? 99 : prio;
      if (pthread_setschedparam(pthread_self(), SCHED_FIFO, &param) != 0) {
        EVR_LOG_WARN("Pool", "SCHED_FIFO priority %d not permitted", static_cast<int>(prio));
      }
    } else if (prio < 0) {
      struct sched_param param{};
      param.sched_priority = 0;
      (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
    }
#else
    (void)prio;
#endif
  }

  static uint32_t ResolveWorkerNum(uint32_t requested) noexcept {
    if (requested > 0U) {
      return requested;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return (hw > 0U) ? static_cast<uint32_t>(hw) : 1U;
  }

  static const TaskPool*& CurrentPool() noexcept {
    static thread_local const TaskPool* current = nullptr;
    return current;
  }

  // ======================== Default pool slot ========================

  struct DefaultSlot {
    std::mutex mtx;
    TaskPoolConfig cfg;
    bool created{false};
  };

  static DefaultSlot& GetDefaultSlot() noexcept {
    static DefaultSlot slot;
    return slot;
  }

  static TaskPoolConfig TakeDefaultConfig() {
    auto& slot = GetDefaultSlot();
    std::lock_guard<std::mutex> lk(slot.mtx);
    slot.created = true;
    return slot.cfg;
  }

  // ======================== Data members ========================

  FixedString<32> name_;
  const uint32_t worker_num_;
  const int32_t priority_;
#ifdef __linux__
  const uint32_t cpu_set_size_{0U};
  const cpu_set_t* cpu_set_{nullptr};
#endif

  std::mutex lifecycle_mtx_;
  std::mutex submit_mtx_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_{false};

  alignas(kCacheLineSize) std::atomic<uint64_t> submitted_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> rejected_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> stolen_{0U};
  alignas(kCacheLineSize) std::atomic<uint32_t> next_worker_{0U};

  std::vector<std::unique_ptr<WorkerContext>> workers_;
  std::vector<std::thread> worker_threads_;
};

}  // namespace evr

#endif  // EVR_TASK_POOL_HPP_
