/**
 * @file evr/fault.hpp
 * @brief Fault carriers for callbacks that throw.
 *
 * - AggregateFault : every exception collected by one Parallel fan-out
 * - Completion     : outcome of one background unit, with an observed marker
 * - FaultSink      : injection point for background faults nobody observed
 *
 * Exceptions thrown by callbacks are captured as std::exception_ptr and moved
 * between threads in that form; evr itself never throws except by rethrowing
 * a callback's fault or wrapping several in AggregateFault.
 */

#ifndef EVR_FAULT_HPP_
#define EVR_FAULT_HPP_

#include "evr/log.hpp"
#include "evr/vocabulary.hpp"

#include <cstdio>

#include <atomic>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

namespace evr {

static constexpr uint32_t kFaultTextCapacity = 160U;

/**
 * @brief Short description of a captured exception for logs.
 *
 * Returns what() for std::exception, a fixed text for anything else, and
 * "none" for a null pointer.
 */
inline FixedString<kFaultTextCapacity> DescribeFault(const std::exception_ptr& fault) noexcept {
  if (!fault) {
    return FixedString<kFaultTextCapacity>("none");
  }
  try {
    std::rethrow_exception(fault);
  } catch (const std::exception& e) {
    return FixedString<kFaultTextCapacity>(TruncateToCapacity, e.what());
  } catch (...) {
    return FixedString<kFaultTextCapacity>("non-standard exception");
  }
}

// ============================================================================
// AggregateFault
// ============================================================================

/**
 * @brief Thrown by a Parallel handler after all units finished, when at least
 *        one elementary callback threw.
 *
 * Faults() holds one entry per failed callback, in completion order.
 */
class AggregateFault : public std::exception {
 public:
  explicit AggregateFault(std::vector<std::exception_ptr> faults) : faults_(std::move(faults)) {
    char buf[64];
    (void)std::snprintf(buf, sizeof(buf), "%zu callback(s) failed", faults_.size());
    what_.assign(TruncateToCapacity, buf);
  }

  const char* what() const noexcept override { return what_.c_str(); }

  const std::vector<std::exception_ptr>& Faults() const noexcept { return faults_; }

  size_t Count() const noexcept { return faults_.size(); }

 private:
  std::vector<std::exception_ptr> faults_;
  FixedString<63> what_;
};

// ============================================================================
// FaultSink
// ============================================================================

/**
 * @brief Receives background faults that completed without being observed.
 *
 * When fn is nullptr the fault is logged with EVR_LOG_ERROR instead. fn runs
 * on a pool worker inside a noexcept path and must not throw; an exception
 * escaping it terminates the process.
 */
struct FaultSink {
  using Fn = void (*)(const std::exception_ptr& fault, void* ctx);
  Fn fn{nullptr};
  void* ctx{nullptr};
};

namespace detail {

struct FaultPolicy {
  std::mutex mtx;
  FaultSink unobserved_sink;
  std::atomic<bool> log_observed{true};
  std::atomic<uint64_t> unobserved_count{0U};
};

inline FaultPolicy& GetFaultPolicy() noexcept {
  static FaultPolicy policy;
  return policy;
}

}  // namespace detail

inline void SetUnobservedFaultSink(FaultSink sink) noexcept {
  auto& p = detail::GetFaultPolicy();
  std::lock_guard<std::mutex> lock(p.mtx);
  p.unobserved_sink = sink;
}

inline void ResetUnobservedFaultSink() noexcept { SetUnobservedFaultSink(FaultSink{}); }

/// Whether the default Async continuation logs observed faults at DEBUG.
inline void SetLogObservedFaults(bool enable) noexcept {
  detail::GetFaultPolicy().log_observed.store(enable, std::memory_order_relaxed);
}

inline bool GetLogObservedFaults() noexcept {
  return detail::GetFaultPolicy().log_observed.load(std::memory_order_relaxed);
}

/// Total faults routed to the unobserved sink since process start.
inline uint64_t UnobservedFaultCount() noexcept {
  return detail::GetFaultPolicy().unobserved_count.load(std::memory_order_relaxed);
}

/// Delivers a fault nobody observed to the installed sink (or the log).
inline void ReportUnobservedFault(const std::exception_ptr& fault) noexcept {
  auto& p = detail::GetFaultPolicy();
  p.unobserved_count.fetch_add(1U, std::memory_order_relaxed);
  FaultSink sink;
  {
    std::lock_guard<std::mutex> lock(p.mtx);
    sink = p.unobserved_sink;
  }
  if (sink.fn != nullptr) {
    sink.fn(fault, sink.ctx);
    return;
  }
  EVR_LOG_ERROR("Async", "unobserved background fault: %s", DescribeFault(fault).c_str());
}

// ============================================================================
// Completion
// ============================================================================

/**
 * @brief Outcome of one background unit of work, passed to its continuation.
 *
 * A faulted completion must be observed (Observe() or Rethrow()) by the
 * continuation; otherwise the fault is reported through the unobserved sink
 * once the continuation returns.
 */
class Completion {
 public:
  Completion() noexcept = default;
  explicit Completion(std::exception_ptr fault) noexcept : fault_(std::move(fault)) {}

  bool IsFaulted() const noexcept { return static_cast<bool>(fault_); }

  bool IsObserved() const noexcept { return observed_; }

  /// Peeks at the fault without marking it observed.
  const std::exception_ptr& Fault() const noexcept { return fault_; }

  /// Marks the fault observed and returns it (null when not faulted).
  std::exception_ptr Observe() noexcept {
    observed_ = true;
    return fault_;
  }

  /// Marks the fault observed and rethrows it; no-op when not faulted.
  void Rethrow() {
    observed_ = true;
    if (fault_) {
      std::rethrow_exception(fault_);
    }
  }

 private:
  std::exception_ptr fault_;
  bool observed_{false};
};

}  // namespace evr

#endif  // EVR_FAULT_HPP_
