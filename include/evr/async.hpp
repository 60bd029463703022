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
 * @file evr/async.hpp
 * @brief Background invocation: the Async decorator and RaiseAsync.
 *
 * Async(h, cont) returns a handler that queues h on a TaskPool and returns to
 * the raiser at once. When the unit finishes, cont runs on the worker with a
 * Completion describing the outcome. The default continuation,
 * ObserveAndDiscard, marks any fault observed. A faulted Completion that is
 * still unobserved after its continuation returns is handed to the
 * unobserved fault sink (fault.hpp).
 *
 * RaiseAsync(h, sender, args) queues a plain Raise and returns a
 * std::future<void>; faults surface through future::get().
 *
 * The event args are copied (as T) into the queued unit, so the raiser's
 * object may be destroyed right after the call. If the pool is not running,
 * the unit runs inline on the raiser's thread.
 */

#ifndef EVR_ASYNC_HPP_
#define EVR_ASYNC_HPP_

#include "evr/fault.hpp"
#include "evr/handler.hpp"
#include "evr/log.hpp"
#include "evr/task_pool.hpp"

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace evr {

/// Runs on the worker after an Async unit finished.
using Continuation = std::function<void(Completion&)>;

/**
 * @brief Default continuation: marks the fault observed and discards it.
 *
 * The fault is logged at DEBUG unless disabled by SetLogObservedFaults().
 */
inline void ObserveAndDiscard(Completion& completion) {
  const std::exception_ptr fault = completion.Observe();
  if (fault && GetLogObservedFaults()) {
    EVR_LOG_DEBUG("Async", "background fault observed: %s", DescribeFault(fault).c_str());
  }
}

namespace detail {

inline void Schedule(TaskPool* pool, const TaskPool::Task& unit) {
  TaskPool& target = (pool != nullptr) ? *pool : TaskPool::Default();
  if (!target.Submit(unit)) {
    EVR_LOG_WARN("Async", "pool '%s' not running, invoking inline", target.Name());
    unit();
  }
}

inline void Finish(const Continuation& continuation, Completion& completion) noexcept {
  if (continuation) {
    try {
      continuation(completion);
    } catch (...) {
      ReportUnobservedFault(std::current_exception());
    }
  }
  if (completion.IsFaulted() && !completion.IsObserved()) {
    ReportUnobservedFault(completion.Fault());
  }
}

template <typename T>
Handler<T> MakeAsync(const Handler<T>& handler, Continuation continuation, TaskPool* pool) {
  static_assert(std::is_copy_constructible<T>::value, "Async requires copyable event args");
  return Handler<T>(Callback<T>([handler, continuation, pool](Sender sender, const T& args) {
    auto copy = std::make_shared<const T>(args);
    Schedule(pool, [handler, continuation, sender, copy] {
      Completion completion;
      try {
        handler(sender, *copy);
      } catch (...) {
        completion = Completion(std::current_exception());
      }
      Finish(continuation, completion);
    });
  }));
}

template <typename T>
std::future<void> StartRaise(const Handler<T>& handler, Sender sender, const T& args, TaskPool* pool) {
  static_assert(std::is_copy_constructible<T>::value, "RaiseAsync requires copyable event args");
  auto promise = std::make_shared<std::promise<void>>();
  std::future<void> result = promise->get_future();
  auto copy = std::make_shared<const T>(args);
  Schedule(pool, [handler, sender, copy, promise] {
    try {
      handler(sender, *copy);
      promise->set_value();
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  return result;
}

}  // namespace detail

// ============================================================================
// Async
// ============================================================================

/**
 * @brief Returns a handler that runs @p handler on the default pool.
 *
 * The result is never None: raising Async(None) queues a no-op unit and still
 * runs @p continuation with a successful Completion. An empty continuation
 * leaves every fault unobserved.
 */
template <typename T>
Handler<T> Async(const Handler<T>& handler, Continuation continuation = ObserveAndDiscard) {
  return detail::MakeAsync(handler, std::move(continuation), nullptr);
}

/// Same as Async(handler, continuation), on @p pool, which must outlive the result.
template <typename T>
Handler<T> Async(const Handler<T>& handler, Continuation continuation, TaskPool& pool) {
  return detail::MakeAsync(handler, std::move(continuation), &pool);
}

// ============================================================================
// RaiseAsync
// ============================================================================

/**
 * @brief Raises @p handler on the default pool.
 *
 * @return Future that becomes ready when every callback ran; get() rethrows
 *         the first fault. Ready with success for None.
 */
template <typename T>
std::future<void> RaiseAsync(const Handler<T>& handler, Sender sender, const typename Handler<T>::ArgsType& args) {
  return detail::StartRaise(handler, sender, args, nullptr);
}

template <typename T>
std::future<void> RaiseAsync(const Handler<T>& handler, Sender sender, const typename Handler<T>::ArgsType& args,
                             TaskPool& pool) {
  return detail::StartRaise(handler, sender, args, &pool);
}

}  // namespace evr

#endif  // EVR_ASYNC_HPP_
