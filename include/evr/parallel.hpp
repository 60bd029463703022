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
 * @file evr/parallel.hpp
 * @brief Parallel decorator: fan-out/fan-in invocation on a TaskPool.
 *
 * Parallel(h) returns a single-callback handler. Raising it runs every
 * callback of h as its own unit on the pool with the same (sender, args) and
 * returns once all units have finished. There is no ordering between units.
 *
 * Faults are not isolated: when any unit throws, an AggregateFault holding
 * every exception is thrown after the whole batch completed. Apply Resilient
 * first to suppress per-callback faults:
 *
 *   auto h = evr::Parallel(evr::Resilient(handlers));
 */

#ifndef EVR_PARALLEL_HPP_
#define EVR_PARALLEL_HPP_

#include "evr/fault.hpp"
#include "evr/handler.hpp"
#include "evr/task_pool.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace evr {

namespace detail {

/// pool == nullptr resolves to TaskPool::Default() at raise time.
template <typename T>
Handler<T> MakeParallel(const Handler<T>& handler, TaskPool* pool) {
  if (!handler) {
    return Handler<T>();
  }
  return Handler<T>(Callback<T>([handler, pool](Sender sender, const T& args) {
    const auto& callbacks = handler.GetInvocationList();
    std::vector<TaskPool::Task> units;
    units.reserve(callbacks.size());
    for (const auto& cb : callbacks) {
      // FanOut() returns only after every unit ran, so references stay valid.
      units.emplace_back([&cb, sender, &args] { cb(sender, args); });
    }
    TaskPool& target = (pool != nullptr) ? *pool : TaskPool::Default();
    std::vector<std::exception_ptr> faults = target.FanOut(std::move(units));
    if (!faults.empty()) {
      throw AggregateFault(std::move(faults));
    }
  }));
}

}  // namespace detail

/**
 * @brief Runs the callbacks of @p handler concurrently on the default pool.
 *
 * None yields None.
 */
template <typename T>
Handler<T> Parallel(const Handler<T>& handler) {
  return detail::MakeParallel(handler, nullptr);
}

/// Same as Parallel(handler), on @p pool, which must outlive the result.
template <typename T>
Handler<T> Parallel(const Handler<T>& handler, TaskPool& pool) {
  return detail::MakeParallel(handler, &pool);
}

}  // namespace evr

#endif  // EVR_PARALLEL_HPP_
