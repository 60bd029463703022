/**
 * @file evr/resilient.hpp
 * @brief Resilient decorator: per-callback fault isolation.
 *
 * Resilient(h) returns a handler of the same length where each callback runs
 * inside its own try block. A callback that throws no longer stops the ones
 * after it; its exception goes to the ExceptionHandler together with the
 * original callback.
 *
 * Usage:
 *   auto safe = evr::Resilient(handler, [](const evr::Callback<Args>& cb, std::exception_ptr e) {
 *     EVR_LOG_WARN("App", "callback %p failed: %s", cb.Id(), evr::DescribeFault(e).c_str());
 *   });
 *   evr::Raise(safe, this, args);  // never throws from a callback
 */

#ifndef EVR_RESILIENT_HPP_
#define EVR_RESILIENT_HPP_

#include "evr/fault.hpp"
#include "evr/handler.hpp"
#include "evr/log.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace evr {

/// Receives (original callback, exception) for each isolated fault.
template <typename T>
using ExceptionHandler = std::function<void(const Callback<T>&, std::exception_ptr)>;

/**
 * @brief Wraps every callback of @p handler so its exceptions are routed to
 *        @p on_fault instead of propagating.
 *
 * An empty @p on_fault discards the faults (logged at DEBUG). Exceptions
 * thrown by @p on_fault itself propagate to the raiser. None yields None.
 */
template <typename T>
Handler<T> Resilient(const Handler<T>& handler,
                     typename detail::NonDeduced<ExceptionHandler<T>>::type on_fault = {}) {
  if (!handler) {
    return Handler<T>();
  }
  auto sink = std::make_shared<const ExceptionHandler<T>>(std::move(on_fault));

  typename Handler<T>::InvocationList wrapped;
  wrapped.reserve(handler.Size());
  for (const auto& cb : handler.GetInvocationList()) {
    wrapped.emplace_back(cb.Receiver(), [cb, sink](Sender sender, const T& args) {
      std::exception_ptr fault;
      try {
        cb(sender, args);
      } catch (...) {
        fault = std::current_exception();
      }
      if (!fault) {
        return;
      }
      if (*sink) {
        (*sink)(cb, fault);
      } else {
        EVR_LOG_DEBUG("Resilient", "suppressed fault: %s", DescribeFault(fault).c_str());
      }
    });
  }
  return Handler<T>(std::move(wrapped));
}

}  // namespace evr

#endif  // EVR_RESILIENT_HPP_
