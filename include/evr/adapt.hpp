/**
 * @file evr/adapt.hpp
 * @brief Conversion of arbitrary callables and handlers into Handler<T>.
 *
 * Adapt<T>() accepts anything shaped like void(Sender, const T&): a plain
 * callable, a receiver plus member function, a Callback<U> or a multicast
 * Handler<U>. Multicast input is converted entry by entry and re-combined in
 * the original order. Incompatible input yields SignatureMismatch and no
 * partial handler. None (nullptr, a null function pointer, an empty
 * std::function or a None handler) adapts to None.
 *
 * Usage:
 *   auto r = evr::Adapt<evr::PropertyChangedEventArgs>(base_handler);
 *   if (!r) {
 *     // r.get_error().target_type == "evr::Handler<evr::PropertyChangedEventArgs>"
 *   }
 */

#ifndef EVR_ADAPT_HPP_
#define EVR_ADAPT_HPP_

#include "evr/handler.hpp"
#include "evr/log.hpp"
#include "evr/vocabulary.hpp"

#include <functional>
#include <type_traits>
#include <utility>

namespace evr {

/// Adaptation failed: the input cannot be invoked as the target handler.
struct SignatureMismatch {
  FixedString<kTypeNameCapacity> target_type;
};

template <typename T>
using AdaptResult = expected<Handler<T>, SignatureMismatch>;

namespace detail {

template <typename F>
struct IsStdFunction : std::false_type {};
template <typename Sig>
struct IsStdFunction<std::function<Sig>> : std::true_type {};

template <typename F>
bool IsNullCallable(const F& fn) noexcept {
  if constexpr (std::is_pointer<F>::value || std::is_member_pointer<F>::value) {
    return fn == nullptr;
  } else if constexpr (IsStdFunction<F>::value) {
    return !fn;
  } else {
    (void)fn;
    return false;
  }
}

template <typename T>
AdaptResult<T> Mismatch() {
  SignatureMismatch err{TypeName<Handler<T>>()};
  EVR_LOG_WARN("Adapt", "signature incompatible with %s", err.target_type.c_str());
  return AdaptResult<T>::error(err);
}

}  // namespace detail

// ============================================================================
// Adapt
// ============================================================================

/**
 * @brief Converts a multicast handler of argument type U into Handler<T>.
 *
 * Succeeds when T is U or derives from U. Same-type input is returned
 * unchanged.
 */
template <typename T, typename U>
AdaptResult<T> Adapt(const Handler<U>& handler) {
  if constexpr (std::is_same<T, U>::value) {
    return AdaptResult<T>::success(handler);
  } else if constexpr (std::is_base_of<U, T>::value) {
    if (!handler) {
      return AdaptResult<T>::success(Handler<T>());
    }
    typename Handler<T>::InvocationList converted;
    converted.reserve(handler.Size());
    for (const auto& cb : handler.GetInvocationList()) {
      converted.emplace_back(cb);
    }
    return AdaptResult<T>::success(Handler<T>(std::move(converted)));
  } else {
    if (!handler) {
      return AdaptResult<T>::success(Handler<T>());
    }
    return detail::Mismatch<T>();
  }
}

template <typename T, typename U>
AdaptResult<T> Adapt(const Callback<U>& cb) {
  return Adapt<T>(Handler<U>(cb));
}

template <typename T>
AdaptResult<T> Adapt(std::nullptr_t) {
  return AdaptResult<T>::success(Handler<T>());
}

/**
 * @brief Converts a plain callable into a single-entry Handler<T>.
 *
 * The callable must be invocable as f(Sender, const T&); its return value, if
 * any, is discarded. Ordinary implicit conversions apply to both arguments,
 * so a first parameter of type bool also accepts the Sender.
 */
template <typename T, typename F,
          typename = std::enable_if_t<!detail::IsHandler<std::decay_t<F>>::value &&
                                      !detail::IsCallback<std::decay_t<F>>::value &&
                                      !std::is_null_pointer<std::decay_t<F>>::value>>
AdaptResult<T> Adapt(F&& fn) {
  using Fn = std::decay_t<F>;
  // A null pointer or empty std::function is None whatever its signature.
  if (detail::IsNullCallable(fn)) {
    return AdaptResult<T>::success(Handler<T>());
  }
  if constexpr (std::is_invocable_v<Fn&, Sender, const T&>) {
    return AdaptResult<T>::success(Handler<T>(Callback<T>(std::forward<F>(fn))));
  } else {
    return detail::Mismatch<T>();
  }
}

/**
 * @brief Binds @p method to @p receiver as a single-entry Handler<T>.
 */
template <typename T, typename R, typename M, typename = std::enable_if_t<std::is_member_function_pointer<M>::value>>
AdaptResult<T> Adapt(R* receiver, M method) {
  if constexpr (std::is_invocable_v<M, R*, Sender, const T&>) {
    if (receiver == nullptr || method == nullptr) {
      return AdaptResult<T>::success(Handler<T>());
    }
    return AdaptResult<T>::success(Handler<T>(Callback<T>(
        static_cast<const void*>(receiver),
        [receiver, method](Sender sender, const T& args) { std::invoke(method, receiver, sender, args); })));
  } else {
    return detail::Mismatch<T>();
  }
}

// ============================================================================
// AdaptContravariant / ToGeneric
// ============================================================================

/**
 * @brief Re-types a handler of base argument type S for derived type T.
 *
 * Never fails: the subtype relation is checked at compile time.
 */
template <typename S, typename T>
Handler<T> AdaptContravariant(const Handler<S>& handler) {
  static_assert(std::is_base_of<S, T>::value, "AdaptContravariant requires T to derive from S");
  return Adapt<T>(handler).value();
}

/// Adapts a plain void(Sender, const EventArgs&) callable to Handler<EventArgs>.
template <typename F>
Handler<EventArgs> ToGeneric(F&& fn) {
  static_assert(std::is_invocable_v<std::decay_t<F>&, Sender, const EventArgs&>,
                "ToGeneric requires a void(Sender, const EventArgs&) callable");
  return Adapt<EventArgs>(std::forward<F>(fn)).value();
}

}  // namespace evr

#endif  // EVR_ADAPT_HPP_
