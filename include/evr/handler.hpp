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
 * @file evr/handler.hpp
 * @brief Callback<T> and Handler<T>: immutable multicast event handlers.
 *
 * Model:
 *   Callback<T>  one notification function  void(Sender, const T&)
 *   Handler<T>   ordered invocation list of Callback<T>, or None
 *
 * None (a default-constructed or nullptr Handler) is a distinct state, not an
 * empty list. It is the identity of Combine and a no-op under Raise.
 *
 * Every operation returns a new Handler; invocation lists are shared through
 * shared_ptr<const ...> and never modified after construction, so one Handler
 * may be raised from any number of threads at once.
 *
 * Usage:
 *   struct Counter {
 *     void OnEvent(evr::Sender, const evr::EventArgs&) { ++hits; }
 *     int hits = 0;
 *   };
 *
 *   Counter c;
 *   evr::Handler<evr::EventArgs> h = evr::Callback<evr::EventArgs>(&c, &Counter::OnEvent);
 *   h = h + h;                                   // two entries
 *   evr::Raise(h, this, evr::EventArgs::Empty());  // c.hits == 2
 */

#ifndef EVR_HANDLER_HPP_
#define EVR_HANDLER_HPP_

#include "evr/platform.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace evr {

// ============================================================================
// Sender / EventArgs
// ============================================================================

/// Identifies the object raising an event. Never dereferenced by evr.
using Sender = const void*;

/**
 * @brief Root of the event data hierarchy.
 *
 * Handlers are parameterized by the most specific EventArgs subtype they
 * accept; a handler of a base type may be adapted to any derived type.
 */
struct EventArgs {
  EventArgs() = default;
  EventArgs(const EventArgs&) = default;
  EventArgs& operator=(const EventArgs&) = default;
  virtual ~EventArgs() = default;

  /// Shared instance for events that carry no data.
  static const EventArgs& Empty() noexcept {
    static const EventArgs empty;
    return empty;
  }
};

/// Raised after a named property of the sender changed.
struct PropertyChangedEventArgs : EventArgs {
  explicit PropertyChangedEventArgs(std::string name) : property_name(std::move(name)) {}

  std::string property_name;
};

template <typename T>
class Callback;
template <typename T>
class Handler;

namespace detail {

/// Blocks template argument deduction through a parameter.
template <typename X>
struct NonDeduced {
  using type = X;
};

template <typename X>
struct IsCallback : std::false_type {};
template <typename T>
struct IsCallback<Callback<T>> : std::true_type {};

template <typename X>
struct IsHandler : std::false_type {};
template <typename T>
struct IsHandler<Handler<T>> : std::true_type {};

/// True for plain callables that are neither Callback nor Handler.
template <typename F, typename T>
static constexpr bool kIsPlainCallable = !IsCallback<std::decay_t<F>>::value &&
                                         !IsHandler<std::decay_t<F>>::value &&
                                         std::is_invocable_v<std::decay_t<F>&, Sender, const T&>;

/// Maps the element of a handler range to the Handler it contributes.
template <typename X>
struct HandlerOf {};
template <typename T>
struct HandlerOf<Handler<T>> {
  using type = Handler<T>;
};
template <typename T>
struct HandlerOf<Callback<T>> {
  using type = Handler<T>;
};

}  // namespace detail

// ============================================================================
// Callback<T>
// ============================================================================

/**
 * @brief One elementary notification function void(Sender, const T&).
 *
 * Identity is the target created at construction: copies compare equal,
 * separately constructed callbacks do not, and a callback converted to a
 * derived argument type keeps the identity of its source.
 */
template <typename T>
class Callback {
 public:
  using ArgsType = T;
  using Function = std::function<void(Sender, const T&)>;

  Callback() noexcept = default;

  template <typename F, typename = std::enable_if_t<detail::kIsPlainCallable<F, T>>>
  explicit Callback(F&& fn)
      : target_(std::make_shared<const Target>(Target{Function(std::forward<F>(fn)), nullptr})),
        id_(target_.get()) {}

  /// Callable bound to an explicit receiver, reported by Receiver().
  template <typename F, typename = std::enable_if_t<detail::kIsPlainCallable<F, T>>>
  Callback(const void* receiver, F&& fn)
      : target_(std::make_shared<const Target>(Target{Function(std::forward<F>(fn)), receiver})),
        id_(target_.get()) {}

  /// Binds a member function to its receiver.
  template <typename R, typename A, typename = std::enable_if_t<std::is_base_of<A, T>::value>>
  Callback(R* receiver, void (R::*method)(Sender, const A&))
      : target_(std::make_shared<const Target>(Target{
            [receiver, method](Sender sender, const T& args) { (receiver->*method)(sender, args); },
            receiver})),
        id_(target_.get()) {
    EVR_ASSERT(receiver != nullptr && method != nullptr);
  }

  template <typename R, typename A, typename = std::enable_if_t<std::is_base_of<A, T>::value>>
  Callback(const R* receiver, void (R::*method)(Sender, const A&) const)
      : target_(std::make_shared<const Target>(Target{
            [receiver, method](Sender sender, const T& args) { (receiver->*method)(sender, args); },
            receiver})),
        id_(target_.get()) {
    EVR_ASSERT(receiver != nullptr && method != nullptr);
  }

  /// Contravariant conversion: a callback of base type S accepts every T.
  template <typename S, typename = std::enable_if_t<std::is_base_of<S, T>::value && !std::is_same<S, T>::value>>
  explicit Callback(const Callback<S>& source)
      : target_(source ? std::make_shared<const Target>(
                             Target{[source](Sender sender, const T& args) { source(sender, args); },
                                    source.Receiver()})
                       : nullptr),
        id_(source.Id()) {}

  void operator()(Sender sender, const T& args) const {
    EVR_ASSERT(target_ != nullptr);
    target_->fn(sender, args);
  }

  explicit operator bool() const noexcept { return target_ != nullptr; }

  /// Identity of the original target (shared by copies and conversions).
  const void* Id() const noexcept { return id_; }

  /// Receiver object for member-function callbacks, nullptr otherwise.
  const void* Receiver() const noexcept { return (target_ != nullptr) ? target_->receiver : nullptr; }

  template <typename U>
  bool SameTarget(const Callback<U>& other) const noexcept {
    return id_ == other.Id();
  }

  friend bool operator==(const Callback& lhs, const Callback& rhs) noexcept { return lhs.id_ == rhs.id_; }
  friend bool operator!=(const Callback& lhs, const Callback& rhs) noexcept { return lhs.id_ != rhs.id_; }

 private:
  struct Target {
    Function fn;
    const void* receiver;
  };

  std::shared_ptr<const Target> target_;
  const void* id_{nullptr};
};

// ============================================================================
// Handler<T>
// ============================================================================

/**
 * @brief Immutable ordered invocation list of Callback<T>, or None.
 */
template <typename T>
class Handler {
  static_assert(std::is_base_of<EventArgs, T>::value, "Handler argument type must derive from evr::EventArgs");

 public:
  using ArgsType = T;
  using CallbackType = Callback<T>;
  using InvocationList = std::vector<Callback<T>>;

  /// None.
  Handler() noexcept = default;
  Handler(std::nullptr_t) noexcept {}  // NOLINT(google-explicit-constructor)

  /// Single-entry handler; an empty callback yields None.
  Handler(Callback<T> cb)  // NOLINT(google-explicit-constructor)
      : list_(cb ? std::make_shared<const InvocationList>(1U, std::move(cb)) : nullptr) {}

  template <typename F, typename = std::enable_if_t<detail::kIsPlainCallable<F, T>>>
  explicit Handler(F&& fn) : Handler(Callback<T>(std::forward<F>(fn))) {}

  /// Takes ownership of a list. Empty callbacks are dropped; a list with
  /// nothing left yields None.
  explicit Handler(InvocationList list) {
    list.erase(std::remove_if(list.begin(), list.end(), [](const Callback<T>& cb) { return !cb; }), list.end());
    if (!list.empty()) {
      list_ = std::make_shared<const InvocationList>(std::move(list));
    }
  }

  bool IsNone() const noexcept { return list_ == nullptr; }
  explicit operator bool() const noexcept { return list_ != nullptr; }

  /// Number of elementary callbacks; 0 for None.
  size_t Size() const noexcept { return (list_ != nullptr) ? list_->size() : 0U; }

  /// Elementary callbacks in invocation order; empty for None.
  const InvocationList& GetInvocationList() const noexcept {
    static const InvocationList kEmpty;
    return (list_ != nullptr) ? *list_ : kEmpty;
  }

  /// Invokes every callback in order. The first exception stops the
  /// remaining callbacks and propagates.
  void operator()(Sender sender, const T& args) const {
    if (list_ == nullptr) {
      return;
    }
    for (const auto& cb : *list_) {
      cb(sender, args);
    }
  }

  friend bool operator==(const Handler& lhs, const Handler& rhs) noexcept {
    if (lhs.list_ == rhs.list_) return true;
    if (lhs.list_ == nullptr || rhs.list_ == nullptr) return false;
    return *lhs.list_ == *rhs.list_;
  }
  friend bool operator!=(const Handler& lhs, const Handler& rhs) noexcept { return !(lhs == rhs); }
  friend bool operator==(const Handler& lhs, std::nullptr_t) noexcept { return lhs.list_ == nullptr; }
  friend bool operator!=(const Handler& lhs, std::nullptr_t) noexcept { return lhs.list_ != nullptr; }

 private:
  std::shared_ptr<const InvocationList> list_;
};

// ============================================================================
// Combine
// ============================================================================

/// Concatenation of two handlers; None is the identity element.
template <typename T>
Handler<T> operator+(const Handler<T>& lhs, const Handler<T>& rhs) {
  if (!lhs) return rhs;
  if (!rhs) return lhs;
  typename Handler<T>::InvocationList merged;
  merged.reserve(lhs.Size() + rhs.Size());
  const auto& a = lhs.GetInvocationList();
  const auto& b = rhs.GetInvocationList();
  merged.insert(merged.end(), a.begin(), a.end());
  merged.insert(merged.end(), b.begin(), b.end());
  return Handler<T>(std::move(merged));
}

/**
 * @brief Combines a sequence of handlers (or callbacks) into one handler.
 *
 * The result holds every callback of every non-None operand in traversal
 * order. All-None (or empty) input yields None.
 */
template <typename Range,
          typename H = typename detail::HandlerOf<
              std::decay_t<decltype(*std::begin(std::declval<const Range&>()))>>::type>
H Combine(const Range& handlers) {
  typename H::InvocationList merged;
  for (const auto& item : handlers) {
    const H h(item);
    const auto& list = h.GetInvocationList();
    merged.insert(merged.end(), list.begin(), list.end());
  }
  return H(std::move(merged));
}

template <typename T>
Handler<T> Combine(std::initializer_list<Handler<T>> handlers) {
  return Combine<std::initializer_list<Handler<T>>, Handler<T>>(handlers);
}

// ============================================================================
// Raise
// ============================================================================

/**
 * @brief Invokes every callback of @p handler in order on the calling thread.
 *
 * No-op for None. The first callback to throw stops the remaining ones and
 * the exception propagates to the caller.
 */
template <typename T>
void Raise(const Handler<T>& handler, Sender sender, const typename Handler<T>::ArgsType& args) {
  handler(sender, args);
}

}  // namespace evr

#endif  // EVR_HANDLER_HPP_
