/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by all evr modules.
 *
 * - expected<V, E>   : value-or-error result for library operations
 * - FixedString<N>   : fixed-capacity, stack-allocated string
 * - TypeName<T>()    : compile-time type name without RTTI
 * - error enums      : per-module error codes
 */

#ifndef EVR_VOCABULARY_HPP_
#define EVR_VOCABULARY_HPP_

#include "evr/platform.hpp"

#include <cstdint>
#include <cstring>

#include <utility>
#include <variant>

namespace evr {

// ============================================================================
// Error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories:
 * @code
 *   return expected<int, ConfigError>::success(42);
 *   return expected<int, ConfigError>::error(ConfigError::kParseError);
 * @endcode
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(V value) {
    return expected(std::in_place_index<0>, std::move(value));
  }

  static expected error(E err) {
    return expected(std::in_place_index<1>, std::move(err));
  }

  bool has_value() const noexcept { return storage_.index() == 0U; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    EVR_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    EVR_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    EVR_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  const E& get_error() const& {
    EVR_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

  V value_or(V fallback) const& {
    return has_value() ? std::get<0>(storage_) : std::move(fallback);
  }

 private:
  template <size_t I, typename Arg>
  expected(std::in_place_index_t<I> tag, Arg&& arg) : storage_(tag, std::forward<Arg>(arg)) {}

  std::variant<V, E> storage_;
};

/// void specialization: success carries no value.
template <typename E>
class expected<void, E> {
 public:
  static expected success() noexcept { return expected(); }

  static expected error(E err) noexcept {
    expected r;
    r.has_value_ = false;
    r.error_ = err;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    EVR_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept = default;

  bool has_value_{true};
  E error_{};
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Fixed-capacity null-terminated string with no heap allocation.
 *
 * Construction from a literal is checked at compile time; runtime strings
 * use the TruncateToCapacity tag.
 */
template <uint32_t Capacity>
class FixedString {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <size_t N>
  FixedString(const char (&str)[N]) noexcept {  // NOLINT(google-explicit-constructor)
    static_assert(N - 1U <= static_cast<size_t>(Capacity), "literal exceeds FixedString capacity");
    std::memcpy(buf_, str, N);
    size_ = static_cast<uint32_t>(N - 1U);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(TruncateToCapacity, str); }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str, (str != nullptr) ? static_cast<uint32_t>(std::strlen(str)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    size_ = (len < Capacity) ? len : Capacity;
    std::memcpy(buf_, str, size_);
    buf_[size_] = '\0';
  }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_{0U};
};

// ============================================================================
// TypeName<T>()
// ============================================================================

static constexpr uint32_t kTypeNameCapacity = 96U;

namespace detail {

/// Extracts "T" from the compiler's signature string "... [with T = X]" or
/// "... TypeNameProbe<X>(void)".
inline FixedString<kTypeNameCapacity> ParseTypeName(const char* sig) noexcept {
  const char* begin = std::strstr(sig, "T = ");
  const char* end = nullptr;
  if (begin != nullptr) {
    begin += 4;
    end = begin;
    uint32_t depth = 0U;
    while (*end != '\0') {
      if (*end == '<' || *end == '[') {
        ++depth;
      } else if (*end == '>' || *end == ']') {
        if (depth == 0U) break;
        --depth;
      } else if (*end == ';' && depth == 0U) {
        break;
      }
      ++end;
    }
  } else {
    begin = std::strstr(sig, "TypeNameProbe<");
    if (begin == nullptr) {
      return FixedString<kTypeNameCapacity>(TruncateToCapacity, sig);
    }
    begin += 14;
    end = std::strrchr(begin, '>');
    if (end == nullptr) end = begin + std::strlen(begin);
  }
  return FixedString<kTypeNameCapacity>(TruncateToCapacity, begin,
                                        static_cast<uint32_t>(end - begin));
}

template <typename T>
inline const char* TypeNameProbe() noexcept {
  return EVR_PRETTY_FUNCTION;
}

}  // namespace detail

/**
 * @brief Human-readable name of T, e.g. "evr::PropertyChangedEventArgs".
 *
 * Derived from the compiler's pretty function signature so it works with
 * -fno-rtti. Long names are truncated to kTypeNameCapacity.
 */
template <typename T>
inline FixedString<kTypeNameCapacity> TypeName() noexcept {
  return detail::ParseTypeName(detail::TypeNameProbe<T>());
}

}  // namespace evr

#endif  // EVR_VOCABULARY_HPP_
