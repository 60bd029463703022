/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef EVR_PLATFORM_HPP_
#define EVR_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace evr {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define EVR_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define EVR_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define EVR_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define EVR_LIKELY(x) __builtin_expect(!!(x), 1)
#define EVR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define EVR_PRETTY_FUNCTION __PRETTY_FUNCTION__
#else
#define EVR_LIKELY(x) (x)
#define EVR_UNLIKELY(x) (x)
#define EVR_PRETTY_FUNCTION __FUNCSIG__
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "EVR_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define EVR_ASSERT(cond) ((void)0)
#else
#define EVR_ASSERT(cond) \
  ((cond) ? ((void)0) : ::evr::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace evr

#endif  // EVR_PLATFORM_HPP_
