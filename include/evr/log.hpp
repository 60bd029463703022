/**
 * @file log.hpp
 * @brief Leveled, printf-style logging to stderr.
 *
 * Output format:
 *   [2026-10-19 12:00:00.123] [WARN] [Adapt] message (adapt.hpp:42)
 *
 * The file:line suffix is dropped in NDEBUG builds. Messages below the
 * runtime level (SetLevel) return before formatting; messages below the
 * compile-time floor EVR_LOG_MIN_LEVEL are removed entirely.
 *
 * Usage:
 *   EVR_LOG_INFO("Pool", "started %u workers", n);
 *   EVR_LOG_ERROR("Async", "unobserved fault: %s", what);
 */

#ifndef EVR_LOG_HPP_
#define EVR_LOG_HPP_

#include "evr/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

/// 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL 5=OFF
#ifndef EVR_LOG_MIN_LEVEL
#ifdef NDEBUG
#define EVR_LOG_MIN_LEVEL 1
#else
#define EVR_LOG_MIN_LEVEL 0
#endif
#endif

namespace evr {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

struct LogState {
#ifdef NDEBUG
  std::atomic<Level> level{Level::kInfo};
#else
  std::atomic<Level> level{Level::kDebug};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;
};

inline LogState& State() noexcept {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
#if defined(EVR_PLATFORM_WINDOWS)
  localtime_s(&tm_buf, &secs);
#else
  localtime_r(&secs, &tm_buf);
#endif
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03d", static_cast<int>(ms));
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

/// Parses "debug", "info", "warn", "error", "fatal" or "off" (any case).
inline bool ParseLevel(const char* str, Level& out) noexcept {
  static constexpr struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  if (str == nullptr) return false;
  for (const auto& n : kNames) {
    size_t i = 0;
    while (str[i] != '\0' && n.name[i] != '\0') {
      const char c = (str[i] >= 'A' && str[i] <= 'Z') ? static_cast<char>(str[i] + 32) : str[i];
      if (c != n.name[i]) break;
      ++i;
    }
    if (str[i] == '\0' && n.name[i] == '\0') {
      out = n.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::State().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::State().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::State().initialized.load(std::memory_order_acquire);
}

/**
 * @brief Format and write one record. Use the EVR_LOG_* macros instead.
 */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line, const char* fmt,
                     ...) noexcept {
  if (level < GetLevel() || level == Level::kOff) {
    return;
  }

  char msg[512];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  std::lock_guard<std::mutex> lock(detail::State().write_mutex);
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts, detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts, detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

}  // namespace log
}  // namespace evr

// ============================================================================
// Macros
// ============================================================================

#define EVR_LOG_DEBUG(cat, fmt, ...)                                                                 \
  do {                                                                                               \
    if (EVR_LOG_MIN_LEVEL <= 0) {                                                                    \
      ::evr::log::LogWrite(::evr::log::Level::kDebug, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                                \
  } while (0)

#define EVR_LOG_INFO(cat, fmt, ...)                                                                 \
  do {                                                                                              \
    if (EVR_LOG_MIN_LEVEL <= 1) {                                                                   \
      ::evr::log::LogWrite(::evr::log::Level::kInfo, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                               \
  } while (0)

#define EVR_LOG_WARN(cat, fmt, ...)                                                                 \
  do {                                                                                              \
    if (EVR_LOG_MIN_LEVEL <= 2) {                                                                   \
      ::evr::log::LogWrite(::evr::log::Level::kWarn, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                               \
  } while (0)

#define EVR_LOG_ERROR(cat, fmt, ...)                                                                 \
  do {                                                                                               \
    if (EVR_LOG_MIN_LEVEL <= 3) {                                                                    \
      ::evr::log::LogWrite(::evr::log::Level::kError, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    }                                                                                                \
  } while (0)

#define EVR_LOG_FATAL(cat, fmt, ...)                                                               \
  do {                                                                                             \
    ::evr::log::LogWrite(::evr::log::Level::kFatal, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__); \
    std::abort();                                                                                  \
  } while (0)

#endif  // EVR_LOG_HPP_
