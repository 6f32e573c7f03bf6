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
 * @file log.hpp
 * @brief Lightweight synchronous logging with printf-style macros.
 *
 * Output format (stderr):
 *   [2026-01-01 12:00:00.123] [WARN] [Serial] port busy (serial_connection.hpp:210)
 *
 * The (file:line) suffix is dropped in NDEBUG builds. Messages below the
 * compile-time floor MG_LOG_MIN_LEVEL are compiled out; the runtime level
 * filters the rest.
 */

#ifndef MG_LOG_HPP_
#define MG_LOG_HPP_

#include "mg/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <sys/time.h>

/// 0=DEBUG 1=INFO 2=WARN 3=ERROR 4=FATAL 5=OFF
#ifndef MG_LOG_MIN_LEVEL
#ifdef NDEBUG
#define MG_LOG_MIN_LEVEL 1
#else
#define MG_LOG_MIN_LEVEL 0
#endif
#endif

namespace mg {
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

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& WriteMutex() noexcept {
  static std::mutex mtx;
  return mtx;
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
      return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  ::localtime_r(&tv.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03ld",
                      static_cast<long>(tv.tv_usec / 1000));  // NOLINT
}

}  // namespace detail

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// Marks the logger as ready. Logging works without Init(); Init/Shutdown
/// only bracket an application's logging lifetime.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::WriteMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  std::lock_guard<std::mutex> lock(detail::WriteMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif
}

MG_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace mg

// ============================================================================
// Macros
// ============================================================================

#define MG_LOG_DEBUG(cat, fmt, ...)                                          \
  do {                                                                       \
    if (MG_LOG_MIN_LEVEL <= 0) {                                             \
      ::mg::log::LogWrite(::mg::log::Level::kDebug, cat, __FILE__, __LINE__, \
                          fmt, ##__VA_ARGS__);                               \
    }                                                                        \
  } while (0)

#define MG_LOG_INFO(cat, fmt, ...)                                          \
  do {                                                                      \
    if (MG_LOG_MIN_LEVEL <= 1) {                                            \
      ::mg::log::LogWrite(::mg::log::Level::kInfo, cat, __FILE__, __LINE__, \
                          fmt, ##__VA_ARGS__);                              \
    }                                                                       \
  } while (0)

#define MG_LOG_WARN(cat, fmt, ...)                                          \
  do {                                                                      \
    if (MG_LOG_MIN_LEVEL <= 2) {                                            \
      ::mg::log::LogWrite(::mg::log::Level::kWarn, cat, __FILE__, __LINE__, \
                          fmt, ##__VA_ARGS__);                              \
    }                                                                       \
  } while (0)

#define MG_LOG_ERROR(cat, fmt, ...)                                          \
  do {                                                                       \
    if (MG_LOG_MIN_LEVEL <= 3) {                                             \
      ::mg::log::LogWrite(::mg::log::Level::kError, cat, __FILE__, __LINE__, \
                          fmt, ##__VA_ARGS__);                               \
    }                                                                        \
  } while (0)

#define MG_LOG_FATAL(cat, fmt, ...)                                          \
  do {                                                                       \
    ::mg::log::LogWrite(::mg::log::Level::kFatal, cat, __FILE__, __LINE__,   \
                        fmt, ##__VA_ARGS__);                                 \
    std::abort();                                                            \
  } while (0)

#endif  // MG_LOG_HPP_
