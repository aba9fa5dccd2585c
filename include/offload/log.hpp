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
 *   [2024-01-01 12:00:00.123][INFO][Pool] message (file.hpp:42)
 *
 * Two filtering layers:
 *   - Compile time: OFFLOAD_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=off) strips
 *     macro calls below the floor.
 *   - Run time: SetLevel() drops entries below the current threshold.
 *
 * ERROR and FATAL flush stderr; FATAL aborts after writing.
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef OFFLOAD_LOG_HPP_
#define OFFLOAD_LOG_HPP_

#include "offload/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <atomic>
#include <chrono>
#include <mutex>

#ifndef OFFLOAD_LOG_MIN_LEVEL
#ifdef NDEBUG
#define OFFLOAD_LOG_MIN_LEVEL 1
#else
#define OFFLOAD_LOG_MIN_LEVEL 0
#endif
#endif

namespace offload {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

struct LogContext {
#ifdef NDEBUG
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  std::atomic<bool> initialized{false};
  std::mutex write_mutex;  ///< Keeps concurrent lines from interleaving.
};

inline LogContext& Context() noexcept {
  static LogContext ctx;
  return ctx;
}

inline const char* LevelName(Level level) noexcept {
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
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatWallclock(char* buf, size_t size) noexcept {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  struct tm tm_buf {};
#if defined(OFFLOAD_PLATFORM_WINDOWS)
  localtime_s(&tm_buf, &secs);
#else
  localtime_r(&secs, &tm_buf);
#endif
  const size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, size - n, ".%03d", static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::Context().level.store(static_cast<uint8_t>(level),
                                std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::Context().level.load(std::memory_order_relaxed));
}

/// @brief Mark the logger initialized. Logging works without it.
inline void Init() noexcept {
  detail::Context().initialized.store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::Context().initialized.store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::Context().initialized.load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char stamp[32];
  detail::FormatWallclock(stamp, sizeof(stamp));

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  {
    std::lock_guard<std::mutex> lock(detail::Context().write_mutex);
    (void)std::fprintf(stderr, "[%s][%s][%s] %s (%s:%d)\n", stamp,
                       detail::LevelName(level),
                       (category != nullptr) ? category : "-", message,
                       detail::Basename(file), line);
    if (level >= Level::kError) {
      (void)std::fflush(stderr);
    }
  }

  if (level == Level::kFatal) {
    std::abort();
  }
}

OFFLOAD_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace offload

// ============================================================================
// Macros
// ============================================================================

#define OFFLOAD_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 0) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kDebug, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 1) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kInfo, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 2) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kWarn, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 3) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kError, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                     \
    ::offload::log::LogWrite(::offload::log::Level::kFatal, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);                \
  } while (0)

#endif  // OFFLOAD_LOG_HPP_
