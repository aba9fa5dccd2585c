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
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clocks and assertion macros.
 */

#ifndef OFFLOAD_PLATFORM_HPP_
#define OFFLOAD_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace offload {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define OFFLOAD_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define OFFLOAD_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define OFFLOAD_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define OFFLOAD_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define OFFLOAD_PRINTF_FMT(fmt_idx, arg_idx)
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
  (void)std::fprintf(stderr, "OFFLOAD_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define OFFLOAD_ASSERT(cond) ((void)0)
#else
#define OFFLOAD_ASSERT(cond) \
  ((cond) ? ((void)0)        \
          : ::offload::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Monotonic Clock Helpers
// ============================================================================

/// @brief Monotonic time in nanoseconds (steady_clock).
inline uint64_t SteadyNowNs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
}

/// @brief Monotonic time in microseconds (steady_clock).
inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

/// @brief Monotonic time in milliseconds (steady_clock).
inline uint64_t SteadyNowMs() noexcept { return SteadyNowNs() / 1000000U; }

}  // namespace offload

#endif  // OFFLOAD_PLATFORM_HPP_
