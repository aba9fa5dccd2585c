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
 * @file message.hpp
 * @brief Message envelope, handshake descriptor and engine error codes.
 *
 * Engine and workers exchange Message<Payload> values only; correlation is
 * by the string id carried in every envelope. The handshake descriptor names
 * the type tags a worker integration uses for readiness, initialization,
 * errors and (optionally) health probes.
 */

#ifndef OFFLOAD_MESSAGE_HPP_
#define OFFLOAD_MESSAGE_HPP_

#include "offload/platform.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <utility>

namespace offload {

// ============================================================================
// EngineError / Failure
// ============================================================================

enum class EngineError : uint8_t {
  kTimeout = 0,       ///< A deadline expired before the worker answered.
  kWorkerError,       ///< Worker reported an error or raised a transport error.
  kInitFailed,        ///< Handshake did not complete.
  kShutdown,          ///< Component shut down before the operation settled.
  kNoWorker,          ///< Factory produced no worker.
  kRecoveryDeferred,  ///< Too many failures inside the debounce window.
  kInvalidSlot,       ///< Slot index out of range.
  kProtocol,          ///< Unexpected message for the current state.
};

inline const char* EngineErrorName(EngineError err) noexcept {
  switch (err) {
    case EngineError::kTimeout:
      return "timeout";
    case EngineError::kWorkerError:
      return "worker_error";
    case EngineError::kInitFailed:
      return "init_failed";
    case EngineError::kShutdown:
      return "shutdown";
    case EngineError::kNoWorker:
      return "no_worker";
    case EngineError::kRecoveryDeferred:
      return "recovery_deferred";
    case EngineError::kInvalidSlot:
      return "invalid_slot";
    case EngineError::kProtocol:
      return "protocol";
  }
  return "unknown";
}

/// @brief Error code plus human-readable context.
struct Failure {
  EngineError code{EngineError::kWorkerError};
  std::string detail;
};

// ============================================================================
// Message<Payload>
// ============================================================================

/**
 * @brief Envelope exchanged between engine and worker.
 *
 * @tparam Payload Opaque consumer payload, usually a std::variant<...>.
 */
template <typename Payload>
struct Message {
  std::string type;    ///< Type tag (see HandshakeConfig and protocols).
  std::string id;      ///< Correlation id (job, probe, stream, init).
  Payload payload{};   ///< Request, result, chunk or done value.
  std::string error;   ///< Error description (error tag only).
  bool healthy{true};  ///< Health-response flag.

  Message() = default;
  Message(std::string t, std::string i) : type(std::move(t)), id(std::move(i)) {}
  Message(std::string t, std::string i, Payload p)
      : type(std::move(t)), id(std::move(i)), payload(std::move(p)) {}
};

// ============================================================================
// HandshakeConfig
// ============================================================================

/**
 * @brief Message-type tags of the worker handshake and health protocol.
 *
 * Lifecycle:
 *   1. worker -> engine   ready_signal
 *   2. engine -> worker   init_request
 *   3. worker -> engine   init_response
 *
 * Leaving both health tags empty disables health probing; such workers are
 * treated as healthy until a runtime error occurs.
 */
struct HandshakeConfig {
  std::string ready_signal;
  std::string init_request;
  std::string init_response;
  std::string error;
  std::string health_check;     ///< Optional.
  std::string health_response;  ///< Optional.

  bool HasHealthProtocol() const noexcept {
    return !health_check.empty() && !health_response.empty();
  }

  /// The streaming pipeline becomes ready on ready_signal when false.
  bool HasInitRoundTrip() const noexcept { return !init_request.empty(); }
};

// ============================================================================
// Content Hash Helpers (FNV-1a, 64-bit)
// ============================================================================

static constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
static constexpr uint64_t kFnvPrime = 1099511628211ULL;

/// @brief Fold bytes into a running FNV-1a hash.
inline uint64_t HashBytes(const void* data, size_t len,
                          uint64_t seed = kFnvOffsetBasis) noexcept {
  const auto* p = static_cast<const uint8_t*>(data);
  uint64_t h = seed;
  for (size_t i = 0U; i < len; ++i) {
    h ^= static_cast<uint64_t>(p[i]);
    h *= kFnvPrime;
  }
  return h;
}

inline uint64_t HashString(const std::string& s,
                           uint64_t seed = kFnvOffsetBasis) noexcept {
  return HashBytes(s.data(), s.size(), seed);
}

}  // namespace offload

#endif  // OFFLOAD_MESSAGE_HPP_
