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
 * @file worker.hpp
 * @brief Abstract worker handle, listener registry and shared handshake.
 *
 * A worker is an independently scheduled execution unit that talks to the
 * engine through Message<Payload> values only. The engine never touches a
 * worker's memory; it posts messages and reacts to deliveries.
 *
 * Delivery contract for implementations:
 *   - Deliver()/DeliverError() may be called from any thread.
 *   - Listeners are snapshotted under the registry lock and invoked outside
 *     it, so a listener may add or remove listeners (including itself).
 *   - Start() is separate from construction: attach listeners first, then
 *     Start(), and the ready-signal cannot be missed.
 */

#ifndef OFFLOAD_WORKER_HPP_
#define OFFLOAD_WORKER_HPP_

#include "offload/log.hpp"
#include "offload/message.hpp"
#include "offload/outcome.hpp"
#include "offload/timer.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// ListenerSet / ListenerToken
// ============================================================================

/// @brief Message and error handlers registered on a worker as one unit.
template <typename Payload>
struct ListenerSet {
  std::function<void(const Message<Payload>&)> on_message;
  std::function<void(const std::string&)> on_error;  ///< Transport error.
};

struct ListenerTokenTag {};
using ListenerToken = NewType<uint32_t, ListenerTokenTag>;

// ============================================================================
// WorkerHandle
// ============================================================================

template <typename Payload>
class WorkerHandle {
 public:
  using MessageType = Message<Payload>;

  virtual ~WorkerHandle() = default;

  /// @brief Begin execution; the worker announces readiness afterwards.
  virtual void Start() = 0;

  /// @brief Engine -> worker. Dropped silently once terminated.
  virtual void Post(MessageType msg) = 0;

  /// @brief Stop the worker. Idempotent.
  virtual void Terminate() = 0;

  virtual bool IsTerminated() const noexcept = 0;

  ListenerToken AddListeners(ListenerSet<Payload> set) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const uint32_t token = next_token_++;
    listeners_.emplace_back(token, std::move(set));
    return ListenerToken(token);
  }

  /// @brief Unregister. Unknown or already-removed tokens are ignored.
  void RemoveListeners(ListenerToken token) noexcept {
    ListenerSet<Payload> doomed;
    {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->first == token.value()) {
          doomed = std::move(it->second);
          listeners_.erase(it);
          break;
        }
      }
    }
  }

  uint32_t ListenerCount() const noexcept {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return static_cast<uint32_t>(listeners_.size());
  }

 protected:
  WorkerHandle() = default;

  /// @brief Worker -> engine message delivery.
  void Deliver(const MessageType& msg) {
    for (const auto& set : Snapshot()) {
      if (set.on_message) {
        set.on_message(msg);
      }
    }
  }

  /// @brief Transport-level error event (crash, broken channel).
  void DeliverError(const std::string& detail) {
    for (const auto& set : Snapshot()) {
      if (set.on_error) {
        set.on_error(detail);
      }
    }
  }

 private:
  std::vector<ListenerSet<Payload>> Snapshot() const {
    std::vector<ListenerSet<Payload>> copy;
    std::lock_guard<std::mutex> lock(listener_mutex_);
    copy.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      copy.push_back(entry.second);
    }
    return copy;
  }

  mutable std::mutex listener_mutex_;
  std::vector<std::pair<uint32_t, ListenerSet<Payload>>> listeners_;
  uint32_t next_token_{1U};
};

/**
 * @brief Creates the worker for a slot (slot is always 0 for the pipeline).
 *
 * Production and test wiring differ only in the factory passed in. A null
 * return is treated as an initialization failure.
 */
template <typename Payload>
using WorkerFactory =
    std::function<std::shared_ptr<WorkerHandle<Payload>>(uint32_t slot)>;

// ============================================================================
// Attach / Detach
// ============================================================================

template <typename Payload>
ListenerToken AttachListeners(const std::shared_ptr<WorkerHandle<Payload>>& worker,
                              ListenerSet<Payload> set) {
  OFFLOAD_ASSERT(worker != nullptr);
  return worker->AddListeners(std::move(set));
}

/// @brief Always safe: null worker, unknown token and double detach are no-ops.
template <typename Payload>
void DetachListeners(const std::shared_ptr<WorkerHandle<Payload>>& worker,
                     ListenerToken token) noexcept {
  if (worker != nullptr) {
    worker->RemoveListeners(token);
  }
}

// ============================================================================
// RunHandshake
// ============================================================================

/**
 * @brief Attach handshake listeners, start the worker and await readiness.
 *
 * Sequence: ready_signal -> init_request(init_id, init_payload) ->
 * init_response. Without an init round-trip the ready_signal alone
 * completes the handshake. An error-tag message or a transport error
 * rejects with kInitFailed; the deadline rejects with kTimeout. The
 * handshake listeners are detached on every path.
 */
template <typename Payload>
Outcome<Unit> RunHandshake(const std::shared_ptr<WorkerHandle<Payload>>& worker,
                           const HandshakeConfig& handshake,
                           const std::string& init_id, Payload init_payload,
                           const std::shared_ptr<TimerScheduler>& timers,
                           uint32_t timeout_ms) {
  if (worker == nullptr) {
    return Outcome<Unit>::Rejected(EngineError::kNoWorker,
                                   "worker factory returned no worker");
  }

  Outcome<Unit> raw;
  std::weak_ptr<WorkerHandle<Payload>> weak_worker = worker;

  ListenerSet<Payload> set;
  set.on_message = [raw, weak_worker, handshake, init_id,
                    init_payload](const Message<Payload>& msg) {
    if (msg.type == handshake.ready_signal) {
      if (!handshake.HasInitRoundTrip()) {
        (void)raw.Resolve(Unit{});
        return;
      }
      if (auto w = weak_worker.lock()) {
        w->Post(Message<Payload>(handshake.init_request, init_id, init_payload));
      }
    } else if (handshake.HasInitRoundTrip() &&
               msg.type == handshake.init_response) {
      (void)raw.Resolve(Unit{});
    } else if (msg.type == handshake.error) {
      (void)raw.Reject(EngineError::kInitFailed, msg.error);
    }
  };
  set.on_error = [raw](const std::string& detail) {
    (void)raw.Reject(EngineError::kInitFailed, "transport error: " + detail);
  };

  const ListenerToken token = AttachListeners(worker, std::move(set));
  Outcome<Unit> guarded =
      WithTimeout(raw, timers, timeout_ms, "Worker initialization");
  guarded.OnSettled([weak_worker, token](const Outcome<Unit>::ResultType&) {
    DetachListeners(weak_worker.lock(), token);
  });

  worker->Start();
  return guarded;
}

// ============================================================================
// Outbox (collect-release-execute)
// ============================================================================

namespace detail {

/**
 * @brief Side effects collected under a component lock, executed after it.
 *
 * Execution order: timers removed, listeners detached, workers terminated,
 * messages posted, then deferred actions (settling outcomes, consumer
 * callbacks, follow-up operations).
 */
template <typename Payload>
struct Outbox {
  using WorkerPtr = std::shared_ptr<WorkerHandle<Payload>>;

  std::vector<TimerTaskId> timers;
  std::vector<std::pair<WorkerPtr, ListenerToken>> detaches;
  std::vector<WorkerPtr> terminations;
  std::vector<std::pair<WorkerPtr, Message<Payload>>> posts;
  std::vector<std::function<void()>> actions;

  void Flush(TimerScheduler& scheduler) {
    for (const auto& id : timers) {
      // kNotFound: the deadline already fired and lost the race.
      (void)scheduler.Remove(id);
    }
    for (auto& d : detaches) {
      DetachListeners(d.first, d.second);
    }
    for (auto& w : terminations) {
      if (w != nullptr) {
        w->Terminate();
      }
    }
    for (auto& p : posts) {
      p.first->Post(std::move(p.second));
    }
    for (auto& fn : actions) {
      fn();
    }
    timers.clear();
    detaches.clear();
    terminations.clear();
    posts.clear();
    actions.clear();
  }
};

}  // namespace detail

}  // namespace offload

#endif  // OFFLOAD_WORKER_HPP_
