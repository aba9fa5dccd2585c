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
 * @file stream_pipeline.hpp
 * @brief Single-worker streaming pipeline with supersede queue and bounded
 *        cooperative cancellation.
 *
 * At most one stream is active. A submission whose content hash matches a
 * still-queued item replaces it, so only the newest request with a given
 * signature ever starts. Any runtime error drops the pipeline back to
 * kUninitialized; the worker is recreated lazily on the next request.
 *
 *   kUninitialized -> kInitializing -> kReady
 *         ^                                |
 *         +---------- runtime error -------+
 *
 * Callbacks (on_chunk, on_complete, on_error) run without the pipeline lock,
 * on the worker's delivery thread or the timer thread.
 */

#ifndef OFFLOAD_STREAM_PIPELINE_HPP_
#define OFFLOAD_STREAM_PIPELINE_HPP_

#include "offload/log.hpp"
#include "offload/message.hpp"
#include "offload/outcome.hpp"
#include "offload/timer.hpp"
#include "offload/vocabulary.hpp"
#include "offload/worker.hpp"

#include <atomic>
#include <cstdint>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// Configuration / Stats
// ============================================================================

struct StreamPipelineConfig {
  uint32_t init_timeout_ms{5000U};
  uint32_t cancel_timeout_ms{1000U};
};

enum class PipelineState : uint8_t {
  kUninitialized = 0,
  kInitializing,
  kReady,
  kTerminated,
};

inline const char* PipelineStateName(PipelineState state) noexcept {
  switch (state) {
    case PipelineState::kUninitialized:
      return "uninitialized";
    case PipelineState::kInitializing:
      return "initializing";
    case PipelineState::kReady:
      return "ready";
    case PipelineState::kTerminated:
      return "terminated";
  }
  return "unknown";
}

struct StreamPipelineStats {
  PipelineState state{PipelineState::kUninitialized};
  uint32_t queue_length{0U};
  bool active{false};
  uint64_t started{0U};
  uint64_t completed{0U};
  uint64_t errors{0U};
  uint64_t cancels{0U};
  uint64_t cancel_timeouts{0U};
  uint64_t superseded{0U};
  uint64_t reinitializations{0U};
};

// ============================================================================
// StreamProtocol / StreamCallbacks / StreamHandle
// ============================================================================

struct StreamTags {
  std::string start;      ///< engine -> worker
  std::string chunk;      ///< worker -> engine, zero or more
  std::string complete;   ///< worker -> engine
  std::string cancel;     ///< engine -> worker
  std::string cancelled;  ///< worker -> engine, cancel acknowledgment
};

template <typename Request, typename Chunk, typename Done, typename Payload>
class StreamProtocol {
 public:
  virtual ~StreamProtocol() = default;

  virtual StreamTags Tags() const = 0;

  virtual Payload BuildInit() const { return Payload{}; }
  virtual Payload BuildStart(const Request& request) const = 0;
  virtual Payload BuildCancel(const std::string& /*id*/) const {
    return Payload{};
  }

  /// @return nullopt to drop a malformed chunk.
  virtual std::optional<Chunk> ParseChunk(const Payload& payload) const = 0;

  /// @return nullopt reports a kProtocol error to the stream.
  virtual std::optional<Done> ParseComplete(const Payload& payload) const = 0;

  virtual std::string ParseError(const Message<Payload>& msg) const {
    return msg.error;
  }

  virtual bool IsCancelledAck(const Message<Payload>& msg) const {
    return msg.type == Tags().cancelled;
  }

  virtual uint64_t Hash(const Request& request) const = 0;
};

template <typename Chunk, typename Done>
struct StreamCallbacks {
  std::function<void(const Chunk&)> on_chunk;
  std::function<void(const Done&)> on_complete;
  std::function<void(const Failure&)> on_error;
};

/// @brief Returned by StartStreaming(); does not keep the pipeline alive.
class StreamHandle final {
 public:
  using CancelFn = std::function<Outcome<Unit>(const std::string&)>;

  StreamHandle() = default;
  StreamHandle(std::string id, CancelFn cancel)
      : id_(std::move(id)), cancel_(std::move(cancel)) {}

  const std::string& Id() const noexcept { return id_; }

  /**
   * @brief Cancel this stream if it is the active one.
   *
   * Resolves once the worker acknowledges or cancel_timeout_ms elapses,
   * whichever comes first; resolves at once if the stream is not active.
   */
  Outcome<Unit> Cancel() const {
    if (!cancel_) {
      return Outcome<Unit>::Resolved(Unit{});
    }
    return cancel_(id_);
  }

 private:
  std::string id_;
  CancelFn cancel_;
};

// ============================================================================
// StreamPipeline
// ============================================================================

template <typename Request, typename Chunk, typename Done, typename Payload>
class StreamPipeline final
    : public std::enable_shared_from_this<
          StreamPipeline<Request, Chunk, Done, Payload>> {
 public:
  using Protocol = StreamProtocol<Request, Chunk, Done, Payload>;
  using ProtocolPtr = std::shared_ptr<const Protocol>;
  using Callbacks = StreamCallbacks<Chunk, Done>;
  using Worker = WorkerHandle<Payload>;
  using WorkerPtr = std::shared_ptr<Worker>;
  using MessageType = Message<Payload>;

  static std::shared_ptr<StreamPipeline> Create(const StreamPipelineConfig& config,
                                                const HandshakeConfig& handshake,
                                                ProtocolPtr protocol,
                                                WorkerFactory<Payload> factory) {
    OFFLOAD_ASSERT(protocol != nullptr);
    OFFLOAD_ASSERT(factory != nullptr);
    return std::shared_ptr<StreamPipeline>(new StreamPipeline(
        config, handshake, std::move(protocol), std::move(factory)));
  }

  ~StreamPipeline() { Shutdown(); }

  StreamPipeline(const StreamPipeline&) = delete;
  StreamPipeline& operator=(const StreamPipeline&) = delete;

  // --------------------------------------------------------------------------
  // Streaming
  // --------------------------------------------------------------------------

  /**
   * @brief Queue a stream; starts at once when nothing is active.
   *
   * A still-queued item with the same content hash is dropped without any
   * callback. After Shutdown() on_error(kShutdown) fires immediately.
   */
  StreamHandle StartStreaming(const Request& request, Callbacks callbacks) {
    const uint64_t hash = protocol_->Hash(request);
    Outbox out;
    std::string id;
    bool rejected = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      id = "stream-" + std::to_string(next_seq_++);
      if (terminated_) {
        rejected = true;
      } else {
        for (auto it = queue_.begin(); it != queue_.end();) {
          if (it->hash == hash) {
            OFFLOAD_LOG_DEBUG("Stream", "%s superseded by %s", it->id.c_str(),
                              id.c_str());
            ++stats_.superseded;
            it = queue_.erase(it);
          } else {
            ++it;
          }
        }
        StreamItem item;
        item.id = id;
        item.request = request;
        item.callbacks = callbacks;
        item.hash = hash;
        queue_.push_back(std::move(item));
        ProcessNextLocked(out);
      }
    }
    out.Flush(*timers_);
    if (rejected && callbacks.on_error) {
      callbacks.on_error(Failure{EngineError::kShutdown, "pipeline shut down"});
    }

    std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
    return StreamHandle(id, [weak](const std::string& stream_id) {
      if (auto self = weak.lock()) {
        return self->Cancel(stream_id);
      }
      return Outcome<Unit>::Resolved(Unit{});
    });
  }

  /**
   * @brief Cancel the active stream if its id matches; otherwise a no-op.
   *
   * A stream whose start message has not been sent yet is dropped locally.
   * Otherwise the cancel message is sent and the returned outcome resolves
   * on acknowledgment or after cancel_timeout_ms, when local state is
   * force-cleaned and the queue advances. Never rejects.
   *
   * Chunk deliveries still pending when the stream is marked cancelled are
   * dropped; an on_chunk call already under way on another thread may still
   * complete.
   */
  Outcome<Unit> Cancel(const std::string& id) {
    Outbox out;
    Outcome<Unit> result;
    bool immediate = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_ || !active_.has_value() || active_->id != id) {
        // Not active: nothing to do.
      } else if (cancel_outcome_.has_value()) {
        result = *cancel_outcome_;
        immediate = false;
      } else {
        StreamItem& item = *active_;
        item.cancelled = true;
        item.halted->store(true, std::memory_order_release);
        ++stats_.cancels;
        if (!item.started) {
          OFFLOAD_LOG_DEBUG("Stream", "%s cancelled before start", id.c_str());
          active_.reset();
          ProcessNextLocked(out);
        } else {
          immediate = false;
          cancel_outcome_ = result;
          std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
          auto timer = timers_->AddOneShot(config_.cancel_timeout_ms, [weak, id]() {
            if (auto self = weak.lock()) {
              self->OnCancelTimeout(id);
            }
          });
          cancel_timer_ = timer.has_value() ? timer.value() : TimerTaskId(0U);
          out.posts.emplace_back(worker_, MessageType(tags_.cancel, id,
                                                      protocol_->BuildCancel(id)));
        }
      }
    }
    out.Flush(*timers_);
    if (immediate) {
      (void)result.Resolve(Unit{});
    }
    return result;
  }

  // --------------------------------------------------------------------------
  // Lifecycle / Introspection
  // --------------------------------------------------------------------------

  /**
   * @brief Fail every pending stream with kShutdown and terminate the worker.
   *
   * Idempotent; called by the destructor.
   */
  void Shutdown() {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_) {
        return;
      }
      terminated_ = true;
      const Failure failure{EngineError::kShutdown, "pipeline shut down"};
      if (active_.has_value()) {
        if (active_->started) {
          out.detaches.emplace_back(worker_, active_->token);
        }
        if (!active_->cancelled) {
          ErrorAction(active_->callbacks, failure, out);
        }
        active_.reset();
      }
      ResolveCancelLocked(out);
      for (auto& item : queue_) {
        ErrorAction(item.callbacks, failure, out);
      }
      queue_.clear();
      ResetWorkerLocked(out);
      state_ = PipelineState::kTerminated;
    }
    OFFLOAD_LOG_INFO("Stream", "shut down");
    out.Flush(*timers_);
    timers_->Stop();
  }

  PipelineState GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  StreamPipelineStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StreamPipelineStats stats = stats_;
    stats.state = state_;
    stats.queue_length = static_cast<uint32_t>(queue_.size());
    stats.active = active_.has_value();
    return stats;
  }

 private:
  using Outbox = detail::Outbox<Payload>;

  struct StreamItem {
    std::string id;
    Request request{};
    Callbacks callbacks;
    uint64_t hash{0U};
    bool cancelled{false};
    bool started{false};
    ListenerToken token{0U};
    /// Mirrors `cancelled` for chunk deliveries already queued in an Outbox.
    std::shared_ptr<std::atomic<bool>> halted{
        std::make_shared<std::atomic<bool>>(false)};
  };

  StreamPipeline(const StreamPipelineConfig& config,
                 const HandshakeConfig& handshake, ProtocolPtr protocol,
                 WorkerFactory<Payload> factory)
      : config_(config),
        handshake_(handshake),
        protocol_(std::move(protocol)),
        tags_(protocol_->Tags()),
        factory_(std::move(factory)),
        timers_(std::make_shared<TimerScheduler>()) {
    (void)timers_->Start();
  }

  // --------------------------------------------------------------------------
  // Queue Processing
  // --------------------------------------------------------------------------

  /// Promote the queue front when idle. The item stays "active" while the
  /// worker is being made ready, so no second item can start meanwhile.
  void ProcessNextLocked(Outbox& out) {
    if (terminated_ || active_.has_value() || queue_.empty()) {
      return;
    }
    active_.emplace(std::move(queue_.front()));
    queue_.pop_front();
    switch (state_) {
      case PipelineState::kReady:
        SendStartLocked(out);
        break;
      case PipelineState::kUninitialized:
        BeginInitLocked(out);
        break;
      default:
        break;
    }
  }

  void SendStartLocked(Outbox& out) {
    StreamItem& item = *active_;
    item.started = true;
    ++stats_.started;

    std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
    const uint32_t generation = generation_;
    const std::string id = item.id;
    ListenerSet<Payload> set;
    set.on_message = [weak, generation, id](const MessageType& msg) {
      if (msg.id != id) {
        return;
      }
      if (auto self = weak.lock()) {
        self->OnStreamMessage(generation, id, msg);
      }
    };
    set.on_error = [weak, generation](const std::string& detail) {
      if (auto self = weak.lock()) {
        self->OnWorkerFailure(generation, detail);
      }
    };
    item.token = AttachListeners(worker_, std::move(set));
    out.posts.emplace_back(worker_,
                           MessageType(tags_.start, id,
                                       protocol_->BuildStart(item.request)));
  }

  /// Detach the active item, settle a pending cancel and move on.
  void FinishActiveLocked(Outbox& out, bool reset_worker) {
    if (active_.has_value() && active_->started) {
      out.detaches.emplace_back(worker_, active_->token);
    }
    active_.reset();
    ResolveCancelLocked(out);
    if (reset_worker) {
      ResetWorkerLocked(out);
    }
    ProcessNextLocked(out);
  }

  void ResolveCancelLocked(Outbox& out) {
    if (!cancel_outcome_.has_value()) {
      return;
    }
    Outcome<Unit> pending = *cancel_outcome_;
    cancel_outcome_.reset();
    out.timers.push_back(cancel_timer_);
    out.actions.push_back([pending]() { (void)pending.Resolve(Unit{}); });
  }

  void ErrorAction(const Callbacks& callbacks, const Failure& failure,
                   Outbox& out) {
    if (!callbacks.on_error) {
      return;
    }
    auto on_error = callbacks.on_error;
    out.actions.push_back([on_error, failure]() { on_error(failure); });
  }

  // --------------------------------------------------------------------------
  // Worker Lifecycle
  // --------------------------------------------------------------------------

  void BeginInitLocked(Outbox& out) {
    state_ = PipelineState::kInitializing;
    const uint32_t generation = ++generation_;
    std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
    out.actions.push_back([weak, generation]() {
      if (auto self = weak.lock()) {
        self->Initialize(generation);
      }
    });
  }

  void Initialize(uint32_t generation) {
    WorkerPtr worker = factory_(0U);
    bool stale = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_ || generation != generation_) {
        stale = true;
      } else {
        worker_ = worker;
        if (worker_ != nullptr) {
          std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
          ListenerSet<Payload> watch;
          watch.on_error = [weak, generation](const std::string& detail) {
            if (auto self = weak.lock()) {
              self->OnWorkerFailure(generation, detail);
            }
          };
          watch_token_ = AttachListeners(worker_, std::move(watch));
        }
      }
    }
    if (stale) {
      if (worker != nullptr) {
        worker->Terminate();
      }
      return;
    }

    std::weak_ptr<StreamPipeline> weak = this->weak_from_this();
    RunHandshake(worker, handshake_, "init-stream", protocol_->BuildInit(),
                 timers_, config_.init_timeout_ms)
        .OnSettled([weak, generation](const Outcome<Unit>::ResultType& r) {
          if (auto self = weak.lock()) {
            self->OnInitSettled(generation, r);
          }
        });
  }

  void OnInitSettled(uint32_t generation, const Outcome<Unit>::ResultType& r) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_ || generation != generation_) {
        return;
      }
      if (r.has_value()) {
        state_ = PipelineState::kReady;
        if (initialized_once_) {
          ++stats_.reinitializations;
        }
        initialized_once_ = true;
        OFFLOAD_LOG_DEBUG("Stream", "worker ready");
        if (active_.has_value()) {
          SendStartLocked(out);
        } else {
          ProcessNextLocked(out);
        }
      } else {
        OFFLOAD_LOG_ERROR("Stream", "worker initialization failed (%s): %s",
                          EngineErrorName(r.get_error().code),
                          r.get_error().detail.c_str());
        const Failure failure{EngineError::kInitFailed,
                              std::string(EngineErrorName(r.get_error().code)) +
                                  ": " + r.get_error().detail};
        if (active_.has_value()) {
          ++stats_.errors;
          ErrorAction(active_->callbacks, failure, out);
          active_.reset();
        }
        for (auto& item : queue_) {
          ++stats_.errors;
          ErrorAction(item.callbacks, failure, out);
        }
        queue_.clear();
        ResetWorkerLocked(out);
      }
    }
    out.Flush(*timers_);
  }

  /// Discard the worker; the next request re-initializes from scratch.
  void ResetWorkerLocked(Outbox& out) {
    state_ = PipelineState::kUninitialized;
    ++generation_;
    if (worker_ != nullptr) {
      out.detaches.emplace_back(worker_, watch_token_);
      out.terminations.push_back(std::move(worker_));
      worker_.reset();
    }
  }

  // --------------------------------------------------------------------------
  // Worker Events
  // --------------------------------------------------------------------------

  void OnStreamMessage(uint32_t generation, const std::string& id,
                       const MessageType& msg) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_ || generation != generation_ || !active_.has_value() ||
          active_->id != id) {
        return;
      }
      StreamItem& item = *active_;
      ProtocolPtr protocol = protocol_;

      if (msg.type == tags_.chunk) {
        if (item.cancelled || !item.callbacks.on_chunk) {
          return;
        }
        auto on_chunk = item.callbacks.on_chunk;
        auto halted = item.halted;
        const Payload payload = msg.payload;
        out.actions.push_back([protocol, on_chunk, halted, payload, id]() {
          auto chunk = protocol->ParseChunk(payload);
          if (!chunk.has_value()) {
            OFFLOAD_LOG_DEBUG("Stream", "%s: dropped malformed chunk", id.c_str());
            return;
          }
          if (halted->load(std::memory_order_acquire)) {
            return;
          }
          on_chunk(*chunk);
        });
      } else if (msg.type == tags_.complete) {
        if (!item.cancelled) {
          ++stats_.completed;
          auto callbacks = item.callbacks;
          const Payload payload = msg.payload;
          out.actions.push_back([protocol, callbacks, payload]() {
            auto done = protocol->ParseComplete(payload);
            if (done.has_value()) {
              if (callbacks.on_complete) {
                callbacks.on_complete(*done);
              }
            } else if (callbacks.on_error) {
              callbacks.on_error(
                  Failure{EngineError::kProtocol, "malformed completion"});
            }
          });
        }
        FinishActiveLocked(out, false);
      } else if (msg.type == handshake_.error) {
        OFFLOAD_LOG_WARN("Stream", "%s failed: %s", id.c_str(), msg.error.c_str());
        if (!item.cancelled) {
          ++stats_.errors;
          auto on_error = item.callbacks.on_error;
          if (on_error) {
            out.actions.push_back([protocol, on_error, msg]() {
              on_error(Failure{EngineError::kWorkerError, protocol->ParseError(msg)});
            });
          }
        }
        FinishActiveLocked(out, true);
      } else if (item.cancelled && protocol_->IsCancelledAck(msg)) {
        OFFLOAD_LOG_DEBUG("Stream", "%s cancel acknowledged", id.c_str());
        FinishActiveLocked(out, false);
      }
    }
    out.Flush(*timers_);
  }

  void OnWorkerFailure(uint32_t generation, const std::string& detail) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      // While initializing, the handshake reports the failure itself.
      if (terminated_ || generation != generation_ ||
          state_ != PipelineState::kReady) {
        return;
      }
      OFFLOAD_LOG_WARN("Stream", "worker transport error: %s", detail.c_str());
      if (active_.has_value()) {
        if (!active_->cancelled) {
          ++stats_.errors;
          ErrorAction(active_->callbacks,
                      Failure{EngineError::kWorkerError, "transport error: " + detail},
                      out);
        }
        FinishActiveLocked(out, true);
      } else {
        ResetWorkerLocked(out);
      }
    }
    out.Flush(*timers_);
  }

  void OnCancelTimeout(const std::string& id) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_ || !cancel_outcome_.has_value() || !active_.has_value() ||
          active_->id != id) {
        return;
      }
      ++stats_.cancel_timeouts;
      OFFLOAD_LOG_WARN("Stream",
                       "%s: no cancel acknowledgment after %u ms, forcing cleanup",
                       id.c_str(), config_.cancel_timeout_ms);
      FinishActiveLocked(out, false);
    }
    out.Flush(*timers_);
  }

  // --------------------------------------------------------------------------
  // Data
  // --------------------------------------------------------------------------

  const StreamPipelineConfig config_;
  const HandshakeConfig handshake_;
  const ProtocolPtr protocol_;
  const StreamTags tags_;
  WorkerFactory<Payload> factory_;
  std::shared_ptr<TimerScheduler> timers_;

  mutable std::mutex mutex_;
  std::deque<StreamItem> queue_;
  std::optional<StreamItem> active_;
  std::optional<Outcome<Unit>> cancel_outcome_;
  TimerTaskId cancel_timer_{0U};
  WorkerPtr worker_;
  ListenerToken watch_token_{0U};
  PipelineState state_{PipelineState::kUninitialized};
  StreamPipelineStats stats_;
  uint32_t generation_{0U};
  uint64_t next_seq_{1U};
  bool initialized_once_{false};
  bool terminated_{false};
};

}  // namespace offload

#endif  // OFFLOAD_STREAM_PIPELINE_HPP_
