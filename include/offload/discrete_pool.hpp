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
 * @file discrete_pool.hpp
 * @brief N-worker request/response pool with dedup, priority queue,
 *        backpressure, per-job deadlines and health-driven recovery.
 *
 * Every public call returns immediately. Submissions never fail: each
 * caller eventually receives the real result or the protocol's fallback
 * value (timeout, worker error, eviction, shutdown).
 *
 * Slot lifecycle:
 *
 *   kUninitialized -> kInitializing -> kReady <-> kUnhealthy -> kTerminated
 *                          ^                          |
 *                          +------ RecoverWorker -----+
 *
 * Threading: one pool mutex guards the queue, the registries and the slot
 * table. Worker deliveries and timer deadlines arrive on their own threads;
 * state changes happen under the mutex, while posting, settling and
 * terminating happen after it is released (detail::Outbox). Lock order is
 * pool -> worker listener registry -> timer scheduler.
 */

#ifndef OFFLOAD_DISCRETE_POOL_HPP_
#define OFFLOAD_DISCRETE_POOL_HPP_

#include "offload/log.hpp"
#include "offload/message.hpp"
#include "offload/outcome.hpp"
#include "offload/timer.hpp"
#include "offload/vocabulary.hpp"
#include "offload/worker.hpp"

#include <cstdint>

#include <deque>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// Configuration / Reports
// ============================================================================

struct DiscretePoolConfig {
  uint32_t pool_size{4U};
  uint32_t operation_timeout_ms{30000U};
  uint32_t init_timeout_ms{5000U};
  uint32_t health_check_timeout_ms{1000U};
  uint32_t health_interval_ms{30000U};
  uint32_t queue_max_size{1000U};
  uint32_t failure_window_ms{5000U};   ///< Recovery debounce window.
  uint32_t max_failures_in_window{3U};  ///< Recoveries allowed per window.
};

enum class SlotState : uint8_t {
  kUninitialized = 0,
  kInitializing,
  kReady,
  kUnhealthy,
  kTerminated,
};

inline const char* SlotStateName(SlotState state) noexcept {
  switch (state) {
    case SlotState::kUninitialized:
      return "uninitialized";
    case SlotState::kInitializing:
      return "initializing";
    case SlotState::kReady:
      return "ready";
    case SlotState::kUnhealthy:
      return "unhealthy";
    case SlotState::kTerminated:
      return "terminated";
  }
  return "unknown";
}

struct HealthReport {
  uint32_t slot{0U};
  bool healthy{false};
  uint32_t response_time_ms{0U};
};

struct DiscretePoolStats {
  uint32_t queue_length{0U};
  uint32_t active_jobs{0U};
  uint32_t worker_count{0U};
  uint32_t healthy_workers{0U};
  uint32_t pending_hashes{0U};
  bool accepting{false};
  bool terminated{false};
  uint64_t dispatched{0U};
  uint64_t completed{0U};   ///< Settled from a worker result message.
  uint64_t fallbacks{0U};   ///< Settled with the fallback value by the pool.
  uint64_t timeouts{0U};
  uint64_t evictions{0U};
  uint64_t recoveries{0U};  ///< Successful replacements.
  uint64_t dedup_hits{0U};
};

// ============================================================================
// JobProtocol
// ============================================================================

/// @brief Message-type tags of the job protocol.
struct JobTags {
  std::string job;           ///< engine -> worker
  std::string result;        ///< worker -> engine
  std::string batch;         ///< engine -> worker (empty: no batch support)
  std::string batch_result;  ///< worker -> engine (empty: same as result)
};

/**
 * @brief Consumer contract of a concrete worker integration.
 *
 * Methods are called without the pool lock held, except BuildJob() and
 * BuildBatch(), which must not call back into the pool.
 */
template <typename Request, typename Result, typename Payload>
class JobProtocol {
 public:
  virtual ~JobProtocol() = default;

  virtual JobTags Tags() const = 0;

  /// @brief Payload of the init-request sent during the handshake.
  virtual Payload BuildInit(uint32_t /*slot*/) const { return Payload{}; }

  virtual Payload BuildJob(const Request& request) const = 0;

  virtual bool SupportsBatch() const { return !Tags().batch.empty(); }

  virtual Payload BuildBatch(const std::vector<Request>& /*requests*/) const {
    return Payload{};
  }

  /// @return nullopt when the payload is malformed (fallback is used).
  virtual std::optional<Result> ParseResult(const Payload& payload,
                                            const Request& request) const = 0;

  virtual std::optional<std::vector<Result>> ParseBatchResult(
      const Payload& /*payload*/,
      const std::vector<Request>& /*requests*/) const {
    return std::nullopt;
  }

  /// @brief Cheap approximate result used whenever the real one is missing.
  virtual Result Fallback(const Request& request) const = 0;

  /// @brief Deterministic content hash (see HashBytes()).
  virtual uint64_t Hash(const Request& request) const = 0;
};

// ============================================================================
// DiscretePool
// ============================================================================

template <typename Request, typename Result, typename Payload>
class DiscretePool final
    : public std::enable_shared_from_this<DiscretePool<Request, Result, Payload>> {
 public:
  using Protocol = JobProtocol<Request, Result, Payload>;
  using ProtocolPtr = std::shared_ptr<const Protocol>;
  using Worker = WorkerHandle<Payload>;
  using WorkerPtr = std::shared_ptr<Worker>;
  using MessageType = Message<Payload>;
  using ResultOutcome = Outcome<Result>;
  using BatchOutcome = Outcome<std::vector<Result>>;
  using RecoveryHook = std::function<void(uint32_t slot)>;

  static std::shared_ptr<DiscretePool> Create(const DiscretePoolConfig& config,
                                              const HandshakeConfig& handshake,
                                              ProtocolPtr protocol,
                                              WorkerFactory<Payload> factory) {
    OFFLOAD_ASSERT(protocol != nullptr);
    OFFLOAD_ASSERT(factory != nullptr);
    return std::shared_ptr<DiscretePool>(
        new DiscretePool(config, handshake, std::move(protocol),
                         std::move(factory)));
  }

  ~DiscretePool() { Shutdown(); }

  DiscretePool(const DiscretePool&) = delete;
  DiscretePool& operator=(const DiscretePool&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Create every slot and handshake them concurrently.
   *
   * The returned outcome resolves once every initial handshake has settled;
   * it never rejects. Slots whose handshake fails stay unhealthy until a
   * recovery succeeds. Repeated calls return the first outcome.
   */
  Outcome<Unit> Start() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (started_ || terminated_) {
        return start_outcome_;
      }
      started_ = true;
    }

    std::vector<WorkerPtr> created;
    created.reserve(config_.pool_size);
    for (uint32_t i = 0U; i < config_.pool_size; ++i) {
      created.push_back(factory_(i));
    }

    std::vector<uint32_t> generations(config_.pool_size, 0U);
    // Slots a RecoverWorker() call already owns keep their worker.
    std::vector<std::optional<Outcome<Unit>>> owned(config_.pool_size);
    std::vector<WorkerPtr> discarded;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_) {
        discarded = std::move(created);
        created.clear();
      } else {
        for (uint32_t i = 0U; i < config_.pool_size; ++i) {
          Slot& s = slots_[i];
          if (s.recovering || s.worker != nullptr) {
            owned[i] = s.recovering ? s.recovery : Outcome<Unit>::Resolved(Unit{});
            discarded.push_back(std::move(created[i]));
            continue;
          }
          s.worker = created[i];
          ++s.generation;
          generations[i] = s.generation;
          s.state = SlotState::kInitializing;
          if (s.worker != nullptr) {
            AttachWatchLocked(i);
          }
        }
      }
    }
    for (auto& w : discarded) {
      if (w != nullptr) {
        w->Terminate();
      }
    }
    if (created.empty()) {
      (void)start_outcome_.Resolve(Unit{});
      return start_outcome_;
    }

    std::vector<Outcome<Unit>> handshakes;
    handshakes.reserve(config_.pool_size);
    for (uint32_t i = 0U; i < config_.pool_size; ++i) {
      if (owned[i].has_value()) {
        handshakes.push_back(*owned[i]);
      } else {
        handshakes.push_back(InitializeSlot(i, generations[i], created[i]));
      }
    }

    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    Outcome<Unit> start = start_outcome_;
    WhenAllSettled(handshakes)
        .OnSettled([weak, start](const Outcome<Unit>::ResultType&) {
          if (auto self = weak.lock()) {
            self->ArmHealthMonitor();
          }
          (void)start.Resolve(Unit{});
        });
    return start_outcome_;
  }

  /**
   * @brief Stop accepting work and settle everything with fallbacks.
   *
   * Queued and active jobs resolve with their fallback values, in-flight
   * recoveries reject with kShutdown, listeners are detached and every
   * worker is terminated. Idempotent; called by the destructor.
   */
  void Shutdown() {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_) {
        return;
      }
      terminated_ = true;
      accepting_ = false;

      for (auto& entry : queue_) {
        QueueSettleFallbackLocked(entry.second, out);
      }
      queue_.clear();

      for (auto& entry : active_) {
        RetireJobLocked(entry.first, entry.second, out);
        SettleJobFallbackLocked(entry.second, out);
      }
      active_.clear();

      for (uint32_t i = 0U; i < slots_.size(); ++i) {
        Slot& s = slots_[i];
        if (s.worker != nullptr) {
          out.detaches.emplace_back(s.worker, s.watch_token);
          out.terminations.push_back(std::move(s.worker));
          s.worker.reset();
        }
        if (s.recovering) {
          Outcome<Unit> recovery = s.recovery;
          out.actions.push_back([recovery]() {
            (void)recovery.Reject(EngineError::kShutdown, "pool shut down");
          });
          s.recovering = false;
        }
        if (s.retry_task.has_value()) {
          out.timers.push_back(*s.retry_task);
          s.retry_task.reset();
        }
        ++s.generation;
        s.state = SlotState::kTerminated;
        s.probing = false;
      }

      pending_.clear();
      if (health_task_.has_value()) {
        out.timers.push_back(*health_task_);
        health_task_.reset();
      }
      started_ = true;
      Outcome<Unit> start = start_outcome_;
      out.actions.push_back([start]() { (void)start.Resolve(Unit{}); });
    }
    OFFLOAD_LOG_INFO("Pool", "shut down");
    out.Flush(*timers_);
    timers_->Stop();
  }

  // --------------------------------------------------------------------------
  // Submission
  // --------------------------------------------------------------------------

  /**
   * @brief Submit one job. Never rejects.
   *
   * An in-flight submission with the same content hash returns the same
   * outcome. Lower priority values are dispatched first; equal priorities
   * keep submission order. When the queue exceeds queue_max_size, the tail
   * (largest priority value, newest) is evicted with its fallback value.
   */
  ResultOutcome SubmitOne(const Request& request, int32_t priority = 0) {
    const uint64_t hash = protocol_->Hash(request);
    ResultOutcome outcome;
    uint64_t seq = 0U;
    bool rejected = false;
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!accepting_) {
        ++stats_.fallbacks;
        rejected = true;
      } else {
        auto pending = pending_.find(hash);
        if (pending != pending_.end()) {
          ++stats_.dedup_hits;
          return pending->second.outcome;
        }
        seq = next_seq_++;
        pending_.emplace(hash, PendingEntry{outcome, seq, SteadyNowMs()});
        queue_.emplace(QueueKey{priority, seq},
                       QueueItem{seq, priority, hash, request, outcome});
        PumpLocked(out);
        EvictOverflowLocked(out);
        DrainStrandedLocked(out);
      }
    }
    if (rejected) {
      (void)outcome.Resolve(protocol_->Fallback(request));
      return outcome;
    }

    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    outcome.OnSettled([weak, hash, seq](const typename ResultOutcome::ResultType&) {
      if (auto self = weak.lock()) {
        self->ReleaseHash(hash, seq);
      }
    });
    out.Flush(*timers_);
    return outcome;
  }

  /**
   * @brief Submit several requests, results assembled positionally.
   *
   * With batch support and an idle worker, one batch message occupies that
   * worker. With batch support but no idle worker every request goes through
   * SubmitOne() at the same priority; without batch support, and on batch
   * timeout, at priority + 1 (saturating). A worker or transport error on
   * the batch resolves every position with its fallback value.
   */
  BatchOutcome SubmitBatch(const std::vector<Request>& requests,
                           int32_t priority = 0) {
    if (requests.empty()) {
      return BatchOutcome::Resolved({});
    }
    BatchOutcome outcome;
    Outbox out;
    bool dispatched = false;
    bool supported = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!accepting_) {
        stats_.fallbacks += requests.size();
        out.actions.push_back(FallbackAllAction(requests, outcome));
        dispatched = true;
      } else if (protocol_->SupportsBatch()) {
        supported = true;
        const int32_t idle = FindIdleSlotLocked();
        if (idle >= 0) {
          StartBatchLocked(static_cast<uint32_t>(idle), requests, priority,
                           outcome, out);
          dispatched = true;
        }
      }
    }
    out.Flush(*timers_);
    if (!dispatched) {
      return SubmitEach(requests, supported ? priority : DemotedPriority(priority));
    }
    return outcome;
  }

  // --------------------------------------------------------------------------
  // Health / Recovery
  // --------------------------------------------------------------------------

  /**
   * @brief Probe every idle ready slot with a health-check message.
   *
   * Without the health protocol the current flags are reported as-is.
   * Slots that are busy, initializing or recovering are reported without a
   * probe. A failed probe (timeout, transport error, healthy == false)
   * marks the slot unhealthy; recovery is left to the caller or to
   * PerformHealthMonitoring().
   */
  Outcome<std::vector<HealthReport>> HealthCheck() {
    std::vector<Outcome<HealthReport>> reports;
    std::vector<ProbePlan> plans;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      reports.reserve(slots_.size());
      for (uint32_t i = 0U; i < slots_.size(); ++i) {
        Slot& s = slots_[i];
        const bool probe = handshake_.HasHealthProtocol() && !terminated_ &&
                           s.state == SlotState::kReady && !s.probing &&
                           s.worker != nullptr && active_.count(i) == 0U;
        if (!probe) {
          reports.push_back(Outcome<HealthReport>::Resolved(
              HealthReport{i, s.state == SlotState::kReady && s.healthy, 0U}));
          continue;
        }
        s.probing = true;
        plans.push_back(ProbePlan{
            i, s.generation,
            "health-" + std::to_string(next_seq_++) + "-" + std::to_string(i),
            s.worker});
        reports.emplace_back();
      }
    }
    for (const auto& plan : plans) {
      reports[plan.slot] = Probe(plan);
    }
    return WhenAll(reports);
  }

  /**
   * @brief Body of the periodic health tick.
   *
   * Prunes stale pending-by-hash entries, runs HealthCheck() and recovers
   * every unhealthy slot. Resolves once all triggered recoveries settle.
   */
  Outcome<Unit> PerformHealthMonitoring() {
    PruneStalePending();
    Outcome<Unit> done;
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    HealthCheck().OnSettled(
        [weak, done](const typename Outcome<std::vector<HealthReport>>::ResultType&) {
          auto self = weak.lock();
          if (self == nullptr) {
            (void)done.Resolve(Unit{});
            return;
          }
          std::vector<Outcome<Unit>> recoveries;
          for (uint32_t slot : self->UnhealthySlots()) {
            recoveries.push_back(self->RecoverWorker(slot));
          }
          WhenAllSettled(recoveries).OnSettled(
              [done](const Outcome<Unit>::ResultType&) {
                (void)done.Resolve(Unit{});
              });
        });
    return done;
  }

  /**
   * @brief Replace the worker of a slot. Guarded by the slot's recovery lock.
   *
   * A second trigger while a recovery runs returns the running recovery's
   * outcome. Any job still active on the old worker resolves with its
   * fallback. After max_failures_in_window recoveries inside
   * failure_window_ms, further attempts are rejected with kRecoveryDeferred
   * until the window slides; a slot that is not ready then gets one retry
   * scheduled for the moment its oldest failure leaves the window.
   */
  Outcome<Unit> RecoverWorker(uint32_t slot) {
    Outbox out;
    Outcome<Unit> recovery;
    uint32_t generation = 0U;
    bool deferred = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (terminated_) {
        return Outcome<Unit>::Rejected(EngineError::kShutdown, "pool shut down");
      }
      if (slot >= slots_.size()) {
        return Outcome<Unit>::Rejected(EngineError::kInvalidSlot,
                                       "slot " + std::to_string(slot));
      }
      Slot& s = slots_[slot];
      if (s.recovering) {
        return s.recovery;
      }

      const uint64_t now_ms = SteadyNowMs();
      while (!s.failure_times_ms.empty() &&
             now_ms - s.failure_times_ms.front() >= config_.failure_window_ms) {
        s.failure_times_ms.pop_front();
      }
      if (s.failure_times_ms.size() >= config_.max_failures_in_window) {
        OFFLOAD_LOG_WARN("Pool",
                         "worker %u failed %u times within %u ms, "
                         "deferring recovery",
                         slot, static_cast<uint32_t>(s.failure_times_ms.size()),
                         config_.failure_window_ms);
        deferred = true;
        if (s.state != SlotState::kReady && !s.failure_times_ms.empty()) {
          const uint64_t age_ms = now_ms - s.failure_times_ms.front();
          ArmRecoveryRetryLocked(
              slot, static_cast<uint32_t>(config_.failure_window_ms - age_ms));
        }
        DrainStrandedLocked(out);
      } else {
        s.failure_times_ms.push_back(now_ms);
        s.recovering = true;
        s.recovery = recovery;
        s.state = SlotState::kInitializing;
        s.healthy = false;
        s.probing = false;
        ++s.generation;
        generation = s.generation;

        auto job = active_.find(slot);
        if (job != active_.end()) {
          RetireJobLocked(slot, job->second, out);
          SettleJobFallbackLocked(job->second, out);
          active_.erase(job);
        }
        if (s.worker != nullptr) {
          out.detaches.emplace_back(s.worker, s.watch_token);
          out.terminations.push_back(std::move(s.worker));
          s.worker.reset();
        }
      }
    }
    if (deferred) {
      out.Flush(*timers_);
      return Outcome<Unit>::Rejected(EngineError::kRecoveryDeferred,
                                     "slot " + std::to_string(slot));
    }
    OFFLOAD_LOG_INFO("Pool", "recovering worker %u", slot);
    out.Flush(*timers_);

    WorkerPtr fresh = factory_(slot);
    bool abandoned = false;
    bool shut_down = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      if (terminated_ || s.generation != generation) {
        abandoned = true;
        shut_down = terminated_;
        ReleaseRecoveryLockLocked(s, recovery);
      } else {
        s.worker = fresh;
        if (fresh != nullptr) {
          AttachWatchLocked(slot);
        }
      }
    }
    if (abandoned) {
      if (fresh != nullptr) {
        fresh->Terminate();
      }
      RejectStaleRecovery(recovery, shut_down);
      return recovery;
    }

    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    RunHandshake(fresh, handshake_, "init-" + std::to_string(slot),
                 protocol_->BuildInit(slot), timers_, config_.init_timeout_ms)
        .OnSettled([weak, slot, generation, recovery](
                       const Outcome<Unit>::ResultType& r) {
          auto self = weak.lock();
          if (self == nullptr) {
            (void)recovery.Reject(EngineError::kShutdown, "pool destroyed");
            return;
          }
          self->FinishRecovery(slot, generation, r, recovery);
        });
    return recovery;
  }

  /// @brief Hook invoked after each successful recovery (outside the lock).
  void SetRecoveryHook(RecoveryHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    recovery_hook_ = std::move(hook);
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  DiscretePoolStats GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DiscretePoolStats stats = stats_;
    stats.queue_length = static_cast<uint32_t>(queue_.size());
    stats.active_jobs = static_cast<uint32_t>(active_.size());
    stats.pending_hashes = static_cast<uint32_t>(pending_.size());
    stats.accepting = accepting_;
    stats.terminated = terminated_;
    stats.worker_count = 0U;
    stats.healthy_workers = 0U;
    for (const auto& s : slots_) {
      if (s.worker != nullptr) {
        ++stats.worker_count;
        if (s.state == SlotState::kReady && s.healthy) {
          ++stats.healthy_workers;
        }
      }
    }
    return stats;
  }

  SlotState GetSlotState(uint32_t slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot < slots_.size() ? slots_[slot].state : SlotState::kTerminated;
  }

  const DiscretePoolConfig& GetConfig() const noexcept { return config_; }

 private:
  using Outbox = detail::Outbox<Payload>;

  // --------------------------------------------------------------------------
  // Internal Types
  // --------------------------------------------------------------------------

  struct QueueKey {
    int32_t priority;
    uint64_t seq;
    bool operator<(const QueueKey& o) const noexcept {
      return priority != o.priority ? priority < o.priority : seq < o.seq;
    }
  };

  struct QueueItem {
    uint64_t seq;
    int32_t priority;
    uint64_t hash;
    Request request;
    ResultOutcome outcome;
  };

  struct PendingEntry {
    ResultOutcome outcome;
    uint64_t seq;
    uint64_t created_ms;
  };

  struct ActiveJob {
    std::string id;
    uint32_t generation{0U};
    uint64_t start_us{0U};
    ListenerToken token{0U};
    TimerTaskId timer{0U};
    bool is_batch{false};
    std::optional<QueueItem> item;                ///< Single job.
    std::vector<Request> batch_requests;          ///< Batch job.
    BatchOutcome batch_outcome;
    int32_t batch_priority{0};
  };

  struct Slot {
    WorkerPtr worker;
    SlotState state{SlotState::kUninitialized};
    bool healthy{false};
    bool probing{false};
    uint32_t generation{0U};
    ListenerToken watch_token{0U};
    bool recovering{false};        ///< Recovery lock.
    Outcome<Unit> recovery;        ///< Outcome shared by concurrent triggers.
    std::deque<uint64_t> failure_times_ms;
    std::optional<TimerTaskId> retry_task;  ///< Deferred recovery attempt.
  };

  DiscretePool(const DiscretePoolConfig& config, const HandshakeConfig& handshake,
               ProtocolPtr protocol, WorkerFactory<Payload> factory)
      : config_(config),
        handshake_(handshake),
        protocol_(std::move(protocol)),
        tags_(protocol_->Tags()),
        factory_(std::move(factory)),
        timers_(std::make_shared<TimerScheduler>()),
        slots_(config.pool_size) {
    if (tags_.batch_result.empty()) {
      tags_.batch_result = tags_.result;
    }
    (void)timers_->Start();
  }

  // --------------------------------------------------------------------------
  // Slot Initialization
  // --------------------------------------------------------------------------

  Outcome<Unit> InitializeSlot(uint32_t slot, uint32_t generation,
                               const WorkerPtr& worker) {
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    Outcome<Unit> hs =
        RunHandshake(worker, handshake_, "init-" + std::to_string(slot),
                     protocol_->BuildInit(slot), timers_, config_.init_timeout_ms);
    hs.OnSettled([weak, slot, generation](const Outcome<Unit>::ResultType& r) {
      if (auto self = weak.lock()) {
        self->OnSlotInitialized(slot, generation, r);
      }
    });
    return hs;
  }

  void OnSlotInitialized(uint32_t slot, uint32_t generation,
                         const Outcome<Unit>::ResultType& r) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      if (terminated_ || s.generation != generation) {
        return;
      }
      if (r.has_value()) {
        s.state = SlotState::kReady;
        s.healthy = true;
        OFFLOAD_LOG_DEBUG("Pool", "worker %u ready", slot);
        PumpLocked(out);
      } else {
        s.state = SlotState::kUnhealthy;
        s.healthy = false;
        OFFLOAD_LOG_ERROR("Pool", "worker %u initialization failed (%s): %s",
                          slot, EngineErrorName(r.get_error().code),
                          r.get_error().detail.c_str());
        if (!HasHealthTick()) {
          ArmRecoveryRetryLocked(slot, config_.failure_window_ms);
        }
        DrainStrandedLocked(out);
      }
    }
    out.Flush(*timers_);
  }

  void FinishRecovery(uint32_t slot, uint32_t generation,
                      const Outcome<Unit>::ResultType& r,
                      const Outcome<Unit>& recovery) {
    Outbox out;
    RecoveryHook hook;
    bool stale = false;
    bool shut_down = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      stale = terminated_ || s.generation != generation;
      if (stale) {
        shut_down = terminated_;
        ReleaseRecoveryLockLocked(s, recovery);
      } else {
        FinishRecoveryLocked(slot, r, hook, out);
      }
    }
    if (stale) {
      RejectStaleRecovery(recovery, shut_down);
      return;
    }
    out.Flush(*timers_);
    if (r.has_value()) {
      if (hook) {
        hook(slot);
      }
      (void)recovery.Resolve(Unit{});
    } else {
      (void)recovery.Reject(r.get_error().code, r.get_error().detail);
    }
  }

  void FinishRecoveryLocked(uint32_t slot, const Outcome<Unit>::ResultType& r,
                            RecoveryHook& hook, Outbox& out) {
    Slot& s = slots_[slot];
    s.recovering = false;
    if (r.has_value()) {
      s.state = SlotState::kReady;
      s.healthy = true;
      ++stats_.recoveries;
      hook = recovery_hook_;
      OFFLOAD_LOG_INFO("Pool", "worker %u recovered", slot);
      PumpLocked(out);
    } else {
      s.state = SlotState::kUnhealthy;
      s.healthy = false;
      OFFLOAD_LOG_ERROR("Pool", "recovery of worker %u failed (%s): %s", slot,
                        EngineErrorName(r.get_error().code),
                        r.get_error().detail.c_str());
      if (!HasHealthTick()) {
        ArmRecoveryRetryLocked(slot, config_.failure_window_ms);
      }
      DrainStrandedLocked(out);
    }
  }

  /// Drop the recovery lock if this recovery still holds it.
  static void ReleaseRecoveryLockLocked(Slot& s, const Outcome<Unit>& recovery) {
    if (s.recovering && s.recovery.SameAs(recovery)) {
      s.recovering = false;
    }
  }

  static void RejectStaleRecovery(const Outcome<Unit>& recovery, bool shut_down) {
    if (shut_down) {
      (void)recovery.Reject(EngineError::kShutdown, "pool shut down");
    } else {
      (void)recovery.Reject(EngineError::kWorkerError, "slot replaced");
    }
  }

  /// Slot-lifetime listener: transport errors while idle or busy.
  void AttachWatchLocked(uint32_t slot) {
    Slot& s = slots_[slot];
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    const uint32_t generation = s.generation;
    ListenerSet<Payload> watch;
    watch.on_error = [weak, slot, generation](const std::string& detail) {
      if (auto self = weak.lock()) {
        self->OnSlotTransportError(slot, generation, detail);
      }
    };
    s.watch_token = AttachListeners(s.worker, std::move(watch));
  }

  void OnSlotTransportError(uint32_t slot, uint32_t generation,
                            const std::string& detail) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      // During a handshake the handshake itself reports the failure.
      if (terminated_ || s.generation != generation ||
          s.state != SlotState::kReady) {
        return;
      }
      OFFLOAD_LOG_WARN("Pool", "worker %u transport error: %s", slot,
                       detail.c_str());
      s.state = SlotState::kUnhealthy;
      s.healthy = false;
      auto job = active_.find(slot);
      if (job != active_.end()) {
        RetireJobLocked(slot, job->second, out);
        SettleJobFallbackLocked(job->second, out);
        active_.erase(job);
      }
      std::weak_ptr<DiscretePool> weak = this->weak_from_this();
      out.actions.push_back([weak, slot]() {
        if (auto self = weak.lock()) {
          (void)self->RecoverWorker(slot);
        }
      });
    }
    out.Flush(*timers_);
  }

  // --------------------------------------------------------------------------
  // Dispatch
  // --------------------------------------------------------------------------

  int32_t FindIdleSlotLocked() const {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      const Slot& s = slots_[i];
      if (s.state == SlotState::kReady && s.healthy && !s.probing &&
          s.worker != nullptr && active_.count(i) == 0U) {
        return static_cast<int32_t>(i);
      }
    }
    return -1;
  }

  /// Drain the queue front onto idle slots.
  void PumpLocked(Outbox& out) {
    if (terminated_) {
      return;
    }
    while (!queue_.empty()) {
      const int32_t idle = FindIdleSlotLocked();
      if (idle < 0) {
        break;
      }
      auto front = queue_.begin();
      QueueItem item = std::move(front->second);
      queue_.erase(front);
      StartJobLocked(static_cast<uint32_t>(idle), std::move(item), out);
    }
  }

  void EvictOverflowLocked(Outbox& out) {
    while (queue_.size() > config_.queue_max_size) {
      auto tail = std::prev(queue_.end());
      OFFLOAD_LOG_DEBUG("Pool", "queue full (%u), evicting job-%llu (priority %d)",
                        config_.queue_max_size,
                        static_cast<unsigned long long>(tail->second.seq),
                        static_cast<int>(tail->second.priority));
      ++stats_.evictions;
      QueueSettleFallbackLocked(tail->second, out);
      queue_.erase(tail);
    }
  }

  ListenerSet<Payload> JobListenersLocked(uint32_t slot, const std::string& id) {
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    ListenerSet<Payload> set;
    set.on_message = [weak, slot, id](const MessageType& msg) {
      if (msg.id != id) {
        return;
      }
      if (auto self = weak.lock()) {
        self->OnJobMessage(slot, id, msg);
      }
    };
    set.on_error = [weak, slot, id](const std::string& detail) {
      if (auto self = weak.lock()) {
        self->OnJobFailed(slot, id, "transport error: " + detail);
      }
    };
    return set;
  }

  void ArmJobLocked(uint32_t slot, ActiveJob& job) {
    Slot& s = slots_[slot];
    job.generation = s.generation;
    job.start_us = SteadyNowUs();
    job.token = AttachListeners(s.worker, JobListenersLocked(slot, job.id));

    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    const std::string id = job.id;
    auto timer = timers_->AddOneShot(config_.operation_timeout_ms, [weak, slot, id]() {
      if (auto self = weak.lock()) {
        self->OnJobTimeout(slot, id);
      }
    });
    if (timer.has_value()) {
      job.timer = timer.value();
    }
    ++stats_.dispatched;
  }

  void StartJobLocked(uint32_t slot, QueueItem item, Outbox& out) {
    ActiveJob job;
    job.id = "job-" + std::to_string(item.seq);
    ArmJobLocked(slot, job);
    out.posts.emplace_back(slots_[slot].worker,
                           MessageType(tags_.job, job.id,
                                       protocol_->BuildJob(item.request)));
    job.item.emplace(std::move(item));
    active_.emplace(slot, std::move(job));
  }

  void StartBatchLocked(uint32_t slot, const std::vector<Request>& requests,
                        int32_t priority, const BatchOutcome& outcome,
                        Outbox& out) {
    ActiveJob job;
    job.id = "batch-" + std::to_string(next_seq_++);
    job.is_batch = true;
    job.batch_requests = requests;
    job.batch_outcome = outcome;
    job.batch_priority = priority;
    ArmJobLocked(slot, job);
    out.posts.emplace_back(slots_[slot].worker,
                           MessageType(tags_.batch, job.id,
                                       protocol_->BuildBatch(requests)));
    active_.emplace(slot, std::move(job));
  }

  /// Remove the job with this id from the slot. False if it already settled.
  bool TakeJobLocked(uint32_t slot, const std::string& id, ActiveJob& job) {
    auto it = active_.find(slot);
    if (it == active_.end() || it->second.id != id) {
      return false;
    }
    job = std::move(it->second);
    active_.erase(it);
    return true;
  }

  void RetireJobLocked(uint32_t slot, const ActiveJob& job, Outbox& out) {
    out.timers.push_back(job.timer);
    out.detaches.emplace_back(slots_[slot].worker, job.token);
  }

  // --------------------------------------------------------------------------
  // Job Completion Paths
  // --------------------------------------------------------------------------

  void OnJobMessage(uint32_t slot, const std::string& id, const MessageType& msg) {
    const bool is_error = msg.type == handshake_.error;
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = active_.find(slot);
      if (it == active_.end() || it->second.id != id) {
        return;
      }
      const std::string& expected_type =
          it->second.is_batch ? tags_.batch_result : tags_.result;
      if (!is_error && msg.type != expected_type) {
        return;
      }
      ActiveJob job = std::move(it->second);
      active_.erase(it);
      RetireJobLocked(slot, job, out);
      if (is_error) {
        OFFLOAD_LOG_DEBUG("Pool", "%s failed on worker %u: %s", id.c_str(), slot,
                          msg.error.c_str());
        SettleJobFallbackLocked(job, out);
      } else {
        ++stats_.completed;
        OFFLOAD_LOG_DEBUG("Pool", "%s done on worker %u in %llu us", id.c_str(), slot,
                          static_cast<unsigned long long>(SteadyNowUs() - job.start_us));
        out.actions.push_back(ParseAction(std::move(job), msg.payload));
      }
      PumpLocked(out);
    }
    out.Flush(*timers_);
  }

  void OnJobFailed(uint32_t slot, const std::string& id, const std::string& why) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ActiveJob job;
      if (!TakeJobLocked(slot, id, job)) {
        return;
      }
      OFFLOAD_LOG_DEBUG("Pool", "%s failed on worker %u: %s", id.c_str(), slot,
                        why.c_str());
      RetireJobLocked(slot, job, out);
      SettleJobFallbackLocked(job, out);
      PumpLocked(out);
    }
    out.Flush(*timers_);
  }

  void OnJobTimeout(uint32_t slot, const std::string& id) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ActiveJob job;
      if (!TakeJobLocked(slot, id, job)) {
        return;
      }
      ++stats_.timeouts;
      OFFLOAD_LOG_WARN("Pool", "%s on worker %u timed out after %u ms", id.c_str(),
                       slot, config_.operation_timeout_ms);
      out.detaches.emplace_back(slots_[slot].worker, job.token);
      if (job.is_batch) {
        std::weak_ptr<DiscretePool> weak = this->weak_from_this();
        std::vector<Request> requests = std::move(job.batch_requests);
        BatchOutcome outcome = job.batch_outcome;
        const int32_t priority = DemotedPriority(job.batch_priority);
        ProtocolPtr protocol = protocol_;
        out.actions.push_back([weak, requests, outcome, priority, protocol]() {
          if (auto self = weak.lock()) {
            self->SubmitEach(requests, priority)
                .OnSettled([outcome](const typename BatchOutcome::ResultType& r) {
                  (void)outcome.Settle(r);
                });
            return;
          }
          std::vector<Result> values;
          values.reserve(requests.size());
          for (const auto& req : requests) {
            values.push_back(protocol->Fallback(req));
          }
          (void)outcome.Resolve(std::move(values));
        });
      } else {
        SettleJobFallbackLocked(job, out);
      }
      PumpLocked(out);
    }
    out.Flush(*timers_);
  }

  // --------------------------------------------------------------------------
  // Settlement Helpers (actions run after the lock is released)
  // --------------------------------------------------------------------------

  std::function<void()> ParseAction(ActiveJob job, const Payload& payload) {
    ProtocolPtr protocol = protocol_;
    if (job.is_batch) {
      std::vector<Request> requests = std::move(job.batch_requests);
      BatchOutcome outcome = job.batch_outcome;
      return [protocol, requests, outcome, payload]() {
        auto parsed = protocol->ParseBatchResult(payload, requests);
        if (parsed.has_value() && parsed->size() == requests.size()) {
          (void)outcome.Resolve(std::move(*parsed));
          return;
        }
        std::vector<Result> values;
        values.reserve(requests.size());
        for (const auto& req : requests) {
          values.push_back(protocol->Fallback(req));
        }
        (void)outcome.Resolve(std::move(values));
      };
    }
    Request request = std::move(job.item->request);
    ResultOutcome outcome = job.item->outcome;
    return [protocol, request, outcome, payload]() {
      auto parsed = protocol->ParseResult(payload, request);
      (void)outcome.Resolve(parsed.has_value() ? std::move(*parsed)
                                               : protocol->Fallback(request));
    };
  }

  std::function<void()> FallbackAllAction(const std::vector<Request>& requests,
                                          const BatchOutcome& outcome) const {
    ProtocolPtr protocol = protocol_;
    return [protocol, requests, outcome]() {
      std::vector<Result> values;
      values.reserve(requests.size());
      for (const auto& req : requests) {
        values.push_back(protocol->Fallback(req));
      }
      (void)outcome.Resolve(std::move(values));
    };
  }

  void QueueSettleFallbackLocked(const QueueItem& item, Outbox& out) {
    ++stats_.fallbacks;
    ProtocolPtr protocol = protocol_;
    Request request = item.request;
    ResultOutcome outcome = item.outcome;
    out.actions.push_back([protocol, request, outcome]() {
      (void)outcome.Resolve(protocol->Fallback(request));
    });
  }

  void SettleJobFallbackLocked(const ActiveJob& job, Outbox& out) {
    if (job.is_batch) {
      stats_.fallbacks += job.batch_requests.size();
      out.actions.push_back(FallbackAllAction(job.batch_requests, job.batch_outcome));
      return;
    }
    QueueSettleFallbackLocked(*job.item, out);
  }

  static int32_t DemotedPriority(int32_t priority) noexcept {
    return priority < std::numeric_limits<int32_t>::max() ? priority + 1 : priority;
  }

  BatchOutcome SubmitEach(const std::vector<Request>& requests, int32_t priority) {
    std::vector<ResultOutcome> parts;
    parts.reserve(requests.size());
    for (const auto& req : requests) {
      parts.push_back(SubmitOne(req, priority));
    }
    return WhenAll(parts);
  }

  // --------------------------------------------------------------------------
  // Health Probe
  // --------------------------------------------------------------------------

  struct ProbePlan {
    uint32_t slot;
    uint32_t generation;
    std::string id;
    WorkerPtr worker;
  };

  /// Attach, arm and post one health probe. Called without the lock.
  Outcome<HealthReport> Probe(const ProbePlan& plan) {
    const uint32_t slot = plan.slot;
    const uint32_t generation = plan.generation;
    const std::string probe_id = plan.id;
    const std::string response_type = handshake_.health_response;

    Outcome<bool> raw;
    ListenerSet<Payload> set;
    set.on_message = [raw, probe_id, response_type](const MessageType& msg) {
      if (msg.id == probe_id && msg.type == response_type) {
        (void)raw.Resolve(msg.healthy);
      }
    };
    set.on_error = [raw](const std::string& detail) {
      (void)raw.Reject(EngineError::kWorkerError, detail);
    };
    const ListenerToken token = AttachListeners(plan.worker, std::move(set));
    std::weak_ptr<Worker> weak_worker = plan.worker;

    Outcome<HealthReport> report;
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    const uint64_t start_ms = SteadyNowMs();
    WithTimeout(raw, timers_, config_.health_check_timeout_ms, "Health check")
        .OnSettled([weak, weak_worker, token, slot, generation, start_ms,
                    report](const Outcome<bool>::ResultType& r) {
          DetachListeners(weak_worker.lock(), token);
          const bool healthy = r.has_value() && r.value();
          const uint32_t elapsed = static_cast<uint32_t>(SteadyNowMs() - start_ms);
          if (auto self = weak.lock()) {
            self->ApplyProbeResult(slot, generation, healthy,
                                   r.has_value() ? std::string("reported unhealthy")
                                                 : r.get_error().detail);
          }
          (void)report.Resolve(HealthReport{slot, healthy, elapsed});
        });
    plan.worker->Post(MessageType(handshake_.health_check, probe_id));
    return report;
  }

  void ApplyProbeResult(uint32_t slot, uint32_t generation, bool healthy,
                        const std::string& detail) {
    Outbox out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      if (terminated_ || s.generation != generation) {
        return;
      }
      s.probing = false;
      if (s.state != SlotState::kReady) {
        return;
      }
      if (healthy) {
        s.healthy = true;
        PumpLocked(out);
      } else {
        OFFLOAD_LOG_WARN("Pool", "health check failed for worker %u: %s", slot,
                         detail.c_str());
        s.healthy = false;
        s.state = SlotState::kUnhealthy;
      }
    }
    out.Flush(*timers_);
  }

  std::vector<uint32_t> UnhealthySlots() const {
    std::vector<uint32_t> result;
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
      return result;
    }
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (slots_[i].state == SlotState::kUnhealthy && !slots_[i].recovering) {
        result.push_back(i);
      }
    }
    return result;
  }

  // --------------------------------------------------------------------------
  // Liveness without a health tick
  // --------------------------------------------------------------------------

  bool HasHealthTick() const noexcept {
    return handshake_.HasHealthProtocol() && config_.health_interval_ms > 0U;
  }

  void ArmRecoveryRetryLocked(uint32_t slot, uint32_t delay_ms) {
    Slot& s = slots_[slot];
    if (terminated_ || s.retry_task.has_value()) {
      return;
    }
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    auto task = timers_->AddOneShot(delay_ms, [weak, slot]() {
      if (auto self = weak.lock()) {
        self->RetryRecovery(slot);
      }
    });
    if (task.has_value()) {
      s.retry_task = task.value();
      OFFLOAD_LOG_DEBUG("Pool", "worker %u recovery retry in %u ms", slot, delay_ms);
    }
  }

  void RetryRecovery(uint32_t slot) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Slot& s = slots_[slot];
      s.retry_task.reset();
      if (terminated_ || s.recovering || s.state != SlotState::kUnhealthy) {
        return;
      }
    }
    (void)RecoverWorker(slot);
  }

  /// Resolve queued work with fallbacks when no slot is serving or about to.
  void DrainStrandedLocked(Outbox& out) {
    if (!started_ || terminated_ || queue_.empty()) {
      return;
    }
    for (const auto& s : slots_) {
      if (s.recovering || s.state == SlotState::kUninitialized ||
          s.state == SlotState::kInitializing ||
          (s.state == SlotState::kReady && s.healthy)) {
        return;
      }
    }
    OFFLOAD_LOG_WARN("Pool", "no worker available, %u queued jobs fall back",
                     static_cast<uint32_t>(queue_.size()));
    for (auto& entry : queue_) {
      QueueSettleFallbackLocked(entry.second, out);
    }
    queue_.clear();
  }

  void ArmHealthMonitor() {
    if (!handshake_.HasHealthProtocol()) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_ || health_task_.has_value()) {
      return;
    }
    std::weak_ptr<DiscretePool> weak = this->weak_from_this();
    auto task = timers_->Add(config_.health_interval_ms, [weak]() {
      if (auto self = weak.lock()) {
        (void)self->PerformHealthMonitoring();
      }
    });
    if (task.has_value()) {
      health_task_ = task.value();
    } else {
      OFFLOAD_LOG_WARN("Pool", "health monitor not armed (interval %u ms)",
                       config_.health_interval_ms);
    }
  }

  // --------------------------------------------------------------------------
  // Pending-by-hash Registry
  // --------------------------------------------------------------------------

  void ReleaseHash(uint64_t hash, uint64_t seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(hash);
    if (it != pending_.end() && it->second.seq == seq) {
      pending_.erase(it);
    }
  }

  void PruneStalePending() {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t now_ms = SteadyNowMs();
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (now_ms - it->second.created_ms > config_.operation_timeout_ms) {
        it = pending_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // --------------------------------------------------------------------------
  // Data
  // --------------------------------------------------------------------------

  const DiscretePoolConfig config_;
  const HandshakeConfig handshake_;
  const ProtocolPtr protocol_;
  JobTags tags_;
  WorkerFactory<Payload> factory_;
  std::shared_ptr<TimerScheduler> timers_;

  mutable std::mutex mutex_;
  std::vector<Slot> slots_;
  std::map<QueueKey, QueueItem> queue_;
  std::map<uint32_t, ActiveJob> active_;  ///< slot -> job; one per slot.
  std::unordered_map<uint64_t, PendingEntry> pending_;
  std::optional<TimerTaskId> health_task_;
  RecoveryHook recovery_hook_;
  Outcome<Unit> start_outcome_;
  DiscretePoolStats stats_;
  uint64_t next_seq_{1U};
  bool started_{false};
  bool accepting_{true};
  bool terminated_{false};
};

}  // namespace offload

#endif  // OFFLOAD_DISCRETE_POOL_HPP_
