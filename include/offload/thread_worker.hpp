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
 * @file thread_worker.hpp
 * @brief In-process WorkerHandle running a WorkerProgram on its own thread.
 *
 * The program sees only messages: it receives engine requests through
 * OnMessage() and answers through its WorkerPort. Nothing is shared between
 * the engine and the program except the inbox.
 *
 *   class Echo : public offload::WorkerProgram<std::string> {
 *     void OnStart(Port& port) override { port.Post({"ready", ""}); }
 *     void OnMessage(const Msg& m, Port& port) override { ... }
 *   };
 *   auto factory = offload::MakeThreadWorkerFactory<std::string>(
 *       [](uint32_t) { return std::make_unique<Echo>(); });
 */

#ifndef OFFLOAD_THREAD_WORKER_HPP_
#define OFFLOAD_THREAD_WORKER_HPP_

#include "offload/log.hpp"
#include "offload/message.hpp"
#include "offload/worker.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace offload {

// ============================================================================
// WorkerPort / WorkerProgram
// ============================================================================

/// @brief The worker side of the channel, handed to the running program.
template <typename Payload>
class WorkerPort {
 public:
  virtual ~WorkerPort() = default;

  /// @brief Worker -> engine. Dropped once the worker is terminated.
  virtual void Post(Message<Payload> msg) = 0;

  /// @brief Raise a transport-level error event on the engine side.
  virtual void RaiseError(const std::string& detail) = 0;

  /**
   * @brief Remove a queued, not yet handled message matching type and id.
   *
   * Long-running handlers poll this to honour a cancel request that arrived
   * while they were busy.
   */
  virtual bool TakePending(const std::string& type, const std::string& id) = 0;

  /// @brief True once Terminate() was called; long loops should return.
  virtual bool StopRequested() const noexcept = 0;
};

template <typename Payload>
class WorkerProgram {
 public:
  virtual ~WorkerProgram() = default;

  /// @brief Runs first on the worker thread; usually posts the ready-signal.
  virtual void OnStart(WorkerPort<Payload>& port) = 0;

  virtual void OnMessage(const Message<Payload>& msg,
                         WorkerPort<Payload>& port) = 0;
};

// ============================================================================
// ThreadWorker
// ============================================================================

/**
 * @brief WorkerHandle backed by a dedicated std::thread.
 *
 * The thread holds a strong reference to the worker until it exits, so the
 * engine may drop its handle at any time. Terminate() does not wait for a
 * program stuck inside OnMessage(): the thread is detached, messages it
 * posts afterwards are discarded, and it exits when the handler returns.
 */
template <typename Payload>
class ThreadWorker final
    : public WorkerHandle<Payload>,
      public std::enable_shared_from_this<ThreadWorker<Payload>> {
 public:
  using MessageType = Message<Payload>;

  static std::shared_ptr<ThreadWorker> Create(
      std::unique_ptr<WorkerProgram<Payload>> program) {
    return std::shared_ptr<ThreadWorker>(new ThreadWorker(std::move(program)));
  }

  ~ThreadWorker() override {
    std::thread local;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
      local = std::move(thread_);
    }
    cv_.notify_all();
    if (local.joinable()) {
      if (local.get_id() == std::this_thread::get_id()) {
        local.detach();
      } else {
        local.join();
      }
    }
  }

  ThreadWorker(const ThreadWorker&) = delete;
  ThreadWorker& operator=(const ThreadWorker&) = delete;

  // --------------------------------------------------------------------------
  // WorkerHandle
  // --------------------------------------------------------------------------

  void Start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stop_) {
      return;
    }
    started_ = true;
    thread_ = std::thread(&ThreadWorker::Run, this->shared_from_this());
  }

  void Post(MessageType msg) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_) {
        return;
      }
      inbox_.push_back(std::move(msg));
    }
    cv_.notify_one();
  }

  void Terminate() override {
    std::thread local;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_) {
        return;
      }
      stop_ = true;
      terminated_.store(true, std::memory_order_release);
      inbox_.clear();
      local = std::move(thread_);
    }
    cv_.notify_all();
    if (local.joinable()) {
      local.detach();
    }
  }

  bool IsTerminated() const noexcept override {
    return terminated_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Worker Side (reached through the program's WorkerPort)
  // --------------------------------------------------------------------------

  void PostToEngine(MessageType msg) {
    if (!StopRequested()) {
      this->Deliver(msg);
    }
  }

  void RaiseError(const std::string& detail) {
    if (!StopRequested()) {
      OFFLOAD_LOG_DEBUG("Worker", "transport error raised: %s", detail.c_str());
      this->DeliverError(detail);
    }
  }

  bool TakePending(const std::string& type, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = inbox_.begin(); it != inbox_.end(); ++it) {
      if (it->type == type && it->id == id) {
        inbox_.erase(it);
        return true;
      }
    }
    return false;
  }

  bool StopRequested() const noexcept {
    return terminated_.load(std::memory_order_acquire);
  }

  /// @brief Messages waiting in the inbox.
  uint32_t PendingCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(inbox_.size());
  }

 private:
  explicit ThreadWorker(std::unique_ptr<WorkerProgram<Payload>> program)
      : program_(std::move(program)) {}

  /// Engine-facing Post() and worker-facing Post() share a name.
  class PortView final : public WorkerPort<Payload> {
   public:
    explicit PortView(ThreadWorker& owner) : owner_(owner) {}
    void Post(MessageType msg) override { owner_.PostToEngine(std::move(msg)); }
    void RaiseError(const std::string& detail) override {
      owner_.RaiseError(detail);
    }
    bool TakePending(const std::string& type, const std::string& id) override {
      return owner_.TakePending(type, id);
    }
    bool StopRequested() const noexcept override {
      return owner_.StopRequested();
    }

   private:
    ThreadWorker& owner_;
  };

  static void Run(std::shared_ptr<ThreadWorker> self) {
    PortView port(*self);
    if (self->program_ == nullptr) {
      port.RaiseError("no worker program");
      return;
    }
    self->program_->OnStart(port);
    for (;;) {
      MessageType msg;
      {
        std::unique_lock<std::mutex> lock(self->mutex_);
        self->cv_.wait(lock,
                       [&self] { return self->stop_ || !self->inbox_.empty(); });
        if (self->stop_) {
          break;
        }
        msg = std::move(self->inbox_.front());
        self->inbox_.pop_front();
      }
      self->program_->OnMessage(msg, port);
    }
  }

  std::unique_ptr<WorkerProgram<Payload>> program_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<MessageType> inbox_;
  std::thread thread_;
  std::atomic<bool> terminated_{false};
  bool started_{false};
  bool stop_{false};
};

// ============================================================================
// Factory Helper
// ============================================================================

/**
 * @brief Wrap a program maker into a WorkerFactory producing ThreadWorkers.
 *
 * @param make_program  Callable (uint32_t slot) ->
 *                      std::unique_ptr<WorkerProgram<Payload>>.
 */
template <typename Payload, typename MakeProgram>
WorkerFactory<Payload> MakeThreadWorkerFactory(MakeProgram make_program) {
  return [make_program](uint32_t slot) -> std::shared_ptr<WorkerHandle<Payload>> {
    std::unique_ptr<WorkerProgram<Payload>> program = make_program(slot);
    if (program == nullptr) {
      return nullptr;
    }
    return ThreadWorker<Payload>::Create(std::move(program));
  };
}

}  // namespace offload

#endif  // OFFLOAD_THREAD_WORKER_HPP_
