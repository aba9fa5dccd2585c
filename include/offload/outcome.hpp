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
 * @file outcome.hpp
 * @brief Settle-once shared result handle plus timeout and join helpers.
 *
 * Outcome<T> is the engine's future: every copy refers to the same shared
 * state, the first Resolve()/Reject() wins, and continuations registered with
 * OnSettled() run exactly once. Continuations run on the settling thread
 * outside the internal lock, or inline when the outcome is already settled.
 *
 *   offload::Outcome<int> o;
 *   o.OnSettled([](const offload::Outcome<int>::ResultType& r) { ... });
 *   o.Resolve(42);   // runs the continuation
 *   o.Resolve(7);    // returns false, value stays 42
 */

#ifndef OFFLOAD_OUTCOME_HPP_
#define OFFLOAD_OUTCOME_HPP_

#include "offload/message.hpp"
#include "offload/timer.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// Outcome<T>
// ============================================================================

template <typename T>
class Outcome final {
 public:
  using ResultType = expected<T, Failure>;
  using Callback = std::function<void(const ResultType&)>;

  Outcome() : state_(std::make_shared<State>()) {}

  static Outcome Resolved(T value) {
    Outcome o;
    (void)o.Resolve(std::move(value));
    return o;
  }

  static Outcome Rejected(EngineError code, std::string detail = {}) {
    Outcome o;
    (void)o.Reject(code, std::move(detail));
    return o;
  }

  // --------------------------------------------------------------------------
  // Producer side
  // --------------------------------------------------------------------------

  /// @return false if the outcome was already settled.
  bool Resolve(T value) const {
    return Settle(ResultType::success(std::move(value)));
  }

  /// @return false if the outcome was already settled.
  bool Reject(EngineError code, std::string detail = {}) const {
    return Settle(ResultType::error(Failure{code, std::move(detail)}));
  }

  bool Settle(ResultType result) const {
    std::vector<Callback> callbacks;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->result.has_value()) {
        return false;
      }
      state_->result.emplace(std::move(result));
      callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    // result is immutable from here on; safe to read without the lock.
    for (auto& cb : callbacks) {
      cb(*state_->result);
    }
    return true;
  }

  // --------------------------------------------------------------------------
  // Consumer side
  // --------------------------------------------------------------------------

  void OnSettled(Callback fn) const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->result.has_value()) {
        state_->callbacks.push_back(std::move(fn));
        return;
      }
    }
    fn(*state_->result);
  }

  bool IsSettled() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result.has_value();
  }

  /// @brief Block until settled. For tests, demos and synchronous callers.
  ResultType Wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->result.has_value(); });
    return *state_->result;
  }

  /// @return true if the outcome settled within timeout_ms.
  bool WaitFor(uint32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                               [this] { return state_->result.has_value(); });
  }

  /// @pre IsSettled().
  ResultType Get() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    OFFLOAD_ASSERT(state_->result.has_value());
    return *state_->result;
  }

  /// @brief True when both handles share one state (deduplicated submits).
  bool SameAs(const Outcome& other) const noexcept {
    return state_ == other.state_;
  }

 private:
  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::optional<ResultType> result;
    std::vector<Callback> callbacks;
  };

  std::shared_ptr<State> state_;
};

// ============================================================================
// WithTimeout
// ============================================================================

/**
 * @brief Race an outcome against a deadline.
 *
 * The returned outcome settles with the source result if it arrives first,
 * or is rejected with EngineError::kTimeout ("<label> timeout after <ms>ms").
 * The deadline task is removed on the source path; on the timeout path it
 * has already fired, so no timer outlives the race either way. Listener
 * cleanup belongs to the caller's OnSettled() on the returned outcome.
 */
template <typename T>
Outcome<T> WithTimeout(const Outcome<T>& source,
                       const std::shared_ptr<TimerScheduler>& timers,
                       uint32_t ms, const std::string& label) {
  Outcome<T> out;
  auto task = timers->AddOneShot(ms, [out, label, ms]() {
    (void)out.Reject(EngineError::kTimeout,
                     label + " timeout after " + std::to_string(ms) + "ms");
  });
  std::weak_ptr<TimerScheduler> weak_timers = timers;
  const bool armed = task.has_value();
  const TimerTaskId task_id = armed ? task.value() : TimerTaskId(0U);
  source.OnSettled([out, weak_timers, armed,
                    task_id](const typename Outcome<T>::ResultType& r) {
    if (armed) {
      if (auto t = weak_timers.lock()) {
        (void)t->Remove(task_id);
      }
    }
    (void)out.Settle(r);
  });
  return out;
}

// ============================================================================
// WhenAll
// ============================================================================

/**
 * @brief Join outcomes positionally.
 *
 * Resolves with every value in input order once all inputs settle, or is
 * rejected with the first failure observed.
 */
template <typename T>
Outcome<std::vector<T>> WhenAll(const std::vector<Outcome<T>>& parts) {
  Outcome<std::vector<T>> out;
  if (parts.empty()) {
    (void)out.Resolve({});
    return out;
  }

  struct Join {
    std::mutex mutex;
    std::vector<std::optional<T>> values;
    size_t remaining;
    explicit Join(size_t n) : values(n), remaining(n) {}
  };
  auto join = std::make_shared<Join>(parts.size());

  for (size_t i = 0U; i < parts.size(); ++i) {
    parts[i].OnSettled([out, join, i](const typename Outcome<T>::ResultType& r) {
      if (!r.has_value()) {
        (void)out.Reject(r.get_error().code, r.get_error().detail);
        return;
      }
      bool complete = false;
      {
        std::lock_guard<std::mutex> lock(join->mutex);
        join->values[i].emplace(r.value());
        complete = (--join->remaining == 0U);
      }
      if (complete) {
        std::vector<T> values;
        values.reserve(join->values.size());
        for (auto& v : join->values) {
          values.push_back(std::move(*v));
        }
        (void)out.Resolve(std::move(values));
      }
    });
  }
  return out;
}

/**
 * @brief Resolve once every input has settled, whatever the results.
 *
 * Used to join internal operations (handshakes, recoveries) whose individual
 * failures are already handled where they occur.
 */
template <typename T>
Outcome<Unit> WhenAllSettled(const std::vector<Outcome<T>>& parts) {
  Outcome<Unit> out;
  if (parts.empty()) {
    (void)out.Resolve(Unit{});
    return out;
  }
  auto remaining = std::make_shared<std::atomic<size_t>>(parts.size());
  for (const auto& part : parts) {
    part.OnSettled([out, remaining](const typename Outcome<T>::ResultType&) {
      if (remaining->fetch_sub(1U) == 1U) {
        (void)out.Resolve(Unit{});
      }
    });
  }
  return out;
}

}  // namespace offload

#endif  // OFFLOAD_OUTCOME_HPP_
