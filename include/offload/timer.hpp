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
 * @file timer.hpp
 * @brief Periodic and one-shot timer scheduler driven by a background thread.
 *
 * Every deadline in the engine (job timeout, handshake, health probe, cancel
 * acknowledgment) and the periodic health tick is a task on a
 * TimerScheduler. Callbacks run on the scheduler thread outside the internal
 * lock, so a callback may Add() or Remove() tasks freely.
 *
 * Remove() on a one-shot task that has already been collected for firing
 * returns TimerError::kNotFound; completion paths use this to learn they
 * lost the race against their own deadline.
 */

#ifndef OFFLOAD_TIMER_HPP_
#define OFFLOAD_TIMER_HPP_

#include "offload/platform.hpp"
#include "offload/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// TimerTaskId / TimerError
// ============================================================================

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,  ///< Periodic task registered with period 0.
  kNotFound,           ///< Task id unknown, removed, or one-shot already fired.
  kAlreadyRunning,     ///< Start() called twice.
};

/// @brief Callback invoked by the scheduler thread.
using TimerTaskFn = std::function<void()>;

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Timer scheduler with a growable task table.
 *
 * Typical usage:
 *
 *   offload::TimerScheduler sched;
 *   sched.Start();
 *   auto tick = sched.Add(1000, [] { ... });        // every second
 *   auto once = sched.AddOneShot(50, [] { ... });   // once, after 50 ms
 *   (void)sched.Remove(once.value());
 *   sched.Stop();
 *
 * The loop state is shared with the scheduler thread, so Stop() may be
 * called from inside a timer callback: the thread is detached instead of
 * joined and finishes on its own.
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  TimerScheduler() : state_(std::make_shared<State>()) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Register a periodic task.
   *
   * @param period_ms  Firing period in milliseconds (must be > 0).
   * @param fn         Callback invoked every period_ms milliseconds.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn) {
    if (period_ms == 0U) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }
    return Insert(period_ms, std::move(fn), false);
  }

  /**
   * @brief Register a task that fires once after delay_ms.
   *
   * A delay of 0 fires on the next scheduler round.
   */
  expected<TimerTaskId, TimerError> AddOneShot(uint32_t delay_ms,
                                               TimerTaskFn fn) {
    return Insert(delay_ms, std::move(fn), true);
  }

  /**
   * @brief Remove a task before it fires (again).
   *
   * @return Success, or kNotFound if the id is unknown, already removed, or
   *         a one-shot that has already been handed to the scheduler thread.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    TimerTaskFn doomed;
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      for (auto& slot : state_->slots) {
        if (slot.active && slot.id == task_id.value()) {
          slot.active = false;
          doomed = std::move(slot.fn);
          slot.fn = nullptr;
          found = true;
          state_->cv.notify_one();
          break;
        }
      }
    }
    // Captured state is destroyed outside the lock.
    if (found) {
      return expected<void, TimerError>::success();
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->running) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    state_->running = true;
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, state_);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the scheduler thread and drop every pending task.
   *
   * Blocks until the thread exits, unless called from a timer callback.
   * Safe to call when not running.
   */
  void Stop() {
    std::vector<TaskSlot> dropped;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->running = false;
      dropped.swap(state_->slots);
      state_->cv.notify_all();
    }
    if (worker_.joinable()) {
      if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
      } else {
        worker_.join();
      }
    }
  }

  bool IsRunning() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
  }

  /// @brief Number of tasks still scheduled to fire.
  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    uint32_t count = 0U;
    for (const auto& slot : state_->slots) {
      if (slot.active) {
        ++count;
      }
    }
    return count;
  }

 private:
  // --------------------------------------------------------------------------
  // Internal Types
  // --------------------------------------------------------------------------

  struct TaskSlot {
    TimerTaskFn fn;             ///< Callback.
    uint64_t period_ns = 0;     ///< Period (periodic) or delay (one-shot).
    uint64_t next_fire_ns = 0;  ///< Next absolute fire time (monotonic ns).
    uint32_t id = 0;            ///< Unique task identifier.
    bool active = false;        ///< Whether this slot is in use.
    bool one_shot = false;      ///< Deactivated when collected for firing.
  };

  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::vector<TaskSlot> slots;
    uint32_t next_id = 1;
    bool running = false;
  };

  expected<TimerTaskId, TimerError> Insert(uint32_t ms, TimerTaskFn fn,
                                           bool one_shot) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    TaskSlot* slot = nullptr;
    for (auto& s : state_->slots) {
      if (!s.active) {
        slot = &s;
        break;
      }
    }
    if (slot == nullptr) {
      state_->slots.emplace_back();
      slot = &state_->slots.back();
    }
    const uint64_t period_ns = static_cast<uint64_t>(ms) * 1000000ULL;
    slot->fn = std::move(fn);
    slot->period_ns = period_ns;
    slot->next_fire_ns = SteadyNowNs() + period_ns;
    slot->id = state_->next_id++;
    slot->one_shot = one_shot;
    slot->active = true;
    state_->cv.notify_one();
    return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot->id));
  }

  // --------------------------------------------------------------------------
  // Scheduler Loop
  // --------------------------------------------------------------------------

  /**
   * @brief Collect due tasks under the lock, run them without it, then sleep
   *        until the earliest remaining deadline or the next Add/Remove.
   */
  static void ScheduleLoop(std::shared_ptr<State> state) {
    std::vector<TimerTaskFn> due;
    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->running) {
      const uint64_t now = SteadyNowNs();
      uint64_t earliest = UINT64_MAX;

      for (auto& slot : state->slots) {
        if (!slot.active) {
          continue;
        }
        if (now >= slot.next_fire_ns) {
          if (slot.one_shot) {
            due.push_back(std::move(slot.fn));
            slot.fn = nullptr;
            slot.active = false;
            continue;
          }
          due.push_back(slot.fn);
          slot.next_fire_ns += slot.period_ns;
          // Skip missed periods.
          while (slot.next_fire_ns <= now) {
            slot.next_fire_ns += slot.period_ns;
          }
        }
        if (slot.next_fire_ns < earliest) {
          earliest = slot.next_fire_ns;
        }
      }

      if (!due.empty()) {
        lock.unlock();
        for (auto& fn : due) {
          if (fn) {
            fn();
          }
        }
        due.clear();
        lock.lock();
        continue;
      }

      if (earliest == UINT64_MAX) {
        state->cv.wait(lock);
      } else {
        state->cv.wait_for(lock, std::chrono::nanoseconds(earliest - now));
      }
    }
  }

  std::shared_ptr<State> state_;
  std::thread worker_;
};

}  // namespace offload

#endif  // OFFLOAD_TIMER_HPP_
