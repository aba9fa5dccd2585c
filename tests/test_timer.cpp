/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "offload/timer.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  offload::TimerScheduler sched;

  auto result = sched.Add(100, [] {});
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0U);

  auto rm = sched.Remove(result.value());
  REQUIRE(rm.has_value());
}

TEST_CASE("TimerScheduler invalid period", "[timer]") {
  offload::TimerScheduler sched;
  auto result = sched.Add(0, [] {});
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == offload::TimerError::kInvalidPeriod);
}

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  offload::TimerScheduler sched;
  auto start_result = sched.Start();
  REQUIRE(start_result.has_value());
  REQUIRE(sched.IsRunning());

  // Double start should fail
  auto start2 = sched.Start();
  REQUIRE(!start2.has_value());
  REQUIRE(start2.get_error() == offload::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
}

TEST_CASE("TimerScheduler TaskCount", "[timer]") {
  offload::TimerScheduler sched;
  REQUIRE(sched.TaskCount() == 0U);

  auto r1 = sched.Add(100, [] {});
  REQUIRE(sched.TaskCount() == 1U);

  auto r2 = sched.AddOneShot(200, [] {});
  REQUIRE(r2.has_value());
  REQUIRE(sched.TaskCount() == 2U);

  (void)sched.Remove(r1.value());
  REQUIRE(sched.TaskCount() == 1U);
}

TEST_CASE("TimerScheduler Remove nonexistent", "[timer]") {
  offload::TimerScheduler sched;
  auto result = sched.Remove(offload::TimerTaskId(999));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == offload::TimerError::kNotFound);

  auto r1 = sched.Add(100, [] {});
  REQUIRE(sched.Remove(r1.value()).has_value());
  // Second remove should fail
  REQUIRE(!sched.Remove(r1.value()).has_value());
}

TEST_CASE("TimerScheduler slots are reused", "[timer]") {
  offload::TimerScheduler sched;
  for (int i = 0; i < 50; ++i) {
    auto r = sched.AddOneShot(1000, [] {});
    REQUIRE(r.has_value());
    REQUIRE(sched.Remove(r.value()).has_value());
  }
  REQUIRE(sched.TaskCount() == 0U);
}

// ============================================================================
// Firing Tests
// ============================================================================

TEST_CASE("TimerScheduler fires periodic callback", "[timer]") {
  std::atomic<int> counter{0};
  offload::TimerScheduler sched;

  (void)sched.Add(10, [&counter] { counter.fetch_add(1); });
  (void)sched.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();

  REQUIRE(counter.load() > 1);
}

TEST_CASE("TimerScheduler one-shot fires exactly once", "[timer]") {
  std::atomic<int> counter{0};
  offload::TimerScheduler sched;
  (void)sched.Start();

  auto r = sched.AddOneShot(10, [&counter] { counter.fetch_add(1); });
  REQUIRE(r.has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  REQUIRE(counter.load() == 1);
  REQUIRE(sched.TaskCount() == 0U);

  // A fired one-shot can no longer be removed.
  auto rm = sched.Remove(r.value());
  REQUIRE(!rm.has_value());
  REQUIRE(rm.get_error() == offload::TimerError::kNotFound);
  sched.Stop();
}

TEST_CASE("TimerScheduler removed one-shot never fires", "[timer]") {
  std::atomic<int> counter{0};
  offload::TimerScheduler sched;
  (void)sched.Start();

  auto r = sched.AddOneShot(30, [&counter] { counter.fetch_add(1); });
  REQUIRE(sched.Remove(r.value()).has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(counter.load() == 0);
  sched.Stop();
}

TEST_CASE("TimerScheduler faster timers fire more often", "[timer]") {
  std::atomic<int> fast{0};
  std::atomic<int> slow{0};
  offload::TimerScheduler sched;

  (void)sched.Add(10, [&fast] { fast.fetch_add(1); });
  (void)sched.Add(40, [&slow] { slow.fetch_add(1); });
  (void)sched.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  sched.Stop();

  REQUIRE(slow.load() > 0);
  REQUIRE(fast.load() > slow.load());
}

TEST_CASE("TimerScheduler callback may add and stop", "[timer]") {
  std::atomic<int> chained{0};
  auto sched = std::make_shared<offload::TimerScheduler>();
  (void)sched->Start();

  (void)sched->AddOneShot(5, [&chained, &sched] {
    (void)sched->AddOneShot(5, [&chained] { chained.fetch_add(1); });
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(chained.load() == 1);

  std::atomic<bool> stopped{false};
  (void)sched->AddOneShot(5, [&stopped, &sched] {
    sched->Stop();
    stopped.store(true);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  REQUIRE(stopped.load());
  REQUIRE(!sched->IsRunning());
}

TEST_CASE("TimerScheduler Stop drops pending tasks", "[timer]") {
  std::atomic<int> counter{0};
  offload::TimerScheduler sched;
  (void)sched.Start();
  (void)sched.AddOneShot(50, [&counter] { counter.fetch_add(1); });
  sched.Stop();
  REQUIRE(sched.TaskCount() == 0U);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  REQUIRE(counter.load() == 0);
}
