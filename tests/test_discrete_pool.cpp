/**
 * @file test_discrete_pool.cpp
 * @brief Tests for discrete_pool.hpp
 */

#include "offload/discrete_pool.hpp"

#include "mock_worker.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using offload_test::AnswerJob;
using offload_test::EchoTimesTen;
using offload_test::FailJobs;
using offload_test::MockBehavior;
using offload_test::MockFactory;
using offload_test::MockWorker;
using offload_test::TestHandshake;
using offload_test::TestMessage;
using offload_test::TimesTenProtocol;
using offload_test::WaitUntil;

namespace {

using Pool = offload::DiscretePool<int, int, offload_test::TestPayload>;

offload::DiscretePoolConfig SmallConfig(uint32_t pool_size) {
  offload::DiscretePoolConfig cfg;
  cfg.pool_size = pool_size;
  cfg.operation_timeout_ms = 2000U;
  cfg.init_timeout_ms = 500U;
  cfg.health_check_timeout_ms = 200U;
  cfg.health_interval_ms = 60000U;
  cfg.queue_max_size = 100U;
  return cfg;
}

std::shared_ptr<Pool> MakePool(const offload::DiscretePoolConfig& cfg,
                               const MockFactory& factory, bool batch = false,
                               bool health = true) {
  auto pool = Pool::Create(cfg, TestHandshake(health),
                           std::make_shared<TimesTenProtocol>(batch),
                           factory.AsFactory());
  pool->Start().Wait();
  return pool;
}

MockFactory EchoFactory() {
  return MockFactory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t) {
    w.SetResponder(EchoTimesTen);
    return true;
  });
}

/// Workers that record jobs and never answer on their own.
MockFactory ManualFactory(bool health = true) {
  return MockFactory(TestHandshake(health));
}

int ValueOf(const offload::Outcome<int>& o) {
  auto r = o.Wait();
  REQUIRE(r.has_value());
  return r.value();
}

}  // namespace

// ============================================================================
// Submission / Dispatch
// ============================================================================

TEST_CASE("DiscretePool resolves with the worker result", "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(2), factory);

  REQUIRE(ValueOf(pool->SubmitOne(7)) == 70);
  REQUIRE(ValueOf(pool->SubmitOne(3)) == 30);

  auto stats = pool->GetStats();
  REQUIRE(stats.worker_count == 2U);
  REQUIRE(stats.healthy_workers == 2U);
  REQUIRE(stats.completed == 2U);
  REQUIRE(stats.fallbacks == 0U);
  REQUIRE(stats.active_jobs == 0U);
}

TEST_CASE("DiscretePool start handshakes every slot", "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(3), factory);

  REQUIRE(factory.TotalCreated() == 3U);
  for (uint32_t i = 0U; i < 3U; ++i) {
    REQUIRE(pool->GetSlotState(i) == offload::SlotState::kReady);
    REQUIRE(factory.Latest(i)->CountReceived("init") == 1U);
    REQUIRE(factory.Latest(i)->Received("init")[0].id == "init-" + std::to_string(i));
  }
}

TEST_CASE("DiscretePool deduplicates identical in-flight requests",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  auto worker = factory.Latest(0);

  auto a = pool->SubmitOne(5);
  auto b = pool->SubmitOne(5);
  REQUIRE(a.SameAs(b));
  REQUIRE(worker->CountReceived("job") == 1U);
  REQUIRE(pool->GetStats().dedup_hits == 1U);
  REQUIRE(pool->GetStats().pending_hashes == 1U);

  AnswerJob(*worker, worker->Received("job")[0]);
  REQUIRE(ValueOf(a) == 50);
  REQUIRE(ValueOf(b) == 50);
  REQUIRE(pool->GetStats().pending_hashes == 0U);

  // Settled hashes no longer deduplicate.
  auto c = pool->SubmitOne(5);
  REQUIRE_FALSE(c.SameAs(a));
  REQUIRE(worker->CountReceived("job") == 2U);
}

TEST_CASE("DiscretePool dispatches queued jobs by ascending priority",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  auto worker = factory.Latest(0);

  auto busy = pool->SubmitOne(100);
  auto p2 = pool->SubmitOne(1, 2);
  auto p0 = pool->SubmitOne(2, 0);
  auto p1 = pool->SubmitOne(3, 1);
  REQUIRE(pool->GetStats().queue_length == 3U);

  for (uint32_t i = 0U; i < 4U; ++i) {
    auto jobs = worker->Received("job");
    REQUIRE(jobs.size() == i + 1U);
    AnswerJob(*worker, jobs.back());
  }

  auto jobs = worker->Received("job");
  REQUIRE(jobs[0].payload[0] == 100);
  REQUIRE(jobs[1].payload[0] == 2);
  REQUIRE(jobs[2].payload[0] == 3);
  REQUIRE(jobs[3].payload[0] == 1);
  REQUIRE(ValueOf(p0) == 20);
  REQUIRE(ValueOf(p1) == 30);
  REQUIRE(ValueOf(p2) == 10);
  REQUIRE(ValueOf(busy) == 1000);
}

TEST_CASE("DiscretePool keeps submission order within a priority tier",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  auto worker = factory.Latest(0);

  (void)pool->SubmitOne(100);
  for (int v = 1; v <= 4; ++v) {
    (void)pool->SubmitOne(v, 1);
  }
  for (uint32_t i = 0U; i < 5U; ++i) {
    AnswerJob(*worker, worker->Received("job").back());
  }
  auto jobs = worker->Received("job");
  REQUIRE(jobs.size() == 5U);
  for (int v = 1; v <= 4; ++v) {
    REQUIRE(jobs[static_cast<size_t>(v)].payload[0] == v);
  }
}

TEST_CASE("DiscretePool evicts the queue tail with its fallback",
          "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.queue_max_size = 2U;
  MockFactory factory = ManualFactory();
  auto pool = MakePool(cfg, factory);

  auto busy = pool->SubmitOne(100);
  auto q1 = pool->SubmitOne(1);
  auto q2 = pool->SubmitOne(2);
  REQUIRE_FALSE(q1.IsSettled());
  REQUIRE_FALSE(q2.IsSettled());

  auto q3 = pool->SubmitOne(3);
  REQUIRE(q3.IsSettled());
  REQUIRE(ValueOf(q3) == -3);
  REQUIRE_FALSE(q1.IsSettled());
  REQUIRE_FALSE(q2.IsSettled());

  auto stats = pool->GetStats();
  REQUIRE(stats.evictions == 1U);
  REQUIRE(stats.queue_length == 2U);

  // A more urgent newcomer pushes out the least urgent queued item.
  auto urgent = pool->SubmitOne(4, -1);
  REQUIRE(ValueOf(q2) == -2);
  REQUIRE_FALSE(urgent.IsSettled());
  REQUIRE(pool->GetStats().evictions == 2U);
  REQUIRE(pool->GetStats().queue_length == 2U);
}

// ============================================================================
// Failure Paths
// ============================================================================

TEST_CASE("DiscretePool job timeout resolves with fallback", "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.operation_timeout_ms = 50U;
  MockFactory factory = ManualFactory();
  auto pool = MakePool(cfg, factory);

  const auto start = std::chrono::steady_clock::now();
  auto silent = pool->SubmitOne(9);
  REQUIRE(ValueOf(silent) == -9);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  REQUIRE(elapsed.count() >= 45);
  REQUIRE(pool->GetStats().timeouts == 1U);

  // The slot takes new work right away.
  REQUIRE(pool->GetStats().active_jobs == 0U);
  factory.Latest(0)->SetResponder(EchoTimesTen);
  REQUIRE(ValueOf(pool->SubmitOne(4)) == 40);
}

TEST_CASE("DiscretePool worker-reported error resolves with fallback",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t) {
    w.SetResponder(FailJobs);
    return true;
  });
  auto pool = MakePool(SmallConfig(1), factory);

  REQUIRE(ValueOf(pool->SubmitOne(3)) == -3);
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kReady);
  REQUIRE(pool->GetStats().fallbacks == 1U);
  REQUIRE(factory.CreatedFor(0) == 1U);
}

TEST_CASE("DiscretePool transport error falls back and replaces the worker",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  auto first = factory.Latest(0);

  auto job = pool->SubmitOne(6);
  first->EmitTransportError("worker crashed");
  REQUIRE(ValueOf(job) == -6);

  REQUIRE(WaitUntil([&] { return factory.CreatedFor(0) == 2U; }));
  REQUIRE(WaitUntil(
      [&] { return pool->GetSlotState(0) == offload::SlotState::kReady; }));
  REQUIRE(first->IsTerminated());
  REQUIRE(pool->GetStats().recoveries == 1U);
}

// ============================================================================
// Recovery
// ============================================================================

TEST_CASE("DiscretePool concurrent recovery builds one replacement",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    b.announce_ready = (nth == 0U);
    w.SetBehavior(b);
    return true;
  });
  auto pool = MakePool(SmallConfig(1), factory);

  auto r1 = pool->RecoverWorker(0);
  auto r2 = pool->RecoverWorker(0);
  REQUIRE(r1.SameAs(r2));
  REQUIRE(factory.CreatedFor(0) == 2U);
  REQUIRE_FALSE(r1.IsSettled());

  factory.Latest(0)->Emit(TestMessage("ready", ""));
  REQUIRE(r1.Wait().has_value());
  REQUIRE(r2.Wait().has_value());
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kReady);
  REQUIRE(factory.CreatedFor(0) == 2U);
}

TEST_CASE("DiscretePool recovery falls back the active job and runs the hook",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  std::vector<uint32_t> hooked;
  pool->SetRecoveryHook([&hooked](uint32_t slot) { hooked.push_back(slot); });

  auto job = pool->SubmitOne(8);
  REQUIRE(pool->RecoverWorker(0).Wait().has_value());
  REQUIRE(ValueOf(job) == -8);
  REQUIRE(hooked == std::vector<uint32_t>{0U});
}

TEST_CASE("DiscretePool recovery of an invalid slot is rejected",
          "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(1), factory);
  auto r = pool->RecoverWorker(5).Wait();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().code == offload::EngineError::kInvalidSlot);
}

TEST_CASE("DiscretePool defers recovery after repeated failures",
          "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.failure_window_ms = 60000U;
  cfg.max_failures_in_window = 2U;
  MockFactory factory = EchoFactory();
  auto pool = MakePool(cfg, factory);

  REQUIRE(pool->RecoverWorker(0).Wait().has_value());
  REQUIRE(pool->RecoverWorker(0).Wait().has_value());
  auto third = pool->RecoverWorker(0).Wait();
  REQUIRE_FALSE(third.has_value());
  REQUIRE(third.get_error().code == offload::EngineError::kRecoveryDeferred);
  REQUIRE(factory.CreatedFor(0) == 3U);
}

TEST_CASE("DiscretePool failed recovery leaves the slot unhealthy",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    if (nth == 1U) {
      b.init = MockBehavior::Init::kFail;
    }
    w.SetBehavior(b);
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = MakePool(SmallConfig(1), factory);

  auto r = pool->RecoverWorker(0).Wait();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().code == offload::EngineError::kInitFailed);
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kUnhealthy);

  // Next monitoring pass retries and succeeds.
  pool->PerformHealthMonitoring().Wait();
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kReady);
  REQUIRE(factory.CreatedFor(0) == 3U);
}

TEST_CASE("DiscretePool retries a deferred recovery without a health tick",
          "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.failure_window_ms = 300U;
  cfg.max_failures_in_window = 1U;
  cfg.operation_timeout_ms = 200U;
  MockFactory factory(TestHandshake(false), [](MockWorker& w, uint32_t, uint32_t) {
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = MakePool(cfg, factory, false, false);

  factory.Latest(0)->EmitTransportError("worker crashed");
  REQUIRE(WaitUntil([&] {
    return factory.CreatedFor(0) == 2U &&
           pool->GetSlotState(0) == offload::SlotState::kReady;
  }));

  // Second crash inside the window: recovery is deferred.
  factory.Latest(0)->EmitTransportError("worker crashed again");
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kUnhealthy);
  REQUIRE(factory.CreatedFor(0) == 2U);

  auto job = pool->SubmitOne(7);
  REQUIRE(job.WaitFor(1000U));
  REQUIRE(ValueOf(job) == -7);

  // Once the failure leaves the window the slot is rebuilt on its own.
  REQUIRE(WaitUntil([&] {
    return factory.CreatedFor(0) == 3U &&
           pool->GetSlotState(0) == offload::SlotState::kReady;
  }));
  REQUIRE(ValueOf(pool->SubmitOne(8)) == 80);
}

TEST_CASE("DiscretePool retries a failed recovery without a health tick",
          "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.failure_window_ms = 100U;
  cfg.init_timeout_ms = 50U;
  MockFactory factory(TestHandshake(false), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    b.announce_ready = (nth != 1U);
    w.SetBehavior(b);
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = MakePool(cfg, factory, false, false);

  auto r = pool->RecoverWorker(0).Wait();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kUnhealthy);

  REQUIRE(WaitUntil([&] {
    return factory.CreatedFor(0) == 3U &&
           pool->GetSlotState(0) == offload::SlotState::kReady;
  }));
  REQUIRE(ValueOf(pool->SubmitOne(2)) == 20);
}

TEST_CASE("DiscretePool start keeps a recovery begun before it",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    b.announce_ready = (nth != 0U);
    w.SetBehavior(b);
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = Pool::Create(SmallConfig(1), TestHandshake(),
                           std::make_shared<TimesTenProtocol>(),
                           factory.AsFactory());

  auto early = pool->RecoverWorker(0);
  REQUIRE_FALSE(early.IsSettled());
  auto start = pool->Start();

  // The worker built by Start() is discarded in favour of the recovering one.
  REQUIRE(factory.CreatedFor(0) == 2U);
  REQUIRE(factory.All()[1]->IsTerminated());
  REQUIRE_FALSE(factory.All()[0]->IsTerminated());
  REQUIRE(pool->RecoverWorker(0).SameAs(early));

  factory.All()[0]->Emit(TestMessage("ready", ""));
  REQUIRE(early.Wait().has_value());
  REQUIRE(start.WaitFor(2000U));
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kReady);
  REQUIRE(ValueOf(pool->SubmitOne(3)) == 30);

  // The recovery lock was released, so a later trigger runs anew.
  REQUIRE(pool->RecoverWorker(0).Wait().has_value());
  REQUIRE(factory.CreatedFor(0) == 3U);
}

// ============================================================================
// Initialization
// ============================================================================

TEST_CASE("DiscretePool slot with failed handshake is excluded from dispatch",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t slot, uint32_t nth) {
    MockBehavior b;
    if (slot == 1U && nth == 0U) {
      b.init = MockBehavior::Init::kFail;
    }
    w.SetBehavior(b);
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = MakePool(SmallConfig(2), factory);

  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kReady);
  REQUIRE(pool->GetSlotState(1) == offload::SlotState::kUnhealthy);
  REQUIRE(pool->GetStats().healthy_workers == 1U);

  for (int v = 1; v <= 3; ++v) {
    REQUIRE(ValueOf(pool->SubmitOne(v)) == v * 10);
  }
  REQUIRE(factory.Latest(1)->CountReceived("job") == 0U);

  pool->PerformHealthMonitoring().Wait();
  REQUIRE(pool->GetSlotState(1) == offload::SlotState::kReady);
}

TEST_CASE("DiscretePool handshake timeout and missing worker", "[discrete_pool]") {
  auto cfg = SmallConfig(2);
  cfg.init_timeout_ms = 30U;
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t slot, uint32_t) {
    if (slot == 1U) {
      return false;
    }
    MockBehavior b;
    b.init = MockBehavior::Init::kSilent;
    w.SetBehavior(b);
    return true;
  });
  auto pool = MakePool(cfg, factory);

  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kUnhealthy);
  REQUIRE(pool->GetSlotState(1) == offload::SlotState::kUnhealthy);
  REQUIRE(pool->GetStats().healthy_workers == 0U);

  // No slot can serve or is about to, so work falls back at once.
  auto job = pool->SubmitOne(1);
  REQUIRE(job.IsSettled());
  REQUIRE(ValueOf(job) == -1);
  REQUIRE(pool->GetStats().queue_length == 0U);
  REQUIRE(pool->GetStats().fallbacks == 1U);
}

TEST_CASE("DiscretePool queued work waits while a slot is initializing",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    b.announce_ready = (nth == 0U);
    w.SetBehavior(b);
    w.SetResponder(EchoTimesTen);
    return true;
  });
  auto pool = MakePool(SmallConfig(1), factory);

  auto recovery = pool->RecoverWorker(0);
  auto job = pool->SubmitOne(4);
  REQUIRE_FALSE(job.IsSettled());
  REQUIRE(pool->GetStats().queue_length == 1U);

  factory.Latest(0)->Emit(TestMessage("ready", ""));
  REQUIRE(recovery.Wait().has_value());
  REQUIRE(ValueOf(job) == 40);
}

// ============================================================================
// Batch
// ============================================================================

TEST_CASE("DiscretePool batch occupies one worker", "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(2), factory, true);

  auto r = pool->SubmitBatch({1, 2, 3}).Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{10, 20, 30});
  REQUIRE(factory.Latest(0)->CountReceived("batch") == 1U);
  REQUIRE(factory.Latest(0)->CountReceived("job") == 0U);
  REQUIRE(factory.Latest(1)->CountReceived("batch") == 0U);
}

TEST_CASE("DiscretePool batch without protocol support submits each request",
          "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(2), factory, false);

  auto r = pool->SubmitBatch({4, 5}).Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{40, 50});
  REQUIRE(factory.Latest(0)->CountReceived("job") +
              factory.Latest(1)->CountReceived("job") ==
          2U);
}

TEST_CASE("DiscretePool batch at the lowest priority does not overflow",
          "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(1), factory, false);

  auto r = pool->SubmitBatch({1, 2}, std::numeric_limits<int32_t>::max()).Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{10, 20});
}

TEST_CASE("DiscretePool batch with every worker busy keeps its priority",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory, true);
  auto worker = factory.Latest(0);

  auto busy = pool->SubmitOne(100);
  auto later = pool->SubmitOne(2, 6);
  auto batch = pool->SubmitBatch({3}, 5);
  REQUIRE(pool->GetStats().queue_length == 2U);

  for (uint32_t i = 0U; i < 3U; ++i) {
    auto jobs = worker->Received("job");
    REQUIRE(jobs.size() == i + 1U);
    AnswerJob(*worker, jobs.back());
  }

  auto jobs = worker->Received("job");
  REQUIRE(jobs[1].payload[0] == 3);
  REQUIRE(jobs[2].payload[0] == 2);
  REQUIRE(worker->CountReceived("batch") == 0U);
  auto r = batch.Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{30});
  REQUIRE(ValueOf(later) == 20);
  REQUIRE(ValueOf(busy) == 1000);
}

TEST_CASE("DiscretePool batch timeout retries per request", "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.operation_timeout_ms = 50U;
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t) {
    w.SetResponder([](MockWorker& worker, const TestMessage& msg) {
      if (msg.type == "job") {
        EchoTimesTen(worker, msg);
      }
    });
    return true;
  });
  auto pool = MakePool(cfg, factory, true);

  auto r = pool->SubmitBatch({1, 2}).Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{10, 20});
  REQUIRE(pool->GetStats().timeouts == 1U);
  REQUIRE(factory.Latest(0)->CountReceived("job") == 2U);
}

TEST_CASE("DiscretePool batch error resolves every position with fallback",
          "[discrete_pool]") {
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t) {
    w.SetResponder(FailJobs);
    return true;
  });
  auto pool = MakePool(SmallConfig(1), factory, true);

  auto r = pool->SubmitBatch({1, 2, 3}).Wait();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == std::vector<int>{-1, -2, -3});
}

// ============================================================================
// Health
// ============================================================================

TEST_CASE("DiscretePool health check marks failing slots unhealthy",
          "[discrete_pool]") {
  MockFactory factory = EchoFactory();
  auto pool = MakePool(SmallConfig(2), factory);

  auto all = pool->HealthCheck().Wait();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2U);
  REQUIRE(all.value()[0].healthy);
  REQUIRE(all.value()[1].healthy);
  REQUIRE(factory.Latest(0)->CountReceived("health") == 1U);

  MockBehavior sick;
  sick.health = MockBehavior::Health::kUnhealthy;
  factory.Latest(1)->SetBehavior(sick);
  auto reports = pool->HealthCheck().Wait().value();
  REQUIRE(reports[0].healthy);
  REQUIRE_FALSE(reports[1].healthy);
  REQUIRE(pool->GetSlotState(1) == offload::SlotState::kUnhealthy);

  pool->PerformHealthMonitoring().Wait();
  REQUIRE(factory.CreatedFor(1) == 2U);
  REQUIRE(pool->GetSlotState(1) == offload::SlotState::kReady);
  REQUIRE(factory.CreatedFor(0) == 1U);
}

TEST_CASE("DiscretePool health check times out", "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.health_check_timeout_ms = 30U;
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t) {
    MockBehavior b;
    b.health = MockBehavior::Health::kSilent;
    w.SetBehavior(b);
    return true;
  });
  auto pool = MakePool(cfg, factory);

  auto reports = pool->HealthCheck().Wait().value();
  REQUIRE_FALSE(reports[0].healthy);
  REQUIRE(reports[0].response_time_ms >= 25U);
  REQUIRE(pool->GetSlotState(0) == offload::SlotState::kUnhealthy);
}

TEST_CASE("DiscretePool without health protocol reports flags only",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory(false);
  auto pool = MakePool(SmallConfig(2), factory, false, false);

  auto reports = pool->HealthCheck().Wait().value();
  REQUIRE(reports.size() == 2U);
  REQUIRE(reports[0].healthy);
  REQUIRE(reports[0].response_time_ms == 0U);
  REQUIRE(factory.Latest(0)->CountReceived("health") == 0U);
}

TEST_CASE("DiscretePool monitoring prunes stale pending hashes",
          "[discrete_pool]") {
  auto cfg = SmallConfig(1);
  cfg.operation_timeout_ms = 30U;
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t, uint32_t nth) {
    MockBehavior b;
    b.announce_ready = (nth == 0U);
    w.SetBehavior(b);
    return true;
  });
  auto pool = MakePool(cfg, factory);

  // The replacement never announces itself, so the job stays queued.
  auto recovery = pool->RecoverWorker(0);
  auto waiting = pool->SubmitOne(1);
  REQUIRE_FALSE(waiting.IsSettled());
  REQUIRE_FALSE(recovery.IsSettled());
  REQUIRE(pool->GetStats().pending_hashes == 1U);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  pool->PerformHealthMonitoring().Wait();
  REQUIRE(pool->GetStats().pending_hashes == 0U);
  REQUIRE_FALSE(pool->SubmitOne(1).SameAs(waiting));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("DiscretePool shutdown settles everything with fallbacks",
          "[discrete_pool]") {
  MockFactory factory = ManualFactory();
  auto pool = MakePool(SmallConfig(1), factory);

  auto active = pool->SubmitOne(1);
  auto queued = pool->SubmitOne(2);
  pool->Shutdown();

  REQUIRE(ValueOf(active) == -1);
  REQUIRE(ValueOf(queued) == -2);
  REQUIRE(factory.Latest(0)->IsTerminated());
  REQUIRE(factory.Latest(0)->ListenerCount() == 0U);

  auto late = pool->SubmitOne(3);
  REQUIRE(late.IsSettled());
  REQUIRE(ValueOf(late) == -3);
  REQUIRE(pool->SubmitBatch({4, 5}).Wait().value() == std::vector<int>{-4, -5});

  auto stats = pool->GetStats();
  REQUIRE_FALSE(stats.accepting);
  REQUIRE(stats.terminated);
  REQUIRE(stats.queue_length == 0U);
  REQUIRE(stats.active_jobs == 0U);
  REQUIRE(stats.pending_hashes == 0U);

  pool->Shutdown();
  REQUIRE(pool->GetStats().terminated);
}

// ============================================================================
// End-to-end Scenario
// ============================================================================

TEST_CASE("DiscretePool one silent worker yields exactly one fallback",
          "[discrete_pool]") {
  auto cfg = SmallConfig(2);
  cfg.operation_timeout_ms = 50U;
  MockFactory factory(TestHandshake(), [](MockWorker& w, uint32_t slot, uint32_t) {
    if (slot == 1U) {
      w.SetResponder(EchoTimesTen);
    }
    return true;
  });
  auto pool = MakePool(cfg, factory);

  const auto start = std::chrono::steady_clock::now();
  std::vector<offload::Outcome<int>> jobs;
  for (int v = 1; v <= 4; ++v) {
    jobs.push_back(pool->SubmitOne(v, 0));
  }

  int fallbacks = 0;
  for (size_t i = 0U; i < jobs.size(); ++i) {
    REQUIRE(jobs[i].WaitFor(1000U));
    const int value = ValueOf(jobs[i]);
    if (value < 0) {
      ++fallbacks;
    } else {
      REQUIRE(value == static_cast<int>(i + 1U) * 10);
    }
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  REQUIRE(fallbacks == 1);
  REQUIRE(ValueOf(jobs[0]) == -1);
  REQUIRE(elapsed.count() < 500);
  REQUIRE(pool->GetStats().timeouts == 1U);
}
