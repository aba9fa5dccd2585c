/**
 * @file test_integration.cpp
 * @brief Cross-module integration tests for the offload engine.
 *
 * Drives DiscretePool and StreamPipeline with ThreadWorker programs, so
 * every delivery crosses a real thread boundary.
 */

#include "offload/discrete_pool.hpp"
#include "offload/stream_pipeline.hpp"
#include "offload/thread_worker.hpp"

#include "mock_worker.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using offload_test::CountingStreamProtocol;
using offload_test::StreamLog;
using offload_test::StreamRequest;
using offload_test::TestHandshake;
using offload_test::TestMessage;
using offload_test::TestPayload;
using offload_test::TimesTenProtocol;
using offload_test::WaitUntil;

namespace {

using Port = offload::WorkerPort<TestPayload>;

/// Job program: result = request * 10; a negative request never answers.
class TimesTenProgram final : public offload::WorkerProgram<TestPayload> {
 public:
  void OnStart(Port& port) override { port.Post(TestMessage("ready", "")); }

  void OnMessage(const TestMessage& msg, Port& port) override {
    if (msg.type == "init") {
      port.Post(TestMessage("init_done", msg.id));
    } else if (msg.type == "health") {
      TestMessage reply("health_ok", msg.id);
      reply.healthy = true;
      port.Post(reply);
    } else if (msg.type == "job") {
      const int v = msg.payload.at(0);
      if (v < 0) {
        while (!port.StopRequested()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      port.Post(TestMessage("result", msg.id, TestPayload{v * 10}));
    } else if (msg.type == "batch") {
      TestPayload out;
      for (int v : msg.payload) {
        out.push_back(v * 10);
      }
      port.Post(TestMessage("batch_result", msg.id, out));
    }
  }
};

/// Stream program: emits key chunks 1..key, honouring cancel between chunks.
class CountingProgram final : public offload::WorkerProgram<TestPayload> {
 public:
  void OnStart(Port& port) override { port.Post(TestMessage("ready", "")); }

  void OnMessage(const TestMessage& msg, Port& port) override {
    if (msg.type != "start") {
      return;
    }
    const int count = msg.payload.at(0);
    int total = 0;
    for (int i = 1; i <= count; ++i) {
      if (port.StopRequested()) {
        return;
      }
      if (port.TakePending("cancel", msg.id)) {
        port.Post(TestMessage("cancelled", msg.id));
        return;
      }
      port.Post(TestMessage("chunk", msg.id, TestPayload{i}));
      total += i;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    port.Post(TestMessage("complete", msg.id, TestPayload{total}));
  }
};

}  // namespace

// ============================================================================
// DiscretePool + ThreadWorker
// ============================================================================

TEST_CASE("integration - DiscretePool over thread workers", "[integration]") {
  offload::DiscretePoolConfig cfg;
  cfg.pool_size = 3U;
  cfg.operation_timeout_ms = 2000U;
  auto pool = offload::DiscretePool<int, int, TestPayload>::Create(
      cfg, TestHandshake(), std::make_shared<TimesTenProtocol>(true),
      offload::MakeThreadWorkerFactory<TestPayload>([](uint32_t) {
        return std::make_unique<TimesTenProgram>();
      }));
  REQUIRE(pool->Start().WaitFor(2000U));
  REQUIRE(pool->GetStats().healthy_workers == 3U);

  std::vector<offload::Outcome<int>> jobs;
  for (int v = 1; v <= 20; ++v) {
    jobs.push_back(pool->SubmitOne(v, v % 3));
  }
  for (size_t i = 0U; i < jobs.size(); ++i) {
    auto r = jobs[i].Wait();
    REQUIRE(r.has_value());
    REQUIRE(r.value() == static_cast<int>(i + 1U) * 10);
  }

  auto batch = pool->SubmitBatch({7, 8, 9}).Wait();
  REQUIRE(batch.value() == std::vector<int>{70, 80, 90});

  auto reports = pool->HealthCheck().Wait().value();
  REQUIRE(reports.size() == 3U);
  for (const auto& report : reports) {
    REQUIRE(report.healthy);
  }
  pool->Shutdown();
}

TEST_CASE("integration - hung thread worker falls back and recovers",
          "[integration]") {
  offload::DiscretePoolConfig cfg;
  cfg.pool_size = 1U;
  cfg.operation_timeout_ms = 50U;
  auto pool = offload::DiscretePool<int, int, TestPayload>::Create(
      cfg, TestHandshake(), std::make_shared<TimesTenProtocol>(),
      offload::MakeThreadWorkerFactory<TestPayload>([](uint32_t) {
        return std::make_unique<TimesTenProgram>();
      }));
  REQUIRE(pool->Start().WaitFor(2000U));

  auto hung = pool->SubmitOne(-4);
  REQUIRE(hung.Wait().value() == 4);
  REQUIRE(pool->GetStats().timeouts == 1U);

  // The program is still stuck; replace its worker.
  auto recovery = pool->RecoverWorker(0);
  REQUIRE(recovery.WaitFor(2000U));
  REQUIRE(recovery.Get().has_value());
  REQUIRE(pool->SubmitOne(5).Wait().value() == 50);
  REQUIRE(pool->GetStats().recoveries == 1U);
  pool->Shutdown();
}

// ============================================================================
// StreamPipeline + ThreadWorker
// ============================================================================

TEST_CASE("integration - StreamPipeline over a thread worker", "[integration]") {
  StreamLog first;
  StreamLog second;
  offload::StreamPipelineConfig cfg;
  cfg.cancel_timeout_ms = 500U;
  offload::HandshakeConfig hs;
  hs.ready_signal = "ready";
  hs.error = "error";
  auto pipeline = offload::StreamPipeline<StreamRequest, int, int, TestPayload>::Create(
      cfg, hs, std::make_shared<CountingStreamProtocol>(),
      offload::MakeThreadWorkerFactory<TestPayload>([](uint32_t) {
        return std::make_unique<CountingProgram>();
      }));

  (void)pipeline->StartStreaming(StreamRequest{4, 0}, first.Callbacks());
  REQUIRE(WaitUntil([&] { return first.Settled(); }));
  REQUIRE(first.chunks == std::vector<int>{1, 2, 3, 4});
  REQUIRE(first.done == 10);

  auto long_stream = pipeline->StartStreaming(StreamRequest{200, 0}, second.Callbacks());
  REQUIRE(WaitUntil([&] {
    std::lock_guard<std::mutex> lock(second.mutex);
    return !second.chunks.empty();
  }));
  REQUIRE(long_stream.Cancel().WaitFor(1000U));
  REQUIRE_FALSE(second.Settled());
  REQUIRE(pipeline->GetStats().cancel_timeouts == 0U);
  pipeline->Shutdown();
}
