// Copyright (c) 2024 liudegui. MIT License.
//
// token_count_demo.cpp -- DiscretePool over thread workers.
//
// Demonstrates:
//   1. Pool start-up and handshake (ready -> init -> init_done)
//   2. Deduplicated and prioritized submissions
//   3. Batch submission occupying one worker
//   4. Per-job timeout with fallback estimate, then worker recovery
//   5. Health check, statistics, and optional INI configuration
//
// Usage: token_count_demo [engine.ini]

#include "offload/config.hpp"
#include "offload/discrete_pool.hpp"
#include "offload/log.hpp"
#include "offload/thread_worker.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

// ============================================================================
// Wire Types
// ============================================================================

using TextList = std::vector<std::string>;
using CountList = std::vector<uint32_t>;
using Payload = std::variant<std::monostate, std::string, uint32_t, TextList, CountList>;
using Msg = offload::Message<Payload>;

static offload::HandshakeConfig TokenHandshake() {
  offload::HandshakeConfig hs;
  hs.ready_signal = "worker-ready";
  hs.init_request = "init";
  hs.init_response = "init-complete";
  hs.error = "error";
  hs.health_check = "health-check";
  hs.health_response = "health-response";
  return hs;
}

// ============================================================================
// Worker Program (runs on the worker thread)
// ============================================================================

/// Whitespace-separated words, long words counted once per 4 characters.
static uint32_t CountTokens(const std::string& text) {
  uint32_t tokens = 0U;
  uint32_t run = 0U;
  for (char c : text) {
    if (c == ' ' || c == '\n' || c == '\t') {
      tokens += (run + 3U) / 4U;
      run = 0U;
    } else {
      ++run;
    }
  }
  return tokens + (run + 3U) / 4U;
}

class TokenCounterProgram final : public offload::WorkerProgram<Payload> {
 public:
  void OnStart(offload::WorkerPort<Payload>& port) override {
    port.Post(Msg("worker-ready", ""));
  }

  void OnMessage(const Msg& msg, offload::WorkerPort<Payload>& port) override {
    if (msg.type == "init") {
      port.Post(Msg("init-complete", msg.id));
    } else if (msg.type == "health-check") {
      port.Post(Msg("health-response", msg.id));
    } else if (msg.type == "count") {
      const auto* text = std::get_if<std::string>(&msg.payload);
      if (text == nullptr) {
        Msg err("error", msg.id);
        err.error = "count expects text";
        port.Post(err);
        return;
      }
      if (text->find("<stall>") != std::string::npos) {
        // Simulated runaway input: never answers until terminated.
        while (!port.StopRequested()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return;
      }
      port.Post(Msg("count-result", msg.id, CountTokens(*text)));
    } else if (msg.type == "batch-count") {
      CountList counts;
      for (const auto& text : std::get<TextList>(msg.payload)) {
        counts.push_back(CountTokens(text));
      }
      port.Post(Msg("batch-count-result", msg.id, counts));
    }
  }
};

// ============================================================================
// Job Protocol (engine side)
// ============================================================================

class TokenProtocol final
    : public offload::JobProtocol<std::string, uint32_t, Payload> {
 public:
  offload::JobTags Tags() const override {
    offload::JobTags tags;
    tags.job = "count";
    tags.result = "count-result";
    tags.batch = "batch-count";
    tags.batch_result = "batch-count-result";
    return tags;
  }

  Payload BuildJob(const std::string& text) const override { return text; }

  Payload BuildBatch(const std::vector<std::string>& texts) const override {
    return TextList(texts);
  }

  std::optional<uint32_t> ParseResult(const Payload& payload,
                                      const std::string&) const override {
    if (const auto* n = std::get_if<uint32_t>(&payload)) {
      return *n;
    }
    return std::nullopt;
  }

  std::optional<std::vector<uint32_t>> ParseBatchResult(
      const Payload& payload, const std::vector<std::string>&) const override {
    if (const auto* counts = std::get_if<CountList>(&payload)) {
      return *counts;
    }
    return std::nullopt;
  }

  /// Length-based estimate when no worker answer is available.
  uint32_t Fallback(const std::string& text) const override {
    return static_cast<uint32_t>((text.size() + 3U) / 4U);
  }

  uint64_t Hash(const std::string& text) const override {
    return offload::HashString(text);
  }
};

using TokenPool = offload::DiscretePool<std::string, uint32_t, Payload>;

// ============================================================================
// Demo
// ============================================================================

static offload::DiscretePoolConfig LoadConfig(int argc, char** argv) {
  offload::DiscretePoolConfig cfg;
  cfg.pool_size = 2U;
  cfg.operation_timeout_ms = 200U;
  cfg.health_interval_ms = 1000U;
#ifdef OFFLOAD_CONFIG_INI_ENABLED
  if (argc > 1) {
    offload::Config<offload::IniBackend> ini;
    if (ini.LoadFile(argv[1]).has_value()) {
      cfg = offload::LoadPoolConfig(ini, "token_pool", cfg);
      printf("  config     : loaded [token_pool] from %s\n", argv[1]);
    }
  }
#else
  (void)argc;
  (void)argv;
#endif
  return cfg;
}

int main(int argc, char** argv) {
  offload::log::Init();
  offload::log::SetLevel(offload::log::Level::kInfo);

  printf("\n=== Token Count Pool ===\n");
  const offload::DiscretePoolConfig cfg = LoadConfig(argc, argv);

  auto pool = TokenPool::Create(
      cfg, TokenHandshake(), std::make_shared<TokenProtocol>(),
      offload::MakeThreadWorkerFactory<Payload>(
          [](uint32_t) { return std::make_unique<TokenCounterProgram>(); }));
  pool->SetRecoveryHook(
      [](uint32_t slot) { printf("  recovered  : worker %u\n", slot); });
  pool->Start().Wait();
  printf("  workers    : %u ready\n", pool->GetStats().healthy_workers);

  // Identical text shares one job.
  auto a = pool->SubmitOne("the quick brown fox jumps over the lazy dog");
  auto b = pool->SubmitOne("the quick brown fox jumps over the lazy dog");
  auto urgent = pool->SubmitOne("selected file contents", -1);
  printf("  dedup      : same outcome = %s\n", a.SameAs(b) ? "yes" : "no");
  printf("  counts     : %u / %u / %u\n", a.Wait().value(), b.Wait().value(),
         urgent.Wait().value());

  auto batch = pool->SubmitBatch({"alpha beta", "gamma", "delta epsilon zeta"});
  const auto counts = batch.Wait().value();
  printf("  batch      : %u %u %u\n", counts[0], counts[1], counts[2]);

  // A stalled worker: the caller gets the estimate, the slot gets replaced.
  const std::string stalled = "<stall> this input never finishes counting";
  auto slow = pool->SubmitOne(stalled);
  printf("  timeout    : fallback estimate %u\n", slow.Wait().value());
  pool->PerformHealthMonitoring().Wait();

  auto reports = pool->HealthCheck().Wait().value();
  for (const auto& r : reports) {
    printf("  health     : worker %u %s (%u ms)\n", r.slot,
           r.healthy ? "healthy" : "unhealthy", r.response_time_ms);
  }

  const auto stats = pool->GetStats();
  printf("  stats      : dispatched=%llu completed=%llu fallbacks=%llu "
         "timeouts=%llu dedup=%llu\n",
         static_cast<unsigned long long>(stats.dispatched),
         static_cast<unsigned long long>(stats.completed),
         static_cast<unsigned long long>(stats.fallbacks),
         static_cast<unsigned long long>(stats.timeouts),
         static_cast<unsigned long long>(stats.dedup_hits));

  pool->Shutdown();
  offload::log::Shutdown();
  return 0;
}
