// Copyright (c) 2024 liudegui. MIT License.
//
// stream_demo.cpp -- StreamPipeline over a single thread worker.
//
// Demonstrates:
//   1. Lazy initialization on the first stream (ready-signal only)
//   2. Chunked delivery followed by completion
//   3. Supersede: a newer queued request replaces an older one
//   4. Cooperative cancel with a bounded wait
//   5. Worker error resets the pipeline; the next stream re-initializes

#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/stream_pipeline.hpp"
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

using PathList = std::vector<std::string>;
using Payload = std::variant<std::monostate, std::string, PathList, uint32_t>;
using Msg = offload::Message<Payload>;

static constexpr uint32_t kLinesPerChunk = 2U;
static constexpr uint32_t kChunkDelayMs = 20U;

// ============================================================================
// Worker Program: flattens "a/b/c" paths into indented tree lines
// ============================================================================

class TreeFlattenProgram final : public offload::WorkerProgram<Payload> {
 public:
  void OnStart(offload::WorkerPort<Payload>& port) override {
    port.Post(Msg("ready", ""));
  }

  void OnMessage(const Msg& msg, offload::WorkerPort<Payload>& port) override {
    if (msg.type == "flatten-cancel") {
      // Arrived after the stream already finished.
      port.Post(Msg("flatten-cancelled", msg.id));
      return;
    }
    if (msg.type != "flatten") {
      return;
    }
    const PathList& paths = std::get<PathList>(msg.payload);
    PathList lines;
    uint32_t total = 0U;
    for (const auto& path : paths) {
      if (path == "!crash") {
        Msg err("error", msg.id);
        err.error = "corrupt tree entry";
        port.Post(err);
        return;
      }
      uint32_t depth = 0U;
      size_t begin = 0U;
      while (begin <= path.size()) {
        size_t end = path.find('/', begin);
        if (end == std::string::npos) {
          end = path.size();
        }
        lines.push_back(std::string(depth * 2U, ' ') + path.substr(begin, end - begin));
        ++depth;
        ++total;
        begin = end + 1U;
      }
      if (lines.size() >= kLinesPerChunk) {
        if (!EmitChunk(msg.id, lines, port)) {
          return;
        }
      }
    }
    if (!lines.empty() && !EmitChunk(msg.id, lines, port)) {
      return;
    }
    port.Post(Msg("flatten-done", msg.id, total));
  }

 private:
  /// @return false when the stream was cancelled meanwhile.
  static bool EmitChunk(const std::string& id, PathList& lines,
                        offload::WorkerPort<Payload>& port) {
    port.Post(Msg("flatten-chunk", id, lines));
    lines.clear();
    std::this_thread::sleep_for(std::chrono::milliseconds(kChunkDelayMs));
    if (port.StopRequested()) {
      return false;
    }
    if (port.TakePending("flatten-cancel", id)) {
      port.Post(Msg("flatten-cancelled", id));
      return false;
    }
    return true;
  }
};

// ============================================================================
// Stream Protocol (engine side)
// ============================================================================

class TreeProtocol final
    : public offload::StreamProtocol<PathList, PathList, uint32_t, Payload> {
 public:
  offload::StreamTags Tags() const override {
    offload::StreamTags tags;
    tags.start = "flatten";
    tags.chunk = "flatten-chunk";
    tags.complete = "flatten-done";
    tags.cancel = "flatten-cancel";
    tags.cancelled = "flatten-cancelled";
    return tags;
  }

  Payload BuildStart(const PathList& paths) const override { return paths; }

  std::optional<PathList> ParseChunk(const Payload& payload) const override {
    if (const auto* lines = std::get_if<PathList>(&payload)) {
      return *lines;
    }
    return std::nullopt;
  }

  std::optional<uint32_t> ParseComplete(const Payload& payload) const override {
    if (const auto* n = std::get_if<uint32_t>(&payload)) {
      return *n;
    }
    return std::nullopt;
  }

  /// Streams for the same root share a signature.
  uint64_t Hash(const PathList& paths) const override {
    return paths.empty() ? 0U : offload::HashString(paths.front());
  }
};

using TreePipeline = offload::StreamPipeline<PathList, PathList, uint32_t, Payload>;

// ============================================================================
// Helpers
// ============================================================================

/// Callbacks that print chunks and settle `done` with the node count.
static TreePipeline::Callbacks PrintingCallbacks(const char* label,
                                                 offload::Outcome<uint32_t> done,
                                                 bool quiet = false) {
  TreePipeline::Callbacks cb;
  cb.on_chunk = [label, quiet](const PathList& lines) {
    if (quiet) {
      return;
    }
    for (const auto& line : lines) {
      printf("  [%s] %s\n", label, line.c_str());
    }
  };
  cb.on_complete = [done](const uint32_t& total) { (void)done.Resolve(total); };
  cb.on_error = [done](const offload::Failure& f) {
    (void)done.Reject(f.code, f.detail);
  };
  return cb;
}

static void Report(const char* label, const offload::Outcome<uint32_t>& done) {
  if (!done.WaitFor(2000U)) {
    printf("  %-10s : never settled\n", label);
    return;
  }
  const auto r = done.Get();
  if (r.has_value()) {
    printf("  %-10s : complete, %u nodes\n", label, r.value());
  } else {
    printf("  %-10s : error %s (%s)\n", label,
           offload::EngineErrorName(r.get_error().code),
           r.get_error().detail.c_str());
  }
}

// ============================================================================
// Demo
// ============================================================================

int main() {
  offload::log::Init();
  offload::log::SetLevel(offload::log::Level::kInfo);

  printf("\n=== Tree Flatten Stream ===\n");

  offload::HandshakeConfig hs;
  hs.ready_signal = "ready";
  hs.error = "error";

  offload::StreamPipelineConfig cfg;
  cfg.init_timeout_ms = 1000U;
  cfg.cancel_timeout_ms = 200U;

  auto pipeline = TreePipeline::Create(
      cfg, hs, std::make_shared<TreeProtocol>(),
      offload::MakeThreadWorkerFactory<Payload>(
          [](uint32_t) { return std::make_unique<TreeFlattenProgram>(); }));
  printf("  state      : %s\n", offload::PipelineStateName(pipeline->GetState()));

  // 1-2. First stream initializes the worker, then streams.
  offload::Outcome<uint32_t> first;
  pipeline->StartStreaming({"src/engine/pool.cpp", "src/engine/stream.cpp"},
                           PrintingCallbacks("first", first));
  Report("first", first);

  // 3. While "busy" runs, two requests for docs/ queue up; only the newer runs.
  PathList busy;
  for (uint32_t i = 0U; i < 8U; ++i) {
    busy.push_back("build/obj/unit" + std::to_string(i) + ".o");
  }
  offload::Outcome<uint32_t> busy_done;
  offload::Outcome<uint32_t> old_docs;
  offload::Outcome<uint32_t> new_docs;
  pipeline->StartStreaming(busy, PrintingCallbacks("busy", busy_done, true));
  pipeline->StartStreaming({"docs", "docs/old.md"}, PrintingCallbacks("old", old_docs));
  pipeline->StartStreaming({"docs", "docs/guide.md", "docs/api.md"},
                           PrintingCallbacks("docs", new_docs));
  Report("busy", busy_done);
  Report("docs", new_docs);
  printf("  superseded : old request settled = %s\n",
         old_docs.IsSettled() ? "yes" : "no");

  // 4. Cancel a long stream mid-flight.
  PathList big;
  for (uint32_t i = 0U; i < 50U; ++i) {
    big.push_back("vendor/lib" + std::to_string(i) + "/include/lib.h");
  }
  offload::Outcome<uint32_t> big_done;
  offload::StreamHandle handle =
      pipeline->StartStreaming(big, PrintingCallbacks("big", big_done, true));
  std::this_thread::sleep_for(std::chrono::milliseconds(3U * kChunkDelayMs));
  const uint64_t t0 = offload::SteadyNowMs();
  handle.Cancel().Wait();
  printf("  cancel     : settled in %llu ms, stream settled = %s\n",
         static_cast<unsigned long long>(offload::SteadyNowMs() - t0),
         big_done.IsSettled() ? "yes" : "no");

  // 5. A worker error resets the pipeline; the next stream rebuilds it.
  offload::Outcome<uint32_t> broken;
  pipeline->StartStreaming({"ok/file", "!crash"}, PrintingCallbacks("broken", broken));
  Report("broken", broken);
  printf("  state      : %s\n", offload::PipelineStateName(pipeline->GetState()));

  offload::Outcome<uint32_t> again;
  pipeline->StartStreaming({"tests/unit.cpp"}, PrintingCallbacks("again", again));
  Report("again", again);

  const auto stats = pipeline->GetStats();
  printf("  stats      : started=%llu completed=%llu errors=%llu cancels=%llu "
         "superseded=%llu reinit=%llu\n",
         static_cast<unsigned long long>(stats.started),
         static_cast<unsigned long long>(stats.completed),
         static_cast<unsigned long long>(stats.errors),
         static_cast<unsigned long long>(stats.cancels),
         static_cast<unsigned long long>(stats.superseded),
         static_cast<unsigned long long>(stats.reinitializations));

  pipeline->Shutdown();
  offload::log::Shutdown();
  return 0;
}
