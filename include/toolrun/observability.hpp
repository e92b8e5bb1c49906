#pragma once

// toolrun/observability.hpp: Task-level observability.
//
// DESIGN:
//   TaskEvent is the observable unit: one per finished task, recorded into
//   the owning engine's EngineStats and, when an event log path is
//   configured, appended to it as one JSON line. Diagnostics (encoding
//   fallbacks, cache corruption, config repairs) go to the same sink as
//   {"kind":"diagnostic",...} lines.
//
//   EngineStats belongs to one Engine instance. There is no global instance.
//
// EXTENSION_POINT: event_hook
//   set_event_hook() intercepts task events and diagnostics before the JSONL
//   sink. Invariant: hooks must not block; they run on engine worker threads.
//   Event attributes carry metadata only; stdout/stderr content never leaves
//   the engine through this path.

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "toolrun/types.hpp"

namespace toolrun {

struct TaskEvent {
  std::uint64_t task_id{0};
  std::string tool;          // argv[0]
  std::string fingerprint;   // empty when not cacheable
  TaskState state{TaskState::pending};
  ErrorCode error_code{ErrorCode::none};
  int exit_code{0};
  std::uint64_t duration_ns{0};
  std::size_t bytes_stdout{0};
  std::size_t bytes_stderr{0};
  std::string stdout_encoding;
  bool encoding_fallback{false};
  bool converted{false};
  bool from_cache{false};
  bool coalesced{false};
  std::int64_t budget_s{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 40;  // up to ~2^39 us, about six days

  void record(std::uint64_t duration_ns);

  // Approximate percentile, p in [0, 1]. Microseconds; 0 with no samples.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: per-engine counters
// ---------------------------------------------------------------------------
// Counters are updated from worker threads; each sits on its own cache line.
class EngineStats {
 public:
  void record_task(const TaskEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> tasks_finished{0};
  alignas(64) std::atomic<std::uint64_t> succeeded{0};
  alignas(64) std::atomic<std::uint64_t> failed{0};
  alignas(64) std::atomic<std::uint64_t> timed_out{0};
  alignas(64) std::atomic<std::uint64_t> cancelled{0};
  alignas(64) std::atomic<std::uint64_t> tool_not_found{0};

  alignas(64) std::atomic<std::uint64_t> processes_spawned{0};
  alignas(64) std::atomic<std::uint64_t> forced_kills{0};

  alignas(64) std::atomic<std::uint64_t> cache_hits{0};
  alignas(64) std::atomic<std::uint64_t> cache_misses{0};
  alignas(64) std::atomic<std::uint64_t> coalesced{0};
  alignas(64) std::atomic<std::uint64_t> cache_corruptions{0};

  alignas(64) std::atomic<std::uint64_t> encoding_fallbacks{0};
  alignas(64) std::atomic<std::uint64_t> outputs_converted{0};
  alignas(64) std::atomic<std::uint64_t> prescans_incomplete{0};

  // Mirrored from the progress dispatcher at to_json() time.
  alignas(64) std::atomic<std::uint64_t> progress_dropped{0};

  LatencyHistogram latency_histogram;
};

using EventHook = std::function<void(const std::string& json_line)>;

// JSONL event sink. One per engine; writes are serialized.
class EventLog {
 public:
  explicit EventLog(std::string path = "") : path_(std::move(path)) {}

  void set_hook(EventHook hook);

  void emit_task(const TaskEvent& ev);
  void emit_diagnostic(std::uint64_t task_id, const std::string& code, const std::string& message);

  const std::string& path() const { return path_; }

 private:
  void write_line(const std::string& line);

  const std::string path_;
  std::mutex mu_;
  EventHook hook_;
};

std::string task_event_to_json(const TaskEvent& ev);

}  // namespace toolrun
