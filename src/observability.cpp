#include "toolrun/observability.hpp"

#include <bit>
#include <chrono>
#include <cstdio>
#include <ctime>

#include "toolrun/jsonlite.hpp"

namespace toolrun {

namespace {

// MICRO_OPT: bit_width gives the bucket index directly (BSR/CLZ).
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

std::uint64_t unix_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_ms\":" + fixed(mean_us() / 1000.0, "%.3f");
  out += ",\"p50_ms\":" + fixed(percentile(0.50) / 1000.0, "%.3f");
  out += ",\"p95_ms\":" + fixed(percentile(0.95) / 1000.0, "%.3f");
  out += ",\"p99_ms\":" + fixed(percentile(0.99) / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_task(const TaskEvent& ev) {
  tasks_finished.fetch_add(1, std::memory_order_relaxed);
  switch (ev.state) {
    case TaskState::succeeded: succeeded.fetch_add(1, std::memory_order_relaxed); break;
    case TaskState::timed_out: timed_out.fetch_add(1, std::memory_order_relaxed); break;
    case TaskState::cancelled: cancelled.fetch_add(1, std::memory_order_relaxed); break;
    default: failed.fetch_add(1, std::memory_order_relaxed); break;
  }
  if (ev.error_code == ErrorCode::tool_not_found) {
    tool_not_found.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.encoding_fallback) encoding_fallbacks.fetch_add(1, std::memory_order_relaxed);
  if (ev.converted) outputs_converted.fetch_add(1, std::memory_order_relaxed);
  // Cache hits finish in microseconds and would swamp the run-time histogram.
  if (!ev.from_cache) latency_histogram.record(ev.duration_ns);
}

std::string EngineStats::to_json() const {
  auto v = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  const std::uint64_t hits = cache_hits.load(std::memory_order_relaxed);
  const std::uint64_t lookups = hits + cache_misses.load(std::memory_order_relaxed);
  const double hit_rate = lookups ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;

  std::string out;
  out.reserve(768);
  out += "{\"tasks\":{\"finished\":" + v(tasks_finished);
  out += ",\"succeeded\":" + v(succeeded);
  out += ",\"failed\":" + v(failed);
  out += ",\"timed_out\":" + v(timed_out);
  out += ",\"cancelled\":" + v(cancelled);
  out += ",\"tool_not_found\":" + v(tool_not_found);
  out += "},\"processes\":{\"spawned\":" + v(processes_spawned);
  out += ",\"forced_kills\":" + v(forced_kills);
  out += "},\"cache\":{\"hits\":" + v(cache_hits);
  out += ",\"misses\":" + v(cache_misses);
  out += ",\"coalesced\":" + v(coalesced);
  out += ",\"corruptions\":" + v(cache_corruptions);
  out += ",\"hit_rate\":" + fixed(hit_rate, "%.6f");
  out += "},\"output\":{\"encoding_fallbacks\":" + v(encoding_fallbacks);
  out += ",\"converted\":" + v(outputs_converted);
  out += "},\"prescans_incomplete\":" + v(prescans_incomplete);
  out += ",\"progress_dropped\":" + v(progress_dropped);
  out += ",\"latency\":" + latency_histogram.to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EventLog
// ---------------------------------------------------------------------------

std::string task_event_to_json(const TaskEvent& ev) {
  std::string line;
  line.reserve(320);
  line += "{\"kind\":\"task\",\"ts_ms\":" + std::to_string(unix_ms());
  line += ",\"task_id\":" + std::to_string(ev.task_id);
  line += ",\"tool\":\"" + jsonlite::escape(ev.tool) + "\"";
  line += ",\"fingerprint\":\"" + ev.fingerprint + "\"";
  line += ",\"state\":\"" + to_string(ev.state) + "\"";
  line += ",\"error_code\":\"" + to_string(ev.error_code) + "\"";
  line += ",\"exit_code\":" + std::to_string(ev.exit_code);
  line += ",\"duration_ns\":" + std::to_string(ev.duration_ns);
  line += ",\"bytes_stdout\":" + std::to_string(ev.bytes_stdout);
  line += ",\"bytes_stderr\":" + std::to_string(ev.bytes_stderr);
  line += ",\"stdout_encoding\":\"" + jsonlite::escape(ev.stdout_encoding) + "\"";
  line += ",\"encoding_fallback\":";
  line += ev.encoding_fallback ? "true" : "false";
  line += ",\"converted\":";
  line += ev.converted ? "true" : "false";
  line += ",\"from_cache\":";
  line += ev.from_cache ? "true" : "false";
  line += ",\"coalesced\":";
  line += ev.coalesced ? "true" : "false";
  line += ",\"budget_s\":" + std::to_string(ev.budget_s);
  line += '}';
  return line;
}

void EventLog::set_hook(EventHook hook) {
  std::lock_guard<std::mutex> lk(mu_);
  hook_ = std::move(hook);
}

void EventLog::emit_task(const TaskEvent& ev) { write_line(task_event_to_json(ev)); }

void EventLog::emit_diagnostic(std::uint64_t task_id, const std::string& code,
                               const std::string& message) {
  std::string line;
  line.reserve(128 + message.size());
  line += "{\"kind\":\"diagnostic\",\"ts_ms\":" + std::to_string(unix_ms());
  line += ",\"task_id\":" + std::to_string(task_id);
  line += ",\"code\":\"" + jsonlite::escape(code) + "\"";
  line += ",\"message\":\"" + jsonlite::escape(message) + "\"}";
  write_line(line);
}

void EventLog::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (hook_) hook_(line);
  if (path_.empty()) return;
  // Appends under O_APPEND; the mutex keeps lines from one engine whole.
  if (FILE* f = std::fopen(path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fputc('\n', f);
    std::fclose(f);
  }
}

}  // namespace toolrun
