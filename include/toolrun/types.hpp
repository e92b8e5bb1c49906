#pragma once

// toolrun/types.hpp: Core value types for the toolrun execution engine.
//
// OWNERSHIP:
//   - CommandSpec, ExecutionResult, ProgressEvent and ScaleSignals are value
//     types. All string members are value-owned; nothing borrows.
//   - ExecutionResult is returned by value and delivered identically to every
//     task attached to the same in-flight run.
//
// ERROR MODEL:
//   No exception crosses the engine boundary. Every outcome is normalized into
//   an ExecutionResult carrying a TaskState, an ErrorCode and a diagnostic.
//   Cancelled and TimedOut are terminal outcomes, not failures.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolrun {

enum class ErrorCode {
  none,
  tool_not_found,
  spawn_failed,
  invalid_spec,
  encoding_exhausted,
  timeout,
  cancelled,
  process_failed,
  cache_corruption,
  internal_error,
};

std::string to_string(ErrorCode code);

enum class TaskState {
  pending,
  running,
  succeeded,
  failed,
  timed_out,
  cancelled,
};

std::string to_string(TaskState state);
bool is_terminal(TaskState state);

// Normalized description of one external invocation.
// argv[0] is the tool (bare name resolved via PATH, or a path).
struct CommandSpec {
  std::vector<std::string> argv;
  std::string cwd;                                // empty = inherit
  std::optional<std::chrono::seconds> timeout;    // explicit budget wins over estimates
  std::string encoding_hint;                      // tried before the configured chain
  std::map<std::string, std::string> env;         // merged over the inherited environment
  std::size_t max_output_bytes{0};                // per stream; 0 = unlimited
};

// Quantitative workload-size indicators consumed by the timeout estimator.
struct ScaleSignals {
  std::uint64_t item_count{0};
  std::uint64_t dir_count{0};
  std::uint64_t total_bytes{0};
  bool complete{true};  // false when a pre-scan was cut short
};

struct ProgressEvent {
  std::uint64_t task_id{0};
  std::uint64_t seq{0};
  std::uint64_t timestamp_us{0};  // wall clock, strictly increasing per task
  std::chrono::milliseconds elapsed{0};
  std::string message;
  std::optional<double> percent;
  TaskState state{TaskState::pending};
};

struct ExecutionResult {
  TaskState state{TaskState::pending};
  ErrorCode error_code{ErrorCode::none};
  int exit_code{0};
  std::string stdout_text;
  std::string stderr_text;
  std::string stdout_encoding;
  std::string stderr_encoding;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::chrono::milliseconds duration{0};
  std::string diagnostic;

  // Output classifier verdict. rendered == stdout_text when !converted.
  std::string rendered;
  bool converted{false};

  // Deadline accounting.
  std::chrono::seconds budget{0};
  bool budget_possibly_underestimated{false};

  std::string fingerprint;
  bool from_cache{false};
  bool coalesced{false};

  bool ok() const { return state == TaskState::succeeded; }
};

// One distinct, actionable line per outcome for the presentation layer.
std::string status_line(const ExecutionResult& result);

}  // namespace toolrun
