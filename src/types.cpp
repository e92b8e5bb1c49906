#include "toolrun/types.hpp"

#include <cstdio>

namespace toolrun {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::tool_not_found: return "tool_not_found";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::invalid_spec: return "invalid_spec";
    case ErrorCode::encoding_exhausted: return "encoding_exhausted";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::process_failed: return "process_failed";
    case ErrorCode::cache_corruption: return "cache_corruption";
    case ErrorCode::internal_error: return "internal_error";
  }
  return "unknown";
}

std::string to_string(TaskState state) {
  switch (state) {
    case TaskState::pending: return "pending";
    case TaskState::running: return "running";
    case TaskState::succeeded: return "succeeded";
    case TaskState::failed: return "failed";
    case TaskState::timed_out: return "timed_out";
    case TaskState::cancelled: return "cancelled";
  }
  return "unknown";
}

bool is_terminal(TaskState state) {
  return state == TaskState::succeeded || state == TaskState::failed ||
         state == TaskState::timed_out || state == TaskState::cancelled;
}

namespace {

std::string seconds_text(std::chrono::milliseconds d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(d.count()) / 1000.0);
  return buf;
}

std::string first_line(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return {};
  const auto end = s.find_first_of("\r\n", start);
  return s.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

}  // namespace

std::string status_line(const ExecutionResult& r) {
  switch (r.state) {
    case TaskState::succeeded: {
      std::string line = "Completed in " + seconds_text(r.duration);
      if (r.from_cache) line += " (cached result)";
      return line;
    }
    case TaskState::timed_out: {
      std::string line = "Timed out after " + seconds_text(r.duration) +
                         " (budget " + std::to_string(r.budget.count()) +
                         "s). Narrow the scope: reduce depth, limit output "
                         "lines, or exclude large subdirectories.";
      if (r.budget_possibly_underestimated)
        line += " The workload pre-scan was incomplete, so the budget may be too low.";
      return line;
    }
    case TaskState::cancelled:
      return "Cancelled after " + seconds_text(r.duration) + ".";
    case TaskState::failed:
      if (r.error_code == ErrorCode::tool_not_found) {
        return "Tool not found (" + r.diagnostic +
               "). Install it or point the configuration at its executable.";
      }
      if (r.error_code == ErrorCode::process_failed) {
        const std::string err = first_line(r.stderr_text);
        return "Exited with code " + std::to_string(r.exit_code) +
               (err.empty() ? std::string(".") : ": " + err);
      }
      return "Failed (" + to_string(r.error_code) + ")" +
             (r.diagnostic.empty() ? std::string{} : ": " + r.diagnostic);
    case TaskState::pending:
    case TaskState::running:
      break;
  }
  return "Running";
}

}  // namespace toolrun
