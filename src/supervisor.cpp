#include "toolrun/supervisor.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <future>

#include "toolrun/output.hpp"

namespace toolrun {

namespace {

void post(const SupervisorContext& ctx, ExecutionTask& task, std::string message) {
  if (!task.sink()) return;
  ctx.dispatcher.post(task.sink(), task.make_event(std::move(message)));
}

void note_exhausted(const SupervisorContext& ctx, const ExecutionTask& task, const char* stream,
                    const DecodeResult& d) {
  ctx.log.emit_diagnostic(task.id(), "encoding_exhausted",
                          std::string(stream) + ": no candidate encoding decoded cleanly; used " +
                              d.encoding + " with " + std::to_string(d.substitutions) +
                              " substitutions");
}

}  // namespace

std::string format_elapsed(std::chrono::milliseconds elapsed) {
  const long long total = std::max<long long>(0, elapsed.count() / 1000);
  char buf[32];
  if (total >= 3600) {
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld", total / 3600, (total / 60) % 60, total % 60);
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", total / 60, total % 60);
  }
  return buf;
}

ExecutionResult cancelled_result(const ExecutionTask& task, const std::string& diagnostic) {
  ExecutionResult r;
  r.state = TaskState::cancelled;
  r.error_code = ErrorCode::cancelled;
  r.diagnostic = diagnostic;
  r.duration = task.elapsed();
  r.budget = task.budget();
  r.budget_possibly_underestimated = task.budget_possibly_underestimated();
  return r;
}

ExecutionResult failed_result(const ExecutionTask& task, ErrorCode code, const std::string& diagnostic) {
  ExecutionResult r;
  r.state = TaskState::failed;
  r.error_code = code;
  r.exit_code = -1;
  r.diagnostic = diagnostic;
  r.duration = task.elapsed();
  r.budget = task.budget();
  r.budget_possibly_underestimated = task.budget_possibly_underestimated();
  return r;
}

ExecutionResult build_result(const ExecutionTask& task, RawOutput raw, TaskState state,
                             const SupervisorContext& ctx) {
  ExecutionResult r;
  r.exit_code = raw.exit_code;
  r.duration = task.elapsed();
  r.budget = task.budget();
  r.budget_possibly_underestimated = task.budget_possibly_underestimated();
  r.stdout_truncated = raw.stdout_truncated;
  r.stderr_truncated = raw.stderr_truncated;

  const std::string& hint = task.spec().encoding_hint;
  DecodeResult out = ctx.negotiator.decode(raw.stdout_bytes, hint);
  DecodeResult err = ctx.negotiator.decode(raw.stderr_bytes, hint);
  if (out.exhausted) note_exhausted(ctx, task, "stdout", out);
  if (err.exhausted) note_exhausted(ctx, task, "stderr", err);
  r.stdout_text = std::move(out.text);
  r.stdout_encoding = std::move(out.encoding);
  r.stderr_text = std::move(err.text);
  r.stderr_encoding = std::move(err.encoding);

  RenderedOutput rendered = render_output(r.stdout_text);
  r.rendered = std::move(rendered.text);
  r.converted = rendered.converted;

  switch (state) {
    case TaskState::timed_out:
      r.state = TaskState::timed_out;
      r.error_code = ErrorCode::timeout;
      r.diagnostic = "deadline of " + std::to_string(r.budget.count()) + "s elapsed";
      break;
    case TaskState::cancelled:
      r.state = TaskState::cancelled;
      r.error_code = ErrorCode::cancelled;
      r.diagnostic = "cancelled by caller";
      break;
    default:
      if (raw.exit_code == 0) {
        r.state = TaskState::succeeded;
        // Non-fatal: the output is usable but contains substitutions.
        if (out.exhausted || err.exhausted) {
          r.error_code = ErrorCode::encoding_exhausted;
          r.diagnostic = "output decoded with fallback encoding";
        }
      } else {
        r.state = TaskState::failed;
        r.error_code = ErrorCode::process_failed;
        r.diagnostic = raw.term_signal != 0
                           ? "terminated by signal " + std::to_string(raw.term_signal)
                           : "exited with code " + std::to_string(raw.exit_code);
      }
      break;
  }
  return r;
}

ExecutionResult supervise(ExecutionTask& task, Process& process,
                          const std::shared_ptr<InFlight>& flight, const SupervisorContext& ctx) {
  const auto poll = std::max(ctx.config.poll_interval, std::chrono::milliseconds(1));
  // A leader cancelled while queued is already finished; it keeps serving others.
  bool detached = task.is_finished();
  auto wake = task.token().on_request([&process] { process.interrupt(); });

  auto detach = [&] {
    // Other subscribers still want the result; only this task leaves.
    post(ctx, task, "Cancelling");
    task.finish(cancelled_result(task, "cancelled by caller; shared run continues"));
    detached = true;
  };

  auto stop = [&](TaskState state, const char* message) {
    if (!detached) post(ctx, task, message);
    if (process.terminate(ctx.config.grace_period, ctx.config.kill_timeout)) {
      ctx.stats.forced_kills.fetch_add(1, std::memory_order_relaxed);
    }
    return build_result(task, process.collect(), state, ctx);
  };

  for (;;) {
    // (1) exit. A cancellation requested before the exit still wins.
    if (process.wait_for(poll)) {
      const auto exited_at = process.exited_at();
      const bool group_cancelled = flight ? flight->close_if_all_cancelled_before(exited_at)
                                          : task.token().requested_before(exited_at);
      if (group_cancelled) {
        if (!detached) post(ctx, task, "Cancelling");
        return build_result(task, process.collect(), TaskState::cancelled, ctx);
      }
      if (!detached && task.token().requested_before(exited_at)) detach();
      ExecutionResult r = build_result(task, process.collect(), TaskState::succeeded, ctx);
      if (!detached) post(ctx, task, "Exited with code " + std::to_string(r.exit_code));
      return r;
    }

    // (2) cancellation
    const bool group_cancelled =
        flight ? flight->close_if_all_cancelled() : task.token().requested();
    if (group_cancelled) return stop(TaskState::cancelled, "Cancelling");
    if (!detached && task.token().requested()) detach();

    // (3) deadline
    if (ExecutionTask::Clock::now() >= task.deadline()) {
      return stop(TaskState::timed_out, "Timed out, terminating");
    }

    // (4) heartbeat
    if (!detached) post(ctx, task, "Running (" + format_elapsed(task.elapsed()) + ")");
  }
}

ExecutionResult follow(ExecutionTask& task, const std::shared_ptr<InFlight>& flight,
                       const SupervisorContext& ctx) {
  const auto poll = std::max(ctx.config.poll_interval, std::chrono::milliseconds(1));
  auto wake = task.token().on_request([&flight] { flight->wake(); });
  for (;;) {
    const bool done = flight->wait_for(poll, &task.token());
    // A cancellation requested before the leader delivered wins.
    if (task.token().requested_before(flight->completed_at())) {
      // The leader's next tick sees the closed flight if we were the last.
      post(ctx, task, "Cancelling");
      return cancelled_result(task, "cancelled by caller");
    }
    if (done) {
      try {
        ExecutionResult r = flight->future().get();
        r.coalesced = true;
        return r;
      } catch (const std::exception& e) {
        return failed_result(task, ErrorCode::internal_error,
                             std::string("shared run failed: ") + e.what());
      }
    }
    post(ctx, task, "Waiting for identical run (" + format_elapsed(task.elapsed()) + ")");
  }
}

}  // namespace toolrun
