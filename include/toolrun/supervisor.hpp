#pragma once

// toolrun/supervisor.hpp: Drives one running process to a terminal state.
//
// TICK ORDER (every poll_interval, waking early on exit or cancellation):
//   1. process exited        -> succeeded (exit 0) / failed (process_failed),
//                               "Exited with code N"; cancelled instead when
//                               the request predates the exit
//   2. cancellation          -> terminate -> cancelled
//   3. deadline elapsed      -> terminate -> timed_out
//   4. otherwise             -> "Running (MM:SS)" progress event
//
// COALESCED RUNS:
//   The leader's process serves every subscriber of its InFlight record. A
//   leader whose own token fires while other subscribers remain is finished
//   as cancelled on its own and the process keeps running. The process is
//   terminated only once every subscriber has cancelled (the flight closes).
//
// Termination always completes (SIGKILL, reap) before a terminal state is
// reported.

#include <memory>
#include <string>

#include "toolrun/cache.hpp"
#include "toolrun/config.hpp"
#include "toolrun/encoding.hpp"
#include "toolrun/launcher.hpp"
#include "toolrun/observability.hpp"
#include "toolrun/progress.hpp"
#include "toolrun/task.hpp"

namespace toolrun {

struct SupervisorContext {
  const EngineConfig& config;
  ProgressDispatcher& dispatcher;
  const EncodingNegotiator& negotiator;
  EngineStats& stats;
  EventLog& log;
};

// Runs the tick loop for `task`, which owns `process`. `flight` is null for
// uncached runs. Returns the outcome of the process itself; when the leader
// detached early, its task already holds a cancelled result and the returned
// value is meant for the remaining subscribers.
ExecutionResult supervise(ExecutionTask& task, Process& process,
                          const std::shared_ptr<InFlight>& flight, const SupervisorContext& ctx);

// Follower wait: ticks on the same interval until the leader's result arrives
// or the follower's own token fires.
ExecutionResult follow(ExecutionTask& task, const std::shared_ptr<InFlight>& flight,
                       const SupervisorContext& ctx);

// Terminal results built without a process.
ExecutionResult cancelled_result(const ExecutionTask& task, const std::string& diagnostic);
ExecutionResult failed_result(const ExecutionTask& task, ErrorCode code, const std::string& diagnostic);

// Decodes, classifies and renders raw process output.
ExecutionResult build_result(const ExecutionTask& task, RawOutput raw, TaskState state,
                             const SupervisorContext& ctx);

// "MM:SS", or "H:MM:SS" past one hour.
std::string format_elapsed(std::chrono::milliseconds elapsed);

}  // namespace toolrun
