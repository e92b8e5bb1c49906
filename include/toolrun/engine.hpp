#pragma once

// toolrun/engine.hpp: Engine facade: run, cancel, await.
//
// THREADING:
//   run() returns immediately. Each accepted task gets one worker thread that
//   performs cache admission, slot acquisition, deadline computation and
//   supervision. At most config.max_concurrent_tasks processes run at once;
//   waiting for a slot is cancellable. Progress events reach sinks through
//   one dispatcher thread, never on the caller's thread.
//
// FAST FAILURES:
//   An empty argv (invalid_spec) or an argv[0] that does not resolve to an
//   executable (tool_not_found) finishes the task inside run(), without a
//   worker thread, a process or an encoding pass.
//
// SHUTDOWN:
//   The destructor cancels every live task, joins every worker (so every
//   child is reaped) and drains the progress queue.
//
// EXTENSION_POINT: fingerprint_inputs
//   RunOptions::input_paths and tool_version are the only identity beyond
//   the CommandSpec. A tool whose output depends on other state (network,
//   clock) must be run with cacheable = false.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "toolrun/cache.hpp"
#include "toolrun/config.hpp"
#include "toolrun/encoding.hpp"
#include "toolrun/launcher.hpp"
#include "toolrun/observability.hpp"
#include "toolrun/progress.hpp"
#include "toolrun/supervisor.hpp"
#include "toolrun/task.hpp"
#include "toolrun/timeout.hpp"
#include "toolrun/types.hpp"

namespace toolrun {

struct RunOptions {
  bool cacheable{true};
  std::optional<ScaleSignals> scale_signals;  // used when spec.timeout is unset
  std::string prescan_path;                   // scanned when neither is given
  std::vector<std::string> input_paths;       // identity: path + size + mtime
  std::string tool_version;
  std::optional<std::chrono::seconds> cache_ttl;
};

class Engine {
 public:
  explicit Engine(EngineConfig config = EngineConfig{});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  TaskHandle run(CommandSpec spec, ProgressSink sink, CancellationToken token = CancellationToken(),
                 RunOptions options = RunOptions());

  void cancel(const TaskHandle& handle);

  ExecutionResult await(const TaskHandle& handle);
  std::optional<ExecutionResult> await_for(const TaskHandle& handle, std::chrono::milliseconds d);

  std::chrono::seconds estimate_timeout(const ScaleSignals& signals) const;
  ToolProbe probe_tool(const std::string& argv0) const;

  ResultCache& cache() { return cache_; }
  const EngineStats& stats();
  std::string stats_json();

  // Blocks until every progress event posted so far has reached its sink.
  void flush_progress() { dispatcher_.flush(); }

  void set_event_hook(EventHook hook) { log_.set_hook(std::move(hook)); }

  const EngineConfig& config() const { return config_; }
  // Repairs validate() applied to the injected configuration.
  const std::vector<std::string>& config_repairs() const { return repairs_; }

 private:
  void worker(const std::shared_ptr<ExecutionTask>& task, const RunOptions& options,
              const std::string& executable);
  ExecutionResult run_task(ExecutionTask& task, const RunOptions& options,
                           const std::string& executable);
  ExecutionResult lead(ExecutionTask& task, const RunOptions& options, const std::string& executable,
                       const std::shared_ptr<InFlight>& flight);

  // True when nobody wants the run any more. Detaches a cancelled leader
  // whose flight still has live subscribers.
  bool abandoned(ExecutionTask& task, const std::shared_ptr<InFlight>& flight);
  // Waits until a cancelled run for the same fingerprint has reaped its process.
  bool await_predecessor(ExecutionTask& task, const std::shared_ptr<InFlight>& flight);
  bool acquire_slot(ExecutionTask& task, const std::shared_ptr<InFlight>& flight);
  void release_slot();
  TimeoutEstimate budget_for(ExecutionTask& task, const RunOptions& options,
                             const std::shared_ptr<InFlight>& flight);

  void complete(ExecutionTask& task, ExecutionResult result);
  void post(ExecutionTask& task, std::string message);
  void reap_finished_workers();

  SupervisorContext context();

  EngineConfig config_;
  std::vector<std::string> repairs_;
  EventLog log_;
  EngineStats stats_;
  ProgressDispatcher dispatcher_;
  EncodingNegotiator negotiator_;
  ResultCache cache_;

  std::mutex slot_mu_;
  std::condition_variable slot_cv_;
  std::uint32_t running_{0};

  std::mutex workers_mu_;
  std::uint64_t next_id_{1};
  std::unordered_map<std::uint64_t, std::thread> workers_;
  std::unordered_map<std::uint64_t, std::weak_ptr<ExecutionTask>> live_;
  std::vector<std::uint64_t> finished_;
};

}  // namespace toolrun
