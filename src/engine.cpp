#include "toolrun/engine.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>

#include "toolrun/fingerprint.hpp"

namespace toolrun {

namespace {

ResultCache::Options cache_options(const EngineConfig& c) {
  ResultCache::Options o;
  o.max_bytes = c.cache_max_bytes;
  o.default_ttl = c.cache_ttl;
  o.dir = c.cache_dir;
  o.compression = c.cache_compression;
  return o;
}

TaskEvent make_task_event(const ExecutionTask& task, const ExecutionResult& r) {
  TaskEvent ev;
  ev.task_id = task.id();
  ev.tool = task.spec().argv.empty() ? std::string() : task.spec().argv.front();
  ev.fingerprint = r.fingerprint;
  ev.state = r.state;
  ev.error_code = r.error_code;
  ev.exit_code = r.exit_code;
  ev.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(r.duration).count());
  ev.bytes_stdout = r.stdout_text.size();
  ev.bytes_stderr = r.stderr_text.size();
  ev.stdout_encoding = r.stdout_encoding;
  ev.encoding_fallback = r.error_code == ErrorCode::encoding_exhausted;
  ev.converted = r.converted;
  ev.from_cache = r.from_cache;
  ev.coalesced = r.coalesced;
  ev.budget_s = r.budget.count();
  return ev;
}

// Holds one concurrency slot for the lifetime of a leader's process.
class SlotGuard {
 public:
  explicit SlotGuard(std::function<void()> release) : release_(std::move(release)) {}
  ~SlotGuard() { release_(); }
  SlotGuard(const SlotGuard&) = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;

 private:
  std::function<void()> release_;
};

}  // namespace

Engine::Engine(EngineConfig config)
    : config_(std::move(config)),
      repairs_(config_.validate()),
      log_(config_.event_log_path),
      dispatcher_(config_.progress_queue_capacity),
      negotiator_(config_.encodings, config_.fallback_encoding),
      cache_(cache_options(config_)) {
  for (const auto& note : repairs_) log_.emit_diagnostic(0, "config_repaired", note);
  cache_.set_diagnostic_callback([this](const std::string& fp, const std::string& reason) {
    stats_.cache_corruptions.fetch_add(1, std::memory_order_relaxed);
    log_.emit_diagnostic(0, "cache_corruption", fp + ": " + reason);
  });
}

Engine::~Engine() {
  std::unordered_map<std::uint64_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    for (auto& [id, weak] : live_) {
      if (auto task = weak.lock()) task->token().request();
    }
    workers.swap(workers_);
  }
  slot_cv_.notify_all();
  for (auto& [id, t] : workers) {
    if (t.joinable()) t.join();
  }
  dispatcher_.stop();
  cache_.set_diagnostic_callback({});
}

SupervisorContext Engine::context() {
  return SupervisorContext{config_, dispatcher_, negotiator_, stats_, log_};
}

void Engine::post(ExecutionTask& task, std::string message) {
  if (!task.sink() || task.is_finished()) return;
  dispatcher_.post(task.sink(), task.make_event(std::move(message)));
}

TaskHandle Engine::run(CommandSpec spec, ProgressSink sink, CancellationToken token, RunOptions options) {
  if (spec.max_output_bytes == 0) spec.max_output_bytes = config_.max_output_bytes;
  reap_finished_workers();

  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    id = next_id_++;
  }
  auto task = std::make_shared<ExecutionTask>(id, std::move(spec), std::move(token), std::move(sink));
  TaskHandle handle(task);

  const CommandSpec& s = task->spec();
  if (s.argv.empty() || s.argv.front().empty()) {
    complete(*task, failed_result(*task, ErrorCode::invalid_spec, "empty argument vector"));
    return handle;
  }
  auto exe = resolve_executable(s.argv.front(), effective_path(s), s.cwd);
  if (!exe) {
    complete(*task, failed_result(*task, ErrorCode::tool_not_found,
                                  "'" + s.argv.front() + "' is not an executable on PATH"));
    return handle;
  }
  if (task->token().requested()) {
    complete(*task, cancelled_result(*task, "cancelled before start"));
    return handle;
  }

  std::lock_guard<std::mutex> lk(workers_mu_);
  live_.emplace(id, task);
  workers_.emplace(id, std::thread([this, task, options = std::move(options), exe = *exe] {
    worker(task, options, exe);
  }));
  return handle;
}

void Engine::cancel(const TaskHandle& handle) {
  if (!handle.valid()) return;
  handle.task()->token().request();
  slot_cv_.notify_all();
}

ExecutionResult Engine::await(const TaskHandle& handle) {
  if (!handle.valid()) {
    ExecutionResult r;
    r.state = TaskState::failed;
    r.error_code = ErrorCode::invalid_spec;
    r.diagnostic = "invalid task handle";
    return r;
  }
  return handle.task()->future().get();
}

std::optional<ExecutionResult> Engine::await_for(const TaskHandle& handle, std::chrono::milliseconds d) {
  if (!handle.valid()) return await(handle);
  auto f = handle.task()->future();
  if (f.wait_for(d) != std::future_status::ready) return std::nullopt;
  return f.get();
}

std::chrono::seconds Engine::estimate_timeout(const ScaleSignals& signals) const {
  return toolrun::estimate_timeout(signals, config_.timeout);
}

ToolProbe Engine::probe_tool(const std::string& argv0) const { return toolrun::probe_tool(argv0); }

const EngineStats& Engine::stats() {
  stats_.progress_dropped.store(dispatcher_.dropped(), std::memory_order_relaxed);
  return stats_;
}

std::string Engine::stats_json() { return stats().to_json(); }

// ---------------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------------

void Engine::worker(const std::shared_ptr<ExecutionTask>& task, const RunOptions& options,
                    const std::string& executable) {
  ExecutionResult result;
  try {
    result = run_task(*task, options, executable);
  } catch (const std::exception& e) {
    result = failed_result(*task, ErrorCode::internal_error, e.what());
  }
  complete(*task, std::move(result));

  std::lock_guard<std::mutex> lk(workers_mu_);
  live_.erase(task->id());
  finished_.push_back(task->id());
}

ExecutionResult Engine::run_task(ExecutionTask& task, const RunOptions& options,
                                 const std::string& executable) {
  if (!options.cacheable) return lead(task, options, executable, nullptr);

  const std::string fp = compute_fingerprint(task.spec(), options.input_paths, options.tool_version);
  AdmitResult adm = cache_.admit(fp, task.token());
  switch (adm.kind) {
    case Admission::hit: {
      stats_.cache_hits.fetch_add(1, std::memory_order_relaxed);
      post(task, "Served from cache");
      return std::move(*adm.cached);
    }
    case Admission::follower: {
      stats_.coalesced.fetch_add(1, std::memory_order_relaxed);
      post(task, "Waiting for identical run (00:00)");
      return follow(task, adm.flight, context());
    }
    case Admission::leader:
      break;
  }

  stats_.cache_misses.fetch_add(1, std::memory_order_relaxed);
  ExecutionResult r;
  try {
    r = lead(task, options, executable, adm.flight);
  } catch (const std::exception&) {
    cache_.abandon(fp, adm.flight, std::current_exception());
    throw;
  }
  r.fingerprint = fp;
  cache_.complete(fp, adm.flight, r, options.cache_ttl.value_or(config_.cache_ttl));
  return r;
}

ExecutionResult Engine::lead(ExecutionTask& task, const RunOptions& options,
                             const std::string& executable, const std::shared_ptr<InFlight>& flight) {
  if (!await_predecessor(task, flight)) return cancelled_result(task, "cancelled while queued");
  if (!acquire_slot(task, flight)) return cancelled_result(task, "cancelled while queued");
  SlotGuard slot([this] { release_slot(); });

  const TimeoutEstimate est = budget_for(task, options, flight);
  if (abandoned(task, flight)) return cancelled_result(task, "cancelled before start");

  SpawnResult spawn = Process::start(task.spec(), executable);
  if (!spawn.ok()) return failed_result(task, spawn.error, spawn.diagnostic);
  stats_.processes_spawned.fetch_add(1, std::memory_order_relaxed);

  task.mark_running(spawn.process->pid());
  task.set_deadline(est.budget, est.possibly_underestimated);
  post(task, "Running (00:00)");
  return supervise(task, *spawn.process, flight, context());
}

bool Engine::abandoned(ExecutionTask& task, const std::shared_ptr<InFlight>& flight) {
  if (flight ? flight->close_if_all_cancelled() : task.token().requested()) return true;
  if (task.token().requested() && !task.is_finished()) {
    task.finish(cancelled_result(task, "cancelled by caller; shared run continues"));
  }
  return false;
}

bool Engine::await_predecessor(ExecutionTask& task, const std::shared_ptr<InFlight>& flight) {
  auto prior = flight ? flight->take_predecessor() : nullptr;
  if (!prior) return true;
  const auto poll = std::max(config_.poll_interval, std::chrono::milliseconds(1));
  post(task, "Waiting for a cancelled identical run to stop");
  while (!prior->wait_for(poll)) {
    if (abandoned(task, flight)) return false;
  }
  return true;
}

bool Engine::acquire_slot(ExecutionTask& task, const std::shared_ptr<InFlight>& flight) {
  const auto poll = std::max(config_.poll_interval, std::chrono::milliseconds(1));
  bool announced = false;
  for (;;) {
    {
      std::unique_lock<std::mutex> lk(slot_mu_);
      if (running_ < config_.max_concurrent_tasks) {
        ++running_;
        return true;
      }
    }
    if (abandoned(task, flight)) return false;
    if (!announced) {
      post(task, "Queued, waiting for a free slot");
      announced = true;
    }
    std::unique_lock<std::mutex> lk(slot_mu_);
    slot_cv_.wait_for(lk, poll, [this] { return running_ < config_.max_concurrent_tasks; });
  }
}

void Engine::release_slot() {
  {
    std::lock_guard<std::mutex> lk(slot_mu_);
    if (running_ > 0) --running_;
  }
  slot_cv_.notify_one();
}

TimeoutEstimate Engine::budget_for(ExecutionTask& task, const RunOptions& options,
                                   const std::shared_ptr<InFlight>& flight) {
  if (const auto& t = task.spec().timeout; t && t->count() > 0) return {*t, false};
  if (options.scale_signals) return estimate(*options.scale_signals, config_.timeout);
  if (options.prescan_path.empty()) return {config_.timeout.base, false};

  post(task, "Scanning " + options.prescan_path);
  const ScaleSignals signals = prescan(
      options.prescan_path, std::chrono::duration_cast<std::chrono::milliseconds>(config_.prescan_time_box),
      [&] { return flight ? flight->all_cancelled() : task.token().requested(); });
  if (!signals.complete) {
    stats_.prescans_incomplete.fetch_add(1, std::memory_order_relaxed);
    log_.emit_diagnostic(task.id(), "prescan_incomplete",
                         options.prescan_path + ": " + describe(signals));
  }
  const TimeoutEstimate est = estimate(signals, config_.timeout);
  post(task, "Scanned " + describe(signals) + ", budget " + std::to_string(est.budget.count()) + "s");
  return est;
}

void Engine::complete(ExecutionTask& task, ExecutionResult result) {
  task.finish(std::move(result));
  // A detached leader already holds its own result; report what the caller saw.
  const ExecutionResult& seen = task.future().get();
  const TaskEvent ev = make_task_event(task, seen);
  stats_.record_task(ev);
  log_.emit_task(ev);
}

void Engine::reap_finished_workers() {
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lk(workers_mu_);
    for (auto id : finished_) {
      auto it = workers_.find(id);
      if (it == workers_.end()) continue;
      done.push_back(std::move(it->second));
      workers_.erase(it);
    }
    finished_.clear();
  }
  for (auto& t : done) {
    if (t.joinable()) t.join();
  }
}

}  // namespace toolrun
