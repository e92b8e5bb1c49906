#pragma once

// toolrun/launcher.hpp: OS process launch, pipe draining and termination.
//
// LIFECYCLE:
//   Process::start() forks a child into its own session (pgid == pid), wires
//   stdout/stderr to pipes and stdin to /dev/null. Exec and chdir failures
//   are reported synchronously through a close-on-exec status pipe, so a
//   missing tool never produces a running Process.
//
//   Two helper threads run per process:
//     drain  - polls both pipes from spawn until EOF. Never paused; bytes past
//              the capture cap are read and discarded.
//     reaper - blocking waitpid(); wakes wait_for()/terminate() on exit.
//
// INVARIANT:
//   The destructor kills the process group and reaps the child. No child
//   outlives its Process object.

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "toolrun/types.hpp"

namespace toolrun {

struct RawOutput {
  std::string stdout_bytes;
  std::string stderr_bytes;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  int exit_code{0};        // 128 + signal when signalled
  int term_signal{0};
};

class Process;

struct SpawnResult {
  std::unique_ptr<Process> process;
  ErrorCode error{ErrorCode::none};
  std::string diagnostic;
  bool ok() const { return process != nullptr; }
};

class Process {
 public:
  // `executable` is the resolved path to exec; spec.argv[0] is still passed
  // as argv[0] to the child.
  static SpawnResult start(const CommandSpec& spec, const std::string& executable);
  static SpawnResult start(const CommandSpec& spec);

  ~Process();
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;

  pid_t pid() const { return pid_; }

  // Waits up to `d` for the child to exit. Returns true once reaped.
  // interrupt() ends the current (or next) wait early.
  bool wait_for(std::chrono::milliseconds d);
  void interrupt();
  bool exited() const;
  // When the reaper saw the exit; time_point::max() while still running.
  std::chrono::steady_clock::time_point exited_at() const;

  // SIGTERM to the process group, wait `grace`, then SIGKILL, re-sent every
  // `kill_timeout` until the child is reaped. Returns true if SIGKILL was needed.
  bool terminate(std::chrono::milliseconds grace, std::chrono::milliseconds kill_timeout);

  // Blocks until exit, then until both pipes reach EOF (at most `linger`
  // after exit; leftover group members holding the pipes are killed).
  RawOutput collect(std::chrono::milliseconds linger = std::chrono::milliseconds(2000));

 private:
  Process(pid_t pid, int out_fd, int err_fd, std::size_t max_output_bytes);

  void drain_loop();
  void reap_loop();

  pid_t pid_;
  int out_fd_;
  int err_fd_;
  std::size_t max_output_bytes_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool exited_{false};
  bool interrupted_{false};
  std::chrono::steady_clock::time_point exited_at_{};
  int status_{0};
  bool drained_{false};
  bool stop_drain_{false};
  RawOutput out_;

  std::thread drain_thread_;
  std::thread reap_thread_;
};

// Resolves argv0 the way execvp would. A name containing '/' is checked
// relative to `cwd` (when non-empty); a bare name is searched in `path_env`.
// Returns the executable path, or nullopt when nothing executable is found.
std::optional<std::string> resolve_executable(const std::string& argv0,
                                              const std::string& path_env,
                                              const std::string& cwd = "");

// PATH to use for `spec`: its env override if present, else the inherited one.
std::string effective_path(const CommandSpec& spec);

struct ToolProbe {
  bool available{false};
  std::string path;
  std::string version;   // first non-empty line of `<tool> --version`
};

// Runs `<argv0> --version` with a short timeout.
ToolProbe probe_tool(const std::string& argv0,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

}  // namespace toolrun
