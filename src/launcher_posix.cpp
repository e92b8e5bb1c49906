#ifndef _WIN32

#include "toolrun/launcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

extern char** environ;

namespace toolrun {

namespace {

constexpr std::size_t kReadChunk = 65536;
constexpr int kDrainPollMs = 100;

// Child -> parent report over the close-on-exec status pipe. EOF means exec
// succeeded.
struct ChildStatus {
  int stage;
  int err;
};
constexpr int kStageIo = 1;
constexpr int kStageChdir = 2;
constexpr int kStageExec = 3;

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void append_limited(std::string& dst, const char* src, std::size_t n,
                    std::size_t limit, bool& truncated) {
  if (limit == 0) {
    dst.append(src, n);
    return;
  }
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min(n, avail);
  dst.append(src, take);
  if (take < n) truncated = true;
}

std::vector<std::string> build_env(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    std::string entry(*e);
    const std::string key = entry.substr(0, entry.find('='));
    if (overrides.find(key) == overrides.end()) out.push_back(std::move(entry));
  }
  for (const auto& [k, v] : overrides) out.push_back(k + "=" + v);
  return out;
}

bool is_executable_file(const std::string& p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

std::string absolute_path(const std::string& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  return ec ? p : abs.lexically_normal().string();
}

[[noreturn]] void child_fail(int status_fd, int stage) {
  ChildStatus s{stage, errno};
  // A single 8-byte write to a pipe is atomic.
  ssize_t n = ::write(status_fd, &s, sizeof(s));
  (void)n;
  _exit(127);
}

std::string first_line(const std::string& text) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(pos, end - pos);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (!line.empty()) return line;
    pos = end + 1;
  }
  return {};
}

}  // namespace

std::string effective_path(const CommandSpec& spec) {
  auto it = spec.env.find("PATH");
  if (it != spec.env.end()) return it->second;
  const char* p = std::getenv("PATH");
  return (p && p[0]) ? std::string(p) : std::string("/usr/local/bin:/usr/bin:/bin");
}

std::optional<std::string> resolve_executable(const std::string& argv0,
                                              const std::string& path_env,
                                              const std::string& cwd) {
  if (argv0.empty()) return std::nullopt;
  if (argv0.find('/') != std::string::npos) {
    std::string p = argv0;
    if (argv0[0] != '/' && !cwd.empty()) p = cwd + "/" + argv0;
    if (!is_executable_file(p)) return std::nullopt;
    return absolute_path(p);
  }
  std::size_t pos = 0;
  while (pos <= path_env.size()) {
    std::size_t end = path_env.find(':', pos);
    if (end == std::string::npos) end = path_env.size();
    std::string dir = path_env.substr(pos, end - pos);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + argv0;
    if (is_executable_file(candidate)) return absolute_path(candidate);
    pos = end + 1;
  }
  return std::nullopt;
}

SpawnResult Process::start(const CommandSpec& spec) {
  SpawnResult result;
  if (spec.argv.empty() || spec.argv[0].empty()) {
    result.error = ErrorCode::invalid_spec;
    result.diagnostic = "empty argument vector";
    return result;
  }
  auto exe = resolve_executable(spec.argv[0], effective_path(spec), spec.cwd);
  if (!exe) {
    result.error = ErrorCode::tool_not_found;
    result.diagnostic = spec.argv[0] + " not found on PATH";
    return result;
  }
  return start(spec, *exe);
}

SpawnResult Process::start(const CommandSpec& spec, const std::string& executable) {
  SpawnResult result;
  if (spec.argv.empty()) {
    result.error = ErrorCode::invalid_spec;
    result.diagnostic = "empty argument vector";
    return result;
  }

  // Everything the child touches is prepared before fork().
  std::vector<std::string> args = spec.argv;
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_env(spec.env);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string exe = executable;
  const std::string cwd = spec.cwd;

  auto fail = [&](const char* what) {
    result.error = ErrorCode::spawn_failed;
    result.diagnostic = std::string(what) + ": " + std::strerror(errno);
    return std::move(result);
  };

  // O_CLOEXEC everywhere: a concurrent fork() elsewhere must not inherit our
  // write ends, or EOF would never arrive.
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {out_pipe, err_pipe, status_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };
  if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(status_pipe, O_CLOEXEC) != 0) {
    SpawnResult r = fail("pipe");
    close_all();
    return r;
  }
  int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull < 0) {
    SpawnResult r = fail("open /dev/null");
    close_all();
    return r;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    SpawnResult r = fail("fork");
    close_all();
    close_fd(devnull);
    return r;
  }

  if (pid == 0) {
    ::setsid();
    ::signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    if (::dup2(devnull, STDIN_FILENO) < 0 || ::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
      child_fail(status_pipe[1], kStageIo);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      child_fail(status_pipe[1], kStageChdir);
    }
    ::execve(exe.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], kStageExec);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);
  close_fd(devnull);

  ChildStatus cs{};
  ssize_t n;
  do {
    n = ::read(status_pipe[0], &cs, sizeof(cs));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(cs))) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    const std::string reason = std::strerror(cs.err);
    if (cs.stage == kStageExec &&
        (cs.err == ENOENT || cs.err == EACCES || cs.err == ENOTDIR || cs.err == ELOOP)) {
      result.error = ErrorCode::tool_not_found;
      result.diagnostic = exe + ": " + reason;
    } else if (cs.stage == kStageChdir) {
      result.error = ErrorCode::spawn_failed;
      result.diagnostic = "working directory '" + cwd + "': " + reason;
    } else {
      result.error = ErrorCode::spawn_failed;
      result.diagnostic = (cs.stage == kStageExec ? "exec " + exe : std::string("stdio setup")) +
                          ": " + reason;
    }
    return result;
  }

  result.process.reset(new Process(pid, out_pipe[0], err_pipe[0], spec.max_output_bytes));
  return result;
}

Process::Process(pid_t pid, int out_fd, int err_fd, std::size_t max_output_bytes)
    : pid_(pid), out_fd_(out_fd), err_fd_(err_fd), max_output_bytes_(max_output_bytes) {
  ::fcntl(out_fd_, F_SETFL, O_NONBLOCK);
  ::fcntl(err_fd_, F_SETFL, O_NONBLOCK);
  drain_thread_ = std::thread([this] { drain_loop(); });
  reap_thread_ = std::thread([this] { reap_loop(); });
}

Process::~Process() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!exited_) ::kill(-pid_, SIGKILL);
    stop_drain_ = true;
  }
  if (reap_thread_.joinable()) reap_thread_.join();
  if (drain_thread_.joinable()) drain_thread_.join();
}

void Process::drain_loop() {
  std::string out_buf;
  std::string err_buf;
  bool out_trunc = false;
  bool err_trunc = false;
  int fds[2] = {out_fd_, err_fd_};
  std::string* bufs[2] = {&out_buf, &err_buf};
  bool* truncs[2] = {&out_trunc, &err_trunc};
  std::vector<char> chunk(kReadChunk);

  while (fds[0] >= 0 || fds[1] >= 0) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stop_drain_) break;
    }
    pollfd p[2] = {{fds[0], POLLIN, 0}, {fds[1], POLLIN, 0}};  // fd < 0 is ignored
    const int r = ::poll(p, 2, kDrainPollMs);
    if (r < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (r == 0) continue;
    for (int i = 0; i < 2; ++i) {
      if (fds[i] < 0 || !(p[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      const ssize_t n = ::read(fds[i], chunk.data(), chunk.size());
      if (n > 0) {
        append_limited(*bufs[i], chunk.data(), static_cast<std::size_t>(n),
                       max_output_bytes_, *truncs[i]);
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK)) {
        close_fd(fds[i]);
      }
    }
  }
  close_fd(fds[0]);
  close_fd(fds[1]);

  std::lock_guard<std::mutex> lk(mu_);
  out_.stdout_bytes = std::move(out_buf);
  out_.stderr_bytes = std::move(err_buf);
  out_.stdout_truncated = out_trunc;
  out_.stderr_truncated = err_trunc;
  drained_ = true;
  cv_.notify_all();
}

void Process::reap_loop() {
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);

  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lk(mu_);
  exited_ = true;
  exited_at_ = now;
  // ECHILD: reaped elsewhere (SIGCHLD ignored by the host); exit status lost.
  status_ = (r == pid_) ? status : -1;
  cv_.notify_all();
}

bool Process::exited() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exited_;
}

bool Process::wait_for(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, d, [this] { return exited_ || interrupted_; });
  interrupted_ = false;
  return exited_;
}

void Process::interrupt() {
  std::lock_guard<std::mutex> lk(mu_);
  interrupted_ = true;
  cv_.notify_all();
}

std::chrono::steady_clock::time_point Process::exited_at() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exited_ ? exited_at_ : std::chrono::steady_clock::time_point::max();
}

bool Process::terminate(std::chrono::milliseconds grace, std::chrono::milliseconds kill_timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (exited_) return false;
  ::kill(-pid_, SIGTERM);
  if (cv_.wait_for(lk, grace, [this] { return exited_; })) return false;
  for (;;) {
    ::kill(-pid_, SIGKILL);
    if (cv_.wait_for(lk, kill_timeout, [this] { return exited_; })) return true;
  }
}

RawOutput Process::collect(std::chrono::milliseconds linger) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return exited_; });
  if (!cv_.wait_for(lk, linger, [this] { return drained_; })) {
    // Leftover group members still hold the pipe write ends.
    ::kill(-pid_, SIGKILL);
    stop_drain_ = true;
    cv_.wait(lk, [this] { return drained_; });
  }
  RawOutput raw = std::move(out_);
  out_ = RawOutput{};
  const int status = status_;
  lk.unlock();

  if (status == -1) {
    raw.exit_code = -1;
  } else if (WIFEXITED(status)) {
    raw.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    raw.term_signal = WTERMSIG(status);
    raw.exit_code = 128 + raw.term_signal;
  }
  return raw;
}

ToolProbe probe_tool(const std::string& argv0, std::chrono::milliseconds timeout) {
  ToolProbe probe;
  CommandSpec spec;
  spec.argv = {argv0, "--version"};
  spec.max_output_bytes = 64 * 1024;
  auto exe = resolve_executable(argv0, effective_path(spec));
  if (!exe) return probe;
  probe.path = *exe;

  auto spawned = Process::start(spec, *exe);
  if (!spawned.ok()) return probe;
  probe.available = true;
  if (!spawned.process->wait_for(timeout)) {
    spawned.process->terminate(std::chrono::milliseconds(200), std::chrono::milliseconds(1000));
  }
  RawOutput raw = spawned.process->collect(std::chrono::milliseconds(500));
  probe.version = first_line(raw.stdout_bytes);
  if (probe.version.empty()) probe.version = first_line(raw.stderr_bytes);
  return probe;
}

}  // namespace toolrun

#endif
