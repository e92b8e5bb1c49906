#pragma once

// toolrun/task.hpp: Task state machine and cancellation.
//
// STATE MACHINE:
//   pending -> running -> {succeeded, failed, timed_out, cancelled}
//   pending -> {succeeded, failed, cancelled}   (cache hit, missing tool,
//                                                 cancelled while queued)
//   Terminal states never change. finish() is first-writer-wins; later calls
//   return false and leave the stored result untouched.
//
// THREADING:
//   ExecutionTask is shared between the caller's TaskHandle, the engine's
//   worker thread and (for coalesced runs) the in-flight record. All mutable
//   state is guarded by one mutex; the id, spec and token are immutable.

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "toolrun/types.hpp"

namespace toolrun {

using ProgressSink = std::function<void(const ProgressEvent&)>;

// Shared cancellation flag. Copies observe the same flag.
//
// The first request() records the request time and runs every registered
// callback on the requesting thread, under the token's lock. Callbacks only
// wake waiters and must not touch the token.
class CancellationToken {
 public:
  using Clock = std::chrono::steady_clock;

 private:
  struct State {
    std::atomic<bool> flag{false};
    std::atomic<Clock::rep> requested_at{0};
    std::mutex mu;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id{1};
  };

 public:
  // Keeps a callback registered until destroyed.
  class Subscription {
   public:
    Subscription() = default;
    ~Subscription() { reset(); }
    Subscription(Subscription&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {}
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();

   private:
    friend class CancellationToken;
    Subscription(std::shared_ptr<State> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<State> state_;
    std::uint64_t id_{0};
  };

  CancellationToken() : state_(std::make_shared<State>()) {}

  void request() const;
  bool requested() const { return state_->flag.load(std::memory_order_acquire); }
  // True when the request happened at or before `t`.
  bool requested_before(Clock::time_point t) const;
  bool same_as(const CancellationToken& other) const { return state_ == other.state_; }

  // Runs `fn` once on request; at once when already requested.
  Subscription on_request(std::function<void()> fn) const;

 private:
  std::shared_ptr<State> state_;
};

class ExecutionTask {
 public:
  using Clock = std::chrono::steady_clock;

  ExecutionTask(std::uint64_t id, CommandSpec spec, CancellationToken token, ProgressSink sink);

  std::uint64_t id() const { return id_; }
  const CommandSpec& spec() const { return spec_; }
  const CancellationToken& token() const { return token_; }
  const ProgressSink& sink() const { return sink_; }

  TaskState state() const;
  bool is_finished() const { return is_terminal(state()); }

  // pending -> running. Records the pid and start time.
  bool mark_running(pid_t pid);
  pid_t pid() const;

  // Moves to result.state (must be terminal) and fulfils the future.
  bool finish(ExecutionResult result);

  std::shared_future<ExecutionResult> future() const { return future_; }

  void set_deadline(std::chrono::seconds budget, bool possibly_underestimated);
  Clock::time_point deadline() const;
  std::chrono::seconds budget() const;
  bool budget_possibly_underestimated() const;

  Clock::time_point created_at() const { return created_at_; }
  Clock::time_point started_at() const;
  std::chrono::milliseconds elapsed() const;

  // Next event for this task: sequence number and a strictly increasing
  // timestamp.
  ProgressEvent make_event(std::string message, std::optional<double> percent = std::nullopt);

 private:
  const std::uint64_t id_;
  const CommandSpec spec_;
  const CancellationToken token_;
  const ProgressSink sink_;
  const Clock::time_point created_at_;

  mutable std::mutex mu_;
  TaskState state_{TaskState::pending};
  pid_t pid_{0};
  Clock::time_point started_at_{};
  Clock::time_point deadline_{Clock::time_point::max()};
  std::chrono::seconds budget_{0};
  bool underestimated_{false};
  std::uint64_t seq_{0};
  std::uint64_t last_ts_us_{0};

  std::promise<ExecutionResult> promise_;
  std::shared_future<ExecutionResult> future_;
};

class TaskHandle {
 public:
  TaskHandle() = default;
  explicit TaskHandle(std::shared_ptr<ExecutionTask> task) : task_(std::move(task)) {}

  bool valid() const { return task_ != nullptr; }
  std::uint64_t id() const { return task_ ? task_->id() : 0; }
  TaskState state() const { return task_ ? task_->state() : TaskState::pending; }
  const std::shared_ptr<ExecutionTask>& task() const { return task_; }

 private:
  std::shared_ptr<ExecutionTask> task_;
};

}  // namespace toolrun
