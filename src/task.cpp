#include "toolrun/task.hpp"

#include <algorithm>

namespace toolrun {

namespace {

std::uint64_t wall_clock_us() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------

void CancellationToken::request() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  if (state_->flag.load(std::memory_order_relaxed)) return;
  state_->requested_at.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
  state_->flag.store(true, std::memory_order_release);
  for (auto& [id, fn] : state_->callbacks) fn();
  state_->callbacks.clear();
}

bool CancellationToken::requested_before(Clock::time_point t) const {
  if (!requested()) return false;
  return state_->requested_at.load(std::memory_order_relaxed) <= t.time_since_epoch().count();
}

CancellationToken::Subscription CancellationToken::on_request(std::function<void()> fn) const {
  std::lock_guard<std::mutex> lk(state_->mu);
  if (state_->flag.load(std::memory_order_relaxed)) {
    fn();
    return Subscription();
  }
  const std::uint64_t id = state_->next_id++;
  state_->callbacks.emplace(id, std::move(fn));
  return Subscription(state_, id);
}

CancellationToken::Subscription& CancellationToken::Subscription::operator=(
    Subscription&& other) noexcept {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
  }
  return *this;
}

void CancellationToken::Subscription::reset() {
  if (!state_) return;
  {
    std::lock_guard<std::mutex> lk(state_->mu);
    state_->callbacks.erase(id_);
  }
  state_.reset();
}

// ---------------------------------------------------------------------------
// ExecutionTask
// ---------------------------------------------------------------------------

ExecutionTask::ExecutionTask(std::uint64_t id, CommandSpec spec, CancellationToken token,
                             ProgressSink sink)
    : id_(id),
      spec_(std::move(spec)),
      token_(std::move(token)),
      sink_(std::move(sink)),
      created_at_(Clock::now()),
      future_(promise_.get_future().share()) {}

TaskState ExecutionTask::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool ExecutionTask::mark_running(pid_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != TaskState::pending) return false;
  state_ = TaskState::running;
  pid_ = pid;
  started_at_ = Clock::now();
  return true;
}

pid_t ExecutionTask::pid() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pid_;
}

bool ExecutionTask::finish(ExecutionResult result) {
  if (!is_terminal(result.state)) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (is_terminal(state_)) return false;
    state_ = result.state;
  }
  promise_.set_value(std::move(result));
  return true;
}

void ExecutionTask::set_deadline(std::chrono::seconds budget, bool possibly_underestimated) {
  std::lock_guard<std::mutex> lk(mu_);
  budget_ = budget;
  underestimated_ = possibly_underestimated;
  const Clock::time_point from = started_at_ == Clock::time_point{} ? Clock::now() : started_at_;
  deadline_ = from + budget;
}

ExecutionTask::Clock::time_point ExecutionTask::deadline() const {
  std::lock_guard<std::mutex> lk(mu_);
  return deadline_;
}

std::chrono::seconds ExecutionTask::budget() const {
  std::lock_guard<std::mutex> lk(mu_);
  return budget_;
}

bool ExecutionTask::budget_possibly_underestimated() const {
  std::lock_guard<std::mutex> lk(mu_);
  return underestimated_;
}

ExecutionTask::Clock::time_point ExecutionTask::started_at() const {
  std::lock_guard<std::mutex> lk(mu_);
  return started_at_ == Clock::time_point{} ? created_at_ : started_at_;
}

std::chrono::milliseconds ExecutionTask::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at());
}

ProgressEvent ExecutionTask::make_event(std::string message, std::optional<double> percent) {
  ProgressEvent ev;
  ev.task_id = id_;
  ev.message = std::move(message);
  ev.percent = percent;
  ev.elapsed = elapsed();
  std::lock_guard<std::mutex> lk(mu_);
  ev.seq = ++seq_;
  ev.timestamp_us = std::max(wall_clock_us(), last_ts_us_ + 1);
  last_ts_us_ = ev.timestamp_us;
  ev.state = state_;
  return ev;
}

}  // namespace toolrun
