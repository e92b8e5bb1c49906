#include "toolrun/progress.hpp"

#include <exception>

namespace toolrun {

ProgressDispatcher::ProgressDispatcher(std::size_t capacity) : capacity_(capacity) {
  worker_ = std::thread([this] { worker_loop(); });
}

ProgressDispatcher::~ProgressDispatcher() { stop(); }

void ProgressDispatcher::post(const ProgressSink& sink, ProgressEvent event) {
  if (!sink) return;
  std::unique_lock<std::mutex> lock(mu_);
  if (stopping_) return;
  if (capacity_ > 0 && queue_.size() >= capacity_) {
    queue_.pop_front();
    ++completed_;
    dropped_.fetch_add(1, std::memory_order_relaxed);
  }
  queue_.emplace_back(sink, std::move(event));
  ++posted_;
  cv_.notify_one();
}

void ProgressDispatcher::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  const std::uint64_t target = posted_;
  cv_idle_.wait(lock, [&] { return completed_ >= target; });
}

void ProgressDispatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable()) worker_.join();
  cv_idle_.notify_all();
}

void ProgressDispatcher::worker_loop() {
  while (true) {
    std::pair<ProgressSink, ProgressEvent> item;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) return;
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      item.first(item.second);
    } catch (const std::exception&) {
      // A throwing sink loses its own event only.
    }
    delivered_.fetch_add(1, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++completed_;
    }
    cv_idle_.notify_all();
  }
}

}  // namespace toolrun
