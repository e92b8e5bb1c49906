#pragma once

// toolrun/progress.hpp: Asynchronous progress delivery.
//
// One dispatcher thread per engine consumes a FIFO of (sink, event) pairs.
// Producers never block on a sink: post() only enqueues. A single consumer
// means events of one task reach its sink in posting order.
//
// The queue is bounded. When full, the oldest queued event is dropped to make
// room and the drop is counted.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

#include "toolrun/task.hpp"

namespace toolrun {

class ProgressDispatcher {
 public:
  explicit ProgressDispatcher(std::size_t capacity = 1024);
  ~ProgressDispatcher();

  ProgressDispatcher(const ProgressDispatcher&) = delete;
  ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

  // No-op when `sink` is empty or the dispatcher is stopping.
  void post(const ProgressSink& sink, ProgressEvent event);

  // Blocks until every event queued before the call has been delivered.
  void flush();

  // Delivers what is queued, then joins the thread. Idempotent.
  void stop();

  std::uint64_t delivered() const { return delivered_.load(std::memory_order_relaxed); }
  std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  const std::size_t capacity_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_idle_;
  std::deque<std::pair<ProgressSink, ProgressEvent>> queue_;
  std::uint64_t posted_{0};
  std::uint64_t completed_{0};  // delivered or dropped
  bool stopping_{false};

  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::thread worker_;
};

}  // namespace toolrun
