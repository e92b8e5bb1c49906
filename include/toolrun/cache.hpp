#pragma once

// toolrun/cache.hpp: Result cache with in-flight coalescing.
//
// MEMORY STORE:
//   Entries and in-flight records are sharded by fingerprint, one mutex per
//   shard. Recency and the byte total are global: one LRU list behind its
//   own mutex, taken only for bookkeeping (lock order: shard, then LRU).
//   When the total exceeds max_bytes the least recently used entries of any
//   shard are evicted. Only an entry larger than max_bytes itself is
//   refused. Entries expire by TTL. Only Succeeded results are stored. An
//   entry is never modified once written; a second put() for a live
//   fingerprint is ignored.
//
// COALESCING:
//   admit(fp, token) returns
//     hit      - a stored result (memory or disk)
//     leader   - caller must produce the result and call complete()/abandon()
//     follower - an identical run is in flight; wait on flight->future()
//   Locks are never held while a run executes. A flight closed because all
//   its subscribers cancelled may still be terminating its process; the next
//   leader for that fingerprint gets it as predecessor() and must wait for it
//   before starting, so one fingerprint never has two live processes.
//
// PERSISTENCE (optional, when Options::dir is set):
//   <dir>/<fp[0:2]>/<fp>.rec   serialized result (identity or zstd)
//   <dir>/<fp[0:2]>/<fp>.meta  flat JSON: expiry, sizes, BLAKE3 blob hash
//   Both are written atomically (tmp + rename). A record that fails its
//   integrity hash or does not decode is a cache corruption: it is deleted,
//   counted, reported to the diagnostic callback and treated as a miss.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolrun/task.hpp"
#include "toolrun/types.hpp"

namespace toolrun {

// Shared record for one in-flight run. Every attached task (leader and
// followers) contributes its cancellation token.
class InFlight {
 public:
  using Clock = std::chrono::steady_clock;

  InFlight();

  // False once the run has been closed for cancellation.
  bool subscribe(const CancellationToken& token);
  bool all_cancelled() const;

  // Atomically closes the flight if every subscriber has cancelled. A closed
  // flight accepts no new subscribers; the next admit() starts a fresh run
  // whose predecessor() is this flight.
  bool close_if_all_cancelled();
  // As above, counting only requests made at or before `t`.
  bool close_if_all_cancelled_before(Clock::time_point t);
  bool closed() const;

  std::shared_future<ExecutionResult> future() const { return future_; }

  // Waits up to `d` for the result. Returns early, with false, once `token`
  // (when given) is cancelled.
  bool wait_for(std::chrono::milliseconds d, const CancellationToken* token = nullptr);
  // Wakes wait_for() callers so they re-check their tokens.
  void wake();
  // When the result was delivered; time_point::max() until then.
  Clock::time_point completed_at() const;

  // A closed flight for the same fingerprint whose process may still be
  // shutting down. Cleared by the first call.
  std::shared_ptr<InFlight> take_predecessor();

  // First call wins.
  void set_result(const ExecutionResult& result);
  void set_exception(std::exception_ptr e);

 private:
  friend class ResultCache;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<CancellationToken> tokens_;
  bool closed_{false};
  bool delivered_{false};  // set_result/set_exception claimed
  bool done_{false};       // future ready
  Clock::time_point completed_at_{Clock::time_point::max()};
  std::shared_ptr<InFlight> predecessor_;
  std::promise<ExecutionResult> promise_;
  std::shared_future<ExecutionResult> future_;
};

enum class Admission { hit, leader, follower };

struct AdmitResult {
  Admission kind{Admission::leader};
  std::optional<ExecutionResult> cached;   // set for hit
  std::shared_ptr<InFlight> flight;        // set for leader/follower
};

struct CacheStats {
  std::uint64_t entries{0};
  std::uint64_t bytes{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t corruptions{0};
  std::uint64_t coalesced{0};
  std::uint64_t disk_writes{0};
  std::uint64_t in_flight{0};

  std::string to_json() const;
};

class ResultCache {
 public:
  struct Options {
    std::uint64_t max_bytes{50ull * 1024 * 1024};
    std::chrono::seconds default_ttl{1800};
    std::string dir;                       // empty = memory only
    std::string compression{"identity"};  // "identity" | "zstd"
    std::size_t shard_count{16};
  };

  using DiagnosticFn = std::function<void(const std::string& fingerprint, const std::string& reason)>;

  explicit ResultCache(Options options);
  ~ResultCache();

  ResultCache(const ResultCache&) = delete;
  ResultCache& operator=(const ResultCache&) = delete;

  void set_diagnostic_callback(DiagnosticFn fn);

  std::optional<ExecutionResult> get(const std::string& fp);

  // Stores a Succeeded result. Returns false if not stored in memory or on
  // disk (not succeeded, already present, or too large with no disk store).
  bool put(const std::string& fp, const ExecutionResult& result,
           std::optional<std::chrono::seconds> ttl = std::nullopt);

  bool invalidate(const std::string& fp);

  // Removes every stored entry, in memory and on disk. In-flight runs are
  // not affected.
  void clear();

  // Removes expired entries from memory and disk. Returns the number removed.
  std::size_t prune_expired();

  CacheStats stats() const;

  AdmitResult admit(const std::string& fp, const CancellationToken& token);

  // Leader hand-off: stores the result if it succeeded, detaches the flight
  // and fulfils every waiter.
  void complete(const std::string& fp, const std::shared_ptr<InFlight>& flight,
                const ExecutionResult& result,
                std::optional<std::chrono::seconds> ttl = std::nullopt);

  // Leader failure: detaches the flight and forwards the exception.
  void abandon(const std::string& fp, const std::shared_ptr<InFlight>& flight,
               std::exception_ptr error);

  // admit + run_fn on the leader + complete. Followers block on the leader.
  // An exception from run_fn reaches the leader and every follower.
  ExecutionResult get_or_run(const std::string& fp,
                             const std::function<ExecutionResult()>& run_fn,
                             const CancellationToken& token = CancellationToken(),
                             std::optional<std::chrono::seconds> ttl = std::nullopt);

  const Options& options() const { return options_; }

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    ExecutionResult result;
    Clock::time_point expires_at;
    std::size_t size{0};
    std::uint64_t generation{0};
  };

  struct Shard {
    std::mutex mu;
    std::unordered_map<std::string, Entry> entries;
    std::unordered_map<std::string, std::shared_ptr<InFlight>> in_flight;
  };

  struct LruNode {
    std::string fp;
    std::uint64_t generation;
    std::size_t size;
  };

  Shard& shard_for(const std::string& fp);

  // Callers hold shard.mu.
  std::optional<ExecutionResult> lookup_locked(Shard& shard, const std::string& fp);
  void erase_locked(Shard& shard, const std::string& fp);
  // Evicted entries are returned in `victims`; pass them to evict() after
  // releasing shard.mu.
  bool insert_locked(Shard& shard, const std::string& fp, const ExecutionResult& result,
                     Clock::time_point expires_at, std::vector<LruNode>& victims);

  // Global LRU bookkeeping; each takes lru_mu_.
  void touch(const std::string& fp, std::uint64_t generation);
  void forget(const std::string& fp, std::uint64_t generation);
  void evict(const std::vector<LruNode>& victims);

  // Disk store.
  std::string record_path(const std::string& fp) const;
  std::string meta_path(const std::string& fp) const;
  bool persist(const std::string& fp, const ExecutionResult& result, std::chrono::seconds ttl);
  std::optional<ExecutionResult> load(const std::string& fp, std::chrono::seconds* remaining);
  void remove_files(const std::string& fp);
  void report_corruption(const std::string& fp, const std::string& reason);

  Options options_;
  std::vector<std::unique_ptr<Shard>> shards_;

  mutable std::mutex lru_mu_;
  std::list<LruNode> lru_;  // front = most recent
  std::unordered_map<std::string, std::list<LruNode>::iterator> lru_index_;
  std::uint64_t bytes_{0};
  std::uint64_t next_generation_{1};

  std::mutex diag_mu_;
  DiagnosticFn diag_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> expirations_{0};
  std::atomic<std::uint64_t> corruptions_{0};
  std::atomic<std::uint64_t> coalesced_{0};
  std::atomic<std::uint64_t> disk_writes_{0};
};

// Binary record codec (exposed for tests and tooling).
std::string encode_result_record(const ExecutionResult& result);
std::optional<ExecutionResult> decode_result_record(const std::string& bytes);

}  // namespace toolrun
