#include "toolrun/cache.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#if defined(TOOLRUN_WITH_ZSTD)
#include <zstd.h>
#endif

#include "toolrun/hash.hpp"
#include "toolrun/jsonlite.hpp"
#include "toolrun/version.hpp"

namespace fs = std::filesystem;

namespace toolrun {

namespace {

constexpr char kRecordMagic[3] = {'T', 'R', 'R'};
// Per-entry bookkeeping charged against the byte budget on top of payload.
constexpr std::size_t kEntryOverhead = 256;
// Upper bound on a decoded record; guards against a corrupt size prefix.
constexpr std::uint64_t kMaxRecordBytes = 1ull << 32;

#if defined(TOOLRUN_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the same directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) return std::nullopt;
  return data;
}

bool valid_fingerprint(const std::string& d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

std::uint64_t unix_now() { return static_cast<std::uint64_t>(std::time(nullptr)); }

std::size_t entry_size(const ExecutionResult& r) {
  return kEntryOverhead + r.stdout_text.size() + r.stderr_text.size() + r.rendered.size() +
         r.diagnostic.size() + r.stdout_encoding.size() + r.stderr_encoding.size() +
         r.fingerprint.size();
}

ExecutionResult as_cached(ExecutionResult r) {
  r.from_cache = true;
  r.coalesced = false;
  return r;
}

// --- record codec helpers --------------------------------------------------

void put_u32(std::string& out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

void put_u64(std::string& out, std::uint64_t v) {
  for (int i = 0; i < 8; ++i) out += static_cast<char>((v >> (8 * i)) & 0xFF);
}

void put_str(std::string& out, const std::string& s) {
  put_u32(out, static_cast<std::uint32_t>(s.size()));
  out += s;
}

class Reader {
 public:
  explicit Reader(const std::string& data) : d_(data) {}

  bool u8(std::uint8_t& v) {
    if (pos_ + 1 > d_.size()) return false;
    v = static_cast<std::uint8_t>(d_[pos_++]);
    return true;
  }
  bool u32(std::uint32_t& v) {
    if (pos_ + 4 > d_.size()) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(static_cast<unsigned char>(d_[pos_ + i])) << (8 * i);
    pos_ += 4;
    return true;
  }
  bool u64(std::uint64_t& v) {
    if (pos_ + 8 > d_.size()) return false;
    v = 0;
    for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(static_cast<unsigned char>(d_[pos_ + i])) << (8 * i);
    pos_ += 8;
    return true;
  }
  bool str(std::string& s) {
    std::uint32_t n = 0;
    if (!u32(n) || pos_ + n > d_.size()) return false;
    s.assign(d_, pos_, n);
    pos_ += n;
    return true;
  }
  bool at_end() const { return pos_ == d_.size(); }

 private:
  const std::string& d_;
  std::size_t pos_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// Record codec
// ---------------------------------------------------------------------------
// Layout (little-endian):
//   "TRR" u8 version | u8 state | u8 error_code | u8 flags | u32 exit_code
//   u64 duration_ms | u64 budget_s | str stdout | str stderr | str stdout_enc
//   str stderr_enc | str diagnostic | str rendered | str fingerprint
// flags: 1 stdout_truncated, 2 stderr_truncated, 4 converted, 8 underestimated

std::string encode_result_record(const ExecutionResult& r) {
  std::string out;
  out.reserve(64 + entry_size(r));
  out.append(kRecordMagic, sizeof(kRecordMagic));
  out += static_cast<char>(version::CACHE_RECORD_VERSION);
  out += static_cast<char>(r.state);
  out += static_cast<char>(r.error_code);
  std::uint8_t flags = 0;
  if (r.stdout_truncated) flags |= 1;
  if (r.stderr_truncated) flags |= 2;
  if (r.converted) flags |= 4;
  if (r.budget_possibly_underestimated) flags |= 8;
  out += static_cast<char>(flags);
  put_u32(out, static_cast<std::uint32_t>(r.exit_code));
  put_u64(out, static_cast<std::uint64_t>(r.duration.count()));
  put_u64(out, static_cast<std::uint64_t>(r.budget.count()));
  put_str(out, r.stdout_text);
  put_str(out, r.stderr_text);
  put_str(out, r.stdout_encoding);
  put_str(out, r.stderr_encoding);
  put_str(out, r.diagnostic);
  put_str(out, r.rendered);
  put_str(out, r.fingerprint);
  return out;
}

std::optional<ExecutionResult> decode_result_record(const std::string& bytes) {
  if (bytes.size() < 4 || bytes.compare(0, 3, kRecordMagic, 3) != 0) return std::nullopt;
  Reader rd(bytes);
  std::uint8_t magic = 0;
  for (int i = 0; i < 3; ++i) rd.u8(magic);

  std::uint8_t ver = 0, state = 0, code = 0, flags = 0;
  std::uint32_t exit_code = 0;
  std::uint64_t duration = 0, budget = 0;
  if (!rd.u8(ver) || ver != version::CACHE_RECORD_VERSION) return std::nullopt;
  if (!rd.u8(state) || !rd.u8(code) || !rd.u8(flags)) return std::nullopt;
  if (state > static_cast<std::uint8_t>(TaskState::cancelled)) return std::nullopt;
  if (code > static_cast<std::uint8_t>(ErrorCode::internal_error)) return std::nullopt;
  if (!rd.u32(exit_code) || !rd.u64(duration) || !rd.u64(budget)) return std::nullopt;

  ExecutionResult r;
  r.state = static_cast<TaskState>(state);
  r.error_code = static_cast<ErrorCode>(code);
  r.exit_code = static_cast<int>(exit_code);
  r.duration = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(duration));
  r.budget = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(budget));
  r.stdout_truncated = flags & 1;
  r.stderr_truncated = flags & 2;
  r.converted = flags & 4;
  r.budget_possibly_underestimated = flags & 8;
  if (!rd.str(r.stdout_text) || !rd.str(r.stderr_text) || !rd.str(r.stdout_encoding) ||
      !rd.str(r.stderr_encoding) || !rd.str(r.diagnostic) || !rd.str(r.rendered) ||
      !rd.str(r.fingerprint)) {
    return std::nullopt;
  }
  if (!rd.at_end()) return std::nullopt;
  return r;
}

// ---------------------------------------------------------------------------
// InFlight
// ---------------------------------------------------------------------------

InFlight::InFlight() : future_(promise_.get_future().share()) {}

bool InFlight::subscribe(const CancellationToken& token) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return false;
  tokens_.push_back(token);
  return true;
}

bool InFlight::all_cancelled() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (tokens_.empty()) return false;
  for (const auto& t : tokens_) {
    if (!t.requested()) return false;
  }
  return true;
}

bool InFlight::close_if_all_cancelled() {
  return close_if_all_cancelled_before(Clock::time_point::max());
}

bool InFlight::close_if_all_cancelled_before(Clock::time_point t) {
  std::lock_guard<std::mutex> lk(mu_);
  if (delivered_) return false;
  if (closed_) return true;
  if (tokens_.empty()) return false;
  for (const auto& token : tokens_) {
    if (!token.requested_before(t)) return false;
  }
  closed_ = true;
  return true;
}

bool InFlight::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

bool InFlight::wait_for(std::chrono::milliseconds d, const CancellationToken* token) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, d, [&] { return done_ || (token && token->requested()); });
  return done_;
}

void InFlight::wake() {
  std::lock_guard<std::mutex> lk(mu_);
  cv_.notify_all();
}

InFlight::Clock::time_point InFlight::completed_at() const {
  std::lock_guard<std::mutex> lk(mu_);
  return completed_at_;
}

std::shared_ptr<InFlight> InFlight::take_predecessor() {
  std::lock_guard<std::mutex> lk(mu_);
  return std::move(predecessor_);
}

void InFlight::set_result(const ExecutionResult& result) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (delivered_) return;
    delivered_ = true;
    closed_ = true;
  }
  promise_.set_value(result);
  std::lock_guard<std::mutex> lk(mu_);
  done_ = true;
  completed_at_ = Clock::now();
  cv_.notify_all();
}

void InFlight::set_exception(std::exception_ptr e) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (delivered_) return;
    delivered_ = true;
    closed_ = true;
  }
  promise_.set_exception(std::move(e));
  std::lock_guard<std::mutex> lk(mu_);
  done_ = true;
  completed_at_ = Clock::now();
  cv_.notify_all();
}

// ---------------------------------------------------------------------------
// CacheStats
// ---------------------------------------------------------------------------

std::string CacheStats::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"entries\":" + std::to_string(entries);
  out += ",\"bytes\":" + std::to_string(bytes);
  out += ",\"hits\":" + std::to_string(hits);
  out += ",\"misses\":" + std::to_string(misses);
  out += ",\"evictions\":" + std::to_string(evictions);
  out += ",\"expirations\":" + std::to_string(expirations);
  out += ",\"corruptions\":" + std::to_string(corruptions);
  out += ",\"coalesced\":" + std::to_string(coalesced);
  out += ",\"disk_writes\":" + std::to_string(disk_writes);
  out += ",\"in_flight\":" + std::to_string(in_flight);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ResultCache
// ---------------------------------------------------------------------------

ResultCache::ResultCache(Options options) : options_(std::move(options)) {
  if (options_.shard_count == 0) options_.shard_count = 1;
  shards_.reserve(options_.shard_count);
  for (std::size_t i = 0; i < options_.shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
  if (!options_.dir.empty()) {
    std::error_code ec;
    fs::create_directories(options_.dir, ec);
  }
}

ResultCache::~ResultCache() = default;

void ResultCache::set_diagnostic_callback(DiagnosticFn fn) {
  std::lock_guard<std::mutex> lk(diag_mu_);
  diag_ = std::move(fn);
}

ResultCache::Shard& ResultCache::shard_for(const std::string& fp) {
  return *shards_[std::hash<std::string>{}(fp) % shards_.size()];
}

void ResultCache::touch(const std::string& fp, std::uint64_t generation) {
  std::lock_guard<std::mutex> lk(lru_mu_);
  auto it = lru_index_.find(fp);
  if (it == lru_index_.end() || it->second->generation != generation) return;
  lru_.splice(lru_.begin(), lru_, it->second);
}

void ResultCache::forget(const std::string& fp, std::uint64_t generation) {
  std::lock_guard<std::mutex> lk(lru_mu_);
  auto it = lru_index_.find(fp);
  if (it == lru_index_.end() || it->second->generation != generation) return;
  bytes_ -= it->second->size;
  lru_.erase(it->second);
  lru_index_.erase(it);
}

void ResultCache::evict(const std::vector<LruNode>& victims) {
  for (const auto& v : victims) {
    Shard& shard = shard_for(v.fp);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.entries.find(v.fp);
    if (it != shard.entries.end() && it->second.generation == v.generation) shard.entries.erase(it);
  }
}

std::optional<ExecutionResult> ResultCache::lookup_locked(Shard& shard, const std::string& fp) {
  auto it = shard.entries.find(fp);
  if (it == shard.entries.end()) return std::nullopt;
  if (Clock::now() >= it->second.expires_at) {
    expirations_.fetch_add(1, std::memory_order_relaxed);
    erase_locked(shard, fp);
    return std::nullopt;
  }
  touch(fp, it->second.generation);
  return it->second.result;
}

void ResultCache::erase_locked(Shard& shard, const std::string& fp) {
  auto it = shard.entries.find(fp);
  if (it == shard.entries.end()) return;
  forget(fp, it->second.generation);
  shard.entries.erase(it);
}

bool ResultCache::insert_locked(Shard& shard, const std::string& fp, const ExecutionResult& result,
                                Clock::time_point expires_at, std::vector<LruNode>& victims) {
  auto existing = shard.entries.find(fp);
  if (existing != shard.entries.end()) {
    if (Clock::now() < existing->second.expires_at) return false;
    erase_locked(shard, fp);
  }
  const std::size_t size = entry_size(result);
  if (size > options_.max_bytes) return false;

  Entry e;
  e.result = result;
  e.result.from_cache = false;
  e.result.coalesced = false;
  e.expires_at = expires_at;
  e.size = size;

  std::lock_guard<std::mutex> lk(lru_mu_);
  e.generation = next_generation_++;
  lru_.push_front(LruNode{fp, e.generation, size});
  lru_index_[fp] = lru_.begin();
  bytes_ += size;
  while (bytes_ > options_.max_bytes && lru_.size() > 1) {
    LruNode victim = std::move(lru_.back());
    lru_.pop_back();
    lru_index_.erase(victim.fp);
    bytes_ -= victim.size;
    evictions_.fetch_add(1, std::memory_order_relaxed);
    // The victim may live in this shard; it is erased once the caller unlocks.
    victims.push_back(std::move(victim));
  }
  shard.entries[fp] = std::move(e);
  return true;
}

std::optional<ExecutionResult> ResultCache::get(const std::string& fp) {
  Shard& shard = shard_for(fp);
  {
    std::lock_guard<std::mutex> lk(shard.mu);
    if (auto r = lookup_locked(shard, fp)) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      return as_cached(std::move(*r));
    }
  }
  std::chrono::seconds remaining{0};
  if (auto r = load(fp, &remaining)) {
    std::vector<LruNode> victims;
    {
      std::lock_guard<std::mutex> lk(shard.mu);
      insert_locked(shard, fp, *r, Clock::now() + remaining, victims);
    }
    evict(victims);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return as_cached(std::move(*r));
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  return std::nullopt;
}

bool ResultCache::put(const std::string& fp, const ExecutionResult& result,
                      std::optional<std::chrono::seconds> ttl) {
  if (!result.ok() || fp.empty()) return false;
  const std::chrono::seconds life = ttl.value_or(options_.default_ttl);
  if (life.count() <= 0) return false;

  Shard& shard = shard_for(fp);
  bool stored = false;
  std::vector<LruNode> victims;
  {
    std::lock_guard<std::mutex> lk(shard.mu);
    stored = insert_locked(shard, fp, result, Clock::now() + life, victims);
  }
  evict(victims);
  if (!options_.dir.empty() && persist(fp, result, life)) stored = true;
  return stored;
}

bool ResultCache::invalidate(const std::string& fp) {
  Shard& shard = shard_for(fp);
  bool removed = false;
  {
    std::lock_guard<std::mutex> lk(shard.mu);
    removed = shard.entries.count(fp) > 0;
    erase_locked(shard, fp);
  }
  if (!options_.dir.empty() && valid_fingerprint(fp)) {
    std::error_code ec;
    removed |= fs::exists(meta_path(fp), ec) || fs::exists(record_path(fp), ec);
    remove_files(fp);
  }
  return removed;
}

void ResultCache::clear() {
  for (auto& s : shards_) {
    std::lock_guard<std::mutex> lk(s->mu);
    for (const auto& [fp, entry] : s->entries) forget(fp, entry.generation);
    s->entries.clear();
  }
  if (options_.dir.empty()) return;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(options_.dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto ext = it->path().extension();
    if (ext == ".rec" || ext == ".meta") {
      std::error_code rm_ec;
      fs::remove(it->path(), rm_ec);
    }
  }
}

std::size_t ResultCache::prune_expired() {
  std::size_t removed = 0;
  const auto now = Clock::now();
  for (auto& s : shards_) {
    std::lock_guard<std::mutex> lk(s->mu);
    for (auto it = s->entries.begin(); it != s->entries.end();) {
      if (now >= it->second.expires_at) {
        forget(it->first, it->second.generation);
        it = s->entries.erase(it);
        ++removed;
        expirations_.fetch_add(1, std::memory_order_relaxed);
      } else {
        ++it;
      }
    }
  }
  if (options_.dir.empty()) return removed;

  std::vector<std::string> expired;
  const std::uint64_t now_s = unix_now();
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(options_.dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->path().extension() != ".meta") continue;
    auto meta = read_file(it->path());
    const std::string fp = it->path().stem().string();
    if (!meta || !jsonlite::find_u64(*meta, "expires_at") ||
        jsonlite::get_u64(*meta, "expires_at") <= now_s) {
      expired.push_back(fp);
    }
  }
  for (const auto& fp : expired) {
    if (!valid_fingerprint(fp)) continue;
    remove_files(fp);
    ++removed;
  }
  return removed;
}

CacheStats ResultCache::stats() const {
  CacheStats st;
  for (const auto& s : shards_) {
    std::lock_guard<std::mutex> lk(s->mu);
    st.in_flight += s->in_flight.size();
  }
  {
    std::lock_guard<std::mutex> lk(lru_mu_);
    st.entries = lru_index_.size();
    st.bytes = bytes_;
  }
  st.hits = hits_.load(std::memory_order_relaxed);
  st.misses = misses_.load(std::memory_order_relaxed);
  st.evictions = evictions_.load(std::memory_order_relaxed);
  st.expirations = expirations_.load(std::memory_order_relaxed);
  st.corruptions = corruptions_.load(std::memory_order_relaxed);
  st.coalesced = coalesced_.load(std::memory_order_relaxed);
  st.disk_writes = disk_writes_.load(std::memory_order_relaxed);
  return st;
}

AdmitResult ResultCache::admit(const std::string& fp, const CancellationToken& token) {
  AdmitResult out;
  Shard& shard = shard_for(fp);
  {
    std::lock_guard<std::mutex> lk(shard.mu);
    if (auto r = lookup_locked(shard, fp)) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      out.kind = Admission::hit;
      out.cached = as_cached(std::move(*r));
      return out;
    }
    auto flight = std::make_shared<InFlight>();
    auto it = shard.in_flight.find(fp);
    if (it != shard.in_flight.end()) {
      if (it->second->subscribe(token)) {
        coalesced_.fetch_add(1, std::memory_order_relaxed);
        out.kind = Admission::follower;
        out.flight = it->second;
        return out;
      }
      // Closed for cancellation and still terminating its process.
      flight->predecessor_ = it->second;
    }
    flight->subscribe(token);
    shard.in_flight[fp] = flight;
    out.kind = Admission::leader;
    out.flight = std::move(flight);
  }

  // Disk lookup happens outside the lock; the flight registered above makes
  // concurrent admits for this fingerprint wait for us instead of missing.
  std::chrono::seconds remaining{0};
  if (auto r = load(fp, &remaining)) {
    std::vector<LruNode> victims;
    {
      std::lock_guard<std::mutex> lk(shard.mu);
      insert_locked(shard, fp, *r, Clock::now() + remaining, victims);
      auto it = shard.in_flight.find(fp);
      if (it != shard.in_flight.end() && it->second == out.flight) shard.in_flight.erase(it);
    }
    evict(victims);
    ExecutionResult cached = as_cached(std::move(*r));
    out.flight->set_result(cached);
    hits_.fetch_add(1, std::memory_order_relaxed);
    out.kind = Admission::hit;
    out.cached = std::move(cached);
    out.flight.reset();
    return out;
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  return out;
}

void ResultCache::complete(const std::string& fp, const std::shared_ptr<InFlight>& flight,
                           const ExecutionResult& result, std::optional<std::chrono::seconds> ttl) {
  // Store before detaching, so an admit() that no longer sees the flight
  // finds the entry instead.
  put(fp, result, ttl);
  {
    Shard& shard = shard_for(fp);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.in_flight.find(fp);
    if (it != shard.in_flight.end() && it->second == flight) shard.in_flight.erase(it);
  }
  if (flight) flight->set_result(result);
}

void ResultCache::abandon(const std::string& fp, const std::shared_ptr<InFlight>& flight,
                          std::exception_ptr error) {
  {
    Shard& shard = shard_for(fp);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.in_flight.find(fp);
    if (it != shard.in_flight.end() && it->second == flight) shard.in_flight.erase(it);
  }
  if (flight) flight->set_exception(std::move(error));
}

ExecutionResult ResultCache::get_or_run(const std::string& fp,
                                        const std::function<ExecutionResult()>& run_fn,
                                        const CancellationToken& token,
                                        std::optional<std::chrono::seconds> ttl) {
  AdmitResult adm = admit(fp, token);
  if (adm.kind == Admission::hit) return std::move(*adm.cached);
  if (adm.kind == Admission::follower) {
    ExecutionResult r = adm.flight->future().get();
    r.coalesced = true;
    return r;
  }
  if (auto prior = adm.flight->take_predecessor()) prior->future().wait();
  ExecutionResult r;
  try {
    r = run_fn();
  } catch (...) {
    abandon(fp, adm.flight, std::current_exception());
    throw;
  }
  complete(fp, adm.flight, r, ttl);
  return r;
}

// ---------------------------------------------------------------------------
// Disk store
// ---------------------------------------------------------------------------

std::string ResultCache::record_path(const std::string& fp) const {
  return (fs::path(options_.dir) / fp.substr(0, 2) / (fp + ".rec")).string();
}

std::string ResultCache::meta_path(const std::string& fp) const {
  return (fs::path(options_.dir) / fp.substr(0, 2) / (fp + ".meta")).string();
}

void ResultCache::remove_files(const std::string& fp) {
  std::error_code ec;
  fs::remove(record_path(fp), ec);
  fs::remove(meta_path(fp), ec);
}

void ResultCache::report_corruption(const std::string& fp, const std::string& reason) {
  corruptions_.fetch_add(1, std::memory_order_relaxed);
  remove_files(fp);
  DiagnosticFn fn;
  {
    std::lock_guard<std::mutex> lk(diag_mu_);
    fn = diag_;
  }
  if (fn) fn(fp, reason);
}

bool ResultCache::persist(const std::string& fp, const ExecutionResult& result,
                          std::chrono::seconds ttl) {
  if (!valid_fingerprint(fp)) return false;
  ExecutionResult stored_result = result;
  stored_result.from_cache = false;
  stored_result.coalesced = false;
  const std::string record = encode_result_record(stored_result);

  std::string stored = record;
  std::string encoding = "identity";
#if defined(TOOLRUN_WITH_ZSTD)
  if (options_.compression == "zstd") {
    auto c = compress_zstd(record);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  const fs::path target = record_path(fp);
  const fs::path meta = meta_path(fp);
  if (!atomic_write(target, stored)) return false;

  const std::uint64_t now = unix_now();
  std::string meta_json;
  meta_json.reserve(320);
  meta_json += "{\"fingerprint\":\"" + fp + "\"";
  meta_json += ",\"record_version\":" + std::to_string(version::CACHE_RECORD_VERSION);
  meta_json += ",\"encoding\":\"" + encoding + "\"";
  meta_json += ",\"original_size\":" + std::to_string(record.size());
  meta_json += ",\"stored_size\":" + std::to_string(stored.size());
  meta_json += ",\"stored_blob_hash\":\"" + cache_blob_hash(stored) + "\"";
  meta_json += ",\"created_at\":" + std::to_string(now);
  meta_json += ",\"expires_at\":" + std::to_string(now + static_cast<std::uint64_t>(ttl.count()));
  meta_json += '}';
  if (!atomic_write(meta, meta_json)) {
    std::error_code ec;
    fs::remove(target, ec);
    return false;
  }
  disk_writes_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::optional<ExecutionResult> ResultCache::load(const std::string& fp,
                                                 std::chrono::seconds* remaining) {
  if (options_.dir.empty() || !valid_fingerprint(fp)) return std::nullopt;
  const fs::path meta_p = meta_path(fp);
  const fs::path rec_p = record_path(fp);
  std::error_code ec;
  const bool has_meta = fs::exists(meta_p, ec);
  const bool has_rec = fs::exists(rec_p, ec);
  if (!has_meta && !has_rec) return std::nullopt;
  if (!has_meta || !has_rec) {
    report_corruption(fp, "orphaned record or metadata");
    return std::nullopt;
  }

  auto meta = read_file(meta_p);
  if (!meta || !jsonlite::find_u64(*meta, "expires_at") ||
      !jsonlite::find_u64(*meta, "original_size")) {
    report_corruption(fp, "unreadable metadata");
    return std::nullopt;
  }
  if (jsonlite::get_u64(*meta, "record_version") != version::CACHE_RECORD_VERSION) {
    // Written by another format version: a miss, not damage.
    remove_files(fp);
    return std::nullopt;
  }
  const std::uint64_t expires_at = jsonlite::get_u64(*meta, "expires_at");
  const std::uint64_t now = unix_now();
  if (expires_at <= now) {
    expirations_.fetch_add(1, std::memory_order_relaxed);
    remove_files(fp);
    return std::nullopt;
  }

  auto stored = read_file(rec_p);
  if (!stored) {
    report_corruption(fp, "unreadable record");
    return std::nullopt;
  }
  if (cache_blob_hash(*stored) != jsonlite::get_string(*meta, "stored_blob_hash")) {
    report_corruption(fp, "record integrity hash mismatch");
    return std::nullopt;
  }

  std::string record;
  const std::string encoding = jsonlite::get_string(*meta, "encoding", "identity");
  const std::uint64_t original_size = jsonlite::get_u64(*meta, "original_size");
  if (encoding == "identity") {
    record = std::move(*stored);
  } else if (encoding == "zstd") {
#if defined(TOOLRUN_WITH_ZSTD)
    if (original_size > kMaxRecordBytes) {
      report_corruption(fp, "implausible record size");
      return std::nullopt;
    }
    auto plain = decompress_zstd(*stored, static_cast<std::size_t>(original_size));
    if (!plain) {
      report_corruption(fp, "zstd decompression failed");
      return std::nullopt;
    }
    record = std::move(*plain);
#else
    // Readable only by a zstd-enabled build; leave it in place.
    return std::nullopt;
#endif
  } else {
    report_corruption(fp, "unknown record encoding '" + encoding + "'");
    return std::nullopt;
  }

  auto result = decode_result_record(record);
  if (!result || result->fingerprint != fp || !result->ok()) {
    report_corruption(fp, "record does not decode");
    return std::nullopt;
  }
  if (remaining) {
    *remaining = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(expires_at - now));
  }
  return result;
}

}  // namespace toolrun
