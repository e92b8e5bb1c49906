#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "toolrun/cache.hpp"
#include "toolrun/config.hpp"
#include "toolrun/encoding.hpp"
#include "toolrun/engine.hpp"
#include "toolrun/fingerprint.hpp"
#include "toolrun/hash.hpp"
#include "toolrun/jsonlite.hpp"
#include "toolrun/launcher.hpp"
#include "toolrun/observability.hpp"
#include "toolrun/output.hpp"
#include "toolrun/progress.hpp"
#include "toolrun/task.hpp"
#include "toolrun/timeout.hpp"
#include "toolrun/version.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  fs::path p = fs::temp_directory_path() / ("toolrun_test_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_file(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool pid_gone(pid_t pid) { return pid > 0 && ::kill(pid, 0) == -1 && errno == ESRCH; }

toolrun::CommandSpec sh(const std::string& script) {
  toolrun::CommandSpec spec;
  spec.argv = {"/bin/sh", "-c", script};
  return spec;
}

// Short intervals so supervision tests finish quickly.
toolrun::EngineConfig fast_config() {
  toolrun::EngineConfig c;
  c.poll_interval = 50ms;
  c.grace_period = 200ms;
  c.kill_timeout = 200ms;
  c.encodings = {"UTF-8", "ISO-8859-1"};
  c.fallback_encoding = "ISO-8859-1";
  return c;
}

toolrun::ExecutionResult make_ok(const std::string& fp, const std::string& out) {
  toolrun::ExecutionResult r;
  r.state = toolrun::TaskState::succeeded;
  r.stdout_text = out;
  r.rendered = out;
  r.stdout_encoding = "UTF-8";
  r.stderr_encoding = "UTF-8";
  r.duration = 12ms;
  r.budget = 300s;
  r.fingerprint = fp;
  return r;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(toolrun::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(toolrun::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  expect(toolrun::fingerprint_hash(payload) != toolrun::cache_blob_hash(payload),
         "fingerprint and blob domains must differ");
  expect(toolrun::fingerprint_hash(payload) == toolrun::fingerprint_hash(payload),
         "domain hash deterministic");
  expect(toolrun::fingerprint_hash(payload).size() == 64, "64 hex chars");
  const auto info = toolrun::hash_runtime_info();
  expect(info.primitive == "blake3", "hash primitive is blake3");
}

void test_version_manifest() {
  const std::string m = toolrun::version::manifest_json();
  expect(toolrun::jsonlite::get_string(m, "engine_semver") == toolrun::version::ENGINE_SEMVER,
         "manifest carries semver");
  expect(toolrun::jsonlite::get_u64(m, "fingerprint_version") == toolrun::version::FINGERPRINT_VERSION,
         "manifest carries fingerprint version");
}

// ============================================================================
// Encoding negotiation
// ============================================================================

void test_earliest_candidate_wins() {
  const std::vector<std::string> chain = {"UTF-8", "ISO-8859-1"};
  auto utf8 = toolrun::decode("caf\xC3\xA9", chain, "ISO-8859-1");
  expect(utf8.encoding == "UTF-8", "valid UTF-8 accepted by first candidate");
  expect(utf8.text == "caf\xC3\xA9", "UTF-8 text unchanged");
  expect(!utf8.exhausted, "not exhausted");

  auto latin = toolrun::decode("caf\xE9", chain, "ISO-8859-1");
  expect(latin.encoding == "ISO-8859-1", "invalid UTF-8 falls to second candidate");
  expect(latin.text == "caf\xC3\xA9", "latin-1 e-acute converted to UTF-8");

  // Reversed chain: ISO-8859-1 accepts anything, so it wins even for UTF-8.
  auto reversed = toolrun::decode("caf\xC3\xA9", {"ISO-8859-1", "UTF-8"}, "ISO-8859-1");
  expect(reversed.encoding == "ISO-8859-1", "order of the chain decides");
}

void test_unknown_encoding_skipped() {
  expect(!toolrun::encoding_available("NO-SUCH-ENCODING-42"), "bogus encoding unavailable");
  auto r = toolrun::decode("plain", {"NO-SUCH-ENCODING-42", "UTF-8"}, "ISO-8859-1");
  expect(r.encoding == "UTF-8", "unknown candidate skipped");
}

void test_exhausted_fallback_never_fails() {
  auto r = toolrun::decode("ok\xFF\xFE", {"UTF-8"}, "NO-SUCH-ENCODING-42");
  expect(r.exhausted, "exhausted flag set");
  expect(r.encoding == "ISO-8859-1", "built-in latin-1 when fallback unknown");
  expect(r.text.rfind("ok", 0) == 0, "valid prefix kept");

  std::size_t subs = 0;
  const std::string lossy = toolrun::decode_lossy("a\xFF" "b", "UTF-8", &subs);
  expect(subs == 1, "one substitution");
  expect(lossy == "a\xEF\xBF\xBD" "b", "U+FFFD substituted");
}

void test_bom_and_hint() {
  auto bom = toolrun::try_decode("\xEF\xBB\xBFhi", "UTF-8");
  expect(bom && *bom == "hi", "UTF-8 BOM stripped");

  toolrun::EncodingNegotiator n({"UTF-8", "ISO-8859-1"}, "ISO-8859-1");
  auto hinted = n.decode("caf\xC3\xA9", "ISO-8859-1");
  expect(hinted.encoding == "ISO-8859-1", "hint tried ahead of the chain");
  auto unhinted = n.decode("caf\xC3\xA9");
  expect(unhinted.encoding == "UTF-8", "chain order without hint");
}

// ============================================================================
// Timeout estimation
// ============================================================================

void test_dust_scenario() {
  toolrun::TimeoutPolicy policy;
  toolrun::ScaleSignals s;
  s.item_count = 111403;
  s.total_bytes = static_cast<std::uint64_t>(161.3 * static_cast<double>(toolrun::kBytesPerGiB));
  expect(toolrun::estimate_timeout(s, policy) == 1800s, "dust: 300+660+4830 clamps to 1800");

  toolrun::ScaleSignals small;
  small.item_count = 25000;
  small.total_bytes = 2 * toolrun::kBytesPerGiB;
  expect(toolrun::estimate_timeout(small, policy) == 480s, "300 + 60*2 + 30*2");
}

void test_estimate_bounds_and_monotonic() {
  toolrun::TimeoutPolicy policy;
  expect(toolrun::estimate_timeout({}, policy) == policy.base, "zero signals give base");

  std::chrono::seconds prev{0};
  for (std::uint64_t items = 0; items <= 400000; items += 9999) {
    toolrun::ScaleSignals s;
    s.item_count = items;
    const auto t = toolrun::estimate_timeout(s, policy);
    expect(t >= policy.base && t <= policy.max, "within [base, max]");
    expect(t >= prev, "monotonic in item_count");
    prev = t;
  }

  toolrun::ScaleSignals huge;
  huge.item_count = UINT64_MAX;
  huge.total_bytes = UINT64_MAX;
  expect(toolrun::estimate_timeout(huge, policy) == policy.max, "saturates to max");

  toolrun::ScaleSignals partial;
  partial.complete = false;
  expect(toolrun::estimate(partial, policy).possibly_underestimated,
         "incomplete scan marks the estimate");
}

void test_prescan_counts() {
  const auto dir = scratch_dir("prescan");
  fs::create_directories(dir / "a" / "b");
  write_file(dir / "one.txt", std::string(100, 'x'));
  write_file(dir / "a" / "two.txt", std::string(50, 'y'));
  write_file(dir / "a" / "b" / "three.txt", "z");

  const auto s = toolrun::prescan(dir.string(), 5000ms);
  expect(s.complete, "scan complete");
  expect(s.item_count == 3, "three files");
  expect(s.dir_count == 2, "two subdirectories");
  expect(s.total_bytes == 151, "byte total");
  expect(toolrun::describe(s).find("3 files, 2 dirs") == 0, "describe summary");

  const auto missing = toolrun::prescan((dir / "nope").string(), 1000ms);
  expect(missing.complete && missing.item_count == 0, "missing root is empty and complete");

  const auto cancelled = toolrun::prescan(dir.string(), 5000ms, [] { return true; });
  expect(!cancelled.complete, "cancelled scan incomplete");
  fs::remove_all(dir);
}

// ============================================================================
// Output classification
// ============================================================================

void test_plain_text_passthrough() {
  const std::string plain = "name,size\n<a> & \"b\"\n\ttabbed\n";
  auto r = toolrun::render_output(plain);
  expect(!r.converted, "plain text not converted");
  expect(r.text == plain, "plain text byte-identical");
}

void test_ansi_to_html() {
  auto r = toolrun::render_output("\x1b[1;31mred\x1b[0m <ok>");
  expect(r.converted, "ANSI converted");
  expect(r.text.rfind("<pre", 0) == 0, "wrapped in <pre>");
  expect(r.text.find("font-weight:bold") != std::string::npos, "bold span");
  expect(r.text.find("red</span>") != std::string::npos, "text inside span");
  expect(r.text.find("&lt;ok&gt;") != std::string::npos, "HTML escaped");
  expect(r.text.find('\x1b') == std::string::npos, "no raw escapes left");

  auto box = toolrun::render_output("\xE2\x94\x80\xE2\x94\x80 tree");
  expect(box.converted, "box-drawing glyphs are markers");

  auto truecolor = toolrun::ansi_to_html("\x1b[38;2;255;128;0mx\x1b[0m");
  expect(truecolor.find("#ff8000") != std::string::npos, "24-bit colour");

  expect(toolrun::strip_escapes("\x1b[32mgo\x1b[0m\x1b]0;title\x07!") == "go!", "escapes stripped");
}

// ============================================================================
// Task model and progress delivery
// ============================================================================

void test_task_state_machine() {
  toolrun::ExecutionTask task(7, sh("true"), toolrun::CancellationToken(), nullptr);
  expect(task.state() == toolrun::TaskState::pending, "starts pending");
  expect(task.mark_running(1234), "pending -> running");
  expect(!task.mark_running(1234), "running only once");

  toolrun::ExecutionResult done;
  done.state = toolrun::TaskState::succeeded;
  expect(task.finish(done), "first finish wins");
  toolrun::ExecutionResult late;
  late.state = toolrun::TaskState::cancelled;
  expect(!task.finish(late), "terminal state is final");
  expect(task.future().get().state == toolrun::TaskState::succeeded, "stored result kept");

  auto a = task.make_event("a");
  auto b = task.make_event("b");
  expect(b.seq == a.seq + 1, "sequence increments");
  expect(b.timestamp_us > a.timestamp_us, "timestamps strictly increasing");
}

void test_cancellation_token() {
  toolrun::CancellationToken token;
  toolrun::CancellationToken copy = token;
  expect(copy.same_as(token), "copies share one flag");
  const auto before = toolrun::CancellationToken::Clock::now();

  int fired = 0;
  int dropped = 0;
  auto sub = token.on_request([&] { ++fired; });
  {
    auto gone = token.on_request([&] { ++dropped; });
  }
  expect(!token.requested_before(toolrun::CancellationToken::Clock::time_point::max()),
         "nothing requested yet");
  std::this_thread::sleep_for(1ms);
  copy.request();
  copy.request();
  expect(token.requested(), "request seen through the copy");
  expect(fired == 1, "callback runs once");
  expect(dropped == 0, "released subscription not called");
  expect(!token.requested_before(before), "request is later than an earlier instant");
  expect(token.requested_before(toolrun::CancellationToken::Clock::now()), "request ordered before now");

  int late = 0;
  auto after = token.on_request([&] { ++late; });
  expect(late == 1, "subscribing after the request runs at once");
}

void test_progress_dispatcher_order() {
  toolrun::ProgressDispatcher d(1024);
  std::mutex mu;
  std::vector<std::uint64_t> seen;
  toolrun::ProgressSink sink = [&](const toolrun::ProgressEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    seen.push_back(ev.seq);
  };
  for (std::uint64_t i = 1; i <= 200; ++i) {
    toolrun::ProgressEvent ev;
    ev.seq = i;
    d.post(sink, ev);
  }
  d.flush();
  std::lock_guard<std::mutex> lk(mu);
  expect(seen.size() == 200, "all delivered");
  for (std::size_t i = 0; i < seen.size(); ++i) expect(seen[i] == i + 1, "FIFO order");
}

void test_progress_dispatcher_drops_oldest() {
  toolrun::ProgressDispatcher d(4);
  std::atomic<bool> release{false};
  std::atomic<int> delivered{0};
  toolrun::ProgressSink slow = [&](const toolrun::ProgressEvent&) {
    while (!release.load()) std::this_thread::sleep_for(1ms);
    delivered.fetch_add(1);
  };
  for (int i = 0; i < 20; ++i) d.post(slow, toolrun::ProgressEvent{});
  release.store(true);
  d.flush();
  expect(d.dropped() > 0, "overflow drops events");
  expect(d.dropped() + d.delivered() == 20, "every event delivered or dropped");

  toolrun::ProgressSink throwing = [](const toolrun::ProgressEvent&) {
    throw std::runtime_error("sink failure");
  };
  d.post(throwing, toolrun::ProgressEvent{});
  d.flush();
  d.stop();
  d.stop();
}

// ============================================================================
// Process launcher
// ============================================================================

void test_launcher_captures_output() {
  auto spawn = toolrun::Process::start(sh("printf out; printf err >&2; exit 3"));
  expect(spawn.ok(), "spawn /bin/sh");
  auto raw = spawn.process->collect();
  expect(raw.stdout_bytes == "out", "stdout captured");
  expect(raw.stderr_bytes == "err", "stderr captured");
  expect(raw.exit_code == 3, "exit code");
}

void test_launcher_env_and_cwd() {
  const auto dir = scratch_dir("cwd");
  auto spec = sh("pwd; printf \"$TOOLRUN_TEST_VAR\"");
  spec.cwd = dir.string();
  spec.env["TOOLRUN_TEST_VAR"] = "merged";
  auto spawn = toolrun::Process::start(spec);
  expect(spawn.ok(), "spawn with cwd");
  auto raw = spawn.process->collect();
  expect(raw.stdout_bytes.find(fs::canonical(dir).string()) == 0, "child runs in cwd");
  expect(raw.stdout_bytes.find("merged") != std::string::npos, "env entry merged");

  auto bad = sh("true");
  bad.cwd = (dir / "missing").string();
  auto failed = toolrun::Process::start(bad);
  expect(!failed.ok(), "missing cwd fails");
  expect(failed.error == toolrun::ErrorCode::spawn_failed, "chdir failure is spawn_failed");
  expect(failed.diagnostic.find("working directory") != std::string::npos, "cwd diagnostic");
  fs::remove_all(dir);
}

void test_launcher_missing_tool() {
  toolrun::CommandSpec spec;
  spec.argv = {"toolrun-definitely-not-installed"};
  auto r = toolrun::Process::start(spec);
  expect(!r.ok(), "no process");
  expect(r.error == toolrun::ErrorCode::tool_not_found, "tool_not_found");
  expect(!toolrun::resolve_executable("toolrun-definitely-not-installed", "/usr/bin:/bin"),
         "resolve fails");
  expect(toolrun::resolve_executable("sh", "/usr/bin:/bin").has_value(), "sh resolves");
}

void test_launcher_truncates_but_drains() {
  auto spec = sh("i=0; while [ $i -lt 2000 ]; do echo 0123456789012345678901234567890123456789; i=$((i+1)); done");
  spec.max_output_bytes = 1024;
  auto spawn = toolrun::Process::start(spec);
  expect(spawn.ok(), "spawn writer");
  auto raw = spawn.process->collect();
  expect(raw.exit_code == 0, "writer not blocked by the cap");
  expect(raw.stdout_bytes.size() == 1024, "capture capped");
  expect(raw.stdout_truncated, "truncation flagged");
}

void test_launcher_terminate_escalates() {
  // Ignores SIGTERM, so termination needs SIGKILL.
  auto spawn = toolrun::Process::start(sh("trap '' TERM; while :; do sleep 1; done"));
  expect(spawn.ok(), "spawn stubborn child");
  const pid_t pid = spawn.process->pid();
  std::this_thread::sleep_for(100ms);
  const bool killed = spawn.process->terminate(200ms, 200ms);
  expect(killed, "SIGKILL needed");
  expect(spawn.process->exited(), "reaped after terminate");
  expect(pid_gone(pid), "pid gone");
  auto raw = spawn.process->collect(500ms);
  expect(raw.exit_code == 128 + SIGKILL, "128 + signal");
}

void test_launcher_interrupt_and_exit_time() {
  auto spawn = toolrun::Process::start(sh("sleep 0.3"));
  expect(spawn.ok(), "spawn");
  auto& p = *spawn.process;
  expect(p.exited_at() == std::chrono::steady_clock::time_point::max(), "no exit time while running");

  const auto start = std::chrono::steady_clock::now();
  std::thread waker([&] {
    std::this_thread::sleep_for(50ms);
    p.interrupt();
  });
  expect(!p.wait_for(5s), "interrupted wait reports still running");
  waker.join();
  expect(std::chrono::steady_clock::now() - start < 1s, "interrupt ends the wait early");

  toolrun::CancellationToken token;
  token.request();
  expect(p.wait_for(5s), "exits");
  expect(token.requested_before(p.exited_at()), "request ordered before the exit");
  expect(p.collect(500ms).exit_code == 0, "clean exit");
}

// ============================================================================
// Fingerprint
// ============================================================================

void test_fingerprint_identity() {
  auto a = sh("echo hi");
  a.env["B"] = "2";
  a.env["A"] = "1";
  auto b = sh("echo hi");
  b.env["A"] = "1";
  b.env["B"] = "2";
  b.timeout = 5s;
  expect(toolrun::compute_fingerprint(a, {}, "v1") == toolrun::compute_fingerprint(b, {}, "v1"),
         "env insertion order and timeout do not change identity");
  expect(toolrun::compute_fingerprint(a, {}, "v1") != toolrun::compute_fingerprint(a, {}, "v2"),
         "tool version is part of identity");
  expect(toolrun::compute_fingerprint(a, {}, "v1") != toolrun::compute_fingerprint(sh("echo ho"), {}, "v1"),
         "argv is part of identity");

  const auto dir = scratch_dir("fp");
  const auto input = dir / "input.csv";
  write_file(input, "a,b\n");
  const auto before = toolrun::compute_fingerprint(a, {input.string()}, "v1");
  write_file(input, "a,b\n1,2\n");
  const auto after = toolrun::compute_fingerprint(a, {input.string()}, "v1");
  expect(before != after, "input change invalidates fingerprint");
  fs::remove_all(dir);
}

// ============================================================================
// Result cache
// ============================================================================

void test_cache_put_get() {
  toolrun::ResultCache cache(toolrun::ResultCache::Options{});
  const std::string fp = toolrun::fingerprint_hash("put-get");
  expect(!cache.get(fp), "empty miss");
  expect(cache.put(fp, make_ok(fp, "data")), "stored");
  auto hit = cache.get(fp);
  expect(hit && hit->stdout_text == "data", "hit returns stored result");
  expect(hit->from_cache, "marked from cache");

  expect(!cache.put(fp, make_ok(fp, "other")), "live entry not replaced");
  expect(cache.get(fp)->stdout_text == "data", "entry immutable");

  toolrun::ExecutionResult failed = make_ok(fp, "x");
  failed.state = toolrun::TaskState::failed;
  const std::string fp2 = toolrun::fingerprint_hash("failed");
  expect(!cache.put(fp2, failed), "failures never cached");

  expect(cache.invalidate(fp), "invalidate existing");
  expect(!cache.get(fp), "gone after invalidate");
  const auto st = cache.stats();
  expect(st.hits == 2 && st.misses == 2, "hit/miss counters");
}

void test_cache_ttl_expiry() {
  toolrun::ResultCache cache(toolrun::ResultCache::Options{});
  const std::string fp = toolrun::fingerprint_hash("ttl");
  expect(cache.put(fp, make_ok(fp, "short"), 1s), "stored with ttl");
  expect(cache.get(fp).has_value(), "live before expiry");
  std::this_thread::sleep_for(1100ms);
  expect(!cache.get(fp), "expired");
  expect(cache.stats().expirations == 1, "expiration counted");
}

void test_cache_lru_eviction() {
  toolrun::ResultCache::Options opts;
  opts.shard_count = 1;
  opts.max_bytes = 3 * 1024;
  toolrun::ResultCache cache(opts);
  const std::string payload(300, 'p');
  const auto fp1 = toolrun::fingerprint_hash("lru1");
  const auto fp2 = toolrun::fingerprint_hash("lru2");
  const auto fp3 = toolrun::fingerprint_hash("lru3");
  const auto fp4 = toolrun::fingerprint_hash("lru4");
  cache.put(fp1, make_ok(fp1, payload));
  cache.put(fp2, make_ok(fp2, payload));
  expect(cache.get(fp1).has_value(), "touch fp1 so fp2 is least recent");
  cache.put(fp3, make_ok(fp3, payload));
  cache.put(fp4, make_ok(fp4, payload));
  expect(cache.stats().bytes <= opts.max_bytes, "within budget");
  expect(cache.stats().evictions >= 1, "eviction happened");
  expect(!cache.get(fp2).has_value(), "least recently used evicted");
  expect(cache.get(fp4).has_value(), "newest kept");
}

void test_cache_budget_spans_shards() {
  toolrun::ResultCache::Options opts;
  opts.max_bytes = 1024 * 1024;
  toolrun::ResultCache cache(opts);
  const std::string payload(50 * 1024, 'q');

  // Each entry is about a tenth of the budget; ten fit.
  std::vector<std::string> fps;
  for (int i = 0; i < 10; ++i) {
    fps.push_back(toolrun::fingerprint_hash("budget" + std::to_string(i)));
    expect(cache.put(fps.back(), make_ok(fps.back(), payload)), "entry within the total budget stored");
  }
  expect(cache.stats().entries == 10, "all ten resident");
  expect(cache.stats().evictions == 0, "no eviction below the total budget");

  expect(cache.get(fps[0]).has_value(), "touch the oldest");
  const auto extra = toolrun::fingerprint_hash("budget-extra");
  expect(cache.put(extra, make_ok(extra, payload)), "store past the budget");
  expect(cache.stats().bytes <= opts.max_bytes, "total stays within budget");
  expect(cache.stats().evictions == 1, "one eviction");
  expect(!cache.get(fps[1]).has_value(), "least recently used across shards evicted");
  expect(cache.get(fps[0]).has_value(), "recently used survives");
  expect(cache.get(extra).has_value(), "newest kept");

  const auto huge = toolrun::fingerprint_hash("budget-huge");
  expect(!cache.put(huge, make_ok(huge, std::string(600 * 1024, 'h'))), "larger than the budget refused");
  expect(cache.get(fps[9]).has_value(), "refusal evicts nothing");
}

void test_cache_disk_persistence() {
  const auto dir = scratch_dir("cache_disk");
  toolrun::ResultCache::Options opts;
  opts.dir = dir.string();
  const auto fp = toolrun::fingerprint_hash("disk");
  {
    toolrun::ResultCache cache(opts);
    expect(cache.put(fp, make_ok(fp, "persisted \xE2\x94\x80")), "stored");
    expect(cache.stats().disk_writes == 1, "written to disk");
  }
  toolrun::ResultCache reopened(opts);
  auto r = reopened.get(fp);
  expect(r && r->stdout_text == "persisted \xE2\x94\x80", "loaded from disk");
  expect(r->fingerprint == fp, "fingerprint kept");

  reopened.clear();
  toolrun::ResultCache after_clear(opts);
  expect(!after_clear.get(fp), "clear removes disk records");
  fs::remove_all(dir);
}

void test_cache_corruption_is_a_miss() {
  const auto dir = scratch_dir("cache_corrupt");
  toolrun::ResultCache::Options opts;
  opts.dir = dir.string();
  const auto fp = toolrun::fingerprint_hash("corrupt");
  {
    toolrun::ResultCache cache(opts);
    cache.put(fp, make_ok(fp, "precious"));
  }
  const fs::path rec = dir / fp.substr(0, 2) / (fp + ".rec");
  expect(fs::exists(rec), "record file exists");
  std::string bytes = read_file(rec);
  bytes[bytes.size() / 2] ^= 0x5A;
  write_file(rec, bytes);

  toolrun::ResultCache cache(opts);
  std::string reported;
  cache.set_diagnostic_callback([&](const std::string& f, const std::string&) { reported = f; });
  expect(!cache.get(fp), "corrupt record is a miss");
  expect(cache.stats().corruptions == 1, "corruption counted");
  expect(reported == fp, "corruption reported");
  expect(!fs::exists(rec), "corrupt record deleted");
  fs::remove_all(dir);
}

void test_cache_record_codec() {
  auto r = make_ok(toolrun::fingerprint_hash("codec"), "out");
  r.stderr_text = "warn";
  r.converted = true;
  r.rendered = "<pre>out</pre>";
  r.exit_code = 0;
  r.budget_possibly_underestimated = true;
  auto decoded = toolrun::decode_result_record(toolrun::encode_result_record(r));
  expect(decoded.has_value(), "decodes");
  expect(decoded->stderr_text == "warn" && decoded->rendered == r.rendered, "strings kept");
  expect(decoded->converted && decoded->budget_possibly_underestimated, "flags kept");
  expect(!toolrun::decode_result_record("TRR"), "truncated record rejected");
  std::string tampered = toolrun::encode_result_record(r);
  tampered.push_back('x');
  expect(!toolrun::decode_result_record(tampered), "trailing bytes rejected");
}

void test_cache_get_or_run_coalesces() {
  toolrun::ResultCache cache(toolrun::ResultCache::Options{});
  const auto fp = toolrun::fingerprint_hash("coalesce");
  std::atomic<int> runs{0};
  auto fn = [&] {
    runs.fetch_add(1);
    std::this_thread::sleep_for(200ms);
    return make_ok(fp, "shared");
  };
  std::vector<std::thread> threads;
  std::vector<toolrun::ExecutionResult> results(8);
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] { results[i] = cache.get_or_run(fp, fn); });
  }
  for (auto& t : threads) t.join();
  expect(runs.load() == 1, "one run for eight callers");
  for (const auto& r : results) expect(r.stdout_text == "shared", "identical result");

  const auto fp_err = toolrun::fingerprint_hash("coalesce-throw");
  bool threw = false;
  try {
    cache.get_or_run(fp_err, []() -> toolrun::ExecutionResult { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "leader exception propagates");
  expect(cache.stats().in_flight == 0, "flight removed after failure");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation_repairs() {
  toolrun::EngineConfig c;
  c.timeout.base = 0s;
  c.timeout.max = 100s;
  c.max_concurrent_tasks = 0;
  c.cache_compression = "lz77";
  c.encodings.clear();
  const auto repairs = c.validate();
  expect(c.timeout.base == 300s, "base repaired");
  expect(c.timeout.max == 300s, "max raised to base");
  expect(c.max_concurrent_tasks == 4, "concurrency repaired");
  expect(c.cache_compression == "identity", "compression repaired");
  expect(c.encodings.size() == 4 && c.encodings.front() == "UTF-8", "default chain restored");
  expect(repairs.size() == 5, "one note per repair");

  toolrun::EngineConfig fine;
  expect(fine.validate().empty(), "defaults need no repair");
}

void test_config_sources() {
  const auto dir = scratch_dir("config");
  const auto file = dir / "toolrun.json";
  write_file(file, "{\"timeout_base_s\": 120, \"timeout_max_s\": 600, \"encodings\": [\"GBK\", \"UTF-8\"],"
                   " \"cache_dir\": \"/tmp/toolrun-cache\"}");
  auto c = toolrun::EngineConfig::from_json_file(file.string());
  expect(c.timeout.base == 120s && c.timeout.max == 600s, "timeouts from file");
  expect(c.encodings.size() == 2 && c.encodings[0] == "GBK", "encodings from file");
  expect(c.cache_dir == "/tmp/toolrun-cache", "cache dir from file");
  expect(c.validate().empty(), "file config valid");

  ::setenv("TOOLRUN_POLL_INTERVAL_MS", "250", 1);
  ::setenv("TOOLRUN_ENCODINGS", "UTF-8, CP950", 1);
  auto e = toolrun::EngineConfig::from_env(c);
  ::unsetenv("TOOLRUN_POLL_INTERVAL_MS");
  ::unsetenv("TOOLRUN_ENCODINGS");
  expect(e.poll_interval == 250ms, "env overrides file");
  expect(e.encodings.size() == 2 && e.encodings[1] == "CP950", "env list trimmed");
  expect(e.timeout.base == 120s, "file value kept when env silent");

  auto missing = toolrun::EngineConfig::from_json_file((dir / "absent.json").string());
  expect(missing.validate().size() == 1, "unreadable file reported");
  fs::remove_all(dir);
}

// ============================================================================
// Engine
// ============================================================================

void test_engine_success_with_progress() {
  toolrun::Engine engine(fast_config());
  std::mutex mu;
  std::vector<toolrun::ProgressEvent> events;
  auto handle = engine.run(sh("sleep 0.3; printf done"), [&](const toolrun::ProgressEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    events.push_back(ev);
  }, toolrun::CancellationToken(), toolrun::RunOptions{false});
  auto r = engine.await(handle);
  engine.flush_progress();
  expect(r.state == toolrun::TaskState::succeeded, "succeeded");
  expect(r.stdout_text == "done", "stdout decoded");
  expect(r.stdout_encoding == "UTF-8", "encoding reported");
  expect(!r.converted && r.rendered == "done", "plain output passes through");
  expect(r.budget == 300s, "base budget without signals");

  std::lock_guard<std::mutex> lk(mu);
  expect(events.size() >= 2, "progress ticks emitted");
  for (std::size_t i = 1; i < events.size(); ++i) {
    expect(events[i].seq > events[i - 1].seq, "events in order");
    expect(events[i].timestamp_us > events[i - 1].timestamp_us, "timestamps increase");
  }
  bool heartbeat = false;
  for (const auto& ev : events) heartbeat |= ev.message.rfind("Running (", 0) == 0;
  expect(heartbeat, "running heartbeat");
  expect(events.back().message == "Exited with code 0", "final exit event");
}

void test_engine_tool_not_found() {
  toolrun::Engine engine(fast_config());
  toolrun::CommandSpec spec;
  spec.argv = {"toolrun-definitely-not-installed", "--flag"};
  const auto start = std::chrono::steady_clock::now();
  auto handle = engine.run(spec, nullptr);
  auto r = engine.await(handle);
  const auto took = std::chrono::steady_clock::now() - start;
  expect(r.state == toolrun::TaskState::failed, "failed");
  expect(r.error_code == toolrun::ErrorCode::tool_not_found, "tool_not_found");
  expect(took < 100ms, "reported within milliseconds");
  expect(r.stdout_encoding.empty(), "no encoding negotiation");
  expect(engine.stats().processes_spawned.load() == 0, "no process spawned");
  expect(toolrun::status_line(r).find("Tool not found") == 0, "install hint");

  toolrun::CommandSpec empty;
  expect(engine.await(engine.run(empty, nullptr)).error_code == toolrun::ErrorCode::invalid_spec,
         "empty argv rejected");
}

void test_engine_process_failure() {
  toolrun::Engine engine(fast_config());
  auto r = engine.await(engine.run(sh("echo 'bad input' >&2; exit 4"), nullptr));
  expect(r.state == toolrun::TaskState::failed, "failed");
  expect(r.error_code == toolrun::ErrorCode::process_failed, "process_failed");
  expect(r.exit_code == 4, "exit code kept");
  expect(r.stderr_text == "bad input\n", "stderr attached");
  expect(toolrun::status_line(r).find("bad input") != std::string::npos, "first stderr line shown");
  expect(!engine.cache().get(r.fingerprint), "failure not cached");
}

void test_engine_cancel() {
  auto cfg = fast_config();
  toolrun::Engine engine(cfg);
  auto handle = engine.run(sh("trap '' TERM; sleep 30"), nullptr);
  std::this_thread::sleep_for(200ms);
  const pid_t pid = handle.task()->pid();
  expect(pid > 0, "process running");
  const auto start = std::chrono::steady_clock::now();
  engine.cancel(handle);
  auto r = engine.await(handle);
  const auto took = std::chrono::steady_clock::now() - start;
  expect(r.state == toolrun::TaskState::cancelled, "cancelled");
  expect(r.error_code == toolrun::ErrorCode::cancelled, "not a process failure");
  expect(took < cfg.poll_interval + cfg.grace_period + cfg.kill_timeout + 500ms,
         "within one poll interval plus grace");
  expect(pid_gone(pid), "process confirmed dead");
  expect(toolrun::status_line(r).rfind("Cancelled", 0) == 0, "neutral status line");
}

void test_engine_cancel_just_before_exit() {
  auto cfg = fast_config();
  cfg.poll_interval = 1000ms;
  toolrun::Engine engine(cfg);
  auto handle = engine.run(sh("sleep 0.5; echo done"), nullptr, toolrun::CancellationToken(),
                           toolrun::RunOptions{false});
  std::this_thread::sleep_for(100ms);
  const auto start = std::chrono::steady_clock::now();
  engine.cancel(handle);
  auto r = engine.await(handle);
  expect(r.state == toolrun::TaskState::cancelled, "cancel before exit is never a success");
  expect(std::chrono::steady_clock::now() - start < 900ms, "cancel wakes the supervisor");
}

void test_engine_timeout() {
  auto cfg = fast_config();
  toolrun::Engine engine(cfg);
  auto spec = sh("sleep 30");
  spec.timeout = 1s;
  auto handle = engine.run(spec, nullptr, toolrun::CancellationToken(), toolrun::RunOptions{false});
  auto r = engine.await(handle);
  expect(r.state == toolrun::TaskState::timed_out, "timed out");
  expect(r.error_code == toolrun::ErrorCode::timeout, "timeout code");
  expect(r.budget == 1s, "explicit timeout wins");
  expect(r.duration < 1s + cfg.poll_interval + cfg.grace_period + cfg.kill_timeout + 500ms,
         "terminated promptly after the deadline");
  expect(pid_gone(handle.task()->pid()), "pid gone after grace + kill timeout");
  expect(toolrun::status_line(r).find("Narrow the scope") != std::string::npos, "remediation hint");
}

void test_engine_coalesces_identical_runs() {
  const auto dir = scratch_dir("coalesce");
  const auto counter = dir / "counter";
  toolrun::Engine engine(fast_config());
  auto spec = sh("echo run >> '" + counter.string() + "'; sleep 0.5; printf shared");
  auto first = engine.run(spec, nullptr);
  std::this_thread::sleep_for(10ms);
  auto second = engine.run(spec, nullptr);
  auto r1 = engine.await(first);
  auto r2 = engine.await(second);
  expect(r1.ok() && r2.ok(), "both succeed");
  expect(r1.stdout_text == "shared" && r2.stdout_text == "shared", "identical output");
  expect(r1.fingerprint == r2.fingerprint, "same fingerprint");
  expect(read_file(counter) == "run\n", "exactly one OS process");
  expect(r2.coalesced || r2.from_cache, "second attached to the first");
  expect(engine.stats().processes_spawned.load() == 1, "one spawn counted");

  auto r3 = engine.await(engine.run(spec, nullptr));
  expect(r3.from_cache, "later identical run served from cache");
  expect(read_file(counter) == "run\n", "cache hit spawns nothing");
  fs::remove_all(dir);
}

void test_engine_leader_cancel_keeps_follower() {
  const auto dir = scratch_dir("detach");
  const auto counter = dir / "counter";
  toolrun::Engine engine(fast_config());
  auto spec = sh("echo run >> '" + counter.string() + "'; sleep 0.6; printf kept");
  auto leader = engine.run(spec, nullptr);
  std::this_thread::sleep_for(100ms);
  auto follower = engine.run(spec, nullptr);
  std::this_thread::sleep_for(100ms);
  engine.cancel(leader);
  auto rl = engine.await(leader);
  auto rf = engine.await(follower);
  expect(rl.state == toolrun::TaskState::cancelled, "leader detached as cancelled");
  expect(rf.ok() && rf.stdout_text == "kept", "follower still gets the result");
  expect(read_file(counter) == "run\n", "process not restarted");
  fs::remove_all(dir);
}

void test_engine_follower_cancel() {
  const auto dir = scratch_dir("follower_cancel");
  const auto counter = dir / "counter";
  auto cfg = fast_config();
  cfg.poll_interval = 1000ms;
  toolrun::Engine engine(cfg);
  auto spec = sh("echo run >> '" + counter.string() + "'; sleep 0.8; printf kept");
  auto leader = engine.run(spec, nullptr);
  std::this_thread::sleep_for(100ms);
  auto follower = engine.run(spec, nullptr);
  std::this_thread::sleep_for(100ms);
  const auto start = std::chrono::steady_clock::now();
  engine.cancel(follower);
  auto rf = engine.await(follower);
  expect(rf.state == toolrun::TaskState::cancelled, "follower cancelled");
  expect(std::chrono::steady_clock::now() - start < 500ms, "follower leaves at once");
  auto rl = engine.await(leader);
  expect(rl.ok() && rl.stdout_text == "kept", "leader unaffected");
  expect(read_file(counter) == "run\n", "one process");
  fs::remove_all(dir);
}

// Writes "start", then "stopped" on SIGTERM or "end" on completion.
toolrun::CommandSpec logged_run(const fs::path& log) {
  const std::string l = "'" + log.string() + "'";
  return sh("trap 'sleep 0.3; echo stopped >> " + l + "; exit 1' TERM; echo start >> " + l +
            "; sleep 1 & wait; echo end >> " + l + "; printf ok");
}

void test_engine_all_subscribers_cancel() {
  const auto dir = scratch_dir("all_cancel");
  const auto log = dir / "log";
  auto cfg = fast_config();
  cfg.grace_period = 2s;
  toolrun::Engine engine(cfg);
  auto leader = engine.run(logged_run(log), nullptr);
  std::this_thread::sleep_for(100ms);
  auto follower = engine.run(logged_run(log), nullptr);
  std::this_thread::sleep_for(100ms);
  const pid_t pid = leader.task()->pid();
  engine.cancel(follower);
  engine.cancel(leader);
  auto rf = engine.await(follower);
  auto rl = engine.await(leader);
  expect(rf.state == toolrun::TaskState::cancelled, "follower cancelled");
  expect(rl.state == toolrun::TaskState::cancelled, "leader cancelled");
  expect(pid_gone(pid), "shared process terminated and reaped");
  expect(read_file(log) == "start\nstopped\n", "terminated, not completed");
  fs::remove_all(dir);
}

void test_engine_rerun_waits_for_stopping_process() {
  const auto dir = scratch_dir("rerun");
  const auto log = dir / "log";
  auto cfg = fast_config();
  cfg.grace_period = 2s;
  toolrun::Engine engine(cfg);
  auto first = engine.run(logged_run(log), nullptr);
  std::this_thread::sleep_for(100ms);
  engine.cancel(first);
  std::this_thread::sleep_for(50ms);  // SIGTERM sent; the trap is still running
  auto second = engine.run(logged_run(log), nullptr);
  auto r1 = engine.await(first);
  auto r2 = engine.await(second);
  expect(r1.state == toolrun::TaskState::cancelled, "first cancelled");
  expect(r2.ok() && r2.stdout_text == "ok", "rerun succeeds");
  expect(read_file(log) == "start\nstopped\nstart\nend\n", "rerun starts after the old process stopped");
  fs::remove_all(dir);
}

void test_engine_encoding_and_markup() {
  toolrun::Engine engine(fast_config());
  auto latin = engine.await(engine.run(sh("printf 'caf\\351'"), nullptr));
  expect(latin.ok(), "latin-1 run ok");
  expect(latin.stdout_encoding == "ISO-8859-1", "second candidate accepted");
  expect(latin.stdout_text == "caf\xC3\xA9", "decoded to UTF-8");

  auto ansi = engine.await(engine.run(sh("printf '\\033[32mgreen\\033[0m'"), nullptr));
  expect(ansi.converted, "ANSI output converted");
  expect(ansi.rendered.find("green</span>") != std::string::npos, "rendered as HTML");
  expect(ansi.stdout_text.find('\x1b') != std::string::npos, "raw text kept");
}

void test_engine_prescan_budget() {
  const auto dir = scratch_dir("budget");
  for (int i = 0; i < 5; ++i) write_file(dir / ("f" + std::to_string(i)), "x");
  toolrun::Engine engine(fast_config());
  toolrun::RunOptions opts;
  opts.cacheable = false;
  opts.prescan_path = dir.string();
  auto r = engine.await(engine.run(sh("true"), nullptr, toolrun::CancellationToken(), opts));
  expect(r.ok() && r.budget == 300s, "small tree gets base budget");

  toolrun::RunOptions signalled;
  signalled.cacheable = false;
  toolrun::ScaleSignals s;
  s.item_count = 111403;
  s.total_bytes = 161ull * toolrun::kBytesPerGiB;
  signalled.scale_signals = s;
  auto big = engine.await(engine.run(sh("true"), nullptr, toolrun::CancellationToken(), signalled));
  expect(big.budget == 1800s, "supplied signals drive the budget");
  expect(engine.estimate_timeout(s) == 1800s, "estimate_timeout is pure");
  fs::remove_all(dir);
}

void test_engine_concurrency_limit() {
  auto cfg = fast_config();
  cfg.max_concurrent_tasks = 1;
  toolrun::Engine engine(cfg);
  const auto start = std::chrono::steady_clock::now();
  toolrun::RunOptions opts;
  opts.cacheable = false;
  auto a = engine.run(sh("sleep 0.3"), nullptr, toolrun::CancellationToken(), opts);
  auto b = engine.run(sh("sleep 0.3"), nullptr, toolrun::CancellationToken(), opts);
  expect(engine.await(a).ok() && engine.await(b).ok(), "both complete");
  expect(std::chrono::steady_clock::now() - start >= 600ms, "runs serialized by the slot limit");
}

void test_engine_event_log() {
  const auto dir = scratch_dir("events");
  auto cfg = fast_config();
  cfg.event_log_path = (dir / "events.jsonl").string();
  std::vector<std::string> hooked;
  std::mutex mu;
  {
    toolrun::Engine engine(cfg);
    engine.set_event_hook([&](const std::string& line) {
      std::lock_guard<std::mutex> lk(mu);
      hooked.push_back(line);
    });
    engine.await(engine.run(sh("printf hi"), nullptr));
    const std::string stats = engine.stats_json();
    expect(stats.find("\"succeeded\":1") != std::string::npos, "stats count success");
    expect(stats.find("\"latency\"") != std::string::npos, "latency histogram present");
  }
  std::lock_guard<std::mutex> lk(mu);
  expect(hooked.size() == 1, "one task event");
  expect(toolrun::jsonlite::get_string(hooked[0], "state") == "succeeded", "state in event");
  expect(hooked[0].find("\"hi\"") == std::string::npos, "output content never logged");
  expect(read_file(dir / "events.jsonl").find("\"kind\":\"task\"") != std::string::npos, "JSONL written");
  fs::remove_all(dir);
}

void test_engine_shutdown_reaps_children() {
  pid_t pid = 0;
  {
    toolrun::Engine engine(fast_config());
    auto handle = engine.run(sh("sleep 30"), nullptr);
    std::this_thread::sleep_for(200ms);
    pid = handle.task()->pid();
    expect(pid > 0, "child started");
  }
  expect(pid_gone(pid), "no child outlives the engine");
}

}  // namespace

int main() {
  std::cout << "=== toolrun engine tests ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Encoding negotiation]\n";
  run_test("earliest decodable candidate wins", test_earliest_candidate_wins);
  run_test("unknown encodings skipped", test_unknown_encoding_skipped);
  run_test("exhausted fallback never fails", test_exhausted_fallback_never_fails);
  run_test("BOM stripping and hint", test_bom_and_hint);

  std::cout << "\n[Timeout estimation]\n";
  run_test("dust scenario", test_dust_scenario);
  run_test("bounds and monotonicity", test_estimate_bounds_and_monotonic);
  run_test("pre-scan counts", test_prescan_counts);

  std::cout << "\n[Output classification]\n";
  run_test("plain text passthrough", test_plain_text_passthrough);
  run_test("ANSI to HTML", test_ansi_to_html);

  std::cout << "\n[Tasks and progress]\n";
  run_test("task state machine", test_task_state_machine);
  run_test("cancellation token", test_cancellation_token);
  run_test("dispatcher preserves order", test_progress_dispatcher_order);
  run_test("dispatcher drops oldest", test_progress_dispatcher_drops_oldest);

  std::cout << "\n[Process launcher]\n";
  run_test("captures output", test_launcher_captures_output);
  run_test("env and cwd", test_launcher_env_and_cwd);
  run_test("missing tool", test_launcher_missing_tool);
  run_test("truncates but drains", test_launcher_truncates_but_drains);
  run_test("terminate escalates to SIGKILL", test_launcher_terminate_escalates);
  run_test("interrupt and exit time", test_launcher_interrupt_and_exit_time);

  std::cout << "\n[Fingerprint]\n";
  run_test("fingerprint identity", test_fingerprint_identity);

  std::cout << "\n[Result cache]\n";
  run_test("put/get", test_cache_put_get);
  run_test("TTL expiry", test_cache_ttl_expiry);
  run_test("LRU eviction", test_cache_lru_eviction);
  run_test("budget spans shards", test_cache_budget_spans_shards);
  run_test("disk persistence", test_cache_disk_persistence);
  run_test("corruption is a miss", test_cache_corruption_is_a_miss);
  run_test("record codec", test_cache_record_codec);
  run_test("get_or_run coalesces", test_cache_get_or_run_coalesces);

  std::cout << "\n[Configuration]\n";
  run_test("validation repairs", test_config_validation_repairs);
  run_test("file and env sources", test_config_sources);

  std::cout << "\n[Engine]\n";
  run_test("success with progress", test_engine_success_with_progress);
  run_test("tool not found", test_engine_tool_not_found);
  run_test("process failure", test_engine_process_failure);
  run_test("cancel", test_engine_cancel);
  run_test("cancel just before exit", test_engine_cancel_just_before_exit);
  run_test("timeout", test_engine_timeout);
  run_test("identical runs coalesce", test_engine_coalesces_identical_runs);
  run_test("leader cancel keeps follower", test_engine_leader_cancel_keeps_follower);
  run_test("follower cancel", test_engine_follower_cancel);
  run_test("all subscribers cancel", test_engine_all_subscribers_cancel);
  run_test("rerun waits for stopping process", test_engine_rerun_waits_for_stopping_process);
  run_test("encoding and markup", test_engine_encoding_and_markup);
  run_test("pre-scan budget", test_engine_prescan_budget);
  run_test("concurrency limit", test_engine_concurrency_limit);
  run_test("event log", test_engine_event_log);
  run_test("shutdown reaps children", test_engine_shutdown_reaps_children);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
