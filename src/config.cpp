#include "toolrun/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

#include "toolrun/jsonlite.hpp"

namespace toolrun {

namespace {

// Upper bound for any numeric knob. Keeps chrono arithmetic far from overflow.
constexpr std::uint64_t kMaxKnob = 1'000'000'000'000ull;

std::optional<std::uint64_t> parse_u64(const std::string& s) {
  if (s.empty() || s.size() > 19) return std::nullopt;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (v > kMaxKnob) return std::nullopt;
  return v;
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else if (c != ' ') {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

class EnvReader {
 public:
  explicit EnvReader(std::vector<std::string>& notes) : notes_(notes) {}

  template <typename Setter>
  void number(const char* name, Setter set) {
    const char* raw = std::getenv(name);
    if (!raw || !raw[0]) return;
    if (auto v = parse_u64(raw)) {
      set(*v);
    } else {
      notes_.push_back(std::string(name) + "=" + raw + " is not a valid number; default kept");
    }
  }

  void text(const char* name, std::string& out) {
    const char* raw = std::getenv(name);
    if (raw && raw[0]) out = raw;
  }

 private:
  std::vector<std::string>& notes_;
};

template <typename Setter>
void json_number(const std::string& doc, const char* key, Setter set,
                 std::vector<std::string>& notes) {
  if (doc.find(std::string("\"") + key + "\"") == std::string::npos) return;
  auto v = jsonlite::find_u64(doc, key);
  if (v && *v <= kMaxKnob) {
    set(*v);
  } else {
    notes.push_back(std::string(key) + " is not a valid number; default kept");
  }
}

}  // namespace

EngineConfig EngineConfig::from_env() { return from_env(EngineConfig{}); }

EngineConfig EngineConfig::from_env(EngineConfig c) {
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  EnvReader env(c.load_notes_);
  env.number("TOOLRUN_TIMEOUT_BASE", [&](std::uint64_t v) { c.timeout.base = seconds(v); });
  env.number("TOOLRUN_TIMEOUT_MAX", [&](std::uint64_t v) { c.timeout.max = seconds(v); });
  env.number("TOOLRUN_TIMEOUT_PER_10K_ITEMS", [&](std::uint64_t v) { c.timeout.per_10k_items = seconds(v); });
  env.number("TOOLRUN_TIMEOUT_PER_GIB", [&](std::uint64_t v) { c.timeout.per_gib = seconds(v); });
  env.number("TOOLRUN_POLL_INTERVAL_MS", [&](std::uint64_t v) { c.poll_interval = milliseconds(v); });
  env.number("TOOLRUN_GRACE_PERIOD_MS", [&](std::uint64_t v) { c.grace_period = milliseconds(v); });
  env.number("TOOLRUN_KILL_TIMEOUT_MS", [&](std::uint64_t v) { c.kill_timeout = milliseconds(v); });
  env.number("TOOLRUN_PRESCAN_TIME_BOX", [&](std::uint64_t v) { c.prescan_time_box = seconds(v); });
  env.number("TOOLRUN_MAX_CONCURRENT", [&](std::uint64_t v) {
    c.max_concurrent_tasks = static_cast<std::uint32_t>(std::min<std::uint64_t>(v, 1024));
  });
  env.number("TOOLRUN_CACHE_TTL", [&](std::uint64_t v) { c.cache_ttl = seconds(v); });
  env.number("TOOLRUN_CACHE_MAX_BYTES", [&](std::uint64_t v) { c.cache_max_bytes = v; });
  env.text("TOOLRUN_CACHE_DIR", c.cache_dir);
  env.text("TOOLRUN_CACHE_COMPRESSION", c.cache_compression);
  std::string encodings;
  env.text("TOOLRUN_ENCODINGS", encodings);
  if (!encodings.empty()) c.encodings = split_list(encodings);
  env.text("TOOLRUN_FALLBACK_ENCODING", c.fallback_encoding);
  env.number("TOOLRUN_MAX_OUTPUT_BYTES", [&](std::uint64_t v) { c.max_output_bytes = static_cast<std::size_t>(v); });
  env.number("TOOLRUN_PROGRESS_QUEUE", [&](std::uint64_t v) { c.progress_queue_capacity = static_cast<std::size_t>(v); });
  env.text("TOOLRUN_EVENT_LOG", c.event_log_path);
  return c;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  EngineConfig c;
  std::ifstream ifs(path);
  if (!ifs) {
    c.load_notes_.push_back("config file " + path + " unreadable; defaults used");
    return c;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  const std::string doc = ss.str();
  auto& n = c.load_notes_;

  json_number(doc, "timeout_base_s", [&](std::uint64_t v) { c.timeout.base = seconds(v); }, n);
  json_number(doc, "timeout_max_s", [&](std::uint64_t v) { c.timeout.max = seconds(v); }, n);
  json_number(doc, "timeout_per_10k_items_s", [&](std::uint64_t v) { c.timeout.per_10k_items = seconds(v); }, n);
  json_number(doc, "timeout_per_gib_s", [&](std::uint64_t v) { c.timeout.per_gib = seconds(v); }, n);
  json_number(doc, "poll_interval_ms", [&](std::uint64_t v) { c.poll_interval = milliseconds(v); }, n);
  json_number(doc, "grace_period_ms", [&](std::uint64_t v) { c.grace_period = milliseconds(v); }, n);
  json_number(doc, "kill_timeout_ms", [&](std::uint64_t v) { c.kill_timeout = milliseconds(v); }, n);
  json_number(doc, "prescan_time_box_s", [&](std::uint64_t v) { c.prescan_time_box = seconds(v); }, n);
  json_number(doc, "max_concurrent_tasks", [&](std::uint64_t v) {
    c.max_concurrent_tasks = static_cast<std::uint32_t>(std::min<std::uint64_t>(v, 1024));
  }, n);
  json_number(doc, "cache_ttl_s", [&](std::uint64_t v) { c.cache_ttl = seconds(v); }, n);
  json_number(doc, "cache_max_bytes", [&](std::uint64_t v) { c.cache_max_bytes = v; }, n);
  json_number(doc, "max_output_bytes", [&](std::uint64_t v) { c.max_output_bytes = static_cast<std::size_t>(v); }, n);
  json_number(doc, "progress_queue_capacity", [&](std::uint64_t v) { c.progress_queue_capacity = static_cast<std::size_t>(v); }, n);

  c.cache_dir = jsonlite::get_string(doc, "cache_dir", c.cache_dir);
  c.cache_compression = jsonlite::get_string(doc, "cache_compression", c.cache_compression);
  c.fallback_encoding = jsonlite::get_string(doc, "fallback_encoding", c.fallback_encoding);
  c.event_log_path = jsonlite::get_string(doc, "event_log_path", c.event_log_path);
  if (doc.find("\"encodings\"") != std::string::npos) {
    c.encodings = jsonlite::get_string_array(doc, "encodings");
  }
  return c;
}

std::vector<std::string> EngineConfig::validate() {
  std::vector<std::string> repairs;
  repairs.swap(load_notes_);
  const EngineConfig ref;

  if (timeout.base.count() <= 0) {
    repairs.push_back("timeout.base must be positive; using 300s");
    timeout.base = ref.timeout.base;
  }
  if (timeout.max.count() <= 0) {
    repairs.push_back("timeout.max must be positive; using 1800s");
    timeout.max = ref.timeout.max;
  }
  if (timeout.max < timeout.base) {
    repairs.push_back("timeout.max below timeout.base; raised to base");
    timeout.max = timeout.base;
  }
  if (timeout.per_10k_items.count() < 0) {
    repairs.push_back("timeout.per_10k_items negative; using 60s");
    timeout.per_10k_items = ref.timeout.per_10k_items;
  }
  if (timeout.per_gib.count() < 0) {
    repairs.push_back("timeout.per_gib negative; using 30s");
    timeout.per_gib = ref.timeout.per_gib;
  }
  if (poll_interval.count() <= 0) {
    repairs.push_back("poll_interval must be positive; using 1000ms");
    poll_interval = ref.poll_interval;
  }
  if (grace_period.count() < 0) {
    repairs.push_back("grace_period negative; using 2000ms");
    grace_period = ref.grace_period;
  }
  if (kill_timeout.count() <= 0) {
    repairs.push_back("kill_timeout must be positive; using 2000ms");
    kill_timeout = ref.kill_timeout;
  }
  if (prescan_time_box.count() <= 0) {
    repairs.push_back("prescan_time_box must be positive; using 30s");
    prescan_time_box = ref.prescan_time_box;
  }
  if (max_concurrent_tasks == 0) {
    repairs.push_back("max_concurrent_tasks must be at least 1; using 4");
    max_concurrent_tasks = ref.max_concurrent_tasks;
  }
  if (cache_ttl.count() <= 0) {
    repairs.push_back("cache_ttl must be positive; using 1800s");
    cache_ttl = ref.cache_ttl;
  }
  if (cache_max_bytes == 0) {
    repairs.push_back("cache_max_bytes must be positive; using 50 MiB");
    cache_max_bytes = ref.cache_max_bytes;
  }
  if (cache_compression != "identity" && cache_compression != "zstd") {
    repairs.push_back("cache_compression '" + cache_compression + "' unknown; using identity");
    cache_compression = "identity";
  }
#if !defined(TOOLRUN_WITH_ZSTD)
  if (cache_compression == "zstd") {
    repairs.push_back("zstd support not compiled in; using identity");
    cache_compression = "identity";
  }
#endif
  if (encodings.empty()) {
    repairs.push_back("encodings empty; using UTF-8,CP950,GBK,ISO-8859-1");
    encodings = ref.encodings;
  }
  if (fallback_encoding.empty()) {
    repairs.push_back("fallback_encoding empty; using CP1252");
    fallback_encoding = ref.fallback_encoding;
  }
  if (progress_queue_capacity == 0) {
    repairs.push_back("progress_queue_capacity must be positive; using 1024");
    progress_queue_capacity = ref.progress_queue_capacity;
  }
  return repairs;
}

std::string EngineConfig::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"timeout_base_s\":" + std::to_string(timeout.base.count());
  out += ",\"timeout_max_s\":" + std::to_string(timeout.max.count());
  out += ",\"timeout_per_10k_items_s\":" + std::to_string(timeout.per_10k_items.count());
  out += ",\"timeout_per_gib_s\":" + std::to_string(timeout.per_gib.count());
  out += ",\"poll_interval_ms\":" + std::to_string(poll_interval.count());
  out += ",\"grace_period_ms\":" + std::to_string(grace_period.count());
  out += ",\"kill_timeout_ms\":" + std::to_string(kill_timeout.count());
  out += ",\"prescan_time_box_s\":" + std::to_string(prescan_time_box.count());
  out += ",\"max_concurrent_tasks\":" + std::to_string(max_concurrent_tasks);
  out += ",\"cache_ttl_s\":" + std::to_string(cache_ttl.count());
  out += ",\"cache_max_bytes\":" + std::to_string(cache_max_bytes);
  out += ",\"cache_dir\":\"" + jsonlite::escape(cache_dir) + "\"";
  out += ",\"cache_compression\":\"" + jsonlite::escape(cache_compression) + "\"";
  out += ",\"encodings\":[";
  for (std::size_t i = 0; i < encodings.size(); ++i) {
    if (i) out += ',';
    out += "\"" + jsonlite::escape(encodings[i]) + "\"";
  }
  out += "],\"fallback_encoding\":\"" + jsonlite::escape(fallback_encoding) + "\"";
  out += ",\"max_output_bytes\":" + std::to_string(max_output_bytes);
  out += ",\"progress_queue_capacity\":" + std::to_string(progress_queue_capacity);
  out += ",\"event_log_path\":\"" + jsonlite::escape(event_log_path) + "\"}";
  return out;
}

}  // namespace toolrun
