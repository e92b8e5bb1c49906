#pragma once

// toolrun/config.hpp: Engine configuration.
//
// One EngineConfig is injected into each Engine at construction. There is no
// process-wide config instance.
//
// SOURCES (later wins):
//   1. Built-in defaults below.
//   2. EngineConfig::from_json_file(path)  (flat JSON object, same key names)
//   3. EngineConfig::from_env()            (TOOLRUN_* variables over defaults)
//
// VALIDATION:
//   validate() never rejects a config. Each invalid value is repaired to its
//   safe fallback and the repair is reported, so a broken config file degrades
//   to reference behavior instead of refusing to run tools.

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace toolrun {

// Deadline policy: clamp(base + k1*floor(items/10000) + k2*floor(bytes/GiB), base, max).
struct TimeoutPolicy {
  std::chrono::seconds base{300};
  std::chrono::seconds max{1800};
  std::chrono::seconds per_10k_items{60};  // k1
  std::chrono::seconds per_gib{30};        // k2
};

struct EngineConfig {
  TimeoutPolicy timeout;

  // Supervisor.
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds grace_period{2000};
  std::chrono::milliseconds kill_timeout{2000};

  // Pre-scan time box. Fixed; not scaled to timeout.max.
  std::chrono::seconds prescan_time_box{30};

  std::uint32_t max_concurrent_tasks{4};

  // Result cache.
  std::chrono::seconds cache_ttl{1800};
  std::uint64_t cache_max_bytes{50ull * 1024 * 1024};
  std::string cache_dir;            // empty = memory only
  std::string cache_compression{"identity"};  // "identity" | "zstd"

  // Encoding negotiation.
  std::vector<std::string> encodings{"UTF-8", "CP950", "GBK", "ISO-8859-1"};
  std::string fallback_encoding{"CP1252"};

  std::size_t max_output_bytes{0};  // per stream, 0 = unlimited
  std::size_t progress_queue_capacity{1024};

  std::string event_log_path;  // JSONL sink; empty = disabled

  // Defaults overridden by TOOLRUN_* environment variables.
  static EngineConfig from_env();
  static EngineConfig from_env(EngineConfig base);

  // Defaults overridden by keys of a flat JSON object. A missing or unreadable
  // file yields the defaults and a repair note from validate().
  static EngineConfig from_json_file(const std::string& path);

  // Repairs invalid values in place. Returns one line per repair.
  std::vector<std::string> validate();

  std::string to_json() const;

 private:
  std::vector<std::string> load_notes_;
};

}  // namespace toolrun
