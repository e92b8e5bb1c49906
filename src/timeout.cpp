#include "toolrun/timeout.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace toolrun {

namespace {

using Rep = std::chrono::seconds::rep;

std::uint64_t sat_mul(std::uint64_t a, std::uint64_t b) {
  if (a == 0 || b == 0) return 0;
  if (a > std::numeric_limits<std::uint64_t>::max() / b) return std::numeric_limits<std::uint64_t>::max();
  return a * b;
}

std::uint64_t sat_add(std::uint64_t a, std::uint64_t b) {
  const std::uint64_t s = a + b;
  return s < a ? std::numeric_limits<std::uint64_t>::max() : s;
}

std::uint64_t non_negative(std::chrono::seconds s) {
  return s.count() > 0 ? static_cast<std::uint64_t>(s.count()) : 0;
}

// How many entries to visit between clock reads.
constexpr std::uint64_t kClockStride = 256;

}  // namespace

std::chrono::seconds estimate_timeout(const ScaleSignals& signals, const TimeoutPolicy& policy) {
  const std::uint64_t base = non_negative(policy.base);
  const std::uint64_t max = std::max(non_negative(policy.max), base);

  std::uint64_t t = base;
  t = sat_add(t, sat_mul(non_negative(policy.per_10k_items), signals.item_count / kItemsPerStep));
  t = sat_add(t, sat_mul(non_negative(policy.per_gib), signals.total_bytes / kBytesPerGiB));
  if (t > max) t = max;
  return std::chrono::seconds(static_cast<Rep>(t));
}

TimeoutEstimate estimate(const ScaleSignals& signals, const TimeoutPolicy& policy) {
  TimeoutEstimate e;
  e.budget = estimate_timeout(signals, policy);
  e.possibly_underestimated = !signals.complete;
  return e;
}

ScaleSignals prescan(const std::string& root, std::chrono::milliseconds time_box,
                     const std::function<bool()>& cancelled) {
  ScaleSignals s;
  const auto deadline = std::chrono::steady_clock::now() + time_box;

  std::error_code ec;
  const auto root_status = fs::symlink_status(root, ec);
  if (ec || !fs::exists(root_status)) return s;
  if (fs::is_regular_file(root_status)) {
    s.item_count = 1;
    s.total_bytes = fs::file_size(root, ec);
    if (ec) s.total_bytes = 0;
    return s;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    s.complete = false;
    return s;
  }

  std::uint64_t visited = 0;
  const fs::recursive_directory_iterator end;
  while (it != end) {
    if (++visited % kClockStride == 0) {
      if (std::chrono::steady_clock::now() >= deadline || (cancelled && cancelled())) {
        s.complete = false;
        return s;
      }
    }

    std::error_code entry_ec;
    const auto st = it->symlink_status(entry_ec);
    if (!entry_ec) {
      if (fs::is_directory(st)) {
        ++s.dir_count;
        // A directory we cannot open is skipped silently by the iterator.
        if (::access(it->path().c_str(), R_OK | X_OK) != 0) s.complete = false;
      } else if (fs::is_regular_file(st)) {
        ++s.item_count;
        const auto size = it->file_size(entry_ec);
        if (!entry_ec) s.total_bytes = sat_add(s.total_bytes, size);
      } else {
        ++s.item_count;
      }
    }

    it.increment(ec);
    if (ec) {
      s.complete = false;
      break;
    }
  }
  return s;
}

std::string describe(const ScaleSignals& signals) {
  char size[32];
  const double gib = static_cast<double>(signals.total_bytes) / static_cast<double>(kBytesPerGiB);
  if (gib >= 1.0) {
    std::snprintf(size, sizeof(size), "%.1f GiB", gib);
  } else {
    std::snprintf(size, sizeof(size), "%.1f MiB",
                  static_cast<double>(signals.total_bytes) / (1024.0 * 1024.0));
  }
  std::string out = std::to_string(signals.item_count) + " files, " +
                    std::to_string(signals.dir_count) + " dirs, " + size;
  if (!signals.complete) out += " (partial)";
  return out;
}

}  // namespace toolrun
