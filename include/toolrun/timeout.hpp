#pragma once

// toolrun/timeout.hpp: Run-time budgets from workload scale.
//
//   budget = clamp(base + k1*floor(items/10000) + k2*floor(bytes/GiB), base, max)
//
// All arithmetic saturates. The result is monotonic non-decreasing in each
// signal and always within [policy.base, policy.max] for a validated policy.

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "toolrun/config.hpp"
#include "toolrun/types.hpp"

namespace toolrun {

constexpr std::uint64_t kItemsPerStep = 10000;
constexpr std::uint64_t kBytesPerGiB = 1024ull * 1024 * 1024;

struct TimeoutEstimate {
  std::chrono::seconds budget{0};
  bool possibly_underestimated{false};  // signals came from an incomplete pre-scan
};

std::chrono::seconds estimate_timeout(const ScaleSignals& signals, const TimeoutPolicy& policy);
TimeoutEstimate estimate(const ScaleSignals& signals, const TimeoutPolicy& policy);

// Walks `root` counting regular files, directories and regular-file bytes.
// Symlinks are not followed. Permission-denied subtrees are skipped and make
// the scan incomplete. Stops with complete=false at `time_box` or when
// `cancelled` returns true. A missing root yields zero signals, complete.
ScaleSignals prescan(const std::string& root, std::chrono::milliseconds time_box,
                     const std::function<bool()>& cancelled = {});

// "111403 files, 2210 dirs, 161.3 GiB" (+ " (partial)" when incomplete).
std::string describe(const ScaleSignals& signals);

}  // namespace toolrun
