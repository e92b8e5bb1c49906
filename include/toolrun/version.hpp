#pragma once

// toolrun/version.hpp: Version constants for every persisted or hashed format.
//
// INVARIANT:
//   Any component that reads a persisted cache record checks the record
//   format version before decoding. Records written by a different version
//   are treated as misses, never decoded on a guess.

#include <cstdint>
#include <string>

namespace toolrun {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.4.0";

// ---------------------------------------------------------------------------
// FINGERPRINT_VERSION
// Part of every canonical fingerprint payload. Bump when the canonical layout
// or the hash domain scheme changes; all cached results become misses.
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_VERSION = 1;

// ---------------------------------------------------------------------------
// CACHE_RECORD_VERSION
// Binary layout of a persisted result blob (see cache.cpp) and its .meta
// sidecar. Version 1 = "TRR" magic, version byte, length-prefixed fields.
// ---------------------------------------------------------------------------
constexpr uint32_t CACHE_RECORD_VERSION = 1;

// Compact JSON description of the engine build, for `toolrun config`.
std::string manifest_json();

}  // namespace version
}  // namespace toolrun
