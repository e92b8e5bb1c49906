#pragma once

#include <string>
#include <string_view>

namespace toolrun {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. The domain prefix keeps digests computed for
// different purposes from ever colliding.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Work fingerprint over a canonical request description ("fp:" domain).
std::string fingerprint_hash(std::string_view canonical);

// Integrity hash of a persisted cache blob ("blob:" domain).
std::string cache_blob_hash(std::string_view stored_bytes);

}  // namespace toolrun
