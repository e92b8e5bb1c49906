#include "toolrun/hash.hpp"

// Hash authority.
//
// INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "fp:" and "blob:" prefixes keep fingerprints and
//      blob integrity hashes in disjoint spaces.
//   3. Changing either prefix invalidates every persisted cache record; bump
//      version::FINGERPRINT_VERSION when doing so.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace toolrun {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string fingerprint_hash(std::string_view canonical) {
  return hash_domain("fp:", canonical);
}

std::string cache_blob_hash(std::string_view stored_bytes) {
  return hash_domain("blob:", stored_bytes);
}

}  // namespace toolrun
