#pragma once

// toolrun/fingerprint.hpp: Work fingerprints for the result cache.
//
// fingerprint = BLAKE3("fp:" || canonical JSON) where the canonical JSON holds
//   v          version::FINGERPRINT_VERSION
//   argv       ordered argument vector
//   cwd        working directory as given
//   encoding   encoding hint
//   env        extra environment entries, sorted by key
//   inputs     one {path,size,mtime_ns} per input path, in the given order
//   tool       tool-version marker (e.g. first line of `tool --version`)
//
// Keys are emitted in fixed order, so equal requests give equal bytes.
// The explicit timeout and the capture cap are not part of the identity.

#include <string>
#include <vector>

#include "toolrun/types.hpp"

namespace toolrun {

struct InputIdentity {
  std::string path;
  bool exists{false};
  std::uint64_t size{0};
  std::int64_t mtime_ns{0};
};

InputIdentity identify_input(const std::string& path);

std::string canonical_request(const CommandSpec& spec, const std::vector<InputIdentity>& inputs,
                              const std::string& tool_version);

std::string compute_fingerprint(const CommandSpec& spec, const std::vector<std::string>& input_paths,
                                const std::string& tool_version);

}  // namespace toolrun
