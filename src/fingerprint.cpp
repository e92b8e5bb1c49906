#include "toolrun/fingerprint.hpp"

#include <sys/stat.h>

#include "toolrun/hash.hpp"
#include "toolrun/jsonlite.hpp"
#include "toolrun/version.hpp"

namespace toolrun {

InputIdentity identify_input(const std::string& path) {
  InputIdentity id;
  id.path = path;
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) return id;
  id.exists = true;
  id.size = static_cast<std::uint64_t>(st.st_size);
  id.mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec;
  return id;
}

std::string canonical_request(const CommandSpec& spec, const std::vector<InputIdentity>& inputs,
                              const std::string& tool_version) {
  std::string out;
  out.reserve(256);
  out += "{\"v\":" + std::to_string(version::FINGERPRINT_VERSION);
  out += ",\"argv\":[";
  for (std::size_t i = 0; i < spec.argv.size(); ++i) {
    if (i) out += ',';
    out += "\"" + jsonlite::escape(spec.argv[i]) + "\"";
  }
  out += "],\"cwd\":\"" + jsonlite::escape(spec.cwd) + "\"";
  out += ",\"encoding\":\"" + jsonlite::escape(spec.encoding_hint) + "\"";
  out += ",\"env\":{";
  bool first = true;
  for (const auto& [k, v] : spec.env) {  // std::map: sorted
    if (!first) out += ',';
    first = false;
    out += "\"" + jsonlite::escape(k) + "\":\"" + jsonlite::escape(v) + "\"";
  }
  out += "},\"inputs\":[";
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (i) out += ',';
    const auto& in = inputs[i];
    out += "{\"path\":\"" + jsonlite::escape(in.path) + "\"";
    if (in.exists) {
      out += ",\"size\":" + std::to_string(in.size);
      out += ",\"mtime_ns\":" + std::to_string(in.mtime_ns);
    } else {
      out += ",\"missing\":true";
    }
    out += '}';
  }
  out += "],\"tool\":\"" + jsonlite::escape(tool_version) + "\"}";
  return out;
}

std::string compute_fingerprint(const CommandSpec& spec, const std::vector<std::string>& input_paths,
                                const std::string& tool_version) {
  std::vector<InputIdentity> inputs;
  inputs.reserve(input_paths.size());
  for (const auto& p : input_paths) inputs.push_back(identify_input(p));
  return fingerprint_hash(canonical_request(spec, inputs, tool_version));
}

}  // namespace toolrun
