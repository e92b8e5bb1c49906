#include "toolrun/version.hpp"

#include <sstream>

#include "toolrun/hash.hpp"

namespace toolrun {
namespace version {

std::string manifest_json() {
  const auto h = hash_runtime_info();
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << ENGINE_SEMVER << "\""
    << ",\"fingerprint_version\":" << FINGERPRINT_VERSION
    << ",\"cache_record_version\":" << CACHE_RECORD_VERSION
    << ",\"hash_primitive\":\"" << h.primitive << "\""
    << ",\"hash_version\":\"" << h.version << "\""
#if defined(TOOLRUN_WITH_ZSTD)
    << ",\"zstd\":true"
#else
    << ",\"zstd\":false"
#endif
    << ",\"build_timestamp\":\"" << __DATE__ << "T" << __TIME__ << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace toolrun
