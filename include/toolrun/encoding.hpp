#pragma once

// toolrun/encoding.hpp: Encoding negotiation for raw process output.
//
// Candidates are tried in order with a strict conversion to UTF-8. The first
// candidate that converts the whole buffer without a hard error wins. When
// every candidate fails, the permissive fallback converts with U+FFFD
// substitution and the result is flagged `exhausted`. decode() never throws.
//
// Encoding names are iconv names ("UTF-8", "CP950", "GBK", "ISO-8859-1", ...).
// Names the platform does not know are skipped.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolrun {

struct DecodeResult {
  std::string text;         // UTF-8
  std::string encoding;     // candidate accepted, or the fallback name
  bool exhausted{false};    // no candidate decoded cleanly
  std::size_t substitutions{0};
};

// Strict conversion. nullopt on any invalid or truncated sequence, or when the
// encoding is unknown. A leading UTF-8 BOM is stripped for UTF-8.
std::optional<std::string> try_decode(std::string_view bytes, const std::string& encoding);

// Permissive conversion: invalid bytes become U+FFFD and conversion continues.
// Unknown encodings degrade to a built-in ISO-8859-1 mapping.
std::string decode_lossy(std::string_view bytes, const std::string& encoding,
                         std::size_t* substitutions = nullptr);

DecodeResult decode(std::string_view bytes, const std::vector<std::string>& candidates,
                    const std::string& fallback);

bool encoding_available(const std::string& encoding);

class EncodingNegotiator {
 public:
  EncodingNegotiator(std::vector<std::string> candidates, std::string fallback);

  // `hint`, when non-empty, is tried ahead of the configured chain.
  DecodeResult decode(std::string_view bytes, const std::string& hint = "") const;

  const std::vector<std::string>& candidates() const { return candidates_; }
  const std::string& fallback() const { return fallback_; }

 private:
  std::vector<std::string> candidates_;
  std::string fallback_;
};

}  // namespace toolrun
