#include "toolrun/encoding.hpp"

#include <iconv.h>

#include <cctype>
#include <cerrno>

namespace toolrun {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD
constexpr std::size_t kChunk = 16384;

class IconvHandle {
 public:
  explicit IconvHandle(const std::string& from)
      : cd_(iconv_open("UTF-8", from.c_str())) {}
  ~IconvHandle() {
    if (ok()) iconv_close(cd_);
  }
  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;

  bool ok() const { return cd_ != reinterpret_cast<iconv_t>(-1); }
  iconv_t get() const { return cd_; }
  void reset() { iconv(cd_, nullptr, nullptr, nullptr, nullptr); }

 private:
  iconv_t cd_;
};

bool is_utf8_name(const std::string& name) {
  std::string n;
  for (char c : name) {
    if (c != '-' && c != '_') n += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return n == "UTF8";
}

// Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF).
bool valid_utf8(std::string_view s) {
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0) lo = 0xA0;
      if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0) lo = 0x90;
      if (c == 0xF4) hi = 0x8F;
    } else {
      return false;
    }
    if (i + len > n) return false;
    const auto c1 = static_cast<unsigned char>(s[i + 1]);
    if (c1 < lo || c1 > hi) return false;
    for (std::size_t k = 2; k < len; ++k) {
      const auto ck = static_cast<unsigned char>(s[i + k]);
      if (ck < 0x80 || ck > 0xBF) return false;
    }
    i += len;
  }
  return true;
}

std::string_view strip_bom(std::string_view s) {
  if (s.size() >= 3 && s.substr(0, 3) == "\xEF\xBB\xBF") s.remove_prefix(3);
  return s;
}

std::string latin1_to_utf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() + bytes.size() / 4);
  for (char ch : bytes) {
    const auto c = static_cast<unsigned char>(ch);
    if (c < 0x80) {
      out += ch;
    } else {
      out += static_cast<char>(0xC0 | (c >> 6));
      out += static_cast<char>(0x80 | (c & 0x3F));
    }
  }
  return out;
}

// Runs iconv over the whole buffer. In strict mode a hard error aborts and
// returns nullopt; otherwise the offending byte is replaced and skipped.
std::optional<std::string> convert(IconvHandle& h, std::string_view bytes, bool strict,
                                   std::size_t* substitutions) {
  std::string out;
  out.reserve(bytes.size() + 16);
  char buf[kChunk];
  char* in = const_cast<char*>(bytes.data());
  std::size_t in_left = bytes.size();

  while (in_left > 0) {
    char* dst = buf;
    std::size_t dst_left = sizeof(buf);
    const std::size_t r = iconv(h.get(), &in, &in_left, &dst, &dst_left);
    out.append(buf, sizeof(buf) - dst_left);
    if (r != static_cast<std::size_t>(-1)) continue;
    if (errno == E2BIG) continue;
    // EILSEQ: invalid sequence. EINVAL: truncated sequence at end of input.
    if (strict) return std::nullopt;
    out += kReplacement;
    if (substitutions) ++*substitutions;
    ++in;
    --in_left;
    h.reset();
  }

  char* dst = buf;
  std::size_t dst_left = sizeof(buf);
  if (iconv(h.get(), nullptr, nullptr, &dst, &dst_left) == static_cast<std::size_t>(-1) && strict) {
    return std::nullopt;
  }
  out.append(buf, sizeof(buf) - dst_left);
  return out;
}

}  // namespace

bool encoding_available(const std::string& encoding) {
  if (encoding.empty()) return false;
  IconvHandle h(encoding);
  return h.ok();
}

std::optional<std::string> try_decode(std::string_view bytes, const std::string& encoding) {
  if (encoding.empty()) return std::nullopt;
  if (is_utf8_name(encoding)) {
    bytes = strip_bom(bytes);
    if (!valid_utf8(bytes)) return std::nullopt;
    return std::string(bytes);
  }
  IconvHandle h(encoding);
  if (!h.ok()) return std::nullopt;
  return convert(h, bytes, true, nullptr);
}

std::string decode_lossy(std::string_view bytes, const std::string& encoding,
                         std::size_t* substitutions) {
  IconvHandle h(encoding.empty() ? std::string("ISO-8859-1") : encoding);
  if (!h.ok()) return latin1_to_utf8(bytes);
  auto out = convert(h, bytes, false, substitutions);
  return out ? std::move(*out) : latin1_to_utf8(bytes);
}

DecodeResult decode(std::string_view bytes, const std::vector<std::string>& candidates,
                    const std::string& fallback) {
  DecodeResult r;
  for (const auto& enc : candidates) {
    if (auto text = try_decode(bytes, enc)) {
      r.text = std::move(*text);
      r.encoding = enc;
      return r;
    }
  }
  r.exhausted = true;
  if (encoding_available(fallback)) {
    r.encoding = fallback;
    r.text = decode_lossy(bytes, fallback, &r.substitutions);
  } else {
    r.encoding = "ISO-8859-1";
    r.text = latin1_to_utf8(bytes);
  }
  return r;
}

EncodingNegotiator::EncodingNegotiator(std::vector<std::string> candidates, std::string fallback)
    : candidates_(std::move(candidates)), fallback_(std::move(fallback)) {}

DecodeResult EncodingNegotiator::decode(std::string_view bytes, const std::string& hint) const {
  if (hint.empty() || (!candidates_.empty() && candidates_.front() == hint)) {
    return toolrun::decode(bytes, candidates_, fallback_);
  }
  std::vector<std::string> chain;
  chain.reserve(candidates_.size() + 1);
  chain.push_back(hint);
  for (const auto& c : candidates_) {
    if (c != hint) chain.push_back(c);
  }
  return toolrun::decode(bytes, chain, fallback_);
}

}  // namespace toolrun
