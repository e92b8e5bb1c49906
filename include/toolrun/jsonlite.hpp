#pragma once

// toolrun/jsonlite.hpp: Minimal flat-JSON helpers.
//
// Scope: configuration files, cache .meta sidecars and event-log lines. All of
// these are flat objects whose values are strings, numbers, booleans or
// arrays of strings. Nested objects are not supported.

#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace toolrun::jsonlite {

inline std::string unescape(const std::string& in) {
  std::string o;
  o.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 1 < in.size()) {
      char n = in[++i];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else if (n == 'u' && i + 4 < in.size()) {
        // \u00XX only; escape() never emits anything wider.
        const unsigned long cp = std::strtoul(in.substr(i + 1, 4).c_str(), nullptr, 16);
        if (cp < 0x80) o += static_cast<char>(cp);
        i += 4;
      } else o += n;
    } else o += in[i];
  }
  return o;
}

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\n') o += "\\n";
    else if (c == '\r') o += "\\r";
    else if (c == '\t') o += "\\t";
    else if (u < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", u);
      o += buf;
    } else o += c;
  }
  return o;
}

// String values may contain escaped quotes.
inline std::optional<std::string> find_string(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  std::smatch m;
  if (std::regex_search(s, m, re)) return unescape(m[1].str());
  return std::nullopt;
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  auto v = find_string(s, key);
  return v ? *v : def;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (std::regex_search(s, m, re)) return m[1].str() == "true";
  return def;
}

inline std::optional<unsigned long long> find_u64(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]{1,19})(?![0-9])");
  std::smatch m;
  if (std::regex_search(s, m, re)) return std::stoull(m[1].str());
  return std::nullopt;
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  auto v = find_u64(s, key);
  return v ? *v : def;
}

inline std::vector<std::string> get_string_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return out;
  std::regex item("\\\"((?:[^\\\"\\\\]|\\\\.)*)\\\"");
  auto begin = std::sregex_iterator(m[1].first, m[1].second, item);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) out.push_back(unescape((*it)[1].str()));
  return out;
}

}  // namespace toolrun::jsonlite
