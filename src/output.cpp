#include "toolrun/output.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <vector>

namespace toolrun {

namespace {

constexpr unsigned char kEsc = 0x1B;
constexpr unsigned char kBel = 0x07;

constexpr const char* kDefaultFg = "#d4d4d4";
constexpr const char* kDefaultBg = "#1e1e1e";

constexpr std::array<const char*, 16> kPalette = {
    "#000000", "#cd3131", "#0dbc79", "#e5e510", "#2472c8", "#bc3fbc", "#11a8cd", "#e5e5e5",
    "#666666", "#f14c4c", "#23d18b", "#f5f543", "#3b8eea", "#d670d6", "#29b8db", "#ffffff",
};

std::string rgb_hex(unsigned r, unsigned g, unsigned b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r & 0xFF, g & 0xFF, b & 0xFF);
  return buf;
}

std::string color_256(unsigned n) {
  if (n < 16) return kPalette[n];
  if (n < 232) {
    static constexpr unsigned kLevels[6] = {0, 95, 135, 175, 215, 255};
    const unsigned i = n - 16;
    return rgb_hex(kLevels[i / 36], kLevels[(i / 6) % 6], kLevels[i % 6]);
  }
  const unsigned v = 8 + 10 * (std::min(n, 255u) - 232);
  return rgb_hex(v, v, v);
}

struct SgrState {
  bool bold{false};
  bool dim{false};
  bool italic{false};
  bool underline{false};
  bool inverse{false};
  bool strike{false};
  std::string fg;  // empty = default
  std::string bg;

  bool is_default() const {
    return !bold && !dim && !italic && !underline && !inverse && !strike && fg.empty() && bg.empty();
  }
  bool operator==(const SgrState& o) const {
    return bold == o.bold && dim == o.dim && italic == o.italic && underline == o.underline &&
           inverse == o.inverse && strike == o.strike && fg == o.fg && bg == o.bg;
  }
  bool operator!=(const SgrState& o) const { return !(*this == o); }

  std::string css() const {
    std::string fg_c = fg;
    std::string bg_c = bg;
    if (inverse) {
      fg_c = bg.empty() ? kDefaultBg : bg;
      bg_c = fg.empty() ? kDefaultFg : fg;
    }
    std::string s;
    if (!fg_c.empty()) s += "color:" + fg_c + ";";
    if (!bg_c.empty()) s += "background-color:" + bg_c + ";";
    if (bold) s += "font-weight:bold;";
    if (dim) s += "opacity:0.7;";
    if (italic) s += "font-style:italic;";
    if (underline || strike) {
      s += "text-decoration:";
      if (underline) s += "underline";
      if (underline && strike) s += ' ';
      if (strike) s += "line-through";
      s += ';';
    }
    return s;
  }
};

// Reads an extended color (38/48) starting at params[i] == 38|48.
// Returns the color (empty if malformed) and advances i past the consumed
// parameters.
std::string extended_color(const std::vector<unsigned>& params, std::size_t& i) {
  if (i + 1 >= params.size()) {
    i = params.size();
    return {};
  }
  const unsigned mode = params[i + 1];
  if (mode == 5 && i + 2 < params.size()) {
    const unsigned n = params[i + 2];
    i += 2;
    return n <= 255 ? color_256(n) : std::string();
  }
  if (mode == 2 && i + 4 < params.size()) {
    std::string c = rgb_hex(params[i + 2], params[i + 3], params[i + 4]);
    i += 4;
    return c;
  }
  i = params.size();
  return {};
}

void apply_sgr(SgrState& st, std::string_view raw) {
  std::vector<unsigned> params;
  unsigned cur = 0;
  bool any = false;
  for (char c : raw) {
    if (c >= '0' && c <= '9') {
      cur = cur * 10 + static_cast<unsigned>(c - '0');
      if (cur > 100000) cur = 100000;
      any = true;
    } else if (c == ';' || c == ':') {
      params.push_back(any ? cur : 0);
      cur = 0;
      any = false;
    }
  }
  params.push_back(any ? cur : 0);

  for (std::size_t i = 0; i < params.size(); ++i) {
    const unsigned p = params[i];
    switch (p) {
      case 0: st = SgrState{}; break;
      case 1: st.bold = true; break;
      case 2: st.dim = true; break;
      case 3: st.italic = true; break;
      case 4:
      case 21: st.underline = true; break;
      case 7: st.inverse = true; break;
      case 9: st.strike = true; break;
      case 22: st.bold = false; st.dim = false; break;
      case 23: st.italic = false; break;
      case 24: st.underline = false; break;
      case 27: st.inverse = false; break;
      case 29: st.strike = false; break;
      case 38: st.fg = extended_color(params, i); break;
      case 39: st.fg.clear(); break;
      case 48: st.bg = extended_color(params, i); break;
      case 49: st.bg.clear(); break;
      default:
        if (p >= 30 && p <= 37) st.fg = kPalette[p - 30];
        else if (p >= 40 && p <= 47) st.bg = kPalette[p - 40];
        else if (p >= 90 && p <= 97) st.fg = kPalette[p - 90 + 8];
        else if (p >= 100 && p <= 107) st.bg = kPalette[p - 100 + 8];
        break;
    }
  }
}

// Walks `text`, calling on_text(byte range) for printable content and
// on_sgr(parameter bytes) for each SGR sequence. All other control
// sequences are consumed silently.
template <typename OnText, typename OnSgr>
void scan(std::string_view text, OnText on_text, OnSgr on_sgr) {
  const std::size_t n = text.size();
  std::size_t i = 0;
  std::size_t run = 0;
  auto flush = [&](std::size_t end) {
    if (end > run) on_text(text.substr(run, end - run));
  };
  auto byte = [&](std::size_t k) { return static_cast<unsigned char>(text[k]); };

  auto skip_csi = [&](std::size_t k) {
    // k is the first parameter byte.
    const std::size_t params = k;
    while (k < n && byte(k) >= 0x30 && byte(k) <= 0x3F) ++k;
    const std::size_t params_end = k;
    while (k < n && byte(k) >= 0x20 && byte(k) <= 0x2F) ++k;
    if (k < n && byte(k) >= 0x40 && byte(k) <= 0x7E) {
      if (text[k] == 'm') on_sgr(text.substr(params, params_end - params));
      ++k;
    }
    return k;
  };
  auto skip_string = [&](std::size_t k) {
    // OSC/DCS/PM/APC body, terminated by BEL, ESC \ or C1 ST.
    while (k < n) {
      if (byte(k) == kBel) return k + 1;
      if (byte(k) == kEsc && k + 1 < n && text[k + 1] == '\\') return k + 2;
      if (byte(k) == 0xC2 && k + 1 < n && byte(k + 1) == 0x9C) return k + 2;
      ++k;
    }
    return k;
  };

  while (i < n) {
    const unsigned char c = byte(i);
    if (c == kEsc) {
      flush(i);
      std::size_t k = i + 1;
      if (k >= n) {
        i = k;
      } else if (text[k] == '[') {
        i = skip_csi(k + 1);
      } else if (text[k] == ']' || text[k] == 'P' || text[k] == 'X' || text[k] == '^' ||
                 text[k] == '_') {
        i = skip_string(k + 1);
      } else {
        while (k < n && byte(k) >= 0x20 && byte(k) <= 0x2F) ++k;  // intermediates
        i = k < n ? k + 1 : k;
      }
      run = i;
    } else if (c == 0xC2 && i + 1 < n && byte(i + 1) == 0x9B) {
      flush(i);
      i = skip_csi(i + 2);
      run = i;
    } else if (c == 0xC2 && i + 1 < n && byte(i + 1) == 0x9D) {
      flush(i);
      i = skip_string(i + 2);
      run = i;
    } else {
      ++i;
    }
  }
  flush(n);
}

}  // namespace

bool has_markup(std::string_view text) {
  const std::size_t n = text.size();
  for (std::size_t i = 0; i < n; ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c == kEsc) return true;
    if (c == 0xC2 && i + 1 < n && static_cast<unsigned char>(text[i + 1]) == 0x9B) return true;
    if (c == 0xE2 && i + 2 < n) {
      const auto c1 = static_cast<unsigned char>(text[i + 1]);
      const auto c2 = static_cast<unsigned char>(text[i + 2]);
      if ((c1 == 0x94 || c1 == 0x95) && c2 >= 0x80 && c2 <= 0xBF) return true;
    }
  }
  return false;
}

std::string html_escape(std::string_view text) {
  std::string out;
  out.reserve(text.size() + text.size() / 8);
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c; break;
    }
  }
  return out;
}

std::string ansi_to_html(std::string_view text) {
  std::string body;
  body.reserve(text.size() * 2);
  SgrState cur;
  SgrState open;
  bool span_open = false;

  scan(
      text,
      [&](std::string_view chunk) {
        if (cur != open) {
          if (span_open) body += "</span>";
          span_open = false;
          if (!cur.is_default()) {
            body += "<span style=\"" + cur.css() + "\">";
            span_open = true;
          }
          open = cur;
        }
        body += html_escape(chunk);
      },
      [&](std::string_view params) { apply_sgr(cur, params); });
  if (span_open) body += "</span>";

  std::string out;
  out.reserve(body.size() + 160);
  out += "<pre style=\"background-color:";
  out += kDefaultBg;
  out += ";color:";
  out += kDefaultFg;
  out += ";font-family:monospace;white-space:pre;\">";
  out += body;
  out += "</pre>";
  return out;
}

std::string strip_escapes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  scan(
      text, [&](std::string_view chunk) { out.append(chunk.data(), chunk.size()); },
      [](std::string_view) {});
  return out;
}

RenderedOutput render_output(std::string_view text) {
  RenderedOutput r;
  if (!has_markup(text)) {
    r.text.assign(text.data(), text.size());
    return r;
  }
  r.text = ansi_to_html(text);
  r.converted = true;
  return r;
}

}  // namespace toolrun
