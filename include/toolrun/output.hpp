#pragma once

// toolrun/output.hpp: Output classification and decorative-markup conversion.
//
// Markers: ESC (0x1B), C1 CSI (U+009B), box-drawing glyphs (U+2500-U+257F).
// Text with no marker is returned byte-identical and `converted` is false.
// Text with any marker becomes an HTML <pre> block: SGR attributes turn into
// inline-styled <span>s, every other control sequence is dropped, and text is
// HTML-escaped.

#include <string>
#include <string_view>

namespace toolrun {

struct RenderedOutput {
  std::string text;
  bool converted{false};
};

bool has_markup(std::string_view text);

RenderedOutput render_output(std::string_view text);

// Unconditional conversion (used by render_output when markers are present).
std::string ansi_to_html(std::string_view text);

// Plain text with every escape sequence removed. Box-drawing glyphs are kept.
std::string strip_escapes(std::string_view text);

std::string html_escape(std::string_view text);

}  // namespace toolrun
