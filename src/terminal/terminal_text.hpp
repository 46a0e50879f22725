#pragma once

#include <cstddef>
#include <string>

// Text cleanup for rows read back from a terminal grid.
namespace TerminalText {

// Remove CSI sequences (colors, cursor motion), OSC sequences (titles,
// hyperlinks; BEL or ST terminated), two-byte ESC sequences and stray
// carriage returns. Printable text, including UTF-8, is kept as-is.
std::string strip_ansi(const std::string& text);

// True if `text` contains any braille spinner frame.
bool contains_spinner(const std::string& text);

// If `text` starts with a spinner frame or a check/cross glyph, return the
// length in bytes of that glyph; otherwise 0.
size_t leading_glyph_length(const std::string& text);

} // namespace TerminalText
