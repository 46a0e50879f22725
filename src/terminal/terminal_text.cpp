#include "terminal_text.hpp"
#include <core/constants.hpp>
#include <cstring>

namespace TerminalText {

std::string strip_ansi(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t len = text.size();

    for (size_t i = 0; i < len; ) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == 0x1B && i + 1 < len && text[i + 1] == '[') {
            // CSI: parameter bytes 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E
            size_t j = i + 2;
            while (j < len) {
                unsigned char p = static_cast<unsigned char>(text[j]);
                if (p < 0x20 || p > 0x3F) break;
                j++;
            }
            if (j < len) {
                unsigned char f = static_cast<unsigned char>(text[j]);
                if (f >= 0x40 && f <= 0x7E) j++;
            }
            i = j;
        } else if (c == 0x1B && i + 1 < len && text[i + 1] == ']') {
            // OSC: runs to BEL or ESC backslash
            size_t j = i + 2;
            while (j < len) {
                if (text[j] == '\a') { j++; break; }
                if (text[j] == '\033' && j + 1 < len && text[j + 1] == '\\') { j += 2; break; }
                j++;
            }
            i = j;
        } else if (c == 0x1B) {
            i += 2;
        } else if (c == '\r') {
            i++;
        } else {
            out += text[i++];
        }
    }
    return out;
}

bool contains_spinner(const std::string& text) {
    for (const char* glyph : SPINNER_GLYPHS) {
        if (text.find(glyph) != std::string::npos) return true;
    }
    return false;
}

size_t leading_glyph_length(const std::string& text) {
    for (const char* glyph : SPINNER_GLYPHS) {
        size_t n = std::strlen(glyph);
        if (text.compare(0, n, glyph) == 0) return n;
    }
    for (const char* glyph : RESULT_GLYPHS) {
        size_t n = std::strlen(glyph);
        if (text.compare(0, n, glyph) == 0) return n;
    }
    return 0;
}

} // namespace TerminalText
