#pragma once

#include <stddef.h>
#include <stdint.h>

namespace stbshx {
    namespace detail {
        static constexpr uint32_t replacement_char = 0xFFFD;

        // Decodes one code point starting at text[i] and advances i. Bad
        // lead bytes, truncated or overlong sequences and surrogates decode
        // to U+FFFD, consuming one byte.
        static inline uint32_t NextCodepoint(const char* text, size_t size, size_t& i) noexcept {
            const uint8_t* s = reinterpret_cast<const uint8_t*>(text);
            uint8_t b0 = s[i];
            int n;
            uint32_t cp;
            uint32_t min;
            if (b0 < 0x80)                { ++i; return b0; }
            else if ((b0 & 0xE0) == 0xC0) { n = 1; cp = b0 & 0x1F; min = 0x80; }
            else if ((b0 & 0xF0) == 0xE0) { n = 2; cp = b0 & 0x0F; min = 0x800; }
            else if ((b0 & 0xF8) == 0xF0) { n = 3; cp = b0 & 0x07; min = 0x10000; }
            else                          { ++i; return replacement_char; }

            if (i + n >= size) { ++i; return replacement_char; }
            for (int k = 1; k <= n; ++k) {
                uint8_t c = s[i + k];
                if ((c & 0xC0) != 0x80) { ++i; return replacement_char; }
                cp = (cp << 6) | (c & 0x3F);
            }
            if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                ++i;
                return replacement_char;
            }
            i += n + 1;
            return cp;
        }
    } // namespace detail
} // namespace stbshx
