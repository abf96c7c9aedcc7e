#pragma once

#include <stdint.h>

namespace stbshx {
    namespace detail {
        struct Fallback {
            uint32_t codepoint;
            const char* ascii;
        };

        // Used only when the font lacks the precomposed glyph.
        static constexpr Fallback latin_fallbacks[]{
            { 0x00E4, "ae" }, // a diaeresis
            { 0x00F6, "oe" }, // o diaeresis
            { 0x00FC, "ue" }, // u diaeresis
            { 0x00C4, "Ae" }, // A diaeresis
            { 0x00D6, "Oe" }, // O diaeresis
            { 0x00DC, "Ue" }, // U diaeresis
            { 0x00DF, "ss" }, // sharp s
        };

        static inline const char* FindFallback(uint32_t codepoint) noexcept {
            for (const Fallback& f : latin_fallbacks) {
                if (f.codepoint == codepoint)
                    return f.ascii;
            }
            return nullptr;
        }
    } // namespace detail
} // namespace stbshx
