#pragma once

#include <stddef.h> // size_t
#include <stdint.h> // uint32_t

#include "integration.hpp"

namespace stbshx {
    namespace detail {
        // Little-endian cursor over an in-memory font file. Reads past the end
        // return zero and latch `short_read`, so a parser can read a whole
        // record and check once.
        struct Buf {
            const uint8_t* data;
            int cursor;
            int size;
            bool short_read;

            inline uint8_t Get8() noexcept;
            inline void Seek(int o) noexcept;
            inline uint32_t Get(int n) noexcept;
            inline uint32_t Get16() noexcept { return Get(2); }
            inline uint32_t Get32() noexcept { return Get(4); }

            inline int Remaining() const noexcept { return size - cursor; }
            inline bool AtEnd() const noexcept { return cursor >= size; }

            inline Buf Range(int o, int s) const noexcept;
            inline Buf Take(int n) noexcept;
            inline Buf TakeString() noexcept;
        }; // struct Buf

        inline Buf MakeBuf(const uint8_t* data, size_t size) noexcept {
            Buf b{};
            b.data = data;
            b.size = size > 0x7FFFFFFF ? 0x7FFFFFFF : static_cast<int>(size);
            return b;
        }


        inline uint8_t Buf::Get8() noexcept {
            if (cursor >= size) {
                short_read = true;
                return 0;
            }
            return data[cursor++];
        }

        inline void Buf::Seek(int o) noexcept {
            if (o > size || o < 0) {
                short_read = true;
                cursor = size;
                return;
            }
            cursor = o;
        }

        inline uint32_t Buf::Get(int n) noexcept {
            STBSHX_assert(n >= 1 && n <= 4);
            uint32_t v = 0;
            for (int i = 0; i < n; ++i)
                v |= static_cast<uint32_t>(Get8()) << (8 * i);
            return v;
        }

        inline Buf Buf::Range(int o, int s) const noexcept {
            Buf r{};
            if (o < 0 || s < 0 || o > size || s > size - o)
                return r;
            r.data = data + o;
            r.size = s;
            return r;
        }

        // Consumes n bytes and returns them as a sub-buffer. A short tail is
        // returned as far as it goes and flags the read.
        inline Buf Buf::Take(int n) noexcept {
            if (n < 0) n = 0;
            int avail = Remaining() < 0 ? 0 : Remaining();
            if (n > avail) {
                short_read = true;
                n = avail;
            }
            Buf r = Range(cursor, n);
            cursor += n;
            return r;
        }

        // Header-style string: stops at CR, LF, NUL or end of data. The
        // terminator is consumed and not part of the result.
        inline Buf Buf::TakeString() noexcept {
            int start = cursor;
            while (cursor < size) {
                uint8_t c = data[cursor];
                if (c == '\r' || c == '\n' || c == 0) {
                    Buf r = Range(start, cursor - start);
                    ++cursor;
                    return r;
                }
                ++cursor;
            }
            return Range(start, cursor - start);
        }

        static inline int Signed8(uint8_t b) noexcept {
            return b > 127 ? b - 256 : b;
        }
    } // namespace detail
} // namespace stbshx
