#pragma once

#include "buf.hpp"
#include "integration.hpp"

namespace stbshx {
    namespace detail {
        // The code stream of one glyph. DRAW_SUBSHAPE splices the callee in
        // front of whatever is left, which we keep as a stack of frames: the
        // caller resumes once the callee runs dry, with no return opcode.
        // A caller frame stays counted until its callee is done, so a glyph
        // that calls itself in tail position still runs into the depth cap.
        struct Tape {
            Buf frames[STBSHX_MAX_SUBSHAPE_DEPTH + 1];
            int height;
            int calls;

            inline void Reset(const uint8_t* program, int size) noexcept {
                frames[0] = Buf{};
                frames[0].data = program;
                frames[0].size = size;
                height = 1;
                calls = 0;
            }

            inline bool Pop(uint8_t& out) noexcept {
                DropExhausted();
                if (height == 0) return false;
                out = frames[height - 1].Get8();
                return true;
            }

            // false once the nesting or the per-glyph call budget is spent
            inline bool Splice(const uint8_t* program, int size) noexcept {
                if (height > STBSHX_MAX_SUBSHAPE_DEPTH) return false;
                if (calls >= STBSHX_MAX_SUBSHAPE_CALLS) return false;
                Buf& f = frames[height++];
                f = Buf{};
                f.data = program;
                f.size = size;
                ++calls;
                return true;
            }

            // END_OF_SHAPE: skip the rest of the program that issued it, up
            // to and including the next zero byte.
            inline void DiscardThroughZero() noexcept {
                if (height == 0) return;
                Buf& f = frames[height - 1];
                while (!f.AtEnd()) {
                    if (f.Get8() == 0) break;
                }
            }

            inline int Depth() const noexcept { return height; }

        private:
            inline void DropExhausted() noexcept {
                while (height > 0 && frames[height - 1].AtEnd())
                    --height;
            }
        }; // struct Tape
    } // namespace detail
} // namespace stbshx
