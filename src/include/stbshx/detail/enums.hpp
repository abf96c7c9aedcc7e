#pragma once

#include <stdint.h>

namespace stbshx {
    // Container layout named by the second header token. The glyph
    // bytecode is the same for all three; only the file tables and the
    // DRAW_SUBSHAPE key width differ.
    enum class Variant : uint8_t {
        Shapes,   // "shapes"  - one byte glyph keys
        BigFont,  // "bigfont" - offset table, extended two byte keys
        Unifont   // "unifont" - sequential records, two byte keys
    };

    enum class Modes : uint8_t {
        Horizontal = 0,
        Dual = 2   // COND_MODE_2 is honoured only for these fonts
    };

    namespace detail {
        // Named opcodes (high nibble zero). Any byte with a non-zero high
        // nibble is a vector move: length in the high nibble, direction in
        // the low one.
        enum class Opcode : uint8_t {
            EndOfShape         = 0x0,
            PenDown            = 0x1,
            PenUp              = 0x2,
            DivideVector       = 0x3,
            MultiplyVector     = 0x4,
            PushStack          = 0x5,
            PopStack           = 0x6,
            DrawSubshape       = 0x7,
            XyDisplacement     = 0x8,
            PolyXyDisplacement = 0x9,  // (0,0) terminated
            OctantArc          = 0xA,
            FractionalArc      = 0xB,  // start, end, radius hi, radius lo, sc
            BulgeArc           = 0xC,  // dx, dy, bulge
            PolyBulgeArc       = 0xD,  // (0,0) terminated, no trailing bulge
            CondMode2          = 0xE
        };

        // Unit vector for each of the 16 directions, 22.5 degrees apart,
        // counter-clockwise from +x. The lengths are not normalised: the
        // diagonals land on the unit square.
        struct Direction { double dx, dy; };

        static constexpr Direction directions[16]{
            {  1.0,  0.0 }, // 0
            {  1.0,  0.5 }, // 1
            {  1.0,  1.0 }, // 2
            {  0.5,  1.0 }, // 3
            {  0.0,  1.0 }, // 4
            { -0.5,  1.0 }, // 5
            { -1.0,  1.0 }, // 6
            { -1.0,  0.5 }, // 7
            { -1.0,  0.0 }, // 8
            { -1.0, -0.5 }, // 9
            { -1.0, -1.0 }, // A
            { -0.5, -1.0 }, // B
            {  0.0, -1.0 }, // C
            {  0.5, -1.0 }, // D
            {  1.0, -1.0 }, // E
            {  1.0, -0.5 }, // F
        };
    } // namespace detail
} // namespace stbshx
