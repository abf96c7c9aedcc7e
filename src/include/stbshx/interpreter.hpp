#pragma once

#include <stddef.h>
#include <stdint.h>
#include <math.h>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "font_file.hpp"
#include "path_sink.hpp"
#include "detail/buf.hpp"
#include "detail/enums.hpp"
#include "detail/tape.hpp"

namespace stbshx {
// Pen state of one render call. x/y (and last_x/last_y) carry over from
// glyph to glyph, which is where the advance comes from; everything else is
// reset by BeginGlyph.
struct InterpreterState {
    struct Position { double x, y; };
    static constexpr int stack_capacity = 3; // a 4th push overflows

    double x{}, y{};
    double last_x{}, last_y{};  // start of the current segment
    bool pen{ true };
    double scale{ 1.0 };
    bool skip_next{};

    Position stack[stack_capacity]{};
    int stack_size{};

    inline void BeginGlyph(double base_scale) noexcept {
        pen = true;
        scale = base_scale;
        skip_next = false;
        stack_size = 0;
    }

    inline void MoveTo(double nx, double ny) noexcept {
        x = last_x = nx;
        y = last_y = ny;
    }
};

// Runs glyph programs of one font. Holds the code tape of the glyph being
// run, so use one Interpreter per render call.
struct Interpreter {
    const FontFile& font;
    bool horizontal;

    explicit Interpreter(const FontFile& font_, bool horizontal_ = true) noexcept
        : font{ font_ }, horizontal{ horizontal_ } {}

    inline Error Execute(const uint8_t* program, size_t size,
                         InterpreterState& st, PathSink& sink);
    inline Error Execute(const FontFile::Program& program,
                         InterpreterState& st, PathSink& sink) {
        return Execute(program.data(), program.size(), st, sink);
    }

private:
    detail::Tape tape{};

    inline Error ReadSubshapeKey(uint32_t& key) noexcept;

    // COND_MODE_2 arms skip_next; whichever opcode comes next still eats
    // its operands, then asks here whether to do anything.
    static inline bool Skipped(InterpreterState& st) noexcept {
        if (!st.skip_next) return false;
        st.skip_next = false;
        return true;
    }

    static inline void Displace(InterpreterState& st, PathSink& sink, double dx, double dy) {
        st.x += dx;
        st.y += dy;
        if (st.pen)
            sink.line(st.last_x, st.last_y, st.x, st.y);
        else
            sink.move(st.x, st.y);
        st.last_x = st.x;
        st.last_y = st.y;
    }

    static inline void ArcTo(InterpreterState& st, PathSink& sink, double radius,
                             int s, int c, bool ccw, double start_offset, double end_offset);
    static inline void BulgeTo(InterpreterState& st, PathSink& sink,
                               double dx, double dy, int h);
}; // struct Interpreter

namespace detail {
    static constexpr double tau = 6.283185307179586476925286766559;
    static constexpr double octant = tau / 8.0;
} // namespace detail

// ============================================================================
//                         PUBLIC   METHODS
// ============================================================================

inline Error Interpreter::Execute(const uint8_t* program, size_t size,
                                  InterpreterState& st, PathSink& sink) {
#define STBSHX__ERR(kind, msg) Error(ErrorKind::kind, msg)
#define STBSHX__POP(v) \
    if (!tape.Pop(v)) return STBSHX__ERR(EmptyStream, "glyph program ends inside an opcode")

    tape.Reset(program, size > 0x7FFFFFFF ? 0x7FFFFFFF : static_cast<int>(size));

    uint8_t b;
    while (tape.Pop(b)) {
        const int length = b >> 4;
        const int direction = b & 0x0F;

        if (length != 0) {
            spdlog::trace("ShxFont: vector dir={} len={}{}", direction, length,
                st.skip_next ? " (skipped)" : "");
            if (Skipped(st)) continue;
            const detail::Direction& d = detail::directions[direction];
            Displace(st, sink, d.dx * length * st.scale, d.dy * length * st.scale);
            continue;
        }

        switch (static_cast<detail::Opcode>(direction)) {
        case detail::Opcode::EndOfShape:
            tape.DiscardThroughZero();
            if (Skipped(st)) break;
            sink.new_path();
            break;

        case detail::Opcode::PenDown:
            if (Skipped(st)) break;
            st.pen = true;
            break;

        case detail::Opcode::PenUp:
            if (Skipped(st)) break;
            st.pen = false;
            break;

        case detail::Opcode::DivideVector: {
            uint8_t factor;
            STBSHX__POP(factor);
            if (factor == 0)
                return STBSHX__ERR(DivideByZero, "DIVIDE_VECTOR by zero");
            if (Skipped(st)) break;
            st.scale /= factor;
        } break;

        case detail::Opcode::MultiplyVector: {
            uint8_t factor;
            STBSHX__POP(factor);
            if (factor == 0)
                return STBSHX__ERR(InvalidFactor, "MULTIPLY_VECTOR by zero");
            if (Skipped(st)) break;
            st.scale *= factor;
        } break;

        case detail::Opcode::PushStack:
            if (Skipped(st)) break;
            if (st.stack_size >= InterpreterState::stack_capacity)
                return STBSHX__ERR(StackOverflow, "position stack overflow");
            st.stack[st.stack_size++] = InterpreterState::Position{ st.x, st.y };
            break;

        case detail::Opcode::PopStack: {
            if (Skipped(st)) break;
            if (st.stack_size <= 0)
                return STBSHX__ERR(StackUnderflow, "position stack underflow");
            const InterpreterState::Position& p = st.stack[--st.stack_size];
            st.x = p.x;
            st.y = p.y;
            // always a move, whatever the pen says
            sink.move(st.x, st.y);
            st.last_x = st.x;
            st.last_y = st.y;
        } break;

        case detail::Opcode::DrawSubshape: {
            uint32_t key = 0;
            Error err = ReadSubshapeKey(key);
            if (err) return err;
            spdlog::trace("ShxFont: subshape {} at depth {}{}", key, tape.Depth(),
                st.skip_next ? " (skipped)" : "");
            if (Skipped(st)) break;
            const FontFile::Program* shape = font.FindGlyph(key);
            if (!shape)
                return STBSHX__ERR(UnresolvedSubshape, "referenced subshape does not exist");
            if (!tape.Splice(shape->data(), static_cast<int>(shape->size())))
                return STBSHX__ERR(RecursionLimit, "subshape nesting limit reached");
        } break;

        case detail::Opcode::XyDisplacement: {
            uint8_t bx, by;
            STBSHX__POP(bx);
            STBSHX__POP(by);
            if (Skipped(st)) break;
            Displace(st, sink, detail::Signed8(bx) * st.scale, detail::Signed8(by) * st.scale);
        } break;

        case detail::Opcode::PolyXyDisplacement: {
            for (;;) {
                uint8_t bx, by;
                STBSHX__POP(bx);
                STBSHX__POP(by);
                if (bx == 0 && by == 0) break;
                if (st.skip_next) continue;
                Displace(st, sink, detail::Signed8(bx) * st.scale, detail::Signed8(by) * st.scale);
            }
            st.skip_next = false;
        } break;

        case detail::Opcode::OctantArc: {
            uint8_t r, sc;
            STBSHX__POP(r);
            STBSHX__POP(sc);
            if (Skipped(st)) break;
            ArcTo(st, sink, r * st.scale, (sc >> 4) & 0x7, sc & 0x7, (sc & 0x80) != 0, 0.0, 0.0);
        } break;

        case detail::Opcode::FractionalArc: {
            uint8_t start_off, end_off, r_hi, r_lo, sc;
            STBSHX__POP(start_off);
            STBSHX__POP(end_off);
            STBSHX__POP(r_hi);
            STBSHX__POP(r_lo);
            STBSHX__POP(sc);
            if (Skipped(st)) break;
            // offsets are 1/256ths of an octant
            ArcTo(st, sink, (256 * r_hi + r_lo) * st.scale,
                (sc >> 4) & 0x7, sc & 0x7, (sc & 0x80) != 0,
                detail::octant * start_off / 256.0,
                detail::octant * end_off / 256.0);
        } break;

        case detail::Opcode::BulgeArc: {
            uint8_t bx, by, h;
            STBSHX__POP(bx);
            STBSHX__POP(by);
            STBSHX__POP(h);
            if (Skipped(st)) break;
            BulgeTo(st, sink, detail::Signed8(bx) * st.scale, detail::Signed8(by) * st.scale,
                detail::Signed8(h));
        } break;

        case detail::Opcode::PolyBulgeArc: {
            for (;;) {
                uint8_t bx, by, h;
                STBSHX__POP(bx);
                STBSHX__POP(by);
                if (bx == 0 && by == 0) break; // no bulge byte after the terminator
                STBSHX__POP(h);
                if (st.skip_next) continue;
                BulgeTo(st, sink, detail::Signed8(bx) * st.scale, detail::Signed8(by) * st.scale,
                    detail::Signed8(h));
            }
            st.skip_next = false;
        } break;

        case detail::Opcode::CondMode2:
            if (Skipped(st)) break;
            if (font.modes == static_cast<int>(Modes::Dual) && horizontal)
                st.skip_next = true;
            break;

        default: // 0x0F is unassigned
            spdlog::trace("ShxFont: ignoring opcode 0x{:02X}", b);
            st.skip_next = false;
            break;
        }
    }
    return Error{};

#undef STBSHX__POP
#undef STBSHX__ERR
}

// ============================================================================
//                         PRIVATE   METHODS
// ============================================================================

// Shapes address subshapes with one byte, unifonts with two (little
// endian). Bigfonts use one byte, where 0 escapes to a two byte number
// followed by origin x/y and width/height, which we read past.
inline Error Interpreter::ReadSubshapeKey(uint32_t& key) noexcept {
    uint8_t lo, hi;
    switch (font.variant) {
    case Variant::Shapes:
        if (!tape.Pop(lo)) break;
        key = lo;
        return Error{};

    case Variant::BigFont: {
        if (!tape.Pop(lo)) break;
        if (lo != 0) {
            key = lo;
            return Error{};
        }
        if (!tape.Pop(lo) || !tape.Pop(hi)) break;
        key = lo | (static_cast<uint32_t>(hi) << 8);
        uint8_t origin_x, origin_y, width, height;
        if (!tape.Pop(origin_x) || !tape.Pop(origin_y) ||
            !tape.Pop(width) || !tape.Pop(height)) break;
        spdlog::trace("ShxFont: extended bigfont subshape {}, origin=({}, {}), size={}x{}",
            key, origin_x, origin_y, width, height);
        return Error{};
    }

    case Variant::Unifont:
        if (!tape.Pop(lo) || !tape.Pop(hi)) break;
        key = lo | (static_cast<uint32_t>(hi) << 8);
        return Error{};
    }
    return Error(ErrorKind::EmptyStream, "glyph program ends inside DRAW_SUBSHAPE");
}

// Octant and fractional arcs. The centre sits one radius back along the
// start angle; a counter-clockwise flag negates the start octant.
inline void Interpreter::ArcTo(InterpreterState& st, PathSink& sink, double radius,
                               int s, int c, bool ccw, double start_offset, double end_offset) {
    if (c == 0) c = 8;
    if (ccw) s = -s;
    double start_angle = start_offset + (s * detail::octant);
    double end_angle = (c + s) * detail::octant + end_offset;
    double mid_angle = (start_angle + end_angle) / 2;

    double cx = st.x - radius * cos(start_angle);
    double cy = st.y - radius * sin(start_angle);
    double mx = cx + radius * cos(mid_angle);
    double my = cy + radius * sin(mid_angle);
    st.x = cx + radius * cos(end_angle);
    st.y = cy + radius * sin(end_angle);

    if (st.pen)
        sink.arc(st.last_x, st.last_y, mx, my, st.x, st.y);
    else
        sink.move(st.x, st.y);
    st.last_x = st.x;
    st.last_y = st.y;
}

// h is +-127ths of half the chord, measured to the right of the chord
// direction; zero is a straight line.
inline void Interpreter::BulgeTo(InterpreterState& st, PathSink& sink,
                                 double dx, double dy, int h) {
    double r = hypot(dx, dy) / 2;
    double bulge = h / 127.0;
    double bx = st.x + (dx / 2);
    double by = st.y + (dy / 2);
    double bulge_angle = atan2(dy, dx) - detail::tau / 4;
    double mx = bx + r * bulge * cos(bulge_angle);
    double my = by + r * bulge * sin(bulge_angle);
    st.x += dx;
    st.y += dy;

    if (st.pen) {
        if (bulge == 0)
            sink.line(st.last_x, st.last_y, st.x, st.y);
        else
            sink.arc(st.last_x, st.last_y, mx, my, st.x, st.y);
    }
    else {
        sink.move(st.x, st.y);
    }
    st.last_x = st.x;
    st.last_y = st.y;
}
} // namespace stbshx
