#pragma once

#include <stddef.h>
#include <vector>

namespace stbshx {
    // Receives the strokes of rendered text. Coordinates are in the caller's
    // output units, y up.
    struct PathSink {
        // Start a disjoint subpath; the pen lifts between glyph components.
        virtual void new_path() = 0;
        virtual void move(double x, double y) = 0;
        virtual void line(double x0, double y0, double x1, double y1) = 0;
        // Circular arc from (x0,y0) to (x1,y1) passing through (cx,cy). The
        // control point lies on the arc, it is not a tangent handle.
        virtual void arc(double x0, double y0, double cx, double cy, double x1, double y1) = 0;
        // Called after each rendered glyph.
        virtual void character_end() {}
        virtual ~PathSink() = default;
    };


    struct NullSink final : PathSink {
        inline void new_path() override {}
        inline void move(double, double) override {}
        inline void line(double, double, double, double) override {}
        inline void arc(double, double, double, double, double, double) override {}
    };


    struct Bounds {
        double x0, y0, x1, y1;
    };

    // Records everything it is given, in order.
    struct StrokePath final : PathSink {
        struct Segment {
            enum class Kind {
                NewPath,
                Move,   // x1,y1
                Line,   // x0,y0 -> x1,y1
                Arc     // x0,y0 -> x1,y1 through cx,cy
            };
            Kind kind{};
            double x0{}, y0{};
            double cx{}, cy{};
            double x1{}, y1{};
        };

        std::vector<Segment> segments;
        size_t characters{};

        inline void new_path() override {
            Segment s;
            s.kind = Segment::Kind::NewPath;
            segments.push_back(s);
        }

        inline void move(double x, double y) override {
            Segment s;
            s.kind = Segment::Kind::Move;
            s.x1 = x;
            s.y1 = y;
            segments.push_back(s);
        }

        inline void line(double x0, double y0, double x1, double y1) override {
            Segment s;
            s.kind = Segment::Kind::Line;
            s.x0 = x0; s.y0 = y0;
            s.x1 = x1; s.y1 = y1;
            segments.push_back(s);
        }

        inline void arc(double x0, double y0, double cx, double cy, double x1, double y1) override {
            Segment s;
            s.kind = Segment::Kind::Arc;
            s.x0 = x0; s.y0 = y0;
            s.cx = cx; s.cy = cy;
            s.x1 = x1; s.y1 = y1;
            segments.push_back(s);
        }

        inline void character_end() override { ++characters; }

        inline size_t Count(Segment::Kind kind) const noexcept {
            size_t n = 0;
            for (const Segment& s : segments)
                if (s.kind == kind) ++n;
            return n;
        }

        inline void Clear() noexcept {
            segments.clear();
            characters = 0;
        }

        // Extent of the recorded start and end points (arc control points
        // are not included). False when nothing but path breaks was drawn.
        inline bool GetBounds(Bounds& out) const noexcept {
            bool started = false;
            auto track = [&](double x, double y) {
                if (!started || x < out.x0) out.x0 = x;
                if (!started || y < out.y0) out.y0 = y;
                if (!started || x > out.x1) out.x1 = x;
                if (!started || y > out.y1) out.y1 = y;
                started = true;
            };
            for (const Segment& s : segments) {
                switch (s.kind) {
                case Segment::Kind::NewPath:
                    break;
                case Segment::Kind::Move:
                    track(s.x1, s.y1);
                    break;
                case Segment::Kind::Line:
                case Segment::Kind::Arc:
                    track(s.x0, s.y0);
                    track(s.x1, s.y1);
                    break;
                }
            }
            return started;
        }

        inline void Scale(double sx, double sy) noexcept {
            for (Segment& s : segments) {
                s.x0 *= sx; s.y0 *= sy;
                s.cx *= sx; s.cy *= sy;
                s.x1 *= sx; s.y1 *= sy;
            }
        }

        inline void Translate(double tx, double ty) noexcept {
            for (Segment& s : segments) {
                if (s.kind == Segment::Kind::NewPath) continue;
                s.x0 += tx; s.y0 += ty;
                s.cx += tx; s.cy += ty;
                s.x1 += tx; s.y1 += ty;
            }
        }
    }; // struct StrokePath
} // namespace stbshx
