#pragma once

#include <math.h>

#include <sstream>
#include <string>

#include "path_sink.hpp"

namespace stbshx {
namespace detail {
    // Circle through three points. False when they are (nearly) collinear,
    // judged by the sine of the angle at the first point.
    static inline bool CircleThrough(double x0, double y0, double x1, double y1,
                                     double x2, double y2,
                                     double& cx, double& cy, double& r) noexcept {
        double ax = x1 - x0, ay = y1 - y0;
        double bx = x2 - x0, by = y2 - y0;
        double cross = ax * by - ay * bx;
        double scale = hypot(ax, ay) * hypot(bx, by);
        if (scale == 0 || fabs(cross) / scale < 1e-9) return false;

        double d = 2 * (x0 * (y1 - y2) + x1 * (y2 - y0) + x2 * (y0 - y1));
        double s0 = x0 * x0 + y0 * y0;
        double s1 = x1 * x1 + y1 * y1;
        double s2 = x2 * x2 + y2 * y2;
        cx = (s0 * (y1 - y2) + s1 * (y2 - y0) + s2 * (y0 - y1)) / d;
        cy = (s0 * (x2 - x1) + s1 * (x0 - x2) + s2 * (x1 - x0)) / d;
        r = hypot(x0 - cx, y0 - cy);
        return true;
    }
} // namespace detail

// SVG path data ("d" attribute) for recorded strokes. SVG is y down, so y
// is flipped on output. Arcs become elliptical arc commands; an arc that
// ends where it starts is a full circle and is written as two halves.
inline std::string SvgPathData(const StrokePath& path) {
    using Kind = StrokePath::Segment::Kind;
    std::ostringstream d;
    double pen_x = 0, pen_y = 0;
    bool have_pen = false;

    auto start_at = [&](double x, double y) {
        if (!have_pen || x != pen_x || y != pen_y)
            d << "M" << x << "," << -y << " ";
        have_pen = true;
    };

    for (const StrokePath::Segment& s : path.segments) {
        switch (s.kind) {
        case Kind::NewPath:
            have_pen = false;
            continue;
        case Kind::Move:
            d << "M" << s.x1 << "," << -s.y1 << " ";
            have_pen = true;
            break;
        case Kind::Line:
            start_at(s.x0, s.y0);
            d << "L" << s.x1 << "," << -s.y1 << " ";
            break;
        case Kind::Arc: {
            start_at(s.x0, s.y0);
            double reach = hypot(s.cx - s.x0, s.cy - s.y0);
            double chord = hypot(s.x1 - s.x0, s.y1 - s.y0);
            double cx, cy, r;
            if (reach > 0 && chord <= 1e-9 * reach) {
                // the control point is the far end of the diameter
                r = reach / 2;
                d << "A" << r << "," << r << " 0 0,0 " << s.cx << "," << -s.cy << " ";
                d << "A" << r << "," << r << " 0 0,0 " << s.x1 << "," << -s.y1 << " ";
            }
            else if (!detail::CircleThrough(s.x0, s.y0, s.cx, s.cy, s.x1, s.y1, cx, cy, r)) {
                d << "L" << s.x1 << "," << -s.y1 << " ";
            }
            else {
                // turn at the control point, in y-up space
                double cross = (s.cx - s.x0) * (s.y1 - s.cy) - (s.cy - s.y0) * (s.x1 - s.cx);
                bool ccw = cross > 0;
                // centre on the control point's side of the chord: more than half a turn
                double side_c = (s.x1 - s.x0) * (cy - s.y0) - (s.y1 - s.y0) * (cx - s.x0);
                double side_m = (s.x1 - s.x0) * (s.cy - s.y0) - (s.y1 - s.y0) * (s.cx - s.x0);
                bool large = side_c * side_m > 0;
                // flipping y turns ccw into sweep-flag 0
                d << "A" << r << "," << r << " 0 " << (large ? 1 : 0) << "," << (ccw ? 0 : 1)
                  << " " << s.x1 << "," << -s.y1 << " ";
            }
        } break;
        }
        pen_x = s.x1;
        pen_y = s.y1;
    }
    return d.str();
}
} // namespace stbshx
