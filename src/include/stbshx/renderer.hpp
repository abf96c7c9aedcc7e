#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "font_file.hpp"
#include "interpreter.hpp"
#include "path_sink.hpp"
#include "detail/fallback.hpp"
#include "detail/utf8.hpp"

namespace stbshx {
enum class Align : uint8_t {
    Start,
    Middle,  // the whole block is centred on x = 0
    End      // every line ends at x = 0
};

struct RenderOptions {
    bool horizontal{ true };
    double font_size{ 12.0 };   // output units per `above`
    double h_spacing{ 1.0 };    // multiplies each glyph's advance
    double v_spacing{ 1.1 };    // multiplies the line height
    Align align{ Align::Start };
};

// Where one line of text ended up, in output units except `width`, which is
// `max_x - start_x`.
struct LineInfo {
    double start_x, start_y;
    double max_x;
    double width;
    double height;
};

inline Error Render(const FontFile& font, PathSink& sink, const std::string& text,
                    const RenderOptions& options, std::vector<LineInfo>* lines = nullptr);

inline Error Render(const FontFile& font, PathSink& sink, const std::string& text,
                    bool horizontal = true, double font_size = 12.0) {
    RenderOptions options;
    options.horizontal = horizontal;
    options.font_size = font_size;
    return Render(font, sink, text, options);
}

namespace detail {
    struct LineLayout {
        const FontFile& font;
        const RenderOptions& options;
        Interpreter interpreter;
        InterpreterState st;
        double base_scale;

        LineLayout(const FontFile& font_, const RenderOptions& options_) noexcept
            : font{ font_ }, options{ options_ },
              interpreter{ font_, options_.horizontal } {
            int above = font.above > 0 ? font.above : 1;
            base_scale = options.font_size / above;
        }

        inline Error Glyph(uint32_t codepoint, PathSink& sink, double& max_x) {
            const FontFile::Program* program = font.FindGlyph(codepoint);
            if (!program) {
                spdlog::debug("ShxRender: no glyph for U+{:04X}", codepoint);
                return Error{};
            }
            double last_x_before = st.last_x;
            st.BeginGlyph(base_scale);
            Error err = interpreter.Execute(*program, st, sink);
            if (err) return err;

            if (options.h_spacing != 1.0) {
                double dx = (options.h_spacing - 1) * (st.last_x - last_x_before);
                st.last_x += dx;
                st.x += dx;
            }
            if (st.x > max_x) max_x = st.x;
            sink.character_end();
            return Error{};
        }

        inline Error Character(uint32_t codepoint, PathSink& sink, double& max_x) {
            if (!font.HasGlyph(codepoint)) {
                if (const char* ascii = FindFallback(codepoint)) {
                    for (const char* c = ascii; *c; ++c) {
                        Error err = Glyph(static_cast<uint8_t>(*c), sink, max_x);
                        if (err) return err;
                    }
                    return Error{};
                }
            }
            return Glyph(codepoint, sink, max_x);
        }

        // One pass over all lines. `offsets` holds the start x of each line,
        // or is empty for all zero.
        inline Error Run(const std::string& text, const std::vector<double>& offsets,
                         PathSink& sink, std::vector<LineInfo>& out) {
            const double line_height = font.above + font.below;
            double offset_y = 0;
            size_t line = 0;
            size_t i = 0;
            out.clear();

            for (;;) {
                double start_x = line < offsets.size() ? offsets[line] : 0.0;
                st.MoveTo(start_x, offset_y * base_scale);
                double max_x = start_x;
                const double start_y = st.y;

                while (i < text.size() && text[i] != '\n') {
                    uint32_t cp = NextCodepoint(text.data(), text.size(), i);
                    Error err = Character(cp, sink, max_x);
                    if (err) return err;
                }

                out.push_back(LineInfo{ start_x, start_y, max_x, max_x - start_x,
                    base_scale * line_height });
                offset_y -= options.v_spacing * line_height;
                ++line;

                if (i >= text.size()) break;
                ++i; // '\n'
            }
            return Error{};
        }
    }; // struct LineLayout
} // namespace detail

// Draws `text` (UTF-8) into `sink`. Stops at the first glyph program fault
// and returns it; whatever was drawn up to that point stays in the sink.
inline Error Render(const FontFile& font, PathSink& sink, const std::string& text,
                    const RenderOptions& options, std::vector<LineInfo>* lines) {
    std::vector<LineInfo> info;
    std::vector<double> offsets;
    if (lines) lines->clear();
    if (text.empty()) return Error{};

    if (options.align != Align::Start) {
        NullSink measure;
        detail::LineLayout layout(font, options);
        Error err = layout.Run(text, offsets, measure, info);
        if (err) {
            spdlog::warn("ShxRender: measuring pass failed: {}", err.message);
            return err;
        }
        double max_len = 0;
        for (size_t l = 0; l < info.size(); ++l)
            if (l == 0 || info[l].max_x > max_len) max_len = info[l].max_x;
        for (const LineInfo& li : info) {
            if (options.align == Align::Middle)
                offsets.push_back(-max_len / 2 + (max_len - li.max_x) / 2);
            else
                offsets.push_back(-li.max_x);
        }
    }

    detail::LineLayout layout(font, options);
    Error err = layout.Run(text, offsets, sink, info);
    if (err) {
        spdlog::warn("ShxRender: render aborted, {}: {}", ErrorKindName(err.kind), err.message);
        return err;
    }
    spdlog::debug("ShxRender: {} line(s), scale {}", info.size(), layout.base_scale);
    if (lines) *lines = std::move(info);
    return Error{};
}
} // namespace stbshx
