/*
MIT License
Copyright (c) 2025 setbe

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the "Software"), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
of the Software, and to permit persons to whom the Software is furnished to do
so, subject to the following conditions:
The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/


// =======================================================================
//
//    ABOUT
//
// Reader and stroke renderer for AutoCAD compiled shape fonts (.shx):
// "shapes", "bigfont" and "unifont" files. Glyphs come out as open
// strokes (moves, lines and three-point arcs), which is what engravers
// and plotters want; nothing here fills or rasterizes.
//
// Font files are treated as untrusted. Every read is range checked, and
// subshape nesting is capped (see STBSHX_MAX_SUBSHAPE_DEPTH), so a broken
// or hostile file ends in an Error, never in a crash or a hang.
//
// =======================================================================
//
//    USAGE
//
//      stbshx::FontFile font;
//      stbshx::Error err = font.ReadFile("txt.shx");
//      if (err) { ... err.kind, err.message ... }
//
//      stbshx::StrokePath path;               // or your own PathSink
//      err = stbshx::Render(font, path, "Hello", true, 12.0);
//
//   Multi-line text, spacing and alignment:
//
//      stbshx::RenderOptions opt;
//      opt.font_size = 10.0;
//      opt.align = stbshx::Align::Middle;
//      std::vector<stbshx::LineInfo> lines;
//      err = stbshx::Render(font, path, "first\nsecond", opt, &lines);
//
//   Output is y up, one `above` of the font maps to `font_size` units.
//   Logging goes through the spdlog default logger ("ShxFont:" and
//   "ShxRender:" prefixes), at debug and trace level only except for
//   rejected files and aborted renders.

#include "stbshx/detail/integration.hpp"

#include "stbshx/error.hpp"
#include "stbshx/path_sink.hpp"
#include "stbshx/font_file.hpp"
#include "stbshx/interpreter.hpp"
#include "stbshx/renderer.hpp"
#include "stbshx/svg.hpp"
