// shx_render <font.shx> <text> [size]
// Renders text with an .shx font and writes the strokes as SVG to stdout.
// Log output (stderr) follows SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=debug.

#include "stbshx/stb_shx.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace stbshx;

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <font.shx> <text> [size]" << std::endl;
        return 2;
    }
    const char* font_path = argv[1];
    const std::string text = argv[2];
    double size = argc > 3 ? std::atof(argv[3]) : 24.0;
    if (!(size > 0)) {
        std::cerr << "size must be a positive number" << std::endl;
        return 2;
    }

    // 1. Load font file
    FontFile font;
    Error err = font.ReadFile(font_path);
    if (err) {
        std::cerr << "Couldn't load font " << font_path << ": "
                  << ErrorKindName(err.kind) << " (" << err.message << ")" << std::endl;
        return 1;
    }

    // 2. Render
    StrokePath path;
    RenderOptions opt;
    opt.font_size = size;
    err = Render(font, path, text, opt);
    if (err) {
        std::cerr << "Render failed: " << ErrorKindName(err.kind)
                  << " (" << err.message << ")" << std::endl;
        return 1;
    }

    // 3. Frame the strokes
    Bounds b{ 0, 0, size, size };
    if (!path.GetBounds(b))
        spdlog::info("nothing to draw for \"{}\"", text);
    double margin = size / 4;
    double w = (b.x1 - b.x0) + 2 * margin;
    double h = (b.y1 - b.y0) + 2 * margin;

    // 4. Write SVG
    std::cout << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\""
              << (b.x0 - margin) << " " << (-b.y1 - margin) << " " << w << " " << h
              << "\" width=\"" << w << "\" height=\"" << h << "\">\n"
              << "  <path fill=\"none\" stroke=\"black\" stroke-width=\"" << size / 20
              << "\" stroke-linecap=\"round\" stroke-linejoin=\"round\" d=\""
              << SvgPathData(path) << "\"/>\n"
              << "</svg>\n";

    spdlog::debug("{} segments, {} characters", path.segments.size(), path.characters);
    return 0;
}
