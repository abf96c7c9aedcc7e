// In-memory .shx builders shared by the Catch2 tests. Each builder lays the
// bytes out the way ReadBytes expects them for its container type.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace shx_test {
    using Bytes = std::vector<std::uint8_t>;

    static inline void put8(Bytes& out, unsigned v) { out.push_back(static_cast<std::uint8_t>(v)); }
    static inline void put16(Bytes& out, unsigned v) {
        put8(out, v & 0xFF);
        put8(out, (v >> 8) & 0xFF);
    }
    static inline void put32(Bytes& out, std::uint32_t v) {
        put16(out, v & 0xFFFF);
        put16(out, v >> 16);
    }
    static inline void put_str(Bytes& out, const std::string& s) {
        out.insert(out.end(), s.begin(), s.end());
    }
    static inline void header(Bytes& out, const char* type) {
        put_str(out, "AutoCAD-86 ");
        put_str(out, type);
        put_str(out, " 1.0\r\n\x1a");
    }

    // "shapes": glyph bytes are written as given, so a record that should
    // carry a name must start with the zero byte itself (see Named).
    struct ShapesBuilder {
        std::string name{ "test" };
        int above{ 10 }, below{ 2 }, modes{ 0 };
        bool metrics{ true };
        std::vector<std::pair<unsigned, Bytes>> shapes;

        ShapesBuilder& Add(unsigned index, Bytes program) {
            shapes.emplace_back(index, std::move(program));
            return *this;
        }

        Bytes Build() const {
            Bytes out;
            header(out, "shapes");
            unsigned count = static_cast<unsigned>(shapes.size()) + (metrics ? 1 : 0);
            put16(out, 0);
            put16(out, 0xFF);
            put16(out, count);
            if (metrics) {
                put16(out, 0);
                put16(out, static_cast<unsigned>(name.size()) + 4);
            }
            for (const auto& s : shapes) {
                put16(out, s.first);
                put16(out, static_cast<unsigned>(s.second.size()));
            }
            if (metrics) {
                put_str(out, name);
                put8(out, 0);
                put8(out, above);
                put8(out, below);
                put8(out, modes);
            }
            for (const auto& s : shapes)
                out.insert(out.end(), s.second.begin(), s.second.end());
            return out;
        }
    };

    // zero byte, name, NUL, program
    static inline Bytes Named(const std::string& name, const Bytes& program) {
        Bytes out;
        put8(out, 0);
        put_str(out, name);
        put8(out, 0);
        out.insert(out.end(), program.begin(), program.end());
        return out;
    }

    struct BigFontBuilder {
        int above{ 8 }, below{ 2 }, modes{ 0 };
        std::vector<std::pair<unsigned, unsigned>> change_table;
        std::vector<std::pair<unsigned, Bytes>> shapes;

        BigFontBuilder& Add(unsigned index, Bytes program) {
            shapes.emplace_back(index, std::move(program));
            return *this;
        }

        Bytes Build() const {
            Bytes out;
            header(out, "bigfont");
            unsigned count = static_cast<unsigned>(shapes.size()) + 1;
            put16(out, count);
            put16(out, 0);
            put16(out, static_cast<unsigned>(change_table.size()));
            for (const auto& c : change_table) {
                put16(out, c.first);
                put16(out, c.second);
            }
            std::uint32_t offset = static_cast<std::uint32_t>(out.size()) + 8 * count;
            // info record first, then glyphs in order
            put16(out, 0);
            put16(out, 3);
            put32(out, offset);
            offset += 3;
            for (const auto& s : shapes) {
                put16(out, s.first);
                put16(out, static_cast<unsigned>(s.second.size()));
                put32(out, offset);
                offset += static_cast<std::uint32_t>(s.second.size());
            }
            put8(out, above);
            put8(out, below);
            put8(out, modes);
            for (const auto& s : shapes)
                out.insert(out.end(), s.second.begin(), s.second.end());
            return out;
        }
    };

    // "unifont": the font info is read from offset 5, which lands inside
    // the header text. With the standard header that gives the name
    // "AD-86 unifont 1.0", above = '\n' (10), below = 0x1a (26), and modes,
    // encoding, embeddable and the reserved byte are the four bytes of the
    // record count. Glyph records start right after that, so the first
    // record's index doubles as the u16 length field.
    struct UnifontBuilder {
        std::vector<std::pair<unsigned, Bytes>> shapes;

        UnifontBuilder& Add(unsigned index, Bytes program) {
            shapes.emplace_back(index, std::move(program));
            return *this;
        }

        Bytes Build() const {
            Bytes out;
            header(out, "unifont");
            put32(out, static_cast<std::uint32_t>(shapes.size()) + 1);
            for (const auto& s : shapes) {
                put16(out, s.first);
                put16(out, static_cast<unsigned>(s.second.size()));
                out.insert(out.end(), s.second.begin(), s.second.end());
            }
            return out;
        }
    };

    static inline std::string getenv_str(const char* name) {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string{};
    }

    static inline int getenv_int(const char* name, int fallback) {
        const char* v = std::getenv(name);
        int n = v ? std::atoi(v) : 0;
        return n > 0 ? n : fallback;
    }

    // STBSHX_TEST_FONT plus the ';' or ':' separated STBSHX_TEST_FONTS,
    // blanks trimmed, empty entries dropped.
    static inline std::vector<std::string> font_paths_from_env() {
        std::vector<std::string> paths;
        std::string list = getenv_str("STBSHX_TEST_FONT") + ";" + getenv_str("STBSHX_TEST_FONTS");
        std::size_t start = 0;
        while (start <= list.size()) {
            std::size_t end = list.find_first_of(";:", start);
            if (end == std::string::npos) end = list.size();
            std::size_t a = list.find_first_not_of(" \t", start);
            std::size_t b = list.find_last_not_of(" \t", end == 0 ? 0 : end - 1);
            if (a != std::string::npos && a < end && b != std::string::npos && b >= a)
                paths.push_back(list.substr(a, b - a + 1));
            start = end + 1;
        }
        return paths;
    }

    static inline bool read_file(const std::string& path, Bytes& out) {
        std::ifstream f(path, std::ios::binary);
        if (!f) return false;
        out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
        return !f.bad() && !out.empty();
    }

    // 64-bit FNV-1a
    static inline std::uint64_t hash_bytes(const void* data, std::size_t n) {
        const auto* p = static_cast<const std::uint8_t*>(data);
        std::uint64_t h = 0xcbf29ce484222325ull;
        for (std::size_t i = 0; i < n; ++i) {
            h ^= p[i];
            h *= 0x100000001b3ull;
        }
        return h;
    }
} // namespace shx_test
