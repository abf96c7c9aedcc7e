#pragma once

#include <stddef.h>
#include <stdint.h>

#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "detail/buf.hpp"
#include "detail/enums.hpp"
#include "detail/utf8.hpp"

namespace stbshx {
// A parsed .shx file. Fill it once with ReadBytes/ReadFile, then hand it out
// by const reference: rendering never writes to it, so one FontFile can
// serve any number of concurrent Render calls.
struct FontFile {
    using Program = std::vector<uint8_t>;

    std::string format;             // vendor tag, usually "AutoCAD-86"
    Variant variant{ Variant::Shapes };
    std::string version;            // usually "1.0"
    std::string font_name;          // empty for bigfonts

    int above{};                    // design units above the baseline
    int below{};                    // design units below the baseline
    int modes{};                    // 0 horizontal only, 2 dual
    int encoding{};                 // unifont only: 0 unicode, 1 packed multibyte, 2 shape file
    int embeddable{};               // unifont only
    bool has_metrics{};             // the font info record was present

    std::map<uint16_t, Program> glyphs;
    // legacy uppercase shape names, parsed for fidelity; rendering only
    // ever looks glyphs up by number
    std::map<std::string, uint16_t> aliases;

    inline Error ReadBytes(const uint8_t* data, size_t size);
    inline Error ReadFile(const char* path);

    inline const Program* FindGlyph(uint32_t key) const noexcept;
    inline bool HasGlyph(uint32_t key) const noexcept { return FindGlyph(key) != nullptr; }
    inline int FindAlias(const std::string& name) const noexcept;
    inline size_t GlyphCount() const noexcept { return glyphs.size(); }

private:
    inline Error ReadHeader(detail::Buf& b);
    inline Error ReadShapes(detail::Buf& b);
    inline Error ReadBigFont(detail::Buf& b);
    inline Error ReadUnifont(detail::Buf& b);
    inline void StoreShape(uint16_t index, const detail::Buf& raw);

    static inline std::string ToString(const detail::Buf& b) {
        if (b.size <= 0) return std::string();
        return std::string(reinterpret_cast<const char*>(b.data), static_cast<size_t>(b.size));
    }

    static inline bool IsValidUtf8(const std::string& s) noexcept {
        size_t i = 0;
        while (i < s.size()) {
            size_t at = i;
            if (detail::NextCodepoint(s.data(), s.size(), i) == detail::replacement_char && i == at + 1)
                return false;
        }
        return true;
    }

    static inline bool IsAliasChar(uint8_t c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == ' ' || c == '&';
    }

    static inline const char* VariantName(Variant v) noexcept {
        switch (v) {
        case Variant::Shapes:  return "shapes";
        case Variant::BigFont: return "bigfont";
        case Variant::Unifont: return "unifont";
        default:               return "?";
        }
    }
}; // struct FontFile

// ============================================================================
//                         PUBLIC   METHODS
// ============================================================================

inline Error FontFile::ReadBytes(const uint8_t* data, size_t size) {
    FontFile parsed;
    detail::Buf b = detail::MakeBuf(data, data ? size : 0);

    Error err = parsed.ReadHeader(b);
    if (!err) {
        switch (parsed.variant) {
        case Variant::Shapes:  err = parsed.ReadShapes(b);  break;
        case Variant::BigFont: err = parsed.ReadBigFont(b); break;
        case Variant::Unifont: err = parsed.ReadUnifont(b); break;
        }
    }
    if (err) {
        spdlog::warn("ShxFont: rejected font data ({}: {})", ErrorKindName(err.kind), err.message);
        *this = FontFile{};
        return err;
    }

    spdlog::debug("ShxFont: {} \"{}\" {}, glyphs: {}, above={}, below={}, modes={}",
        VariantName(parsed.variant), parsed.font_name, parsed.version,
        parsed.glyphs.size(), parsed.above, parsed.below, parsed.modes);
    *this = std::move(parsed);
    return Error{};
}

inline Error FontFile::ReadFile(const char* path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        spdlog::warn("ShxFont: couldn't open font file: {}", path);
        *this = FontFile{};
        return Error(ErrorKind::IoError, "couldn't open font file");
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                                std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        spdlog::warn("ShxFont: error while reading font file: {}", path);
        *this = FontFile{};
        return Error(ErrorKind::IoError, "error while reading font file");
    }
    Error err = ReadBytes(bytes.data(), bytes.size());
    if (err)
        spdlog::debug("ShxFont: {} is not a usable shx font ({})", path, ErrorKindName(err.kind));
    return err;
}

inline const FontFile::Program* FontFile::FindGlyph(uint32_t key) const noexcept {
    if (key > 0xFFFF) return nullptr;
    auto it = glyphs.find(static_cast<uint16_t>(key));
    return it == glyphs.end() ? nullptr : &it->second;
}

inline int FontFile::FindAlias(const std::string& name) const noexcept {
    auto it = aliases.find(name);
    return it == aliases.end() ? -1 : it->second;
}

// ============================================================================
//                         CONTAINER   LAYOUTS
// ============================================================================

// "<format> <variant> <version>" up to CR/LF/NUL, then two bytes we skip
// (the rest of "\r\n\x1a" in every file seen so far).
inline Error FontFile::ReadHeader(detail::Buf& b) {
    std::string header = ToString(b.TakeString());
    if (!IsValidUtf8(header))
        return Error(ErrorKind::InvalidHeader, "header is not valid text");

    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t sp = header.find(' ', start);
        parts.push_back(header.substr(start, sp == std::string::npos ? std::string::npos : sp - start));
        if (sp == std::string::npos) break;
        start = sp + 1;
    }
    if (parts.size() != 3)
        return Error(ErrorKind::InvalidHeader, "header must hold format, type and version");

    format = parts[0];
    version = parts[2];
    if (parts[1] == "shapes")       variant = Variant::Shapes;
    else if (parts[1] == "bigfont") variant = Variant::BigFont;
    else if (parts[1] == "unifont") variant = Variant::Unifont;
    else
        return Error(ErrorKind::UnknownVariant, "not a shapes, bigfont or unifont file");

    b.Take(2);
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "file ends inside the header");
    return Error{};
}

inline Error FontFile::ReadShapes(detail::Buf& b) {
    struct Ref { uint16_t index, length; };

    uint32_t first = b.Get16();
    uint32_t last = b.Get16();
    uint32_t count = b.Get16();
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "shapes table header is truncated");
    spdlog::debug("ShxFont: parsing shapes: start={}, end={}, count={}", first, last, count);

    std::vector<Ref> refs;
    refs.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Ref r;
        r.index = static_cast<uint16_t>(b.Get16());
        r.length = static_cast<uint16_t>(b.Get16());
        refs.push_back(r);
    }
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "shapes index table is truncated");

    for (const Ref& r : refs) {
        if (r.index == 0) {
            // font info: the record length is not used here, the three
            // metric bytes follow the name directly
            if (has_metrics)
                return Error(ErrorKind::DuplicateFontInfo, "font info record appears twice");
            font_name = ToString(b.TakeString());
            above = b.Get8();
            below = b.Get8();
            modes = b.Get8();
            if (b.short_read)
                return Error(ErrorKind::TruncatedFile, "font info record is truncated");
            has_metrics = true;
            continue;
        }
        detail::Buf raw = b.Take(r.length);
        if (b.short_read)
            return Error(ErrorKind::TruncatedFile, "glyph data runs past the end of the file");
        StoreShape(r.index, raw);
    }
    return Error{};
}

// Shape bytes may open with a NUL-terminated shape name. Two zero bytes
// mean "no name"; a single zero is followed by a name candidate that is
// kept only when it looks like a legacy uppercase identifier.
inline void FontFile::StoreShape(uint16_t index, const detail::Buf& raw) {
    const uint8_t* p = raw.data;
    int n = raw.size;
    if (n >= 2 && p[0] == 0 && p[1] == 0) {
        p += 2;
        n -= 2;
    }
    else if (n >= 1 && p[0] == 0) {
        p += 1;
        n -= 1;
        int nul = -1;
        for (int i = 0; i < n; ++i) {
            if (p[i] == 0) { nul = i; break; }
        }
        if (nul >= 0) {
            bool is_name = true;
            for (int i = 0; i < nul && is_name; ++i)
                is_name = IsAliasChar(p[i]);
            if (is_name) {
                if (nul > 0)
                    aliases[std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(nul))] = index;
                p += nul + 1;
                n -= nul + 1;
            }
            else {
                spdlog::trace("ShxFont: shape {} has no name", index);
            }
        }
    }
    Program& prog = glyphs[index];
    if (n > 0) prog.assign(p, p + n);
    else       prog.clear();
}

inline Error FontFile::ReadBigFont(detail::Buf& b) {
    struct Ref { uint16_t index, length; uint32_t offset; };

    uint32_t count = b.Get16();
    uint32_t length = b.Get16();
    uint32_t change_count = b.Get16();
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "bigfont table header is truncated");
    spdlog::debug("ShxFont: parsing bigfont: count={}, length={}, change_count={}",
        count, length, change_count);

    // escape-byte ranges of the double byte encoding; lookups are by
    // full glyph number so these are not needed
    for (uint32_t i = 0; i < change_count; ++i) {
        b.Get16();
        b.Get16();
    }

    std::vector<Ref> refs;
    refs.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Ref r;
        r.index = static_cast<uint16_t>(b.Get16());
        r.length = static_cast<uint16_t>(b.Get16());
        r.offset = b.Get32();
        refs.push_back(r);
    }
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "bigfont index table is truncated");

    for (const Ref& r : refs) {
        b.Seek(r.offset > 0x7FFFFFFFu ? -1 : static_cast<int>(r.offset));
        if (r.index == 0) {
            above = b.Get8();
            below = b.Get8();
            modes = b.Get8();
            if (b.short_read)
                return Error(ErrorKind::TruncatedFile, "font info record is out of range");
            has_metrics = true;
            continue;
        }
        detail::Buf raw = b.Take(r.length);
        if (b.short_read)
            return Error(ErrorKind::TruncatedFile, "glyph data is out of range");
        glyphs[r.index].assign(raw.data, raw.data + raw.size);
    }
    return Error{};
}

inline Error FontFile::ReadUnifont(detail::Buf& b) {
    uint32_t count = b.Get32();
    uint32_t length = b.Get16();
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "unifont table header is truncated");

    b.Seek(5);
    font_name = ToString(b.TakeString());
    above = b.Get8();
    below = b.Get8();
    modes = b.Get8();
    encoding = b.Get8();
    embeddable = b.Get8();
    b.Get8(); // reserved
    if (b.short_read)
        return Error(ErrorKind::TruncatedFile, "font info record is truncated");
    has_metrics = true;
    spdlog::debug("ShxFont: parsing unifont: name={}, count={}, length={}", font_name, count, length);

    // the font info record is the first of `count`
    for (uint32_t i = 1; i < count; ++i) {
        uint16_t index = static_cast<uint16_t>(b.Get16());
        uint16_t n = static_cast<uint16_t>(b.Get16());
        detail::Buf raw = b.Take(n);
        if (b.short_read)
            return Error(ErrorKind::TruncatedFile, "glyph record runs past the end of the file");
        glyphs[index].assign(raw.data, raw.data + raw.size);
    }
    return Error{};
}
} // namespace stbshx
