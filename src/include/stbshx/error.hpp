#pragma once

#include <stdint.h>

namespace stbshx {
    enum class ErrorKind : uint8_t {
        None = 0,

        // container: the file is unusable
        InvalidHeader,
        UnknownVariant,
        TruncatedFile,
        DuplicateFontInfo,
        IoError,

        // interpreter: aborts one render call, the font stays valid
        DivideByZero,
        InvalidFactor,
        StackOverflow,
        StackUnderflow,
        UnresolvedSubshape,
        EmptyStream,
        RecursionLimit
    };

    static inline const char* ErrorKindName(ErrorKind kind) noexcept {
        switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::InvalidHeader:      return "InvalidHeader";
        case ErrorKind::UnknownVariant:     return "UnknownVariant";
        case ErrorKind::TruncatedFile:      return "TruncatedFile";
        case ErrorKind::DuplicateFontInfo:  return "DuplicateFontInfo";
        case ErrorKind::IoError:            return "IoError";
        case ErrorKind::DivideByZero:       return "DivideByZero";
        case ErrorKind::InvalidFactor:      return "InvalidFactor";
        case ErrorKind::StackOverflow:      return "StackOverflow";
        case ErrorKind::StackUnderflow:     return "StackUnderflow";
        case ErrorKind::UnresolvedSubshape: return "UnresolvedSubshape";
        case ErrorKind::EmptyStream:        return "EmptyStream";
        case ErrorKind::RecursionLimit:     return "RecursionLimit";
        default:                            return "Unknown";
        }
    }

    // Every parser and interpreter fault comes back as one of these, by
    // value. `message` always points at a string literal.
    struct Error {
        ErrorKind kind{ ErrorKind::None };
        const char* message{ "" };

        Error() noexcept = default;
        Error(ErrorKind kind_, const char* message_) noexcept
            : kind{ kind_ }, message{ message_ } {}

        inline bool Ok() const noexcept { return kind == ErrorKind::None; }
        explicit operator bool() const noexcept { return kind != ErrorKind::None; }
    };

    inline bool operator==(const Error& e, ErrorKind k) noexcept { return e.kind == k; }
    inline bool operator!=(const Error& e, ErrorKind k) noexcept { return e.kind != k; }
} // namespace stbshx
