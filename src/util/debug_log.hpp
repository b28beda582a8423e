#pragma once
/// @file debug_log.hpp
/// @brief Tagged diagnostic lines on stderr, silent in release builds

#include <cstdarg>
#include <cstdio>

namespace tachy {

/// Writes one "[tachy] "-prefixed line to `out`
inline void vwrite_log(std::FILE* out, const char* fmt, std::va_list args) {
    std::fputs("[tachy] ", out);
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

inline void write_log(std::FILE* out, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vwrite_log(out, fmt, args);
    va_end(args);
}

/// printf-style diagnostic on stderr; does nothing when NDEBUG is defined
inline void debug_log([[maybe_unused]] const char* fmt, ...) {
#ifndef NDEBUG
    std::va_list args;
    va_start(args, fmt);
    vwrite_log(stderr, fmt, args);
    va_end(args);
#endif
}

} // namespace tachy
