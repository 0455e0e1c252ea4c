/**
 * @file log.hpp
 * @brief Diagnostic output for colpack.
 *
 * Messages are printf-style and go to stderr, one line each:
 *
 *     colpack [DEBUG] reading 4 bytes for 9 values of width 3
 *
 * Debug tracing is compiled out unless COLPACK_DEBUG=1. Warnings are
 * always compiled in; callers decide when to emit them.
 */

#ifndef COLPACK_LOG_HPP
#define COLPACK_LOG_HPP

#include "config.hpp"

#include <cstdio>

namespace colpack {
namespace detail {

/**
 * @brief Write one "colpack [LEVEL] message" line to a stream.
 *
 * @param out Destination stream
 * @param level Level tag
 * @param fmt printf format string
 * @param args Format arguments
 */
template <typename... Args>
inline void write_log_line(std::FILE* out, const char* level, const char* fmt,
                           Args... args) noexcept {
    std::fprintf(out, "colpack [%s] ", level);
    if constexpr (sizeof...(Args) == 0) {
        std::fputs(fmt, out);
    } else {
        std::fprintf(out, fmt, args...);
    }
    std::fputc('\n', out);
}

template <typename... Args>
inline void log_debug([[maybe_unused]] const char* fmt, [[maybe_unused]] Args... args) noexcept {
    if constexpr (COLPACK_DEBUG != 0) {
        write_log_line(stderr, "DEBUG", fmt, args...);
    }
}

template <typename... Args>
inline void log_warn(const char* fmt, Args... args) noexcept {
    write_log_line(stderr, "WARN", fmt, args...);
}

} // namespace detail
} // namespace colpack

#endif // COLPACK_LOG_HPP
