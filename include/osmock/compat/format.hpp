/**
 * @file format.hpp
 * @brief std::format with an fmt fallback
 *
 * Log helpers in osmock take std::format-style format strings. Toolchains
 * whose standard library lacks <format> (libstdc++ before GCC 13) build
 * against the fmt library instead.
 *
 * Usage:
 *   #include <osmock/compat/format.hpp>
 *   auto s = osmock::compat::format("listening on {}:{}", host, port);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define OSMOCK_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define OSMOCK_HAS_STD_FORMAT 1
#else
    #define OSMOCK_HAS_STD_FORMAT 0
#endif

#if OSMOCK_HAS_STD_FORMAT
    #include <format>
    namespace osmock::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace osmock::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
