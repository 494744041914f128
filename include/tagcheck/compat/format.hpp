/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Selects std::format when the standard library ships it and falls back to
 * the fmt library otherwise. Detection is based on the __cpp_lib_format
 * feature test macro.
 *
 * Usage:
 *   #include <tagcheck/compat/format.hpp>
 *   auto s = tagcheck::compat::format("{} findings", count);
 */

#pragma once

#include <version>

// libstdc++ needs GCC 13+ for std::format, so non-Apple Clang on Linux is
// covered by __cpp_lib_format alone.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define TAGCHECK_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define TAGCHECK_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define TAGCHECK_HAS_STD_FORMAT 1
#else
    #define TAGCHECK_HAS_STD_FORMAT 0
#endif

#if TAGCHECK_HAS_STD_FORMAT
    #include <format>
    namespace tagcheck::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace tagcheck::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
