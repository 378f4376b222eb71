/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Gives the transfer engine one formatting entry point regardless of
 * whether the standard library ships <format>.
 *
 * Usage:
 *   #include <xnat/compat/format.hpp>
 *   auto s = xnat::compat::format("batch {} of {}", i, n);
 */

#pragma once

#include <version>

// __cpp_lib_format is authoritative for libstdc++ and libc++; Apple Clang 15+
// ships a usable <format> without always advertising it.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define XNAT_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define XNAT_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define XNAT_HAS_STD_FORMAT 1
#else
    #define XNAT_HAS_STD_FORMAT 0
#endif

#if XNAT_HAS_STD_FORMAT
    #include <format>
    namespace xnat::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace xnat::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
