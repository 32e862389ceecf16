/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Selects std::format when the standard library ships it (detected via
 * the __cpp_lib_format feature test macro) and falls back to the fmt
 * library otherwise.
 *
 * Usage:
 *   #include <recall/compat/format.hpp>
 *   auto s = recall::compat::format("{} cards due", count);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define RECALL_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define RECALL_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define RECALL_HAS_STD_FORMAT 1
#else
    #define RECALL_HAS_STD_FORMAT 0
#endif

#if RECALL_HAS_STD_FORMAT
    #include <format>
    namespace recall::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace recall::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
