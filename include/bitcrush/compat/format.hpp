/**
 * @file format.hpp
 * @brief std::format / fmt::format selection for log and error messages
 *
 * Usage:
 *   #include <bitcrush/compat/format.hpp>
 *   auto s = bitcrush::compat::format("src: /images/{}.jpg", id);
 */

#pragma once

#include <version>

// __cpp_lib_format is the only reliable signal on libstdc++ (GCC 13+);
// Apple Clang 15+ ships std::format without always defining it.
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define BITCRUSH_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define BITCRUSH_HAS_STD_FORMAT 1
#else
    #define BITCRUSH_HAS_STD_FORMAT 0
#endif

#if BITCRUSH_HAS_STD_FORMAT
    #include <format>
    namespace bitcrush::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace bitcrush::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
