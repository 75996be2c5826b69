// _include.hpp

#pragma once

#if defined(_MSVC_LANG)
    #define FUNKY_CPLUSPLUS _MSVC_LANG
#else
    #define FUNKY_CPLUSPLUS __cplusplus
#endif

#if FUNKY_CPLUSPLUS < 201703L
    #error "funky requires C++17 or newer"
#endif

// [[unlikely]] is C++20; older compilers get no hint.
#if __has_cpp_attribute(unlikely)
    #define FUNKY_ATTR_UNLIKELY [[unlikely]]
#else
    #define FUNKY_ATTR_UNLIKELY
#endif

// FUNKY_DEBUG              - enable debug_assert checks and panic logging
// FUNKY_PANIC_SHOULD_ABORT - log and std::abort() on panic instead of throwing
#if defined(FUNKY_PANIC_SHOULD_ABORT) || defined(FUNKY_DEBUG)
    #define FUNKY_PANIC_LOGS 1
#else
    #define FUNKY_PANIC_LOGS 0
#endif
