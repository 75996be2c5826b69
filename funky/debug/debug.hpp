// debug.hpp

#pragma once

#include "../_include.hpp"

#ifdef FUNKY_DEBUG

#include "../panic.hpp"

#include <string>

namespace funky {

inline void debug_assert(bool const b, char const* expr, char const* file, int const line) {
    if (!b) FUNKY_ATTR_UNLIKELY
        panic(std::string(file) + ':' + std::to_string(line) + ": funky::debug_assert(" + expr + ") failed");
}

} // namespace funky

#define FUNKY_DEBUG_ASSERT(cond) \
    ::funky::debug_assert(static_cast<bool>(cond), #cond, __FILE__, __LINE__)

#else // FUNKY_DEBUG

#define FUNKY_DEBUG_ASSERT(cond) (static_cast<void>(0))

#endif // FUNKY_DEBUG
