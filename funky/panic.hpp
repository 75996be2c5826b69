// panic.hpp

#pragma once

#include "_include.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace funky {

/// Base of every fault raised by funky::panic.
/// Faults signal a broken caller precondition and never travel through
/// the reason channel of a Result.
class Panic : public std::logic_error {
public:
    explicit Panic(std::string const& msg) : std::logic_error(msg) {}
    explicit Panic(char const* msg) : std::logic_error(msg) {}
};

/// Raised by get_value_or_fail() on an absent Option or a failed Result.
class NotFound : public Panic {
public:
    explicit NotFound(std::string const& msg) : Panic(msg) {}
    explicit NotFound(char const* msg) : Panic(msg) {}
};

template<class Fault = Panic, class Msg>
[[noreturn]] void panic(Msg&& msg) {
    static_assert(std::is_base_of_v<Panic, Fault>,
                  "funky::panic<Fault>(Msg) requires Fault to derive from funky::Panic");
#if FUNKY_PANIC_LOGS
    std::cerr << "funky::panic: " << msg << '\n';
#endif
#ifdef FUNKY_PANIC_SHOULD_ABORT
    std::abort();
#else // FUNKY_PANIC_SHOULD_ABORT
    throw Fault(std::forward<Msg>(msg));
#endif // FUNKY_PANIC_SHOULD_ABORT
}

} // namespace funky
