// result.hpp

#pragma once

#include "_include.hpp"
#include "_detail.hpp"
#include "_option_result_base.hpp"
#include "option.hpp"
#include "panic.hpp"

#include <algorithm>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <vector>

namespace funky {
namespace result {

// Result<T, R>::to_option
template<class T, class R>
[[nodiscard]] option::Option<T> Result<T, R>::to_option() const& {
    return dispatch([](T const& v) { return option::Option<T>{option::Present<T>{v}}; },
                    [](reasons_type const&) { return option::Option<T>{option::Absent}; });
}

template<class T, class R>
[[nodiscard]] option::Option<T> Result<T, R>::to_option() && {
    return std::move(*this).dispatch(
        [](T&& v) { return option::Option<T>{option::Present<T>{std::move(v)}}; },
        [](reasons_type&&) { return option::Option<T>{option::Absent}; });
}

// success
template<class V>
[[nodiscard]] inline constexpr Success<std::decay_t<V>> success(V&& v) {
    return Success<std::decay_t<V>>{std::forward<V>(v)};
}

// failure
template<class R>
[[nodiscard]] inline Failure<std::decay_t<R>> failure(R&& reason) {
    return Failure<std::decay_t<R>>{std::forward<R>(reason)};
}

template<class R>
[[nodiscard]] inline Failure<R> failure() {
    return Failure<R>{reason_traits<R>::not_found()};
}

// failures: collapses to a single-reason failure once it becomes a Result
template<class R>
[[nodiscard]] inline Failures<R> failures(std::vector<R> reasons) {
    return Failures<R>{std::move(reasons)};
}

template<class R>
[[nodiscard]] inline Failures<R> failures(std::initializer_list<R> reasons) {
    return Failures<R>{std::vector<R>(reasons)};
}

/// Canonical Result for any raw input:
///   Absent / nullptr             -> Failure{reason_traits<R>::not_found()}
///   Success / Failure / Result   -> unchanged
///   Failures{r}                  -> Failure{r}
///   Failures{} / Failures{r...}  -> unchanged
///   anything convertible to T    -> Success{value}
template<class T, class R, class Raw>
[[nodiscard]] inline Result<T, R> normalize(Raw&& raw) {
    return Result<T, R>::normalize(std::forward<Raw>(raw));
}

template<class T, class R>
[[nodiscard]] inline Result<T, R> normalize(Result<T, R> const& raw) {
    return Result<T, R>::normalize(raw);
}

template <class T, class R, class U, class G>
[[nodiscard]] inline bool operator==(Result<T, R> const& lhs, Result<U, G> const& rhs) {
    return lhs.dispatch(
        [&](T const& l) {
            return rhs.dispatch([&](U const& r) { return bool(l == r); },
                                [](std::vector<G> const&) { return false; });
        },
        [&](std::vector<R> const& ls) {
            return rhs.dispatch([](U const&) { return false; },
                                [&](std::vector<G> const& rs) {
                                    return std::equal(ls.begin(), ls.end(), rs.begin(), rs.end());
                                });
        });
}
template <class T, class R, class U, class G>
[[nodiscard]] inline bool operator!=(Result<T, R> const& lhs, Result<U, G> const& rhs) {
    return !(lhs == rhs);
}

} // namespace result
} // namespace funky
