// option.hpp

#pragma once

#include "_include.hpp"
#include "_detail.hpp"
#include "_option_result_base.hpp"
#include "panic.hpp"
#include "result.hpp"

#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>

namespace funky {
namespace option {

// Option<T>::to_result
template<class T>
template<class R>
[[nodiscard]] result::Result<T, std::decay_t<R>> Option<T>::to_result(R&& reason) const& {
    using Res = result::Result<T, std::decay_t<R>>;
    return dispatch([](T const& v) -> Res { return result::Success<T>{v}; },
                    [&]() -> Res { return result::Failure<std::decay_t<R>>{std::forward<R>(reason)}; });
}

template<class T>
template<class R>
[[nodiscard]] result::Result<T, std::decay_t<R>> Option<T>::to_result(R&& reason) && {
    using Res = result::Result<T, std::decay_t<R>>;
    return std::move(*this).dispatch(
        [](T&& v) -> Res { return result::Success<T>{std::move(v)}; },
        [&]() -> Res { return result::Failure<std::decay_t<R>>{std::forward<R>(reason)}; });
}

template<class T>
template<class R>
[[nodiscard]] result::Result<T, R> Option<T>::to_result() const& {
    return to_result(result::reason_traits<R>::not_found());
}

template<class T>
template<class R>
[[nodiscard]] result::Result<T, R> Option<T>::to_result() && {
    return std::move(*this).to_result(result::reason_traits<R>::not_found());
}

// present
template<class V>
[[nodiscard]] inline constexpr Option<std::decay_t<V>> present(V&& v) {
    using T = std::decay_t<V>;
    return Option<T>{Present<T>{std::forward<V>(v)}};
}

// absent
template<class T>
[[nodiscard]] inline constexpr Option<T> absent() noexcept {
    return Absent;
}

/// True for any Option<U>, whatever its state. Everything else is not an
/// Option, including a bare value or nullptr.
template<class X>
[[nodiscard]] inline constexpr bool is_option_shape(X const&) noexcept {
    return funky::detail::is_option_v<X>;
}

/// Present with the first element of `xs`, or Absent when `xs` is empty.
template<class Container>
[[nodiscard]] inline constexpr auto list_first(Container const& xs) {
    using T = funky::detail::range_value_t<Container const>;
    auto first = std::begin(xs);
    if (first == std::end(xs))
        return Option<T>{Absent};
    return Option<T>{*first};
}

template<class T>
[[nodiscard]] inline constexpr Option<T> list_first(std::initializer_list<T> xs) {
    return xs.size() == 0 ? Option<T>{Absent} : Option<T>{*xs.begin()};
}

/// Present only when `xs` holds exactly one element.
template<class Container>
[[nodiscard]] inline constexpr auto list_single(Container const& xs) {
    using T = funky::detail::range_value_t<Container const>;
    auto first = std::begin(xs);
    auto last = std::end(xs);
    if (first == last || std::next(first) != last)
        return Option<T>{Absent};
    return Option<T>{*first};
}

template<class T>
[[nodiscard]] inline constexpr Option<T> list_single(std::initializer_list<T> xs) {
    return xs.size() == 1 ? Option<T>{*xs.begin()} : Option<T>{Absent};
}

/// Compares two Option objects. Options nested to different depths never
/// compare equal: Option<Option<int>> holding present(42) is not present(42).
template <class T, class U>
[[nodiscard]] inline constexpr bool operator==(Option<T> const& lhs, Option<U> const& rhs) {
    if constexpr (funky::detail::option_depth_v<T> != funky::detail::option_depth_v<U>)
        return false;
    else
        return lhs.dispatch(
            [&](T const& l) { return rhs.exists([&](U const& r) { return bool(l == r); }); },
            [&]() { return rhs.is_absent(); });
}
template <class T, class U>
[[nodiscard]] inline constexpr bool operator!=(Option<T> const& lhs, Option<U> const& rhs) {
    return !(lhs == rhs);
}

/// Compares an Option to `Absent`
template <class T>
[[nodiscard]] inline constexpr bool operator==(Option<T> const& lhs, Absent_t) noexcept {
    return lhs.is_absent();
}
template <class T>
[[nodiscard]] inline constexpr bool operator==(Absent_t, Option<T> const& rhs) noexcept {
    return rhs.is_absent();
}
template <class T>
[[nodiscard]] inline constexpr bool operator!=(Option<T> const& lhs, Absent_t) noexcept {
    return lhs.is_present();
}
template <class T>
[[nodiscard]] inline constexpr bool operator!=(Absent_t, Option<T> const& rhs) noexcept {
    return rhs.is_present();
}

/// Compares the Option with a bare value. Only a present, non-nested Option
/// holding an equal payload compares equal.
template <class T, class U, std::enable_if_t<!funky::detail::is_option_v<U> && !funky::detail::is_absent_marker_v<U>>* = nullptr>
[[nodiscard]] inline constexpr bool operator==(Option<T> const& lhs, U const& rhs) {
    if constexpr (funky::detail::is_option_v<T>)
        return false;
    else
        return lhs.exists([&](T const& l) { return bool(l == rhs); });
}
template <class T, class U, std::enable_if_t<!funky::detail::is_option_v<U> && !funky::detail::is_absent_marker_v<U>>* = nullptr>
[[nodiscard]] inline constexpr bool operator==(U const& lhs, Option<T> const& rhs) {
    return rhs == lhs;
}
template <class T, class U, std::enable_if_t<!funky::detail::is_option_v<U> && !funky::detail::is_absent_marker_v<U>>* = nullptr>
[[nodiscard]] inline constexpr bool operator!=(Option<T> const& lhs, U const& rhs) {
    return !(lhs == rhs);
}
template <class T, class U, std::enable_if_t<!funky::detail::is_option_v<U> && !funky::detail::is_absent_marker_v<U>>* = nullptr>
[[nodiscard]] inline constexpr bool operator!=(U const& lhs, Option<T> const& rhs) {
    return !(rhs == lhs);
}

} // namespace option
} // namespace funky
