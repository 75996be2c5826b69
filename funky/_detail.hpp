// _detail.hpp

#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace funky {

namespace option { template<class T> class Option; struct Absent_t; }
namespace result { template<class T, class R> class Result; }

namespace detail {

// struct overloaded used by the dispatch functions
template<class... Fns> struct overloaded : Fns... { using Fns::operator()...; };
template<class... Fns> overloaded(Fns...) -> overloaded<Fns...>;

// C++20's remove_cvref
template<class T>
struct remove_cvref {
    using type = std::remove_cv_t<std::remove_reference_t<T>>;
};

template<class T>
using remove_cvref_t = typename remove_cvref<T>::type;

// Trait for checking if a type is a funky::option::Option
template <class T> struct is_option_impl : std::false_type {};
template <class T> struct is_option_impl<option::Option<T>> : std::true_type {};
template <class T> using is_option = is_option_impl<remove_cvref_t<T>>;
template <class T> static constexpr bool is_option_v = is_option<T>::value;

// Trait for checking if a type is a funky::result::Result
template <class T> struct is_result_impl : std::false_type {};
template <class T, class R> struct is_result_impl<result::Result<T, R>> : std::true_type {};
template <class T> using is_result = is_result_impl<remove_cvref_t<T>>;
template <class T> static constexpr bool is_result_v = is_result<T>::value;

// Number of Option layers wrapped around a type: Option<Option<int>> -> 2
template <class T> struct option_depth : std::integral_constant<std::size_t, 0> {};
template <class T> struct option_depth<option::Option<T>>
    : std::integral_constant<std::size_t, option_depth<T>::value + 1> {};
template <class T> static constexpr std::size_t option_depth_v = option_depth<remove_cvref_t<T>>::value;

// Innermost payload of a nested Option: Option<Option<int>> -> int
template <class T> struct innermost { using type = T; };
template <class T> struct innermost<option::Option<T>> : innermost<T> {};
template <class T> using innermost_t = typename innermost<remove_cvref_t<T>>::type;

// Element type of anything std::begin/std::end accept
template <class C>
using range_value_t = remove_cvref_t<decltype(*std::begin(std::declval<C&>()))>;

// Marker types that may never be the payload of an Option or a Result
template <class T>
static constexpr bool is_absent_marker_v =
    std::is_same_v<remove_cvref_t<T>, option::Absent_t> ||
    std::is_same_v<remove_cvref_t<T>, std::nullptr_t>;

} // namespace detail
} // namespace funky
