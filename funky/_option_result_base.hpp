// _option_result_base.hpp

#pragma once

#include "_include.hpp"
#include "_detail.hpp"
#include "panic.hpp"
#include "debug/debug.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace funky {

namespace option {

namespace { struct do_not_use{}; }

struct Absent_t { constexpr explicit Absent_t(do_not_use, do_not_use) noexcept {} };
static constexpr Absent_t Absent{do_not_use{}, do_not_use{}};

template<class T>
struct Present { T value; };

namespace detail {

template <class T, class U>
using enable_forward_value_t = std::enable_if_t<
    std::is_convertible_v<U&&, T> &&
    !std::is_same_v<funky::detail::remove_cvref_t<U>, Option<T>> &&
    !std::is_same_v<funky::detail::remove_cvref_t<U>, Present<T>> &&
    !funky::detail::is_absent_marker_v<U>>;

} // namespace detail
} // namespace option

namespace result {

template<class T> struct Success { T value; };
template<class R> struct Failure { R reason; };
template<class R> struct Failures { std::vector<R> reasons; };

/// Reason used wherever a failure has to be made up without the caller
/// naming one: normalizing Absent/nullptr, failure<R>(), to_result<R>().
/// Specialize for your own reason types.
template<class R>
struct reason_traits {
    static R not_found() { return R{}; }
};

template<>
struct reason_traits<std::string> {
    static std::string not_found() { return "enoent"; }
};

namespace detail {

template <class X> struct is_tag_impl : std::false_type {};
template <class T> struct is_tag_impl<Success<T>> : std::true_type {};
template <class R> struct is_tag_impl<Failure<R>> : std::true_type {};
template <class R> struct is_tag_impl<Failures<R>> : std::true_type {};
template <class X> static constexpr bool is_tag_v = is_tag_impl<funky::detail::remove_cvref_t<X>>::value;

template <class T, class R, class U>
using enable_forward_value_t = std::enable_if_t<
    std::is_convertible_v<U&&, T> &&
    !std::is_same_v<funky::detail::remove_cvref_t<U>, Result<T, R>> &&
    !is_tag_v<U> &&
    !funky::detail::is_absent_marker_v<U>>;

} // namespace detail
} // namespace result

// ------------------------------------------------------------------------------------------
// Option

namespace option {

template<class T>
class Option {
public:
    using value_type = T;
private:

    static_assert(!funky::detail::is_absent_marker_v<value_type>,
                  "instantiation of Option with Absent_t or std::nullptr_t is ill-formed");
    static_assert(!std::is_reference_v<value_type>,
                  "instantiation of Option with a reference type is ill-formed");
    static_assert(!std::is_void_v<value_type>,
                  "instantiation of Option with void is ill-formed");
    static_assert(!std::is_array_v<value_type>,
                  "instantiation of Option with an array type is ill-formed");
    static_assert(std::is_destructible_v<value_type>,
                  "instantiation of Option with a non-destructible type is ill-formed");

    std::variant<Absent_t, Present<T>> storage_;

public:
    // constructors
    constexpr Option() noexcept : storage_(std::in_place_index<0>, Absent) {}

    constexpr Option(Absent_t) noexcept : storage_(std::in_place_index<0>, Absent) {}

    constexpr Option(Present<T> const& p) : storage_(std::in_place_index<1>, p) {}
    constexpr Option(Present<T>&& p) : storage_(std::in_place_index<1>, std::move(p)) {}

    template <class U = T, detail::enable_forward_value_t<T, U>* = nullptr>
    constexpr Option(U&& u)
        : storage_(std::in_place_index<1>, Present<T>{static_cast<T>(std::forward<U>(u))})
    {}

    constexpr Option(Option const& rhs) = default;
    constexpr Option(Option&& rhs) = default;

    Option& operator=(Option const& rhs) = default;
    Option& operator=(Option&& rhs) = default;

    // dispatch
    template<class OnPresent, class OnAbsent>
    constexpr auto dispatch(OnPresent&& on_present, OnAbsent&& on_absent) const& {
        static_assert(std::is_invocable_v<OnPresent, T const&>,
            "const& overload of funky::Option<T>::dispatch requires OnPresent to be invocable by a T const&");
        static_assert(std::is_invocable_v<OnAbsent>,
            "funky::Option<T>::dispatch requires OnAbsent to be invocable with no arguments");
        using Ret = std::common_type_t<std::invoke_result_t<OnPresent, T const&>, std::invoke_result_t<OnAbsent>>;
        return std::visit(funky::detail::overloaded{
            [&](Present<T> const& p) -> Ret { return std::invoke(std::forward<OnPresent>(on_present), p.value); },
            [&](Absent_t) -> Ret { return std::invoke(std::forward<OnAbsent>(on_absent)); }
        }, storage_);
    }

    template<class OnPresent, class OnAbsent>
    constexpr auto dispatch(OnPresent&& on_present, OnAbsent&& on_absent) && {
        static_assert(std::is_invocable_v<OnPresent, T&&>,
            "&& overload of funky::Option<T>::dispatch requires OnPresent to be invocable by a T&&");
        static_assert(std::is_invocable_v<OnAbsent>,
            "funky::Option<T>::dispatch requires OnAbsent to be invocable with no arguments");
        using Ret = std::common_type_t<std::invoke_result_t<OnPresent, T&&>, std::invoke_result_t<OnAbsent>>;
        return std::visit(funky::detail::overloaded{
            [&](Present<T>&& p) -> Ret { return std::invoke(std::forward<OnPresent>(on_present), std::move(p.value)); },
            [&](Absent_t) -> Ret { return std::invoke(std::forward<OnAbsent>(on_absent)); }
        }, std::move(storage_));
    }

    // is_present
    [[nodiscard]] constexpr bool is_present() const noexcept {
        return dispatch([](T const&) noexcept { return true; }, []() noexcept { return false; });
    }

    // is_absent
    [[nodiscard]] constexpr bool is_absent() const noexcept {
        return !is_present();
    }

    // operator bool
    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_present();
    }

    // get_value_or_fail
    [[nodiscard]] constexpr T get_value_or_fail() const& {
        return dispatch([](T const& v) -> T { return v; },
                        []() -> T { funky::panic<NotFound>("funky::Option::get_value_or_fail called on an absent option"); });
    }

    [[nodiscard]] constexpr T get_value_or_fail() && {
        return std::move(*this).dispatch(
            [](T&& v) -> T { return std::move(v); },
            []() -> T { funky::panic<NotFound>("funky::Option::get_value_or_fail called on an absent option"); });
    }

    // bind
    template<class Fn>
    [[nodiscard]] constexpr auto bind(Fn&& fn) const& {
        static_assert(std::is_invocable_v<Fn, T const&>,
            "const& overload of funky::Option<T>::bind(Fn) requires Fn to be invocable by a T const&");
        using Res = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T const&>>;
        static_assert(funky::detail::is_option_v<Res>,
            "funky::Option<T>::bind(Fn) requires Fn's return type to be an Option");
        return dispatch([&](T const& v) -> Res { return std::invoke(std::forward<Fn>(fn), v); },
                        []() -> Res { return Absent; });
    }

    template<class Fn>
    [[nodiscard]] constexpr auto bind(Fn&& fn) && {
        static_assert(std::is_invocable_v<Fn, T&&>,
            "&& overload of funky::Option<T>::bind(Fn) requires Fn to be invocable by a T&&");
        using Res = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T&&>>;
        static_assert(funky::detail::is_option_v<Res>,
            "funky::Option<T>::bind(Fn) requires Fn's return type to be an Option");
        return std::move(*this).dispatch(
            [&](T&& v) -> Res { return std::invoke(std::forward<Fn>(fn), std::move(v)); },
            []() -> Res { return Absent; });
    }

    // map
    template<class Fn>
    [[nodiscard]] constexpr auto map(Fn&& fn) const& {
        static_assert(std::is_invocable_v<Fn, T const&>,
            "const& overload of funky::Option<T>::map(Fn) requires Fn to be invocable by a T const&");
        using U = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T const&>>;
        static_assert(!std::is_void_v<U>, "funky::Option<T>::map(Fn) requires Fn to return a value");
        return dispatch([&](T const& v) { return Option<U>{Present<U>{std::invoke(std::forward<Fn>(fn), v)}}; },
                        []() { return Option<U>{Absent}; });
    }

    template<class Fn>
    [[nodiscard]] constexpr auto map(Fn&& fn) && {
        static_assert(std::is_invocable_v<Fn, T&&>,
            "&& overload of funky::Option<T>::map(Fn) requires Fn to be invocable by a T&&");
        using U = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T&&>>;
        static_assert(!std::is_void_v<U>, "funky::Option<T>::map(Fn) requires Fn to return a value");
        return std::move(*this).dispatch(
            [&](T&& v) { return Option<U>{Present<U>{std::invoke(std::forward<Fn>(fn), std::move(v))}}; },
            []() { return Option<U>{Absent}; });
    }

    // exists
    template<class Pred>
    [[nodiscard]] constexpr bool exists(Pred&& pred) const {
        static_assert(std::is_invocable_r_v<bool, Pred, T const&>,
            "funky::Option<T>::exists(Pred) requires Pred to be invocable with T const& and return a bool");
        return dispatch([&](T const& v) -> bool { return std::invoke(std::forward<Pred>(pred), v); },
                        []() { return false; });
    }

    // filter
    template<class Pred>
    [[nodiscard]] constexpr Option filter(Pred&& pred) const& {
        return exists(std::forward<Pred>(pred)) ? *this : Option{Absent};
    }

    template<class Pred>
    [[nodiscard]] constexpr Option filter(Pred&& pred) && {
        return exists(std::forward<Pred>(pred)) ? std::move(*this) : Option{Absent};
    }

    // fold
    template<class Fn, class Acc>
    [[nodiscard]] constexpr Acc fold(Fn&& fn, Acc initial) const {
        static_assert(std::is_invocable_r_v<Acc, Fn, Acc, T const&>,
            "funky::Option<T>::fold(Fn, Acc) requires Fn to be invocable with (Acc, T const&) and return an Acc");
        return dispatch([&](T const& v) -> Acc { return std::invoke(std::forward<Fn>(fn), std::move(initial), v); },
                        [&]() -> Acc { return std::move(initial); });
    }

    // count
    [[nodiscard]] constexpr std::size_t count() const noexcept {
        return dispatch([](T const&) noexcept -> std::size_t { return 1; },
                        []() noexcept -> std::size_t { return 0; });
    }

    // flatten: removes one Option layer, if there is one to remove
    [[nodiscard]] constexpr auto flatten() const& {
        if constexpr (funky::detail::is_option_v<T>)
            return dispatch([](T const& inner) -> T { return inner; }, []() -> T { return Absent; });
        else
            return *this;
    }

    [[nodiscard]] constexpr auto flatten() && {
        if constexpr (funky::detail::is_option_v<T>)
            return std::move(*this).dispatch([](T&& inner) -> T { return std::move(inner); },
                                             []() -> T { return Absent; });
        else
            return std::move(*this);
    }

    // flatten_all: removes every Option layer down to the innermost payload
    [[nodiscard]] constexpr Option<funky::detail::innermost_t<T>> flatten_all() const& {
        if constexpr (funky::detail::option_depth_v<T> > 0)
            return flatten().flatten_all();
        else
            return *this;
    }

    [[nodiscard]] constexpr Option<funky::detail::innermost_t<T>> flatten_all() && {
        if constexpr (funky::detail::option_depth_v<T> > 0)
            return std::move(*this).flatten().flatten_all();
        else
            return std::move(*this);
    }

    // to_result
    template<class R>
    [[nodiscard]] result::Result<T, std::decay_t<R>> to_result(R&& reason) const&;

    template<class R>
    [[nodiscard]] result::Result<T, std::decay_t<R>> to_result(R&& reason) &&;

    template<class R>
    [[nodiscard]] result::Result<T, R> to_result() const&;

    template<class R>
    [[nodiscard]] result::Result<T, R> to_result() &&;
};

} // namespace option

// ------------------------------------------------------------------------------------------
// Result

namespace result {

template<class T, class R>
class Result {
public:
    using value_type = T;
    using reason_type = R;
    using reasons_type = std::vector<R>;
private:

    static_assert(!funky::detail::is_absent_marker_v<value_type>,
                  "instantiation of Result with Absent_t or std::nullptr_t as value is ill-formed");
    static_assert(!std::is_reference_v<value_type> && !std::is_reference_v<reason_type>,
                  "instantiation of Result with a reference type is ill-formed");
    static_assert(!std::is_void_v<value_type> && !std::is_void_v<reason_type>,
                  "instantiation of Result with void is ill-formed");
    static_assert(!detail::is_tag_v<value_type>,
                  "instantiation of Result with a Success/Failure/Failures value is ill-formed");

    using storage_type = std::variant<Success<T>, Failure<R>, Failures<R>>;
    storage_type storage_;

    // A one-element reason list is kept as a single-reason failure.
    static storage_type canonical(Failures<R>&& f) {
        if (f.reasons.size() == 1)
            return storage_type{std::in_place_index<1>, Failure<R>{std::move(f.reasons.front())}};
        return storage_type{std::in_place_index<2>, std::move(f)};
    }

    template<class G>
    static Failures<R> convert(Failures<G>&& f) {
        if constexpr (std::is_same_v<G, R>)
            return std::move(f);
        else
            return Failures<R>{reasons_type(std::make_move_iterator(f.reasons.begin()),
                                            std::make_move_iterator(f.reasons.end()))};
    }

public:
    // constructors
    Result(option::Absent_t)
        : storage_(std::in_place_index<1>, Failure<R>{reason_traits<R>::not_found()})
    {}

    template<class U, std::enable_if_t<std::is_convertible_v<U&&, T>>* = nullptr>
    Result(Success<U>&& s)
        : storage_(std::in_place_index<0>, Success<T>{static_cast<T>(std::move(s.value))})
    {}

    template<class U, std::enable_if_t<std::is_convertible_v<U const&, T>>* = nullptr>
    Result(Success<U> const& s)
        : storage_(std::in_place_index<0>, Success<T>{static_cast<T>(s.value)})
    {}

    template<class G, std::enable_if_t<std::is_convertible_v<G&&, R>>* = nullptr>
    Result(Failure<G>&& f)
        : storage_(std::in_place_index<1>, Failure<R>{static_cast<R>(std::move(f.reason))})
    {}

    template<class G, std::enable_if_t<std::is_convertible_v<G const&, R>>* = nullptr>
    Result(Failure<G> const& f)
        : storage_(std::in_place_index<1>, Failure<R>{static_cast<R>(f.reason)})
    {}

    template<class G, std::enable_if_t<std::is_constructible_v<R, G&&>>* = nullptr>
    Result(Failures<G>&& f)
        : storage_(canonical(convert(std::move(f))))
    {}

    template<class G, std::enable_if_t<std::is_constructible_v<R, G const&>>* = nullptr>
    Result(Failures<G> const& f)
        : Result(Failures<G>(f))
    {}

    template <class U = T, detail::enable_forward_value_t<T, R, U>* = nullptr>
    Result(U&& u)
        : storage_(std::in_place_index<0>, Success<T>{static_cast<T>(std::forward<U>(u))})
    {}

    Result(Result const& rhs) = default;
    Result(Result&& rhs) = default;

    Result& operator=(Result const& rhs) = default;
    Result& operator=(Result&& rhs) = default;

    // normalize
    template<class Raw>
    [[nodiscard]] static Result normalize(Raw&& raw) {
        using Raw_t = funky::detail::remove_cvref_t<Raw>;
        Result res = [&]() -> Result {
            if constexpr (funky::detail::is_absent_marker_v<Raw_t>)
                return Result{option::Absent};
            else
                return Result(std::forward<Raw>(raw));
        }();
        FUNKY_DEBUG_ASSERT(res.storage_.index() != 2 || std::get<2>(res.storage_).reasons.size() != 1);
        return res;
    }

    // dispatch
    // A single-reason failure is handed over as a fresh one-element vector,
    // so every dispatch on a Failure allocates, including the predicates below.
    template<class OnSuccess, class OnFailure>
    auto dispatch(OnSuccess&& on_success, OnFailure&& on_failure) const& {
        static_assert(std::is_invocable_v<OnSuccess, T const&>,
            "const& overload of funky::Result<T, R>::dispatch requires OnSuccess to be invocable by a T const&");
        static_assert(std::is_invocable_v<OnFailure, reasons_type const&>,
            "const& overload of funky::Result<T, R>::dispatch requires OnFailure to be invocable by a std::vector<R> const&");
        using Ret = std::common_type_t<std::invoke_result_t<OnSuccess, T const&>,
                                       std::invoke_result_t<OnFailure, reasons_type const&>>;
        return std::visit(funky::detail::overloaded{
            [&](Success<T> const& s) -> Ret { return std::invoke(std::forward<OnSuccess>(on_success), s.value); },
            [&](Failure<R> const& f) -> Ret { return std::invoke(std::forward<OnFailure>(on_failure), reasons_type{f.reason}); },
            [&](Failures<R> const& f) -> Ret { return std::invoke(std::forward<OnFailure>(on_failure), f.reasons); }
        }, storage_);
    }

    template<class OnSuccess, class OnFailure>
    auto dispatch(OnSuccess&& on_success, OnFailure&& on_failure) && {
        static_assert(std::is_invocable_v<OnSuccess, T&&>,
            "&& overload of funky::Result<T, R>::dispatch requires OnSuccess to be invocable by a T&&");
        static_assert(std::is_invocable_v<OnFailure, reasons_type&&>,
            "&& overload of funky::Result<T, R>::dispatch requires OnFailure to be invocable by a std::vector<R>&&");
        using Ret = std::common_type_t<std::invoke_result_t<OnSuccess, T&&>,
                                       std::invoke_result_t<OnFailure, reasons_type&&>>;
        return std::visit(funky::detail::overloaded{
            [&](Success<T>&& s) -> Ret { return std::invoke(std::forward<OnSuccess>(on_success), std::move(s.value)); },
            [&](Failure<R>&& f) -> Ret { return std::invoke(std::forward<OnFailure>(on_failure), reasons_type{std::move(f.reason)}); },
            [&](Failures<R>&& f) -> Ret { return std::invoke(std::forward<OnFailure>(on_failure), std::move(f.reasons)); }
        }, std::move(storage_));
    }

    // is_success
    [[nodiscard]] bool is_success() const {
        return dispatch([](T const&) { return true; }, [](reasons_type const&) { return false; });
    }

    // is_failure
    [[nodiscard]] bool is_failure() const {
        return !is_success();
    }

    // operator bool
    [[nodiscard]] explicit operator bool() const {
        return is_success();
    }

    // reasons
    [[nodiscard]] reasons_type reasons() const {
        return dispatch([](T const&) { return reasons_type{}; }, [](reasons_type const& rs) { return rs; });
    }

    // get_value_or_fail
    [[nodiscard]] T get_value_or_fail() const& {
        return dispatch([](T const& v) -> T { return v; },
                        [](reasons_type const&) -> T { funky::panic<NotFound>("funky::Result::get_value_or_fail called on a failed result"); });
    }

    [[nodiscard]] T get_value_or_fail() && {
        return std::move(*this).dispatch(
            [](T&& v) -> T { return std::move(v); },
            [](reasons_type&&) -> T { funky::panic<NotFound>("funky::Result::get_value_or_fail called on a failed result"); });
    }

    // bind
    template<class Fn>
    [[nodiscard]] auto bind(Fn&& fn) const& {
        static_assert(std::is_invocable_v<Fn, T const&>,
            "const& overload of funky::Result<T, R>::bind(Fn) requires Fn to be invocable by a T const&");
        using Res = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T const&>>;
        static_assert(funky::detail::is_result_v<Res>,
            "funky::Result<T, R>::bind(Fn) requires Fn's return type to be a Result<U, R>");
        static_assert(std::is_same_v<typename Res::reason_type, R>,
            "funky::Result<T, R>::bind(Fn) requires Fn's return type to keep the reason type R");
        return dispatch([&](T const& v) -> Res { return std::invoke(std::forward<Fn>(fn), v); },
                        [](reasons_type const& rs) -> Res { return Failures<R>{rs}; });
    }

    template<class Fn>
    [[nodiscard]] auto bind(Fn&& fn) && {
        static_assert(std::is_invocable_v<Fn, T&&>,
            "&& overload of funky::Result<T, R>::bind(Fn) requires Fn to be invocable by a T&&");
        using Res = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T&&>>;
        static_assert(funky::detail::is_result_v<Res>,
            "funky::Result<T, R>::bind(Fn) requires Fn's return type to be a Result<U, R>");
        static_assert(std::is_same_v<typename Res::reason_type, R>,
            "funky::Result<T, R>::bind(Fn) requires Fn's return type to keep the reason type R");
        return std::move(*this).dispatch(
            [&](T&& v) -> Res { return std::invoke(std::forward<Fn>(fn), std::move(v)); },
            [](reasons_type&& rs) -> Res { return Failures<R>{std::move(rs)}; });
    }

    // map
    template<class Fn>
    [[nodiscard]] auto map(Fn&& fn) const& {
        static_assert(std::is_invocable_v<Fn, T const&>,
            "const& overload of funky::Result<T, R>::map(Fn) requires Fn to be invocable by a T const&");
        using U = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T const&>>;
        static_assert(!std::is_void_v<U>, "funky::Result<T, R>::map(Fn) requires Fn to return a value");
        using Res = Result<U, R>;
        return dispatch([&](T const& v) -> Res { return Success<U>{std::invoke(std::forward<Fn>(fn), v)}; },
                        [](reasons_type const& rs) -> Res { return Failures<R>{rs}; });
    }

    template<class Fn>
    [[nodiscard]] auto map(Fn&& fn) && {
        static_assert(std::is_invocable_v<Fn, T&&>,
            "&& overload of funky::Result<T, R>::map(Fn) requires Fn to be invocable by a T&&");
        using U = funky::detail::remove_cvref_t<std::invoke_result_t<Fn, T&&>>;
        static_assert(!std::is_void_v<U>, "funky::Result<T, R>::map(Fn) requires Fn to return a value");
        using Res = Result<U, R>;
        return std::move(*this).dispatch(
            [&](T&& v) -> Res { return Success<U>{std::invoke(std::forward<Fn>(fn), std::move(v))}; },
            [](reasons_type&& rs) -> Res { return Failures<R>{std::move(rs)}; });
    }

    // to_option
    [[nodiscard]] option::Option<T> to_option() const&;
    [[nodiscard]] option::Option<T> to_option() &&;
};

} // namespace result
} // namespace funky
