// Unit tests for funky::option::Option
#include <criterion/criterion.h>

#include <list>
#include <string>
#include <type_traits>
#include <vector>

#include "funky/option.hpp"

using namespace funky::option;

namespace {

Option<int> half(int x) {
    if (x % 2 != 0)
        return Absent;
    return present(x / 2);
}

} // namespace

Test(option, present_holds_its_value) {
    auto o = present(42);
    cr_assert(o.is_present());
    cr_assert(!o.is_absent());
    cr_assert(bool(o));
    cr_assert_eq(o.get_value_or_fail(), 42);

    auto s = present(std::string("hello"));
    cr_assert(s.get_value_or_fail() == "hello");
}

Test(option, absent_is_absent) {
    auto o = absent<int>();
    cr_assert(o.is_absent());
    cr_assert(!o.is_present());
    cr_assert(!o);
    cr_assert(o == absent<int>());
    cr_assert(o == Absent);
    cr_assert(Option<int>{} == Absent, "a default constructed option is absent");
}

Test(option, get_value_or_fail_on_absent_raises_not_found) {
    Option<int> o = Absent;
    cr_assert_throw((void)o.get_value_or_fail(), funky::NotFound);
    cr_assert_throw((void)absent<std::string>().get_value_or_fail(), funky::Panic);
}

Test(option, is_option_shape) {
    cr_assert(is_option_shape(present(1)));
    cr_assert(is_option_shape(absent<int>()));
    cr_assert(is_option_shape(present(present(1))));
    cr_assert(!is_option_shape(42));
    cr_assert(!is_option_shape(nullptr));
    cr_assert(!is_option_shape(std::string("x")));
}

Test(option, dispatch_calls_exactly_one_handler) {
    int on_present = 0;
    int on_absent = 0;

    present(7).dispatch([&](int v) { on_present += v; }, [&]() { ++on_absent; });
    cr_assert_eq(on_present, 7);
    cr_assert_eq(on_absent, 0);

    absent<int>().dispatch([&](int v) { on_present += v; }, [&]() { ++on_absent; });
    cr_assert_eq(on_present, 7);
    cr_assert_eq(on_absent, 1);

    auto described = present(std::string("abc")).dispatch(
        [](std::string const& s) { return "present " + s; },
        []() { return std::string("absent"); });
    cr_assert(described == "present abc");
}

Test(option, map) {
    auto inc = [](int x) { return x + 1; };
    cr_assert(present(42).map(inc) == present(43));
    cr_assert(absent<int>().map(inc) == absent<int>());

    auto length = present(std::string("four")).map([](std::string const& s) { return s.size(); });
    static_assert(std::is_same_v<decltype(length), Option<std::size_t>>);
    cr_assert(length == present(std::size_t{4}));
}

Test(option, bind) {
    cr_assert(present(42).bind(half) == present(21));
    cr_assert(present(21).bind(half) == Absent, "the binder decides presence");
    cr_assert(absent<int>().bind(half) == Absent);

    cr_assert(present(8).bind(half).bind(half).bind(half) == present(1));
    cr_assert(present(8).bind(half).bind(half).bind(half).bind(half) == Absent);
}

Test(option, bind_on_absent_never_calls_the_binder) {
    int calls = 0;
    auto counted = [&](int x) { ++calls; return present(x); };
    auto out = absent<int>().bind(counted);
    cr_assert(out == Absent);
    cr_assert_eq(calls, 0);
}

Test(option, exists) {
    cr_assert(present(42).exists([](int) { return true; }));
    cr_assert(!present(42).exists([](int) { return false; }));
    cr_assert(!absent<int>().exists([](int) { return true; }));
}

Test(option, filter) {
    cr_assert(present(42).filter([](int x) { return x > 100; }) == Absent);
    cr_assert(present(42).filter([](int x) { return x > 0; }) == present(42));
    cr_assert(absent<int>().filter([](int) { return true; }) == Absent);
}

Test(option, fold) {
    auto add = [](int acc, int x) { return acc + x; };
    cr_assert_eq(present(32).fold(add, 10), 42);
    cr_assert_eq(absent<int>().fold(add, 10), 10);

    auto joined = present(std::string("b")).fold(
        [](std::string acc, std::string const& x) { return acc + x; }, std::string("a"));
    cr_assert(joined == "ab");
}

Test(option, count) {
    cr_assert_eq(present(32).count(), 1u);
    cr_assert_eq(absent<int>().count(), 0u);
}

Test(option, flatten_removes_exactly_one_level) {
    cr_assert(present(42).flatten() == present(42), "a flat option is left alone");
    auto nested = present(present(42)).flatten();
    static_assert(std::is_same_v<decltype(nested), Option<int>>);
    cr_assert(nested == present(42));
    cr_assert(absent<int>().flatten() == Absent);
    cr_assert(absent<Option<int>>().flatten() == absent<int>());
    cr_assert(present(absent<int>()).flatten() == absent<int>());

    auto triple = present(present(present(42)));
    auto once = triple.flatten();
    static_assert(std::is_same_v<decltype(once), Option<Option<int>>>);
    cr_assert(once == present(present(42)));
}

Test(option, flatten_all_removes_every_level) {
    static_assert(funky::detail::option_depth_v<Option<Option<Option<int>>>> == 3);

    auto all = present(present(present(42))).flatten_all();
    static_assert(std::is_same_v<decltype(all), Option<int>>);
    cr_assert(all == present(42));

    cr_assert(present(42).flatten_all() == present(42));
    cr_assert(absent<int>().flatten_all() == Absent);
    cr_assert(present(present(absent<int>())).flatten_all() == absent<int>(),
              "an absent layer at any depth short-circuits");
    cr_assert(present(absent<Option<int>>()).flatten_all() == absent<int>());
}

Test(option, list_first) {
    cr_assert(list_first(std::vector<int>{}) == Absent);
    cr_assert(list_first(std::vector<int>{1}) == present(1));
    cr_assert(list_first(std::vector<int>{1, 2, 3}) == present(1));
    cr_assert(list_first(std::list<std::string>{"a", "b"}) == present(std::string("a")));
    cr_assert(list_first({4, 5}) == present(4));
}

Test(option, list_single) {
    cr_assert(list_single(std::vector<int>{}) == Absent);
    cr_assert(list_single(std::vector<int>{1}) == present(1));
    cr_assert(list_single(std::vector<int>{1, 2}) == Absent);
    cr_assert(list_single(std::list<int>{1, 2, 3}) == Absent);
    cr_assert(list_single({9}) == present(9));
}

Test(option, comparisons) {
    cr_assert(present(1) == present(1));
    cr_assert(present(1) != present(2));
    cr_assert(present(1) != absent<int>());
    cr_assert(absent<int>() != present(1));
    cr_assert(present(1) == 1);
    cr_assert(1 == present(1));
    cr_assert(absent<int>() != 1);
    cr_assert(present(std::string("x")) == std::string("x"));
}

Test(option, nesting_depth_is_part_of_equality) {
    cr_assert(present(present(42)) != present(42));
    cr_assert(present(42) != present(present(42)));
    cr_assert(present(present(present(42))) != present(present(42)));
    cr_assert(present(present(42)) != 42);
    cr_assert(42 != present(present(42)));
    cr_assert(present(present(42)) == present(present(42)));
    cr_assert(present(absent<int>()) != absent<int>());

    auto unflattened = present(present(42));
    cr_assert(unflattened != present(42), "flatten has to remove a layer to reach present(42)");
}

Test(option, combinators_leave_the_input_untouched) {
    auto const original = present(std::string("keep"));
    auto mapped = original.map([](std::string const& s) { return s + "!"; });
    auto filtered = original.filter([](std::string const&) { return false; });
    cr_assert(original == present(std::string("keep")));
    cr_assert(mapped == present(std::string("keep!")));
    cr_assert(filtered == Absent);
}
