// Unit tests for the log-and-abort panic mode, built with FUNKY_PANIC_SHOULD_ABORT
#include <criterion/criterion.h>

#include <csignal>
#include <string>

#include "funky/option.hpp"
#include "funky/result.hpp"

using namespace funky::option;
using namespace funky::result;

Test(abort_mode, absent_option_aborts, .signal = SIGABRT) {
    (void)absent<int>().get_value_or_fail();
}

Test(abort_mode, failed_result_aborts, .signal = SIGABRT) {
    Result<int, std::string> r = failure(std::string("boom"));
    (void)r.get_value_or_fail();
}

Test(abort_mode, present_values_do_not_abort) {
    cr_assert_eq(present(3).get_value_or_fail(), 3);
    Result<int, std::string> r = success(4);
    cr_assert_eq(r.get_value_or_fail(), 4);
}
