#include "common.hpp"

#include "utility/demangle.hpp"
#include "utility/exception.hpp"
#include "utility/filepath.hpp"
#include "utility/prettify.hpp"
#include "utility/replace.hpp"
#include "utility/time.hpp"
#include "utility/version.hpp"


// --- Time ---
// ------------

TEST_CASE("Time / Duration formatting") {
    using namespace fgp::time;

    CHECK(format_duration(milliseconds{1000}) == "1.00s");
    CHECK(format_duration(milliseconds{500}) == "500.00ms");
    CHECK(format_duration(microseconds{1500}) == "1.50ms");
    CHECK(format_duration(microseconds{250}) == "250.00μs");
    CHECK(format_duration(seconds{90}) == "90.00s");
}

TEST_CASE("Time / Formatter interprets values in the profile unit") {
    const auto ms = fgp::time::make_formatter(fgp::time_unit::milliseconds);
    const auto us = fgp::time::make_formatter(fgp::time_unit::microseconds);

    CHECK(ms(1000) == "1.00s");
    CHECK(ms(500) == "500.00ms");
    CHECK(ms(0.5) == "500.00μs");
    CHECK(us(1000) == "1.00ms");
    CHECK(us(12) == "12.00μs");
}

TEST_CASE("Time / Units") {
    CHECK(fgp::time::parse_unit("microseconds") == fgp::time_unit::microseconds);
    CHECK(fgp::time::parse_unit("milliseconds") == fgp::time_unit::milliseconds);
    CHECK_THROWS_AS(fgp::time::parse_unit("seconds"), fgp::invalid_trace_error);

    CHECK(fgp::time::to_string(fgp::time_unit::milliseconds) == "milliseconds");
}

TEST_CASE("Time / Percentage") {
    CHECK(fgp::time::to_percentage(1, 4) == 25);
    CHECK(fgp::time::to_percentage(1, 0) == 0);
}

// --- Symbols ---
// ---------------

TEST_CASE("Symbols / Demangling") {
    CHECK(fgp::symbol::is_mangled("_Z3fooi"));
    CHECK(fgp::symbol::is_mangled("__Z3fooi"));
    CHECK_FALSE(fgp::symbol::is_mangled("memcpy"));

    CHECK(fgp::symbol::try_demangle("_Z3fooi") == "foo(int)");
    CHECK(fgp::symbol::try_demangle("__Z3fooi") == "foo(int)");
    CHECK_FALSE(fgp::symbol::try_demangle("memcpy").has_value());

    CHECK_THROWS_AS(fgp::symbol::demangle("memcpy"), fgp::exception);
}

TEST_CASE("Symbols / Prettification") {
    CHECK(fgp::prettify::full("std::vector<int, std::allocator<int> >") == "std::vector<int>");
    CHECK(fgp::prettify::full("std::__1::basic_string<char, std::__1::char_traits<char>, std::__1::allocator<char> >") ==
          "std::string");
    CHECK(fgp::prettify::full("std::map<int,float> const &") == "std::map<int, float> const&");
    CHECK(fgp::prettify::full("foo[abi:cxx11](int)") == "foo(int)");
    CHECK(fgp::prettify::full("class app::widget *") == "app::widget*");
}

TEST_CASE("Symbols / Replacement") {
    std::string str = "a.b.c";
    fgp::replace_all(str, ".", "::");
    CHECK(str == "a::b::c");

    std::string nested = "> > > >";
    fgp::replace_all_dynamically(nested, "> >", ">>");
    CHECK(nested == ">>>>");

    std::string templ = "pool<int, alloc<int, other<char>>>";
    fgp::replace_all_template(templ, ", alloc<", "");
    CHECK(templ == "pool<int>");
}

// --- Filepaths ---
// -----------------

TEST_CASE("Filepath / Normalization") {
    CHECK(fgp::normalize_filepath("src/./main.cpp") == "src/main.cpp");
    CHECK(fgp::normalize_filepath("src/detail/../main.cpp") == "src/main.cpp");
    CHECK(fgp::normalize_filepath("") == "");

    CHECK(fgp::trim_filepath("/home/user/project/main.cpp") == "main.cpp");
}

// --- Version ---
// ---------------

TEST_CASE("Version / Formatting") {
    CHECK(fgp::version::format_semantic() == "0.1.0");

    const std::string banner = fgp::version::format_full();

    CHECK(banner.starts_with("flamegraph-report 0.1.0 ("));
    CHECK(banner.contains(fgp::version::description));
    CHECK(banner.ends_with(fgp::version::copyright));
}

// --- Exceptions ---
// ------------------

TEST_CASE("Exception / Derived kinds") {
    const fgp::unbalanced_stack_error unbalanced{"Frame {} is still open", 3};
    const fgp::invalid_sort_error     sort{"Sort {{ {} }} doesn't fit a {} profile", "call order", "flamegraph"};
    const fgp::invalid_trace_error    trace{"Unknown unit"};

    CHECK(unbalanced.message() == "Frame 3 is still open");
    CHECK(std::string_view{unbalanced.what()}.contains("fgp::unbalanced_stack_error"));

    CHECK(sort.message() == "Sort { call order } doesn't fit a flamegraph profile");
    CHECK(std::string_view{sort.what()}.contains("fgp::invalid_sort_error"));

    CHECK(trace.message() == "Unknown unit");
    CHECK(std::string_view{trace.what()}.contains("fgp::invalid_trace_error"));

    CHECK_THROWS_AS(throw fgp::invalid_trace_error{"Unknown unit"}, fgp::exception);
}
