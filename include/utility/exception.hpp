// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Exception classes used throughout the codebase. The base class carries source
// location info and supports {fmt} format strings in constructor, which makes
// diagnostics nicer. Chaining & rethrowing such exceptions can even accomplish
// a pseudo-stacktrace. Derived classes mark the failures callers may want to
// handle separately (broken event nesting, bad sort selection, malformed traces).
// _________________________________________________________________________________

#pragma once

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "utility/filepath.hpp"


namespace fgp {

class exception : public std::runtime_error {

    // Note: ANSI color sequences are supported by most modern terminals
    constexpr static auto format = //
        "\033[31;1m"               // bold red
        "Error   ->"               // |
        "\033[0m"                  // reset
        " "                        //
        "\033[36m"                 // cyan
        "{}"                       // | exception kind
        "\033[0m"                  // reset
        " thrown at "              //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        ":"                        //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        " in function "            //
        "\033[35m"                 // magenta
        "{}"                       // |
        "\033[0m"                  // reset
        "\n"                       //
        "\033[31;1m"               // bold red
        "Message ->"               // |
        "\033[0m"                  // reset
        " {}";                     //

    std::string plain_message;

protected:
    exception(std::string_view kind, std::string_view message, std::source_location loc)
        : std::runtime_error(fmt::format(fmt::runtime(format), kind, fgp::trim_filepath(loc.file_name()), loc.line(),
                                         loc.function_name(), message)),
          plain_message(message) {}

public:
    // Required API
    exception(std::string_view message, std::source_location loc = std::source_location::current())
        : exception("fgp::exception", message, loc) {}

    exception(const exception& other) = default;

    [[nodiscard]] const char* what() const noexcept override { return std::runtime_error::what(); }

    // Message without the location & coloring, convenient for tests and nested reports
    [[nodiscard]] const std::string& message() const noexcept { return this->plain_message; }

    // Constructors with fmt
    // clang-format off
    template <class T1>
    exception(fmt::format_string<T1> fmt, T1&& arg1,
              std::source_location loc = std::source_location::current())
        : exception(fmt::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    exception(fmt::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
              std::source_location loc = std::source_location::current())
        : exception(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}

    template <class T1, class T2, class T3>
    exception(fmt::format_string<T1, T2, T3> fmt, T1&& arg1, T2&& arg2, T3&& arg3,
              std::source_location loc = std::source_location::current())
        : exception(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)), loc) {}
    // clang-format on
};

// Close event without a matching open event, or open events left at the end of the stream
class unbalanced_stack_error : public fgp::exception {
public:
    unbalanced_stack_error(std::string_view message, std::source_location loc = std::source_location::current())
        : fgp::exception("fgp::unbalanced_stack_error", message, loc) {}

    // clang-format off
    template <class T1>
    unbalanced_stack_error(fmt::format_string<T1> fmt, T1&& arg1,
                           std::source_location loc = std::source_location::current())
        : unbalanced_stack_error(fmt::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    unbalanced_stack_error(fmt::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
                           std::source_location loc = std::source_location::current())
        : unbalanced_stack_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}

    template <class T1, class T2, class T3>
    unbalanced_stack_error(fmt::format_string<T1, T2, T3> fmt, T1&& arg1, T2&& arg2, T3&& arg3,
                           std::source_location loc = std::source_location::current())
        : unbalanced_stack_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)), loc) {}
    // clang-format on
};

// Sort strategy that doesn't fit the profile type hint
class invalid_sort_error : public fgp::exception {
public:
    invalid_sort_error(std::string_view message, std::source_location loc = std::source_location::current())
        : fgp::exception("fgp::invalid_sort_error", message, loc) {}

    // clang-format off
    template <class T1>
    invalid_sort_error(fmt::format_string<T1> fmt, T1&& arg1,
                        std::source_location loc = std::source_location::current())
        : invalid_sort_error(fmt::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    invalid_sort_error(fmt::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
                        std::source_location loc = std::source_location::current())
        : invalid_sort_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}

    template <class T1, class T2, class T3>
    invalid_sort_error(fmt::format_string<T1, T2, T3> fmt, T1&& arg1, T2&& arg2, T3&& arg3,
                        std::source_location loc = std::source_location::current())
        : invalid_sort_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)), loc) {}
    // clang-format on
};

// Trace content that can't be interpreted (bad units, indices, lengths, JSON schema)
class invalid_trace_error : public fgp::exception {
public:
    invalid_trace_error(std::string_view message, std::source_location loc = std::source_location::current())
        : fgp::exception("fgp::invalid_trace_error", message, loc) {}

    // clang-format off
    template <class T1>
    invalid_trace_error(fmt::format_string<T1> fmt, T1&& arg1,
                        std::source_location loc = std::source_location::current())
        : invalid_trace_error(fmt::format(fmt, std::forward<T1>(arg1)), loc) {}

    template <class T1, class T2>
    invalid_trace_error(fmt::format_string<T1, T2> fmt, T1&& arg1, T2&& arg2,
                        std::source_location loc = std::source_location::current())
        : invalid_trace_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2)), loc) {}

    template <class T1, class T2, class T3>
    invalid_trace_error(fmt::format_string<T1, T2, T3> fmt, T1&& arg1, T2&& arg2, T3&& arg3,
                        std::source_location loc = std::source_location::current())
        : invalid_trace_error(fmt::format(fmt, std::forward<T1>(arg1), std::forward<T2>(arg2), std::forward<T3>(arg3)), loc) {}
    // clang-format on
};

} // namespace fgp
