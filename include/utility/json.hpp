// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Wraps <glaze/json.hpp> library include and adds a simpler read/write API with
// errors through exceptions so we can have a uniform error handling style
// throughout the codebase.
// _________________________________________________________________________________

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-braces" // false positive in 'glaze'
#endif

#include <glaze/json.hpp> // IWYU pragma: export

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include "utility/exception.hpp"


namespace fgp {

// Traces produced by different tools carry plenty of fields we don't care about
constexpr auto json_read_options = glz::opts{.error_on_unknown_keys = false};

template <class T, auto opts = json_read_options>
[[nodiscard]] std::expected<T, std::string> try_read_json(std::string_view json) {
    T           value{};
    std::string buffer{json}; // glaze expects a null-terminated buffer

    if (const glz::error_ctx err = glz::read<opts>(value, buffer))
        return std::unexpected{fmt::format("Could not parse JSON, error:\n{}", glz::format_error(err, buffer))};

    return value;
}

template <class T, auto opts = json_read_options>
[[nodiscard]] std::expected<T, std::string> try_read_file_json(std::string_view path) {
    T           value{};
    std::string buffer;

    if (const glz::error_ctx err = glz::read_file_json<opts>(value, path, buffer)) {
        std::string context = fmt::format("Could not read JSON at {{ {} }}, error:\n{}", path,
                                          glz::format_error(err, buffer));
        return std::unexpected{std::move(context)};
    }

    return value;
}

template <auto opts = glz::opts{}, class T>
[[nodiscard]] std::string write_json(const T& value) {
    std::string buffer;

    if (const glz::error_ctx err = glz::write<opts>(value, buffer))
        throw fgp::exception{"Could not serialize JSON, error:\n{}", glz::format_error(err, buffer)};

    return buffer;
}

template <auto opts = glz::opts{}, class T>
void write_file_json(std::string_view path, const T& value) {
    std::string buffer;

    if (const glz::error_ctx err = glz::write_file_json<opts>(value, path, buffer))
        throw fgp::exception{"Could not write JSON at {{ {} }}, error:\n{}", path, glz::format_error(err, buffer)};
}

} // namespace fgp
