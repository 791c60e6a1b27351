// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/demangle.hpp"

#include <cstdlib>
#include <memory>

#include <cxxabi.h>

#include "utility/exception.hpp"


bool fgp::symbol::is_mangled(const std::string& symbol) {
    // Itanium ABI names start with "_Z", some platforms prepend an extra underscore
    return !symbol.contains(' ') && (symbol.starts_with("_Z") || symbol.starts_with("__Z"));
}

// --- <cxxabi> demangling ---
// ---------------------------

namespace {

struct c_str_deleter {
    void operator()(char* c_str) { std::free(c_str); }
};

using c_str_wrapper = std::unique_ptr<char, c_str_deleter>;

} // namespace

std::optional<std::string> fgp::symbol::try_demangle(const std::string& symbol) {
    // we have to take either 'std::string' or 'const char*' due to the null-termination requirement

    if (!is_mangled(symbol)) return std::nullopt;

    // Some platforms struggle to demangle "__Z" with two leading underscores, so we trim the excess
    const std::size_t offset = symbol.starts_with("__Z") ? 1 : 0;

    // We are responsible for cleaning up the 'char *' returned by the API
    int        status = 0;
    const auto result = c_str_wrapper{abi::__cxa_demangle(symbol.c_str() + offset, nullptr, nullptr, &status)};

    if (status || !result) return std::nullopt;

    return std::string{result.get()};
}

std::string fgp::symbol::demangle(const std::string& symbol) {
    if (auto result = try_demangle(symbol)) return std::move(result.value());

    throw fgp::exception{"Could not demangle symbol {{ {} }}", symbol};
}
