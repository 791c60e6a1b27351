// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// ABI demangling. Native profilers frequently record symbols in a mangled form,
// so we have to do some work to turn them back into a human-readable state.
// _________________________________________________________________________________

#pragma once

#include <optional>
#include <string>


namespace fgp::symbol {

[[nodiscard]] bool is_mangled(const std::string& symbol);

// Returns 'std::nullopt' if the symbol could not be demangled
[[nodiscard]] std::optional<std::string> try_demangle(const std::string& symbol);

// Throws if the symbol could not be demangled
[[nodiscard]] std::string demangle(const std::string& symbol);

} // namespace fgp::symbol
