// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Symbol prettification. Native profilers report frames of C++ code with fully
// expanded template names, so instead of 'std::string' we will get something like
// 'std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >'.
// By applying a bunch of replacement and normalization rules we can prettify the
// symbols so they will mostly match the way they were written in the source.
// _________________________________________________________________________________

#pragma once

#include <string>


namespace fgp::prettify {

[[nodiscard]] std::string normalize(std::string identifier);   // spacing & compiler-specific syntax
[[nodiscard]] std::string deobfuscate(std::string identifier); // internal namespaces & ABI tags
[[nodiscard]] std::string collapse(std::string identifier);    // default template arguments & aliases

[[nodiscard]] std::string full(std::string identifier);

} // namespace fgp::prettify
