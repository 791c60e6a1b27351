// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Functions for operating on filepath strings, used for diagnostics and for
// normalizing source locations attached to frames.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <string_view>


namespace fgp {

[[nodiscard]] std::string_view trim_filepath(std::string_view path);

[[nodiscard]] std::string normalize_filepath(std::string path);

} // namespace fgp
