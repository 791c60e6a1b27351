// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Output serialization for '--output=text'.
// _________________________________________________________________________________

#pragma once

#include <filesystem>
#include <string>

#include "backend/config.hpp"
#include "backend/flamegraph.hpp"


namespace fgp::output {

// Plain text listing of the laid-out tree, same as the terminal output without colors
[[nodiscard]] std::string text_report(const fgp::flamegraph& flamegraph, const fgp::config& config);

// Writes 'text_report()' to '<output_directory>/report.txt'
void text(const fgp::flamegraph& flamegraph, const fgp::config& config, const std::filesystem::path& output_directory);

}
